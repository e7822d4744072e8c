#ifndef GEOSBRIDGE_H
#define GEOSBRIDGE_H

#include <QString>
#include <QVector>
#include <QPointF>

#include "geometry/featuregeometry.h"

/**
 * @brief GeosBridge - GEOS utility functions for brush geometry
 *
 * Wraps the GEOS C API (re-entrant functions on one shared context) behind
 * Qt value types. Operations never throw: failures yield an empty geometry
 * or false, and the reason is available from lastError().
 */
namespace GeosBridge {

/**
 * @brief Initialize GEOS context (safe to call repeatedly)
 */
void initialize();

/**
 * @brief Cleanup GEOS context (call at shutdown)
 */
void cleanup();

/**
 * @brief Get last error message
 */
QString lastError();

/**
 * @brief Create a circular buffer polygon around a point
 * @param center Point in map units
 * @param radius Buffer radius in map units (must be > 0)
 * @param quadrantSegments Segments used to approximate a quarter circle
 * @return Polygon geometry (empty on error)
 */
FeatureGeometry bufferPoint(const QPointF& center, double radius, int quadrantSegments);

/**
 * @brief Create a round-capped, round-joined buffer around an open path
 * @param path Path vertices (at least 2)
 * @param radius Buffer radius in map units (must be > 0)
 * @param quadrantSegments Segments used to approximate a quarter circle
 * @return Polygon geometry, possibly with holes (empty on error)
 */
FeatureGeometry bufferPath(const QVector<QPointF>& path, double radius, int quadrantSegments);

/**
 * @brief Check if two geometries share at least one point
 * @return True if they intersect, false if disjoint or on error
 */
bool intersects(const FeatureGeometry& a, const FeatureGeometry& b);

/**
 * @brief Calculate the area of a geometry
 * @return Area in square map units (0 for points, lines or on error)
 */
double calculateArea(const FeatureGeometry& geometry);

/**
 * @brief PreparedGeometry - Geometry prepared once for repeated predicate tests
 *
 * Used for the brush corridor, which is tested against every candidate
 * feature of every candidate layer.
 */
class PreparedGeometry {
public:
    explicit PreparedGeometry(const FeatureGeometry& geometry);
    ~PreparedGeometry();

    PreparedGeometry(const PreparedGeometry&) = delete;
    PreparedGeometry& operator=(const PreparedGeometry&) = delete;

    bool isValid() const { return m_prepared != nullptr; }

    /**
     * @brief Exact intersection test against another geometry
     * @return False if either geometry is empty or on error
     */
    bool intersects(const FeatureGeometry& other) const;

private:
    void* m_geometry{nullptr};
    const void* m_prepared{nullptr};
};

} // namespace GeosBridge

#endif // GEOSBRIDGE_H

#ifndef CORRIDORBUILDER_H
#define CORRIDORBUILDER_H

#include <QPointF>
#include <QVector>

#include "geometry/featuregeometry.h"

/**
 * @brief CorridorBuilder - Buffers a brush stroke into its selection polygon
 *
 * One point gives a circle; a longer path gives a single round-capped,
 * round-joined buffer of the polyline. The result is deterministic for the
 * same inputs, so the live preview and the final selection agree.
 */
class CorridorBuilder {
public:
    /**
     * @param points Stroke in map units
     * @param radius Buffer radius in map units
     * @param segments Segments per quadrant (raised to at least 8)
     * @return Polygon geometry; empty for empty input or when buffering fails
     */
    static FeatureGeometry build(const QVector<QPointF>& points, double radius, int segments);

    // Drops consecutive coincident points (zero-length segments)
    static QVector<QPointF> removeRepeatedPoints(const QVector<QPointF>& points);
};

#endif // CORRIDORBUILDER_H

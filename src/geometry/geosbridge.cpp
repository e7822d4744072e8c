#include "geometry/geosbridge.h"
#include "logging.h"

#include <geos_c.h>

#include <QLineF>
#include <QtMath>

#include <cmath>

// Static GEOS context
static GEOSContextHandle_t s_geosContext = nullptr;
static QString s_lastError;

// Error handlers
static void geosErrorHandler(const char* message, void* /*userdata*/) {
    s_lastError = QString::fromUtf8(message);
    qCWarning(lcGeos) << "GEOS error:" << message;
}

static void geosNoticeHandler(const char* /*message*/, void* /*userdata*/) {
    // Ignore notices
}

namespace GeosBridge {

void initialize()
{
    if (!s_geosContext) {
        s_geosContext = GEOS_init_r();
        if (s_geosContext) {
            GEOSContext_setErrorMessageHandler_r(s_geosContext, geosErrorHandler, nullptr);
            GEOSContext_setNoticeMessageHandler_r(s_geosContext, geosNoticeHandler, nullptr);
        } else {
            qCWarning(lcGeos) << "Failed to create GEOS context";
        }
    }
}

void cleanup()
{
    if (s_geosContext) {
        GEOS_finish_r(s_geosContext);
        s_geosContext = nullptr;
    }
}

QString lastError()
{
    return s_lastError;
}

// Helper: Create GEOS coordinate sequence from QPointF vector
static GEOSCoordSequence* createCoordSeq(const QVector<QPointF>& points, bool closeRing)
{
    if (!s_geosContext || points.isEmpty()) return nullptr;

    int size = points.size();
    bool needsClosing = false;
    if (closeRing) {
        // Check distance to avoid epsilon issues
        double dist = QLineF(points.first(), points.last()).length();
        needsClosing = (dist > 1e-9);
    }

    if (needsClosing) {
        size += 1;  // Add closing point
    }

    GEOSCoordSequence* seq = GEOSCoordSeq_create_r(s_geosContext, size, 2);
    if (!seq) return nullptr;

    for (int i = 0; i < points.size(); ++i) {
        double x = points[i].x();
        double y = points[i].y();

        // A last point within epsilon of the first is snapped onto it so
        // GEOS sees an exactly closed ring
        if (closeRing && !needsClosing && i == points.size() - 1) {
            x = points.first().x();
            y = points.first().y();
        }

        GEOSCoordSeq_setXY_r(s_geosContext, seq, i, x, y);
    }

    if (needsClosing) {
        GEOSCoordSeq_setXY_r(s_geosContext, seq, size - 1, points.first().x(), points.first().y());
    }

    return seq;
}

static GEOSGeometry* createPoint(const QPointF& point)
{
    GEOSCoordSequence* seq = GEOSCoordSeq_create_r(s_geosContext, 1, 2);
    if (!seq) return nullptr;
    GEOSCoordSeq_setXY_r(s_geosContext, seq, 0, point.x(), point.y());

    GEOSGeometry* geom = GEOSGeom_createPoint_r(s_geosContext, seq);
    if (!geom) {
        GEOSCoordSeq_destroy_r(s_geosContext, seq);
    }
    return geom;
}

static GEOSGeometry* createLineString(const QVector<QPointF>& points)
{
    if (points.size() < 2) return nullptr;

    GEOSCoordSequence* seq = createCoordSeq(points, false);
    if (!seq) return nullptr;

    GEOSGeometry* line = GEOSGeom_createLineString_r(s_geosContext, seq);
    if (!line) {
        GEOSCoordSeq_destroy_r(s_geosContext, seq);
    }
    return line;
}

static GEOSGeometry* createLinearRing(const QVector<QPointF>& points)
{
    if (points.size() < 3) return nullptr;

    GEOSCoordSequence* seq = createCoordSeq(points, true);
    if (!seq) return nullptr;

    GEOSGeometry* ring = GEOSGeom_createLinearRing_r(s_geosContext, seq);
    if (!ring) {
        GEOSCoordSeq_destroy_r(s_geosContext, seq);
    }
    return ring;
}

static GEOSGeometry* createPolygon(const GeometryPart& part)
{
    GEOSGeometry* shell = createLinearRing(part.points);
    if (!shell) return nullptr;

    QVector<GEOSGeometry*> holes;
    for (const auto& hole : part.holes) {
        GEOSGeometry* ring = createLinearRing(hole);
        if (ring) holes.append(ring);
    }

    GEOSGeometry* polygon = GEOSGeom_createPolygon_r(s_geosContext, shell,
                                                     holes.isEmpty() ? nullptr : holes.data(),
                                                     static_cast<unsigned int>(holes.size()));
    if (!polygon) {
        GEOSGeom_destroy_r(s_geosContext, shell);
        for (auto* ring : holes) GEOSGeom_destroy_r(s_geosContext, ring);
    }
    return polygon;
}

// Helper: Convert a FeatureGeometry to a newly allocated GEOS geometry
// (caller owns the result; nullptr if nothing convertible)
static GEOSGeometry* toGeos(const FeatureGeometry& geometry)
{
    if (!s_geosContext || geometry.isEmpty()) return nullptr;

    QVector<GEOSGeometry*> members;
    int collectionType = GEOS_GEOMETRYCOLLECTION;

    for (const auto& part : geometry.parts) {
        GEOSGeometry* member = nullptr;
        switch (geometry.type) {
            case GeometryType::Point:
                collectionType = GEOS_MULTIPOINT;
                for (const QPointF& p : part.points) {
                    GEOSGeometry* pt = createPoint(p);
                    if (pt) members.append(pt);
                }
                continue;
            case GeometryType::Line:
                collectionType = GEOS_MULTILINESTRING;
                member = createLineString(part.points);
                break;
            case GeometryType::Polygon:
                collectionType = GEOS_MULTIPOLYGON;
                member = createPolygon(part);
                break;
            default:
                break;
        }
        if (member) members.append(member);
    }

    if (members.isEmpty()) return nullptr;
    if (members.size() == 1) return members.first();

    GEOSGeometry* collection = GEOSGeom_createCollection_r(s_geosContext, collectionType,
                                                           members.data(),
                                                           static_cast<unsigned int>(members.size()));
    if (!collection) {
        for (auto* g : members) GEOSGeom_destroy_r(s_geosContext, g);
    }
    return collection;
}

static QVector<QPointF> readCoords(const GEOSGeometry* geom)
{
    QVector<QPointF> result;
    const GEOSCoordSequence* seq = GEOSGeom_getCoordSeq_r(s_geosContext, geom);
    if (!seq) return result;

    unsigned int size = 0;
    GEOSCoordSeq_getSize_r(s_geosContext, seq, &size);
    result.reserve(static_cast<int>(size));

    for (unsigned int i = 0; i < size; ++i) {
        double x, y;
        GEOSCoordSeq_getXY_r(s_geosContext, seq, i, &x, &y);
        result.append(QPointF(x, y));
    }
    return result;
}

// Helper: Append the members of a GEOS geometry to a FeatureGeometry
static void appendFromGeos(const GEOSGeometry* geom, FeatureGeometry& out)
{
    if (!geom || GEOSisEmpty_r(s_geosContext, geom) == 1) return;

    switch (GEOSGeomTypeId_r(s_geosContext, geom)) {
        case GEOS_POINT: {
            GeometryPart part;
            part.points = readCoords(geom);
            out.type = GeometryType::Point;
            out.parts.append(part);
            break;
        }
        case GEOS_LINESTRING:
        case GEOS_LINEARRING: {
            GeometryPart part;
            part.points = readCoords(geom);
            out.type = GeometryType::Line;
            out.parts.append(part);
            break;
        }
        case GEOS_POLYGON: {
            GeometryPart part;
            const GEOSGeometry* shell = GEOSGetExteriorRing_r(s_geosContext, geom);
            if (shell) part.points = readCoords(shell);

            int numHoles = GEOSGetNumInteriorRings_r(s_geosContext, geom);
            for (int i = 0; i < numHoles; ++i) {
                const GEOSGeometry* hole = GEOSGetInteriorRingN_r(s_geosContext, geom, i);
                if (hole) part.holes.append(readCoords(hole));
            }
            out.type = GeometryType::Polygon;
            out.parts.append(part);
            break;
        }
        case GEOS_MULTIPOINT:
        case GEOS_MULTILINESTRING:
        case GEOS_MULTIPOLYGON:
        case GEOS_GEOMETRYCOLLECTION: {
            int numGeoms = GEOSGetNumGeometries_r(s_geosContext, geom);
            for (int i = 0; i < numGeoms; ++i) {
                appendFromGeos(GEOSGetGeometryN_r(s_geosContext, geom, i), out);
            }
            break;
        }
        default:
            break;
    }
}

static FeatureGeometry bufferGeometry(GEOSGeometry* input, double radius, int quadrantSegments)
{
    FeatureGeometry result;

    if (!input) {
        s_lastError = "Failed to create input geometry for buffer";
        return result;
    }

    GEOSGeometry* bufferGeom = GEOSBuffer_r(s_geosContext, input, radius, quadrantSegments);
    GEOSGeom_destroy_r(s_geosContext, input);

    if (!bufferGeom) {
        if (s_lastError.isEmpty()) s_lastError = "Buffer operation failed";
        return result;
    }

    appendFromGeos(bufferGeom, result);
    GEOSGeom_destroy_r(s_geosContext, bufferGeom);

    if (result.isEmpty()) {
        s_lastError = "Buffer produced an empty geometry";
        result = FeatureGeometry();
    }
    return result;
}

static bool checkBufferArgs(double radius, int quadrantSegments)
{
    if (!s_geosContext) {
        s_lastError = "GEOS context not initialized";
        return false;
    }
    if (!std::isfinite(radius) || radius <= 0.0) {
        s_lastError = "Buffer radius must be positive";
        return false;
    }
    if (quadrantSegments < 1) {
        s_lastError = "Buffer needs at least 1 segment per quadrant";
        return false;
    }
    return true;
}

FeatureGeometry bufferPoint(const QPointF& center, double radius, int quadrantSegments)
{
    initialize();
    s_lastError.clear();

    if (!checkBufferArgs(radius, quadrantSegments)) return FeatureGeometry();
    if (!std::isfinite(center.x()) || !std::isfinite(center.y())) {
        s_lastError = "Buffer center is not finite";
        return FeatureGeometry();
    }

    return bufferGeometry(createPoint(center), radius, quadrantSegments);
}

FeatureGeometry bufferPath(const QVector<QPointF>& path, double radius, int quadrantSegments)
{
    initialize();
    s_lastError.clear();

    if (path.size() < 2) {
        s_lastError = "Need at least 2 points for path buffer";
        return FeatureGeometry();
    }
    if (!checkBufferArgs(radius, quadrantSegments)) return FeatureGeometry();

    return bufferGeometry(createLineString(path), radius, quadrantSegments);
}

bool intersects(const FeatureGeometry& a, const FeatureGeometry& b)
{
    initialize();
    s_lastError.clear();

    GEOSGeometry* geom1 = toGeos(a);
    GEOSGeometry* geom2 = toGeos(b);

    if (!geom1 || !geom2) {
        if (geom1) GEOSGeom_destroy_r(s_geosContext, geom1);
        if (geom2) GEOSGeom_destroy_r(s_geosContext, geom2);
        return false;
    }

    char result = GEOSIntersects_r(s_geosContext, geom1, geom2);

    GEOSGeom_destroy_r(s_geosContext, geom1);
    GEOSGeom_destroy_r(s_geosContext, geom2);

    return result == 1;
}

double calculateArea(const FeatureGeometry& geometry)
{
    initialize();
    s_lastError.clear();

    if (geometry.type != GeometryType::Polygon) return 0.0;

    GEOSGeometry* geom = toGeos(geometry);
    if (!geom) {
        s_lastError = "Failed to create polygon for area calculation";
        return 0.0;
    }

    double area = 0.0;
    if (GEOSArea_r(s_geosContext, geom, &area) == 0) {
        area = 0.0;
    }
    GEOSGeom_destroy_r(s_geosContext, geom);

    return area;
}

PreparedGeometry::PreparedGeometry(const FeatureGeometry& geometry)
{
    initialize();

    GEOSGeometry* geom = toGeos(geometry);
    if (!geom) return;

    const GEOSPreparedGeometry* prepared = GEOSPrepare_r(s_geosContext, geom);
    if (!prepared) {
        GEOSGeom_destroy_r(s_geosContext, geom);
        return;
    }

    m_geometry = geom;
    m_prepared = prepared;
}

PreparedGeometry::~PreparedGeometry()
{
    if (s_geosContext && m_prepared) {
        GEOSPreparedGeom_destroy_r(s_geosContext, static_cast<const GEOSPreparedGeometry*>(m_prepared));
    }
    if (s_geosContext && m_geometry) {
        GEOSGeom_destroy_r(s_geosContext, static_cast<GEOSGeometry*>(m_geometry));
    }
}

bool PreparedGeometry::intersects(const FeatureGeometry& other) const
{
    if (!m_prepared) return false;

    GEOSGeometry* geom = toGeos(other);
    if (!geom) return false;

    char result = GEOSPreparedIntersects_r(s_geosContext,
                                           static_cast<const GEOSPreparedGeometry*>(m_prepared),
                                           geom);
    GEOSGeom_destroy_r(s_geosContext, geom);

    return result == 1;
}

} // namespace GeosBridge

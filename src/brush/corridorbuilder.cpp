#include "brush/corridorbuilder.h"
#include "brush/brushconfig.h"
#include "geometry/geosbridge.h"
#include "logging.h"

FeatureGeometry CorridorBuilder::build(const QVector<QPointF>& points, double radius, int segments)
{
    const QVector<QPointF> path = removeRepeatedPoints(points);
    if (path.isEmpty()) return FeatureGeometry();

    const int quadrantSegments = qMax(BrushConfig::MinSegments, segments);

    FeatureGeometry corridor = (path.size() == 1)
        ? GeosBridge::bufferPoint(path.first(), radius, quadrantSegments)
        : GeosBridge::bufferPath(path, radius, quadrantSegments);

    if (corridor.isEmpty()) {
        qCDebug(lcTool) << "Corridor buffer failed:" << GeosBridge::lastError();
    }
    return corridor;
}

QVector<QPointF> CorridorBuilder::removeRepeatedPoints(const QVector<QPointF>& points)
{
    QVector<QPointF> result;
    result.reserve(points.size());
    for (const QPointF& p : points) {
        if (result.isEmpty() || result.last() != p) {
            result.append(p);
        }
    }
    return result;
}

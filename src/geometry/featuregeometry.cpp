#include "geometry/featuregeometry.h"

QString geometryTypeName(GeometryType type)
{
    switch (type) {
        case GeometryType::Point: return "point";
        case GeometryType::Line: return "line";
        case GeometryType::Polygon: return "polygon";
        default: return "any";
    }
}

GeometryType geometryTypeFromName(const QString& name)
{
    const QString key = name.trimmed().toLower();
    if (key == "point") return GeometryType::Point;
    if (key == "line") return GeometryType::Line;
    if (key == "polygon") return GeometryType::Polygon;
    return GeometryType::Unknown;
}

bool FeatureGeometry::isEmpty() const
{
    return vertexCount() == 0;
}

int FeatureGeometry::vertexCount() const
{
    int count = 0;
    for (const auto& part : parts) {
        count += part.points.size();
    }
    return count;
}

QRectF FeatureGeometry::boundingBox() const
{
    bool hasData = false;
    double minX = 0, maxX = 0, minY = 0, maxY = 0;

    // Holes lie inside the exterior ring, so the exterior vertices are enough
    for (const auto& part : parts) {
        for (const QPointF& p : part.points) {
            if (!hasData) {
                minX = maxX = p.x();
                minY = maxY = p.y();
                hasData = true;
            } else {
                minX = qMin(minX, p.x());
                maxX = qMax(maxX, p.x());
                minY = qMin(minY, p.y());
                maxY = qMax(maxY, p.y());
            }
        }
    }

    if (!hasData) return QRectF();
    return QRectF(QPointF(minX, minY), QPointF(maxX, maxY));
}

FeatureGeometry FeatureGeometry::fromPoint(const QPointF& point)
{
    FeatureGeometry geom;
    geom.type = GeometryType::Point;
    GeometryPart part;
    part.points.append(point);
    geom.parts.append(part);
    return geom;
}

FeatureGeometry FeatureGeometry::fromPolyline(const QVector<QPointF>& points)
{
    FeatureGeometry geom;
    geom.type = GeometryType::Line;
    GeometryPart part;
    part.points = points;
    geom.parts.append(part);
    return geom;
}

FeatureGeometry FeatureGeometry::fromPolygon(const QVector<QPointF>& exterior,
                                             const QVector<QVector<QPointF>>& holes)
{
    FeatureGeometry geom;
    geom.type = GeometryType::Polygon;
    GeometryPart part;
    part.points = exterior;
    part.holes = holes;
    geom.parts.append(part);
    return geom;
}

#ifndef FEATUREGEOMETRY_H
#define FEATUREGEOMETRY_H

#include <QPointF>
#include <QRectF>
#include <QString>
#include <QVariantMap>
#include <QVector>

enum class GeometryType {
    Unknown = 0,    // No geometry / any type (as a filter)
    Point,
    Line,
    Polygon
};

QString geometryTypeName(GeometryType type);
GeometryType geometryTypeFromName(const QString& name);

// One member of a (possibly multi-part) geometry
struct GeometryPart {
    QVector<QPointF> points;            // Point: one vertex. Line: path. Polygon: exterior ring
    QVector<QVector<QPointF>> holes;    // Interior rings (polygons only)
};

struct FeatureGeometry {
    GeometryType type{GeometryType::Unknown};
    QVector<GeometryPart> parts;

    bool isEmpty() const;
    QRectF boundingBox() const;
    int vertexCount() const;

    static FeatureGeometry fromPoint(const QPointF& point);
    static FeatureGeometry fromPolyline(const QVector<QPointF>& points);
    static FeatureGeometry fromPolygon(const QVector<QPointF>& exterior,
                                       const QVector<QVector<QPointF>>& holes = {});
};

struct MapFeature {
    qint64 id{-1};
    FeatureGeometry geometry;
    QVariantMap attributes;
};

#endif // FEATUREGEOMETRY_H

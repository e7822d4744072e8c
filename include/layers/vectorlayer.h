#ifndef VECTORLAYER_H
#define VECTORLAYER_H

#include <QObject>
#include <QString>
#include <QColor>
#include <QHash>
#include <QSet>
#include <QVector>
#include <QRectF>

#include "geometry/featuregeometry.h"
#include "geometry/spatialindex.h"
#include "layers/categoryrenderer.h"

// How a new id set is merged into a layer's selection
enum class SelectBehavior {
    SetSelection,       // Replace the selection
    AddToSelection      // Union with the selection
};

/**
 * @brief VectorLayer - In-memory vector layer with selection state
 *
 * Holds features of one geometry type, a bounding box index over them and
 * the set of selected feature ids. Selection changes are announced with
 * selectionChanged().
 */
class VectorLayer : public QObject {
    Q_OBJECT
public:
    explicit VectorLayer(const QString& name, GeometryType type = GeometryType::Unknown,
                         QObject* parent = nullptr);

    QString name() const { return m_name; }
    void setName(const QString& name) { m_name = name; }
    GeometryType geometryType() const { return m_geometryType; }

    QColor color() const { return m_color; }
    void setColor(const QColor& color);
    bool isVisible() const { return m_visible; }
    void setVisible(bool visible);
    QString crs() const { return m_crs; }
    void setCrs(const QString& crs) { m_crs = crs; }

    // Features
    bool addFeature(const MapFeature& feature);    // id < 0 assigns the next free id; other types are refused
    bool removeFeature(qint64 id);
    void clearFeatures();
    const QVector<MapFeature>& features() const { return m_features; }
    int featureCount() const { return m_features.size(); }
    const MapFeature* feature(qint64 id) const;
    QRectF extent() const;

    /**
     * @brief Features whose bounding box intersects a rectangle
     *
     * Uses the spatial index; exact geometry tests are up to the caller.
     * Features with empty geometry are never returned.
     */
    QVector<MapFeature> featuresInRect(const QRectF& rect) const;

    // Symbology
    const CategoryRenderer& renderer() const { return m_renderer; }
    void setRenderer(const CategoryRenderer& renderer);
    bool setCategoryVisible(const QVariant& value, bool visible);
    bool willRenderFeature(const MapFeature& feature) const;

    // Selection
    void selectByIds(const QSet<qint64>& ids, SelectBehavior behavior);
    void removeSelection();
    QSet<qint64> selectedFeatureIds() const { return m_selected; }
    int selectedFeatureCount() const { return m_selected.size(); }
    bool isSelected(qint64 id) const { return m_selected.contains(id); }

signals:
    void selectionChanged();
    void featuresChanged();
    void styleChanged();

private:
    void ensureIndex() const;
    void rebuildLookup();

    QString m_name;
    GeometryType m_geometryType;
    QColor m_color{200, 200, 200};
    bool m_visible{true};
    QString m_crs;

    QVector<MapFeature> m_features;
    QHash<qint64, int> m_idToIndex;
    qint64 m_nextId{1};

    CategoryRenderer m_renderer;
    QSet<qint64> m_selected;

    mutable SpatialIndex m_index;
    mutable bool m_indexDirty{true};
};

#endif // VECTORLAYER_H

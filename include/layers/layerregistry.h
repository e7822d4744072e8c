#ifndef LAYERREGISTRY_H
#define LAYERREGISTRY_H

#include <QObject>
#include <QString>
#include <QColor>
#include <QVector>

#include "geometry/featuregeometry.h"

class VectorLayer;

/**
 * @brief LayerRegistry - Owns the project's vector layers and the active layer
 *
 * Layer names are unique (case-insensitive). The first layer added becomes
 * the active layer when none is set.
 */
class LayerRegistry : public QObject {
    Q_OBJECT
public:
    explicit LayerRegistry(QObject* parent = nullptr);

    // Basic API
    VectorLayer* addLayer(const QString& name, GeometryType type = GeometryType::Unknown,
                          const QColor& color = QColor(200, 200, 200));
    bool addLayer(VectorLayer* layer);      // takes ownership; false (and deletes) on clash
    bool removeLayer(const QString& name);
    bool renameLayer(const QString& oldName, const QString& newName);
    void clear();

    bool hasLayer(const QString& name) const;
    VectorLayer* layer(const QString& name) const;  // nullptr if missing
    const QVector<VectorLayer*>& layers() const { return m_layers; }
    int count() const { return m_layers.size(); }

    // Current layer
    QString currentLayer() const { return m_currentLayer; }
    VectorLayer* activeLayer() const { return layer(m_currentLayer); }
    bool setCurrentLayer(const QString& name);

signals:
    void layersChanged();
    void currentLayerChanged(const QString& name);

private:
    int indexOf(const QString& name) const;
    QVector<VectorLayer*> m_layers;
    QString m_currentLayer;
};

#endif // LAYERREGISTRY_H

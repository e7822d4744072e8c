#include "layers/layerregistry.h"
#include "layers/vectorlayer.h"

LayerRegistry::LayerRegistry(QObject* parent)
    : QObject(parent)
{
}

int LayerRegistry::indexOf(const QString& name) const
{
    for (int i = 0; i < m_layers.size(); ++i) {
        if (m_layers[i]->name().compare(name, Qt::CaseInsensitive) == 0) return i;
    }
    return -1;
}

VectorLayer* LayerRegistry::addLayer(const QString& name, GeometryType type, const QColor& color)
{
    if (name.trimmed().isEmpty()) return nullptr;
    if (hasLayer(name)) return nullptr;

    auto* layer = new VectorLayer(name.trimmed(), type, this);
    layer->setColor(color);
    addLayer(layer);
    return layer;
}

bool LayerRegistry::addLayer(VectorLayer* layer)
{
    if (!layer) return false;
    if (layer->name().trimmed().isEmpty() || hasLayer(layer->name())) {
        delete layer;
        return false;
    }

    layer->setParent(this);
    m_layers.push_back(layer);
    emit layersChanged();

    if (m_currentLayer.isEmpty()) {
        m_currentLayer = layer->name();
        emit currentLayerChanged(m_currentLayer);
    }
    return true;
}

bool LayerRegistry::removeLayer(const QString& name)
{
    int idx = indexOf(name);
    if (idx < 0) return false;

    VectorLayer* removed = m_layers[idx];
    m_layers.remove(idx);

    // If removing current layer, fall back to the first remaining one
    if (m_currentLayer.compare(name, Qt::CaseInsensitive) == 0) {
        m_currentLayer = m_layers.isEmpty() ? QString() : m_layers.first()->name();
        emit currentLayerChanged(m_currentLayer);
    }

    delete removed;
    emit layersChanged();
    return true;
}

bool LayerRegistry::renameLayer(const QString& oldName, const QString& newName)
{
    int idx = indexOf(oldName);
    if (idx < 0) return false;
    if (newName.trimmed().isEmpty()) return false;
    if (hasLayer(newName) && oldName.compare(newName, Qt::CaseInsensitive) != 0) return false;

    m_layers[idx]->setName(newName.trimmed());
    if (m_currentLayer.compare(oldName, Qt::CaseInsensitive) == 0) {
        m_currentLayer = m_layers[idx]->name();
        emit currentLayerChanged(m_currentLayer);
    }
    emit layersChanged();
    return true;
}

void LayerRegistry::clear()
{
    if (m_layers.isEmpty()) return;

    qDeleteAll(m_layers);
    m_layers.clear();
    if (!m_currentLayer.isEmpty()) {
        m_currentLayer.clear();
        emit currentLayerChanged(m_currentLayer);
    }
    emit layersChanged();
}

bool LayerRegistry::hasLayer(const QString& name) const
{
    return indexOf(name) >= 0;
}

VectorLayer* LayerRegistry::layer(const QString& name) const
{
    int idx = indexOf(name);
    if (idx < 0) return nullptr;
    return m_layers[idx];
}

bool LayerRegistry::setCurrentLayer(const QString& name)
{
    if (name.isEmpty()) {
        // Clearing the active layer is allowed (no layer selected in the UI)
        if (m_currentLayer.isEmpty()) return true;
        m_currentLayer.clear();
        emit currentLayerChanged(m_currentLayer);
        return true;
    }
    if (!hasLayer(name)) return false;
    if (m_currentLayer.compare(name, Qt::CaseInsensitive) == 0) return true;
    m_currentLayer = layer(name)->name();
    emit currentLayerChanged(m_currentLayer);
    return true;
}

#include "layers/vectorlayer.h"

VectorLayer::VectorLayer(const QString& name, GeometryType type, QObject* parent)
    : QObject(parent)
    , m_name(name)
    , m_geometryType(type)
{
}

void VectorLayer::setColor(const QColor& color)
{
    if (m_color == color) return;
    m_color = color;
    emit styleChanged();
}

void VectorLayer::setVisible(bool visible)
{
    if (m_visible == visible) return;
    m_visible = visible;
    emit styleChanged();
}

bool VectorLayer::addFeature(const MapFeature& feature)
{
    MapFeature copy = feature;
    if (copy.id < 0) {
        copy.id = m_nextId;
    }
    if (m_idToIndex.contains(copy.id)) return false;

    // A layer holds a single geometry type
    if (m_geometryType != GeometryType::Unknown && copy.geometry.type != GeometryType::Unknown
        && copy.geometry.type != m_geometryType) {
        return false;
    }

    // Layers infer their type from the first typed feature
    if (m_geometryType == GeometryType::Unknown) {
        m_geometryType = copy.geometry.type;
    }

    m_idToIndex.insert(copy.id, m_features.size());
    m_features.append(copy);
    m_nextId = qMax(m_nextId, copy.id + 1);
    m_indexDirty = true;
    emit featuresChanged();
    return true;
}

bool VectorLayer::removeFeature(qint64 id)
{
    auto it = m_idToIndex.find(id);
    if (it == m_idToIndex.end()) return false;

    m_features.remove(it.value());
    rebuildLookup();
    m_indexDirty = true;

    if (m_selected.remove(id)) {
        emit selectionChanged();
    }
    emit featuresChanged();
    return true;
}

void VectorLayer::clearFeatures()
{
    m_features.clear();
    m_idToIndex.clear();
    m_index.clear();
    m_indexDirty = false;

    if (!m_selected.isEmpty()) {
        m_selected.clear();
        emit selectionChanged();
    }
    emit featuresChanged();
}

void VectorLayer::rebuildLookup()
{
    m_idToIndex.clear();
    for (int i = 0; i < m_features.size(); ++i) {
        m_idToIndex.insert(m_features[i].id, i);
    }
}

const MapFeature* VectorLayer::feature(qint64 id) const
{
    auto it = m_idToIndex.constFind(id);
    if (it == m_idToIndex.constEnd()) return nullptr;
    return &m_features[it.value()];
}

QRectF VectorLayer::extent() const
{
    QRectF result;
    bool hasData = false;
    for (const auto& f : m_features) {
        if (f.geometry.isEmpty()) continue;
        QRectF box = f.geometry.boundingBox();
        if (!hasData) {
            result = box;
            hasData = true;
        } else {
            // QRectF::united() drops zero-size boxes, so merge by hand
            result = QRectF(QPointF(qMin(result.left(), box.left()), qMin(result.top(), box.top())),
                            QPointF(qMax(result.right(), box.right()), qMax(result.bottom(), box.bottom())));
        }
    }
    return result;
}

void VectorLayer::ensureIndex() const
{
    if (!m_indexDirty) return;

    m_index.clear();
    for (int i = 0; i < m_features.size(); ++i) {
        const auto& geom = m_features[i].geometry;
        if (geom.isEmpty()) continue;
        m_index.insert(i, geom.boundingBox());
    }
    m_indexDirty = false;
}

QVector<MapFeature> VectorLayer::featuresInRect(const QRectF& rect) const
{
    QVector<MapFeature> result;
    ensureIndex();

    const QVector<int> hits = m_index.query(rect);
    result.reserve(hits.size());
    for (int idx : hits) {
        if (idx >= 0 && idx < m_features.size()) {
            result.append(m_features[idx]);
        }
    }
    return result;
}

void VectorLayer::setRenderer(const CategoryRenderer& renderer)
{
    m_renderer = renderer;
    emit styleChanged();
}

bool VectorLayer::setCategoryVisible(const QVariant& value, bool visible)
{
    if (!m_renderer.setCategoryVisible(value, visible)) return false;
    emit styleChanged();
    return true;
}

bool VectorLayer::willRenderFeature(const MapFeature& feature) const
{
    if (!m_visible) return false;
    return m_renderer.willRender(feature);
}

void VectorLayer::selectByIds(const QSet<qint64>& ids, SelectBehavior behavior)
{
    QSet<qint64> valid;
    for (qint64 id : ids) {
        if (m_idToIndex.contains(id)) valid.insert(id);
    }

    QSet<qint64> next = (behavior == SelectBehavior::AddToSelection) ? m_selected + valid : valid;
    if (next == m_selected) return;

    m_selected = next;
    emit selectionChanged();
}

void VectorLayer::removeSelection()
{
    if (m_selected.isEmpty()) return;
    m_selected.clear();
    emit selectionChanged();
}

#include "layers/categoryrenderer.h"
#include "geometry/featuregeometry.h"

CategoryRenderer::CategoryRenderer(const QString& attribute)
    : m_attribute(attribute)
{
}

int CategoryRenderer::indexOf(const QVariant& value) const
{
    // Attribute values from different drivers arrive as int, double or
    // string; categories match on the textual form
    const QString key = value.toString();
    for (int i = 0; i < m_categories.size(); ++i) {
        if (m_categories[i].value.toString() == key) return i;
    }
    return -1;
}

void CategoryRenderer::addCategory(const QVariant& value, const QColor& color,
                                   bool visible, const QString& label)
{
    int idx = indexOf(value);
    RenderCategory category{value, label.isEmpty() ? value.toString() : label, color, visible};
    if (idx >= 0) {
        m_categories[idx] = category;
    } else {
        m_categories.append(category);
    }
}

bool CategoryRenderer::setCategoryVisible(const QVariant& value, bool visible)
{
    int idx = indexOf(value);
    if (idx < 0) return false;
    m_categories[idx].visible = visible;
    return true;
}

bool CategoryRenderer::isCategoryVisible(const QVariant& value) const
{
    int idx = indexOf(value);
    if (idx < 0) return m_renderUncategorized;
    return m_categories[idx].visible;
}

bool CategoryRenderer::willRender(const MapFeature& feature) const
{
    if (!isCategorized()) return true;
    return isCategoryVisible(feature.attributes.value(m_attribute));
}

QColor CategoryRenderer::colorFor(const MapFeature& feature, const QColor& fallback) const
{
    if (!isCategorized()) return fallback;
    int idx = indexOf(feature.attributes.value(m_attribute));
    if (idx < 0 || !m_categories[idx].color.isValid()) return fallback;
    return m_categories[idx].color;
}

#ifndef CATEGORYRENDERER_H
#define CATEGORYRENDERER_H

#include <QColor>
#include <QString>
#include <QVariant>
#include <QVector>

struct MapFeature;

struct RenderCategory {
    QVariant value;
    QString label;
    QColor color;
    bool visible{true};
};

/**
 * @brief CategoryRenderer - Categorized symbology for a vector layer
 *
 * Features are classified by the value of one attribute. Each category can
 * be switched off, in which case its features are not drawn. A renderer
 * without an attribute draws every feature with the layer colour.
 */
class CategoryRenderer {
public:
    CategoryRenderer() = default;
    explicit CategoryRenderer(const QString& attribute);

    QString attribute() const { return m_attribute; }
    void setAttribute(const QString& attribute) { m_attribute = attribute; }
    bool isCategorized() const { return !m_attribute.isEmpty(); }

    void addCategory(const QVariant& value, const QColor& color,
                     bool visible = true, const QString& label = QString());
    bool setCategoryVisible(const QVariant& value, bool visible);
    bool isCategoryVisible(const QVariant& value) const;
    const QVector<RenderCategory>& categories() const { return m_categories; }
    void clearCategories() { m_categories.clear(); }

    // Features whose value matches no category ("all other values")
    void setRenderUncategorized(bool render) { m_renderUncategorized = render; }
    bool renderUncategorized() const { return m_renderUncategorized; }

    bool willRender(const MapFeature& feature) const;
    QColor colorFor(const MapFeature& feature, const QColor& fallback) const;

private:
    int indexOf(const QVariant& value) const;

    QString m_attribute;
    QVector<RenderCategory> m_categories;
    bool m_renderUncategorized{true};
};

#endif // CATEGORYRENDERER_H

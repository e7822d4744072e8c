#ifndef MAPCANVAS_H
#define MAPCANVAS_H

#include <QWidget>
#include <QPointF>
#include <QColor>
#include <QPixmap>
#include <QPointer>
#include <QTransform>

#include "brush/mapcanvasinterface.h"
#include "geometry/featuregeometry.h"

class BrushTool;
class LayerRegistry;
class VectorLayer;
class QPainter;
class QPainterPath;

/**
 * @brief MapCanvas - Widget that draws the registry's vector layers
 *
 * World Y points up. Rendered layers are cached in a pixmap that is only
 * rebuilt while rendering is enabled; brush previews are painted on top
 * of the cache on every update. Mouse, wheel and key events go to the
 * active map tool first. Middle-drag pans and the wheel zooms when the
 * tool does not consume it.
 */
class MapCanvas : public QWidget, public MapCanvasInterface {
    Q_OBJECT
public:
    explicit MapCanvas(QWidget* parent = nullptr);
    ~MapCanvas() override;

    void setLayerRegistry(LayerRegistry* registry);
    LayerRegistry* layerRegistry() const { return m_registry; }

    // Map tool
    void setMapTool(BrushTool* tool);
    void unsetMapTool();
    BrushTool* mapTool() const { return m_tool; }

    // MapCanvasInterface
    double mapUnitsPerPixel() const override;
    QPointF toMapCoordinates(const QPoint& screen) const override;
    void setRenderingEnabled(bool enabled) override;
    bool isRenderingEnabled() const override { return m_renderingEnabled; }

    // View
    double zoom() const { return m_zoom; }
    void setZoom(double zoom);
    void setCenter(const QPointF& center);
    QPointF worldToScreen(const QPointF& world) const;

public slots:
    void fitToWindow();
    void zoomIn();
    void zoomOut();
    void refresh();

signals:
    void zoomChanged(double zoom);
    void mouseWorldPosition(const QPointF& pos);
    void statusMessage(const QString& message, int timeoutMs);

protected:
    void paintEvent(QPaintEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;
    void wheelEvent(QWheelEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void keyPressEvent(QKeyEvent* event) override;
    void keyReleaseEvent(QKeyEvent* event) override;

private slots:
    void onLayersChanged();
    void invalidateCache();

private:
    void updateTransform();
    void renderLayers();
    void drawLayer(QPainter& painter, const VectorLayer& layer);
    void drawFeature(QPainter& painter, const FeatureGeometry& geometry,
                     const QColor& color, bool selected);
    void drawPreview(QPainter& painter, const FeatureGeometry& geometry,
                     const QColor& fill, const QColor& outline);
    QPainterPath toScreenPath(const FeatureGeometry& geometry) const;

    QPointer<LayerRegistry> m_registry;
    QPointer<BrushTool> m_tool;

    // View transform
    double m_zoom{1.0};         // Screen pixels per map unit
    QPointF m_offset;           // Negated view center
    QTransform m_worldToScreen;
    QTransform m_screenToWorld;

    // Panning
    bool m_isPanning{false};
    QPoint m_lastMousePos;

    // Layer cache
    QPixmap m_cache;
    bool m_cacheValid{false};
    bool m_renderingEnabled{true};

    QColor m_backgroundColor{Qt::white};
    QColor m_selectionColor{255, 220, 0};
};

#endif // MAPCANVAS_H

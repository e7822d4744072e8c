#include "canvas/mapcanvas.h"
#include "brush/brushtool.h"
#include "layers/layerregistry.h"
#include "layers/vectorlayer.h"
#include "logging.h"

#include <QPainter>
#include <QPainterPath>
#include <QPaintEvent>
#include <QWheelEvent>
#include <QMouseEvent>
#include <QKeyEvent>
#include <QtMath>

// Brush preview colours (stroke band and brush tip)
static const QColor s_strokeFill(0, 150, 255, 60);
static const QColor s_strokeOutline(0, 100, 200, 150);
static const QColor s_cursorFill(0, 150, 255, 80);
static const QColor s_cursorOutline(0, 100, 200, 180);

static const double s_zoomFactor = 1.15;
static const double s_pointSize = 6.0;

MapCanvas::MapCanvas(QWidget* parent)
    : QWidget(parent)
{
    setMouseTracking(true);
    setFocusPolicy(Qt::StrongFocus);
    setMinimumSize(400, 300);

    updateTransform();
}

MapCanvas::~MapCanvas()
{
    unsetMapTool();
}

void MapCanvas::setLayerRegistry(LayerRegistry* registry)
{
    if (m_registry == registry) return;
    if (m_registry) disconnect(m_registry, nullptr, this, nullptr);

    m_registry = registry;
    if (m_registry) {
        connect(m_registry, &LayerRegistry::layersChanged, this, &MapCanvas::onLayersChanged);
    }
    onLayersChanged();
}

void MapCanvas::onLayersChanged()
{
    if (m_registry) {
        for (VectorLayer* layer : m_registry->layers()) {
            connect(layer, &VectorLayer::selectionChanged, this, &MapCanvas::invalidateCache, Qt::UniqueConnection);
            connect(layer, &VectorLayer::featuresChanged, this, &MapCanvas::invalidateCache, Qt::UniqueConnection);
            connect(layer, &VectorLayer::styleChanged, this, &MapCanvas::invalidateCache, Qt::UniqueConnection);
        }
    }
    invalidateCache();
}

void MapCanvas::invalidateCache()
{
    m_cacheValid = false;
    // While rendering is suspended the stale image stays on screen
    if (m_renderingEnabled) update();
}

void MapCanvas::refresh()
{
    invalidateCache();
}

void MapCanvas::setMapTool(BrushTool* tool)
{
    if (m_tool == tool) return;
    unsetMapTool();

    m_tool = tool;
    if (!m_tool) return;

    connect(m_tool, &BrushTool::previewChanged, this, QOverload<>::of(&QWidget::update));
    connect(m_tool, &BrushTool::statusMessage, this, &MapCanvas::statusMessage);
    m_tool->activate();
    setCursor(Qt::CrossCursor);
    setFocus();
}

void MapCanvas::unsetMapTool()
{
    if (!m_tool) return;

    BrushTool* tool = m_tool;
    m_tool = nullptr;
    disconnect(tool, nullptr, this, nullptr);
    tool->deactivate();
    setCursor(Qt::ArrowCursor);
    update();
}

double MapCanvas::mapUnitsPerPixel() const
{
    return 1.0 / m_zoom;
}

QPointF MapCanvas::toMapCoordinates(const QPoint& screen) const
{
    return m_screenToWorld.map(QPointF(screen));
}

QPointF MapCanvas::worldToScreen(const QPointF& world) const
{
    return m_worldToScreen.map(world);
}

void MapCanvas::setRenderingEnabled(bool enabled)
{
    if (m_renderingEnabled == enabled) return;
    m_renderingEnabled = enabled;
    qCDebug(lcCanvas) << "Rendering" << (enabled ? "enabled" : "suspended");

    if (enabled) {
        m_cacheValid = false;
        update();
    }
}

void MapCanvas::updateTransform()
{
    m_worldToScreen = QTransform();
    m_worldToScreen.translate(width() / 2.0, height() / 2.0);
    m_worldToScreen.scale(m_zoom, -m_zoom);
    m_worldToScreen.translate(m_offset.x(), m_offset.y());
    m_screenToWorld = m_worldToScreen.inverted();
}

void MapCanvas::setZoom(double zoom)
{
    m_zoom = qBound(1e-6, zoom, 1e6);
    updateTransform();
    invalidateCache();
    emit zoomChanged(m_zoom);
}

void MapCanvas::setCenter(const QPointF& center)
{
    m_offset = -center;
    updateTransform();
    invalidateCache();
}

void MapCanvas::zoomIn()
{
    setZoom(m_zoom * 1.2);
}

void MapCanvas::zoomOut()
{
    setZoom(m_zoom / 1.2);
}

void MapCanvas::fitToWindow()
{
    bool hasData = false;
    double minX = 0, maxX = 0, minY = 0, maxY = 0;

    if (m_registry) {
        for (const VectorLayer* layer : m_registry->layers()) {
            if (layer->featureCount() == 0) continue;
            const QRectF e = layer->extent();
            if (!hasData) {
                minX = e.left();
                maxX = e.right();
                minY = e.top();
                maxY = e.bottom();
                hasData = true;
            } else {
                minX = qMin(minX, e.left());
                maxX = qMax(maxX, e.right());
                minY = qMin(minY, e.top());
                maxY = qMax(maxY, e.bottom());
            }
        }
    }

    if (!hasData) {
        m_offset = QPointF();
        setZoom(1.0);
        return;
    }

    double margin = 50.0;
    double dataWidth = maxX - minX;
    double dataHeight = maxY - minY;

    if (dataWidth < 0.001) dataWidth = 1.0;
    if (dataHeight < 0.001) dataHeight = 1.0;

    double scaleX = (width() - 2 * margin) / dataWidth;
    double scaleY = (height() - 2 * margin) / dataHeight;
    m_offset = QPointF(-(minX + maxX) / 2.0, -(minY + maxY) / 2.0);
    setZoom(qMax(1e-6, qMin(scaleX, scaleY)));
}

QPainterPath MapCanvas::toScreenPath(const FeatureGeometry& geometry) const
{
    QPainterPath path;
    path.setFillRule(Qt::OddEvenFill);

    auto addRing = [&](const QVector<QPointF>& ring, bool close) {
        if (ring.isEmpty()) return;
        path.moveTo(worldToScreen(ring.first()));
        for (int i = 1; i < ring.size(); ++i) {
            path.lineTo(worldToScreen(ring[i]));
        }
        if (close) path.closeSubpath();
    };

    const bool polygon = geometry.type == GeometryType::Polygon;
    for (const auto& part : geometry.parts) {
        addRing(part.points, polygon);
        if (!polygon) continue;
        for (const auto& hole : part.holes) {
            addRing(hole, true);
        }
    }
    return path;
}

void MapCanvas::drawFeature(QPainter& painter, const FeatureGeometry& geometry,
                            const QColor& color, bool selected)
{
    const QColor stroke = selected ? m_selectionColor : color;
    QPen pen(stroke, selected ? 2.5 : 1.2);
    pen.setCosmetic(true);
    painter.setPen(pen);

    switch (geometry.type) {
        case GeometryType::Point: {
            painter.setBrush(stroke);
            const double size = selected ? s_pointSize + 2.0 : s_pointSize;
            for (const auto& part : geometry.parts) {
                if (part.points.isEmpty()) continue;
                painter.drawEllipse(worldToScreen(part.points.first()), size / 2.0, size / 2.0);
            }
            break;
        }
        case GeometryType::Line:
            painter.setBrush(Qt::NoBrush);
            painter.drawPath(toScreenPath(geometry));
            break;
        case GeometryType::Polygon: {
            QColor fill = stroke;
            fill.setAlpha(selected ? 110 : 60);
            painter.setBrush(fill);
            painter.drawPath(toScreenPath(geometry));
            break;
        }
        case GeometryType::Unknown:
            break;
    }
}

void MapCanvas::drawLayer(QPainter& painter, const VectorLayer& layer)
{
    if (!layer.isVisible()) return;

    const QRectF view = m_screenToWorld.mapRect(QRectF(rect()));
    const QVector<MapFeature> features = layer.featuresInRect(view);
    for (const auto& feature : features) {
        if (!layer.willRenderFeature(feature)) continue;
        const QColor color = layer.renderer().colorFor(feature, layer.color());
        drawFeature(painter, feature.geometry, color, layer.isSelected(feature.id));
    }
}

void MapCanvas::renderLayers()
{
    m_cache = QPixmap(size());
    m_cache.fill(m_backgroundColor);

    QPainter painter(&m_cache);
    painter.setRenderHint(QPainter::Antialiasing, true);

    if (m_registry) {
        // First layer on top
        const auto& layers = m_registry->layers();
        for (int i = layers.size() - 1; i >= 0; --i) {
            drawLayer(painter, *layers[i]);
        }
    }
    m_cacheValid = true;
}

void MapCanvas::drawPreview(QPainter& painter, const FeatureGeometry& geometry,
                            const QColor& fill, const QColor& outline)
{
    if (geometry.isEmpty()) return;
    QPen pen(outline, 1.5);
    pen.setCosmetic(true);
    painter.setPen(pen);
    painter.setBrush(fill);
    painter.drawPath(toScreenPath(geometry));
}

void MapCanvas::paintEvent(QPaintEvent* event)
{
    Q_UNUSED(event);

    if (m_renderingEnabled && (!m_cacheValid || m_cache.size() != size())) {
        renderLayers();
    }

    QPainter painter(this);
    if (m_cache.isNull()) {
        painter.fillRect(rect(), m_backgroundColor);
    } else {
        painter.drawPixmap(0, 0, m_cache);
    }

    if (!m_tool) return;

    painter.setRenderHint(QPainter::Antialiasing, true);
    drawPreview(painter, m_tool->strokePreview(), s_strokeFill, s_strokeOutline);
    drawPreview(painter, m_tool->cursorPreview(), s_cursorFill, s_cursorOutline);
}

void MapCanvas::resizeEvent(QResizeEvent* event)
{
    Q_UNUSED(event);
    updateTransform();
    m_cacheValid = false;
}

void MapCanvas::wheelEvent(QWheelEvent* event)
{
    const QPoint screenPos = event->position().toPoint();
    if (m_tool && m_tool->onWheel(toMapCoordinates(screenPos), event->angleDelta(), event->modifiers())) {
        event->accept();
        return;
    }

    if (event->angleDelta().y() == 0) return;

    // Zoom centered on the cursor
    QPointF cursorWorldBefore = toMapCoordinates(screenPos);
    m_zoom = qBound(1e-6, event->angleDelta().y() > 0 ? m_zoom * s_zoomFactor : m_zoom / s_zoomFactor, 1e6);
    updateTransform();

    QPointF cursorWorldAfter = toMapCoordinates(screenPos);
    m_offset += cursorWorldAfter - cursorWorldBefore;
    updateTransform();
    invalidateCache();
    emit zoomChanged(m_zoom);
}

void MapCanvas::mousePressEvent(QMouseEvent* event)
{
    if (event->button() == Qt::MiddleButton) {
        m_isPanning = true;
        m_lastMousePos = event->pos();
        setCursor(Qt::ClosedHandCursor);
        return;
    }

    if (m_tool) {
        m_tool->onPress(toMapCoordinates(event->pos()), event->button(), event->modifiers());
    }
}

void MapCanvas::mouseMoveEvent(QMouseEvent* event)
{
    const QPointF worldPos = toMapCoordinates(event->pos());
    emit mouseWorldPosition(worldPos);

    if (m_isPanning) {
        QPointF delta = toMapCoordinates(event->pos()) - toMapCoordinates(m_lastMousePos);
        m_offset += delta;
        m_lastMousePos = event->pos();
        updateTransform();
        invalidateCache();
        return;
    }

    if (m_tool) {
        m_tool->onMove(worldPos, event->buttons());
    }
}

void MapCanvas::mouseReleaseEvent(QMouseEvent* event)
{
    if (event->button() == Qt::MiddleButton) {
        if (m_isPanning) {
            m_isPanning = false;
            setCursor(m_tool ? Qt::CrossCursor : Qt::ArrowCursor);
        }
        return;
    }

    if (m_tool) {
        m_tool->onRelease(toMapCoordinates(event->pos()), event->button());
    }
}

void MapCanvas::keyPressEvent(QKeyEvent* event)
{
    if (m_tool && !event->isAutoRepeat()) {
        m_tool->onKeyPress(event->key());
    }
    QWidget::keyPressEvent(event);
}

void MapCanvas::keyReleaseEvent(QKeyEvent* event)
{
    if (m_tool && !event->isAutoRepeat()) {
        m_tool->onKeyRelease(event->key());
    }
    QWidget::keyReleaseEvent(event);
}

#include "brush/brushtool.h"
#include "brush/corridorbuilder.h"
#include "brush/mapcanvasinterface.h"
#include "geometry/geosbridge.h"
#include "layers/layerregistry.h"
#include "logging.h"

// How long the selection summary stays in the status bar
static const int s_statusTimeoutMs = 5000;

BrushTool::BrushTool(MapCanvasInterface* canvas, LayerRegistry* layers, QObject* parent)
    : QObject(parent)
    , m_canvas(canvas)
    , m_layers(layers)
{
}

void BrushTool::setConfig(const BrushConfig& config)
{
    const int oldRadius = m_config.radiusPx;
    m_config = config;
    m_config.setRadiusPx(config.radiusPx);
    m_config.radiusStep = qMax(1, config.radiusStep);

    if (m_config.radiusPx != oldRadius) {
        emit radiusChanged(m_config.radiusPx);
    }
    if (m_hasCursor) updateCursorPreview(m_lastCursor);
    if (m_dragging) updateStrokePreview();
}

void BrushTool::setRadiusPx(int radiusPx)
{
    const int clamped = BrushConfig::clampRadius(radiusPx);
    if (clamped == m_config.radiusPx) return;

    m_config.radiusPx = clamped;
    emit radiusChanged(clamped);

    // Previews follow the new size immediately
    if (m_hasCursor) updateCursorPreview(m_lastCursor);
    if (m_dragging) updateStrokePreview();
}

void BrushTool::setSegments(int segments)
{
    m_config.segments = segments;
}

void BrushTool::setActiveLayerOnly(bool activeOnly)
{
    m_config.activeLayerOnly = activeOnly;
}

void BrushTool::setAddToSelection(bool add)
{
    m_config.selectBehavior = add ? SelectBehavior::AddToSelection : SelectBehavior::SetSelection;
}

void BrushTool::setGeometryFilter(GeometryType filter)
{
    m_config.geometryFilter = filter;
}

void BrushTool::setRespectSymbology(bool respect)
{
    m_config.respectSymbology = respect;
}

SelectBehavior BrushTool::effectiveBehavior() const
{
    if (!m_shiftPressed) return m_config.selectBehavior;
    return (m_config.selectBehavior == SelectBehavior::AddToSelection)
        ? SelectBehavior::SetSelection
        : SelectBehavior::AddToSelection;
}

double BrushTool::radiusMapUnits() const
{
    const double mupp = m_canvas ? m_canvas->mapUnitsPerPixel() : 1.0;
    return m_config.radiusMapUnits(mupp);
}

void BrushTool::activate()
{
    m_active = true;
    qCDebug(lcTool) << "Brush tool activated, radius" << m_config.radiusPx << "px";
}

void BrushTool::deactivate()
{
    const bool hadStroke = m_dragging;

    m_sampler.reset();
    m_dragging = false;
    m_shiftPressed = false;
    m_hasCursor = false;
    m_active = false;
    clearPreviews();

    if (hadStroke) {
        qCDebug(lcTool) << "Brush stroke abandoned on deactivation";
    }
}

void BrushTool::clearPreviews()
{
    m_cursorPreview = FeatureGeometry();
    m_strokePreview = FeatureGeometry();
    emit previewChanged();
}

void BrushTool::onPress(const QPointF& mapPoint, Qt::MouseButton button, Qt::KeyboardModifiers modifiers)
{
    if (button != Qt::LeftButton) return;

    m_dragging = true;
    m_shiftPressed = modifiers.testFlag(Qt::ShiftModifier);
    m_sampler.begin(mapPoint);

    updateCursorPreview(mapPoint);
    updateStrokePreview();
}

void BrushTool::onMove(const QPointF& mapPoint, Qt::MouseButtons buttons)
{
    // The brush tip follows the pointer in every state
    updateCursorPreview(mapPoint);

    if (!m_dragging || !buttons.testFlag(Qt::LeftButton)) return;

    const double mupp = m_canvas ? m_canvas->mapUnitsPerPixel() : 1.0;
    if (m_sampler.extend(mapPoint, mupp)) {
        updateStrokePreview();
    }
}

void BrushTool::onRelease(const QPointF& mapPoint, Qt::MouseButton button)
{
    if (button != Qt::LeftButton || !m_dragging) return;

    m_dragging = false;
    finishStroke(mapPoint);
}

bool BrushTool::onWheel(const QPointF& mapPoint, const QPoint& angleDelta, Qt::KeyboardModifiers modifiers)
{
    if (!modifiers.testFlag(Qt::ShiftModifier)) return false;

    // macOS turns Shift+wheel into horizontal scrolling
    const int delta = (angleDelta.y() != 0) ? angleDelta.y() : angleDelta.x();
    if (delta == 0) return true;

    const int step = (delta > 0) ? m_config.radiusStep : -m_config.radiusStep;
    m_lastCursor = mapPoint;
    m_hasCursor = true;
    setRadiusPx(m_config.radiusPx + step);
    return true;
}

void BrushTool::onKeyPress(int key)
{
    if (key == Qt::Key_Shift) {
        m_shiftPressed = true;
    }
}

void BrushTool::onKeyRelease(int key)
{
    if (key == Qt::Key_Shift) {
        m_shiftPressed = false;
    }
}

void BrushTool::updateCursorPreview(const QPointF& mapPoint)
{
    m_lastCursor = mapPoint;
    m_hasCursor = true;
    m_cursorPreview = GeosBridge::bufferPoint(mapPoint, radiusMapUnits(), m_config.effectiveSegments());
    emit previewChanged();
}

void BrushTool::updateStrokePreview()
{
    if (m_sampler.points().isEmpty()) {
        m_strokePreview = FeatureGeometry();
    } else {
        FeatureGeometry stroke = CorridorBuilder::build(m_sampler.points(), radiusMapUnits(), m_config.segments);
        // Keep the last good preview if this buffer failed
        if (!stroke.isEmpty()) m_strokePreview = stroke;
    }
    emit previewChanged();
}

void BrushTool::finishStroke(const QPointF& mapPoint)
{
    const QVector<QPointF> stroke = m_sampler.end(mapPoint);
    const FeatureGeometry corridor = CorridorBuilder::build(stroke, radiusMapUnits(), m_config.segments);

    m_strokePreview = FeatureGeometry();
    emit previewChanged();

    qCDebug(lcTool) << "Brush stroke finished with" << stroke.size() << "points";

    if (corridor.isEmpty()) {
        // Nothing to select (degenerate stroke)
        return;
    }

    QVector<VectorLayer*> layers;
    if (m_layers) {
        layers = SelectionEngine::candidateLayers(*m_layers, m_config.activeLayerOnly, m_config.geometryFilter);
    }

    SelectionEngine::Options options;
    options.behavior = effectiveBehavior();
    options.respectSymbology = m_config.respectSymbology;

    {
        RenderSuspender suspend(m_canvas);
        m_lastResult = SelectionEngine::selectFeatures(corridor, layers, options);
    }

    const QString message = m_lastResult.summary();
    qCInfo(lcTool).noquote() << message;
    emit statusMessage(message, s_statusTimeoutMs);
    emit selectionFinished(m_lastResult);
}

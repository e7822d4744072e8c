#ifndef BRUSHTOOL_H
#define BRUSHTOOL_H

#include <QObject>
#include <QPoint>
#include <QPointF>
#include <QVector>

#include "brush/brushconfig.h"
#include "brush/selectionengine.h"
#include "brush/strokesampler.h"
#include "geometry/featuregeometry.h"

class LayerRegistry;
class MapCanvasInterface;

/**
 * @brief BrushTool - Paint a stroke over the map to select features
 *
 * Left-drag paints a stroke; the buffered stroke is previewed live and the
 * selection runs once, on release. The radius is set in screen pixels, so
 * the brush feels the same at any zoom and in any CRS. Shift held during
 * the stroke inverts the configured merge policy; Shift+wheel resizes the
 * brush.
 *
 * The tool only sees the canvas through MapCanvasInterface and the layers
 * through LayerRegistry, both owned by the caller.
 */
class BrushTool : public QObject {
    Q_OBJECT
public:
    BrushTool(MapCanvasInterface* canvas, LayerRegistry* layers, QObject* parent = nullptr);

    // Configuration
    const BrushConfig& config() const { return m_config; }
    void setConfig(const BrushConfig& config);
    int radiusPx() const { return m_config.radiusPx; }
    void setRadiusPx(int radiusPx);
    void setSegments(int segments);
    void setActiveLayerOnly(bool activeOnly);
    void setAddToSelection(bool add);
    void setGeometryFilter(GeometryType filter);
    void setRespectSymbology(bool respect);

    // State
    bool isActive() const { return m_active; }
    bool isDragging() const { return m_dragging; }
    bool isShiftPressed() const { return m_shiftPressed; }
    const QVector<QPointF>& strokePoints() const { return m_sampler.points(); }
    const FeatureGeometry& cursorPreview() const { return m_cursorPreview; }
    const FeatureGeometry& strokePreview() const { return m_strokePreview; }
    const SelectionResult& lastResult() const { return m_lastResult; }

    // Merge policy the current (or next) stroke will use
    SelectBehavior effectiveBehavior() const;

    // Tool lifecycle
    void activate();
    void deactivate();

    // Canvas events (positions already in map units)
    void onPress(const QPointF& mapPoint, Qt::MouseButton button, Qt::KeyboardModifiers modifiers);
    void onMove(const QPointF& mapPoint, Qt::MouseButtons buttons);
    void onRelease(const QPointF& mapPoint, Qt::MouseButton button);
    bool onWheel(const QPointF& mapPoint, const QPoint& angleDelta, Qt::KeyboardModifiers modifiers);
    void onKeyPress(int key);
    void onKeyRelease(int key);

signals:
    void previewChanged();
    void radiusChanged(int radiusPx);
    void statusMessage(const QString& message, int timeoutMs);
    void selectionFinished(const SelectionResult& result);

private:
    double radiusMapUnits() const;
    void updateCursorPreview(const QPointF& mapPoint);
    void updateStrokePreview();
    void finishStroke(const QPointF& mapPoint);
    void clearPreviews();

    MapCanvasInterface* m_canvas;
    LayerRegistry* m_layers;
    BrushConfig m_config;

    StrokeSampler m_sampler;
    bool m_active{false};
    bool m_dragging{false};
    bool m_shiftPressed{false};
    bool m_hasCursor{false};
    QPointF m_lastCursor;

    FeatureGeometry m_cursorPreview;
    FeatureGeometry m_strokePreview;
    SelectionResult m_lastResult;
};

#endif // BRUSHTOOL_H

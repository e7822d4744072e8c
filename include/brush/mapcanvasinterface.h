#ifndef MAPCANVASINTERFACE_H
#define MAPCANVASINTERFACE_H

#include <QPoint>
#include <QPointF>

/**
 * @brief MapCanvasInterface - What map tools need from the canvas
 */
class MapCanvasInterface {
public:
    virtual ~MapCanvasInterface() = default;

    // Current zoom as map units per screen pixel
    virtual double mapUnitsPerPixel() const = 0;
    virtual QPointF toMapCoordinates(const QPoint& screen) const = 0;

    // While disabled the canvas keeps showing its last rendered layers
    virtual void setRenderingEnabled(bool enabled) = 0;
    virtual bool isRenderingEnabled() const = 0;
};

/**
 * @brief RenderSuspender - Disables canvas rendering for its lifetime
 *
 * Rendering is re-enabled on destruction, whichever way the scope is left.
 */
class RenderSuspender {
public:
    explicit RenderSuspender(MapCanvasInterface* canvas)
        : m_canvas(canvas)
    {
        if (m_canvas) m_canvas->setRenderingEnabled(false);
    }

    ~RenderSuspender()
    {
        if (m_canvas) m_canvas->setRenderingEnabled(true);
    }

    RenderSuspender(const RenderSuspender&) = delete;
    RenderSuspender& operator=(const RenderSuspender&) = delete;

private:
    MapCanvasInterface* m_canvas;
};

#endif // MAPCANVASINTERFACE_H

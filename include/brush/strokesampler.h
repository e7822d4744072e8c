#ifndef STROKESAMPLER_H
#define STROKESAMPLER_H

#include <QPointF>
#include <QVector>

/**
 * @brief StrokeSampler - Decimates a pointer drag into a sparse map-space path
 *
 * A point is kept only if it lies at least SpacingPx screen pixels from the
 * last kept point. The spacing is converted to map units on every call, so
 * the stroke keeps the same on-screen density at any zoom. The first and
 * last points of a stroke are always kept.
 */
class StrokeSampler {
public:
    static constexpr double SpacingPx = 2.0;

    void begin(const QPointF& point);
    bool extend(const QPointF& point, double mapUnitsPerPixel);
    QVector<QPointF> end(const QPointF& point);
    void reset();

    bool isActive() const { return m_active; }
    const QVector<QPointF>& points() const { return m_points; }

private:
    void append(const QPointF& point);

    QVector<QPointF> m_points;
    QPointF m_lastAdded;
    bool m_active{false};
};

#endif // STROKESAMPLER_H

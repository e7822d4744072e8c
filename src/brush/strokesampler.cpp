#include "brush/strokesampler.h"

static double distanceSquared(const QPointF& a, const QPointF& b)
{
    double dx = a.x() - b.x();
    double dy = a.y() - b.y();
    return dx * dx + dy * dy;
}

void StrokeSampler::append(const QPointF& point)
{
    m_points.append(point);
    m_lastAdded = point;
}

void StrokeSampler::begin(const QPointF& point)
{
    m_points.clear();
    m_active = true;
    append(point);
}

bool StrokeSampler::extend(const QPointF& point, double mapUnitsPerPixel)
{
    if (!m_active) return false;

    const double threshold = SpacingPx * mapUnitsPerPixel;
    if (distanceSquared(point, m_lastAdded) < threshold * threshold) {
        return false;   // jitter
    }

    append(point);
    return true;
}

QVector<QPointF> StrokeSampler::end(const QPointF& point)
{
    if (!m_active) return QVector<QPointF>();

    append(point);
    QVector<QPointF> stroke = m_points;
    reset();
    return stroke;
}

void StrokeSampler::reset()
{
    m_points.clear();
    m_lastAdded = QPointF();
    m_active = false;
}

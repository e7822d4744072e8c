#include "brush/selectionengine.h"
#include "geometry/geosbridge.h"
#include "layers/layerregistry.h"
#include "logging.h"

#include <QElapsedTimer>
#include <QStringList>

QString SelectionResult::summary() const
{
    if (layers.isEmpty()) {
        return QString("Brush selected 0 features in %1 ms").arg(elapsedMs);
    }

    QStringList perLayer;
    for (const auto& entry : layers) {
        perLayer << QString("%1: %2").arg(entry.layerName).arg(entry.count());
    }
    return QString("Brush selected %1 feature(s) [%2] in %3 ms")
        .arg(total)
        .arg(perLayer.join(", "))
        .arg(elapsedMs);
}

static bool acceptsLayer(const VectorLayer* layer, GeometryType filter)
{
    if (!layer) return false;
    return filter == GeometryType::Unknown || layer->geometryType() == filter;
}

QVector<VectorLayer*> SelectionEngine::candidateLayers(const LayerRegistry& registry,
                                                       bool activeLayerOnly,
                                                       GeometryType filter)
{
    QVector<VectorLayer*> result;

    if (activeLayerOnly) {
        VectorLayer* active = registry.activeLayer();
        if (acceptsLayer(active, filter)) result.append(active);
        return result;
    }

    for (VectorLayer* layer : registry.layers()) {
        if (acceptsLayer(layer, filter)) result.append(layer);
    }
    return result;
}

QSet<qint64> SelectionEngine::matchFeatures(const VectorLayer& layer,
                                            const GeosBridge::PreparedGeometry& corridor,
                                            const QRectF& corridorBounds,
                                            bool respectSymbology)
{
    QSet<qint64> ids;
    if (!corridor.isValid()) return ids;

    const QVector<MapFeature> candidates = layer.featuresInRect(corridorBounds);
    for (const auto& feature : candidates) {
        if (feature.geometry.isEmpty()) continue;
        if (!corridor.intersects(feature.geometry)) continue;

        // Features hidden by the layer symbology are not selectable
        if (respectSymbology && !layer.willRenderFeature(feature)) continue;

        ids.insert(feature.id);
    }

    qCDebug(lcTool) << "Layer" << layer.name() << ":" << candidates.size()
                    << "bbox candidates," << ids.size() << "matches";
    return ids;
}

SelectionResult SelectionEngine::selectFeatures(const FeatureGeometry& corridor,
                                                const QVector<VectorLayer*>& layers,
                                                const Options& options)
{
    SelectionResult result;
    QElapsedTimer timer;
    timer.start();

    if (corridor.isEmpty()) {
        result.elapsedMs = timer.elapsed();
        return result;
    }

    const GeosBridge::PreparedGeometry prepared(corridor);
    if (!prepared.isValid()) {
        qCWarning(lcTool) << "Could not prepare brush corridor:" << GeosBridge::lastError();
        result.elapsedMs = timer.elapsed();
        return result;
    }

    const QRectF bounds = corridor.boundingBox();

    for (VectorLayer* layer : layers) {
        if (!layer) continue;

        LayerSelectionResult entry;
        entry.layerName = layer->name();
        entry.ids = matchFeatures(*layer, prepared, bounds, options.respectSymbology);

        if (!entry.ids.isEmpty()) {
            layer->selectByIds(entry.ids, options.behavior);
        } else if (options.behavior == SelectBehavior::SetSelection) {
            layer->removeSelection();
        }

        result.total += entry.count();
        result.layers.append(entry);
    }

    result.elapsedMs = timer.elapsed();
    return result;
}

#ifndef SELECTIONENGINE_H
#define SELECTIONENGINE_H

#include <QRectF>
#include <QSet>
#include <QString>
#include <QVector>

#include "geometry/featuregeometry.h"
#include "layers/vectorlayer.h"

class LayerRegistry;

namespace GeosBridge {
class PreparedGeometry;
}

struct LayerSelectionResult {
    QString layerName;
    QSet<qint64> ids;

    int count() const { return ids.size(); }
};

struct SelectionResult {
    QVector<LayerSelectionResult> layers;   // One entry per candidate layer
    int total{0};
    qint64 elapsedMs{0};

    // e.g. "Brush selected 3 feature(s) [Parcels: 2, Roads: 1] in 4 ms"
    QString summary() const;
};

/**
 * @brief SelectionEngine - Selects the features a brush corridor touches
 *
 * Per candidate layer: bounding box prefilter through the layer's spatial
 * index, exact intersection against the prepared corridor, optional
 * symbology visibility filter, then the merge into the layer selection.
 */
class SelectionEngine {
public:
    struct Options {
        SelectBehavior behavior{SelectBehavior::SetSelection};
        bool respectSymbology{true};
    };

    /**
     * @brief Layers a brush pass applies to
     * @param activeLayerOnly Only the registry's active layer
     * @param filter Required geometry type (Unknown accepts every layer)
     */
    static QVector<VectorLayer*> candidateLayers(const LayerRegistry& registry,
                                                 bool activeLayerOnly,
                                                 GeometryType filter);

    /**
     * @brief Ids of the features of one layer that the corridor intersects
     *
     * Does not modify the layer.
     */
    static QSet<qint64> matchFeatures(const VectorLayer& layer,
                                      const GeosBridge::PreparedGeometry& corridor,
                                      const QRectF& corridorBounds,
                                      bool respectSymbology);

    /**
     * @brief Match every layer and apply the result to its selection
     *
     * With SetSelection a layer without matches has its selection cleared.
     * An empty corridor changes nothing.
     */
    static SelectionResult selectFeatures(const FeatureGeometry& corridor,
                                          const QVector<VectorLayer*>& layers,
                                          const Options& options);
};

#endif // SELECTIONENGINE_H

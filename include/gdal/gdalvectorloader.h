#ifndef GDALVECTORLOADER_H
#define GDALVECTORLOADER_H

#include <QString>
#include <QStringList>
#include <QColor>

#include "geometry/featuregeometry.h"

class LayerRegistry;
class OGRGeometry;
class OGRLayer;
class OGRFeature;

/**
 * @brief GdalVectorLoader - Reads OGR vector datasets into the layer registry
 *
 * Every OGR layer of the dataset becomes one VectorLayer. Feature ids are
 * the OGR FIDs, so selections can be traced back to the source file, and
 * the attribute table is carried over. Curved geometries are linearized.
 */
class GdalVectorLoader {
public:
    GdalVectorLoader() = default;

    // Register the GDAL drivers (call once at startup)
    static void initialize();

    /**
     * @brief Load every vector layer of a dataset
     * @return false if the file cannot be opened or yields no layer
     */
    bool load(const QString& fileName, LayerRegistry& registry);

    // Build a categorized renderer on this attribute for each loaded layer
    void setCategoryAttribute(const QString& attribute) { m_categoryAttribute = attribute; }
    QString categoryAttribute() const { return m_categoryAttribute; }

    QStringList loadedLayers() const { return m_loadedLayers; }
    int featuresLoaded() const { return m_featuresLoaded; }
    int featuresSkipped() const { return m_featuresSkipped; }
    QString lastError() const { return m_lastError; }

    static QString fileFilter();

    // OGR geometry to our geometry model; empty for unsupported types
    static FeatureGeometry convertGeometry(const OGRGeometry* geometry);

private:
    bool readLayer(OGRLayer* ogrLayer, int layerIndex, LayerRegistry& registry);
    static QVariantMap readAttributes(OGRFeature* feature);
    static QString uniqueLayerName(const LayerRegistry& registry, const QString& name);
    static QColor layerColor(int index);

    QString m_categoryAttribute;
    QStringList m_loadedLayers;
    int m_featuresLoaded{0};
    int m_featuresSkipped{0};
    QString m_lastError;
};

#endif // GDALVECTORLOADER_H

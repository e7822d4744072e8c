#include "gdal/gdalvectorloader.h"
#include "layers/layerregistry.h"
#include "layers/vectorlayer.h"
#include "logging.h"

#include <gdal_priv.h>
#include <ogrsf_frmts.h>
#include <cpl_conv.h>
#include <cpl_error.h>

#include <QFileInfo>
#include <QSet>

#include <memory>

// Color palette for layers
static const QColor s_layerColors[] = {
    QColor(230, 60, 60),
    QColor(60, 170, 60),
    QColor(60, 90, 220),
    QColor(220, 170, 30),
    QColor(190, 60, 190),
    QColor(40, 170, 190),
    QColor(240, 130, 20),
    QColor(120, 60, 220),
};
static const int s_numColors = sizeof(s_layerColors) / sizeof(s_layerColors[0]);

void GdalVectorLoader::initialize()
{
    GDALAllRegister();
}

QColor GdalVectorLoader::layerColor(int index)
{
    return s_layerColors[index % s_numColors];
}

QString GdalVectorLoader::fileFilter()
{
    return QStringLiteral("Vector files (*.shp *.gpkg *.geojson *.json *.kml *.gml *.csv *.dxf);;"
                          "Shapefile (*.shp);;GeoPackage (*.gpkg);;GeoJSON (*.geojson *.json);;"
                          "All files (*)");
}

static QVector<QPointF> readPath(const OGRSimpleCurve* curve)
{
    QVector<QPointF> points;
    if (!curve) return points;
    points.reserve(curve->getNumPoints());
    for (int i = 0; i < curve->getNumPoints(); ++i) {
        points.append(QPointF(curve->getX(i), curve->getY(i)));
    }
    return points;
}

static bool appendPolygon(const OGRPolygon* polygon, FeatureGeometry& out)
{
    const OGRLinearRing* exterior = polygon->getExteriorRing();
    if (!exterior || exterior->getNumPoints() < 3) return false;

    GeometryPart part;
    part.points = readPath(exterior);
    for (int r = 0; r < polygon->getNumInteriorRings(); ++r) {
        QVector<QPointF> hole = readPath(polygon->getInteriorRing(r));
        if (hole.size() >= 3) part.holes.append(hole);
    }
    out.parts.append(part);
    return true;
}

// Appends the members of a linear geometry; the first member fixes the type
static void appendGeometry(const OGRGeometry* geometry, FeatureGeometry& out)
{
    if (!geometry || geometry->IsEmpty()) return;

    const OGRwkbGeometryType flat = wkbFlatten(geometry->getGeometryType());
    switch (flat) {
        case wkbPoint: {
            if (out.type != GeometryType::Unknown && out.type != GeometryType::Point) return;
            auto* point = static_cast<const OGRPoint*>(geometry);
            GeometryPart part;
            part.points.append(QPointF(point->getX(), point->getY()));
            out.type = GeometryType::Point;
            out.parts.append(part);
            break;
        }

        case wkbLineString: {
            if (out.type != GeometryType::Unknown && out.type != GeometryType::Line) return;
            GeometryPart part;
            part.points = readPath(static_cast<const OGRLineString*>(geometry));
            if (part.points.size() < 2) return;
            out.type = GeometryType::Line;
            out.parts.append(part);
            break;
        }

        case wkbPolygon: {
            if (out.type != GeometryType::Unknown && out.type != GeometryType::Polygon) return;
            if (appendPolygon(static_cast<const OGRPolygon*>(geometry), out)) {
                out.type = GeometryType::Polygon;
            }
            break;
        }

        case wkbMultiPoint:
        case wkbMultiLineString:
        case wkbMultiPolygon:
        case wkbGeometryCollection: {
            auto* collection = static_cast<const OGRGeometryCollection*>(geometry);
            for (int i = 0; i < collection->getNumGeometries(); ++i) {
                appendGeometry(collection->getGeometryRef(i), out);
            }
            break;
        }

        default:
            // Unsupported geometry type
            break;
    }
}

FeatureGeometry GdalVectorLoader::convertGeometry(const OGRGeometry* geometry)
{
    FeatureGeometry result;
    if (!geometry) return result;

    if (geometry->hasCurveGeometry()) {
        std::unique_ptr<OGRGeometry> linear(geometry->getLinearGeometry());
        appendGeometry(linear.get(), result);
    } else {
        appendGeometry(geometry, result);
    }

    if (result.parts.isEmpty()) result.type = GeometryType::Unknown;
    return result;
}

QVariantMap GdalVectorLoader::readAttributes(OGRFeature* feature)
{
    QVariantMap attributes;
    OGRFeatureDefn* defn = feature->GetDefnRef();
    for (int i = 0; i < defn->GetFieldCount(); ++i) {
        OGRFieldDefn* field = defn->GetFieldDefn(i);
        const QString name = QString::fromUtf8(field->GetNameRef());
        if (!feature->IsFieldSetAndNotNull(i)) {
            attributes.insert(name, QVariant());
            continue;
        }

        switch (field->GetType()) {
            case OFTInteger:
                attributes.insert(name, feature->GetFieldAsInteger(i));
                break;
            case OFTInteger64:
                attributes.insert(name, static_cast<qlonglong>(feature->GetFieldAsInteger64(i)));
                break;
            case OFTReal:
                attributes.insert(name, feature->GetFieldAsDouble(i));
                break;
            default:
                attributes.insert(name, QString::fromUtf8(feature->GetFieldAsString(i)));
                break;
        }
    }
    return attributes;
}

QString GdalVectorLoader::uniqueLayerName(const LayerRegistry& registry, const QString& name)
{
    QString base = name.trimmed().isEmpty() ? QStringLiteral("Layer") : name.trimmed();
    if (!registry.hasLayer(base)) return base;

    int n = 2;
    while (registry.hasLayer(QString("%1 (%2)").arg(base).arg(n))) ++n;
    return QString("%1 (%2)").arg(base).arg(n);
}

static GeometryType layerTypeFromOgr(OGRwkbGeometryType type)
{
    switch (wkbFlatten(OGR_GT_GetLinear(type))) {
        case wkbPoint:
        case wkbMultiPoint:
            return GeometryType::Point;
        case wkbLineString:
        case wkbMultiLineString:
            return GeometryType::Line;
        case wkbPolygon:
        case wkbMultiPolygon:
            return GeometryType::Polygon;
        default:
            return GeometryType::Unknown;
    }
}

bool GdalVectorLoader::load(const QString& fileName, LayerRegistry& registry)
{
    m_loadedLayers.clear();
    m_featuresLoaded = 0;
    m_featuresSkipped = 0;
    m_lastError.clear();

    // GDAL reports through our lastError; keep its console chatter out
    CPLPushErrorHandler(CPLQuietErrorHandler);
    GDALDataset* dataset = static_cast<GDALDataset*>(
        GDALOpenEx(fileName.toUtf8().constData(),
                   GDAL_OF_READONLY | GDAL_OF_VECTOR,
                   nullptr, nullptr, nullptr));
    CPLPopErrorHandler();

    if (!dataset) {
        m_lastError = QString("Failed to open file: %1").arg(CPLGetLastErrorMsg());
        qCWarning(lcGdal) << m_lastError;
        return false;
    }

    // Palette slot of the dataset's first layer
    const int firstColor = registry.count();
    const int layerCount = dataset->GetLayerCount();
    for (int i = 0; i < layerCount; ++i) {
        OGRLayer* ogrLayer = dataset->GetLayer(i);
        if (!ogrLayer) continue;
        readLayer(ogrLayer, firstColor + i, registry);
    }

    GDALClose(dataset);

    if (m_loadedLayers.isEmpty()) {
        m_lastError = QString("No vector features found in %1").arg(QFileInfo(fileName).fileName());
        qCWarning(lcGdal) << m_lastError;
        return false;
    }

    qCInfo(lcGdal) << "Loaded" << m_featuresLoaded << "features in" << m_loadedLayers.size()
                   << "layer(s) from" << fileName << "(" << m_featuresSkipped << "skipped )";
    return true;
}

bool GdalVectorLoader::readLayer(OGRLayer* ogrLayer, int layerIndex, LayerRegistry& registry)
{
    const QString name = uniqueLayerName(registry, QString::fromUtf8(ogrLayer->GetName()));
    auto* layer = new VectorLayer(name, layerTypeFromOgr(ogrLayer->GetGeomType()));
    layer->setColor(layerColor(layerIndex));

    // Get CRS
    const OGRSpatialReference* srs = ogrLayer->GetSpatialRef();
    if (srs) {
        const char* authName = srs->GetAuthorityName(nullptr);
        const char* authCode = srs->GetAuthorityCode(nullptr);
        if (authName && authCode) {
            layer->setCrs(QString("%1:%2").arg(authName).arg(authCode));
        }
    }

    QSet<QString> categoryValues;
    QVector<QVariant> orderedValues;

    ogrLayer->ResetReading();
    OGRFeature* ogrFeature;
    while ((ogrFeature = ogrLayer->GetNextFeature()) != nullptr) {
        MapFeature feature;
        feature.geometry = convertGeometry(ogrFeature->GetGeometryRef());
        const GIntBig fid = ogrFeature->GetFID();
        feature.id = (fid == OGRNullFID) ? -1 : static_cast<qint64>(fid);
        feature.attributes = readAttributes(ogrFeature);
        OGRFeature::DestroyFeature(ogrFeature);

        // Members of another geometry type are refused by the layer
        if (feature.geometry.isEmpty() || !layer->addFeature(feature)) {
            ++m_featuresSkipped;
            continue;
        }
        ++m_featuresLoaded;

        if (!m_categoryAttribute.isEmpty()) {
            const QVariant value = feature.attributes.value(m_categoryAttribute);
            if (!value.isNull() && !categoryValues.contains(value.toString())) {
                categoryValues.insert(value.toString());
                orderedValues.append(value);
            }
        }
    }

    if (layer->featureCount() == 0) {
        qCDebug(lcGdal) << "Skipping empty layer" << name;
        delete layer;
        return false;
    }

    if (!m_categoryAttribute.isEmpty() && !orderedValues.isEmpty()) {
        CategoryRenderer renderer(m_categoryAttribute);
        for (int i = 0; i < orderedValues.size(); ++i) {
            renderer.addCategory(orderedValues[i], layerColor(layerIndex + i + 1));
        }
        layer->setRenderer(renderer);
    }

    if (!registry.addLayer(layer)) {
        return false;
    }
    m_loadedLayers.append(name);
    return true;
}

#include "gdal/gdalvectorloader.h"
#include "layers/layerregistry.h"
#include "layers/vectorlayer.h"

#include <gtest/gtest.h>

#include <gdal_priv.h>
#include <ogr_geometry.h>
#include <ogrsf_frmts.h>

#include <QFile>
#include <QTemporaryDir>

namespace {

    const char* kGeoJson = R"({
  "type": "FeatureCollection",
  "features": [
    {"type": "Feature", "id": 7, "properties": {"kind": "road", "lanes": 2},
     "geometry": {"type": "LineString", "coordinates": [[0, 0], [10, 0]]}},
    {"type": "Feature", "id": 9, "properties": {"kind": "path", "lanes": 1},
     "geometry": {"type": "MultiLineString", "coordinates": [[[0, 5], [10, 5]], [[0, 6], [10, 6]]]}},
    {"type": "Feature", "id": 11, "properties": {"kind": "road", "lanes": null},
     "geometry": null}
  ]
})";

    FeatureGeometry convertWkt(const char* wkt) {
        OGRGeometry* geometry = nullptr;
        if (OGRGeometryFactory::createFromWkt(wkt, nullptr, &geometry) != OGRERR_NONE) {
            return FeatureGeometry();
        }
        FeatureGeometry result = GdalVectorLoader::convertGeometry(geometry);
        OGRGeometryFactory::destroyGeometry(geometry);
        return result;
    }

} // anonymous namespace

class GdalVectorLoaderTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() { GdalVectorLoader::initialize(); }

    QString writeFile(const QString& name, const QByteArray& content) {
        const QString path = dir.filePath(name);
        QFile file(path);
        if (file.open(QIODevice::WriteOnly)) file.write(content);
        return path;
    }

    QTemporaryDir dir;
    LayerRegistry registry;
    GdalVectorLoader loader;
};

TEST_F(GdalVectorLoaderTest, ConvertsPoints) {
    const FeatureGeometry point = convertWkt("POINT (3 4)");
    EXPECT_EQ(point.type, GeometryType::Point);
    ASSERT_EQ(point.parts.size(), 1);
    EXPECT_EQ(point.parts.first().points.first(), QPointF(3, 4));

    const FeatureGeometry multi = convertWkt("MULTIPOINT ((0 0), (1 1), (2 2))");
    EXPECT_EQ(multi.type, GeometryType::Point);
    EXPECT_EQ(multi.parts.size(), 3);
}

TEST_F(GdalVectorLoaderTest, ConvertsPolygonWithHole) {
    const FeatureGeometry polygon =
        convertWkt("POLYGON ((0 0, 10 0, 10 10, 0 10, 0 0), (2 2, 4 2, 4 4, 2 4, 2 2))");
    EXPECT_EQ(polygon.type, GeometryType::Polygon);
    ASSERT_EQ(polygon.parts.size(), 1);
    EXPECT_EQ(polygon.parts.first().points.size(), 5);
    EXPECT_EQ(polygon.parts.first().holes.size(), 1);
}

TEST_F(GdalVectorLoaderTest, ConvertsMultiPolygonAnd25D) {
    const FeatureGeometry multi =
        convertWkt("MULTIPOLYGON Z (((0 0 1, 1 0 1, 1 1 1, 0 0 1)), ((5 5 2, 6 5 2, 6 6 2, 5 5 2)))");
    EXPECT_EQ(multi.type, GeometryType::Polygon);
    EXPECT_EQ(multi.parts.size(), 2);
}

TEST_F(GdalVectorLoaderTest, LinearizesCurves) {
    const FeatureGeometry arc = convertWkt("CIRCULARSTRING (0 0, 1 1, 2 0)");
    EXPECT_EQ(arc.type, GeometryType::Line);
    ASSERT_EQ(arc.parts.size(), 1);
    EXPECT_GT(arc.parts.first().points.size(), 3);
}

TEST_F(GdalVectorLoaderTest, CollectionKeepsFirstMemberType) {
    const FeatureGeometry mixed =
        convertWkt("GEOMETRYCOLLECTION (LINESTRING (0 0, 1 1), POINT (5 5), LINESTRING (2 2, 3 3))");
    EXPECT_EQ(mixed.type, GeometryType::Line);
    EXPECT_EQ(mixed.parts.size(), 2);
}

TEST_F(GdalVectorLoaderTest, EmptyGeometryConvertsToEmpty) {
    EXPECT_TRUE(convertWkt("POINT EMPTY").isEmpty());
    EXPECT_EQ(convertWkt("POINT EMPTY").type, GeometryType::Unknown);
    EXPECT_TRUE(GdalVectorLoader::convertGeometry(nullptr).isEmpty());
}

TEST_F(GdalVectorLoaderTest, LoadsGeoJsonWithIdsAndAttributes) {
    ASSERT_TRUE(dir.isValid());
    const QString path = writeFile("roads.geojson", kGeoJson);

    ASSERT_TRUE(loader.load(path, registry)) << loader.lastError().toStdString();
    ASSERT_EQ(loader.loadedLayers().size(), 1);
    EXPECT_EQ(loader.featuresLoaded(), 2);
    EXPECT_EQ(loader.featuresSkipped(), 1);

    VectorLayer* layer = registry.layer(loader.loadedLayers().first());
    ASSERT_NE(layer, nullptr);
    EXPECT_EQ(layer->geometryType(), GeometryType::Line);
    EXPECT_EQ(registry.activeLayer(), layer);

    const MapFeature* road = layer->feature(7);
    ASSERT_NE(road, nullptr);
    EXPECT_EQ(road->attributes.value("kind").toString(), "road");
    EXPECT_EQ(road->attributes.value("lanes").toInt(), 2);

    const MapFeature* path2 = layer->feature(9);
    ASSERT_NE(path2, nullptr);
    EXPECT_EQ(path2->geometry.parts.size(), 2);
}

TEST_F(GdalVectorLoaderTest, CategorizesOnRequest) {
    const QString path = writeFile("roads.geojson", kGeoJson);
    loader.setCategoryAttribute("kind");
    ASSERT_TRUE(loader.load(path, registry));

    VectorLayer* layer = registry.layer(loader.loadedLayers().first());
    ASSERT_NE(layer, nullptr);
    EXPECT_TRUE(layer->renderer().isCategorized());
    EXPECT_EQ(layer->renderer().categories().size(), 2);

    ASSERT_TRUE(layer->setCategoryVisible("path", false));
    EXPECT_FALSE(layer->willRenderFeature(*layer->feature(9)));
    EXPECT_TRUE(layer->willRenderFeature(*layer->feature(7)));
}

TEST_F(GdalVectorLoaderTest, LayerNamesAreMadeUnique) {
    const QString path = writeFile("roads.geojson", kGeoJson);
    ASSERT_TRUE(loader.load(path, registry));
    ASSERT_TRUE(loader.load(path, registry));
    EXPECT_EQ(registry.count(), 2);
    EXPECT_TRUE(loader.loadedLayers().first().endsWith("(2)"));
}

TEST_F(GdalVectorLoaderTest, LayersOfOneDatasetTakeConsecutiveColors) {
    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("GPKG");
    if (!driver) GTEST_SKIP() << "GeoPackage driver not available";

    const QString path = dir.filePath("survey.gpkg");
    GDALDataset* dataset = driver->Create(path.toUtf8().constData(), 0, 0, 0, GDT_Unknown, nullptr);
    ASSERT_NE(dataset, nullptr);
    for (const char* name : {"wells", "beacons", "pegs"}) {
        OGRLayer* ogrLayer = dataset->CreateLayer(name, nullptr, wkbPoint, nullptr);
        ASSERT_NE(ogrLayer, nullptr);
        OGRFeature* ogrFeature = OGRFeature::CreateFeature(ogrLayer->GetLayerDefn());
        OGRPoint point(1.0, 2.0);
        ogrFeature->SetGeometry(&point);
        EXPECT_EQ(ogrLayer->CreateFeature(ogrFeature), OGRERR_NONE);
        OGRFeature::DestroyFeature(ogrFeature);
    }
    GDALClose(dataset);

    ASSERT_TRUE(loader.load(path, registry)) << loader.lastError().toStdString();
    ASSERT_EQ(loader.loadedLayers().size(), 3);

    const QVector<QColor> expected{QColor(230, 60, 60), QColor(60, 170, 60), QColor(60, 90, 220)};
    for (int i = 0; i < 3; ++i) {
        VectorLayer* layer = registry.layer(loader.loadedLayers()[i]);
        ASSERT_NE(layer, nullptr);
        EXPECT_EQ(layer->color(), expected[i]) << "layer " << i;
    }
}

TEST_F(GdalVectorLoaderTest, MissingFileFails) {
    EXPECT_FALSE(loader.load(dir.filePath("missing.shp"), registry));
    EXPECT_FALSE(loader.lastError().isEmpty());
    EXPECT_EQ(registry.count(), 0);
}

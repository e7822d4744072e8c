#include "layers/categoryrenderer.h"
#include "layers/vectorlayer.h"

#include <gtest/gtest.h>

namespace {

    MapFeature pointFeature(qint64 id, double x, double y, const QString& kind = QString()) {
        MapFeature f;
        f.id = id;
        f.geometry = FeatureGeometry::fromPoint(QPointF(x, y));
        if (!kind.isEmpty()) f.attributes.insert("kind", kind);
        return f;
    }

} // anonymous namespace

class VectorLayerTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (qint64 id = 1; id <= 5; ++id) {
            ASSERT_TRUE(layer.addFeature(pointFeature(id, id * 10.0, 0.0)));
        }
        QObject::connect(&layer, &VectorLayer::selectionChanged, [this]() { ++selectionSignals; });
    }

    VectorLayer layer{"Points"};
    int selectionSignals = 0;
};

TEST_F(VectorLayerTest, InfersTypeFromFirstFeature) {
    EXPECT_EQ(layer.geometryType(), GeometryType::Point);
    EXPECT_EQ(layer.featureCount(), 5);
}

TEST_F(VectorLayerTest, RejectsDuplicateIds) {
    EXPECT_FALSE(layer.addFeature(pointFeature(3, 0, 0)));
    EXPECT_EQ(layer.featureCount(), 5);
}

TEST_F(VectorLayerTest, RejectsOtherGeometryTypes) {
    MapFeature parcel;
    parcel.id = 10;
    parcel.geometry = FeatureGeometry::fromPolygon({QPointF(0, 0), QPointF(1, 0), QPointF(1, 1)});
    EXPECT_FALSE(layer.addFeature(parcel));

    MapFeature road;
    road.id = 11;
    road.geometry = FeatureGeometry::fromPolyline({QPointF(0, 0), QPointF(5, 5)});
    EXPECT_FALSE(layer.addFeature(road));

    EXPECT_EQ(layer.featureCount(), 5);
    EXPECT_EQ(layer.geometryType(), GeometryType::Point);

    // Features without geometry are kept
    MapFeature bare;
    bare.id = 12;
    EXPECT_TRUE(layer.addFeature(bare));
}

TEST_F(VectorLayerTest, AssignsNextFreeId) {
    ASSERT_TRUE(layer.addFeature(pointFeature(-1, 0, 0)));
    EXPECT_NE(layer.feature(6), nullptr);
}

TEST_F(VectorLayerTest, ExtentIncludesPointFeatures) {
    const QRectF e = layer.extent();
    EXPECT_DOUBLE_EQ(e.left(), 10.0);
    EXPECT_DOUBLE_EQ(e.right(), 50.0);
    EXPECT_DOUBLE_EQ(e.height(), 0.0);
}

TEST_F(VectorLayerTest, FeaturesInRectUsesBoundingBoxes) {
    const QVector<MapFeature> hits = layer.featuresInRect(QRectF(15, -1, 20, 2));
    ASSERT_EQ(hits.size(), 2);
    EXPECT_EQ(hits[0].id, 2);
    EXPECT_EQ(hits[1].id, 3);

    // Index follows feature edits
    ASSERT_TRUE(layer.removeFeature(2));
    ASSERT_EQ(layer.featuresInRect(QRectF(15, -1, 20, 2)).size(), 1);
}

TEST_F(VectorLayerTest, SetSelectionReplaces) {
    layer.selectByIds({1, 2, 3}, SelectBehavior::SetSelection);
    layer.selectByIds({3, 4}, SelectBehavior::SetSelection);
    EXPECT_EQ(layer.selectedFeatureIds(), (QSet<qint64>{3, 4}));
    EXPECT_EQ(selectionSignals, 2);
}

TEST_F(VectorLayerTest, AddToSelectionUnions) {
    layer.selectByIds({1, 2, 3}, SelectBehavior::SetSelection);
    layer.selectByIds({3, 4}, SelectBehavior::AddToSelection);
    EXPECT_EQ(layer.selectedFeatureIds(), (QSet<qint64>{1, 2, 3, 4}));
}

TEST_F(VectorLayerTest, UnknownIdsAreIgnored) {
    layer.selectByIds({2, 99}, SelectBehavior::SetSelection);
    EXPECT_EQ(layer.selectedFeatureIds(), (QSet<qint64>{2}));
}

TEST_F(VectorLayerTest, UnchangedSelectionDoesNotNotify) {
    layer.selectByIds({1, 2}, SelectBehavior::SetSelection);
    layer.selectByIds({2}, SelectBehavior::AddToSelection);
    EXPECT_EQ(selectionSignals, 1);
}

TEST_F(VectorLayerTest, RemoveSelectionClears) {
    layer.selectByIds({1, 2}, SelectBehavior::SetSelection);
    layer.removeSelection();
    EXPECT_TRUE(layer.selectedFeatureIds().isEmpty());
    layer.removeSelection();
    EXPECT_EQ(selectionSignals, 2);
}

TEST_F(VectorLayerTest, RemovingSelectedFeatureDropsIt) {
    layer.selectByIds({1, 2}, SelectBehavior::SetSelection);
    ASSERT_TRUE(layer.removeFeature(1));
    EXPECT_EQ(layer.selectedFeatureIds(), (QSet<qint64>{2}));
}

TEST_F(VectorLayerTest, HiddenLayerRendersNothing) {
    const MapFeature f = *layer.feature(1);
    EXPECT_TRUE(layer.willRenderFeature(f));
    layer.setVisible(false);
    EXPECT_FALSE(layer.willRenderFeature(f));
}

// ============================================================================
// CategoryRenderer
// ============================================================================

class CategoryRendererTest : public ::testing::Test {
protected:
    void SetUp() override {
        renderer.addCategory("road", QColor(Qt::red));
        renderer.addCategory("path", QColor(Qt::green), false);
    }

    CategoryRenderer renderer{"kind"};
};

TEST_F(CategoryRendererTest, UncategorizedRendererDrawsEverything) {
    CategoryRenderer plain;
    EXPECT_FALSE(plain.isCategorized());
    EXPECT_TRUE(plain.willRender(pointFeature(1, 0, 0, "anything")));
    EXPECT_EQ(plain.colorFor(pointFeature(1, 0, 0), Qt::blue), QColor(Qt::blue));
}

TEST_F(CategoryRendererTest, HiddenCategoryIsNotRendered) {
    EXPECT_TRUE(renderer.willRender(pointFeature(1, 0, 0, "road")));
    EXPECT_FALSE(renderer.willRender(pointFeature(2, 0, 0, "path")));

    ASSERT_TRUE(renderer.setCategoryVisible("path", true));
    EXPECT_TRUE(renderer.willRender(pointFeature(2, 0, 0, "path")));
    EXPECT_FALSE(renderer.setCategoryVisible("river", false));
}

TEST_F(CategoryRendererTest, OtherValuesFollowFallbackSwitch) {
    EXPECT_TRUE(renderer.willRender(pointFeature(1, 0, 0, "river")));
    renderer.setRenderUncategorized(false);
    EXPECT_FALSE(renderer.willRender(pointFeature(1, 0, 0, "river")));
}

TEST_F(CategoryRendererTest, ValuesMatchByText) {
    CategoryRenderer byCode("code");
    byCode.addCategory(7, QColor(Qt::red), false);

    MapFeature f = pointFeature(1, 0, 0);
    f.attributes.insert("code", QString("7"));
    EXPECT_FALSE(byCode.willRender(f));
}

TEST_F(CategoryRendererTest, ColorForCategory) {
    EXPECT_EQ(renderer.colorFor(pointFeature(1, 0, 0, "road"), Qt::blue), QColor(Qt::red));
    EXPECT_EQ(renderer.colorFor(pointFeature(1, 0, 0, "river"), Qt::blue), QColor(Qt::blue));
}

#include "brush/corridorbuilder.h"
#include "geometry/geosbridge.h"

#include <gtest/gtest.h>

#include <cmath>

namespace {

    constexpr double kPi = 3.14159265358979323846;

    bool containsPoint(const FeatureGeometry& geometry, const QPointF& p) {
        return GeosBridge::intersects(geometry, FeatureGeometry::fromPoint(p));
    }

} // anonymous namespace

class CorridorBuilderTest : public ::testing::Test {};

TEST_F(CorridorBuilderTest, EmptyStrokeGivesEmptyCorridor) {
    EXPECT_TRUE(CorridorBuilder::build({}, 5.0, 8).isEmpty());
}

TEST_F(CorridorBuilderTest, SinglePointGivesDisc) {
    const FeatureGeometry disc = CorridorBuilder::build({QPointF(10, 10)}, 5.0, 8);
    ASSERT_FALSE(disc.isEmpty());
    EXPECT_EQ(disc.type, GeometryType::Polygon);

    // A 32-gon inscribed in the circle is within 1% of pi r^2
    const double area = GeosBridge::calculateArea(disc);
    EXPECT_NEAR(area, kPi * 25.0, kPi * 25.0 * 0.01);

    const QRectF box = disc.boundingBox();
    EXPECT_NEAR(box.width(), 10.0, 1e-6);
    EXPECT_NEAR(box.center().x(), 10.0, 1e-6);
    EXPECT_NEAR(box.center().y(), 10.0, 1e-6);
}

TEST_F(CorridorBuilderTest, CoincidentPointsBehaveLikeOnePoint) {
    const FeatureGeometry single = CorridorBuilder::build({QPointF(3, 4)}, 2.0, 8);
    const FeatureGeometry doubled = CorridorBuilder::build({QPointF(3, 4), QPointF(3, 4)}, 2.0, 8);
    ASSERT_FALSE(doubled.isEmpty());
    EXPECT_DOUBLE_EQ(GeosBridge::calculateArea(single), GeosBridge::calculateArea(doubled));
    EXPECT_EQ(single.vertexCount(), doubled.vertexCount());
}

TEST_F(CorridorBuilderTest, StraightStrokeIsCapsule) {
    const double r = 2.0;
    const FeatureGeometry corridor = CorridorBuilder::build({QPointF(0, 0), QPointF(10, 0)}, r, 8);
    ASSERT_FALSE(corridor.isEmpty());

    // Rectangle plus two half discs
    const double expected = 10.0 * 2.0 * r + kPi * r * r;
    EXPECT_NEAR(GeosBridge::calculateArea(corridor), expected, expected * 0.01);

    EXPECT_TRUE(containsPoint(corridor, QPointF(5, 1.9)));
    EXPECT_TRUE(containsPoint(corridor, QPointF(-1.9, 0)));   // round cap
    EXPECT_FALSE(containsPoint(corridor, QPointF(5, 2.5)));
    EXPECT_FALSE(containsPoint(corridor, QPointF(-1.5, 1.5)));
}

TEST_F(CorridorBuilderTest, SegmentsAreRaisedToMinimum) {
    const FeatureGeometry coarse = CorridorBuilder::build({QPointF(0, 0)}, 1.0, 1);
    const FeatureGeometry minimum = CorridorBuilder::build({QPointF(0, 0)}, 1.0, 8);
    EXPECT_EQ(coarse.vertexCount(), minimum.vertexCount());

    const FeatureGeometry fine = CorridorBuilder::build({QPointF(0, 0)}, 1.0, 16);
    EXPECT_GT(fine.vertexCount(), minimum.vertexCount());
}

TEST_F(CorridorBuilderTest, SameInputGivesSameCorridor) {
    const QVector<QPointF> stroke{QPointF(0, 0), QPointF(4, 3), QPointF(8, 0), QPointF(8, -5)};
    const FeatureGeometry a = CorridorBuilder::build(stroke, 1.5, 8);
    const FeatureGeometry b = CorridorBuilder::build(stroke, 1.5, 8);
    ASSERT_EQ(a.parts.size(), b.parts.size());
    ASSERT_FALSE(a.parts.isEmpty());
    EXPECT_EQ(a.parts.first().points, b.parts.first().points);
}

TEST_F(CorridorBuilderTest, NonPositiveRadiusFails) {
    EXPECT_TRUE(CorridorBuilder::build({QPointF(0, 0)}, 0.0, 8).isEmpty());
    EXPECT_TRUE(CorridorBuilder::build({QPointF(0, 0), QPointF(1, 1)}, -1.0, 8).isEmpty());
    EXPECT_TRUE(CorridorBuilder::build({QPointF(0, 0)}, std::nan(""), 8).isEmpty());
}

TEST_F(CorridorBuilderTest, RemoveRepeatedPointsKeepsOrder) {
    const QVector<QPointF> in{QPointF(0, 0), QPointF(0, 0), QPointF(1, 0), QPointF(1, 0),
                              QPointF(0, 0)};
    const QVector<QPointF> out = CorridorBuilder::removeRepeatedPoints(in);
    ASSERT_EQ(out.size(), 3);
    EXPECT_EQ(out[0], QPointF(0, 0));
    EXPECT_EQ(out[1], QPointF(1, 0));
    EXPECT_EQ(out[2], QPointF(0, 0));
}

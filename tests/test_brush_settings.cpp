#include "brushsettings.h"

#include <gtest/gtest.h>

#include <QSettings>
#include <QTemporaryDir>

class BrushSettingsTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(dir.isValid());
        path = dir.filePath("brush.ini");
    }

    QTemporaryDir dir;
    QString path;
};

TEST_F(BrushSettingsTest, DefaultsWhenEmpty) {
    QSettings settings(path, QSettings::IniFormat);
    const BrushConfig config = BrushSettings::load(settings);
    EXPECT_EQ(config.radiusPx, 20);
    EXPECT_EQ(config.segments, 8);
    EXPECT_EQ(config.selectBehavior, SelectBehavior::SetSelection);
    EXPECT_TRUE(config.activeLayerOnly);
    EXPECT_EQ(config.geometryFilter, GeometryType::Unknown);
    EXPECT_TRUE(config.respectSymbology);
    EXPECT_EQ(config.radiusStep, 2);
}

TEST_F(BrushSettingsTest, SaveThenLoad) {
    BrushConfig config;
    config.radiusPx = 45;
    config.segments = 12;
    config.selectBehavior = SelectBehavior::AddToSelection;
    config.activeLayerOnly = false;
    config.geometryFilter = GeometryType::Polygon;
    config.respectSymbology = false;
    config.radiusStep = 5;

    {
        QSettings settings(path, QSettings::IniFormat);
        BrushSettings::save(config, settings);
    }

    QSettings settings(path, QSettings::IniFormat);
    EXPECT_EQ(settings.value("brush/geometryFilter").toString(), "polygon");

    const BrushConfig loaded = BrushSettings::load(settings);
    EXPECT_EQ(loaded.radiusPx, 45);
    EXPECT_EQ(loaded.segments, 12);
    EXPECT_EQ(loaded.selectBehavior, SelectBehavior::AddToSelection);
    EXPECT_FALSE(loaded.activeLayerOnly);
    EXPECT_EQ(loaded.geometryFilter, GeometryType::Polygon);
    EXPECT_FALSE(loaded.respectSymbology);
    EXPECT_EQ(loaded.radiusStep, 5);
}

TEST_F(BrushSettingsTest, OutOfRangeValuesAreClamped) {
    QSettings settings(path, QSettings::IniFormat);
    settings.setValue("brush/radiusPx", 1000);
    settings.setValue("brush/segments", 2);
    settings.setValue("brush/radiusStep", 0);
    settings.setValue("brush/geometryFilter", "raster");

    const BrushConfig config = BrushSettings::load(settings);
    EXPECT_EQ(config.radiusPx, 200);
    EXPECT_EQ(config.segments, 8);
    EXPECT_EQ(config.radiusStep, 1);
    EXPECT_EQ(config.geometryFilter, GeometryType::Unknown);

    settings.setValue("brush/radiusPx", -3);
    EXPECT_EQ(BrushSettings::load(settings).radiusPx, 1);
}

TEST_F(BrushSettingsTest, GeometryTypeNames) {
    EXPECT_EQ(geometryTypeName(GeometryType::Line), "line");
    EXPECT_EQ(geometryTypeFromName(" Point "), GeometryType::Point);
    EXPECT_EQ(geometryTypeFromName("any"), GeometryType::Unknown);
}

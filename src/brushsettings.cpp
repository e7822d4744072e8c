#include "brushsettings.h"
#include <QSettings>

static QString radiusKey() { return QStringLiteral("brush/radiusPx"); }
static QString segmentsKey() { return QStringLiteral("brush/segments"); }
static QString addKey() { return QStringLiteral("brush/addToSelection"); }
static QString activeOnlyKey() { return QStringLiteral("brush/activeLayerOnly"); }
static QString filterKey() { return QStringLiteral("brush/geometryFilter"); }
static QString symbologyKey() { return QStringLiteral("brush/respectSymbology"); }
static QString stepKey() { return QStringLiteral("brush/radiusStep"); }

// Upper bound for stored segment counts; finer arcs only cost time
static const int s_maxSegments = 64;

int BrushSettings::radiusPx()
{
    QSettings s;
    return BrushConfig::clampRadius(s.value(radiusKey(), BrushConfig().radiusPx).toInt());
}

void BrushSettings::setRadiusPx(int px)
{
    QSettings s;
    s.setValue(radiusKey(), BrushConfig::clampRadius(px));
}

BrushConfig BrushSettings::load()
{
    QSettings s;
    return load(s);
}

BrushConfig BrushSettings::load(const QSettings& settings)
{
    BrushConfig config;
    config.setRadiusPx(settings.value(radiusKey(), config.radiusPx).toInt());
    config.segments = qBound(BrushConfig::MinSegments,
                             settings.value(segmentsKey(), config.segments).toInt(), s_maxSegments);
    config.selectBehavior = settings.value(addKey(), false).toBool()
        ? SelectBehavior::AddToSelection
        : SelectBehavior::SetSelection;
    config.activeLayerOnly = settings.value(activeOnlyKey(), config.activeLayerOnly).toBool();
    config.geometryFilter = geometryTypeFromName(settings.value(filterKey(), "any").toString());
    config.respectSymbology = settings.value(symbologyKey(), config.respectSymbology).toBool();
    config.radiusStep = qBound(1, settings.value(stepKey(), config.radiusStep).toInt(), BrushConfig::MaxRadiusPx);
    return config;
}

void BrushSettings::save(const BrushConfig& config)
{
    QSettings s;
    save(config, s);
}

void BrushSettings::save(const BrushConfig& config, QSettings& settings)
{
    settings.setValue(radiusKey(), BrushConfig::clampRadius(config.radiusPx));
    settings.setValue(segmentsKey(), qBound(BrushConfig::MinSegments, config.segments, s_maxSegments));
    settings.setValue(addKey(), config.selectBehavior == SelectBehavior::AddToSelection);
    settings.setValue(activeOnlyKey(), config.activeLayerOnly);
    settings.setValue(filterKey(), geometryTypeName(config.geometryFilter));
    settings.setValue(symbologyKey(), config.respectSymbology);
    settings.setValue(stepKey(), qBound(1, config.radiusStep, BrushConfig::MaxRadiusPx));
}

#ifndef BRUSHSETTINGS_H
#define BRUSHSETTINGS_H

#include <QString>

#include "brush/brushconfig.h"

class QSettings;

/**
 * @brief BrushSettings - Persistent brush options (QSettings, group "brush")
 *
 * Static accessors use the application QSettings; load()/save() also accept
 * an explicit store. Values are clamped on read.
 */
class BrushSettings {
public:
    static int radiusPx();
    static void setRadiusPx(int px);

    static BrushConfig load();
    static BrushConfig load(const QSettings& settings);
    static void save(const BrushConfig& config);
    static void save(const BrushConfig& config, QSettings& settings);
};

#endif // BRUSHSETTINGS_H

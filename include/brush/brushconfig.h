#ifndef BRUSHCONFIG_H
#define BRUSHCONFIG_H

#include <QtGlobal>

#include "geometry/featuregeometry.h"
#include "layers/vectorlayer.h"

/**
 * @brief BrushConfig - Brush options shared by the tool and the UI controls
 */
struct BrushConfig {
    static constexpr int MinRadiusPx = 1;
    static constexpr int MaxRadiusPx = 200;
    static constexpr int MinSegments = 8;

    int radiusPx{20};                       // Screen pixels
    int segments{8};                        // Buffer segments per quadrant
    SelectBehavior selectBehavior{SelectBehavior::SetSelection};
    bool activeLayerOnly{true};
    GeometryType geometryFilter{GeometryType::Unknown};    // Unknown = any type
    bool respectSymbology{true};            // Skip features hidden by the renderer
    int radiusStep{2};                      // Shift+wheel step in pixels

    static int clampRadius(int px) { return qBound(MinRadiusPx, px, MaxRadiusPx); }
    void setRadiusPx(int px) { radiusPx = clampRadius(px); }

    int effectiveSegments() const { return qMax(MinSegments, segments); }
    double radiusMapUnits(double mapUnitsPerPixel) const { return radiusPx * mapUnitsPerPixel; }
};

#endif // BRUSHCONFIG_H

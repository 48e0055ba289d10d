#pragma once

#include "Geometry.hpp"

namespace deck
{

struct PlacementSettings
{
    static constexpr int kDefaultAnchorX = 10;
    static constexpr int kDefaultAnchorY = 10;
    static constexpr int kDefaultGap = 5;

    Point anchor{ kDefaultAnchorX, kDefaultAnchorY };
    int gap = kDefaultGap;

    void applyDefaults()
    {
        anchor = Point{ kDefaultAnchorX, kDefaultAnchorY };
        gap = kDefaultGap;
    }
};

} // namespace deck

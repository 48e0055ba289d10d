#pragma once

#include "../placement/PlacementSettings.hpp"

#include <toml++/toml.h>

// TOML mapping for the [placement] section
class PlacementSerializer
{
public:
    static toml::table serialize(const deck::PlacementSettings& settings);

    // Missing keys keep their defaults. Returns false if any present value was rejected.
    static bool deserialize(const toml::table& tbl, deck::PlacementSettings& settings);
};

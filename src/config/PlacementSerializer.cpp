#include "PlacementSerializer.hpp"

#include "../utils/ErrorReporter.hpp"

#include <cstdint>
#include <string>

namespace
{
// Reads a non-negative integer key into out. Absent keys leave out untouched.
bool read_non_negative(const toml::table& tbl, const char* key, int& out)
{
    const auto* node = tbl.get(key);
    if (!node)
        return true;

    // Exact: booleans and floats are not integers here.
    auto value = node->value_exact<int64_t>();
    if (!value || *value < 0 || *value > 100000)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            std::string("Invalid placement setting '") + key + "', using default",
                                            "Expected an integer between 0 and 100000");
        return false;
    }
    out = static_cast<int>(*value);
    return true;
}
} // namespace

toml::table PlacementSerializer::serialize(const deck::PlacementSettings& settings)
{
    toml::table t;
    t.insert("anchor_x", settings.anchor.x);
    t.insert("anchor_y", settings.anchor.y);
    t.insert("gap", settings.gap);
    return t;
}

bool PlacementSerializer::deserialize(const toml::table& tbl, deck::PlacementSettings& settings)
{
    bool ok = true;
    ok &= read_non_negative(tbl, "anchor_x", settings.anchor.x);
    ok &= read_non_negative(tbl, "anchor_y", settings.anchor.y);
    ok &= read_non_negative(tbl, "gap", settings.gap);
    return ok;
}

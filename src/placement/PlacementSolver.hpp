#pragma once

#include "Geometry.hpp"
#include "PlacementSettings.hpp"

#include <functional>
#include <optional>
#include <vector>

namespace deck
{

using DisplaySizeFn = std::function<Size()>;

/**
 * @brief Picks the top-left corner for a new dialog next to the ones already on screen
 *
 * Candidates are generated around every existing rectangle (right, left, below, above and
 * three diagonals, separated by the configured gap), ranked by squared distance to the
 * anchor, and the first one that does not overlap anything wins. When none fits, a
 * row-major grid scan bounded by the display size is tried, and as a last resort the
 * anchor is returned even if it overlaps.
 *
 * The solver holds no state besides its settings; the same inputs always give the same
 * position.
 */
class PlacementSolver
{
public:
    explicit PlacementSolver(PlacementSettings settings = {});

    Point findPosition(const std::vector<Rect>& existing, int width, int height,
                       const DisplaySizeFn& display_size) const;

    /// Candidates in the order findPosition tries them, overlapping ones included.
    std::vector<Point> rankedCandidates(const std::vector<Rect>& existing, int width, int height) const;

    /// First free cell of the fallback grid, or nullopt when the bounded area is full.
    std::optional<Point> scanGrid(const std::vector<Rect>& existing, int width, int height,
                                  Size display) const;

    const PlacementSettings& settings() const { return settings_; }

private:
    void addCandidatesAround(const Rect& rect, int width, int height, std::vector<Point>& out) const;
    long long distanceSquared(const Point& p) const;

    PlacementSettings settings_;
};

} // namespace deck

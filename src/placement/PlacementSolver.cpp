#include "PlacementSolver.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <limits>
#include <set>

namespace deck
{

PlacementSolver::PlacementSolver(PlacementSettings settings)
    : settings_(settings)
{
}

Point PlacementSolver::findPosition(const std::vector<Rect>& existing, int width, int height,
                                    const DisplaySizeFn& display_size) const
{
    const Point anchor = settings_.anchor;
    if (existing.empty())
        return anchor;

    for (const auto& candidate : rankedCandidates(existing, width, height))
    {
        if (!overlapsAny(existing, Rect{ candidate.x, candidate.y, width, height }))
        {
            PLOG_VERBOSE << "Placing " << width << "x" << height << " at (" << candidate.x << ", "
                         << candidate.y << ") next to " << existing.size() << " dialog(s)";
            return candidate;
        }
    }

    Size display{};
    if (display_size)
        display = display_size();

    PLOG_DEBUG << "No adjacent slot for " << width << "x" << height << ", scanning "
               << display.width << "x" << display.height << " grid";

    if (auto cell = scanGrid(existing, width, height, display))
        return *cell;

    PLOG_WARNING << "Display is saturated, placing " << width << "x" << height
                 << " dialog at anchor (" << anchor.x << ", " << anchor.y << ") with overlap";
    return anchor;
}

std::vector<Point> PlacementSolver::rankedCandidates(const std::vector<Rect>& existing, int width,
                                                     int height) const
{
    std::vector<Point> generated;
    generated.reserve(existing.size() * 7 + 1);
    generated.push_back(settings_.anchor);
    for (const auto& rect : existing)
        addCandidatesAround(rect, width, height, generated);

    std::set<Point> unique;
    for (const auto& p : generated)
    {
        // Negative candidates come from rects partly off-screen, or from a negative anchor.
        if (p.x >= 0 && p.y >= 0)
            unique.insert(p);
    }

    std::vector<Point> ranked(unique.begin(), unique.end());
    std::stable_sort(ranked.begin(), ranked.end(),
                     [this](const Point& a, const Point& b)
                     {
                         return distanceSquared(a) < distanceSquared(b);
                     });
    return ranked;
}

std::optional<Point> PlacementSolver::scanGrid(const std::vector<Rect>& existing, int width, int height,
                                               Size display) const
{
    const long long step_x = static_cast<long long>(width) + settings_.gap;
    const long long step_y = static_cast<long long>(height) + settings_.gap;
    if (step_x <= 0 || step_y <= 0)
    {
        PLOG_WARNING << "Grid step " << step_x << "x" << step_y << " is not positive, skipping grid scan";
        return std::nullopt;
    }

    // Loop variables stay below the display size, so each tested cell fits in int.
    for (long long y = settings_.anchor.y; y < display.height; y += step_y)
    {
        for (long long x = settings_.anchor.x; x < display.width; x += step_x)
        {
            const Point cell{ static_cast<int>(x), static_cast<int>(y) };
            if (!overlapsAny(existing, Rect{ cell.x, cell.y, width, height }))
                return cell;
        }
    }
    return std::nullopt;
}

void PlacementSolver::addCandidatesAround(const Rect& rect, int width, int height,
                                          std::vector<Point>& out) const
{
    const long long gap = settings_.gap;
    const long long right = static_cast<long long>(rect.x) + rect.width + gap;
    const long long left = std::max<long long>(settings_.anchor.x, static_cast<long long>(rect.x) - width - gap);
    const long long below = static_cast<long long>(rect.y) + rect.height + gap;
    const long long above = std::max<long long>(settings_.anchor.y, static_cast<long long>(rect.y) - height - gap);

    // Positions outside the int range cannot be assigned to a dialog.
    auto emit = [&out](long long x, long long y)
    {
        if (x >= 0 && y >= 0 && x <= std::numeric_limits<int>::max() && y <= std::numeric_limits<int>::max())
            out.push_back(Point{ static_cast<int>(x), static_cast<int>(y) });
    };

    emit(right, rect.y);
    emit(left, rect.y);
    emit(rect.x, below);
    emit(rect.x, above);
    emit(right, below);
    emit(left, below);
    emit(right, above);
}

long long PlacementSolver::distanceSquared(const Point& p) const
{
    const long long dx = static_cast<long long>(p.x) - settings_.anchor.x;
    const long long dy = static_cast<long long>(p.y) - settings_.anchor.y;
    return dx * dx + dy * dy;
}

} // namespace deck

#include <catch2/catch_test_macros.hpp>
#include "placement/PlacementSolver.hpp"

#include <algorithm>
#include <limits>
#include <optional>
#include <vector>

using namespace deck;

namespace {

Size fixed_display_size() { return Size{ 1920, 1080 }; }

} // namespace

TEST_CASE("rectanglesOverlap - edge semantics", "[placement][geometry]") {
    const Rect a{ 10, 10, 100, 50 };

    SECTION("Touching edges do not overlap") {
        REQUIRE_FALSE(rectanglesOverlap(a, Rect{ 110, 10, 100, 50 }));
        REQUIRE_FALSE(rectanglesOverlap(a, Rect{ 10, 60, 100, 50 }));
        REQUIRE_FALSE(rectanglesOverlap(a, Rect{ -90, 10, 100, 50 }));
        REQUIRE_FALSE(rectanglesOverlap(a, Rect{ 10, -40, 100, 50 }));
    }

    SECTION("One unit of intrusion overlaps") {
        REQUIRE(rectanglesOverlap(a, Rect{ 109, 10, 100, 50 }));
        REQUIRE(rectanglesOverlap(a, Rect{ 10, 59, 100, 50 }));
    }

    SECTION("Containment overlaps both ways") {
        const Rect inner{ 20, 20, 10, 10 };
        REQUIRE(rectanglesOverlap(a, inner));
        REQUIRE(rectanglesOverlap(inner, a));
    }

    SECTION("overlapsAny checks every rectangle") {
        std::vector<Rect> rects{ Rect{ 500, 500, 10, 10 }, a };
        REQUIRE(overlapsAny(rects, Rect{ 50, 30, 5, 5 }));
        REQUIRE_FALSE(overlapsAny(rects, Rect{ 200, 200, 5, 5 }));
        REQUIRE_FALSE(overlapsAny({}, a));
    }
}

TEST_CASE("PlacementSolver - Empty screen uses the anchor", "[placement]") {
    PlacementSolver solver;
    REQUIRE(solver.findPosition({}, 100, 50, fixed_display_size) == Point{ 10, 10 });
}

TEST_CASE("PlacementSolver - Second dialog goes below the first", "[placement]") {
    PlacementSolver solver;
    const std::vector<Rect> existing{ Rect{ 10, 10, 100, 50 } };

    SECTION("Below is closer to the anchor than right") {
        REQUIRE(solver.findPosition(existing, 100, 50, fixed_display_size) == Point{ 10, 65 });
    }

    SECTION("Candidates are ranked by squared distance") {
        auto ranked = solver.rankedCandidates(existing, 100, 50);
        REQUIRE(ranked.size() == 4);
        REQUIRE(ranked[0] == Point{ 10, 10 });
        REQUIRE(ranked[1] == Point{ 10, 65 });
        REQUIRE(ranked[2] == Point{ 115, 10 });
        REQUIRE(ranked[3] == Point{ 115, 65 });
    }
}

TEST_CASE("PlacementSolver - Wide dialog prefers the right side", "[placement]") {
    PlacementSolver solver;
    // Below: (10, 215) at distance^2 205^2, right: (65, 10) at 55^2.
    const std::vector<Rect> existing{ Rect{ 10, 10, 50, 200 } };
    REQUIRE(solver.findPosition(existing, 80, 80, fixed_display_size) == Point{ 65, 10 });
}

TEST_CASE("PlacementSolver - Left and above candidates clamp to the anchor", "[placement]") {
    PlacementSolver solver;
    const std::vector<Rect> existing{ Rect{ 300, 300, 100, 100 } };
    auto ranked = solver.rankedCandidates(existing, 100, 50);

    SECTION("Left of it") {
        REQUIRE(std::find(ranked.begin(), ranked.end(), Point{ 195, 300 }) != ranked.end());
    }
    SECTION("Above it") {
        REQUIRE(std::find(ranked.begin(), ranked.end(), Point{ 300, 245 }) != ranked.end());
    }
    SECTION("Anchor is free and wins") {
        REQUIRE(solver.findPosition(existing, 100, 50, fixed_display_size) == Point{ 10, 10 });
    }

    SECTION("Clamping happens near the corner") {
        const std::vector<Rect> near{ Rect{ 30, 20, 100, 100 } };
        auto near_ranked = solver.rankedCandidates(near, 100, 50);
        // Left would be x = 30 - 105 and above y = 20 - 55; both clamp to 10.
        REQUIRE(std::find(near_ranked.begin(), near_ranked.end(), Point{ 10, 20 }) != near_ranked.end());
        REQUIRE(std::find(near_ranked.begin(), near_ranked.end(), Point{ 30, 10 }) != near_ranked.end());
        for (const auto& p : near_ranked) {
            REQUIRE(p.x >= 10);
            REQUIRE(p.y >= 10);
        }
    }
}

TEST_CASE("PlacementSolver - Negative candidates are discarded", "[placement]") {
    PlacementSolver solver;
    // Partly above the screen: the right/below-of-top candidates keep y = -100.
    const std::vector<Rect> existing{ Rect{ 10, -100, 100, 50 } };
    auto ranked = solver.rankedCandidates(existing, 100, 50);
    for (const auto& p : ranked) {
        REQUIRE(p.x >= 0);
        REQUIRE(p.y >= 0);
    }
    REQUIRE(std::find(ranked.begin(), ranked.end(), Point{ 115, -100 }) == ranked.end());
}

TEST_CASE("PlacementSolver - Deterministic output", "[placement]") {
    PlacementSolver solver;
    const std::vector<Rect> existing{
        Rect{ 10, 10, 120, 80 },
        Rect{ 10, 95, 60, 60 },
        Rect{ 135, 10, 200, 40 },
    };
    const Point first = solver.findPosition(existing, 90, 70, fixed_display_size);

    SECTION("Same inputs give the same answer") {
        for (int i = 0; i < 5; ++i)
            REQUIRE(solver.findPosition(existing, 90, 70, fixed_display_size) == first);
    }

    SECTION("Input order does not matter") {
        const std::vector<Rect> reversed(existing.rbegin(), existing.rend());
        REQUIRE(solver.findPosition(reversed, 90, 70, fixed_display_size) == first);
    }

    SECTION("Result does not overlap") {
        REQUIRE_FALSE(overlapsAny(existing, Rect{ first.x, first.y, 90, 70 }));
    }
}

TEST_CASE("PlacementSolver - Equal distances break ties by row", "[placement]") {
    PlacementSettings settings;
    settings.anchor = Point{ 0, 0 };
    settings.gap = 0;
    PlacementSolver solver(settings);

    // Right (10, 0) and below (0, 10) are both at distance^2 100.
    const std::vector<Rect> existing{ Rect{ 0, 0, 10, 10 } };
    REQUIRE(solver.findPosition(existing, 10, 10, fixed_display_size) == Point{ 10, 0 });
}

TEST_CASE("PlacementSolver - Display size is only read by the fallback", "[placement]") {
    PlacementSolver solver;
    int queries = 0;
    auto counting_display = [&queries]() {
        ++queries;
        return Size{ 800, 600 };
    };

    solver.findPosition({ Rect{ 10, 10, 100, 50 } }, 100, 50, counting_display);
    REQUIRE(queries == 0);
}

TEST_CASE("PlacementSolver - Grid scan walks cells from the anchor", "[placement][fallback]") {
    PlacementSolver solver;
    // Three packed dialogs fill the first two grid cells of row one and the first cell of row two.
    const std::vector<Rect> packed{
        Rect{ 10, 10, 100, 50 },
        Rect{ 115, 10, 100, 50 },
        Rect{ 10, 65, 100, 50 },
    };

    SECTION("First free cell is aligned to (width + gap, height + gap)") {
        auto cell = solver.scanGrid(packed, 100, 50, Size{ 800, 600 });
        REQUIRE(cell.has_value());
        REQUIRE(*cell == Point{ 220, 10 });
        REQUIRE((cell->x - 10) % 105 == 0);
        REQUIRE((cell->y - 10) % 55 == 0);
    }

    SECTION("Narrow display moves the scan to the next row") {
        auto cell = solver.scanGrid(packed, 100, 50, Size{ 220, 600 });
        REQUIRE(cell.has_value());
        REQUIRE(*cell == Point{ 115, 65 });
    }

    SECTION("Full bounded area yields nothing") {
        REQUIRE_FALSE(solver.scanGrid(packed, 100, 50, Size{ 115, 100 }).has_value());
    }

    SECTION("Empty display yields nothing") {
        REQUIRE_FALSE(solver.scanGrid(packed, 100, 50, Size{ 0, 0 }).has_value());
    }
}

TEST_CASE("PlacementSolver - Fallback when every candidate overlaps", "[placement][fallback]") {
    // A negative gap makes each adjacent candidate intrude into its own rectangle,
    // so only the grid scan can find room.
    PlacementSettings settings;
    settings.gap = -10;
    PlacementSolver solver(settings);

    const std::vector<Rect> packed{
        Rect{ 10, 10, 100, 50 },
        Rect{ 110, 10, 100, 50 },
        Rect{ 10, 60, 100, 50 },
    };

    for (const auto& candidate : solver.rankedCandidates(packed, 100, 50))
        REQUIRE(overlapsAny(packed, Rect{ candidate.x, candidate.y, 100, 50 }));

    SECTION("Grid scan finds the first free cell") {
        auto display = []() { return Size{ 800, 600 }; };
        const Point pos = solver.findPosition(packed, 100, 50, display);
        REQUIRE(pos == Point{ 280, 10 });
        REQUIRE_FALSE(overlapsAny(packed, Rect{ pos.x, pos.y, 100, 50 }));
    }

    SECTION("Saturated display degrades to the anchor") {
        auto display = []() { return Size{ 150, 100 }; };
        REQUIRE(solver.findPosition(packed, 100, 50, display) == Point{ 10, 10 });
    }

    SECTION("Missing display accessor degrades to the anchor") {
        REQUIRE(solver.findPosition(packed, 100, 50, DisplaySizeFn{}) == Point{ 10, 10 });
    }
}

TEST_CASE("PlacementSolver - Non-positive grid step skips the scan", "[placement][fallback]") {
    PlacementSettings settings;
    settings.gap = -100;
    PlacementSolver solver(settings);
    REQUIRE_FALSE(solver.scanGrid({ Rect{ 10, 10, 50, 50 } }, 50, 50, Size{ 800, 600 }).has_value());
}

TEST_CASE("PlacementSolver - Custom anchor and gap", "[placement][settings]") {
    PlacementSettings settings;
    settings.anchor = Point{ 40, 30 };
    settings.gap = 12;
    PlacementSolver solver(settings);

    REQUIRE(solver.findPosition({}, 100, 50, fixed_display_size) == Point{ 40, 30 });
    REQUIRE(solver.findPosition({ Rect{ 40, 30, 100, 50 } }, 100, 50, fixed_display_size) == Point{ 40, 92 });
}

TEST_CASE("PlacementSolver - Coordinates near the int limit", "[placement]") {
    constexpr int kMax = std::numeric_limits<int>::max();
    PlacementSolver solver;

    SECTION("Overlap test does not wrap around") {
        REQUIRE_FALSE(rectanglesOverlap(Rect{ kMax - 10, 0, 100, 100 }, Rect{ 0, 0, 10, 10 }));
        REQUIRE(rectanglesOverlap(Rect{ kMax - 10, 0, 100, 100 }, Rect{ kMax - 5, 5, 1, 1 }));
    }

    SECTION("Candidates past the limit are dropped") {
        const std::vector<Rect> existing{ Rect{ kMax - 20, 10, 20, 50 } };
        auto ranked = solver.rankedCandidates(existing, 100, 50);

        // Anchor, the two left candidates and the two in the rect's own column.
        REQUIRE(ranked.size() == 5);
        REQUIRE(ranked[0] == Point{ 10, 10 });
        for (const auto& p : ranked)
            REQUIRE(p.x <= kMax - 20);
    }

    SECTION("Grid step wider than the display") {
        const std::vector<Rect> existing{ Rect{ 10, 10, 100, 50 } };
        auto cell = solver.scanGrid(existing, kMax, 50, Size{ 800, 600 });
        REQUIRE(cell.has_value());
        REQUIRE(*cell == Point{ 10, 65 });
    }
}

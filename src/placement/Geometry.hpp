#pragma once

#include <vector>

namespace deck
{

struct Point
{
    int x = 0;
    int y = 0;

    bool operator==(const Point& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Point& other) const { return !(*this == other); }

    // Row-major order; also the tie-break order for equally distant candidates.
    bool operator<(const Point& other) const
    {
        if (y != other.y)
            return y < other.y;
        return x < other.x;
    }
};

struct Size
{
    int width = 0;
    int height = 0;
};

struct Rect
{
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    long long right() const { return static_cast<long long>(x) + width; }
    long long bottom() const { return static_cast<long long>(y) + height; }
    Point topLeft() const { return Point{ x, y }; }
};

// Touching edges do not count as overlap.
inline bool rectanglesOverlap(const Rect& a, const Rect& b)
{
    return !(a.right() <= b.x ||
             b.right() <= a.x ||
             a.bottom() <= b.y ||
             b.bottom() <= a.y);
}

inline bool overlapsAny(const std::vector<Rect>& rects, const Rect& candidate)
{
    for (const auto& rect : rects)
    {
        if (rectanglesOverlap(rect, candidate))
            return true;
    }
    return false;
}

} // namespace deck

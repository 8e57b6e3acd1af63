#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace axground::geometry {

// Raw element geometry as reported by the snapshot (screen pixels).
struct Bounds {
    int x = 0, y = 0;
    int width = 0, height = 0;

    bool has_positive_size() const { return width > 0 && height > 0; }
    bool operator==(const Bounds&) const = default;
};

struct Point {
    int x = 0, y = 0;
    bool operator==(const Point&) const = default;
};

// Half-open axis-aligned rectangle [x1, x2) x [y1, y2).
struct ClipRect {
    int x1 = 0, y1 = 0;
    int x2 = 0, y2 = 0;

    static ClipRect from_bounds(const Bounds& b);
    static ClipRect screen(int width, int height) { return {0, 0, width, height}; }

    std::int64_t width() const { return static_cast<std::int64_t>(x2) - x1; }
    std::int64_t height() const { return static_cast<std::int64_t>(y2) - y1; }

    // Zero for empty or inverted rectangles.
    std::int64_t area() const;
    bool is_empty() const { return x2 <= x1 || y2 <= y1; }
    bool is_well_formed() const { return x2 >= x1 && y2 >= y1; }

    Point center() const;
    bool contains(const Point& p) const;
    bool contains(const ClipRect& other) const;

    bool operator==(const ClipRect&) const = default;
};

// nullopt when the rectangles do not share a positive-area region.
std::optional<ClipRect> intersect(const ClipRect& a, const ClipRect& b);

// Area of a ∩ b, zero when disjoint.
std::int64_t intersection_area(const ClipRect& a, const ClipRect& b);

std::string to_string(const ClipRect& r);

} // namespace axground::geometry

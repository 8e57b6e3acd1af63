#include <axground/geometry/rect.h>

#include <algorithm>
#include <limits>
#include <sstream>

namespace axground::geometry {

namespace {

// Floor division by two that also rounds negative sums downward.
int floor_half(std::int64_t sum) {
    std::int64_t q = sum / 2;
    if (sum < 0 && (sum % 2) != 0) --q;
    return static_cast<int>(q);
}

// Far edges of huge boxes saturate at INT_MAX instead of wrapping.
int saturating_add(int a, int b) {
    std::int64_t sum = static_cast<std::int64_t>(a) + b;
    sum = std::clamp<std::int64_t>(sum, std::numeric_limits<int>::min(),
                                   std::numeric_limits<int>::max());
    return static_cast<int>(sum);
}

} // anonymous namespace

ClipRect ClipRect::from_bounds(const Bounds& b) {
    return {b.x, b.y, saturating_add(b.x, b.width), saturating_add(b.y, b.height)};
}

std::int64_t ClipRect::area() const {
    if (is_empty()) return 0;
    return width() * height();
}

Point ClipRect::center() const {
    return {floor_half(static_cast<std::int64_t>(x1) + x2),
            floor_half(static_cast<std::int64_t>(y1) + y2)};
}

bool ClipRect::contains(const Point& p) const {
    return p.x >= x1 && p.x < x2 && p.y >= y1 && p.y < y2;
}

bool ClipRect::contains(const ClipRect& other) const {
    return other.x1 >= x1 && other.y1 >= y1 && other.x2 <= x2 && other.y2 <= y2;
}

std::optional<ClipRect> intersect(const ClipRect& a, const ClipRect& b) {
    ClipRect r{std::max(a.x1, b.x1), std::max(a.y1, b.y1),
               std::min(a.x2, b.x2), std::min(a.y2, b.y2)};
    if (r.is_empty()) return std::nullopt;
    return r;
}

std::int64_t intersection_area(const ClipRect& a, const ClipRect& b) {
    auto r = intersect(a, b);
    return r ? r->area() : 0;
}

std::string to_string(const ClipRect& r) {
    std::ostringstream oss;
    oss << "[" << r.x1 << "," << r.y1 << "," << r.x2 << "," << r.y2 << "]";
    return oss.str();
}

} // namespace axground::geometry

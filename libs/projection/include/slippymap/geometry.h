#pragma once

#include <algorithm>

namespace slippymap {

// Integer pixel point. Map, cache and view coordinates all use it;
// which space a value belongs to is stated by the function using it.
struct Point {
    int x = 0;
    int y = 0;

    friend constexpr Point operator+(Point a, Point b) { return {a.x + b.x, a.y + b.y}; }
    friend constexpr Point operator-(Point a, Point b) { return {a.x - b.x, a.y - b.y}; }
    friend constexpr bool operator==(Point a, Point b) = default;
};

struct Size {
    int width = 0;
    int height = 0;

    friend constexpr bool operator==(Size a, Size b) = default;
};

// Half-open pixel rectangle: [left, right) x [top, bottom).
struct Rect {
    int left = 0;
    int top = 0;
    int right = 0;
    int bottom = 0;

    [[nodiscard]] static constexpr Rect from_points(Point top_left, Point bottom_right) {
        return {top_left.x, top_left.y, bottom_right.x, bottom_right.y};
    }

    [[nodiscard]] static constexpr Rect from_size(Point top_left, Size size) {
        return {top_left.x, top_left.y, top_left.x + size.width, top_left.y + size.height};
    }

    // Rectangle spanned by two arbitrary corners, e.g. a rubber band dragged up-left.
    [[nodiscard]] static constexpr Rect normalized(Point a, Point b) {
        return {std::min(a.x, b.x), std::min(a.y, b.y), std::max(a.x, b.x), std::max(a.y, b.y)};
    }

    [[nodiscard]] constexpr int width() const { return right - left; }
    [[nodiscard]] constexpr int height() const { return bottom - top; }
    [[nodiscard]] constexpr Size size() const { return {width(), height()}; }
    [[nodiscard]] constexpr Point top_left() const { return {left, top}; }
    [[nodiscard]] constexpr Point bottom_right() const { return {right, bottom}; }
    [[nodiscard]] constexpr Point center() const { return {left + width() / 2, top + height() / 2}; }
    [[nodiscard]] constexpr bool empty() const { return right <= left || bottom <= top; }

    [[nodiscard]] constexpr bool contains(Point p) const {
        return p.x >= left && p.x < right && p.y >= top && p.y < bottom;
    }

    [[nodiscard]] constexpr bool contains(const Rect& r) const {
        return r.left >= left && r.right <= right && r.top >= top && r.bottom <= bottom;
    }

    [[nodiscard]] constexpr Rect offset(Point delta) const {
        return {left + delta.x, top + delta.y, right + delta.x, bottom + delta.y};
    }

    [[nodiscard]] constexpr Rect moved_to(Point top_left) const {
        return from_size(top_left, size());
    }

    // Empty rect (all zero) when the rectangles do not overlap.
    [[nodiscard]] constexpr Rect intersect(const Rect& r) const {
        Rect out{std::max(left, r.left), std::max(top, r.top),
                 std::min(right, r.right), std::min(bottom, r.bottom)};
        if (out.empty()) return {};
        return out;
    }

    friend constexpr bool operator==(const Rect& a, const Rect& b) = default;
};

// Absolute map coordinates -> coordinates relative to a viewport starting at `origin`.
[[nodiscard]] constexpr Point to_inner(Point origin, Point p) { return p - origin; }
[[nodiscard]] constexpr Rect to_inner(Point origin, const Rect& r) {
    return r.offset({-origin.x, -origin.y});
}

// Viewport-relative coordinates -> absolute map coordinates.
[[nodiscard]] constexpr Point to_outer(Point origin, Point p) { return p + origin; }
[[nodiscard]] constexpr Rect to_outer(Point origin, const Rect& r) { return r.offset(origin); }

} // namespace slippymap

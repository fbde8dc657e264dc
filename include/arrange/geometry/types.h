#pragma once
#include <optional>
#include <string>

namespace arrange::geometry {

struct Size {
    float width = 0, height = 0;

    bool operator==(const Size&) const = default;
};

struct Point {
    float x = 0, y = 0;

    bool operator==(const Point&) const = default;
};

struct Rect {
    Point origin;
    Size size;

    float min_x() const { return origin.x; }
    float mid_x() const { return origin.x + size.width / 2; }
    float max_x() const { return origin.x + size.width; }
    float min_y() const { return origin.y; }
    float mid_y() const { return origin.y + size.height / 2; }
    float max_y() const { return origin.y + size.height; }
    Point center() const { return {mid_x(), mid_y()}; }

    // Rect of the given size whose center sits at `center`
    static Rect centered_at(Point center, Size size) {
        return {{center.x - size.width / 2, center.y - size.height / 2}, size};
    }

    bool operator==(const Rect&) const = default;
};

// Proposed measurement bounds. An empty axis imposes no limit.
struct Constraint {
    std::optional<float> width;
    std::optional<float> height;

    static Constraint unbounded() { return {}; }
    static Constraint exactly(Size size) { return {size.width, size.height}; }
    static Constraint width_only(float width) { return {width, std::nullopt}; }

    bool is_unbounded() const { return !width && !height; }

    // Resolve to a concrete size, substituting `fallback` for unbounded axes.
    Size replacing_unbounded(float fallback) const {
        return {width.value_or(fallback), height.value_or(fallback)};
    }

    bool operator==(const Constraint&) const = default;
};

std::string to_string(const Size& size);
std::string to_string(const Point& point);
std::string to_string(const Rect& rect);
std::string to_string(const Constraint& constraint);

} // namespace arrange::geometry

#include <arrange/geometry/types.h>

#include <sstream>

namespace arrange::geometry {

namespace {

void write_axis(std::ostringstream& oss, const std::optional<float>& axis) {
    if (axis) {
        oss << *axis;
    } else {
        oss << "inf";
    }
}

} // namespace

std::string to_string(const Size& size) {
    std::ostringstream oss;
    oss << size.width << "x" << size.height;
    return oss.str();
}

std::string to_string(const Point& point) {
    std::ostringstream oss;
    oss << "(" << point.x << "," << point.y << ")";
    return oss.str();
}

std::string to_string(const Rect& rect) {
    return to_string(rect.origin) + " " + to_string(rect.size);
}

std::string to_string(const Constraint& constraint) {
    std::ostringstream oss;
    write_axis(oss, constraint.width);
    oss << "x";
    write_axis(oss, constraint.height);
    return oss.str();
}

} // namespace arrange::geometry

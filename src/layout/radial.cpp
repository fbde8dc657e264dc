#include <arrange/layout/radial.h>

#include <algorithm>
#include <cmath>
#include <string>

#include <arrange/core/config.h>

namespace arrange::layout {

namespace {

constexpr const char* kModule = "radial";
constexpr double kPi = 3.14159265358979323846;

} // namespace

Size RadialLayout::measure(const std::vector<Box>& /*boxes*/, const Measurer& /*measurer*/,
                           const Constraint& available,
                           core::DiagnosticLog* diagnostics) const {
    if (diagnostics && !(available.width && available.height)) {
        diagnostics->emit(core::Severity::Info, kModule, "measure",
                          "unbounded proposal " + geometry::to_string(available) +
                          " resolved with " +
                          std::to_string(core::config::kUnspecifiedDimension));
    }
    return available.replacing_unbounded(core::config::kUnspecifiedDimension);
}

LayoutResult RadialLayout::place(const std::vector<Box>& boxes, const Measurer& measurer,
                                 const Rect& bounds,
                                 core::DiagnosticLog* diagnostics) const {
    LayoutResult result;
    result.total_size = bounds.size;
    if (boxes.empty()) return result;

    const double radius = std::min(bounds.size.width, bounds.size.height) / 2.0;
    const double angle_step = 2.0 * kPi / static_cast<double>(boxes.size());
    const Point center = bounds.center();

    result.placements.reserve(boxes.size());
    for (std::size_t i = 0; i < boxes.size(); ++i) {
        const Size size = measurer(boxes[i], Constraint::unbounded());
        const double angle = angle_step * static_cast<double>(i) - kPi / 2.0;

        const double x = std::cos(angle) * (radius - size.width / 2.0);
        const double y = std::sin(angle) * (radius - size.height / 2.0);
        const Point box_center{center.x + static_cast<float>(x), center.y + static_cast<float>(y)};

        if (diagnostics && (size.width > 2 * radius || size.height > 2 * radius)) {
            diagnostics->emit_for_box(core::Severity::Warning, kModule, "place", i,
                                      geometry::to_string(size) +
                                      " is larger than the circle diameter " +
                                      std::to_string(2 * radius));
        }

        Placement placement;
        placement.box_index = i;
        placement.frame = Rect::centered_at(box_center, size);
        placement.anchor = Anchor::Center;
        placement.proposal = Constraint::unbounded();
        result.placements.push_back(placement);
    }
    return result;
}

} // namespace arrange::layout

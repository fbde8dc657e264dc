#include <arrange/layout/masonry.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace arrange::layout {

namespace {

constexpr const char* kModule = "masonry";

// Index of the strictly shortest column; the ascending scan with `<` keeps
// the lowest index on ties.
std::size_t shortest_column(const std::vector<float>& heights) {
    std::size_t selected = 0;
    float selected_height = std::numeric_limits<float>::max();
    for (std::size_t c = 0; c < heights.size(); ++c) {
        if (heights[c] < selected_height) {
            selected = c;
            selected_height = heights[c];
        }
    }
    return selected;
}

} // namespace

void validate(const MasonryConfig& config) {
    if (config.columns < 1) {
        throw std::invalid_argument(
            "MasonryLayout: columns must be >= 1, got " + std::to_string(config.columns));
    }
    if (std::isnan(config.spacing) || config.spacing < 0) {
        throw std::invalid_argument(
            "MasonryLayout: spacing must be >= 0, got " + std::to_string(config.spacing));
    }
}

MasonryLayout::MasonryLayout(MasonryConfig config) : config_(config) {
    validate(config_);
}

float MasonryLayout::column_width(float total_width) const {
    if (config_.columns == 1) return total_width;
    const float total_spacing = config_.spacing * static_cast<float>(config_.columns - 1);
    return (total_width - total_spacing) / static_cast<float>(config_.columns);
}

std::vector<Rect> MasonryLayout::compute_frames(const std::vector<Box>& boxes,
                                                const Measurer& measurer, float total_width,
                                                const char* stage,
                                                core::DiagnosticLog* diagnostics) const {
    const float width = column_width(total_width);
    const float stride = width + config_.spacing;
    const Constraint proposal = Constraint::width_only(width);

    if (diagnostics && width < 0) {
        diagnostics->emit(core::Severity::Warning, kModule, stage,
                          "column width " + std::to_string(width) + " is negative for total width " +
                          std::to_string(total_width) + " and " +
                          std::to_string(config_.columns) + " columns");
    }

    std::vector<float> column_heights(static_cast<std::size_t>(config_.columns), 0.0f);
    std::vector<Rect> frames;
    frames.reserve(boxes.size());

    for (const auto& box : boxes) {
        const std::size_t column = shortest_column(column_heights);
        Size size = measurer(box, proposal);

        frames.push_back({{static_cast<float>(column) * stride, column_heights[column]}, size});
        column_heights[column] += size.height + config_.spacing;
    }
    return frames;
}

Size MasonryLayout::measure(const std::vector<Box>& boxes, const Measurer& measurer,
                            const Constraint& available,
                            core::DiagnosticLog* diagnostics) const {
    const float width = available.replacing_unbounded(core::config::kUnspecifiedDimension).width;
    auto frames = compute_frames(boxes, measurer, width, "measure", diagnostics);

    float height = 0;
    if (!frames.empty()) {
        height = std::max_element(frames.begin(), frames.end(),
                                  [](const Rect& a, const Rect& b) { return a.max_y() < b.max_y(); })
                     ->max_y();
    }
    return {width, height};
}

LayoutResult MasonryLayout::place(const std::vector<Box>& boxes, const Measurer& measurer,
                                  const Rect& bounds,
                                  core::DiagnosticLog* diagnostics) const {
    auto frames = compute_frames(boxes, measurer, bounds.size.width, "place", diagnostics);

    LayoutResult result;
    result.total_size = {bounds.size.width, 0};
    result.placements.reserve(frames.size());

    for (std::size_t i = 0; i < frames.size(); ++i) {
        const Rect& frame = frames[i];
        result.total_size.height = i == 0 ? frame.max_y()
                                          : std::max(result.total_size.height, frame.max_y());

        Placement placement;
        placement.box_index = i;
        placement.frame = {{bounds.min_x() + frame.min_x(), bounds.min_y() + frame.min_y()},
                           frame.size};
        placement.anchor = Anchor::TopLeading;
        placement.proposal = Constraint::exactly(frame.size);
        result.placements.push_back(placement);
    }
    return result;
}

} // namespace arrange::layout

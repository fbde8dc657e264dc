#include <arrange/layout/wrap_flow.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace arrange::layout {

namespace {

constexpr const char* kModule = "wrap_flow";

} // namespace

void validate(const WrapFlowConfig& config) {
    if (std::isnan(config.spacing) || config.spacing < 0) {
        throw std::invalid_argument(
            "WrapFlowLayout: spacing must be >= 0, got " + std::to_string(config.spacing));
    }
    switch (config.alignment) {
        case HorizontalAlignment::Leading:
        case HorizontalAlignment::Center:
        case HorizontalAlignment::Trailing:
            return;
    }
    throw std::invalid_argument(
        "WrapFlowLayout: unknown alignment " +
        std::to_string(static_cast<int>(config.alignment)));
}

WrapFlowLayout::WrapFlowLayout(WrapFlowConfig config) : config_(config) {
    validate(config_);
}

std::vector<WrapFlowLayout::Row> WrapFlowLayout::build_rows(
        const std::vector<Box>& boxes, const Measurer& measurer, float available_width,
        const char* stage, core::DiagnosticLog* diagnostics) const {
    const float spacing = config_.spacing;
    std::vector<Row> rows;
    Row current;

    for (std::size_t i = 0; i < boxes.size(); ++i) {
        Size size = measurer(boxes[i], Constraint::unbounded());

        if (diagnostics && size.width > available_width) {
            diagnostics->emit_for_box(core::Severity::Info, kModule, stage, i,
                                      "wider (" + std::to_string(size.width) +
                                      ") than the available width " +
                                      std::to_string(available_width) +
                                      "; it gets a row of its own");
        }

        // A box never wraps away from an empty row, so an oversized box
        // still occupies a row instead of leaving an empty one behind.
        if (current.width + size.width + spacing > available_width && !current.indices.empty()) {
            rows.push_back(std::move(current));
            current = Row{};
            current.indices.push_back(i);
            current.sizes.push_back(size);
            current.width = size.width + spacing;
            current.height = size.height;
        } else {
            current.indices.push_back(i);
            current.sizes.push_back(size);
            current.width += size.width + spacing;
            current.height = std::max(current.height, size.height);
        }
    }

    if (!current.indices.empty()) {
        rows.push_back(std::move(current));
    }
    return rows;
}

float WrapFlowLayout::total_height(const std::vector<Row>& rows) const {
    float height = 0;
    for (std::size_t r = 0; r < rows.size(); ++r) {
        if (r > 0) height += config_.spacing;
        height += rows[r].height;
    }
    return height;
}

float WrapFlowLayout::row_start_x(const Row& row, const Rect& bounds) const {
    switch (config_.alignment) {
        case HorizontalAlignment::Leading:
            return bounds.min_x();
        case HorizontalAlignment::Center:
            return bounds.min_x() + (bounds.size.width - row.width) / 2;
        case HorizontalAlignment::Trailing:
            return bounds.max_x() - row.width;
    }
    return bounds.min_x();
}

Size WrapFlowLayout::measure(const std::vector<Box>& boxes, const Measurer& measurer,
                             const Constraint& available,
                             core::DiagnosticLog* diagnostics) const {
    if (available.width) {
        auto rows = build_rows(boxes, measurer, *available.width, "measure", diagnostics);
        return {*available.width, total_height(rows)};
    }

    // Unbounded: everything lands on one row. Report the content width
    // rather than an infinite one.
    auto rows = build_rows(boxes, measurer, std::numeric_limits<float>::infinity(),
                           "measure", diagnostics);
    float width = 0;
    for (const auto& row : rows) {
        width = std::max(width, row.width - config_.spacing);
    }
    return {width, total_height(rows)};
}

LayoutResult WrapFlowLayout::place(const std::vector<Box>& boxes, const Measurer& measurer,
                                   const Rect& bounds,
                                   core::DiagnosticLog* diagnostics) const {
    auto rows = build_rows(boxes, measurer, bounds.size.width, "place", diagnostics);

    LayoutResult result;
    result.total_size = {bounds.size.width, total_height(rows)};
    result.placements.resize(boxes.size());

    float y = bounds.min_y();
    for (const auto& row : rows) {
        float x = row_start_x(row, bounds);
        for (std::size_t k = 0; k < row.indices.size(); ++k) {
            const std::size_t index = row.indices[k];
            auto& placement = result.placements[index];
            placement.box_index = index;
            placement.frame = {{x, y}, row.sizes[k]};
            placement.anchor = Anchor::TopLeading;
            placement.proposal = Constraint::unbounded();
            x += row.sizes[k].width + config_.spacing;
        }
        y += row.height + config_.spacing;
    }

    if (diagnostics) {
        diagnostics->emit(core::Severity::Info, kModule, "place",
                          std::to_string(boxes.size()) + " boxes in " +
                          std::to_string(rows.size()) + " rows");
    }
    return result;
}

} // namespace arrange::layout

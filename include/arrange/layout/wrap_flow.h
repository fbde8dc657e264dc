#pragma once
#include <arrange/core/config.h>
#include <arrange/core/diagnostics.h>
#include <arrange/layout/box.h>
#include <vector>

namespace arrange::layout {

enum class HorizontalAlignment {
    Leading,
    Center,
    Trailing
};

struct WrapFlowConfig {
    HorizontalAlignment alignment = HorizontalAlignment::Center;
    float spacing = core::config::kDefaultSpacing;  // between boxes in a row and between rows
};

// Throws std::invalid_argument for a negative or NaN spacing or an unknown alignment.
void validate(const WrapFlowConfig& config);

// Arranges boxes left to right and starts a new row whenever the next box
// would overflow the available width. Rows are aligned horizontally as a
// whole; boxes inside a row share the row's top edge.
class WrapFlowLayout {
public:
    explicit WrapFlowLayout(WrapFlowConfig config = {});

    const WrapFlowConfig& config() const { return config_; }

    // Width is the available width, or the widest row when it is unbounded.
    Size measure(const std::vector<Box>& boxes, const Measurer& measurer,
                 const Constraint& available,
                 core::DiagnosticLog* diagnostics = nullptr) const;

    LayoutResult place(const std::vector<Box>& boxes, const Measurer& measurer,
                       const Rect& bounds,
                       core::DiagnosticLog* diagnostics = nullptr) const;

private:
    struct Row {
        std::vector<std::size_t> indices;
        std::vector<Size> sizes;
        float width = 0;   // includes the spacing after the last box
        float height = 0;
    };

    std::vector<Row> build_rows(const std::vector<Box>& boxes, const Measurer& measurer,
                                float available_width, const char* stage,
                                core::DiagnosticLog* diagnostics) const;
    float total_height(const std::vector<Row>& rows) const;
    float row_start_x(const Row& row, const Rect& bounds) const;

    WrapFlowConfig config_;
};

} // namespace arrange::layout

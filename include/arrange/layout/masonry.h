#pragma once
#include <arrange/core/config.h>
#include <arrange/core/diagnostics.h>
#include <arrange/layout/box.h>
#include <vector>

namespace arrange::layout {

struct MasonryConfig {
    int columns = core::config::kDefaultMasonryColumns;
    float spacing = core::config::kDefaultSpacing;  // between columns and between stacked boxes
};

// Throws std::invalid_argument for columns < 1 or a negative or NaN spacing.
void validate(const MasonryConfig& config);

// Splits the width into equal columns and drops each box, in input order,
// into the column whose stack is currently the shortest. Ties go to the
// lowest column index, so identical input always yields identical frames.
class MasonryLayout {
public:
    explicit MasonryLayout(MasonryConfig config = {});

    const MasonryConfig& config() const { return config_; }

    Size measure(const std::vector<Box>& boxes, const Measurer& measurer,
                 const Constraint& available,
                 core::DiagnosticLog* diagnostics = nullptr) const;

    LayoutResult place(const std::vector<Box>& boxes, const Measurer& measurer,
                       const Rect& bounds,
                       core::DiagnosticLog* diagnostics = nullptr) const;

    // Frames relative to the layout's top-left corner, one per box.
    // The column width is not guarded: narrow widths with many columns
    // produce negative column widths and the frames that follow from them.
    std::vector<Rect> compute_frames(const std::vector<Box>& boxes, const Measurer& measurer,
                                     float total_width, const char* stage = "frames",
                                     core::DiagnosticLog* diagnostics = nullptr) const;

    float column_width(float total_width) const;

private:
    MasonryConfig config_;
};

} // namespace arrange::layout

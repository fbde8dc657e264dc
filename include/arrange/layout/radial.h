#pragma once
#include <arrange/core/diagnostics.h>
#include <arrange/layout/box.h>
#include <vector>

namespace arrange::layout {

struct RadialConfig {};

// Spaces boxes evenly on the circle inscribed in the bounds, starting at the
// top and running clockwise (+y down). Each box center is pulled in from the
// circle by half of its own width on x and half of its own height on y.
class RadialLayout {
public:
    explicit RadialLayout(RadialConfig config = {}) : config_(config) {}

    const RadialConfig& config() const { return config_; }

    // The available size with unbounded axes resolved; content never grows it.
    Size measure(const std::vector<Box>& boxes, const Measurer& measurer,
                 const Constraint& available,
                 core::DiagnosticLog* diagnostics = nullptr) const;

    // Placements are center-anchored.
    LayoutResult place(const std::vector<Box>& boxes, const Measurer& measurer,
                       const Rect& bounds,
                       core::DiagnosticLog* diagnostics = nullptr) const;

private:
    RadialConfig config_;
};

} // namespace arrange::layout

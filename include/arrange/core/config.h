#ifndef ARRANGE_CORE_CONFIG_H
#define ARRANGE_CORE_CONFIG_H

namespace arrange::core::config {

// Gap between neighbouring boxes, rows and columns.
inline constexpr float kDefaultSpacing = 10.0f;
inline constexpr int kDefaultMasonryColumns = 3;

// Substituted for an unbounded axis when a layout must report a concrete size.
inline constexpr float kUnspecifiedDimension = 10.0f;

}  // namespace arrange::core::config

#endif  // ARRANGE_CORE_CONFIG_H

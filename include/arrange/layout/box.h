#pragma once
#include <arrange/geometry/types.h>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace arrange::layout {

using geometry::Constraint;
using geometry::Point;
using geometry::Rect;
using geometry::Size;

// Opaque handle to one item supplied by the host for a single layout pass.
// The layouts never look inside a box; they only hand it back to the measurer.
struct Box {
    std::uint64_t id = 0;
};

// Returns the natural size of `box` under `constraint`. Supplied by the host
// and treated as read-only; results are not cached between calls.
using Measurer = std::function<Size(const Box& box, const Constraint& constraint)>;

// Point of a frame the host positions the item by.
enum class Anchor {
    TopLeading,
    Center
};

struct Placement {
    std::size_t box_index = 0;   // position of the box in the input sequence
    Rect frame;
    Anchor anchor = Anchor::TopLeading;
    Constraint proposal;         // constraint to re-propose when applying the frame

    // The point to hand to the host together with `anchor`
    Point anchor_point() const {
        return anchor == Anchor::Center ? frame.center() : frame.origin;
    }
};

// One placement per input box, in input order.
struct LayoutResult {
    Size total_size;
    std::vector<Placement> placements;
};

// Stable textual form: "{w:.. h:..}[i x:.. y:.. w:.. h:..]..."
std::string serialize_layout(const LayoutResult& result);

} // namespace arrange::layout

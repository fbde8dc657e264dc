#pragma once
#include <arrange/layout/box.h>
#include <vector>

namespace arrange::layout {

// Capability pair a host view proxy implements so the layouts can drive it.
class LayoutItem {
public:
    virtual ~LayoutItem() = default;

    virtual Size size_that_fits(const Constraint& proposal) const = 0;
    virtual void place(const Point& position, Anchor anchor, const Constraint& proposal) = 0;
};

// Bridges a host's ordered item list to the box/measurer contract and
// applies a computed LayoutResult back onto the items.
// Items are borrowed and must outlive the set.
class ItemSet {
public:
    // Throws std::invalid_argument if any item is null.
    explicit ItemSet(std::vector<LayoutItem*> items);

    // One box per item; the box id is the item's index.
    const std::vector<Box>& boxes() const { return boxes_; }
    std::size_t size() const { return items_.size(); }

    // Forwards to LayoutItem::size_that_fits. The measurer keeps its own copy
    // of the item list, so it stays usable after the set is moved or destroyed.
    Measurer measurer() const;

    // Places every item at the anchor point of its frame. The result is
    // checked before any item is touched: a placement count that differs
    // from the item count, or a box index that is out of range or repeated,
    // throws std::invalid_argument.
    void apply(const LayoutResult& result);

private:
    std::vector<LayoutItem*> items_;
    std::vector<Box> boxes_;
};

} // namespace arrange::layout

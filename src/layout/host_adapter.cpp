#include <arrange/layout/host_adapter.h>

#include <stdexcept>
#include <string>
#include <utility>

namespace arrange::layout {

ItemSet::ItemSet(std::vector<LayoutItem*> items) : items_(std::move(items)) {
    boxes_.reserve(items_.size());
    for (std::size_t i = 0; i < items_.size(); ++i) {
        if (!items_[i]) {
            throw std::invalid_argument("ItemSet: item " + std::to_string(i) + " is null");
        }
        boxes_.push_back(Box{static_cast<std::uint64_t>(i)});
    }
}

Measurer ItemSet::measurer() const {
    return [items = items_](const Box& box, const Constraint& proposal) -> Size {
        if (box.id >= items.size()) {
            throw std::out_of_range("ItemSet: no item for box " + std::to_string(box.id));
        }
        return items[static_cast<std::size_t>(box.id)]->size_that_fits(proposal);
    };
}

void ItemSet::apply(const LayoutResult& result) {
    if (result.placements.size() != items_.size()) {
        throw std::invalid_argument(
            "ItemSet: result has " + std::to_string(result.placements.size()) +
            " placements for " + std::to_string(items_.size()) + " items");
    }
    std::vector<bool> seen(items_.size(), false);
    for (const auto& placement : result.placements) {
        if (placement.box_index >= items_.size()) {
            throw std::invalid_argument(
                "ItemSet: placement refers to box " + std::to_string(placement.box_index));
        }
        if (seen[placement.box_index]) {
            throw std::invalid_argument(
                "ItemSet: box " + std::to_string(placement.box_index) + " is placed twice");
        }
        seen[placement.box_index] = true;
    }

    for (const auto& placement : result.placements) {
        items_[placement.box_index]->place(placement.anchor_point(), placement.anchor,
                                           placement.proposal);
    }
}

} // namespace arrange::layout

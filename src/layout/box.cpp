#include <arrange/layout/box.h>

namespace arrange::layout {

std::string serialize_layout(const LayoutResult& result) {
    std::string out;
    out += "{w:" + std::to_string(result.total_size.width);
    out += " h:" + std::to_string(result.total_size.height);
    out += "}";
    for (const auto& placement : result.placements) {
        const auto& frame = placement.frame;
        out += "[" + std::to_string(placement.box_index);
        out += " x:" + std::to_string(frame.origin.x);
        out += " y:" + std::to_string(frame.origin.y);
        out += " w:" + std::to_string(frame.size.width);
        out += " h:" + std::to_string(frame.size.height);
        if (placement.anchor == Anchor::Center) out += " center";
        out += "]";
    }
    return out;
}

} // namespace arrange::layout

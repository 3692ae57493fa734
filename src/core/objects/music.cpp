#include "hircgen/objects/music.hpp"
#include "hircgen/renderer.hpp"

namespace hircgen {

void MusicSegmentObject::parse_props(const Node& node) {
    parse_children(node);
    for (const auto& nstinger : node.find_children("stinger")) {
        stingers_.push_back(require_id(*nstinger));
    }
    for (const auto& ntransition : node.find_children("transition")) {
        transitions_.push_back(require_id(*ntransition));
    }
    report_unknown_children(node, {"child", "stinger", "transition"});
}

void MusicSegmentObject::render(RenderScope& scope) const {
    ChildListObject::render(scope);

    for (uint32_t stinger : stingers_) {
        scope.add_secondary("stinger", stinger, *this);
    }
    for (uint32_t transition : transitions_) {
        scope.add_secondary("transition", transition, *this);
    }
}

void MusicTrackObject::parse_props(const Node& node) {
    for (const auto& nsource : node.find_children("source")) {
        uint32_t id = require_id(*nsource);
        sources_.push_back(nsource->str_attr("name").value_or(std::to_string(id) + ".wem"));
    }
    report_unknown_children(node, {"source"});
}

void MusicTrackObject::render(RenderScope& scope) const {
    for (const auto& source : sources_) {
        scope.line("source " + source);
    }
}

} // namespace hircgen

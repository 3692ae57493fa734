#include "hircgen/objects/actions.hpp"
#include "hircgen/renderer.hpp"
#include <stdexcept>

namespace hircgen {

// ============================================================================
// EventObject
// ============================================================================

void EventObject::parse_props(const Node& node) {
    for (const auto& naction : node.find_children("action")) {
        actions_.push_back(require_id(*naction));
    }
    report_unknown_children(node, {"action"});
}

void EventObject::render(RenderScope& scope) const {
    for (uint32_t action : actions_) {
        scope.render_ref(action, *this);
    }
}

// ============================================================================
// ActionPlayObject
// ============================================================================

void ActionPlayObject::parse_props(const Node& node) {
    auto ntarget = node.find_child("target");
    if (!ntarget) {
        throw std::runtime_error("CAkActionPlay " + std::to_string(sid_) + ": missing target");
    }
    target_ = require_id(*ntarget);

    // 参照先バンクの宣言
    if (auto bank = ntarget->int_attr("bank")) {
        TargetBank tb;
        tb.id = static_cast<uint32_t>(*bank);
        tb.name = ntarget->str_attr("bankname").value_or("");
        target_bank_ = tb;
    }

    report_unknown_children(node, {"target"});
}

void ActionPlayObject::render(RenderScope& scope) const {
    scope.render_ref(target_, *this, target_bank_);
}

} // namespace hircgen

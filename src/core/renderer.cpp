#include "hircgen/renderer.hpp"
#include <algorithm>
#include <stdexcept>

namespace hircgen {

RenderScope::RenderScope(Registry& registry, StateContext& state, Artifact& out)
    : registry_(registry), state_(state), out_(out) {}

void RenderScope::line(const std::string& text) {
    out_.line(depth_, text);
}

void RenderScope::render_object(const HircObject& obj) {
    if (std::find(stack_.begin(), stack_.end(), &obj) != stack_.end()) {
        throw std::runtime_error("render loop at " + obj.name() + " " +
                                 std::to_string(obj.sid()) + " in bank " +
                                 registry_.bank_name(obj.bank_id()));
    }

    line(obj.header());

    stack_.push_back(&obj);
    depth_++;
    apply_statechunks(obj);
    apply_rtpcs(obj);
    obj.render(*this);
    depth_--;
    stack_.pop_back();
}

bool RenderScope::render_ref(uint32_t sid, const HircObject& caller,
                             const std::optional<TargetBank>& target) {
    auto obj = registry_.get_object(caller.bank_id(), sid, caller.ref(), target);
    if (!obj) {
        line("missing " + std::to_string(sid));
        return false;
    }
    render_object(*obj);
    return true;
}

void RenderScope::add_secondary(const std::string& kind, uint32_t sid, const HircObject& caller) {
    // 未使用として報告されないよう構築だけしておく
    auto obj = registry_.get_object(caller.bank_id(), sid, caller.ref());
    if (!obj) {
        return;
    }
    if (state_.secondaries().add(Secondary{kind, obj->ref()}) && kind == "transition") {
        registry_.report_transition_object();
    }
}

void RenderScope::apply_statechunks(const HircObject& obj) {
    for (const auto& chunk : obj.statechunks()) {
        for (const auto& item : chunk.states) {
            state_.chunk_set().add(item);
        }

        auto current = state_.chunk(chunk.group);
        if (!current) continue;
        for (const auto& item : chunk.states) {
            if (item.value == *current) {
                line("state " + item.describe());
            }
        }
    }
}

void RenderScope::apply_rtpcs(const HircObject& obj) {
    for (const auto& curve : obj.rtpcs()) {
        if (!state_.is_param_preset(curve.id)) {
            for (double point : curve.points) {
                state_.param_set().add(ParamItem{curve.id, curve.name, point});
            }
        }

        auto current = state_.param(curve.id);
        if (current) {
            line("rtpc " + ParamItem{curve.id, curve.name, *current}.describe());
        }
    }
}

// ============================================================================
// TreeRenderer
// ============================================================================

TreeRenderer::TreeRenderer(Registry& registry)
    : registry_(registry) {}

void TreeRenderer::render(const NodePtr& root, StateContext& state, Artifact& out) {
    auto obj = registry_.build(root);
    RenderScope scope(registry_, state, out);
    scope.render_object(*obj);
}

std::vector<std::string> TreeRenderer::root_types() const {
    return builtin_root_types();
}

} // namespace hircgen

#include "hircgen/objects/containers.hpp"
#include "hircgen/renderer.hpp"
#include <stdexcept>

namespace hircgen {

// ============================================================================
// SwitchContainerObject
// ============================================================================

void SwitchContainerObject::parse_props(const Node& node) {
    auto ngroup = node.find_child("group");
    if (!ngroup) {
        throw std::runtime_error("CAkSwitchCntr " + std::to_string(sid_) + ": missing group");
    }
    group_ = require_id(*ngroup);
    group_name_ = ngroup->str_attr("name").value_or("");

    for (const auto& ncase : node.find_children("case")) {
        Case c;
        c.item.group = group_;
        c.item.group_name = group_name_;
        c.item.value = require_id(*ncase);
        c.item.value_name = ncase->str_attr("name").value_or("");
        for (const auto& nchild : ncase->find_children("child")) {
            c.children.push_back(require_id(*nchild));
        }
        cases_.push_back(std::move(c));
    }

    report_unknown_children(node, {"group", "case"});
}

std::string SwitchContainerObject::header() const {
    std::string g = group_name_.empty() ? std::to_string(group_) : group_name_;
    return name() + " " + label() + " [" + g + "]";
}

std::vector<uint32_t> SwitchContainerObject::child_refs() const {
    std::vector<uint32_t> refs;
    for (const auto& c : cases_) {
        refs.insert(refs.end(), c.children.begin(), c.children.end());
    }
    return refs;
}

void SwitchContainerObject::render(RenderScope& scope) const {
    auto current = scope.state().selector(group_);
    if (!current) {
        // 外側の同じグループで探索中の値に従う
        current = scope.state().selector_paths().current(group_);
    }
    if (current) {
        // 選択済み: 一致するケースのみ（なければ何も鳴らない）
        for (const auto& c : cases_) {
            if (c.item.value == *current) {
                render_case(scope, c);
            }
        }
        return;
    }

    // 未選択: 全ケースを探索してパスを記録
    for (const auto& c : cases_) {
        scope.state().selector_paths().push(c.item);
        render_case(scope, c);
        scope.state().selector_paths().pop();
    }
}

void SwitchContainerObject::render_case(RenderScope& scope, const Case& c) const {
    scope.line("case " + c.item.describe());
    for (uint32_t child : c.children) {
        scope.render_ref(child, *this);
    }
}

// ============================================================================
// ChildListObject / RanSeqContainerObject
// ============================================================================

void ChildListObject::parse_props(const Node& node) {
    parse_children(node);
    report_unknown_children(node, {"child"});
}

void ChildListObject::parse_children(const Node& node) {
    for (const auto& nchild : node.find_children("child")) {
        children_.push_back(require_id(*nchild));
    }
}

void ChildListObject::render(RenderScope& scope) const {
    for (uint32_t child : children_) {
        scope.render_ref(child, *this);
    }
}

void RanSeqContainerObject::parse_props(const Node& node) {
    ChildListObject::parse_props(node);

    if (auto mode = node.str_attr("mode")) {
        if (*mode != "random" && *mode != "sequence") {
            throw std::runtime_error("CAkRanSeqCntr " + std::to_string(sid_) +
                                     ": unknown mode '" + *mode + "'");
        }
        mode_ = *mode;
    }
}

std::string RanSeqContainerObject::header() const {
    return name() + " " + label() + " [" + mode_ + "]";
}

// ============================================================================
// SoundObject
// ============================================================================

void SoundObject::parse_props(const Node& node) {
    auto nsource = node.find_child("source");
    if (!nsource) {
        throw std::runtime_error("CAkSound " + std::to_string(sid_) + ": missing source");
    }
    source_ = require_id(*nsource);
    source_name_ = nsource->str_attr("name").value_or(std::to_string(source_) + ".wem");

    report_unknown_children(node, {"source"});
}

void SoundObject::render(RenderScope& scope) const {
    scope.line("source " + source_name_);
}

} // namespace hircgen

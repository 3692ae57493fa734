#include "hircgen/hirc_object.hpp"
#include "hircgen/registry.hpp"
#include <limits>
#include <stdexcept>

namespace hircgen {

void HircObject::bind(Registry& registry) {
    registry_ = &registry;
}

void HircObject::parse(const Node& node) {
    if (!registry_) {
        throw std::logic_error(name() + ": parse called before bind");
    }

    sid_ = node.sid().value_or(0);
    display_name_ = node.display_name().value_or("");
    bank_id_ = registry_->bank_of(node);

    parse_statechunks(node);
    parse_rtpcs(node);
    parse_props(node);
}

std::string HircObject::label() const {
    if (!display_name_.empty()) {
        return display_name_;
    }
    return std::to_string(sid_);
}

std::string HircObject::header() const {
    return name() + " " + label();
}

uint32_t HircObject::require_id(const Node& node) const {
    auto v = node.int_value();
    if (!v || *v < 0 || *v > static_cast<int64_t>(std::numeric_limits<uint32_t>::max())) {
        throw std::runtime_error(name() + " " + std::to_string(sid_) + ": '" +
                                 node.type() + "' requires an integer id");
    }
    return static_cast<uint32_t>(*v);
}

void HircObject::report_unknown_children(const Node& node,
                                         const std::set<std::string>& known) const {
    for (const auto& child : node.children()) {
        const auto& type = child->type();
        if (type == "sid" || type == "statechunk" || type == "rtpc") {
            continue;
        }
        if (known.count(type) == 0) {
            registry_->report_unknown_prop(name() + "." + type);
        }
    }
}

void HircObject::parse_statechunks(const Node& node) {
    for (const auto& nchunk : node.find_children("statechunk")) {
        StateChunk chunk;
        chunk.group = require_id(*nchunk);
        chunk.group_name = nchunk->str_attr("name").value_or("");

        for (const auto& nstate : nchunk->find_children("state")) {
            StateItem item;
            item.group = chunk.group;
            item.group_name = chunk.group_name;
            item.value = require_id(*nstate);
            item.value_name = nstate->str_attr("name").value_or("");
            chunk.states.push_back(std::move(item));
        }
        statechunks_.push_back(std::move(chunk));
    }
}

void HircObject::parse_rtpcs(const Node& node) {
    for (const auto& nrtpc : node.find_children("rtpc")) {
        ParamCurve curve;
        curve.id = require_id(*nrtpc);
        curve.name = nrtpc->str_attr("name").value_or("");

        for (const auto& npoint : nrtpc->find_children("point")) {
            auto v = npoint->number_value();
            if (!v) {
                throw std::runtime_error(name() + " " + std::to_string(sid_) +
                                         ": rtpc point requires a number");
            }
            curve.points.push_back(*v);
        }
        rtpcs_.push_back(std::move(curve));
    }
}

void UnsupportedObject::parse_props(const Node&) {
    registry_->report_unknown_prop("unsupported object " + type_);
}

} // namespace hircgen

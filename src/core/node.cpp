#include "hircgen/node.hpp"
#include <sstream>

namespace hircgen {

Node::Node(std::string type)
    : type_(std::move(type)) {}

std::optional<int64_t> Node::int_value() const {
    if (auto p = std::get_if<int64_t>(&value_)) {
        return *p;
    }
    return std::nullopt;
}

std::optional<double> Node::number_value() const {
    if (auto p = std::get_if<int64_t>(&value_)) {
        return static_cast<double>(*p);
    }
    if (auto p = std::get_if<double>(&value_)) {
        return *p;
    }
    return std::nullopt;
}

const Value* Node::attr(const std::string& key) const {
    auto it = attrs_.find(key);
    if (it == attrs_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::optional<int64_t> Node::int_attr(const std::string& key) const {
    const Value* v = attr(key);
    if (!v) return std::nullopt;
    if (auto p = std::get_if<int64_t>(v)) {
        return *p;
    }
    return std::nullopt;
}

std::optional<std::string> Node::str_attr(const std::string& key) const {
    const Value* v = attr(key);
    if (!v || std::holds_alternative<std::monostate>(*v)) {
        return std::nullopt;
    }
    return value_to_string(*v);
}

NodePtr Node::find_child(const std::string& type) const {
    for (const auto& child : children_) {
        if (child->type() == type) {
            return child;
        }
    }
    return nullptr;
}

std::vector<NodePtr> Node::find_children(const std::string& type) const {
    std::vector<NodePtr> result;
    for (const auto& child : children_) {
        if (child->type() == type) {
            result.push_back(child);
        }
    }
    return result;
}

std::optional<uint32_t> Node::sid() const {
    auto nsid = find_child("sid");
    if (!nsid) return std::nullopt;
    auto v = nsid->int_value();
    if (!v || *v < 0) return std::nullopt;
    return static_cast<uint32_t>(*v);
}

std::optional<std::string> Node::display_name() const {
    auto nsid = find_child("sid");
    if (!nsid) return std::nullopt;
    return nsid->str_attr("name");
}

void Node::set_attr(const std::string& key, Value value) {
    attrs_[key] = std::move(value);
}

void Node::add_child(NodePtr child) {
    children_.push_back(std::move(child));
}

std::string value_to_string(const Value& value) {
    if (auto p = std::get_if<int64_t>(&value)) {
        return std::to_string(*p);
    }
    if (auto p = std::get_if<double>(&value)) {
        std::ostringstream oss;
        oss << *p;
        return oss.str();
    }
    if (auto p = std::get_if<std::string>(&value)) {
        return *p;
    }
    return "";
}

} // namespace hircgen

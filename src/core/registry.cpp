#include "hircgen/registry.hpp"
#include <iostream>

namespace hircgen {

namespace {
std::string describe_ref(const Reference& ref) {
    return std::to_string(ref.bank_id) + "/" + std::to_string(ref.sid);
}
}  // namespace

Registry::Registry()
    : table_(builtin_object_table())
    , silent_types_(builtin_silent_types()) {}

Registry::Registry(ObjectTable table)
    : table_(std::move(table))
    , silent_types_(builtin_silent_types()) {}

void Registry::add_loaded_bank(uint32_t bank_id, const std::string& filename) {
    loaded_banks_[bank_id] = filename;
}

bool Registry::is_bank_loaded(uint32_t bank_id) const {
    return loaded_banks_.count(bank_id) > 0;
}

std::string Registry::bank_name(uint32_t bank_id) const {
    auto it = loaded_banks_.find(bank_id);
    if (it == loaded_banks_.end()) {
        return "?";
    }
    return it->second;
}

bool Registry::register_node(uint32_t bank_id, uint32_t sid, NodePtr node) {
    // 同じ id が複数バンクに保存されることがある（通常はクローンだが別物のこともある）。
    // bank + id を別々に扱い、id 単独でも探せるようにしておく。
    Reference ref{bank_id, sid};
    if (ref_to_handle_.count(ref) > 0) {
        if (verbose_) {
            std::cerr << "[hircgen] ignored repeated bank " << bank_id << " + id " << sid << "\n";
        }
        return false;
    }

    size_t handle = handle_of(node, bank_id);
    if (node_banks_[handle] == 0) {
        node_banks_[handle] = bank_id;
    }
    ref_to_handle_[ref] = handle;
    id_to_refs_[sid].push_back(ref);
    type_to_handles_[node->type()].push_back(handle);
    return true;
}

NodePtr Registry::resolve(uint32_t bank_id, uint32_t sid) {
    auto it = ref_to_handle_.find(Reference{bank_id, sid});
    if (it != ref_to_handle_.end()) {
        return nodes_[it->second];
    }

    // 他バンクを探す
    auto rit = id_to_refs_.find(sid);
    if (rit == id_to_refs_.end() || rit->second.empty()) {
        return nullptr;
    }

    const auto& refs = rit->second;
    if (refs.size() > 1) {
        if (ambiguous_ids_.insert(sid).second && verbose_) {
            std::cerr << "[hircgen] id " << sid << " found in multiple banks, not found in bank "
                      << bank_id << "\n";
        }
    }
    return nodes_[ref_to_handle_.at(refs.front())];
}

HircObjectPtr Registry::get_object(uint32_t bank_id, uint32_t sid, const Reference& caller,
                                   const std::optional<TargetBank>& target) {
    if (target) {
        bank_id = target->id;
    }
    if (bank_id == 0 || sid == 0) {
        // 何も指さない参照（バンク -1 など）
        return nullptr;
    }

    NodePtr node = resolve(bank_id, sid);
    if (node) {
        return build(node);
    }

    record_missing(bank_id, sid, caller, target);
    return nullptr;
}

void Registry::record_missing(uint32_t bank_id, uint32_t sid, const Reference& caller,
                              const std::optional<TargetBank>& target) {
    Reference ref{bank_id, sid};

    if (!target) {
        // 宣言付きで分類済みなら優先
        if (missing_loaded_.count(ref) > 0 || missing_others_.count(ref) > 0) {
            return;
        }
        // 他バンクの参照か残骸か不明
        if (missing_unknown_.insert(ref).second && verbose_) {
            std::cerr << "[hircgen] missing node " << sid << " in unknown bank, called by "
                      << describe_ref(caller) << "\n";
        }
        return;
    }

    // 宣言のない参照で記録済みなら宣言付きの分類に移す
    missing_unknown_.erase(ref);

    if (is_bank_loaded(bank_id)) {
        // 読み込み済みバンクにない: 残骸
        if (missing_loaded_.insert(ref).second && verbose_) {
            std::cerr << "[hircgen] missing node " << sid << " in loaded bank "
                      << bank_name(bank_id) << ", called by " << describe_ref(caller) << "\n";
        }
        return;
    }

    std::string name = target->name.empty() ? std::to_string(target->id) : target->name;
    if (missing_others_.insert(ref).second && verbose_) {
        std::cerr << "[hircgen] missing node " << sid << " in non-loaded bank " << name
                  << ", called by " << describe_ref(caller) << "\n";
    }
    missing_banks_.insert(name);
}

HircObjectPtr Registry::build(const NodePtr& node) {
    if (!node) {
        return nullptr;
    }
    return build_handle(handle_of(node, 0), true);
}

HircObjectPtr Registry::peek(const NodePtr& node) {
    if (!node) {
        return nullptr;
    }
    return build_handle(handle_of(node, 0), false);
}

HircObjectPtr Registry::build_handle(size_t handle, bool mark_used) {
    if (!objects_[handle]) {
        const NodePtr& node = nodes_[handle];

        HircObjectPtr obj;
        auto it = table_.find(node->type());
        if (it != table_.end()) {
            obj = it->second();
        } else {
            obj = std::make_shared<UnsupportedObject>(node->type());
        }

        // parse が例外を送出した場合はキャッシュしない
        obj->bind(*this);
        obj->parse(*node);

        objects_[handle] = obj;
        object_count_++;
    }

    if (mark_used) {
        used_[handle] = true;
    }
    return objects_[handle];
}

size_t Registry::handle_of(const NodePtr& node, uint32_t bank_id) {
    auto it = handles_.find(node.get());
    if (it != handles_.end()) {
        return it->second;
    }

    size_t handle = nodes_.size();
    nodes_.push_back(node);
    node_banks_.push_back(bank_id);
    objects_.push_back(nullptr);
    used_.push_back(false);
    handles_[node.get()] = handle;
    return handle;
}

bool Registry::is_used(const Node& node) const {
    auto it = handles_.find(&node);
    if (it == handles_.end()) {
        return false;
    }
    return used_[it->second];
}

uint32_t Registry::bank_of(const Node& node) const {
    auto it = handles_.find(&node);
    if (it == handles_.end()) {
        return 0;
    }
    return node_banks_[it->second];
}

bool Registry::counts_as_unused(size_t handle) {
    if (used_[handle]) {
        return false;
    }
    if (silent_types_.count(nodes_[handle]->type()) == 0) {
        return true;
    }
    // 子のない空オブジェクト（無音セグメントなど）は残骸として扱わない
    auto obj = build_handle(handle, false);
    return !obj->child_refs().empty();
}

bool Registry::has_unused(const std::vector<std::string>& types) {
    for (const auto& type : types) {
        auto it = type_to_handles_.find(type);
        if (it == type_to_handles_.end()) continue;
        for (size_t handle : it->second) {
            if (counts_as_unused(handle)) {
                return true;
            }
        }
    }
    return false;
}

std::vector<NodePtr> Registry::list_unused(const std::string& type) {
    std::vector<NodePtr> result;
    auto it = type_to_handles_.find(type);
    if (it == type_to_handles_.end()) {
        return result;
    }
    for (size_t handle : it->second) {
        if (counts_as_unused(handle)) {
            result.push_back(nodes_[handle]);
        }
    }
    return result;
}

void Registry::report_unknown_prop(const std::string& prop) {
    if (unknown_props_.insert(prop).second && verbose_) {
        std::cerr << "[hircgen] unknown property " << prop << "\n";
    }
}

} // namespace hircgen

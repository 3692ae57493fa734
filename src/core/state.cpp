#include "hircgen/state.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace hircgen {

std::string StateItem::describe() const {
    std::string g = group_name.empty() ? std::to_string(group) : group_name;
    std::string v = value_name.empty() ? std::to_string(value) : value_name;
    return g + "=" + v;
}

std::string ParamItem::describe() const {
    std::ostringstream oss;
    oss << (name.empty() ? std::to_string(id) : name) << "=" << value;
    return oss.str();
}

// ============================================================================
// SelectorPaths
// ============================================================================

SelectorPaths::SelectorPaths() {
    nodes_.push_back(PathNode{});
}

void SelectorPaths::push(const StateItem& item) {
    size_t parent = stack_.empty() ? 0 : stack_.back();

    for (size_t child : nodes_[parent].children) {
        if (nodes_[child].item == item) {
            stack_.push_back(child);
            return;
        }
    }

    size_t idx = nodes_.size();
    nodes_.push_back(PathNode{item, {}});
    nodes_[parent].children.push_back(idx);
    stack_.push_back(idx);
}

void SelectorPaths::pop() {
    if (stack_.empty()) {
        throw std::logic_error("SelectorPaths::pop without matching push");
    }
    stack_.pop_back();
}

std::optional<uint32_t> SelectorPaths::current(uint32_t group) const {
    for (auto it = stack_.rbegin(); it != stack_.rend(); ++it) {
        const auto& item = nodes_[*it].item;
        if (item.group == group) {
            return item.value;
        }
    }
    return std::nullopt;
}

std::vector<SelectorCombo> SelectorPaths::combos() const {
    if (empty()) {
        return {};
    }
    return expand(0);
}

std::vector<SelectorCombo> SelectorPaths::expand(size_t idx) const {
    const auto& children = nodes_[idx].children;

    // 子のグループを出現順に集める
    std::vector<uint32_t> groups;
    for (size_t child : children) {
        uint32_t g = nodes_[child].item.group;
        if (std::find(groups.begin(), groups.end(), g) == groups.end()) {
            groups.push_back(g);
        }
    }

    std::vector<SelectorCombo> result{SelectorCombo{}};
    for (uint32_t g : groups) {
        // 同一グループの値は択一
        std::vector<SelectorCombo> alternatives;
        for (size_t child : children) {
            if (nodes_[child].item.group != g) continue;
            for (auto& sub : expand(child)) {
                SelectorCombo combo;
                combo.reserve(sub.size() + 1);
                combo.push_back(nodes_[child].item);
                combo.insert(combo.end(), sub.begin(), sub.end());
                alternatives.push_back(std::move(combo));
            }
        }

        // 異なるグループは直積
        std::vector<SelectorCombo> next;
        next.reserve(result.size() * alternatives.size());
        for (const auto& base : result) {
            for (const auto& alt : alternatives) {
                SelectorCombo combo = base;
                combo.insert(combo.end(), alt.begin(), alt.end());
                next.push_back(std::move(combo));
            }
        }
        result = std::move(next);
    }
    return result;
}

void SelectorPaths::clear() {
    nodes_.clear();
    nodes_.push_back(PathNode{});
    stack_.clear();
}

// ============================================================================
// StateChunkSet
// ============================================================================

void StateChunkSet::add(const StateItem& state, bool unreachable) {
    auto git = std::find_if(groups_.begin(), groups_.end(),
                            [&state](const Group& g) { return g.id == state.group; });
    if (git == groups_.end()) {
        groups_.push_back(Group{state.group, {}});
        git = groups_.end() - 1;
    }

    for (auto& entry : git->values) {
        if (entry.state == state) {
            entry.unreachable = entry.unreachable || unreachable;
            return;
        }
    }
    git->values.push_back(Entry{state, unreachable});
}

std::vector<ChunkCombo> StateChunkSet::combos(const std::map<uint32_t, uint32_t>& selectors) const {
    if (groups_.empty()) {
        return {};
    }

    std::vector<ChunkCombo> result{ChunkCombo{}};
    for (const auto& group : groups_) {
        // セレクタと同じグループで値が異なれば到達不能
        auto sit = selectors.find(group.id);

        std::vector<ChunkCombo> next;
        next.reserve(result.size() * group.values.size());
        for (const auto& base : result) {
            for (const auto& entry : group.values) {
                ChunkCombo combo = base;
                combo.items.push_back(entry.state);
                bool conflicts = sit != selectors.end() && sit->second != entry.state.value;
                combo.unreachable = combo.unreachable || entry.unreachable || conflicts;
                next.push_back(std::move(combo));
            }
        }
        result = std::move(next);
    }
    return result;
}

bool StateChunkSet::generate_default(const std::vector<ChunkCombo>& combos) const {
    if (combos.empty()) {
        return false;
    }
    return std::all_of(combos.begin(), combos.end(),
                       [](const ChunkCombo& c) { return c.unreachable; });
}

void StateChunkSet::clear() {
    groups_.clear();
}

// ============================================================================
// ParamSet / SecondarySet
// ============================================================================

void ParamSet::add(const ParamItem& param) {
    auto pit = std::find_if(params_.begin(), params_.end(),
                            [&param](const Param& p) { return p.id == param.id; });
    if (pit == params_.end()) {
        params_.push_back(Param{param.id, {}});
        pit = params_.end() - 1;
    }

    for (const auto& v : pit->values) {
        if (v.value == param.value) {
            return;
        }
    }
    pit->values.push_back(param);
}

std::vector<ParamCombo> ParamSet::combos() const {
    if (params_.empty()) {
        return {};
    }

    std::vector<ParamCombo> result{ParamCombo{}};
    for (const auto& param : params_) {
        std::vector<ParamCombo> next;
        next.reserve(result.size() * param.values.size());
        for (const auto& base : result) {
            for (const auto& v : param.values) {
                ParamCombo combo = base;
                combo.push_back(v);
                next.push_back(std::move(combo));
            }
        }
        result = std::move(next);
    }
    return result;
}

bool SecondarySet::add(const Secondary& secondary) {
    for (const auto& item : items_) {
        if (item.target == secondary.target) {
            return false;
        }
    }
    items_.push_back(secondary);
    return true;
}

// ============================================================================
// StateContext
// ============================================================================

void StateContext::set_selector_presets(std::vector<StateItem> presets) {
    selector_presets_ = std::move(presets);
}

void StateContext::set_param_presets(std::vector<ParamItem> presets) {
    param_presets_ = std::move(presets);
}

void StateContext::reset() {
    selectors_.clear();
    for (const auto& item : selector_presets_) {
        selectors_[item.group] = item.value;
    }
    applied_selectors_.clear();
    selector_paths_.clear();

    reset_chunks();
    reset_params();
    secondaries_.clear();
}

void StateContext::reset_chunks() {
    clear_chunks();
    chunk_set_.clear();
}

void StateContext::reset_params() {
    params_.clear();
    for (const auto& item : param_presets_) {
        params_[item.id] = item.value;
    }
    applied_params_.clear();
    param_set_.clear();
}

void StateContext::set_selectors(const SelectorCombo& combo) {
    selectors_.clear();
    for (const auto& item : selector_presets_) {
        selectors_[item.group] = item.value;
    }
    for (const auto& item : combo) {
        selectors_[item.group] = item.value;
    }
    applied_selectors_ = combo;
}

std::optional<uint32_t> StateContext::selector(uint32_t group) const {
    auto it = selectors_.find(group);
    if (it == selectors_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void StateContext::set_chunks(const ChunkCombo& combo) {
    chunks_.clear();
    for (const auto& item : combo.items) {
        chunks_[item.group] = item.value;
    }
    applied_chunks_ = combo;
}

void StateContext::clear_chunks() {
    chunks_.clear();
    applied_chunks_.reset();
}

std::optional<uint32_t> StateContext::chunk(uint32_t group) const {
    auto it = chunks_.find(group);
    if (it == chunks_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ChunkCombo> StateContext::chunk_combos() const {
    return chunk_set_.combos(selectors_);
}

void StateContext::set_params(const ParamCombo& combo) {
    params_.clear();
    for (const auto& item : param_presets_) {
        params_[item.id] = item.value;
    }
    for (const auto& item : combo) {
        params_[item.id] = item.value;
    }
    applied_params_ = combo;
}

std::optional<double> StateContext::param(uint32_t id) const {
    auto it = params_.find(id);
    if (it == params_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool StateContext::is_param_preset(uint32_t id) const {
    return std::any_of(param_presets_.begin(), param_presets_.end(),
                       [id](const ParamItem& p) { return p.id == id; });
}

} // namespace hircgen

#include "hircgen/generator.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace hircgen {

// ============================================================================
// GeneratorFilter
// ============================================================================

void GeneratorFilter::add(const std::string& entry) {
    if (!entry.empty()) {
        entries_.insert(entry);
    }
}

bool GeneratorFilter::allow(const Node& node) const {
    if (entries_.count(node.type()) > 0) {
        return true;
    }
    if (auto sid = node.sid()) {
        if (entries_.count(std::to_string(*sid)) > 0) {
            return true;
        }
    }
    if (auto name = node.display_name()) {
        if (entries_.count(*name) > 0) {
            return true;
        }
    }
    return false;
}

// ============================================================================
// Generator
// ============================================================================

Generator::Generator(std::vector<Bank> banks, Registry& registry, Renderer& renderer,
                     ArtifactSink& sink, GeneratorOptions options)
    : banks_(std::move(banks))
    , registry_(registry)
    , renderer_(renderer)
    , sink_(sink)
    , options_(std::move(options)) {
    state_.set_selector_presets(options_.selector_presets);
    state_.set_param_presets(options_.param_presets);

    for (const auto& type : renderer_.root_types()) {
        root_types_.insert(type);
    }
}

void Generator::generate() {
    if (options_.verbose) std::cerr << "[hircgen] start\n";

    setup();
    write_normal();
    write_unused();

    if (options_.verbose) {
        std::cerr << "[hircgen] done: " << stats_.roots << " roots, " << stats_.renders
                  << " renders, " << stats_.published << " artifacts\n";
    }
}

void Generator::setup() {
    for (const auto& bank : banks_) {
        registry_.add_loaded_bank(bank.id, bank.filename);

        // バンク同士が参照しあうため、先に全オブジェクトを登録する
        for (const auto& node : bank.items) {
            auto sid = node->sid();
            if (!sid) {
                std::cerr << "[hircgen] WARNING: sid not found for " << node->type()
                          << " in " << bank.filename << "\n";
                continue;
            }
            registry_.register_node(bank.id, *sid, node);
        }
    }
}

void Generator::write_normal() {
    if (options_.verbose) std::cerr << "[hircgen] processing nodes\n";

    suppressed_ = filter_.skip_normal;
    for (const auto& bank : banks_) {
        for (const auto& node : order_roots(bank)) {
            render_root(node);
        }
    }
    suppressed_ = false;
}

void Generator::write_unused() {
    if (!options_.generate_unused) {
        return;
    }
    if (!registry_.has_unused(options_.unused_types)) {
        return;
    }

    if (options_.verbose) std::cerr << "[hircgen] processing unused\n";

    suppressed_ = filter_.skip_unused;
    unused_mark_ = true;

    // 型ごとに一覧を取り直す（前の型の描画で使用済みになるものがある）
    for (const auto& type : options_.unused_types) {
        for (const auto& node : registry_.list_unused(type)) {
            if (registry_.is_used(*node)) {
                continue;
            }
            if (filter_.active() && !filter_.generate_rest && !filter_.allow(*node)) {
                continue;
            }
            render_root(node);
        }
    }

    unused_mark_ = false;
    suppressed_ = false;
}

std::vector<NodePtr> Generator::order_roots(const Bank& bank) const {
    std::vector<NodePtr> allowed;
    std::vector<std::pair<std::string, NodePtr>> named;
    std::vector<std::pair<uint32_t, NodePtr>> unnamed;

    for (const auto& node : bank.items) {
        auto sid = node->sid();
        if (!sid) continue;

        // フィルタ有効時: 一致したものを最優先、それ以外は rest 指定時のみ
        if (filter_.active()) {
            if (filter_.allow(*node)) {
                allowed.push_back(node);
                continue;
            }
            if (!filter_.generate_rest) {
                continue;
            }
        }

        if (root_types_.count(node->type()) == 0) {
            continue;
        }

        // 名前付きを先に生成すると、同じ内容の名前なしは重複として落ちる
        auto name = node->display_name();
        if (name && !options_.bank_order) {
            named.emplace_back(*name, node);
        } else {
            unnamed.emplace_back(*sid, node);
        }
    }

    std::stable_sort(named.begin(), named.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });
    if (!options_.bank_order) {
        std::stable_sort(unnamed.begin(), unnamed.end(),
                         [](const auto& a, const auto& b) { return a.first < b.first; });
    }

    std::vector<NodePtr> result = allowed;
    for (const auto& item : named) result.push_back(item.second);
    for (const auto& item : unnamed) result.push_back(item.second);

    if (options_.verbose) {
        std::cerr << "[hircgen] bank " << bank.filename << ": named=" << named.size()
                  << " unnamed=" << unnamed.size() << " filtered=" << allowed.size() << "\n";
    }
    return result;
}

void Generator::render_root(const NodePtr& root) {
    stats_.roots++;
    try {
        render_base(root);
    } catch (const std::exception& e) {
        uint32_t sid = root->sid().value_or(0);
        std::cerr << "[hircgen] ERROR! node " << sid << " in "
                  << registry_.bank_name(registry_.bank_of(*root)) << ": " << e.what() << "\n";
        throw;
    }
}

void Generator::render_base(const NodePtr& root) {
    // ルートごとに状態は0から
    state_.reset();

    // 組み合わせがなければこの描画が最後まで渡される
    Artifact base = begin_artifact(root);
    render_selectors(root, state_.selector_combos(), std::move(base));

    render_secondaries(root);
}

void Generator::render_selectors(const NodePtr& root, const std::vector<SelectorCombo>& combos,
                                 Artifact current) {
    if (combos.empty()) {
        render_chunks(root, state_.chunk_combos(), std::move(current), ChunkPass::Reachable);
        return;
    }

    // 到達不能なチャンクは到達可能な全分岐の後で生成する
    std::vector<SelectorCombo> deferred;

    for (const auto& combo : combos) {
        state_.set_selectors(combo);
        state_.reset_chunks();
        state_.reset_params();

        Artifact artifact = begin_artifact(root);
        auto chunk_combos = state_.chunk_combos();
        bool has_unreachables = std::any_of(chunk_combos.begin(), chunk_combos.end(),
                                            [](const ChunkCombo& c) { return c.unreachable; });
        if (has_unreachables) {
            deferred.push_back(combo);
        }

        render_chunks(root, chunk_combos, std::move(artifact), ChunkPass::Reachable);
    }

    for (const auto& combo : deferred) {
        state_.set_selectors(combo);
        state_.reset_chunks();
        state_.reset_params();

        Artifact artifact = begin_artifact(root);
        render_chunks(root, state_.chunk_combos(), std::move(artifact), ChunkPass::Unreachable);
    }
}

void Generator::render_chunks(const NodePtr& root, const std::vector<ChunkCombo>& combos,
                              Artifact current, ChunkPass pass) {
    if (combos.empty()) {
        // 到達不能パスでは出力済みの内容になるため何もしない
        if (pass == ChunkPass::Reachable) {
            render_params(root, state_.param_combos(), std::move(current));
        }
        return;
    }

    bool unreachable_pass = (pass == ChunkPass::Unreachable);
    bool make_default = !unreachable_pass && state_.chunk_set().generate_default(combos);

    for (const auto& combo : combos) {
        if (combo.unreachable != unreachable_pass) {
            continue;
        }

        state_.set_chunks(combo);
        state_.reset_params();

        Artifact artifact = begin_artifact(root);
        render_params(root, state_.param_combos(), std::move(artifact));
    }

    // チャンクなしの既定出力
    if (make_default) {
        state_.clear_chunks();
        state_.reset_params();

        Artifact artifact = begin_artifact(root);
        artifact.set_default_chunks(true);
        render_params(root, state_.param_combos(), std::move(artifact));
    }
}

void Generator::render_params(const NodePtr& root, const std::vector<ParamCombo>& combos,
                              Artifact current) {
    if (combos.empty()) {
        render_last(std::move(current));
        return;
    }

    bool default_chunks = current.is_default_chunks();
    for (const auto& combo : combos) {
        state_.set_params(combo);

        Artifact artifact = begin_artifact(root);
        artifact.set_default_chunks(default_chunks);
        render_last(std::move(artifact));
    }
}

void Generator::render_last(Artifact artifact) {
    artifact.set_suppressed(suppressed_);
    stats_.published++;
    sink_.publish(std::move(artifact));
}

void Generator::render_secondaries(const NodePtr& root) {
    // 副オブジェクトの描画で一覧が変わるため複製してから処理
    std::vector<Secondary> secondaries = state_.secondaries().items();
    if (secondaries.empty()) {
        return;
    }

    Reference caller{registry_.bank_of(*root), root->sid().value_or(0)};
    for (const auto& secondary : secondaries) {
        NodePtr node = registry_.resolve(secondary.target.bank_id, secondary.target.sid);
        if (!node) {
            continue;
        }

        state_.reset();
        Artifact artifact = begin_artifact(node);
        artifact.set_caller(caller);
        artifact.set_secondary(secondary);
        stats_.secondaries++;
        render_last(std::move(artifact));
    }
}

Artifact Generator::begin_artifact(const NodePtr& root) {
    Artifact artifact(root_name(*root));
    artifact.set_unused(unused_mark_);

    renderer_.render(root, state_, artifact);
    artifact.set_state(state_.applied_selectors(), state_.applied_chunks(),
                       state_.applied_params());

    stats_.renders++;
    return artifact;
}

std::string Generator::root_name(const Node& root) const {
    if (auto name = root.display_name()) {
        return *name;
    }
    if (auto sid = root.sid()) {
        return std::to_string(*sid);
    }
    return root.type();
}

} // namespace hircgen

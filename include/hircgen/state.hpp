/**
 * @file state.hpp
 * @brief 組み合わせ状態コンテキスト（セレクタ / ステートチャンク / パラメータ / 副オブジェクト）
 */
#ifndef HIRCGEN_STATE_HPP
#define HIRCGEN_STATE_HPP

#include "hircgen/node.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace hircgen {

/**
 * @brief グループ + 値のペア（スイッチ/ステートの選択）
 */
struct StateItem {
    uint32_t group = 0;
    uint32_t value = 0;
    std::string group_name;
    std::string value_name;

    bool operator==(const StateItem& other) const {
        return group == other.group && value == other.value;
    }

    /**
     * @brief "group=value" 形式の表示文字列（名前がなければ数値）
     */
    std::string describe() const;
};

/**
 * @brief セレクタの組み合わせ（グループごとに1値）
 */
using SelectorCombo = std::vector<StateItem>;

/**
 * @brief ステートチャンクの組み合わせ
 *
 * unreachable は現在のセレクタ選択に対して到達不能かどうか。
 */
struct ChunkCombo {
    std::vector<StateItem> items;
    bool unreachable = false;
};

/**
 * @brief パラメータ（RTPC）のバケット値
 */
struct ParamItem {
    uint32_t id = 0;
    std::string name;
    double value = 0.0;

    std::string describe() const;
};

using ParamCombo = std::vector<ParamItem>;

/**
 * @brief 描画中に発見された副オブジェクト（スティンガー、トランジション）
 */
struct Secondary {
    std::string kind;
    Reference target;
};

/**
 * @brief セレクタのパス木
 *
 * 未選択のグループを描画中に探索すると push/pop でパスを記録する。
 * 同じ親の下で同じグループの子は択一、異なるグループの子は直積になる。
 */
class SelectorPaths {
public:
    SelectorPaths();

    void push(const StateItem& item);
    void pop();

    /**
     * @brief 現在のパス上でグループに選ばれている値
     * @return パス上になければ std::nullopt
     */
    std::optional<uint32_t> current(uint32_t group) const;

    bool empty() const { return nodes_.size() == 1; }

    /**
     * @brief パス木から全組み合わせを展開
     */
    std::vector<SelectorCombo> combos() const;

    void clear();

private:
    struct PathNode {
        StateItem item;
        std::vector<size_t> children;
    };

    std::vector<SelectorCombo> expand(size_t idx) const;

    std::vector<PathNode> nodes_;  // [0] は根
    std::vector<size_t> stack_;
};

/**
 * @brief 発見されたステートチャンクのグループ集合
 */
class StateChunkSet {
public:
    /**
     * @brief グループの状態値を追加（既存グループにはマージ）
     * @param unreachable 描画側が到達不能と判定した値
     */
    void add(const StateItem& state, bool unreachable = false);

    bool empty() const { return groups_.empty(); }

    /**
     * @brief 組み合わせを展開し、セレクタ選択に対する到達可能性を付与
     * @param selectors 現在のセレクタ選択（group -> value）
     */
    std::vector<ChunkCombo> combos(const std::map<uint32_t, uint32_t>& selectors) const;

    /**
     * @brief 既定（チャンクなし）出力が必要か
     *
     * 全組み合わせが到達不能な場合に true。
     */
    bool generate_default(const std::vector<ChunkCombo>& combos) const;

    void clear();

private:
    struct Entry {
        StateItem state;
        bool unreachable = false;
    };
    struct Group {
        uint32_t id = 0;
        std::vector<Entry> values;
    };

    std::vector<Group> groups_;
};

/**
 * @brief 発見されたパラメータ集合
 */
class ParamSet {
public:
    void add(const ParamItem& param);

    bool empty() const { return params_.empty(); }

    std::vector<ParamCombo> combos() const;

    void clear() { params_.clear(); }

private:
    struct Param {
        uint32_t id = 0;
        std::vector<ParamItem> values;
    };

    std::vector<Param> params_;
};

/**
 * @brief 副オブジェクトの集合（参照で重複排除、挿入順）
 */
class SecondarySet {
public:
    /**
     * @return 新規追加なら true
     */
    bool add(const Secondary& secondary);

    const std::vector<Secondary>& items() const { return items_; }
    bool empty() const { return items_.empty(); }
    void clear() { items_.clear(); }

private:
    std::vector<Secondary> items_;
};

/**
 * @brief ルートオブジェクトごとの組み合わせ状態
 *
 * 描画（Renderer）が発見した組み合わせを記録し、生成器（Generator）が
 * 選択を適用して再描画する。リセットは reset / reset_chunks /
 * reset_params のみで行う。
 */
class StateContext {
public:
    StateContext() = default;

    // ===== プリセット =====

    /**
     * @brief 固定セレクタ（常に選択済み、探索しない）
     */
    void set_selector_presets(std::vector<StateItem> presets);

    /**
     * @brief 固定パラメータ値（常に適用、列挙しない）
     */
    void set_param_presets(std::vector<ParamItem> presets);

    // ===== リセット =====

    /**
     * @brief 全状態をリセットしてプリセットを再適用
     */
    void reset();

    /**
     * @brief ステートチャンクの選択と発見結果をリセット
     */
    void reset_chunks();

    /**
     * @brief パラメータの選択と発見結果をリセット
     */
    void reset_params();

    // ===== セレクタ =====

    /**
     * @brief セレクタの組み合わせを適用（プリセットは維持）
     */
    void set_selectors(const SelectorCombo& combo);
    std::optional<uint32_t> selector(uint32_t group) const;
    const SelectorCombo& applied_selectors() const { return applied_selectors_; }
    SelectorPaths& selector_paths() { return selector_paths_; }
    std::vector<SelectorCombo> selector_combos() const { return selector_paths_.combos(); }

    // ===== ステートチャンク =====

    void set_chunks(const ChunkCombo& combo);
    void clear_chunks();
    std::optional<uint32_t> chunk(uint32_t group) const;
    const std::optional<ChunkCombo>& applied_chunks() const { return applied_chunks_; }
    StateChunkSet& chunk_set() { return chunk_set_; }
    const StateChunkSet& chunk_set() const { return chunk_set_; }
    std::vector<ChunkCombo> chunk_combos() const;

    // ===== パラメータ =====

    void set_params(const ParamCombo& combo);
    std::optional<double> param(uint32_t id) const;
    bool is_param_preset(uint32_t id) const;
    const ParamCombo& applied_params() const { return applied_params_; }
    ParamSet& param_set() { return param_set_; }
    std::vector<ParamCombo> param_combos() const { return param_set_.combos(); }

    // ===== 副オブジェクト =====

    SecondarySet& secondaries() { return secondaries_; }

private:
    std::vector<StateItem> selector_presets_;
    std::vector<ParamItem> param_presets_;

    std::map<uint32_t, uint32_t> selectors_;  // group -> value（プリセット含む）
    SelectorCombo applied_selectors_;
    SelectorPaths selector_paths_;

    std::map<uint32_t, uint32_t> chunks_;
    std::optional<ChunkCombo> applied_chunks_;
    StateChunkSet chunk_set_;

    std::map<uint32_t, double> params_;
    ParamCombo applied_params_;
    ParamSet param_set_;

    SecondarySet secondaries_;
};

} // namespace hircgen

#endif // HIRCGEN_STATE_HPP

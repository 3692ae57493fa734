/**
 * @file generator.hpp
 * @brief 生成器（ルートごとに状態の組み合わせを探索して生成物を出力）
 */
#ifndef HIRCGEN_GENERATOR_HPP
#define HIRCGEN_GENERATOR_HPP

#include "hircgen/artifact.hpp"
#include "hircgen/node.hpp"
#include "hircgen/registry.hpp"
#include "hircgen/renderer.hpp"
#include "hircgen/state.hpp"
#include <set>
#include <string>
#include <vector>

namespace hircgen {

/**
 * @brief 生成器の設定
 */
struct GeneratorOptions {
    bool generate_unused = false;  // 通常生成の後に未使用オブジェクトも生成
    bool bank_order = false;       // 名前付き優先の並べ替えをせずバンク内の宣言順
    bool verbose = false;
    std::vector<StateItem> selector_presets;  // 固定セレクタ
    std::vector<ParamItem> param_presets;     // 固定パラメータ値
    std::vector<std::string> unused_types = builtin_unused_types();
};

/**
 * @brief 生成対象のフィルタ
 *
 * エントリは short id、表示名、型名のいずれか。
 */
class GeneratorFilter {
public:
    void add(const std::string& entry);

    bool active() const { return !entries_.empty(); }

    /**
     * @brief ノードがいずれかのエントリに一致するか
     */
    bool allow(const Node& node) const;

    bool generate_rest = false;  // フィルタ外のノードも後から生成
    bool skip_normal = false;    // 通常生成は描画のみで出力しない
    bool skip_unused = false;    // 未使用生成は描画のみで出力しない

private:
    std::set<std::string> entries_;
};

/**
 * @brief 生成統計
 */
struct GeneratorStats {
    size_t roots = 0;
    size_t renders = 0;
    size_t published = 0;
    size_t secondaries = 0;
};

/**
 * @brief 生成器
 *
 * ルートごとに次の順で組み合わせを探索する:
 * 1. 状態をリセットして基本描画（セレクタの組み合わせを発見）
 * 2. セレクタの組み合わせごとに再描画（ステートチャンクを発見）
 *    到達不能なチャンクを持つセレクタは後回しにし、到達可能な全分岐の後で処理
 * 3. ステートチャンクの組み合わせごとに再描画（パラメータを発見）
 * 4. パラメータの組み合わせごとに再描画し、生成物を出力
 * 5. 描画中に発見された副オブジェクトを個別に出力
 *
 * 各段階は次の段階の状態をリセットしてから再描画する。
 */
class Generator {
public:
    /**
     * @param banks 読み込まれたバンク（登録順 = 優先順）
     * @param registry 生成1回分のレジストリ
     * @param renderer 描画
     * @param sink 出力先
     */
    Generator(std::vector<Bank> banks, Registry& registry, Renderer& renderer,
              ArtifactSink& sink, GeneratorOptions options = GeneratorOptions());

    GeneratorFilter& filter() { return filter_; }

    /**
     * @brief セットアップ、通常生成、未使用生成を順に実行
     */
    void generate();

    /**
     * @brief 全バンクの全オブジェクトを登録
     */
    void setup();

    /**
     * @brief バンク順に通常生成
     */
    void write_normal();

    /**
     * @brief 未使用オブジェクトを型の優先順に生成
     */
    void write_unused();

    /**
     * @brief 1つのルートの全組み合わせを生成
     *
     * 例外発生時はルートの id とバンクを記録して再送出する。
     */
    void render_root(const NodePtr& root);

    /**
     * @brief バンク内のルート候補を生成順に並べる
     */
    std::vector<NodePtr> order_roots(const Bank& bank) const;

    const GeneratorStats& stats() const { return stats_; }

private:
    enum class ChunkPass { Reachable, Unreachable };

    void render_base(const NodePtr& root);
    void render_selectors(const NodePtr& root, const std::vector<SelectorCombo>& combos,
                          Artifact current);
    void render_chunks(const NodePtr& root, const std::vector<ChunkCombo>& combos,
                       Artifact current, ChunkPass pass);
    void render_params(const NodePtr& root, const std::vector<ParamCombo>& combos,
                       Artifact current);
    void render_last(Artifact artifact);
    void render_secondaries(const NodePtr& root);

    /**
     * @brief 現在の状態で新しい生成物を描画
     */
    Artifact begin_artifact(const NodePtr& root);

    std::string root_name(const Node& root) const;

    std::vector<Bank> banks_;
    Registry& registry_;
    Renderer& renderer_;
    ArtifactSink& sink_;
    GeneratorOptions options_;
    GeneratorFilter filter_;

    StateContext state_;
    std::set<std::string> root_types_;
    bool unused_mark_ = false;
    bool suppressed_ = false;
    GeneratorStats stats_;
};

} // namespace hircgen

#endif // HIRCGEN_GENERATOR_HPP

/**
 * @file renderer.hpp
 * @brief 描画インターフェースと組み込みのツリー描画
 */
#ifndef HIRCGEN_RENDERER_HPP
#define HIRCGEN_RENDERER_HPP

#include "hircgen/artifact.hpp"
#include "hircgen/hirc_object.hpp"
#include "hircgen/registry.hpp"
#include "hircgen/state.hpp"
#include <optional>
#include <string>
#include <vector>

namespace hircgen {

/**
 * @brief 描画の基底クラス
 *
 * 1回の描画でルートから出力を組み立てると同時に、発見した組み合わせを
 * StateContext に記録する。
 */
class Renderer {
public:
    virtual ~Renderer() = default;

    /**
     * @brief 現在の状態でルートを1回描画
     * @param root ルートノード
     * @param state 組み合わせ状態（選択の参照と発見結果の記録）
     * @param out 出力先の生成物
     */
    virtual void render(const NodePtr& root, StateContext& state, Artifact& out) = 0;

    /**
     * @brief 生成対象とするルートの型名
     */
    virtual std::vector<std::string> root_types() const = 0;
};

/**
 * @brief 1回の描画の作業領域（HircObject::render に渡される）
 */
class RenderScope {
public:
    RenderScope(Registry& registry, StateContext& state, Artifact& out);

    Registry& registry() { return registry_; }
    StateContext& state() { return state_; }

    /**
     * @brief 現在の深さで行を出力
     */
    void line(const std::string& text);

    /**
     * @brief オブジェクトを1段深く描画（ステートチャンク・RTPC を処理してから本体）
     * @throws std::runtime_error 参照が循環している場合
     */
    void render_object(const HircObject& obj);

    /**
     * @brief 参照先を解決して描画
     * @return 参照先が見つかれば true
     */
    bool render_ref(uint32_t sid, const HircObject& caller,
                    const std::optional<TargetBank>& target = std::nullopt);

    /**
     * @brief 副オブジェクトを登録（参照先は使用済みになるが描画はしない）
     */
    void add_secondary(const std::string& kind, uint32_t sid, const HircObject& caller);

private:
    void apply_statechunks(const HircObject& obj);
    void apply_rtpcs(const HircObject& obj);

    Registry& registry_;
    StateContext& state_;
    Artifact& out_;
    int depth_ = 0;
    std::vector<const HircObject*> stack_;
};

/**
 * @brief 組み込みオブジェクトをたどるツリー描画
 */
class TreeRenderer : public Renderer {
public:
    explicit TreeRenderer(Registry& registry);

    void render(const NodePtr& root, StateContext& state, Artifact& out) override;

    std::vector<std::string> root_types() const override;

private:
    Registry& registry_;
};

} // namespace hircgen

#endif // HIRCGEN_RENDERER_HPP

/**
 * @file containers.hpp
 * @brief サウンド系コンテナ（スイッチ、ランダム/シーケンス、レイヤー）とサウンド
 */
#ifndef HIRCGEN_OBJECTS_CONTAINERS_HPP
#define HIRCGEN_OBJECTS_CONTAINERS_HPP

#include "hircgen/hirc_object.hpp"
#include <string>
#include <vector>

namespace hircgen {

/**
 * @brief スイッチコンテナ
 *
 * グループの現在値に対応するケースの子だけを描画する。グループが未選択なら
 * 全ケースを探索し、セレクタのパスとして記録する。
 *
 * ノード形式:
 *   CAkSwitchCntr { sid ID; group ID name="..."; case VALUE name="..." { child ID; } }
 */
class SwitchContainerObject : public HircObject {
public:
    struct Case {
        StateItem item;
        std::vector<uint32_t> children;
    };

    std::string name() const override { return "CAkSwitchCntr"; }
    std::string header() const override;
    std::vector<uint32_t> child_refs() const override;
    void render(RenderScope& scope) const override;

    uint32_t group() const { return group_; }
    const std::vector<Case>& cases() const { return cases_; }

protected:
    void parse_props(const Node& node) override;

private:
    void render_case(RenderScope& scope, const Case& c) const;

    uint32_t group_ = 0;
    std::string group_name_;
    std::vector<Case> cases_;
};

/**
 * @brief 子オブジェクトを順に描画するコンテナの共通部分
 */
class ChildListObject : public HircObject {
public:
    std::vector<uint32_t> child_refs() const override { return children_; }
    void render(RenderScope& scope) const override;

protected:
    void parse_props(const Node& node) override;

    /**
     * @brief "child" 子ノードを読む
     */
    void parse_children(const Node& node);

    std::vector<uint32_t> children_;
};

/**
 * @brief ランダム/シーケンスコンテナ
 *
 * ノード形式: CAkRanSeqCntr mode="random"|"sequence" { sid ID; child ID; ... }
 */
class RanSeqContainerObject : public ChildListObject {
public:
    std::string name() const override { return "CAkRanSeqCntr"; }
    std::string header() const override;

protected:
    void parse_props(const Node& node) override;

private:
    std::string mode_ = "random";
};

/**
 * @brief レイヤーコンテナ（全ての子を同時再生）
 */
class LayerContainerObject : public ChildListObject {
public:
    std::string name() const override { return "CAkLayerCntr"; }
};

/**
 * @brief サウンド（1つのソース）
 *
 * ノード形式: CAkSound { sid ID; source ID [name="..."]; }
 */
class SoundObject : public HircObject {
public:
    std::string name() const override { return "CAkSound"; }
    void render(RenderScope& scope) const override;

    uint32_t source() const { return source_; }

protected:
    void parse_props(const Node& node) override;

private:
    uint32_t source_ = 0;
    std::string source_name_;
};

} // namespace hircgen

#endif // HIRCGEN_OBJECTS_CONTAINERS_HPP

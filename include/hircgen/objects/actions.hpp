/**
 * @file actions.hpp
 * @brief イベントとアクション
 */
#ifndef HIRCGEN_OBJECTS_ACTIONS_HPP
#define HIRCGEN_OBJECTS_ACTIONS_HPP

#include "hircgen/hirc_object.hpp"
#include "hircgen/registry.hpp"
#include <optional>
#include <vector>

namespace hircgen {

/**
 * @brief イベント（アクションの並び）
 *
 * ノード形式: CAkEvent { sid ID name="..."; action ID; ... }
 */
class EventObject : public HircObject {
public:
    std::string name() const override { return "CAkEvent"; }
    std::vector<uint32_t> child_refs() const override { return actions_; }
    void render(RenderScope& scope) const override;

protected:
    void parse_props(const Node& node) override;

private:
    std::vector<uint32_t> actions_;
};

/**
 * @brief 再生アクション
 *
 * ノード形式: CAkActionPlay { sid ID; target ID [bank=N] [bankname="..."]; }
 * bank 属性は参照先のバンクを宣言する（参照切れの分類に使用）。
 */
class ActionPlayObject : public HircObject {
public:
    std::string name() const override { return "CAkActionPlay"; }
    std::vector<uint32_t> child_refs() const override { return {target_}; }
    void render(RenderScope& scope) const override;

    const std::optional<TargetBank>& target_bank() const { return target_bank_; }

protected:
    void parse_props(const Node& node) override;

private:
    uint32_t target_ = 0;
    std::optional<TargetBank> target_bank_;
};

} // namespace hircgen

#endif // HIRCGEN_OBJECTS_ACTIONS_HPP

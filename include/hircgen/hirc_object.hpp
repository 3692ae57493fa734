/**
 * @file hirc_object.hpp
 * @brief 階層オブジェクトの基底クラス（構築契約）とオブジェクトテーブル
 */
#ifndef HIRCGEN_HIRC_OBJECT_HPP
#define HIRCGEN_HIRC_OBJECT_HPP

#include "hircgen/node.hpp"
#include "hircgen/state.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace hircgen {

// Forward declaration
class Registry;
class RenderScope;

/**
 * @brief オブジェクトに付くステートチャンク（グループと対象の状態値）
 */
struct StateChunk {
    uint32_t group = 0;
    std::string group_name;
    std::vector<StateItem> states;
};

/**
 * @brief オブジェクトに付くパラメータ（RTPC）とバケット値
 */
struct ParamCurve {
    uint32_t id = 0;
    std::string name;
    std::vector<double> points;
};

/**
 * @brief 解決済み階層オブジェクトの基底クラス
 *
 * ソースノード1つにつき1回だけ構築される。構築は2段階:
 * bind(registry) でレジストリに結び付け、parse(node) でノードを読む。
 * parse は不正なデータに対して例外を送出してよい。
 */
class HircObject {
public:
    virtual ~HircObject() = default;

    /**
     * @brief オブジェクトの型名
     */
    virtual std::string name() const = 0;

    /**
     * @brief レジストリへの結び付け（構築の第1段階）
     */
    void bind(Registry& registry);

    /**
     * @brief ノードを解析（構築の第2段階）
     *
     * 共通部分（sid、ステートチャンク、RTPC）を読んだ後 parse_props() を呼ぶ。
     */
    void parse(const Node& node);

    /**
     * @brief 子オブジェクトの short id
     *
     * 未使用判定で子のない空オブジェクトを除外するのに使う。
     */
    virtual std::vector<uint32_t> child_refs() const { return {}; }

    /**
     * @brief 描画時の見出し行
     */
    virtual std::string header() const;

    /**
     * @brief 現在の状態で本体（子オブジェクトなど）を描画
     */
    virtual void render(RenderScope& scope) const = 0;

    uint32_t sid() const { return sid_; }
    uint32_t bank_id() const { return bank_id_; }
    Reference ref() const { return Reference{bank_id_, sid_}; }
    const std::string& display_name() const { return display_name_; }

    /**
     * @brief 表示名（なければ short id）
     */
    std::string label() const;

    const std::vector<StateChunk>& statechunks() const { return statechunks_; }
    const std::vector<ParamCurve>& rtpcs() const { return rtpcs_; }

protected:
    /**
     * @brief 型固有の解析
     */
    virtual void parse_props(const Node& node) = 0;

    /**
     * @brief known 以外の子ノード型を未調査プロパティとして報告
     *
     * sid / statechunk / rtpc は共通部分として常に既知。
     */
    void report_unknown_children(const Node& node, const std::set<std::string>& known) const;

    /**
     * @brief 必須の整数値を取得（なければ例外）
     */
    uint32_t require_id(const Node& node) const;

    Registry* registry_ = nullptr;
    uint32_t sid_ = 0;
    uint32_t bank_id_ = 0;
    std::string display_name_;

private:
    void parse_statechunks(const Node& node);
    void parse_rtpcs(const Node& node);

    std::vector<StateChunk> statechunks_;
    std::vector<ParamCurve> rtpcs_;
};

using HircObjectPtr = std::shared_ptr<HircObject>;

/**
 * @brief 未対応の型（何も描画しない）
 */
class UnsupportedObject : public HircObject {
public:
    explicit UnsupportedObject(std::string type) : type_(std::move(type)) {}

    std::string name() const override { return type_; }
    void render(RenderScope&) const override {}

protected:
    void parse_props(const Node& node) override;

private:
    std::string type_;
};

/**
 * @brief 型名 -> オブジェクト生成関数のテーブル
 */
using ObjectBuilder = HircObjectPtr (*)();
using ObjectTable = std::map<std::string, ObjectBuilder>;

/**
 * @brief 組み込み型のテーブル（objects/builtin.cpp で定義）
 */
const ObjectTable& builtin_object_table();

/**
 * @brief 組み込み描画のルート型
 */
const std::vector<std::string>& builtin_root_types();

/**
 * @brief 未使用検出の対象型（優先順）
 *
 * 上位の型を先に描画すると下位の型が使用済みになるため順序が重要。
 */
const std::vector<std::string>& builtin_unused_types();

/**
 * @brief 子がなければ未使用として報告しない型（無音セグメントなど）
 */
const std::set<std::string>& builtin_silent_types();

} // namespace hircgen

#endif // HIRCGEN_HIRC_OBJECT_HPP

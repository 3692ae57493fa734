/**
 * @file registry.hpp
 * @brief バンク横断の参照レジストリ（識別解決、解決済みオブジェクトのキャッシュ、診断）
 */
#ifndef HIRCGEN_REGISTRY_HPP
#define HIRCGEN_REGISTRY_HPP

#include "hircgen/hirc_object.hpp"
#include "hircgen/node.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace hircgen {

/**
 * @brief 参照側が宣言した対象バンク
 */
struct TargetBank {
    uint32_t id = 0;
    std::string name;  // 空なら id を表示に使う
};

/**
 * @brief 参照レジストリ
 *
 * 生成1回につき1つ作られ、セットアップで全バンクのオブジェクトを登録した後は
 * 描画中に読まれ続ける（クリアや再構築はしない）。
 *
 * ソースノードはレジストリ内で安定した整数ハンドルを持ち、解決済みオブジェクトの
 * キャッシュと使用フラグはハンドルで管理する。同じ (bank, id) を持つ別バンクの
 * ノードは別オブジェクトとして扱う。
 *
 * 参照切れ・重複登録・曖昧な参照は例外にせず診断として蓄積する。
 * 構築中（HircObject::parse）の例外のみ呼び出し元へ伝播する。
 */
class Registry {
public:
    /**
     * @brief 組み込み型テーブルで作成
     */
    Registry();

    /**
     * @brief 型テーブルを指定して作成
     */
    explicit Registry(ObjectTable table);

    // ===== バンク =====

    /**
     * @brief 生成に参加するバンクを記録
     */
    void add_loaded_bank(uint32_t bank_id, const std::string& filename);

    bool is_bank_loaded(uint32_t bank_id) const;

    /**
     * @brief バンクのファイル名（未登録なら "?"）
     */
    std::string bank_name(uint32_t bank_id) const;

    // ===== 登録と解決 =====

    /**
     * @brief ノードを登録
     *
     * 同じ (bank, id) が登録済みなら無視する（先勝ち）。
     *
     * @return 新規登録なら true
     */
    bool register_node(uint32_t bank_id, uint32_t sid, NodePtr node);

    /**
     * @brief (bank, id) からノードを解決
     *
     * 同一バンクで見つからなければ他バンクを探す。候補が複数バンクにあれば
     * id を曖昧として記録し、最初に登録された候補を返す。
     *
     * @return 見つからなければ nullptr
     */
    NodePtr resolve(uint32_t bank_id, uint32_t sid);

    /**
     * @brief 参照から解決済みオブジェクトを取得
     *
     * 見つからない場合は参照切れとして3種類のいずれか1つに分類する。
     * target があればそのバンクで探す。
     *
     * @param caller 参照元（ログ用）
     * @param target 参照側が宣言した対象バンク
     * @return 見つからなければ nullptr（例外は送出しない）
     */
    HircObjectPtr get_object(uint32_t bank_id, uint32_t sid, const Reference& caller,
                             const std::optional<TargetBank>& target = std::nullopt);

    /**
     * @brief ノードから解決済みオブジェクトを構築（キャッシュ済みならそれを返す）
     *
     * 初回は型テーブルで生成し bind → parse を行う。使用済みとしてマークする。
     */
    HircObjectPtr build(const NodePtr& node);

    /**
     * @brief 使用済みマークを付けずに構築（未使用判定用）
     */
    HircObjectPtr peek(const NodePtr& node);

    /**
     * @brief ノードの解決済みオブジェクトが使用済みか
     */
    bool is_used(const Node& node) const;

    /**
     * @brief ノードが登録されたバンク（未登録なら 0）
     */
    uint32_t bank_of(const Node& node) const;

    // ===== 未使用検出 =====

    /**
     * @brief 指定型に未使用オブジェクトがあるか
     */
    bool has_unused(const std::vector<std::string>& types);

    /**
     * @brief 指定型の未使用ノード一覧（登録順）
     */
    std::vector<NodePtr> list_unused(const std::string& type);

    // ===== 診断 =====

    const std::set<Reference>& missing_loaded() const { return missing_loaded_; }
    const std::set<Reference>& missing_others() const { return missing_others_; }
    const std::set<Reference>& missing_unknown() const { return missing_unknown_; }
    const std::set<std::string>& missing_banks() const { return missing_banks_; }
    const std::set<uint32_t>& ambiguous_ids() const { return ambiguous_ids_; }
    const std::set<std::string>& unknown_props() const { return unknown_props_; }
    size_t transition_objects() const { return transition_objects_; }

    void report_unknown_prop(const std::string& prop);
    void report_transition_object() { transition_objects_++; }

    size_t node_count() const { return nodes_.size(); }
    size_t object_count() const { return object_count_; }

    void set_verbose(bool verbose) { verbose_ = verbose; }

private:
    /**
     * @brief ノードのハンドルを取得（未知ならハンドルを割り当てる）
     */
    size_t handle_of(const NodePtr& node, uint32_t bank_id);

    HircObjectPtr build_handle(size_t handle, bool mark_used);

    /**
     * @brief 未使用として数えるか（空オブジェクトは除外）
     */
    bool counts_as_unused(size_t handle);

    void record_missing(uint32_t bank_id, uint32_t sid, const Reference& caller,
                        const std::optional<TargetBank>& target);

    ObjectTable table_;
    std::set<std::string> silent_types_;

    // ハンドル -> ノード / バンク / 解決済みオブジェクト / 使用フラグ
    std::vector<NodePtr> nodes_;
    std::vector<uint32_t> node_banks_;
    std::vector<HircObjectPtr> objects_;
    std::vector<bool> used_;
    std::unordered_map<const Node*, size_t> handles_;
    size_t object_count_ = 0;

    std::map<Reference, size_t> ref_to_handle_;
    std::map<uint32_t, std::vector<Reference>> id_to_refs_;  // 登録順
    std::map<std::string, std::vector<size_t>> type_to_handles_;

    std::map<uint32_t, std::string> loaded_banks_;

    std::set<Reference> missing_loaded_;   // 読み込み済みバンクにない（残骸）
    std::set<Reference> missing_others_;   // 未読み込みバンクにある
    std::set<Reference> missing_unknown_;  // バンク不明
    std::set<std::string> missing_banks_;
    std::set<uint32_t> ambiguous_ids_;
    std::set<std::string> unknown_props_;
    size_t transition_objects_ = 0;

    bool verbose_ = false;
};

} // namespace hircgen

#endif // HIRCGEN_REGISTRY_HPP

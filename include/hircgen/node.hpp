/**
 * @file node.hpp
 * @brief バンク解析結果のノード木（不変）とバンク定義
 */
#ifndef HIRCGEN_NODE_HPP
#define HIRCGEN_NODE_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace hircgen {

/**
 * @brief ノードのスカラー値（なし / 整数 / 実数 / 文字列）
 */
using Value = std::variant<std::monostate, int64_t, double, std::string>;

class Node;
using NodePtr = std::shared_ptr<Node>;

/**
 * @brief 解析済み階層オブジェクトの1ノード
 *
 * 型名、任意のスカラー値、属性、子ノードを持つ。
 * パーサーが構築した後は変更しない。
 */
class Node {
public:
    explicit Node(std::string type);

    const std::string& type() const { return type_; }

    /**
     * @brief ノード自身の値
     */
    const Value& value() const { return value_; }
    bool has_value() const { return !std::holds_alternative<std::monostate>(value_); }
    std::optional<int64_t> int_value() const;
    std::optional<double> number_value() const;

    /**
     * @brief 属性を取得
     * @return 存在しなければ nullptr
     */
    const Value* attr(const std::string& key) const;
    std::optional<int64_t> int_attr(const std::string& key) const;
    std::optional<std::string> str_attr(const std::string& key) const;
    const std::map<std::string, Value>& attrs() const { return attrs_; }

    const std::vector<NodePtr>& children() const { return children_; }

    /**
     * @brief 指定型の最初の直下子ノード
     */
    NodePtr find_child(const std::string& type) const;

    /**
     * @brief 指定型の直下子ノードを全て取得（宣言順）
     */
    std::vector<NodePtr> find_children(const std::string& type) const;

    /**
     * @brief 自己識別子ノード（"sid" 子ノード）の short id
     */
    std::optional<uint32_t> sid() const;

    /**
     * @brief 自己識別子ノードの表示名（"sid" の name 属性）
     */
    std::optional<std::string> display_name() const;

    // ===== 構築（パーサー専用） =====

    void set_value(Value value) { value_ = std::move(value); }
    void set_attr(const std::string& key, Value value);
    void add_child(NodePtr child);

private:
    std::string type_;
    Value value_;
    std::map<std::string, Value> attrs_;
    std::vector<NodePtr> children_;
};

/**
 * @brief 階層オブジェクトの参照（バンクID + short id）
 *
 * short id はバンクをまたいで一意とは限らない。
 */
struct Reference {
    uint32_t bank_id = 0;
    uint32_t sid = 0;

    bool operator==(const Reference& other) const {
        return bank_id == other.bank_id && sid == other.sid;
    }
    bool operator!=(const Reference& other) const { return !(*this == other); }
    bool operator<(const Reference& other) const {
        if (bank_id != other.bank_id) return bank_id < other.bank_id;
        return sid < other.sid;
    }
};

/**
 * @brief 読み込まれたバンク
 */
struct Bank {
    uint32_t id = 0;
    std::string filename;
    std::vector<NodePtr> items;  // トップレベルの階層オブジェクト
};

/**
 * @brief Value を表示用文字列に変換
 */
std::string value_to_string(const Value& value);

} // namespace hircgen

#endif // HIRCGEN_NODE_HPP

/**
 * @file parser_context.hpp
 * @brief バンクダンプパーサーの状態（bison のアクションから使用）
 */
#ifndef HIRCGEN_BANK_PARSER_CONTEXT_HPP
#define HIRCGEN_BANK_PARSER_CONTEXT_HPP

#include "hircgen/node.hpp"
#include <memory>
#include <string>
#include <vector>

/**
 * @brief 構築中のノード木
 *
 * open_node / close_node の入れ子でノード木を組み立てる。
 */
struct ParserContext {
    std::vector<hircgen::NodePtr> roots;
    std::vector<hircgen::NodePtr> stack;
    bool has_error = false;
    std::string error_message;

    void open_node(const std::string& type) {
        auto node = std::make_shared<hircgen::Node>(type);
        if (stack.empty()) {
            roots.push_back(node);
        } else {
            stack.back()->add_child(node);
        }
        stack.push_back(node);
    }

    void set_value(hircgen::Value value) {
        stack.back()->set_value(std::move(value));
    }

    void set_attr(const std::string& key, hircgen::Value value) {
        stack.back()->set_attr(key, std::move(value));
    }

    void close_node() {
        stack.pop_back();
    }
};

#endif // HIRCGEN_BANK_PARSER_CONTEXT_HPP

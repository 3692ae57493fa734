/**
 * @file bank_parser.hpp
 * @brief バンクダンプ（テキスト形式）パーサーのインターフェース
 */
#ifndef HIRCGEN_BANK_PARSER_HPP
#define HIRCGEN_BANK_PARSER_HPP

#include "hircgen/node.hpp"
#include <cstdio>
#include <string>
#include <vector>

// Forward declarations for flex/bison
typedef void* yyscan_t;
struct ParserContext;

// Flex functions
int yylex_init(yyscan_t* scanner);
int yylex_destroy(yyscan_t scanner);
void yyset_in(FILE* in, yyscan_t scanner);
struct yy_buffer_state;
typedef struct yy_buffer_state* YY_BUFFER_STATE;
YY_BUFFER_STATE yy_scan_string(const char* str, yyscan_t scanner);
void yy_delete_buffer(YY_BUFFER_STATE buffer, yyscan_t scanner);

// Bison function
int yyparse(yyscan_t scanner, ParserContext* ctx);

namespace hircgen {
namespace bank {

/**
 * @brief ファイルからバンクを読む
 *
 * トップレベルは "bank <id> file=\"...\" { ... }" のみ。
 *
 * @throws std::runtime_error ファイルが開けない、または構文エラー
 */
std::vector<Bank> parse_file(const std::string& filename);

/**
 * @brief 文字列からバンクを読む
 */
std::vector<Bank> parse_string(const std::string& input);

} // namespace bank
} // namespace hircgen

#endif // HIRCGEN_BANK_PARSER_HPP

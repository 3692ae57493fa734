#include "bank_parser.hpp"
#include "parser.hpp"
#include <limits>
#include <stdexcept>
#include <cstdio>

namespace hircgen {
namespace bank {

namespace {

std::vector<Bank> to_banks(const ParserContext& ctx) {
    std::vector<Bank> banks;
    for (const auto& root : ctx.roots) {
        if (root->type() != "bank") {
            throw std::runtime_error("Parse error: top-level node must be 'bank', got '" +
                                     root->type() + "'");
        }
        auto id = root->int_value();
        if (!id || *id <= 0 || *id > static_cast<int64_t>(std::numeric_limits<uint32_t>::max())) {
            throw std::runtime_error("Parse error: bank requires a positive integer id");
        }

        Bank bank;
        bank.id = static_cast<uint32_t>(*id);
        bank.filename = root->str_attr("file").value_or(std::to_string(bank.id) + ".bnk");
        bank.items = root->children();
        banks.push_back(std::move(bank));
    }
    return banks;
}

}  // namespace

std::vector<Bank> parse_file(const std::string& filename) {
    FILE* file = fopen(filename.c_str(), "r");
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filename);
    }

    yyscan_t scanner;
    yylex_init(&scanner);
    yyset_in(file, scanner);

    ParserContext ctx;
    int result = yyparse(scanner, &ctx);

    yylex_destroy(scanner);
    fclose(file);

    if (result != 0 || ctx.has_error) {
        throw std::runtime_error("Parse error: " + filename + ": " + ctx.error_message);
    }

    return to_banks(ctx);
}

std::vector<Bank> parse_string(const std::string& input) {
    yyscan_t scanner;
    yylex_init(&scanner);

    YY_BUFFER_STATE buffer = yy_scan_string(input.c_str(), scanner);

    ParserContext ctx;
    int result = yyparse(scanner, &ctx);

    yy_delete_buffer(buffer, scanner);
    yylex_destroy(scanner);

    if (result != 0 || ctx.has_error) {
        throw std::runtime_error("Parse error: " + ctx.error_message);
    }

    return to_banks(ctx);
}

} // namespace bank
} // namespace hircgen

/**
 * @file report.hpp
 * @brief 生成終了時のレポート
 */
#ifndef HIRCGEN_REPORT_HPP
#define HIRCGEN_REPORT_HPP

#include "hircgen/artifact.hpp"
#include "hircgen/generator.hpp"
#include "hircgen/registry.hpp"
#include <iosfwd>

namespace hircgen {

/**
 * @brief 参照切れ、未読み込みバンク、曖昧な id、未調査プロパティと出力数を書き出す
 */
void write_report(std::ostream& out, const Registry& registry,
                  const GeneratorStats& generator_stats, const SinkStats& sink_stats);

} // namespace hircgen

#endif // HIRCGEN_REPORT_HPP

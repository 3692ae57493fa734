/**
 * @file artifact.hpp
 * @brief 生成物（1つの状態組み合わせに対応する再生記述）と出力先
 */
#ifndef HIRCGEN_ARTIFACT_HPP
#define HIRCGEN_ARTIFACT_HPP

#include "hircgen/node.hpp"
#include "hircgen/state.hpp"
#include <cstddef>
#include <iosfwd>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace hircgen {

/**
 * @brief 生成物
 *
 * 描画で出力された行と、適用された状態、出力先へのタグを持つ。
 */
class Artifact {
public:
    Artifact() = default;
    explicit Artifact(std::string root_name);

    const std::string& root_name() const { return root_name_; }

    /**
     * @brief 行を追加
     * @param depth インデントの深さ
     */
    void line(int depth, const std::string& text);
    const std::vector<std::string>& lines() const { return lines_; }

    /**
     * @brief 全行を改行で連結した本文（重複判定に使用）
     */
    std::string body() const;

    // ===== 適用された状態 =====

    void set_state(const SelectorCombo& selectors, const std::optional<ChunkCombo>& chunks,
                   const ParamCombo& params);
    const SelectorCombo& selectors() const { return selectors_; }
    const std::optional<ChunkCombo>& chunks() const { return chunks_; }
    const ParamCombo& params() const { return params_; }

    bool is_unreachable() const { return chunks_ && chunks_->unreachable; }

    // ===== タグ =====

    void set_caller(const Reference& caller) { caller_ = caller; }
    const std::optional<Reference>& caller() const { return caller_; }

    void set_secondary(const Secondary& secondary) { secondary_ = secondary; }
    const std::optional<Secondary>& secondary() const { return secondary_; }

    void set_default_chunks(bool flag) { default_chunks_ = flag; }
    bool is_default_chunks() const { return default_chunks_; }

    void set_unused(bool flag) { unused_ = flag; }
    bool is_unused() const { return unused_; }

    /**
     * @brief 描画のみ行い出力しない
     */
    void set_suppressed(bool flag) { suppressed_ = flag; }
    bool is_suppressed() const { return suppressed_; }

    /**
     * @brief 出力名: "<root> (g=v) {s}=(g=v) {p=v}"
     */
    std::string describe() const;

private:
    std::string root_name_;
    std::vector<std::string> lines_;

    SelectorCombo selectors_;
    std::optional<ChunkCombo> chunks_;
    ParamCombo params_;

    std::optional<Reference> caller_;
    std::optional<Secondary> secondary_;
    bool default_chunks_ = false;
    bool unused_ = false;
    bool suppressed_ = false;
};

/**
 * @brief 生成物の出力先（重複排除、命名、出力を担当）
 */
class ArtifactSink {
public:
    virtual ~ArtifactSink() = default;

    virtual void publish(Artifact artifact) = 0;
};

/**
 * @brief 出力統計
 */
struct SinkStats {
    size_t created = 0;
    size_t duplicates = 0;
    size_t unused = 0;
    size_t secondaries = 0;
    size_t suppressed = 0;
};

/**
 * @brief テキスト出力先
 *
 * 本文が同じ生成物は最初の1つだけ出力する。出力ディレクトリが指定されれば
 * 生成物ごとに "<name>.txtp" を書き、なければストリームに書く。
 */
class TextSink : public ArtifactSink {
public:
    /**
     * @brief ストリームに書く
     */
    explicit TextSink(std::ostream& out);

    /**
     * @brief ディレクトリにファイルとして書く
     */
    explicit TextSink(std::string outdir);

    void publish(Artifact artifact) override;

    const SinkStats& stats() const { return stats_; }

    /**
     * @brief 出力した名前（出力順）
     */
    const std::vector<std::string>& names() const { return names_; }

private:
    std::string unique_name(const std::string& name);
    std::string render_text(const Artifact& artifact) const;
    void write_file(const std::string& name, const std::string& text) const;

    std::ostream* out_ = nullptr;
    std::string outdir_;

    std::set<std::string> bodies_;
    std::map<std::string, size_t> name_counts_;
    std::vector<std::string> names_;
    SinkStats stats_;
};

} // namespace hircgen

#endif // HIRCGEN_ARTIFACT_HPP

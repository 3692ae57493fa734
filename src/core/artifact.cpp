#include "hircgen/artifact.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace hircgen {

Artifact::Artifact(std::string root_name)
    : root_name_(std::move(root_name)) {}

void Artifact::line(int depth, const std::string& text) {
    lines_.push_back(std::string(static_cast<size_t>(depth) * 2, ' ') + text);
}

std::string Artifact::body() const {
    std::string result;
    for (const auto& l : lines_) {
        result += l;
        result += '\n';
    }
    return result;
}

void Artifact::set_state(const SelectorCombo& selectors, const std::optional<ChunkCombo>& chunks,
                         const ParamCombo& params) {
    selectors_ = selectors;
    chunks_ = chunks;
    params_ = params;
}

std::string Artifact::describe() const {
    std::string name;
    if (unused_) {
        name += "[unused] ";
    }
    name += root_name_;

    if (secondary_) {
        name += " {" + secondary_->kind + "}";
    }

    for (const auto& item : selectors_) {
        name += " (" + item.describe() + ")";
    }

    if (chunks_) {
        name += " {s}=(";
        for (size_t i = 0; i < chunks_->items.size(); ++i) {
            if (i) name += ",";
            name += chunks_->items[i].describe();
        }
        name += ")";
        if (chunks_->unreachable) {
            name += " {unreachable}";
        }
    } else if (default_chunks_) {
        name += " {s}=-";
    }

    for (const auto& param : params_) {
        name += " {" + param.describe() + "}";
    }
    return name;
}

// ============================================================================
// TextSink
// ============================================================================

TextSink::TextSink(std::ostream& out)
    : out_(&out) {}

TextSink::TextSink(std::string outdir)
    : outdir_(std::move(outdir)) {}

void TextSink::publish(Artifact artifact) {
    // 本文が同じなら重複（命名は最初のものを優先）
    if (!bodies_.insert(artifact.body()).second) {
        stats_.duplicates++;
        return;
    }

    if (artifact.is_suppressed()) {
        stats_.suppressed++;
        return;
    }

    stats_.created++;
    if (artifact.is_unused()) stats_.unused++;
    if (artifact.secondary()) stats_.secondaries++;

    std::string name = unique_name(artifact.describe());
    names_.push_back(name);

    std::string text = render_text(artifact);
    if (out_) {
        *out_ << "== " << name << "\n" << text << "\n";
    } else {
        write_file(name, text);
    }
}

std::string TextSink::unique_name(const std::string& name) {
    size_t count = ++name_counts_[name];
    if (count == 1) {
        return name;
    }
    return name + " [" + std::to_string(count) + "]";
}

std::string TextSink::render_text(const Artifact& artifact) const {
    std::string text = "# " + artifact.describe() + "\n";
    if (artifact.caller()) {
        text += "# caller: " + std::to_string(artifact.caller()->bank_id) + "/" +
                std::to_string(artifact.caller()->sid) + "\n";
    }
    if (artifact.is_default_chunks()) {
        text += "# default state\n";
    }
    if (artifact.is_unreachable()) {
        text += "# unreachable state\n";
    }
    text += artifact.body();
    return text;
}

void TextSink::write_file(const std::string& name, const std::string& text) const {
    std::string filename = name;
    for (auto& c : filename) {
        switch (c) {
            case '/': case '\\': case ':': case '*': case '?':
            case '"': case '<': case '>': case '|':
                c = '_';
                break;
            default:
                break;
        }
    }

    std::filesystem::path dir(outdir_);
    std::filesystem::create_directories(dir);
    std::filesystem::path path = dir / (filename + ".txtp");

    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path.string());
    }
    file << text;
}

} // namespace hircgen

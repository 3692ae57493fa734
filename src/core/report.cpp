#include "hircgen/report.hpp"
#include <ostream>

namespace hircgen {

namespace {

template<typename Container>
void write_list(std::ostream& out, const Container& items) {
    bool first = true;
    for (const auto& item : items) {
        if (!first) out << ", ";
        first = false;
        out << item;
    }
    out << "\n";
}

}  // namespace

void write_report(std::ostream& out, const Registry& registry,
                  const GeneratorStats& generator_stats, const SinkStats& sink_stats) {
    out << "[hircgen] created " << sink_stats.created << " artifacts";
    if (sink_stats.duplicates > 0) out << ", " << sink_stats.duplicates << " duplicates";
    if (sink_stats.unused > 0) out << ", " << sink_stats.unused << " unused";
    if (sink_stats.secondaries > 0) out << ", " << sink_stats.secondaries << " stingers/transitions";
    if (sink_stats.suppressed > 0) out << ", " << sink_stats.suppressed << " skipped";
    out << " (" << generator_stats.roots << " roots, " << generator_stats.renders << " renders)\n";

    if (!registry.missing_loaded().empty()) {
        out << "[hircgen] WARNING: missing " << registry.missing_loaded().size()
            << " nodes in loaded banks (ignore?)\n";
    }
    if (!registry.missing_others().empty()) {
        out << "[hircgen] WARNING: missing " << registry.missing_others().size()
            << " nodes in other banks (load more banks?)\n";
        out << "[hircgen]   missing banks: ";
        write_list(out, registry.missing_banks());
    }
    if (!registry.missing_unknown().empty()) {
        out << "[hircgen] WARNING: missing " << registry.missing_unknown().size()
            << " nodes in unknown banks (load more banks?)\n";
    }
    if (!registry.ambiguous_ids().empty()) {
        out << "[hircgen] WARNING: " << registry.ambiguous_ids().size()
            << " ids found in multiple banks (first loaded bank used): ";
        write_list(out, registry.ambiguous_ids());
    }
    if (!registry.unknown_props().empty()) {
        out << "[hircgen] WARNING: unexamined properties: ";
        write_list(out, registry.unknown_props());
    }
    if (registry.transition_objects() > 0) {
        out << "[hircgen] transition objects: " << registry.transition_objects() << "\n";
    }
}

} // namespace hircgen

#include <catch2/catch_test_macros.hpp>
#include "hircgen/generator.hpp"
#include "hircgen/registry.hpp"
#include "hircgen/renderer.hpp"
#include "hircgen/report.hpp"
#include "bank_parser.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace hircgen;

namespace {

// Parses a dump and runs a full generation into a text stream
struct Run {
    explicit Run(const std::string& dump, GeneratorOptions options = GeneratorOptions())
        : renderer(registry)
        , sink(out)
        , generator(bank::parse_string(dump), registry, renderer, sink, std::move(options)) {}

    Registry registry;
    TreeRenderer renderer;
    std::ostringstream out;
    TextSink sink;
    Generator generator;
};

bool contains(const std::string& text, const std::string& part) {
    return text.find(part) != std::string::npos;
}

}  // namespace

// ============================================================================
// Tree rendering
// ============================================================================

TEST_CASE("TreeRenderer expands switch cases", "[objects][switch]") {
    const std::string dump = R"(
bank 1 file="base.bnk" {
    CAkEvent { sid 100 name="Play_Step"; action 200 }
    CAkActionPlay { sid 200; target 300 }
    CAkSwitchCntr {
        sid 300
        group 10 name="surface"
        case 1 name="grass" { child 400 }
        case 2 name="stone" { child 401 }
    }
    CAkSound { sid 400; source 5000 name="grass.wem" }
    CAkSound { sid 401; source 5001 }
    CAkSound { sid 402; source 5002 }
}
)";

    SECTION("one artifact per case") {
        Run run(dump);
        run.generator.generate();

        std::vector<std::string> expected = {
            "Play_Step (surface=grass)",
            "Play_Step (surface=stone)",
        };
        REQUIRE(run.sink.names() == expected);

        const std::string text = run.out.str();
        REQUIRE(contains(text, "      case surface=grass\n"));
        REQUIRE(contains(text, "        source grass.wem\n"));
        REQUIRE(contains(text, "        source 5001.wem\n"));
        REQUIRE(!contains(text, "5002"));
    }

    SECTION("unused objects are generated afterwards") {
        GeneratorOptions options;
        options.generate_unused = true;
        Run run(dump, options);
        run.generator.generate();

        std::vector<std::string> expected = {
            "Play_Step (surface=grass)",
            "Play_Step (surface=stone)",
            "[unused] 402",
        };
        REQUIRE(run.sink.names() == expected);
        REQUIRE(run.sink.stats().unused == 1);
    }

    SECTION("selector presets pick a single case") {
        GeneratorOptions options;
        StateItem preset;
        preset.group = 10;
        preset.value = 2;
        options.selector_presets = {preset};
        Run run(dump, options);
        run.generator.generate();

        REQUIRE(run.sink.names() == std::vector<std::string>{"Play_Step"});
        REQUIRE(contains(run.out.str(), "source 5001.wem"));
        REQUIRE(!contains(run.out.str(), "grass.wem"));
    }
}

TEST_CASE("TreeRenderer follows the outer case in nested switches of one group", "[objects][switch]") {
    const std::string dump = R"(
bank 1 file="nested.bnk" {
    CAkEvent { sid 100 name="Ev"; action 200 }
    CAkActionPlay { sid 200; target 300 }
    CAkSwitchCntr {
        sid 300
        group 10
        case 1 { child 301 }
        case 2 { child 402 }
    }
    CAkSwitchCntr {
        sid 301
        group 10
        case 1 { child 400 }
        case 2 { child 401 }
    }
    CAkSound { sid 400; source 6000 }
    CAkSound { sid 401; source 6001 }
    CAkSound { sid 402; source 6002 }
}
)";

    Run run(dump);
    run.generator.generate();

    std::vector<std::string> expected = {
        "Ev (10=1)",
        "Ev (10=2)",
    };
    REQUIRE(run.sink.names() == expected);

    const std::string text = run.out.str();
    REQUIRE(contains(text, "source 6000.wem"));
    REQUIRE(contains(text, "source 6002.wem"));
    REQUIRE(!contains(text, "6001"));
}

TEST_CASE("TreeRenderer combines state chunks and parameters", "[objects][state]") {
    const std::string dump = R"(
bank 1 file="amb.bnk" {
    CAkEvent { sid 100 name="Amb"; action 200 }
    CAkActionPlay { sid 200; target 300 }
    CAkLayerCntr {
        sid 300
        statechunk 20 name="weather" { state 1 name="sunny"; state 2 name="rain" }
        rtpc 30 name="distance" { point 0; point 50.5 }
        child 400
    }
    CAkSound { sid 400; source 7 }
}
)";

    Run run(dump);
    run.generator.generate();

    std::vector<std::string> expected = {
        "Amb {s}=(weather=sunny) {distance=0}",
        "Amb {s}=(weather=sunny) {distance=50.5}",
        "Amb {s}=(weather=rain) {distance=0}",
        "Amb {s}=(weather=rain) {distance=50.5}",
    };
    REQUIRE(run.sink.names() == expected);
    REQUIRE(contains(run.out.str(), "      state weather=rain\n"));
    REQUIRE(contains(run.out.str(), "      rtpc distance=50.5\n"));
}

TEST_CASE("TreeRenderer publishes stingers as secondaries", "[objects][music]") {
    const std::string dump = R"(
bank 1 file="music.bnk" {
    CAkEvent { sid 100 name="Music"; action 200 }
    CAkActionPlay { sid 200; target 300 }
    CAkMusicSegment { sid 300; child 400; stinger 500 }
    CAkMusicTrack { sid 400; source 1 name="main.wem" }
    CAkMusicSegment { sid 500; child 401 }
    CAkMusicTrack { sid 401; source 2 name="hit.wem" }
    CAkMusicSegment { sid 600 }
}
)";

    GeneratorOptions options;
    options.generate_unused = true;
    Run run(dump, options);
    run.generator.generate();

    REQUIRE(run.sink.names() == std::vector<std::string>{"Music", "500 {stinger}"});
    REQUIRE(contains(run.out.str(), "# caller: 1/100\n"));
    REQUIRE(contains(run.out.str(), "source hit.wem"));
    REQUIRE(run.sink.stats().secondaries == 1);
    REQUIRE(run.sink.stats().unused == 0);
}

TEST_CASE("TreeRenderer classifies missing targets", "[objects][missing]") {
    const std::string dump = R"(
bank 1 file="base.bnk" {
    CAkEvent { sid 100; action 200 }
    CAkActionPlay { sid 200; target 900 bank=5 bankname="music.bnk" }
    CAkEvent { sid 101; action 201 }
    CAkActionPlay { sid 201; target 901 bank=1 }
    CAkEvent { sid 102; action 202 }
    CAkActionPlay { sid 202; target 902 }
}
)";

    Run run(dump);
    run.generator.generate();

    const auto& registry = run.registry;
    REQUIRE(registry.missing_others().count(Reference{5, 900}) == 1);
    REQUIRE(registry.missing_banks().count("music.bnk") == 1);
    REQUIRE(registry.missing_loaded().count(Reference{1, 901}) == 1);
    REQUIRE(registry.missing_unknown().count(Reference{1, 902}) == 1);
    REQUIRE(registry.missing_others().size() == 1);
    REQUIRE(registry.missing_loaded().size() == 1);
    REQUIRE(registry.missing_unknown().size() == 1);
    REQUIRE(contains(run.out.str(), "missing 900"));

    std::ostringstream report;
    write_report(report, registry, run.generator.stats(), run.sink.stats());
    REQUIRE(contains(report.str(), "[hircgen] created 3 artifacts"));
    REQUIRE(contains(report.str(), "missing banks: music.bnk\n"));
    REQUIRE(contains(report.str(), "missing 1 nodes in loaded banks"));
    REQUIRE(contains(report.str(), "missing 1 nodes in unknown banks"));
}

TEST_CASE("TreeRenderer resolves references across banks", "[objects][banks]") {
    const std::string dump = R"(
bank 1 file="events.bnk" {
    CAkEvent { sid 100 name="Play"; action 200 }
    CAkActionPlay { sid 200; target 300 bank=2 }
}
bank 2 file="media.bnk" {
    CAkSound { sid 300; source 9 name="media.wem" }
}
)";

    Run run(dump);
    run.generator.generate();

    REQUIRE(run.sink.names() == std::vector<std::string>{"Play"});
    REQUIRE(contains(run.out.str(), "source media.wem"));
    REQUIRE(run.registry.missing_others().empty());
}

TEST_CASE("TreeRenderer reports invalid trees", "[objects][error]") {
    SECTION("reference loop") {
        const std::string dump = R"(
bank 1 file="loop.bnk" {
    CAkEvent { sid 100; action 200 }
    CAkActionPlay { sid 200; target 300 }
    CAkLayerCntr { sid 300; child 300 }
}
)";
        Run run(dump);
        REQUIRE_THROWS_AS(run.generator.generate(), std::runtime_error);
    }

    SECTION("unknown container mode") {
        const std::string dump = R"(
bank 1 file="mode.bnk" {
    CAkEvent { sid 100; action 200 }
    CAkActionPlay { sid 200; target 300 }
    CAkRanSeqCntr mode="shuffle" { sid 300 }
}
)";
        Run run(dump);
        REQUIRE_THROWS_AS(run.generator.generate(), std::runtime_error);
    }
}

// ============================================================================
// TextSink
// ============================================================================

TEST_CASE("TextSink deduplicates and names artifacts", "[objects][sink]") {
    std::ostringstream out;
    TextSink sink(out);

    Artifact first("Root");
    first.line(0, "CAkEvent Root");
    first.line(1, "CAkSound 1");

    Artifact same_body("Other");
    same_body.line(0, "CAkEvent Root");
    same_body.line(1, "CAkSound 1");

    Artifact same_name("Root");
    same_name.line(0, "CAkEvent Root");
    same_name.line(1, "CAkSound 2");

    sink.publish(first);
    sink.publish(same_body);
    sink.publish(same_name);

    REQUIRE(sink.names() == std::vector<std::string>{"Root", "Root [2]"});
    REQUIRE(sink.stats().created == 2);
    REQUIRE(sink.stats().duplicates == 1);
    REQUIRE(contains(out.str(), "== Root\n# Root\nCAkEvent Root\n  CAkSound 1\n"));
}

TEST_CASE("TextSink writes one file per artifact", "[objects][sink]") {
    auto dir = std::filesystem::temp_directory_path() / "hircgen_test_sink";
    std::filesystem::remove_all(dir);

    TextSink sink(dir.string());

    Artifact artifact("Play/Step");
    artifact.line(0, "CAkEvent Play/Step");
    sink.publish(artifact);

    auto path = dir / "Play_Step.txtp";
    REQUIRE(std::filesystem::exists(path));

    std::ifstream file(path);
    std::string header;
    std::getline(file, header);
    REQUIRE(header == "# Play/Step");

    std::filesystem::remove_all(dir);
}

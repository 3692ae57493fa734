#include <catch2/catch_test_macros.hpp>
#include "bank_parser.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace hircgen;

// ============================================================================
// Bank dump parsing tests
// ============================================================================

TEST_CASE("Parse bank dump", "[parser]") {
    const std::string input = R"(
# sample dump
bank 12 file="init.bnk" {
    CAkEvent {
        sid 100 name="Play_Intro"
        action 200;
    }
    // action with a declared target bank
    CAkActionPlay { sid 200; target 0x12C bank=3 bankname="music.bnk" }
    CAkRanSeqCntr mode="sequence" {
        sid 300
        rtpc 7 { point -1.5; point 2 }
    }
}
bank 3 {
}
)";

    auto banks = bank::parse_string(input);
    REQUIRE(banks.size() == 2);

    SECTION("bank headers") {
        REQUIRE(banks[0].id == 12);
        REQUIRE(banks[0].filename == "init.bnk");
        REQUIRE(banks[0].items.size() == 3);
        REQUIRE(banks[1].id == 3);
        REQUIRE(banks[1].filename == "3.bnk");
        REQUIRE(banks[1].items.empty());
    }

    SECTION("self identifier and name") {
        const auto& event = banks[0].items[0];
        REQUIRE(event->type() == "CAkEvent");
        REQUIRE(event->sid() == 100u);
        REQUIRE(event->display_name() == std::string("Play_Intro"));
        REQUIRE(event->find_child("action")->int_value() == 200);
    }

    SECTION("hex values and attributes") {
        const auto& action = banks[0].items[1];
        REQUIRE(!action->display_name().has_value());
        auto target = action->find_child("target");
        REQUIRE(target->int_value() == 300);
        REQUIRE(target->int_attr("bank") == 3);
        REQUIRE(target->str_attr("bankname") == std::string("music.bnk"));
        REQUIRE(!target->attr("missing"));
    }

    SECTION("attributes on the object and numeric points") {
        const auto& container = banks[0].items[2];
        REQUIRE(container->str_attr("mode") == std::string("sequence"));
        auto points = container->find_child("rtpc")->find_children("point");
        REQUIRE(points.size() == 2);
        REQUIRE(points[0]->number_value() == -1.5);
        REQUIRE(points[1]->number_value() == 2.0);
    }
}

TEST_CASE("Parse string escapes", "[parser]") {
    auto banks = bank::parse_string("bank 1 { CAkSound { sid 5 name=\"a \\\"b\\\"\" } }");
    REQUIRE(banks.size() == 1);
    REQUIRE(banks[0].items[0]->display_name() == std::string("a \"b\""));
}

TEST_CASE("Parse errors", "[parser][error]") {
    SECTION("unbalanced braces report the line") {
        try {
            bank::parse_string("bank 1 {\n  CAkEvent { sid 1\n");
            FAIL("expected a parse error");
        } catch (const std::runtime_error& e) {
            std::string msg = e.what();
            REQUIRE(msg.find("Parse error") != std::string::npos);
            REQUIRE(msg.find("line") != std::string::npos);
        }
    }

    SECTION("top level must be a bank") {
        REQUIRE_THROWS_AS(bank::parse_string("CAkEvent { sid 1 }"), std::runtime_error);
    }

    SECTION("bank requires an id") {
        REQUIRE_THROWS_AS(bank::parse_string("bank { }"), std::runtime_error);
    }

    SECTION("stray characters") {
        REQUIRE_THROWS_AS(bank::parse_string("bank 1 { @ }"), std::runtime_error);
    }

    SECTION("missing file") {
        REQUIRE_THROWS_AS(bank::parse_file("/nonexistent/hircgen/dump.txt"), std::runtime_error);
    }
}

TEST_CASE("Parse bank file", "[parser]") {
    auto path = std::filesystem::temp_directory_path() / "hircgen_test_dump.txt";
    {
        std::ofstream file(path);
        file << "bank 7 file=\"sfx.bnk\" {\n"
             << "    CAkSound { sid 1; source 10 }\n"
             << "}\n";
    }

    auto banks = bank::parse_file(path.string());
    std::filesystem::remove(path);

    REQUIRE(banks.size() == 1);
    REQUIRE(banks[0].filename == "sfx.bnk");
    REQUIRE(banks[0].items[0]->find_child("source")->int_value() == 10);
}

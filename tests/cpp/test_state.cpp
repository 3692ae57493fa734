#include <catch2/catch_test_macros.hpp>
#include "hircgen/state.hpp"
#include <stdexcept>

using namespace hircgen;

namespace {

StateItem item(uint32_t group, uint32_t value) {
    StateItem s;
    s.group = group;
    s.value = value;
    return s;
}

ParamItem param(uint32_t id, double value) {
    ParamItem p;
    p.id = id;
    p.value = value;
    return p;
}

}  // namespace

// ============================================================================
// SelectorPaths tests
// ============================================================================

TEST_CASE("SelectorPaths combinations", "[state][selector]") {
    SelectorPaths paths;

    SECTION("empty tree has no combinations") {
        REQUIRE(paths.empty());
        REQUIRE(paths.combos().empty());
    }

    SECTION("same group siblings are alternatives") {
        paths.push(item(1, 10));
        paths.pop();
        paths.push(item(1, 20));
        paths.pop();

        auto combos = paths.combos();
        REQUIRE(combos.size() == 2);
        REQUIRE(combos[0].size() == 1);
        REQUIRE(combos[0][0].value == 10);
        REQUIRE(combos[1][0].value == 20);
    }

    SECTION("nested groups only expand under their parent") {
        // group 1: A(10) has no children, B(20) leads to group 2 with x(1), y(2)
        paths.push(item(1, 10));
        paths.pop();
        paths.push(item(1, 20));
        paths.push(item(2, 1));
        paths.pop();
        paths.push(item(2, 2));
        paths.pop();
        paths.pop();

        auto combos = paths.combos();
        REQUIRE(combos.size() == 3);
        REQUIRE(combos[0] == SelectorCombo{item(1, 10)});
        REQUIRE(combos[1] == SelectorCombo{item(1, 20), item(2, 1)});
        REQUIRE(combos[2] == SelectorCombo{item(1, 20), item(2, 2)});
    }

    SECTION("different groups at the same level are a cartesian product") {
        paths.push(item(1, 10));
        paths.pop();
        paths.push(item(1, 20));
        paths.pop();
        paths.push(item(2, 1));
        paths.pop();
        paths.push(item(2, 2));
        paths.pop();
        paths.push(item(2, 3));
        paths.pop();

        REQUIRE(paths.combos().size() == 6);
    }

    SECTION("repeated pushes of the same item are merged") {
        paths.push(item(1, 10));
        paths.pop();
        paths.push(item(1, 10));
        paths.pop();

        REQUIRE(paths.combos().size() == 1);
    }

    SECTION("pop without push throws") {
        REQUIRE_THROWS_AS(paths.pop(), std::logic_error);
    }

    SECTION("clear forgets everything") {
        paths.push(item(1, 10));
        paths.pop();
        paths.clear();
        REQUIRE(paths.empty());
    }

    SECTION("current value follows the open path") {
        REQUIRE(!paths.current(1).has_value());
        paths.push(item(1, 10));
        paths.push(item(2, 3));
        REQUIRE(paths.current(1) == 10u);
        REQUIRE(paths.current(2) == 3u);
        paths.pop();
        REQUIRE(!paths.current(2).has_value());
        paths.pop();
        REQUIRE(!paths.current(1).has_value());
    }
}

// ============================================================================
// StateChunkSet tests
// ============================================================================

TEST_CASE("StateChunkSet reachability", "[state][chunk]") {
    StateChunkSet chunks;

    SECTION("no groups means no combinations and no default") {
        auto combos = chunks.combos({});
        REQUIRE(combos.empty());
        REQUIRE(!chunks.generate_default(combos));
    }

    SECTION("cartesian product of groups") {
        chunks.add(item(5, 1));
        chunks.add(item(5, 2));
        chunks.add(item(6, 1));
        chunks.add(item(6, 2));
        chunks.add(item(6, 3));
        chunks.add(item(6, 3));  // duplicate

        auto combos = chunks.combos({});
        REQUIRE(combos.size() == 6);
        for (const auto& c : combos) {
            REQUIRE(c.items.size() == 2);
            REQUIRE(!c.unreachable);
        }
        REQUIRE(!chunks.generate_default(combos));
    }

    SECTION("explicitly unreachable value marks its combinations") {
        chunks.add(item(5, 1));
        chunks.add(item(5, 2), true);

        auto combos = chunks.combos({});
        REQUIRE(combos.size() == 2);
        REQUIRE(!combos[0].unreachable);
        REQUIRE(combos[1].unreachable);
    }

    SECTION("value conflicting with the selected switch is unreachable") {
        chunks.add(item(5, 1));
        chunks.add(item(5, 2));

        std::map<uint32_t, uint32_t> selectors{{5, 2}};
        auto combos = chunks.combos(selectors);
        REQUIRE(combos[0].unreachable);
        REQUIRE(!combos[1].unreachable);
        REQUIRE(!chunks.generate_default(combos));
    }

    SECTION("default is generated when everything is unreachable") {
        chunks.add(item(5, 1), true);

        auto combos = chunks.combos({});
        REQUIRE(combos.size() == 1);
        REQUIRE(chunks.generate_default(combos));
    }

    SECTION("clear forgets groups") {
        chunks.add(item(5, 1), true);
        chunks.clear();
        REQUIRE(chunks.empty());
        REQUIRE(!chunks.generate_default(chunks.combos({})));
    }
}

// ============================================================================
// ParamSet / SecondarySet tests
// ============================================================================

TEST_CASE("ParamSet combinations", "[state][param]") {
    ParamSet params;
    REQUIRE(params.combos().empty());

    params.add(param(7, 0.0));
    params.add(param(7, 50.0));
    params.add(param(7, 50.0));
    params.add(param(8, 1.5));

    auto combos = params.combos();
    REQUIRE(combos.size() == 2);
    REQUIRE(combos[0].size() == 2);
    REQUIRE(combos[0][0].value == 0.0);
    REQUIRE(combos[1][0].value == 50.0);
    REQUIRE(combos[1][1].id == 8);
}

TEST_CASE("SecondarySet deduplicates by target", "[state][secondary]") {
    SecondarySet set;
    REQUIRE(set.add(Secondary{"stinger", Reference{1, 100}}));
    REQUIRE(!set.add(Secondary{"transition", Reference{1, 100}}));
    REQUIRE(set.add(Secondary{"stinger", Reference{2, 100}}));
    REQUIRE(set.items().size() == 2);
    REQUIRE(set.items()[0].kind == "stinger");
}

// ============================================================================
// StateContext tests
// ============================================================================

TEST_CASE("StateContext presets and resets", "[state][context]") {
    StateContext ctx;
    ctx.set_selector_presets({item(1, 10)});
    ctx.set_param_presets({param(7, 25.0)});
    ctx.reset();

    SECTION("presets are applied after reset") {
        REQUIRE(ctx.selector(1) == 10u);
        REQUIRE(ctx.param(7) == 25.0);
        REQUIRE(ctx.is_param_preset(7));
        REQUIRE(!ctx.is_param_preset(8));
        REQUIRE(ctx.applied_selectors().empty());
    }

    SECTION("applied selectors keep presets") {
        ctx.set_selectors({item(2, 3)});
        REQUIRE(ctx.selector(1) == 10u);
        REQUIRE(ctx.selector(2) == 3u);
        REQUIRE(ctx.applied_selectors().size() == 1);

        ctx.reset();
        REQUIRE(!ctx.selector(2).has_value());
    }

    SECTION("chunk reachability uses preset selectors") {
        ctx.chunk_set().add(item(1, 10));
        ctx.chunk_set().add(item(1, 11));

        auto combos = ctx.chunk_combos();
        REQUIRE(combos.size() == 2);
        REQUIRE(!combos[0].unreachable);
        REQUIRE(combos[1].unreachable);
    }

    SECTION("reset_chunks clears selection and discoveries") {
        ChunkCombo combo;
        combo.items.push_back(item(5, 1));
        ctx.set_chunks(combo);
        ctx.chunk_set().add(item(5, 1));
        REQUIRE(ctx.chunk(5) == 1u);
        REQUIRE(ctx.applied_chunks().has_value());

        ctx.reset_chunks();
        REQUIRE(!ctx.chunk(5).has_value());
        REQUIRE(!ctx.applied_chunks().has_value());
        REQUIRE(ctx.chunk_set().empty());
    }

    SECTION("reset_params keeps presets") {
        ctx.set_params({param(8, 1.0)});
        REQUIRE(ctx.param(8) == 1.0);
        ctx.param_set().add(param(8, 1.0));

        ctx.reset_params();
        REQUIRE(!ctx.param(8).has_value());
        REQUIRE(ctx.param(7) == 25.0);
        REQUIRE(ctx.param_set().empty());
    }

    SECTION("reset clears secondaries") {
        ctx.secondaries().add(Secondary{"stinger", Reference{1, 5}});
        ctx.reset();
        REQUIRE(ctx.secondaries().empty());
    }
}

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_template_test_macros.hpp>
#include <lease/lease.hpp>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "support/effects.hpp"
#include "support/fake_resource.hpp"

using namespace lease;
using namespace lease::test;

TEMPLATE_LIST_TEST_CASE("zip releases both resources", "[ap]", all_effects) {
    using E = TestType;
    resource_table table;

    auto both = zip(scoped<E>(table, "left"), scoped<E>(table, "right"));
    auto [l, r] = evaluate<E>(both.run());

    REQUIRE(l == "left");
    REQUIRE(r == "right");
    REQUIRE(table.size() == 0);
    REQUIRE(table.count("acquire left") == 1);
    REQUIRE(table.count("acquire right") == 1);
    REQUIRE(table.count("release left") == 1);
    REQUIRE(table.count("release right") == 1);
}

TEMPLATE_LIST_TEST_CASE("ap combines both values", "[ap]", all_effects) {
    using E = TestType;
    resource_table table;

    auto joined = ap(scoped<E>(table, "A"), scoped<E>(table, "B"),
                     [](std::string a, std::string b) { return a + "+" + b; });

    REQUIRE(evaluate<E>(joined.run()) == "A+B");
    REQUIRE(table.size() == 0);
}

TEMPLATE_LIST_TEST_CASE("ap nested in bind is released before the outer resource", "[ap][bind]", all_effects) {
    using E = TestType;
    resource_table table;

    auto composed = scoped<E>(table, "outer").flat_map([&table](std::string) {
        return zip(scoped<E>(table, "x"), scoped<E>(table, "y"));
    });
    evaluate<E>(composed.run());

    auto log = table.events();
    REQUIRE(log.size() == 6);
    REQUIRE(log.front() == "acquire outer");
    REQUIRE(log.back() == "release outer");
    REQUIRE(table.size() == 0);
}

TEMPLATE_LIST_TEST_CASE("ap releases the surviving side when one acquisition fails", "[ap][error]", error_effects) {
    using E = TestType;
    resource_table table;
    auto broken = raise_error<E, std::string>(std::runtime_error("unreachable host"));

    SECTION("left fails") {
        auto joined = zip(broken, scoped<E>(table, "right"));
        REQUIRE_THROWS_WITH(evaluate<E>(joined.run()), "unreachable host");
        REQUIRE(table.events() == std::vector<std::string>{"acquire right", "release right"});
    }

    SECTION("right fails") {
        auto joined = zip(scoped<E>(table, "left"), broken);
        REQUIRE_THROWS_WITH(evaluate<E>(joined.run()), "unreachable host");
        REQUIRE(table.events() == std::vector<std::string>{"acquire left", "release left"});
    }

    REQUIRE(table.size() == 0);
}

TEMPLATE_LIST_TEST_CASE("ap surfaces the left failure when both sides fail", "[ap][error]", error_effects) {
    using E = TestType;

    auto joined = zip(raise_error<E, int>(std::runtime_error("left")),
                      raise_error<E, int>(std::runtime_error("right")));

    REQUIRE_THROWS_WITH(evaluate<E>(joined.run()), "left");
}

TEMPLATE_LIST_TEST_CASE("ap surfaces the release failure of the surviving side", "[ap][error]", error_effects) {
    using E = TestType;
    resource_table table;
    table.fail_close_of("right");

    auto joined = zip(raise_error<E, std::string>(std::runtime_error("left")), scoped<E>(table, "right"));

    REQUIRE_THROWS_AS(evaluate<E>(joined.run()), close_failed);
}

TEMPLATE_LIST_TEST_CASE("ap attempts both releases and the left failure wins", "[ap][error]", error_effects) {
    using E = TestType;
    resource_table table;
    auto joined = zip(scoped<E>(table, "L"), scoped<E>(table, "R"));

    SECTION("both fail") {
        table.fail_close_of("L");
        table.fail_close_of("R");
        REQUIRE_THROWS_WITH(evaluate<E>(joined.run()), "close failed: L");
    }

    SECTION("only the right fails") {
        table.fail_close_of("R");
        REQUIRE_THROWS_WITH(evaluate<E>(joined.run()), "close failed: R");
        REQUIRE_FALSE(table.contains("L"));
    }

    REQUIRE(table.count("release L") == 1);
    REQUIRE(table.count("release R") == 1);
}

TEMPLATE_LIST_TEST_CASE("ap releases both when the combiner throws", "[ap][error]", error_effects) {
    using E = TestType;
    resource_table table;

    auto joined = ap(scoped<E>(table, "A"), scoped<E>(table, "B"), [](std::string, std::string) -> int {
        throw std::logic_error("cannot combine");
    });

    REQUIRE_THROWS_AS(evaluate<E>(joined.run()), std::logic_error);
    REQUIRE(table.size() == 0);
    REQUIRE(table.count("release A") == 1);
    REQUIRE(table.count("release B") == 1);
}

TEMPLATE_LIST_TEST_CASE("ap keeps the state of a mutable combiner", "[ap]", all_effects) {
    using E = TestType;
    resource_table table;

    auto tagged = ap(scoped<E>(table, "A"), scoped<E>(table, "B"), [round = 0](std::string a, std::string b) mutable {
        return a + b + std::to_string(round++);
    });

    REQUIRE(evaluate<E>(tagged.run()) == "AB0");
    REQUIRE(evaluate<E>(tagged.run()) == "AB1");
    REQUIRE(table.size() == 0);
}

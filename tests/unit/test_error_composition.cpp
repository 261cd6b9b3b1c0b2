#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_template_test_macros.hpp>
#include <lease/lease.hpp>
#include <exception>
#include <stdexcept>
#include <string>
#include <vector>
#include "support/effects.hpp"
#include "support/fake_resource.hpp"

using namespace lease;
using namespace lease::test;

using events = std::vector<std::string>;

TEMPLATE_LIST_TEST_CASE("raise_error fails every acquisition", "[error]", error_effects) {
    using E = TestType;
    auto failing = raise_error<E, int>(std::runtime_error("boom"));

    REQUIRE_THROWS_WITH(evaluate<E>(failing.run()), "boom");
    REQUIRE_THROWS_AS(evaluate<E>(failing.acquire()), std::runtime_error);
}

TEMPLATE_LIST_TEST_CASE("raise_error keeps the exception_ptr it was given", "[error]", error_effects) {
    using E = TestType;
    auto error = std::make_exception_ptr(std::out_of_range("index"));

    REQUIRE_THROWS_AS(evaluate<E>(raise_error<E, int>(error).run()), std::out_of_range);
}

TEMPLATE_LIST_TEST_CASE("bind after raise_error never releases", "[error][bind]", error_effects) {
    using E = TestType;
    resource_table table;
    bool continued = false;

    auto composed = raise_error<E, std::string>(std::runtime_error("early")).flat_map(
        [&](std::string) {
            continued = true;
            return scoped<E>(table, "never");
        });

    REQUIRE_THROWS_WITH(evaluate<E>(composed.run()), "early");
    REQUIRE_FALSE(continued);
    REQUIRE(table.events().empty());
}

TEMPLATE_LIST_TEST_CASE("a throwing continuation releases the held resource once", "[error][bind]", error_effects) {
    using E = TestType;
    resource_table table;

    auto composed = scoped<E>(table, "A").flat_map([](std::string) -> factory<E, int> {
        throw std::runtime_error("continuation");
    });

    REQUIRE_THROWS_WITH(evaluate<E>(composed.run()), "continuation");
    REQUIRE(table.events() == events{"acquire A", "release A"});
    REQUIRE(table.count("release A") == 1);
}

TEMPLATE_LIST_TEST_CASE("a failing inner acquisition releases the outer resource", "[error][bind]", error_effects) {
    using E = TestType;
    resource_table table;

    auto composed = scoped<E>(table, "A").flat_map([](std::string) {
        return raise_error<E, int>(std::runtime_error("inner"));
    });

    REQUIRE_THROWS_WITH(evaluate<E>(composed.run()), "inner");
    REQUIRE(table.events() == events{"acquire A", "release A"});
    REQUIRE(table.size() == 0);
}

TEMPLATE_LIST_TEST_CASE("outer release failure replaces the inner acquisition failure", "[error][bind]", error_effects) {
    using E = TestType;
    resource_table table;
    table.fail_close_of("A");

    auto composed = scoped<E>(table, "A").flat_map([](std::string) {
        return raise_error<E, int>(std::runtime_error("inner"));
    });

    REQUIRE_THROWS_AS(evaluate<E>(composed.run()), close_failed);
    REQUIRE(table.contains("A"));
}

TEMPLATE_LIST_TEST_CASE("release failure priority", "[error][bind]", error_effects) {
    using E = TestType;
    resource_table table;
    auto composed = scoped<E>(table, "A").flat_map([&table](std::string) {
        return scoped<E>(table, "B");
    });

    SECTION("both releases fail: the outer failure surfaces") {
        table.fail_close_of("A");
        table.fail_close_of("B");

        REQUIRE_THROWS_WITH(evaluate<E>(composed.run()), "close failed: A");
        REQUIRE(table.events() == events{"acquire A", "acquire B", "release B", "release A"});
    }

    SECTION("only the inner release fails: the outer still runs") {
        table.fail_close_of("B");

        REQUIRE_THROWS_WITH(evaluate<E>(composed.run()), "close failed: B");
        REQUIRE(table.events() == events{"acquire A", "acquire B", "release B", "release A"});
        REQUIRE_FALSE(table.contains("A"));
    }

    SECTION("only the outer release fails") {
        table.fail_close_of("A");

        REQUIRE_THROWS_WITH(evaluate<E>(composed.run()), "close failed: A");
        REQUIRE_FALSE(table.contains("B"));
    }
}

TEMPLATE_LIST_TEST_CASE("map that throws releases the resource", "[error][map]", error_effects) {
    using E = TestType;
    resource_table table;

    auto mapped = scoped<E>(table, "A").map([](std::string) -> int {
        throw std::invalid_argument("bad value");
    });

    REQUIRE_THROWS_AS(evaluate<E>(mapped.run()), std::invalid_argument);
    REQUIRE(table.events() == events{"acquire A", "release A"});
}

TEMPLATE_LIST_TEST_CASE("use releases when the continuation fails", "[error][use]", error_effects) {
    using E = TestType;
    resource_table table;
    auto conn = scoped<E>(table, "conn");

    SECTION("continuation throws") {
        auto result = conn.use([](std::string) -> typename E::template type<int> {
            throw std::runtime_error("body threw");
        });
        REQUIRE_THROWS_WITH(evaluate<E>(std::move(result)), "body threw");
    }

    SECTION("continuation yields a failed computation") {
        auto result = conn.use([](std::string) {
            return E::template raise<int>(std::make_exception_ptr(std::runtime_error("body failed")));
        });
        REQUIRE_THROWS_WITH(evaluate<E>(std::move(result)), "body failed");
    }

    REQUIRE(table.events() == events{"acquire conn", "release conn"});
}

TEMPLATE_LIST_TEST_CASE("use surfaces a release failure over the continuation failure", "[error][use]", error_effects) {
    using E = TestType;
    resource_table table;
    table.fail_close_of("conn");

    auto result = scoped<E>(table, "conn").use([](std::string) -> typename E::template type<int> {
        throw std::runtime_error("body threw");
    });

    REQUIRE_THROWS_AS(evaluate<E>(std::move(result)), close_failed);
}

TEMPLATE_LIST_TEST_CASE("run surfaces a release failure", "[error][run]", error_effects) {
    using E = TestType;
    resource_table table;
    table.fail_close_of("r0");

    REQUIRE_THROWS_AS(evaluate<E>(scoped<E>(table, "r0").run()), close_failed);
    REQUIRE(table.events() == events{"acquire r0", "release r0"});
}

TEMPLATE_LIST_TEST_CASE("handle_error acquires the replacement", "[error][handle_error]", error_effects) {
    using E = TestType;
    resource_table table;
    std::string seen;

    auto primary = raise_error<E, std::string>(std::runtime_error("primary down"));
    auto recovered = handle_error(primary, [&](std::exception_ptr error) {
        seen = log::describe(error);
        return scoped<E>(table, "replica");
    });

    REQUIRE(evaluate<E>(recovered.run()) == "replica");
    REQUIRE(seen == "primary down");
    REQUIRE(table.events() == events{"acquire replica", "release replica"});
}

TEMPLATE_LIST_TEST_CASE("handle_error leaves successful acquisitions alone", "[error][handle_error]", error_effects) {
    using E = TestType;
    resource_table table;
    bool handled = false;

    auto recovered = handle_error(scoped<E>(table, "primary"), [&](std::exception_ptr) {
        handled = true;
        return scoped<E>(table, "replica");
    });

    REQUIRE(evaluate<E>(recovered.run()) == "primary");
    REQUIRE_FALSE(handled);
}

TEMPLATE_LIST_TEST_CASE("handle_error does not intercept release failures", "[error][handle_error]", error_effects) {
    using E = TestType;
    resource_table table;
    table.fail_close_of("primary");
    bool handled = false;

    auto recovered = handle_error(scoped<E>(table, "primary"), [&](std::exception_ptr) {
        handled = true;
        return scoped<E>(table, "replica");
    });

    REQUIRE_THROWS_AS(evaluate<E>(recovered.run()), close_failed);
    REQUIRE_FALSE(handled);
}

TEMPLATE_LIST_TEST_CASE("handle_error recovers a failed conflict", "[error][handle_error]", error_effects) {
    using E = TestType;
    resource_table table;
    auto exclusive = scoped<E>(table, "r0");

    auto composed = exclusive.flat_map([exclusive, &table](std::string) {
        return handle_error(exclusive, [&table](std::exception_ptr) {
            return scoped<E>(table, "r0-fallback");
        });
    });

    REQUIRE(evaluate<E>(composed.run()) == "r0-fallback");
    REQUIRE(table.events() == events{"acquire r0", "acquire r0-fallback", "release r0-fallback", "release r0"});
}

TEMPLATE_LIST_TEST_CASE("handle_error keeps the state of a mutable handler", "[error][handle_error]", error_effects) {
    using E = TestType;
    resource_table table;

    auto failover = handle_error(raise_error<E, std::string>(std::runtime_error("primary down")),
        [&table, attempt = 0](std::exception_ptr) mutable {
            return scoped<E>(table, "replica-" + std::to_string(attempt++));
        });

    REQUIRE(evaluate<E>(failover.run()) == "replica-0");
    REQUIRE(evaluate<E>(failover.run()) == "replica-1");
    REQUIRE(table.size() == 0);
}

TEST_CASE("identity has no error channel", "[error]") {
    STATIC_REQUIRE_FALSE(effect::error_effect<effect::identity>);
    STATIC_REQUIRE(effect::error_effect<effect::immediate>);
    STATIC_REQUIRE(effect::error_effect<effect::task_effect>);
}

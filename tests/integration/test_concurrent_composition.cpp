#include <catch2/catch_test_macros.hpp>
#include <lease/lease.hpp>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "../test_main.cpp"  // For scaled timeouts
#include "support/fake_resource.hpp"

using namespace lease;
using namespace lease::test;

using E = effect::task_effect;

namespace {

/// Tracks how many acquisitions are in flight at once
struct overlap_probe {
    std::atomic<int> inside{0};
    std::atomic<int> peak{0};

    void enter() {
        int now = inside.fetch_add(1) + 1;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
    }

    void leave() { inside.fetch_sub(1); }
};

/// A scoped resource whose opening blocks its worker for `hold`
factory<E, std::string> slow(resource_table& table, overlap_probe& probe, std::string id,
                             std::chrono::milliseconds hold) {
    return factory<E, std::string>([&table, &probe, id = std::move(id), hold] {
        return E::delay([&table, &probe, id, hold] {
            probe.enter();
            std::this_thread::sleep_for(hold);
            probe.leave();
            table.open(id);
            return handle<E, std::string>{id, close_in<E>(table, id)};
        });
    });
}

} // namespace

TEST_CASE("independent acquisitions overlap on a multi-threaded scheduler", "[integration][ap]") {
    resource_table table;
    overlap_probe probe;

    auto both = zip(slow(table, probe, "left", scaled_ms(100)), slow(table, probe, "right", scaled_ms(100)));
    auto [l, r] = lease::run(both.run(), 4);

    REQUIRE(l == "left");
    REQUIRE(r == "right");
    REQUIRE(probe.peak.load() == 2);
    REQUIRE(table.size() == 0);
    REQUIRE(table.count("release left") == 1);
    REQUIRE(table.count("release right") == 1);
}

TEST_CASE("sequential composition keeps its order across workers", "[integration][bind]") {
    resource_table table;
    overlap_probe probe;

    auto chain = slow(table, probe, "A", scaled_ms(10)).flat_map([&](std::string) {
        return slow(table, probe, "B", scaled_ms(10)).flat_map([&](std::string) {
            return slow(table, probe, "C", scaled_ms(10));
        });
    });
    auto value = lease::run(chain.run(), 4);

    REQUIRE(value == "C");
    REQUIRE(probe.peak.load() == 1);
    REQUIRE(table.events() == std::vector<std::string>{
        "acquire A", "acquire B", "acquire C", "release C", "release B", "release A"});
}

TEST_CASE("many concurrent uses of one reentrant factory", "[integration][use]") {
    resource_table table;
    auto pool = reentrant<E>(table, "conn-");
    const int users = 64;

    auto driver = [&]() -> coro::task<int> {
        std::vector<coro::join_handle<size_t>> handles;
        handles.reserve(users);
        for (int i = 0; i < users; ++i) {
            handles.push_back(pool.use([&table](std::string id) {
                return E::delay([&table, id] { return table.contains(id) ? id.size() : size_t{0}; });
            }).spawn());
        }
        int open_while_used = 0;
        for (auto& h : handles) {
            if (co_await std::move(h) > 0) ++open_while_used;
        }
        co_return open_while_used;
    };

    REQUIRE(lease::run(driver(), 4) == users);
    REQUIRE(table.size() == 0);
}

TEST_CASE("the first branch to settle wins a race", "[integration][race]") {
    resource_table table;
    overlap_probe probe;

    auto raced = choose_any(slow(table, probe, "slow", scaled_ms(300)), {slow(table, probe, "fast", scaled_ms(1))});

    auto driver = [&]() -> coro::task<std::string> {
        auto won = co_await raced.run();
        // The losing branch is still owned by its residual
        auto loser = co_await won.residuals[0].run();
        co_return won.value + "," + loser;
    };

    REQUIRE(lease::run(driver(), 4) == "fast,slow");
    REQUIRE(table.size() == 0);
    REQUIRE(table.count("release fast") == 1);
    REQUIRE(table.count("release slow") == 1);
}

TEST_CASE("a failed race releases the branches that did acquire", "[integration][race]") {
    resource_table table;
    overlap_probe probe;

    auto broken = factory<E, std::string>([] {
        return E::delay([]() -> handle<E, std::string> { throw std::runtime_error("refused"); });
    });
    auto raced = choose_any(broken, {slow(table, probe, "late", scaled_ms(100))});

    REQUIRE_THROWS_WITH(lease::run(raced.run(), 4), "refused");
    REQUIRE(table.events() == std::vector<std::string>{"acquire late", "release late"});
}

TEST_CASE("release failures keep their priority across workers", "[integration][error]") {
    resource_table table;
    overlap_probe probe;
    table.fail_close_of("outer");
    table.fail_close_of("inner");

    auto chain = slow(table, probe, "outer", scaled_ms(5)).flat_map([&](std::string) {
        return zip(slow(table, probe, "inner", scaled_ms(5)), slow(table, probe, "side", scaled_ms(5)));
    });

    REQUIRE_THROWS_WITH(lease::run(chain.run(), 4), "close failed: outer");
    REQUIRE(table.count("release inner") == 1);
    REQUIRE(table.count("release side") == 1);
    REQUIRE_FALSE(table.contains("side"));
}

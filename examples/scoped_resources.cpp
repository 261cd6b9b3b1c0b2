#include <lease/lease.hpp>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

using namespace lease;

// A toy connection that reports when it is opened and closed
class connection {
public:
    explicit connection(std::string name) : name_(std::move(name)) {
        LEASE_LOG_INFO("open {}", name_);
    }

    void close() {
        LEASE_LOG_INFO("close {}", name_);
    }

    std::string query(const std::string& sql) const {
        return name_ + " <- " + sql;
    }

private:
    std::string name_;
};

using E = effect::task_effect;
using connection_ptr = std::shared_ptr<connection>;

factory<E, connection_ptr> connect(std::string name) {
    return managed<E>([name] { return std::make_unique<connection>(name); });
}

// Nested scopes: the transaction is closed before the database
coro::task<std::string> run_report() {
    auto tx = connect("db").flat_map([](connection_ptr db) {
        return connect("tx").map([db](connection_ptr tx) {
            return db->query("BEGIN") + " / " + tx->query("SELECT 1");
        });
    });

    co_return co_await tx.run();
}

// A failing step still gives the database back
coro::task<std::string> run_failing() {
    auto broken = connect("db").flat_map([](connection_ptr) -> factory<E, connection_ptr> {
        throw std::runtime_error("schema mismatch");
    });

    try {
        co_await broken.run();
    } catch (const std::exception& e) {
        co_return std::string("failed: ") + e.what();
    }
    co_return "unexpected success";
}

coro::task<int> async_main() {
    std::cout << co_await run_report() << std::endl;
    std::cout << co_await run_failing() << std::endl;
    co_return 0;
}

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--log-level" && i + 1 < argc) {
            auto lvl = log::parse_level(argv[++i]);
            if (!lvl) {
                std::cerr << "unknown log level: " << argv[i] << std::endl;
                return 1;
            }
            log::logger::instance().set_level(*lvl);
        } else {
            std::cout << "Usage: " << argv[0] << " [--log-level debug|info|warn|error]" << std::endl;
            return arg == "--help" ? 0 : 1;
        }
    }

    std::cout << "=== lease scoped resources ===" << std::endl;
    return lease::run(async_main(), 2);
}

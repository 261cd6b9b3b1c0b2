#include <lease/lease.hpp>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace lease;
using namespace std::chrono_literals;

using E = effect::task_effect;

// A replica endpoint that takes `latency` to answer the handshake
factory<E, std::string> replica(std::string name, std::chrono::milliseconds latency) {
    return factory<E, std::string>([name, latency] {
        return E::delay([name, latency] {
            std::this_thread::sleep_for(latency);
            LEASE_LOG_INFO("connected to {} after {}ms", name, latency.count());
            return handle<E, std::string>{name, [name] {
                return E::delay([name] {
                    LEASE_LOG_INFO("disconnected from {}", name);
                    return unit{};
                });
            }};
        });
    });
}

coro::task<int> async_main() {
    auto fastest = choose_any(replica("eu-west", 120ms), {replica("us-east", 30ms), replica("ap-south", 200ms)});

    auto won = co_await fastest.run();
    std::cout << "Fastest replica: " << won.value << " (branch " << won.index << ")" << std::endl;

    // The losers are still owned by their residuals; drain and close them
    for (auto& residual : won.residuals) {
        auto name = co_await residual.run();
        std::cout << "Closed residual: " << name << std::endl;
    }

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

    std::cout << "=== lease racing connections ===" << std::endl;
    return lease::run(async_main(), 4);
}

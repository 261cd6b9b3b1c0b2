#include <lease/lease.hpp>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace lease;

using E = effect::task_effect;

factory<E, std::string> temp_dir(std::string path, bool fail_cleanup = false) {
    return factory<E, std::string>([path, fail_cleanup] {
        return E::delay([path, fail_cleanup] {
            LEASE_LOG_INFO("mkdir {}", path);
            return handle<E, std::string>{path, [path, fail_cleanup] {
                return E::delay([path, fail_cleanup] {
                    LEASE_LOG_INFO("rm -r {}", path);
                    if (fail_cleanup) {
                        throw std::runtime_error("busy: " + path);
                    }
                    return unit{};
                });
            }};
        });
    });
}

coro::task<std::string> build_workspace() {
    auto scratch = sequence<E, std::string>({temp_dir("/tmp/obj"), temp_dir("/tmp/dep"), temp_dir("/tmp/gen")});
    auto both = zip(temp_dir("/tmp/src"), scratch);

    co_return co_await both.use([](std::pair<std::string, std::vector<std::string>> dirs) {
        return E::delay([dirs] {
            return dirs.first + " + " + std::to_string(dirs.second.size()) + " scratch dirs";
        });
    });
}

// The cleanup failure surfaces even though the body succeeded
coro::task<std::string> build_with_stuck_cleanup() {
    auto dirs = ap(temp_dir("/tmp/cache", true), temp_dir("/tmp/out"),
                   [](std::string a, std::string b) { return a + "," + b; });
    auto guarded = handle_error(dirs, [](std::exception_ptr e) {
        LEASE_LOG_WARNING("workspace unavailable: {}", log::describe(e));
        return pure<E>(std::string("<none>"));
    });

    try {
        co_return co_await guarded.run();
    } catch (const std::exception& e) {
        co_return std::string("cleanup failed: ") + e.what();
    }
}

coro::task<int> async_main() {
    std::cout << "Workspace: " << co_await build_workspace() << std::endl;
    std::cout << "Stuck: " << co_await build_with_stuck_cleanup() << std::endl;
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

    std::cout << "=== lease parallel cleanup ===" << std::endl;
    return lease::run(async_main(), 4);
}

#pragma once

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/chrono.h>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <exception>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace lease::log {

/// Log level enumeration
enum class level {
    debug = 0,
    info = 1,
    warning = 2,
    error = 3
};

/// Convert log level to string
constexpr const char* level_to_string(level lvl) noexcept {
    switch (lvl) {
        case level::debug:   return "DEBUG";
        case level::info:    return "INFO";
        case level::warning: return "WARN";
        case level::error:   return "ERROR";
        default:             return "UNKNOWN";
    }
}

/// Parse a level name as given on a command line ("debug", "info", "warn",
/// "warning", "error"). Returns nullopt for anything else.
inline std::optional<level> parse_level(std::string_view name) noexcept {
    if (name == "debug") return level::debug;
    if (name == "info") return level::info;
    if (name == "warn" || name == "warning") return level::warning;
    if (name == "error") return level::error;
    return std::nullopt;
}

/// Convert log level to ANSI color code
constexpr const char* level_to_color(level lvl) noexcept {
    switch (lvl) {
        case level::debug:   return "\033[36m";  // Cyan
        case level::info:    return "\033[32m";  // Green
        case level::warning: return "\033[33m";  // Yellow
        case level::error:   return "\033[31m";  // Red
        default:             return "\033[0m";   // Reset
    }
}

/// Render an exception carried in an error channel for a log line
inline std::string describe(const std::exception_ptr& error) {
    if (!error) {
        return "<no error>";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "<non-standard exception>";
    }
}

/// Singleton logger class
class logger {
public:
    /// Get singleton instance
    static logger& instance() noexcept {
        static logger inst;
        return inst;
    }

    /// Set minimum log level
    void set_level(level min_level) noexcept {
        min_level_.store(min_level, std::memory_order_relaxed);
    }

    /// Get current minimum log level
    level get_level() const noexcept {
        return min_level_.load(std::memory_order_relaxed);
    }

    /// Redirect output (stderr by default). Colors are only emitted on stderr.
    void set_output(std::FILE* out) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = out ? out : stderr;
    }

    /// Log a message with formatting
    template<typename... Args>
    void log(level lvl, const char* file, int line, fmt::format_string<Args...> fmt_str, Args&&... args) {
        if (lvl < min_level_.load(std::memory_order_relaxed)) {
            return;
        }

        auto msg = fmt::format(fmt_str, std::forward<Args>(args)...);

        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::lock_guard<std::mutex> lock(mutex_);
        bool colored = out_ == stderr;

        // Format: [TIMESTAMP] [LEVEL] [file:line] message
        fmt::print(out_,
            "{}[{:%Y-%m-%d %H:%M:%S}.{:03d}] [{}] [{}:{}] {}{}\n",
            colored ? level_to_color(lvl) : "",
            fmt::localtime(time),
            ms.count(),
            level_to_string(lvl),
            file,
            line,
            msg,
            colored ? "\033[0m" : ""
        );
        std::fflush(out_);
    }

private:
    logger() noexcept : min_level_(level::info), out_(stderr) {}
    ~logger() = default;

    logger(const logger&) = delete;
    logger& operator=(const logger&) = delete;

    std::atomic<level> min_level_;
    std::mutex mutex_;  // Serializes writes to out_
    std::FILE* out_;
};

} // namespace lease::log

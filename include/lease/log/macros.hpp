#pragma once

#include "logger.hpp"

/// Logging macros with file and line information.
/// LEASE_LOG_DEBUG compiles to nothing unless LEASE_DEBUG is defined.

#define LEASE_LOG_AT(lvl, fmt, ...) \
    ::lease::log::logger::instance().log( \
        (lvl), __FILE__, __LINE__, \
        fmt __VA_OPT__(,) __VA_ARGS__ \
    )

#ifdef LEASE_DEBUG
    #define LEASE_LOG_DEBUG(fmt, ...) \
        LEASE_LOG_AT(::lease::log::level::debug, fmt __VA_OPT__(,) __VA_ARGS__)
#else
    #define LEASE_LOG_DEBUG(fmt, ...) ((void)0)
#endif

#define LEASE_LOG_INFO(fmt, ...) \
    LEASE_LOG_AT(::lease::log::level::info, fmt __VA_OPT__(,) __VA_ARGS__)

#define LEASE_LOG_WARNING(fmt, ...) \
    LEASE_LOG_AT(::lease::log::level::warning, fmt __VA_OPT__(,) __VA_ARGS__)

#define LEASE_LOG_ERROR(fmt, ...) \
    LEASE_LOG_AT(::lease::log::level::error, fmt __VA_OPT__(,) __VA_ARGS__)

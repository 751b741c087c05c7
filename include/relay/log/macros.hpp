#pragma once

#include "logger.hpp"

/// relay's logging entry points
///
/// Each macro records the call site and goes through the process-wide
/// logger. The level is tested before the arguments are evaluated, so a
/// filtered line costs one atomic load. RELAY_LOG_DEBUG is compiled in only
/// with RELAY_DEBUG (cmake -DRELAY_DEBUG_LOG=ON); without it the arguments
/// are never evaluated at all.

#define RELAY_LOG_AT(lvl, fmt, ...)                                          \
    do {                                                                     \
        auto& relay_logger_ = ::relay::log::logger::instance();              \
        if (relay_logger_.enabled(lvl)) {                                    \
            relay_logger_.log((lvl), __FILE__, __LINE__,                     \
                              fmt __VA_OPT__(,) __VA_ARGS__);                \
        }                                                                    \
    } while (0)

#ifdef RELAY_DEBUG
    #define RELAY_LOG_DEBUG(fmt, ...) \
        RELAY_LOG_AT(::relay::log::level::debug, fmt __VA_OPT__(,) __VA_ARGS__)
#else
    #define RELAY_LOG_DEBUG(fmt, ...) ((void)0)
#endif

#define RELAY_LOG_INFO(fmt, ...) \
    RELAY_LOG_AT(::relay::log::level::info, fmt __VA_OPT__(,) __VA_ARGS__)

#define RELAY_LOG_WARNING(fmt, ...) \
    RELAY_LOG_AT(::relay::log::level::warning, fmt __VA_OPT__(,) __VA_ARGS__)

#define RELAY_LOG_ERROR(fmt, ...) \
    RELAY_LOG_AT(::relay::log::level::error, fmt __VA_OPT__(,) __VA_ARGS__)

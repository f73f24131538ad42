#pragma once

#include "logger.hpp"

/// Logging macros with file and line information

#ifdef HERALD_DEBUG
    #define HERALD_LOG_DEBUG(fmt, ...) \
        ::herald::log::logger::instance().log( \
            ::herald::log::level::debug, \
            __FILE__, __LINE__, \
            fmt __VA_OPT__(,) __VA_ARGS__ \
        )
#else
    #define HERALD_LOG_DEBUG(fmt, ...) ((void)0)
#endif

#define HERALD_LOG_INFO(fmt, ...) \
    ::herald::log::logger::instance().log( \
        ::herald::log::level::info, \
        __FILE__, __LINE__, \
        fmt __VA_OPT__(,) __VA_ARGS__ \
    )

#define HERALD_LOG_WARNING(fmt, ...) \
    ::herald::log::logger::instance().log( \
        ::herald::log::level::warning, \
        __FILE__, __LINE__, \
        fmt __VA_OPT__(,) __VA_ARGS__ \
    )

#define HERALD_LOG_ERROR(fmt, ...) \
    ::herald::log::logger::instance().log( \
        ::herald::log::level::error, \
        __FILE__, __LINE__, \
        fmt __VA_OPT__(,) __VA_ARGS__ \
    )

#pragma once

#include "logger.hpp"

#define SDKGATE_LOG_AT(lvl, ...) \
    ::sdkgate::log::logger::instance().log(::sdkgate::log::level::lvl, __VA_ARGS__)

// Debug records cost nothing unless compiled in
#ifdef SDKGATE_DEBUG
    #define SDKGATE_LOG_DEBUG(...) SDKGATE_LOG_AT(debug, __VA_ARGS__)
#else
    #define SDKGATE_LOG_DEBUG(...) ((void)0)
#endif

#define SDKGATE_LOG_INFO(...) SDKGATE_LOG_AT(info, __VA_ARGS__)
#define SDKGATE_LOG_WARNING(...) SDKGATE_LOG_AT(warning, __VA_ARGS__)
#define SDKGATE_LOG_ERROR(...) SDKGATE_LOG_AT(error, __VA_ARGS__)

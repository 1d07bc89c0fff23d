// formwork_log.hpp - Formwork - Diagnostic logging for tools
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

// The engine itself reports through return values and never logs.
// These macros are for drivers such as the command line tool.

#ifndef FORMWORK_LOG_HPP
#define FORMWORK_LOG_HPP

#include <cstdio>

// 0 = silent, 1 = errors, 2 = warnings, 3 = info, 4 = debug
#ifndef FORMWORK_LOG_LEVEL
#define FORMWORK_LOG_LEVEL 4
#endif

namespace formwork::log
{
    // Run-time ceiling below the compile-time one. Warnings by default.
    inline int & level()
    {
        static int current = 2;
        return current;
    }

    inline void set_level(int l) { level() = l; }
}

#define FW_LOG_AT(LVL, TAG, ...) do { if (FORMWORK_LOG_LEVEL >= (LVL) && formwork::log::level() >= (LVL)) { std::fprintf(stderr, "[formwork][" TAG "] "); std::fprintf(stderr, __VA_ARGS__); std::fprintf(stderr, "\n"); } } while(0)

#define FW_LOGE(...) FW_LOG_AT(1, "E", __VA_ARGS__)
#define FW_LOGW(...) FW_LOG_AT(2, "W", __VA_ARGS__)
#define FW_LOGI(...) FW_LOG_AT(3, "I", __VA_ARGS__)
#define FW_LOGD(...) FW_LOG_AT(4, "D", __VA_ARGS__)

#endif // FORMWORK_LOG_HPP

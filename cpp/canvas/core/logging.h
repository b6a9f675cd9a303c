#pragma once

#include <cstdio>

#ifndef CANVAS_ENABLE_LOGGING
#define CANVAS_ENABLE_LOGGING 0
#endif

#if CANVAS_ENABLE_LOGGING
#define CANVAS_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[canvas] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define CANVAS_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[canvas][warn] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define CANVAS_LOG_DEBUG(...) do { } while (0)
#define CANVAS_LOG_WARN(...) do { } while (0)
#endif

#pragma once

#include <cstdio>

#ifndef ISOVOXEL_ENABLE_LOGGING
#define ISOVOXEL_ENABLE_LOGGING 0
#endif

#if ISOVOXEL_ENABLE_LOGGING
#define ISOVOXEL_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[isovoxel] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define ISOVOXEL_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[isovoxel] warn: "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define ISOVOXEL_LOG_DEBUG(...) do { } while (0)
#define ISOVOXEL_LOG_WARN(...) do { } while (0)
#endif

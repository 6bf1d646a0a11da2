#pragma once

#include <cstdio>

#ifndef PROCGEO_ENABLE_LOGGING
#define PROCGEO_ENABLE_LOGGING 0
#endif

#if PROCGEO_ENABLE_LOGGING
#define PROCGEO_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[procgeo] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define PROCGEO_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[procgeo][warn] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define PROCGEO_LOG_DEBUG(...) do { } while (0)
#define PROCGEO_LOG_WARN(...) do { } while (0)
#endif

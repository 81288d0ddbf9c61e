#pragma once

/// Cross-platform logging macros for the math text pipeline.
/// Android: uses __android_log_print
/// Other platforms: uses fprintf(stderr, ...)
/// Define MATHTEXT_QUIET to compile debug messages out.

#ifdef __ANDROID__

#include <android/log.h>

#define MT_LOG_TAG "MathText"
#ifdef MATHTEXT_QUIET
#define MT_LOGD(...) ((void)0)
#else
#define MT_LOGD(...) __android_log_print(ANDROID_LOG_DEBUG, MT_LOG_TAG, __VA_ARGS__)
#endif
#define MT_LOGI(...) __android_log_print(ANDROID_LOG_INFO,  MT_LOG_TAG, __VA_ARGS__)
#define MT_LOGW(...) __android_log_print(ANDROID_LOG_WARN,  MT_LOG_TAG, __VA_ARGS__)

#else

#include <cstdio>

#ifdef MATHTEXT_QUIET
#define MT_LOGD(fmt, ...) ((void)0)
#else
#define MT_LOGD(fmt, ...) fprintf(stderr, "[MathText D] " fmt "\n", ##__VA_ARGS__)
#endif
#define MT_LOGI(fmt, ...) fprintf(stderr, "[MathText I] " fmt "\n", ##__VA_ARGS__)
#define MT_LOGW(fmt, ...) fprintf(stderr, "[MathText W] " fmt "\n", ##__VA_ARGS__)

#endif

#ifndef MRZSCAN_LOG_H
#define MRZSCAN_LOG_H

/**
 * Logging macros shared by the native sources.
 *
 * Each translation unit defines TAG before including this header and logs
 * with printf-style LOGD/LOGI/LOGW/LOGE. On Android the messages go to
 * logcat; on host builds they go to spdlog.
 */

#ifndef TAG
#define TAG "MRZScan"
#endif

#if defined(__ANDROID__)

#include <android/log.h>

#define LOGD(...) __android_log_print(ANDROID_LOG_DEBUG, TAG, __VA_ARGS__)
#define LOGI(...) __android_log_print(ANDROID_LOG_INFO, TAG, __VA_ARGS__)
#define LOGW(...) __android_log_print(ANDROID_LOG_WARN, TAG, __VA_ARGS__)
#define LOGE(...) __android_log_print(ANDROID_LOG_ERROR, TAG, __VA_ARGS__)

#else

#include <fmt/printf.h>
#include <spdlog/spdlog.h>

#define LOGD(...) spdlog::debug("[{}] {}", TAG, fmt::sprintf(__VA_ARGS__))
#define LOGI(...) spdlog::info("[{}] {}", TAG, fmt::sprintf(__VA_ARGS__))
#define LOGW(...) spdlog::warn("[{}] {}", TAG, fmt::sprintf(__VA_ARGS__))
#define LOGE(...) spdlog::error("[{}] {}", TAG, fmt::sprintf(__VA_ARGS__))

#endif

#endif // MRZSCAN_LOG_H

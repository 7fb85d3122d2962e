/**
 * @file logging.hpp
 * @brief Logging macros
 *
 * @details Provides compile-time controlled logging macros (LOG_INFO,
 *          LOG_WARN, LOG_ERROR, LOG_PHASE, LOG_SUCCESS). Messages from
 *          concurrent job threads are serialized by a global mutex.
 *
 * @note All logs use fmt::print for type-safe formatting and are flushed
 *       immediately so progress from job threads shows up in order.
 */

#ifndef KEYOUT_LOGGING_HPP
#define KEYOUT_LOGGING_HPP

#include <cstdio>
#include <mutex>

#include <fmt/color.h>
#include <fmt/core.h>

namespace keyout {

// **----- LOGGING CONFIGURATION -----**

/**
 * @brief Logging is controlled by KEYOUT_ENABLE_LOGGING at compile time.
 */
#ifndef KEYOUT_ENABLE_LOGGING
#define KEYOUT_ENABLE_LOGGING 1
#endif

/// Global log mutex (defined in logging.cpp)
extern std::mutex log_mutex;

// **----- LOGGING MACROS -----**

#if KEYOUT_ENABLE_LOGGING
#define LOG_INFO(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(keyout::log_mutex);                       \
    fmt::print("[INFO] " format_str "\n", ##__VA_ARGS__);                      \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_WARN(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(keyout::log_mutex);                       \
    fmt::print(fg(fmt::color::yellow), "[WARN] " format_str "\n",              \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_ERROR(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(keyout::log_mutex);                       \
    fmt::print(fg(fmt::color::red), "[ERROR] " format_str "\n",                \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_PHASE(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(keyout::log_mutex);                       \
    fmt::print(fg(fmt::color::cyan), format_str "\n", ##__VA_ARGS__);          \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_SUCCESS(format_str, ...)                                           \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(keyout::log_mutex);                       \
    fmt::print(fg(fmt::color::green), format_str "\n", ##__VA_ARGS__);         \
    std::fflush(stdout);                                                       \
  } while (0)
#else
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

} // namespace keyout

#endif // KEYOUT_LOGGING_HPP

/**
 * @file system.hpp
 * @brief Identifiers and time formatting utilities
 *
 * @details Provides:
 *
 *          - UUID4 identifier generation and validation (ids become path
 *            components, so validation also rules out traversal)
 *
 *          - Duration and timestamp formatting for logs and JSON
 */

#ifndef KEYOUT_SYSTEM_HPP
#define KEYOUT_SYSTEM_HPP

#include <chrono>
#include <string>

namespace keyout {

// **---- Identifiers ----**

/**
 * @brief Generate a random lower-case UUID4 string.
 * @note Thread-safe.
 */
std::string generate_id();

/**
 * @brief Check that an id is a canonical lower-case UUID4.
 */
bool is_valid_id(const std::string &id);

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS string.
 * @param seconds Time in seconds
 * @return Formatted string in HH:MM:SS format
 */
std::string format_time(double seconds);

/**
 * @brief Format a wall clock time as ISO 8601 UTC with milliseconds.
 */
std::string format_timestamp(std::chrono::system_clock::time_point tp);

} // namespace keyout

#endif // KEYOUT_SYSTEM_HPP

/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables.
 *          Option structs (RegistryOptions, ServiceOptions) take their
 *          defaults from here and may be overridden in code.
 */

#ifndef KEYOUT_CONFIG_HPP
#define KEYOUT_CONFIG_HPP

#include <cstdlib>
#include <string>

namespace keyout {
namespace Config {

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value or default
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::atoi(val) : default_val;
}

/**
 * @brief Get a non-negative count from environment variable.
 * @note Negative values fall back to the default.
 */
inline int get_env_count(const char *name, int default_val) {
  int val = get_env_int(name, default_val);
  return val < 0 ? default_val : val;
}

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 */
inline std::string get_env_string(const char *name, const char *default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : std::string(default_val);
}

// **---- ENCODER ----**

/// Encoder binary, resolved through PATH when not absolute
inline const std::string &encoder_path() {
  static std::string val = get_env_string("KEYOUT_ENCODER", "ffmpeg");
  return val;
}

/// Root directory for assets, outputs, previews and logs
inline const std::string &data_dir() {
  static std::string val = get_env_string("KEYOUT_DATA_DIR", "./.data");
  return val;
}

// **---- JOBS ----**

/**
 * @brief Maximum number of encoder processes running at once
 * @note 0 = unbounded (one process per job as soon as it is created).
 *       N > 0 keeps further jobs queued until a slot frees up.
 */
inline int max_concurrent_jobs() {
  static int val = get_env_count("KEYOUT_MAX_CONCURRENT_JOBS", 0);
  return val;
}

/// Milliseconds between SIGTERM and SIGKILL when canceling
inline int cancel_grace_ms() {
  static int val = get_env_count("KEYOUT_CANCEL_GRACE_MS", 5000);
  return val;
}

/// Capacity of each job's diagnostic log tail
inline int log_tail_lines() {
  static int val = get_env_count("KEYOUT_LOG_TAIL_LINES", 20);
  return val;
}

/// Log lines quoted in a failed job's message
inline int failure_context_lines() {
  static int val = get_env_count("KEYOUT_FAILURE_CONTEXT_LINES", 10);
  return val;
}

// **---- KEYING ----**

/// Channel quantization step for key estimation
inline int key_quant_step() {
  static int val = get_env_count("KEYOUT_KEY_QUANT_STEP", 8);
  return val;
}

/// Minimum samples below which key estimation fails
inline int min_key_samples() {
  static int val = get_env_count("KEYOUT_MIN_KEY_SAMPLES", 4);
  return val;
}

inline int preview_max_width() {
  static int val = get_env_int("KEYOUT_PREVIEW_MAX_WIDTH", 640);
  return val;
}

inline int default_crf() {
  static int val = get_env_int("KEYOUT_DEFAULT_CRF", 24);
  return val;
}

} // namespace Config
} // namespace keyout

#endif // KEYOUT_CONFIG_HPP

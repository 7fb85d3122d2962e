/**
 * @file progress_parser.cpp
 * @brief Incremental -progress stream parser implementation
 */

#include "keyout/progress_parser.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace keyout {

namespace {

std::string trim(const std::string &s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
    ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
    --e;
  return s.substr(b, e - b);
}

/// Strict non-negative integer parse (no sign, no trailing garbage)
bool parse_uint(const std::string &s, int64_t &out) {
  if (s.empty() || s.size() > 18)
    return false;
  int64_t v = 0;
  for (char c : s) {
    if (!std::isdigit(static_cast<unsigned char>(c)))
      return false;
    v = v * 10 + (c - '0');
  }
  out = v;
  return true;
}

/// "HH:MM:SS.ffffff" -> microseconds
bool parse_clock(const std::string &s, int64_t &out) {
  size_t c1 = s.find(':');
  size_t c2 = (c1 == std::string::npos) ? c1 : s.find(':', c1 + 1);
  if (c2 == std::string::npos)
    return false;

  int64_t h = 0;
  int64_t m = 0;
  if (!parse_uint(s.substr(0, c1), h) ||
      !parse_uint(s.substr(c1 + 1, c2 - c1 - 1), m))
    return false;

  std::string sec = s.substr(c2 + 1);
  if (sec.empty() || !std::isdigit(static_cast<unsigned char>(sec[0])))
    return false;
  char *end = nullptr;
  double seconds = std::strtod(sec.c_str(), &end);
  if (end == nullptr || *end != '\0' || seconds < 0)
    return false;

  out = (h * 3600 + m * 60) * 1000000 +
        static_cast<int64_t>(std::llround(seconds * 1e6));
  return true;
}

} // anonymous namespace

ProgressParser::ProgressParser(double total_duration_sec)
    : total_us_(total_duration_sec > 0
                    ? static_cast<int64_t>(std::llround(total_duration_sec * 1e6))
                    : 0) {}

bool ProgressParser::parse_out_time(const std::string &line, int64_t &us) {
  std::string t = trim(line);
  size_t eq = t.find('=');
  if (eq == std::string::npos)
    return false;

  std::string key = t.substr(0, eq);
  std::string value = t.substr(eq + 1);

  if (key == "out_time_us" || key == "out_time_ms")
    return parse_uint(value, us);
  if (key == "out_time")
    return parse_clock(value, us);
  return false;
}

bool ProgressParser::feed(const std::string &line) {
  if (trim(line) == "progress=end") {
    finished_ = true;
    return false;
  }

  int64_t us = 0;
  if (!parse_out_time(line, us))
    return false;
  if (us <= out_time_us_)
    return false;
  out_time_us_ = us;

  if (total_us_ <= 0)
    return false;

  double p = std::min(1.0, static_cast<double>(us) / total_us_);
  if (p <= progress_)
    return false;
  progress_ = p;
  return true;
}

} // namespace keyout

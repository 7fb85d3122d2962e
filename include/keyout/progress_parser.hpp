/**
 * @file progress_parser.hpp
 * @brief Incremental parser for the encoder's -progress stream
 *
 * @details Fed one line at a time. The only state kept is the furthest
 *          output time seen, so progress never goes backwards and the
 *          stream is never buffered.
 *
 *          Recognized keys (ffmpeg writes microseconds under both *_us
 *          and *_ms):
 *
 *          - out_time_us=<int>
 *
 *          - out_time_ms=<int>
 *
 *          - out_time=HH:MM:SS.ffffff
 *
 *          - progress=end
 */

#ifndef KEYOUT_PROGRESS_PARSER_HPP
#define KEYOUT_PROGRESS_PARSER_HPP

#include <cstdint>
#include <string>

namespace keyout {

class ProgressParser {
public:
  /**
   * @param total_duration_sec Media duration; <= 0 disables fractional
   *        progress (feed() then never reports an advance)
   */
  explicit ProgressParser(double total_duration_sec);

  /**
   * @brief Consume one line.
   * @return true if progress() advanced because of this line
   */
  bool feed(const std::string &line);

  /// Fraction in [0, 1], non-decreasing
  double progress() const { return progress_; }

  /// Furthest output time seen, -1 before the first marker
  int64_t out_time_us() const { return out_time_us_; }

  /// True once progress=end was seen
  bool finished() const { return finished_; }

  /**
   * @brief Parse a single out_time marker.
   * @param line Raw line
   * @param us Output: microseconds
   * @return false if the line is not a usable time marker
   */
  static bool parse_out_time(const std::string &line, int64_t &us);

private:
  int64_t total_us_;
  int64_t out_time_us_{-1};
  double progress_{0.0};
  bool finished_{false};
};

} // namespace keyout

#endif // KEYOUT_PROGRESS_PARSER_HPP

/**
 * @file job.hpp
 * @brief Job records, snapshots and their JSON form
 */

#ifndef KEYOUT_JOB_HPP
#define KEYOUT_JOB_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "key_estimator.hpp"
#include "types.hpp"

namespace keyout {

using Clock = std::chrono::system_clock;

/**
 * @class LogTail
 * @brief Fixed-capacity line buffer; the oldest line is evicted first.
 */
class LogTail {
public:
  explicit LogTail(size_t capacity = 20) : capacity_(capacity) {}

  void push(std::string line);

  /// Lines oldest first
  std::vector<std::string> lines() const {
    return {lines_.begin(), lines_.end()};
  }

  /// The newest n lines joined with '\n'
  std::string last(size_t n) const;

  size_t size() const { return lines_.size(); }
  size_t capacity() const { return capacity_; }

private:
  size_t capacity_;
  std::deque<std::string> lines_;
};

/**
 * @struct JobOutput
 * @brief Produced file of a finished job.
 */
struct JobOutput {
  std::string path;
  uint64_t size_bytes = 0;
};

/**
 * @struct JobSnapshot
 * @brief Consistent copy of a job's state at one instant.
 */
struct JobSnapshot {
  std::string id;
  std::string asset_id;
  AssetKind kind = AssetKind::Video;
  JobStatus status = JobStatus::Queued;
  double progress = 0.0;
  std::string key_hex;
  KeyingParameters params;
  std::string message;
  std::vector<std::string> log_tail;
  Clock::time_point created_at;
  std::optional<Clock::time_point> started_at;
  std::optional<Clock::time_point> finished_at;
  std::optional<JobOutput> output;
  std::string failure_message;
};

void to_json(nlohmann::json &j, const JobSnapshot &s);
void to_json(nlohmann::json &j, const KeyEstimate &e);

} // namespace keyout

#endif // KEYOUT_JOB_HPP

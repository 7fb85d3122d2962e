/**
 * @file job.cpp
 * @brief Log tail and JSON serialization
 */

#include "keyout/job.hpp"

#include <filesystem>
#include <utility>

#include "keyout/system.hpp"

namespace keyout {

// **---- LogTail ----**

void LogTail::push(std::string line) {
  if (capacity_ == 0)
    return;
  if (lines_.size() == capacity_)
    lines_.pop_front();
  lines_.push_back(std::move(line));
}

std::string LogTail::last(size_t n) const {
  std::string out;
  size_t start = lines_.size() > n ? lines_.size() - n : 0;
  for (size_t i = start; i < lines_.size(); ++i) {
    if (!out.empty())
      out += '\n';
    out += lines_[i];
  }
  return out;
}

// **---- JSON ----**

void to_json(nlohmann::json &j, const JobSnapshot &s) {
  j = nlohmann::json{
      {"job_id", s.id},
      {"asset_id", s.asset_id},
      {"asset_type", asset_kind_name(s.kind)},
      {"status", job_status_name(s.status)},
      {"progress", s.progress},
      {"hex", s.key_hex},
      {"similarity", s.params.similarity},
      {"blend", s.params.blend},
      {"created_at", format_timestamp(s.created_at)},
      {"last_log_lines", s.log_tail},
  };

  j["message"] = s.message.empty() ? nlohmann::json() : nlohmann::json(s.message);
  j["started_at"] = s.started_at ? nlohmann::json(format_timestamp(*s.started_at))
                                 : nlohmann::json();
  j["finished_at"] = s.finished_at
                         ? nlohmann::json(format_timestamp(*s.finished_at))
                         : nlohmann::json();

  if (s.kind == AssetKind::Video) {
    j["crf"] = s.params.crf;
    j["include_audio"] = s.params.include_audio;
  }

  if (s.output) {
    j["output_filename"] =
        std::filesystem::path(s.output->path).filename().string();
    j["output_size_bytes"] = s.output->size_bytes;
  } else {
    j["output_filename"] = nullptr;
    j["output_size_bytes"] = nullptr;
  }

  if (!s.failure_message.empty())
    j["failure_message"] = s.failure_message;
}

void to_json(nlohmann::json &j, const KeyEstimate &e) {
  j = nlohmann::json{
      {"hex", e.color.hex},
      {"rgb", {{"r", e.color.rgb.r}, {"g", e.color.rgb.g}, {"b", e.color.rgb.b}}},
      {"samples", e.sample_count},
  };
}

} // namespace keyout

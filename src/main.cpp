/**
 * @file main.cpp
 * @brief Entry point for the keyout command-line driver
 *
 * @details Subcommands:
 *
 *          - probe: report the encoder version
 *
 *          - estimate <file>: import a file and print its estimated key
 *
 *          - preview <file> <out.png>: write a keyed preview frame
 *
 *          - render <file>: import, key and render, printing the final job
 *
 * @note Ctrl-C during a render cancels the job; the encoder's process group
 *       gets SIGTERM, then SIGKILL after KEYOUT_CANCEL_GRACE_MS.
 */

#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "keyout/asset_store.hpp"
#include "keyout/config.hpp"
#include "keyout/job.hpp"
#include "keyout/job_registry.hpp"
#include "keyout/keying_service.hpp"
#include "keyout/logging.hpp"
#include "keyout/process_supervisor.hpp"
#include "keyout/system.hpp"

using namespace keyout;

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void on_sigint(int) { g_interrupted = 1; }

struct CliOptions {
  std::string hex;
  KeyingParameters params;
  double time = 0.5;
  int width = Config::preview_max_width();
  std::vector<std::string> positional;
};

void print_usage() {
  LOG_WARN("Usage: keyout probe");
  LOG_WARN("       keyout estimate <file>");
  LOG_WARN("       keyout preview <file> <out.png> [options]");
  LOG_WARN("       keyout render <file> [options]");
  LOG_WARN("Options: --hex RRGGBB --similarity S --blend B --crf N "
           "--no-audio --time T --width W");
}

bool parse_number(const std::string &text, double &out) {
  char *end = nullptr;
  out = std::strtod(text.c_str(), &end);
  return !text.empty() && end && *end == '\0';
}

bool parse_options(int argc, char *argv[], int first, CliOptions &opts) {
  opts.params.crf = Config::default_crf();

  for (int i = first; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--no-audio") {
      opts.params.include_audio = false;
      continue;
    }
    if (arg.rfind("--", 0) != 0) {
      opts.positional.push_back(arg);
      continue;
    }
    if (i + 1 >= argc) {
      LOG_ERROR("Missing value for {}", arg);
      return false;
    }

    std::string value = argv[++i];
    if (arg == "--hex") {
      opts.hex = value;
      continue;
    }

    double num = 0.0;
    if (!parse_number(value, num)) {
      LOG_ERROR("Invalid value for {}: '{}'", arg, value);
      return false;
    }
    if (arg == "--similarity") {
      opts.params.similarity = num;
    } else if (arg == "--blend") {
      opts.params.blend = num;
    } else if (arg == "--crf") {
      opts.params.crf = static_cast<int>(num);
    } else if (arg == "--time") {
      opts.time = num;
    } else if (arg == "--width") {
      opts.width = static_cast<int>(num);
    } else {
      LOG_ERROR("Unknown option: {}", arg);
      return false;
    }
  }
  return true;
}

int report(const Error &err) {
  LOG_ERROR("{}: {}", error_kind_name(err.kind), err.message);
  return 1;
}

// **---- SUBCOMMANDS ----**

int cmd_probe(const KeyingService &service) {
  std::string version;
  Error err;
  if (!service.probe_encoder(version, err))
    return report(err);
  fmt::print("{}\n", version);
  return 0;
}

int cmd_estimate(DirectoryAssetStore &assets, const KeyingService &service,
                 const CliOptions &opts) {
  if (opts.positional.size() != 1) {
    print_usage();
    return 1;
  }

  Asset asset;
  KeyEstimate estimate;
  Error err;
  if (!assets.import_file(opts.positional[0], asset, err) ||
      !service.estimate_key(asset.id, estimate, err))
    return report(err);

  nlohmann::json j = estimate;
  j["asset_id"] = asset.id;
  fmt::print("{}\n", j.dump(2));
  return 0;
}

int cmd_preview(DirectoryAssetStore &assets, const KeyingService &service,
                const CliOptions &opts) {
  if (opts.positional.size() != 2) {
    print_usage();
    return 1;
  }

  Asset asset;
  Error err;
  if (!assets.import_file(opts.positional[0], asset, err))
    return report(err);

  PreviewRequest req;
  req.hex = opts.hex;
  req.params = opts.params;
  req.time = opts.time;
  req.max_width = opts.width;
  if (req.hex.empty()) {
    KeyEstimate estimate;
    if (!service.estimate_key(asset.id, estimate, err))
      return report(err);
    req.hex = estimate.color.hex;
    LOG_INFO("Using estimated key #{}", req.hex);
  }

  std::vector<uint8_t> png;
  if (!service.preview(asset.id, req, png, err))
    return report(err);

  std::ofstream out(opts.positional[1], std::ios::binary | std::ios::trunc);
  out.write(reinterpret_cast<const char *>(png.data()),
            static_cast<std::streamsize>(png.size()));
  if (!out) {
    LOG_ERROR("Failed to write {}", opts.positional[1]);
    return 1;
  }
  LOG_SUCCESS("Preview written: {} ({} bytes)", opts.positional[1],
              png.size());
  return 0;
}

int cmd_render(DirectoryAssetStore &assets, const KeyingService &service,
               JobRegistry &registry, const CliOptions &opts) {
  if (opts.positional.size() != 1) {
    print_usage();
    return 1;
  }

  Asset asset;
  Error err;
  if (!assets.import_file(opts.positional[0], asset, err))
    return report(err);

  RenderRequest req;
  req.hex = opts.hex;
  req.params = opts.params;
  if (asset.kind == AssetKind::Video && !asset.metadata.has_audio)
    req.params.include_audio = false;
  if (req.hex.empty()) {
    KeyEstimate estimate;
    if (!service.estimate_key(asset.id, estimate, err))
      return report(err);
    req.hex = estimate.color.hex;
    LOG_INFO("Using estimated key #{}", req.hex);
  }

  std::string job_id;
  if (!registry.start_render(asset.id, req, job_id, err))
    return report(err);

  std::signal(SIGINT, on_sigint);

  JobSnapshot snap;
  double last_reported = -1.0;
  while (true) {
    if (!registry.wait(job_id, std::chrono::milliseconds(500), snap, err))
      return report(err);
    if (is_terminal(snap.status))
      break;

    if (g_interrupted) {
      LOG_WARN("Interrupted, canceling job {}", job_id);
      JobStatus status;
      if (!registry.cancel(job_id, status, err))
        return report(err);
      continue;
    }

    if (snap.status == JobStatus::Running &&
        snap.progress >= last_reported + 0.01) {
      last_reported = snap.progress;
      LOG_INFO("[Job {}] {:.1f}% ({} of {})", job_id, snap.progress * 100.0,
               format_time(snap.progress * asset.metadata.duration),
               format_time(asset.metadata.duration));
    }
  }

  std::signal(SIGINT, SIG_DFL);

  nlohmann::json j = snap;
  fmt::print("{}\n", j.dump(2));

  if (snap.status != JobStatus::Done) {
    if (!snap.failure_message.empty())
      LOG_ERROR("{}", snap.failure_message);
    return 1;
  }
  LOG_SUCCESS("Output: {}", snap.output->path);
  return 0;
}

} // anonymous namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  if (argc < 2) {
    print_usage();
    return 1;
  }

  std::string command = argv[1];
  CliOptions opts;
  if (!parse_options(argc, argv, 2, opts)) {
    print_usage();
    return 1;
  }

  DirectoryAssetStore assets(Config::data_dir());
  OutputStore outputs(Config::data_dir());
  ProcessSupervisor supervisor(
      std::chrono::milliseconds(Config::cancel_grace_ms()));
  KeyingService service(assets, outputs, supervisor);

  if (command == "probe")
    return cmd_probe(service);
  if (command == "estimate")
    return cmd_estimate(assets, service, opts);
  if (command == "preview")
    return cmd_preview(assets, service, opts);
  if (command == "render") {
    JobRegistry registry(assets, outputs, supervisor);
    return cmd_render(assets, service, registry, opts);
  }

  LOG_ERROR("Unknown command: {}", command);
  print_usage();
  return 1;
}

/**
 * @file keying_service.cpp
 * @brief Encoder probe, key estimation and preview implementation
 */

#include "keyout/keying_service.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

#include <fmt/core.h>

#include "keyout/command_builder.hpp"
#include "keyout/job.hpp"
#include "keyout/logging.hpp"
#include "keyout/system.hpp"

namespace keyout {

namespace fs = std::filesystem;

KeyingService::KeyingService(const AssetStore &assets,
                             const OutputStore &outputs,
                             const ProcessSupervisor &supervisor,
                             ServiceOptions options)
    : assets_(assets), outputs_(outputs), supervisor_(supervisor),
      options_(std::move(options)) {}

bool KeyingService::run_encoder(const std::vector<std::string> &argv,
                                bool capture_stdout, ProcessResult &result,
                                Error &err) const {
  LogTail tail(options_.failure_context_lines);

  LaunchRequest launch;
  launch.argv = argv;
  launch.capture_stdout = capture_stdout;
  launch.on_line = [&tail](const std::string &line) { tail.push(line); };

  if (!supervisor_.run(launch, result, err)) {
    LOG_ERROR("{}", err.message);
    return false;
  }

  if (!result.success()) {
    std::string context = tail.last(options_.failure_context_lines);
    err.set(ErrorKind::EncoderRuntime,
            context.empty()
                ? fmt::format("Encoder failed with {}", result.describe())
                : fmt::format("Encoder failed with {}\n{}",
                              result.describe(), context));
    LOG_ERROR("Encoder failed with {}: {}", result.describe(),
              join_command(argv));
    return false;
  }
  return true;
}

bool KeyingService::probe_encoder(std::string &version, Error &err) const {
  ProcessResult result;
  if (!run_encoder({options_.encoder, "-version"}, true, result, err))
    return false;

  std::string out(result.stdout_data.begin(), result.stdout_data.end());
  version = out.substr(0, out.find('\n'));
  return true;
}

bool KeyingService::estimate_key(const std::string &asset_id,
                                 KeyEstimate &estimate, Error &err) const {
  Asset asset;
  if (!assets_.resolve(asset_id, asset, err))
    return false;

  CommandRequest cmd;
  cmd.mode = CommandMode::SampleFrame;
  cmd.kind = asset.kind;
  cmd.metadata = asset.metadata;
  cmd.encoder = options_.encoder;
  cmd.input_path = asset.path;
  cmd.time = key_sample_time(asset.metadata, asset.kind);

  std::vector<std::string> argv;
  if (!build_command(cmd, argv, err))
    return false;

  ProcessResult result;
  if (!run_encoder(argv, true, result, err))
    return false;

  std::vector<Rgb> samples;
  if (!gather_samples(result.stdout_data, asset.metadata.width,
                      asset.metadata.height, samples)) {
    return err.set(ErrorKind::EncoderRuntime,
                   fmt::format("Encoder returned {} bytes, expected a {}x{} "
                               "rgb24 frame",
                               result.stdout_data.size(), asset.metadata.width,
                               asset.metadata.height));
  }

  if (!keyout::estimate_key(samples, options_.quant_step, options_.min_samples,
                            estimate, err)) {
    LOG_WARN("Key estimation failed for asset {}: {}", asset_id, err.message);
    return false;
  }

  LOG_INFO("Estimated key #{} for asset {} from {} samples",
           estimate.color.hex, asset_id, estimate.sample_count);
  return true;
}

bool KeyingService::preview(const std::string &asset_id,
                            const PreviewRequest &req,
                            std::vector<uint8_t> &png, Error &err) const {
  Asset asset;
  if (!assets_.resolve(asset_id, asset, err))
    return false;

  CommandRequest cmd;
  cmd.mode = CommandMode::Preview;
  cmd.kind = asset.kind;
  cmd.metadata = asset.metadata;
  cmd.params = req.params;
  cmd.encoder = options_.encoder;
  cmd.input_path = asset.path;
  cmd.time = req.time;
  cmd.max_width = req.max_width;
  if (!parse_hex_color(req.hex, cmd.key, err))
    return false;

  /// Validate before allocating a preview directory
  if (!validate_parameters(cmd.params, cmd.metadata, cmd.kind, cmd.mode, err) ||
      !validate_preview_width(cmd.max_width, err))
    return false;

  std::string preview_id = generate_id();
  if (!outputs_.preview_path(preview_id, cmd.output_path, err))
    return false;

  /// Every path past this point removes the preview directory
  std::vector<std::string> argv;
  ProcessResult result;
  bool ok = build_command(cmd, argv, err) &&
            run_encoder(argv, false, result, err);
  if (ok) {
    std::ifstream in(cmd.output_path, std::ios::binary);
    png.assign(std::istreambuf_iterator<char>(in),
               std::istreambuf_iterator<char>());
    if (png.empty()) {
      ok = err.set(ErrorKind::EncoderRuntime,
                   "Encoder exited successfully but produced no preview");
    }
  }

  std::error_code ec;
  fs::remove_all(fs::path(cmd.output_path).parent_path(), ec);
  return ok;
}

} // namespace keyout

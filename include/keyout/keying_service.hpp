/**
 * @file keying_service.hpp
 * @brief Synchronous keying operations: encoder probe, key estimation,
 *        preview
 *
 * @details These calls run one short encoder invocation each and block the
 *          caller until it exits. Long renders go through JobRegistry.
 */

#ifndef KEYOUT_KEYING_SERVICE_HPP
#define KEYOUT_KEYING_SERVICE_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "asset_store.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "key_estimator.hpp"
#include "process_supervisor.hpp"
#include "types.hpp"

namespace keyout {

/**
 * @struct ServiceOptions
 * @brief Service tuning; defaults come from the environment (Config).
 */
struct ServiceOptions {
  std::string encoder = Config::encoder_path();
  int quant_step = Config::key_quant_step();
  size_t min_samples = static_cast<size_t>(Config::min_key_samples());
  size_t failure_context_lines =
      static_cast<size_t>(Config::failure_context_lines());
};

/**
 * @struct PreviewRequest
 * @brief Key color, parameters and framing of a preview.
 */
struct PreviewRequest {
  std::string hex;
  KeyingParameters params;
  double time = 0.5; //< Seconds into a video; ignored for images
  int max_width = Config::preview_max_width();
};

class KeyingService {
public:
  KeyingService(const AssetStore &assets, const OutputStore &outputs,
                const ProcessSupervisor &supervisor,
                ServiceOptions options = ServiceOptions());

  /**
   * @brief Run `<encoder> -version` and return its first line.
   * @param err EncoderLaunch or EncoderRuntime
   */
  bool probe_encoder(std::string &version, Error &err) const;

  /**
   * @brief Estimate the background color of an asset.
   *
   * @note Video assets are sampled at 10% of their duration.
   * @param err AssetNotFound, EncoderLaunch, EncoderRuntime or
   *        InsufficientSample
   */
  bool estimate_key(const std::string &asset_id, KeyEstimate &estimate,
                    Error &err) const;

  /**
   * @brief Render a single keyed, downscaled PNG frame.
   * @param png Output: PNG file contents
   * @param err AssetNotFound, InvalidParameter, EncoderLaunch or
   *        EncoderRuntime
   */
  bool preview(const std::string &asset_id, const PreviewRequest &req,
               std::vector<uint8_t> &png, Error &err) const;

private:
  /// Run a short invocation; non-zero exit becomes EncoderRuntime
  bool run_encoder(const std::vector<std::string> &argv, bool capture_stdout,
                   ProcessResult &result, Error &err) const;

  const AssetStore &assets_;
  const OutputStore &outputs_;
  const ProcessSupervisor &supervisor_;
  ServiceOptions options_;
};

} // namespace keyout

#endif // KEYOUT_KEYING_SERVICE_HPP

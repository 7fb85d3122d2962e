/**
 * @file command_builder.hpp
 * @brief Encoder argument lists for preview, render and sampling
 *
 * @details Pure functions: nothing here touches the filesystem or spawns a
 *          process. Modes:
 *
 *          - Preview: one keyed frame, downscaled, written as PNG
 *
 *          - RenderImage: keyed full resolution PNG with alpha
 *
 *          - RenderVideo: keyed VP9 WebM with alpha, optional Opus audio
 *
 *          - SampleFrame: one unkeyed rgb24 frame on stdout for key estimation
 */

#ifndef KEYOUT_COMMAND_BUILDER_HPP
#define KEYOUT_COMMAND_BUILDER_HPP

#include <string>
#include <vector>

#include "errors.hpp"
#include "types.hpp"

namespace keyout {

enum class CommandMode { Preview, RenderImage, RenderVideo, SampleFrame };

/**
 * @struct CommandRequest
 * @brief Everything needed to build one encoder invocation.
 */
struct CommandRequest {
  CommandMode mode = CommandMode::RenderVideo;
  AssetKind kind = AssetKind::Video;
  AssetMetadata metadata;
  KeyingParameters params;
  KeyColor key;
  std::string encoder = "ffmpeg"; //< argv[0]
  std::string input_path;
  std::string output_path;        //< Ignored for SampleFrame (stdout)
  double time = 0.0;              //< Preview/sample timestamp (video only)
  int max_width = 640;            //< Preview width bound
};

/**
 * @brief Check keying parameters against their ranges and the asset.
 *
 * @note Video-only options (crf, include_audio) are checked for RenderVideo
 *       only. Asking for audio on a video without an audio stream fails.
 */
bool validate_parameters(const KeyingParameters &params,
                         const AssetMetadata &meta, AssetKind kind,
                         CommandMode mode, Error &err);

/// Preview width must lie in [MIN_PREVIEW_WIDTH, MAX_PREVIEW_WIDTH]
bool validate_preview_width(int max_width, Error &err);

/**
 * @brief Format a tolerance with the shortest round-trip representation.
 */
std::string format_tolerance(double value);

/**
 * @brief chromakey filter expression for a key color and tolerances.
 * @note A similarity of 0 is raised to CHROMAKEY_MIN_SIMILARITY.
 */
std::string chromakey_filter(const KeyColor &key, double similarity,
                             double blend);

/**
 * @brief Clamp a seek time into [0, duration - SEEK_END_MARGIN_SEC].
 */
double clamp_seek_time(double time, double duration);

/**
 * @brief Build the full argument list (argv[0] = encoder).
 * @param req Mode, asset, parameters and paths
 * @param argv Output argument list
 * @param err InvalidParameter when validation fails
 */
bool build_command(const CommandRequest &req, std::vector<std::string> &argv,
                   Error &err);

/**
 * @brief Join an argument list for logging (quotes arguments with spaces).
 */
std::string join_command(const std::vector<std::string> &argv);

/**
 * @brief File extension of a render output for the asset kind.
 */
const char *output_extension(AssetKind kind);

} // namespace keyout

#endif // KEYOUT_COMMAND_BUILDER_HPP

/**
 * @file types.hpp
 * @brief Core data types and constants for keyout
 *
 * @details Contains fundamental data structures used throughout the
 * application:
 *          - Asset kinds and probed media metadata
 *
 *          - RGB pixels and key colors
 *
 *          - Keying parameters and their accepted ranges
 *
 *          - Job status values
 */

#ifndef KEYOUT_TYPES_HPP
#define KEYOUT_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <string>

namespace keyout {

// **----- CONSTANTS -----**

/// Upper bound for similarity and blend accepted from callers
constexpr double MAX_KEY_TOLERANCE = 0.5;

/**
 * @brief Smallest similarity ffmpeg's chromakey filter accepts.
 * @note A requested similarity of exactly 0 is emitted as this value so the
 *       filter stays in the graph.
 */
constexpr double CHROMAKEY_MIN_SIMILARITY = 0.00001;

constexpr int MIN_CRF = 10;
constexpr int MAX_CRF = 63;

constexpr int MIN_PREVIEW_WIDTH = 100;
constexpr int MAX_PREVIEW_WIDTH = 1920;

/// Distance kept from the end of a video when seeking for a single frame
constexpr double SEEK_END_MARGIN_SEC = 0.1;

/// Relative position of the frame used for key estimation
constexpr double KEY_SAMPLE_POSITION = 0.10;

// **----- DATA STRUCTURES -----**

enum class AssetKind { Video, Image };

const char *asset_kind_name(AssetKind kind);

/**
 * @struct AssetMetadata
 * @brief Probed properties of an asset.
 * @note duration, fps and has_audio are meaningful for videos only.
 */
struct AssetMetadata {
  int width = 0;          //< Frame width in pixels
  int height = 0;         //< Frame height in pixels
  double duration = 0.0;  //< Duration in seconds (video)
  double fps = 0.0;       //< Frame rate (video)
  bool has_audio = false; //< Audio stream present (video)
};

/**
 * @struct Asset
 * @brief An uploaded media item, owned by the asset store.
 */
struct Asset {
  std::string id;
  AssetKind kind = AssetKind::Image;
  std::string path;
  AssetMetadata metadata;
};

/**
 * @struct Rgb
 * @brief A 24-bit pixel.
 */
struct Rgb {
  uint8_t r = 0;
  uint8_t g = 0;
  uint8_t b = 0;

  bool operator==(const Rgb &o) const {
    return r == o.r && g == o.g && b == o.b;
  }
  bool operator!=(const Rgb &o) const { return !(*this == o); }
};

/**
 * @struct KeyColor
 * @brief Reference color for chroma keying with its hex form ("00FF00").
 */
struct KeyColor {
  Rgb rgb;
  std::string hex;
};

/**
 * @struct KeyingParameters
 * @brief Caller supplied keying settings.
 * @note crf and include_audio are only consulted for video renders.
 */
struct KeyingParameters {
  double similarity = 0.10;
  double blend = 0.05;
  int crf = 24;
  bool include_audio = true;
};

enum class JobStatus { Queued, Running, Done, Error, Canceled };

const char *job_status_name(JobStatus status);

inline bool is_terminal(JobStatus status) {
  return status == JobStatus::Done || status == JobStatus::Error ||
         status == JobStatus::Canceled;
}

} // namespace keyout

#endif // KEYOUT_TYPES_HPP

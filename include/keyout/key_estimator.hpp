/**
 * @file key_estimator.hpp
 * @brief Background color estimation from border pixels
 *
 * @details Sampling happens on a decoded rgb24 frame (the encoder binary
 *          does the decoding):
 *
 *          - Four corners and four edge midpoints, inset by a small margin
 *
 *          - Channels quantized to a fixed step to absorb compression noise
 *
 *          - Most populated bucket wins; ties go to the first encountered
 */

#ifndef KEYOUT_KEY_ESTIMATOR_HPP
#define KEYOUT_KEY_ESTIMATOR_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "errors.hpp"
#include "types.hpp"

namespace keyout {

/**
 * @struct KeyEstimate
 * @brief Estimated key color and the number of samples it came from.
 */
struct KeyEstimate {
  KeyColor color;
  size_t sample_count = 0;
};

/**
 * @struct PixelPoint
 * @brief Pixel coordinate inside a frame.
 */
struct PixelPoint {
  int x;
  int y;
};

/**
 * @brief Format an RGB triple as upper-case hex without prefix ("00FF00").
 */
std::string to_hex(const Rgb &rgb);

/**
 * @brief Parse a caller supplied hex color.
 * @note Accepts an optional leading '#' and either letter case.
 * @param text Hex text such as "00ff00" or "#00FF00"
 * @param out Parsed color with normalized hex
 * @param err InvalidParameter on malformed input
 */
bool parse_hex_color(const std::string &text, KeyColor &out, Error &err);

/**
 * @brief Positions sampled from a width x height frame.
 * @note Duplicates (tiny frames) are removed, so a 1x1 frame yields one point.
 */
std::vector<PixelPoint> sample_points(int width, int height);

/**
 * @brief Read the pixels at sample_points() from a packed rgb24 frame.
 * @return false if the buffer is smaller than width * height * 3
 */
bool gather_samples(const std::vector<uint8_t> &rgb24, int width, int height,
                    std::vector<Rgb> &samples);

/**
 * @brief Estimate the dominant color of a sample set.
 *
 * @param samples Pixels in sampling order
 * @param quant_step Channel quantization step (values <= 1 disable it)
 * @param min_samples Minimum number of samples required
 * @param out Estimated color and sample count
 * @param err InsufficientSample when samples.size() < min_samples
 */
bool estimate_key(const std::vector<Rgb> &samples, int quant_step,
                  size_t min_samples, KeyEstimate &out, Error &err);

/**
 * @brief Timestamp of the frame used for estimation.
 * @return KEY_SAMPLE_POSITION into the video, 0 for images
 */
double key_sample_time(const AssetMetadata &meta, AssetKind kind);

} // namespace keyout

#endif // KEYOUT_KEY_ESTIMATOR_HPP

/**
 * @file key_estimator.cpp
 * @brief Background color estimation implementation
 */

#include "keyout/key_estimator.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

#include <fmt/core.h>

namespace keyout {

namespace {

/// Margin kept from the frame border when sampling
constexpr int SAMPLE_INSET = 4;

uint8_t quantize(uint8_t v, int step) {
  if (step <= 1)
    return v;
  int q = static_cast<int>(std::lround(static_cast<double>(v) / step)) * step;
  return static_cast<uint8_t>(std::min(q, 255));
}

int hex_digit(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

/// One quantized color bucket; sums keep the raw channel totals
struct Bucket {
  Rgb key;
  size_t count = 0;
  uint64_t sum_r = 0;
  uint64_t sum_g = 0;
  uint64_t sum_b = 0;
};

} // anonymous namespace

std::string to_hex(const Rgb &rgb) {
  return fmt::format("{:02X}{:02X}{:02X}", rgb.r, rgb.g, rgb.b);
}

bool parse_hex_color(const std::string &text, KeyColor &out, Error &err) {
  std::string digits = text;
  if (!digits.empty() && digits.front() == '#')
    digits.erase(0, 1);

  if (digits.size() != 6) {
    return err.set(ErrorKind::InvalidParameter,
                   fmt::format("Invalid hex color format: '{}'. Expected 6 "
                               "hex characters (e.g. '00FF00')",
                               text));
  }

  uint8_t channels[3];
  for (int i = 0; i < 3; ++i) {
    int hi = hex_digit(digits[i * 2]);
    int lo = hex_digit(digits[i * 2 + 1]);
    if (hi < 0 || lo < 0) {
      return err.set(ErrorKind::InvalidParameter,
                     fmt::format("Invalid hex color format: '{}'", text));
    }
    channels[i] = static_cast<uint8_t>(hi * 16 + lo);
  }

  out.rgb = {channels[0], channels[1], channels[2]};
  out.hex = to_hex(out.rgb);
  return true;
}

std::vector<PixelPoint> sample_points(int width, int height) {
  std::vector<PixelPoint> points;
  if (width <= 0 || height <= 0)
    return points;

  /// Never inset past the center
  int inset_x = std::min(SAMPLE_INSET, (width - 1) / 2);
  int inset_y = std::min(SAMPLE_INSET, (height - 1) / 2);
  int left = inset_x;
  int right = width - 1 - inset_x;
  int top = inset_y;
  int bottom = height - 1 - inset_y;
  int mid_x = width / 2;
  int mid_y = height / 2;

  const PixelPoint candidates[] = {
      {left, top},     {right, top},  {left, bottom}, {right, bottom},
      {mid_x, top},    {mid_x, bottom}, {left, mid_y}, {right, mid_y},
  };

  for (const auto &p : candidates) {
    bool seen = std::any_of(points.begin(), points.end(),
                            [&p](const PixelPoint &q) {
                              return q.x == p.x && q.y == p.y;
                            });
    if (!seen)
      points.push_back(p);
  }
  return points;
}

bool gather_samples(const std::vector<uint8_t> &rgb24, int width, int height,
                    std::vector<Rgb> &samples) {
  if (width <= 0 || height <= 0)
    return false;
  size_t needed = static_cast<size_t>(width) * height * 3;
  if (rgb24.size() < needed)
    return false;

  samples.clear();
  for (const auto &p : sample_points(width, height)) {
    size_t off = (static_cast<size_t>(p.y) * width + p.x) * 3;
    samples.push_back({rgb24[off], rgb24[off + 1], rgb24[off + 2]});
  }
  return true;
}

bool estimate_key(const std::vector<Rgb> &samples, int quant_step,
                  size_t min_samples, KeyEstimate &out, Error &err) {
  if (samples.empty() || samples.size() < min_samples) {
    return err.set(ErrorKind::InsufficientSample,
                   fmt::format("Need at least {} samples to estimate a key "
                               "color, got {}",
                               min_samples, samples.size()));
  }

  /// Buckets stay in first-encountered order so ties resolve to the earliest
  std::vector<Bucket> buckets;
  for (const auto &s : samples) {
    Rgb key{quantize(s.r, quant_step), quantize(s.g, quant_step),
            quantize(s.b, quant_step)};
    auto it = std::find_if(buckets.begin(), buckets.end(),
                           [&key](const Bucket &b) { return b.key == key; });
    if (it == buckets.end()) {
      buckets.push_back({key});
      it = buckets.end() - 1;
    }
    it->count++;
    it->sum_r += s.r;
    it->sum_g += s.g;
    it->sum_b += s.b;
  }

  const Bucket *best = &buckets.front();
  for (const auto &b : buckets) {
    if (b.count > best->count)
      best = &b;
  }

  auto mean = [best](uint64_t sum) {
    return static_cast<uint8_t>(
        std::lround(static_cast<double>(sum) / best->count));
  };

  out.color.rgb = {mean(best->sum_r), mean(best->sum_g), mean(best->sum_b)};
  out.color.hex = to_hex(out.color.rgb);
  out.sample_count = samples.size();
  return true;
}

double key_sample_time(const AssetMetadata &meta, AssetKind kind) {
  if (kind != AssetKind::Video || meta.duration <= 0)
    return 0.0;
  return meta.duration * KEY_SAMPLE_POSITION;
}

} // namespace keyout

#include <gtest/gtest.h>

#include "keyout/key_estimator.hpp"

using namespace keyout;

namespace {

std::vector<uint8_t> solid_frame(int w, int h, Rgb c) {
  std::vector<uint8_t> frame;
  for (int i = 0; i < w * h; ++i) {
    frame.push_back(c.r);
    frame.push_back(c.g);
    frame.push_back(c.b);
  }
  return frame;
}

} // namespace

TEST(HexColor, AcceptsHashAndLowerCase) {
  KeyColor key;
  Error err;
  ASSERT_TRUE(parse_hex_color("#00ff00", key, err));
  EXPECT_EQ(key.hex, "00FF00");
  EXPECT_EQ(key.rgb, (Rgb{0, 255, 0}));

  ASSERT_TRUE(parse_hex_color("1A2b3C", key, err));
  EXPECT_EQ(key.hex, "1A2B3C");
  EXPECT_EQ(key.rgb, (Rgb{0x1A, 0x2B, 0x3C}));
}

TEST(HexColor, RejectsMalformed) {
  for (const char *bad : {"", "#", "00FF0", "00FF000", "GG0000", "#12 456"}) {
    KeyColor key;
    Error err;
    EXPECT_FALSE(parse_hex_color(bad, key, err)) << bad;
    EXPECT_EQ(err.kind, ErrorKind::InvalidParameter) << bad;
  }
}

TEST(HexColor, ToHexIsUpperCase) {
  EXPECT_EQ(to_hex({255, 10, 171}), "FF0AAB");
  EXPECT_EQ(to_hex({0, 0, 0}), "000000");
}

TEST(SamplePoints, EightDistinctInsetPointsOnLargeFrames) {
  auto points = sample_points(1920, 1080);
  ASSERT_EQ(points.size(), 8u);

  auto has = [&points](int x, int y) {
    for (const auto &p : points)
      if (p.x == x && p.y == y)
        return true;
    return false;
  };
  EXPECT_TRUE(has(4, 4));
  EXPECT_TRUE(has(1915, 4));
  EXPECT_TRUE(has(4, 1075));
  EXPECT_TRUE(has(1915, 1075));
  EXPECT_TRUE(has(960, 4));
  EXPECT_TRUE(has(960, 1075));
  EXPECT_TRUE(has(4, 540));
  EXPECT_TRUE(has(1915, 540));
}

TEST(SamplePoints, TinyFramesCollapseDuplicates) {
  EXPECT_EQ(sample_points(1, 1).size(), 1u);
  EXPECT_EQ(sample_points(3, 3).size(), 1u);
  EXPECT_EQ(sample_points(4, 4).size(), 4u);
  EXPECT_TRUE(sample_points(0, 10).empty());
}

TEST(GatherSamples, RejectsShortBuffer) {
  std::vector<Rgb> samples;
  std::vector<uint8_t> frame(4 * 4 * 3 - 1, 0);
  EXPECT_FALSE(gather_samples(frame, 4, 4, samples));
}

TEST(EstimateKey, UniformGreenFrame) {
  std::vector<Rgb> samples;
  ASSERT_TRUE(gather_samples(solid_frame(64, 36, {0, 255, 0}), 64, 36, samples));
  ASSERT_EQ(samples.size(), 8u);

  KeyEstimate est;
  Error err;
  ASSERT_TRUE(estimate_key(samples, 8, 4, est, err));
  EXPECT_EQ(est.color.hex, "00FF00");
  EXPECT_EQ(est.sample_count, 8u);
}

TEST(EstimateKey, ModeBucketWinsAndAveragesRawSamples) {
  std::vector<Rgb> samples = {
      {0, 248, 0}, {255, 0, 0}, {2, 250, 2}, {255, 0, 0},
      {1, 249, 3}, {255, 0, 0}, {3, 251, 1},
  };

  KeyEstimate est;
  Error err;
  ASSERT_TRUE(estimate_key(samples, 8, 4, est, err));
  EXPECT_EQ(est.color.rgb, (Rgb{2, 250, 2}));
  EXPECT_EQ(est.color.hex, "02FA02");
  EXPECT_EQ(est.sample_count, 7u);
}

TEST(EstimateKey, TieGoesToFirstBucket) {
  std::vector<Rgb> samples = {
      {255, 0, 0}, {0, 0, 255}, {255, 0, 0}, {0, 0, 255}};

  KeyEstimate est;
  Error err;
  ASSERT_TRUE(estimate_key(samples, 8, 4, est, err));
  EXPECT_EQ(est.color.hex, "FF0000");
}

TEST(EstimateKey, TooFewSamples) {
  std::vector<Rgb> samples = {{0, 255, 0}, {0, 255, 0}, {0, 255, 0}};

  KeyEstimate est;
  Error err;
  EXPECT_FALSE(estimate_key(samples, 8, 4, est, err));
  EXPECT_EQ(err.kind, ErrorKind::InsufficientSample);
}

TEST(EstimateKey, EmptySamplesFailEvenWithZeroMinimum) {
  std::vector<Rgb> samples;

  KeyEstimate est;
  Error err;
  EXPECT_FALSE(estimate_key(samples, 8, 0, est, err));
  EXPECT_EQ(err.kind, ErrorKind::InsufficientSample);
}

TEST(EstimateKey, SampleTimeIsTenPercentOfVideo) {
  AssetMetadata meta;
  meta.duration = 10.0;
  EXPECT_DOUBLE_EQ(key_sample_time(meta, AssetKind::Video), 1.0);
  EXPECT_DOUBLE_EQ(key_sample_time(meta, AssetKind::Image), 0.0);
}

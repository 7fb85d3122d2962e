#include <algorithm>
#include <cstdlib>

#include <gtest/gtest.h>

#include "keyout/command_builder.hpp"
#include "keyout/key_estimator.hpp"

using namespace keyout;

namespace {

/// Argument following flag, empty if flag is absent
std::string value_after(const std::vector<std::string> &argv,
                        const std::string &flag) {
  auto it = std::find(argv.begin(), argv.end(), flag);
  if (it == argv.end() || it + 1 == argv.end())
    return "";
  return *(it + 1);
}

bool contains(const std::vector<std::string> &argv, const std::string &arg) {
  return std::find(argv.begin(), argv.end(), arg) != argv.end();
}

CommandRequest video_request(CommandMode mode) {
  CommandRequest req;
  req.mode = mode;
  req.kind = AssetKind::Video;
  req.metadata.width = 1280;
  req.metadata.height = 720;
  req.metadata.duration = 10.0;
  req.metadata.fps = 30.0;
  req.metadata.has_audio = true;
  req.encoder = "ffmpeg";
  req.input_path = "/data/in.mp4";
  req.output_path = "/data/out.webm";
  Error err;
  EXPECT_TRUE(parse_hex_color("00FF00", req.key, err));
  return req;
}

} // namespace

TEST(ChromakeyFilter, EmbedsColorAndTolerances) {
  KeyColor key;
  Error err;
  ASSERT_TRUE(parse_hex_color("00ff00", key, err));
  EXPECT_EQ(chromakey_filter(key, 0.1, 0.05),
            "chromakey=color=0x00FF00:similarity=0.1:blend=0.05");
}

TEST(ChromakeyFilter, TolerancesAreNotRounded) {
  EXPECT_EQ(format_tolerance(0.123), "0.123");
  EXPECT_EQ(format_tolerance(0.5), "0.5");
  EXPECT_EQ(format_tolerance(0.3333), "0.3333");
}

TEST(ChromakeyFilter, ZeroSimilarityStaysPositive) {
  KeyColor key;
  Error err;
  ASSERT_TRUE(parse_hex_color("0000FF", key, err));
  std::string filter = chromakey_filter(key, 0.0, 0.0);

  std::string marker = "similarity=";
  auto pos = filter.find(marker);
  ASSERT_NE(pos, std::string::npos);
  double sim = std::strtod(filter.c_str() + pos + marker.size(), nullptr);
  EXPECT_DOUBLE_EQ(sim, CHROMAKEY_MIN_SIMILARITY);
}

TEST(ValidateParameters, ToleranceBounds) {
  AssetMetadata meta;
  KeyingParameters params;
  Error err;

  params.similarity = 0.6;
  EXPECT_FALSE(validate_parameters(params, meta, AssetKind::Image,
                                   CommandMode::RenderImage, err));
  EXPECT_EQ(err.kind, ErrorKind::InvalidParameter);

  params.similarity = -0.1;
  EXPECT_FALSE(validate_parameters(params, meta, AssetKind::Image,
                                   CommandMode::Preview, err));

  params.similarity = 0.5;
  params.blend = 0.51;
  EXPECT_FALSE(validate_parameters(params, meta, AssetKind::Image,
                                   CommandMode::Preview, err));

  params.blend = 0.0;
  err.clear();
  EXPECT_TRUE(validate_parameters(params, meta, AssetKind::Image,
                                  CommandMode::Preview, err));
}

TEST(ValidateParameters, CrfOnlyCheckedForVideo) {
  AssetMetadata meta;
  meta.has_audio = true;
  KeyingParameters params;
  Error err;

  params.crf = 9;
  EXPECT_FALSE(validate_parameters(params, meta, AssetKind::Video,
                                   CommandMode::RenderVideo, err));
  params.crf = 64;
  EXPECT_FALSE(validate_parameters(params, meta, AssetKind::Video,
                                   CommandMode::RenderVideo, err));
  params.crf = 63;
  EXPECT_TRUE(validate_parameters(params, meta, AssetKind::Video,
                                  CommandMode::RenderVideo, err));

  params.crf = 5;
  EXPECT_TRUE(validate_parameters(params, meta, AssetKind::Image,
                                  CommandMode::RenderImage, err));
}

TEST(ValidateParameters, AudioRequiresAudioTrack) {
  AssetMetadata meta;
  meta.has_audio = false;
  KeyingParameters params;
  params.include_audio = true;
  Error err;

  EXPECT_FALSE(validate_parameters(params, meta, AssetKind::Video,
                                   CommandMode::RenderVideo, err));
  EXPECT_EQ(err.kind, ErrorKind::InvalidParameter);

  params.include_audio = false;
  EXPECT_TRUE(validate_parameters(params, meta, AssetKind::Video,
                                  CommandMode::RenderVideo, err));
}

TEST(ValidateParameters, VideoRenderOfImageRejected) {
  AssetMetadata meta;
  KeyingParameters params;
  params.include_audio = false;
  Error err;
  EXPECT_FALSE(validate_parameters(params, meta, AssetKind::Image,
                                   CommandMode::RenderVideo, err));
}

TEST(BuildCommand, VideoRenderWithAudio) {
  CommandRequest req = video_request(CommandMode::RenderVideo);
  req.params.crf = 30;

  std::vector<std::string> argv;
  Error err;
  ASSERT_TRUE(build_command(req, argv, err)) << err.message;

  EXPECT_EQ(argv.front(), "ffmpeg");
  EXPECT_EQ(argv.back(), "/data/out.webm");
  EXPECT_EQ(value_after(argv, "-i"), "/data/in.mp4");
  EXPECT_EQ(value_after(argv, "-vf"),
            "chromakey=color=0x00FF00:similarity=0.1:blend=0.05,"
            "format=yuva420p");
  EXPECT_EQ(value_after(argv, "-c:v"), "libvpx-vp9");
  EXPECT_EQ(value_after(argv, "-crf"), "30");
  EXPECT_EQ(value_after(argv, "-pix_fmt"), "yuva420p");
  EXPECT_EQ(value_after(argv, "-c:a"), "libopus");
  EXPECT_EQ(value_after(argv, "-progress"), "pipe:2");
  EXPECT_EQ(value_after(argv, "-f"), "webm");
  EXPECT_FALSE(contains(argv, "-an"));
  EXPECT_TRUE(contains(argv, "-y"));
}

TEST(BuildCommand, VideoRenderWithoutAudio) {
  CommandRequest req = video_request(CommandMode::RenderVideo);
  req.params.include_audio = false;

  std::vector<std::string> argv;
  Error err;
  ASSERT_TRUE(build_command(req, argv, err));
  EXPECT_TRUE(contains(argv, "-an"));
  EXPECT_FALSE(contains(argv, "-c:a"));
}

TEST(BuildCommand, ImageRenderIsSinglePngFrame) {
  CommandRequest req = video_request(CommandMode::RenderImage);
  req.kind = AssetKind::Image;
  req.output_path = "/data/out.png";

  std::vector<std::string> argv;
  Error err;
  ASSERT_TRUE(build_command(req, argv, err));
  EXPECT_EQ(value_after(argv, "-frames:v"), "1");
  EXPECT_EQ(value_after(argv, "-c:v"), "png");
  EXPECT_EQ(value_after(argv, "-vf"),
            "chromakey=color=0x00FF00:similarity=0.1:blend=0.05,format=rgba");
  EXPECT_FALSE(contains(argv, "-crf"));
  EXPECT_EQ(argv.back(), "/data/out.png");
}

TEST(BuildCommand, PreviewSeeksAndNeverUpscales) {
  CommandRequest req = video_request(CommandMode::Preview);
  req.metadata.width = 320;
  req.time = 100.0;
  req.max_width = 640;
  req.output_path = "/data/preview.png";

  std::vector<std::string> argv;
  Error err;
  ASSERT_TRUE(build_command(req, argv, err));
  EXPECT_EQ(value_after(argv, "-ss"), "9.900");
  std::string vf = value_after(argv, "-vf");
  EXPECT_NE(vf.find("scale=320:-1"), std::string::npos) << vf;

  req.metadata.width = 1920;
  ASSERT_TRUE(build_command(req, argv, err));
  vf = value_after(argv, "-vf");
  EXPECT_NE(vf.find("scale=640:-1"), std::string::npos) << vf;
}

TEST(BuildCommand, ImagePreviewHasNoSeek) {
  CommandRequest req = video_request(CommandMode::Preview);
  req.kind = AssetKind::Image;
  req.time = 3.0;

  std::vector<std::string> argv;
  Error err;
  ASSERT_TRUE(build_command(req, argv, err));
  EXPECT_FALSE(contains(argv, "-ss"));
}

TEST(BuildCommand, PreviewWidthBounds) {
  CommandRequest req = video_request(CommandMode::Preview);
  std::vector<std::string> argv;
  Error err;

  req.max_width = 50;
  EXPECT_FALSE(build_command(req, argv, err));
  EXPECT_EQ(err.kind, ErrorKind::InvalidParameter);

  req.max_width = 4000;
  EXPECT_FALSE(build_command(req, argv, err));
}

TEST(ValidatePreviewWidth, AcceptsInclusiveBounds) {
  Error err;
  EXPECT_TRUE(validate_preview_width(MIN_PREVIEW_WIDTH, err));
  EXPECT_TRUE(validate_preview_width(MAX_PREVIEW_WIDTH, err));

  EXPECT_FALSE(validate_preview_width(MIN_PREVIEW_WIDTH - 1, err));
  EXPECT_EQ(err.kind, ErrorKind::InvalidParameter);
  EXPECT_FALSE(validate_preview_width(MAX_PREVIEW_WIDTH + 1, err));
  EXPECT_FALSE(validate_preview_width(0, err));
}

TEST(BuildCommand, SampleFrameWritesRawRgbToStdout) {
  CommandRequest req = video_request(CommandMode::SampleFrame);
  req.time = 1.0;

  std::vector<std::string> argv;
  Error err;
  ASSERT_TRUE(build_command(req, argv, err));
  EXPECT_EQ(value_after(argv, "-ss"), "1.000");
  EXPECT_EQ(value_after(argv, "-vf"), "scale=1280:720");
  EXPECT_EQ(value_after(argv, "-pix_fmt"), "rgb24");
  EXPECT_EQ(argv.back(), "-");
}

TEST(SeekTime, ClampedIntoVideo) {
  EXPECT_DOUBLE_EQ(clamp_seek_time(-1.0, 10.0), 0.0);
  EXPECT_DOUBLE_EQ(clamp_seek_time(5.0, 10.0), 5.0);
  EXPECT_DOUBLE_EQ(clamp_seek_time(20.0, 10.0), 9.9);
  EXPECT_DOUBLE_EQ(clamp_seek_time(1.0, 0.05), 0.0);
}

TEST(JoinCommand, QuotesArgumentsWithSpaces) {
  EXPECT_EQ(join_command({"ffmpeg", "-i", "my clip.mp4", "-y"}),
            "ffmpeg -i 'my clip.mp4' -y");
}

/**
 * @file command_builder.cpp
 * @brief Encoder argument list construction
 */

#include "keyout/command_builder.hpp"

#include <algorithm>

#include <fmt/core.h>

namespace keyout {

namespace {

bool tolerance_in_range(double v) {
  return v >= 0.0 && v <= MAX_KEY_TOLERANCE;
}

/// Options shared by every invocation
void push_common(std::vector<std::string> &argv, const std::string &encoder) {
  argv.push_back(encoder);
  argv.insert(argv.end(), {"-hide_banner", "-nostdin", "-y"});
}

void push_seek(std::vector<std::string> &argv, const CommandRequest &req) {
  if (req.kind != AssetKind::Video)
    return;
  argv.push_back("-ss");
  argv.push_back(fmt::format("{:.3f}",
                             clamp_seek_time(req.time, req.metadata.duration)));
}

} // anonymous namespace

bool validate_parameters(const KeyingParameters &params,
                         const AssetMetadata &meta, AssetKind kind,
                         CommandMode mode, Error &err) {
  if (mode == CommandMode::SampleFrame)
    return true;

  if (!tolerance_in_range(params.similarity)) {
    return err.set(ErrorKind::InvalidParameter,
                   fmt::format("Invalid similarity value: {}. Must be between "
                               "0.0 and {}",
                               params.similarity, MAX_KEY_TOLERANCE));
  }
  if (!tolerance_in_range(params.blend)) {
    return err.set(ErrorKind::InvalidParameter,
                   fmt::format("Invalid blend value: {}. Must be between 0.0 "
                               "and {}",
                               params.blend, MAX_KEY_TOLERANCE));
  }

  if (mode == CommandMode::RenderVideo) {
    if (kind != AssetKind::Video) {
      return err.set(ErrorKind::InvalidParameter,
                     "Video render requested for an image asset");
    }
    if (params.crf < MIN_CRF || params.crf > MAX_CRF) {
      return err.set(ErrorKind::InvalidParameter,
                     fmt::format("Invalid crf value: {}. Must be between {} "
                                 "and {}",
                                 params.crf, MIN_CRF, MAX_CRF));
    }
    if (params.include_audio && !meta.has_audio) {
      return err.set(ErrorKind::InvalidParameter,
                     "Audio requested but the asset has no audio track");
    }
  }
  return true;
}

bool validate_preview_width(int max_width, Error &err) {
  if (max_width < MIN_PREVIEW_WIDTH || max_width > MAX_PREVIEW_WIDTH) {
    return err.set(ErrorKind::InvalidParameter,
                   fmt::format("Invalid preview width: {}. Must be between "
                               "{} and {}",
                               max_width, MIN_PREVIEW_WIDTH, MAX_PREVIEW_WIDTH));
  }
  return true;
}

std::string format_tolerance(double value) { return fmt::format("{}", value); }

std::string chromakey_filter(const KeyColor &key, double similarity,
                             double blend) {
  double sim = std::max(similarity, CHROMAKEY_MIN_SIMILARITY);
  return fmt::format("chromakey=color=0x{}:similarity={}:blend={}", key.hex,
                     format_tolerance(sim), format_tolerance(blend));
}

double clamp_seek_time(double time, double duration) {
  double upper = std::max(0.0, duration - SEEK_END_MARGIN_SEC);
  return std::min(std::max(time, 0.0), upper);
}

bool build_command(const CommandRequest &req, std::vector<std::string> &argv,
                   Error &err) {
  if (!validate_parameters(req.params, req.metadata, req.kind, req.mode, err))
    return false;

  argv.clear();
  push_common(argv, req.encoder);

  std::string keyer =
      chromakey_filter(req.key, req.params.similarity, req.params.blend);

  switch (req.mode) {
  case CommandMode::Preview: {
    if (!validate_preview_width(req.max_width, err))
      return false;
    /// Downscale only; -1 keeps the aspect ratio
    int width = req.max_width;
    if (req.metadata.width > 0)
      width = std::min(width, req.metadata.width);

    push_seek(argv, req);
    argv.insert(argv.end(),
                {"-i", req.input_path, "-vf",
                 fmt::format("{},format=rgba,scale={}:-1", keyer, width),
                 "-frames:v", "1", "-update", "1", "-f", "image2", "-c:v",
                 "png", req.output_path});
    break;
  }

  case CommandMode::RenderImage:
    argv.insert(argv.end(),
                {"-i", req.input_path, "-vf",
                 fmt::format("{},format=rgba", keyer), "-frames:v", "1",
                 "-update", "1", "-f", "image2", "-c:v", "png",
                 req.output_path});
    break;

  case CommandMode::RenderVideo:
    argv.insert(argv.end(),
                {"-i", req.input_path, "-vf",
                 fmt::format("{},format=yuva420p", keyer), "-c:v",
                 "libvpx-vp9", "-b:v", "0", "-crf", std::to_string(req.params.crf),
                 "-auto-alt-ref", "0", "-pix_fmt", "yuva420p"});
    if (req.params.include_audio && req.metadata.has_audio) {
      argv.insert(argv.end(), {"-c:a", "libopus", "-b:a", "128k"});
    } else {
      argv.push_back("-an");
    }
    argv.insert(argv.end(),
                {"-progress", "pipe:2", "-nostats", "-f", "webm",
                 req.output_path});
    break;

  case CommandMode::SampleFrame:
    if (req.metadata.width <= 0 || req.metadata.height <= 0) {
      return err.set(ErrorKind::InvalidParameter,
                     "Cannot sample a frame without known dimensions");
    }
    push_seek(argv, req);
    argv.insert(argv.end(),
                {"-i", req.input_path, "-frames:v", "1", "-vf",
                 fmt::format("scale={}:{}", req.metadata.width,
                             req.metadata.height),
                 "-f", "rawvideo", "-pix_fmt", "rgb24", "-"});
    break;
  }

  return true;
}

std::string join_command(const std::vector<std::string> &argv) {
  std::string out;
  for (const auto &arg : argv) {
    if (!out.empty())
      out += ' ';
    if (arg.find(' ') != std::string::npos) {
      out += fmt::format("'{}'", arg);
    } else {
      out += arg;
    }
  }
  return out;
}

const char *output_extension(AssetKind kind) {
  return kind == AssetKind::Video ? "webm" : "png";
}

} // namespace keyout

/**
 * @file media_probe.cpp
 * @brief libavformat metadata probe implementation
 */

#include "keyout/media_probe.hpp"

#include <cmath>

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
#include <libavutil/error.h>
}

#include <fmt/core.h>

#include "keyout/logging.hpp"

namespace keyout {

namespace {

std::string av_error_string(int code) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(code, buf, sizeof(buf));
  return buf;
}

/**
 * @class FormatInput
 * @brief Owns an opened AVFormatContext.
 */
class FormatInput {
public:
  FormatInput() = default;
  ~FormatInput() {
    if (ctx)
      avformat_close_input(&ctx);
  }

  FormatInput(const FormatInput &) = delete;
  FormatInput &operator=(const FormatInput &) = delete;

  AVFormatContext *ctx = nullptr;
};

} // anonymous namespace

bool probe_media(const std::string &path, AssetKind kind, AssetMetadata &meta,
                 Error &err) {
  FormatInput input;

  int rc = avformat_open_input(&input.ctx, path.c_str(), nullptr, nullptr);
  if (rc < 0) {
    return err.set(ErrorKind::Probe,
                   fmt::format("Failed to open '{}': {}", path,
                               av_error_string(rc)));
  }

  /// Reads some packets to determine streams
  rc = avformat_find_stream_info(input.ctx, nullptr);
  if (rc < 0) {
    return err.set(ErrorKind::Probe,
                   fmt::format("Failed to read stream info from '{}': {}",
                               path, av_error_string(rc)));
  }

  int video_idx =
      av_find_best_stream(input.ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (video_idx < 0) {
    return err.set(ErrorKind::Probe,
                   fmt::format("No video stream found in '{}'", path));
  }

  const AVStream *stream = input.ctx->streams[video_idx];
  meta = AssetMetadata{};
  meta.width = stream->codecpar->width;
  meta.height = stream->codecpar->height;

  if (kind == AssetKind::Video) {
    if (input.ctx->duration != AV_NOPTS_VALUE && input.ctx->duration > 0) {
      meta.duration = static_cast<double>(input.ctx->duration) / AV_TIME_BASE;
    } else if (stream->duration != AV_NOPTS_VALUE && stream->duration > 0) {
      meta.duration = stream->duration * av_q2d(stream->time_base);
    }

    if (stream->r_frame_rate.den != 0 && stream->r_frame_rate.num != 0) {
      meta.fps = std::round(av_q2d(stream->r_frame_rate) * 100.0) / 100.0;
    } else {
      meta.fps = 30.0;
    }

    for (unsigned int i = 0; i < input.ctx->nb_streams; i++) {
      if (input.ctx->streams[i]->codecpar->codec_type == AVMEDIA_TYPE_AUDIO) {
        meta.has_audio = true;
        break;
      }
    }
  }

  if (meta.width <= 0 || meta.height <= 0) {
    return err.set(ErrorKind::Probe,
                   fmt::format("Invalid dimensions {}x{} in '{}'", meta.width,
                               meta.height, path));
  }

  LOG_INFO("Probed {} ({}): {}x{}, {:.2f}s @ {:.2f}fps, audio={}", path,
           asset_kind_name(kind), meta.width, meta.height, meta.duration,
           meta.fps, meta.has_audio);
  return true;
}

} // namespace keyout

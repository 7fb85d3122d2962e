/**
 * @file logging.cpp
 * @brief Logging globals and enum names used in log lines
 */

#include "keyout/logging.hpp"

#include "keyout/errors.hpp"
#include "keyout/types.hpp"

namespace keyout {

// **----- GLOBAL LOG MUTEX -----**

std::mutex log_mutex;

// **----- ENUM NAMES -----**

const char *asset_kind_name(AssetKind kind) {
  switch (kind) {
  case AssetKind::Video:
    return "video";
  case AssetKind::Image:
    return "image";
  }
  return "unknown";
}

const char *job_status_name(JobStatus status) {
  switch (status) {
  case JobStatus::Queued:
    return "queued";
  case JobStatus::Running:
    return "running";
  case JobStatus::Done:
    return "done";
  case JobStatus::Error:
    return "error";
  case JobStatus::Canceled:
    return "canceled";
  }
  return "unknown";
}

const char *error_kind_name(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "None";
  case ErrorKind::InvalidParameter:
    return "InvalidParameterError";
  case ErrorKind::AssetNotFound:
    return "AssetNotFoundError";
  case ErrorKind::JobNotFound:
    return "JobNotFoundError";
  case ErrorKind::JobNotFinished:
    return "JobNotFinishedError";
  case ErrorKind::InsufficientSample:
    return "InsufficientSampleError";
  case ErrorKind::EncoderLaunch:
    return "EncoderLaunchError";
  case ErrorKind::EncoderRuntime:
    return "EncoderRuntimeError";
  case ErrorKind::Cancellation:
    return "CancellationError";
  case ErrorKind::Probe:
    return "ProbeError";
  case ErrorKind::Io:
    return "IoError";
  }
  return "UnknownError";
}

} // namespace keyout

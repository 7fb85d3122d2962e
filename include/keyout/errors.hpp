/**
 * @file errors.hpp
 * @brief Error kinds reported by the keying core
 *
 * @details Operations return bool (or an exit status) and fill an Error on
 *          failure. Validation and lookup errors are returned before any job
 *          exists; failures during a render are recorded on the job instead.
 */

#ifndef KEYOUT_ERRORS_HPP
#define KEYOUT_ERRORS_HPP

#include <string>
#include <utility>

namespace keyout {

enum class ErrorKind {
  None,
  InvalidParameter,   //< Out of range or inconsistent caller input
  AssetNotFound,      //< Asset id does not resolve
  JobNotFound,        //< Job id does not resolve
  JobNotFinished,     //< Output requested before the job is done
  InsufficientSample, //< Too few pixels to estimate a key color
  EncoderLaunch,      //< Encoder binary could not be started
  EncoderRuntime,     //< Encoder binary exited unsuccessfully
  Cancellation,       //< Encoder ignored SIGTERM and was force-killed
  Probe,              //< Media could not be opened or parsed
  Io                  //< Filesystem failure
};

const char *error_kind_name(ErrorKind kind);

/**
 * @struct Error
 * @brief Failure kind plus a human readable message.
 */
struct Error {
  ErrorKind kind = ErrorKind::None;
  std::string message;

  bool ok() const { return kind == ErrorKind::None; }

  /// Fill this error and return false so callers can `return err.set(...)`
  bool set(ErrorKind k, std::string msg) {
    kind = k;
    message = std::move(msg);
    return false;
  }

  void clear() {
    kind = ErrorKind::None;
    message.clear();
  }
};

} // namespace keyout

#endif // KEYOUT_ERRORS_HPP

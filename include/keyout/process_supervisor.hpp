/**
 * @file process_supervisor.hpp
 * @brief Launch, stream and cancel encoder child processes
 *
 * @details Each encoder runs in its own process group so cancellation
 *          reaches any helper processes it spawns.
 *
 * @attention THREAD MODEL:
 *
 *            - start() forks the child and returns immediately
 *
 *            - A reader thread per process drains stderr (and stdout when
 *              captured), feeds the log and progress sinks, then waits for
 *              the exit without reaping and fulfills the result future
 *
 *            - Sinks are invoked on the reader thread, in emission order
 *
 *            - The owner reaps with reap(); the destructor reaps otherwise
 *
 *            - cancel() never signals a child that has exited
 */

#ifndef KEYOUT_PROCESS_SUPERVISOR_HPP
#define KEYOUT_PROCESS_SUPERVISOR_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <sys/types.h>

#include "errors.hpp"

namespace keyout {

using LineSink = std::function<void(const std::string &)>;
using ProgressSink = std::function<void(double)>;

/**
 * @struct LaunchRequest
 * @brief One encoder invocation.
 */
struct LaunchRequest {
  std::vector<std::string> argv; //< argv[0] resolved through PATH
  std::string workdir;           //< Empty = inherit
  double total_duration = 0.0;   //< Seconds; <= 0 = binary progress
  bool capture_stdout = false;   //< Otherwise stdout goes to /dev/null
  ProgressSink on_progress;      //< Called with each progress advance
  LineSink on_line;              //< Called with every diagnostic line
};

/**
 * @struct ProcessResult
 * @brief How a supervised process ended.
 */
struct ProcessResult {
  int exit_code = -1;   //< -1 when killed by a signal
  int term_signal = 0;  //< Terminating signal, 0 for a normal exit
  std::chrono::milliseconds duration{0}; //< Spawn to exit
  bool force_killed = false;             //< SIGKILL after the grace period
  std::vector<uint8_t> stdout_data;      //< Only with capture_stdout

  bool success() const { return term_signal == 0 && exit_code == 0; }

  /// "exit code N" or "signal N"
  std::string describe() const;
};

enum class CancelOutcome { AlreadyExited, Terminated, ForceKilled };

/**
 * @class EncoderProcess
 * @brief Handle to one running (or finished) child process.
 * @note The destructor joins the reader thread, so dropping the last handle
 *       of a live process blocks until it exits.
 */
class EncoderProcess {
public:
  ~EncoderProcess();

  EncoderProcess(const EncoderProcess &) = delete;
  EncoderProcess &operator=(const EncoderProcess &) = delete;

  pid_t pid() const { return pid_; }

  /// True once the child's exit has been observed
  bool exited() const;

  /**
   * @brief Release the exited child's pid.
   * @note No-op before exit or when already reaped. Lock order: a caller's
   *       own mutex may be held, the process mutex is taken inside.
   */
  void reap();

  /// Wait up to timeout for exit; true if the result is available
  bool wait_for(std::chrono::milliseconds timeout) const;

  /// Block until exit and return the result
  const ProcessResult &wait() const { return result_.get(); }

private:
  friend class ProcessSupervisor;
  EncoderProcess() = default;

  void reader_loop(int out_fd, int err_fd, LaunchRequest req);

  pid_t pid_{-1};
  std::chrono::steady_clock::time_point started_;

  /// Guards the flags below; held while signaling and reaping
  mutable std::mutex mutex_;
  bool exited_{false};
  bool reaped_{false};
  bool force_killed_{false};

  std::promise<ProcessResult> promise_;
  std::shared_future<ProcessResult> result_;
  std::thread reader_;
};

/**
 * @class ProcessSupervisor
 * @brief Starts and cancels encoder processes. Never retries.
 */
class ProcessSupervisor {
public:
  /**
   * @param grace Time between SIGTERM and SIGKILL on cancel
   */
  explicit ProcessSupervisor(std::chrono::milliseconds grace);

  /**
   * @brief Launch a process.
   * @param req Invocation and sinks
   * @param err EncoderLaunch if the binary could not be executed
   * @return Handle, or nullptr on failure
   */
  std::shared_ptr<EncoderProcess> start(const LaunchRequest &req,
                                        Error &err) const;

  /**
   * @brief Terminate the process group, escalating to SIGKILL after the grace
   *        period. Returns once the process has exited.
   * @note Idempotent; a finished process yields AlreadyExited.
   */
  CancelOutcome cancel(EncoderProcess &proc) const;

  /**
   * @brief start() then wait for exit.
   * @return false only when the process could not be launched
   */
  bool run(const LaunchRequest &req, ProcessResult &result, Error &err) const;

  std::chrono::milliseconds grace() const { return grace_; }

private:
  std::chrono::milliseconds grace_;
};

} // namespace keyout

#endif // KEYOUT_PROCESS_SUPERVISOR_HPP

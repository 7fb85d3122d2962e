/**
 * @file job_registry.hpp
 * @brief Authoritative state of every render job
 *
 * @details The JobRegistry owns all job records and is their only mutator.
 *          Each job gets its own worker thread, which waits for admission,
 *          launches the encoder, and drives the job to a terminal state.
 *
 *          State machine:
 *
 *          - queued -> running      encoder started (handle stored atomically)
 *
 *          - queued -> error        encoder could not be launched
 *
 *          - queued -> canceled     canceled before any process started
 *
 *          - running -> done        exit 0 with a non-empty output file
 *
 *          - running -> error       non-zero exit, signal, or no output
 *
 *          - running -> canceled    canceled; set once the process exited
 *
 * @attention LOCKING:
 *
 *   - jobs_mutex_ only guards the id -> entry map and the worker list
 *
 *   - Each entry has its own mutex; every transition and every progress or
 *     log update happens under it
 *
 *   - Status reads copy a snapshot under the entry mutex and never wait on
 *     a render
 */

#ifndef KEYOUT_JOB_REGISTRY_HPP
#define KEYOUT_JOB_REGISTRY_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "admission_gate.hpp"
#include "asset_store.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "job.hpp"
#include "process_supervisor.hpp"
#include "types.hpp"

namespace keyout {

/**
 * @struct RegistryOptions
 * @brief Registry tuning; defaults come from the environment (Config).
 */
struct RegistryOptions {
  std::string encoder = Config::encoder_path();
  int max_concurrent_jobs = Config::max_concurrent_jobs();
  size_t log_tail_lines = static_cast<size_t>(Config::log_tail_lines());
  size_t failure_context_lines =
      static_cast<size_t>(Config::failure_context_lines());
};

/**
 * @struct RenderRequest
 * @brief Key color (hex) plus keying parameters for one render.
 */
struct RenderRequest {
  std::string hex;
  KeyingParameters params;
};

class JobRegistry {
public:
  JobRegistry(const AssetStore &assets, const OutputStore &outputs,
              const ProcessSupervisor &supervisor,
              RegistryOptions options = RegistryOptions());

  /**
   * @brief Cancels every unfinished job and joins all worker threads.
   */
  ~JobRegistry();

  JobRegistry(const JobRegistry &) = delete;
  JobRegistry &operator=(const JobRegistry &) = delete;

  /**
   * @brief Validate a render request and create a queued job.
   *
   * @param asset_id Asset to render
   * @param req Key color and parameters
   * @param job_id Output: new job id
   * @param err AssetNotFound or InvalidParameter; no job is created then
   */
  bool start_render(const std::string &asset_id, const RenderRequest &req,
                    std::string &job_id, Error &err);

  /**
   * @brief Copy the current state of a job.
   * @param err JobNotFound for unknown ids
   */
  bool get_status(const std::string &job_id, JobSnapshot &snapshot,
                  Error &err) const;

  /**
   * @brief Request cancellation and wait until the job is terminal.
   *
   * @note A job that is already terminal is left untouched; its status is
   *       reported back and the call still succeeds.
   * @param status Output: the job's terminal status
   */
  bool cancel(const std::string &job_id, JobStatus &status, Error &err);

  /**
   * @brief Wait up to timeout for a job to become terminal.
   * @note Succeeds on timeout too; check snapshot.status.
   */
  bool wait(const std::string &job_id, std::chrono::milliseconds timeout,
            JobSnapshot &snapshot, Error &err) const;

  /**
   * @brief Read the output file of a finished job.
   * @param err JobNotFound, JobNotFinished (status is not done) or Io
   */
  bool download(const std::string &job_id, std::vector<uint8_t> &bytes,
                Error &err) const;

  /// Snapshots of all jobs, oldest first
  std::vector<JobSnapshot> list() const;

private:
  struct JobEntry;

  std::shared_ptr<JobEntry> find(const std::string &job_id) const;
  static JobSnapshot snapshot_of(const JobEntry &entry);

  void run_job(std::shared_ptr<JobEntry> entry);
  void execute(const std::shared_ptr<JobEntry> &entry);
  void finish(JobEntry &entry, const ProcessResult &result);

  /// Join workers whose job has finished (jobs_mutex_ held)
  void reap_workers_locked();

  const AssetStore &assets_;
  const OutputStore &outputs_;
  const ProcessSupervisor &supervisor_;
  RegistryOptions options_;
  AdmissionGate gate_;

  mutable std::mutex jobs_mutex_;
  std::unordered_map<std::string, std::shared_ptr<JobEntry>> jobs_;
  std::vector<std::shared_ptr<JobEntry>> order_;   //< Creation order
  std::vector<std::shared_ptr<JobEntry>> workers_; //< Entries with live threads
};

} // namespace keyout

#endif // KEYOUT_JOB_REGISTRY_HPP

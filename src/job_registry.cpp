/**
 * @file job_registry.cpp
 * @brief Job registry and per-job worker implementation
 */

#include "keyout/job_registry.hpp"

#include <algorithm>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>
#include <thread>
#include <utility>

#include <fmt/core.h>

#include "keyout/command_builder.hpp"
#include "keyout/key_estimator.hpp"
#include "keyout/logging.hpp"
#include "keyout/system.hpp"

namespace keyout {

namespace fs = std::filesystem;

/**
 * @struct JobRegistry::JobEntry
 * @brief One job: its record, its process handle and its worker thread.
 * @note Fields below `mutex` are guarded by it; the rest are fixed at
 *       creation.
 */
struct JobRegistry::JobEntry {
  explicit JobEntry(size_t tail_capacity) : tail(tail_capacity) {}

  Asset asset;
  std::vector<std::string> argv;
  std::string output_path;
  std::string log_path;

  std::mutex mutex;
  std::condition_variable changed;
  JobSnapshot record;
  LogTail tail;
  std::shared_ptr<EncoderProcess> process;

  std::atomic<bool> cancel_requested{false};
  std::atomic<bool> worker_done{false};
  std::thread worker;
};

// **---- Construction ----**

JobRegistry::JobRegistry(const AssetStore &assets, const OutputStore &outputs,
                         const ProcessSupervisor &supervisor,
                         RegistryOptions options)
    : assets_(assets), outputs_(outputs), supervisor_(supervisor),
      options_(std::move(options)), gate_(options_.max_concurrent_jobs) {}

JobRegistry::~JobRegistry() {
  std::vector<std::shared_ptr<JobEntry>> entries;
  {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    entries = order_;
  }

  for (const auto &entry : entries) {
    JobStatus status;
    Error err;
    if (!cancel(entry->record.id, status, err)) {
      LOG_ERROR("[Job {}] Cancel during shutdown failed: {}",
                entry->record.id, err.message);
    }
  }

  std::lock_guard<std::mutex> lock(jobs_mutex_);
  for (auto &entry : workers_) {
    if (entry->worker.joinable())
      entry->worker.join();
  }
  workers_.clear();
}

// **---- Lookup ----**

std::shared_ptr<JobRegistry::JobEntry>
JobRegistry::find(const std::string &job_id) const {
  std::lock_guard<std::mutex> lock(jobs_mutex_);
  auto it = jobs_.find(job_id);
  return it == jobs_.end() ? nullptr : it->second;
}

JobSnapshot JobRegistry::snapshot_of(const JobEntry &entry) {
  JobSnapshot snap = entry.record;
  snap.log_tail = entry.tail.lines();
  return snap;
}

void JobRegistry::reap_workers_locked() {
  auto done = std::stable_partition(
      workers_.begin(), workers_.end(),
      [](const std::shared_ptr<JobEntry> &e) { return !e->worker_done.load(); });
  for (auto it = done; it != workers_.end(); ++it) {
    if ((*it)->worker.joinable())
      (*it)->worker.join();
  }
  workers_.erase(done, workers_.end());
}

// **---- Public API ----**

bool JobRegistry::start_render(const std::string &asset_id,
                               const RenderRequest &req, std::string &job_id,
                               Error &err) {
  Asset asset;
  if (!assets_.resolve(asset_id, asset, err)) {
    LOG_WARN("Render rejected for asset {}: {}", asset_id, err.message);
    return false;
  }

  KeyColor key;
  if (!parse_hex_color(req.hex, key, err))
    return false;

  CommandMode mode = (asset.kind == AssetKind::Video) ? CommandMode::RenderVideo
                                                      : CommandMode::RenderImage;
  if (!validate_parameters(req.params, asset.metadata, asset.kind, mode, err)) {
    LOG_WARN("Render rejected for asset {}: {}", asset_id, err.message);
    return false;
  }

  std::string id = generate_id();
  auto entry =
      std::make_shared<JobEntry>(std::max<size_t>(options_.log_tail_lines, 1));

  if (!outputs_.output_path(id, output_extension(asset.kind),
                            entry->output_path, err) ||
      !outputs_.log_path(id, entry->log_path, err))
    return false;

  CommandRequest cmd;
  cmd.mode = mode;
  cmd.kind = asset.kind;
  cmd.metadata = asset.metadata;
  cmd.params = req.params;
  cmd.key = key;
  cmd.encoder = options_.encoder;
  cmd.input_path = asset.path;
  cmd.output_path = entry->output_path;
  if (!build_command(cmd, entry->argv, err))
    return false;

  entry->asset = asset;
  entry->record.id = id;
  entry->record.asset_id = asset_id;
  entry->record.kind = asset.kind;
  entry->record.status = JobStatus::Queued;
  entry->record.key_hex = key.hex;
  entry->record.params = req.params;
  entry->record.message = "Queued";
  entry->record.created_at = Clock::now();

  {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    reap_workers_locked();
    jobs_.emplace(id, entry);
    order_.push_back(entry);
    workers_.push_back(entry);
    entry->worker = std::thread(&JobRegistry::run_job, this, entry);
  }

  LOG_INFO("[Job {}] Created: asset={}, type={}, key=#{}", id, asset_id,
           asset_kind_name(asset.kind), key.hex);
  job_id = id;
  return true;
}

bool JobRegistry::get_status(const std::string &job_id, JobSnapshot &snapshot,
                             Error &err) const {
  auto entry = find(job_id);
  if (!entry) {
    return err.set(ErrorKind::JobNotFound,
                   fmt::format("Job not found: {}", job_id));
  }
  std::lock_guard<std::mutex> lock(entry->mutex);
  snapshot = snapshot_of(*entry);
  return true;
}

bool JobRegistry::cancel(const std::string &job_id, JobStatus &status,
                         Error &err) {
  auto entry = find(job_id);
  if (!entry) {
    return err.set(ErrorKind::JobNotFound,
                   fmt::format("Job not found: {}", job_id));
  }

  std::shared_ptr<EncoderProcess> proc;
  {
    std::lock_guard<std::mutex> lock(entry->mutex);
    if (is_terminal(entry->record.status)) {
      status = entry->record.status;
      return true;
    }

    entry->cancel_requested.store(true);

    if (entry->record.status == JobStatus::Queued) {
      /// No process exists yet; the worker sees the flag and never starts one
      entry->record.status = JobStatus::Canceled;
      entry->record.finished_at = Clock::now();
      entry->record.message = "Canceled by user";
      entry->changed.notify_all();
      status = JobStatus::Canceled;
    } else {
      proc = entry->process;
    }
  }

  if (!proc) {
    gate_.wake_all();
    LOG_INFO("[Job {}] Canceled while queued", job_id);
    return true;
  }

  LOG_INFO("[Job {}] Canceling encoder (pid {})", job_id, proc->pid());
  supervisor_.cancel(*proc);

  /// The worker records the terminal state once it has seen the exit
  std::unique_lock<std::mutex> lock(entry->mutex);
  entry->changed.wait(lock,
                      [&entry] { return is_terminal(entry->record.status); });
  status = entry->record.status;
  return true;
}

bool JobRegistry::wait(const std::string &job_id,
                       std::chrono::milliseconds timeout,
                       JobSnapshot &snapshot, Error &err) const {
  auto entry = find(job_id);
  if (!entry) {
    return err.set(ErrorKind::JobNotFound,
                   fmt::format("Job not found: {}", job_id));
  }
  std::unique_lock<std::mutex> lock(entry->mutex);
  entry->changed.wait_for(lock, timeout, [&entry] {
    return is_terminal(entry->record.status);
  });
  snapshot = snapshot_of(*entry);
  return true;
}

bool JobRegistry::download(const std::string &job_id,
                           std::vector<uint8_t> &bytes, Error &err) const {
  JobSnapshot snap;
  if (!get_status(job_id, snap, err))
    return false;
  if (snap.status != JobStatus::Done || !snap.output) {
    return err.set(ErrorKind::JobNotFinished,
                   fmt::format("Job {} is {}, not done", job_id,
                               job_status_name(snap.status)));
  }

  std::ifstream in(snap.output->path, std::ios::binary);
  if (!in) {
    return err.set(ErrorKind::Io, fmt::format("Failed to open output '{}'",
                                              snap.output->path));
  }
  bytes.assign(std::istreambuf_iterator<char>(in),
               std::istreambuf_iterator<char>());
  return true;
}

std::vector<JobSnapshot> JobRegistry::list() const {
  std::vector<std::shared_ptr<JobEntry>> entries;
  {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    entries = order_;
  }

  std::vector<JobSnapshot> out;
  out.reserve(entries.size());
  for (const auto &entry : entries) {
    std::lock_guard<std::mutex> lock(entry->mutex);
    out.push_back(snapshot_of(*entry));
  }
  return out;
}

// **---- Worker ----**

void JobRegistry::run_job(std::shared_ptr<JobEntry> entry) {
  execute(entry);
  entry->worker_done.store(true);
}

void JobRegistry::execute(const std::shared_ptr<JobEntry> &entry) {
  const std::string &id = entry->record.id;

  if (!gate_.acquire(entry->cancel_requested))
    return;

  std::ofstream log_file(entry->log_path, std::ios::trunc);
  if (!log_file)
    LOG_WARN("[Job {}] Cannot write log file {}", id, entry->log_path);

  std::string command_line = "Command: " + join_command(entry->argv);
  if (log_file)
    log_file << command_line << '\n';

  LaunchRequest launch;
  launch.argv = entry->argv;
  launch.total_duration = (entry->asset.kind == AssetKind::Video)
                              ? entry->asset.metadata.duration
                              : 0.0;
  launch.on_line = [&entry, &log_file](const std::string &line) {
    if (log_file)
      log_file << line << '\n';
    std::lock_guard<std::mutex> lock(entry->mutex);
    entry->tail.push(line);
  };
  launch.on_progress = [&entry](double p) {
    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->record.status == JobStatus::Running &&
        p > entry->record.progress)
      entry->record.progress = p;
  };

  std::shared_ptr<EncoderProcess> proc;
  {
    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->record.status != JobStatus::Queued) {
      /// Canceled between admission and launch
      gate_.release();
      return;
    }

    entry->tail.push(command_line);

    Error err;
    proc = supervisor_.start(launch, err);
    if (!proc) {
      entry->record.status = JobStatus::Error;
      entry->record.finished_at = Clock::now();
      entry->record.failure_message = err.message;
      entry->record.message = "Failed to launch encoder";
      entry->tail.push(err.message);
      entry->changed.notify_all();
      LOG_ERROR("[Job {}] {}: {}", id, error_kind_name(err.kind), err.message);
      gate_.release();
      return;
    }

    entry->process = proc;
    entry->record.status = JobStatus::Running;
    entry->record.started_at = Clock::now();
    entry->record.message = "Rendering";
    entry->changed.notify_all();
  }

  LOG_PHASE("[Job {}] Encoder started (pid {})", id, proc->pid());

  const ProcessResult &result = proc->wait();

  /// The persisted log is complete before the status turns terminal
  if (log_file) {
    log_file << fmt::format("--- encoder finished: {} in {} ms ---\n",
                            result.describe(), result.duration.count());
    log_file.close();
  }

  finish(*entry, result);
  gate_.release();
}

void JobRegistry::finish(JobEntry &entry, const ProcessResult &result) {
  const std::string &id = entry.record.id;

  std::error_code ec;
  uint64_t size = 0;
  if (fs::is_regular_file(entry.output_path, ec))
    size = fs::file_size(entry.output_path, ec);
  if (ec)
    size = 0;

  /// Reaped under the entry lock: no snapshot shows running without a pid
  std::lock_guard<std::mutex> lock(entry.mutex);
  if (entry.process) {
    entry.process->reap();
    entry.process.reset();
  }
  entry.record.finished_at = Clock::now();

  if (entry.cancel_requested.load()) {
    entry.record.status = JobStatus::Canceled;
    entry.record.message = "Canceled by user";
    fs::remove(entry.output_path, ec);
    if (result.force_killed) {
      std::string anomaly = fmt::format(
          "{}: encoder ignored SIGTERM and was killed", error_kind_name(
                                                            ErrorKind::Cancellation));
      entry.tail.push(anomaly);
      LOG_WARN("[Job {}] {}", id, anomaly);
    }
    LOG_INFO("[Job {}] Canceled after {} ms", id, result.duration.count());
  } else if (result.success() && size > 0) {
    entry.record.status = JobStatus::Done;
    entry.record.progress = 1.0;
    entry.record.output = JobOutput{entry.output_path, size};
    entry.record.message = "Render completed successfully";
    LOG_SUCCESS("[Job {}] Completed: {} bytes in {}", id, size,
                format_time(result.duration.count() / 1000.0));
  } else {
    std::string reason =
        result.success()
            ? std::string("Encoder exited successfully but produced no output")
            : fmt::format("Encoder failed with {}", result.describe());
    std::string context = entry.tail.last(options_.failure_context_lines);
    entry.record.status = JobStatus::Error;
    entry.record.message = reason;
    entry.record.failure_message =
        context.empty() ? reason : fmt::format("{}\n{}", reason, context);
    fs::remove(entry.output_path, ec);
    LOG_ERROR("[Job {}] {}: {}", id,
              error_kind_name(ErrorKind::EncoderRuntime), reason);
  }

  entry.changed.notify_all();
}

} // namespace keyout

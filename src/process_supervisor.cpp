/**
 * @file process_supervisor.cpp
 * @brief Encoder process supervision implementation
 *
 * @details Launch uses fork/execvp with a close-on-exec error pipe: if exec
 *          fails the child writes errno into the pipe, so a missing binary
 *          is reported as a launch error instead of an exit code 127.
 */

#include "keyout/process_supervisor.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

#include "keyout/logging.hpp"
#include "keyout/progress_parser.hpp"

namespace keyout {

namespace {

void close_fd(int &fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

ssize_t read_retry(int fd, void *buf, size_t n) {
  ssize_t got;
  do {
    got = ::read(fd, buf, n);
  } while (got < 0 && errno == EINTR);
  return got;
}

} // anonymous namespace

// **---- ProcessResult ----**

std::string ProcessResult::describe() const {
  if (term_signal != 0)
    return fmt::format("signal {}", term_signal);
  return fmt::format("exit code {}", exit_code);
}

// **---- EncoderProcess ----**

EncoderProcess::~EncoderProcess() {
  if (reader_.joinable())
    reader_.join();
  reap();
}

bool EncoderProcess::exited() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return exited_;
}

void EncoderProcess::reap() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (reaped_ || !exited_)
    return;
  while (::waitpid(pid_, nullptr, 0) < 0 && errno == EINTR) {
  }
  reaped_ = true;
}

bool EncoderProcess::wait_for(std::chrono::milliseconds timeout) const {
  return result_.wait_for(timeout) == std::future_status::ready;
}

void EncoderProcess::reader_loop(int out_fd, int err_fd, LaunchRequest req) {
  ProgressParser parser(req.total_duration);
  std::string pending;
  std::vector<uint8_t> captured;
  char buf[8192];

  auto emit = [&](std::string line) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (parser.feed(line) && req.on_progress)
      req.on_progress(parser.progress());
    if (req.on_line)
      req.on_line(line);
  };

  /// Drain both pipes until the child closes them
  while (err_fd >= 0 || out_fd >= 0) {
    pollfd fds[2];
    int n = 0;
    if (err_fd >= 0)
      fds[n++] = {err_fd, POLLIN, 0};
    if (out_fd >= 0)
      fds[n++] = {out_fd, POLLIN, 0};

    if (::poll(fds, n, -1) < 0) {
      if (errno == EINTR)
        continue;
      LOG_ERROR("poll failed for pid {}: {}", pid_, std::strerror(errno));
      break;
    }

    for (int i = 0; i < n; ++i) {
      if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR)))
        continue;

      ssize_t got = read_retry(fds[i].fd, buf, sizeof(buf));
      bool is_err = (fds[i].fd == err_fd);
      if (got <= 0) {
        close_fd(is_err ? err_fd : out_fd);
        continue;
      }

      if (!is_err) {
        captured.insert(captured.end(), buf, buf + got);
        continue;
      }

      pending.append(buf, static_cast<size_t>(got));
      size_t pos;
      while ((pos = pending.find('\n')) != std::string::npos) {
        emit(pending.substr(0, pos));
        pending.erase(0, pos + 1);
      }
    }
  }
  close_fd(err_fd);
  close_fd(out_fd);

  if (!pending.empty())
    emit(pending);

  /// Wait without reaping; the pid and group stay valid until reap()
  siginfo_t info{};
  int rc;
  while ((rc = ::waitid(P_PID, static_cast<id_t>(pid_), &info,
                        WEXITED | WNOWAIT)) < 0 &&
         errno == EINTR) {
  }
  if (rc < 0)
    LOG_ERROR("waitid failed for pid {}: {}", pid_, std::strerror(errno));

  ProcessResult result;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    exited_ = true;
    result.force_killed = force_killed_;
    if (rc == 0 && info.si_code == CLD_EXITED) {
      result.exit_code = info.si_status;
    } else if (rc == 0 &&
               (info.si_code == CLD_KILLED || info.si_code == CLD_DUMPED)) {
      result.term_signal = info.si_status;
    }
  }

  result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started_);
  result.stdout_data = std::move(captured);
  promise_.set_value(std::move(result));
}

// **---- ProcessSupervisor ----**

ProcessSupervisor::ProcessSupervisor(std::chrono::milliseconds grace)
    : grace_(grace) {}

std::shared_ptr<EncoderProcess>
ProcessSupervisor::start(const LaunchRequest &req, Error &err) const {
  if (req.argv.empty()) {
    err.set(ErrorKind::EncoderLaunch, "Empty encoder command");
    return nullptr;
  }

  /// Everything the child touches is prepared before fork
  std::vector<char *> cargv;
  cargv.reserve(req.argv.size() + 1);
  for (const auto &arg : req.argv)
    cargv.push_back(const_cast<char *>(arg.c_str()));
  cargv.push_back(nullptr);
  const char *workdir = req.workdir.empty() ? nullptr : req.workdir.c_str();

  int err_pipe[2] = {-1, -1};
  int out_pipe[2] = {-1, -1};
  int exec_pipe[2] = {-1, -1};
  int devnull = ::open("/dev/null", O_RDWR | O_CLOEXEC);

  auto close_all = [&] {
    close_fd(err_pipe[0]);
    close_fd(err_pipe[1]);
    close_fd(out_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(exec_pipe[0]);
    close_fd(exec_pipe[1]);
    close_fd(devnull);
  };

  /// O_CLOEXEC keeps concurrent launches from inheriting each other's pipes
  if (devnull < 0 || ::pipe2(err_pipe, O_CLOEXEC) != 0 ||
      ::pipe2(exec_pipe, O_CLOEXEC) != 0 ||
      (req.capture_stdout && ::pipe2(out_pipe, O_CLOEXEC) != 0)) {
    err.set(ErrorKind::EncoderLaunch,
            fmt::format("Failed to create pipes: {}", std::strerror(errno)));
    close_all();
    return nullptr;
  }

  pid_t pid = ::fork();
  if (pid < 0) {
    err.set(ErrorKind::EncoderLaunch,
            fmt::format("fork failed: {}", std::strerror(errno)));
    close_all();
    return nullptr;
  }

  if (pid == 0) {
    /// Child: async-signal-safe calls only
    ::setpgid(0, 0);
    ::dup2(devnull, STDIN_FILENO);
    ::dup2(req.capture_stdout ? out_pipe[1] : devnull, STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);
    if (workdir == nullptr || ::chdir(workdir) == 0)
      ::execvp(cargv[0], cargv.data());
    int code = errno;
    ssize_t ignored = ::write(exec_pipe[1], &code, sizeof(code));
    (void)ignored;
    ::_exit(127);
  }

  /// Also set from the parent so the group exists before anyone signals it
  ::setpgid(pid, pid);

  close_fd(err_pipe[1]);
  close_fd(out_pipe[1]);
  close_fd(exec_pipe[1]);
  close_fd(devnull);

  int child_errno = 0;
  ssize_t got = read_retry(exec_pipe[0], &child_errno, sizeof(child_errno));
  close_fd(exec_pipe[0]);

  if (got == static_cast<ssize_t>(sizeof(child_errno))) {
    while (::waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {
    }
    close_all();
    err.set(ErrorKind::EncoderLaunch,
            fmt::format("Failed to launch '{}': {}", req.argv[0],
                        std::strerror(child_errno)));
    return nullptr;
  }

  std::shared_ptr<EncoderProcess> proc(new EncoderProcess());
  proc->pid_ = pid;
  proc->started_ = std::chrono::steady_clock::now();
  proc->result_ = proc->promise_.get_future().share();
  proc->reader_ = std::thread(&EncoderProcess::reader_loop, proc.get(),
                              out_pipe[0], err_pipe[0], req);
  return proc;
}

CancelOutcome ProcessSupervisor::cancel(EncoderProcess &proc) const {
  {
    std::lock_guard<std::mutex> lock(proc.mutex_);
    if (proc.exited_)
      return CancelOutcome::AlreadyExited;
    ::kill(-proc.pid_, SIGTERM);
  }

  if (proc.wait_for(grace_))
    return CancelOutcome::Terminated;

  {
    std::lock_guard<std::mutex> lock(proc.mutex_);
    if (!proc.exited_) {
      proc.force_killed_ = true;
      ::kill(-proc.pid_, SIGKILL);
    }
  }

  return proc.wait().force_killed ? CancelOutcome::ForceKilled
                                  : CancelOutcome::Terminated;
}

bool ProcessSupervisor::run(const LaunchRequest &req, ProcessResult &result,
                            Error &err) const {
  auto proc = start(req, err);
  if (!proc)
    return false;
  result = proc->wait();
  proc->reap();
  return true;
}

} // namespace keyout

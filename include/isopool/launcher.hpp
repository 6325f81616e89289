/**
 * @file launcher.hpp
 * @brief Starting worker processes and owning them from the supervisor side.
 *
 * Two launchers:
 *   - ForkLauncher: fork() and run the worker loop in the child with a
 *     handler built by a factory. No exec, so the handler type lives in the
 *     supervisor's binary.
 *   - ExecLauncher: fork() + execve() of a dedicated worker executable whose
 *     main() calls RunWorkerMain(). Channels arrive on fds 3 and 4.
 *
 * Either way, the child's inbound pipe is the supervisor's write end and its
 * outbound pipe the supervisor's read end. Both pipes are O_CLOEXEC.
 */

#ifndef ISOPOOL_LAUNCHER_HPP_
#define ISOPOOL_LAUNCHER_HPP_

#include "isopool/channel.hpp"
#include "isopool/codec.hpp"
#include "isopool/log.hpp"
#include "isopool/platform.hpp"
#include "isopool/process.hpp"
#include "isopool/vocabulary.hpp"
#include "isopool/worker.hpp"

#include <cstdint>
#include <cstring>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <unistd.h>

extern char** environ;  // NOLINT

namespace isopool {

// ============================================================================
// WorkerProcess
// ============================================================================

/**
 * @brief Owns one worker child: its pid and the supervisor's two pipe ends.
 *
 * Destruction kills and reaps a child that is still running, so a
 * WorkerProcess never leaves a zombie behind. Movable, not copyable.
 */
class WorkerProcess {
 public:
  WorkerProcess() noexcept = default;
  WorkerProcess(pid_t pid, int inbound_fd, int outbound_fd) noexcept
      : pid_(pid), inbound_fd_(inbound_fd), outbound_fd_(outbound_fd) {}

  ~WorkerProcess() { (void)Kill(); }

  WorkerProcess(const WorkerProcess&) = delete;
  WorkerProcess& operator=(const WorkerProcess&) = delete;

  WorkerProcess(WorkerProcess&& other) noexcept
      : pid_(other.pid_), inbound_fd_(other.inbound_fd_), outbound_fd_(other.outbound_fd_) {
    other.pid_ = -1;
    other.inbound_fd_ = -1;
    other.outbound_fd_ = -1;
  }

  WorkerProcess& operator=(WorkerProcess&& other) noexcept {
    if (this != &other) {
      (void)Kill();
      pid_ = other.pid_;
      inbound_fd_ = other.inbound_fd_;
      outbound_fd_ = other.outbound_fd_;
      other.pid_ = -1;
      other.inbound_fd_ = -1;
      other.outbound_fd_ = -1;
    }
    return *this;
  }

  pid_t Pid() const noexcept { return pid_; }
  int InboundFd() const noexcept { return inbound_fd_; }
  int OutboundFd() const noexcept { return outbound_fd_; }
  bool IsRunning() const { return pid_ > 0 && IsProcessAlive(pid_); }

  /** @brief Ask the worker to leave its loop: send kShutdown, close inbound. */
  void RequestStop() {
    if (inbound_fd_ >= 0) {
      // The worker may already be gone; EPIPE is expected then.
      (void)WriteFrame(inbound_fd_, FrameType::kShutdown, std::vector<uint8_t>());
      detail::CloseFd(inbound_fd_);
    }
  }

  /**
   * @brief Graceful stop: RequestStop(), wait up to @p grace_ms, then
   * SIGKILL. Always reaps.
   */
  WaitResult Terminate(uint32_t grace_ms) {
    RequestStop();
    WaitResult wr;
    if (pid_ > 0) {
      wr = ReapProcess(pid_, grace_ms == 0U ? 1U : grace_ms);
      if (wr.timed_out) {
        ISOPOOL_LOG_WARN("launcher", "worker pid %d ignored stop for %u ms, killing",
                         static_cast<int>(pid_), grace_ms);
        wr = KillAndReap(pid_);
      }
      pid_ = -1;
    }
    detail::CloseFd(outbound_fd_);
    return wr;
  }

  /** @brief Untrusted stop: close both channels, SIGKILL, reap. */
  WaitResult Kill() {
    detail::CloseFd(inbound_fd_);
    detail::CloseFd(outbound_fd_);
    WaitResult wr;
    if (pid_ > 0) {
      wr = KillAndReap(pid_);
      pid_ = -1;
    }
    return wr;
  }

  /**
   * @brief Collect a worker whose channel already broke: wait briefly for
   * its exit status, SIGKILL if it lingers.
   */
  WaitResult Collect(uint32_t wait_ms) {
    detail::CloseFd(inbound_fd_);
    detail::CloseFd(outbound_fd_);
    WaitResult wr;
    if (pid_ > 0) {
      wr = ReapProcess(pid_, wait_ms == 0U ? 1U : wait_ms);
      if (wr.timed_out) wr = KillAndReap(pid_);
      pid_ = -1;
    }
    return wr;
  }

 private:
  pid_t pid_ = -1;
  int inbound_fd_ = -1;   ///< supervisor -> worker (write end)
  int outbound_fd_ = -1;  ///< worker -> supervisor (read end)
};

// ============================================================================
// WorkerLauncher
// ============================================================================

struct LaunchRequest {
  WorkerId worker_id;
  uint32_t generation = 0;
  uint32_t max_tasks = 0;  ///< Worker-side recycle threshold (0 = unlimited)
  uint32_t max_frame_bytes = 16U * 1024U * 1024U;
};

class WorkerLauncher {
 public:
  virtual ~WorkerLauncher() = default;

  /** @brief Start one worker. Does not wait for its kReady handshake. */
  virtual expected<WorkerProcess, SpawnError> Launch(const LaunchRequest& req) = 0;

  virtual const char* Name() const noexcept = 0;
};

/**
 * @brief Wait for the kReady handshake of a freshly launched worker.
 * @return The worker's ReadyInfo, or kHandshakeTimeout / kHandshakeFailed /
 *         kInitFailed.
 */
inline expected<ReadyInfo, SpawnError> AwaitReady(const WorkerProcess& proc, uint32_t timeout_ms,
                                                  uint32_t max_frame_bytes) {
  auto frame = ReadFrame(proc.OutboundFd(), DeadlineMs(timeout_ms), max_frame_bytes);
  if (!frame.has_value()) {
    return expected<ReadyInfo, SpawnError>::error(frame.get_error() == ChannelError::kTimeout
                                                      ? SpawnError::kHandshakeTimeout
                                                      : SpawnError::kHandshakeFailed);
  }
  if (frame.value().type != FrameType::kReady) {
    return expected<ReadyInfo, SpawnError>::error(SpawnError::kHandshakeFailed);
  }
  auto info = DecodeReady(frame.value().body);
  if (!info.has_value()) return expected<ReadyInfo, SpawnError>::error(SpawnError::kHandshakeFailed);
  if (!info.value().init_ok) {
    ISOPOOL_LOG_ERROR("launcher", "worker pid %d init failed: %s", static_cast<int>(proc.Pid()),
                      info.value().message.c_str());
    return expected<ReadyInfo, SpawnError>::error(SpawnError::kInitFailed);
  }
  return expected<ReadyInfo, SpawnError>::success(std::move(info.value()));
}

// ============================================================================
// ForkLauncher
// ============================================================================

using HandlerFactory = std::function<std::unique_ptr<WorkHandler>()>;

/**
 * @brief Runs workers as plain forks of the supervisor process.
 *
 * The child drops every inherited descriptor except its own two channels,
 * then builds a fresh handler. Handler code must not rely on locks another
 * supervisor thread might hold at fork time; use ExecLauncher for SDKs that
 * start their own threads.
 */
class ForkLauncher final : public WorkerLauncher {
 public:
  explicit ForkLauncher(HandlerFactory factory) : factory_(std::move(factory)) {}

  expected<WorkerProcess, SpawnError> Launch(const LaunchRequest& req) override {
    detail::PipeGuard inbound;
    detail::PipeGuard outbound;
    if (!inbound.Create() || !outbound.Create()) {
      return expected<WorkerProcess, SpawnError>::error(SpawnError::kPipeFailed);
    }

    pid_t child = fork();
    if (child < 0) return expected<WorkerProcess, SpawnError>::error(SpawnError::kForkFailed);

    if (child == 0) {
      ResetChildSignals();
      int in_fd = inbound.ReleaseRead();
      int out_fd = outbound.ReleaseWrite();
      CloseInheritedFds(in_fd, out_fd);
      _exit(RunChild(in_fd, out_fd, req));
    }

    inbound.CloseRead();
    outbound.CloseWrite();
    return expected<WorkerProcess, SpawnError>::success(
        WorkerProcess(child, inbound.ReleaseWrite(), outbound.ReleaseRead()));
  }

  const char* Name() const noexcept override { return "fork"; }

 private:
  int RunChild(int in_fd, int out_fd, const LaunchRequest& req) {
    std::unique_ptr<WorkHandler> handler;
#ifdef ISOPOOL_HAS_EXCEPTIONS
    try {
      handler = factory_();
    } catch (const std::exception& e) {
      ISOPOOL_LOG_ERROR("worker", "handler factory threw: %s", e.what());
    }
#else
    handler = factory_();
#endif
    if (handler == nullptr) return WorkerExitCode(WorkerExit::kInitFailed);

    WorkerLoopOptions opts;
    opts.worker_id = req.worker_id.value();
    opts.max_tasks = req.max_tasks;
    opts.max_frame_bytes = req.max_frame_bytes;
    return WorkerExitCode(RunWorkerLoop(in_fd, out_fd, *handler, opts));
  }

  HandlerFactory factory_;
};

// ============================================================================
// ExecLauncher
// ============================================================================

/**
 * @brief Runs workers as a separate executable (fork + execve).
 *
 * argv and envp are fully built before fork(); the child only performs
 * async-signal-safe calls until execve().
 */
class ExecLauncher final : public WorkerLauncher {
 public:
  explicit ExecLauncher(std::string executable, std::vector<std::string> args = {})
      : executable_(std::move(executable)), args_(std::move(args)) {}

  expected<WorkerProcess, SpawnError> Launch(const LaunchRequest& req) override {
    std::vector<std::string> env_store = BuildEnv(req);
    std::vector<char*> envp;
    envp.reserve(env_store.size() + 1U);
    for (auto& s : env_store) envp.push_back(&s[0]);
    envp.push_back(nullptr);

    std::vector<std::string> argv_store;
    argv_store.reserve(args_.size() + 1U);
    argv_store.push_back(executable_);
    argv_store.insert(argv_store.end(), args_.begin(), args_.end());
    std::vector<char*> argv;
    argv.reserve(argv_store.size() + 1U);
    for (auto& s : argv_store) argv.push_back(&s[0]);
    argv.push_back(nullptr);

    detail::PipeGuard inbound;
    detail::PipeGuard outbound;
    if (!inbound.Create() || !outbound.Create()) {
      return expected<WorkerProcess, SpawnError>::error(SpawnError::kPipeFailed);
    }

    pid_t child = fork();
    if (child < 0) return expected<WorkerProcess, SpawnError>::error(SpawnError::kForkFailed);

    if (child == 0) {
      ResetChildSignals();
      // Park both ends above the target numbers so neither dup2 clobbers
      // the other, then land them on 3 and 4 (dup2 clears O_CLOEXEC).
      int in_tmp = fcntl(inbound.ReadEnd(), F_DUPFD_CLOEXEC, 10);
      int out_tmp = fcntl(outbound.WriteEnd(), F_DUPFD_CLOEXEC, 10);
      if (in_tmp < 0 || out_tmp < 0) _exit(126);
      if (dup2(in_tmp, kExecInboundFd) < 0 || dup2(out_tmp, kExecOutboundFd) < 0) _exit(126);
      CloseFdsFrom(kExecOutboundFd + 1);
      execve(argv[0], argv.data(), envp.data());
      _exit(127);
    }

    inbound.CloseRead();
    outbound.CloseWrite();
    return expected<WorkerProcess, SpawnError>::success(
        WorkerProcess(child, inbound.ReleaseWrite(), outbound.ReleaseRead()));
  }

  const char* Name() const noexcept override { return "exec"; }

  const std::string& Executable() const noexcept { return executable_; }

 private:
  std::vector<std::string> BuildEnv(const LaunchRequest& req) const {
    std::vector<std::string> env;
    for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
      if (std::strncmp(*e, "ISOPOOL_WORKER_", 15) == 0) continue;
      env.emplace_back(*e);
    }
    env.push_back("ISOPOOL_WORKER_IN_FD=" + std::to_string(kExecInboundFd));
    env.push_back("ISOPOOL_WORKER_OUT_FD=" + std::to_string(kExecOutboundFd));
    env.push_back("ISOPOOL_WORKER_ID=" + std::to_string(req.worker_id.value()));
    env.push_back("ISOPOOL_WORKER_GENERATION=" + std::to_string(req.generation));
    env.push_back("ISOPOOL_WORKER_MAX_TASKS=" + std::to_string(req.max_tasks));
    env.push_back("ISOPOOL_WORKER_MAX_FRAME_BYTES=" + std::to_string(req.max_frame_bytes));
    return env;
  }

  std::string executable_;
  std::vector<std::string> args_;
};

}  // namespace isopool

#endif  // ISOPOOL_LAUNCHER_HPP_

/**
 * @file worker.hpp
 * @brief Worker process side: the pluggable work interface and the receive
 * loop that runs inside each isolated child.
 *
 * A worker executes one unit at a time. Every result of the work function,
 * returned or thrown, is classified into a TaskReply before it leaves the
 * process; a work-level error never ends the loop.
 */

#ifndef ISOPOOL_WORKER_HPP_
#define ISOPOOL_WORKER_HPP_

#include "isopool/channel.hpp"
#include "isopool/codec.hpp"
#include "isopool/log.hpp"
#include "isopool/platform.hpp"
#include "isopool/vocabulary.hpp"
#include "isopool/work.hpp"

#include <cstdint>
#include <cstdlib>
#include <string>

#ifdef ISOPOOL_HAS_EXCEPTIONS
#include <exception>
#include <stdexcept>
#include <system_error>
#endif

#include <unistd.h>

namespace isopool {

// ============================================================================
// WorkHandler
// ============================================================================

/**
 * @brief The work function run inside a worker.
 *
 * Init() runs once per process before the first unit (load the SDK, warm
 * caches). Execute() may leak; the process is discarded on recycle.
 */
class WorkHandler {
 public:
  virtual ~WorkHandler() = default;

  virtual expected<void, WorkFailure> Init() { return expected<void, WorkFailure>::success(); }

  virtual expected<WorkResult, WorkFailure> Execute(const Payload& payload) = 0;
};

// ============================================================================
// Worker loop
// ============================================================================

struct WorkerLoopOptions {
  uint32_t worker_id = 0;
  uint32_t max_tasks = 0;  ///< Exit after this many units (0 = unlimited)
  uint32_t max_frame_bytes = 16U * 1024U * 1024U;
};

enum class WorkerExit : uint8_t {
  kShutdown = 0,    ///< Supervisor sent kShutdown
  kInboundClosed,   ///< Supervisor closed our inbound pipe
  kTaskLimit,       ///< max_tasks reached
  kInitFailed,
  kChannelError,    ///< I/O failure or protocol violation
};

inline const char* WorkerExitName(WorkerExit e) noexcept {
  switch (e) {
    case WorkerExit::kShutdown:
      return "shutdown";
    case WorkerExit::kInboundClosed:
      return "inbound_closed";
    case WorkerExit::kTaskLimit:
      return "task_limit";
    case WorkerExit::kInitFailed:
      return "init_failed";
    case WorkerExit::kChannelError:
      return "channel_error";
  }
  return "unknown";
}

/// Process exit status for a worker that left its loop.
inline int WorkerExitCode(WorkerExit e) noexcept {
  switch (e) {
    case WorkerExit::kShutdown:
    case WorkerExit::kInboundClosed:
    case WorkerExit::kTaskLimit:
      return 0;
    case WorkerExit::kInitFailed:
      return 3;
    case WorkerExit::kChannelError:
      return 4;
  }
  return 4;
}

namespace detail {

inline TaskReply FailureReply(UnitId id, FailureKind kind, std::string message) {
  TaskReply reply;
  reply.unit_id = id;
  reply.ok = false;
  reply.failure.kind = kind;
  reply.failure.message = std::move(message);
  return reply;
}

/** @brief Run Execute() and fold every way it can end into a TaskReply. */
inline TaskReply ExecuteClassified(WorkHandler& handler, const WorkUnit& unit) {
#ifdef ISOPOOL_HAS_EXCEPTIONS
  try {
#endif
    auto r = handler.Execute(unit.payload);
    if (!r.has_value()) {
      return FailureReply(unit.id, r.get_error().kind, r.get_error().message);
    }
    TaskReply reply;
    reply.unit_id = unit.id;
    reply.ok = true;
    reply.result = std::move(r).value();
    return reply;
#ifdef ISOPOOL_HAS_EXCEPTIONS
  } catch (const std::invalid_argument& e) {
    return FailureReply(unit.id, FailureKind::kInvalidInput, e.what());
  } catch (const std::out_of_range& e) {
    return FailureReply(unit.id, FailureKind::kResourceLimit, e.what());
  } catch (const std::length_error& e) {
    return FailureReply(unit.id, FailureKind::kResourceLimit, e.what());
  } catch (const std::system_error& e) {
    return FailureReply(unit.id, FailureKind::kIoError, e.what());
  } catch (const std::exception& e) {
    return FailureReply(unit.id, FailureKind::kExecutionError, e.what());
  } catch (...) {
    return FailureReply(unit.id, FailureKind::kExecutionError, "unknown exception");
  }
#endif
}

inline expected<void, WorkFailure> InitClassified(WorkHandler& handler) {
#ifdef ISOPOOL_HAS_EXCEPTIONS
  try {
    return handler.Init();
  } catch (const std::exception& e) {
    return expected<void, WorkFailure>::error(WorkFailure{FailureKind::kExecutionError, e.what()});
  } catch (...) {
    return expected<void, WorkFailure>::error(
        WorkFailure{FailureKind::kExecutionError, "unknown exception"});
  }
#else
  return handler.Init();
#endif
}

}  // namespace detail

/**
 * @brief Serve units from @p in_fd until told to stop.
 *
 * 1. Init() the handler, report kReady (with the failure text, if any).
 * 2. For each kTask: execute, reply kOutcome, count the completion.
 * 3. Leave on kShutdown, inbound EOF, or after opts.max_tasks units.
 */
inline WorkerExit RunWorkerLoop(int in_fd, int out_fd, WorkHandler& handler, const WorkerLoopOptions& opts) {
  auto init = detail::InitClassified(handler);

  ReadyInfo ready;
  ready.pid = static_cast<int32_t>(getpid());
  ready.init_ok = init.has_value();
  if (!ready.init_ok) ready.message = init.get_error().message;
  if (!WriteFrame(out_fd, FrameType::kReady, EncodeReady(ready)).has_value()) {
    return WorkerExit::kChannelError;
  }
  if (!ready.init_ok) {
    ISOPOOL_LOG_ERROR("worker", "worker %u init failed: %s", opts.worker_id, ready.message.c_str());
    return WorkerExit::kInitFailed;
  }

  uint32_t completed = 0;
  for (;;) {
    auto frame = ReadFrame(in_fd, kNoDeadline, opts.max_frame_bytes);
    if (!frame.has_value()) {
      if (frame.get_error() == ChannelError::kClosed) return WorkerExit::kInboundClosed;
      ISOPOOL_LOG_ERROR("worker", "worker %u inbound read failed: %s", opts.worker_id,
                        ChannelErrorName(frame.get_error()));
      return WorkerExit::kChannelError;
    }

    if (frame.value().type == FrameType::kShutdown) return WorkerExit::kShutdown;
    if (frame.value().type != FrameType::kTask) {
      ISOPOOL_LOG_ERROR("worker", "worker %u unexpected frame type %u", opts.worker_id,
                        static_cast<unsigned>(frame.value().type));
      return WorkerExit::kChannelError;
    }

    auto unit = DecodeTask(frame.value().body);
    if (!unit.has_value()) {
      ISOPOOL_LOG_ERROR("worker", "worker %u received undecodable task", opts.worker_id);
      return WorkerExit::kChannelError;
    }

    TaskReply reply = detail::ExecuteClassified(handler, unit.value());
    if (!reply.ok) {
      ISOPOOL_LOG_WARN("worker", "[%.8s] unit %llu failed: %s: %s", unit.value().trace_id.c_str(),
                       static_cast<unsigned long long>(unit.value().id.value()),
                       FailureKindName(reply.failure.kind), reply.failure.message.c_str());
    }
    if (!WriteFrame(out_fd, FrameType::kOutcome, EncodeOutcome(reply)).has_value()) {
      return WorkerExit::kChannelError;
    }

    ++completed;
    if (opts.max_tasks != 0U && completed >= opts.max_tasks) {
      ISOPOOL_LOG_DEBUG("worker", "worker %u reached %u tasks, exiting", opts.worker_id, completed);
      return WorkerExit::kTaskLimit;
    }
  }
}

namespace detail {

inline uint32_t EnvU32Or(const char* name, uint32_t fallback) {
  const char* text = std::getenv(name);
  if (text == nullptr || *text == '\0') return fallback;
  char* end = nullptr;
  unsigned long v = std::strtoul(text, &end, 10);
  return (*end == '\0') ? static_cast<uint32_t>(v) : fallback;
}

}  // namespace detail

/// Channel fds an exec-mode worker finds its pipes on.
static constexpr int kExecInboundFd = 3;
static constexpr int kExecOutboundFd = 4;

/**
 * @brief main() body for an exec-mode worker executable.
 *
 * Reads ISOPOOL_WORKER_IN_FD / ISOPOOL_WORKER_OUT_FD (default 3 / 4),
 * ISOPOOL_WORKER_ID and ISOPOOL_WORKER_MAX_TASKS from the environment.
 * @return Process exit status.
 */
inline int RunWorkerMain(WorkHandler& handler) {
  log::Init();
  WorkerLoopOptions opts;
  opts.worker_id = detail::EnvU32Or("ISOPOOL_WORKER_ID", 0U);
  opts.max_tasks = detail::EnvU32Or("ISOPOOL_WORKER_MAX_TASKS", 0U);
  opts.max_frame_bytes = detail::EnvU32Or("ISOPOOL_WORKER_MAX_FRAME_BYTES", opts.max_frame_bytes);
  int in_fd = static_cast<int>(detail::EnvU32Or("ISOPOOL_WORKER_IN_FD", kExecInboundFd));
  int out_fd = static_cast<int>(detail::EnvU32Or("ISOPOOL_WORKER_OUT_FD", kExecOutboundFd));

  WorkerExit exit = RunWorkerLoop(in_fd, out_fd, handler, opts);
  ISOPOOL_LOG_DEBUG("worker", "worker %u exiting: %s", opts.worker_id, WorkerExitName(exit));
  return WorkerExitCode(exit);
}

}  // namespace isopool

#endif  // ISOPOOL_WORKER_HPP_

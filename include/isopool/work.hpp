/**
 * @file work.hpp
 * @brief Work unit, work result and the tagged Outcome returned to callers.
 *
 * A WorkUnit is immutable once built by the Dispatcher and resolves to
 * exactly one Outcome. Only closed, serializable data (strings and string
 * maps) travels with a unit, so it can cross the process boundary.
 */

#ifndef ISOPOOL_WORK_HPP_
#define ISOPOOL_WORK_HPP_

#include "isopool/vocabulary.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <variant>

namespace isopool {

using StringMap = std::map<std::string, std::string>;

// ============================================================================
// Input
// ============================================================================

/** @brief Input of one unit: a filesystem reference plus small parameters. */
struct Payload {
  std::string input_path;
  StringMap params;  ///< e.g. {"language": "auto"}
};

struct WorkUnit {
  UnitId id;
  std::string trace_id;
  Payload payload;
  uint64_t submitted_us = 0;  ///< SteadyNowUs() at submission
};

// ============================================================================
// Worker-side Result
// ============================================================================

struct WorkResult {
  std::string text;
  StringMap fields;
};

enum class FailureKind : uint8_t {
  kInvalidInput = 0,
  kUnsupportedFormat,
  kInputNotFound,
  kResourceLimit,  ///< Input too large or too long
  kIoError,
  kExecutionError,  ///< Anything the handler could not classify
};

/** @brief A domain error raised by the work function. Never kills the worker. */
struct WorkFailure {
  FailureKind kind = FailureKind::kExecutionError;
  std::string message;
};

inline const char* FailureKindName(FailureKind kind) noexcept {
  switch (kind) {
    case FailureKind::kInvalidInput:
      return "invalid_input";
    case FailureKind::kUnsupportedFormat:
      return "unsupported_format";
    case FailureKind::kInputNotFound:
      return "input_not_found";
    case FailureKind::kResourceLimit:
      return "resource_limit";
    case FailureKind::kIoError:
      return "io_error";
    case FailureKind::kExecutionError:
      return "execution_error";
  }
  return "unknown";
}

// ============================================================================
// Outcome alternatives
// ============================================================================

struct Success {
  WorkResult result;
};

struct Failure {
  FailureKind kind = FailureKind::kExecutionError;
  std::string message;
};

/// The call exceeded its deadline; the worker was killed and replaced.
struct Timeout {
  uint32_t timeout_ms = 0;
};

/// The worker exited or closed its channel mid-call.
struct WorkerCrashed {
  std::string detail;  ///< "exit code 3", "signal 6 (Aborted)", ...
};

/// No worker became free in time, or the pending queue was full.
struct QueueTimeout {
  uint32_t waited_ms = 0;
  bool queue_full = false;
};

struct Disabled {};

struct ShuttingDown {};

/// Spawning a worker failed and no worker could be assigned.
struct PoolUnavailable {
  std::string detail;
};

using OutcomeValue = std::variant<Success, Failure, Timeout, WorkerCrashed, QueueTimeout, Disabled,
                                  ShuttingDown, PoolUnavailable>;

/// Variant index order of OutcomeValue.
enum class OutcomeKind : uint8_t {
  kSuccess = 0,
  kFailure,
  kTimeout,
  kWorkerCrashed,
  kQueueTimeout,
  kDisabled,
  kShuttingDown,
  kPoolUnavailable,
};

inline const char* OutcomeKindName(OutcomeKind kind) noexcept {
  switch (kind) {
    case OutcomeKind::kSuccess:
      return "success";
    case OutcomeKind::kFailure:
      return "failure";
    case OutcomeKind::kTimeout:
      return "timeout";
    case OutcomeKind::kWorkerCrashed:
      return "worker_crashed";
    case OutcomeKind::kQueueTimeout:
      return "queue_timeout";
    case OutcomeKind::kDisabled:
      return "disabled";
    case OutcomeKind::kShuttingDown:
      return "shutting_down";
    case OutcomeKind::kPoolUnavailable:
      return "pool_unavailable";
  }
  return "unknown";
}

// ============================================================================
// Outcome
// ============================================================================

struct Outcome {
  UnitId unit_id;
  std::string trace_id;
  OutcomeValue value;
  uint64_t elapsed_us = 0;      ///< Submission to resolution
  int32_t worker_pid = 0;       ///< 0 when no worker was involved
  uint32_t worker_slot = 0;     ///< Valid when worker_pid != 0
  uint32_t worker_generation = 0;

  OutcomeKind Kind() const noexcept { return static_cast<OutcomeKind>(value.index()); }
  bool IsSuccess() const noexcept { return value.index() == 0U; }

  template <typename T>
  const T* As() const noexcept {
    return std::get_if<T>(&value);
  }
};

/**
 * @brief Status class an HTTP layer should answer with.
 *
 * 4xx separates "your input was bad"; 5xx/503 separates "the system
 * failed or was overloaded".
 */
inline int SuggestedHttpStatus(const Outcome& outcome) noexcept {
  switch (outcome.Kind()) {
    case OutcomeKind::kSuccess:
      return 200;
    case OutcomeKind::kFailure: {
      const Failure* f = outcome.As<Failure>();
      switch (f->kind) {
        case FailureKind::kInvalidInput:
          return 400;
        case FailureKind::kInputNotFound:
          return 404;
        case FailureKind::kResourceLimit:
          return 413;
        case FailureKind::kUnsupportedFormat:
          return 415;
        case FailureKind::kIoError:
        case FailureKind::kExecutionError:
          return 422;
      }
      return 422;
    }
    case OutcomeKind::kTimeout:
      return 504;
    case OutcomeKind::kWorkerCrashed:
      return 500;
    case OutcomeKind::kQueueTimeout:
    case OutcomeKind::kDisabled:
    case OutcomeKind::kShuttingDown:
    case OutcomeKind::kPoolUnavailable:
      return 503;
  }
  return 500;
}

}  // namespace isopool

#endif  // ISOPOOL_WORK_HPP_

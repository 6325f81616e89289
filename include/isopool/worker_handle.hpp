/**
 * @file worker_handle.hpp
 * @brief Supervisor-side record of one worker generation in one slot.
 *
 * A slot (worker_id) outlives its workers: every respawn creates a fresh
 * WorkerHandle with the same worker_id, the next generation and
 * tasks_completed back at 0.
 */

#ifndef ISOPOOL_WORKER_HANDLE_HPP_
#define ISOPOOL_WORKER_HANDLE_HPP_

#include "isopool/launcher.hpp"
#include "isopool/vocabulary.hpp"

#include <cstdint>

#include <sys/types.h>

namespace isopool {

enum class WorkerStatus : uint8_t {
  kSpawning = 0,  ///< Slot reserved, process starting or handshaking
  kIdle,
  kBusy,      ///< Exactly one unit in flight
  kRetiring,  ///< Being stopped (recycle, idle reap, shutdown)
  kDead,
};

inline const char* WorkerStatusName(WorkerStatus s) noexcept {
  switch (s) {
    case WorkerStatus::kSpawning:
      return "spawning";
    case WorkerStatus::kIdle:
      return "idle";
    case WorkerStatus::kBusy:
      return "busy";
    case WorkerStatus::kRetiring:
      return "retiring";
    case WorkerStatus::kDead:
      return "dead";
  }
  return "unknown";
}

struct WorkerHandle {
  WorkerId worker_id;
  uint32_t generation = 0;
  WorkerProcess process;  ///< Touched only by the thread that owns the handle
  pid_t pid = -1;         ///< Copy of process.Pid(), fixed once spawned
  uint32_t tasks_completed = 0;
  uint64_t spawned_us = 0;
  uint64_t last_active_us = 0;
  WorkerStatus status = WorkerStatus::kSpawning;
  bool healthy = true;  ///< false once the process was lost mid-call
  UnitId current_unit;

  bool IsLive() const noexcept { return status != WorkerStatus::kDead; }
};

}  // namespace isopool

#endif  // ISOPOOL_WORKER_HANDLE_HPP_

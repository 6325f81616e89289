/**
 * @file supervisor.hpp
 * @brief Pool supervisor: worker lifecycle, assignment, timeouts, recycling
 * and idle reaping.
 *
 * Per slot:  Spawning -> Idle <-> Busy -> Retiring -> Dead -> (Spawning)
 *
 * Locking:
 *   - One mutex guards the slot table, the pending queue and the counters.
 *   - Nothing that can block (fork, handshake, pipe I/O, waitpid) runs
 *     under it. A thread that moved a handle out of Idle (to Busy, Retiring
 *     or Spawning) owns the handle's process until it gives the slot back.
 *   - Every queued caller waits on its own condition variable; a worker
 *     freed by Release() goes straight to the head of the queue.
 *
 * Invariant: Spawning + Idle + Busy + Retiring <= max_workers.
 */

#ifndef ISOPOOL_SUPERVISOR_HPP_
#define ISOPOOL_SUPERVISOR_HPP_

#include "isopool/channel.hpp"
#include "isopool/codec.hpp"
#include "isopool/launcher.hpp"
#include "isopool/log.hpp"
#include "isopool/platform.hpp"
#include "isopool/pool_config.hpp"
#include "isopool/process.hpp"
#include "isopool/timer.hpp"
#include "isopool/vocabulary.hpp"
#include "isopool/work.hpp"
#include "isopool/worker_handle.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <signal.h>

namespace isopool {

// ============================================================================
// Introspection
// ============================================================================

struct WorkerInfo {
  uint32_t worker_id = 0;
  uint32_t generation = 0;
  int32_t pid = 0;
  WorkerStatus status = WorkerStatus::kDead;
  uint32_t tasks_completed = 0;
  uint64_t idle_ms = 0;  ///< 0 unless Idle
  uint64_t rss_kb = 0;  ///< 0 while Spawning, Retiring or lost
};

struct SupervisorCounters {
  uint64_t spawned = 0;
  uint64_t spawn_failures = 0;
  uint64_t recycled = 0;  ///< Retired at max_tasks_per_worker
  uint64_t reaped = 0;    ///< Stopped by the idle reaper
  uint64_t timeouts = 0;  ///< Killed for exceeding the call deadline
  uint64_t crashes = 0;   ///< Lost mid-call, or found dead while idle
  uint64_t queued = 0;    ///< Acquire() calls that had to wait
};

struct PoolSnapshot {
  bool running = false;
  bool shutting_down = false;
  uint32_t max_workers = 0;
  uint32_t live = 0;
  uint32_t spawning = 0;
  uint32_t idle = 0;
  uint32_t busy = 0;
  uint32_t retiring = 0;
  uint32_t queue_depth = 0;
  std::vector<WorkerInfo> workers;
  SupervisorCounters counters;
  /// tasks_completed at retirement -> number of retired generations
  std::map<uint32_t, uint64_t> retired_tasks_histogram;
  uint64_t supervisor_rss_kb = 0;
};

enum class AcquireError : uint8_t {
  kQueueTimeout = 0,
  kQueueFull,
  kShuttingDown,
};

// ============================================================================
// Supervisor
// ============================================================================

class Supervisor final {
 public:
  Supervisor(const PoolConfig& cfg, std::unique_ptr<WorkerLauncher> launcher)
      : cfg_(cfg), launcher_(std::move(launcher)), slots_(cfg.max_workers), generations_(cfg.max_workers, 0U) {
    ISOPOOL_ASSERT(launcher_ != nullptr);
    (void)IgnoreSigpipe();
  }

  ~Supervisor() { Shutdown(); }

  Supervisor(const Supervisor&) = delete;
  Supervisor& operator=(const Supervisor&) = delete;

  // --------------------------------------------------------------------------
  // Lifecycle
  // --------------------------------------------------------------------------

  /**
   * @brief Start the idle reaper and warm min_workers processes.
   *
   * A failed warm spawn is reported but leaves the supervisor running; the
   * missing workers are spawned on the next submission.
   */
  expected<void, SpawnError> Start() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (shutting_down_) return expected<void, SpawnError>::error(SpawnError::kShuttingDown);
      if (started_) return expected<void, SpawnError>::success();
      started_ = true;
    }
    auto t = reaper_.Start(cfg_.reap_interval_ms, [this] { OnReapTick(); });
    if (!t.has_value()) {
      ISOPOOL_LOG_WARN("supervisor", "idle reaper not started");
    }
    ISOPOOL_LOG_INFO("supervisor",
                     "started: launcher=%s max_workers=%u min_workers=%u recycle_after=%u "
                     "idle_timeout=%ums call_timeout=%ums",
                     launcher_->Name(), cfg_.max_workers, cfg_.min_workers, cfg_.max_tasks_per_worker,
                     cfg_.idle_timeout_ms, cfg_.call_timeout_ms);
    return SpawnUpTo(cfg_.min_workers);
  }

  /**
   * @brief Stop everything. Idempotent.
   *
   * 1. Refuse new work, stop the reaper, fail queued callers with
   *    kShuttingDown.
   * 2. Stop idle workers (kShutdown, grace, SIGKILL).
   * 3. Give busy workers shutdown_grace_ms to finish, then SIGKILL them.
   * 4. Wait until every slot has been handed back.
   */
  void Shutdown() {
    {
      std::unique_lock<std::mutex> lock(mutex_);
      if (shutting_down_) {
        // Another Shutdown() is (or was) doing the work.
        slots_cv_.wait(lock, [this] { return shutdown_done_; });
        return;
      }
      shutting_down_ = true;
      shutting_down_flag_.store(true, std::memory_order_release);
    }
    reaper_.Stop();

    std::vector<std::unique_ptr<WorkerHandle>> idle;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      for (PendingEntry* entry : pending_) {
        entry->cancelled = true;
        entry->cv.notify_one();
      }
      pending_.clear();
      for (auto& slot : slots_) {
        if (slot != nullptr && slot->status == WorkerStatus::kIdle) {
          slot->status = WorkerStatus::kRetiring;
          RecordRetiredLocked(*slot);
          idle.push_back(std::move(slot));
        }
      }
    }

    ISOPOOL_LOG_INFO("supervisor", "shutting down: stopping %zu idle workers", idle.size());
    for (auto& h : idle) h->process.RequestStop();
    for (auto& h : idle) (void)h->process.Terminate(cfg_.shutdown_grace_ms);
    idle.clear();

    std::unique_lock<std::mutex> lock(mutex_);
    auto grace = std::chrono::steady_clock::now() + std::chrono::milliseconds(cfg_.shutdown_grace_ms);
    if (!slots_cv_.wait_until(lock, grace, [this] { return !HasBusyLocked(); })) {
      for (auto& slot : slots_) {
        if (slot != nullptr && slot->status == WorkerStatus::kBusy && slot->healthy && slot->pid > 0) {
          ISOPOOL_LOG_WARN("supervisor", "worker %u (pid %d) still busy after grace, killing",
                           slot->worker_id.value(), static_cast<int>(slot->pid));
          // The owning caller sees EOF, then reaps it.
          (void)kill(slot->pid, SIGKILL);
        }
      }
    }
    slots_cv_.wait(lock, [this] { return AllSlotsEmptyLocked(); });
    shutdown_done_ = true;
    slots_cv_.notify_all();
    ISOPOOL_LOG_INFO("supervisor", "shutdown complete");
  }

  bool IsShuttingDown() const noexcept { return shutting_down_flag_.load(std::memory_order_acquire); }

  // --------------------------------------------------------------------------
  // Capacity
  // --------------------------------------------------------------------------

  /**
   * @brief Spawn workers into every empty slot.
   *
   * Stops at the first spawn failure. Reports that failure only when no
   * worker at all is left to serve or queue for; otherwise callers can
   * still be served by the live ones.
   */
  expected<void, SpawnError> EnsureCapacity() { return SpawnUpTo(cfg_.max_workers); }

  // --------------------------------------------------------------------------
  // Assignment
  // --------------------------------------------------------------------------

  /**
   * @brief Take an idle worker for @p unit, or queue (FIFO) for one.
   *
   * The returned handle is Busy and owned by the caller until Release().
   */
  expected<WorkerHandle*, AcquireError> Acquire(const WorkUnit& unit, uint32_t queue_timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (shutting_down_) return expected<WorkerHandle*, AcquireError>::error(AcquireError::kShuttingDown);

    for (auto& slot : slots_) {
      if (slot != nullptr && slot->status == WorkerStatus::kIdle) {
        slot->status = WorkerStatus::kBusy;
        slot->current_unit = unit.id;
        return expected<WorkerHandle*, AcquireError>::success(slot.get());
      }
    }

    if (pending_.size() >= cfg_.max_queue_depth) {
      return expected<WorkerHandle*, AcquireError>::error(AcquireError::kQueueFull);
    }

    PendingEntry entry;
    entry.unit_id = unit.id;
    pending_.push_back(&entry);
    ++counters_.queued;

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(queue_timeout_ms);
    (void)entry.cv.wait_until(lock, deadline, [&entry] { return entry.handle != nullptr || entry.cancelled; });

    if (entry.handle != nullptr) {
      return expected<WorkerHandle*, AcquireError>::success(entry.handle);
    }
    auto it = std::find(pending_.begin(), pending_.end(), &entry);
    if (it != pending_.end()) pending_.erase(it);
    if (entry.cancelled) return expected<WorkerHandle*, AcquireError>::error(AcquireError::kShuttingDown);
    return expected<WorkerHandle*, AcquireError>::error(AcquireError::kQueueTimeout);
  }

  /**
   * @brief Run @p unit on the Busy @p handle and wait for its outcome.
   *
   * Races the worker's reply against @p call_timeout_ms in poll(2). On
   * timeout the worker is SIGKILLed without a chance to clean up; on a
   * broken channel it is reaped. Either way handle.healthy turns false and
   * Release() replaces the worker.
   */
  OutcomeValue Dispatch(WorkerHandle& handle, const WorkUnit& unit, uint32_t call_timeout_ms) {
    auto sent = WriteFrame(handle.process.InboundFd(), FrameType::kTask, EncodeTask(unit));
    if (!sent.has_value()) {
      return LoseWorker(handle, "inbound write failed", false);
    }

    auto frame = ReadFrame(handle.process.OutboundFd(), DeadlineMs(call_timeout_ms),
                           cfg_.max_frame_bytes);
    if (!frame.has_value()) {
      if (frame.get_error() == ChannelError::kTimeout) {
        if (IsShuttingDown()) return LoseWorker(handle, "timed out during shutdown", true);
        MarkLost(handle);
        (void)handle.process.Kill();
        {
          std::lock_guard<std::mutex> lock(mutex_);
          ++counters_.timeouts;
        }
        ISOPOOL_LOG_WARN("supervisor", "[%.8s] unit %llu timed out after %u ms on worker %u (pid %d), killed",
                         unit.trace_id.c_str(), static_cast<unsigned long long>(unit.id.value()),
                         call_timeout_ms, handle.worker_id.value(), static_cast<int>(handle.pid));
        Timeout t;
        t.timeout_ms = call_timeout_ms;
        return t;
      }
      return LoseWorker(handle, ChannelErrorName(frame.get_error()), frame.get_error() != ChannelError::kClosed);
    }

    if (frame.value().type != FrameType::kOutcome) {
      return LoseWorker(handle, "unexpected frame from worker", true);
    }
    auto reply = DecodeOutcome(frame.value().body);
    if (!reply.has_value() || reply.value().unit_id != unit.id) {
      return LoseWorker(handle, "undecodable or mismatched reply", true);
    }

    if (reply.value().ok) {
      Success s;
      s.result = std::move(reply.value().result);
      return s;
    }
    Failure f;
    f.kind = reply.value().failure.kind;
    f.message = std::move(reply.value().failure.message);
    return f;
  }

  /**
   * @brief Give a Busy handle back after its unit resolved.
   *
   * - lost worker: slot respawned with the next generation
   * - tasks_completed reached max_tasks_per_worker: retired and respawned
   * - otherwise: Idle, or handed directly to the oldest queued caller
   *
   * Respawns run in the calling thread before this returns.
   */
  void Release(WorkerHandle* handle, OutcomeKind kind) {
    ISOPOOL_ASSERT(handle != nullptr);
    const uint32_t idx = handle->worker_id.value();
    std::unique_ptr<WorkerHandle> retired;
    uint32_t next_gen = 0;
    WorkerHandle* respawn = nullptr;

    {
      std::lock_guard<std::mutex> lock(mutex_);
      ISOPOOL_ASSERT(slots_[idx].get() == handle);
      handle->current_unit = UnitId();

      if (!handle->healthy) {
        handle->status = WorkerStatus::kDead;
        RecordRetiredLocked(*handle);
        retired = std::move(slots_[idx]);
        respawn = ReserveSlotLocked(idx, &next_gen);
        slots_cv_.notify_all();
      } else {
        if (kind == OutcomeKind::kSuccess || kind == OutcomeKind::kFailure) {
          ++handle->tasks_completed;
        }
        handle->last_active_us = SteadyNowUs();
        if (shutting_down_ || handle->tasks_completed >= cfg_.max_tasks_per_worker) {
          handle->status = WorkerStatus::kRetiring;
        } else {
          MakeIdleLocked(handle);
          return;
        }
      }
    }

    if (retired == nullptr) {
      // Retiring: stop it outside the lock, then reuse the slot.
      const bool recycle = !IsShuttingDown();
      ISOPOOL_LOG_DEBUG("supervisor", "worker %u gen %u (pid %d) retiring after %u tasks",
                        handle->worker_id.value(), handle->generation, static_cast<int>(handle->pid),
                        handle->tasks_completed);
      (void)handle->process.Terminate(cfg_.shutdown_grace_ms);
      std::lock_guard<std::mutex> lock(mutex_);
      handle->status = WorkerStatus::kDead;
      RecordRetiredLocked(*handle);
      if (recycle) ++counters_.recycled;
      retired = std::move(slots_[idx]);
      respawn = ReserveSlotLocked(idx, &next_gen);
      slots_cv_.notify_all();
    }

    retired.reset();
    if (respawn != nullptr) (void)CompleteSpawn(idx, respawn, next_gen);
  }

  // --------------------------------------------------------------------------
  // Idle reaper
  // --------------------------------------------------------------------------

  /**
   * @brief Stop workers idle longer than idle_timeout_ms, never going below
   * min_workers, and drop idle workers that died on their own. Runs every
   * reap_interval_ms once Start()ed; callable directly.
   * @return Number of workers removed.
   */
  uint32_t IdleReap() {
    std::vector<std::unique_ptr<WorkerHandle>> victims;
    std::vector<std::unique_ptr<WorkerHandle>> dead;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (shutting_down_) return 0U;
      const uint64_t now = SteadyNowUs();
      const uint64_t idle_limit_us = static_cast<uint64_t>(cfg_.idle_timeout_ms) * 1000U;
      uint32_t live = LiveCountLocked();

      for (auto& slot : slots_) {
        if (slot == nullptr || slot->status != WorkerStatus::kIdle) continue;
        if (HasExited(slot->pid)) {
          ISOPOOL_LOG_WARN("supervisor", "idle worker %u (pid %d) died on its own", slot->worker_id.value(),
                           static_cast<int>(slot->pid));
          slot->status = WorkerStatus::kDead;
          RecordRetiredLocked(*slot);
          ++counters_.crashes;
          dead.push_back(std::move(slot));
          --live;
          continue;
        }
        if (live > cfg_.min_workers && now - slot->last_active_us >= idle_limit_us) {
          slot->status = WorkerStatus::kRetiring;
          RecordRetiredLocked(*slot);
          ++counters_.reaped;
          victims.push_back(std::move(slot));
          --live;
        }
      }
      if (!victims.empty() || !dead.empty()) slots_cv_.notify_all();
    }

    for (auto& h : dead) (void)h->process.Collect(cfg_.shutdown_grace_ms);
    for (auto& h : victims) {
      ISOPOOL_LOG_INFO("supervisor", "reaping idle worker %u gen %u (pid %d, %u tasks, rss %llu KiB)",
                       h->worker_id.value(), h->generation, static_cast<int>(h->pid), h->tasks_completed,
                       static_cast<unsigned long long>(ReadProcessRssKb(h->pid)));
      (void)h->process.Terminate(cfg_.shutdown_grace_ms);
    }
    return static_cast<uint32_t>(victims.size() + dead.size());
  }

  // --------------------------------------------------------------------------
  // Introspection
  // --------------------------------------------------------------------------

  PoolSnapshot Snapshot() const {
    PoolSnapshot snap;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      const uint64_t now = SteadyNowUs();
      snap.running = started_ && !shutting_down_;
      snap.shutting_down = shutting_down_;
      snap.max_workers = cfg_.max_workers;
      snap.queue_depth = static_cast<uint32_t>(pending_.size());
      snap.counters = counters_;
      snap.retired_tasks_histogram = retired_histogram_;
      for (const auto& slot : slots_) {
        if (slot == nullptr || !slot->IsLive()) continue;
        ++snap.live;
        switch (slot->status) {
          case WorkerStatus::kSpawning:
            ++snap.spawning;
            break;
          case WorkerStatus::kIdle:
            ++snap.idle;
            break;
          case WorkerStatus::kBusy:
            ++snap.busy;
            break;
          case WorkerStatus::kRetiring:
            ++snap.retiring;
            break;
          case WorkerStatus::kDead:
            break;
        }
        WorkerInfo info;
        info.worker_id = slot->worker_id.value();
        info.generation = slot->generation;
        info.pid = static_cast<int32_t>(slot->pid);
        info.status = slot->status;
        info.tasks_completed = slot->tasks_completed;
        // Under the lock an Idle or healthy Busy pid is not reaped yet, so
        // it cannot have been reused. Retiring and lost workers are reaped
        // outside the lock and report 0.
        const bool pinned = slot->status == WorkerStatus::kIdle ||
                            (slot->status == WorkerStatus::kBusy && slot->healthy);
        if (pinned && slot->pid > 0) info.rss_kb = ReadProcessRssKb(slot->pid);
        if (slot->status == WorkerStatus::kIdle && now > slot->last_active_us) {
          info.idle_ms = (now - slot->last_active_us) / 1000U;
        }
        snap.workers.push_back(info);
      }
    }
    snap.supervisor_rss_kb = ReadSelfRssKb();
    return snap;
  }

  const PoolConfig& GetConfig() const noexcept { return cfg_; }

 private:
  struct PendingEntry {
    UnitId unit_id;
    std::condition_variable cv;
    WorkerHandle* handle = nullptr;
    bool cancelled = false;
  };

  // --- Slot bookkeeping (mutex_ held) ---

  uint32_t LiveCountLocked() const {
    uint32_t n = 0;
    for (const auto& slot : slots_) {
      if (slot != nullptr && slot->IsLive()) ++n;
    }
    return n;
  }

  bool HasBusyLocked() const {
    for (const auto& slot : slots_) {
      if (slot != nullptr && slot->status == WorkerStatus::kBusy) return true;
    }
    return false;
  }

  bool AllSlotsEmptyLocked() const {
    for (const auto& slot : slots_) {
      if (slot != nullptr) return false;
    }
    return true;
  }

  /** @brief Put a Spawning handle with the next generation into slot @p idx. */
  WorkerHandle* ReserveSlotLocked(uint32_t idx, uint32_t* generation) {
    if (shutting_down_) return nullptr;
    auto h = std::unique_ptr<WorkerHandle>(new WorkerHandle());
    h->worker_id = WorkerId(idx);
    h->generation = ++generations_[idx];
    h->status = WorkerStatus::kSpawning;
    *generation = h->generation;
    slots_[idx] = std::move(h);
    return slots_[idx].get();
  }

  /** @brief Idle @p h, or hand it to the oldest queued caller as Busy. */
  void MakeIdleLocked(WorkerHandle* h) {
    if (!pending_.empty()) {
      PendingEntry* entry = pending_.front();
      pending_.pop_front();
      h->status = WorkerStatus::kBusy;
      h->current_unit = entry->unit_id;
      entry->handle = h;
      entry->cv.notify_one();
      return;
    }
    h->status = WorkerStatus::kIdle;
  }

  void RecordRetiredLocked(const WorkerHandle& h) { ++retired_histogram_[h.tasks_completed]; }

  void MarkLost(WorkerHandle& handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    handle.healthy = false;
  }

  /**
   * @brief The worker's channel broke mid-call: reap it and describe how it
   * ended. @p kill for protocol errors where the process may still run.
   */
  OutcomeValue LoseWorker(WorkerHandle& handle, const char* what, bool kill) {
    MarkLost(handle);
    WaitResult wr = kill ? handle.process.Kill() : handle.process.Collect(cfg_.shutdown_grace_ms);
    const std::string how = DescribeWaitResult(wr);
    if (IsShuttingDown()) {
      return ShuttingDown{};
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++counters_.crashes;
    }
    ISOPOOL_LOG_ERROR("supervisor", "worker %u gen %u (pid %d) lost mid-call (%s): %s", handle.worker_id.value(),
                      handle.generation, static_cast<int>(handle.pid), what, how.c_str());
    WorkerCrashed c;
    c.detail = std::string(what) + ", " + how;
    return c;
  }

  // --- Spawning ---

  /** @brief Fill empty slots until @p target live workers exist. */
  expected<void, SpawnError> SpawnUpTo(uint32_t target) {
    if (target > cfg_.max_workers) target = cfg_.max_workers;
    bool failed = false;
    SpawnError last_error = SpawnError::kForkFailed;

    for (;;) {
      uint32_t idx = 0;
      uint32_t gen = 0;
      WorkerHandle* h = nullptr;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_) return expected<void, SpawnError>::error(SpawnError::kShuttingDown);
        if (LiveCountLocked() >= target) break;
        for (uint32_t i = 0; i < slots_.size(); ++i) {
          if (slots_[i] == nullptr) {
            idx = i;
            h = ReserveSlotLocked(i, &gen);
            break;
          }
        }
      }
      if (h == nullptr) break;
      auto r = CompleteSpawn(idx, h, gen);
      if (!r.has_value()) {
        failed = true;
        last_error = r.get_error();
        break;
      }
    }

    if (failed) {
      std::lock_guard<std::mutex> lock(mutex_);
      if (shutting_down_) return expected<void, SpawnError>::error(SpawnError::kShuttingDown);
      if (LiveCountLocked() == 0U) return expected<void, SpawnError>::error(last_error);
    }
    return expected<void, SpawnError>::success();
  }

  /**
   * @brief Launch and handshake the process for the Spawning handle @p h in
   * slot @p idx. On failure the slot is emptied for a later retry.
   */
  expected<void, SpawnError> CompleteSpawn(uint32_t idx, WorkerHandle* h, uint32_t generation) {
    LaunchRequest req;
    req.worker_id = WorkerId(idx);
    req.generation = generation;
    req.max_tasks = cfg_.max_tasks_per_worker;
    req.max_frame_bytes = cfg_.max_frame_bytes;

    auto proc = launcher_->Launch(req);
    SpawnError err = SpawnError::kForkFailed;
    bool ok = proc.has_value();
    if (!ok) {
      err = proc.get_error();
    } else {
      auto ready = AwaitReady(proc.value(), cfg_.spawn_timeout_ms, cfg_.max_frame_bytes);
      if (!ready.has_value()) {
        ok = false;
        err = ready.get_error();
        WaitResult wr = proc.value().Kill();
        ISOPOOL_LOG_ERROR("supervisor", "worker %u gen %u handshake failed (%s), child %s", idx, generation,
                          SpawnErrorName(err), DescribeWaitResult(wr).c_str());
      }
    }

    if (!ok) {
      std::lock_guard<std::mutex> lock(mutex_);
      ISOPOOL_LOG_ERROR("supervisor", "spawning worker %u gen %u failed: %s", idx, generation,
                        SpawnErrorName(err));
      ++counters_.spawn_failures;
      slots_[idx].reset();
      slots_cv_.notify_all();
      return expected<void, SpawnError>::error(err);
    }

    WorkerProcess orphan;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (shutting_down_) {
        orphan = std::move(proc.value());
        slots_[idx].reset();
        slots_cv_.notify_all();
      } else {
        h->process = std::move(proc.value());
        h->pid = h->process.Pid();
        h->spawned_us = SteadyNowUs();
        h->last_active_us = h->spawned_us;
        ++counters_.spawned;
        ISOPOOL_LOG_DEBUG("supervisor", "worker %u gen %u spawned (pid %d)", idx, generation,
                          static_cast<int>(h->pid));
        MakeIdleLocked(h);
        return expected<void, SpawnError>::success();
      }
    }
    (void)orphan.Terminate(cfg_.shutdown_grace_ms);
    return expected<void, SpawnError>::error(SpawnError::kShuttingDown);
  }

  void OnReapTick() {
    (void)IdleReap();
    bool starving = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      starving = !pending_.empty() && !shutting_down_;
    }
    // Queued callers with empty slots (a respawn failed): retry here too.
    if (starving) (void)EnsureCapacity();
  }

  const PoolConfig cfg_;
  std::unique_ptr<WorkerLauncher> launcher_;
  PeriodicTimer reaper_;

  mutable std::mutex mutex_;
  std::condition_variable slots_cv_;
  std::vector<std::unique_ptr<WorkerHandle>> slots_;  ///< index == worker_id
  std::vector<uint32_t> generations_;
  std::deque<PendingEntry*> pending_;
  SupervisorCounters counters_;
  std::map<uint32_t, uint64_t> retired_histogram_;
  bool started_ = false;
  bool shutting_down_ = false;
  bool shutdown_done_ = false;
  std::atomic<bool> shutting_down_flag_{false};
};

}  // namespace isopool

#endif  // ISOPOOL_SUPERVISOR_HPP_

/**
 * @file dispatcher.hpp
 * @brief Caller-facing facade: one Submit() call runs one unit in the pool
 * and always returns exactly one Outcome.
 *
 * Usage:
 * @code
 *   isopool::log::Init();
 *   isopool::PoolConfig cfg;
 *   cfg.max_workers = 4;
 *   isopool::Dispatcher pool(cfg, std::unique_ptr<isopool::WorkerLauncher>(
 *       new isopool::ExecLauncher("/usr/libexec/transcribe_worker")));
 *   isopool::Payload p;
 *   p.input_path = "/data/call.wav";
 *   isopool::Outcome o = pool.Submit(p);
 *   if (o.IsSuccess()) puts(o.As<isopool::Success>()->result.text.c_str());
 * @endcode
 *
 * Logging: call isopool::log::Init() once at program start so
 * ISOPOOL_LOG_LEVEL takes effect; neither Dispatcher nor Supervisor reads it.
 * Workers started by ExecLauncher call it through RunWorkerMain().
 *
 * Thread safety: Submit(), SubmitAsync(), Stats() and Shutdown() may be
 * called from any number of threads.
 */

#ifndef ISOPOOL_DISPATCHER_HPP_
#define ISOPOOL_DISPATCHER_HPP_

#include "isopool/codec.hpp"
#include "isopool/launcher.hpp"
#include "isopool/log.hpp"
#include "isopool/platform.hpp"
#include "isopool/pool_config.hpp"
#include "isopool/supervisor.hpp"
#include "isopool/vocabulary.hpp"
#include "isopool/work.hpp"

#include <array>
#include <atomic>
#include <cstdint>
#include <cstdio>
#include <future>
#include <memory>
#include <mutex>
#include <random>
#include <string>

#include <sys/stat.h>

namespace isopool {

static constexpr uint32_t kOutcomeKindCount = 8U;

struct DispatcherStats {
  bool enabled = false;
  uint64_t submitted = 0;
  std::array<uint64_t, kOutcomeKindCount> outcomes{};  ///< Indexed by OutcomeKind
  PoolSnapshot pool;  ///< Empty when disabled

  uint64_t Count(OutcomeKind kind) const noexcept { return outcomes[static_cast<uint32_t>(kind)]; }
};

class Dispatcher final {
 public:
  /**
   * @brief Build the pool. With cfg.enabled == false nothing is ever
   * spawned and every Submit() returns Disabled.
   *
   * An invalid configuration is logged and turns every Submit() into
   * PoolUnavailable.
   */
  Dispatcher(const PoolConfig& cfg, std::unique_ptr<WorkerLauncher> launcher) : cfg_(cfg) {
    const char* reason = nullptr;
    if (!cfg_.enabled) {
      ISOPOOL_LOG_INFO("dispatcher", "process pool disabled");
      return;
    }
    if (!ValidatePoolConfig(cfg_, &reason).has_value()) {
      config_error_ = reason;
      ISOPOOL_LOG_ERROR("dispatcher", "invalid pool configuration: %s", reason);
      return;
    }
    supervisor_.reset(new Supervisor(cfg_, std::move(launcher)));
    auto started = supervisor_->Start();
    if (!started.has_value()) {
      ISOPOOL_LOG_WARN("dispatcher", "warm spawn failed (%s), workers start on demand",
                       SpawnErrorName(started.get_error()));
    }
  }

  ~Dispatcher() { Shutdown(); }

  Dispatcher(const Dispatcher&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;

  /**
   * @brief Run @p payload on a worker and wait for its outcome.
   *
   * @param timeout_ms Per-call deadline; 0 uses call_timeout_ms.
   * @param trace_hint Correlation id to carry; a random one if empty.
   */
  Outcome Submit(const Payload& payload, uint32_t timeout_ms = 0U, const std::string& trace_hint = std::string()) {
    WorkUnit unit;
    unit.id = UnitId(next_unit_id_.fetch_add(1U, std::memory_order_relaxed));
    unit.trace_id = trace_hint.empty() ? GenerateTraceId() : trace_hint;
    unit.payload = payload;
    unit.submitted_us = SteadyNowUs();
    submitted_.fetch_add(1U, std::memory_order_relaxed);

    Outcome out;
    out.unit_id = unit.id;
    out.trace_id = unit.trace_id;
    out.value = Run(unit, timeout_ms == 0U ? cfg_.call_timeout_ms : timeout_ms, &out);
    out.elapsed_us = SteadyNowUs() - unit.submitted_us;
    Record(out);
    return out;
  }

  /**
   * @brief Submit() on a separate thread.
   *
   * The Dispatcher must outlive the returned future.
   */
  std::future<Outcome> SubmitAsync(Payload payload, uint32_t timeout_ms = 0U, std::string trace_hint = std::string()) {
    return std::async(std::launch::async, [this, payload, timeout_ms, trace_hint]() {
      return Submit(payload, timeout_ms, trace_hint);
    });
  }

  /** @brief Cancel queued callers, stop workers, kill stragglers. Idempotent. */
  void Shutdown() {
    if (supervisor_ != nullptr) supervisor_->Shutdown();
  }

  bool IsEnabled() const noexcept { return cfg_.enabled; }

  DispatcherStats Stats() const {
    DispatcherStats st;
    st.enabled = cfg_.enabled;
    st.submitted = submitted_.load(std::memory_order_relaxed);
    for (uint32_t i = 0; i < kOutcomeKindCount; ++i) {
      st.outcomes[i] = outcome_counts_[i].load(std::memory_order_relaxed);
    }
    if (supervisor_ != nullptr) st.pool = supervisor_->Snapshot();
    return st;
  }

  const PoolConfig& GetConfig() const noexcept { return cfg_; }

 private:
  OutcomeValue Run(const WorkUnit& unit, uint32_t call_timeout_ms, Outcome* out) {
    if (!cfg_.enabled) return Disabled{};
    if (supervisor_ == nullptr) {
      PoolUnavailable u;
      u.detail = std::string("invalid configuration: ") + config_error_;
      return u;
    }
    if (supervisor_->IsShuttingDown()) return ShuttingDown{};

    if (cfg_.validate_input_exists && !unit.payload.input_path.empty()) {
      struct stat st;
      if (::stat(unit.payload.input_path.c_str(), &st) != 0) {
        Failure f;
        f.kind = FailureKind::kInputNotFound;
        f.message = "input not found: " + unit.payload.input_path;
        return f;
      }
    }

    // A task frame the worker would refuse must not cost a worker.
    const size_t task_bytes = EncodeTask(unit).size();
    if (task_bytes > cfg_.max_frame_bytes) {
      Failure f;
      f.kind = FailureKind::kResourceLimit;
      f.message = "payload too large: " + std::to_string(task_bytes) + " > " +
                  std::to_string(cfg_.max_frame_bytes) + " bytes";
      return f;
    }

    auto cap = supervisor_->EnsureCapacity();
    if (!cap.has_value()) {
      if (cap.get_error() == SpawnError::kShuttingDown) return ShuttingDown{};
      PoolUnavailable u;
      u.detail = std::string("worker spawn failed: ") + SpawnErrorName(cap.get_error());
      return u;
    }

    const uint64_t queue_start = SteadyNowUs();
    auto acquired = supervisor_->Acquire(unit, cfg_.queue_wait_timeout_ms);
    if (!acquired.has_value()) {
      if (acquired.get_error() == AcquireError::kShuttingDown) return ShuttingDown{};
      QueueTimeout q;
      q.waited_ms = static_cast<uint32_t>((SteadyNowUs() - queue_start) / 1000U);
      q.queue_full = acquired.get_error() == AcquireError::kQueueFull;
      return q;
    }

    WorkerHandle* handle = acquired.value();
    out->worker_pid = static_cast<int32_t>(handle->pid);
    out->worker_slot = handle->worker_id.value();
    out->worker_generation = handle->generation;

    OutcomeValue value = supervisor_->Dispatch(*handle, unit, call_timeout_ms);
    supervisor_->Release(handle, static_cast<OutcomeKind>(value.index()));
    return value;
  }

  void Record(const Outcome& out) {
    outcome_counts_[static_cast<uint32_t>(out.Kind())].fetch_add(1U, std::memory_order_relaxed);
    const unsigned long long id = static_cast<unsigned long long>(out.unit_id.value());
    const double ms = static_cast<double>(out.elapsed_us) / 1000.0;
    switch (out.Kind()) {
      case OutcomeKind::kSuccess:
        ISOPOOL_LOG_INFO("dispatcher", "[%.8s] unit %llu ok in %.1f ms (worker %u pid %d)", out.trace_id.c_str(), id,
                         ms, out.worker_slot, static_cast<int>(out.worker_pid));
        break;
      case OutcomeKind::kFailure: {
        const Failure* f = out.As<Failure>();
        ISOPOOL_LOG_WARN("dispatcher", "[%.8s] unit %llu failed (%s): %s", out.trace_id.c_str(), id,
                         FailureKindName(f->kind), f->message.c_str());
        break;
      }
      case OutcomeKind::kWorkerCrashed:
        ISOPOOL_LOG_ERROR("dispatcher", "[%.8s] unit %llu lost its worker: %s", out.trace_id.c_str(), id,
                          out.As<WorkerCrashed>()->detail.c_str());
        break;
      case OutcomeKind::kPoolUnavailable:
        ISOPOOL_LOG_ERROR("dispatcher", "[%.8s] unit %llu: pool unavailable: %s", out.trace_id.c_str(), id,
                          out.As<PoolUnavailable>()->detail.c_str());
        break;
      default:
        ISOPOOL_LOG_WARN("dispatcher", "[%.8s] unit %llu: %s after %.1f ms", out.trace_id.c_str(), id,
                         OutcomeKindName(out.Kind()), ms);
        break;
    }
  }

  /** @brief 32 lowercase hex digits, like a dash-less random UUID. */
  std::string GenerateTraceId() {
    uint64_t hi;
    uint64_t lo;
    {
      std::lock_guard<std::mutex> lock(rng_mutex_);
      hi = rng_();
      lo = rng_();
    }
    char buf[33];
    (void)std::snprintf(buf, sizeof(buf), "%016llx%016llx", static_cast<unsigned long long>(hi),
                        static_cast<unsigned long long>(lo));
    return std::string(buf, 32);
  }

  const PoolConfig cfg_;
  const char* config_error_ = "";
  std::unique_ptr<Supervisor> supervisor_;

  std::atomic<uint64_t> next_unit_id_{1U};
  std::atomic<uint64_t> submitted_{0U};
  std::array<std::atomic<uint64_t>, kOutcomeKindCount> outcome_counts_{};

  std::mutex rng_mutex_;
  std::mt19937_64 rng_{std::random_device{}()};
};

}  // namespace isopool

#endif  // ISOPOOL_DISPATCHER_HPP_

/**
 * @file test_dispatcher.cpp
 * @brief Tests for dispatcher.hpp: the caller-facing pool behavior.
 */

#include "isopool/dispatcher.hpp"

#include "test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace {

/// Wraps another launcher and counts launches.
class CountingLauncher final : public isopool::WorkerLauncher {
 public:
  CountingLauncher(std::unique_ptr<isopool::WorkerLauncher> inner, std::atomic<int>* count)
      : inner_(std::move(inner)), count_(count) {}

  isopool::expected<isopool::WorkerProcess, isopool::SpawnError> Launch(const isopool::LaunchRequest& req) override {
    count_->fetch_add(1);
    return inner_->Launch(req);
  }
  const char* Name() const noexcept override { return "counting"; }

 private:
  std::unique_ptr<isopool::WorkerLauncher> inner_;
  std::atomic<int>* count_;
};

class NoLauncher final : public isopool::WorkerLauncher {
 public:
  isopool::expected<isopool::WorkerProcess, isopool::SpawnError> Launch(const isopool::LaunchRequest&) override {
    return isopool::expected<isopool::WorkerProcess, isopool::SpawnError>::error(isopool::SpawnError::kPipeFailed);
  }
  const char* Name() const noexcept override { return "none"; }
};

std::unique_ptr<isopool::WorkerLauncher> Counting(std::atomic<int>* count) {
  return std::unique_ptr<isopool::WorkerLauncher>(new CountingLauncher(isopool_test::MakeForkLauncher(), count));
}

}  // namespace

// ============================================================================
// Basic submission
// ============================================================================

TEST_CASE("Dispatcher Submit returns the worker's result", "[dispatcher]") {
  isopool::Dispatcher pool(isopool_test::TestConfig(2), isopool_test::MakeForkLauncher());
  REQUIRE(pool.IsEnabled());

  isopool::Outcome o = pool.Submit(isopool_test::MakePayload("/a.wav", {{"language", "de"}}));
  REQUIRE(o.IsSuccess());
  REQUIRE(o.Kind() == isopool::OutcomeKind::kSuccess);
  REQUIRE(o.As<isopool::Success>()->result.text == "/a.wav");
  REQUIRE(o.As<isopool::Success>()->result.fields.at("language") == "de");
  REQUIRE(o.worker_pid == isopool_test::PidOf(o));
  REQUIRE(o.worker_pid != static_cast<int32_t>(getpid()));
  REQUIRE(o.worker_generation == 1U);
  REQUIRE(o.elapsed_us > 0U);
  REQUIRE(isopool::SuggestedHttpStatus(o) == 200);
}

TEST_CASE("Dispatcher trace ids", "[dispatcher]") {
  isopool::Dispatcher pool(isopool_test::TestConfig(1), isopool_test::MakeForkLauncher());
  isopool::Outcome a = pool.Submit(isopool_test::MakePayload("/a"), 0, "req-123");
  REQUIRE(a.trace_id == "req-123");

  isopool::Outcome b = pool.Submit(isopool_test::MakePayload("/b"));
  isopool::Outcome c = pool.Submit(isopool_test::MakePayload("/c"));
  REQUIRE(b.trace_id.size() == 32U);
  REQUIRE(b.trace_id.find_first_not_of("0123456789abcdef") == std::string::npos);
  REQUIRE(b.trace_id != c.trace_id);
}

TEST_CASE("Dispatcher N concurrent submissions yield N unique outcomes", "[dispatcher]") {
  isopool::Dispatcher pool(isopool_test::TestConfig(3), isopool_test::MakeForkLauncher());

  constexpr int kCount = 12;
  std::vector<std::future<isopool::Outcome>> futures;
  for (int i = 0; i < kCount; ++i) {
    futures.push_back(
        pool.SubmitAsync(isopool_test::MakePayload("/in/" + std::to_string(i), {{"sleep_ms", "10"}})));
  }

  std::set<uint64_t> ids;
  std::set<std::string> texts;
  for (auto& f : futures) {
    isopool::Outcome o = f.get();
    REQUIRE(o.IsSuccess());
    ids.insert(o.unit_id.value());
    texts.insert(o.As<isopool::Success>()->result.text);
  }
  REQUIRE(ids.size() == static_cast<size_t>(kCount));
  REQUIRE(texts.size() == static_cast<size_t>(kCount));

  isopool::DispatcherStats st = pool.Stats();
  REQUIRE(st.submitted == static_cast<uint64_t>(kCount));
  REQUIRE(st.Count(isopool::OutcomeKind::kSuccess) == static_cast<uint64_t>(kCount));
  REQUIRE(st.pool.live <= 3U);
}

// ============================================================================
// Scenarios
// ============================================================================

TEST_CASE("Scenario: pool of 2, recycle after 2, five sequential units", "[dispatcher][scenario]") {
  isopool::PoolConfig cfg = isopool_test::TestConfig(2);
  cfg.max_tasks_per_worker = 2;
  isopool::Dispatcher pool(cfg, isopool_test::MakeForkLauncher());

  std::vector<int> pids;
  for (int i = 0; i < 5; ++i) {
    isopool::Outcome o = pool.Submit(isopool_test::MakePayload("/echo/" + std::to_string(i)));
    REQUIRE(o.IsSuccess());
    REQUIRE(o.As<isopool::Success>()->result.text == "/echo/" + std::to_string(i));
    pids.push_back(isopool_test::PidOf(o));
  }

  REQUIRE(pids[0] == pids[1]);
  REQUIRE(pids[2] == pids[3]);
  REQUIRE(pids[1] != pids[2]);
  REQUIRE(pids[3] != pids[4]);

  isopool::DispatcherStats st = pool.Stats();
  REQUIRE(st.pool.counters.recycled == 2U);
  REQUIRE(st.pool.retired_tasks_histogram.at(2) == 2U);
  REQUIRE(st.pool.live <= 2U);
}

TEST_CASE("Scenario: pool of 1 serializes three concurrent 100 ms units", "[dispatcher][scenario]") {
  isopool::Dispatcher pool(isopool_test::TestConfig(1), isopool_test::MakeForkLauncher());
  // Warm the single worker so spawn time does not count.
  REQUIRE(pool.Submit(isopool_test::MakePayload("/warm")).IsSuccess());

  uint64_t start = isopool::SteadyNowMs();
  std::vector<std::future<isopool::Outcome>> futures;
  for (int i = 0; i < 3; ++i) {
    futures.push_back(pool.SubmitAsync(isopool_test::MakePayload("/s", {{"sleep_ms", "100"}})));
  }
  std::set<int> pids;
  for (auto& f : futures) {
    isopool::Outcome o = f.get();
    REQUIRE(o.IsSuccess());
    pids.insert(isopool_test::PidOf(o));
  }
  uint64_t took = isopool::SteadyNowMs() - start;

  REQUIRE(took >= 290U);
  REQUIRE(took < 3000U);
  REQUIRE(pids.size() == 1U);
}

// ============================================================================
// Failure isolation
// ============================================================================

TEST_CASE("Dispatcher timeout replaces the worker", "[dispatcher]") {
  isopool::Dispatcher pool(isopool_test::TestConfig(1), isopool_test::MakeForkLauncher());

  isopool::Outcome hung = pool.Submit(isopool_test::MakePayload("/x", {{"hang", "1"}}), 150);
  REQUIRE(hung.Kind() == isopool::OutcomeKind::kTimeout);
  REQUIRE(hung.As<isopool::Timeout>()->timeout_ms == 150U);
  REQUIRE(isopool::SuggestedHttpStatus(hung) == 504);
  REQUIRE_FALSE(isopool::IsProcessAlive(static_cast<pid_t>(hung.worker_pid)));

  isopool::Outcome next = pool.Submit(isopool_test::MakePayload("/y"));
  REQUIRE(next.IsSuccess());
  REQUIRE(next.worker_pid != hung.worker_pid);
  REQUIRE(next.worker_slot == hung.worker_slot);
  REQUIRE(next.worker_generation == hung.worker_generation + 1U);
}

TEST_CASE("Dispatcher crash affects only the crashing call", "[dispatcher]") {
  isopool::Dispatcher pool(isopool_test::TestConfig(3), isopool_test::MakeForkLauncher());
  REQUIRE(pool.Submit(isopool_test::MakePayload("/warm")).IsSuccess());

  auto slow1 = pool.SubmitAsync(isopool_test::MakePayload("/s1", {{"sleep_ms", "150"}}));
  auto slow2 = pool.SubmitAsync(isopool_test::MakePayload("/s2", {{"sleep_ms", "150"}}));
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  isopool::Outcome crashed = pool.Submit(isopool_test::MakePayload("/boom", {{"abort", "1"}}));

  REQUIRE(crashed.Kind() == isopool::OutcomeKind::kWorkerCrashed);
  REQUIRE(isopool::SuggestedHttpStatus(crashed) == 500);
  REQUIRE(slow1.get().IsSuccess());
  REQUIRE(slow2.get().IsSuccess());
  REQUIRE(pool.Submit(isopool_test::MakePayload("/after")).IsSuccess());
  REQUIRE(pool.Stats().Count(isopool::OutcomeKind::kWorkerCrashed) == 1U);
}

TEST_CASE("Dispatcher rejects an oversize payload without touching the worker", "[dispatcher]") {
  isopool::PoolConfig cfg = isopool_test::TestConfig(1);
  cfg.max_frame_bytes = 4096;
  isopool::Dispatcher pool(cfg, isopool_test::MakeForkLauncher());

  isopool::Outcome a = pool.Submit(isopool_test::MakePayload("/a"));
  REQUIRE(a.IsSuccess());

  isopool::Outcome big = pool.Submit(isopool_test::MakePayload("/b", {{"blob", std::string(8192, 'x')}}));
  REQUIRE(big.Kind() == isopool::OutcomeKind::kFailure);
  REQUIRE(big.As<isopool::Failure>()->kind == isopool::FailureKind::kResourceLimit);
  REQUIRE(isopool::SuggestedHttpStatus(big) == 413);
  REQUIRE(big.worker_pid == 0);

  isopool::Outcome c = pool.Submit(isopool_test::MakePayload("/c"));
  REQUIRE(c.IsSuccess());
  REQUIRE(isopool_test::PidOf(c) == isopool_test::PidOf(a));
  REQUIRE(pool.Stats().pool.counters.crashes == 0U);
  REQUIRE(pool.Stats().pool.counters.spawned == 1U);
}

TEST_CASE("Dispatcher keeps a deadline for timeouts above INT32_MAX", "[dispatcher]") {
  isopool::Dispatcher pool(isopool_test::TestConfig(1), isopool_test::MakeForkLauncher());
  isopool::Outcome o = pool.Submit(isopool_test::MakePayload("/a", {{"sleep_ms", "20"}}), UINT32_MAX);
  REQUIRE(o.IsSuccess());
}

TEST_CASE("Dispatcher Stats reports RSS of live workers", "[dispatcher]") {
  isopool::Dispatcher pool(isopool_test::TestConfig(2), isopool_test::MakeForkLauncher());
  REQUIRE(pool.Submit(isopool_test::MakePayload("/a")).IsSuccess());

  isopool::DispatcherStats st = pool.Stats();
  REQUIRE(st.pool.workers.size() == 2U);
  for (const auto& w : st.pool.workers) {
    REQUIRE(w.status == isopool::WorkerStatus::kIdle);
    REQUIRE(w.rss_kb > 0U);
  }
  REQUIRE(st.pool.supervisor_rss_kb > 0U);
}

TEST_CASE("Dispatcher domain failure keeps its kind", "[dispatcher]") {
  isopool::Dispatcher pool(isopool_test::TestConfig(1), isopool_test::MakeForkLauncher());
  isopool::Outcome o = pool.Submit(isopool_test::MakePayload("/big.wav", {{"fail", "resource_limit"}}));
  REQUIRE(o.Kind() == isopool::OutcomeKind::kFailure);
  REQUIRE(o.As<isopool::Failure>()->kind == isopool::FailureKind::kResourceLimit);
  REQUIRE(isopool::SuggestedHttpStatus(o) == 413);
}

// ============================================================================
// Refusals
// ============================================================================

TEST_CASE("Dispatcher disabled mode spawns nothing", "[dispatcher]") {
  std::atomic<int> launches{0};
  isopool::PoolConfig cfg = isopool_test::TestConfig(2);
  cfg.enabled = false;
  cfg.min_workers = 1;
  isopool::Dispatcher pool(cfg, Counting(&launches));

  REQUIRE_FALSE(pool.IsEnabled());
  for (int i = 0; i < 3; ++i) {
    isopool::Outcome o = pool.Submit(isopool_test::MakePayload("/a"));
    REQUIRE(o.Kind() == isopool::OutcomeKind::kDisabled);
    REQUIRE(o.worker_pid == 0);
    REQUIRE(isopool::SuggestedHttpStatus(o) == 503);
  }
  REQUIRE(launches.load() == 0);
  REQUIRE(pool.Stats().Count(isopool::OutcomeKind::kDisabled) == 3U);
  REQUIRE(pool.Stats().pool.live == 0U);
}

TEST_CASE("Dispatcher checks the input exists before using a worker", "[dispatcher]") {
  std::atomic<int> launches{0};
  isopool::PoolConfig cfg = isopool_test::TestConfig(1);
  cfg.validate_input_exists = true;
  isopool::Dispatcher pool(cfg, Counting(&launches));

  isopool::Outcome o = pool.Submit(isopool_test::MakePayload("/nonexistent/audio.wav"));
  REQUIRE(o.Kind() == isopool::OutcomeKind::kFailure);
  REQUIRE(o.As<isopool::Failure>()->kind == isopool::FailureKind::kInputNotFound);
  REQUIRE(isopool::SuggestedHttpStatus(o) == 404);
  REQUIRE(launches.load() == 0);

  REQUIRE(pool.Submit(isopool_test::MakePayload("/dev/null")).IsSuccess());
  REQUIRE(launches.load() == 1);
}

TEST_CASE("Dispatcher spawn failure is PoolUnavailable and retried", "[dispatcher]") {
  isopool::Dispatcher pool(isopool_test::TestConfig(2), std::unique_ptr<isopool::WorkerLauncher>(new NoLauncher()));
  isopool::Outcome o = pool.Submit(isopool_test::MakePayload("/a"));
  REQUIRE(o.Kind() == isopool::OutcomeKind::kPoolUnavailable);
  REQUIRE(o.As<isopool::PoolUnavailable>()->detail.find("pipe_failed") != std::string::npos);
  REQUIRE(isopool::SuggestedHttpStatus(o) == 503);

  REQUIRE(pool.Submit(isopool_test::MakePayload("/b")).Kind() == isopool::OutcomeKind::kPoolUnavailable);
  REQUIRE(pool.Stats().pool.counters.spawn_failures == 2U);
}

TEST_CASE("Dispatcher invalid configuration is PoolUnavailable", "[dispatcher]") {
  isopool::PoolConfig cfg = isopool_test::TestConfig(1);
  cfg.max_tasks_per_worker = 0;
  isopool::Dispatcher pool(cfg, isopool_test::MakeForkLauncher());
  REQUIRE(pool.Submit(isopool_test::MakePayload("/a")).Kind() == isopool::OutcomeKind::kPoolUnavailable);
}

TEST_CASE("Dispatcher queue full is QueueTimeout", "[dispatcher]") {
  isopool::PoolConfig cfg = isopool_test::TestConfig(1);
  cfg.max_queue_depth = 0;
  isopool::Dispatcher pool(cfg, isopool_test::MakeForkLauncher());
  REQUIRE(pool.Submit(isopool_test::MakePayload("/warm")).IsSuccess());

  auto slow = pool.SubmitAsync(isopool_test::MakePayload("/slow", {{"sleep_ms", "300"}}));
  while (pool.Stats().pool.busy == 0U) std::this_thread::sleep_for(std::chrono::milliseconds(1));

  isopool::Outcome o = pool.Submit(isopool_test::MakePayload("/rejected"));
  REQUIRE(o.Kind() == isopool::OutcomeKind::kQueueTimeout);
  REQUIRE(o.As<isopool::QueueTimeout>()->queue_full);
  REQUIRE(slow.get().IsSuccess());
}

TEST_CASE("Dispatcher after Shutdown", "[dispatcher]") {
  isopool::Dispatcher pool(isopool_test::TestConfig(2), isopool_test::MakeForkLauncher());
  isopool::Outcome first = pool.Submit(isopool_test::MakePayload("/a"));
  REQUIRE(first.IsSuccess());

  pool.Shutdown();
  REQUIRE_FALSE(isopool::IsProcessAlive(static_cast<pid_t>(first.worker_pid)));
  REQUIRE(pool.Submit(isopool_test::MakePayload("/b")).Kind() == isopool::OutcomeKind::kShuttingDown);
  pool.Shutdown();
}

// ============================================================================
// Exec mode
// ============================================================================

TEST_CASE("Dispatcher with exec workers", "[dispatcher][exec]") {
  isopool::PoolConfig cfg = isopool_test::TestConfig(2);
  cfg.max_tasks_per_worker = 3;
  isopool::Dispatcher pool(cfg,
                           std::unique_ptr<isopool::WorkerLauncher>(new isopool::ExecLauncher(isopool_test::TestWorkerPath())));

  std::set<int> pids;
  for (int i = 0; i < 4; ++i) {
    isopool::Outcome o = pool.Submit(isopool_test::MakePayload("/exec/" + std::to_string(i)));
    REQUIRE(o.IsSuccess());
    pids.insert(isopool_test::PidOf(o));
  }
  REQUIRE(pids.size() == 2U);

  isopool::Outcome crashed = pool.Submit(isopool_test::MakePayload("/x", {{"exit", "9"}}));
  REQUIRE(crashed.Kind() == isopool::OutcomeKind::kWorkerCrashed);
  REQUIRE(crashed.As<isopool::WorkerCrashed>()->detail.find("exit code 9") != std::string::npos);
}

// ============================================================================
// Idle reclamation
// ============================================================================

TEST_CASE("Dispatcher reclaims idle workers and recovers on demand", "[dispatcher]") {
  isopool::PoolConfig cfg = isopool_test::TestConfig(2);
  cfg.idle_timeout_ms = 200;
  cfg.reap_interval_ms = 50;
  isopool::Dispatcher pool(cfg, isopool_test::MakeForkLauncher());

  isopool::Outcome first = pool.Submit(isopool_test::MakePayload("/a"));
  REQUIRE(first.IsSuccess());

  uint64_t deadline = isopool::SteadyNowMs() + 3000U;
  while (pool.Stats().pool.live != 0U && isopool::SteadyNowMs() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  isopool::DispatcherStats st = pool.Stats();
  REQUIRE(st.pool.live == 0U);
  REQUIRE(st.pool.counters.reaped == 2U);
  REQUIRE_FALSE(isopool::IsProcessAlive(static_cast<pid_t>(first.worker_pid)));

  isopool::Outcome again = pool.Submit(isopool_test::MakePayload("/b"));
  REQUIRE(again.IsSuccess());
  REQUIRE(again.worker_pid != first.worker_pid);
}

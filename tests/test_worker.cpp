/**
 * @file test_worker.cpp
 * @brief Tests for worker.hpp: the worker loop driven over in-process pipes.
 */

#include "isopool/worker.hpp"
#include "isopool/process.hpp"

#include "test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>

#include <thread>

#include <unistd.h>

namespace {

/// Runs RunWorkerLoop on a thread, talking to it like a supervisor would.
class LoopHarness {
 public:
  explicit LoopHarness(isopool::WorkHandler& handler, uint32_t max_tasks = 0) {
    REQUIRE(to_worker_.Create());
    REQUIRE(from_worker_.Create());
    isopool::WorkerLoopOptions opts;
    opts.worker_id = 1;
    opts.max_tasks = max_tasks;
    opts.max_frame_bytes = 1024 * 1024;
    int in_fd = to_worker_.ReadEnd();
    int out_fd = from_worker_.WriteEnd();
    thread_ = std::thread([this, &handler, in_fd, out_fd, opts] { exit_ = isopool::RunWorkerLoop(in_fd, out_fd, handler, opts); });
  }

  ~LoopHarness() {
    to_worker_.CloseWrite();
    if (thread_.joinable()) thread_.join();
  }

  isopool::ReadyInfo ReadReady() {
    auto f = isopool::ReadFrame(from_worker_.ReadEnd(), 2000, 1024 * 1024);
    REQUIRE(f.has_value());
    REQUIRE(f.value().type == isopool::FrameType::kReady);
    auto info = isopool::DecodeReady(f.value().body);
    REQUIRE(info.has_value());
    return info.value();
  }

  isopool::TaskReply Run(uint64_t id, const isopool::Payload& p) {
    isopool::WorkUnit unit;
    unit.id = isopool::UnitId(id);
    unit.trace_id = "trace";
    unit.payload = p;
    REQUIRE(isopool::WriteFrame(to_worker_.WriteEnd(), isopool::FrameType::kTask, isopool::EncodeTask(unit)));
    auto f = isopool::ReadFrame(from_worker_.ReadEnd(), 2000, 1024 * 1024);
    REQUIRE(f.has_value());
    REQUIRE(f.value().type == isopool::FrameType::kOutcome);
    auto reply = isopool::DecodeOutcome(f.value().body);
    REQUIRE(reply.has_value());
    return reply.value();
  }

  void SendShutdown() { REQUIRE(isopool::WriteFrame(to_worker_.WriteEnd(), isopool::FrameType::kShutdown, {})); }
  void CloseInbound() { to_worker_.CloseWrite(); }

  isopool::WorkerExit Join() {
    thread_.join();
    return exit_;
  }

 private:
  isopool::detail::PipeGuard to_worker_;
  isopool::detail::PipeGuard from_worker_;
  std::thread thread_;
  isopool::WorkerExit exit_ = isopool::WorkerExit::kChannelError;
};

}  // namespace

TEST_CASE("Worker reports ready, then serves units", "[worker]") {
  isopool_test::ScriptedHandler handler;
  LoopHarness h(handler);
  isopool::ReadyInfo ready = h.ReadReady();
  REQUIRE(ready.init_ok);
  REQUIRE(ready.pid == static_cast<int32_t>(getpid()));

  isopool::TaskReply r1 = h.Run(11, isopool_test::MakePayload("/a.wav", {{"language", "en"}}));
  REQUIRE(r1.ok);
  REQUIRE(r1.unit_id == isopool::UnitId(11));
  REQUIRE(r1.result.text == "/a.wav");
  REQUIRE(r1.result.fields.at("language") == "en");
  REQUIRE(r1.result.fields.at("calls") == "1");

  isopool::TaskReply r2 = h.Run(12, isopool_test::MakePayload("/b.wav"));
  REQUIRE(r2.result.fields.at("calls") == "2");

  h.SendShutdown();
  REQUIRE(h.Join() == isopool::WorkerExit::kShutdown);
}

TEST_CASE("Worker returns domain failures and keeps serving", "[worker]") {
  isopool_test::ScriptedHandler handler;
  LoopHarness h(handler);
  h.ReadReady();

  isopool::TaskReply bad = h.Run(1, isopool_test::MakePayload("/x.txt", {{"fail", "unsupported_format"}}));
  REQUIRE_FALSE(bad.ok);
  REQUIRE(bad.failure.kind == isopool::FailureKind::kUnsupportedFormat);

  isopool::TaskReply good = h.Run(2, isopool_test::MakePayload("/y.wav"));
  REQUIRE(good.ok);

  h.CloseInbound();
  REQUIRE(h.Join() == isopool::WorkerExit::kInboundClosed);
}

#ifdef ISOPOOL_HAS_EXCEPTIONS
TEST_CASE("Worker turns exceptions into execution errors", "[worker]") {
  isopool_test::ScriptedHandler handler;
  LoopHarness h(handler);
  h.ReadReady();

  isopool::TaskReply r = h.Run(1, isopool_test::MakePayload("/z.wav", {{"throw", "decoder exploded"}}));
  REQUIRE_FALSE(r.ok);
  REQUIRE(r.failure.kind == isopool::FailureKind::kExecutionError);
  REQUIRE(r.failure.message.find("decoder exploded") != std::string::npos);

  REQUIRE(h.Run(2, isopool_test::MakePayload("/ok.wav")).ok);
}
#endif

TEST_CASE("Worker exits after max_tasks units", "[worker]") {
  isopool_test::ScriptedHandler handler;
  LoopHarness h(handler, 2);
  h.ReadReady();
  REQUIRE(h.Run(1, isopool_test::MakePayload("/1")).ok);
  REQUIRE(h.Run(2, isopool_test::MakePayload("/2")).ok);
  REQUIRE(h.Join() == isopool::WorkerExit::kTaskLimit);
}

TEST_CASE("Worker reports init failure and exits", "[worker]") {
  isopool_test::ScriptedHandler handler(true);
  LoopHarness h(handler);
  isopool::ReadyInfo ready = h.ReadReady();
  REQUIRE_FALSE(ready.init_ok);
  REQUIRE(ready.message == "model failed to load");
  REQUIRE(h.Join() == isopool::WorkerExit::kInitFailed);
}

TEST_CASE("Worker exit codes", "[worker]") {
  REQUIRE(isopool::WorkerExitCode(isopool::WorkerExit::kShutdown) == 0);
  REQUIRE(isopool::WorkerExitCode(isopool::WorkerExit::kTaskLimit) == 0);
  REQUIRE(isopool::WorkerExitCode(isopool::WorkerExit::kInitFailed) != 0);
  REQUIRE(isopool::WorkerExitCode(isopool::WorkerExit::kChannelError) != 0);
}

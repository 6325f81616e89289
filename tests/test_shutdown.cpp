/**
 * @file test_shutdown.cpp
 * @brief Tests for shutdown.hpp
 */

#include "isopool/shutdown.hpp"

#include "test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>

#include <csignal>
#include <thread>
#include <vector>

TEST_CASE("ShutdownSignal Register callbacks", "[shutdown]") {
  isopool::ShutdownSignal sig;
  REQUIRE(sig.IsValid());

  for (uint32_t i = 0; i < isopool::ShutdownSignal::kMaxCallbacks; ++i) {
    REQUIRE(sig.Register([](int, void*) {}).has_value());
  }

  // 17th should fail
  auto rn = sig.Register([](int, void*) {});
  REQUIRE(!rn.has_value());
  REQUIRE(rn.get_error() == isopool::ShutdownError::kCallbacksFull);
}

TEST_CASE("ShutdownSignal null callback rejected", "[shutdown]") {
  isopool::ShutdownSignal sig;
  auto r = sig.Register(nullptr);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == isopool::ShutdownError::kCallbacksFull);
}

TEST_CASE("ShutdownSignal Quit and IsRequested", "[shutdown]") {
  isopool::ShutdownSignal sig;
  REQUIRE(!sig.IsRequested());

  sig.Quit(0);
  REQUIRE(sig.IsRequested());
  REQUIRE(sig.SignalNumber() == 0);
}

TEST_CASE("ShutdownSignal runs callbacks LIFO with their context", "[shutdown]") {
  isopool::ShutdownSignal sig;
  std::vector<int> order;

  REQUIRE(sig.Register([](int, void* p) { static_cast<std::vector<int>*>(p)->push_back(1); }, &order).has_value());
  REQUIRE(sig.Register([](int, void* p) { static_cast<std::vector<int>*>(p)->push_back(2); }, &order).has_value());
  REQUIRE(sig.Register([](int, void* p) { static_cast<std::vector<int>*>(p)->push_back(3); }, &order).has_value());

  sig.Quit(42);
  sig.Wait();
  REQUIRE(order == std::vector<int>{3, 2, 1});
  REQUIRE(sig.SignalNumber() == 42);

  // Callbacks run once.
  sig.Wait();
  REQUIRE(order.size() == 3U);
}

TEST_CASE("ShutdownSignal Wait wakes on Quit from another thread", "[shutdown]") {
  isopool::ShutdownSignal sig;
  static int seen_signo = -1;
  seen_signo = -1;
  REQUIRE(sig.Register([](int signo, void*) { seen_signo = signo; }).has_value());

  std::thread t([&sig] {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    sig.Quit(7);
  });
  sig.Wait();
  t.join();
  REQUIRE(seen_signo == 7);
}

TEST_CASE("ShutdownSignal Install turns SIGTERM into a shutdown request", "[shutdown]") {
  isopool::ShutdownSignal sig;
  REQUIRE(sig.Install().has_value());

  REQUIRE(::raise(SIGTERM) == 0);
  sig.Wait();
  REQUIRE(sig.IsRequested());
  REQUIRE(sig.SignalNumber() == SIGTERM);
}

TEST_CASE("ShutdownSignal second instance is inactive", "[shutdown]") {
  isopool::ShutdownSignal first;
  isopool::ShutdownSignal second;
  REQUIRE(first.IsValid());
  REQUIRE_FALSE(second.IsValid());

  auto r = second.Register([](int, void*) {});
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == isopool::ShutdownError::kAlreadyInstantiated);
  REQUIRE(second.Install().get_error() == isopool::ShutdownError::kAlreadyInstantiated);
}

TEST_CASE("ShutdownSignal callback shuts the pool down", "[shutdown][dispatcher]") {
  isopool::Dispatcher pool(isopool_test::TestConfig(1), isopool_test::MakeForkLauncher());
  REQUIRE(pool.Submit(isopool_test::MakePayload("/a")).IsSuccess());

  isopool::ShutdownSignal sig;
  REQUIRE(sig.Register([](int, void* p) { static_cast<isopool::Dispatcher*>(p)->Shutdown(); }, &pool).has_value());
  sig.Quit(SIGINT);
  sig.Wait();

  REQUIRE(pool.Submit(isopool_test::MakePayload("/b")).Kind() == isopool::OutcomeKind::kShuttingDown);
}

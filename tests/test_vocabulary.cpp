/**
 * @file test_vocabulary.cpp
 * @brief Tests for vocabulary.hpp
 */

#include "isopool/vocabulary.hpp"

#include <catch2/catch_test_macros.hpp>

#include <functional>
#include <memory>
#include <string>

// ============================================================================
// expected<V, E>
// ============================================================================

TEST_CASE("expected holds a value", "[vocabulary]") {
  auto r = isopool::expected<int, isopool::ChannelError>::success(42);
  REQUIRE(r.has_value());
  REQUIRE(static_cast<bool>(r));
  REQUIRE(r.value() == 42);
  REQUIRE(r.value_or(7) == 42);
}

TEST_CASE("expected holds an error", "[vocabulary]") {
  auto r = isopool::expected<int, isopool::ChannelError>::error(isopool::ChannelError::kTimeout);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == isopool::ChannelError::kTimeout);
  REQUIRE(r.value_or(7) == 7);
}

TEST_CASE("expected copies and moves non-trivial values", "[vocabulary]") {
  auto a = isopool::expected<std::string, isopool::CodecError>::success(std::string("payload"));
  auto b = a;
  REQUIRE(b.value() == "payload");
  auto c = std::move(a);
  REQUIRE(c.value() == "payload");

  c = isopool::expected<std::string, isopool::CodecError>::error(isopool::CodecError::kTruncated);
  REQUIRE(!c.has_value());
  REQUIRE(c.get_error() == isopool::CodecError::kTruncated);
}

TEST_CASE("expected carries move-only values", "[vocabulary]") {
  auto r = isopool::expected<std::unique_ptr<int>, isopool::SpawnError>::success(std::unique_ptr<int>(new int(5)));
  REQUIRE(r.has_value());
  std::unique_ptr<int> p = std::move(r).value();
  REQUIRE(*p == 5);
}

TEST_CASE("expected<void, E>", "[vocabulary]") {
  auto ok = isopool::expected<void, isopool::TimerError>::success();
  REQUIRE(ok.has_value());
  auto bad = isopool::expected<void, isopool::TimerError>::error(isopool::TimerError::kInvalidPeriod);
  REQUIRE(!bad);
  REQUIRE(bad.get_error() == isopool::TimerError::kInvalidPeriod);
}

// ============================================================================
// NewType
// ============================================================================

TEST_CASE("NewType compares by value", "[vocabulary]") {
  isopool::WorkerId a(3);
  isopool::WorkerId b(3);
  isopool::WorkerId c(4);
  REQUIRE(a == b);
  REQUIRE(a != c);
  REQUIRE(a < c);
  REQUIRE(isopool::UnitId().value() == 0U);
  REQUIRE(isopool::UnitId(99).value() == 99U);
}

// ============================================================================
// ScopeGuard
// ============================================================================

TEST_CASE("ScopeGuard runs on scope exit unless released", "[vocabulary]") {
  int runs = 0;
  {
    isopool::ScopeGuard<std::function<void()>> g([&runs] { ++runs; });
  }
  REQUIRE(runs == 1);
  {
    auto fn = [&runs] { ++runs; };
    isopool::ScopeGuard<decltype(fn)> g(fn);
    g.release();
  }
  REQUIRE(runs == 1);
}

// ============================================================================
// Error names
// ============================================================================

TEST_CASE("Error name helpers", "[vocabulary]") {
  REQUIRE(std::string(isopool::ChannelErrorName(isopool::ChannelError::kClosed)) == "closed");
  REQUIRE(std::string(isopool::SpawnErrorName(isopool::SpawnError::kInitFailed)) == "init_failed");
  REQUIRE(std::string(isopool::ConfigErrorName(isopool::ConfigError::kParseError)) == "parse_error");
}

/**
 * @file vocabulary.hpp
 * @brief Vocabulary types shared by every isopool module.
 *
 * - expected<V, E>: value-or-error return type (no exceptions thrown)
 * - NewType<T, Tag>: strong typedef for identifiers
 * - ScopeGuard: run a callable on scope exit
 * - Per-module error enums
 */

#ifndef ISOPOOL_VOCABULARY_HPP_
#define ISOPOOL_VOCABULARY_HPP_

#include "isopool/platform.hpp"

#include <cstdint>
#include <new>
#include <type_traits>
#include <utility>

namespace isopool {

// ============================================================================
// Error Enums
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
  kInvalidValue,
};

enum class CodecError : uint8_t {
  kTruncated = 0,
  kBadMagic,
  kBadType,
  kTooLarge,
  kBadValue,
};

enum class ChannelError : uint8_t {
  kTimeout = 0,  ///< Deadline elapsed before a full frame arrived
  kClosed,       ///< Peer closed its end (EOF, EPIPE, POLLHUP)
  kIoError,      ///< read/write/poll failed
  kMalformed,    ///< Frame header did not decode
  kTooLarge,     ///< Frame body exceeds the configured limit
};

enum class SpawnError : uint8_t {
  kPipeFailed = 0,
  kForkFailed,
  kHandshakeTimeout,  ///< Worker did not report ready in time
  kHandshakeFailed,   ///< Worker died or sent garbage before ready
  kInitFailed,        ///< Worker reported handler Init() failure
  kShuttingDown,
};

enum class TimerError : uint8_t {
  kInvalidPeriod = 0,
  kAlreadyRunning,
  kNotRunning,
};

enum class ShutdownError : uint8_t {
  kCallbacksFull = 0,
  kPipeCreationFailed,
  kSignalInstallFailed,
  kAlreadyInstantiated,
};

inline const char* ConfigErrorName(ConfigError e) noexcept {
  switch (e) {
    case ConfigError::kFileNotFound:
      return "file_not_found";
    case ConfigError::kParseError:
      return "parse_error";
    case ConfigError::kFormatNotSupported:
      return "format_not_supported";
    case ConfigError::kBufferFull:
      return "buffer_full";
    case ConfigError::kInvalidValue:
      return "invalid_value";
  }
  return "unknown";
}

inline const char* ChannelErrorName(ChannelError e) noexcept {
  switch (e) {
    case ChannelError::kTimeout:
      return "timeout";
    case ChannelError::kClosed:
      return "closed";
    case ChannelError::kIoError:
      return "io_error";
    case ChannelError::kMalformed:
      return "malformed";
    case ChannelError::kTooLarge:
      return "too_large";
  }
  return "unknown";
}

inline const char* SpawnErrorName(SpawnError e) noexcept {
  switch (e) {
    case SpawnError::kPipeFailed:
      return "pipe_failed";
    case SpawnError::kForkFailed:
      return "fork_failed";
    case SpawnError::kHandshakeTimeout:
      return "handshake_timeout";
    case SpawnError::kHandshakeFailed:
      return "handshake_failed";
    case SpawnError::kInitFailed:
      return "init_failed";
    case SpawnError::kShuttingDown:
      return "shutting_down";
  }
  return "unknown";
}

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Holds either a value of type V or an error of type E.
 *
 * Construct through the named factories success() / error(). Accessing
 * value() on an error (or get_error() on a value) is a programming error
 * and trips ISOPOOL_ASSERT in debug builds.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& v) {
    expected r;
    ::new (static_cast<void*>(r.storage_)) V(v);
    r.has_value_ = true;
    return r;
  }

  static expected success(V&& v) {
    expected r;
    ::new (static_cast<void*>(r.storage_)) V(std::move(v));
    r.has_value_ = true;
    return r;
  }

  static expected error(const E& e) {
    expected r;
    ::new (static_cast<void*>(r.storage_)) E(e);
    r.has_value_ = false;
    return r;
  }

  static expected error(E&& e) {
    expected r;
    ::new (static_cast<void*>(r.storage_)) E(std::move(e));
    r.has_value_ = false;
    return r;
  }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(storage_)) V(other.Val());
    } else {
      ::new (static_cast<void*>(storage_)) E(other.Err());
    }
  }

  expected(expected&& other) noexcept(std::is_nothrow_move_constructible<V>::value &&
                                      std::is_nothrow_move_constructible<E>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(storage_)) V(std::move(other.Val()));
    } else {
      ::new (static_cast<void*>(storage_)) E(std::move(other.Err()));
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (static_cast<void*>(storage_)) V(other.Val());
      } else {
        ::new (static_cast<void*>(storage_)) E(other.Err());
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(std::is_nothrow_move_constructible<V>::value &&
                                                 std::is_nothrow_move_constructible<E>::value) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (static_cast<void*>(storage_)) V(std::move(other.Val()));
      } else {
        ::new (static_cast<void*>(storage_)) E(std::move(other.Err()));
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & {
    ISOPOOL_ASSERT(has_value_);
    return Val();
  }
  const V& value() const& {
    ISOPOOL_ASSERT(has_value_);
    return Val();
  }
  V&& value() && {
    ISOPOOL_ASSERT(has_value_);
    return std::move(Val());
  }

  const E& get_error() const {
    ISOPOOL_ASSERT(!has_value_);
    return Err();
  }

  V value_or(const V& default_val) const { return has_value_ ? Val() : default_val; }

 private:
  expected() noexcept : has_value_(false) {}

  V& Val() { return *std::launder(reinterpret_cast<V*>(storage_)); }
  const V& Val() const { return *std::launder(reinterpret_cast<const V*>(storage_)); }
  E& Err() { return *std::launder(reinterpret_cast<E*>(storage_)); }
  const E& Err() const { return *std::launder(reinterpret_cast<const E*>(storage_)); }

  void Destroy() noexcept {
    if (has_value_) {
      Val().~V();
    } else {
      Err().~E();
    }
  }

  static constexpr size_t kSize = (sizeof(V) > sizeof(E)) ? sizeof(V) : sizeof(E);
  alignas(V) alignas(E) unsigned char storage_[kSize];
  bool has_value_;
};

/** @brief expected<void, E>: success carries no value. */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(true, E{}); }
  static expected error(E e) { return expected(false, std::move(e)); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  const E& get_error() const {
    ISOPOOL_ASSERT(!has_value_);
    return error_;
  }

 private:
  expected(bool ok, E e) : error_(std::move(e)), has_value_(ok) {}

  E error_;
  bool has_value_;
};

// ============================================================================
// NewType<T, Tag>
// ============================================================================

/**
 * @brief Strong typedef: two NewTypes over the same T with different tags
 * do not convert into each other.
 */
template <typename T, typename Tag>
class NewType {
 public:
  constexpr NewType() noexcept : val_{} {}
  constexpr explicit NewType(T v) noexcept : val_(v) {}

  constexpr T value() const noexcept { return val_; }

  constexpr bool operator==(const NewType& o) const noexcept { return val_ == o.val_; }
  constexpr bool operator!=(const NewType& o) const noexcept { return val_ != o.val_; }
  constexpr bool operator<(const NewType& o) const noexcept { return val_ < o.val_; }

 private:
  T val_;
};

struct WorkerIdTag {};
struct UnitIdTag {};

/// Process slot identifier, stable across worker generations.
using WorkerId = NewType<uint32_t, WorkerIdTag>;
/// Work unit correlation identifier, unique per Dispatcher.
using UnitId = NewType<uint64_t, UnitIdTag>;

// ============================================================================
// ScopeGuard
// ============================================================================

template <typename F>
class ScopeGuard final {
 public:
  explicit ScopeGuard(F fn) noexcept(std::is_nothrow_move_constructible<F>::value)
      : fn_(std::move(fn)), active_(true) {}

  ScopeGuard(ScopeGuard&& other) noexcept(std::is_nothrow_move_constructible<F>::value)
      : fn_(std::move(other.fn_)), active_(other.active_) {
    other.active_ = false;
  }

  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;
  ScopeGuard& operator=(ScopeGuard&&) = delete;

  ~ScopeGuard() {
    if (active_) {
      fn_();
    }
  }

  void release() noexcept { active_ = false; }

 private:
  F fn_;
  bool active_;
};

}  // namespace isopool

#endif  // ISOPOOL_VOCABULARY_HPP_

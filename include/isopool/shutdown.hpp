/**
 * @file shutdown.hpp
 * @brief SIGINT/SIGTERM handling for processes that host a pool.
 *
 * Uses a self-pipe for async-signal-safe wakeup and sigaction(2) for
 * signal installation. Callbacks run in LIFO order after the wakeup, on
 * the thread that called Wait(), never in signal context.
 */

#ifndef ISOPOOL_SHUTDOWN_HPP_
#define ISOPOOL_SHUTDOWN_HPP_

#include "isopool/platform.hpp"
#include "isopool/vocabulary.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdint>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace isopool {

/// @brief Shutdown callback. Receives the signal number (0 for Quit()) and
/// the context pointer given at registration.
using ShutdownFn = void (*)(int signo, void* ctx);

class ShutdownSignal;

namespace detail {

/** @brief The one active ShutdownSignal of this process, if any. */
inline ShutdownSignal*& ShutdownInstance() {
  static ShutdownSignal* ptr = nullptr;
  return ptr;
}

}  // namespace detail

/**
 * @brief Turns SIGINT/SIGTERM into an orderly pool shutdown.
 *
 * Only one instance per process is active; a second one reports
 * kAlreadyInstantiated from every call.
 *
 * Usage:
 * @code
 *   isopool::ShutdownSignal sig;
 *   sig.Register([](int, void* p) { static_cast<isopool::Dispatcher*>(p)->Shutdown(); }, &pool);
 *   sig.Install();
 *   sig.Wait();
 * @endcode
 */
class ShutdownSignal final {
 public:
  ShutdownSignal() noexcept {
    if (detail::ShutdownInstance() != nullptr) return;
    if (::pipe2(pipe_fd_, O_CLOEXEC | O_NONBLOCK) != 0) {
      pipe_fd_[0] = -1;
      pipe_fd_[1] = -1;
      return;
    }
    detail::ShutdownInstance() = this;
    valid_ = true;
  }

  ~ShutdownSignal() {
    if (valid_ && installed_) {
      (void)::sigaction(SIGINT, &old_int_, nullptr);
      (void)::sigaction(SIGTERM, &old_term_, nullptr);
    }
    if (pipe_fd_[0] >= 0) ::close(pipe_fd_[0]);
    if (pipe_fd_[1] >= 0) ::close(pipe_fd_[1]);
    if (detail::ShutdownInstance() == this) detail::ShutdownInstance() = nullptr;
  }

  ShutdownSignal(const ShutdownSignal&) = delete;
  ShutdownSignal& operator=(const ShutdownSignal&) = delete;
  ShutdownSignal(ShutdownSignal&&) = delete;
  ShutdownSignal& operator=(ShutdownSignal&&) = delete;

  bool IsValid() const noexcept { return valid_; }

  /**
   * @brief Add a callback, run LIFO by Wait().
   * @return kAlreadyInstantiated on an inactive instance, kCallbacksFull if
   *         @p fn is null or all kMaxCallbacks slots are taken.
   */
  expected<void, ShutdownError> Register(ShutdownFn fn, void* ctx = nullptr) noexcept {
    if (!valid_) return expected<void, ShutdownError>::error(ShutdownError::kAlreadyInstantiated);
    if (fn == nullptr || count_ >= kMaxCallbacks) {
      return expected<void, ShutdownError>::error(ShutdownError::kCallbacksFull);
    }
    callbacks_[count_].fn = fn;
    callbacks_[count_].ctx = ctx;
    ++count_;
    return expected<void, ShutdownError>::success();
  }

  /** @brief Install handlers for SIGINT and SIGTERM (SA_RESTART). */
  expected<void, ShutdownError> Install() noexcept {
    if (!valid_) return expected<void, ShutdownError>::error(ShutdownError::kAlreadyInstantiated);
    if (pipe_fd_[1] < 0) return expected<void, ShutdownError>::error(ShutdownError::kPipeCreationFailed);

    struct sigaction sa;
    sa.sa_handler = &ShutdownSignal::Handler;
    ::sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    if (::sigaction(SIGINT, &sa, &old_int_) != 0 || ::sigaction(SIGTERM, &sa, &old_term_) != 0) {
      return expected<void, ShutdownError>::error(ShutdownError::kSignalInstallFailed);
    }
    installed_ = true;
    return expected<void, ShutdownError>::success();
  }

  /** @brief Trigger shutdown by hand, e.g. once all work is done. */
  void Quit(int signo = 0) noexcept { Trigger(signo); }

  /**
   * @brief Block until a signal or Quit(), then run callbacks LIFO.
   * Callbacks run once even if Wait() is called again.
   */
  void Wait() noexcept {
    while (pipe_fd_[0] >= 0 && !requested_.load(std::memory_order_acquire)) {
      struct pollfd pfd;
      pfd.fd = pipe_fd_[0];
      pfd.events = POLLIN;
      pfd.revents = 0;
      if (::poll(&pfd, 1, -1) < 0 && errno != EINTR) break;
      uint8_t buf = 0;
      (void)::read(pipe_fd_[0], &buf, 1);
    }
    RunCallbacks();
  }

  bool IsRequested() const noexcept { return requested_.load(std::memory_order_acquire); }

  int SignalNumber() const noexcept { return signo_.load(std::memory_order_relaxed); }

  static constexpr uint32_t kMaxCallbacks = 16U;

 private:
  struct Entry {
    ShutdownFn fn = nullptr;
    void* ctx = nullptr;
  };

  static void Handler(int signo) {
    ShutdownSignal* self = detail::ShutdownInstance();
    if (self != nullptr) self->Trigger(signo);
  }

  /// Async-signal-safe: atomics and write(2) only.
  void Trigger(int signo) noexcept {
    bool expected_val = false;
    if (requested_.compare_exchange_strong(expected_val, true, std::memory_order_acq_rel)) {
      signo_.store(signo, std::memory_order_relaxed);
      if (pipe_fd_[1] >= 0) {
        const int saved = errno;
        const uint8_t byte = 1;
        (void)::write(pipe_fd_[1], &byte, 1);
        errno = saved;
      }
    }
  }

  void RunCallbacks() noexcept {
    if (ran_) return;
    ran_ = true;
    const int signo = signo_.load(std::memory_order_relaxed);
    for (uint32_t i = count_; i > 0U; --i) callbacks_[i - 1U].fn(signo, callbacks_[i - 1U].ctx);
  }

  Entry callbacks_[kMaxCallbacks];
  uint32_t count_ = 0;
  int pipe_fd_[2] = {-1, -1};
  std::atomic<bool> requested_{false};
  std::atomic<int> signo_{0};
  struct sigaction old_int_ = {};
  struct sigaction old_term_ = {};
  bool installed_ = false;
  bool valid_ = false;
  bool ran_ = false;
};

}  // namespace isopool

#endif  // ISOPOOL_SHUTDOWN_HPP_

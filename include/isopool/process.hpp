/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file process.hpp
 * @brief OS process primitives for worker children: pipes, reaping,
 * liveness, memory readings and descriptor hygiene.
 *
 * Linux-only (requires /proc, pipe2(2), waitpid(2)).
 */

#ifndef ISOPOOL_PROCESS_HPP_
#define ISOPOOL_PROCESS_HPP_

#include "isopool/platform.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

#include <dirent.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>

namespace isopool {

namespace detail {

class DirGuard {
 public:
  explicit DirGuard(DIR* dir) : dir_(dir) {}
  ~DirGuard() {
    if (dir_) {
      closedir(dir_);
    }
  }
  DIR* get() const { return dir_; }

  DirGuard(const DirGuard&) = delete;
  DirGuard& operator=(const DirGuard&) = delete;

 private:
  DIR* dir_;
};

/// @brief Sleep for @p ms milliseconds (nanosleep).
inline void SleepMs(uint32_t ms) {
  struct timespec ts;
  ts.tv_sec = static_cast<time_t>(ms / 1000U);
  ts.tv_nsec = static_cast<long>(ms % 1000U) * 1000000L;  // NOLINT
  while (nanosleep(&ts, &ts) != 0 && errno == EINTR) {
  }
}

/// @brief Read a /proc file into @p buf (NUL-terminated). -1 on error.
inline int ReadProcFile(const char* path, char* buf, size_t buf_size) {
  int fd = open(path, O_RDONLY | O_CLOEXEC);  // NOLINT
  if (fd < 0) return -1;
  ssize_t n = read(fd, buf, buf_size - 1);
  close(fd);  // NOLINT
  if (n < 0) return -1;
  buf[static_cast<size_t>(n)] = '\0';
  return static_cast<int>(n);
}

inline void CloseFd(int& fd) noexcept {
  if (fd >= 0) {
    close(fd);  // NOLINT
    fd = -1;
  }
}

// ============================================================================
// PipeGuard - RAII pipe, close-on-exec from birth
// ============================================================================

class PipeGuard {
 public:
  PipeGuard() : fd_{-1, -1} {}
  ~PipeGuard() { CloseAll(); }

  /// @brief Create the pipe with O_CLOEXEC. Returns false on failure.
  bool Create() { return pipe2(fd_, O_CLOEXEC) == 0; }

  int ReadEnd() const { return fd_[0]; }
  int WriteEnd() const { return fd_[1]; }

  void CloseRead() { CloseFd(fd_[0]); }
  void CloseWrite() { CloseFd(fd_[1]); }
  void CloseAll() {
    CloseRead();
    CloseWrite();
  }

  int ReleaseRead() {
    int r = fd_[0];
    fd_[0] = -1;
    return r;
  }
  int ReleaseWrite() {
    int r = fd_[1];
    fd_[1] = -1;
    return r;
  }

  PipeGuard(const PipeGuard&) = delete;
  PipeGuard& operator=(const PipeGuard&) = delete;

 private:
  int fd_[2];
};

inline bool IsDigitString(const char* s) {
  if (*s == '\0') return false;
  for (; *s != '\0'; ++s) {
    if (*s < '0' || *s > '9') return false;
  }
  return true;
}

}  // namespace detail

// ============================================================================
// Descriptor hygiene (child side)
// ============================================================================

/**
 * @brief Close every descriptor above stderr except @p keep_a and @p keep_b.
 *
 * Run in a forked worker so no child holds a sibling's pipe end; otherwise a
 * crashed sibling's EOF would never be observed by the supervisor.
 */
inline void CloseInheritedFds(int keep_a, int keep_b) {
  int dir_fd = -1;
  {
    detail::DirGuard dir(opendir("/proc/self/fd"));
    if (dir.get() != nullptr) {
      dir_fd = dirfd(dir.get());
      // Collect first: closing while iterating would disturb readdir.
      int to_close[1024];
      int count = 0;
      bool overflow = false;
      struct dirent* entry;
      while ((entry = readdir(dir.get())) != nullptr) {
        if (!detail::IsDigitString(entry->d_name)) continue;
        int fd = std::atoi(entry->d_name);
        if (fd <= STDERR_FILENO || fd == keep_a || fd == keep_b || fd == dir_fd) continue;
        if (count < 1024) {
          to_close[count++] = fd;
        } else {
          overflow = true;
        }
      }
      for (int i = 0; i < count; ++i) close(to_close[i]);  // NOLINT
      if (!overflow) return;
    }
  }
  long max_fd = sysconf(_SC_OPEN_MAX);
  if (max_fd < 0) max_fd = 4096;
  for (int fd = STDERR_FILENO + 1; fd < max_fd; ++fd) {
    if (fd != keep_a && fd != keep_b) close(fd);  // NOLINT
  }
}

/**
 * @brief Close every descriptor >= @p lowest. Async-signal-safe, for use
 * between fork() and execve().
 */
inline void CloseFdsFrom(int lowest) {
#ifdef SYS_close_range
  if (syscall(SYS_close_range, static_cast<unsigned>(lowest), ~0U, 0U) == 0) return;
#endif
  long max_fd = sysconf(_SC_OPEN_MAX);
  if (max_fd < 0 || max_fd > 65536) max_fd = 65536;
  for (int fd = lowest; fd < max_fd; ++fd) close(fd);  // NOLINT
}

/**
 * @brief Reset signal dispositions and the signal mask inherited from the
 * supervisor, then leave its session so terminal signals reach the
 * supervisor only.
 */
inline void ResetChildSignals() {
  struct sigaction sa_dfl;
  std::memset(&sa_dfl, 0, sizeof(sa_dfl));
  sa_dfl.sa_handler = SIG_DFL;
  for (int sig = 1; sig < 32; ++sig) {
    sigaction(sig, &sa_dfl, nullptr);  // uncatchable signals fail harmlessly
  }
  sigset_t none;
  sigemptyset(&none);
  sigprocmask(SIG_SETMASK, &none, nullptr);
  setsid();
}

/**
 * @brief Ignore SIGPIPE process-wide so writing to a dead worker fails with
 * EPIPE instead of terminating the supervisor.
 */
inline bool IgnoreSigpipe() noexcept {
  struct sigaction sa;
  std::memset(&sa, 0, sizeof(sa));
  sa.sa_handler = SIG_IGN;
  sigemptyset(&sa.sa_mask);
  return sigaction(SIGPIPE, &sa, nullptr) == 0;
}

// ============================================================================
// Liveness and reaping
// ============================================================================

/// @brief Check if a process exists and can receive signals.
inline bool IsProcessAlive(pid_t pid) { return pid > 0 && kill(pid, 0) == 0; }

/**
 * @brief True if child @p pid has terminated (zombie or gone). Leaves the
 * exit status in place for a later waitpid().
 */
inline bool HasExited(pid_t pid) {
  if (pid <= 0) return true;
  siginfo_t info;
  std::memset(&info, 0, sizeof(info));
  if (waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
    return errno == ECHILD;
  }
  return info.si_pid == pid;
}

struct WaitResult {
  bool exited;      ///< true if child exited normally
  int exit_code;    ///< valid if exited
  bool signaled;    ///< true if child was killed by a signal
  int term_signal;  ///< valid if signaled
  bool timed_out;   ///< true if the child was still running at the deadline

  WaitResult() : exited(false), exit_code(-1), signaled(false), term_signal(0), timed_out(false) {}
};

namespace detail {

inline void FillWaitResult(int status, WaitResult& wr) {
  if (WIFEXITED(status)) {
    wr.exited = true;
    wr.exit_code = WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    wr.signaled = true;
    wr.term_signal = WTERMSIG(status);
  }
}

}  // namespace detail

/**
 * @brief Wait for child @p pid to exit.
 * @param timeout_ms 0 blocks until exit; otherwise poll waitpid(WNOHANG)
 *        until the deadline and report timed_out if still running.
 *
 * A child already reaped elsewhere (ECHILD) reports exited with code -1.
 */
inline WaitResult ReapProcess(pid_t pid, uint32_t timeout_ms) {
  WaitResult wr;
  if (pid <= 0) {
    wr.exited = true;
    return wr;
  }

  if (timeout_ms == 0U) {
    int status = 0;
    pid_t w;
    do {
      w = waitpid(pid, &status, 0);
    } while (w < 0 && errno == EINTR);
    if (w > 0) {
      detail::FillWaitResult(status, wr);
    } else {
      wr.exited = true;
    }
    return wr;
  }

  constexpr uint32_t kPollIntervalMs = 5;
  uint64_t deadline = SteadyNowMs() + timeout_ms;
  for (;;) {
    int status = 0;
    pid_t w = waitpid(pid, &status, WNOHANG);
    if (w > 0) {
      detail::FillWaitResult(status, wr);
      return wr;
    }
    if (w < 0 && errno != EINTR) {
      wr.exited = true;
      return wr;
    }
    if (SteadyNowMs() >= deadline) break;
    detail::SleepMs(kPollIntervalMs);
  }
  wr.timed_out = true;
  return wr;
}

/** @brief SIGKILL then blocking waitpid. Safe on an already-exited child. */
inline WaitResult KillAndReap(pid_t pid) {
  if (pid <= 0) return ReapProcess(pid, 0);
  (void)kill(pid, SIGKILL);
  return ReapProcess(pid, 0);
}

/** @brief "exit code 3", "signal 9 (SIGKILL)", "still running", ... */
inline std::string DescribeWaitResult(const WaitResult& wr) {
  char buf[64];
  if (wr.timed_out) {
    return "still running";
  }
  if (wr.signaled) {
    const char* name = "?";
    switch (wr.term_signal) {
      case SIGKILL:
        name = "SIGKILL";
        break;
      case SIGTERM:
        name = "SIGTERM";
        break;
      case SIGABRT:
        name = "SIGABRT";
        break;
      case SIGSEGV:
        name = "SIGSEGV";
        break;
      case SIGBUS:
        name = "SIGBUS";
        break;
      case SIGFPE:
        name = "SIGFPE";
        break;
      case SIGILL:
        name = "SIGILL";
        break;
      default:
        break;
    }
    std::snprintf(buf, sizeof(buf), "signal %d (%s)", wr.term_signal, name);
    return buf;
  }
  std::snprintf(buf, sizeof(buf), "exit code %d", wr.exit_code);
  return buf;
}

// ============================================================================
// Memory readings
// ============================================================================

/**
 * @brief Resident set size of @p pid in KiB from /proc/<pid>/statm.
 * @return 0 if the process is gone or /proc is unreadable.
 */
inline uint64_t ReadProcessRssKb(pid_t pid) {
  char path[64];
  std::snprintf(path, sizeof(path), "/proc/%d/statm", static_cast<int>(pid));
  char buf[128];
  if (detail::ReadProcFile(path, buf, sizeof(buf)) <= 0) return 0;

  unsigned long long size_pages = 0;
  unsigned long long rss_pages = 0;
  if (std::sscanf(buf, "%llu %llu", &size_pages, &rss_pages) != 2) return 0;
  long page = sysconf(_SC_PAGESIZE);
  if (page <= 0) page = 4096;
  return static_cast<uint64_t>(rss_pages) * static_cast<uint64_t>(page) / 1024U;
}

inline uint64_t ReadSelfRssKb() { return ReadProcessRssKb(getpid()); }

}  // namespace isopool

#endif  // ISOPOOL_PROCESS_HPP_

/**
 * @file channel.hpp
 * @brief Framed blocking I/O over one pipe end.
 *
 * ReadFrame() waits in poll(2) until data, hangup or the deadline, whichever
 * comes first; it never sleeps in a loop.
 */

#ifndef ISOPOOL_CHANNEL_HPP_
#define ISOPOOL_CHANNEL_HPP_

#include "isopool/codec.hpp"
#include "isopool/platform.hpp"
#include "isopool/vocabulary.hpp"

#include <cerrno>
#include <cstdint>
#include <vector>

#include <poll.h>
#include <unistd.h>

namespace isopool {

/// Wait forever in ReadFrame().
static constexpr int32_t kNoDeadline = -1;

/**
 * @brief Convert an unsigned timeout to ReadFrame()'s deadline argument.
 * Values above INT32_MAX saturate instead of wrapping into kNoDeadline.
 */
inline int32_t DeadlineMs(uint32_t timeout_ms) noexcept {
  return timeout_ms > static_cast<uint32_t>(INT32_MAX) ? INT32_MAX : static_cast<int32_t>(timeout_ms);
}

struct Frame {
  FrameType type = FrameType::kTask;
  std::vector<uint8_t> body;
};

namespace detail {

/** @brief Write all @p len bytes, retrying on EINTR and short writes. */
inline expected<void, ChannelError> WriteAll(int fd, const uint8_t* data, size_t len) noexcept {
  while (len > 0U) {
    ssize_t n = ::write(fd, data, len);
    if (n < 0) {
      if (errno == EINTR) continue;
      if (errno == EPIPE) return expected<void, ChannelError>::error(ChannelError::kClosed);
      return expected<void, ChannelError>::error(ChannelError::kIoError);
    }
    data += n;
    len -= static_cast<size_t>(n);
  }
  return expected<void, ChannelError>::success();
}

/**
 * @brief Read exactly @p len bytes before @p deadline_ms (SteadyNowMs
 * scale, or 0 for none).
 */
inline expected<void, ChannelError> ReadExact(int fd, uint8_t* out, size_t len,
                                              uint64_t deadline_ms) noexcept {
  while (len > 0U) {
    int wait_ms = -1;
    if (deadline_ms != 0U) {
      uint64_t now = SteadyNowMs();
      if (now >= deadline_ms) return expected<void, ChannelError>::error(ChannelError::kTimeout);
      uint64_t left = deadline_ms - now;
      wait_ms = (left > 0x7fffffffULL) ? 0x7fffffff : static_cast<int>(left);
    }

    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN;
    pfd.revents = 0;
    int rc = ::poll(&pfd, 1, wait_ms);
    if (rc < 0) {
      if (errno == EINTR) continue;
      return expected<void, ChannelError>::error(ChannelError::kIoError);
    }
    if (rc == 0) return expected<void, ChannelError>::error(ChannelError::kTimeout);
    if ((pfd.revents & POLLNVAL) != 0) return expected<void, ChannelError>::error(ChannelError::kIoError);

    // POLLHUP with buffered data still reads; read() reports EOF afterwards.
    ssize_t n = ::read(fd, out, len);
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      return expected<void, ChannelError>::error(ChannelError::kIoError);
    }
    if (n == 0) return expected<void, ChannelError>::error(ChannelError::kClosed);
    out += n;
    len -= static_cast<size_t>(n);
  }
  return expected<void, ChannelError>::success();
}

}  // namespace detail

/** @brief Send one frame. kClosed means the reader is gone (EPIPE). */
inline expected<void, ChannelError> WriteFrame(int fd, FrameType type, const std::vector<uint8_t>& body) {
  uint8_t hdr_buf[FrameCodec::kHeaderSize];
  FrameHeader hdr;
  hdr.type = type;
  hdr.length = static_cast<uint32_t>(body.size());
  FrameCodec::EncodeHeader(hdr, hdr_buf);

  auto r = detail::WriteAll(fd, hdr_buf, sizeof(hdr_buf));
  if (!r.has_value() || body.empty()) return r;
  return detail::WriteAll(fd, body.data(), body.size());
}

/**
 * @brief Receive one frame.
 * @param timeout_ms Relative deadline for the whole frame, or kNoDeadline.
 * @param max_bytes  Largest body accepted; larger frames return kTooLarge.
 */
inline expected<Frame, ChannelError> ReadFrame(int fd, int32_t timeout_ms, uint32_t max_bytes) {
  uint64_t deadline = 0;
  if (timeout_ms >= 0) deadline = SteadyNowMs() + static_cast<uint64_t>(timeout_ms);
  // Zero would mean "no deadline" to ReadExact.
  if (timeout_ms >= 0 && deadline == 0U) deadline = 1U;

  uint8_t hdr_buf[FrameCodec::kHeaderSize];
  auto r = detail::ReadExact(fd, hdr_buf, sizeof(hdr_buf), deadline);
  if (!r.has_value()) return expected<Frame, ChannelError>::error(r.get_error());

  auto hdr = FrameCodec::DecodeHeader(hdr_buf, sizeof(hdr_buf));
  if (!hdr.has_value()) return expected<Frame, ChannelError>::error(ChannelError::kMalformed);
  if (hdr.value().length > max_bytes) return expected<Frame, ChannelError>::error(ChannelError::kTooLarge);

  Frame frame;
  frame.type = hdr.value().type;
  frame.body.resize(hdr.value().length);
  if (!frame.body.empty()) {
    r = detail::ReadExact(fd, frame.body.data(), frame.body.size(), deadline);
    if (!r.has_value()) return expected<Frame, ChannelError>::error(r.get_error());
  }
  return expected<Frame, ChannelError>::success(std::move(frame));
}

}  // namespace isopool

#endif  // ISOPOOL_CHANNEL_HPP_

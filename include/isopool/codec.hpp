/**
 * @file codec.hpp
 * @brief Wire format between the supervisor and its worker processes.
 *
 * Every message is one frame:
 *
 *   offset  size  field
 *   0       4     magic "ISP\1"
 *   4       1     FrameType
 *   5       3     reserved (zero)
 *   8       4     body length (little-endian)
 *   12      n     body
 *
 * Body fields are little-endian integers and length-prefixed (u32) strings.
 * Decoding never trusts a length without checking it against what remains.
 */

#ifndef ISOPOOL_CODEC_HPP_
#define ISOPOOL_CODEC_HPP_

#include "isopool/vocabulary.hpp"
#include "isopool/work.hpp"

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace isopool {

enum class FrameType : uint8_t {
  kReady = 1,     ///< worker -> supervisor, once after Init()
  kTask = 2,      ///< supervisor -> worker
  kOutcome = 3,   ///< worker -> supervisor
  kShutdown = 4,  ///< supervisor -> worker, no body
};

struct FrameHeader {
  FrameType type = FrameType::kTask;
  uint32_t length = 0;
};

/** @brief Body of kReady: Init() status reported by a freshly started worker. */
struct ReadyInfo {
  int32_t pid = 0;
  bool init_ok = true;
  std::string message;  ///< Init() failure text
};

/** @brief Body of kOutcome: what a worker can report about one unit. */
struct TaskReply {
  UnitId unit_id;
  bool ok = true;
  WorkResult result;    ///< when ok
  WorkFailure failure;  ///< when !ok
};

class FrameCodec {
 public:
  static constexpr uint32_t kHeaderSize = 12;
  static constexpr uint8_t kMagic[4] = {'I', 'S', 'P', 1};

  static void EncodeHeader(const FrameHeader& hdr, uint8_t* buf) noexcept {
    std::memcpy(buf, kMagic, 4);
    buf[4] = static_cast<uint8_t>(hdr.type);
    buf[5] = 0;
    buf[6] = 0;
    buf[7] = 0;
    PutU32(buf + 8, hdr.length);
  }

  static expected<FrameHeader, CodecError> DecodeHeader(const uint8_t* buf, uint32_t size) noexcept {
    if (size < kHeaderSize) return expected<FrameHeader, CodecError>::error(CodecError::kTruncated);
    if (std::memcmp(buf, kMagic, 4) != 0) {
      return expected<FrameHeader, CodecError>::error(CodecError::kBadMagic);
    }
    uint8_t t = buf[4];
    if (t < static_cast<uint8_t>(FrameType::kReady) || t > static_cast<uint8_t>(FrameType::kShutdown)) {
      return expected<FrameHeader, CodecError>::error(CodecError::kBadType);
    }
    FrameHeader hdr;
    hdr.type = static_cast<FrameType>(t);
    hdr.length = GetU32(buf + 8);
    return expected<FrameHeader, CodecError>::success(hdr);
  }

  static void PutU32(uint8_t* p, uint32_t v) noexcept {
    for (int i = 0; i < 4; ++i) p[i] = static_cast<uint8_t>(v >> (8 * i));
  }

  static uint32_t GetU32(const uint8_t* p) noexcept {
    uint32_t v = 0;
    for (int i = 0; i < 4; ++i) v |= static_cast<uint32_t>(p[i]) << (8 * i);
    return v;
  }
};

// ============================================================================
// Body Writer / Reader
// ============================================================================

namespace detail {

class BodyWriter {
 public:
  void U8(uint8_t v) { buf_.push_back(v); }

  void U32(uint32_t v) {
    uint8_t b[4];
    FrameCodec::PutU32(b, v);
    buf_.insert(buf_.end(), b, b + 4);
  }

  void U64(uint64_t v) {
    U32(static_cast<uint32_t>(v));
    U32(static_cast<uint32_t>(v >> 32));
  }

  void Str(const std::string& s) {
    U32(static_cast<uint32_t>(s.size()));
    buf_.insert(buf_.end(), s.begin(), s.end());
  }

  void Map(const StringMap& m) {
    U32(static_cast<uint32_t>(m.size()));
    for (const auto& kv : m) {
      Str(kv.first);
      Str(kv.second);
    }
  }

  std::vector<uint8_t> Take() { return std::move(buf_); }

 private:
  std::vector<uint8_t> buf_;
};

class BodyReader {
 public:
  BodyReader(const uint8_t* data, size_t size) noexcept : p_(data), end_(data + size) {}

  bool U8(uint8_t* out) noexcept {
    if (Remaining() < 1U) return false;
    *out = *p_++;
    return true;
  }

  bool U32(uint32_t* out) noexcept {
    if (Remaining() < 4U) return false;
    *out = FrameCodec::GetU32(p_);
    p_ += 4;
    return true;
  }

  bool U64(uint64_t* out) noexcept {
    uint32_t lo = 0;
    uint32_t hi = 0;
    if (!U32(&lo) || !U32(&hi)) return false;
    *out = (static_cast<uint64_t>(hi) << 32) | lo;
    return true;
  }

  bool Str(std::string* out) {
    uint32_t len = 0;
    if (!U32(&len) || Remaining() < len) return false;
    out->assign(reinterpret_cast<const char*>(p_), len);
    p_ += len;
    return true;
  }

  bool Map(StringMap* out) {
    uint32_t count = 0;
    if (!U32(&count)) return false;
    // Each entry needs at least two length prefixes.
    if (count > Remaining() / 8U) return false;
    for (uint32_t i = 0; i < count; ++i) {
      std::string k;
      std::string v;
      if (!Str(&k) || !Str(&v)) return false;
      (*out)[std::move(k)] = std::move(v);
    }
    return true;
  }

  bool AtEnd() const noexcept { return p_ == end_; }

 private:
  size_t Remaining() const noexcept { return static_cast<size_t>(end_ - p_); }

  const uint8_t* p_;
  const uint8_t* end_;
};

}  // namespace detail

// ============================================================================
// Message Bodies
// ============================================================================

inline std::vector<uint8_t> EncodeTask(const WorkUnit& unit) {
  detail::BodyWriter w;
  w.U64(unit.id.value());
  w.Str(unit.trace_id);
  w.Str(unit.payload.input_path);
  w.Map(unit.payload.params);
  w.U64(unit.submitted_us);
  return w.Take();
}

inline expected<WorkUnit, CodecError> DecodeTask(const std::vector<uint8_t>& body) {
  detail::BodyReader r(body.data(), body.size());
  WorkUnit unit;
  uint64_t id = 0;
  if (!r.U64(&id) || !r.Str(&unit.trace_id) || !r.Str(&unit.payload.input_path) ||
      !r.Map(&unit.payload.params) || !r.U64(&unit.submitted_us)) {
    return expected<WorkUnit, CodecError>::error(CodecError::kTruncated);
  }
  if (!r.AtEnd()) return expected<WorkUnit, CodecError>::error(CodecError::kBadValue);
  unit.id = UnitId(id);
  return expected<WorkUnit, CodecError>::success(std::move(unit));
}

inline std::vector<uint8_t> EncodeOutcome(const TaskReply& reply) {
  detail::BodyWriter w;
  w.U64(reply.unit_id.value());
  w.U8(reply.ok ? 1U : 0U);
  if (reply.ok) {
    w.Str(reply.result.text);
    w.Map(reply.result.fields);
  } else {
    w.U8(static_cast<uint8_t>(reply.failure.kind));
    w.Str(reply.failure.message);
  }
  return w.Take();
}

inline expected<TaskReply, CodecError> DecodeOutcome(const std::vector<uint8_t>& body) {
  detail::BodyReader r(body.data(), body.size());
  TaskReply reply;
  uint64_t id = 0;
  uint8_t ok = 0;
  if (!r.U64(&id) || !r.U8(&ok)) return expected<TaskReply, CodecError>::error(CodecError::kTruncated);
  if (ok > 1U) return expected<TaskReply, CodecError>::error(CodecError::kBadValue);
  reply.unit_id = UnitId(id);
  reply.ok = (ok == 1U);
  if (reply.ok) {
    if (!r.Str(&reply.result.text) || !r.Map(&reply.result.fields)) {
      return expected<TaskReply, CodecError>::error(CodecError::kTruncated);
    }
  } else {
    uint8_t kind = 0;
    if (!r.U8(&kind) || !r.Str(&reply.failure.message)) {
      return expected<TaskReply, CodecError>::error(CodecError::kTruncated);
    }
    if (kind > static_cast<uint8_t>(FailureKind::kExecutionError)) {
      return expected<TaskReply, CodecError>::error(CodecError::kBadValue);
    }
    reply.failure.kind = static_cast<FailureKind>(kind);
  }
  if (!r.AtEnd()) return expected<TaskReply, CodecError>::error(CodecError::kBadValue);
  return expected<TaskReply, CodecError>::success(std::move(reply));
}

inline std::vector<uint8_t> EncodeReady(const ReadyInfo& info) {
  detail::BodyWriter w;
  w.U32(static_cast<uint32_t>(info.pid));
  w.U8(info.init_ok ? 1U : 0U);
  w.Str(info.message);
  return w.Take();
}

inline expected<ReadyInfo, CodecError> DecodeReady(const std::vector<uint8_t>& body) {
  detail::BodyReader r(body.data(), body.size());
  ReadyInfo info;
  uint32_t pid = 0;
  uint8_t ok = 0;
  if (!r.U32(&pid) || !r.U8(&ok) || !r.Str(&info.message)) {
    return expected<ReadyInfo, CodecError>::error(CodecError::kTruncated);
  }
  if (ok > 1U || !r.AtEnd()) return expected<ReadyInfo, CodecError>::error(CodecError::kBadValue);
  info.pid = static_cast<int32_t>(pid);
  info.init_ok = (ok == 1U);
  return expected<ReadyInfo, CodecError>::success(std::move(info));
}

}  // namespace isopool

#endif  // ISOPOOL_CODEC_HPP_

/**
 * @file test_codec.cpp
 * @brief Tests for codec.hpp
 */

#include "isopool/codec.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstring>

// ============================================================================
// Frame header
// ============================================================================

TEST_CASE("FrameCodec header layout is little-endian", "[codec]") {
  uint8_t buf[isopool::FrameCodec::kHeaderSize];
  isopool::FrameHeader hdr;
  hdr.type = isopool::FrameType::kOutcome;
  hdr.length = 0x01020304U;
  isopool::FrameCodec::EncodeHeader(hdr, buf);

  REQUIRE(std::memcmp(buf, "ISP\x01", 4) == 0);
  REQUIRE(buf[4] == 3U);
  REQUIRE(buf[8] == 0x04U);
  REQUIRE(buf[11] == 0x01U);

  auto dec = isopool::FrameCodec::DecodeHeader(buf, sizeof(buf));
  REQUIRE(dec.has_value());
  REQUIRE(dec.value().type == isopool::FrameType::kOutcome);
  REQUIRE(dec.value().length == 0x01020304U);
}

TEST_CASE("FrameCodec rejects bad headers", "[codec]") {
  uint8_t buf[isopool::FrameCodec::kHeaderSize];
  isopool::FrameHeader hdr;
  isopool::FrameCodec::EncodeHeader(hdr, buf);

  auto shortbuf = isopool::FrameCodec::DecodeHeader(buf, 8);
  REQUIRE(shortbuf.get_error() == isopool::CodecError::kTruncated);

  buf[0] = 'X';
  REQUIRE(isopool::FrameCodec::DecodeHeader(buf, sizeof(buf)).get_error() == isopool::CodecError::kBadMagic);

  isopool::FrameCodec::EncodeHeader(hdr, buf);
  buf[4] = 9;
  REQUIRE(isopool::FrameCodec::DecodeHeader(buf, sizeof(buf)).get_error() == isopool::CodecError::kBadType);
}

// ============================================================================
// Bodies
// ============================================================================

TEST_CASE("Task body carries every unit field", "[codec]") {
  isopool::WorkUnit unit;
  unit.id = isopool::UnitId(0x1122334455667788ULL);
  unit.trace_id = "4bf92f3577b34da6a3ce929d0e0e4736";
  unit.payload.input_path = "/data/call one.wav";
  unit.payload.params["language"] = "auto";
  unit.payload.params["empty"] = "";
  unit.submitted_us = 123456789U;

  auto dec = isopool::DecodeTask(isopool::EncodeTask(unit));
  REQUIRE(dec.has_value());
  REQUIRE(dec.value().id == unit.id);
  REQUIRE(dec.value().trace_id == unit.trace_id);
  REQUIRE(dec.value().payload.input_path == unit.payload.input_path);
  REQUIRE(dec.value().payload.params == unit.payload.params);
  REQUIRE(dec.value().submitted_us == unit.submitted_us);
}

TEST_CASE("Outcome body success and failure", "[codec]") {
  isopool::TaskReply ok;
  ok.unit_id = isopool::UnitId(5);
  ok.result.text = "hello world";
  ok.result.fields["duration_s"] = "3.2";
  auto a = isopool::DecodeOutcome(isopool::EncodeOutcome(ok));
  REQUIRE(a.has_value());
  REQUIRE(a.value().ok);
  REQUIRE(a.value().result.text == "hello world");
  REQUIRE(a.value().result.fields.at("duration_s") == "3.2");

  isopool::TaskReply bad;
  bad.unit_id = isopool::UnitId(6);
  bad.ok = false;
  bad.failure.kind = isopool::FailureKind::kUnsupportedFormat;
  bad.failure.message = "not audio";
  auto b = isopool::DecodeOutcome(isopool::EncodeOutcome(bad));
  REQUIRE(b.has_value());
  REQUIRE_FALSE(b.value().ok);
  REQUIRE(b.value().failure.kind == isopool::FailureKind::kUnsupportedFormat);
  REQUIRE(b.value().failure.message == "not audio");
}

TEST_CASE("Decoders reject truncated and padded bodies", "[codec]") {
  isopool::WorkUnit unit;
  unit.payload.input_path = "/x";
  std::vector<uint8_t> body = isopool::EncodeTask(unit);

  std::vector<uint8_t> cut(body.begin(), body.end() - 3);
  REQUIRE(isopool::DecodeTask(cut).get_error() == isopool::CodecError::kTruncated);

  std::vector<uint8_t> padded = body;
  padded.push_back(0);
  REQUIRE(isopool::DecodeTask(padded).get_error() == isopool::CodecError::kBadValue);
}

TEST_CASE("Decoders reject out-of-range enums", "[codec]") {
  isopool::TaskReply bad;
  bad.ok = false;
  std::vector<uint8_t> body = isopool::EncodeOutcome(bad);
  body[9] = 200;  // failure kind
  REQUIRE(isopool::DecodeOutcome(body).get_error() == isopool::CodecError::kBadValue);

  body = isopool::EncodeOutcome(bad);
  body[8] = 2;  // ok flag
  REQUIRE(isopool::DecodeOutcome(body).get_error() == isopool::CodecError::kBadValue);
}

TEST_CASE("Map count larger than the body is rejected", "[codec]") {
  isopool::WorkUnit unit;
  std::vector<uint8_t> body = isopool::EncodeTask(unit);
  // id(8) + trace(4) + path(4) -> map count
  isopool::FrameCodec::PutU32(&body[16], 0xFFFFFFFFU);
  REQUIRE(!isopool::DecodeTask(body).has_value());
}

TEST_CASE("Ready body", "[codec]") {
  isopool::ReadyInfo info;
  info.pid = 4242;
  info.init_ok = false;
  info.message = "model missing";
  auto dec = isopool::DecodeReady(isopool::EncodeReady(info));
  REQUIRE(dec.has_value());
  REQUIRE(dec.value().pid == 4242);
  REQUIRE_FALSE(dec.value().init_ok);
  REQUIRE(dec.value().message == "model missing");
}

// Copyright (c) 2024 liudegui. MIT License.
//
// transcribe_worker.cpp -- Exec-mode worker for isopool_demo.
//
// Stands in for a speech SDK that leaks on every call: each unit keeps a
// chunk of heap alive until the process is recycled. Inputs are classified
// the way a real transcriber would reject them:
//   - missing file        -> input_not_found
//   - unknown extension   -> unsupported_format
//   - file over max_bytes -> resource_limit

#include "isopool/platform.hpp"
#include "isopool/process.hpp"
#include "isopool/worker.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include <strings.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

constexpr uint64_t kDefaultMaxBytes = 100ULL * 1024ULL * 1024ULL;
constexpr size_t kLeakPerUnit = 4U * 1024U * 1024U;

bool SupportedExtension(const std::string& path) {
  static const char* const kExts[] = {"wav", "mp3", "flac", "ogg", "m4a", "webm"};
  const size_t dot = path.rfind('.');
  if (dot == std::string::npos) return false;
  const std::string ext = path.substr(dot + 1U);
  for (const char* e : kExts) {
    if (::strcasecmp(ext.c_str(), e) == 0) return true;
  }
  return false;
}

isopool::expected<isopool::WorkResult, isopool::WorkFailure> Fail(isopool::FailureKind kind, std::string msg) {
  return isopool::expected<isopool::WorkResult, isopool::WorkFailure>::error(
      isopool::WorkFailure{kind, std::move(msg)});
}

class FakeTranscriber final : public isopool::WorkHandler {
 public:
  isopool::expected<void, isopool::WorkFailure> Init() override {
    const char* max = std::getenv("TRANSCRIBE_MAX_BYTES");
    if (max != nullptr && *max != '\0') max_bytes_ = std::strtoull(max, nullptr, 10);
    // "Model" load.
    model_.assign(8U * 1024U * 1024U, 0x5a);
    ISOPOOL_LOG_INFO("transcriber", "model loaded in pid %d (rss %llu kB)", static_cast<int>(getpid()),
                     static_cast<unsigned long long>(isopool::ReadSelfRssKb()));
    return isopool::expected<void, isopool::WorkFailure>::success();
  }

  isopool::expected<isopool::WorkResult, isopool::WorkFailure> Execute(const isopool::Payload& p) override {
    struct stat st;
    if (::stat(p.input_path.c_str(), &st) != 0) {
      return Fail(isopool::FailureKind::kInputNotFound, "audio file not found: " + p.input_path);
    }
    if (!S_ISREG(st.st_mode)) {
      return Fail(isopool::FailureKind::kInvalidInput, "not a regular file: " + p.input_path);
    }
    if (!SupportedExtension(p.input_path)) {
      return Fail(isopool::FailureKind::kUnsupportedFormat, "unsupported audio format: " + p.input_path);
    }
    const uint64_t size = static_cast<uint64_t>(st.st_size);
    if (size > max_bytes_) {
      return Fail(isopool::FailureKind::kResourceLimit,
                  "file too large: " + std::to_string(size) + " > " + std::to_string(max_bytes_) + " bytes");
    }

    std::FILE* f = std::fopen(p.input_path.c_str(), "rb");
    if (f == nullptr) {
      return Fail(isopool::FailureKind::kIoError, "cannot open " + p.input_path + ": " + std::strerror(errno));
    }
    uint64_t checksum = 0;
    uint8_t buf[4096];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0U) {
      for (size_t i = 0; i < n; ++i) checksum = checksum * 131U + buf[i];
    }
    const bool read_error = std::ferror(f) != 0;
    std::fclose(f);
    if (read_error) return Fail(isopool::FailureKind::kIoError, "read failed: " + p.input_path);

    // The leak the pool exists to contain.
    leaked_.emplace_back(new char[kLeakPerUnit]);
    std::memset(leaked_.back().get(), 1, kLeakPerUnit);
    ++units_;

    auto lang = p.params.find("language");
    isopool::WorkResult r;
    char text[96];
    (void)std::snprintf(text, sizeof(text), "%llu bytes, checksum %016llx", static_cast<unsigned long long>(size),
                        static_cast<unsigned long long>(checksum));
    r.text = text;
    r.fields["language"] = (lang == p.params.end() || lang->second == "auto") ? "en-US" : lang->second;
    // 16 kHz mono 16-bit PCM.
    r.fields["duration_s"] = std::to_string(size / 32000U);
    r.fields["worker_pid"] = std::to_string(getpid());
    r.fields["worker_units"] = std::to_string(units_);
    r.fields["worker_rss_kb"] = std::to_string(isopool::ReadSelfRssKb());
    return isopool::expected<isopool::WorkResult, isopool::WorkFailure>::success(r);
  }

 private:
  uint64_t max_bytes_ = kDefaultMaxBytes;
  std::vector<uint8_t> model_;
  std::vector<std::unique_ptr<char[]>> leaked_;
  uint32_t units_ = 0;
};

}  // namespace

int main() {
  FakeTranscriber handler;
  return isopool::RunWorkerMain(handler);
}

// Copyright (c) 2024 liudegui. MIT License.
//
// isopool_demo.cpp -- Transcribe a batch of files through isolated workers.
//
//   isopool_demo [-c pool.ini] [-w path/to/isopool_transcribe_worker] FILE...
//
// Demonstrates:
//   1. Layered configuration (defaults -> file -> ISOPOOL_* environment)
//   2. Concurrent submission with SubmitAsync
//   3. Per-outcome reporting and the suggested HTTP status
//   4. Pool statistics, including worker recycling
//   5. SIGINT/SIGTERM handling through ShutdownSignal

#include "isopool/config.hpp"
#include "isopool/dispatcher.hpp"
#include "isopool/log.hpp"
#include "isopool/pool_config.hpp"
#include "isopool/shutdown.hpp"

#include <cstdint>
#include <cstdio>
#include <cstring>
#include <future>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

namespace {

void PrintUsage(const char* prog) {
  std::fprintf(stderr, "usage: %s [-c config] [-w worker_executable] FILE...\n", prog);
}

/// The worker binary is installed next to this one by default.
std::string DefaultWorkerPath(const char* argv0) {
  std::string self(argv0);
  const size_t slash = self.rfind('/');
  std::string dir = (slash == std::string::npos) ? std::string(".") : self.substr(0, slash);
  return dir + "/isopool_transcribe_worker";
}

void PrintOutcome(const std::string& file, const isopool::Outcome& o) {
  std::printf("%-32s %3d %-16s %8.1f ms  pid %-6d gen %u  ", file.c_str(), isopool::SuggestedHttpStatus(o),
              isopool::OutcomeKindName(o.Kind()), static_cast<double>(o.elapsed_us) / 1000.0,
              static_cast<int>(o.worker_pid), o.worker_generation);
  switch (o.Kind()) {
    case isopool::OutcomeKind::kSuccess: {
      const isopool::WorkResult& r = o.As<isopool::Success>()->result;
      auto rss = r.fields.find("worker_rss_kb");
      std::printf("%s (rss %s kB)\n", r.text.c_str(), rss == r.fields.end() ? "?" : rss->second.c_str());
      break;
    }
    case isopool::OutcomeKind::kFailure:
      std::printf("%s: %s\n", isopool::FailureKindName(o.As<isopool::Failure>()->kind),
                  o.As<isopool::Failure>()->message.c_str());
      break;
    case isopool::OutcomeKind::kWorkerCrashed:
      std::printf("%s\n", o.As<isopool::WorkerCrashed>()->detail.c_str());
      break;
    case isopool::OutcomeKind::kPoolUnavailable:
      std::printf("%s\n", o.As<isopool::PoolUnavailable>()->detail.c_str());
      break;
    default:
      std::printf("\n");
      break;
  }
}

void PrintStats(const isopool::DispatcherStats& st) {
  std::printf("\n=== Pool Statistics ===\n");
  std::printf("  submitted       : %llu\n", static_cast<unsigned long long>(st.submitted));
  for (uint32_t i = 0; i < isopool::kOutcomeKindCount; ++i) {
    if (st.outcomes[i] == 0U) continue;
    std::printf("  %-16s: %llu\n", isopool::OutcomeKindName(static_cast<isopool::OutcomeKind>(i)),
                static_cast<unsigned long long>(st.outcomes[i]));
  }
  const isopool::PoolSnapshot& p = st.pool;
  std::printf("  workers         : %u live (%u idle, %u busy) of %u\n", p.live, p.idle, p.busy, p.max_workers);
  std::printf("  spawned         : %llu (%llu failed)\n", static_cast<unsigned long long>(p.counters.spawned),
              static_cast<unsigned long long>(p.counters.spawn_failures));
  std::printf("  recycled        : %llu\n", static_cast<unsigned long long>(p.counters.recycled));
  std::printf("  timeouts/crashes: %llu/%llu\n", static_cast<unsigned long long>(p.counters.timeouts),
              static_cast<unsigned long long>(p.counters.crashes));
  for (const auto& kv : p.retired_tasks_histogram) {
    std::printf("  retired after %u tasks: %llu\n", kv.first, static_cast<unsigned long long>(kv.second));
  }
  std::printf("  supervisor rss  : %llu kB\n", static_cast<unsigned long long>(p.supervisor_rss_kb));
  for (const auto& w : p.workers) {
    std::printf("  worker %u gen %u pid %d %-8s tasks %u rss %llu kB\n", w.worker_id, w.generation,
                static_cast<int>(w.pid), isopool::WorkerStatusName(w.status), w.tasks_completed,
                static_cast<unsigned long long>(w.rss_kb));
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  isopool::log::Init();

  const char* config_path = nullptr;
  std::string worker_path = DefaultWorkerPath(argv[0]);
  int opt;
  while ((opt = ::getopt(argc, argv, "c:w:h")) != -1) {
    switch (opt) {
      case 'c':
        config_path = optarg;
        break;
      case 'w':
        worker_path = optarg;
        break;
      default:
        PrintUsage(argv[0]);
        return opt == 'h' ? 0 : 2;
    }
  }
  if (optind >= argc) {
    PrintUsage(argv[0]);
    return 2;
  }

  isopool::PoolConfig cfg;
  if (config_path != nullptr) {
    isopool::PoolConfigFile file;
    auto loaded = file.LoadFile(config_path);
    if (!loaded.has_value()) {
      ISOPOOL_LOG_ERROR("demo", "cannot load %s: %s", config_path, isopool::ConfigErrorName(loaded.get_error()));
      return 1;
    }
    cfg = isopool::LoadPoolConfig(file, cfg);
  }
  if (!isopool::ApplyEnvOverrides(cfg).has_value()) {
    ISOPOOL_LOG_WARN("demo", "ignored malformed ISOPOOL_* environment values");
  }

  isopool::Dispatcher pool(cfg, std::unique_ptr<isopool::WorkerLauncher>(new isopool::ExecLauncher(worker_path)));

  isopool::ShutdownSignal sig;
  (void)sig.Register([](int signo, void* p) {
    if (signo != 0) ISOPOOL_LOG_WARN("demo", "signal %d, shutting down", signo);
    static_cast<isopool::Dispatcher*>(p)->Shutdown();
  }, &pool);
  if (!sig.Install().has_value()) {
    ISOPOOL_LOG_WARN("demo", "signal handlers not installed");
  }
  std::thread waiter([&sig] { sig.Wait(); });

  std::vector<std::string> files(argv + optind, argv + argc);
  std::vector<std::future<isopool::Outcome>> futures;
  futures.reserve(files.size());
  for (const auto& f : files) {
    isopool::Payload p;
    p.input_path = f;
    p.params["language"] = "auto";
    futures.push_back(pool.SubmitAsync(p));
  }

  int failures = 0;
  for (size_t i = 0; i < futures.size(); ++i) {
    isopool::Outcome o = futures[i].get();
    if (!o.IsSuccess()) ++failures;
    PrintOutcome(files[i], o);
  }

  PrintStats(pool.Stats());

  sig.Quit();
  waiter.join();
  return failures == 0 ? 0 : 1;
}

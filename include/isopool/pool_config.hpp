/**
 * @file pool_config.hpp
 * @brief Worker pool tunables, layered defaults -> config file -> environment.
 */

#ifndef ISOPOOL_POOL_CONFIG_HPP_
#define ISOPOOL_POOL_CONFIG_HPP_

#include "isopool/config.hpp"
#include "isopool/log.hpp"
#include "isopool/platform.hpp"
#include "isopool/vocabulary.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>

namespace isopool {

struct PoolConfig {
  bool enabled = true;
  uint32_t max_workers = 12;
  uint32_t min_workers = 0;            ///< Idle reaper never shrinks below this
  uint32_t max_tasks_per_worker = 100;  ///< Recycle after N completed units
  uint32_t idle_timeout_ms = 300000;
  uint32_t call_timeout_ms = 300000;
  uint32_t queue_wait_timeout_ms = 60000;
  uint32_t max_queue_depth = 256;
  uint32_t reap_interval_ms = 10000;
  uint32_t spawn_timeout_ms = 10000;
  uint32_t shutdown_grace_ms = 5000;
  uint32_t max_frame_bytes = 16U * 1024U * 1024U;
  bool validate_input_exists = true;
};

namespace detail {

inline void ReadU32(const ConfigStore& store, const char* key, uint32_t* out) {
  auto v = store.FindInt("pool", key);
  if (!v.has_value()) return;
  if (v.value() < 0) {
    ISOPOOL_LOG_WARN("config", "pool.%s=%d is negative, keeping %u", key, v.value(), *out);
    return;
  }
  *out = static_cast<uint32_t>(v.value());
}

/// Strict unsigned parse: the whole string must be digits.
inline bool ParseU64(const char* text, uint64_t* out) noexcept {
  if (text == nullptr || *text == '\0' || *text == '-') return false;
  errno = 0;
  char* end = nullptr;
  unsigned long long v = std::strtoull(text, &end, 10);
  if (errno != 0 || end == text || *end != '\0') return false;
  *out = static_cast<uint64_t>(v);
  return true;
}

inline bool EnvU32(const char* name, uint64_t scale, uint32_t* out, bool* bad) {
  const char* text = std::getenv(name);
  if (text == nullptr) return false;
  uint64_t v = 0;
  if (!ParseU64(text, &v) || v * scale > UINT32_MAX) {
    ISOPOOL_LOG_WARN("config", "ignoring %s=\"%s\": not a valid count", name, text);
    *bad = true;
    return false;
  }
  *out = static_cast<uint32_t>(v * scale);
  return true;
}

}  // namespace detail

/**
 * @brief Read section [pool] of @p store on top of @p base.
 *
 * Keys: enabled, max_workers, min_workers, max_tasks_per_worker,
 * idle_timeout_ms, call_timeout_ms, queue_wait_timeout_ms, max_queue_depth,
 * reap_interval_ms, spawn_timeout_ms, shutdown_grace_ms, max_frame_bytes,
 * validate_input_exists. Missing keys keep the value from @p base.
 */
inline PoolConfig LoadPoolConfig(const ConfigStore& store, PoolConfig base = PoolConfig{}) {
  auto enabled = store.FindBool("pool", "enabled");
  if (enabled.has_value()) base.enabled = enabled.value();
  detail::ReadU32(store, "max_workers", &base.max_workers);
  detail::ReadU32(store, "min_workers", &base.min_workers);
  detail::ReadU32(store, "max_tasks_per_worker", &base.max_tasks_per_worker);
  detail::ReadU32(store, "idle_timeout_ms", &base.idle_timeout_ms);
  detail::ReadU32(store, "call_timeout_ms", &base.call_timeout_ms);
  detail::ReadU32(store, "queue_wait_timeout_ms", &base.queue_wait_timeout_ms);
  detail::ReadU32(store, "max_queue_depth", &base.max_queue_depth);
  detail::ReadU32(store, "reap_interval_ms", &base.reap_interval_ms);
  detail::ReadU32(store, "spawn_timeout_ms", &base.spawn_timeout_ms);
  detail::ReadU32(store, "shutdown_grace_ms", &base.shutdown_grace_ms);
  detail::ReadU32(store, "max_frame_bytes", &base.max_frame_bytes);
  auto validate = store.FindBool("pool", "validate_input_exists");
  if (validate.has_value()) base.validate_input_exists = validate.value();
  return base;
}

/**
 * @brief Apply ISOPOOL_* environment overrides. Durations are in seconds.
 *
 * Every well-formed variable is applied even when another one is rejected;
 * kInvalidValue reports that at least one was ignored.
 */
inline expected<void, ConfigError> ApplyEnvOverrides(PoolConfig& cfg) {
  bool bad = false;
  const char* enabled = std::getenv("ISOPOOL_ENABLED");
  if (enabled != nullptr) cfg.enabled = ConfigStore::ParseBool(enabled);
  (void)detail::EnvU32("ISOPOOL_MAX_WORKERS", 1U, &cfg.max_workers, &bad);
  (void)detail::EnvU32("ISOPOOL_RECYCLE_AFTER_TASKS", 1U, &cfg.max_tasks_per_worker, &bad);
  (void)detail::EnvU32("ISOPOOL_IDLE_TIMEOUT_SECONDS", 1000U, &cfg.idle_timeout_ms, &bad);
  (void)detail::EnvU32("ISOPOOL_CALL_TIMEOUT_SECONDS", 1000U, &cfg.call_timeout_ms, &bad);
  (void)detail::EnvU32("ISOPOOL_QUEUE_WAIT_TIMEOUT_SECONDS", 1000U, &cfg.queue_wait_timeout_ms, &bad);
  if (bad) return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
  return expected<void, ConfigError>::success();
}

/**
 * @brief Reject settings the supervisor cannot run with.
 * @param reason If non-null, receives a static description of the problem.
 */
inline expected<void, ConfigError> ValidatePoolConfig(const PoolConfig& cfg,
                                                      const char** reason = nullptr) {
  const char* why = nullptr;
  if (cfg.max_workers == 0U) {
    why = "max_workers must be at least 1";
  } else if (cfg.min_workers > cfg.max_workers) {
    why = "min_workers exceeds max_workers";
  } else if (cfg.max_tasks_per_worker == 0U) {
    why = "max_tasks_per_worker must be at least 1";
  } else if (cfg.call_timeout_ms == 0U) {
    why = "call_timeout_ms must be positive";
  } else if (cfg.reap_interval_ms == 0U) {
    why = "reap_interval_ms must be positive";
  } else if (cfg.max_frame_bytes < 64U) {
    why = "max_frame_bytes is too small";
  }
  if (why != nullptr) {
    if (reason != nullptr) *reason = why;
    return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
  }
  return expected<void, ConfigError>::success();
}

}  // namespace isopool

#endif  // ISOPOOL_POOL_CONFIG_HPP_

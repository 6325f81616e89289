/**
 * @file config.hpp
 * @brief Multi-format configuration reader for pool settings.
 *
 * Every format is flattened into "section + key = value" entries held by a
 * ConfigStore. Format parsers are ConfigParser<Backend> specializations and
 * Config<Backends...> picks one at compile time by tag.
 *
 * Backends (CMake opt-in):
 *   - IniBackend  : inih           (ISOPOOL_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json  (ISOPOOL_CONFIG_JSON_ENABLED)
 *   - YamlBackend : fkYAML         (ISOPOOL_CONFIG_YAML_ENABLED)
 *
 * Usage:
 * @code
 *   isopool::PoolConfigFile cfg;
 *   if (cfg.LoadFile("pool.ini").has_value()) {
 *     int32_t workers = cfg.GetInt("pool", "max_workers", 12);
 *   }
 * @endcode
 */

#ifndef ISOPOOL_CONFIG_HPP_
#define ISOPOOL_CONFIG_HPP_

#include "isopool/platform.hpp"
#include "isopool/vocabulary.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

#ifdef ISOPOOL_CONFIG_INI_ENABLED
#include <ini.h>
#endif

#ifdef ISOPOOL_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef ISOPOOL_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

#ifndef ISOPOOL_CONFIG_MAX_FILE_SIZE
#define ISOPOOL_CONFIG_MAX_FILE_SIZE (64U * 1024U)
#endif

namespace isopool {

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

namespace detail {

inline bool EqualNoCase(const char* a, const char* b) noexcept {
  while (*a != '\0' && *b != '\0') {
    char la = (*a >= 'A' && *a <= 'Z') ? static_cast<char>(*a + 32) : *a;
    char lb = (*b >= 'A' && *b <= 'Z') ? static_cast<char>(*b + 32) : *b;
    if (la != lb) return false;
    ++a;
    ++b;
  }
  return *a == *b;
}

inline const char* FileExtension(const char* path) noexcept {
  const char* dot = nullptr;
  for (const char* p = path; *p != '\0'; ++p) {
    if (*p == '.') dot = p;
    if (*p == '/') dot = nullptr;
  }
  return (dot != nullptr) ? dot + 1 : nullptr;
}

}  // namespace detail

// ============================================================================
// Backend Tags
// ============================================================================

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::EqualNoCase(ext, "ini") || detail::EqualNoCase(ext, "conf");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const char* ext) noexcept { return detail::EqualNoCase(ext, "json"); }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::EqualNoCase(ext, "yaml") || detail::EqualNoCase(ext, "yml");
  }
};

// ============================================================================
// ConfigStore
// ============================================================================

/**
 * @brief Flat, case-insensitive section/key/value table with typed getters.
 *
 * Getters fall back to the default when the key is missing or its value
 * does not parse; Find* getters report "missing or unparsable" as nullopt.
 */
class ConfigStore {
 public:
  const char* GetString(const char* section, const char* key, const char* default_val = "") const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? e->value.c_str() : default_val;
  }

  int32_t GetInt(const char* section, const char* key, int32_t default_val = 0) const {
    return FindInt(section, key).value_or(default_val);
  }

  bool GetBool(const char* section, const char* key, bool default_val = false) const {
    return FindBool(section, key).value_or(default_val);
  }

  double GetDouble(const char* section, const char* key, double default_val = 0.0) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return default_val;
    char* end = nullptr;
    double val = std::strtod(e->value.c_str(), &end);
    return (end == e->value.c_str()) ? default_val : val;
  }

  std::optional<int32_t> FindInt(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return std::nullopt;
    char* end = nullptr;
    long val = std::strtol(e->value.c_str(), &end, 10);
    if (end == e->value.c_str()) return std::nullopt;
    return static_cast<int32_t>(val);
  }

  std::optional<bool> FindBool(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return std::nullopt;
    return ParseBool(e->value.c_str());
  }

  bool HasSection(const char* section) const {
    ISOPOOL_ASSERT(section != nullptr);
    for (const auto& e : entries_) {
      if (detail::EqualNoCase(e.section.c_str(), section)) return true;
    }
    return false;
  }

  bool HasKey(const char* section, const char* key) const { return FindEntry(section, key) != nullptr; }

  uint32_t EntryCount() const noexcept { return static_cast<uint32_t>(entries_.size()); }

  /** @brief Insert or overwrite one entry. Later sources override earlier ones. */
  void Set(const char* section, const char* key, const char* value) {
    for (auto& e : entries_) {
      if (detail::EqualNoCase(e.section.c_str(), section) && detail::EqualNoCase(e.key.c_str(), key)) {
        e.value = (value != nullptr) ? value : "";
        return;
      }
    }
    entries_.push_back(Entry{section, key, (value != nullptr) ? value : ""});
  }

  /**
   * @brief Case-insensitive boolean parse: true/1/yes/on are true,
   * everything else is false.
   */
  static bool ParseBool(const char* str) noexcept {
    if (str == nullptr) return false;
    return detail::EqualNoCase(str, "true") || detail::EqualNoCase(str, "1") ||
           detail::EqualNoCase(str, "yes") || detail::EqualNoCase(str, "on");
  }

 protected:
  struct Entry {
    std::string section;
    std::string key;
    std::string value;
  };

  static expected<std::string, ConfigError> ReadFile(const char* path) {
    FILE* f = std::fopen(path, "rb");
    if (f == nullptr) return expected<std::string, ConfigError>::error(ConfigError::kFileNotFound);
    std::string content;
    char chunk[4096];
    size_t n = 0;
    while ((n = std::fread(chunk, 1, sizeof(chunk), f)) > 0) {
      content.append(chunk, n);
      if (content.size() > ISOPOOL_CONFIG_MAX_FILE_SIZE) {
        (void)std::fclose(f);
        return expected<std::string, ConfigError>::error(ConfigError::kBufferFull);
      }
    }
    (void)std::fclose(f);
    return expected<std::string, ConfigError>::success(std::move(content));
  }

  const Entry* FindEntry(const char* section, const char* key) const {
    ISOPOOL_ASSERT(section != nullptr && key != nullptr);
    for (const auto& e : entries_) {
      if (detail::EqualNoCase(e.section.c_str(), section) && detail::EqualNoCase(e.key.c_str(), key)) {
        return &e;
      }
    }
    return nullptr;
  }

  std::vector<Entry> entries_;

  template <typename>
  friend struct ConfigParser;
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/** Backends compiled out report kFormatNotSupported. */
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> ParseFile(ConfigStore&, const char*) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
  static expected<void, ConfigError> ParseBuffer(ConfigStore&, const std::string&) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

#ifdef ISOPOOL_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store, const char* path) {
    int rc = ini_parse(path, OnEntry, &store);
    if (rc == -1) return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    if (rc != 0) return expected<void, ConfigError>::error(ConfigError::kParseError);
    return expected<void, ConfigError>::success();
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store, const std::string& text) {
    if (ini_parse_string(text.c_str(), OnEntry, &store) != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  // inih callback: nonzero means "keep going".
  static int OnEntry(void* user, const char* section, const char* name, const char* value) {
    static_cast<ConfigStore*>(user)->Set(section != nullptr ? section : "", name != nullptr ? name : "",
                                         value);
    return 1;
  }
};
#endif

#ifdef ISOPOOL_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store, const char* path) {
    auto text = ConfigStore::ReadFile(path);
    if (!text.has_value()) return expected<void, ConfigError>::error(text.get_error());
    return ParseBuffer(store, text.value());
  }

  /**
   * Top-level objects become sections; top-level scalars land in the ""
   * section. Deeper nesting is stored as its JSON dump.
   */
  static expected<void, ConfigError> ParseBuffer(ConfigStore& store, const std::string& text) {
    auto root = nlohmann::json::parse(text, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = root.begin(); it != root.end(); ++it) {
      if (it->is_object()) {
        for (auto kit = it->begin(); kit != it->end(); ++kit) {
          store.Set(it.key().c_str(), kit.key().c_str(), ToText(*kit).c_str());
        }
      } else {
        store.Set("", it.key().c_str(), ToText(*it).c_str());
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string ToText(const nlohmann::json& n) {
    if (n.is_string()) return n.get<std::string>();
    if (n.is_boolean()) return n.get<bool>() ? "true" : "false";
    if (n.is_number_integer()) return std::to_string(n.get<int64_t>());
    return n.dump();
  }
};
#endif

#ifdef ISOPOOL_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store, const char* path) {
    auto text = ConfigStore::ReadFile(path);
    if (!text.has_value()) return expected<void, ConfigError>::error(text.get_error());
    return ParseBuffer(store, text.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store, const std::string& text) {
#ifdef ISOPOOL_HAS_EXCEPTIONS
    try {
      return Walk(store, fkyaml::node::deserialize(text));
    } catch (const fkyaml::exception&) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
#else
    return Walk(store, fkyaml::node::deserialize(text));
#endif
  }

 private:
  static expected<void, ConfigError> Walk(ConfigStore& store, fkyaml::node root) {
    if (!root.is_mapping()) return expected<void, ConfigError>::error(ConfigError::kParseError);
    for (auto it = root.begin(); it != root.end(); ++it) {
      auto section = it.key().get_value<std::string>();
      auto& node = *it;
      if (node.is_mapping()) {
        for (auto kit = node.begin(); kit != node.end(); ++kit) {
          auto key = kit.key().get_value<std::string>();
          store.Set(section.c_str(), key.c_str(), ToText(*kit).c_str());
        }
      } else {
        store.Set("", section.c_str(), ToText(node).c_str());
      }
    }
    return expected<void, ConfigError>::success();
  }

  static std::string ToText(const fkyaml::node& n) {
    if (n.is_string()) return n.get_value<std::string>();
    if (n.is_boolean()) return n.get_value<bool>() ? "true" : "false";
    if (n.is_integer()) return std::to_string(n.get_value<int64_t>());
    if (n.is_float_number()) return std::to_string(n.get_value<double>());
    return std::string();
  }
};
#endif

// ============================================================================
// Config<Backends...>
// ============================================================================

template <typename... Backends>
class Config final : public ConfigStore {
  static_assert(sizeof...(Backends) > 0, "Config requires at least one backend");

 public:
  Config() = default;

  /** @brief Load a file; kAuto picks the backend from the extension. */
  expected<void, ConfigError> LoadFile(const char* path, ConfigFormat format = ConfigFormat::kAuto) {
    ISOPOOL_ASSERT(path != nullptr);
    if (format == ConfigFormat::kAuto) format = DetectFormat(path);
    return DispatchFile<Backends...>(path, format);
  }

  expected<void, ConfigError> LoadBuffer(const std::string& text, ConfigFormat format) {
    return DispatchBuffer<Backends...>(text, format);
  }

 private:
  using Head = typename std::tuple_element<0, std::tuple<Backends...>>::type;

  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchFile(const char* path, ConfigFormat format) {
    if (First::kFormat == format) return ConfigParser<First>::ParseFile(*this, path);
    if constexpr (sizeof...(Rest) > 0) return DispatchFile<Rest...>(path, format);
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchBuffer(const std::string& text, ConfigFormat format) {
    if (First::kFormat == format) return ConfigParser<First>::ParseBuffer(*this, text);
    if constexpr (sizeof...(Rest) > 0) return DispatchBuffer<Rest...>(text, format);
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  ConfigFormat DetectFormat(const char* path) const noexcept {
    const char* ext = detail::FileExtension(path);
    if (ext == nullptr) return Head::kFormat;
    return DetectExt<Backends...>(ext);
  }

  template <typename First, typename... Rest>
  ConfigFormat DetectExt(const char* ext) const noexcept {
    if (First::MatchesExtension(ext)) return First::kFormat;
    if constexpr (sizeof...(Rest) > 0) return DetectExt<Rest...>(ext);
    return Head::kFormat;
  }
};

// ============================================================================
// Aliases
// ============================================================================

/// Every backend enabled in this build; INI is always first when present.
using PoolConfigFile = Config<
#ifdef ISOPOOL_CONFIG_INI_ENABLED
    IniBackend
#endif
#if defined(ISOPOOL_CONFIG_INI_ENABLED) && \
    (defined(ISOPOOL_CONFIG_JSON_ENABLED) || defined(ISOPOOL_CONFIG_YAML_ENABLED))
    ,
#endif
#ifdef ISOPOOL_CONFIG_JSON_ENABLED
    JsonBackend
#endif
#if defined(ISOPOOL_CONFIG_JSON_ENABLED) && defined(ISOPOOL_CONFIG_YAML_ENABLED)
    ,
#endif
#ifdef ISOPOOL_CONFIG_YAML_ENABLED
    YamlBackend
#endif
    >;

}  // namespace isopool

#endif  // ISOPOOL_CONFIG_HPP_

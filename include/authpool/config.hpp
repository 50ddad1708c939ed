/**
 * @file config.hpp
 * @brief Pool configuration reader with template-based backend dispatch.
 *
 * Backends (tag types):
 *   - JsonBackend : nlohmann/json (always available)
 *   - IniBackend  : inih          (AUTHPOOL_CONFIG_INI_ENABLED)
 *
 * Every format is flattened to "section + key = value". Lookups are case
 * insensitive on section and key.
 *
 * Usage:
 * @code
 *   authpool::PoolConfigFile cfg;
 *   if (cfg.LoadFile("authpool.json").has_value()) {
 *     int32_t n = cfg.GetInt("pool", "worker_num", 4);
 *   }
 * @endcode
 */

#ifndef AUTHPOOL_CONFIG_HPP_
#define AUTHPOOL_CONFIG_HPP_

#include "authpool/platform.hpp"
#include "authpool/vocabulary.hpp"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <cstdlib>
#include <string>
#include <tuple>
#include <vector>

#ifdef AUTHPOOL_CONFIG_INI_ENABLED
#include <ini.h>
#endif

namespace authpool {

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
};

inline const char* ConfigErrorName(ConfigError e) noexcept {
  switch (e) {
    case ConfigError::kFileNotFound:       return "FileNotFound";
    case ConfigError::kParseError:         return "ParseError";
    case ConfigError::kFormatNotSupported: return "FormatNotSupported";
    case ConfigError::kBufferFull:         return "BufferFull";
  }
  return "Unknown";
}

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
};

namespace detail {

inline bool CaseEqual(const char* a, const char* b) noexcept {
  while (*a != '\0' && *b != '\0') {
    char la = (*a >= 'A' && *a <= 'Z') ? static_cast<char>(*a + 32) : *a;
    char lb = (*b >= 'A' && *b <= 'Z') ? static_cast<char>(*b + 32) : *b;
    if (la != lb) return false;
    ++a; ++b;
  }
  return *a == *b;
}

}  // namespace detail

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "ini") || detail::CaseEqual(ext, "conf");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "json");
  }
};

// ============================================================================
// ConfigStore
// ============================================================================

#ifndef AUTHPOOL_CONFIG_MAX_ENTRIES
#define AUTHPOOL_CONFIG_MAX_ENTRIES 256U
#endif

class ConfigStore {
 public:
  const char* GetString(const char* section, const char* key,
                        const char* default_val = "") const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? e->value.c_str() : default_val;
  }

  int32_t GetInt(const char* section, const char* key,
                 int32_t default_val = 0) const {
    optional<int32_t> v = FindInt(section, key);
    return v.has_value() ? v.value() : default_val;
  }

  bool GetBool(const char* section, const char* key,
               bool default_val = false) const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? ParseBool(e->value.c_str()) : default_val;
  }

  double GetDouble(const char* section, const char* key,
                   double default_val = 0.0) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return default_val;
    char* end = nullptr;
    double val = std::strtod(e->value.c_str(), &end);
    return (end == e->value.c_str()) ? default_val : val;
  }

  optional<int32_t> FindInt(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return optional<int32_t>();
    char* end = nullptr;
    long val = std::strtol(e->value.c_str(), &end, 10);
    if (end == e->value.c_str()) return optional<int32_t>();
    return optional<int32_t>(static_cast<int32_t>(val));
  }

  bool HasSection(const char* section) const {
    AUTHPOOL_ASSERT(section != nullptr);
    for (const Entry& e : entries_) {
      if (detail::CaseEqual(e.section.c_str(), section)) return true;
    }
    return false;
  }

  bool HasKey(const char* section, const char* key) const {
    return FindEntry(section, key) != nullptr;
  }

  uint32_t EntryCount() const noexcept {
    return static_cast<uint32_t>(entries_.size());
  }

  /** @brief Insert or overwrite one entry. */
  bool Set(const char* section, const char* key, const char* value) {
    return AddEntry(section, key, value);
  }

 protected:
  struct Entry {
    std::string section;
    std::string key;
    std::string value;
  };

  std::vector<Entry> entries_;

  bool AddEntry(const char* section, const char* key, const char* value) {
    for (Entry& e : entries_) {
      if (detail::CaseEqual(e.section.c_str(), section) &&
          detail::CaseEqual(e.key.c_str(), key)) {
        e.value = value;
        return true;
      }
    }
    if (entries_.size() >= AUTHPOOL_CONFIG_MAX_ENTRIES) return false;
    entries_.push_back(Entry{section, key, value});
    return true;
  }

  const Entry* FindEntry(const char* section, const char* key) const {
    AUTHPOOL_ASSERT(section != nullptr && key != nullptr);
    for (const Entry& e : entries_) {
      if (detail::CaseEqual(e.section.c_str(), section) &&
          detail::CaseEqual(e.key.c_str(), key)) {
        return &e;
      }
    }
    return nullptr;
  }

  static expected<std::string, ConfigError> ReadFile(const char* path) {
    FILE* f = std::fopen(path, "rb");
    if (f == nullptr) {
      return expected<std::string, ConfigError>::error(
          ConfigError::kFileNotFound);
    }
    std::string text;
    char chunk[1024];
    size_t n = 0U;
    while ((n = std::fread(chunk, 1U, sizeof(chunk), f)) > 0U) {
      text.append(chunk, n);
    }
    std::fclose(f);
    return expected<std::string, ConfigError>::success(std::move(text));
  }

  static bool ParseBool(const char* str) noexcept {
    return detail::CaseEqual(str, "true") || detail::CaseEqual(str, "1") ||
           detail::CaseEqual(str, "yes") || detail::CaseEqual(str, "on");
  }

  static const char* GetExtension(const char* path) noexcept {
    const char* dot = nullptr;
    for (const char* p = path; *p != '\0'; ++p) {
      if (*p == '.') dot = p;
      if (*p == '/') dot = nullptr;
    }
    return (dot != nullptr) ? dot + 1 : nullptr;
  }

  template <typename> friend struct ConfigParser;
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/** Backend compiled out: format not supported. */
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> ParseFile(ConfigStore&, const char*) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
  static expected<void, ConfigError> ParseBuffer(ConfigStore&,
                                                  const std::string&) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

#ifdef AUTHPOOL_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                                const char* path) {
    int result = ini_parse(path, Handler, &store);
    if (result == -1) {
      return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    }
    if (result != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                  const std::string& text) {
    if (ini_parse_string(text.c_str(), Handler, &store) != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static int Handler(void* user, const char* section, const char* name,
                     const char* value) {
    auto* s = static_cast<ConfigStore*>(user);
    return s->AddEntry(section ? section : "", name ? name : "",
                       value ? value : "") ? 1 : 0;
  }
};
#endif

template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                                const char* path) {
    auto text = ConfigStore::ReadFile(path);
    if (!text.has_value()) {
      return expected<void, ConfigError>::error(text.get_error());
    }
    return ParseBuffer(store, text.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                  const std::string& text) {
    nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }

    for (auto it = j.begin(); it != j.end(); ++it) {
      if (it->is_object()) {
        for (auto kit = it->begin(); kit != it->end(); ++kit) {
          if (!store.AddEntry(it.key().c_str(), kit.key().c_str(),
                              ToStr(*kit).c_str())) {
            return expected<void, ConfigError>::error(ConfigError::kBufferFull);
          }
        }
      } else if (!store.AddEntry("", it.key().c_str(), ToStr(*it).c_str())) {
        return expected<void, ConfigError>::error(ConfigError::kBufferFull);
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string ToStr(const nlohmann::json& n) {
    if (n.is_string()) return n.get<std::string>();
    if (n.is_boolean()) return n.get<bool>() ? "true" : "false";
    return n.dump();
  }
};

// ============================================================================
// Config<Backends...>
// ============================================================================

template <typename... Backends>
class Config final : public ConfigStore {
  static_assert(sizeof...(Backends) > 0, "Config requires at least one backend");

 public:
  Config() = default;

  expected<void, ConfigError> LoadFile(
      const char* path, ConfigFormat format = ConfigFormat::kAuto) {
    AUTHPOOL_ASSERT(path != nullptr);
    if (format == ConfigFormat::kAuto) format = DetectFormat(path);
    return DispatchFile<Backends...>(path, format);
  }

  expected<void, ConfigError> LoadBuffer(const std::string& text,
                                          ConfigFormat format) {
    return DispatchBuffer<Backends...>(text, format);
  }

 private:
  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchFile(const char* path,
                                            ConfigFormat format) {
    if (First::kFormat == format) {
      return ConfigParser<First>::ParseFile(*this, path);
    }
    if constexpr (sizeof...(Rest) > 0) {
      return DispatchFile<Rest...>(path, format);
    }
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchBuffer(const std::string& text,
                                              ConfigFormat format) {
    if (First::kFormat == format) {
      return ConfigParser<First>::ParseBuffer(*this, text);
    }
    if constexpr (sizeof...(Rest) > 0) {
      return DispatchBuffer<Rest...>(text, format);
    }
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  ConfigFormat DetectFormat(const char* path) const noexcept {
    const char* ext = GetExtension(path);
    if (ext == nullptr) return Head::kFormat;
    return DetectExt<Backends...>(ext);
  }

  template <typename First, typename... Rest>
  ConfigFormat DetectExt(const char* ext) const noexcept {
    if (First::MatchesExtension(ext)) return First::kFormat;
    if constexpr (sizeof...(Rest) > 0) return DetectExt<Rest...>(ext);
    return Head::kFormat;
  }

  using Head = typename std::tuple_element<0, std::tuple<Backends...>>::type;
};

#ifdef AUTHPOOL_CONFIG_INI_ENABLED
using PoolConfigFile = Config<JsonBackend, IniBackend>;
using IniConfig = Config<IniBackend>;
#else
using PoolConfigFile = Config<JsonBackend>;
#endif
using JsonConfig = Config<JsonBackend>;

}  // namespace authpool

#endif  // AUTHPOOL_CONFIG_HPP_

/**
 * @file config.hpp
 * @brief Multi-format configuration store with template-based backend dispatch.
 *
 * Every format is flattened to "section + key = value" entries held in a
 * fixed-size ConfigStore. Backends are selected at compile time:
 *   - IniBackend  : inih library   (MSCALE_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json  (MSCALE_CONFIG_JSON_ENABLED)
 *   - YamlBackend : fkYAML         (MSCALE_CONFIG_YAML_ENABLED)
 *
 * Usage:
 * @code
 *   mscale::MultiConfig cfg;
 *   auto r = cfg.LoadFile("/etc/mscale/discovery.ini");
 *   const char* ns = cfg.GetString("discovery", "namespace", "");
 * @endcode
 */

#ifndef MSCALE_CONFIG_HPP_
#define MSCALE_CONFIG_HPP_

#include "mscale/platform.hpp"
#include "mscale/vocabulary.hpp"

#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <tuple>

#ifdef MSCALE_CONFIG_INI_ENABLED
#include <ini.h>
#endif

#ifdef MSCALE_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef MSCALE_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

#if defined(MSCALE_CONFIG_JSON_ENABLED) || defined(MSCALE_CONFIG_YAML_ENABLED)
#include <string>
#endif

#ifndef MSCALE_CONFIG_MAX_FILE_SIZE
#define MSCALE_CONFIG_MAX_FILE_SIZE 8192U
#endif

namespace mscale {

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

// ============================================================================
// Backend Tags
// ============================================================================

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::AsciiCaseEqual(ext, "ini") ||
           detail::AsciiCaseEqual(ext, "conf");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::AsciiCaseEqual(ext, "json");
  }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::AsciiCaseEqual(ext, "yaml") ||
           detail::AsciiCaseEqual(ext, "yml");
  }
};

// ============================================================================
// ConfigStore
// ============================================================================

class ConfigStore {
 public:
  static constexpr uint32_t kMaxEntries = 64;
  static constexpr uint32_t kMaxKeyLen = 63;
  static constexpr uint32_t kMaxValueLen = 255;

  using Key = FixedString<kMaxKeyLen>;
  using Value = FixedString<kMaxValueLen>;

  const char* GetString(const char* section, const char* key,
                        const char* default_val = "") const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? e->value.c_str() : default_val;
  }

  /** Strict integer lookup: trailing garbage yields the default. */
  int32_t GetInt(const char* section, const char* key,
                 int32_t default_val = 0) const {
    return FindInt(section, key).value_or(default_val);
  }

  bool GetBool(const char* section, const char* key,
               bool default_val = false) const {
    return FindBool(section, key).value_or(default_val);
  }

  optional<const char*> FindString(const char* section,
                                   const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return {};
    return optional<const char*>(e->value.c_str());
  }

  optional<int32_t> FindInt(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return {};
    int32_t v = 0;
    if (!ParseInt32(e->value.c_str(), v)) return {};
    return optional<int32_t>(v);
  }

  optional<bool> FindBool(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return {};
    const char* s = e->value.c_str();
    if (detail::AsciiCaseEqual(s, "true") || detail::AsciiCaseEqual(s, "1") ||
        detail::AsciiCaseEqual(s, "yes") || detail::AsciiCaseEqual(s, "on")) {
      return optional<bool>(true);
    }
    if (detail::AsciiCaseEqual(s, "false") ||
        detail::AsciiCaseEqual(s, "0") || detail::AsciiCaseEqual(s, "no") ||
        detail::AsciiCaseEqual(s, "off")) {
      return optional<bool>(false);
    }
    return {};
  }

  bool HasSection(const char* section) const {
    MSCALE_ASSERT(section != nullptr);
    for (const Entry& e : entries_) {
      if (detail::AsciiCaseEqual(e.section.c_str(), section)) return true;
    }
    return false;
  }

  bool HasKey(const char* section, const char* key) const {
    return FindEntry(section, key) != nullptr;
  }

  uint32_t EntryCount() const noexcept { return entries_.size(); }

  /**
   * @brief Insert or overwrite one entry.
   * @return false when the store is full.
   */
  bool Set(const char* section, const char* key, const char* value) {
    MSCALE_ASSERT(section != nullptr && key != nullptr);
    for (Entry& e : entries_) {
      if (detail::AsciiCaseEqual(e.section.c_str(), section) &&
          detail::AsciiCaseEqual(e.key.c_str(), key)) {
        e.value.assign(TruncateToCapacity, value);
        return true;
      }
    }
    Entry e;
    e.section.assign(TruncateToCapacity, section);
    e.key.assign(TruncateToCapacity, key);
    e.value.assign(TruncateToCapacity, value);
    return entries_.push_back(e);
  }

  /**
   * @brief Base-10 int32 parse of the whole string (leading/trailing blanks
   * allowed, anything else rejected).
   */
  static bool ParseInt32(const char* str, int32_t& out) noexcept {
    if (str == nullptr) return false;
    errno = 0;
    char* end = nullptr;
    long val = std::strtol(str, &end, 10);
    if (end == str || errno == ERANGE) return false;
    while (*end == ' ' || *end == '\t') ++end;
    if (*end != '\0') return false;
    if (val < INT32_MIN || val > INT32_MAX) return false;
    out = static_cast<int32_t>(val);
    return true;
  }

 protected:
  struct Entry {
    Key section;
    Key key;
    Value value;
  };

  static expected<uint32_t, ConfigError> ReadFile(const char* path, char* buf,
                                                  uint32_t buf_size) {
    FILE* f = std::fopen(path, "r");
    if (f == nullptr) {
      return expected<uint32_t, ConfigError>::error(ConfigError::kFileNotFound);
    }
    size_t bytes = std::fread(buf, 1, buf_size - 1, f);
    bool truncated = (bytes == buf_size - 1) && (std::fgetc(f) != EOF);
    (void)std::fclose(f);
    if (truncated) {
      return expected<uint32_t, ConfigError>::error(ConfigError::kBufferFull);
    }
    buf[bytes] = '\0';
    return expected<uint32_t, ConfigError>::success(
        static_cast<uint32_t>(bytes));
  }

  static const char* GetExtension(const char* path) noexcept {
    const char* dot = std::strrchr(path, '.');
    const char* slash = std::strrchr(path, '/');
    if (dot == nullptr || (slash != nullptr && dot < slash)) return nullptr;
    return dot + 1;
  }

  const Entry* FindEntry(const char* section, const char* key) const {
    MSCALE_ASSERT(section != nullptr && key != nullptr);
    for (const Entry& e : entries_) {
      if (detail::AsciiCaseEqual(e.section.c_str(), section) &&
          detail::AsciiCaseEqual(e.key.c_str(), key)) {
        return &e;
      }
    }
    return nullptr;
  }

  FixedVector<Entry, kMaxEntries> entries_;

  template <typename>
  friend struct ConfigParser;
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/** Unsupported format (backend not compiled in). */
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> ParseFile(ConfigStore&, const char*) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
  static expected<void, ConfigError> ParseBuffer(ConfigStore&, const char*,
                                                 uint32_t) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

#ifdef MSCALE_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    int rc = ini_parse(path, Handler, &store);
    if (rc == -1) {
      return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    }
    return Check(rc);
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data, uint32_t) {
    return Check(ini_parse_string(data, Handler, &store));
  }

 private:
  static expected<void, ConfigError> Check(int rc) {
    if (rc == -2) {
      return expected<void, ConfigError>::error(ConfigError::kBufferFull);
    }
    if (rc != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

  static int Handler(void* user, const char* section, const char* name,
                     const char* value) {
    auto* store = static_cast<ConfigStore*>(user);
    return store->Set(section != nullptr ? section : "",
                      name != nullptr ? name : "",
                      value != nullptr ? value : "")
               ? 1
               : 0;
  }
};
#endif

#ifdef MSCALE_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    char buf[MSCALE_CONFIG_MAX_FILE_SIZE];
    auto r = ConfigStore::ReadFile(path, buf, sizeof(buf));
    if (!r.has_value()) {
      return expected<void, ConfigError>::error(r.get_error());
    }
    return ParseBuffer(store, buf, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data,
                                                 uint32_t size) {
    auto root = nlohmann::json::parse(data, data + size, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = root.begin(); it != root.end(); ++it) {
      if (it->is_object()) {
        for (auto kit = it->begin(); kit != it->end(); ++kit) {
          if (!store.Set(it.key().c_str(), kit.key().c_str(),
                         Scalar(*kit).c_str())) {
            return expected<void, ConfigError>::error(ConfigError::kBufferFull);
          }
        }
      } else if (!store.Set("", it.key().c_str(), Scalar(*it).c_str())) {
        return expected<void, ConfigError>::error(ConfigError::kBufferFull);
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string Scalar(const nlohmann::json& n) {
    if (n.is_string()) return n.get<std::string>();
    return n.dump();
  }
};
#endif

#ifdef MSCALE_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    char buf[MSCALE_CONFIG_MAX_FILE_SIZE];
    auto r = ConfigStore::ReadFile(path, buf, sizeof(buf));
    if (!r.has_value()) {
      return expected<void, ConfigError>::error(r.get_error());
    }
    return ParseBuffer(store, buf, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data,
                                                 uint32_t size) {
    auto root = fkyaml::node::deserialize(std::string(data, size));
    if (!root.is_mapping()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = root.begin(); it != root.end(); ++it) {
      auto section = it.key().get_value<std::string>();
      auto& node = *it;
      if (node.is_mapping()) {
        for (auto kit = node.begin(); kit != node.end(); ++kit) {
          auto key = kit.key().get_value<std::string>();
          if (!store.Set(section.c_str(), key.c_str(),
                         Scalar(*kit).c_str())) {
            return expected<void, ConfigError>::error(ConfigError::kBufferFull);
          }
        }
      } else if (!store.Set("", section.c_str(), Scalar(node).c_str())) {
        return expected<void, ConfigError>::error(ConfigError::kBufferFull);
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string Scalar(const fkyaml::node& n) {
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

  expected<void, ConfigError> LoadFile(
      const char* path, ConfigFormat format = ConfigFormat::kAuto) {
    MSCALE_ASSERT(path != nullptr);
    if (format == ConfigFormat::kAuto) format = DetectFormat(path);
    return DispatchFile<Backends...>(path, format);
  }

  expected<void, ConfigError> LoadBuffer(const char* data, uint32_t size,
                                         ConfigFormat format) {
    MSCALE_ASSERT(data != nullptr);
    return DispatchBuffer<Backends...>(data, size, format);
  }

 private:
  using Head = typename std::tuple_element<0, std::tuple<Backends...>>::type;

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
  expected<void, ConfigError> DispatchBuffer(const char* data, uint32_t size,
                                             ConfigFormat format) {
    if (First::kFormat == format) {
      return ConfigParser<First>::ParseBuffer(*this, data, size);
    }
    if constexpr (sizeof...(Rest) > 0) {
      return DispatchBuffer<Rest...>(data, size, format);
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
    if constexpr (sizeof...(Rest) > 0) {
      return DetectExt<Rest...>(ext);
    }
    return Head::kFormat;
  }
};

// ============================================================================
// Aliases
// ============================================================================

#ifdef MSCALE_CONFIG_INI_ENABLED
using IniConfig = Config<IniBackend>;
#endif
#ifdef MSCALE_CONFIG_JSON_ENABLED
using JsonConfig = Config<JsonBackend>;
#endif
#ifdef MSCALE_CONFIG_YAML_ENABLED
using YamlConfig = Config<YamlBackend>;
#endif

using MultiConfig = Config<
#ifdef MSCALE_CONFIG_INI_ENABLED
    IniBackend
#endif
#if defined(MSCALE_CONFIG_INI_ENABLED) && \
    (defined(MSCALE_CONFIG_JSON_ENABLED) || defined(MSCALE_CONFIG_YAML_ENABLED))
    ,
#endif
#ifdef MSCALE_CONFIG_JSON_ENABLED
    JsonBackend
#endif
#if defined(MSCALE_CONFIG_JSON_ENABLED) && defined(MSCALE_CONFIG_YAML_ENABLED)
    ,
#endif
#ifdef MSCALE_CONFIG_YAML_ENABLED
    YamlBackend
#endif
    >;

}  // namespace mscale

#endif  // MSCALE_CONFIG_HPP_

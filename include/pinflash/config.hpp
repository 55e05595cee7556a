/**
 * @file config.hpp
 * @brief Multi-format settings file reader with template-based backend
 *        dispatch.
 *
 * Backends (CMake opt-in):
 *   - IniBackend  : inih          (PINFLASH_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json (PINFLASH_CONFIG_JSON_ENABLED)
 *   - YamlBackend : fkYAML        (PINFLASH_CONFIG_YAML_ENABLED)
 *
 * Every format is flattened to "section + key = value". Top-level scalars
 * land in the "" section. Section and key lookups are case-insensitive.
 *
 * @code
 *   pinflash::MultiConfig cfg;
 *   if (cfg.LoadFile("pinflash.ini")) {
 *     uint32_t baud = cfg.GetUint32("serial", "baud", 921600);
 *   }
 * @endcode
 */

#ifndef PINFLASH_CONFIG_HPP_
#define PINFLASH_CONFIG_HPP_

#include "pinflash/platform.hpp"
#include "pinflash/vocabulary.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <map>
#include <string>
#include <tuple>
#include <utility>

#ifdef PINFLASH_CONFIG_INI_ENABLED
#include <ini.h>
#endif

#ifdef PINFLASH_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef PINFLASH_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

namespace pinflash {

// ============================================================================
// ConfigError / ConfigFormat
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound,
  kParseError,
  kFormatNotSupported,
};

inline const char* ConfigErrorName(ConfigError e) noexcept {
  switch (e) {
    case ConfigError::kFileNotFound:
      return "file not found";
    case ConfigError::kParseError:
      return "parse error";
    case ConfigError::kFormatNotSupported:
      return "format not supported";
  }
  return "unknown";
}

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

// ============================================================================
// Backend tag types
// ============================================================================

namespace detail {

inline std::string AsciiLower(const char* s) {
  std::string out;
  for (; *s != '\0'; ++s) {
    out.push_back((*s >= 'A' && *s <= 'Z') ? static_cast<char>(*s + 32) : *s);
  }
  return out;
}

inline bool ExtCaseEqual(const char* a, const char* b) {
  return AsciiLower(a) == AsciiLower(b);
}

}  // namespace detail

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const char* ext) {
    return detail::ExtCaseEqual(ext, "ini") ||
           detail::ExtCaseEqual(ext, "cfg") ||
           detail::ExtCaseEqual(ext, "conf");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const char* ext) {
    return detail::ExtCaseEqual(ext, "json");
  }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const char* ext) {
    return detail::ExtCaseEqual(ext, "yaml") ||
           detail::ExtCaseEqual(ext, "yml");
  }
};

// ============================================================================
// ConfigStore
// ============================================================================

class ConfigStore {
 public:
  std::string GetString(const char* section, const char* key,
                        const std::string& default_val = std::string()) const {
    const std::string* v = FindValue(section, key);
    return (v != nullptr) ? *v : default_val;
  }

  uint32_t GetUint32(const char* section, const char* key,
                     uint32_t default_val = 0U) const {
    auto v = FindUint32(section, key);
    return v.has_value() ? *v : default_val;
  }

  bool GetBool(const char* section, const char* key,
               bool default_val = false) const {
    const std::string* v = FindValue(section, key);
    return (v != nullptr) ? ParseBool(*v) : default_val;
  }

  /// @brief Unsigned decimal value; empty if absent or malformed.
  optional<uint32_t> FindUint32(const char* section, const char* key) const {
    const std::string* v = FindValue(section, key);
    if (v == nullptr || v->empty()) return {};
    char* end = nullptr;
    const unsigned long long val = std::strtoull(v->c_str(), &end, 10);
    if (*end != '\0' || (*v)[0] == '-' || val > 0xFFFFFFFFULL) return {};
    return static_cast<uint32_t>(val);
  }

  bool HasSection(const char* section) const {
    PINFLASH_ASSERT(section != nullptr);
    const std::string prefix = detail::AsciiLower(section) + '\n';
    auto it = entries_.lower_bound(prefix);
    return it != entries_.end() && it->first.compare(0, prefix.size(),
                                                     prefix) == 0;
  }

  bool HasKey(const char* section, const char* key) const {
    return FindValue(section, key) != nullptr;
  }

  uint32_t EntryCount() const noexcept {
    return static_cast<uint32_t>(entries_.size());
  }

  /// @brief Insert or overwrite one value.
  void Set(const char* section, const char* key, const std::string& value) {
    entries_[MakeKey(section, key)] = value;
  }

 protected:
  static std::string MakeKey(const char* section, const char* key) {
    return detail::AsciiLower(section) + '\n' + detail::AsciiLower(key);
  }

  const std::string* FindValue(const char* section, const char* key) const {
    PINFLASH_ASSERT(section != nullptr && key != nullptr);
    auto it = entries_.find(MakeKey(section, key));
    return (it != entries_.end()) ? &it->second : nullptr;
  }

  static bool ParseBool(const std::string& s) {
    const std::string v = detail::AsciiLower(s.c_str());
    return v == "true" || v == "1" || v == "yes" || v == "on";
  }

  static expected<std::string, ConfigError> ReadFile(const char* path) {
    std::FILE* f = std::fopen(path, "rb");
    if (f == nullptr) {
      return expected<std::string, ConfigError>::error(
          ConfigError::kFileNotFound);
    }
    std::string data;
    char buf[4096];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) data.append(buf, n);
    std::fclose(f);
    return expected<std::string, ConfigError>::success(std::move(data));
  }

  static const char* GetExtension(const char* path) noexcept {
    const char* dot = nullptr;
    for (const char* p = path; *p != '\0'; ++p) {
      if (*p == '.') dot = p;
      if (*p == '/') dot = nullptr;
    }
    return (dot != nullptr) ? dot + 1 : nullptr;
  }

  std::map<std::string, std::string> entries_;

  template <typename>
  friend struct ConfigParser;
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/// Format not compiled in.
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

// --- INI ---

#ifdef PINFLASH_CONFIG_INI_ENABLED
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
                                                 const std::string& data) {
    if (ini_parse_string(data.c_str(), Handler, &store) != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static int Handler(void* user, const char* section, const char* name,
                     const char* value) {
    auto* s = static_cast<ConfigStore*>(user);
    s->Set(section ? section : "", name ? name : "", value ? value : "");
    return 1;
  }
};
#endif

// --- JSON ---

#ifdef PINFLASH_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    auto r = ConfigStore::ReadFile(path);
    if (!r.has_value()) {
      return expected<void, ConfigError>::error(r.get_error());
    }
    return ParseBuffer(store, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const std::string& data) {
    auto j = nlohmann::json::parse(data, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
      if (it->is_object()) {
        for (auto kit = it->begin(); kit != it->end(); ++kit) {
          store.Set(it.key().c_str(), kit.key().c_str(), ToStr(*kit));
        }
      } else {
        store.Set("", it.key().c_str(), ToStr(*it));
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string ToStr(const nlohmann::json& n) {
    if (n.is_string()) return n.get<std::string>();
    if (n.is_boolean()) return n.get<bool>() ? "true" : "false";
    if (n.is_number_unsigned()) return std::to_string(n.get<uint64_t>());
    if (n.is_number_integer()) return std::to_string(n.get<int64_t>());
    return n.dump();
  }
};
#endif

// --- YAML ---

#ifdef PINFLASH_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    auto r = ConfigStore::ReadFile(path);
    if (!r.has_value()) {
      return expected<void, ConfigError>::error(r.get_error());
    }
    return ParseBuffer(store, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const std::string& data) {
    auto root = fkyaml::node::deserialize(data);
    if (root.is_null() || !root.is_mapping()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = root.begin(); it != root.end(); ++it) {
      auto sec = it.key().get_value<std::string>();
      auto& node = *it;
      if (node.is_mapping()) {
        for (auto kit = node.begin(); kit != node.end(); ++kit) {
          auto key = kit.key().get_value<std::string>();
          store.Set(sec.c_str(), key.c_str(), ToStr(*kit));
        }
      } else {
        store.Set("", sec.c_str(), ToStr(node));
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string ToStr(const fkyaml::node& n) {
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
 public:
  Config() = default;

  expected<void, ConfigError> LoadFile(
      const char* path, ConfigFormat format = ConfigFormat::kAuto) {
    PINFLASH_ASSERT(path != nullptr);
    if (format == ConfigFormat::kAuto) format = DetectFormat(path);
    return DispatchFile<Backends...>(path, format);
  }

  expected<void, ConfigError> LoadBuffer(const std::string& data,
                                         ConfigFormat format) {
    return DispatchBuffer<Backends...>(data, format);
  }

  /// @brief Format LoadFile() would use for @p path.
  ConfigFormat DetectFormat(const char* path) const {
    if constexpr (sizeof...(Backends) == 0) {
      return ConfigFormat::kAuto;
    } else {
      const char* ext = GetExtension(path);
      if (ext == nullptr) return Head<Backends...>::kFormat;
      return DetectExt<Backends...>(ext);
    }
  }

 private:
  template <typename... Ts>
  struct First {
    using type = typename std::tuple_element<0, std::tuple<Ts...>>::type;
  };
  template <typename... Ts>
  using Head = typename First<Ts..., IniBackend>::type;

  template <typename... Ts>
  expected<void, ConfigError> DispatchFile(const char* path,
                                           ConfigFormat format) {
    if constexpr (sizeof...(Ts) == 0) {
      (void)path;
      (void)format;
      return expected<void, ConfigError>::error(
          ConfigError::kFormatNotSupported);
    } else {
      return DispatchFileImpl<Ts...>(path, format);
    }
  }

  template <typename F, typename... Rest>
  expected<void, ConfigError> DispatchFileImpl(const char* path,
                                               ConfigFormat format) {
    if (F::kFormat == format) return ConfigParser<F>::ParseFile(*this, path);
    return DispatchFile<Rest...>(path, format);
  }

  template <typename... Ts>
  expected<void, ConfigError> DispatchBuffer(const std::string& data,
                                             ConfigFormat format) {
    if constexpr (sizeof...(Ts) == 0) {
      (void)data;
      (void)format;
      return expected<void, ConfigError>::error(
          ConfigError::kFormatNotSupported);
    } else {
      return DispatchBufferImpl<Ts...>(data, format);
    }
  }

  template <typename F, typename... Rest>
  expected<void, ConfigError> DispatchBufferImpl(const std::string& data,
                                                 ConfigFormat format) {
    if (F::kFormat == format) return ConfigParser<F>::ParseBuffer(*this, data);
    return DispatchBuffer<Rest...>(data, format);
  }

  template <typename F, typename... Rest>
  ConfigFormat DetectExt(const char* ext) const {
    if (F::MatchesExtension(ext)) return F::kFormat;
    if constexpr (sizeof...(Rest) > 0) {
      return DetectExt<Rest...>(ext);
    } else {
      return Head<Backends...>::kFormat;
    }
  }
};

// ============================================================================
// Aliases
// ============================================================================

using MultiConfig = Config<
#ifdef PINFLASH_CONFIG_INI_ENABLED
    IniBackend
#endif
#if defined(PINFLASH_CONFIG_INI_ENABLED) && \
    (defined(PINFLASH_CONFIG_JSON_ENABLED) ||  \
     defined(PINFLASH_CONFIG_YAML_ENABLED))
    ,
#endif
#ifdef PINFLASH_CONFIG_JSON_ENABLED
    JsonBackend
#endif
#if defined(PINFLASH_CONFIG_JSON_ENABLED) && \
    defined(PINFLASH_CONFIG_YAML_ENABLED)
    ,
#endif
#ifdef PINFLASH_CONFIG_YAML_ENABLED
    YamlBackend
#endif
    >;

}  // namespace pinflash

#endif  // PINFLASH_CONFIG_HPP_

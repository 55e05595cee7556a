/**
 * @file settings.hpp
 * @brief Typed tool settings loaded from an INI / JSON / YAML file.
 *
 * | section.key              | default                        |
 * |--------------------------|--------------------------------|
 * | firmware.dir             | $HOME/.fast/firmware           |
 * | firmware.archive_url     | fast-firmware main.zip         |
 * | firmware.download_tool   | curl                           |
 * | firmware.extract_tool    | unzip                          |
 * | serial.baud              | 921600                         |
 * | serial.probe_timeout_ms  | 5                              |
 * | serial.net_timeout_ms    | 200                            |
 * | log.level                | info                           |
 */

#ifndef PINFLASH_SETTINGS_HPP_
#define PINFLASH_SETTINGS_HPP_

#include "pinflash/config.hpp"
#include "pinflash/firmware_fetcher.hpp"
#include "pinflash/log.hpp"
#include "pinflash/process.hpp"
#include "pinflash/protocol.hpp"
#include "pinflash/vocabulary.hpp"

#include <cstdint>
#include <cstdlib>
#include <string>

namespace pinflash {

struct Settings {
  std::string firmware_dir;
  FetchConfig fetch;
  uint32_t baud_rate = kBusBaudRate;
  uint32_t probe_timeout_ms = kProbeReadTimeoutMs;
  uint32_t net_timeout_ms = kNetReadTimeoutMs;
  log::Level log_level = log::Level::kInfo;
};

/// @brief $HOME, or "" when unset.
inline std::string HomeDir() {
  const char* home = std::getenv("HOME");
  return (home != nullptr) ? std::string(home) : std::string();
}

/// @brief "$HOME/.fast" (the tool's data directory).
inline std::string DataDir() { return HomeDir() + "/.fast"; }

inline std::string DefaultFirmwareDir() { return DataDir() + "/firmware"; }

inline std::string DefaultSettingsPath() { return DataDir() + "/pinflash.ini"; }

/// @brief Settings with every default applied.
inline Settings DefaultSettings() {
  Settings s;
  s.firmware_dir = DefaultFirmwareDir();
  return s;
}

/**
 * @brief Overlay values found in @p store onto @p base.
 *
 * Malformed numbers and unknown log level names keep the base value and are
 * reported with a warning.
 */
inline Settings ApplySettings(const ConfigStore& store, Settings base) {
  base.firmware_dir =
      store.GetString("firmware", "dir", base.firmware_dir);
  base.fetch.archive_url =
      store.GetString("firmware", "archive_url", base.fetch.archive_url);
  base.fetch.download_tool =
      store.GetString("firmware", "download_tool", base.fetch.download_tool);
  base.fetch.extract_tool =
      store.GetString("firmware", "extract_tool", base.fetch.extract_tool);

  struct NumKey {
    const char* key;
    uint32_t* out;
  };
  const NumKey nums[] = {
      {"baud", &base.baud_rate},
      {"probe_timeout_ms", &base.probe_timeout_ms},
      {"net_timeout_ms", &base.net_timeout_ms},
  };
  for (const NumKey& n : nums) {
    if (!store.HasKey("serial", n.key)) continue;
    auto v = store.FindUint32("serial", n.key);
    if (v.has_value()) {
      *n.out = *v;
    } else {
      PINFLASH_LOG_WARN("SETTINGS", "serial.%s: not an unsigned number",
                        n.key);
    }
  }

  if (store.HasKey("log", "level")) {
    const std::string name = store.GetString("log", "level");
    if (!log::ParseLevel(name.c_str(), base.log_level)) {
      PINFLASH_LOG_WARN("SETTINGS", "log.level: unknown level '%s'",
                        name.c_str());
    }
  }
  return base;
}

/**
 * @brief Load settings from @p path over the defaults.
 *
 * @param required When false a missing file yields the defaults; when true
 *        it is an error.
 */
inline expected<Settings, ConfigError> LoadSettings(const std::string& path,
                                                    bool required) {
  using R = expected<Settings, ConfigError>;
  if (!required && !IsRegularFile(path)) {
    return R::success(DefaultSettings());
  }
  MultiConfig cfg;
  auto r = cfg.LoadFile(path.c_str());
  if (!r) {
    PINFLASH_LOG_ERROR("SETTINGS", "%s: %s", path.c_str(),
                       ConfigErrorName(r.get_error()));
    return R::error(r.get_error());
  }
  PINFLASH_LOG_DEBUG("SETTINGS", "loaded %u entries from %s",
                     cfg.EntryCount(), path.c_str());
  return R::success(ApplySettings(cfg, DefaultSettings()));
}

}  // namespace pinflash

#endif  // PINFLASH_SETTINGS_HPP_

/**
 * @file firmware_catalog.hpp
 * @brief On-disk firmware catalog keyed by "{BoardType}_{Protocol}".
 *
 * Layout: {base}/{family}/{BoardType}_{Protocol}_firmware_v_{major}_{minor}.txt
 *
 * The catalog is scanned once on first Load() and then served from memory.
 * If the base directory is missing or empty the fetcher (when set) is asked
 * once to populate it; a failed fetch leaves an empty catalog.
 */

#ifndef PINFLASH_FIRMWARE_CATALOG_HPP_
#define PINFLASH_FIRMWARE_CATALOG_HPP_

#include "pinflash/firmware_fetcher.hpp"
#include "pinflash/log.hpp"
#include "pinflash/process.hpp"
#include "pinflash/version.hpp"
#include "pinflash/vocabulary.hpp"

#include <climits>
#include <cstdint>
#include <cstdlib>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace pinflash {

static constexpr const char kFirmwareStemMarker[] = "_firmware_v_";

/// Parsed firmware file name.
struct FirmwareFileName {
  std::string board_type;
  std::string protocol;
  FirmwareVersion version;

  std::string Key() const { return board_type + "_" + protocol; }
};

/**
 * @brief Parse "{BoardType}_{Protocol}_firmware_v_{major}_{minor}.txt".
 *
 * The board type is everything before the last '_' ahead of the marker, so
 * "FP-EXP-0091_EXP_firmware_v_0_48.txt" gives ("FP-EXP-0091", "EXP", 0.48).
 * The ".txt" suffix is matched case-insensitively.
 */
inline optional<FirmwareFileName> ParseFirmwareFileName(
    const std::string& name) {
  if (!detail::HasTxtExtension(name)) return {};
  const std::string stem = name.substr(0, name.size() - 4U);

  const size_t marker = stem.find(kFirmwareStemMarker);
  if (marker == std::string::npos) return {};
  const std::string prefix = stem.substr(0, marker);
  const std::string ver =
      stem.substr(marker + sizeof(kFirmwareStemMarker) - 1U);

  const size_t sep = prefix.rfind('_');
  if (sep == std::string::npos || sep == 0U || sep + 1U == prefix.size()) {
    return {};
  }
  const size_t us = ver.find('_');
  if (us == std::string::npos) return {};

  FirmwareFileName out;
  out.board_type = prefix.substr(0, sep);
  out.protocol = prefix.substr(sep + 1U);
  if (!ParseUnsigned(ver.substr(0, us), out.version.major) ||
      !ParseUnsigned(ver.substr(us + 1U), out.version.minor)) {
    return {};
  }
  return out;
}

namespace detail {

/// "1.05, 2.00" or "none", for log lines.
inline std::string JoinVersions(const std::vector<std::string>& versions) {
  std::string out;
  for (const std::string& v : versions) {
    if (!out.empty()) out += ", ";
    out += v;
  }
  return out.empty() ? std::string("none") : out;
}

}  // namespace detail

// ============================================================================
// FirmwareCatalog
// ============================================================================

class FirmwareCatalog {
 public:
  /// version -> absolute file path, in numeric version order.
  using VersionMap = std::map<FirmwareVersion, std::string>;
  using Snapshot = std::map<std::string, VersionMap>;

  /**
   * @param base_dir Catalog root.
   * @param fetcher Download collaborator used when the root is missing or
   *        empty; nullptr disables downloading. Not owned.
   */
  explicit FirmwareCatalog(std::string base_dir,
                           FirmwareFetcher* fetcher = nullptr)
      : base_dir_(std::move(base_dir)), fetcher_(fetcher) {}

  FirmwareCatalog(const FirmwareCatalog&) = delete;
  FirmwareCatalog& operator=(const FirmwareCatalog&) = delete;

  /// @brief Scan on first call; later calls return the same snapshot.
  const Snapshot& Load() {
    if (loaded_) return entries_;
    loaded_ = true;

    if (ListDir(base_dir_).empty()) {
      if (fetcher_ != nullptr) {
        PINFLASH_LOG_INFO("CATALOG", "%s is empty, downloading firmware",
                          base_dir_.c_str());
        auto r = fetcher_->Fetch(base_dir_);
        if (!r) {
          PINFLASH_LOG_WARN("CATALOG", "firmware download failed: %s",
                            FetchErrorName(r.get_error()));
        }
      } else {
        PINFLASH_LOG_WARN("CATALOG", "%s is missing or empty",
                          base_dir_.c_str());
      }
    }

    const std::string root = AbsolutePath(base_dir_);
    uint32_t files = 0;
    for (const std::string& family : ListDir(root)) {
      const std::string dir = root + "/" + family;
      if (!IsDirectory(dir)) continue;
      for (const std::string& name : ListDir(dir)) {
        const std::string path = dir + "/" + name;
        if (!IsRegularFile(path)) continue;
        auto parsed = ParseFirmwareFileName(name);
        if (!parsed.has_value()) continue;
        if (entries_[parsed->Key()].emplace(parsed->version, path).second) {
          ++files;
        } else {
          PINFLASH_LOG_DEBUG("CATALOG", "duplicate %s ignored", path.c_str());
        }
      }
    }
    PINFLASH_LOG_DEBUG("CATALOG", "%u firmware files under %zu keys", files,
                       entries_.size());
    return entries_;
  }

  /// @brief Path for @p key at @p version (normalized before lookup).
  optional<std::string> Find(const std::string& key,
                             const std::string& version) {
    auto v = FirmwareVersion::Parse(version);
    if (!v.has_value()) return {};
    const Snapshot& snap = Load();
    auto it = snap.find(key);
    if (it == snap.end()) return {};
    auto vit = it->second.find(*v);
    if (vit == it->second.end()) return {};
    return vit->second;
  }

  /// @brief Canonical version strings for @p key, ascending.
  std::vector<std::string> Versions(const std::string& key) {
    std::vector<std::string> out;
    const Snapshot& snap = Load();
    auto it = snap.find(key);
    if (it == snap.end()) return out;
    for (const auto& kv : it->second) out.push_back(kv.first.ToString());
    return out;
  }

  /// @brief Canonical version -> path map for @p key.
  std::map<std::string, std::string> Entry(const std::string& key) {
    std::map<std::string, std::string> out;
    const Snapshot& snap = Load();
    auto it = snap.find(key);
    if (it == snap.end()) return out;
    for (const auto& kv : it->second) {
      out.emplace(kv.first.ToString(), kv.second);
    }
    return out;
  }

  bool HasKey(const std::string& key) { return Load().count(key) != 0U; }

  size_t KeyCount() { return Load().size(); }

  const std::string& base_dir() const noexcept { return base_dir_; }
  bool loaded() const noexcept { return loaded_; }

 private:
  static std::string AbsolutePath(const std::string& path) {
    char resolved[PATH_MAX];
    if (::realpath(path.c_str(), resolved) == nullptr) return path;
    return std::string(resolved);
  }

  std::string base_dir_;
  FirmwareFetcher* fetcher_;
  bool loaded_ = false;
  Snapshot entries_;
};

}  // namespace pinflash

#endif  // PINFLASH_FIRMWARE_CATALOG_HPP_

/**
 * @file firmware_fetcher.hpp
 * @brief Download collaborator: fetch the FAST firmware archive and unpack
 *        its firmware files into the catalog directory.
 *
 * ArchiveFetcher spawns external tools (curl, unzip by default) via
 * RunCommand. The archive's top-level folder is stripped so files land as
 * {target}/{family}/{file}.txt.
 */

#ifndef PINFLASH_FIRMWARE_FETCHER_HPP_
#define PINFLASH_FIRMWARE_FETCHER_HPP_

#include "pinflash/log.hpp"
#include "pinflash/process.hpp"
#include "pinflash/vocabulary.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

namespace pinflash {

static constexpr const char kDefaultArchiveUrl[] =
    "https://github.com/fastpinball/fast-firmware/archive/refs/heads/main.zip";

enum class FetchError : uint8_t {
  kTargetDirFailed,
  kStagingFailed,
  kDownloadFailed,
  kExtractFailed,
  kInstallFailed,
};

inline const char* FetchErrorName(FetchError e) noexcept {
  switch (e) {
    case FetchError::kTargetDirFailed:
      return "cannot create firmware directory";
    case FetchError::kStagingFailed:
      return "cannot create staging directory";
    case FetchError::kDownloadFailed:
      return "download failed";
    case FetchError::kExtractFailed:
      return "extract failed";
    case FetchError::kInstallFailed:
      return "install failed";
  }
  return "unknown";
}

// ============================================================================
// FirmwareFetcher
// ============================================================================

class FirmwareFetcher {
 public:
  virtual ~FirmwareFetcher() = default;

  /**
   * @brief Populate @p target_dir with firmware files.
   * @return Number of firmware files installed.
   */
  virtual expected<uint32_t, FetchError> Fetch(
      const std::string& target_dir) = 0;
};

// ============================================================================
// ArchiveFetcher
// ============================================================================

struct FetchConfig {
  std::string archive_url = kDefaultArchiveUrl;
  std::string download_tool = "curl";
  std::string extract_tool = "unzip";
};

namespace detail {

inline bool HasTxtExtension(const std::string& name) {
  if (name.size() < 4U) return false;
  const char* ext = name.c_str() + name.size() - 4U;
  return ext[0] == '.' && (ext[1] == 't' || ext[1] == 'T') &&
         (ext[2] == 'x' || ext[2] == 'X') && (ext[3] == 't' || ext[3] == 'T');
}

/// Move every *.txt below @p src into @p dst, keeping relative paths.
inline bool InstallTree(const std::string& src, const std::string& dst,
                        uint32_t& count) {
  for (const std::string& name : ListDir(src)) {
    const std::string from = src + "/" + name;
    const std::string to = dst + "/" + name;
    if (IsDirectory(from)) {
      if (!MakeDirs(to) || !InstallTree(from, to, count)) return false;
    } else if (HasTxtExtension(name) && IsRegularFile(from)) {
      if (!MoveFile(from, to)) {
        PINFLASH_LOG_ERROR("FETCH", "cannot install %s: %s", to.c_str(),
                           std::strerror(errno));
        return false;
      }
      ++count;
    }
  }
  return true;
}

}  // namespace detail

/**
 * @brief Fetches the firmware repository archive with external tools.
 *
 * Steps: curl -fsSL -o {staging}/firmware.zip {url};
 * unzip -q -o {zip} *.txt -d {staging}/x; move {staging}/x/{top}/... into
 * the target directory. The staging directory is removed on every path.
 */
class ArchiveFetcher final : public FirmwareFetcher {
 public:
  explicit ArchiveFetcher(FetchConfig cfg = FetchConfig())
      : cfg_(std::move(cfg)) {}

  expected<uint32_t, FetchError> Fetch(
      const std::string& target_dir) override {
    using R = expected<uint32_t, FetchError>;
    if (!MakeDirs(target_dir)) {
      PINFLASH_LOG_ERROR("FETCH", "cannot create %s", target_dir.c_str());
      return R::error(FetchError::kTargetDirFailed);
    }

    char tmpl[] = "/tmp/pinflash-fetch-XXXXXX";
    if (::mkdtemp(tmpl) == nullptr) {
      PINFLASH_LOG_ERROR("FETCH", "mkdtemp: %s", std::strerror(errno));
      return R::error(FetchError::kStagingFailed);
    }
    const std::string staging(tmpl);
    PINFLASH_SCOPE_EXIT(RemoveTree(staging));

    const std::string archive = staging + "/firmware.zip";
    const std::string unpack = staging + "/x";

    PINFLASH_LOG_INFO("FETCH", "downloading %s", cfg_.archive_url.c_str());
    const char* dl_argv[] = {cfg_.download_tool.c_str(), "-fsSL", "-o",
                             archive.c_str(), cfg_.archive_url.c_str(),
                             nullptr};
    if (!Run(dl_argv)) return R::error(FetchError::kDownloadFailed);

    const char* ex_argv[] = {cfg_.extract_tool.c_str(), "-q", "-o",
                             archive.c_str(), "*.txt", "-d", unpack.c_str(),
                             nullptr};
    if (!Run(ex_argv)) return R::error(FetchError::kExtractFailed);

    uint32_t count = 0;
    for (const std::string& top : ListDir(unpack)) {
      const std::string root = unpack + "/" + top;
      if (!IsDirectory(root)) continue;
      if (!detail::InstallTree(root, target_dir, count)) {
        return R::error(FetchError::kInstallFailed);
      }
    }
    PINFLASH_LOG_INFO("FETCH", "installed %u firmware files into %s", count,
                      target_dir.c_str());
    return R::success(count);
  }

  const FetchConfig& config() const noexcept { return cfg_; }

 private:
  bool Run(const char* const* argv) {
    std::string output;
    int exit_code = -1;
    ProcessResult r = RunCommand(argv, output, exit_code);
    if (r != ProcessResult::kSuccess) {
      PINFLASH_LOG_ERROR("FETCH", "%s: cannot run", argv[0]);
      return false;
    }
    if (exit_code != 0) {
      while (!output.empty() &&
             (output.back() == '\n' || output.back() == '\r')) {
        output.pop_back();
      }
      PINFLASH_LOG_ERROR("FETCH", "%s exited with %d: %s", argv[0], exit_code,
                         output.c_str());
      return false;
    }
    return true;
  }

  FetchConfig cfg_;
};

}  // namespace pinflash

#endif  // PINFLASH_FIRMWARE_FETCHER_HPP_

/**
 * @file test_firmware_fetcher.cpp
 * @brief Tests for firmware_fetcher.hpp with scripted download and extract
 *        tools.
 */

#include "pinflash/firmware_fetcher.hpp"

#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

#include <sys/stat.h>

using pinflash::ArchiveFetcher;
using pinflash::FetchConfig;
using pinflash::FetchError;
using pinflash_test::TempDir;
using pinflash_test::WriteFile;

namespace {

/// Extract tool stand-in: unpacks a fixed tree into the "-d" directory
/// ($6 with the argument order ArchiveFetcher uses).
std::string WriteFakeExtractor(const TempDir& dir) {
  const std::string path = dir.Sub("fake-unzip.sh");
  const std::string script =
      "#!/bin/sh\n"
      "root=\"$6/fast-firmware-main\"\n"
      "mkdir -p \"$root/EXP\" \"$root/NET\"\n"
      "echo a > \"$root/EXP/FP-EXP-0071_EXP_firmware_v_0_48.txt\"\n"
      "echo b > \"$root/NET/FP-CPU-2000_NET_firmware_v_2_28.txt\"\n"
      "echo c > \"$root/README.md\"\n";
  REQUIRE(WriteFile(path, script));
  REQUIRE(::chmod(path.c_str(), 0755) == 0);
  return path;
}

}  // namespace

TEST_CASE("HasTxtExtension is case-insensitive", "[fetch]") {
  REQUIRE(pinflash::detail::HasTxtExtension("a.txt"));
  REQUIRE(pinflash::detail::HasTxtExtension("a.TXT"));
  REQUIRE_FALSE(pinflash::detail::HasTxtExtension("a.md"));
  REQUIRE_FALSE(pinflash::detail::HasTxtExtension("txt"));
}

TEST_CASE("FetchConfig defaults", "[fetch]") {
  ArchiveFetcher fetcher;
  REQUIRE(fetcher.config().archive_url ==
          std::string(pinflash::kDefaultArchiveUrl));
  REQUIRE(fetcher.config().download_tool == "curl");
  REQUIRE(fetcher.config().extract_tool == "unzip");
}

TEST_CASE("Fetch reports a failed download", "[fetch]") {
  TempDir dir;
  FetchConfig cfg;
  cfg.download_tool = "false";
  ArchiveFetcher fetcher(cfg);
  auto r = fetcher.Fetch(dir.Sub("firmware"));
  REQUIRE_FALSE(r);
  REQUIRE(r.get_error() == FetchError::kDownloadFailed);
  REQUIRE(pinflash::IsDirectory(dir.Sub("firmware")));
}

TEST_CASE("Fetch reports a missing tool as a failed download", "[fetch]") {
  TempDir dir;
  FetchConfig cfg;
  cfg.download_tool = "/nonexistent/pinflash-no-such-tool";
  ArchiveFetcher fetcher(cfg);
  auto r = fetcher.Fetch(dir.path());
  REQUIRE_FALSE(r);
  REQUIRE(r.get_error() == FetchError::kDownloadFailed);
}

TEST_CASE("Fetch reports a failed extraction", "[fetch]") {
  TempDir dir;
  FetchConfig cfg;
  cfg.download_tool = "true";
  cfg.extract_tool = "false";
  ArchiveFetcher fetcher(cfg);
  auto r = fetcher.Fetch(dir.path());
  REQUIRE_FALSE(r);
  REQUIRE(r.get_error() == FetchError::kExtractFailed);
}

TEST_CASE("Fetch installs only .txt files below the top directory",
          "[fetch]") {
  TempDir dir;
  FetchConfig cfg;
  cfg.download_tool = "true";
  cfg.extract_tool = WriteFakeExtractor(dir);
  ArchiveFetcher fetcher(cfg);

  const std::string target = dir.Sub("firmware");
  auto r = fetcher.Fetch(target);
  REQUIRE(r);
  REQUIRE(r.value() == 2U);
  REQUIRE(pinflash::IsRegularFile(
      target + "/EXP/FP-EXP-0071_EXP_firmware_v_0_48.txt"));
  REQUIRE(pinflash::IsRegularFile(
      target + "/NET/FP-CPU-2000_NET_firmware_v_2_28.txt"));
  REQUIRE_FALSE(pinflash::IsRegularFile(target + "/README.md"));
}

TEST_CASE("Fetch replaces existing files", "[fetch]") {
  TempDir dir;
  const std::string target = dir.Sub("firmware");
  REQUIRE(WriteFile(target + "/EXP/FP-EXP-0071_EXP_firmware_v_0_48.txt",
                    "old\n"));
  FetchConfig cfg;
  cfg.download_tool = "true";
  cfg.extract_tool = WriteFakeExtractor(dir);
  ArchiveFetcher fetcher(cfg);
  REQUIRE(fetcher.Fetch(target));
  REQUIRE(pinflash_test::ReadFile(
              target + "/EXP/FP-EXP-0071_EXP_firmware_v_0_48.txt") == "a\n");
}

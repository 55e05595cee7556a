/**
 * @file test_process.cpp
 * @brief Tests for process.hpp
 */

#include "pinflash/process.hpp"

#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using pinflash::ProcessResult;
using pinflash_test::TempDir;
using pinflash_test::WriteFile;

// ============================================================================
// RunCommand
// ============================================================================

TEST_CASE("ProcessResult values", "[process]") {
  REQUIRE(static_cast<int8_t>(ProcessResult::kSuccess) == 0);
  REQUIRE(static_cast<int8_t>(ProcessResult::kFailed) == -2);
  REQUIRE(static_cast<int8_t>(ProcessResult::kWaitError) == -3);
}

TEST_CASE("RunCommand captures stdout and stderr", "[process]") {
  const char* argv[] = {"sh", "-c", "echo out; echo err 1>&2; exit 3",
                        nullptr};
  std::string output;
  int code = 0;
  REQUIRE(pinflash::RunCommand(argv, output, code) == ProcessResult::kSuccess);
  REQUIRE(code == 3);
  REQUIRE(output.find("out\n") != std::string::npos);
  REQUIRE(output.find("err\n") != std::string::npos);
}

TEST_CASE("RunCommand reports exec failure as 127", "[process]") {
  const char* argv[] = {"/nonexistent/pinflash-tool", nullptr};
  std::string output;
  int code = 0;
  REQUIRE(pinflash::RunCommand(argv, output, code) == ProcessResult::kSuccess);
  REQUIRE(code == 127);
}

TEST_CASE("RunCommand rejects an empty argv", "[process]") {
  const char* argv[] = {nullptr};
  std::string output;
  int code = 0;
  REQUIRE(pinflash::RunCommand(argv, output, code) == ProcessResult::kFailed);
  REQUIRE(code == -1);
}

// ============================================================================
// Filesystem helpers
// ============================================================================

TEST_CASE("MakeDirs creates nested directories", "[process]") {
  TempDir dir;
  const std::string deep = dir.Sub("a/b/c");
  REQUIRE(pinflash::MakeDirs(deep));
  REQUIRE(pinflash::IsDirectory(deep));
  REQUIRE(pinflash::MakeDirs(deep));
  REQUIRE_FALSE(pinflash::MakeDirs(""));
}

TEST_CASE("ListDir is sorted and skips dot entries", "[process]") {
  TempDir dir;
  REQUIRE(WriteFile(dir.Sub("b.txt"), "b"));
  REQUIRE(WriteFile(dir.Sub("a.txt"), "a"));
  REQUIRE(pinflash::MakeDirs(dir.Sub("c")));
  REQUIRE(pinflash::ListDir(dir.path()) ==
          std::vector<std::string>{"a.txt", "b.txt", "c"});
  REQUIRE(pinflash::ListDir(dir.Sub("missing")).empty());
}

TEST_CASE("IsRegularFile and IsDirectory", "[process]") {
  TempDir dir;
  REQUIRE(WriteFile(dir.Sub("f"), "x"));
  REQUIRE(pinflash::IsRegularFile(dir.Sub("f")));
  REQUIRE_FALSE(pinflash::IsDirectory(dir.Sub("f")));
  REQUIRE(pinflash::IsDirectory(dir.path()));
  REQUIRE_FALSE(pinflash::IsRegularFile(dir.path()));
}

TEST_CASE("CopyFile and MoveFile", "[process]") {
  TempDir dir;
  REQUIRE(WriteFile(dir.Sub("src"), "payload"));
  REQUIRE(pinflash::CopyFile(dir.Sub("src"), dir.Sub("copy")));
  REQUIRE(pinflash_test::ReadFile(dir.Sub("copy")) == "payload");

  REQUIRE(pinflash::MoveFile(dir.Sub("copy"), dir.Sub("moved")));
  REQUIRE_FALSE(pinflash::IsRegularFile(dir.Sub("copy")));
  REQUIRE(pinflash_test::ReadFile(dir.Sub("moved")) == "payload");

  REQUIRE_FALSE(pinflash::CopyFile(dir.Sub("missing"), dir.Sub("x")));
}

TEST_CASE("RemoveTree removes recursively", "[process]") {
  TempDir dir;
  REQUIRE(WriteFile(dir.Sub("t/a/b/file.txt"), "x"));
  REQUIRE(pinflash::RemoveTree(dir.Sub("t")));
  REQUIRE_FALSE(pinflash::IsDirectory(dir.Sub("t")));
  REQUIRE(pinflash::RemoveTree(dir.Sub("never-existed")));
}

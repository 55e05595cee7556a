/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file process.hpp
 * @brief Child process and filesystem helpers used by the firmware fetcher
 *        and the catalog scanner.
 *
 *   - RunCommand: fork/exec with merged stdout+stderr capture, blocking wait
 *   - DirGuard: RAII wrapper for DIR*
 *   - ListDir / IsDirectory / IsRegularFile / MakeDirs / RemoveTree / CopyFile
 *
 * POSIX only.
 */

#ifndef PINFLASH_PROCESS_HPP_
#define PINFLASH_PROCESS_HPP_

#include "pinflash/platform.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include <dirent.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace pinflash {

// ============================================================================
// ProcessResult
// ============================================================================

enum class ProcessResult : int8_t {
  kSuccess = 0,
  kFailed = -2,     ///< pipe/fork failure
  kWaitError = -3,  ///< waitpid(2) failure
};

namespace detail {

// ============================================================================
// DirGuard - RAII wrapper for DIR*
// ============================================================================

class DirGuard {
 public:
  explicit DirGuard(DIR* dir) : dir_(dir) {}
  ~DirGuard() {
    if (dir_) {
      closedir(dir_);
    }
  }
  DIR* get() const { return dir_; }

  DirGuard(const DirGuard&) = delete;
  DirGuard& operator=(const DirGuard&) = delete;

 private:
  DIR* dir_;
};

// ============================================================================
// PipeGuard - RAII wrapper for a pipe pair
// ============================================================================

class PipeGuard {
 public:
  PipeGuard() : fd_{-1, -1} {}
  ~PipeGuard() { CloseAll(); }

  bool Create() { return pipe(fd_) == 0; }

  int ReadEnd() const { return fd_[0]; }
  int WriteEnd() const { return fd_[1]; }

  void CloseRead() {
    if (fd_[0] >= 0) {
      close(fd_[0]);
      fd_[0] = -1;
    }  // NOLINT
  }
  void CloseWrite() {
    if (fd_[1] >= 0) {
      close(fd_[1]);
      fd_[1] = -1;
    }  // NOLINT
  }
  void CloseAll() {
    CloseRead();
    CloseWrite();
  }

  PipeGuard(const PipeGuard&) = delete;
  PipeGuard& operator=(const PipeGuard&) = delete;

 private:
  int fd_[2];
};

}  // namespace detail

// ============================================================================
// RunCommand
// ============================================================================

/**
 * @brief Run a command and capture its combined stdout/stderr.
 *
 * Blocks until the child exits. A program that cannot be exec'd exits
 * with code 127.
 *
 * @param argv NULL-terminated argument array, argv[0] is looked up in PATH.
 * @param[out] output Captured output.
 * @param[out] exit_code Child exit code, -1 if killed by a signal.
 */
inline ProcessResult RunCommand(const char* const* argv, std::string& output,
                                int& exit_code) {
  exit_code = -1;
  if (argv == nullptr || argv[0] == nullptr) return ProcessResult::kFailed;

  detail::PipeGuard out_pipe;
  if (!out_pipe.Create()) return ProcessResult::kFailed;

  pid_t child = fork();
  if (child < 0) return ProcessResult::kFailed;

  if (child == 0) {
    // Reset all signal dispositions to default (SIG_IGN survives exec)
    struct sigaction sa_dfl;
    std::memset(&sa_dfl, 0, sizeof(sa_dfl));
    sa_dfl.sa_handler = SIG_DFL;
    for (int sig = 1; sig < 32; ++sig) {
      sigaction(sig, &sa_dfl, nullptr);
    }
    out_pipe.CloseRead();
    dup2(out_pipe.WriteEnd(), STDOUT_FILENO);
    dup2(out_pipe.WriteEnd(), STDERR_FILENO);
    out_pipe.CloseWrite();
    execvp(argv[0], const_cast<char* const*>(argv));
    _exit(127);
  }

  out_pipe.CloseWrite();
  char buf[4096];
  for (;;) {
    ssize_t n = read(out_pipe.ReadEnd(), buf, sizeof(buf));
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) break;
    output.append(buf, static_cast<size_t>(n));
  }

  int status = 0;
  pid_t w;
  do {
    w = waitpid(child, &status, 0);
  } while (w < 0 && errno == EINTR);
  if (w < 0) return ProcessResult::kWaitError;
  if (WIFEXITED(status)) exit_code = WEXITSTATUS(status);
  return ProcessResult::kSuccess;
}

// ============================================================================
// Filesystem helpers
// ============================================================================

inline bool IsDirectory(const std::string& path) {
  struct stat st;
  return ::stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

inline bool IsRegularFile(const std::string& path) {
  struct stat st;
  return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

/// @brief Entry names of @p path (no "." / ".."), sorted. Empty on error.
inline std::vector<std::string> ListDir(const std::string& path) {
  std::vector<std::string> names;
  detail::DirGuard dir(opendir(path.c_str()));
  if (dir.get() == nullptr) return names;
  struct dirent* entry;
  while ((entry = readdir(dir.get())) != nullptr) {
    if (std::strcmp(entry->d_name, ".") == 0 ||
        std::strcmp(entry->d_name, "..") == 0) {
      continue;
    }
    names.emplace_back(entry->d_name);
  }
  std::sort(names.begin(), names.end());
  return names;
}

/// @brief mkdir -p. Returns true if @p path exists as a directory afterwards.
inline bool MakeDirs(const std::string& path) {
  if (path.empty()) return false;
  for (size_t pos = 1; pos <= path.size(); ++pos) {
    if (pos == path.size() || path[pos] == '/') {
      const std::string part = path.substr(0, pos);
      if (::mkdir(part.c_str(), 0755) != 0 && errno != EEXIST) return false;
    }
  }
  return IsDirectory(path);
}

/// @brief rm -rf. Missing paths count as removed.
inline bool RemoveTree(const std::string& path) {
  struct stat st;
  if (::lstat(path.c_str(), &st) != 0) return errno == ENOENT;
  if (S_ISDIR(st.st_mode)) {
    for (const std::string& name : ListDir(path)) {
      if (!RemoveTree(path + "/" + name)) return false;
    }
    return ::rmdir(path.c_str()) == 0;
  }
  return ::unlink(path.c_str()) == 0;
}

/// @brief Copy a regular file byte for byte, replacing @p dst.
inline bool CopyFile(const std::string& src, const std::string& dst) {
  int in = ::open(src.c_str(), O_RDONLY);  // NOLINT
  if (in < 0) return false;
  int out = ::open(dst.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);  // NOLINT
  if (out < 0) {
    ::close(in);
    return false;
  }
  bool ok = true;
  char buf[8192];
  for (;;) {
    ssize_t n = ::read(in, buf, sizeof(buf));
    if (n < 0 && errno == EINTR) continue;
    if (n < 0) {
      ok = false;
      break;
    }
    if (n == 0) break;
    ssize_t off = 0;
    while (off < n) {
      ssize_t w = ::write(out, buf + off, static_cast<size_t>(n - off));
      if (w < 0 && errno == EINTR) continue;
      if (w <= 0) {
        ok = false;
        break;
      }
      off += w;
    }
    if (!ok) break;
  }
  ::close(in);
  if (::close(out) != 0) ok = false;
  return ok;
}

/// @brief Move a file, falling back to copy+unlink across filesystems.
inline bool MoveFile(const std::string& src, const std::string& dst) {
  if (::rename(src.c_str(), dst.c_str()) == 0) return true;
  if (errno != EXDEV) return false;
  if (!CopyFile(src, dst)) return false;
  return ::unlink(src.c_str()) == 0;
}

}  // namespace pinflash

#endif  // PINFLASH_PROCESS_HPP_

/**
 * @file test_support.hpp
 * @brief Shared test doubles: scripted byte channel, manual clock and
 *        temporary directory helpers.
 */

#ifndef PINFLASH_TESTS_TEST_SUPPORT_HPP_
#define PINFLASH_TESTS_TEST_SUPPORT_HPP_

#include "pinflash/byte_channel.hpp"
#include "pinflash/process.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <deque>
#include <map>
#include <string>
#include <vector>

namespace pinflash_test {

// ============================================================================
// ManualClock
// ============================================================================

/// Simulated time: SleepMs() advances NowMs() and returns immediately.
class ManualClock final : public pinflash::Clock {
 public:
  uint64_t NowMs() override { return now_ms_; }

  void SleepMs(uint32_t ms) override {
    now_ms_ += ms;
    sleeps.push_back(ms);
  }

  void Advance(uint64_t ms) { now_ms_ += ms; }

  std::vector<uint32_t> sleeps;

 private:
  uint64_t now_ms_ = 0;
};

// ============================================================================
// FakeChannel
// ============================================================================

/**
 * @brief In-memory ByteChannel driven by a script.
 *
 * Reply(cmd, text) queues @p text to arrive after the next write whose
 * bytes equal @p cmd; ReplyChunks() does the same with several chunks.
 * Feed(text) makes @p text readable right away. Each queued chunk is
 * returned by one Read() (split if larger than the caller's buffer).
 */
class FakeChannel final : public pinflash::ByteChannel {
 public:
  explicit FakeChannel(const char* name = "/dev/fake0", bool open = true)
      : name_(name), open_(open) {}

  void Reply(const std::string& cmd, const std::string& text) {
    replies_[cmd].push_back({text});
  }

  /// @brief Like Reply(), but each chunk arrives as a separate Read().
  void ReplyChunks(const std::string& cmd,
                   const std::vector<std::string>& chunks) {
    replies_[cmd].push_back(chunks);
  }

  void Feed(const std::string& text) { rx_.push_back(text); }

  pinflash::expected<void, pinflash::SerialError> Open() override {
    using R = pinflash::expected<void, pinflash::SerialError>;
    if (fail_open) return R::error(pinflash::SerialError::kOpenFailed);
    open_ = true;
    ++open_count;
    return R::success();
  }

  void Close() override {
    open_ = false;
    ++close_count;
  }

  bool IsOpen() const override { return open_; }

  pinflash::expected<uint32_t, pinflash::SerialError> Read(
      uint8_t* buf, uint32_t cap, uint32_t timeout_ms) override {
    using R = pinflash::expected<uint32_t, pinflash::SerialError>;
    read_timeouts.push_back(timeout_ms);
    if (!open_) return R::error(pinflash::SerialError::kPortNotOpen);
    if (fail_reads) return R::error(pinflash::SerialError::kRecvFailed);
    if (rx_.empty()) return R::success(0U);
    std::string& front = rx_.front();
    const uint32_t n =
        static_cast<uint32_t>(front.size() < cap ? front.size() : cap);
    std::memcpy(buf, front.data(), n);
    front.erase(0, n);
    if (front.empty()) rx_.pop_front();
    return R::success(n);
  }

  pinflash::expected<void, pinflash::SerialError> Write(
      const uint8_t* data, uint32_t len) override {
    using R = pinflash::expected<void, pinflash::SerialError>;
    if (!open_) return R::error(pinflash::SerialError::kPortNotOpen);
    if (fail_writes) return R::error(pinflash::SerialError::kSendFailed);
    const std::string text(reinterpret_cast<const char*>(data), len);
    writes.push_back(text);
    auto it = replies_.find(text);
    if (it != replies_.end() && !it->second.empty()) {
      for (const std::string& chunk : it->second.front()) {
        rx_.push_back(chunk);
      }
      it->second.pop_front();
    }
    return R::success();
  }

  pinflash::expected<void, pinflash::SerialError> Flush() override {
    using R = pinflash::expected<void, pinflash::SerialError>;
    if (!open_) return R::error(pinflash::SerialError::kPortNotOpen);
    return R::success();
  }

  const char* Name() const override { return name_; }

  /// @brief Number of writes whose bytes equal @p text.
  size_t CountWrites(const std::string& text) const {
    size_t n = 0;
    for (const std::string& w : writes) {
      if (w == text) ++n;
    }
    return n;
  }

  std::vector<std::string> writes;
  std::vector<uint32_t> read_timeouts;
  bool fail_open = false;
  bool fail_reads = false;
  bool fail_writes = false;
  int open_count = 0;
  int close_count = 0;

 private:
  const char* name_;
  bool open_;
  std::map<std::string, std::deque<std::vector<std::string>>> replies_;
  std::deque<std::string> rx_;
};

// ============================================================================
// Filesystem fixtures
// ============================================================================

/// Fresh directory under /tmp, removed with its contents on destruction.
class TempDir {
 public:
  TempDir() {
    char tmpl[] = "/tmp/pinflash-test-XXXXXX";
    if (::mkdtemp(tmpl) != nullptr) path_ = tmpl;
  }
  ~TempDir() {
    if (!path_.empty()) pinflash::RemoveTree(path_);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::string& path() const { return path_; }
  std::string Sub(const std::string& rel) const { return path_ + "/" + rel; }

 private:
  std::string path_;
};

/// Write @p content to @p path, creating parent directories.
inline bool WriteFile(const std::string& path, const std::string& content) {
  const size_t slash = path.rfind('/');
  if (slash != std::string::npos && slash > 0U &&
      !pinflash::MakeDirs(path.substr(0, slash))) {
    return false;
  }
  std::FILE* fp = std::fopen(path.c_str(), "wb");
  if (fp == nullptr) return false;
  const size_t n = std::fwrite(content.data(), 1, content.size(), fp);
  return std::fclose(fp) == 0 && n == content.size();
}

inline std::string ReadFile(const std::string& path) {
  std::string out;
  std::FILE* fp = std::fopen(path.c_str(), "rb");
  if (fp == nullptr) return out;
  char buf[512];
  size_t n;
  while ((n = std::fread(buf, 1, sizeof(buf), fp)) > 0) out.append(buf, n);
  std::fclose(fp);
  return out;
}

}  // namespace pinflash_test

#endif  // PINFLASH_TESTS_TEST_SUPPORT_HPP_

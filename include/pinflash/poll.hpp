/**
 * @file poll.hpp
 * @brief Deadline-bounded receive helpers over ByteChannel + Clock.
 *
 * All waiting in pinflash goes through these helpers: read with a short
 * timeout, sleep a fixed interval, check the deadline, repeat. Expiry is
 * reported, never treated as an error.
 */

#ifndef PINFLASH_POLL_HPP_
#define PINFLASH_POLL_HPP_

#include "pinflash/byte_channel.hpp"
#include "pinflash/log.hpp"
#include "pinflash/protocol.hpp"

#include <cstdint>
#include <string>

namespace pinflash {

/// Per-read timeout used inside poll loops.
static constexpr uint32_t kPollReadTimeoutMs = 5U;
/// Sleep between reads inside poll loops.
static constexpr uint32_t kPollIntervalMs = 50U;

// ============================================================================
// Single reads
// ============================================================================

/**
 * @brief One read of at most kReplyCap bytes, decoded as text.
 *
 * Read errors are logged and yield an empty string; a device that stops
 * answering looks the same as one that never answered.
 */
inline std::string ReceiveText(ByteChannel& ch, uint32_t timeout_ms) {
  uint8_t buf[kReplyCap];
  auto r = ch.Read(buf, kReplyCap, timeout_ms);
  if (!r.has_value()) {
    PINFLASH_LOG_DEBUG("POLL", "%s: read failed (%s)", ch.Name(),
                       SerialErrorName(r.get_error()));
    return std::string();
  }
  return std::string(reinterpret_cast<const char*>(buf), r.value());
}

/**
 * @brief Read until a read returns nothing or @p cap bytes are collected.
 */
inline std::string ReceiveUntilQuiet(ByteChannel& ch, uint32_t cap,
                                     uint32_t timeout_ms) {
  std::string out;
  uint8_t buf[kReplyCap];
  while (out.size() < cap) {
    const uint32_t want = static_cast<uint32_t>(
        (cap - out.size() < sizeof(buf)) ? cap - out.size() : sizeof(buf));
    auto r = ch.Read(buf, want, timeout_ms);
    if (!r.has_value() || r.value() == 0U) break;
    out.append(reinterpret_cast<const char*>(buf), r.value());
  }
  return out;
}

/// @brief Discard whatever is waiting in the receive queue.
inline void DrainInput(ByteChannel& ch,
                       uint32_t timeout_ms = kPollReadTimeoutMs) {
  const std::string stale = ReceiveText(ch, timeout_ms);
  if (!stale.empty()) {
    PINFLASH_LOG_DEBUG("POLL", "%s: drained %zu stale bytes", ch.Name(),
                       stale.size());
  }
}

/// @brief Write a text command and flush.
inline expected<void, SerialError> SendText(ByteChannel& ch,
                                            const std::string& text) {
  auto w = ch.Write(reinterpret_cast<const uint8_t*>(text.data()),
                    static_cast<uint32_t>(text.size()));
  if (!w) return w;
  return ch.Flush();
}

// ============================================================================
// Deadline poll
// ============================================================================

struct PollResult {
  std::string text;   ///< Everything received while polling.
  bool matched = false;
  uint64_t elapsed_ms = 0;
};

/**
 * @brief Accumulate received text until @p done(text) holds or
 *        @p deadline_ms elapses.
 *
 * @tparam Pred bool(const std::string&)
 */
template <typename Pred>
PollResult PollUntil(ByteChannel& ch, Clock& clock, uint32_t deadline_ms,
                     Pred&& done,
                     uint32_t read_timeout_ms = kPollReadTimeoutMs) {
  PollResult res;
  const uint64_t start = clock.NowMs();
  while (clock.NowMs() - start < deadline_ms) {
    const std::string chunk = ReceiveText(ch, read_timeout_ms);
    if (!chunk.empty()) {
      res.text += chunk;
      if (done(res.text)) {
        res.matched = true;
        break;
      }
    }
    clock.SleepMs(kPollIntervalMs);
  }
  res.elapsed_ms = clock.NowMs() - start;
  return res;
}

/// @brief Poll until the accumulated text contains @p token.
inline PollResult PollForToken(ByteChannel& ch, Clock& clock,
                               uint32_t deadline_ms, const char* token,
                               uint32_t read_timeout_ms = kPollReadTimeoutMs) {
  return PollUntil(
      ch, clock, deadline_ms,
      [token](const std::string& text) {
        return text.find(token) != std::string::npos;
      },
      read_timeout_ms);
}

}  // namespace pinflash

#endif  // PINFLASH_POLL_HPP_

/**
 * @file byte_channel.hpp
 * @brief Duplex byte-channel and time-source interfaces.
 *
 * Every protocol component talks to hardware through ByteChannel and waits
 * through Clock, so bus logic runs unchanged against a real serial port or
 * an in-memory script with simulated time.
 */

#ifndef PINFLASH_BYTE_CHANNEL_HPP_
#define PINFLASH_BYTE_CHANNEL_HPP_

#include "pinflash/platform.hpp"
#include "pinflash/vocabulary.hpp"

#include <cstdint>
#include <time.h>
#include <sys/time.h>

namespace pinflash {

// ============================================================================
// Serial Error
// ============================================================================

enum class SerialError : uint8_t {
  kOpenFailed,
  kConfigFailed,
  kSendFailed,
  kRecvFailed,
  kPortNotOpen,
};

inline const char* SerialErrorName(SerialError e) noexcept {
  switch (e) {
    case SerialError::kOpenFailed:
      return "open failed";
    case SerialError::kConfigFailed:
      return "config failed";
    case SerialError::kSendFailed:
      return "send failed";
    case SerialError::kRecvFailed:
      return "receive failed";
    case SerialError::kPortNotOpen:
      return "port not open";
  }
  return "unknown";
}

// ============================================================================
// ByteChannel
// ============================================================================

/**
 * @brief Duplex byte stream with bounded-time reads.
 *
 * Implementations are single-owner and not thread-safe.
 */
class ByteChannel {
 public:
  virtual ~ByteChannel() = default;

  virtual expected<void, SerialError> Open() = 0;
  virtual void Close() = 0;
  virtual bool IsOpen() const = 0;

  /**
   * @brief Read up to @p cap bytes, waiting at most @p timeout_ms for the
   *        first byte.
   * @return Number of bytes read; 0 when nothing arrived in time.
   */
  virtual expected<uint32_t, SerialError> Read(uint8_t* buf, uint32_t cap,
                                               uint32_t timeout_ms) = 0;

  /// @brief Write all @p len bytes.
  virtual expected<void, SerialError> Write(const uint8_t* data,
                                            uint32_t len) = 0;

  /// @brief Block until written bytes have left the output queue.
  virtual expected<void, SerialError> Flush() = 0;

  /// @brief Port name for log lines.
  virtual const char* Name() const = 0;
};

// ============================================================================
// Clock
// ============================================================================

/// @brief Monotonic millisecond time source with sleep.
class Clock {
 public:
  virtual ~Clock() = default;
  virtual uint64_t NowMs() = 0;
  virtual void SleepMs(uint32_t ms) = 0;
};

/// @brief Wall-clock implementation (CLOCK_MONOTONIC + nanosleep).
class SystemClock final : public Clock {
 public:
  uint64_t NowMs() override {
    struct timespec ts;
    ::clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<uint64_t>(ts.tv_sec) * 1000U +
           static_cast<uint64_t>(ts.tv_nsec) / 1000000U;
  }

  void SleepMs(uint32_t ms) override {
    struct timespec ts;
    ts.tv_sec = static_cast<time_t>(ms / 1000U);
    ts.tv_nsec = static_cast<long>(ms % 1000U) * 1000000L;  // NOLINT
    while (::nanosleep(&ts, &ts) != 0) {
    }
  }

  /// @brief Process-wide instance for production wiring.
  static SystemClock& Instance() {
    static SystemClock clock;
    return clock;
  }
};

}  // namespace pinflash

#endif  // PINFLASH_BYTE_CHANNEL_HPP_

/**
 * @file serial_port.hpp
 * @brief POSIX serial port (termios + open/read/write) implementing
 *        ByteChannel, plus system serial port enumeration.
 *
 * Raw mode, no framing: FAST boards speak line-oriented ASCII, so bytes are
 * passed through untouched in both directions.
 */

#ifndef PINFLASH_SERIAL_PORT_HPP_
#define PINFLASH_SERIAL_PORT_HPP_

#include "pinflash/byte_channel.hpp"
#include "pinflash/log.hpp"
#include "pinflash/platform.hpp"
#include "pinflash/protocol.hpp"
#include "pinflash/vocabulary.hpp"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

#if defined(PINFLASH_PLATFORM_POSIX)
#include <dirent.h>
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <sys/stat.h>
#include <termios.h>
#include <unistd.h>
#endif

namespace pinflash {

// ============================================================================
// Serial Config
// ============================================================================

/// @brief Line configuration for one serial endpoint.
struct SerialConfig {
  char port_name[64] = "/dev/ttyACM0";
  uint32_t baud_rate = kBusBaudRate;
  uint8_t data_bits = 8U;
  uint8_t stop_bits = 1U;
  uint8_t parity = 0U;        // 0=None, 1=Odd, 2=Even
  uint8_t flow_control = 0U;  // 0=None, 1=HW(RTS/CTS), 2=SW(XON/XOFF)
  bool assert_dtr = true;
  uint32_t read_timeout_ms = kProbeReadTimeoutMs;
  uint32_t write_retry_count = 3U;
  uint32_t write_retry_delay_us = 1000U;
};

/// @brief FAST bus line settings (921600 8N1, no flow control, DTR on).
inline SerialConfig MakeBusConfig(const std::string& port,
                                  uint32_t read_timeout_ms,
                                  uint32_t baud = kBusBaudRate) {
  SerialConfig cfg;
  const size_t n = std::min(port.size(), sizeof(cfg.port_name) - 1U);
  std::memcpy(cfg.port_name, port.data(), n);
  cfg.port_name[n] = '\0';
  cfg.baud_rate = baud;
  cfg.read_timeout_ms = read_timeout_ms;
  return cfg;
}

// ============================================================================
// SerialPort
// ============================================================================

class SerialPort final : public ByteChannel {
 public:
  explicit SerialPort(const SerialConfig& cfg) noexcept
      : cfg_(cfg), fd_(-1) {}

  ~SerialPort() override { Close(); }

  SerialPort(const SerialPort&) = delete;
  SerialPort& operator=(const SerialPort&) = delete;

  // ------------------------------------------------------------------
  // Open / Close / IsOpen
  // ------------------------------------------------------------------

  expected<void, SerialError> Open() override {
#if defined(PINFLASH_PLATFORM_POSIX)
    if (fd_ >= 0) {
      return expected<void, SerialError>::success();
    }

    fd_ = ::open(cfg_.port_name, O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd_ < 0) {
      PINFLASH_LOG_DEBUG("SERIAL", "open %s: %s", cfg_.port_name,
                         std::strerror(errno));
      return expected<void, SerialError>::error(SerialError::kOpenFailed);
    }

    auto r = ConfigurePort();
    if (!r) {
      ::close(fd_);
      fd_ = -1;
      return r;
    }
    return expected<void, SerialError>::success();
#else
    return expected<void, SerialError>::error(SerialError::kOpenFailed);
#endif
  }

  void Close() override {
#if defined(PINFLASH_PLATFORM_POSIX)
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
#endif
  }

  bool IsOpen() const override { return fd_ >= 0; }

  const char* Name() const override { return cfg_.port_name; }

  // ------------------------------------------------------------------
  // Read / Write / Flush
  // ------------------------------------------------------------------

  expected<uint32_t, SerialError> Read(uint8_t* buf, uint32_t cap,
                                       uint32_t timeout_ms) override {
#if defined(PINFLASH_PLATFORM_POSIX)
    if (fd_ < 0) {
      return expected<uint32_t, SerialError>::error(SerialError::kPortNotOpen);
    }
    PINFLASH_ASSERT(buf != nullptr);

    struct pollfd pfd;
    pfd.fd = fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;
    const int ready = ::poll(&pfd, 1, static_cast<int>(timeout_ms));
    if (ready < 0) {
      if (errno == EINTR) return expected<uint32_t, SerialError>::success(0U);
      return expected<uint32_t, SerialError>::error(SerialError::kRecvFailed);
    }
    if (ready == 0) return expected<uint32_t, SerialError>::success(0U);
    if ((pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) != 0 &&
        (pfd.revents & POLLIN) == 0) {
      return expected<uint32_t, SerialError>::error(SerialError::kRecvFailed);
    }

    const ssize_t n = ::read(fd_, buf, cap);
    if (n < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
        return expected<uint32_t, SerialError>::success(0U);
      }
      return expected<uint32_t, SerialError>::error(SerialError::kRecvFailed);
    }
    return expected<uint32_t, SerialError>::success(static_cast<uint32_t>(n));
#else
    (void)buf;
    (void)cap;
    (void)timeout_ms;
    return expected<uint32_t, SerialError>::error(SerialError::kPortNotOpen);
#endif
  }

  /// @brief Write all data, backing off while the non-blocking fd is full.
  expected<void, SerialError> Write(const uint8_t* data,
                                    uint32_t len) override {
#if defined(PINFLASH_PLATFORM_POSIX)
    if (fd_ < 0) {
      return expected<void, SerialError>::error(SerialError::kPortNotOpen);
    }
    uint32_t written = 0U;
    uint32_t retry_count = 0U;

    while (written < len) {
      const ssize_t n = ::write(fd_, data + written, len - written);
      if (n < 0) {
        const int err = errno;
        if (err == EINTR) continue;
        if (err == EAGAIN || err == EWOULDBLOCK) {
          if (retry_count >= cfg_.write_retry_count) {
            return expected<void, SerialError>::error(SerialError::kSendFailed);
          }
          ++retry_count;
          ::usleep(cfg_.write_retry_delay_us);
          continue;
        }
        return expected<void, SerialError>::error(SerialError::kSendFailed);
      }
      written += static_cast<uint32_t>(n);
      retry_count = 0U;
    }

    return expected<void, SerialError>::success();
#else
    (void)data;
    (void)len;
    return expected<void, SerialError>::error(SerialError::kPortNotOpen);
#endif
  }

  expected<void, SerialError> Flush() override {
#if defined(PINFLASH_PLATFORM_POSIX)
    if (fd_ < 0) {
      return expected<void, SerialError>::error(SerialError::kPortNotOpen);
    }
    if (::tcdrain(fd_) != 0 && errno != EINTR) {
      return expected<void, SerialError>::error(SerialError::kSendFailed);
    }
    return expected<void, SerialError>::success();
#else
    return expected<void, SerialError>::error(SerialError::kPortNotOpen);
#endif
  }

 private:
  // ------------------------------------------------------------------
  // Port configuration (POSIX termios)
  // ------------------------------------------------------------------

  expected<void, SerialError> ConfigurePort() {
#if defined(PINFLASH_PLATFORM_POSIX)
    struct termios tio;
    std::memset(&tio, 0, sizeof(tio));

    if (::tcgetattr(fd_, &tio) != 0) {
      return expected<void, SerialError>::error(SerialError::kConfigFailed);
    }

    // Raw mode
    tio.c_iflag &= static_cast<tcflag_t>(~(IGNBRK | BRKINT | PARMRK | ISTRIP |
                                           INLCR | IGNCR | ICRNL | IXON |
                                           IXOFF | IXANY));
    tio.c_oflag &= static_cast<tcflag_t>(~OPOST);
    tio.c_lflag &=
        static_cast<tcflag_t>(~(ECHO | ECHONL | ICANON | ISIG | IEXTEN));
    tio.c_cflag &= static_cast<tcflag_t>(~(CSIZE | PARENB | PARODD | CSTOPB));
    tio.c_cflag |= static_cast<tcflag_t>(CLOCAL | CREAD);

    switch (cfg_.data_bits) {
      case 5U:
        tio.c_cflag |= CS5;
        break;
      case 6U:
        tio.c_cflag |= CS6;
        break;
      case 7U:
        tio.c_cflag |= CS7;
        break;
      default:
        tio.c_cflag |= CS8;
        break;
    }

    if (cfg_.parity == 1U) {
      tio.c_cflag |= static_cast<tcflag_t>(PARENB | PARODD);
    } else if (cfg_.parity == 2U) {
      tio.c_cflag |= PARENB;
    }

    if (cfg_.stop_bits == 2U) {
      tio.c_cflag |= CSTOPB;
    }

#ifdef CRTSCTS
    tio.c_cflag &= static_cast<tcflag_t>(~CRTSCTS);
    if (cfg_.flow_control == 1U) {
      tio.c_cflag |= CRTSCTS;
    }
#endif
    if (cfg_.flow_control == 2U) {
      tio.c_iflag |= static_cast<tcflag_t>(IXON | IXOFF);
    }

    // Reads are bounded by poll() in Read(), so the driver never blocks.
    tio.c_cc[VMIN] = 0;
    tio.c_cc[VTIME] = 0;

    const speed_t speed = BaudToSpeed(cfg_.baud_rate);
    ::cfsetispeed(&tio, speed);
    ::cfsetospeed(&tio, speed);

    if (::tcsetattr(fd_, TCSANOW, &tio) != 0) {
      return expected<void, SerialError>::error(SerialError::kConfigFailed);
    }

    if (cfg_.assert_dtr) {
      int bits = TIOCM_DTR;
      if (::ioctl(fd_, TIOCMBIS, &bits) != 0) {
        // Pseudo terminals and some USB bridges have no modem lines.
        PINFLASH_LOG_DEBUG("SERIAL", "%s: DTR not supported (%s)",
                           cfg_.port_name, std::strerror(errno));
      }
    }

    ::tcflush(fd_, TCIOFLUSH);
    return expected<void, SerialError>::success();
#else
    return expected<void, SerialError>::error(SerialError::kConfigFailed);
#endif
  }

  static speed_t BaudToSpeed(uint32_t baud) noexcept {
    switch (baud) {
      case 9600U:
        return B9600;
      case 19200U:
        return B19200;
      case 38400U:
        return B38400;
      case 57600U:
        return B57600;
      case 115200U:
        return B115200;
      case 230400U:
        return B230400;
#ifdef B460800
      case 460800U:
        return B460800;
#endif
#ifdef B921600
      case 921600U:
        return B921600;
#endif
      default:
        return B115200;
    }
  }

  SerialConfig cfg_;
  int fd_;
};

// ============================================================================
// Port enumeration
// ============================================================================

namespace detail {

inline bool HasPrefix(const char* s, const char* prefix) noexcept {
  return std::strncmp(s, prefix, std::strlen(prefix)) == 0;
}

}  // namespace detail

/**
 * @brief List serial ports present on this system, sorted by path.
 *
 * Linux: every /sys/class/tty entry backed by a real device.
 * macOS: /dev/cu.* call-out devices.
 */
inline std::vector<std::string> ListSerialPorts() {
  std::vector<std::string> ports;
#if defined(PINFLASH_PLATFORM_LINUX)
  DIR* dir = ::opendir("/sys/class/tty");
  if (dir == nullptr) return ports;
  PINFLASH_SCOPE_EXIT(::closedir(dir));
  struct dirent* entry;
  while ((entry = ::readdir(dir)) != nullptr) {
    if (entry->d_name[0] == '.') continue;
    std::string dev_link =
        std::string("/sys/class/tty/") + entry->d_name + "/device";
    struct stat st;
    if (::stat(dev_link.c_str(), &st) != 0) continue;
    // Legacy 8250 UARTs register all ttySn whether or not hardware exists.
    std::string driver = dev_link + "/driver";
    char target[256];
    const ssize_t n = ::readlink(driver.c_str(), target, sizeof(target) - 1U);
    if (n > 0) {
      target[n] = '\0';
      if (std::strstr(target, "serial8250") != nullptr) continue;
    }
    ports.push_back(std::string("/dev/") + entry->d_name);
  }
#elif defined(PINFLASH_PLATFORM_MACOS)
  DIR* dir = ::opendir("/dev");
  if (dir == nullptr) return ports;
  PINFLASH_SCOPE_EXIT(::closedir(dir));
  struct dirent* entry;
  while ((entry = ::readdir(dir)) != nullptr) {
    if (detail::HasPrefix(entry->d_name, "cu.")) {
      ports.push_back(std::string("/dev/") + entry->d_name);
    }
  }
#endif
  std::sort(ports.begin(), ports.end());
  return ports;
}

}  // namespace pinflash

#endif  // PINFLASH_SERIAL_PORT_HPP_

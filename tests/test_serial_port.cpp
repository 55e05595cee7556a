/**
 * @file test_serial_port.cpp
 * @brief Tests for serial_port.hpp using PTY pairs to simulate serial ports.
 */

#include "pinflash/serial_port.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstring>
#include <string>

#include <fcntl.h>
#include <unistd.h>

#if defined(PINFLASH_PLATFORM_LINUX)
#include <pty.h>
#endif

using pinflash::SerialError;
using pinflash::SerialPort;

// ============================================================================
// PTY helper
// ============================================================================

struct PtyPair {
  int master = -1;
  int slave = -1;
  char slave_name[64] = {};
  bool valid = false;
};

static PtyPair CreatePtyPair() {
  PtyPair p;
#if defined(PINFLASH_PLATFORM_LINUX)
  if (::openpty(&p.master, &p.slave, p.slave_name, nullptr, nullptr) == 0) {
    int flags = ::fcntl(p.master, F_GETFL, 0);
    ::fcntl(p.master, F_SETFL, flags | O_NONBLOCK);
    p.valid = true;
  }
#endif
  return p;
}

static void ClosePty(PtyPair& p) {
  if (p.master >= 0) ::close(p.master);
  if (p.slave >= 0) ::close(p.slave);
  p.master = p.slave = -1;
  p.valid = false;
}

/// Read whatever the master side has, waiting up to ~100 ms.
static std::string ReadMaster(int fd) {
  std::string out;
  char buf[256];
  for (int i = 0; i < 20; ++i) {
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n > 0) {
      out.append(buf, static_cast<size_t>(n));
      continue;
    }
    if (!out.empty()) break;
    ::usleep(5000);
  }
  return out;
}

// ============================================================================
// Config
// ============================================================================

TEST_CASE("MakeBusConfig uses 921600 8N1 with DTR", "[serial]") {
  auto cfg = pinflash::MakeBusConfig("/dev/ttyACM0", 200);
  REQUIRE(std::string(cfg.port_name) == "/dev/ttyACM0");
  REQUIRE(cfg.baud_rate == 921600U);
  REQUIRE(cfg.data_bits == 8U);
  REQUIRE(cfg.stop_bits == 1U);
  REQUIRE(cfg.parity == 0U);
  REQUIRE(cfg.flow_control == 0U);
  REQUIRE(cfg.assert_dtr);
  REQUIRE(cfg.read_timeout_ms == 200U);
}

TEST_CASE("MakeBusConfig truncates long port names", "[serial]") {
  const std::string long_name(200, 'p');
  auto cfg = pinflash::MakeBusConfig(long_name, 5, 115200);
  REQUIRE(std::strlen(cfg.port_name) == sizeof(cfg.port_name) - 1U);
  REQUIRE(cfg.baud_rate == 115200U);
}

// ============================================================================
// SerialPort
// ============================================================================

TEST_CASE("SerialPort open fails for a missing device", "[serial]") {
  SerialPort port(pinflash::MakeBusConfig("/dev/pinflash-missing", 5));
  auto r = port.Open();
  REQUIRE_FALSE(r);
  REQUIRE(r.get_error() == SerialError::kOpenFailed);
  REQUIRE_FALSE(port.IsOpen());
}

TEST_CASE("SerialPort I/O on a closed port", "[serial]") {
  SerialPort port(pinflash::MakeBusConfig("/dev/pinflash-missing", 5));
  uint8_t buf[8];
  auto rd = port.Read(buf, sizeof(buf), 1);
  REQUIRE_FALSE(rd);
  REQUIRE(rd.get_error() == SerialError::kPortNotOpen);
  auto wr = port.Write(buf, 1);
  REQUIRE_FALSE(wr);
  REQUIRE(wr.get_error() == SerialError::kPortNotOpen);
}

TEST_CASE("SerialPort round trip over a PTY", "[serial]") {
  PtyPair pty = CreatePtyPair();
  if (!pty.valid) {
    SKIP("openpty not available");
  }

  // The PTY slave accepts the line settings except DTR, which is ignored.
  auto cfg = pinflash::MakeBusConfig(pty.slave_name, 50, 115200);
  cfg.assert_dtr = false;
  SerialPort port(cfg);
  REQUIRE(port.Open());
  REQUIRE(port.IsOpen());
  REQUIRE(std::string(port.Name()) == pty.slave_name);

  const char cmd[] = "ID:\r";
  REQUIRE(port.Write(reinterpret_cast<const uint8_t*>(cmd), 4));
  REQUIRE(ReadMaster(pty.master) == "ID:\r");

  const char reply[] = "ID:EXP FP-EXP-0071 0.48\r";
  REQUIRE(::write(pty.master, reply, sizeof(reply) - 1U) ==
          static_cast<ssize_t>(sizeof(reply) - 1U));
  uint8_t buf[64] = {};
  auto rd = port.Read(buf, sizeof(buf), 200);
  REQUIRE(rd);
  REQUIRE(rd.value() > 0U);
  REQUIRE(std::string(reinterpret_cast<char*>(buf), rd.value()) ==
          std::string(reply).substr(0, rd.value()));

  port.Close();
  REQUIRE_FALSE(port.IsOpen());
  ClosePty(pty);
}

TEST_CASE("SerialPort read times out quietly", "[serial]") {
  PtyPair pty = CreatePtyPair();
  if (!pty.valid) {
    SKIP("openpty not available");
  }
  auto cfg = pinflash::MakeBusConfig(pty.slave_name, 5, 115200);
  cfg.assert_dtr = false;
  SerialPort port(cfg);
  REQUIRE(port.Open());
  uint8_t buf[16];
  auto rd = port.Read(buf, sizeof(buf), 10);
  REQUIRE(rd);
  REQUIRE(rd.value() == 0U);
  port.Close();
  ClosePty(pty);
}

TEST_CASE("ListSerialPorts returns /dev paths in order", "[serial]") {
  auto ports = pinflash::ListSerialPorts();
  for (size_t i = 0; i < ports.size(); ++i) {
    REQUIRE(ports[i].compare(0, 5, "/dev/") == 0);
    if (i > 0) REQUIRE(ports[i - 1] < ports[i]);
  }
}

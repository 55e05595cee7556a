/**
 * @file port_discovery.hpp
 * @brief Find FAST NET and EXP ports by probing every system serial port
 *        with "ID:" and classifying the reply.
 *
 * A port that cannot be opened, stays silent or answers with something
 * other than "ID:NET" / "ID:EXP" is skipped: absent hardware is the normal
 * case on most ports.
 */

#ifndef PINFLASH_PORT_DISCOVERY_HPP_
#define PINFLASH_PORT_DISCOVERY_HPP_

#include "pinflash/byte_channel.hpp"
#include "pinflash/log.hpp"
#include "pinflash/poll.hpp"
#include "pinflash/protocol.hpp"
#include "pinflash/response_parser.hpp"
#include "pinflash/serial_port.hpp"
#include "pinflash/vocabulary.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace pinflash {

/// Settle time between the probe command and the first read.
static constexpr uint32_t kProbeSettleMs = 5U;

/// @brief First port of each kind, as chosen by SelectFirst().
struct BusPorts {
  optional<std::string> net;
  optional<std::string> exp;

  bool Complete() const noexcept { return net.has_value() && exp.has_value(); }
};

class PortDiscovery {
 public:
  using Enumerator = std::function<std::vector<std::string>()>;
  using ChannelFactory =
      std::function<std::unique_ptr<ByteChannel>(const std::string& port)>;

  PortDiscovery(Enumerator enumerate, ChannelFactory open_channel,
                Clock& clock, uint32_t read_timeout_ms = kProbeReadTimeoutMs)
      : enumerate_(std::move(enumerate)),
        open_channel_(std::move(open_channel)),
        clock_(clock),
        read_timeout_ms_(read_timeout_ms) {}

  /// @brief Discovery over the real system ports with the bus line settings.
  static PortDiscovery ForSystem(
      uint32_t baud = kBusBaudRate,
      uint32_t read_timeout_ms = kProbeReadTimeoutMs) {
    return PortDiscovery(
        &ListSerialPorts,
        [baud, read_timeout_ms](const std::string& port) {
          std::unique_ptr<ByteChannel> ch = std::make_unique<SerialPort>(
              MakeBusConfig(port, read_timeout_ms, baud));
          return ch;
        },
        SystemClock::Instance(), read_timeout_ms);
  }

  /**
   * @brief Probe every enumerated port.
   * @return port name -> protocol for every port that identified itself.
   */
  std::map<std::string, ProtocolKind> Discover() {
    std::map<std::string, ProtocolKind> found;
    const std::vector<std::string> ports = enumerate_();
    PINFLASH_LOG_DEBUG("DISCOVERY", "probing %zu serial ports", ports.size());
    for (const std::string& port : ports) {
      auto kind = Probe(port);
      if (kind.has_value()) {
        PINFLASH_LOG_INFO("DISCOVERY", "%s -> %s", port.c_str(),
                          ProtocolName(*kind));
        found.emplace(port, *kind);
      }
    }
    return found;
  }

  /// @brief Open @p port, send "ID:" and classify the reply.
  optional<ProtocolKind> Probe(const std::string& port) {
    std::unique_ptr<ByteChannel> ch = open_channel_(port);
    if (!ch) return {};
    auto opened = ch->Open();
    if (!opened) {
      PINFLASH_LOG_DEBUG("DISCOVERY", "%s: skipped (%s)", port.c_str(),
                         SerialErrorName(opened.get_error()));
      return {};
    }

    auto sent = SendText(*ch, kIdentifyCmd);
    if (!sent) {
      PINFLASH_LOG_DEBUG("DISCOVERY", "%s: probe write failed", port.c_str());
      return {};
    }
    clock_.SleepMs(kProbeSettleMs);

    const std::string reply =
        ReceiveUntilQuiet(*ch, kReplyCap, read_timeout_ms_);
    ch->Close();
    if (reply.empty()) {
      PINFLASH_LOG_DEBUG("DISCOVERY", "%s: no reply", port.c_str());
      return {};
    }
    auto kind = ParseProtocol(reply);
    if (!kind.has_value()) {
      PINFLASH_LOG_DEBUG("DISCOVERY", "%s: unrecognized reply (%zu bytes)",
                         port.c_str(), reply.size());
    }
    return kind;
  }

 private:
  Enumerator enumerate_;
  ChannelFactory open_channel_;
  Clock& clock_;
  uint32_t read_timeout_ms_;
};

/// @brief Keep the first port (in name order) of each protocol kind.
inline BusPorts SelectFirst(const std::map<std::string, ProtocolKind>& found) {
  BusPorts out;
  for (const auto& kv : found) {
    switch (kv.second) {
      case ProtocolKind::kNet:
        if (!out.net.has_value()) out.net = kv.first;
        break;
      case ProtocolKind::kExp:
        if (!out.exp.has_value()) out.exp = kv.first;
        break;
    }
  }
  return out;
}

}  // namespace pinflash

#endif  // PINFLASH_PORT_DISCOVERY_HPP_

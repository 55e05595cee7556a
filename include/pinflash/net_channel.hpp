/**
 * @file net_channel.hpp
 * @brief NET (controller) bus channel: node enumeration and controller
 *        firmware update followed by an I/O board broadcast.
 */

#ifndef PINFLASH_NET_CHANNEL_HPP_
#define PINFLASH_NET_CHANNEL_HPP_

#include "pinflash/byte_channel.hpp"
#include "pinflash/firmware_catalog.hpp"
#include "pinflash/flash_procedure.hpp"
#include "pinflash/log.hpp"
#include "pinflash/poll.hpp"
#include "pinflash/protocol.hpp"
#include "pinflash/response_parser.hpp"
#include "pinflash/serial_port.hpp"
#include "pinflash/version.hpp"
#include "pinflash/vocabulary.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>

namespace pinflash {

static constexpr uint32_t kNetQuerySettleMs = 10U;
static constexpr uint32_t kNetInterQueryMs = 5U;
static constexpr uint32_t kNetRecordPacingMs = 400U;
/// "NN:{:02d}" addresses at most 100 nodes.
static constexpr uint32_t kMaxNetNodes = 100U;

class NetChannel {
 public:
  /**
   * @param port Opened NET port. The channel takes exclusive ownership.
   * @param clock Time source for settle delays and deadlines.
   */
  explicit NetChannel(std::unique_ptr<ByteChannel> port,
                      Clock& clock = SystemClock::Instance())
      : port_(std::move(port)), clock_(&clock) {}

  NetChannel(NetChannel&&) = default;
  NetChannel& operator=(NetChannel&&) = default;
  NetChannel(const NetChannel&) = delete;
  NetChannel& operator=(const NetChannel&) = delete;

  /// @brief Open @p port_name with the NET line settings.
  static expected<NetChannel, SerialError> Open(
      const std::string& port_name, uint32_t baud = kBusBaudRate,
      uint32_t read_timeout_ms = kNetReadTimeoutMs,
      Clock& clock = SystemClock::Instance()) {
    std::unique_ptr<ByteChannel> port = std::make_unique<SerialPort>(
        MakeBusConfig(port_name, read_timeout_ms, baud));
    auto r = port->Open();
    if (!r) {
      PINFLASH_LOG_ERROR("NET", "cannot open %s: %s", port_name.c_str(),
                         SerialErrorName(r.get_error()));
      return expected<NetChannel, SerialError>::error(r.get_error());
    }
    return expected<NetChannel, SerialError>::success(
        NetChannel(std::move(port), clock, read_timeout_ms));
  }

  static FlashProfile Profile(uint32_t read_timeout_ms = kNetReadTimeoutMs) {
    FlashProfile p;
    p.tag = "NET";
    p.read_timeout_ms = read_timeout_ms;
    p.record_pacing_ms = kNetRecordPacingMs;
    p.ack_token = kNetBootloaderToken;
    p.ack_deadline_ms = kAckDeadlineMs;
    p.identity_command = kIdentifyCmd;
    p.id_prefix = kNetIdLinePrefix;
    p.version_rule = VersionRule::kTrimAndStripMajorZeros;
    p.verify_deadline_ms = kVerifyDeadlineMs;
    p.post_verify_command = kNetBroadcastCmd;
    return p;
  }

  /**
   * @brief Query the controller and walk "NN:00", "NN:01", ... until a node
   *        is missing.
   *
   * The controller itself is appended at the next free index with node id
   * "NC" when it answered "ID:".
   */
  std::map<uint32_t, NodeInfo> Enumerate() {
    std::map<uint32_t, NodeInfo> nodes;
    DrainInput(*port_, read_timeout_ms_);

    optional<IdReply> controller;
    auto sent = SendText(*port_, kIdentifyCmd);
    if (sent) {
      clock_->SleepMs(kNetQuerySettleMs);
      controller = ParseIdLine(ReceiveText(*port_, read_timeout_ms_));
    } else {
      PINFLASH_LOG_DEBUG("NET", "ID: send failed (%s)",
                         SerialErrorName(sent.get_error()));
    }

    uint32_t index = 0;
    for (; index < kMaxNetNodes; ++index) {
      auto q = SendText(*port_, NodeQueryCommand(index));
      if (!q) {
        PINFLASH_LOG_DEBUG("NET", "NN:%02u send failed (%s)", index,
                           SerialErrorName(q.get_error()));
      }
      clock_->SleepMs(kNetQuerySettleMs);

      const std::string reply = ReceiveText(*port_, read_timeout_ms_);
      if (reply.empty() || reply.find(kNodeNotFound) != std::string::npos) {
        break;
      }
      auto node = ParseNodeRecord(reply);
      if (node.has_value()) {
        PINFLASH_LOG_DEBUG("NET", "node %02u: %s %s", index,
                           node->node_name.c_str(), node->firmware.c_str());
        nodes.emplace(index, std::move(*node));
      }
      clock_->SleepMs(kNetInterQueryMs);
    }

    if (controller.has_value()) {
      NodeInfo nc;
      nc.node_id = kControllerNodeId;
      nc.node_name = controller->board;
      nc.firmware = controller->version;
      nodes.emplace(index, std::move(nc));
    }
    return nodes;
  }

  /**
   * @brief Flash the controller with catalog @p version, verify, then ask
   *        the I/O boards to update themselves.
   */
  expected<FlashReport, FlashError> UpdateFirmware(
      FirmwareCatalog& catalog, const std::string& version,
      const ProgressFn& progress = nullptr) {
    using R = expected<FlashReport, FlashError>;
    const std::string normalized = NormalizeVersion(version);
    auto path = catalog.Find(kNetCatalogKey, normalized);
    if (!path.has_value()) {
      PINFLASH_LOG_ERROR(
          "NET", "firmware not found for key '%s' version '%s', available: %s",
          kNetCatalogKey, normalized.c_str(),
          detail::JoinVersions(catalog.Versions(kNetCatalogKey)).c_str());
      return R::error(FlashError::kFirmwareNotFound);
    }

    PINFLASH_LOG_INFO("NET", "updating %s to %s", kNetBoardType,
                      normalized.c_str());
    FlashProcedure proc(*port_, *clock_, Profile(read_timeout_ms_));
    auto r = proc.Run(std::string(), *path, kNetBoardType, normalized,
                      progress);
    if (r) {
      PINFLASH_LOG_INFO("NET",
                        "update broadcast sent; not all I/O boards may have "
                        "an update");
    }
    return r;
  }

  ByteChannel& port() noexcept { return *port_; }

 private:
  NetChannel(std::unique_ptr<ByteChannel> port, Clock& clock,
             uint32_t read_timeout_ms)
      : port_(std::move(port)),
        clock_(&clock),
        read_timeout_ms_(read_timeout_ms) {}

  std::unique_ptr<ByteChannel> port_;
  Clock* clock_;
  uint32_t read_timeout_ms_ = kNetReadTimeoutMs;
};

}  // namespace pinflash

#endif  // PINFLASH_NET_CHANNEL_HPP_

/**
 * @file exp_channel.hpp
 * @brief EXP (expansion) bus channel: board enumeration over the fixed
 *        address map and addressed firmware update.
 */

#ifndef PINFLASH_EXP_CHANNEL_HPP_
#define PINFLASH_EXP_CHANNEL_HPP_

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
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace pinflash {

static constexpr uint32_t kExpQuerySettleMs = 10U;
static constexpr uint32_t kExpInterQueryMs = 5U;
static constexpr uint32_t kExpRecordPacingMs = 200U;

/// One responding EXP board.
struct BoardInfo {
  std::string address;
  std::string board_name;
  std::string version;
  /// Catalog versions for this board, ascending; empty optional if the
  /// catalog has no entry for it.
  optional<std::vector<std::string>> available_versions;
};

// ============================================================================
// ExpChannel
// ============================================================================

class ExpChannel {
 public:
  /**
   * @param port Opened EXP port. The channel takes exclusive ownership.
   * @param clock Time source for settle delays and deadlines.
   */
  explicit ExpChannel(std::unique_ptr<ByteChannel> port,
                      Clock& clock = SystemClock::Instance())
      : port_(std::move(port)), clock_(&clock) {}

  ExpChannel(ExpChannel&&) = default;
  ExpChannel& operator=(ExpChannel&&) = default;
  ExpChannel(const ExpChannel&) = delete;
  ExpChannel& operator=(const ExpChannel&) = delete;

  /// @brief Open @p port_name with the EXP line settings.
  static expected<ExpChannel, SerialError> Open(
      const std::string& port_name, uint32_t baud = kBusBaudRate,
      Clock& clock = SystemClock::Instance()) {
    std::unique_ptr<ByteChannel> port = std::make_unique<SerialPort>(
        MakeBusConfig(port_name, kExpReadTimeoutMs, baud));
    auto r = port->Open();
    if (!r) {
      PINFLASH_LOG_ERROR("EXP", "cannot open %s: %s", port_name.c_str(),
                         SerialErrorName(r.get_error()));
      return expected<ExpChannel, SerialError>::error(r.get_error());
    }
    return expected<ExpChannel, SerialError>::success(
        ExpChannel(std::move(port), clock));
  }

  /// @brief Flash profile for the board at @p address.
  static FlashProfile Profile(const std::string& address) {
    FlashProfile p;
    p.tag = "EXP";
    p.read_timeout_ms = kExpReadTimeoutMs;
    p.select_command = ExpSelectCommand(address);
    p.select_settle_ms = kSelectSettleMs;
    p.record_pacing_ms = kExpRecordPacingMs;
    p.ack_token = kExpBootloaderToken;
    p.ack_deadline_ms = kAckDeadlineMs;
    p.identity_command = ExpIdCommand(address);
    p.id_prefix = kExpIdLinePrefix;
    p.version_rule = VersionRule::kTrimTrailing;
    p.verify_deadline_ms = kVerifyDeadlineMs;
    return p;
  }

  /**
   * @brief Query every address of the EXP map and collect the boards that
   *        answer with a parseable identity.
   */
  std::vector<BoardInfo> Enumerate(FirmwareCatalog& catalog) {
    std::vector<BoardInfo> boards;
    DrainInput(*port_, kExpReadTimeoutMs);

    for (const BoardAddressEntry& entry : kExpAddressMap) {
      auto sent = SendText(*port_, ExpIdCommand(entry.address));
      if (!sent) {
        PINFLASH_LOG_DEBUG("EXP", "ID@%s: send failed (%s)", entry.address,
                           SerialErrorName(sent.get_error()));
      }
      clock_->SleepMs(kExpQuerySettleMs);

      const std::string reply = ReceiveText(*port_, kExpReadTimeoutMs);
      auto id = ParseIdLine(reply);
      if (id.has_value()) {
        BoardInfo info;
        info.address = entry.address;
        info.board_name = id->board.empty() ? std::string(entry.board_type)
                                            : id->board;
        info.version = id->version;
        info.available_versions =
            LookupVersions(catalog, CatalogKey(info.board_name, id->protocol),
                           CatalogKey(entry.board_type, id->protocol));
        PINFLASH_LOG_DEBUG("EXP", "%s: %s %s", entry.address,
                           info.board_name.c_str(), info.version.c_str());
        boards.push_back(std::move(info));
      }
      clock_->SleepMs(kExpInterQueryMs);
    }
    return boards;
  }

  /**
   * @brief Flash the board at @p address with catalog @p version and verify
   *        its reported identity afterwards.
   */
  expected<FlashReport, FlashError> UpdateFirmware(
      FirmwareCatalog& catalog, const std::string& address,
      const std::string& version, const ProgressFn& progress = nullptr) {
    using R = expected<FlashReport, FlashError>;
    auto board_type = BoardTypeForAddress(address);
    if (!board_type.has_value()) {
      PINFLASH_LOG_ERROR("EXP", "unknown EXP board address: %s",
                         address.c_str());
      return R::error(FlashError::kUnknownBoardAddress);
    }
    std::string addr = address;
    for (char& c : addr) c = detail::AsciiUpper(c);

    const std::string normalized = NormalizeVersion(version);
    const std::string key = CatalogKey(*board_type, ProtocolKind::kExp);
    auto path = catalog.Find(key, normalized);
    if (!path.has_value()) {
      PINFLASH_LOG_ERROR("EXP",
                         "firmware not found for key '%s' version '%s', "
                         "available: %s",
                         key.c_str(), normalized.c_str(),
                         detail::JoinVersions(catalog.Versions(key)).c_str());
      return R::error(FlashError::kFirmwareNotFound);
    }

    PINFLASH_LOG_INFO("EXP", "updating %s at %s to %s", board_type->c_str(),
                      addr.c_str(), normalized.c_str());
    FlashProcedure proc(*port_, *clock_, Profile(addr));
    return proc.Run(addr, *path, *board_type, normalized, progress);
  }

  ByteChannel& port() noexcept { return *port_; }

 private:
  static optional<std::vector<std::string>> LookupVersions(
      FirmwareCatalog& catalog, const std::string& key,
      const std::string& fallback_key) {
    if (catalog.HasKey(key)) return catalog.Versions(key);
    if (catalog.HasKey(fallback_key)) return catalog.Versions(fallback_key);
    return {};
  }

  std::unique_ptr<ByteChannel> port_;
  Clock* clock_;
};

}  // namespace pinflash

#endif  // PINFLASH_EXP_CHANNEL_HPP_

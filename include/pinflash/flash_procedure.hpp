/**
 * @file flash_procedure.hpp
 * @brief Select -> stream -> await bootloader ack -> verify, shared by the
 *        EXP and NET channels.
 *
 * A FlashProfile captures everything that differs between the two buses:
 * target selection, record pacing, bootloader token, identity query and
 * its reply prefix, version post-processing and an optional command sent
 * once verification is over.
 *
 * Phase flow:
 *   kIdle -> kAddressSelected -> kStreaming -> kAwaitingBootloaderAck
 *         -> kVerifying -> {kVerified | kMismatch | kUnparseable | kTimedOut}
 *
 * Streaming is not retried: a file or serial error aborts the session. A
 * missing bootloader ack or a failed verification is reported in the
 * FlashReport, never as an error.
 */

#ifndef PINFLASH_FLASH_PROCEDURE_HPP_
#define PINFLASH_FLASH_PROCEDURE_HPP_

#include "pinflash/byte_channel.hpp"
#include "pinflash/log.hpp"
#include "pinflash/poll.hpp"
#include "pinflash/response_parser.hpp"
#include "pinflash/vocabulary.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include <sys/stat.h>

namespace pinflash {

// ============================================================================
// Errors and phases
// ============================================================================

enum class FlashError : uint8_t {
  kUnknownBoardAddress,
  kFirmwareNotFound,
  kIoErrorDuringStream,
  kSendFailed,
  kPortNotOpen,
};

inline const char* FlashErrorName(FlashError e) noexcept {
  switch (e) {
    case FlashError::kUnknownBoardAddress:
      return "unknown board address";
    case FlashError::kFirmwareNotFound:
      return "firmware not found";
    case FlashError::kIoErrorDuringStream:
      return "I/O error during stream";
    case FlashError::kSendFailed:
      return "send failed";
    case FlashError::kPortNotOpen:
      return "port not open";
  }
  return "unknown";
}

enum class FlashPhase : uint8_t {
  kIdle = 0,
  kAddressSelected,
  kStreaming,
  kAwaitingBootloaderAck,
  kVerifying,
  kVerified,
  kMismatch,
  kUnparseable,
  kTimedOut,
};

inline const char* FlashPhaseName(FlashPhase p) noexcept {
  switch (p) {
    case FlashPhase::kIdle:
      return "idle";
    case FlashPhase::kAddressSelected:
      return "address-selected";
    case FlashPhase::kStreaming:
      return "streaming";
    case FlashPhase::kAwaitingBootloaderAck:
      return "awaiting-bootloader-ack";
    case FlashPhase::kVerifying:
      return "verifying";
    case FlashPhase::kVerified:
      return "verified";
    case FlashPhase::kMismatch:
      return "mismatch";
    case FlashPhase::kUnparseable:
      return "unparseable";
    case FlashPhase::kTimedOut:
      return "timed-out";
  }
  return "?";
}

/// Result of comparing the post-flash identity reply with the expectation.
enum class VerifyOutcome : uint8_t {
  kVerified = 0,
  kBoardMismatch,
  kVersionMismatch,
  kBoardAndVersionMismatch,
  kUnparseable,  ///< Text arrived but no usable identity line.
  kNoReply,      ///< Nothing arrived before the verify deadline.
};

inline const char* VerifyOutcomeName(VerifyOutcome v) noexcept {
  switch (v) {
    case VerifyOutcome::kVerified:
      return "verified";
    case VerifyOutcome::kBoardMismatch:
      return "board mismatch";
    case VerifyOutcome::kVersionMismatch:
      return "version mismatch";
    case VerifyOutcome::kBoardAndVersionMismatch:
      return "board and version mismatch";
    case VerifyOutcome::kUnparseable:
      return "unparseable";
    case VerifyOutcome::kNoReply:
      return "no reply";
  }
  return "?";
}

// ============================================================================
// Profile / session / report
// ============================================================================

static constexpr uint32_t kSelectSettleMs = 10U;
static constexpr uint32_t kAckDeadlineMs = 30000U;
static constexpr uint32_t kVerifyDeadlineMs = 5000U;

struct FlashProfile {
  const char* tag = "FLASH";  ///< Log tag.
  uint32_t read_timeout_ms = kPollReadTimeoutMs;

  /// Target selection command; empty means "drain input instead".
  std::string select_command;
  uint32_t select_settle_ms = kSelectSettleMs;

  uint32_t record_pacing_ms = 200U;

  const char* ack_token   = "";
  uint32_t ack_deadline_ms = kAckDeadlineMs;

  std::string identity_command;
  const char* id_prefix    = "";
  VersionRule version_rule = VersionRule::kTrimTrailing;
  uint32_t verify_deadline_ms = kVerifyDeadlineMs;

  /// Sent once after verification regardless of outcome; empty for none.
  std::string post_verify_command;
};

/// Live state of one flash attempt.
struct FlashSession {
  std::string target;  ///< Bus address, empty on NET.
  std::string path;
  uint64_t total_bytes = 0;
  uint64_t bytes_sent  = 0;
  uint32_t records     = 0;
  FlashPhase phase     = FlashPhase::kIdle;
};

struct FlashReport {
  FlashPhase phase        = FlashPhase::kIdle;
  VerifyOutcome outcome   = VerifyOutcome::kNoReply;
  uint64_t bytes_sent     = 0;
  uint64_t total_bytes    = 0;
  bool bootloader_acked   = false;
  optional<std::string> id_line;
  optional<std::string> board;
  optional<std::string> version;
  std::string reply;  ///< Raw identity reply text.

  bool Verified() const noexcept { return outcome == VerifyOutcome::kVerified; }
};

/// Progress callback: (bytes sent so far, total bytes; 0 if unknown).
using ProgressFn = std::function<void(uint64_t sent, uint64_t total)>;

// ============================================================================
// Verification
// ============================================================================

/**
 * @brief Compare a parsed identity reply with the expected board/version.
 *
 * @p reply_empty distinguishes "nothing arrived" from "garbage arrived".
 */
inline VerifyOutcome ClassifyVerify(const VerifyParse& parsed,
                                    bool reply_empty,
                                    const std::string& expected_board,
                                    const std::string& expected_version) {
  if (!parsed.board.has_value() || !parsed.version.has_value()) {
    return reply_empty ? VerifyOutcome::kNoReply : VerifyOutcome::kUnparseable;
  }
  const bool board_ok = (*parsed.board == expected_board);
  const bool version_ok = (*parsed.version == expected_version);
  if (board_ok && version_ok) return VerifyOutcome::kVerified;
  if (!board_ok && !version_ok) return VerifyOutcome::kBoardAndVersionMismatch;
  return board_ok ? VerifyOutcome::kVersionMismatch
                  : VerifyOutcome::kBoardMismatch;
}

inline FlashPhase PhaseForOutcome(VerifyOutcome v) noexcept {
  switch (v) {
    case VerifyOutcome::kVerified:
      return FlashPhase::kVerified;
    case VerifyOutcome::kBoardMismatch:
    case VerifyOutcome::kVersionMismatch:
    case VerifyOutcome::kBoardAndVersionMismatch:
      return FlashPhase::kMismatch;
    case VerifyOutcome::kUnparseable:
      return FlashPhase::kUnparseable;
    case VerifyOutcome::kNoReply:
      return FlashPhase::kTimedOut;
  }
  return FlashPhase::kUnparseable;
}

// ============================================================================
// FlashProcedure
// ============================================================================

class FlashProcedure {
 public:
  FlashProcedure(ByteChannel& ch, Clock& clock, FlashProfile profile)
      : ch_(ch), clock_(clock), profile_(std::move(profile)) {}

  /**
   * @brief Run one flash attempt.
   *
   * @param target Bus address for log lines, empty on NET.
   * @param path Firmware image, streamed as '\r'-terminated records.
   * @param expected_board Board name the identity reply must carry.
   * @param expected_version Canonical version the reply must carry.
   * @param progress Optional progress callback, called after every record.
   */
  expected<FlashReport, FlashError> Run(const std::string& target,
                                        const std::string& path,
                                        const std::string& expected_board,
                                        const std::string& expected_version,
                                        const ProgressFn& progress = nullptr) {
    using R = expected<FlashReport, FlashError>;
    session_ = FlashSession();
    session_.target = target;
    session_.path = path;

    if (!ch_.IsOpen()) {
      PINFLASH_LOG_ERROR(profile_.tag, "%s: port not open", ch_.Name());
      return R::error(FlashError::kPortNotOpen);
    }

    // -- select --
    if (!profile_.select_command.empty()) {
      if (!SendText(ch_, profile_.select_command)) {
        PINFLASH_LOG_ERROR(profile_.tag, "select %s: send failed",
                           target.c_str());
        return Abort(FlashError::kSendFailed);
      }
      clock_.SleepMs(profile_.select_settle_ms);
    }
    DrainInput(ch_, profile_.read_timeout_ms);
    session_.phase = FlashPhase::kAddressSelected;

    // -- stream --
    session_.phase = FlashPhase::kStreaming;
    auto streamed = Stream(progress);
    if (!streamed) return Abort(streamed.get_error());

    FlashReport report;
    report.bytes_sent = session_.bytes_sent;
    report.total_bytes = session_.total_bytes;

    // -- bootloader ack --
    session_.phase = FlashPhase::kAwaitingBootloaderAck;
    PollResult ack = PollForToken(ch_, clock_, profile_.ack_deadline_ms,
                                  profile_.ack_token, profile_.read_timeout_ms);
    report.bootloader_acked = ack.matched;
    if (ack.matched) {
      PINFLASH_LOG_INFO(profile_.tag, "bootloader reported completion: %s",
                        profile_.ack_token);
    } else {
      PINFLASH_LOG_WARN(profile_.tag,
                        "timed out waiting for %s after %u ms, "
                        "proceeding to ID check",
                        profile_.ack_token, profile_.ack_deadline_ms);
    }

    // -- verify --
    session_.phase = FlashPhase::kVerifying;
    DrainInput(ch_, profile_.read_timeout_ms);
    if (!SendText(ch_, profile_.identity_command)) {
      PINFLASH_LOG_ERROR(profile_.tag, "identity query: send failed");
      return Abort(FlashError::kSendFailed);
    }
    PollResult id = PollUntil(
        ch_, clock_, profile_.verify_deadline_ms,
        [this](const std::string& text) { return HasIdentityLine(text); },
        profile_.read_timeout_ms);
    report.reply = id.text;
    PINFLASH_LOG_DEBUG(profile_.tag, "ID response: %s", id.text.c_str());

    VerifyParse parsed = ParseVerifyReply(id.text, profile_.id_prefix,
                                          profile_.version_rule);
    report.id_line = parsed.line;
    report.board = parsed.board;
    report.version = parsed.version;
    report.outcome = ClassifyVerify(parsed, id.text.empty(), expected_board,
                                    expected_version);
    report.phase = PhaseForOutcome(report.outcome);
    session_.phase = report.phase;
    LogOutcome(report, target, expected_board, expected_version);

    if (!profile_.post_verify_command.empty()) {
      if (!SendText(ch_, profile_.post_verify_command)) {
        PINFLASH_LOG_WARN(profile_.tag, "post-verify command not sent");
      }
    }
    return R::success(std::move(report));
  }

  const FlashSession& session() const noexcept { return session_; }
  const FlashProfile& profile() const noexcept { return profile_; }

 private:
  expected<FlashReport, FlashError> Abort(FlashError e) const {
    PINFLASH_LOG_ERROR(profile_.tag, "flash aborted during %s: %s",
                       FlashPhaseName(session_.phase), FlashErrorName(e));
    return expected<FlashReport, FlashError>::error(e);
  }

  /// True once a terminated line with the identity prefix carries both
  /// board and version.
  bool HasIdentityLine(const std::string& text) const {
    const size_t end = text.find_last_of("\r\n");
    if (end == std::string::npos) return false;
    return ParseVerifyReply(text.substr(0, end), profile_.id_prefix,
                            profile_.version_rule)
        .version.has_value();
  }

  expected<void, FlashError> Stream(const ProgressFn& progress) {
    using R = expected<void, FlashError>;
    std::FILE* fp = std::fopen(session_.path.c_str(), "rb");
    if (fp == nullptr) {
      PINFLASH_LOG_ERROR(profile_.tag, "cannot open firmware file %s: %s",
                         session_.path.c_str(), std::strerror(errno));
      return R::error(FlashError::kIoErrorDuringStream);
    }
    PINFLASH_SCOPE_EXIT(std::fclose(fp));

    struct stat st;
    if (::fstat(fileno(fp), &st) == 0 && st.st_size > 0) {
      session_.total_bytes = static_cast<uint64_t>(st.st_size);
    }
    PINFLASH_LOG_INFO(profile_.tag, "flashing %s (%llu bytes)",
                      session_.path.c_str(),
                      static_cast<unsigned long long>(session_.total_bytes));

    std::vector<uint8_t> record;
    record.reserve(1024);
    for (;;) {
      record.clear();
      int c;
      while ((c = std::fgetc(fp)) != EOF) {
        record.push_back(static_cast<uint8_t>(c));
        if (c == '\r') break;
      }
      if (std::ferror(fp)) {
        PINFLASH_LOG_ERROR(profile_.tag,
                           "read error in %s after %llu bytes: %s",
                           session_.path.c_str(),
                           static_cast<unsigned long long>(session_.bytes_sent),
                           std::strerror(errno));
        return R::error(FlashError::kIoErrorDuringStream);
      }
      if (record.empty()) break;

      auto w = ch_.Write(record.data(), static_cast<uint32_t>(record.size()));
      if (w) w = ch_.Flush();
      if (!w) {
        PINFLASH_LOG_ERROR(profile_.tag, "%s: write failed at %llu bytes (%s)",
                           ch_.Name(),
                           static_cast<unsigned long long>(session_.bytes_sent),
                           SerialErrorName(w.get_error()));
        return R::error(FlashError::kSendFailed);
      }
      session_.bytes_sent += record.size();
      ++session_.records;
      if (progress) progress(session_.bytes_sent, session_.total_bytes);
      clock_.SleepMs(profile_.record_pacing_ms);
    }
    PINFLASH_LOG_INFO(profile_.tag, "sent %llu bytes in %u records",
                      static_cast<unsigned long long>(session_.bytes_sent),
                      session_.records);
    return R::success();
  }

  void LogOutcome(const FlashReport& r, const std::string& target,
                  const std::string& expected_board,
                  const std::string& expected_version) const {
    const char* line = r.id_line.has_value() ? r.id_line->c_str() : "";
    switch (r.outcome) {
      case VerifyOutcome::kVerified:
        PINFLASH_LOG_INFO(profile_.tag,
                          "firmware update verified: board %s reports "
                          "version %s%s%s",
                          expected_board.c_str(), expected_version.c_str(),
                          target.empty() ? "" : " at address ",
                          target.c_str());
        return;
      case VerifyOutcome::kBoardMismatch:
      case VerifyOutcome::kVersionMismatch:
      case VerifyOutcome::kBoardAndVersionMismatch:
        if (r.outcome != VerifyOutcome::kVersionMismatch) {
          PINFLASH_LOG_WARN(profile_.tag,
                            "ID board mismatch: expected '%s', got '%s' "
                            "(line: %s)",
                            expected_board.c_str(), r.board->c_str(), line);
        }
        if (r.outcome != VerifyOutcome::kBoardMismatch) {
          PINFLASH_LOG_WARN(profile_.tag,
                            "firmware version mismatch: expected '%s', "
                            "got '%s' (line: %s)",
                            expected_version.c_str(), r.version->c_str(),
                            line);
        }
        return;
      case VerifyOutcome::kUnparseable:
        if (r.id_line.has_value()) {
          PINFLASH_LOG_WARN(profile_.tag,
                            "could not parse board/version from ID line: %s",
                            line);
        } else {
          PINFLASH_LOG_WARN(profile_.tag,
                            "no '%s' line in response; cannot verify "
                            "version %s for board %s",
                            profile_.id_prefix, expected_version.c_str(),
                            expected_board.c_str());
        }
        return;
      case VerifyOutcome::kNoReply:
        PINFLASH_LOG_WARN(profile_.tag,
                          "no ID response within %u ms; cannot verify "
                          "version %s for board %s",
                          profile_.verify_deadline_ms,
                          expected_version.c_str(), expected_board.c_str());
        return;
    }
  }

  ByteChannel& ch_;
  Clock& clock_;
  FlashProfile profile_;
  FlashSession session_;
};

}  // namespace pinflash

#endif  // PINFLASH_FLASH_PROCEDURE_HPP_

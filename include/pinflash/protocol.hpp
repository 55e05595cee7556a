/**
 * @file protocol.hpp
 * @brief FAST serial bus definitions: protocol kinds, EXP address map,
 *        command builders and bootloader tokens.
 *
 * Command format (ASCII, every command ends with '\r'):
 *   ID:              identify the board on the port (either bus)
 *   ID@{addr}:       identify the EXP board at hex address {addr}
 *   ea:{addr}        select EXP board {addr} as firmware target
 *   NN:{nn}          query NET node {nn} (two decimal digits)
 *   bn:aa55          broadcast firmware update to NET I/O boards
 */

#ifndef PINFLASH_PROTOCOL_HPP_
#define PINFLASH_PROTOCOL_HPP_

#include "pinflash/vocabulary.hpp"

#include <cstdint>
#include <cstdio>
#include <string>

namespace pinflash {

// ============================================================================
// ProtocolKind
// ============================================================================

enum class ProtocolKind : uint8_t {
  kNet = 0,
  kExp = 1,
};

inline const char* ProtocolName(ProtocolKind kind) noexcept {
  switch (kind) {
    case ProtocolKind::kNet:
      return "NET";
    case ProtocolKind::kExp:
      return "EXP";
  }
  return "?";
}

// ============================================================================
// Line configuration
// ============================================================================

static constexpr uint32_t kBusBaudRate = 921600U;
static constexpr uint32_t kProbeReadTimeoutMs = 5U;
static constexpr uint32_t kExpReadTimeoutMs = 5U;
static constexpr uint32_t kNetReadTimeoutMs = 200U;

/// Upper bound for a single receive / probe reply.
static constexpr uint32_t kReplyCap = 256U;

// ============================================================================
// Tokens
// ============================================================================

static constexpr const char kIdPrefix[] = "ID:";
static constexpr const char kNodePrefix[] = "NN:";
static constexpr const char kNodeNotFound[] = "!Node Not Found!";

static constexpr const char kExpBootloaderToken[] = "!BL2040:02";
static constexpr const char kNetBootloaderToken[] = "!B:02";

static constexpr const char kExpIdLinePrefix[] = "ID:EXP";
static constexpr const char kNetIdLinePrefix[] = "ID:NET";

static constexpr const char kNetBoardType[] = "FP-CPU-2000";
static constexpr const char kNetCatalogKey[] = "FP-CPU-2000_NET";
static constexpr const char kNetBroadcastCmd[] = "bn:aa55\r";
static constexpr const char kIdentifyCmd[] = "ID:\r";

/// Node id used for the NET controller itself in node listings.
static constexpr const char kControllerNodeId[] = "NC";

// ============================================================================
// EXP address map
// ============================================================================

struct BoardAddressEntry {
  const char* address;     ///< Upper-case hex bus address.
  const char* board_type;  ///< Board model name.
};

static constexpr uint32_t kExpAddressCount = 25U;

static constexpr BoardAddressEntry kExpAddressMap[kExpAddressCount] = {
    {"48", "FP-CPU-2000"},  // Neuron built-in EXP
    {"D0", "FP-EXP-0051"}, {"D1", "FP-EXP-0051"},
    {"D2", "FP-EXP-0051"}, {"D3", "FP-EXP-0051"},
    {"90", "FP-EXP-0061"}, {"91", "FP-EXP-0061"},
    {"92", "FP-EXP-0061"}, {"93", "FP-EXP-0061"},
    {"B4", "FP-EXP-0071"}, {"B5", "FP-EXP-0071"},
    {"B6", "FP-EXP-0071"}, {"B7", "FP-EXP-0071"},
    {"84", "FP-EXP-0081"}, {"85", "FP-EXP-0081"},
    {"86", "FP-EXP-0081"}, {"87", "FP-EXP-0081"},
    {"88", "FP-EXP-0091"}, {"89", "FP-EXP-0091"},
    {"8A", "FP-EXP-0091"}, {"8B", "FP-EXP-0091"},
    {"30", "FP-EXP-1313"}, {"31", "FP-EXP-1313"},
    {"32", "FP-EXP-1313"}, {"33", "FP-EXP-1313"},
};

namespace detail {

inline char AsciiUpper(char c) noexcept {
  return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 32) : c;
}

}  // namespace detail

/**
 * @brief Look up the board model for an EXP bus address (case-insensitive).
 * @return Board type, or empty optional for an address not in the map.
 */
inline optional<std::string> BoardTypeForAddress(const std::string& address) {
  for (const BoardAddressEntry& entry : kExpAddressMap) {
    const char* a = entry.address;
    size_t i = 0;
    while (a[i] != '\0' && i < address.size() &&
           detail::AsciiUpper(address[i]) == a[i]) {
      ++i;
    }
    if (a[i] == '\0' && i == address.size()) {
      return std::string(entry.board_type);
    }
  }
  return {};
}

/// @brief Catalog key "{BoardType}_{Protocol}".
inline std::string CatalogKey(const std::string& board_type,
                              const std::string& protocol) {
  return board_type + "_" + protocol;
}

inline std::string CatalogKey(const std::string& board_type,
                              ProtocolKind kind) {
  return CatalogKey(board_type, std::string(ProtocolName(kind)));
}

// ============================================================================
// Command builders
// ============================================================================

inline std::string ExpIdCommand(const std::string& address) {
  return "ID@" + address + ":\r";
}

inline std::string ExpSelectCommand(const std::string& address) {
  return "ea:" + address + "\r";
}

inline std::string NodeQueryCommand(uint32_t index) {
  char buf[16];
  (void)std::snprintf(buf, sizeof(buf), "NN:%02u\r", index);
  return std::string(buf);
}

}  // namespace pinflash

#endif  // PINFLASH_PROTOCOL_HPP_

/**
 * @file cli.hpp
 * @brief Command-line front end pieces: mode table, option parsing,
 *        interactive prompts and listing output.
 *
 * All I/O goes through FILE* so prompts and listings run against
 * in-memory streams in tests.
 */

#ifndef PINFLASH_CLI_HPP_
#define PINFLASH_CLI_HPP_

#include "pinflash/exp_channel.hpp"
#include "pinflash/response_parser.hpp"
#include "pinflash/version.hpp"
#include "pinflash/vocabulary.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace pinflash {

// ============================================================================
// Modes
// ============================================================================

enum class Mode : uint8_t {
  kListAll = 0,
  kListExp,
  kListNet,
  kUpdateExp,
  kUpdateNet,
  kGetLatestFirmware,
  kHelp,
};

struct ModeEntry {
  Mode mode;
  const char* names[4];  ///< Primary name first; unused slots are nullptr.
  const char* help;
  bool needs_hardware;
};

static constexpr ModeEntry kModes[] = {
    {Mode::kListAll, {"list", "all", nullptr, nullptr},
     "List both EXP and NET boards (default)", true},
    {Mode::kListExp, {"list-exp", "exp", nullptr, nullptr},
     "List connected EXP boards and their versions", true},
    {Mode::kListNet, {"list-net", "net", nullptr, nullptr},
     "List connected NET nodes and their versions", true},
    {Mode::kUpdateExp, {"update-exp", "update", "flash", nullptr},
     "Select an EXP board and flash a chosen version", true},
    {Mode::kUpdateNet, {"update-net", "flash-net", "net-update", nullptr},
     "Flash the NET (CPU) firmware", true},
    {Mode::kGetLatestFirmware,
     {"get-latest-firmware", "check-updates", "download-firmware", "check"},
     "Download the latest firmware files", false},
    {Mode::kHelp, {"help", "-h", "--help", nullptr}, "Show this help", false},
};

namespace detail {

inline bool CaseEqual(const char* a, const char* b) noexcept {
  while (*a != '\0' && *b != '\0') {
    if (AsciiUpper(*a) != AsciiUpper(*b)) return false;
    ++a;
    ++b;
  }
  return *a == *b;
}

}  // namespace detail

/// @brief Resolve a mode name or alias (case-insensitive).
inline optional<Mode> LookupMode(const char* name) {
  for (const ModeEntry& entry : kModes) {
    for (const char* alias : entry.names) {
      if (alias != nullptr && detail::CaseEqual(alias, name)) {
        return entry.mode;
      }
    }
  }
  return {};
}

inline const ModeEntry& ModeInfo(Mode mode) {
  for (const ModeEntry& entry : kModes) {
    if (entry.mode == mode) return entry;
  }
  return kModes[0];
}

// ============================================================================
// Options
// ============================================================================

struct CliOptions {
  Mode mode = Mode::kListAll;
  std::string config_path;  ///< Empty: use the default location if present.
  bool verbose = false;
  bool unknown_mode = false;  ///< Mode word not recognized; listing instead.
  std::string mode_word;
};

enum class CliError : uint8_t {
  kMissingValue,
  kUnknownOption,
  kExtraArgument,
};

inline const char* CliErrorName(CliError e) noexcept {
  switch (e) {
    case CliError::kMissingValue:
      return "option requires a value";
    case CliError::kUnknownOption:
      return "unknown option";
    case CliError::kExtraArgument:
      return "unexpected extra argument";
  }
  return "unknown";
}

/**
 * @brief Parse "[--config file] [--verbose] [mode]".
 *
 * An unrecognized mode word falls back to the default listing and sets
 * CliOptions::unknown_mode. "-h" / "--help" are modes, not options.
 */
inline expected<CliOptions, CliError> ParseArgs(int argc,
                                                const char* const argv[]) {
  using R = expected<CliOptions, CliError>;
  CliOptions opts;
  bool have_mode = false;
  for (int i = 1; i < argc; ++i) {
    const char* arg = argv[i];
    if (std::string(arg) == "--config" || std::string(arg) == "-c") {
      if (i + 1 >= argc) return R::error(CliError::kMissingValue);
      opts.config_path = argv[++i];
      continue;
    }
    if (std::string(arg) == "--verbose" || std::string(arg) == "-v") {
      opts.verbose = true;
      continue;
    }
    auto mode = LookupMode(arg);
    if (arg[0] == '-' && !mode.has_value()) {
      return R::error(CliError::kUnknownOption);
    }
    if (have_mode) return R::error(CliError::kExtraArgument);
    have_mode = true;
    opts.mode_word = arg;
    if (mode.has_value()) {
      opts.mode = *mode;
    } else {
      opts.mode = Mode::kListAll;
      opts.unknown_mode = true;
    }
  }
  return R::success(std::move(opts));
}

inline void PrintUsage(std::FILE* out, const char* program) {
  std::fprintf(out, "%s - FAST Pinball firmware utility\n", program);
  std::fprintf(out, "Usage: %s [--config FILE] [--verbose] [MODE]\n\n",
               program);
  std::fprintf(out, "Modes:\n");
  for (const ModeEntry& entry : kModes) {
    std::string names = entry.names[0];
    for (size_t i = 1; i < 4U && entry.names[i] != nullptr; ++i) {
      names += " | ";
      names += entry.names[i];
    }
    std::fprintf(out, "  %-58s\n      %s\n", names.c_str(), entry.help);
  }
}

// ============================================================================
// Prompts
// ============================================================================

/// @brief Read one line from @p in with surrounding whitespace removed.
inline std::string ReadLineTrimmed(std::FILE* in) {
  std::string line;
  char buf[256];
  while (std::fgets(buf, sizeof(buf), in) != nullptr) {
    line += buf;
    if (!line.empty() && line.back() == '\n') break;
  }
  return detail::Trim(line);
}

enum class ChoiceStatus : uint8_t {
  kSelected = 0,
  kCanceled,
  kInvalid,
  kOutOfRange,
};

struct Choice {
  ChoiceStatus status = ChoiceStatus::kInvalid;
  size_t index = 0;  ///< Zero-based, valid when kSelected.
};

/// @brief Interpret a 1-based menu answer; "0" cancels.
inline Choice ParseChoice(const std::string& text, size_t count) {
  Choice c;
  uint32_t n = 0;
  if (!ParseUnsigned(text, n)) return c;
  if (n == 0U) {
    c.status = ChoiceStatus::kCanceled;
  } else if (n > count) {
    c.status = ChoiceStatus::kOutOfRange;
  } else {
    c.status = ChoiceStatus::kSelected;
    c.index = n - 1U;
  }
  return c;
}

/// @brief Ask for a menu number and report the outcome on @p out.
inline Choice PromptChoice(std::FILE* in, std::FILE* out, const char* what,
                           size_t count) {
  std::fprintf(out, "Enter %s (1-%zu), or 0 to cancel: ", what, count);
  std::fflush(out);
  Choice c = ParseChoice(ReadLineTrimmed(in), count);
  switch (c.status) {
    case ChoiceStatus::kSelected:
      break;
    case ChoiceStatus::kCanceled:
      std::fprintf(out, "Canceled.\n");
      break;
    case ChoiceStatus::kInvalid:
      std::fprintf(out, "Invalid selection.\n");
      break;
    case ChoiceStatus::kOutOfRange:
      std::fprintf(out, "Out of range.\n");
      break;
  }
  return c;
}

inline bool IsYes(const std::string& answer) {
  return answer == "y" || answer == "Y" || answer == "yes" ||
         answer == "YES";
}

/// @brief "Proceed? [y/N]: " - anything but yes cancels.
inline bool PromptConfirm(std::FILE* in, std::FILE* out) {
  std::fprintf(out, "Proceed? [y/N]: ");
  std::fflush(out);
  if (IsYes(ReadLineTrimmed(in))) return true;
  std::fprintf(out, "Canceled.\n");
  return false;
}

/// @brief Versions sorted newest first by numeric (major, minor).
inline std::vector<std::string> NewestFirst(std::vector<std::string> versions) {
  std::sort(versions.begin(), versions.end(), VersionLess);
  std::reverse(versions.begin(), versions.end());
  return versions;
}

/**
 * @brief Print a numbered version menu, marking the one equal to
 *        @p installed (after normalization).
 */
inline void PrintVersionMenu(std::FILE* out,
                             const std::vector<std::string>& versions,
                             const std::string& installed) {
  const std::string current = NormalizeVersion(installed);
  for (size_t i = 0; i < versions.size(); ++i) {
    std::fprintf(out, "  %zu) %s%s\n", i + 1U, versions[i].c_str(),
                 (!current.empty() && versions[i] == current) ? "  (installed)"
                                                              : "");
  }
}

// ============================================================================
// Listings
// ============================================================================

inline void PrintExpBoards(std::FILE* out,
                           const std::vector<BoardInfo>& boards) {
  if (boards.empty()) {
    std::fprintf(out, "No EXP boards found.\n");
    return;
  }
  std::fprintf(out, "EXP boards:\n");
  for (const BoardInfo& b : boards) {
    std::fprintf(out, "  Address %s -> %s (version %s)\n", b.address.c_str(),
                 b.board_name.c_str(), b.version.c_str());
  }
}

inline void PrintNetNodes(std::FILE* out,
                          const std::map<uint32_t, NodeInfo>& nodes) {
  if (nodes.empty()) {
    std::fprintf(out, "No NET boards found.\n");
    return;
  }
  std::fprintf(out, "NET nodes:\n");
  for (const auto& kv : nodes) {
    std::fprintf(out, "  Node %s (%s) -> firmware %s\n",
                 kv.second.node_id.c_str(), kv.second.node_name.c_str(),
                 kv.second.firmware.c_str());
  }
}

}  // namespace pinflash

#endif  // PINFLASH_CLI_HPP_

/**
 * @file main.cpp
 * @brief pinflash: list FAST pinball boards and update their firmware.
 *
 * Flow for hardware modes:
 *   PortDiscovery -> SelectFirst -> ExpChannel + NetChannel
 *   -> FirmwareCatalog lookup -> interactive selection -> UpdateFirmware
 *
 * Exit codes:
 *   0  success (including canceled or unverified updates)
 *   1  explicit firmware download failed
 *   2  NET and EXP ports not both found
 *   64 bad command line
 *   78 settings file could not be loaded
 */

#include "pinflash/cli.hpp"
#include "pinflash/exp_channel.hpp"
#include "pinflash/firmware_catalog.hpp"
#include "pinflash/firmware_fetcher.hpp"
#include "pinflash/log.hpp"
#include "pinflash/net_channel.hpp"
#include "pinflash/port_discovery.hpp"
#include "pinflash/settings.hpp"
#include "pinflash/vocabulary.hpp"

#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitDownloadFailed = 1;
constexpr int kExitNoHardware = 2;
constexpr int kExitUsage = 64;
constexpr int kExitConfig = 78;

// ============================================================================
// Progress / reports
// ============================================================================

void PrintProgress(uint64_t sent, uint64_t total) {
  if (total > 0U) {
    std::printf("\r  sent %llu/%llu bytes (%.0f%%)",
                static_cast<unsigned long long>(sent),
                static_cast<unsigned long long>(total),
                static_cast<double>(sent) * 100.0 / static_cast<double>(total));
  } else {
    std::printf("\r  sent %llu bytes", static_cast<unsigned long long>(sent));
  }
  std::fflush(stdout);
}

void PrintReport(const pinflash::expected<pinflash::FlashReport,
                                          pinflash::FlashError>& r) {
  std::printf("\n");
  if (!r) {
    std::printf("Firmware update failed: %s\n",
                pinflash::FlashErrorName(r.get_error()));
    return;
  }
  const pinflash::FlashReport& rep = r.value();
  std::printf("Bootloader ack: %s\n", rep.bootloader_acked ? "yes" : "no");
  if (!rep.reply.empty()) {
    std::printf("ID response: %s\n",
                pinflash::detail::Trim(rep.reply).c_str());
  }
  std::printf("Result: %s\n", pinflash::VerifyOutcomeName(rep.outcome));
}

// ============================================================================
// Modes
// ============================================================================

int RunGetLatestFirmware(const pinflash::Settings& settings) {
  pinflash::ArchiveFetcher fetcher(settings.fetch);
  std::printf("Downloading firmware archive from %s ...\n",
              settings.fetch.archive_url.c_str());
  auto r = fetcher.Fetch(settings.firmware_dir);
  if (!r) {
    std::fprintf(stderr, "Failed to download firmware: %s\n",
                 pinflash::FetchErrorName(r.get_error()));
    return kExitDownloadFailed;
  }
  if (r.value() == 0U) {
    std::printf("No .txt firmware files were found in the archive.\n");
  } else {
    std::printf("Downloaded and updated %u firmware files into %s.\n",
                r.value(), settings.firmware_dir.c_str());
  }
  return kExitOk;
}

int RunUpdateExp(pinflash::ExpChannel& exp,
                 pinflash::FirmwareCatalog& catalog) {
  const std::vector<pinflash::BoardInfo> boards = exp.Enumerate(catalog);
  if (boards.empty()) {
    std::printf("No EXP boards found. Connect a board and try again.\n");
    return kExitOk;
  }
  std::printf("Select an EXP board to flash:\n");
  for (size_t i = 0; i < boards.size(); ++i) {
    std::printf("  %zu) Address %s -> %s (current %s)\n", i + 1U,
                boards[i].address.c_str(), boards[i].board_name.c_str(),
                boards[i].version.c_str());
  }
  pinflash::Choice board_sel =
      pinflash::PromptChoice(stdin, stdout, "number", boards.size());
  if (board_sel.status != pinflash::ChoiceStatus::kSelected) return kExitOk;
  const pinflash::BoardInfo& chosen = boards[board_sel.index];

  std::vector<std::string> versions = pinflash::NewestFirst(
      chosen.available_versions.value_or(std::vector<std::string>()));
  if (versions.empty()) {
    std::printf("No firmware files available for %s under %s.\n",
                chosen.board_name.c_str(), catalog.base_dir().c_str());
    return kExitOk;
  }
  std::printf("Available versions for %s (current %s):\n",
              chosen.board_name.c_str(), chosen.version.c_str());
  pinflash::PrintVersionMenu(stdout, versions, chosen.version);
  pinflash::Choice ver_sel =
      pinflash::PromptChoice(stdin, stdout, "version number", versions.size());
  if (ver_sel.status != pinflash::ChoiceStatus::kSelected) return kExitOk;
  const std::string& version = versions[ver_sel.index];

  std::printf("About to flash %s at address %s to version %s.\n",
              chosen.board_name.c_str(), chosen.address.c_str(),
              version.c_str());
  if (!pinflash::PromptConfirm(stdin, stdout)) return kExitOk;

  std::printf("Starting firmware update... This may take a few minutes.\n");
  PrintReport(exp.UpdateFirmware(catalog, chosen.address, version,
                                 &PrintProgress));
  return kExitOk;
}

int RunUpdateNet(pinflash::NetChannel& net,
                 pinflash::FirmwareCatalog& catalog) {
  std::vector<std::string> versions =
      pinflash::NewestFirst(catalog.Versions(pinflash::kNetCatalogKey));
  if (versions.empty()) {
    std::printf("No NET firmware files found under %s.\n",
                catalog.base_dir().c_str());
    return kExitOk;
  }

  std::string installed;
  for (const auto& kv : net.Enumerate()) {
    if (kv.second.node_id == pinflash::kControllerNodeId) {
      installed = kv.second.firmware;
    }
  }

  std::printf("Available NET firmware versions (newest first):\n");
  pinflash::PrintVersionMenu(stdout, versions, installed);
  pinflash::Choice sel =
      pinflash::PromptChoice(stdin, stdout, "version number", versions.size());
  if (sel.status != pinflash::ChoiceStatus::kSelected) return kExitOk;
  const std::string& version = versions[sel.index];

  std::printf("About to flash NET (CPU) to version %s.\n", version.c_str());
  if (!pinflash::PromptConfirm(stdin, stdout)) return kExitOk;

  std::printf("Starting NET firmware update... This may take a few minutes.\n");
  PrintReport(net.UpdateFirmware(catalog, version, &PrintProgress));
  return kExitOk;
}

int RunHardwareMode(pinflash::Mode mode, const pinflash::Settings& settings) {
  pinflash::PortDiscovery discovery = pinflash::PortDiscovery::ForSystem(
      settings.baud_rate, settings.probe_timeout_ms);
  const pinflash::BusPorts ports =
      pinflash::SelectFirst(discovery.Discover());
  if (!ports.Complete()) {
    std::fprintf(stderr,
                 "Could not find FAST NET/EXP serial ports. Ensure devices "
                 "are connected and accessible.\n");
    return kExitNoHardware;
  }

  auto exp = pinflash::ExpChannel::Open(*ports.exp, settings.baud_rate);
  auto net = pinflash::NetChannel::Open(*ports.net, settings.baud_rate,
                                        settings.net_timeout_ms);
  if (!exp || !net) {
    std::fprintf(stderr, "Could not open FAST NET/EXP serial ports.\n");
    return kExitNoHardware;
  }

  pinflash::ArchiveFetcher fetcher(settings.fetch);
  pinflash::FirmwareCatalog catalog(settings.firmware_dir, &fetcher);

  switch (mode) {
    case pinflash::Mode::kListExp:
      pinflash::PrintExpBoards(stdout, exp.value().Enumerate(catalog));
      return kExitOk;
    case pinflash::Mode::kListNet:
      pinflash::PrintNetNodes(stdout, net.value().Enumerate());
      return kExitOk;
    case pinflash::Mode::kUpdateExp:
      return RunUpdateExp(exp.value(), catalog);
    case pinflash::Mode::kUpdateNet:
      return RunUpdateNet(net.value(), catalog);
    case pinflash::Mode::kListAll:
    case pinflash::Mode::kGetLatestFirmware:
    case pinflash::Mode::kHelp:
      break;
  }
  pinflash::PrintExpBoards(stdout, exp.value().Enumerate(catalog));
  std::printf("\n");
  pinflash::PrintNetNodes(stdout, net.value().Enumerate());
  return kExitOk;
}

}  // namespace

int main(int argc, char* argv[]) {
  pinflash::log::Init();
  const char* program = (argc > 0) ? argv[0] : "pinflash";

  auto parsed = pinflash::ParseArgs(argc, argv);
  if (!parsed) {
    std::fprintf(stderr, "%s: %s\n\n", program,
                 pinflash::CliErrorName(parsed.get_error()));
    pinflash::PrintUsage(stderr, program);
    return kExitUsage;
  }
  const pinflash::CliOptions& opts = parsed.value();
  if (opts.mode == pinflash::Mode::kHelp) {
    pinflash::PrintUsage(stdout, program);
    return kExitOk;
  }

  const bool explicit_config = !opts.config_path.empty();
  auto settings = pinflash::LoadSettings(
      explicit_config ? opts.config_path : pinflash::DefaultSettingsPath(),
      explicit_config);
  if (!settings) return kExitConfig;
  pinflash::log::SetLevel(opts.verbose ? pinflash::log::Level::kDebug
                                       : settings.value().log_level);
  if (opts.unknown_mode) {
    PINFLASH_LOG_WARN("MAIN", "unknown mode '%s', listing boards",
                      opts.mode_word.c_str());
  }

  int rc;
  if (pinflash::ModeInfo(opts.mode).needs_hardware) {
    rc = RunHardwareMode(opts.mode, settings.value());
  } else {
    rc = RunGetLatestFirmware(settings.value());
  }
  pinflash::log::Shutdown();
  return rc;
}

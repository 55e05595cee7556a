/**
 * @file test_exp_channel.cpp
 * @brief Tests for exp_channel.hpp over a scripted channel.
 */

#include "pinflash/exp_channel.hpp"

#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <string>
#include <vector>

using pinflash::ExpChannel;
using pinflash::FirmwareCatalog;
using pinflash::FlashError;
using pinflash_test::FakeChannel;
using pinflash_test::ManualClock;
using pinflash_test::TempDir;
using pinflash_test::WriteFile;

namespace {

struct ExpRig {
  TempDir dir;
  ManualClock clock;
  FakeChannel* ch;  // owned by exp
  ExpChannel exp;
  FirmwareCatalog catalog;

  ExpRig()
      : ch(new FakeChannel("/dev/ttyACM1")),
        exp(std::unique_ptr<pinflash::ByteChannel>(ch), clock),
        catalog(dir.path()) {
    REQUIRE(WriteFile(dir.Sub("EXP/FP-EXP-0071_EXP_firmware_v_0_47.txt"),
                      ":00\r"));
    REQUIRE(WriteFile(dir.Sub("EXP/FP-EXP-0071_EXP_firmware_v_0_48.txt"),
                      ":01\r:02\r"));
    REQUIRE(WriteFile(dir.Sub("CPU/FP-CPU-2000_EXP_firmware_v_1_0.txt"),
                      ":03\r"));
  }
};

}  // namespace

TEST_CASE("ExpChannel profile", "[exp]") {
  auto p = ExpChannel::Profile("B4");
  REQUIRE(p.select_command == "ea:B4\r");
  REQUIRE(p.identity_command == "ID@B4:\r");
  REQUIRE(std::string(p.ack_token) == "!BL2040:02");
  REQUIRE(std::string(p.id_prefix) == "ID:EXP");
  REQUIRE(p.record_pacing_ms == 200U);
  REQUIRE(p.read_timeout_ms == 5U);
  REQUIRE(p.post_verify_command.empty());
}

TEST_CASE("Enumerate queries every address once", "[exp]") {
  ExpRig rig;
  auto boards = rig.exp.Enumerate(rig.catalog);
  REQUIRE(boards.empty());
  REQUIRE(rig.ch->writes.size() == pinflash::kExpAddressCount);
  REQUIRE(rig.ch->writes.front() == "ID@48:\r");
  REQUIRE(rig.ch->writes.back() == "ID@33:\r");
}

TEST_CASE("Enumerate reports responding boards with versions", "[exp]") {
  ExpRig rig;
  rig.ch->Reply("ID@48:\r", "ID:EXP FP-CPU-2000 1.00\r");
  rig.ch->Reply("ID@B4:\r", "ID:EXP FP-EXP-0071 0.47\r");
  rig.ch->Reply("ID@89:\r", "ID:EXP FP-EXP-0091 0.10\r");
  rig.ch->Reply("ID@D0:\r", "garbage\r");

  auto boards = rig.exp.Enumerate(rig.catalog);
  REQUIRE(boards.size() == 3U);

  REQUIRE(boards[0].address == "48");
  REQUIRE(boards[0].board_name == "FP-CPU-2000");
  REQUIRE(boards[0].available_versions.value() ==
          std::vector<std::string>{"1.00"});

  REQUIRE(boards[1].address == "B4");
  REQUIRE(boards[1].version == "0.47");
  REQUIRE(boards[1].available_versions.value() ==
          std::vector<std::string>{"0.47", "0.48"});

  REQUIRE(boards[2].address == "89");
  REQUIRE_FALSE(boards[2].available_versions.has_value());
}

TEST_CASE("Enumerate falls back to the map board type", "[exp]") {
  ExpRig rig;
  rig.ch->Reply("ID@B5:\r", "ID:EXP FP-EXP-0071-RevB 0.40\r");
  auto boards = rig.exp.Enumerate(rig.catalog);
  REQUIRE(boards.size() == 1U);
  REQUIRE(boards[0].board_name == "FP-EXP-0071-RevB");
  REQUIRE(boards[0].available_versions.value().size() == 2U);
}

TEST_CASE("UpdateFirmware flashes and verifies", "[exp]") {
  ExpRig rig;
  rig.ch->Reply(":02\r", "!BL2040:02\r");
  rig.ch->Reply("ID@B4:\r", "ID:EXP FP-EXP-0071 0.48\r");
  auto r = rig.exp.UpdateFirmware(rig.catalog, "b4", "0.48");
  REQUIRE(r);
  REQUIRE(r.value().Verified());
  REQUIRE(r.value().bootloader_acked);
  REQUIRE(rig.ch->CountWrites(":01\r") == 1U);
  REQUIRE(rig.ch->CountWrites(":00\r") == 0U);
}

TEST_CASE("UpdateFirmware normalizes the requested version", "[exp]") {
  ExpRig rig;
  rig.ch->Reply("ID@48:\r", "ID:EXP FP-CPU-2000 1.00\r");
  auto r = rig.exp.UpdateFirmware(rig.catalog, "48", "1.0");
  REQUIRE(r);
  REQUIRE(r.value().Verified());
}

TEST_CASE("UpdateFirmware rejects an unknown address", "[exp]") {
  ExpRig rig;
  auto r = rig.exp.UpdateFirmware(rig.catalog, "FF", "0.48");
  REQUIRE_FALSE(r);
  REQUIRE(r.get_error() == FlashError::kUnknownBoardAddress);
  REQUIRE(rig.ch->writes.empty());
}

TEST_CASE("UpdateFirmware rejects a missing version", "[exp]") {
  ExpRig rig;
  auto r = rig.exp.UpdateFirmware(rig.catalog, "B4", "9.99");
  REQUIRE_FALSE(r);
  REQUIRE(r.get_error() == FlashError::kFirmwareNotFound);

  r = rig.exp.UpdateFirmware(rig.catalog, "D0", "0.48");
  REQUIRE_FALSE(r);
  REQUIRE(r.get_error() == FlashError::kFirmwareNotFound);
  REQUIRE(rig.ch->writes.empty());
}

TEST_CASE("Open fails for a missing device", "[exp]") {
  auto r = ExpChannel::Open("/dev/pinflash-no-such-port");
  REQUIRE_FALSE(r);
  REQUIRE(r.get_error() == pinflash::SerialError::kOpenFailed);
}

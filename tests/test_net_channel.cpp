/**
 * @file test_net_channel.cpp
 * @brief Tests for net_channel.hpp over a scripted channel.
 */

#include "pinflash/net_channel.hpp"

#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <string>
#include <vector>

using pinflash::FirmwareCatalog;
using pinflash::FlashError;
using pinflash::NetChannel;
using pinflash_test::FakeChannel;
using pinflash_test::ManualClock;
using pinflash_test::TempDir;
using pinflash_test::WriteFile;

namespace {

struct NetRig {
  TempDir dir;
  ManualClock clock;
  FakeChannel* ch;  // owned by net
  NetChannel net;
  FirmwareCatalog catalog;

  NetRig()
      : ch(new FakeChannel("/dev/ttyACM0")),
        net(std::unique_ptr<pinflash::ByteChannel>(ch), clock),
        catalog(dir.path()) {
    REQUIRE(WriteFile(dir.Sub("NET/FP-CPU-2000_NET_firmware_v_2_28.txt"),
                      ":A\r:B\r"));
  }
};

}  // namespace

TEST_CASE("NetChannel profile", "[net]") {
  auto p = NetChannel::Profile();
  REQUIRE(p.select_command.empty());
  REQUIRE(p.identity_command == "ID:\r");
  REQUIRE(std::string(p.ack_token) == "!B:02");
  REQUIRE(std::string(p.id_prefix) == "ID:NET");
  REQUIRE(p.record_pacing_ms == 400U);
  REQUIRE(p.read_timeout_ms == 200U);
  REQUIRE(p.post_verify_command == "bn:aa55\r");
  REQUIRE(p.version_rule == pinflash::VersionRule::kTrimAndStripMajorZeros);
}

TEST_CASE("Enumerate walks nodes and appends the controller", "[net]") {
  NetRig rig;
  rig.ch->Reply("ID:\r", "ID:NET FP-CPU-2000 02.28\r");
  rig.ch->Reply("NN:00\r", "NN:00,FP-I/O-3208,1.05,32,8\r");
  rig.ch->Reply("NN:01\r", "NN:01,FP-I/O-0804,0.13\r");
  rig.ch->Reply("NN:02\r", "!Node Not Found!\r");

  auto nodes = rig.net.Enumerate();
  REQUIRE(nodes.size() == 3U);
  REQUIRE(nodes.at(0).node_name == "FP-I/O-3208");
  REQUIRE(nodes.at(0).firmware == "1.05");
  REQUIRE(nodes.at(0).extra_fields.size() == 2U);
  REQUIRE(nodes.at(1).node_id == "01");
  REQUIRE(nodes.at(2).node_id == "NC");
  REQUIRE(nodes.at(2).node_name == "FP-CPU-2000");
  REQUIRE(nodes.at(2).firmware == "02.28");
  REQUIRE(rig.ch->CountWrites("NN:03\r") == 0U);
}

TEST_CASE("Enumerate stops at the first silent node", "[net]") {
  NetRig rig;
  rig.ch->Reply("NN:00\r", "NN:00,FP-I/O-3208,1.05\r");
  auto nodes = rig.net.Enumerate();
  REQUIRE(nodes.size() == 1U);
  REQUIRE(nodes.count(0) == 1U);
  REQUIRE(rig.ch->CountWrites("NN:01\r") == 1U);
  REQUIRE(rig.ch->CountWrites("NN:02\r") == 0U);
}

TEST_CASE("Enumerate on a silent bus finds nothing", "[net]") {
  NetRig rig;
  REQUIRE(rig.net.Enumerate().empty());
}

TEST_CASE("Enumerate uses the NET read timeout", "[net]") {
  NetRig rig;
  rig.net.Enumerate();
  for (uint32_t t : rig.ch->read_timeouts) REQUIRE(t == 200U);
}

TEST_CASE("UpdateFirmware verifies and broadcasts", "[net]") {
  NetRig rig;
  rig.ch->Reply(":B\r", "!B:02\r");
  rig.ch->Reply("ID:\r", "ID:NET FP-CPU-2000 02.28\r");
  auto r = rig.net.UpdateFirmware(rig.catalog, "2.28");
  REQUIRE(r);
  REQUIRE(r.value().Verified());
  REQUIRE(r.value().version.value() == "2.28");

  const std::vector<std::string> expected_writes = {":A\r", ":B\r", "ID:\r",
                                                    "bn:aa55\r"};
  REQUIRE(rig.ch->writes == expected_writes);
}

TEST_CASE("UpdateFirmware broadcasts after a failed verification", "[net]") {
  NetRig rig;
  rig.ch->Reply("ID:\r", "ID:NET FP-CPU-2000 02.27\r");
  auto r = rig.net.UpdateFirmware(rig.catalog, "2.28");
  REQUIRE(r);
  REQUIRE(r.value().outcome == pinflash::VerifyOutcome::kVersionMismatch);
  REQUIRE(rig.ch->writes.back() == "bn:aa55\r");
}

TEST_CASE("UpdateFirmware rejects a missing version", "[net]") {
  NetRig rig;
  auto r = rig.net.UpdateFirmware(rig.catalog, "3.00");
  REQUIRE_FALSE(r);
  REQUIRE(r.get_error() == FlashError::kFirmwareNotFound);
  REQUIRE(rig.ch->writes.empty());
}

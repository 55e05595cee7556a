/**
 * @file test_version.cpp
 * @brief Tests for version.hpp
 */

#include "pinflash/version.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <string>
#include <vector>

using pinflash::FirmwareVersion;

TEST_CASE("ParseUnsigned accepts plain decimal only", "[version]") {
  uint32_t v = 7;
  REQUIRE(pinflash::ParseUnsigned("0", v));
  REQUIRE(v == 0U);
  REQUIRE(pinflash::ParseUnsigned("0048", v));
  REQUIRE(v == 48U);
  REQUIRE(pinflash::ParseUnsigned("4294967295", v));
  REQUIRE(v == 4294967295U);

  REQUIRE_FALSE(pinflash::ParseUnsigned("", v));
  REQUIRE_FALSE(pinflash::ParseUnsigned("-1", v));
  REQUIRE_FALSE(pinflash::ParseUnsigned("+1", v));
  REQUIRE_FALSE(pinflash::ParseUnsigned("1a", v));
  REQUIRE_FALSE(pinflash::ParseUnsigned("4294967296", v));
}

TEST_CASE("FirmwareVersion canonical form pads minor", "[version]") {
  auto v = FirmwareVersion::Parse("2.8");
  REQUIRE(v.has_value());
  REQUIRE(v->major == 2U);
  REQUIRE(v->minor == 8U);
  REQUIRE(v->ToString() == "2.08");

  REQUIRE(FirmwareVersion::Parse("0.48")->ToString() == "0.48");
  REQUIRE(FirmwareVersion::Parse("02.28")->ToString() == "2.28");
  REQUIRE(FirmwareVersion::Parse("1.123")->ToString() == "1.123");
}

TEST_CASE("FirmwareVersion rejects malformed text", "[version]") {
  REQUIRE_FALSE(FirmwareVersion::Parse("").has_value());
  REQUIRE_FALSE(FirmwareVersion::Parse("2").has_value());
  REQUIRE_FALSE(FirmwareVersion::Parse("2.").has_value());
  REQUIRE_FALSE(FirmwareVersion::Parse(".5").has_value());
  REQUIRE_FALSE(FirmwareVersion::Parse("v0.48").has_value());
  REQUIRE_FALSE(FirmwareVersion::Parse("1.2.3").has_value());
}

TEST_CASE("NormalizeVersion leaves unparseable text alone", "[version]") {
  REQUIRE(pinflash::NormalizeVersion("1.5") == "1.05");
  REQUIRE(pinflash::NormalizeVersion("1.05") == "1.05");
  REQUIRE(pinflash::NormalizeVersion("latest") == "latest");
}

TEST_CASE("Versions order numerically, not lexically", "[version]") {
  REQUIRE(FirmwareVersion{1, 9} < FirmwareVersion{1, 10});
  REQUIRE(FirmwareVersion{1, 99} < FirmwareVersion{2, 0});
  REQUIRE(FirmwareVersion{2, 8} == *FirmwareVersion::Parse("2.08"));

  std::vector<std::string> v = {"10.00", "2.08", "junk", "2.10", "0.48"};
  std::sort(v.begin(), v.end(), pinflash::VersionLess);
  REQUIRE(v == std::vector<std::string>{"0.48", "2.08", "2.10", "10.00",
                                        "junk"});
}

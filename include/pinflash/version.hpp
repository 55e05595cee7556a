/**
 * @file version.hpp
 * @brief Firmware version value type and canonical "{major}.{minor:02d}" form.
 */

#ifndef PINFLASH_VERSION_HPP_
#define PINFLASH_VERSION_HPP_

#include "pinflash/vocabulary.hpp"

#include <cstdint>
#include <cstdio>
#include <string>

namespace pinflash {

/// @brief Parse an unsigned decimal field. Rejects empty, signs and overflow.
inline bool ParseUnsigned(const std::string& text, uint32_t& out) noexcept {
  if (text.empty()) return false;
  uint64_t acc = 0;
  for (char c : text) {
    if (c < '0' || c > '9') return false;
    acc = acc * 10U + static_cast<uint64_t>(c - '0');
    if (acc > 0xFFFFFFFFULL) return false;
  }
  out = static_cast<uint32_t>(acc);
  return true;
}

struct FirmwareVersion {
  uint32_t major = 0;
  uint32_t minor = 0;

  /// @brief Parse "major.minor" (both unsigned decimal).
  static optional<FirmwareVersion> Parse(const std::string& text) {
    const size_t dot = text.find('.');
    if (dot == std::string::npos) return {};
    FirmwareVersion v;
    if (!ParseUnsigned(text.substr(0, dot), v.major) ||
        !ParseUnsigned(text.substr(dot + 1), v.minor)) {
      return {};
    }
    return v;
  }

  /// @brief Canonical "{major}.{minor:02d}" form, e.g. 2.8 -> "2.08".
  std::string ToString() const {
    char buf[32];
    (void)std::snprintf(buf, sizeof(buf), "%u.%02u", major, minor);
    return std::string(buf);
  }

  friend bool operator==(const FirmwareVersion& a, const FirmwareVersion& b) {
    return a.major == b.major && a.minor == b.minor;
  }
  friend bool operator!=(const FirmwareVersion& a, const FirmwareVersion& b) {
    return !(a == b);
  }
  friend bool operator<(const FirmwareVersion& a, const FirmwareVersion& b) {
    return (a.major != b.major) ? (a.major < b.major) : (a.minor < b.minor);
  }
};

/**
 * @brief Normalize a user or catalog version string to canonical form.
 *
 * Text that is not "major.minor" is returned unchanged so that lookups with
 * it simply miss.
 */
inline std::string NormalizeVersion(const std::string& text) {
  auto v = FirmwareVersion::Parse(text);
  return v.has_value() ? v->ToString() : text;
}

/**
 * @brief Strict-weak ordering for version strings by numeric (major, minor).
 *
 * Unparseable strings order after every parseable one, then by text.
 */
inline bool VersionLess(const std::string& a, const std::string& b) {
  auto va = FirmwareVersion::Parse(a);
  auto vb = FirmwareVersion::Parse(b);
  if (va.has_value() && vb.has_value()) {
    if (*va != *vb) return *va < *vb;
    return a < b;
  }
  if (va.has_value() != vb.has_value()) return va.has_value();
  return a < b;
}

}  // namespace pinflash

#endif  // PINFLASH_VERSION_HPP_

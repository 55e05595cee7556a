/**
 * @file response_parser.hpp
 * @brief Stateless text matchers for FAST serial replies.
 *
 * Replies are free-form ASCII and may carry stale fragments of earlier
 * replies, so every matcher searches by substring rather than assuming a
 * fixed frame layout.
 */

#ifndef PINFLASH_RESPONSE_PARSER_HPP_
#define PINFLASH_RESPONSE_PARSER_HPP_

#include "pinflash/protocol.hpp"
#include "pinflash/vocabulary.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace pinflash {

// ============================================================================
// Result types
// ============================================================================

/// Tokens of an "ID:{protocol} {board} {version}" reply.
struct IdReply {
  std::string protocol;
  std::string board;
  std::string version;
};

/// One NET node as reported by "NN:" enumeration.
struct NodeInfo {
  std::string node_id;
  std::string node_name;
  std::string firmware;
  std::vector<std::string> extra_fields;  ///< Trailing fields, in order.
};

/// Post-processing applied to the version token of a verification reply.
enum class VersionRule : uint8_t {
  kTrimTrailing = 0,     ///< Strip trailing chars that are not digit or '.'.
  kTrimAndStripMajorZeros,  ///< As above, then "02.28" -> "2.28".
};

/// Outcome of scanning a verification reply for an identity line.
struct VerifyParse {
  optional<std::string> line;     ///< First line with the identity prefix.
  optional<std::string> board;    ///< Parsed board token.
  optional<std::string> version;  ///< Parsed, post-processed version token.
};

namespace detail {

inline bool IsSpace(char c) noexcept {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' ||
         c == '\f';
}

inline bool IsAlpha(char c) noexcept {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

inline bool IsDigit(char c) noexcept { return c >= '0' && c <= '9'; }

inline std::string Trim(const std::string& s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && IsSpace(s[b])) ++b;
  while (e > b && IsSpace(s[e - 1])) --e;
  return s.substr(b, e - b);
}

inline std::vector<std::string> SplitWhitespace(const std::string& s) {
  std::vector<std::string> out;
  size_t i = 0;
  while (i < s.size()) {
    while (i < s.size() && IsSpace(s[i])) ++i;
    size_t start = i;
    while (i < s.size() && !IsSpace(s[i])) ++i;
    if (i > start) out.push_back(s.substr(start, i - start));
  }
  return out;
}

/// Split on '\r' and '\n'; empty segments are dropped.
inline std::vector<std::string> SplitLines(const std::string& s) {
  std::vector<std::string> out;
  size_t start = 0;
  for (size_t i = 0; i <= s.size(); ++i) {
    if (i == s.size() || s[i] == '\r' || s[i] == '\n') {
      if (i > start) out.push_back(s.substr(start, i - start));
      start = i + 1;
    }
  }
  return out;
}

inline bool StartsWith(const std::string& s, const char* prefix) {
  return s.compare(0, std::char_traits<char>::length(prefix), prefix) == 0;
}

}  // namespace detail

// ============================================================================
// Matchers
// ============================================================================

/**
 * @brief Classify a reply by the alphabetic token after the first "ID:".
 *
 * "ID:NET FP-CPU-2000 2.28" -> kNet, " ID: exp ..." -> kExp. Any other token
 * (or no "ID:") yields an empty optional.
 */
inline optional<ProtocolKind> ParseProtocol(const std::string& text) {
  const size_t pos = text.find(kIdPrefix);
  if (pos == std::string::npos) return {};
  size_t i = pos + sizeof(kIdPrefix) - 1U;
  while (i < text.size() && detail::IsSpace(text[i])) ++i;
  std::string token;
  while (i < text.size() && detail::IsAlpha(text[i])) {
    token.push_back(detail::AsciiUpper(text[i]));
    ++i;
  }
  if (token == "NET") return ProtocolKind::kNet;
  if (token == "EXP") return ProtocolKind::kExp;
  return {};
}

/**
 * @brief Split an identity reply into (protocol, board, version).
 *
 * Commas are treated as whitespace, so "ID:EXP, FP-EXP-0091 v0.48" parses
 * the same as "ID:EXP FP-EXP-0091 v0.48".
 */
inline optional<IdReply> ParseIdLine(const std::string& text) {
  const size_t pos = text.find(kIdPrefix);
  if (pos == std::string::npos) return {};
  std::string rest = text.substr(pos + sizeof(kIdPrefix) - 1U);
  for (char& c : rest) {
    if (c == ',') c = ' ';
  }
  std::vector<std::string> tokens = detail::SplitWhitespace(rest);
  if (tokens.size() < 3U) return {};
  IdReply reply;
  reply.protocol = tokens[0];
  reply.board = tokens[1];
  reply.version = tokens[2];
  return reply;
}

/**
 * @brief Parse the last "NN:" record in a NET reply.
 *
 * The record runs to the next line break and holds comma separated
 * node-id, node-name, firmware and optional extra fields.
 */
inline optional<NodeInfo> ParseNodeRecord(const std::string& text) {
  const size_t pos = text.rfind(kNodePrefix);
  if (pos == std::string::npos) return {};
  std::string rest = text.substr(pos + sizeof(kNodePrefix) - 1U);
  const size_t eol = rest.find_first_of("\r\n");
  if (eol != std::string::npos) rest.resize(eol);
  rest = detail::Trim(rest);

  std::vector<std::string> fields;
  size_t start = 0;
  for (size_t i = 0; i <= rest.size(); ++i) {
    if (i == rest.size() || rest[i] == ',') {
      fields.push_back(detail::Trim(rest.substr(start, i - start)));
      start = i + 1;
    }
  }
  if (fields.size() < 3U) return {};

  NodeInfo info;
  info.node_id = fields[0];
  info.node_name = fields[1];
  info.firmware = fields[2];
  info.extra_fields.assign(fields.begin() + 3, fields.end());
  return info;
}

/// @brief Apply a VersionRule to a raw version token.
inline std::string ApplyVersionRule(std::string version, VersionRule rule) {
  while (!version.empty() && !detail::IsDigit(version.back()) &&
         version.back() != '.') {
    version.pop_back();
  }
  if (rule == VersionRule::kTrimTrailing) return version;

  const size_t dot = version.find('.');
  std::string major = (dot == std::string::npos) ? version
                                                 : version.substr(0, dot);
  const size_t nz = major.find_first_not_of('0');
  major = (nz == std::string::npos) ? std::string("0") : major.substr(nz);
  return (dot == std::string::npos) ? major : major + version.substr(dot);
}

/**
 * @brief Find the identity line in a verification reply and extract board
 *        and version.
 *
 * The first line starting with @p prefix is reported as the found line;
 * board and version come from the first such line carrying at least three
 * whitespace separated tokens.
 */
inline VerifyParse ParseVerifyReply(const std::string& text,
                                    const char* prefix, VersionRule rule) {
  VerifyParse out;
  for (const std::string& raw : detail::SplitLines(text)) {
    const std::string line = detail::Trim(raw);
    if (!detail::StartsWith(line, prefix)) continue;
    if (!out.line.has_value()) out.line = line;
    std::vector<std::string> tokens = detail::SplitWhitespace(line);
    if (tokens.size() >= 3U) {
      out.board = tokens[1];
      out.version = ApplyVersionRule(tokens[2], rule);
      break;
    }
  }
  return out;
}

}  // namespace pinflash

#endif  // PINFLASH_RESPONSE_PARSER_HPP_

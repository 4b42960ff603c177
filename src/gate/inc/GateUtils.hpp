#ifndef QUORUM_GATEUTILS_HPP
#define QUORUM_GATEUTILS_HPP
/**
 * @file GateUtils.hpp
 * @brief Internal utility functions shared by the gate components.
 *
 * Consolidates small helpers:
 * - Clock utilities (steady clock for wall-time measurements)
 * - File utilities (slurp, head-of-log extraction, atomic-ish writes)
 * - Text utilities (trim, character stripping, strict number parsing)
 */

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quorum {
namespace gate {

/* ---------------------------- Clock Utilities ---------------------------- */

/**
 * @brief Current time in microseconds from a monotonic clock.
 *
 * Uses steady_clock so wall-time measurements aren't affected by system
 * clock adjustments (NTP, daylight savings, etc.).
 */
inline double nowUs() {
  using clock = std::chrono::steady_clock;
  return static_cast<double>(
      std::chrono::duration_cast<std::chrono::microseconds>(clock::now().time_since_epoch())
          .count());
}

/* ----------------------------- File Utilities ----------------------------- */

/** @brief Read whole file into memory (binary mode). Empty string if unreadable. */
inline std::string slurp(const std::filesystem::path& path) {
  std::ifstream ifs(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

/**
 * @brief Write a whole file, truncating any previous content.
 * @return false if the file could not be opened or written.
 */
inline bool writeFile(const std::filesystem::path& path, std::string_view content) {
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  if (!ofs) {
    return false;
  }
  ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
  return static_cast<bool>(ofs);
}

/** @brief First @p maxLines lines of a file, for diagnostics after a fatal error. */
inline std::string headOfFile(const std::filesystem::path& path, int maxLines = 120) {
  std::ifstream ifs(path);
  std::string out;
  std::string line;
  int n = 0;
  while (n < maxLines && std::getline(ifs, line)) {
    out += line;
    out += '\n';
    ++n;
  }
  return out;
}

/* ----------------------------- Text Utilities ----------------------------- */

/** @brief Trim ASCII whitespace from both ends. */
inline std::string_view trim(std::string_view s) {
  const auto IS_SPACE = [](char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
  };
  while (!s.empty() && IS_SPACE(s.front())) {
    s.remove_prefix(1);
  }
  while (!s.empty() && IS_SPACE(s.back())) {
    s.remove_suffix(1);
  }
  return s;
}

/** @brief Copy of @p s with every character in @p chars removed. */
inline std::string stripChars(std::string_view s, std::string_view chars) {
  std::string out;
  out.reserve(s.size());
  for (const char C : s) {
    if (chars.find(C) == std::string_view::npos) {
      out.push_back(C);
    }
  }
  return out;
}

/** @brief Split on '\n', dropping a trailing '\r' per line. */
inline std::vector<std::string_view> splitLines(std::string_view text) {
  std::vector<std::string_view> lines;
  std::size_t start = 0;
  while (start < text.size()) {
    std::size_t end = text.find('\n', start);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    std::string_view line = text.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    lines.push_back(line);
    start = end + 1;
  }
  return lines;
}

/** @brief Parse a whole string as a finite double; nullopt on any trailing garbage. */
inline std::optional<double> parseDouble(std::string_view s) {
  const std::string BUF(trim(s));
  if (BUF.empty()) {
    return std::nullopt;
  }
  char* end = nullptr;
  errno = 0;
  const double VAL = std::strtod(BUF.c_str(), &end);
  if (errno != 0 || end != BUF.c_str() + BUF.size() || !std::isfinite(VAL)) {
    return std::nullopt;
  }
  return VAL;
}

/** @brief Parse a whole string as a base-10 signed integer. */
inline std::optional<long long> parseInt(std::string_view s) {
  const std::string BUF(trim(s));
  if (BUF.empty()) {
    return std::nullopt;
  }
  char* end = nullptr;
  errno = 0;
  const long long VAL = std::strtoll(BUF.c_str(), &end, 10);
  if (errno != 0 || end != BUF.c_str() + BUF.size()) {
    return std::nullopt;
  }
  return VAL;
}

/**
 * @brief Length of the leading unsigned decimal `[0-9]+(\.[0-9]+)?` in @p s.
 * @return 0 if @p s does not start with one.
 */
inline std::size_t decimalPrefixLength(std::string_view s) {
  std::size_t i = 0;
  while (i < s.size() && s[i] >= '0' && s[i] <= '9') {
    ++i;
  }
  if (i == 0) {
    return 0;
  }
  if (i < s.size() && s[i] == '.') {
    const std::size_t FRAC_START = i + 1;
    std::size_t j = FRAC_START;
    while (j < s.size() && s[j] >= '0' && s[j] <= '9') {
      ++j;
    }
    if (j == FRAC_START) {
      return 0;
    }
    i = j;
  }
  return i;
}

/**
 * @brief Parse a metric value: an unsigned decimal `[0-9]+(\.[0-9]+)?` and nothing else.
 *
 * Signs, exponents, hex floats, "nan" and "inf" are rejected. Surrounding whitespace is allowed.
 */
inline std::optional<double> parseUnsignedDecimal(std::string_view s) {
  const std::string_view BODY = trim(s);
  if (BODY.empty() || decimalPrefixLength(BODY) != BODY.size()) {
    return std::nullopt;
  }
  return parseDouble(BODY);
}

/** @brief Parse an unsigned integer `[0-9]+` (surrounding whitespace allowed). */
inline std::optional<long long> parseUnsignedInt(std::string_view s) {
  const std::string_view BODY = trim(s);
  if (BODY.empty() ||
      !std::all_of(BODY.begin(), BODY.end(), [](char c) { return c >= '0' && c <= '9'; })) {
    return std::nullopt;
  }
  return parseInt(BODY);
}

/** @brief ASCII lower-case copy. */
inline std::string toLower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>((c >= 'A' && c <= 'Z') ? c - 'A' + 'a' : c);
  });
  return out;
}

} // namespace gate
} // namespace quorum

#endif // QUORUM_GATEUTILS_HPP

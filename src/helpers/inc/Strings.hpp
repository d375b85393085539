#ifndef SYSCTLGEN_HELPERS_STRINGS_HPP
#define SYSCTLGEN_HELPERS_STRINGS_HPP
/**
 * @file Strings.hpp
 * @brief Small string helpers shared by detection parsers and the CLI.
 *
 * @note All functions except toLower() are noexcept and allocation-free.
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring> // strlen, strncmp
#include <optional>
#include <string>
#include <string_view>

namespace sysctlgen {
namespace helpers {
namespace strings {

/* ----------------------------- Manipulation ----------------------------- */

/**
 * @brief Strip trailing whitespace in-place.
 * @param buf Buffer to modify (null-terminated).
 * @param len Current string length (will be updated).
 */
inline void stripTrailingWhitespace(char* buf, std::size_t& len) noexcept {
  if (buf == nullptr) {
    return;
  }
  while (len > 0) {
    const char C = buf[len - 1];
    if (C != '\n' && C != '\r' && C != ' ' && C != '\t') {
      break;
    }
    --len;
    buf[len] = '\0';
  }
}

/**
 * @brief View without leading/trailing spaces, tabs and line breaks.
 */
[[nodiscard]] inline std::string_view trim(std::string_view sv) noexcept {
  constexpr std::string_view WS = " \t\r\n";
  const std::size_t FIRST = sv.find_first_not_of(WS);
  if (FIRST == std::string_view::npos) {
    return {};
  }
  const std::size_t LAST = sv.find_last_not_of(WS);
  return sv.substr(FIRST, LAST - FIRST + 1);
}

/**
 * @brief Copy string into fixed-size array with null termination.
 * @tparam N Array size.
 */
template <std::size_t N>
inline void copyToFixedArray(std::array<char, N>& dest, std::string_view src) noexcept {
  const std::size_t COPY_LEN = (src.size() < N - 1) ? src.size() : (N - 1);
  for (std::size_t i = 0; i < COPY_LEN; ++i) {
    dest[i] = src[i];
  }
  dest[COPY_LEN] = '\0';
}

/* ----------------------------- Inspection ----------------------------- */

/**
 * @brief Check if string starts with prefix.
 */
[[nodiscard]] inline bool startsWith(const char* str, const char* prefix) noexcept {
  if (str == nullptr || prefix == nullptr) {
    return false;
  }
  return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

/**
 * @brief Parse a strictly positive decimal integer.
 * @param sv Text (surrounding whitespace ignored).
 * @return Value, or nullopt if empty, non-numeric, zero, or overflowing.
 */
[[nodiscard]] inline std::optional<std::int64_t> parsePositive(std::string_view sv) noexcept {
  sv = trim(sv);
  if (sv.empty() || sv.size() > 18) {
    return std::nullopt;
  }
  std::int64_t val = 0;
  for (const char C : sv) {
    if (C < '0' || C > '9') {
      return std::nullopt;
    }
    val = val * 10 + (C - '0');
  }
  if (val <= 0) {
    return std::nullopt;
  }
  return val;
}

/**
 * @brief ASCII case-insensitive equality.
 */
[[nodiscard]] inline bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    char x = a[i];
    char y = b[i];
    if (x >= 'A' && x <= 'Z') {
      x = static_cast<char>(x - 'A' + 'a');
    }
    if (y >= 'A' && y <= 'Z') {
      y = static_cast<char>(y - 'A' + 'a');
    }
    if (x != y) {
      return false;
    }
  }
  return true;
}

/**
 * @brief ASCII lower-case copy.
 */
[[nodiscard]] inline std::string toLower(std::string_view sv) {
  std::string out(sv);
  for (char& c : out) {
    if (c >= 'A' && c <= 'Z') {
      c = static_cast<char>(c - 'A' + 'a');
    }
  }
  return out;
}

} // namespace strings
} // namespace helpers
} // namespace sysctlgen

#endif // SYSCTLGEN_HELPERS_STRINGS_HPP

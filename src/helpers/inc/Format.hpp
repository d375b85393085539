#ifndef SYSCTLGEN_HELPERS_FORMAT_HPP
#define SYSCTLGEN_HELPERS_FORMAT_HPP
/**
 * @file Format.hpp
 * @brief Console formatting: byte sizes and optional ANSI colors.
 *
 * Color output is decided once per run (terminal and --no-color) and carried
 * in a Palette; a disabled palette returns text unchanged.
 */

#include <cstdint>
#include <string>
#include <string_view>

#include <fmt/core.h>
#include <fmt/format.h>

namespace sysctlgen {
namespace helpers {
namespace format {

/* ----------------------------- Bytes ----------------------------- */

/**
 * @brief Format bytes using binary units (KiB, MiB, GiB, TiB).
 * @param bytes Byte count.
 * @return Formatted string (e.g., "1.5 GiB").
 */
[[nodiscard]] inline std::string bytesBinary(std::uint64_t bytes) {
  if (bytes == 0) {
    return "0 B";
  }

  static constexpr std::uint64_t KIB = 1024ULL;
  static constexpr std::uint64_t MIB = KIB * 1024ULL;
  static constexpr std::uint64_t GIB = MIB * 1024ULL;
  static constexpr std::uint64_t TIB = GIB * 1024ULL;

  if (bytes >= TIB) {
    return fmt::format("{:.1f} TiB", static_cast<double>(bytes) / static_cast<double>(TIB));
  }
  if (bytes >= GIB) {
    return fmt::format("{:.1f} GiB", static_cast<double>(bytes) / static_cast<double>(GIB));
  }
  if (bytes >= MIB) {
    return fmt::format("{:.1f} MiB", static_cast<double>(bytes) / static_cast<double>(MIB));
  }
  if (bytes >= KIB) {
    return fmt::format("{:.1f} KiB", static_cast<double>(bytes) / static_cast<double>(KIB));
  }

  return fmt::format("{} B", bytes);
}

/* ----------------------------- Colors ----------------------------- */

inline constexpr const char* ANSI_RED = "\033[31m";
inline constexpr const char* ANSI_GREEN = "\033[32m";
inline constexpr const char* ANSI_YELLOW = "\033[33m";
inline constexpr const char* ANSI_CYAN = "\033[36m";
inline constexpr const char* ANSI_BOLD_BLUE = "\033[1;34m";
inline constexpr const char* ANSI_RESET = "\033[0m";

/**
 * @brief Wraps text in ANSI colors when enabled.
 */
struct Palette {
  bool enabled{false};

  [[nodiscard]] std::string paint(const char* code, std::string_view text) const {
    if (!enabled) {
      return std::string(text);
    }
    return fmt::format("{}{}{}", code, text, ANSI_RESET);
  }

  [[nodiscard]] std::string red(std::string_view t) const { return paint(ANSI_RED, t); }
  [[nodiscard]] std::string green(std::string_view t) const { return paint(ANSI_GREEN, t); }
  [[nodiscard]] std::string yellow(std::string_view t) const { return paint(ANSI_YELLOW, t); }
  [[nodiscard]] std::string cyan(std::string_view t) const { return paint(ANSI_CYAN, t); }
  [[nodiscard]] std::string heading(std::string_view t) const { return paint(ANSI_BOLD_BLUE, t); }
};

} // namespace format
} // namespace helpers
} // namespace sysctlgen

#endif // SYSCTLGEN_HELPERS_FORMAT_HPP

#ifndef SYSCTLGEN_TUNING_RULE_MATH_HPP
#define SYSCTLGEN_TUNING_RULE_MATH_HPP
/**
 * @file RuleMath.hpp
 * @brief Integer helpers shared by the rule sets.
 *
 * All arithmetic is signed 64-bit and truncates toward zero.
 */

#include <cstdint> // std::int64_t

namespace sysctlgen {

namespace tuning {

/* ----------------------------- Constants ----------------------------- */

/// NIC speed tiers (Mbps). A speed exactly on a tier belongs to it.
inline constexpr std::int64_t NIC_1G = 1000;
inline constexpr std::int64_t NIC_10G = 10000;
inline constexpr std::int64_t NIC_25G = 25000;
inline constexpr std::int64_t NIC_40G = 40000;

/// Baseline vm.min_free_kbytes per GB of RAM.
inline constexpr std::int64_t MIN_FREE_KB_PER_GB = 4096;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Clamp into [lo, hi]; lo wins if the band is inverted.
 */
[[nodiscard]] constexpr std::int64_t clampBand(std::int64_t x, std::int64_t lo,
                                               std::int64_t hi) noexcept {
  return x < lo ? lo : (x > hi ? hi : x);
}

[[nodiscard]] constexpr std::int64_t minOf(std::int64_t a, std::int64_t b) noexcept {
  return a < b ? a : b;
}

[[nodiscard]] constexpr std::int64_t maxOf(std::int64_t a, std::int64_t b) noexcept {
  return a > b ? a : b;
}

/**
 * @brief Two-threshold tier: x >= t1 ? a : (x >= t2 ? b : c).
 */
template <typename T>
[[nodiscard]] constexpr T tier(std::int64_t x, std::int64_t t1, T a, std::int64_t t2, T b,
                               T c) noexcept {
  return x >= t1 ? a : (x >= t2 ? b : c);
}

/**
 * @brief Baseline minimum free memory for a RAM size.
 */
[[nodiscard]] constexpr std::int64_t baselineMinFreeKb(std::int64_t ramGb) noexcept {
  return ramGb * MIN_FREE_KB_PER_GB;
}

} // namespace tuning

} // namespace sysctlgen

#endif // SYSCTLGEN_TUNING_RULE_MATH_HPP

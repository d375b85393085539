#ifndef SYSCTLGEN_HARDWARE_HARDWARE_FACTS_HPP
#define SYSCTLGEN_HARDWARE_HARDWARE_FACTS_HPP
/**
 * @file HardwareFacts.hpp
 * @brief Hardware snapshot consumed by the tuning rules.
 * @note Thread-safe: plain value type, no shared state.
 *
 * Built once per run, either by detection or by manual entry, then validated
 * and passed by value into every rule evaluation.
 */

#include "src/helpers/inc/Status.hpp"

#include <cstdint>     // std::int64_t, std::uint8_t
#include <optional>    // std::optional
#include <string>      // std::string
#include <string_view> // std::string_view

namespace sysctlgen {

namespace hardware {

/* ----------------------------- Constants ----------------------------- */

/// Largest accepted RAM size (1 EiB). Keeps every rule product below INT64_MAX.
inline constexpr std::int64_t MAX_RAM_GB = std::int64_t{1} << 20;

/// Largest accepted core or thread count.
inline constexpr std::int64_t MAX_CPUS = std::int64_t{1} << 24;

/// Largest accepted link speed in Mbps.
inline constexpr std::int64_t MAX_NIC_MBPS = std::int64_t{1} << 24;

/* ----------------------------- Enums ----------------------------- */

/**
 * @brief Storage medium backing the root filesystem.
 */
enum class DiskMedium : std::uint8_t {
  HDD = 0, ///< Rotational disk
  SSD,     ///< SATA/SAS solid state
  NVME,    ///< NVMe solid state
};

/**
 * @brief Display name ("HDD", "SSD", "NVMe").
 * @note Returns "unknown" for out-of-range values.
 */
[[nodiscard]] const char* toString(DiskMedium medium) noexcept;

/**
 * @brief Parse "hdd", "ssd" or "nvme" (case-insensitive).
 * @return Medium, or nullopt if unrecognized.
 */
[[nodiscard]] std::optional<DiskMedium> parseDiskMedium(std::string_view text) noexcept;

/**
 * @brief True for SSD and NVMe.
 */
[[nodiscard]] bool isFlash(DiskMedium medium) noexcept;

/* ----------------------------- HardwareFacts ----------------------------- */

/**
 * @brief Hardware facts that drive parameter selection.
 *
 * Valid values: cores, threads in [1, MAX_CPUS]; ramGb in [1, MAX_RAM_GB];
 * nicMbps in [1, MAX_NIC_MBPS]; disk a declared enumerator. Use validate() before handing the snapshot to the engine.
 */
struct HardwareFacts {
  std::int64_t cores{0};            ///< Usable CPU cores
  std::int64_t threads{0};          ///< Usable hardware threads
  std::int64_t ramGb{0};            ///< RAM (or container memory limit) in whole GB
  std::int64_t nicMbps{0};          ///< Link speed of the primary interface
  DiskMedium disk{DiskMedium::HDD}; ///< Root storage medium
  bool isContainer{false};          ///< Running inside a container

  /// @brief True if the disk is SSD or NVMe.
  [[nodiscard]] bool isFlash() const noexcept;

  /// @brief One-line summary: "4 cores / 4 threads, 8GB RAM, 1000Mb/s NIC, HDD".
  [[nodiscard]] std::string summary() const;

  /// @brief Multi-line human-readable listing.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Check every fact against its constraint.
 * @return Success, or INVALID_HARDWARE_FACT naming the first failing field.
 */
[[nodiscard]] helpers::Status validate(const HardwareFacts& facts);

} // namespace hardware

} // namespace sysctlgen

#endif // SYSCTLGEN_HARDWARE_HARDWARE_FACTS_HPP

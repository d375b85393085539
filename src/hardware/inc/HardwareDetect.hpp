#ifndef SYSCTLGEN_HARDWARE_HARDWARE_DETECT_HPP
#define SYSCTLGEN_HARDWARE_HARDWARE_DETECT_HPP
/**
 * @file HardwareDetect.hpp
 * @brief Detection of the facts the tuning rules consume (Linux).
 * @note Linux-only. Reads /proc/meminfo, /proc/mounts, /proc/net/route,
 *       /sys/class/net/, /sys/block/, DMI vendor.
 * @note Thread-safe: All functions are stateless and safe to call concurrently.
 *
 * Detection never fails: a fact that cannot be read falls back to a
 * documented default (1 CPU, 1 GB, 1000 Mbps, HDD). Text parsers are exposed
 * separately so they can be exercised on literal inputs.
 */

#include "src/hardware/inc/ContainerInfo.hpp"
#include "src/hardware/inc/HardwareFacts.hpp"

#include <array>   // std::array
#include <cstddef> // std::size_t
#include <cstdint> // std::int64_t
#include <string>  // std::string

namespace sysctlgen {

namespace hardware {

/* ----------------------------- Constants ----------------------------- */

/// Interface name size (matches IFNAMSIZ).
inline constexpr std::size_t IF_NAME_SIZE = 16;

/// Block device name size (e.g., "nvme0n1").
inline constexpr std::size_t DEVICE_NAME_SIZE = 32;

/// Link speed assumed when none can be read.
inline constexpr std::int64_t DEFAULT_NIC_MBPS = 1000;

/* ----------------------------- Probe Results ----------------------------- */

/**
 * @brief Primary network interface and its link speed.
 */
struct NicProbe {
  std::array<char, IF_NAME_SIZE> ifname{}; ///< Interface name; empty if none found
  std::int64_t speedMbps{DEFAULT_NIC_MBPS}; ///< Reported or default speed
  bool speedReported{false};                ///< True if sysfs reported a positive speed

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

/**
 * @brief Storage medium of the root device.
 */
struct DiskProbe {
  DiskMedium medium{DiskMedium::HDD};           ///< Detected medium
  std::array<char, DEVICE_NAME_SIZE> device{};  ///< Root block device; empty if unknown
  bool hostStorage{false};                      ///< Container: host disk not visible

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

/**
 * @brief Full detection result: the facts plus how they were obtained.
 */
struct DetectedHardware {
  HardwareFacts facts{};     ///< Facts passed to the rules
  ContainerInfo container{}; ///< Container detection details
  NicProbe nic{};            ///< Interface probe details
  DiskProbe disk{};          ///< Disk probe details

  /// @brief Human-readable summary of all probes.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- Parsers ----------------------------- */

/**
 * @brief Extract MemTotal (kB) from /proc/meminfo content.
 * @return kB value, or 0 if the field is missing.
 */
[[nodiscard]] std::int64_t parseMemTotalKb(const char* meminfo) noexcept;

/**
 * @brief Convert MemTotal kB to GB rounded to nearest, at least 1.
 */
[[nodiscard]] std::int64_t ramGbFromMemTotalKb(std::int64_t kb) noexcept;

/**
 * @brief Convert a cgroup limit in bytes to whole GB (truncated), at least 1.
 */
[[nodiscard]] std::int64_t ramGbFromLimitBytes(std::int64_t bytes) noexcept;

/**
 * @brief Find the interface carrying the default route in /proc/net/route content.
 * @param procNetRoute File content.
 * @param out Interface name output (empty on failure).
 * @return true if a default route was found.
 */
[[nodiscard]] bool parseDefaultRouteInterface(const char* procNetRoute,
                                              std::array<char, IF_NAME_SIZE>& out) noexcept;

/**
 * @brief Find the source device mounted at "/" in /proc/mounts content.
 * @param procMounts File content.
 * @param out Source device output, e.g. "/dev/nvme0n1p2" (empty on failure).
 * @return true if a root mount was found (the last one wins, as in the kernel).
 */
template <std::size_t N>
[[nodiscard]] bool parseRootMountSource(const char* procMounts, std::array<char, N>& out) noexcept;

/**
 * @brief Reduce a partition device path to its whole-disk name.
 *
 * "/dev/nvme0n1p2" -> "nvme0n1", "/dev/sda1" -> "sda", "/dev/vda3" -> "vda",
 * "/dev/xvda1" -> "xvda", "/dev/mmcblk0p1" -> "mmcblk0". Other names are
 * returned without the "/dev/" prefix.
 */
[[nodiscard]] bool wholeDiskName(const char* source,
                                 std::array<char, DEVICE_NAME_SIZE>& out) noexcept;

/**
 * @brief True if the DMI system vendor names a public cloud provider.
 */
[[nodiscard]] bool isCloudVendor(const char* vendor) noexcept;

/* ----------------------------- Probes ----------------------------- */

/**
 * @brief Logical CPUs usable by this process (affinity mask), at least 1.
 */
[[nodiscard]] std::int64_t detectCpuCount() noexcept;

/**
 * @brief RAM in GB: container limit if set, else rounded MemTotal.
 */
[[nodiscard]] std::int64_t detectRamGb(const ContainerInfo& container) noexcept;

/**
 * @brief Primary interface and its speed.
 *
 * Interface: default route, else lowest-ifindex non-loopback interface.
 * Speed: /sys/class/net/\<if\>/speed when positive, else DEFAULT_NIC_MBPS.
 */
[[nodiscard]] NicProbe detectNic() noexcept;

/**
 * @brief Root storage medium.
 *
 * Container: SSD if the DMI vendor is a cloud provider, else HDD.
 * Otherwise: NVMe for nvme* devices, SSD when queue/rotational is 0, else HDD.
 */
[[nodiscard]] DiskProbe detectDisk(const ContainerInfo& container) noexcept;

/**
 * @brief Run every probe and assemble HardwareFacts (cores = threads).
 */
[[nodiscard]] DetectedHardware detectHardware() noexcept;

/* ----------------------------- Template Implementation ----------------------------- */

template <std::size_t N>
bool parseRootMountSource(const char* procMounts, std::array<char, N>& out) noexcept {
  out[0] = '\0';
  if (procMounts == nullptr) {
    return false;
  }

  bool found = false;
  const char* line = procMounts;
  while (*line != '\0') {
    const char* eol = line;
    while (*eol != '\0' && *eol != '\n') {
      ++eol;
    }

    // Fields: source mountpoint fstype options dump pass
    const char* srcEnd = line;
    while (srcEnd < eol && *srcEnd != ' ') {
      ++srcEnd;
    }
    const char* mnt = srcEnd;
    while (mnt < eol && *mnt == ' ') {
      ++mnt;
    }
    if (mnt < eol && mnt[0] == '/' && (mnt + 1 == eol || mnt[1] == ' ')) {
      const std::size_t LEN = static_cast<std::size_t>(srcEnd - line);
      const std::size_t COPY_LEN = (LEN < N - 1) ? LEN : (N - 1);
      for (std::size_t i = 0; i < COPY_LEN; ++i) {
        out[i] = line[i];
      }
      out[COPY_LEN] = '\0';
      found = true;
    }

    line = (*eol == '\0') ? eol : eol + 1;
  }
  return found;
}

} // namespace hardware

} // namespace sysctlgen

#endif // SYSCTLGEN_HARDWARE_HARDWARE_DETECT_HPP

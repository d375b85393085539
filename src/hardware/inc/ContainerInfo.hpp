#ifndef SYSCTLGEN_HARDWARE_CONTAINER_INFO_HPP
#define SYSCTLGEN_HARDWARE_CONTAINER_INFO_HPP
/**
 * @file ContainerInfo.hpp
 * @brief Container detection and cgroup memory/I/O limits (Linux).
 * @note Linux-only. Reads marker files, /proc/1/cgroup and /sys/fs/cgroup/.
 * @note Thread-safe: All functions are stateless and safe to call concurrently.
 *
 * A container changes how RAM and disk are detected: the cgroup memory limit
 * replaces MemTotal, and the host disk is not visible.
 */

#include <cstdint> // std::int64_t, std::uint8_t
#include <string>  // std::string

namespace sysctlgen {

namespace hardware {

/* ----------------------------- Constants ----------------------------- */

/// Sentinel for an unset or unlimited cgroup limit.
inline constexpr std::int64_t LIMIT_UNLIMITED = -1;

/// Values at or above this are the kernel's "no limit" page-counter maximum.
inline constexpr std::int64_t CGROUP_V1_NO_LIMIT_FLOOR = 0x7FFFFFFFFFFFF000LL;

/* ----------------------------- Enums ----------------------------- */

/**
 * @brief Container runtime family.
 */
enum class ContainerRuntime : std::uint8_t {
  NONE = 0, ///< Not in a container
  DOCKER,   ///< Docker (or docker-compatible)
  LXC,      ///< LXC/LXD
  PODMAN,   ///< Podman
};

/**
 * @brief Convert ContainerRuntime to lower-case name.
 * @return "none", "docker", "lxc" or "podman".
 */
[[nodiscard]] const char* toString(ContainerRuntime runtime) noexcept;

/* ----------------------------- ContainerInfo ----------------------------- */

/**
 * @brief Container presence and the limits that affect detection.
 */
struct ContainerInfo {
  bool detected{false};                            ///< Container environment detected
  ContainerRuntime runtime{ContainerRuntime::NONE}; ///< Runtime family
  std::int64_t memLimitBytes{LIMIT_UNLIMITED};     ///< cgroup memory limit; LIMIT_UNLIMITED if none
  bool hasIoLimits{false};                         ///< blkio (v1) or io.max (v2) present

  /// @brief True if a finite memory limit is set.
  [[nodiscard]] bool hasMemoryLimit() const noexcept;

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Classify runtime from /proc/1/cgroup content.
 * @param cgroupContent File content (may be nullptr).
 * @return DOCKER if "docker" appears, LXC if "/lxc/" appears, else NONE.
 */
[[nodiscard]] ContainerRuntime runtimeFromCgroup(const char* cgroupContent) noexcept;

/**
 * @brief Parse a cgroup memory limit file ("max", bytes, or the v1 no-limit value).
 * @return Limit in bytes, or LIMIT_UNLIMITED.
 */
[[nodiscard]] std::int64_t parseMemoryLimit(const char* text) noexcept;

/**
 * @brief Detect container runtime and limits.
 * @return Populated ContainerInfo.
 *
 * Order:
 *  - /.dockerenv, or "docker" in /proc/1/cgroup -> docker
 *  - "/lxc/" in /proc/1/cgroup -> lxc
 *  - /run/.containerenv -> podman
 *
 * Memory limit: /sys/fs/cgroup/memory/memory.limit_in_bytes (v1), else
 * /sys/fs/cgroup/memory.max (v2).
 */
[[nodiscard]] ContainerInfo getContainerInfo() noexcept;

} // namespace hardware

} // namespace sysctlgen

#endif // SYSCTLGEN_HARDWARE_CONTAINER_INFO_HPP

#ifndef SYSCTLGEN_HARDWARE_DISTRO_HPP
#define SYSCTLGEN_HARDWARE_DISTRO_HPP
/**
 * @file Distro.hpp
 * @brief Distribution family and the matching sysctl install path (Linux).
 * @note Thread-safe: All functions are stateless and safe to call concurrently.
 */

#include <cstdint> // std::uint8_t

namespace sysctlgen {

namespace hardware {

/* ----------------------------- Constants ----------------------------- */

/// Drop-in file used on RHEL-family systems.
inline constexpr const char* RHEL_INSTALL_PATH = "/etc/sysctl.d/99-custom.conf";

/// Main sysctl file used elsewhere.
inline constexpr const char* DEBIAN_INSTALL_PATH = "/etc/sysctl.conf";

/* ----------------------------- Enums ----------------------------- */

/**
 * @brief Distribution family, as far as sysctl file placement is concerned.
 */
enum class DistroFamily : std::uint8_t {
  DEBIAN = 0, ///< Debian, Ubuntu and anything unrecognized
  RHEL,       ///< Red Hat, CentOS, Fedora
};

/// @brief "debian" or "rhel".
[[nodiscard]] const char* toString(DistroFamily family) noexcept;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Classify the family from the presence of release marker files.
 * @param root Filesystem root to probe ("/" on a live system).
 * @return RHEL if redhat-release, centos-release or fedora-release exists.
 */
[[nodiscard]] DistroFamily detectDistroFamily(const char* root = "/") noexcept;

/**
 * @brief Where the generated file should be installed for a family.
 */
[[nodiscard]] const char* installPathFor(DistroFamily family) noexcept;

} // namespace hardware

} // namespace sysctlgen

#endif // SYSCTLGEN_HARDWARE_DISTRO_HPP

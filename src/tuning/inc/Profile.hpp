#ifndef SYSCTLGEN_TUNING_PROFILE_HPP
#define SYSCTLGEN_TUNING_PROFILE_HPP
/**
 * @file Profile.hpp
 * @brief Fixed set of workload profiles.
 */

#include "src/helpers/inc/Status.hpp"

#include <array>       // std::array
#include <cstddef>     // std::size_t
#include <cstdint>     // std::uint8_t
#include <string_view> // std::string_view

namespace sysctlgen {

namespace tuning {

/* ----------------------------- Enums ----------------------------- */

/**
 * @brief Workload a generated configuration targets.
 */
enum class Profile : std::uint8_t {
  GENERAL = 0,
  VIRTUALIZATION,
  WEB,
  DATABASE,
  CACHE,
  COMPUTE,
  FILESERVER,
  NETWORK,
  CONTAINER,
  DEVELOPMENT,
};

/// Number of profiles.
inline constexpr std::size_t PROFILE_COUNT = 10;

/// Every profile, in menu order.
inline constexpr std::array<Profile, PROFILE_COUNT> ALL_PROFILES = {
    Profile::GENERAL,    Profile::VIRTUALIZATION, Profile::WEB,     Profile::DATABASE,
    Profile::CACHE,      Profile::COMPUTE,        Profile::FILESERVER, Profile::NETWORK,
    Profile::CONTAINER,  Profile::DEVELOPMENT,
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Lower-case identifier ("general", "web", ...).
 */
[[nodiscard]] std::string_view toString(Profile profile) noexcept;

/**
 * @brief Description, e.g. "Web Server: Optimized for HTTP traffic".
 */
[[nodiscard]] std::string_view description(Profile profile) noexcept;

/**
 * @brief Description up to its first ':' ("Web Server").
 */
[[nodiscard]] std::string_view label(Profile profile) noexcept;

/**
 * @brief Resolve an identifier (case-insensitive, surrounding whitespace ignored).
 * @param text Identifier.
 * @param out Resolved profile (unchanged on failure).
 * @return Success, or UNKNOWN_PROFILE naming the rejected text.
 */
[[nodiscard]] helpers::Status parseProfile(std::string_view text, Profile& out);

} // namespace tuning

} // namespace sysctlgen

#endif // SYSCTLGEN_TUNING_PROFILE_HPP

#ifndef SYSCTLGEN_TUNING_PROFILE_RULES_HPP
#define SYSCTLGEN_TUNING_PROFILE_RULES_HPP
/**
 * @file ProfileRules.hpp
 * @brief Per-profile override rules and the registry that dispatches them.
 * @note Rule functions are pure and never read another profile's output.
 *
 * Each rule computes a partial map laid over the baseline. Values are either
 * clamped into a band (clampBand, minOf, maxOf) or picked from NIC/RAM tiers,
 * highest threshold first.
 */

#include "src/hardware/inc/HardwareFacts.hpp"
#include "src/tuning/inc/Profile.hpp"
#include "src/tuning/inc/SettingValue.hpp"

#include <cstdint> // std::int64_t

namespace sysctlgen {

namespace tuning {

/* ----------------------------- Types ----------------------------- */

/// Rule function signature.
using ProfileRule = OverrideMap (*)(const hardware::HardwareFacts& facts);

/* ----------------------------- Registry ----------------------------- */

/**
 * @brief Rule function registered for a profile.
 * @return Rule, or nullptr for an out-of-range enumerator.
 */
[[nodiscard]] ProfileRule ruleFor(Profile profile) noexcept;

/**
 * @brief Evaluate the registered rule (empty map for an unregistered profile).
 */
[[nodiscard]] OverrideMap profileOverrides(Profile profile, const hardware::HardwareFacts& facts);

/* ----------------------------- Rules ----------------------------- */

[[nodiscard]] OverrideMap generalRules(const hardware::HardwareFacts& facts);
[[nodiscard]] OverrideMap virtualizationRules(const hardware::HardwareFacts& facts);
[[nodiscard]] OverrideMap webRules(const hardware::HardwareFacts& facts);
[[nodiscard]] OverrideMap databaseRules(const hardware::HardwareFacts& facts);
[[nodiscard]] OverrideMap cacheRules(const hardware::HardwareFacts& facts);
[[nodiscard]] OverrideMap computeRules(const hardware::HardwareFacts& facts);
[[nodiscard]] OverrideMap fileserverRules(const hardware::HardwareFacts& facts);
[[nodiscard]] OverrideMap networkRules(const hardware::HardwareFacts& facts);
[[nodiscard]] OverrideMap containerRules(const hardware::HardwareFacts& facts);
[[nodiscard]] OverrideMap developmentRules(const hardware::HardwareFacts& facts);

/* ----------------------------- Shared Writers ----------------------------- */

/**
 * @brief Socket buffer limits and defaults common to every profile.
 *
 * Sets net.core.{rmem,wmem}_{max,default} and net.core.optmem_max.
 */
void setSocketBuffers(OverrideMap& m, std::int64_t rmemMax, std::int64_t wmemMax,
                      std::int64_t rmemDefault, std::int64_t wmemDefault, std::int64_t optmemMax);

/**
 * @brief TCP/UDP memory tuples common to every profile.
 *
 * Sets net.ipv4.{tcp_rmem,tcp_wmem,udp_mem,tcp_mem}.
 */
void setProtocolMemory(OverrideMap& m, const SettingValue& tcpRmem, const SettingValue& tcpWmem,
                       const SettingValue& udpMem, const SettingValue& tcpMem);

} // namespace tuning

} // namespace sysctlgen

#endif // SYSCTLGEN_TUNING_PROFILE_RULES_HPP

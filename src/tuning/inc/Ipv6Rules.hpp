#ifndef SYSCTLGEN_TUNING_IPV6_RULES_HPP
#define SYSCTLGEN_TUNING_IPV6_RULES_HPP
/**
 * @file Ipv6Rules.hpp
 * @brief IPv6 enable/disable overrides.
 * @note Independent of hardware facts.
 */

#include "src/tuning/inc/SettingValue.hpp"

namespace sysctlgen {

namespace tuning {

/**
 * @brief Overrides for the IPv6 toggle.
 *
 * Disabled: disable_ipv6 = 1 on all, default and lo, nothing else.
 * Enabled: disable_ipv6 = 0 on the same three, redirects and router
 * advertisements refused, neighbor table thresholds raised.
 */
[[nodiscard]] OverrideMap ipv6Overrides(bool ipv6Disabled);

} // namespace tuning

} // namespace sysctlgen

#endif // SYSCTLGEN_TUNING_IPV6_RULES_HPP

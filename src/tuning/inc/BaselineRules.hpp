#ifndef SYSCTLGEN_TUNING_BASELINE_RULES_HPP
#define SYSCTLGEN_TUNING_BASELINE_RULES_HPP
/**
 * @file BaselineRules.hpp
 * @brief Profile-independent parameter set derived from hardware facts.
 * @note Pure function; no I/O.
 */

#include "src/hardware/inc/HardwareFacts.hpp"
#include "src/tuning/inc/SettingValue.hpp"

namespace sysctlgen {

namespace tuning {

/**
 * @brief Compute the baseline every profile starts from.
 *
 * Socket buffer limits are tiered on NIC speed (10G, 1G, slower); VM
 * writeback and swappiness follow RAM and disk medium; the remaining keys
 * are constants.
 */
[[nodiscard]] SettingsMap baselineSettings(const hardware::HardwareFacts& facts);

} // namespace tuning

} // namespace sysctlgen

#endif // SYSCTLGEN_TUNING_BASELINE_RULES_HPP

#ifndef SYSCTLGEN_TUNING_RESOLUTION_ENGINE_HPP
#define SYSCTLGEN_TUNING_RESOLUTION_ENGINE_HPP
/**
 * @file ResolutionEngine.hpp
 * @brief Merge of baseline, profile and IPv6 layers, and rendering of the result.
 * @note Thread-safe: no shared state. Only writeConfig() touches the filesystem.
 *
 * Precedence is baseline < profile < IPv6: each later layer replaces whole
 * values of keys it touches and adds keys it introduces. The result is a
 * SettingsMap, so every key appears once and iteration is in byte order.
 */

#include "src/hardware/inc/HardwareFacts.hpp"
#include "src/helpers/inc/Status.hpp"
#include "src/tuning/inc/Profile.hpp"
#include "src/tuning/inc/SettingValue.hpp"

#include <ctime>       // std::time_t
#include <string>      // std::string
#include <string_view> // std::string_view

namespace sysctlgen {

namespace tuning {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Values printed in the comment block above the settings.
 */
struct RenderHeader {
  Profile profile{Profile::GENERAL}; ///< Selected profile (label is printed)
  hardware::HardwareFacts facts{};   ///< Facts the settings were derived from
  std::string generatedAt{};         ///< "YYYY-MM-DD HH:MM:SS"
  std::string installPath{};         ///< Path shown in the apply hint
};

/* ----------------------------- Merge ----------------------------- */

/**
 * @brief Lay one override layer over a map (override wins per key).
 */
void mergeLayer(SettingsMap& base, const OverrideMap& layer);

/**
 * @brief Baseline, then profile overrides, then IPv6 overrides.
 * @note Total over valid facts; call validate() first for untrusted input.
 */
[[nodiscard]] SettingsMap resolve(const hardware::HardwareFacts& facts, Profile profile,
                                  bool ipv6Disabled);

/**
 * @brief Validate facts, then resolve.
 * @param out Resolved map (untouched on failure).
 * @return Success, or INVALID_HARDWARE_FACT.
 */
[[nodiscard]] helpers::Status resolveChecked(const hardware::HardwareFacts& facts,
                                             Profile profile, bool ipv6Disabled,
                                             SettingsMap& out);

/* ----------------------------- Rendering ----------------------------- */

/**
 * @brief Local time formatted as "YYYY-MM-DD HH:MM:SS".
 */
[[nodiscard]] std::string formatTimestamp(std::time_t when);

/**
 * @brief Comment block: profile label, hardware, timestamp, apply hint, warning.
 */
[[nodiscard]] std::string renderHeader(const RenderHeader& header);

/**
 * @brief "key = value" per line, in map order.
 */
[[nodiscard]] std::string renderSettings(const SettingsMap& settings);

/**
 * @brief Header followed by the settings.
 */
[[nodiscard]] std::string render(const RenderHeader& header, const SettingsMap& settings);

/**
 * @brief JSON object of the settings (integers bare, words and tuples as strings).
 */
[[nodiscard]] std::string renderJson(const SettingsMap& settings);

/**
 * @brief Write rendered text to a path, replacing any existing file.
 * @return Success, or RENDER_FAILURE carrying the OS error. Never retried.
 */
[[nodiscard]] helpers::Status writeConfig(const char* path, std::string_view text);

} // namespace tuning

} // namespace sysctlgen

#endif // SYSCTLGEN_TUNING_RESOLUTION_ENGINE_HPP

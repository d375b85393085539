#ifndef SYSCTLGEN_TUNING_SETTING_VALUE_HPP
#define SYSCTLGEN_TUNING_SETTING_VALUE_HPP
/**
 * @file SettingValue.hpp
 * @brief Kernel parameter value and the ordered key/value maps built from it.
 *
 * A value is an integer, a bare word ("bbr", "madvise") or a tuple of
 * integers ("4096 131072 33554432"). Each kind renders to text losslessly.
 */

#include <cstdint>          // std::int64_t, std::uint8_t
#include <initializer_list> // std::initializer_list
#include <map>              // std::map
#include <string>           // std::string
#include <string_view>      // std::string_view
#include <vector>           // std::vector

namespace sysctlgen {

namespace tuning {

/* ----------------------------- Enums ----------------------------- */

/**
 * @brief Representation of a parameter value.
 */
enum class ValueKind : std::uint8_t {
  INTEGER = 0, ///< Signed 64-bit integer
  WORD,        ///< Bare word without whitespace
  TUPLE,       ///< Whitespace-separated integers
};

/// @brief "integer", "word" or "tuple".
[[nodiscard]] const char* toString(ValueKind kind) noexcept;

/* ----------------------------- SettingValue ----------------------------- */

/**
 * @brief One parameter value.
 *
 * Only the member matching kind is meaningful.
 */
struct SettingValue {
  ValueKind kind{ValueKind::INTEGER}; ///< Active representation
  std::int64_t integer{0};            ///< INTEGER payload
  std::string word{};                 ///< WORD payload
  std::vector<std::int64_t> tuple{};  ///< TUPLE payload

  [[nodiscard]] static SettingValue ofInt(std::int64_t value);
  [[nodiscard]] static SettingValue ofWord(std::string_view value);
  [[nodiscard]] static SettingValue ofTuple(std::initializer_list<std::int64_t> values);

  /// @brief Rendered text ("65535", "bbr", "4096 131072 33554432").
  [[nodiscard]] std::string toString() const;

  /// @brief JSON literal: integers bare, words and tuples quoted.
  [[nodiscard]] std::string toJson() const;

  [[nodiscard]] bool operator==(const SettingValue& other) const noexcept;
  [[nodiscard]] bool operator!=(const SettingValue& other) const noexcept {
    return !(*this == other);
  }
};

/* ----------------------------- Maps ----------------------------- */

/**
 * @brief Complete parameter set, ordered by key (byte-wise ascending).
 */
using SettingsMap = std::map<std::string, SettingValue>;

/**
 * @brief Partial parameter set laid over a SettingsMap; entries replace whole values.
 */
using OverrideMap = std::map<std::string, SettingValue>;

} // namespace tuning

} // namespace sysctlgen

#endif // SYSCTLGEN_TUNING_SETTING_VALUE_HPP

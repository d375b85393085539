#ifndef SYSCTLGEN_SESSION_SESSION_HPP
#define SYSCTLGEN_SESSION_SESSION_HPP
/**
 * @file Session.hpp
 * @brief Interactive collection of hardware facts, profile and IPv6 choice.
 * @note Reads from any std::istream and writes prompts to any FILE*, so the
 *       flow can be driven by scripted input.
 *
 * Flow: show detected values and offer manual entry, pick a profile from the
 * menu, ask about IPv6, print a summary and ask for confirmation. Invalid
 * answers are re-prompted; end of input abandons the session.
 */

#include "src/hardware/inc/HardwareDetect.hpp"
#include "src/hardware/inc/HardwareFacts.hpp"
#include "src/helpers/inc/Format.hpp"
#include "src/tuning/inc/Profile.hpp"

#include <cstddef>     // std::size_t
#include <cstdint>     // std::int64_t, std::uint8_t
#include <cstdio>      // std::FILE
#include <istream>     // std::istream
#include <string>      // std::string
#include <string_view> // std::string_view

namespace sysctlgen {

namespace session {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief How a session ended.
 */
enum class SessionOutcome : std::uint8_t {
  CONFIRMED = 0, ///< User confirmed; choices are complete
  ABORTED,       ///< User answered "n" at the confirmation
  INPUT_CLOSED,  ///< Input ended before the flow finished
};

/// @brief "confirmed", "aborted" or "input closed".
[[nodiscard]] const char* toString(SessionOutcome outcome) noexcept;

/**
 * @brief Everything the engine needs from the user.
 */
struct SessionChoices {
  hardware::HardwareFacts facts{};                 ///< Detected or entered facts
  tuning::Profile profile{tuning::Profile::GENERAL}; ///< Selected profile
  bool ipv6Disabled{false};                        ///< IPv6 disable requested
};

/* ----------------------------- Prompt ----------------------------- */

/**
 * @brief Line-oriented question/answer channel.
 */
class Prompt {
public:
  Prompt(std::istream& in, std::FILE* out, helpers::format::Palette palette) noexcept
      : in_(in), out_(out), palette_(palette) {}

  /// @brief Next input line without the trailing newline; false at end of input.
  [[nodiscard]] bool readLine(std::string& line);

  /// @brief Print text as-is.
  void say(std::string_view text);

  /**
   * @brief Ask until a positive integer is entered.
   * @return false at end of input.
   */
  [[nodiscard]] bool askPositive(std::string_view question, std::int64_t& out);

  /**
   * @brief Ask for a menu number in [1, count].
   * @param defaultChoice Answer used for an empty line; 0 means no default.
   * @return false at end of input.
   */
  [[nodiscard]] bool askChoice(int count, int defaultChoice, int& out);

  /**
   * @brief Ask a [Y/n] question; empty answer means yes.
   * @return false at end of input.
   */
  [[nodiscard]] bool askYesNo(std::string_view question, bool& out);

  [[nodiscard]] const helpers::format::Palette& palette() const noexcept { return palette_; }

private:
  void invalid(std::string_view message);

  std::istream& in_;
  std::FILE* out_;
  helpers::format::Palette palette_;
};

/* ----------------------------- Steps ----------------------------- */

/**
 * @brief Show facts and optionally replace them with manual entries.
 * @return false at end of input.
 */
[[nodiscard]] bool confirmOrInputHardware(Prompt& prompt, hardware::HardwareFacts& facts);

/**
 * @brief Profile menu in ALL_PROFILES order.
 * @return false at end of input.
 */
[[nodiscard]] bool selectProfile(Prompt& prompt, tuning::Profile& profile);

/**
 * @brief IPv6 question (keep enabled is the default).
 * @return false at end of input.
 */
[[nodiscard]] bool askIpv6(Prompt& prompt, bool& ipv6Disabled);

/* ----------------------------- API ----------------------------- */

/**
 * @brief Run the full interactive flow.
 * @param prompt Channel.
 * @param detected Detection result used for defaults and the container note.
 * @param outputPath Destination shown in the summary.
 * @param choices Filled in as the flow progresses.
 * @param assumeYes Skip the final confirmation.
 */
[[nodiscard]] SessionOutcome runSession(Prompt& prompt, const hardware::DetectedHardware& detected,
                                        std::string_view outputPath, SessionChoices& choices,
                                        bool assumeYes = false);

} // namespace session

} // namespace sysctlgen

#endif // SYSCTLGEN_SESSION_SESSION_HPP

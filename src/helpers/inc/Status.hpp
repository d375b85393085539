#ifndef SYSCTLGEN_HELPERS_STATUS_HPP
#define SYSCTLGEN_HELPERS_STATUS_HPP
/**
 * @file Status.hpp
 * @brief Error classification returned across module boundaries.
 *
 * Library code never throws. Operations that can fail return a Status carrying
 * an ErrorKind and a human-readable message naming the violated constraint.
 */

#include <cstdint>
#include <string>
#include <utility>

#include <fmt/core.h>

namespace sysctlgen {
namespace helpers {

/* ----------------------------- Enums ----------------------------- */

/**
 * @brief Failure categories surfaced to the caller.
 */
enum class ErrorKind : std::uint8_t {
  NONE = 0,              ///< Success
  INVALID_HARDWARE_FACT, ///< A hardware fact violates its constraint
  UNKNOWN_PROFILE,       ///< Profile identifier outside the fixed set
  RENDER_FAILURE,        ///< Writing the rendered configuration failed
};

/**
 * @brief Convert ErrorKind to a stable identifier.
 * @param kind Error kind.
 * @return Static string representation.
 */
[[nodiscard]] inline const char* toString(ErrorKind kind) noexcept {
  switch (kind) {
  case ErrorKind::NONE:
    return "ok";
  case ErrorKind::INVALID_HARDWARE_FACT:
    return "invalid hardware fact";
  case ErrorKind::UNKNOWN_PROFILE:
    return "unknown profile";
  case ErrorKind::RENDER_FAILURE:
    return "render failure";
  }
  return "unknown error";
}

/* ----------------------------- Status ----------------------------- */

/**
 * @brief Outcome of a fallible operation.
 */
struct Status {
  ErrorKind kind{ErrorKind::NONE}; ///< NONE on success
  std::string message{};           ///< Constraint or cause; empty on success

  /// @brief Successful status.
  [[nodiscard]] static Status success() { return Status{}; }

  /// @brief Failed status with a message.
  [[nodiscard]] static Status failure(ErrorKind kind, std::string message) {
    return Status{kind, std::move(message)};
  }

  /// @brief True if no error occurred.
  [[nodiscard]] bool ok() const noexcept { return kind == ErrorKind::NONE; }

  /// @brief "<kind>: <message>" or "ok".
  [[nodiscard]] std::string toString() const {
    if (ok()) {
      return "ok";
    }
    return fmt::format("{}: {}", helpers::toString(kind), message);
  }
};

} // namespace helpers
} // namespace sysctlgen

#endif // SYSCTLGEN_HELPERS_STATUS_HPP

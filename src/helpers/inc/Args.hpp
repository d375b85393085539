#ifndef SYSCTLGEN_HELPERS_ARGS_HPP
#define SYSCTLGEN_HELPERS_ARGS_HPP
/**
 * @file Args.hpp
 * @brief Fixed-arity command-line flag parsing for the CLI tools.
 *
 * Each flag consumes exactly ArgDef::nargs following tokens. Tokens that are
 * neither a known flag nor a consumed value are rejected.
 */

#include <algorithm>
#include <bitset>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace sysctlgen {
namespace helpers {
namespace args {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Definition for a CLI argument flag.
 */
struct ArgDef {
  std::string_view flag;   ///< Flag string, e.g. "--profile"
  std::uint8_t nargs;      ///< Number of values required after the flag
  bool required;           ///< True if flag must be provided
  std::string_view desc{}; ///< Description for help output (optional)
};

/// Map from key to argument definition.
using ArgMap = std::unordered_map<std::uint8_t, ArgDef>;

/// Map from key to parsed values.
using ParsedArgs = std::unordered_map<std::uint8_t, std::vector<std::string_view>>;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse user-provided arguments according to a flag map.
 *
 * @param args   Argument list (non-owning views; must outlive pargs).
 * @param map    Definitions of accepted flags and their requirements.
 * @param pargs  Output map of parsed values (later occurrences overwrite earlier).
 * @param error  Optional error message target (set on failure when provided).
 * @return true on success; false on unknown token, missing value or missing
 *         required flag.
 */
[[nodiscard]] inline bool
parseArgs(std::span<const std::string_view> args, const ArgMap& map, ParsedArgs& pargs,
          std::optional<std::reference_wrapper<std::string>> error = std::nullopt) {
  std::unordered_map<std::string_view, std::pair<std::uint8_t, const ArgDef*>> lut;
  lut.reserve(map.size());
  for (const auto& KV : map) {
    lut.emplace(KV.second.flag, std::make_pair(KV.first, &KV.second));
  }

  auto fail = [&error](std::string msg) {
    if (error) {
      error->get() = std::move(msg);
    }
    return false;
  };

  std::bitset<256> seen;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view TOK = args[i];
    const auto IT = lut.find(TOK);
    if (IT == lut.end()) {
      return fail(fmt::format("Unrecognized argument '{}'", TOK));
    }

    const std::uint8_t KEY = IT->second.first;
    const ArgDef& DEF = *IT->second.second;
    // Values occupy [i+1, i+nargs]
    if (i + DEF.nargs >= args.size()) {
      return fail(fmt::format("Flag '{}' expects {} value(s)", DEF.flag, DEF.nargs));
    }

    auto& out = pargs[KEY];
    out.clear();
    for (std::uint8_t k = 0; k < DEF.nargs; ++k) {
      out.emplace_back(args[i + 1 + k]);
    }
    seen.set(KEY);
    i += DEF.nargs;
  }

  for (const auto& KV : map) {
    if (KV.second.required && !seen.test(KV.first)) {
      return fail(fmt::format("Missing required argument '{}'", KV.second.flag));
    }
  }
  return true;
}

/**
 * @brief True if the flag for key was given.
 */
[[nodiscard]] inline bool has(const ParsedArgs& pargs, std::uint8_t key) noexcept {
  return pargs.find(key) != pargs.end();
}

/**
 * @brief First value of a one-argument flag, if given.
 */
[[nodiscard]] inline std::optional<std::string_view> value(const ParsedArgs& pargs,
                                                           std::uint8_t key) noexcept {
  const auto IT = pargs.find(key);
  if (IT == pargs.end() || IT->second.empty()) {
    return std::nullopt;
  }
  return IT->second.front();
}

/**
 * @brief Reject a pair of flags that cannot be given together.
 * @return false (with error set) if both flags were given.
 */
[[nodiscard]] inline bool
checkExclusive(const ParsedArgs& pargs, const ArgMap& map, std::uint8_t a, std::uint8_t b,
               std::optional<std::reference_wrapper<std::string>> error = std::nullopt) {
  if (!has(pargs, a) || !has(pargs, b)) {
    return true;
  }
  if (error) {
    error->get() = fmt::format("Arguments '{}' and '{}' cannot be combined", map.at(a).flag,
                               map.at(b).flag);
  }
  return false;
}

/**
 * @brief Print usage information for a CLI tool.
 * @param progName    Program name (typically argv[0]).
 * @param description Brief description of the tool's purpose.
 * @param map         Argument definitions to document.
 */
inline void printUsage(const char* progName, std::string_view description, const ArgMap& map) {
  fmt::print("Usage: {} [OPTIONS]\n\n", progName);
  if (!description.empty()) {
    fmt::print("{}\n\n", description);
  }
  fmt::print("Options:\n");

  std::vector<const ArgDef*> entries;
  entries.reserve(map.size());
  for (const auto& KV : map) {
    entries.push_back(&KV.second);
  }
  std::sort(entries.begin(), entries.end(),
            [](const ArgDef* a, const ArgDef* b) { return a->flag < b->flag; });

  for (const ArgDef* def : entries) {
    std::string flagStr(def->flag);
    if (def->nargs == 1) {
      flagStr += " <value>";
    } else if (def->nargs > 1) {
      flagStr += " <value> ...";
    }
    fmt::print("  {:<24}  {}{}\n", flagStr, def->desc, def->required ? " (required)" : "");
  }
}

} // namespace args
} // namespace helpers
} // namespace sysctlgen

#endif // SYSCTLGEN_HELPERS_ARGS_HPP

/**
 * @file ResolutionEngine.cpp
 * @brief Layer merge and configuration rendering.
 */

#include "src/tuning/inc/ResolutionEngine.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/tuning/inc/BaselineRules.hpp"
#include "src/tuning/inc/Ipv6Rules.hpp"
#include "src/tuning/inc/ProfileRules.hpp"

#include <iterator> // std::back_inserter

#include <fmt/chrono.h>
#include <fmt/format.h>

namespace sysctlgen {

namespace tuning {

using helpers::ErrorKind;
using helpers::Status;

/* ----------------------------- Merge ----------------------------- */

void mergeLayer(SettingsMap& base, const OverrideMap& layer) {
  for (const auto& [key, value] : layer) {
    base.insert_or_assign(key, value);
  }
}

SettingsMap resolve(const hardware::HardwareFacts& facts, Profile profile, bool ipv6Disabled) {
  SettingsMap settings = baselineSettings(facts);
  mergeLayer(settings, profileOverrides(profile, facts));
  mergeLayer(settings, ipv6Overrides(ipv6Disabled));
  return settings;
}

Status resolveChecked(const hardware::HardwareFacts& facts, Profile profile, bool ipv6Disabled,
                      SettingsMap& out) {
  Status status = hardware::validate(facts);
  if (!status.ok()) {
    return status;
  }
  out = resolve(facts, profile, ipv6Disabled);
  return Status::success();
}

/* ----------------------------- Rendering ----------------------------- */

std::string formatTimestamp(std::time_t when) {
  return fmt::format("{:%Y-%m-%d %H:%M:%S}", fmt::localtime(when));
}

std::string renderHeader(const RenderHeader& header) {
  std::string out;
  out += fmt::format("# Optimized sysctl.conf for {}\n", label(header.profile));
  out += fmt::format("# Hardware: {}\n", header.facts.summary());
  out += fmt::format("# Generated on: {}\n", header.generatedAt);
  out += "#\n";
  out += fmt::format("# Apply changes with: sudo sysctl -p {}\n", header.installPath);
  out += "#\n";
  out += "# IMPORTANT: Test these settings with your specific workload.\n";
  out += "#\n";
  return out;
}

std::string renderSettings(const SettingsMap& settings) {
  fmt::memory_buffer buf;
  for (const auto& [key, value] : settings) {
    fmt::format_to(std::back_inserter(buf), "{} = {}\n", key, value.toString());
  }
  return fmt::to_string(buf);
}

std::string render(const RenderHeader& header, const SettingsMap& settings) {
  return renderHeader(header) + renderSettings(settings);
}

std::string renderJson(const SettingsMap& settings) {
  fmt::memory_buffer buf;
  fmt::format_to(std::back_inserter(buf), "{{\n");
  std::size_t i = 0;
  for (const auto& [key, value] : settings) {
    ++i;
    fmt::format_to(std::back_inserter(buf), "  \"{}\": {}{}\n", key, value.toJson(),
                   i < settings.size() ? "," : "");
  }
  fmt::format_to(std::back_inserter(buf), "}}\n");
  return fmt::to_string(buf);
}

Status writeConfig(const char* path, std::string_view text) {
  std::string error;
  if (!helpers::files::writeTextFile(path, text, error)) {
    return Status::failure(ErrorKind::RENDER_FAILURE, error);
  }
  return Status::success();
}

} // namespace tuning

} // namespace sysctlgen

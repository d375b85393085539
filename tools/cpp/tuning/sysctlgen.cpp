/**
 * @file sysctlgen.cpp
 * @brief Generate a tuned sysctl configuration for this machine and workload.
 *
 * Detects CPU, RAM, NIC speed, disk medium and container status, lets flags
 * (or an interactive session) override them, resolves the parameter set for
 * the selected profile and writes it as a sysctl.conf-style file. Exit code
 * is 0 on success or user abort, 1 on invalid input or write failure.
 */

#include "src/hardware/inc/Distro.hpp"
#include "src/hardware/inc/HardwareDetect.hpp"
#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Format.hpp"
#include "src/helpers/inc/Status.hpp"
#include "src/helpers/inc/Strings.hpp"
#include "src/session/inc/Session.hpp"
#include "src/tuning/inc/Profile.hpp"
#include "src/tuning/inc/ResolutionEngine.hpp"

#include <unistd.h> // isatty

#include <cstdint>
#include <cstdlib> // getenv
#include <ctime>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

namespace hw = sysctlgen::hardware;
namespace tn = sysctlgen::tuning;
namespace args = sysctlgen::helpers::args;

using sysctlgen::helpers::ErrorKind;
using sysctlgen::helpers::Status;
using sysctlgen::helpers::format::Palette;

namespace {

/* ----------------------------- Argument Handling ----------------------------- */

enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_PROFILE,
  ARG_CORES,
  ARG_THREADS,
  ARG_RAM,
  ARG_NIC,
  ARG_DISK,
  ARG_CONTAINER,
  ARG_DISABLE_IPV6,
  ARG_OUTPUT,
  ARG_INSTALL_PATH,
  ARG_STDOUT,
  ARG_JSON,
  ARG_INTERACTIVE,
  ARG_YES,
  ARG_DETECT,
  ARG_LIST_PROFILES,
  ARG_NO_COLOR,
};

constexpr std::string_view DESCRIPTION =
    "Generate an optimized sysctl configuration from detected hardware and a workload profile.";

constexpr const char* OUTPUT_FILE_NAME = "sysctl-suggestion.conf";

args::ArgMap buildArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_PROFILE] = {"--profile", 1, false, "Workload profile (see --list-profiles)"};
  map[ARG_CORES] = {"--cores", 1, false, "Override detected CPU cores"};
  map[ARG_THREADS] = {"--threads", 1, false, "Override detected CPU threads"};
  map[ARG_RAM] = {"--ram", 1, false, "Override detected RAM in GB"};
  map[ARG_NIC] = {"--nic", 1, false, "Override detected NIC speed in Mbps"};
  map[ARG_DISK] = {"--disk", 1, false, "Override detected disk medium (hdd, ssd, nvme)"};
  map[ARG_CONTAINER] = {"--container", 0, false, "Treat the system as a container"};
  map[ARG_DISABLE_IPV6] = {"--disable-ipv6", 0, false, "Disable IPv6 in the generated file"};
  map[ARG_OUTPUT] = {"--output", 1, false, "Output file (default: $HOME/sysctl-suggestion.conf)"};
  map[ARG_INSTALL_PATH] = {"--install-path", 1, false,
                           "Install path shown in the header (default: by distribution)"};
  map[ARG_STDOUT] = {"--stdout", 0, false, "Print the configuration instead of writing it"};
  map[ARG_JSON] = {"--json", 0, false, "Print the resolved parameters as JSON"};
  map[ARG_INTERACTIVE] = {"--interactive", 0, false,
                          "Prompt for hardware, profile and IPv6 (not with --profile)"};
  map[ARG_YES] = {"--yes", 0, false, "Skip the interactive confirmation"};
  map[ARG_DETECT] = {"--detect", 0, false, "Print detected hardware and exit"};
  map[ARG_LIST_PROFILES] = {"--list-profiles", 0, false, "List profiles and exit"};
  map[ARG_NO_COLOR] = {"--no-color", 0, false, "Disable colored output"};
  return map;
}

/* ----------------------------- Helpers ----------------------------- */

void printError(const Status& status) { fmt::print(stderr, "Error: {}\n", status.toString()); }

std::string defaultOutputPath() {
  const char* home = std::getenv("HOME");
  if (home == nullptr || home[0] == '\0') {
    return fmt::format("./{}", OUTPUT_FILE_NAME);
  }
  return fmt::format("{}/{}", home, OUTPUT_FILE_NAME);
}

/// Parse one positive-integer override flag into target.
Status applyPositive(const args::ParsedArgs& pargs, ArgKey key, std::string_view flag,
                     std::int64_t& target) {
  const auto TEXT = args::value(pargs, key);
  if (!TEXT) {
    return Status::success();
  }
  const auto VAL = sysctlgen::helpers::strings::parsePositive(*TEXT);
  if (!VAL) {
    return Status::failure(ErrorKind::INVALID_HARDWARE_FACT,
                           fmt::format("{} expects a positive integer (got '{}')", flag, *TEXT));
  }
  target = *VAL;
  return Status::success();
}

/// Apply every hardware override flag to the detected facts.
Status applyOverrides(const args::ParsedArgs& pargs, hw::HardwareFacts& facts) {
  Status st = applyPositive(pargs, ARG_CORES, "--cores", facts.cores);
  if (st.ok()) {
    st = applyPositive(pargs, ARG_THREADS, "--threads", facts.threads);
  }
  if (st.ok()) {
    st = applyPositive(pargs, ARG_RAM, "--ram", facts.ramGb);
  }
  if (st.ok()) {
    st = applyPositive(pargs, ARG_NIC, "--nic", facts.nicMbps);
  }
  if (!st.ok()) {
    return st;
  }

  if (const auto TEXT = args::value(pargs, ARG_DISK)) {
    const auto MEDIUM = hw::parseDiskMedium(*TEXT);
    if (!MEDIUM) {
      return Status::failure(ErrorKind::INVALID_HARDWARE_FACT,
                             fmt::format("--disk expects hdd, ssd or nvme (got '{}')", *TEXT));
    }
    facts.disk = *MEDIUM;
  }
  if (args::has(pargs, ARG_CONTAINER)) {
    facts.isContainer = true;
  }
  return Status::success();
}

void printProfiles(const Palette& c) {
  fmt::print("{}\n", c.heading("Profiles:"));
  for (const tn::Profile P : tn::ALL_PROFILES) {
    fmt::print("  {} {}\n", c.yellow(fmt::format("{:<16}", tn::toString(P))), tn::description(P));
  }
}

void printDetected(const hw::DetectedHardware& detected, hw::DistroFamily family,
                   const Palette& c) {
  fmt::print("{}\n", c.heading("System Hardware Detection:"));
  fmt::print("{}", detected.toString());
  fmt::print("Distribution:\n");
  fmt::print("  Family:       {}\n", hw::toString(family));
  fmt::print("  Install path: {}\n", hw::installPathFor(family));
}

void printFollowUp(const std::string& outputPath, const std::string& installPath,
                   const hw::DetectedHardware& detected, bool isContainer, const Palette& c) {
  fmt::print("\n{}\n", c.green("Optimization complete!"));
  fmt::print("Configuration saved to: {}\n\n", c.cyan(outputPath));
  fmt::print("To apply these settings:\n");
  fmt::print("  1. Review the configuration: {}\n", c.cyan(fmt::format("less {}", outputPath)));
  fmt::print("  2. Copy it to system location: {}\n",
             c.cyan(fmt::format("sudo cp {} {}", outputPath, installPath)));
  fmt::print("  3. Apply the settings: {}\n\n",
             c.cyan(fmt::format("sudo sysctl -p {}", installPath)));

  if (isContainer) {
    fmt::print("{}\n", c.yellow("Container Environment Notes:"));
    fmt::print("- Some settings may require host privileges and might be ignored\n");
    if (detected.container.runtime == hw::ContainerRuntime::LXC) {
      fmt::print("- LXC containers may need adjusted permissions (e.g., 'lxc.cap.drop=' in the "
                 "container config)\n");
    }
    fmt::print("- Consider applying security-critical settings on the host system instead\n\n");
  }

  fmt::print("{}\n", c.yellow("Note: Always test these settings in a staging environment before "
                              "applying to production."));
}

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  const args::ArgMap ARG_MAP = buildArgMap();
  args::ParsedArgs pargs;

  std::vector<std::string_view> argList;
  argList.reserve(static_cast<std::size_t>(argc > 0 ? argc - 1 : 0));
  for (int i = 1; i < argc; ++i) {
    argList.emplace_back(argv[i]);
  }

  std::string error;
  if (!args::parseArgs(argList, ARG_MAP, pargs, error) ||
      !args::checkExclusive(pargs, ARG_MAP, ARG_PROFILE, ARG_INTERACTIVE, error)) {
    fmt::print(stderr, "Error: {}\n\n", error);
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 1;
  }
  if (args::has(pargs, ARG_HELP)) {
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 0;
  }

  const Palette C{!args::has(pargs, ARG_NO_COLOR) && ::isatty(STDOUT_FILENO) != 0};

  if (args::has(pargs, ARG_LIST_PROFILES)) {
    printProfiles(C);
    return 0;
  }

  // Gather data
  hw::DetectedHardware detected = hw::detectHardware();
  const hw::DistroFamily FAMILY = hw::detectDistroFamily();

  if (args::has(pargs, ARG_DETECT)) {
    printDetected(detected, FAMILY, C);
    return 0;
  }

  Status status = applyOverrides(pargs, detected.facts);
  if (!status.ok()) {
    printError(status);
    return 1;
  }

  const std::string INSTALL_PATH =
      std::string(args::value(pargs, ARG_INSTALL_PATH).value_or(hw::installPathFor(FAMILY)));
  const std::string OUTPUT_PATH = args::has(pargs, ARG_OUTPUT)
                                      ? std::string(*args::value(pargs, ARG_OUTPUT))
                                      : defaultOutputPath();

  sysctlgen::session::SessionChoices choices{};
  choices.facts = detected.facts;
  choices.ipv6Disabled = args::has(pargs, ARG_DISABLE_IPV6);

  if (const auto PROFILE_TEXT = args::value(pargs, ARG_PROFILE)) {
    status = tn::parseProfile(*PROFILE_TEXT, choices.profile);
    if (!status.ok()) {
      printError(status);
      fmt::print(stderr, "\n");
      printProfiles(Palette{});
      return 1;
    }
  } else if (args::has(pargs, ARG_INTERACTIVE) || ::isatty(STDIN_FILENO) != 0) {
    sysctlgen::session::Prompt prompt(std::cin, stdout, C);
    const auto OUTCOME = sysctlgen::session::runSession(prompt, detected, OUTPUT_PATH, choices,
                                                        args::has(pargs, ARG_YES));
    if (OUTCOME == sysctlgen::session::SessionOutcome::ABORTED) {
      return 0;
    }
    if (OUTCOME == sysctlgen::session::SessionOutcome::INPUT_CLOSED) {
      fmt::print(stderr, "\nError: input closed before the session finished\n");
      return 1;
    }
    fmt::print("\n{}\n", C.heading("Generating optimized sysctl.conf..."));
  } else {
    printError(Status::failure(ErrorKind::UNKNOWN_PROFILE,
                               "no profile given (use --profile <id> or --interactive)"));
    return 1;
  }

  tn::SettingsMap settings;
  status = tn::resolveChecked(choices.facts, choices.profile, choices.ipv6Disabled, settings);
  if (!status.ok()) {
    printError(status);
    return 1;
  }

  if (args::has(pargs, ARG_JSON)) {
    fmt::print("{}", tn::renderJson(settings));
    return 0;
  }

  tn::RenderHeader header{};
  header.profile = choices.profile;
  header.facts = choices.facts;
  header.generatedAt = tn::formatTimestamp(std::time(nullptr));
  header.installPath = INSTALL_PATH;
  const std::string TEXT = tn::render(header, settings);

  if (args::has(pargs, ARG_STDOUT)) {
    fmt::print("{}", TEXT);
    return 0;
  }

  status = tn::writeConfig(OUTPUT_PATH.c_str(), TEXT);
  if (!status.ok()) {
    printError(status);
    return 1;
  }

  printFollowUp(OUTPUT_PATH, INSTALL_PATH, detected, choices.facts.isContainer, C);
  return 0;
}

/**
 * @file Session.cpp
 * @brief Interactive prompt flow.
 */

#include "src/session/inc/Session.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <cstdio>
#include <string>

#include <fmt/core.h>

namespace sysctlgen {

namespace session {

using hardware::DiskMedium;
using hardware::HardwareFacts;
using helpers::strings::parsePositive;
using helpers::strings::trim;
using tuning::Profile;

const char* toString(SessionOutcome outcome) noexcept {
  switch (outcome) {
  case SessionOutcome::CONFIRMED:
    return "confirmed";
  case SessionOutcome::ABORTED:
    return "aborted";
  case SessionOutcome::INPUT_CLOSED:
    return "input closed";
  }
  return "unknown";
}

/* ----------------------------- Prompt ----------------------------- */

bool Prompt::readLine(std::string& line) {
  std::fflush(out_);
  if (!std::getline(in_, line)) {
    return false;
  }
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  return true;
}

void Prompt::say(std::string_view text) { fmt::print(out_, "{}", text); }

void Prompt::invalid(std::string_view message) {
  fmt::print(out_, "{}\n", palette_.red(message));
}

bool Prompt::askPositive(std::string_view question, std::int64_t& out) {
  std::string line;
  while (true) {
    fmt::print(out_, "{}", question);
    if (!readLine(line)) {
      return false;
    }
    if (const auto VAL = parsePositive(line)) {
      out = *VAL;
      return true;
    }
    invalid("Invalid input. Please enter a positive number.");
  }
}

bool Prompt::askChoice(int count, int defaultChoice, int& out) {
  std::string line;
  while (true) {
    fmt::print(out_, "\nEnter selection [1-{}]: ", count);
    if (!readLine(line)) {
      return false;
    }
    if (trim(line).empty() && defaultChoice > 0) {
      out = defaultChoice;
      return true;
    }
    const auto VAL = parsePositive(line);
    if (VAL && *VAL <= count) {
      out = static_cast<int>(*VAL);
      return true;
    }
    invalid("Invalid selection. Please try again.");
  }
}

bool Prompt::askYesNo(std::string_view question, bool& out) {
  std::string line;
  while (true) {
    fmt::print(out_, "\n{} [Y/n]: ", question);
    if (!readLine(line)) {
      return false;
    }
    const std::string_view ANSWER = trim(line);
    if (ANSWER.empty() || ANSWER == "y" || ANSWER == "Y") {
      out = true;
      return true;
    }
    if (ANSWER == "n" || ANSWER == "N") {
      out = false;
      return true;
    }
    invalid("Please answer y or n.");
  }
}

/* ----------------------------- Steps ----------------------------- */

bool confirmOrInputHardware(Prompt& prompt, HardwareFacts& facts) {
  const auto& C = prompt.palette();
  prompt.say(fmt::format("\n{}\n", C.heading("Hardware Parameters:")));
  prompt.say("Current detected values:\n");
  prompt.say(fmt::format("  1. CPU: {} cores / {} threads\n", C.green(std::to_string(facts.cores)),
                         C.green(std::to_string(facts.threads))));
  prompt.say(fmt::format("  2. RAM: {} GB\n", C.green(std::to_string(facts.ramGb))));
  prompt.say(fmt::format("  3. Network: {} Mbps\n", C.green(std::to_string(facts.nicMbps))));
  prompt.say(fmt::format("  4. Disk: {}\n", C.green(hardware::toString(facts.disk))));
  prompt.say("\nDo you want to use these detected values or manually input your own?\n");
  prompt.say("1) Use detected values (default)\n");
  prompt.say("2) Manually input values\n");

  int choice = 0;
  if (!prompt.askChoice(2, 1, choice)) {
    return false;
  }
  if (choice == 1) {
    prompt.say("Using detected hardware values.\n");
    return true;
  }

  HardwareFacts entered = facts;
  if (!prompt.askPositive("\nEnter number of CPU cores: ", entered.cores) ||
      !prompt.askPositive("Enter number of CPU threads: ", entered.threads) ||
      !prompt.askPositive("\nEnter RAM amount in GB: ", entered.ramGb) ||
      !prompt.askPositive("\nEnter network speed in Mbps (e.g., 1000 for 1Gbps): ",
                          entered.nicMbps)) {
    return false;
  }

  prompt.say("\nSelect disk type:\n");
  prompt.say("1) HDD (Hard Disk Drive)\n");
  prompt.say("2) SSD (Solid State Drive)\n");
  prompt.say("3) NVMe SSD\n");
  int disk = 0;
  if (!prompt.askChoice(3, 0, disk)) {
    return false;
  }
  entered.disk = static_cast<DiskMedium>(disk - 1);

  facts = entered;
  prompt.say(fmt::format("\n{}\n", C.green("Hardware parameters updated:")));
  prompt.say(fmt::format("  - CPU: {} cores / {} threads\n", facts.cores, facts.threads));
  prompt.say(fmt::format("  - RAM: {} GB\n", facts.ramGb));
  prompt.say(fmt::format("  - Network: {} Mbps\n", facts.nicMbps));
  prompt.say(fmt::format("  - Disk: {}\n", hardware::toString(facts.disk)));
  return true;
}

bool selectProfile(Prompt& prompt, Profile& profile) {
  const auto& C = prompt.palette();
  prompt.say(fmt::format("\n{}\n", C.heading("Select your server's primary use case:")));
  prompt.say("This will determine which optimization profile to use.\n\n");

  int index = 1;
  for (const Profile P : tuning::ALL_PROFILES) {
    prompt.say(fmt::format("{:2}) {} {}\n", index, C.yellow(fmt::format("{:<20}", tuning::toString(P))),
                           tuning::description(P)));
    ++index;
  }

  int choice = 0;
  if (!prompt.askChoice(static_cast<int>(tuning::PROFILE_COUNT), 0, choice)) {
    return false;
  }
  profile = tuning::ALL_PROFILES[static_cast<std::size_t>(choice - 1)];
  prompt.say(fmt::format("\nSelected: {} - {}\n", C.yellow(tuning::toString(profile)),
                         tuning::description(profile)));
  return true;
}

bool askIpv6(Prompt& prompt, bool& ipv6Disabled) {
  const auto& C = prompt.palette();
  prompt.say(fmt::format("\n{}\n", C.heading("IPv6 Configuration:")));
  prompt.say("Do you want to disable IPv6 on this system?\n\n");
  prompt.say("1) No, keep IPv6 enabled (default)\n");
  prompt.say("2) Yes, disable IPv6 completely\n");

  int choice = 0;
  if (!prompt.askChoice(2, 1, choice)) {
    return false;
  }
  ipv6Disabled = (choice == 2);
  prompt.say(fmt::format("IPv6 will be {} in the generated configuration.\n",
                         ipv6Disabled ? C.red("disabled") : C.green("enabled")));
  return true;
}

/* ----------------------------- API ----------------------------- */

SessionOutcome runSession(Prompt& prompt, const hardware::DetectedHardware& detected,
                          std::string_view outputPath, SessionChoices& choices, bool assumeYes) {
  choices.facts = detected.facts;
  if (!confirmOrInputHardware(prompt, choices.facts) || !selectProfile(prompt, choices.profile) ||
      !askIpv6(prompt, choices.ipv6Disabled)) {
    return SessionOutcome::INPUT_CLOSED;
  }

  const auto& C = prompt.palette();
  const HardwareFacts& F = choices.facts;
  prompt.say(fmt::format("\n{}\n", C.heading("Configuration Summary:")));
  prompt.say(fmt::format("  - Use Case: {} ({})\n", C.yellow(tuning::toString(choices.profile)),
                         tuning::description(choices.profile)));
  prompt.say(fmt::format("  - CPU: {} cores / {} threads\n", F.cores, F.threads));
  prompt.say(fmt::format("  - RAM: {} GB\n", F.ramGb));
  prompt.say(fmt::format("  - Network: {} Mbps\n", F.nicMbps));
  prompt.say(fmt::format("  - Disk: {}\n", hardware::toString(F.disk)));
  if (detected.container.detected) {
    prompt.say(fmt::format("  - Environment: {} container\n",
                           hardware::toString(detected.container.runtime)));
  }
  prompt.say(fmt::format("  - IPv6: {}\n",
                         choices.ipv6Disabled ? C.red("Disabled") : C.green("Enabled")));
  prompt.say(fmt::format("  - Output file: {}\n", outputPath));

  if (assumeYes) {
    return SessionOutcome::CONFIRMED;
  }
  bool proceed = false;
  if (!prompt.askYesNo("Generate sysctl.conf with these settings?", proceed)) {
    return SessionOutcome::INPUT_CLOSED;
  }
  if (!proceed) {
    prompt.say(fmt::format("{}\n", C.red("Aborted by user.")));
    return SessionOutcome::ABORTED;
  }
  return SessionOutcome::CONFIRMED;
}

} // namespace session

} // namespace sysctlgen

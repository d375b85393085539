/**
 * @file HardwareFacts.cpp
 * @brief Hardware snapshot formatting and validation.
 */

#include "src/hardware/inc/HardwareFacts.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <fmt/core.h>

namespace sysctlgen {

namespace hardware {

using helpers::ErrorKind;
using helpers::Status;

/* ----------------------------- DiskMedium ----------------------------- */

const char* toString(DiskMedium medium) noexcept {
  switch (medium) {
  case DiskMedium::HDD:
    return "HDD";
  case DiskMedium::SSD:
    return "SSD";
  case DiskMedium::NVME:
    return "NVMe";
  }
  return "unknown";
}

std::optional<DiskMedium> parseDiskMedium(std::string_view text) noexcept {
  using helpers::strings::equalsIgnoreCase;
  const std::string_view T = helpers::strings::trim(text);

  if (equalsIgnoreCase(T, "hdd")) {
    return DiskMedium::HDD;
  }
  if (equalsIgnoreCase(T, "ssd")) {
    return DiskMedium::SSD;
  }
  if (equalsIgnoreCase(T, "nvme")) {
    return DiskMedium::NVME;
  }
  return std::nullopt;
}

bool isFlash(DiskMedium medium) noexcept {
  return medium == DiskMedium::SSD || medium == DiskMedium::NVME;
}

/* ----------------------------- HardwareFacts Methods ----------------------------- */

bool HardwareFacts::isFlash() const noexcept { return hardware::isFlash(disk); }

std::string HardwareFacts::summary() const {
  return fmt::format("{} cores / {} threads, {}GB RAM, {}Mb/s NIC, {}", cores, threads, ramGb,
                     nicMbps, hardware::toString(disk));
}

std::string HardwareFacts::toString() const {
  std::string out;
  out += "Hardware Facts:\n";
  out += fmt::format("  CPU:       {} cores / {} threads\n", cores, threads);
  out += fmt::format("  RAM:       {} GB\n", ramGb);
  out += fmt::format("  Network:   {} Mbps\n", nicMbps);
  out += fmt::format("  Disk:      {}\n", hardware::toString(disk));
  out += fmt::format("  Container: {}\n", isContainer ? "yes" : "no");
  return out;
}

/* ----------------------------- API ----------------------------- */

namespace {

/// Range check for one fact; message names the field.
Status checkRange(const char* field, std::int64_t value, std::int64_t lo, std::int64_t hi,
                  const char* unit) {
  if (value < lo || value > hi) {
    return Status::failure(ErrorKind::INVALID_HARDWARE_FACT,
                           fmt::format("{} must be between {} and {}{} (got {})", field, lo, hi,
                                       unit, value));
  }
  return Status::success();
}

} // namespace

Status validate(const HardwareFacts& facts) {
  Status st = checkRange("cores", facts.cores, 1, MAX_CPUS, "");
  if (st.ok()) {
    st = checkRange("threads", facts.threads, 1, MAX_CPUS, "");
  }
  if (st.ok()) {
    st = checkRange("RAM", facts.ramGb, 1, MAX_RAM_GB, " GB");
  }
  if (st.ok()) {
    st = checkRange("NIC speed", facts.nicMbps, 1, MAX_NIC_MBPS, " Mbps");
  }
  if (!st.ok()) {
    return st;
  }
  switch (facts.disk) {
  case DiskMedium::HDD:
  case DiskMedium::SSD:
  case DiskMedium::NVME:
    break;
  default:
    return Status::failure(
        ErrorKind::INVALID_HARDWARE_FACT,
        fmt::format("unrecognized disk medium ({})", static_cast<int>(facts.disk)));
  }
  return Status::success();
}

} // namespace hardware

} // namespace sysctlgen

/**
 * @file HardwareDetect.cpp
 * @brief Implementation of CPU, RAM, NIC and disk probes.
 */

#include "src/hardware/inc/HardwareDetect.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <dirent.h> // opendir, readdir, closedir
#include <sched.h>  // sched_getaffinity, CPU_COUNT
#include <unistd.h> // sysconf

#include <cstdio>  // snprintf
#include <cstdlib> // strtoll
#include <cstring> // strcmp, strlen, strncmp, strstr

#include <fmt/core.h>

namespace sysctlgen {

namespace hardware {

namespace {

using helpers::files::pathExists;
using helpers::files::readFileInt64;
using helpers::files::readFileToBuffer;
using helpers::strings::copyToFixedArray;
using helpers::strings::startsWith;

constexpr const char* PROC_MEMINFO = "/proc/meminfo";
constexpr const char* PROC_MOUNTS = "/proc/mounts";
constexpr const char* PROC_NET_ROUTE = "/proc/net/route";
constexpr const char* SYS_CLASS_NET = "/sys/class/net";
constexpr const char* SYS_BLOCK = "/sys/block";
constexpr const char* DMI_SYS_VENDOR = "/sys/class/dmi/id/sys_vendor";

constexpr std::size_t MOUNTS_BUFFER_SIZE = 32768;
constexpr std::size_t PATH_BUFFER_SIZE = 256;

constexpr std::int64_t KB_PER_GB = 1024 * 1024;
constexpr std::int64_t BYTES_PER_GB = 1024LL * 1024 * 1024;

bool isDigit(char c) noexcept { return c >= '0' && c <= '9'; }

char lowerAscii(char c) noexcept {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

/// Case-insensitive substring test; needle must be lower-case.
bool containsIgnoreCase(const char* hay, const char* needle) noexcept {
  const std::size_t NLEN = std::strlen(needle);
  for (const char* p = hay; *p != '\0'; ++p) {
    std::size_t k = 0;
    while (k < NLEN && p[k] != '\0' && lowerAscii(p[k]) == needle[k]) {
      ++k;
    }
    if (k == NLEN) {
      return true;
    }
  }
  return false;
}

/// Skip virtual and removable block devices when guessing the root disk.
bool shouldFilterDevice(const char* name) noexcept {
  if (name[0] == '.') {
    return true;
  }
  if (startsWith(name, "loop") || startsWith(name, "ram") || startsWith(name, "dm-") ||
      startsWith(name, "zram")) {
    return true;
  }
  // Floppy: fd0, fd1, ...
  return name[0] == 'f' && name[1] == 'd' && isDigit(name[2]);
}

/// Lowest-ifindex interface other than loopback.
bool firstNonLoopbackInterface(std::array<char, IF_NAME_SIZE>& out) noexcept {
  out[0] = '\0';
  DIR* dir = ::opendir(SYS_CLASS_NET);
  if (dir == nullptr) {
    return false;
  }

  std::int64_t bestIndex = -1;
  std::array<char, PATH_BUFFER_SIZE> path{};
  struct dirent* entry = nullptr;
  while ((entry = ::readdir(dir)) != nullptr) {
    const char* NAME = entry->d_name;
    if (NAME[0] == '.' || std::strcmp(NAME, "lo") == 0) {
      continue;
    }
    std::snprintf(path.data(), path.size(), "%s/%s/ifindex", SYS_CLASS_NET, NAME);
    const std::int64_t IDX = readFileInt64(path.data(), -1);
    if (IDX < 0) {
      continue;
    }
    if (bestIndex < 0 || IDX < bestIndex) {
      bestIndex = IDX;
      copyToFixedArray(out, NAME);
    }
  }

  ::closedir(dir);
  return bestIndex >= 0;
}

/// First block device in /sys/block that is not virtual.
bool firstBlockDevice(std::array<char, DEVICE_NAME_SIZE>& out) noexcept {
  out[0] = '\0';
  DIR* dir = ::opendir(SYS_BLOCK);
  if (dir == nullptr) {
    return false;
  }

  bool found = false;
  struct dirent* entry = nullptr;
  while ((entry = ::readdir(dir)) != nullptr) {
    if (shouldFilterDevice(entry->d_name)) {
      continue;
    }
    // readdir order is arbitrary; keep the lexically smallest for stability
    if (!found || std::strcmp(entry->d_name, out.data()) < 0) {
      copyToFixedArray(out, entry->d_name);
      found = true;
    }
  }

  ::closedir(dir);
  return found;
}

} // namespace

/* ----------------------------- Probe Result Methods ----------------------------- */

std::string NicProbe::toString() const {
  return fmt::format("  Interface: {} ({} Mbps{})\n", ifname[0] != '\0' ? ifname.data() : "none",
                     speedMbps, speedReported ? "" : ", default");
}

std::string DiskProbe::toString() const {
  if (hostStorage) {
    return fmt::format("  Disk:      {} (container, host storage)\n", hardware::toString(medium));
  }
  return fmt::format("  Disk:      {} ({})\n", hardware::toString(medium),
                     device[0] != '\0' ? device.data() : "unknown device");
}

std::string DetectedHardware::toString() const {
  std::string out = facts.toString();
  out += "Probes:\n";
  out += nic.toString();
  out += disk.toString();
  out += container.toString();
  return out;
}

/* ----------------------------- Parsers ----------------------------- */

std::int64_t parseMemTotalKb(const char* meminfo) noexcept {
  if (meminfo == nullptr) {
    return 0;
  }
  const char* p = std::strstr(meminfo, "MemTotal:");
  if (p == nullptr) {
    return 0;
  }
  p += std::strlen("MemTotal:");
  char* end = nullptr;
  const long long VAL = std::strtoll(p, &end, 10);
  if (end == p || VAL < 0) {
    return 0;
  }
  return static_cast<std::int64_t>(VAL);
}

std::int64_t ramGbFromMemTotalKb(std::int64_t kb) noexcept {
  if (kb <= 0) {
    return 1;
  }
  const std::int64_t GB = (kb + KB_PER_GB / 2) / KB_PER_GB;
  return GB < 1 ? 1 : GB;
}

std::int64_t ramGbFromLimitBytes(std::int64_t bytes) noexcept {
  const std::int64_t GB = bytes / BYTES_PER_GB;
  return GB < 1 ? 1 : GB;
}

bool parseDefaultRouteInterface(const char* procNetRoute,
                                std::array<char, IF_NAME_SIZE>& out) noexcept {
  out[0] = '\0';
  if (procNetRoute == nullptr) {
    return false;
  }

  const char* line = procNetRoute;
  bool header = true;
  while (*line != '\0') {
    const char* eol = line;
    while (*eol != '\0' && *eol != '\n') {
      ++eol;
    }

    if (!header) {
      // Fields: Iface Destination Gateway Flags ...
      const char* ifEnd = line;
      while (ifEnd < eol && *ifEnd != '\t' && *ifEnd != ' ') {
        ++ifEnd;
      }
      const char* dst = ifEnd;
      while (dst < eol && (*dst == '\t' || *dst == ' ')) {
        ++dst;
      }
      if (ifEnd > line && eol - dst >= 8 && std::strncmp(dst, "00000000", 8) == 0 &&
          (dst + 8 == eol || dst[8] == '\t' || dst[8] == ' ')) {
        copyToFixedArray(out, std::string_view(line, static_cast<std::size_t>(ifEnd - line)));
        return true;
      }
    }
    header = false;
    line = (*eol == '\0') ? eol : eol + 1;
  }
  return false;
}

bool wholeDiskName(const char* source, std::array<char, DEVICE_NAME_SIZE>& out) noexcept {
  out[0] = '\0';
  if (!startsWith(source, "/dev/")) {
    return false;
  }
  const char* name = source + std::strlen("/dev/");
  std::size_t len = std::strlen(name);
  if (len == 0) {
    return false;
  }

  if (startsWith(name, "nvme") || startsWith(name, "mmcblk")) {
    // Partitions are "<disk>p<N>" where <disk> ends in a digit
    std::size_t i = len;
    while (i > 0 && isDigit(name[i - 1])) {
      --i;
    }
    if (i < len && i >= 2 && name[i - 1] == 'p' && isDigit(name[i - 2])) {
      len = i - 1;
    }
  } else {
    while (len > 1 && isDigit(name[len - 1])) {
      --len;
    }
  }

  copyToFixedArray(out, std::string_view(name, len));
  return true;
}

bool isCloudVendor(const char* vendor) noexcept {
  if (vendor == nullptr || vendor[0] == '\0') {
    return false;
  }
  return containsIgnoreCase(vendor, "amazon") || containsIgnoreCase(vendor, "google") ||
         containsIgnoreCase(vendor, "microsoft") || containsIgnoreCase(vendor, "azure") ||
         containsIgnoreCase(vendor, "digitalocean");
}

/* ----------------------------- Probes ----------------------------- */

std::int64_t detectCpuCount() noexcept {
  cpu_set_t set;
  CPU_ZERO(&set);
  if (::sched_getaffinity(0, sizeof(set), &set) == 0) {
    const int COUNT = CPU_COUNT(&set);
    if (COUNT > 0) {
      return COUNT;
    }
  }
  const long ONLINE = ::sysconf(_SC_NPROCESSORS_ONLN);
  return ONLINE > 0 ? static_cast<std::int64_t>(ONLINE) : 1;
}

std::int64_t detectRamGb(const ContainerInfo& container) noexcept {
  if (container.detected && container.hasMemoryLimit()) {
    return ramGbFromLimitBytes(container.memLimitBytes);
  }
  std::array<char, helpers::files::TEXT_READ_BUFFER_SIZE> buf{};
  (void)readFileToBuffer(PROC_MEMINFO, buf.data(), buf.size());
  return ramGbFromMemTotalKb(parseMemTotalKb(buf.data()));
}

NicProbe detectNic() noexcept {
  NicProbe probe{};

  std::array<char, helpers::files::TEXT_READ_BUFFER_SIZE> routes{};
  (void)readFileToBuffer(PROC_NET_ROUTE, routes.data(), routes.size());
  if (!parseDefaultRouteInterface(routes.data(), probe.ifname)) {
    (void)firstNonLoopbackInterface(probe.ifname);
  }

  if (probe.ifname[0] != '\0') {
    std::array<char, PATH_BUFFER_SIZE> path{};
    std::snprintf(path.data(), path.size(), "%s/%s/speed", SYS_CLASS_NET, probe.ifname.data());
    // Reads fail (EINVAL) or report -1 when the link is down or virtual
    const std::int64_t SPEED = readFileInt64(path.data(), -1);
    if (SPEED > 0) {
      probe.speedMbps = SPEED;
      probe.speedReported = true;
    }
  }
  return probe;
}

DiskProbe detectDisk(const ContainerInfo& container) noexcept {
  DiskProbe probe{};

  if (container.detected) {
    probe.hostStorage = true;
    std::array<char, helpers::files::INT_READ_BUFFER_SIZE> vendor{};
    (void)readFileToBuffer(DMI_SYS_VENDOR, vendor.data(), vendor.size());
    probe.medium = isCloudVendor(vendor.data()) ? DiskMedium::SSD : DiskMedium::HDD;
    return probe;
  }

  std::array<char, MOUNTS_BUFFER_SIZE> mounts{};
  (void)readFileToBuffer(PROC_MOUNTS, mounts.data(), mounts.size());
  std::array<char, PATH_BUFFER_SIZE> source{};
  const bool ROOT_FOUND = parseRootMountSource(mounts.data(), source);

  std::array<char, PATH_BUFFER_SIZE> path{};
  bool resolved = ROOT_FOUND && wholeDiskName(source.data(), probe.device);
  if (resolved) {
    std::snprintf(path.data(), path.size(), "%s/%s", SYS_BLOCK, probe.device.data());
    resolved = pathExists(path.data());
  }
  if (!resolved) {
    // /dev/root, overlay, or a mapper device: guess from the first real disk
    (void)firstBlockDevice(probe.device);
  }

  if (probe.device[0] == '\0') {
    return probe;
  }
  if (startsWith(probe.device.data(), "nvme")) {
    probe.medium = DiskMedium::NVME;
    return probe;
  }

  std::snprintf(path.data(), path.size(), "%s/%s/queue/rotational", SYS_BLOCK,
                probe.device.data());
  probe.medium = (readFileInt64(path.data(), 1) == 0) ? DiskMedium::SSD : DiskMedium::HDD;
  return probe;
}

DetectedHardware detectHardware() noexcept {
  DetectedHardware hw{};
  hw.container = getContainerInfo();
  hw.nic = detectNic();
  hw.disk = detectDisk(hw.container);

  const std::int64_t CPUS = detectCpuCount();
  hw.facts.cores = CPUS;
  hw.facts.threads = CPUS;
  hw.facts.ramGb = detectRamGb(hw.container);
  hw.facts.nicMbps = hw.nic.speedMbps;
  hw.facts.disk = hw.disk.medium;
  hw.facts.isContainer = hw.container.detected;
  return hw;
}

} // namespace hardware

} // namespace sysctlgen

/**
 * @file ContainerInfo.cpp
 * @brief Implementation of container detection and cgroup limit queries.
 */

#include "src/hardware/inc/ContainerInfo.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Format.hpp"

#include <array>
#include <cstdlib> // strtoll
#include <cstring> // strstr, strcmp

#include <fmt/core.h>

namespace sysctlgen {

namespace hardware {

namespace {

using helpers::files::pathExists;
using helpers::files::readFileToBuffer;

constexpr const char* PROC_1_CGROUP = "/proc/1/cgroup";
constexpr const char* CGROUP_V1_MEMORY_LIMIT = "/sys/fs/cgroup/memory/memory.limit_in_bytes";
constexpr const char* CGROUP_V2_MEMORY_MAX = "/sys/fs/cgroup/memory.max";

/// Read a cgroup memory limit file; LIMIT_UNLIMITED if absent.
std::int64_t readMemoryLimit(const char* path) noexcept {
  std::array<char, 64> buf{};
  if (readFileToBuffer(path, buf.data(), buf.size()) == 0) {
    return LIMIT_UNLIMITED;
  }
  return parseMemoryLimit(buf.data());
}

} // namespace

/* ----------------------------- ContainerRuntime toString ----------------------------- */

const char* toString(ContainerRuntime runtime) noexcept {
  switch (runtime) {
  case ContainerRuntime::DOCKER:
    return "docker";
  case ContainerRuntime::LXC:
    return "lxc";
  case ContainerRuntime::PODMAN:
    return "podman";
  case ContainerRuntime::NONE:
  default:
    return "none";
  }
}

/* ----------------------------- ContainerInfo Methods ----------------------------- */

bool ContainerInfo::hasMemoryLimit() const noexcept {
  return memLimitBytes != LIMIT_UNLIMITED && memLimitBytes > 0;
}

std::string ContainerInfo::toString() const {
  std::string out;
  out += "Container:\n";
  out += fmt::format("  Detected:   {}\n", detected ? "yes" : "no");
  if (!detected) {
    return out;
  }
  out += fmt::format("  Runtime:    {}\n", hardware::toString(runtime));
  if (hasMemoryLimit()) {
    out += fmt::format("  Mem limit:  {}\n",
                       helpers::format::bytesBinary(static_cast<std::uint64_t>(memLimitBytes)));
  } else {
    out += "  Mem limit:  unlimited\n";
  }
  out += fmt::format("  I/O limits: {}\n", hasIoLimits ? "yes" : "no");
  return out;
}

/* ----------------------------- API ----------------------------- */

ContainerRuntime runtimeFromCgroup(const char* cgroupContent) noexcept {
  if (cgroupContent == nullptr || cgroupContent[0] == '\0') {
    return ContainerRuntime::NONE;
  }
  if (std::strstr(cgroupContent, "docker") != nullptr) {
    return ContainerRuntime::DOCKER;
  }
  if (std::strstr(cgroupContent, "/lxc/") != nullptr) {
    return ContainerRuntime::LXC;
  }
  return ContainerRuntime::NONE;
}

std::int64_t parseMemoryLimit(const char* text) noexcept {
  if (text == nullptr || text[0] == '\0' || std::strcmp(text, "max") == 0) {
    return LIMIT_UNLIMITED;
  }

  char* end = nullptr;
  const long long VAL = std::strtoll(text, &end, 10);
  if (end == text || VAL <= 0 || VAL >= CGROUP_V1_NO_LIMIT_FLOOR) {
    return LIMIT_UNLIMITED;
  }
  return static_cast<std::int64_t>(VAL);
}

ContainerInfo getContainerInfo() noexcept {
  ContainerInfo info{};

  std::array<char, helpers::files::TEXT_READ_BUFFER_SIZE> cgroupBuf{};
  (void)readFileToBuffer(PROC_1_CGROUP, cgroupBuf.data(), cgroupBuf.size());
  const ContainerRuntime FROM_CGROUP = runtimeFromCgroup(cgroupBuf.data());

  if (pathExists("/.dockerenv")) {
    info.runtime = ContainerRuntime::DOCKER;
  } else if (FROM_CGROUP != ContainerRuntime::NONE) {
    info.runtime = FROM_CGROUP;
  } else if (pathExists("/run/.containerenv")) {
    info.runtime = ContainerRuntime::PODMAN;
  }
  info.detected = (info.runtime != ContainerRuntime::NONE);

  if (!info.detected) {
    return info;
  }

  // v1 takes precedence when both hierarchies are mounted
  if (pathExists(CGROUP_V1_MEMORY_LIMIT)) {
    info.memLimitBytes = readMemoryLimit(CGROUP_V1_MEMORY_LIMIT);
  } else if (pathExists(CGROUP_V2_MEMORY_MAX)) {
    info.memLimitBytes = readMemoryLimit(CGROUP_V2_MEMORY_MAX);
  }

  info.hasIoLimits = pathExists("/sys/fs/cgroup/blkio") || pathExists("/sys/fs/cgroup/io.max");
  return info;
}

} // namespace hardware

} // namespace sysctlgen

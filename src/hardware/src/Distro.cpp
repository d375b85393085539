/**
 * @file Distro.cpp
 * @brief Release-file based distribution family detection.
 */

#include "src/hardware/inc/Distro.hpp"
#include "src/helpers/inc/Files.hpp"

#include <array>
#include <cstdio> // snprintf
#include <string> // std::char_traits

namespace sysctlgen {

namespace hardware {

namespace {

constexpr std::array<const char*, 3> RHEL_RELEASE_FILES = {
    "etc/redhat-release",
    "etc/centos-release",
    "etc/fedora-release",
};

} // namespace

const char* toString(DistroFamily family) noexcept {
  switch (family) {
  case DistroFamily::RHEL:
    return "rhel";
  case DistroFamily::DEBIAN:
  default:
    return "debian";
  }
}

DistroFamily detectDistroFamily(const char* root) noexcept {
  if (root == nullptr || root[0] == '\0') {
    root = "/";
  }
  const bool TRAILING_SLASH = root[std::char_traits<char>::length(root) - 1] == '/';

  std::array<char, 512> path{};
  for (const char* rel : RHEL_RELEASE_FILES) {
    std::snprintf(path.data(), path.size(), "%s%s%s", root, TRAILING_SLASH ? "" : "/", rel);
    if (helpers::files::pathExists(path.data())) {
      return DistroFamily::RHEL;
    }
  }
  return DistroFamily::DEBIAN;
}

const char* installPathFor(DistroFamily family) noexcept {
  return family == DistroFamily::RHEL ? RHEL_INSTALL_PATH : DEBIAN_INSTALL_PATH;
}

} // namespace hardware

} // namespace sysctlgen

/**
 * @file Profile.cpp
 * @brief Profile names, descriptions and lookup.
 */

#include "src/tuning/inc/Profile.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <string>

#include <fmt/core.h>

namespace sysctlgen {

namespace tuning {

using helpers::ErrorKind;
using helpers::Status;

std::string_view toString(Profile profile) noexcept {
  switch (profile) {
  case Profile::GENERAL:
    return "general";
  case Profile::VIRTUALIZATION:
    return "virtualization";
  case Profile::WEB:
    return "web";
  case Profile::DATABASE:
    return "database";
  case Profile::CACHE:
    return "cache";
  case Profile::COMPUTE:
    return "compute";
  case Profile::FILESERVER:
    return "fileserver";
  case Profile::NETWORK:
    return "network";
  case Profile::CONTAINER:
    return "container";
  case Profile::DEVELOPMENT:
    return "development";
  }
  return "unknown";
}

std::string_view description(Profile profile) noexcept {
  switch (profile) {
  case Profile::GENERAL:
    return "General Purpose: Balanced tuning for mixed workloads";
  case Profile::VIRTUALIZATION:
    return "Virtualization Host: For KVM/QEMU/Proxmox/ESXi/etc.";
  case Profile::WEB:
    return "Web Server: Optimized for HTTP traffic";
  case Profile::DATABASE:
    return "Database Server: Tuned for MySQL/PostgreSQL/etc.";
  case Profile::CACHE:
    return "Caching Server: For Redis/Memcached/etc.";
  case Profile::COMPUTE:
    return "HPC / Compute Node: For computational workloads";
  case Profile::FILESERVER:
    return "File Server: For NFS/SMB/file storage";
  case Profile::NETWORK:
    return "Network Appliance: For routers/firewalls/gateways";
  case Profile::CONTAINER:
    return "Container Host: For Docker/Kubernetes nodes";
  case Profile::DEVELOPMENT:
    return "Development Machine: For coding workstations";
  }
  return "Unknown";
}

std::string_view label(Profile profile) noexcept {
  const std::string_view DESC = description(profile);
  return DESC.substr(0, DESC.find(':'));
}

Status parseProfile(std::string_view text, Profile& out) {
  const std::string WANTED = helpers::strings::toLower(helpers::strings::trim(text));
  for (const Profile P : ALL_PROFILES) {
    if (toString(P) == WANTED) {
      out = P;
      return Status::success();
    }
  }
  return Status::failure(ErrorKind::UNKNOWN_PROFILE,
                         fmt::format("'{}' is not one of the {} profiles", text, PROFILE_COUNT));
}

} // namespace tuning

} // namespace sysctlgen

/**
 * @file Ipv6Rules.cpp
 * @brief IPv6 toggle overrides.
 */

#include "src/tuning/inc/Ipv6Rules.hpp"

namespace sysctlgen {

namespace tuning {

OverrideMap ipv6Overrides(bool ipv6Disabled) {
  OverrideMap m;
  const std::int64_t DISABLE = ipv6Disabled ? 1 : 0;
  m["net.ipv6.conf.all.disable_ipv6"] = SettingValue::ofInt(DISABLE);
  m["net.ipv6.conf.default.disable_ipv6"] = SettingValue::ofInt(DISABLE);
  m["net.ipv6.conf.lo.disable_ipv6"] = SettingValue::ofInt(DISABLE);
  if (ipv6Disabled) {
    return m;
  }

  m["net.ipv6.conf.all.accept_redirects"] = SettingValue::ofInt(0);
  m["net.ipv6.conf.default.accept_redirects"] = SettingValue::ofInt(0);
  m["net.ipv6.conf.all.accept_ra"] = SettingValue::ofInt(0);
  m["net.ipv6.conf.default.accept_ra"] = SettingValue::ofInt(0);
  m["net.ipv6.neigh.default.gc_thresh1"] = SettingValue::ofInt(1024);
  m["net.ipv6.neigh.default.gc_thresh2"] = SettingValue::ofInt(4096);
  m["net.ipv6.neigh.default.gc_thresh3"] = SettingValue::ofInt(8192);
  return m;
}

} // namespace tuning

} // namespace sysctlgen

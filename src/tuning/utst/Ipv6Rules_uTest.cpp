/**
 * @file Ipv6Rules_uTest.cpp
 * @brief Unit tests for sysctlgen::tuning::ipv6Overrides.
 */

#include "src/tuning/inc/Ipv6Rules.hpp"

#include <gtest/gtest.h>

using sysctlgen::tuning::ipv6Overrides;
using sysctlgen::tuning::OverrideMap;
using sysctlgen::tuning::SettingValue;

/** @test Disabling touches only the three disable keys. */
TEST(Ipv6RulesTest, Disabled) {
  const OverrideMap M = ipv6Overrides(true);
  ASSERT_EQ(M.size(), 3U);
  for (const auto& [key, value] : M) {
    EXPECT_EQ(value, SettingValue::ofInt(1)) << key;
  }
  EXPECT_EQ(M.count("net.ipv6.conf.lo.disable_ipv6"), 1U);
  EXPECT_EQ(M.count("net.ipv6.conf.all.accept_ra"), 0U);
}

/** @test Enabling clears the disable keys and adds hardening. */
TEST(Ipv6RulesTest, Enabled) {
  const OverrideMap M = ipv6Overrides(false);
  ASSERT_EQ(M.size(), 10U);
  EXPECT_EQ(M.at("net.ipv6.conf.all.disable_ipv6"), SettingValue::ofInt(0));
  EXPECT_EQ(M.at("net.ipv6.conf.default.disable_ipv6"), SettingValue::ofInt(0));
  EXPECT_EQ(M.at("net.ipv6.conf.lo.disable_ipv6"), SettingValue::ofInt(0));
  EXPECT_EQ(M.at("net.ipv6.conf.all.accept_redirects"), SettingValue::ofInt(0));
  EXPECT_EQ(M.at("net.ipv6.conf.default.accept_ra"), SettingValue::ofInt(0));
  EXPECT_EQ(M.at("net.ipv6.neigh.default.gc_thresh3"), SettingValue::ofInt(8192));
}

/**
 * @file SettingValue_uTest.cpp
 * @brief Unit tests for sysctlgen::tuning::SettingValue.
 */

#include "src/tuning/inc/SettingValue.hpp"

#include <gtest/gtest.h>

using sysctlgen::tuning::SettingsMap;
using sysctlgen::tuning::SettingValue;
using sysctlgen::tuning::ValueKind;

/** @test Each kind renders losslessly. */
TEST(SettingValueTest, Render) {
  EXPECT_EQ(SettingValue::ofInt(65535).toString(), "65535");
  EXPECT_EQ(SettingValue::ofInt(-1).toString(), "-1");
  EXPECT_EQ(SettingValue::ofWord("bbr").toString(), "bbr");
  EXPECT_EQ(SettingValue::ofTuple({4096, 131072, 33554432}).toString(), "4096 131072 33554432");
  EXPECT_EQ(SettingValue::ofTuple({1024, 65535}).toString(), "1024 65535");
}

/** @test JSON leaves integers bare and quotes the rest. */
TEST(SettingValueTest, Json) {
  EXPECT_EQ(SettingValue::ofInt(10).toJson(), "10");
  EXPECT_EQ(SettingValue::ofWord("madvise").toJson(), "\"madvise\"");
  EXPECT_EQ(SettingValue::ofTuple({1, 2, 3}).toJson(), "\"1 2 3\"");
}

/** @test Equality compares kind and payload. */
TEST(SettingValueTest, Equality) {
  EXPECT_EQ(SettingValue::ofInt(5), SettingValue::ofInt(5));
  EXPECT_NE(SettingValue::ofInt(5), SettingValue::ofInt(6));
  EXPECT_NE(SettingValue::ofWord("5"), SettingValue::ofInt(5));
  EXPECT_EQ(SettingValue::ofTuple({1, 2}), SettingValue::ofTuple({1, 2}));
  EXPECT_NE(SettingValue::ofTuple({1, 2}), SettingValue::ofTuple({1, 2, 3}));
  EXPECT_EQ(SettingValue::ofWord("fq").kind, ValueKind::WORD);
}

/** @test Map iteration is byte-wise ascending ('-' sorts before '.' and '_'). */
TEST(SettingValueTest, MapOrderIsBytewise) {
  SettingsMap m;
  m["vm.page_cluster_x"] = SettingValue::ofInt(1);
  m["vm.page-cluster"] = SettingValue::ofInt(0);
  m["fs.file-max"] = SettingValue::ofInt(2);
  m["fs.aio-max-nr"] = SettingValue::ofInt(3);

  auto it = m.begin();
  EXPECT_EQ((it++)->first, "fs.aio-max-nr");
  EXPECT_EQ((it++)->first, "fs.file-max");
  EXPECT_EQ((it++)->first, "vm.page-cluster");
  EXPECT_EQ((it++)->first, "vm.page_cluster_x");
  EXPECT_EQ(it, m.end());
}

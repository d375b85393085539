/**
 * @file ContainerInfo_uTest.cpp
 * @brief Unit tests for sysctlgen::hardware::ContainerInfo.
 *
 * Notes:
 *  - Live detection is asserted by invariants only; parsers use literal input.
 */

#include "src/hardware/inc/ContainerInfo.hpp"

#include <gtest/gtest.h>

#include <string>

using sysctlgen::hardware::CGROUP_V1_NO_LIMIT_FLOOR;
using sysctlgen::hardware::ContainerInfo;
using sysctlgen::hardware::ContainerRuntime;
using sysctlgen::hardware::getContainerInfo;
using sysctlgen::hardware::LIMIT_UNLIMITED;
using sysctlgen::hardware::parseMemoryLimit;
using sysctlgen::hardware::runtimeFromCgroup;

/* ----------------------------- runtimeFromCgroup ----------------------------- */

/** @test Docker and LXC paths are recognized. */
TEST(ContainerInfoTest, RuntimeFromCgroup) {
  EXPECT_EQ(runtimeFromCgroup("12:memory:/docker/3f2a9c\n11:cpu:/docker/3f2a9c"),
            ContainerRuntime::DOCKER);
  EXPECT_EQ(runtimeFromCgroup("0::/lxc/web01"), ContainerRuntime::LXC);
  EXPECT_EQ(runtimeFromCgroup("0::/init.scope"), ContainerRuntime::NONE);
  EXPECT_EQ(runtimeFromCgroup(""), ContainerRuntime::NONE);
  EXPECT_EQ(runtimeFromCgroup(nullptr), ContainerRuntime::NONE);
}

/* ----------------------------- parseMemoryLimit ----------------------------- */

/** @test Finite limits parse; "max" and the v1 sentinel mean unlimited. */
TEST(ContainerInfoTest, ParseMemoryLimit) {
  EXPECT_EQ(parseMemoryLimit("2147483648"), 2147483648LL);
  EXPECT_EQ(parseMemoryLimit("max"), LIMIT_UNLIMITED);
  EXPECT_EQ(parseMemoryLimit("9223372036854771712"), LIMIT_UNLIMITED);
  EXPECT_EQ(parseMemoryLimit("0"), LIMIT_UNLIMITED);
  EXPECT_EQ(parseMemoryLimit(""), LIMIT_UNLIMITED);
  EXPECT_EQ(parseMemoryLimit("garbage"), LIMIT_UNLIMITED);
  EXPECT_EQ(parseMemoryLimit(nullptr), LIMIT_UNLIMITED);
  EXPECT_GE(9223372036854771712LL, CGROUP_V1_NO_LIMIT_FLOOR);
}

/* ----------------------------- ContainerInfo ----------------------------- */

/** @test hasMemoryLimit follows the sentinel. */
TEST(ContainerInfoTest, HasMemoryLimit) {
  ContainerInfo info{};
  EXPECT_FALSE(info.hasMemoryLimit());
  info.memLimitBytes = 1073741824;
  EXPECT_TRUE(info.hasMemoryLimit());
}

/** @test toString names the runtime and limit. */
TEST(ContainerInfoTest, ToString) {
  ContainerInfo info{};
  EXPECT_NE(info.toString().find("Detected:   no"), std::string::npos);

  info.detected = true;
  info.runtime = ContainerRuntime::PODMAN;
  info.memLimitBytes = 2147483648LL;
  const std::string S = info.toString();
  EXPECT_NE(S.find("podman"), std::string::npos);
  EXPECT_NE(S.find("2.0 GiB"), std::string::npos);
}

/** @test Live detection is self-consistent. */
TEST(ContainerInfoTest, LiveDetectionInvariants) {
  const ContainerInfo INFO = getContainerInfo();
  EXPECT_EQ(INFO.detected, INFO.runtime != ContainerRuntime::NONE);
  if (!INFO.detected) {
    EXPECT_EQ(INFO.memLimitBytes, LIMIT_UNLIMITED);
  } else if (INFO.hasMemoryLimit()) {
    EXPECT_LT(INFO.memLimitBytes, CGROUP_V1_NO_LIMIT_FLOOR);
  }
  GTEST_LOG_(INFO) << "\n" << INFO.toString();
}

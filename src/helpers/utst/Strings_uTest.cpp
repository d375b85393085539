/**
 * @file Strings_uTest.cpp
 * @brief Unit tests for sysctlgen::helpers::strings and Status.
 */

#include "src/helpers/inc/Status.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <gtest/gtest.h>

#include <array>
#include <cstring>

using sysctlgen::helpers::ErrorKind;
using sysctlgen::helpers::Status;
using sysctlgen::helpers::strings::copyToFixedArray;
using sysctlgen::helpers::strings::parsePositive;
using sysctlgen::helpers::strings::startsWith;
using sysctlgen::helpers::strings::stripTrailingWhitespace;
using sysctlgen::helpers::strings::toLower;
using sysctlgen::helpers::strings::trim;

/* ----------------------------- parsePositive ----------------------------- */

/** @test Accepts positive decimals, with surrounding whitespace. */
TEST(StringsTest, ParsePositiveAccepts) {
  EXPECT_EQ(parsePositive("8"), 8);
  EXPECT_EQ(parsePositive(" 1000\n"), 1000);
  EXPECT_EQ(parsePositive("007"), 7);
}

/** @test Rejects zero, signs, junk and overlong input. */
TEST(StringsTest, ParsePositiveRejects) {
  EXPECT_FALSE(parsePositive("").has_value());
  EXPECT_FALSE(parsePositive("0").has_value());
  EXPECT_FALSE(parsePositive("-4").has_value());
  EXPECT_FALSE(parsePositive("+4").has_value());
  EXPECT_FALSE(parsePositive("4GB").has_value());
  EXPECT_FALSE(parsePositive("1.5").has_value());
  EXPECT_FALSE(parsePositive("9999999999999999999").has_value());
}

/* ----------------------------- Manipulation ----------------------------- */

TEST(StringsTest, TrimAndLower) {
  EXPECT_EQ(trim("  web \t\r\n"), "web");
  EXPECT_EQ(trim("   "), "");
  EXPECT_EQ(toLower("NVMe"), "nvme");
}

TEST(StringsTest, EqualsIgnoreCase) {
  using sysctlgen::helpers::strings::equalsIgnoreCase;
  EXPECT_TRUE(equalsIgnoreCase("NVMe", "nvme"));
  EXPECT_TRUE(equalsIgnoreCase("ssd", "SSD"));
  EXPECT_TRUE(equalsIgnoreCase("", ""));
  EXPECT_FALSE(equalsIgnoreCase("hdd", "hd"));
  EXPECT_FALSE(equalsIgnoreCase("hdd", "ssd"));
}

/** @test Trailing whitespace is removed in place. */
TEST(StringsTest, StripTrailingWhitespace) {
  char buf[] = "1000\n \t";
  std::size_t len = std::strlen(buf);
  stripTrailingWhitespace(buf, len);
  EXPECT_EQ(len, 4U);
  EXPECT_STREQ(buf, "1000");
}

TEST(StringsTest, CopyToFixedArrayTruncates) {
  std::array<char, 4> out{};
  copyToFixedArray(out, "eth0123");
  EXPECT_STREQ(out.data(), "eth");
  EXPECT_TRUE(startsWith("nvme0n1", "nvme"));
  EXPECT_FALSE(startsWith("sda", "nvme"));
  EXPECT_FALSE(startsWith(nullptr, "x"));
}

/* ----------------------------- Status ----------------------------- */

TEST(StatusTest, SuccessAndFailure) {
  const Status OK = Status::success();
  EXPECT_TRUE(OK.ok());
  EXPECT_EQ(OK.toString(), "ok");

  const Status BAD = Status::failure(ErrorKind::UNKNOWN_PROFILE, "'gaming' is not a profile");
  EXPECT_FALSE(BAD.ok());
  EXPECT_EQ(BAD.kind, ErrorKind::UNKNOWN_PROFILE);
  EXPECT_EQ(BAD.toString(), "unknown profile: 'gaming' is not a profile");
}

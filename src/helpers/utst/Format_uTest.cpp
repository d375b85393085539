/**
 * @file Format_uTest.cpp
 * @brief Unit tests for sysctlgen::helpers::format.
 */

#include "src/helpers/inc/Format.hpp"

#include <gtest/gtest.h>

using sysctlgen::helpers::format::ANSI_RED;
using sysctlgen::helpers::format::ANSI_RESET;
using sysctlgen::helpers::format::bytesBinary;
using sysctlgen::helpers::format::Palette;

/** @test Binary units pick the largest whole unit. */
TEST(FormatTest, BytesBinary) {
  EXPECT_EQ(bytesBinary(0), "0 B");
  EXPECT_EQ(bytesBinary(512), "512 B");
  EXPECT_EQ(bytesBinary(1536), "1.5 KiB");
  EXPECT_EQ(bytesBinary(2ULL * 1024 * 1024 * 1024), "2.0 GiB");
  EXPECT_EQ(bytesBinary(3ULL * 1024 * 1024 * 1024 * 1024), "3.0 TiB");
}

/** @test A disabled palette passes text through unchanged. */
TEST(FormatTest, PaletteDisabled) {
  const Palette P{false};
  EXPECT_EQ(P.red("Error"), "Error");
  EXPECT_EQ(P.heading("Profiles:"), "Profiles:");
}

/** @test An enabled palette wraps text in the color and a reset. */
TEST(FormatTest, PaletteEnabled) {
  const Palette P{true};
  EXPECT_EQ(P.red("x"), std::string(ANSI_RED) + "x" + ANSI_RESET);
}

/**
 * @file Profile_uTest.cpp
 * @brief Unit tests for sysctlgen::tuning::Profile lookup.
 */

#include "src/tuning/inc/Profile.hpp"

#include <gtest/gtest.h>

#include <set>
#include <string>

using sysctlgen::helpers::ErrorKind;
using sysctlgen::tuning::ALL_PROFILES;
using sysctlgen::tuning::description;
using sysctlgen::tuning::label;
using sysctlgen::tuning::parseProfile;
using sysctlgen::tuning::Profile;
using sysctlgen::tuning::PROFILE_COUNT;

/** @test Every identifier is unique and parses back to its profile. */
TEST(ProfileTest, IdentifiersRoundTrip) {
  std::set<std::string> seen;
  for (const Profile P : ALL_PROFILES) {
    const std::string ID(toString(P));
    EXPECT_TRUE(seen.insert(ID).second) << ID;

    Profile parsed = Profile::GENERAL;
    EXPECT_TRUE(parseProfile(ID, parsed).ok());
    EXPECT_EQ(parsed, P);
  }
  EXPECT_EQ(seen.size(), PROFILE_COUNT);
}

/** @test Lookup ignores case and surrounding whitespace. */
TEST(ProfileTest, ParseLenient) {
  Profile p = Profile::GENERAL;
  EXPECT_TRUE(parseProfile(" FileServer\n", p).ok());
  EXPECT_EQ(p, Profile::FILESERVER);
}

/** @test Unknown names fail with UNKNOWN_PROFILE and leave the output alone. */
TEST(ProfileTest, ParseUnknown) {
  Profile p = Profile::CACHE;
  const auto ST = parseProfile("gaming", p);
  EXPECT_EQ(ST.kind, ErrorKind::UNKNOWN_PROFILE);
  EXPECT_NE(ST.message.find("gaming"), std::string::npos);
  EXPECT_EQ(p, Profile::CACHE);

  EXPECT_EQ(parseProfile("", p).kind, ErrorKind::UNKNOWN_PROFILE);
}

/** @test Label is the description up to its colon. */
TEST(ProfileTest, Label) {
  EXPECT_EQ(label(Profile::GENERAL), "General Purpose");
  EXPECT_EQ(label(Profile::COMPUTE), "HPC / Compute Node");
  EXPECT_EQ(label(Profile::NETWORK), "Network Appliance");
  EXPECT_EQ(description(Profile::WEB), "Web Server: Optimized for HTTP traffic");
  for (const Profile P : ALL_PROFILES) {
    EXPECT_FALSE(label(P).empty());
    EXPECT_EQ(label(P).find(':'), std::string_view::npos);
  }
}

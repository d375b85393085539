/**
 * @file Session_uTest.cpp
 * @brief Unit tests for the interactive session, driven by scripted input.
 */

#include "src/session/inc/Session.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <sstream>
#include <string>

using sysctlgen::hardware::ContainerRuntime;
using sysctlgen::hardware::DetectedHardware;
using sysctlgen::hardware::DiskMedium;
using sysctlgen::hardware::HardwareFacts;
using sysctlgen::helpers::format::Palette;
using sysctlgen::session::Prompt;
using sysctlgen::session::runSession;
using sysctlgen::session::SessionChoices;
using sysctlgen::session::SessionOutcome;
using sysctlgen::tuning::Profile;

namespace session = sysctlgen::session;

class SessionTest : public ::testing::Test {
protected:
  DetectedHardware detected_{};
  std::FILE* out_{nullptr};

  void SetUp() override {
    detected_.facts = HardwareFacts{8, 16, 32, 10000, DiskMedium::SSD, false};
    out_ = std::tmpfile();
    ASSERT_NE(out_, nullptr);
  }

  void TearDown() override {
    if (out_ != nullptr) {
      std::fclose(out_);
    }
  }

  /// Everything printed so far.
  std::string output() {
    std::fflush(out_);
    std::rewind(out_);
    std::string text;
    char buf[1024];
    std::size_t n = 0;
    while ((n = std::fread(buf, 1, sizeof(buf), out_)) > 0) {
      text.append(buf, n);
    }
    return text;
  }

  SessionOutcome run(const std::string& script, SessionChoices& choices, bool assumeYes = false) {
    std::istringstream in(script);
    Prompt prompt(in, out_, Palette{false});
    return runSession(prompt, detected_, "/tmp/out.conf", choices, assumeYes);
  }
};

/** @test Defaults everywhere except the profile. */
TEST_F(SessionTest, DetectedValuesConfirmed) {
  SessionChoices c;
  EXPECT_EQ(run("\n3\n\n\n", c), SessionOutcome::CONFIRMED);
  EXPECT_EQ(c.facts.summary(), detected_.facts.summary());
  EXPECT_EQ(c.profile, Profile::WEB);
  EXPECT_FALSE(c.ipv6Disabled);

  const std::string OUT = output();
  EXPECT_NE(OUT.find("1) Use detected values (default)"), std::string::npos);
  EXPECT_NE(OUT.find("Using detected hardware values."), std::string::npos);
  EXPECT_NE(OUT.find("Output file: /tmp/out.conf"), std::string::npos);
  EXPECT_NE(OUT.find("[Y/n]"), std::string::npos);
}

/** @test Manual entry re-prompts on invalid numbers and maps the disk menu. */
TEST_F(SessionTest, ManualEntry) {
  SessionChoices c;
  const std::string SCRIPT = "2\n"
                             "abc\n0\n4\n" // cores: two rejects
                             "4\n"         // threads
                             "-8\n8\n"     // RAM: one reject
                             "1000\n"      // NIC
                             "7\n1\n"      // disk: one reject, then HDD
                             "10\n"        // development
                             "2\n"         // disable IPv6
                             "y\n";
  EXPECT_EQ(run(SCRIPT, c), SessionOutcome::CONFIRMED);

  const HardwareFacts EXPECTED{4, 4, 8, 1000, DiskMedium::HDD, false};
  EXPECT_EQ(c.facts.summary(), EXPECTED.summary());
  EXPECT_EQ(c.profile, Profile::DEVELOPMENT);
  EXPECT_TRUE(c.ipv6Disabled);

  const std::string OUT = output();
  EXPECT_NE(OUT.find("Invalid input. Please enter a positive number."), std::string::npos);
  EXPECT_NE(OUT.find("Invalid selection. Please try again."), std::string::npos);
  EXPECT_NE(OUT.find("Hardware parameters updated:"), std::string::npos);
}

/** @test Profile menu rejects out-of-range and empty answers. */
TEST_F(SessionTest, ProfileMenuValidation) {
  SessionChoices c;
  EXPECT_EQ(run("1\n0\n11\n\n6\n1\nY\n", c), SessionOutcome::CONFIRMED);
  EXPECT_EQ(c.profile, Profile::COMPUTE);
  EXPECT_FALSE(c.ipv6Disabled);
}

/** @test Answering n at the confirmation aborts. */
TEST_F(SessionTest, AbortAtConfirmation) {
  SessionChoices c;
  EXPECT_EQ(run("\n1\n\nn\n", c), SessionOutcome::ABORTED);
  EXPECT_NE(output().find("Aborted by user."), std::string::npos);
}

/** @test End of input at any step closes the session. */
TEST_F(SessionTest, InputClosed) {
  SessionChoices c;
  EXPECT_EQ(run("", c), SessionOutcome::INPUT_CLOSED);
  EXPECT_EQ(run("\n", c), SessionOutcome::INPUT_CLOSED);
  EXPECT_EQ(run("\n2\n", c), SessionOutcome::INPUT_CLOSED);
  EXPECT_EQ(run("\n2\n1\n", c), SessionOutcome::INPUT_CLOSED);
  EXPECT_EQ(run("2\n4\n", c), SessionOutcome::INPUT_CLOSED);
}

/** @test assumeYes skips the confirmation question. */
TEST_F(SessionTest, AssumeYes) {
  SessionChoices c;
  EXPECT_EQ(run("\n9\n2\n", c, true), SessionOutcome::CONFIRMED);
  EXPECT_EQ(c.profile, Profile::CONTAINER);
  EXPECT_TRUE(c.ipv6Disabled);
  EXPECT_EQ(output().find("[Y/n]"), std::string::npos);
}

/** @test The summary names the container runtime when one was detected. */
TEST_F(SessionTest, ContainerNote) {
  detected_.container.detected = true;
  detected_.container.runtime = ContainerRuntime::DOCKER;
  SessionChoices c;
  EXPECT_EQ(run("\n1\n\n\n", c), SessionOutcome::CONFIRMED);
  EXPECT_NE(output().find("container"), std::string::npos);
}

/** @test Carriage returns from pasted input are ignored. */
TEST_F(SessionTest, CrLfInput) {
  SessionChoices c;
  EXPECT_EQ(run("\r\n4\r\n2\r\ny\r\n", c), SessionOutcome::CONFIRMED);
  EXPECT_EQ(c.profile, Profile::DATABASE);
  EXPECT_TRUE(c.ipv6Disabled);
}

/** @test Outcome names. */
TEST_F(SessionTest, OutcomeNames) {
  EXPECT_STREQ(session::toString(SessionOutcome::CONFIRMED), "confirmed");
  EXPECT_STREQ(session::toString(SessionOutcome::ABORTED), "aborted");
  EXPECT_STREQ(session::toString(SessionOutcome::INPUT_CLOSED), "input closed");
}

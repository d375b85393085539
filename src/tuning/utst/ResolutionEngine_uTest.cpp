/**
 * @file ResolutionEngine_uTest.cpp
 * @brief Unit tests for layer merging and rendering.
 */

#include "src/tuning/inc/ResolutionEngine.hpp"
#include "src/tuning/inc/BaselineRules.hpp"
#include "src/tuning/inc/Ipv6Rules.hpp"
#include "src/tuning/inc/ProfileRules.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <regex>
#include <set>
#include <string>
#include <unistd.h>

using sysctlgen::hardware::DiskMedium;
using sysctlgen::hardware::HardwareFacts;
using sysctlgen::helpers::ErrorKind;
using sysctlgen::tuning::ALL_PROFILES;
using sysctlgen::tuning::baselineSettings;
using sysctlgen::tuning::ipv6Overrides;
using sysctlgen::tuning::mergeLayer;
using sysctlgen::tuning::OverrideMap;
using sysctlgen::tuning::Profile;
using sysctlgen::tuning::profileOverrides;
using sysctlgen::tuning::RenderHeader;
using sysctlgen::tuning::resolve;
using sysctlgen::tuning::SettingsMap;
using sysctlgen::tuning::SettingValue;

namespace tuning = sysctlgen::tuning;

namespace {

std::string at(const SettingsMap& m, const std::string& key) {
  const auto IT = m.find(key);
  return IT == m.end() ? "<missing>" : IT->second.toString();
}

} // namespace

class ResolutionEngineTest : public ::testing::Test {
protected:
  HardwareFacts small_{};

  void SetUp() override { small_ = HardwareFacts{4, 4, 8, 1000, DiskMedium::HDD, false}; }
};

/* ----------------------------- Merge ----------------------------- */

/** @test Later layer replaces whole values and adds new keys. */
TEST_F(ResolutionEngineTest, MergeLayerOverrides) {
  SettingsMap base;
  base["a.x"] = SettingValue::ofInt(1);
  base["a.y"] = SettingValue::ofTuple({1, 2, 3});

  OverrideMap layer;
  layer["a.y"] = SettingValue::ofTuple({4, 5});
  layer["b.z"] = SettingValue::ofWord("on");
  mergeLayer(base, layer);

  EXPECT_EQ(base.size(), 3U);
  EXPECT_EQ(at(base, "a.x"), "1");
  EXPECT_EQ(at(base, "a.y"), "4 5");
  EXPECT_EQ(at(base, "b.z"), "on");
}

/** @test Every resolved key comes from the last layer that set it. */
TEST_F(ResolutionEngineTest, Precedence) {
  for (const Profile P : ALL_PROFILES) {
    for (const bool DISABLED : {false, true}) {
      const SettingsMap OUT = resolve(small_, P, DISABLED);
      const SettingsMap BASE = baselineSettings(small_);
      const OverrideMap PROF = profileOverrides(P, small_);
      const OverrideMap V6 = ipv6Overrides(DISABLED);

      for (const auto& [key, value] : OUT) {
        if (V6.count(key) != 0) {
          EXPECT_EQ(value, V6.at(key)) << key;
        } else if (PROF.count(key) != 0) {
          EXPECT_EQ(value, PROF.at(key)) << key;
        } else {
          ASSERT_EQ(BASE.count(key), 1U) << key;
          EXPECT_EQ(value, BASE.at(key)) << key;
        }
      }

      std::set<std::string> expected;
      for (const auto& kv : BASE) expected.insert(kv.first);
      for (const auto& kv : PROF) expected.insert(kv.first);
      for (const auto& kv : V6) expected.insert(kv.first);
      EXPECT_EQ(OUT.size(), expected.size()) << toString(P);
    }
  }
}

/** @test Same input, same output; rendering is byte-identical. */
TEST_F(ResolutionEngineTest, Deterministic) {
  const SettingsMap A = resolve(small_, Profile::DATABASE, false);
  const SettingsMap B = resolve(small_, Profile::DATABASE, false);
  EXPECT_EQ(A, B);
  EXPECT_EQ(tuning::renderSettings(A), tuning::renderSettings(B));
}

/** @test Rendered keys are unique and strictly ascending. */
TEST_F(ResolutionEngineTest, SortedUniqueKeys) {
  const std::string TEXT = tuning::renderSettings(resolve(small_, Profile::CONTAINER, true));
  std::string prev;
  std::size_t lines = 0;
  std::size_t pos = 0;
  while (pos < TEXT.size()) {
    const std::size_t EOL = TEXT.find('\n', pos);
    ASSERT_NE(EOL, std::string::npos);
    const std::string LINE = TEXT.substr(pos, EOL - pos);
    const std::size_t SEP = LINE.find(" = ");
    ASSERT_NE(SEP, std::string::npos) << LINE;
    const std::string KEY = LINE.substr(0, SEP);
    if (lines > 0) {
      EXPECT_LT(prev, KEY);
    }
    prev = KEY;
    ++lines;
    pos = EOL + 1;
  }
  EXPECT_GT(lines, 67U);
}

/** @test General profile on a small HDD box with IPv6 on. */
TEST_F(ResolutionEngineTest, GeneralEndToEnd) {
  const SettingsMap M = resolve(small_, Profile::GENERAL, false);
  EXPECT_EQ(at(M, "vm.swappiness"), "20");
  EXPECT_EQ(at(M, "vm.min_free_kbytes"), "32768");
  EXPECT_EQ(at(M, "net.core.somaxconn"), "4096");
  EXPECT_EQ(at(M, "net.ipv6.conf.all.disable_ipv6"), "0");
  EXPECT_EQ(at(M, "net.ipv6.conf.all.accept_ra"), "0");
  // Baseline-only keys survive
  EXPECT_EQ(at(M, "net.ipv4.tcp_congestion_control"), "bbr");
  EXPECT_EQ(at(M, "vm.page-cluster"), "0");
}

/** @test Compute on a large box keeps its own THP and zone reclaim values. */
TEST_F(ResolutionEngineTest, ComputeEndToEnd) {
  const HardwareFacts BIG{64, 128, 256, 25000, DiskMedium::NVME, false};
  const SettingsMap M = resolve(BIG, Profile::COMPUTE, true);
  EXPECT_EQ(at(M, "vm.zone_reclaim_mode"), "1");
  EXPECT_EQ(at(M, "vm.transparent_hugepage.enabled"), "always");
  EXPECT_EQ(at(M, "net.ipv6.conf.default.disable_ipv6"), "1");
  EXPECT_EQ(M.count("net.ipv6.conf.all.accept_ra"), 0U);
}

/** @test Invalid facts are refused before any rule runs. */
TEST_F(ResolutionEngineTest, ResolveCheckedRejectsInvalid) {
  HardwareFacts f = small_;
  f.ramGb = 0;
  SettingsMap out;
  out["sentinel"] = SettingValue::ofInt(1);

  const auto ST = tuning::resolveChecked(f, Profile::WEB, false, out);
  EXPECT_EQ(ST.kind, ErrorKind::INVALID_HARDWARE_FACT);
  EXPECT_EQ(out.size(), 1U);

  EXPECT_TRUE(tuning::resolveChecked(small_, Profile::WEB, false, out).ok());
  EXPECT_EQ(out, resolve(small_, Profile::WEB, false));
}

/** @test Out-of-range RAM is refused with the field named. */
TEST_F(ResolutionEngineTest, ResolveCheckedRejectsHugeRam) {
  HardwareFacts f = small_;
  f.ramGb = 200000000;
  SettingsMap out;
  const auto ST = tuning::resolveChecked(f, Profile::DATABASE, false, out);
  EXPECT_EQ(ST.kind, ErrorKind::INVALID_HARDWARE_FACT);
  EXPECT_NE(ST.message.find("RAM"), std::string::npos);
  EXPECT_TRUE(out.empty());
}

/** @test The largest accepted facts resolve to non-negative values in every profile. */
TEST_F(ResolutionEngineTest, LargestFactsStayInRange) {
  using sysctlgen::hardware::MAX_CPUS;
  using sysctlgen::hardware::MAX_NIC_MBPS;
  using sysctlgen::hardware::MAX_RAM_GB;
  using sysctlgen::tuning::ValueKind;

  const HardwareFacts TOP{MAX_CPUS, MAX_CPUS, MAX_RAM_GB, MAX_NIC_MBPS, DiskMedium::HDD, false};
  for (const Profile P : ALL_PROFILES) {
    SettingsMap out;
    ASSERT_TRUE(tuning::resolveChecked(TOP, P, false, out).ok()) << toString(P);
    for (const auto& [key, value] : out) {
      if (value.kind == ValueKind::INTEGER) {
        EXPECT_GE(value.integer, 0) << toString(P) << " " << key;
      }
      for (const std::int64_t PART : value.tuple) {
        EXPECT_GE(PART, 0) << toString(P) << " " << key;
      }
    }
  }
  SettingsMap db;
  ASSERT_TRUE(tuning::resolveChecked(TOP, Profile::DATABASE, false, db).ok());
  EXPECT_EQ(db.at("kernel.shmmax").integer, MAX_RAM_GB * 1073741824 * 80 / 100);
}

/* ----------------------------- Rendering ----------------------------- */

/** @test Header carries the profile label, hardware line and apply hint. */
TEST_F(ResolutionEngineTest, Header) {
  RenderHeader h;
  h.profile = Profile::CACHE;
  h.facts = small_;
  h.generatedAt = "2024-01-02 03:04:05";
  h.installPath = "/etc/sysctl.d/99-custom.conf";

  const std::string TEXT = tuning::renderHeader(h);
  EXPECT_EQ(TEXT.rfind("# Optimized sysctl.conf for Caching Server\n", 0), 0U);
  EXPECT_NE(TEXT.find("# Hardware: 4 cores / 4 threads, 8GB RAM, 1000Mb/s NIC, HDD\n"),
            std::string::npos);
  EXPECT_NE(TEXT.find("# Generated on: 2024-01-02 03:04:05\n"), std::string::npos);
  EXPECT_NE(TEXT.find("sudo sysctl -p /etc/sysctl.d/99-custom.conf\n"), std::string::npos);

  const SettingsMap M = resolve(small_, Profile::CACHE, false);
  const std::string FULL = tuning::render(h, M);
  EXPECT_EQ(FULL, TEXT + tuning::renderSettings(M));
  // Settings follow the header with no blank line
  EXPECT_EQ(FULL.find("\n\n"), std::string::npos);
}

/** @test Timestamp format is YYYY-MM-DD HH:MM:SS. */
TEST_F(ResolutionEngineTest, Timestamp) {
  const std::string TS = tuning::formatTimestamp(1700000000);
  EXPECT_TRUE(std::regex_match(TS, std::regex(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2})"))) << TS;
}

/** @test JSON lists keys in order; integers are bare. */
TEST_F(ResolutionEngineTest, Json) {
  SettingsMap m;
  m["b.word"] = SettingValue::ofWord("fq");
  m["a.int"] = SettingValue::ofInt(7);
  m["c.tuple"] = SettingValue::ofTuple({1, 2});
  EXPECT_EQ(tuning::renderJson(m),
            "{\n  \"a.int\": 7,\n  \"b.word\": \"fq\",\n  \"c.tuple\": \"1 2\"\n}\n");
  EXPECT_EQ(tuning::renderJson(SettingsMap{}), "{\n}\n");
}

/** @test Writing replaces the file; an unwritable path is a render failure. */
TEST_F(ResolutionEngineTest, WriteConfig) {
  char path[] = "/tmp/sysctlgen_write_XXXXXX";
  const int FD = ::mkstemp(path);
  ASSERT_GE(FD, 0);
  ::close(FD);

  const std::string TEXT = tuning::renderSettings(resolve(small_, Profile::GENERAL, true));
  ASSERT_TRUE(tuning::writeConfig(path, "stale contents that are much longer than needed\n").ok());
  ASSERT_TRUE(tuning::writeConfig(path, TEXT).ok());

  std::FILE* f = std::fopen(path, "r");
  ASSERT_NE(f, nullptr);
  std::string back;
  char buf[4096];
  std::size_t n = 0;
  while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) {
    back.append(buf, n);
  }
  std::fclose(f);
  std::remove(path);
  EXPECT_EQ(back, TEXT);

  const auto ST = tuning::writeConfig("/nonexistent-dir/sub/sysctl.conf", TEXT);
  EXPECT_EQ(ST.kind, ErrorKind::RENDER_FAILURE);
  EXPECT_FALSE(ST.message.empty());
}

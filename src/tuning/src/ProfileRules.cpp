/**
 * @file ProfileRules.cpp
 * @brief Profile registry plus the general and development rules.
 */

#include "src/tuning/inc/ProfileRules.hpp"
#include "src/tuning/inc/RuleMath.hpp"

#include <array>
#include <cstddef>

namespace sysctlgen {

namespace tuning {

using hardware::HardwareFacts;

namespace {

/// Indexed by Profile; order must follow the enum.
constexpr std::array<ProfileRule, PROFILE_COUNT> REGISTRY = {
    &generalRules, &virtualizationRules, &webRules,      &databaseRules, &cacheRules,
    &computeRules, &fileserverRules,     &networkRules,  &containerRules, &developmentRules,
};

} // namespace

/* ----------------------------- Registry ----------------------------- */

ProfileRule ruleFor(Profile profile) noexcept {
  const auto IDX = static_cast<std::size_t>(profile);
  return IDX < REGISTRY.size() ? REGISTRY[IDX] : nullptr;
}

OverrideMap profileOverrides(Profile profile, const HardwareFacts& facts) {
  const ProfileRule RULE = ruleFor(profile);
  return RULE != nullptr ? RULE(facts) : OverrideMap{};
}

/* ----------------------------- Shared Writers ----------------------------- */

void setSocketBuffers(OverrideMap& m, std::int64_t rmemMax, std::int64_t wmemMax,
                      std::int64_t rmemDefault, std::int64_t wmemDefault, std::int64_t optmemMax) {
  m["net.core.rmem_max"] = SettingValue::ofInt(rmemMax);
  m["net.core.wmem_max"] = SettingValue::ofInt(wmemMax);
  m["net.core.rmem_default"] = SettingValue::ofInt(rmemDefault);
  m["net.core.wmem_default"] = SettingValue::ofInt(wmemDefault);
  m["net.core.optmem_max"] = SettingValue::ofInt(optmemMax);
}

void setProtocolMemory(OverrideMap& m, const SettingValue& tcpRmem, const SettingValue& tcpWmem,
                       const SettingValue& udpMem, const SettingValue& tcpMem) {
  m["net.ipv4.tcp_rmem"] = tcpRmem;
  m["net.ipv4.tcp_wmem"] = tcpWmem;
  m["net.ipv4.udp_mem"] = udpMem;
  m["net.ipv4.tcp_mem"] = tcpMem;
}

/* ----------------------------- general ----------------------------- */

OverrideMap generalRules(const HardwareFacts& hw) {
  OverrideMap m;
  const bool FAST = hw.nicMbps >= NIC_10G;
  const std::int64_t RAM = hw.ramGb;

  const std::int64_t BUF_MAX = FAST ? 33554432 : 16777216;
  setSocketBuffers(m, BUF_MAX, BUF_MAX, 2097152, 2097152, 4194304);
  const SettingValue TCP_BUF = FAST ? SettingValue::ofTuple({4096, 131072, 33554432})
                                    : SettingValue::ofTuple({4096, 65536, 16777216});
  setProtocolMemory(m, TCP_BUF, TCP_BUF, SettingValue::ofTuple({4194304, 8388608, 16777216}),
                    SettingValue::ofTuple({786432, 1048576, 16777216}));

  m["net.core.somaxconn"] = SettingValue::ofInt(clampBand(hw.threads * 256, 4096, 65535));
  m["net.ipv4.tcp_max_syn_backlog"] = SettingValue::ofInt(clampBand(hw.threads * 512, 8192, 65536));
  m["net.core.netdev_max_backlog"] = SettingValue::ofInt(FAST ? 250000 : 30000);

  m["vm.swappiness"] = SettingValue::ofInt(hw.isFlash() ? 10 : 20);
  m["vm.vfs_cache_pressure"] = SettingValue::ofInt(50);
  m["vm.dirty_ratio"] = SettingValue::ofInt(RAM >= 32 ? 10 : 20);
  m["vm.dirty_background_ratio"] = SettingValue::ofInt(RAM >= 32 ? 3 : 5);
  m["vm.min_free_kbytes"] = SettingValue::ofInt(maxOf(baselineMinFreeKb(RAM), RAM * 1024));

  m["kernel.pid_max"] = SettingValue::ofInt(minOf(RAM * 16384, 4194304));
  m["fs.file-max"] = SettingValue::ofInt(minOf(RAM * 262144, 26214400));

  m["kernel.sched_migration_cost_ns"] = SettingValue::ofInt(hw.cores <= 4 ? 100000 : 500000);
  m["kernel.sched_min_granularity_ns"] = SettingValue::ofInt(10000);
  m["kernel.sched_wakeup_granularity_ns"] = SettingValue::ofInt(15000);
  return m;
}

/* ----------------------------- development ----------------------------- */

OverrideMap developmentRules(const HardwareFacts& hw) {
  OverrideMap m;
  const bool FLASH = hw.isFlash();
  const std::int64_t RAM = hw.ramGb;
  const bool GIGABIT = hw.nicMbps >= NIC_1G;

  setSocketBuffers(m, 8388608, 8388608, 1048576, 1048576, 2097152);
  const SettingValue TCP_BUF = SettingValue::ofTuple({4096, 65536, 8388608});
  setProtocolMemory(m, TCP_BUF, TCP_BUF, SettingValue::ofTuple({4194304, 4194304, 8388608}),
                    SettingValue::ofTuple({786432, 1048576, 4194304}));

  m["vm.swappiness"] = SettingValue::ofInt(FLASH ? 10 : 20);
  m["vm.vfs_cache_pressure"] = SettingValue::ofInt(FLASH ? 50 : 70);
  m["vm.dirty_ratio"] = SettingValue::ofInt(FLASH ? 10 : 20);
  m["vm.dirty_background_ratio"] = SettingValue::ofInt(FLASH ? 3 : 5);
  m["vm.dirty_expire_centisecs"] = SettingValue::ofInt(FLASH ? 1500 : 3000);
  m["vm.dirty_writeback_centisecs"] = SettingValue::ofInt(FLASH ? 250 : 500);
  m["vm.min_free_kbytes"] = SettingValue::ofInt(maxOf(baselineMinFreeKb(RAM), RAM * 512));

  // Interactive desktop: favor responsiveness over throughput
  m["kernel.sched_autogroup_enabled"] = SettingValue::ofInt(1);
  m["kernel.sched_child_runs_first"] = SettingValue::ofInt(1);
  m["kernel.sched_min_granularity_ns"] =
      SettingValue::ofInt(clampBand(hw.cores * 150000, 1000000, 10000000));
  m["kernel.sched_wakeup_granularity_ns"] =
      SettingValue::ofInt(clampBand(hw.cores * 200000, 2000000, 15000000));
  m["kernel.sched_latency_ns"] = SettingValue::ofInt(clampBand(hw.cores * 1000000, 6000000, 30000000));
  m["kernel.sched_migration_cost_ns"] =
      SettingValue::ofInt(clampBand(hw.cores * 30000, 100000, 2000000));

  m["net.core.somaxconn"] = SettingValue::ofInt(GIGABIT ? 4096 : 1024);
  m["net.ipv4.tcp_max_syn_backlog"] = SettingValue::ofInt(GIGABIT ? 2048 : 512);
  m["net.ipv4.tcp_fastopen"] = SettingValue::ofInt(3);
  m["net.ipv4.tcp_keepalive_time"] = SettingValue::ofInt(600);

  m["fs.inotify.max_user_watches"] = SettingValue::ofInt(minOf(RAM * 65536, 8388608));
  m["fs.file-max"] = SettingValue::ofInt(minOf(RAM * 32768, 4194304));
  return m;
}

} // namespace tuning

} // namespace sysctlgen

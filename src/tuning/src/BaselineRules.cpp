/**
 * @file BaselineRules.cpp
 * @brief Baseline parameter table.
 */

#include "src/tuning/inc/BaselineRules.hpp"
#include "src/tuning/inc/RuleMath.hpp"

namespace sysctlgen {

namespace tuning {

namespace {

/// Socket buffer sizes for one NIC tier.
struct BufferTier {
  std::int64_t bufMax;
  std::int64_t tcpDefault;
  std::int64_t tcpMax;
};

constexpr BufferTier TIER_10G{67108864, 262144, 33554432};
constexpr BufferTier TIER_1G{16777216, 262144, 16777216};
constexpr BufferTier TIER_SLOW{4194304, 131072, 4194304};

void addNetworkCore(SettingsMap& m, const hardware::HardwareFacts& hw) {
  const BufferTier T = tier(hw.nicMbps, NIC_10G, TIER_10G, NIC_1G, TIER_1G, TIER_SLOW);

  m["net.core.rmem_max"] = SettingValue::ofInt(T.bufMax);
  m["net.core.wmem_max"] = SettingValue::ofInt(T.bufMax);
  m["net.core.rmem_default"] = SettingValue::ofInt(2097152);
  m["net.core.wmem_default"] = SettingValue::ofInt(2097152);
  m["net.core.optmem_max"] = SettingValue::ofInt(4194304);
  m["net.ipv4.tcp_rmem"] = SettingValue::ofTuple({4096, T.tcpDefault, T.tcpMax});
  m["net.ipv4.tcp_wmem"] = SettingValue::ofTuple({4096, T.tcpDefault, T.tcpMax});
  m["net.ipv4.udp_mem"] = SettingValue::ofTuple({4194304, 8388608, 16777216});
  m["net.ipv4.tcp_mem"] = SettingValue::ofTuple({786432, 1048576, 26777216});
  m["net.ipv4.udp_rmem_min"] = SettingValue::ofInt(16384);
  m["net.ipv4.udp_wmem_min"] = SettingValue::ofInt(16384);

  m["net.core.netdev_max_backlog"] = SettingValue::ofInt(hw.nicMbps >= NIC_10G ? 250000 : 30000);
  m["net.core.somaxconn"] = SettingValue::ofInt(hw.threads * 1024);
  m["net.ipv4.tcp_max_syn_backlog"] = SettingValue::ofInt(16384);
  m["net.core.busy_poll"] = SettingValue::ofInt(50);
  m["net.core.busy_read"] = SettingValue::ofInt(50);
  m["net.core.netdev_budget_usecs"] = SettingValue::ofInt(4000);
  m["net.core.dev_weight"] = SettingValue::ofInt(64);
  m["net.core.default_qdisc"] = SettingValue::ofWord("fq");
}

void addTcp(SettingsMap& m) {
  m["net.ipv4.tcp_fastopen"] = SettingValue::ofInt(3);
  m["net.ipv4.tcp_notsent_lowat"] = SettingValue::ofInt(16384);
  m["net.ipv4.tcp_max_tw_buckets"] = SettingValue::ofInt(2000000);
  m["net.ipv4.ip_local_port_range"] = SettingValue::ofTuple({1024, 65535});
  m["net.ipv4.tcp_congestion_control"] = SettingValue::ofWord("bbr");
  m["net.ipv4.tcp_window_scaling"] = SettingValue::ofInt(1);
  m["net.ipv4.tcp_timestamps"] = SettingValue::ofInt(1);
  m["net.ipv4.tcp_sack"] = SettingValue::ofInt(1);
  m["net.ipv4.tcp_dsack"] = SettingValue::ofInt(1);
  m["net.ipv4.tcp_slow_start_after_idle"] = SettingValue::ofInt(0);
  m["net.ipv4.tcp_fin_timeout"] = SettingValue::ofInt(10);
  m["net.ipv4.tcp_keepalive_time"] = SettingValue::ofInt(300);
  m["net.ipv4.tcp_keepalive_intvl"] = SettingValue::ofInt(10);
  m["net.ipv4.tcp_keepalive_probes"] = SettingValue::ofInt(6);
  m["net.ipv4.tcp_moderate_rcvbuf"] = SettingValue::ofInt(1);
  m["net.ipv4.tcp_frto"] = SettingValue::ofInt(2);
  m["net.ipv4.tcp_mtu_probing"] = SettingValue::ofInt(1);

  m["net.ipv4.conf.all.rp_filter"] = SettingValue::ofInt(1);
  m["net.ipv4.conf.default.rp_filter"] = SettingValue::ofInt(1);
  m["net.ipv4.conf.all.accept_redirects"] = SettingValue::ofInt(0);
  m["net.ipv4.conf.default.accept_redirects"] = SettingValue::ofInt(0);
  m["net.netfilter.nf_conntrack_max"] = SettingValue::ofInt(1048576);
}

void addScheduler(SettingsMap& m) {
  m["kernel.sched_min_granularity_ns"] = SettingValue::ofInt(10000);
  m["kernel.sched_wakeup_granularity_ns"] = SettingValue::ofInt(15000);
  m["kernel.sched_latency_ns"] = SettingValue::ofInt(60000);
  m["kernel.sched_rt_runtime_us"] = SettingValue::ofInt(980000);
  m["kernel.sched_migration_cost_ns"] = SettingValue::ofInt(50000);
  m["kernel.sched_autogroup_enabled"] = SettingValue::ofInt(0);
  m["kernel.sched_cfs_bandwidth_slice_us"] = SettingValue::ofInt(3000);
}

void addMemory(SettingsMap& m, const hardware::HardwareFacts& hw) {
  const bool LARGE = hw.ramGb >= 16;

  m["vm.swappiness"] = SettingValue::ofInt(hw.isFlash() ? 5 : 10);
  m["vm.dirty_ratio"] = SettingValue::ofInt(LARGE ? 5 : 10);
  m["vm.dirty_background_ratio"] = SettingValue::ofInt(LARGE ? 2 : 5);
  m["vm.dirty_expire_centisecs"] = SettingValue::ofInt(1000);
  m["vm.dirty_writeback_centisecs"] = SettingValue::ofInt(100);
  m["vm.min_free_kbytes"] = SettingValue::ofInt(baselineMinFreeKb(hw.ramGb));
  m["vm.zone_reclaim_mode"] = SettingValue::ofInt(0);
  m["vm.vfs_cache_pressure"] = SettingValue::ofInt(50);
  m["vm.overcommit_memory"] = SettingValue::ofInt(0);
  m["vm.overcommit_ratio"] = SettingValue::ofInt(50);
  m["vm.max_map_count"] = SettingValue::ofInt(1048576);
  m["vm.page-cluster"] = SettingValue::ofInt(0);
  m["vm.oom_kill_allocating_task"] = SettingValue::ofInt(1);
}

void addFilesystem(SettingsMap& m) {
  m["fs.file-max"] = SettingValue::ofInt(26214400);
  m["fs.nr_open"] = SettingValue::ofInt(26214400);
  m["fs.aio-max-nr"] = SettingValue::ofInt(1048576);
  m["fs.inotify.max_user_instances"] = SettingValue::ofInt(8192);
  m["fs.inotify.max_user_watches"] = SettingValue::ofInt(1048576);
  m["kernel.pid_max"] = SettingValue::ofInt(4194304);
}

} // namespace

SettingsMap baselineSettings(const hardware::HardwareFacts& facts) {
  SettingsMap m;
  addNetworkCore(m, facts);
  addTcp(m);
  addScheduler(m);
  addMemory(m, facts);
  addFilesystem(m);
  return m;
}

} // namespace tuning

} // namespace sysctlgen

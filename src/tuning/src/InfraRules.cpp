/**
 * @file InfraRules.cpp
 * @brief Rules for infrastructure hosts: virtualization, compute, network, container.
 */

#include "src/tuning/inc/ProfileRules.hpp"
#include "src/tuning/inc/RuleMath.hpp"

namespace sysctlgen {

namespace tuning {

using hardware::HardwareFacts;

namespace {

void enableForwarding(OverrideMap& m) {
  m["net.ipv4.ip_forward"] = SettingValue::ofInt(1);
  m["net.ipv6.conf.all.forwarding"] = SettingValue::ofInt(1);
}

} // namespace

/* ----------------------------- virtualization ----------------------------- */

OverrideMap virtualizationRules(const HardwareFacts& hw) {
  OverrideMap m;
  const std::int64_t NIC = hw.nicMbps;
  const std::int64_t RAM = hw.ramGb;

  const std::int64_t BUF_MAX =
      tier<std::int64_t>(NIC, NIC_25G, 134217728, NIC_10G, 67108864, 33554432);
  setSocketBuffers(m, BUF_MAX, BUF_MAX, 8388608, 8388608, 16777216);
  const SettingValue TCP_BUF = NIC >= NIC_25G ? SettingValue::ofTuple({8192, 262144, 134217728})
                                              : SettingValue::ofTuple({4096, 131072, 67108864});
  const SettingValue PROTO_MEM = SettingValue::ofTuple({16777216, 33554432, 67108864});
  setProtocolMemory(m, TCP_BUF, TCP_BUF, PROTO_MEM, PROTO_MEM);

  // Guests are bridged; host firewall rules must not see bridged frames
  enableForwarding(m);
  m["net.bridge.bridge-nf-call-iptables"] = SettingValue::ofInt(0);
  m["net.bridge.bridge-nf-call-ip6tables"] = SettingValue::ofInt(0);
  m["net.bridge.bridge-nf-call-arptables"] = SettingValue::ofInt(0);

  m["net.core.netdev_max_backlog"] = SettingValue::ofInt(NIC >= NIC_10G ? 250000 : 100000);
  m["net.core.somaxconn"] = SettingValue::ofInt(minOf(hw.threads * 1024, 65535));
  m["net.ipv4.tcp_max_syn_backlog"] =
      SettingValue::ofInt(clampBand(hw.threads * 1024, 16384, 262144));
  m["net.ipv4.tcp_tw_reuse"] = SettingValue::ofInt(1);
  m["net.ipv4.tcp_fin_timeout"] = SettingValue::ofInt(15);

  const std::int64_t RAW_HUGEPAGES =
      RAM >= 128 ? RAM * 200 / (hw.cores + 1) : RAM * 156 / (hw.cores + 1);
  m["vm.nr_hugepages"] = SettingValue::ofInt(maxOf(2, RAW_HUGEPAGES));
  m["vm.hugetlb_shm_group"] = SettingValue::ofInt(0);
  m["vm.transparent_hugepage.enabled"] = SettingValue::ofWord("madvise");
  m["vm.transparent_hugepage.defrag"] = SettingValue::ofWord(RAM >= 64 ? "madvise" : "never");

  m["vm.swappiness"] = SettingValue::ofInt(hw.isFlash() ? 5 : 10);
  m["vm.dirty_ratio"] = SettingValue::ofInt(tier<std::int64_t>(RAM, 64, 10, 16, 20, 30));
  m["vm.dirty_background_ratio"] = SettingValue::ofInt(tier<std::int64_t>(RAM, 64, 3, 16, 5, 10));
  m["vm.overcommit_memory"] = SettingValue::ofInt(1);
  m["vm.overcommit_ratio"] = SettingValue::ofInt(minOf(50 + RAM / 8, 95));
  m["vm.zone_reclaim_mode"] = SettingValue::ofInt(0);
  m["vm.min_free_kbytes"] = SettingValue::ofInt(maxOf(baselineMinFreeKb(RAM), RAM * 2048));
  m["vm.vfs_cache_pressure"] = SettingValue::ofInt(RAM >= 64 ? 50 : 75);

  m["kernel.sched_migration_cost_ns"] = SettingValue::ofInt(hw.cores <= 4 ? 1000000 : 5000000);
  m["kernel.sched_autogroup_enabled"] = SettingValue::ofInt(0);
  m["kernel.pid_max"] = SettingValue::ofInt(minOf(RAM * 16384, 8388608));

  m["net.netfilter.nf_conntrack_max"] = SettingValue::ofInt(minOf(RAM * 16384, 4194304));
  m["net.netfilter.nf_conntrack_tcp_timeout_established"] = SettingValue::ofInt(86400);

  const std::int64_t SLOTS = clampBand(RAM / 4, 64, 256);
  m["sunrpc.tcp_slot_table_entries"] = SettingValue::ofInt(SLOTS);
  m["sunrpc.udp_slot_table_entries"] = SettingValue::ofInt(SLOTS);

  m["kernel.tsc_reliable"] = SettingValue::ofInt(1);
  m["kernel.randomize_va_space"] = SettingValue::ofInt(0);

  m["fs.file-max"] = SettingValue::ofInt(minOf(RAM * 2097152, 1073741824));
  m["fs.inotify.max_user_watches"] = SettingValue::ofInt(minOf(RAM * 65536, 8388608));
  m["fs.inotify.max_user_instances"] = SettingValue::ofInt(minOf(RAM * 32, 8192));
  return m;
}

/* ----------------------------- compute ----------------------------- */

OverrideMap computeRules(const HardwareFacts& hw) {
  OverrideMap m;
  const bool FAST = hw.nicMbps >= NIC_10G;
  const std::int64_t RAM = hw.ramGb;
  const std::int64_t CORES = hw.cores;

  const std::int64_t BUF_MAX = FAST ? 33554432 : 16777216;
  setSocketBuffers(m, BUF_MAX, BUF_MAX, 2097152, 2097152, 4194304);
  const SettingValue TCP_BUF = FAST ? SettingValue::ofTuple({4096, 131072, 33554432})
                                    : SettingValue::ofTuple({4096, 65536, 16777216});
  setProtocolMemory(m, TCP_BUF, TCP_BUF, SettingValue::ofTuple({4194304, 8388608, 16777216}),
                    SettingValue::ofTuple({1048576, 4194304, 16777216}));

  m["kernel.sched_min_granularity_ns"] = SettingValue::ofInt(CORES <= 4 ? 3000 : 5000);
  m["kernel.sched_wakeup_granularity_ns"] = SettingValue::ofInt(CORES <= 4 ? 5000 : 10000);
  m["kernel.sched_latency_ns"] = SettingValue::ofInt(clampBand(CORES * 1000, 10000, 60000));
  m["kernel.sched_migration_cost_ns"] = SettingValue::ofInt(maxOf(CORES * 5000, 50000));
  m["kernel.sched_autogroup_enabled"] = SettingValue::ofInt(0);
  m["kernel.numa_balancing"] = SettingValue::ofInt(CORES >= 32 ? 1 : 0);
  m["kernel.sched_rt_runtime_us"] = SettingValue::ofInt(990000);

  m["vm.swappiness"] = SettingValue::ofInt(hw.isFlash() ? 1 : 5);
  m["vm.overcommit_ratio"] = SettingValue::ofInt(minOf(50 + RAM / 16, 95));
  m["vm.min_free_kbytes"] = SettingValue::ofInt(maxOf(baselineMinFreeKb(RAM) * 6 / 5, RAM * 512));
  // Local-node reclaim only pays off on large multi-socket machines
  m["vm.zone_reclaim_mode"] = SettingValue::ofInt((RAM >= 64 && CORES >= 16) ? 1 : 0);
  m["vm.transparent_hugepage.enabled"] = SettingValue::ofWord(RAM >= 16 ? "always" : "madvise");
  m["vm.transparent_hugepage.defrag"] = SettingValue::ofWord(RAM >= 32 ? "always" : "madvise");

  const std::int64_t TASKS = clampBand(RAM * 32768, 4194304, 16777216);
  m["kernel.pid_max"] = SettingValue::ofInt(TASKS);
  m["kernel.threads-max"] = SettingValue::ofInt(TASKS);

  m["net.core.busy_poll"] = SettingValue::ofInt(FAST ? 50 : 25);
  m["net.core.busy_read"] = SettingValue::ofInt(FAST ? 50 : 25);
  m["net.core.netdev_budget"] = SettingValue::ofInt(clampBand(CORES * 20, 300, 1000));
  m["net.core.somaxconn"] = SettingValue::ofInt(clampBand(hw.threads * 128, 1024, 65535));

  m["fs.file-max"] = SettingValue::ofInt(minOf(RAM * 1048576, 52428800));
  m["fs.aio-max-nr"] = SettingValue::ofInt(minOf(RAM * 4096, 1048576));
  return m;
}

/* ----------------------------- network ----------------------------- */

OverrideMap networkRules(const HardwareFacts& hw) {
  OverrideMap m;
  const std::int64_t NIC = hw.nicMbps;
  const std::int64_t RAM = hw.ramGb;

  const std::int64_t BUF_MAX =
      tier<std::int64_t>(NIC, NIC_40G, 268435456, NIC_10G, 134217728, 67108864);
  setSocketBuffers(m, BUF_MAX, BUF_MAX, 16777216, 16777216, NIC >= NIC_25G ? 67108864 : 33554432);

  SettingValue tcpBuf;
  if (NIC >= NIC_40G) {
    tcpBuf = SettingValue::ofTuple({16384, 1048576, 268435456});
  } else if (NIC >= NIC_10G) {
    tcpBuf = SettingValue::ofTuple({8192, 524288, 134217728});
  } else {
    tcpBuf = SettingValue::ofTuple({4096, 262144, 67108864});
  }
  const SettingValue PROTO_MEM = NIC >= NIC_25G
                                     ? SettingValue::ofTuple({33554432, 67108864, 134217728})
                                     : SettingValue::ofTuple({16777216, 33554432, 67108864});
  setProtocolMemory(m, tcpBuf, tcpBuf, PROTO_MEM, PROTO_MEM);

  // Routing appliance: asymmetric paths are expected
  enableForwarding(m);
  m["net.ipv4.conf.all.route_localnet"] = SettingValue::ofInt(1);
  m["net.ipv4.conf.all.rp_filter"] = SettingValue::ofInt(2);
  m["net.ipv4.conf.default.rp_filter"] = SettingValue::ofInt(2);

  m["net.netfilter.nf_conntrack_max"] = SettingValue::ofInt(minOf(RAM * 65536, 8388608));
  m["net.netfilter.nf_conntrack_tcp_timeout_established"] = SettingValue::ofInt(432000);
  m["net.netfilter.nf_conntrack_tcp_timeout_time_wait"] = SettingValue::ofInt(30);

  m["net.core.netdev_max_backlog"] = SettingValue::ofInt(NIC >= NIC_40G ? 1000000 : 250000);
  m["net.core.netdev_budget"] = SettingValue::ofInt(clampBand(hw.cores * 25, 300, 1000));
  m["net.core.netdev_budget_usecs"] =
      SettingValue::ofInt(clampBand(NIC <= NIC_1G ? 4000 : 8000, 2000, 16000));
  m["net.core.dev_weight"] = SettingValue::ofInt(600);
  m["net.core.somaxconn"] = SettingValue::ofInt(clampBand(hw.threads * 2048, 65535, 1048576));
  m["net.ipv4.tcp_max_syn_backlog"] =
      SettingValue::ofInt(clampBand(hw.threads * 2048, 65536, 1048576));
  m["net.ipv4.tcp_adv_win_scale"] = SettingValue::ofInt(NIC >= NIC_10G ? 1 : 2);
  m["net.ipv4.tcp_no_metrics_save"] = SettingValue::ofInt(1);
  m["net.ipv4.tcp_slow_start_after_idle"] = SettingValue::ofInt(0);
  m["net.ipv4.tcp_max_tw_buckets"] = SettingValue::ofInt(clampBand(RAM * 20000, 2000000, 6000000));

  m["vm.min_free_kbytes"] = SettingValue::ofInt(maxOf(baselineMinFreeKb(RAM) * 2, RAM * 2048));
  m["vm.swappiness"] = SettingValue::ofInt(10);
  m["vm.dirty_ratio"] = SettingValue::ofInt(5);
  m["vm.dirty_background_ratio"] = SettingValue::ofInt(2);

  const std::int64_t FILES = minOf(RAM * 1048576, 104857600);
  m["fs.file-max"] = SettingValue::ofInt(FILES);
  m["fs.nr_open"] = SettingValue::ofInt(FILES);
  return m;
}

/* ----------------------------- container ----------------------------- */

OverrideMap containerRules(const HardwareFacts& hw) {
  OverrideMap m;
  const bool FAST = hw.nicMbps >= NIC_10G;
  const bool FLASH = hw.isFlash();
  const std::int64_t RAM = hw.ramGb;

  const std::int64_t BUF_MAX = FAST ? 67108864 : 33554432;
  setSocketBuffers(m, BUF_MAX, BUF_MAX, 4194304, 4194304, 8388608);
  const SettingValue TCP_BUF = FAST ? SettingValue::ofTuple({4096, 262144, 67108864})
                                    : SettingValue::ofTuple({4096, 131072, 33554432});
  setProtocolMemory(m, TCP_BUF, TCP_BUF, SettingValue::ofTuple({8388608, 16777216, 33554432}),
                    SettingValue::ofTuple({4194304, 8388608, 33554432}));

  m["vm.overcommit_memory"] = SettingValue::ofInt(1);
  m["vm.overcommit_ratio"] = SettingValue::ofInt(minOf(50 + RAM / 4, 95));
  m["kernel.panic_on_oom"] = SettingValue::ofInt(0);
  m["vm.swappiness"] = SettingValue::ofInt(FLASH ? 0 : 5);
  m["vm.vfs_cache_pressure"] = SettingValue::ofInt(FLASH ? 50 : 75);
  m["vm.min_free_kbytes"] = SettingValue::ofInt(maxOf(baselineMinFreeKb(RAM) * 3 / 2, RAM * 1024));
  m["vm.dirty_ratio"] = SettingValue::ofInt(10);
  m["vm.dirty_background_ratio"] = SettingValue::ofInt(5);
  m["vm.dirty_expire_centisecs"] = SettingValue::ofInt(500);
  m["vm.dirty_writeback_centisecs"] = SettingValue::ofInt(100);

  m["kernel.keys.root_maxkeys"] = SettingValue::ofInt(clampBand(RAM * 4096, 10000, 2000000));
  m["kernel.keys.root_maxbytes"] = SettingValue::ofInt(clampBand(RAM * 100000, 1000000, 50000000));
  m["kernel.keys.maxkeys"] = SettingValue::ofInt(clampBand(RAM * 16, 1000, 4000));
  m["kernel.keys.maxbytes"] = SettingValue::ofInt(clampBand(RAM * 16000, 1000000, 4000000));

  const std::int64_t NAMESPACES = clampBand(RAM * 256, 5000, 30000);
  for (const char* key : {"user.max_user_namespaces", "user.max_ipc_namespaces",
                          "user.max_pid_namespaces", "user.max_net_namespaces",
                          "user.max_mnt_namespaces", "user.max_uts_namespaces"}) {
    m[key] = SettingValue::ofInt(NAMESPACES);
  }

  const std::int64_t TASKS = clampBand(RAM * 32768, 4194304, 16777216);
  m["kernel.pid_max"] = SettingValue::ofInt(TASKS);
  m["kernel.threads-max"] = SettingValue::ofInt(TASKS);

  // Pod networking goes through bridges that must hit iptables
  enableForwarding(m);
  m["net.bridge.bridge-nf-call-ip6tables"] = SettingValue::ofInt(1);
  m["net.bridge.bridge-nf-call-iptables"] = SettingValue::ofInt(1);
  m["net.ipv4.conf.default.rp_filter"] = SettingValue::ofInt(0);
  m["net.ipv4.conf.all.rp_filter"] = SettingValue::ofInt(0);

  const std::int64_t BACKLOG = clampBand(hw.threads * 1024, 8192, 262144);
  m["net.core.somaxconn"] = SettingValue::ofInt(BACKLOG);
  m["net.ipv4.tcp_max_syn_backlog"] = SettingValue::ofInt(BACKLOG);

  m["fs.file-max"] = SettingValue::ofInt(minOf(RAM * 4194304, 1073741824));
  m["fs.inotify.max_user_instances"] = SettingValue::ofInt(minOf(RAM * 512, 65536));
  m["fs.inotify.max_user_watches"] = SettingValue::ofInt(minOf(RAM * 131072, 16777216));
  m["fs.aio-max-nr"] = SettingValue::ofInt(minOf(RAM * 8192, 1048576));
  return m;
}

} // namespace tuning

} // namespace sysctlgen

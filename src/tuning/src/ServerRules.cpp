/**
 * @file ServerRules.cpp
 * @brief Rules for service workloads: web, database, cache, fileserver.
 */

#include "src/tuning/inc/ProfileRules.hpp"
#include "src/tuning/inc/RuleMath.hpp"

namespace sysctlgen {

namespace tuning {

using hardware::HardwareFacts;

/* ----------------------------- web ----------------------------- */

OverrideMap webRules(const HardwareFacts& hw) {
  OverrideMap m;
  const bool FAST = hw.nicMbps >= NIC_10G;
  const std::int64_t RAM = hw.ramGb;

  const std::int64_t BUF_MAX = FAST ? 33554432 : 16777216;
  setSocketBuffers(m, BUF_MAX, BUF_MAX, 1048576, 1048576, 4194304);
  const SettingValue TCP_BUF = FAST ? SettingValue::ofTuple({4096, 131072, 33554432})
                                    : SettingValue::ofTuple({4096, 65536, 16777216});
  setProtocolMemory(m, TCP_BUF, TCP_BUF, SettingValue::ofTuple({4194304, 8388608, 16777216}),
                    SettingValue::ofTuple({786432, 1048576, 26777216}));

  m["vm.swappiness"] = SettingValue::ofInt(hw.isFlash() ? 10 : 30);
  m["vm.vfs_cache_pressure"] = SettingValue::ofInt(70);
  m["vm.min_free_kbytes"] = SettingValue::ofInt(maxOf(baselineMinFreeKb(RAM) * 3 / 2, RAM * 1024));
  if (hw.isFlash()) {
    m["vm.dirty_ratio"] = SettingValue::ofInt(RAM >= 32 ? 5 : 10);
    m["vm.dirty_background_ratio"] = SettingValue::ofInt(RAM >= 32 ? 2 : 5);
    m["vm.dirty_expire_centisecs"] = SettingValue::ofInt(300);
    m["vm.dirty_writeback_centisecs"] = SettingValue::ofInt(100);
  } else {
    m["vm.dirty_ratio"] = SettingValue::ofInt(RAM >= 32 ? 3 : 5);
    m["vm.dirty_background_ratio"] = SettingValue::ofInt(RAM >= 32 ? 1 : 2);
    m["vm.dirty_expire_centisecs"] = SettingValue::ofInt(500);
    m["vm.dirty_writeback_centisecs"] = SettingValue::ofInt(250);
  }

  m["net.core.somaxconn"] = SettingValue::ofInt(clampBand(hw.threads * 1024, 4096, 262144));
  m["net.core.netdev_max_backlog"] = SettingValue::ofInt(FAST ? 250000 : 65536);
  m["net.ipv4.tcp_max_syn_backlog"] = SettingValue::ofInt(maxOf(hw.threads * 1024, 8192));
  m["net.ipv4.tcp_fin_timeout"] = SettingValue::ofInt(FAST ? 10 : 15);
  m["net.ipv4.tcp_keepalive_time"] = SettingValue::ofInt(600);
  m["net.ipv4.tcp_max_tw_buckets"] = SettingValue::ofInt(minOf(RAM * 50000, 6000000));
  m["net.ipv4.tcp_tw_reuse"] = SettingValue::ofInt(1);
  m["net.ipv4.tcp_fastopen"] = SettingValue::ofInt(3);
  m["net.ipv4.tcp_slow_start_after_idle"] = SettingValue::ofInt(0);

  m["fs.file-max"] = SettingValue::ofInt(minOf(RAM * 1048576, 104857600));
  m["fs.inotify.max_user_watches"] = SettingValue::ofInt(minOf(RAM * 131072, 8388608));

  m["kernel.sched_min_granularity_ns"] = SettingValue::ofInt(hw.cores >= 16 ? 15000000 : 10000000);
  m["kernel.sched_wakeup_granularity_ns"] =
      SettingValue::ofInt(hw.cores >= 16 ? 20000000 : 15000000);
  m["kernel.pid_max"] = SettingValue::ofInt(clampBand(RAM * 8192, 1048576, 4194304));
  return m;
}

/* ----------------------------- database ----------------------------- */

OverrideMap databaseRules(const HardwareFacts& hw) {
  OverrideMap m;
  const bool FAST = hw.nicMbps >= NIC_10G;
  const bool FLASH = hw.isFlash();
  const std::int64_t RAM = hw.ramGb;

  const std::int64_t BUF_MAX = FAST ? 67108864 : 33554432;
  setSocketBuffers(m, BUF_MAX, BUF_MAX, 4194304, 4194304, 8388608);
  const SettingValue TCP_BUF = FAST ? SettingValue::ofTuple({8192, 262144, 67108864})
                                    : SettingValue::ofTuple({4096, 131072, 33554432});
  setProtocolMemory(m, TCP_BUF, TCP_BUF, SettingValue::ofTuple({8388608, 16777216, 33554432}),
                    SettingValue::ofTuple({1048576, 4194304, 33554432}));

  // Shared memory sized for the buffer pool; shmall is in 4 KiB pages
  const std::int64_t SHMMAX = RAM * 1073741824 * (RAM >= 64 ? 80 : 90) / 100;
  m["kernel.shmmax"] = SettingValue::ofInt(SHMMAX);
  m["kernel.shmall"] = SettingValue::ofInt(SHMMAX / 4096);
  m["kernel.shmmni"] = SettingValue::ofInt(maxOf(RAM * 32, 4096));

  m["vm.swappiness"] = SettingValue::ofInt(FLASH ? 1 : 5);
  if (FLASH) {
    m["vm.dirty_ratio"] = SettingValue::ofInt(RAM >= 32 ? 20 : 40);
    m["vm.dirty_background_ratio"] = SettingValue::ofInt(RAM >= 32 ? 5 : 10);
    m["vm.dirty_expire_centisecs"] = SettingValue::ofInt(500);
    m["vm.dirty_writeback_centisecs"] = SettingValue::ofInt(100);
  } else {
    m["vm.dirty_ratio"] = SettingValue::ofInt(RAM >= 32 ? 10 : 20);
    m["vm.dirty_background_ratio"] = SettingValue::ofInt(RAM >= 32 ? 3 : 5);
    m["vm.dirty_expire_centisecs"] = SettingValue::ofInt(1000);
    m["vm.dirty_writeback_centisecs"] = SettingValue::ofInt(500);
  }
  m["vm.zone_reclaim_mode"] = SettingValue::ofInt(0);
  m["vm.min_free_kbytes"] = SettingValue::ofInt(maxOf(baselineMinFreeKb(RAM) * 2, RAM * 2048));
  m["vm.vfs_cache_pressure"] = SettingValue::ofInt(FLASH ? 50 : 125);
  m["vm.page-cluster"] = SettingValue::ofInt(FLASH ? 0 : 3);

  m["net.core.somaxconn"] = SettingValue::ofInt(clampBand(hw.threads * 256, 4096, 65535));
  m["net.ipv4.tcp_max_syn_backlog"] = SettingValue::ofInt(minOf(hw.threads * 2048, 131072));
  m["net.ipv4.tcp_keepalive_time"] = SettingValue::ofInt(90);
  m["net.ipv4.tcp_keepalive_intvl"] = SettingValue::ofInt(10);
  m["net.ipv4.tcp_keepalive_probes"] = SettingValue::ofInt(9);
  m["net.ipv4.tcp_max_tw_buckets"] = SettingValue::ofInt(2000000);
  m["net.ipv4.tcp_tw_reuse"] = SettingValue::ofInt(0);

  m["fs.aio-max-nr"] = SettingValue::ofInt(minOf(RAM * 65536, 4194304));
  m["fs.file-max"] = SettingValue::ofInt(minOf(RAM * 2097152, 104857600));

  m["kernel.sched_migration_cost_ns"] = SettingValue::ofInt(hw.cores >= 16 ? 5000000 : 1000000);
  m["kernel.sched_min_granularity_ns"] = SettingValue::ofInt(10000);
  m["kernel.sched_wakeup_granularity_ns"] = SettingValue::ofInt(15000);
  m["kernel.sched_autogroup_enabled"] = SettingValue::ofInt(0);
  return m;
}

/* ----------------------------- cache ----------------------------- */

OverrideMap cacheRules(const HardwareFacts& hw) {
  OverrideMap m;
  const bool FAST = hw.nicMbps >= NIC_10G;
  const std::int64_t RAM = hw.ramGb;

  // Responses outweigh requests: send side gets twice the receive side
  setSocketBuffers(m, FAST ? 33554432 : 16777216, FAST ? 67108864 : 33554432, 1048576, 4194304,
                   4194304);
  if (FAST) {
    setProtocolMemory(m, SettingValue::ofTuple({4096, 65536, 33554432}),
                      SettingValue::ofTuple({4096, 131072, 67108864}),
                      SettingValue::ofTuple({8388608, 16777216, 33554432}),
                      SettingValue::ofTuple({1048576, 4194304, 33554432}));
  } else {
    setProtocolMemory(m, SettingValue::ofTuple({4096, 32768, 16777216}),
                      SettingValue::ofTuple({4096, 65536, 33554432}),
                      SettingValue::ofTuple({8388608, 16777216, 33554432}),
                      SettingValue::ofTuple({1048576, 4194304, 33554432}));
  }

  m["vm.swappiness"] = SettingValue::ofInt(0);
  m["vm.overcommit_memory"] = SettingValue::ofInt(1);
  m["vm.overcommit_ratio"] = SettingValue::ofInt(minOf(50 + RAM / 4, 95));
  m["vm.min_free_kbytes"] = SettingValue::ofInt(maxOf(baselineMinFreeKb(RAM) * 3 / 2, RAM * 1024));
  m["vm.vfs_cache_pressure"] = SettingValue::ofInt(maxOf(50 - RAM / 8, 5));
  m["vm.dirty_ratio"] = SettingValue::ofInt(RAM >= 64 ? 3 : 5);
  m["vm.dirty_background_ratio"] = SettingValue::ofInt(RAM >= 64 ? 1 : 2);
  m["vm.zone_reclaim_mode"] = SettingValue::ofInt(0);

  m["net.core.somaxconn"] = SettingValue::ofInt(clampBand(hw.threads * 2048, 65535, 524288));
  m["net.ipv4.tcp_max_syn_backlog"] =
      SettingValue::ofInt(clampBand(hw.threads * 4096, 65536, 262144));
  m["net.ipv4.tcp_max_tw_buckets"] = SettingValue::ofInt(6000000);
  m["net.ipv4.tcp_tw_reuse"] = SettingValue::ofInt(1);
  m["net.ipv4.tcp_fin_timeout"] = SettingValue::ofInt(FAST ? 5 : 10);
  m["net.core.netdev_max_backlog"] = SettingValue::ofInt(FAST ? 250000 : 100000);

  m["kernel.sched_min_granularity_ns"] = SettingValue::ofInt(hw.cores <= 4 ? 5000 : 10000);
  m["kernel.sched_wakeup_granularity_ns"] = SettingValue::ofInt(hw.cores <= 4 ? 10000 : 15000);
  m["kernel.numa_balancing"] = SettingValue::ofInt(0);
  m["kernel.sched_migration_cost_ns"] =
      SettingValue::ofInt(hw.cores <= 8 ? 5000 : maxOf(hw.cores * 10000, 100000));
  m["kernel.sched_autogroup_enabled"] = SettingValue::ofInt(0);

  m["fs.file-max"] = SettingValue::ofInt(minOf(RAM * 2097152, 104857600));
  m["fs.aio-max-nr"] = SettingValue::ofInt(minOf(RAM * 8192, 1048576));
  return m;
}

/* ----------------------------- fileserver ----------------------------- */

OverrideMap fileserverRules(const HardwareFacts& hw) {
  OverrideMap m;
  const std::int64_t NIC = hw.nicMbps;
  const std::int64_t RAM = hw.ramGb;

  const std::int64_t BUF_MAX =
      tier<std::int64_t>(NIC, NIC_40G, 134217728, NIC_10G, 67108864, 33554432);
  setSocketBuffers(m, BUF_MAX, BUF_MAX, 8388608, 8388608, 16777216);
  const SettingValue TCP_BUF = NIC >= NIC_25G ? SettingValue::ofTuple({8192, 262144, 134217728})
                                              : SettingValue::ofTuple({4096, 131072, 67108864});
  const SettingValue PROTO_MEM = SettingValue::ofTuple({16777216, 33554432, 67108864});
  setProtocolMemory(m, TCP_BUF, TCP_BUF, PROTO_MEM, PROTO_MEM);

  m["net.ipv4.tcp_window_scaling"] = SettingValue::ofInt(1);
  m["net.ipv4.tcp_timestamps"] = SettingValue::ofInt(1);
  m["net.ipv4.tcp_sack"] = SettingValue::ofInt(1);
  m["net.ipv4.tcp_slow_start_after_idle"] = SettingValue::ofInt(0);
  m["net.ipv4.tcp_fin_timeout"] = SettingValue::ofInt(20);
  m["net.core.netdev_max_backlog"] = SettingValue::ofInt(NIC >= NIC_10G ? 250000 : 100000);
  m["net.core.somaxconn"] = SettingValue::ofInt(clampBand(hw.threads * 512, 2048, 65535));

  const std::int64_t SLOTS = clampBand(RAM * 8, 128, 2048);
  m["sunrpc.tcp_slot_table_entries"] = SettingValue::ofInt(SLOTS);
  m["sunrpc.udp_slot_table_entries"] = SettingValue::ofInt(SLOTS);
  m["fs.nfsd.max_connections"] = SettingValue::ofInt(clampBand(RAM * 64, 256, 65536));

  m["fs.file-max"] = SettingValue::ofInt(minOf(RAM * 4194304, 1073741824));
  m["fs.inotify.max_user_watches"] = SettingValue::ofInt(minOf(RAM * 131072, 8388608));
  m["fs.inotify.max_user_instances"] = SettingValue::ofInt(minOf(RAM * 256, 65536));
  m["fs.aio-max-nr"] = SettingValue::ofInt(minOf(RAM * 32768, 4194304));

  if (hw.isFlash()) {
    m["vm.dirty_ratio"] = SettingValue::ofInt(RAM >= 32 ? 15 : 30);
    m["vm.dirty_background_ratio"] = SettingValue::ofInt(RAM >= 32 ? 3 : 5);
    m["vm.vfs_cache_pressure"] = SettingValue::ofInt(50);
    m["vm.swappiness"] = SettingValue::ofInt(10);
    m["vm.dirty_expire_centisecs"] = SettingValue::ofInt(1500);
    m["vm.dirty_writeback_centisecs"] = SettingValue::ofInt(250);
  } else {
    // Keep dentries and inodes cached on slow disks
    m["vm.dirty_ratio"] = SettingValue::ofInt(RAM >= 32 ? 10 : 20);
    m["vm.dirty_background_ratio"] = SettingValue::ofInt(RAM >= 32 ? 2 : 3);
    m["vm.vfs_cache_pressure"] = SettingValue::ofInt(10);
    m["vm.swappiness"] = SettingValue::ofInt(20);
    m["vm.dirty_expire_centisecs"] = SettingValue::ofInt(3000);
    m["vm.dirty_writeback_centisecs"] = SettingValue::ofInt(500);
  }
  m["vm.min_free_kbytes"] = SettingValue::ofInt(maxOf(baselineMinFreeKb(RAM) * 3 / 2, RAM * 1024));
  return m;
}

} // namespace tuning

} // namespace sysctlgen

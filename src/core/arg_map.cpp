// core/arg_map.cpp - Argument table
#include "arg_map.hpp"
#include <set>

namespace clinic {

const std::map<std::string, ArgMapping> &argument_table() {
  using K = HandlerKind;
  static const std::map<std::string, ArgMapping> table = {
      // Structured handlers
      {"image", {K::Direct, ""}},
      {"port", {K::Port, "-p"}},
      {"ports", {K::Port, "-p"}},
      {"volumes", {K::Volume, "-v"}},
      {"volume", {K::Volume, "-v"}},
      {"env", {K::Env, "-e"}},
      {"environment", {K::Env, "-e"}},
      {"labels", {K::Label, "--label"}},
      {"label", {K::Label, "--label"}},
      {"vpn", {K::Vpn, ""}},
      {"privileged_vpn", {K::Privileged, "--privileged"}},
      {"privileged", {K::Privileged, "--privileged"}},
      {"depends_on", {K::DependsOn, "--link"}},
      {"healthcheck", {K::Healthcheck, "--health-cmd"}},
      {"extra_args", {K::ExtraArgs, ""}},
      {"command", {K::Command, ""}},
      {"domain_routing", {K::DomainRouting, "--label"}},
      {"enable_discovery", {K::Discovery, "-p"}},

      // Execution
      {"entrypoint", {K::Flag, "--entrypoint"}},
      {"working_dir", {K::Flag, "--workdir"}},
      {"workdir", {K::Flag, "--workdir"}},
      {"user", {K::Flag, "--user"}},
      {"hostname", {K::Flag, "--hostname"}},
      {"domainname", {K::Flag, "--domainname"}},
      {"env_file", {K::Flag, "--env-file"}},
      {"platform", {K::Flag, "--platform"}},
      {"pull", {K::Flag, "--pull"}},
      {"runtime", {K::Flag, "--runtime"}},
      {"isolation", {K::Flag, "--isolation"}},
      {"annotation", {K::Flag, "--annotation"}},
      {"attach", {K::Flag, "--attach"}},
      {"cidfile", {K::Flag, "--cidfile"}},
      {"detach_keys", {K::Flag, "--detach-keys"}},
      {"stop_signal", {K::Flag, "--stop-signal"}},
      {"stop_timeout", {K::Flag, "--stop-timeout"}},
      {"pid_file", {K::Flag, "--pidfile"}},

      // Networking
      {"network_mode", {K::Flag, "--network"}},
      {"network", {K::Flag, "--network"}},
      {"net", {K::Flag, "--network"}},
      {"static_ip", {K::Flag, "--ip"}},
      {"ip", {K::Flag, "--ip"}},
      {"ip6", {K::Flag, "--ip6"}},
      {"mac_address", {K::Flag, "--mac-address"}},
      {"link", {K::Flag, "--link"}},
      {"external_links", {K::Flag, "--link"}},
      {"add_host", {K::Flag, "--add-host"}},
      {"dns", {K::Flag, "--dns"}},
      {"dns_search", {K::Flag, "--dns-search"}},
      {"dns_opt", {K::Flag, "--dns-option"}},
      {"dns_option", {K::Flag, "--dns-option"}},
      {"expose", {K::Flag, "--expose"}},
      {"publish", {K::Flag, "--publish"}},
      {"network_alias", {K::Flag, "--network-alias"}},
      {"link_local_ip", {K::Flag, "--link-local-ip"}},

      // Storage
      {"tmpfs", {K::Flag, "--tmpfs"}},
      {"mount", {K::Flag, "--mount"}},
      {"volumes_from", {K::Flag, "--volumes-from"}},
      {"volume_driver", {K::Flag, "--volume-driver"}},
      {"storage_opt", {K::Flag, "--storage-opt"}},
      {"shm_size", {K::Flag, "--shm-size"}},

      // Resources
      {"memory", {K::Flag, "--memory"}},
      {"memory_limit", {K::Flag, "--memory"}},
      {"memory_swap", {K::Flag, "--memory-swap"}},
      {"memory_reservation", {K::Flag, "--memory-reservation"}},
      {"memory_swappiness", {K::Flag, "--memory-swappiness"}},
      {"kernel_memory", {K::Flag, "--kernel-memory"}},
      {"cpus", {K::Flag, "--cpus"}},
      {"cpu_limit", {K::Flag, "--cpus"}},
      {"cpu_shares", {K::Flag, "--cpu-shares"}},
      {"cpu_period", {K::Flag, "--cpu-period"}},
      {"cpu_quota", {K::Flag, "--cpu-quota"}},
      {"cpu_rt_period", {K::Flag, "--cpu-rt-period"}},
      {"cpu_rt_runtime", {K::Flag, "--cpu-rt-runtime"}},
      {"cpuset_cpus", {K::Flag, "--cpuset-cpus"}},
      {"cpuset_mems", {K::Flag, "--cpuset-mems"}},
      {"pids_limit", {K::Flag, "--pids-limit"}},
      {"oom_score_adj", {K::Flag, "--oom-score-adj"}},
      {"ulimit", {K::Flag, "--ulimit"}},
      {"blkio_weight", {K::Flag, "--blkio-weight"}},
      {"blkio_weight_device", {K::Flag, "--blkio-weight-device"}},
      {"device_read_bps", {K::Flag, "--device-read-bps"}},
      {"device_read_iops", {K::Flag, "--device-read-iops"}},
      {"device_write_bps", {K::Flag, "--device-write-bps"}},
      {"device_write_iops", {K::Flag, "--device-write-iops"}},
      {"gpus", {K::Flag, "--gpus"}},

      // Security and namespaces
      {"security_opt", {K::Flag, "--security-opt"}},
      {"cap_add", {K::Flag, "--cap-add"}},
      {"cap_drop", {K::Flag, "--cap-drop"}},
      {"user_ns", {K::Flag, "--userns"}},
      {"group_add", {K::Flag, "--group-add"}},
      {"sysctls", {K::Flag, "--sysctl"}},
      {"sysctl", {K::Flag, "--sysctl"}},
      {"device", {K::Flag, "--device"}},
      {"device_cgroup_rule", {K::Flag, "--device-cgroup-rule"}},
      {"cgroup_parent", {K::Flag, "--cgroup-parent"}},
      {"cgroup_ns", {K::Flag, "--cgroupns"}},
      {"ipc", {K::Flag, "--ipc"}},
      {"pid", {K::Flag, "--pid"}},
      {"uts", {K::Flag, "--uts"}},

      // Restart and health
      {"restart", {K::Flag, "--restart"}},
      {"restart_policy", {K::Flag, "--restart"}},
      {"health_cmd", {K::Flag, "--health-cmd"}},
      {"health_interval", {K::Flag, "--health-interval"}},
      {"health_timeout", {K::Flag, "--health-timeout"}},
      {"health_retries", {K::Flag, "--health-retries"}},
      {"health_start_period", {K::Flag, "--health-start-period"}},
      {"health_start_interval", {K::Flag, "--health-start-interval"}},

      // Logging
      {"log_driver", {K::Flag, "--log-driver"}},
      {"log_opt", {K::Flag, "--log-opt"}},

      // Switches
      {"read_only", {K::BooleanFlag, "--read-only"}},
      {"publish_all", {K::BooleanFlag, "--publish-all"}},
      {"rm", {K::BooleanFlag, "--rm"}},
      {"autoremove", {K::BooleanFlag, "--rm"}},
      {"interactive", {K::BooleanFlag, "--interactive"}},
      {"stdin_open", {K::BooleanFlag, "--interactive"}},
      {"tty", {K::BooleanFlag, "--tty"}},
      {"pseudo_tty", {K::BooleanFlag, "--tty"}},
      {"init", {K::BooleanFlag, "--init"}},
      {"sig_proxy", {K::BooleanFlag, "--sig-proxy"}},
      {"oom_kill_disable", {K::BooleanFlag, "--oom-kill-disable"}},
      {"no_healthcheck", {K::BooleanFlag, "--no-healthcheck"}},
      {"disable_content_trust", {K::BooleanFlag, "--disable-content-trust"}},
      {"quiet", {K::BooleanFlag, "--quiet"}},
      {"tun", {K::BooleanFlag, "--device=/dev/net/tun"}},
      {"net_admin", {K::BooleanFlag, "--cap-add=NET_ADMIN"}},
      {"sys_module", {K::BooleanFlag, "--cap-add=SYS_MODULE"}},

      // Metadata
      {"description", {K::Ignore, ""}},
      {"port_notes", {K::Ignore, ""}},
      {"supports_domains", {K::Ignore, ""}},
      {"requires_setup", {K::Ignore, ""}},
      {"post_start_hook", {K::Ignore, ""}},
      {"conflict_port", {K::Ignore, ""}},
      {"service_type", {K::Ignore, ""}},
      {"discovery_ports", {K::Ignore, ""}},
      {"discovery_protocol", {K::Ignore, ""}},
      {"multicast_relay", {K::Ignore, ""}},
      {"detach", {K::Ignore, ""}},
  };
  return table;
}

ArgMapping lookup_mapping(const std::string &key) {
  const auto &table = argument_table();
  auto it = table.find(key);
  if (it == table.end()) {
    return ArgMapping{};
  }
  return it->second;
}

bool flag_keeps_commas(const std::string &flag) {
  static const std::set<std::string> whole = {
      "--tmpfs",           "--mount",          "--log-opt",
      "--sysctl",          "--ulimit",         "--device-cgroup-rule",
      "--blkio-weight-device", "--device-read-bps", "--device-read-iops",
      "--device-write-bps", "--device-write-iops", "--health-cmd",
      "--entrypoint",      "--annotation",     "--security-opt"};
  return whole.count(flag) > 0;
}

std::string handler_kind_name(HandlerKind kind) {
  switch (kind) {
  case HandlerKind::Direct:
    return "direct";
  case HandlerKind::Flag:
    return "flag";
  case HandlerKind::BooleanFlag:
    return "boolean_flag";
  case HandlerKind::Port:
    return "port";
  case HandlerKind::Volume:
    return "volume";
  case HandlerKind::Env:
    return "env";
  case HandlerKind::Label:
    return "label";
  case HandlerKind::Vpn:
    return "vpn";
  case HandlerKind::Privileged:
    return "privileged";
  case HandlerKind::DependsOn:
    return "depends_on";
  case HandlerKind::Healthcheck:
    return "healthcheck";
  case HandlerKind::ExtraArgs:
    return "extra_args";
  case HandlerKind::Command:
    return "command";
  case HandlerKind::DomainRouting:
    return "domain_routing";
  case HandlerKind::Discovery:
    return "discovery";
  case HandlerKind::Ignore:
    return "ignore";
  case HandlerKind::Unknown:
    break;
  }
  return "unknown";
}

} // namespace clinic

// core/state.hpp - Desired-state snapshot
#pragma once

#include "../conf/config.hpp"
#include <map>
#include <string>
#include <vector>

namespace clinic {

enum class SnapshotStatus { Missing, Valid, Legacy, Corrupt };

std::string snapshot_status_to_string(SnapshotStatus status);

// Persisted subset of the configuration, written as a shell-sourceable file
// and read back through Config::from_file.
struct DesiredStateSnapshot {
  fs::path cfg_root;
  fs::path wg_dir;
  std::vector<std::string> selected_containers;
  std::string docker_network_name;
  std::string docker_network_subnet;
  std::string lan_subnet;
  std::string vpn_subnet;
  std::string vpn_subnet_base;
  std::string wg_client_dns;
  std::string dns_fallback;
  std::string wg_endpoint;
  FirewallMode firewall_mode = FirewallMode::Open;
  std::vector<std::string> restricted_services;
  std::string traefik_domain_mode;
  std::string traefik_domain_name;
  std::string traefik_acme_email;
  // Keyed by snapshot key stem (service_env_key)
  std::map<std::string, std::string> port_overrides;
  std::map<std::string, std::string> container_ips;

  static DesiredStateSnapshot capture(const Config &config);

  std::string render() const;
  bool save(const fs::path &path) const;
};

SnapshotStatus inspect_snapshot(const fs::path &path, std::string *error);

// Renames the file to <path>.backup-YYYYmmdd-HHMMSS and returns the new
// path, or an empty path on failure.
fs::path quarantine_snapshot(const fs::path &path);

// Quarantines legacy or corrupt snapshots. Returns true when path now
// holds a valid snapshot that can be loaded.
bool prepare_snapshot(const fs::path &path);

} // namespace clinic

// conf/config.hpp - Orchestrator configuration
#pragma once

#include "../defs.hpp"
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace clinic {

enum class FirewallMode { Open, Restrict, Custom };

std::string firewall_mode_to_string(FirewallMode mode);
FirewallMode firewall_mode_from_string(const std::string &value);

// One KEY=value line of a shell-sourceable file. Arrays are written (a b c).
struct Assignment {
  std::string key;
  std::string value;
  std::vector<std::string> items;
  bool is_array = false;
  int line = 0;
};

// Returns false and fills error on the first line that is neither a
// comment, blank, nor an assignment.
bool parse_assignments(const std::string &text, std::vector<Assignment> &out,
                       std::string &error);

// Service name -> snapshot key stem: "home-assistant" -> "HOME_ASSISTANT".
std::string service_env_key(const std::string &service);

// True when <stem>_PORT or <stem>_CONTAINER_IP is a configuration key, so
// a service with that key stem cannot be recorded in the snapshot.
bool is_reserved_service_key(const std::string &stem);

struct Config {
  fs::path cfg_root = DEFAULT_CFG_ROOT;
  fs::path wg_dir = DEFAULT_WG_DIR;

  std::string docker_network_name = DEFAULT_DOCKER_NETWORK;
  std::string docker_network_subnet = DEFAULT_DOCKER_SUBNET;
  std::string lan_subnet = DEFAULT_LAN_SUBNET;
  bool lan_subnet_explicit = false;
  std::string vpn_subnet = DEFAULT_VPN_SUBNET;
  std::string vpn_subnet_base = DEFAULT_VPN_BASE;
  std::string vpn_service = DEFAULT_VPN_SERVICE;
  int wg_port = DEFAULT_WG_PORT;
  std::string wg_client_dns = DEFAULT_CLIENT_DNS;
  std::string dns_fallback = DEFAULT_DNS_FALLBACK;
  std::string wg_endpoint;
  int backup_retention = DEFAULT_BACKUP_RETENTION;

  std::vector<std::string> selected_containers;
  FirewallMode firewall_mode = FirewallMode::Open;
  std::vector<std::string> restricted_services;

  std::string traefik_domain_mode = "local";
  std::string traefik_domain_name;
  std::string traefik_acme_email;

  int repair_max_attempts = DEFAULT_REPAIR_ATTEMPTS;
  int repair_retry_delay = DEFAULT_REPAIR_DELAY_SECONDS;

  bool dry_run = false;
  bool verbose = false;

  // Keyed by service_env_key(service)
  std::map<std::string, std::string> port_overrides;
  std::map<std::string, std::string> container_ips;

  // Derived locations
  fs::path services_dir() const;
  fs::path backup_dir() const;
  fs::path log_dir() const;
  fs::path qr_dir() const;
  fs::path state_file() const;
  fs::path lock_file() const;
  fs::path diagnostics_file() const;
  fs::path wg_keys_env() const;
  fs::path wg_clients_dir() const;
  fs::path wg_server_conf() const;

  std::string port_override(const std::string &service) const;
  std::string container_ip(const std::string &service) const;
  bool is_selected(const std::string &service) const;

  // Variables visible to ${VAR} expansion in descriptors.
  std::map<std::string, std::string> variables() const;

  // Returns false for keys it does not know. Throws std::runtime_error on
  // a malformed value for a known key.
  bool set_value(const std::string &key, const std::string &value);
  bool set_array(const std::string &key,
                 const std::vector<std::string> &items);

  static Config load_default();
  static Config from_file(const fs::path &path);

  void apply_env();
  void merge_with_cli(const fs::path &root_override,
                      const std::vector<std::string> &services_override,
                      const std::string &firewall_mode_override,
                      const std::vector<std::string> &restrict_override,
                      const std::map<std::string, std::string> &port_override,
                      bool dry_run_override, bool verbose_override);
};

} // namespace clinic

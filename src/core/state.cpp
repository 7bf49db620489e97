// core/state.cpp - Desired-state snapshot implementation
#include "state.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include <sstream>

namespace clinic {

std::string snapshot_status_to_string(SnapshotStatus status) {
  switch (status) {
  case SnapshotStatus::Missing:
    return "missing";
  case SnapshotStatus::Valid:
    return "valid";
  case SnapshotStatus::Legacy:
    return "legacy";
  case SnapshotStatus::Corrupt:
    break;
  }
  return "corrupt";
}

DesiredStateSnapshot DesiredStateSnapshot::capture(const Config &config) {
  DesiredStateSnapshot s;
  s.cfg_root = config.cfg_root;
  s.wg_dir = config.wg_dir;
  s.selected_containers = config.selected_containers;
  s.docker_network_name = config.docker_network_name;
  s.docker_network_subnet = config.docker_network_subnet;
  s.lan_subnet = config.lan_subnet;
  s.vpn_subnet = config.vpn_subnet;
  s.vpn_subnet_base = config.vpn_subnet_base;
  s.wg_client_dns = config.wg_client_dns;
  s.dns_fallback = config.dns_fallback;
  s.wg_endpoint = config.wg_endpoint;
  s.firewall_mode = config.firewall_mode;
  s.restricted_services = config.restricted_services;
  s.traefik_domain_mode = config.traefik_domain_mode;
  s.traefik_domain_name = config.traefik_domain_name;
  s.traefik_acme_email = config.traefik_acme_email;
  s.port_overrides = config.port_overrides;
  s.container_ips = config.container_ips;
  return s;
}

// Double-quoted shell word
static std::string quoted(const std::string &value) {
  std::string out = "\"";
  for (char c : value) {
    if (c == '"' || c == '\\' || c == '$' || c == '`')
      out += '\\';
    out += c;
  }
  return out + "\"";
}

static std::string array(const std::vector<std::string> &items) {
  return "(" + join(items, " ") + ")";
}

std::string DesiredStateSnapshot::render() const {
  std::ostringstream out;
  out << "# clinicd desired state, generated " << timestamp("%Y-%m-%d %H:%M:%S")
      << "\n";
  out << "# Sourced by shell tooling and reloaded on every run.\n";
  out << "CFG_ROOT=" << quoted(cfg_root.string()) << "\n";
  out << "SELECTED_CONTAINERS=" << array(selected_containers) << "\n";
  out << "\n# Network\n";
  out << "DOCKER_NETWORK_NAME=" << quoted(docker_network_name) << "\n";
  out << "DOCKER_NETWORK_SUBNET=" << quoted(docker_network_subnet) << "\n";
  out << "LAN_SUBNET=" << quoted(lan_subnet) << "\n";
  out << "VPN_SUBNET=" << quoted(vpn_subnet) << "\n";
  out << "VPN_SUBNET_BASE=" << quoted(vpn_subnet_base) << "\n";
  out << "WG_CLIENT_DNS=" << quoted(wg_client_dns) << "\n";
  out << "DNS_FALLBACK=" << quoted(dns_fallback) << "\n";
  if (!wg_endpoint.empty()) {
    out << "WG_ENDPOINT=" << quoted(wg_endpoint) << "\n";
  }
  out << "\n# Firewall\n";
  out << "FIREWALL_RESTRICT_MODE=" << quoted(firewall_mode_to_string(firewall_mode))
      << "\n";
  out << "RESTRICTED_SERVICES=" << array(restricted_services) << "\n";
  out << "\n# Reverse proxy\n";
  out << "TRAEFIK_DOMAIN_MODE=" << quoted(traefik_domain_mode) << "\n";
  out << "TRAEFIK_DOMAIN_NAME=" << quoted(traefik_domain_name) << "\n";
  out << "TRAEFIK_ACME_EMAIL=" << quoted(traefik_acme_email) << "\n";

  out << "\n# Custom port mappings\n";
  for (const auto &[key, port] : port_overrides) {
    out << key << "_PORT=" << quoted(port) << "\n";
  }
  out << "\n# Container IP assignments\n";
  for (const auto &[key, ip] : container_ips) {
    out << key << "_CONTAINER_IP=" << quoted(ip) << "\n";
  }
  out << "\nWG_DIR=" << quoted(wg_dir.string()) << "\n";
  return out.str();
}

bool DesiredStateSnapshot::save(const fs::path &path) const {
  if (!write_file_atomic(path, render(), true)) {
    LOG_ERROR("Failed to save desired state to " + path.string());
    return false;
  }
  LOG_DEBUG("Desired state saved to " + path.string());
  return true;
}

SnapshotStatus inspect_snapshot(const fs::path &path, std::string *error) {
  if (!fs::exists(path)) {
    return SnapshotStatus::Missing;
  }

  std::string text = read_file(path);
  if (contains(text, LEGACY_STATE_MARKER)) {
    if (error)
      *error = "legacy associative-array format";
    return SnapshotStatus::Legacy;
  }

  std::vector<Assignment> assignments;
  std::string parse_error;
  if (!parse_assignments(text, assignments, parse_error)) {
    if (error)
      *error = parse_error;
    return SnapshotStatus::Corrupt;
  }

  // Values must also be acceptable to the configuration layer
  Config probe;
  try {
    for (const auto &a : assignments) {
      if (a.is_array)
        probe.set_array(a.key, a.items);
      else
        probe.set_value(a.key, a.value);
    }
  } catch (const std::exception &e) {
    if (error)
      *error = e.what();
    return SnapshotStatus::Corrupt;
  }
  return SnapshotStatus::Valid;
}

fs::path quarantine_snapshot(const fs::path &path) {
  fs::path target = path;
  target += ".backup-" + timestamp();

  std::error_code ec;
  fs::rename(path, target, ec);
  if (ec) {
    LOG_ERROR("Cannot quarantine " + path.string() + ": " + ec.message());
    return fs::path();
  }
  return target;
}

bool prepare_snapshot(const fs::path &path) {
  std::string error;
  SnapshotStatus status = inspect_snapshot(path, &error);
  switch (status) {
  case SnapshotStatus::Missing:
    return false;
  case SnapshotStatus::Valid:
    return true;
  case SnapshotStatus::Legacy:
  case SnapshotStatus::Corrupt:
    break;
  }

  fs::path moved = quarantine_snapshot(path);
  if (moved.empty()) {
    throw ExitError(EXIT_CONFIG_INVALID,
                    "Desired state " + path.string() + " is " +
                        snapshot_status_to_string(status) + " (" + error +
                        ") and could not be moved aside");
  }
  LOG_WARN("Desired state " + path.string() + " is " +
           snapshot_status_to_string(status) + " (" + error +
           "), moved to " + moved.string() + " and will be regenerated");
  return false;
}

} // namespace clinic

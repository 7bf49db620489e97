// conf/config.cpp - Configuration implementation
#include "config.hpp"
#include "../utils.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace clinic {

std::string firewall_mode_to_string(FirewallMode mode) {
  switch (mode) {
  case FirewallMode::Restrict:
    return "restrict";
  case FirewallMode::Custom:
    return "custom";
  case FirewallMode::Open:
    break;
  }
  return "open";
}

FirewallMode firewall_mode_from_string(const std::string &value) {
  std::string v = to_lower(trim(value));
  if (v == "open" || v.empty())
    return FirewallMode::Open;
  if (v == "restrict" || v == "restricted")
    return FirewallMode::Restrict;
  if (v == "custom")
    return FirewallMode::Custom;
  if (v == "ask") {
    // Interactive prompt of the old bootstrap script, never answered here
    LOG_WARN("FIREWALL_RESTRICT_MODE=ask is not interactive here, using open");
    return FirewallMode::Open;
  }
  throw std::runtime_error("Invalid firewall mode: " + value);
}

static bool is_identifier(const std::string &key) {
  if (key.empty() || std::isdigit(static_cast<unsigned char>(key[0])))
    return false;
  for (char c : key) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_')
      return false;
  }
  return true;
}

static std::string unquote(const std::string &raw, bool &ok) {
  ok = true;
  if (raw.empty())
    return raw;
  char q = raw.front();
  if (q != '"' && q != '\'')
    return raw;
  if (raw.size() < 2 || raw.back() != q) {
    ok = false;
    return raw;
  }
  std::string body = raw.substr(1, raw.size() - 2);
  if (q == '\'')
    return body;

  // Backslash escapes inside double quotes
  std::string out;
  for (size_t i = 0; i < body.size(); ++i) {
    if (body[i] == '\\' && i + 1 < body.size())
      ++i;
    out += body[i];
  }
  return out;
}

bool parse_assignments(const std::string &text, std::vector<Assignment> &out,
                       std::string &error) {
  std::istringstream in(text);
  std::string line;
  int line_no = 0;

  while (std::getline(in, line)) {
    ++line_no;
    std::string t = trim(line);
    if (t.empty() || t[0] == '#')
      continue;
    if (starts_with(t, "export "))
      t = trim(t.substr(7));

    auto eq_pos = t.find('=');
    if (eq_pos == std::string::npos) {
      error = "line " + std::to_string(line_no) + ": expected KEY=value";
      return false;
    }

    Assignment a;
    a.line = line_no;
    a.key = trim(t.substr(0, eq_pos));
    if (!is_identifier(a.key)) {
      error = "line " + std::to_string(line_no) + ": invalid key '" + a.key +
              "'";
      return false;
    }

    std::string raw = trim(t.substr(eq_pos + 1));
    if (!raw.empty() && raw[0] == '(') {
      if (raw.back() != ')') {
        error = "line " + std::to_string(line_no) + ": unterminated array";
        return false;
      }
      a.is_array = true;
      for (const auto &item :
           split_whitespace(raw.substr(1, raw.size() - 2))) {
        bool ok = true;
        std::string v = unquote(item, ok);
        if (!ok) {
          error = "line " + std::to_string(line_no) + ": unbalanced quote";
          return false;
        }
        a.items.push_back(v);
      }
    } else {
      bool ok = true;
      a.value = unquote(raw, ok);
      if (!ok) {
        error = "line " + std::to_string(line_no) + ": unbalanced quote";
        return false;
      }
    }
    out.push_back(a);
  }
  return true;
}

std::string service_env_key(const std::string &service) {
  std::string key;
  for (char c : service) {
    if (c == '-' || c == '.')
      key += '_';
    else
      key += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return key;
}

// Derived locations
fs::path Config::services_dir() const { return cfg_root / SERVICES_SUBDIR; }
fs::path Config::backup_dir() const { return cfg_root / BACKUP_SUBDIR; }
fs::path Config::log_dir() const { return cfg_root / LOG_SUBDIR; }
fs::path Config::qr_dir() const { return cfg_root / QR_SUBDIR; }
fs::path Config::state_file() const { return cfg_root / STATE_FILE_NAME; }
fs::path Config::diagnostics_file() const {
  return log_dir() / DIAGNOSTICS_FILE_NAME;
}
fs::path Config::wg_keys_env() const { return wg_dir / WG_KEYS_ENV_NAME; }
fs::path Config::wg_clients_dir() const { return wg_dir / WG_CLIENTS_SUBDIR; }
fs::path Config::wg_server_conf() const {
  return cfg_root / WG_CONFS_SUBDIR / WG_SERVER_CONF_NAME;
}

fs::path Config::lock_file() const {
  const char *home = std::getenv("HOME");
  fs::path base = (home && *home) ? fs::path(home) : cfg_root;
  return base / ".cache" / LOCK_FILE_NAME;
}

std::string Config::port_override(const std::string &service) const {
  auto it = port_overrides.find(service_env_key(service));
  return it == port_overrides.end() ? "" : it->second;
}

std::string Config::container_ip(const std::string &service) const {
  auto it = container_ips.find(service_env_key(service));
  return it == container_ips.end() ? "" : it->second;
}

bool Config::is_selected(const std::string &service) const {
  if (selected_containers.empty())
    return true;
  return std::find(selected_containers.begin(), selected_containers.end(),
                   service) != selected_containers.end();
}

std::map<std::string, std::string> Config::variables() const {
  return {{"CFG_ROOT", cfg_root.string()},
          {"WG_DIR", wg_dir.string()},
          {"DOCKER_NETWORK_NAME", docker_network_name},
          {"DOCKER_NETWORK_SUBNET", docker_network_subnet},
          {"LAN_SUBNET", lan_subnet},
          {"VPN_SUBNET", vpn_subnet},
          {"VPN_SUBNET_BASE", vpn_subnet_base},
          {"TRAEFIK_DOMAIN_NAME", traefik_domain_name}};
}

static int parse_int(const std::string &key, const std::string &value) {
  std::string v = trim(value);
  if (!is_all_digits(v) || v.size() > 9) {
    throw std::runtime_error("Invalid integer for " + key + ": " + value);
  }
  return std::stoi(v);
}

static bool ends_with(const std::string &s, const std::string &suffix) {
  return s.size() > suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static std::vector<std::string> split_list(const std::string &value) {
  std::string normalized = value;
  std::replace(normalized.begin(), normalized.end(), ',', ' ');
  return split_whitespace(normalized);
}

bool Config::set_value(const std::string &raw_key, const std::string &value) {
  std::string key;
  for (char c : raw_key) {
    key += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }

  if (key == "CFG_ROOT")
    cfg_root = value;
  else if (key == "WG_DIR")
    wg_dir = value;
  else if (key == "DOCKER_NETWORK_NAME")
    docker_network_name = value;
  else if (key == "DOCKER_NETWORK_SUBNET")
    docker_network_subnet = value;
  else if (key == "LAN_SUBNET") {
    lan_subnet = value;
    lan_subnet_explicit = !value.empty();
  } else if (key == "VPN_SUBNET")
    vpn_subnet = value;
  else if (key == "VPN_SUBNET_BASE")
    vpn_subnet_base = value;
  else if (key == "VPN_ENDPOINT_SERVICE")
    vpn_service = value;
  else if (key == "WG_PORT")
    wg_port = parse_int(key, value);
  else if (key == "WG_CLIENT_DNS")
    wg_client_dns = value;
  else if (key == "DNS_FALLBACK")
    dns_fallback = value;
  else if (key == "WG_ENDPOINT")
    wg_endpoint = value;
  else if (key == "BACKUP_RETENTION")
    backup_retention = parse_int(key, value);
  else if (key == "SELECTED_CONTAINERS")
    selected_containers = split_list(value);
  else if (key == "FIREWALL_RESTRICT_MODE")
    firewall_mode = firewall_mode_from_string(value);
  else if (key == "RESTRICTED_SERVICES")
    restricted_services = split_list(value);
  else if (key == "TRAEFIK_DOMAIN_MODE")
    traefik_domain_mode = value;
  else if (key == "TRAEFIK_DOMAIN_NAME")
    traefik_domain_name = value;
  else if (key == "TRAEFIK_ACME_EMAIL")
    traefik_acme_email = value;
  else if (key == "REPAIR_MAX_ATTEMPTS")
    repair_max_attempts = parse_int(key, value);
  else if (key == "REPAIR_RETRY_DELAY")
    repair_retry_delay = parse_int(key, value);
  else if (key == "DRY_RUN")
    dry_run = is_truthy(value);
  else if (key == "VERBOSE")
    verbose = is_truthy(value);
  else if (key == "CONFIG_FILE" || key == "BACKUP_DIR" || key == "LOG_DIR" ||
           key == "QR_DIR" || key == "WG_KEYS_ENV" || key == "WG_CLIENTS_DIR")
    LOG_DEBUG(key + " is derived from CFG_ROOT/WG_DIR, ignoring");
  else if (ends_with(key, "_CONTAINER_IP"))
    container_ips[key.substr(0, key.size() - 13)] = value;
  else if (ends_with(key, "_PORT"))
    port_overrides[key.substr(0, key.size() - 5)] = value;
  else
    return false;
  return true;
}

bool Config::set_array(const std::string &raw_key,
                       const std::vector<std::string> &items) {
  std::string key;
  for (char c : raw_key) {
    key += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }

  if (key == "SELECTED_CONTAINERS")
    selected_containers = items;
  else if (key == "RESTRICTED_SERVICES")
    restricted_services = items;
  else
    return set_value(key, join(items, " "));
  return true;
}

Config Config::load_default() {
  Config config;
  fs::path default_path = config.state_file();
  if (fs::exists(default_path)) {
    try {
      return from_file(default_path);
    } catch (const std::exception &e) {
      LOG_WARN("Failed to load " + default_path.string() + " (" + e.what() +
               "), using defaults");
    }
  }
  return config;
}

Config Config::from_file(const fs::path &path) {
  Config config;

  if (!fs::exists(path)) {
    throw std::runtime_error("Cannot open config file " + path.string());
  }
  std::string text = read_file(path);

  std::vector<Assignment> assignments;
  std::string error;
  if (!parse_assignments(text, assignments, error)) {
    throw std::runtime_error(path.string() + ": " + error);
  }

  for (const auto &a : assignments) {
    bool known = a.is_array ? config.set_array(a.key, a.items)
                            : config.set_value(a.key, a.value);
    if (!known) {
      LOG_DEBUG("Unknown config key " + a.key + " in " + path.string());
    }
  }
  return config;
}

// Settings read from the environment and the snapshot
static const char *const kConfigKeys[] = {
    "CFG_ROOT",           "WG_DIR",
    "DOCKER_NETWORK_NAME", "DOCKER_NETWORK_SUBNET",
    "LAN_SUBNET",         "VPN_SUBNET",
    "VPN_SUBNET_BASE",    "VPN_ENDPOINT_SERVICE",
    "WG_PORT",            "WG_CLIENT_DNS",
    "DNS_FALLBACK",       "WG_ENDPOINT",
    "BACKUP_RETENTION",   "SELECTED_CONTAINERS",
    "FIREWALL_RESTRICT_MODE", "RESTRICTED_SERVICES",
    "TRAEFIK_DOMAIN_MODE", "TRAEFIK_DOMAIN_NAME",
    "TRAEFIK_ACME_EMAIL", "REPAIR_MAX_ATTEMPTS",
    "REPAIR_RETRY_DELAY", "DRY_RUN",
    "VERBOSE"};

bool is_reserved_service_key(const std::string &stem) {
  for (const char *key : kConfigKeys) {
    if (stem + "_PORT" == key || stem + "_CONTAINER_IP" == key)
      return true;
  }
  return false;
}

void Config::apply_env() {
  for (const char *key : kConfigKeys) {
    const char *value = std::getenv(key);
    if (value != nullptr && *value != '\0') {
      set_value(key, value);
    }
  }
}

void Config::merge_with_cli(
    const fs::path &root_override,
    const std::vector<std::string> &services_override,
    const std::string &firewall_mode_override,
    const std::vector<std::string> &restrict_override,
    const std::map<std::string, std::string> &port_override,
    bool dry_run_override, bool verbose_override) {
  if (!root_override.empty()) {
    cfg_root = root_override;
  }
  if (!services_override.empty()) {
    selected_containers = services_override;
  }
  if (!firewall_mode_override.empty()) {
    firewall_mode = firewall_mode_from_string(firewall_mode_override);
  }
  if (!restrict_override.empty()) {
    firewall_mode = FirewallMode::Custom;
    restricted_services = restrict_override;
  }
  for (const auto &[service, port] : port_override) {
    std::string key = service_env_key(service);
    if (is_reserved_service_key(key)) {
      throw std::runtime_error("Service name '" + service + "' maps to " +
                               key + "_PORT, which is a configuration key");
    }
    port_overrides[key] = port;
  }
  if (dry_run_override) {
    dry_run = true;
  }
  if (verbose_override) {
    verbose = true;
  }
}

} // namespace clinic

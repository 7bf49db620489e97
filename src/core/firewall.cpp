// core/firewall.cpp - Firewall policy implementation
#include "firewall.hpp"
#include "../defs.hpp"
#include "synthesizer.hpp"
#include <algorithm>
#include <set>

namespace clinic {

std::string subnet_class_name(SubnetClass c) {
  switch (c) {
  case SubnetClass::Lan:
    return "lan";
  case SubnetClass::Vpn:
    return "vpn";
  case SubnetClass::Docker:
    return "docker";
  case SubnetClass::Open:
    break;
  }
  return "open";
}

std::string FirewallRule::describe() const {
  std::string out = service + " " + port + "/" + protocol + " ";
  if (action == RuleAction::Deny)
    return out + "deny";
  out += "allow " + subnet_class_name(subnet_class);
  if (!source.empty())
    out += " from " + source;
  return out;
}

static bool mentions_udp(const ServiceDescriptor &desc) {
  for (const char *key : {"port", "ports", "port_notes", "description"}) {
    if (contains(desc.get(key), "udp"))
      return true;
  }
  return false;
}

std::vector<ServicePort> service_ports(const ServiceDescriptor &desc,
                                       const Config &config) {
  std::vector<ServicePort> ports;
  std::vector<std::string> items = service_port_items(desc, config);

  // The udp hint only applies when no item names its own protocol
  bool udp_hint =
      mentions_udp(desc) &&
      std::none_of(items.begin(), items.end(), [](const std::string &item) {
        return contains(item, "/");
      });

  for (const auto &item : items) {
    PortSpec spec;
    if (!parse_port_spec(item, spec)) {
      LOG_WARN(desc.name + ": invalid port '" + item +
               "', no firewall rule");
      continue;
    }
    std::string protocol = spec.protocol;
    if (!contains(item, "/") && udp_hint)
      protocol = "udp";
    // ufw and iptables use ':' for ranges
    std::string port = spec.host_port;
    std::replace(port.begin(), port.end(), '-', ':');
    ports.push_back({desc.name, port, protocol});
  }
  return ports;
}

bool is_restricted(const std::string &service, const Config &config) {
  if (service == config.vpn_service)
    return false;
  switch (config.firewall_mode) {
  case FirewallMode::Restrict:
    return true;
  case FirewallMode::Custom:
    return std::find(config.restricted_services.begin(),
                     config.restricted_services.end(),
                     service) != config.restricted_services.end();
  case FirewallMode::Open:
    break;
  }
  return false;
}

std::vector<FirewallRule>
derive_rules(const std::vector<ServiceDescriptor> &services,
             const Config &config) {
  std::vector<FirewallRule> rules;
  std::set<std::string> seen;

  for (const auto &desc : services) {
    // The VPN endpoint is the remote access path and is never restricted
    if (desc.name == config.vpn_service &&
        config.firewall_mode == FirewallMode::Restrict) {
      LOG_DEBUG("No firewall rules for VPN endpoint " + desc.name);
      continue;
    }

    bool restricted = is_restricted(desc.name, config);
    for (const auto &sp : service_ports(desc, config)) {
      std::string key = sp.port + "/" + sp.protocol;
      if (!seen.insert(key).second) {
        LOG_WARN(desc.name + ": port " + key +
                 " already covered by another service");
        continue;
      }

      if (!restricted) {
        rules.push_back({sp.service, sp.port, sp.protocol, SubnetClass::Open,
                         "", RuleAction::Allow});
        continue;
      }
      rules.push_back({sp.service, sp.port, sp.protocol, SubnetClass::Lan,
                       config.lan_subnet, RuleAction::Allow});
      rules.push_back({sp.service, sp.port, sp.protocol, SubnetClass::Vpn,
                       config.vpn_subnet, RuleAction::Allow});
      rules.push_back({sp.service, sp.port, sp.protocol, SubnetClass::Docker,
                       config.docker_network_subnet, RuleAction::Allow});
      rules.push_back({sp.service, sp.port, sp.protocol, SubnetClass::Open,
                       "", RuleAction::Deny});
    }
  }
  return rules;
}

std::string detect_lan_subnet(CommandRunner &runner, const Config &config) {
  CommandResult r = runner.run({"ip", "route"});
  if (r.ok()) {
    for (const auto &line : split(r.output, '\n')) {
      auto cols = split_whitespace(line);
      if (cols.empty())
        continue;
      const std::string &dest = cols[0];
      if (!starts_with(dest, "192.168.") && !starts_with(dest, "10."))
        continue;
      if (!contains(dest, "/") || dest == config.vpn_subnet)
        continue;
      if (contains(line, "docker") || contains(line, "br-"))
        continue;
      LOG_DEBUG("Detected LAN subnet " + dest);
      return dest;
    }
  }
  LOG_DEBUG("Could not detect LAN subnet, using " + config.lan_subnet);
  return config.lan_subnet;
}

// ufw
bool UfwBackend::available(CommandRunner &runner) {
  if (!runner.program_exists("ufw"))
    return false;
  CommandResult r = runner.run({"ufw", "status"});
  return r.ok() && contains(r.output, "Status: active");
}

const std::string &UfwBackend::status() {
  if (!status_loaded_) {
    CommandResult r = runner_.run({"ufw", "status"});
    status_ = r.ok() ? r.output : "";
    status_loaded_ = true;
  }
  return status_;
}

bool UfwBackend::rule_exists(const FirewallRule &rule) {
  if (rule.action == RuleAction::Deny) {
    return true;
  }

  std::string target = rule.port + "/" + rule.protocol;
  for (const auto &line : split(status(), '\n')) {
    auto cols = split_whitespace(line);
    if (cols.size() < 3 || cols[0] != target)
      continue;
    size_t i = 1;
    if (cols[i] != "ALLOW")
      continue;
    ++i;
    if (i < cols.size() && cols[i] == "IN")
      ++i;
    if (i >= cols.size())
      continue;
    const std::string &from = cols[i];
    if (rule.subnet_class == SubnetClass::Open ? from == "Anywhere"
                                               : from == rule.source)
      return true;
  }
  return false;
}

bool UfwBackend::add_rule(const FirewallRule &rule) {
  // Everything not allowed falls to the ufw default incoming policy
  if (rule.action == RuleAction::Deny) {
    return true;
  }

  std::vector<std::string> argv;
  if (rule.subnet_class == SubnetClass::Open) {
    argv = {"ufw", "allow", rule.port + "/" + rule.protocol};
  } else {
    argv = {"ufw",  "allow", "from",      rule.source, "to",
            "any",  "port",  rule.port,   "proto",     rule.protocol};
  }

  CommandResult r = runner_.mutate(argv);
  status_loaded_ = false;
  if (!r.ok()) {
    LOG_WARN("ufw rejected " + rule.describe() + ": " + trim(r.output));
    return false;
  }
  return true;
}

void UfwBackend::revoke_open(const std::string &port,
                             const std::string &protocol) {
  CommandResult r = runner_.mutate(
      {"ufw", "--force", "delete", "allow", port + "/" + protocol});
  status_loaded_ = false;
  if (!r.ok()) {
    LOG_DEBUG("No blanket ufw allow for " + port + "/" + protocol);
  }
}

// iptables
bool IptablesBackend::available(CommandRunner &runner) {
  return runner.program_exists("iptables");
}

std::vector<std::string> IptablesBackend::rule_spec(const FirewallRule &rule) {
  std::vector<std::string> spec = {"INPUT", "-p", rule.protocol};
  if (rule.action == RuleAction::Allow && !rule.source.empty()) {
    spec.push_back("-s");
    spec.push_back(rule.source);
  }
  spec.push_back("--dport");
  spec.push_back(rule.port);
  spec.push_back("-j");
  spec.push_back(rule.action == RuleAction::Deny ? "DROP" : "ACCEPT");
  return spec;
}

bool IptablesBackend::rule_exists(const FirewallRule &rule) {
  std::vector<std::string> argv = {"iptables", "-C"};
  auto spec = rule_spec(rule);
  argv.insert(argv.end(), spec.begin(), spec.end());
  return runner_.run(argv).ok();
}

bool IptablesBackend::add_rule(const FirewallRule &rule) {
  std::vector<std::string> argv = {"iptables", "-A"};
  auto spec = rule_spec(rule);
  argv.insert(argv.end(), spec.begin(), spec.end());
  CommandResult r = runner_.mutate(argv);
  if (!r.ok()) {
    LOG_WARN("iptables rejected " + rule.describe() + ": " + trim(r.output));
    return false;
  }
  return true;
}

void IptablesBackend::revoke_open(const std::string &port,
                                  const std::string &protocol) {
  FirewallRule blanket;
  blanket.port = port;
  blanket.protocol = protocol;
  if (!rule_exists(blanket)) {
    return;
  }
  std::vector<std::string> argv = {"iptables", "-D"};
  auto spec = rule_spec(blanket);
  argv.insert(argv.end(), spec.begin(), spec.end());
  CommandResult r = runner_.mutate(argv);
  if (!r.ok()) {
    LOG_WARN("Could not remove open rule for " + port + "/" + protocol +
             ": " + trim(r.output));
  }
}

bool IptablesBackend::persist() {
  if (runner_.program_exists("netfilter-persistent")) {
    CommandResult r = runner_.mutate({"netfilter-persistent", "save"});
    if (r.ok())
      return true;
    LOG_WARN("netfilter-persistent save failed: " + trim(r.output));
  }

  if (!runner_.program_exists("iptables-save")) {
    LOG_WARN("iptables rules are not persistent across reboots");
    return false;
  }
  if (runner_.dry_run()) {
    LOG_INFO(std::string("[dry-run] iptables-save > ") + IPTABLES_RULES_FILE);
    return true;
  }
  CommandResult r = runner_.run({"iptables-save"});
  if (!r.ok() || !write_file(IPTABLES_RULES_FILE, r.output)) {
    LOG_WARN(std::string("Could not save rules to ") + IPTABLES_RULES_FILE);
    return false;
  }
  return true;
}

std::unique_ptr<FirewallBackend> select_backend(CommandRunner &runner) {
  if (UfwBackend::available(runner)) {
    return std::make_unique<UfwBackend>(runner);
  }
  if (IptablesBackend::available(runner)) {
    return std::make_unique<IptablesBackend>(runner);
  }
  return nullptr;
}

// Engine
FirewallEngine::FirewallEngine(const Config &config, CommandRunner &runner)
    : config_(config), runner_(runner) {}

std::vector<FirewallRule>
FirewallEngine::plan(const std::vector<ServiceDescriptor> &services) {
  if (!config_.lan_subnet_explicit) {
    config_.lan_subnet = detect_lan_subnet(runner_, config_);
    config_.lan_subnet_explicit = true;
  }
  return derive_rules(services, config_);
}

FirewallReport
FirewallEngine::apply(const std::vector<ServiceDescriptor> &services) {
  auto backend = select_backend(runner_);
  if (!backend) {
    LOG_WARN("Neither ufw nor iptables is available, firewall left "
             "unchanged");
    return FirewallReport{};
  }
  return apply(services, *backend);
}

FirewallReport
FirewallEngine::apply(const std::vector<ServiceDescriptor> &services,
                      FirewallBackend &backend) {
  FirewallReport report;
  report.backend = backend.name();

  auto rules = plan(services);
  LOG_INFO("Applying " + std::to_string(rules.size()) +
           " firewall rule(s) with " + backend.name() + " (mode " +
           firewall_mode_to_string(config_.firewall_mode) + ")");

  std::set<std::string> revoked;
  for (const auto &rule : rules) {
    if (rule.subnet_class != SubnetClass::Open ||
        rule.action == RuleAction::Deny) {
      std::string key = rule.port + "/" + rule.protocol;
      if (revoked.insert(key).second) {
        backend.revoke_open(rule.port, rule.protocol);
      }
    }

    if (backend.rule_exists(rule)) {
      LOG_DEBUG("Present: " + rule.describe());
      ++report.present;
      continue;
    }
    if (backend.add_rule(rule)) {
      LOG_DEBUG("Added: " + rule.describe());
      ++report.added;
    } else {
      ++report.failed;
    }
  }

  if (report.added > 0) {
    backend.persist();
  }
  LOG_INFO("Firewall: " + std::to_string(report.added) + " added, " +
           std::to_string(report.present) + " already present, " +
           std::to_string(report.failed) + " failed");
  return report;
}

} // namespace clinic

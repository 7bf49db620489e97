// core/firewall.hpp - Firewall policy derivation and backends
#pragma once

#include "../conf/config.hpp"
#include "../conf/descriptor.hpp"
#include "../utils.hpp"
#include <memory>
#include <string>
#include <vector>

namespace clinic {

enum class SubnetClass { Lan, Vpn, Docker, Open };
enum class RuleAction { Allow, Deny };

struct FirewallRule {
  std::string service;
  std::string port;
  std::string protocol;
  SubnetClass subnet_class = SubnetClass::Open;
  std::string source; // empty for Open and Deny
  RuleAction action = RuleAction::Allow;

  std::string describe() const;
};

struct ServicePort {
  std::string service;
  std::string port;
  std::string protocol;
};

std::string subnet_class_name(SubnetClass c);

// Host ports a service exposes. Invalid entries are warned and skipped.
std::vector<ServicePort> service_ports(const ServiceDescriptor &desc,
                                       const Config &config);

// Whether the service gets LAN/VPN/Docker restriction under the mode.
bool is_restricted(const std::string &service, const Config &config);

std::vector<FirewallRule>
derive_rules(const std::vector<ServiceDescriptor> &services,
             const Config &config);

// First private route from `ip route` that is neither docker nor the VPN.
std::string detect_lan_subnet(CommandRunner &runner, const Config &config);

class FirewallBackend {
public:
  virtual ~FirewallBackend() = default;

  virtual std::string name() const = 0;
  virtual bool rule_exists(const FirewallRule &rule) = 0;
  virtual bool add_rule(const FirewallRule &rule) = 0;
  // Drops the blanket allow for a port that is about to be restricted.
  virtual void revoke_open(const std::string &port,
                           const std::string &protocol) = 0;
  virtual bool persist() = 0;
};

class UfwBackend : public FirewallBackend {
public:
  explicit UfwBackend(CommandRunner &runner) : runner_(runner) {}

  static bool available(CommandRunner &runner);

  std::string name() const override { return "ufw"; }
  bool rule_exists(const FirewallRule &rule) override;
  bool add_rule(const FirewallRule &rule) override;
  void revoke_open(const std::string &port,
                   const std::string &protocol) override;
  bool persist() override { return true; }

private:
  const std::string &status();

  CommandRunner &runner_;
  std::string status_;
  bool status_loaded_ = false;
};

class IptablesBackend : public FirewallBackend {
public:
  explicit IptablesBackend(CommandRunner &runner) : runner_(runner) {}

  static bool available(CommandRunner &runner);
  static std::vector<std::string> rule_spec(const FirewallRule &rule);

  std::string name() const override { return "iptables"; }
  bool rule_exists(const FirewallRule &rule) override;
  bool add_rule(const FirewallRule &rule) override;
  void revoke_open(const std::string &port,
                   const std::string &protocol) override;
  bool persist() override;

private:
  CommandRunner &runner_;
};

// ufw when active, else iptables, else nullptr.
std::unique_ptr<FirewallBackend> select_backend(CommandRunner &runner);

struct FirewallReport {
  std::string backend;
  int added = 0;
  int present = 0;
  int failed = 0;
};

class FirewallEngine {
public:
  FirewallEngine(const Config &config, CommandRunner &runner);

  std::vector<FirewallRule>
  plan(const std::vector<ServiceDescriptor> &services);

  // Best effort: a missing backend is a warning, never an error.
  FirewallReport apply(const std::vector<ServiceDescriptor> &services);
  FirewallReport apply(const std::vector<ServiceDescriptor> &services,
                       FirewallBackend &backend);

private:
  Config config_;
  CommandRunner &runner_;
};

} // namespace clinic

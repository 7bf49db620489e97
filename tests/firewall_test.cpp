#include "conf/config.hpp"
#include "conf/descriptor.hpp"
#include "core/firewall.hpp"
#include "fake_runner.hpp"

#include <algorithm>
#include <cassert>
#include <string>
#include <vector>

using namespace clinic;
using clinic_test::FakeRunner;

namespace {

ServiceDescriptor make(const std::string& name, const std::string& text) {
    return ServiceDescriptor::parse(name, text);
}

std::vector<ServiceDescriptor> stack() {
    return {make("grafana", "image=grafana/grafana\nport=3000:3000\n"),
            make("wireguard", "image=linuxserver/wireguard\nport=51820/udp\n"),
            make("ollama", "image=ollama/ollama\nport=11434\n")};
}

size_t rules_for(const std::vector<FirewallRule>& rules, const std::string& service) {
    return static_cast<size_t>(std::count_if(rules.begin(), rules.end(),
                                             [&](const FirewallRule& r) { return r.service == service; }));
}

// Records what the engine asks for; rules listed in present already exist.
class RecordingBackend : public FirewallBackend {
public:
    std::string name() const override { return "recording"; }
    bool rule_exists(const FirewallRule& rule) override {
        return std::find(present.begin(), present.end(), rule.describe()) != present.end();
    }
    bool add_rule(const FirewallRule& rule) override {
        added.push_back(rule.describe());
        present.push_back(rule.describe());
        return true;
    }
    void revoke_open(const std::string& port, const std::string& protocol) override {
        revoked.push_back(port + "/" + protocol);
    }
    bool persist() override {
        ++persisted;
        return true;
    }

    std::vector<std::string> present;
    std::vector<std::string> added;
    std::vector<std::string> revoked;
    int persisted = 0;
};

}  // namespace

int main() {
    {
        auto ports = service_ports(make("wg", "port=51820\nport_notes=udp tunnel\n"), Config());
        assert(ports.size() == 1 && ports[0].protocol == "udp");
        ports = service_ports(make("range", "port=6000-6010:6000-6010,bad\n"), Config());
        assert(ports.size() == 1 && ports[0].port == "6000:6010" && ports[0].protocol == "tcp");
    }

    // Mixed list: only the item that says udp is udp
    {
        ServiceDescriptor adguard = make("adguard", "image=adguard/adguardhome\nport=53:53/udp,3000:3000\n");
        auto ports = service_ports(adguard, Config());
        assert(ports.size() == 2);
        assert(ports[0].port == "53" && ports[0].protocol == "udp");
        assert(ports[1].port == "3000" && ports[1].protocol == "tcp");

        Config config;
        config.firewall_mode = FirewallMode::Restrict;
        auto rules = derive_rules({adguard}, config);
        assert(rules.size() == 8);
        bool tcp_deny = false;
        for (const auto& r : rules) {
            if (r.describe() == "adguard 3000/tcp deny")
                tcp_deny = true;
            assert(r.describe().find("3000/udp") == std::string::npos);
        }
        assert(tcp_deny);
    }

    // Restrict mode never emits rules for the VPN endpoint
    {
        Config config;
        config.firewall_mode = FirewallMode::Restrict;
        auto rules = derive_rules(stack(), config);
        assert(rules_for(rules, "wireguard") == 0);
        assert(rules_for(rules, "grafana") == 4);
        assert(rules_for(rules, "ollama") == 4);
        assert(rules[0].subnet_class == SubnetClass::Lan && rules[0].source == config.lan_subnet);
        assert(rules[3].action == RuleAction::Deny);
        assert(rules[3].describe() == "grafana 3000/tcp deny");
    }

    // Custom mode restricts only the listed services
    {
        Config config;
        config.firewall_mode = FirewallMode::Custom;
        config.restricted_services = {"ollama", "wireguard"};
        auto rules = derive_rules(stack(), config);
        assert(rules_for(rules, "ollama") == 4);
        assert(rules_for(rules, "grafana") == 1);
        assert(rules_for(rules, "wireguard") == 1);
        for (const auto& r : rules) {
            if (r.service != "ollama") {
                assert(r.subnet_class == SubnetClass::Open && r.action == RuleAction::Allow);
            }
        }
        assert(!is_restricted("wireguard", config));
    }

    {
        Config config;
        auto rules = derive_rules(stack(), config);
        assert(rules.size() == 3);
        assert(rules[1].describe() == "wireguard 51820/udp allow open");
    }

    // Re-adding an existing rule is a no-op
    {
        Config config;
        config.lan_subnet_explicit = true;
        config.firewall_mode = FirewallMode::Restrict;
        FakeRunner runner;
        RecordingBackend backend;
        FirewallEngine engine(config, runner);

        FirewallReport first = engine.apply(stack(), backend);
        assert(first.added == 8 && first.present == 0);
        assert(backend.persisted == 1);
        assert(backend.revoked.size() == 2);

        FirewallReport second = engine.apply(stack(), backend);
        assert(second.added == 0 && second.present == 8);
        assert(backend.persisted == 1);
        assert(!runner.called({"ip", "route"}));
    }

    // LAN subnet detection skips docker bridges and the VPN
    {
        Config config;
        FakeRunner runner;
        runner.respond({"ip", "route"}, 0,
                       "default via 192.168.1.1 dev eth0\n"
                       "10.8.0.0/24 dev wg0 scope link\n"
                       "172.20.0.0/16 dev br-1234 scope link\n"
                       "192.168.1.0/24 dev eth0 proto kernel scope link\n");
        assert(detect_lan_subnet(runner, config) == "192.168.1.0/24");

        runner.respond({"ip", "route"}, 1, "");
        assert(detect_lan_subnet(runner, config) == config.lan_subnet);
    }

    // No packet filter installed: nothing happens
    {
        Config config;
        FakeRunner runner;
        FirewallEngine engine(config, runner);
        FirewallReport report = engine.apply(stack());
        assert(report.backend.empty() && report.added == 0);
        assert(!select_backend(runner));
    }

    // ufw only counts when active
    {
        FakeRunner runner;
        runner.install("ufw");
        runner.respond({"ufw", "status"}, 0, "Status: inactive\n");
        assert(!UfwBackend::available(runner));
        runner.install("iptables");
        auto backend = select_backend(runner);
        assert(backend && backend->name() == "iptables");

        runner.respond({"ufw", "status"}, 0,
                       "Status: active\n\n"
                       "To                         Action      From\n"
                       "--                         ------      ----\n"
                       "3000/tcp                   ALLOW       192.168.1.0/24\n"
                       "51820/udp                  ALLOW       Anywhere\n");
        backend = select_backend(runner);
        assert(backend && backend->name() == "ufw");

        FirewallRule lan{"grafana", "3000", "tcp", SubnetClass::Lan, "192.168.1.0/24",
                         RuleAction::Allow};
        FirewallRule vpn{"grafana", "3000", "tcp", SubnetClass::Vpn, "10.8.0.0/24",
                         RuleAction::Allow};
        FirewallRule open{"wireguard", "51820", "udp", SubnetClass::Open, "", RuleAction::Allow};
        assert(backend->rule_exists(lan));
        assert(!backend->rule_exists(vpn));
        assert(backend->rule_exists(open));

        assert(backend->add_rule(vpn));
        assert(runner.called({"ufw", "allow", "from", "10.8.0.0/24", "to", "any", "port", "3000",
                              "proto", "tcp"}));
        backend->revoke_open("3000", "tcp");
        assert(runner.called({"ufw", "--force", "delete", "allow", "3000/tcp"}));
    }

    // iptables rule shapes and the existence check
    {
        FakeRunner runner;
        runner.install("iptables");
        IptablesBackend backend(runner);
        FirewallRule lan{"grafana", "3000", "tcp", SubnetClass::Lan, "192.168.1.0/24",
                         RuleAction::Allow};
        FirewallRule deny{"grafana", "3000", "tcp", SubnetClass::Open, "", RuleAction::Deny};

        auto spec = IptablesBackend::rule_spec(lan);
        assert((spec == std::vector<std::string>{"INPUT", "-p", "tcp", "-s", "192.168.1.0/24",
                                                 "--dport", "3000", "-j", "ACCEPT"}));
        assert(IptablesBackend::rule_spec(deny).back() == "DROP");

        runner.respond({"iptables", "-C"}, 1, "Bad rule");
        assert(!backend.rule_exists(lan));
        assert(backend.add_rule(lan));
        assert(runner.called({"iptables", "-A", "INPUT", "-p", "tcp", "-s"}));

        runner.install("iptables-save");
        runner.set_dry_run(true);
        assert(backend.persist());
    }

    return 0;
}

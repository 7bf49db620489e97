// core/synthesizer.hpp - Descriptor to container-launch command
#pragma once

#include "../conf/config.hpp"
#include "../conf/descriptor.hpp"
#include <string>
#include <vector>

namespace clinic {

struct ResolvedCommand {
  std::string service;
  std::string image;
  // Arguments following the docker program name
  std::vector<std::string> args;

  std::vector<std::string> argv() const;
  std::string to_string() const;
};

// host_port is the left side used for binding and firewalling.
struct PortSpec {
  std::string host_ip;
  std::string host_port;
  std::string container_port;
  std::string protocol = "tcp";
};

// Accepts N, N/proto, H:C, H:C/proto, IP:H:C[/proto] and N-M ranges.
bool parse_port_spec(const std::string &item, PortSpec &spec);

// host_path:/container_path shape, rooted at / or a $VAR. URLs do not count.
bool is_volume_shaped(const std::string &value);

// Effective port list for a service: the snapshot override wins.
std::vector<std::string> service_port_items(const ServiceDescriptor &desc,
                                            const Config &config);

class CommandSynthesizer {
public:
  explicit CommandSynthesizer(const Config &config);

  // Throws std::runtime_error when the descriptor fails validation.
  ResolvedCommand synthesize(const ServiceDescriptor &desc) const;

private:
  struct Context {
    const ServiceDescriptor &desc;
    VarMap vars;
    bool domain_routing = false;
    bool ports_done = false;
    bool discovery = false;
    std::vector<std::string> args;
    std::vector<std::string> trailing;
    std::string image;
  };

  void handle_option(Context &ctx, const std::string &key,
                     const std::string &value) const;
  void add_ports(Context &ctx, const std::vector<std::string> &items) const;
  void add_env(Context &ctx, const std::string &value) const;
  void add_labels(Context &ctx, const std::string &value) const;
  void add_domain_routing(Context &ctx) const;
  void add_discovery(Context &ctx) const;

  const Config &config_;
};

} // namespace clinic

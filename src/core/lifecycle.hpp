// core/lifecycle.hpp - Service lifecycle controller
#pragma once

#include "../conf/config.hpp"
#include "../conf/descriptor.hpp"
#include "runtime.hpp"
#include <map>
#include <string>
#include <vector>

namespace clinic {

struct ServiceStatus {
  std::string name;
  bool exists = false;
  bool running = false;
  std::string health;
};

class LifecycleController {
public:
  LifecycleController(const Config &config, ContainerRuntime &runtime);

  // Starts services in order. Descriptors that fail validation are skipped;
  // a failed launch aborts the pass and returns false.
  bool up(const std::vector<ServiceDescriptor> &services);
  bool down(const std::vector<ServiceDescriptor> &services,
            bool remove_network);

  // Full replace protocol for one service: stop, remove, check the port,
  // ensure the network, run, post-start hook.
  bool start_service(const ServiceDescriptor &desc);

  // Single-service operations. A missing container is reported, not an error.
  bool stop_service(const std::string &name);
  bool restart_service(const std::string &name);
  bool remove_service(const std::string &name);
  ServiceStatus status(const std::string &name);

  // Address of each running service on the shared network, keyed by
  // service name, for the desired-state snapshot.
  std::map<std::string, std::string>
  container_ips(const std::vector<ServiceDescriptor> &services);

  // Host port the service binds, "" when none is declared.
  static std::string conflict_port(const ServiceDescriptor &desc,
                                   const Config &config,
                                   std::string &protocol);

private:
  bool start_systemd(const ServiceDescriptor &desc);
  void clear_existing(const std::string &name);
  void warn_port_conflict(const ServiceDescriptor &desc);
  void run_post_start_hook(const ServiceDescriptor &desc);

  const Config &config_;
  ContainerRuntime &runtime_;
};

} // namespace clinic

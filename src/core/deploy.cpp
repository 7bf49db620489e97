// core/deploy.cpp - Full bring-up pass
#include "deploy.hpp"
#include "../utils.hpp"
#include "firewall.hpp"
#include "lifecycle.hpp"
#include "state.hpp"

namespace clinic {

bool save_desired_state(const Config &config) {
  if (config.dry_run) {
    LOG_INFO("[dry-run] desired state not written");
    return true;
  }
  return DesiredStateSnapshot::capture(config).save(config.state_file());
}

bool deploy_stack(Config &config, ContainerRuntime &runtime,
                  const std::vector<ServiceDescriptor> &services) {
  LifecycleController lifecycle(config, runtime);
  if (!lifecycle.up(services)) {
    LOG_ERROR("Bring-up aborted; firewall and desired state left unchanged");
    return false;
  }

  FirewallEngine firewall(config, runtime.runner());
  firewall.apply(services);

  for (const auto &[name, ip] : lifecycle.container_ips(services)) {
    config.container_ips[service_env_key(name)] = ip;
  }
  return save_desired_state(config);
}

} // namespace clinic

// core/deploy.hpp - Full bring-up pass
#pragma once

#include "../conf/config.hpp"
#include "../conf/descriptor.hpp"
#include "runtime.hpp"
#include <vector>

namespace clinic {

// Launches the services, then applies the firewall and records container
// addresses in the desired-state snapshot at config.state_file(). A failed
// launch aborts the pass before the firewall and the snapshot are touched.
bool deploy_stack(Config &config, ContainerRuntime &runtime,
                  const std::vector<ServiceDescriptor> &services);

// Writes the snapshot unless running dry.
bool save_desired_state(const Config &config);

} // namespace clinic

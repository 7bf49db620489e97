// core/lifecycle.cpp - Lifecycle controller implementation
#include "lifecycle.hpp"
#include "../utils.hpp"
#include "synthesizer.hpp"

namespace clinic {

LifecycleController::LifecycleController(const Config &config,
                                         ContainerRuntime &runtime)
    : config_(config), runtime_(runtime) {}

bool LifecycleController::up(const std::vector<ServiceDescriptor> &services) {
  if (services.empty()) {
    LOG_WARN("No services selected, nothing to start");
    return true;
  }

  int started = 0;
  int skipped = 0;
  for (const auto &desc : services) {
    std::string error;
    if (!validate_descriptor(desc, error)) {
      LOG_ERROR("Skipping " + desc.name + ": " + error);
      ++skipped;
      continue;
    }

    if (!start_service(desc)) {
      LOG_ERROR("Failed to start " + desc.name + ", aborting this pass");
      return false;
    }
    ++started;
  }

  LOG_INFO("Started " + std::to_string(started) + " service(s)" +
           (skipped ? ", skipped " + std::to_string(skipped) : ""));
  return true;
}

bool LifecycleController::down(const std::vector<ServiceDescriptor> &services,
                               bool remove_network) {
  bool ok = true;
  for (const auto &desc : services) {
    if (desc.is_systemd()) {
      CommandResult r =
          runtime_.runner().mutate({"systemctl", "stop", desc.name});
      if (!r.ok()) {
        LOG_WARN("systemctl stop " + desc.name + " failed: " + trim(r.output));
        ok = false;
      }
      continue;
    }
    if (!remove_service(desc.name)) {
      ok = false;
    }
  }

  if (remove_network && !runtime_.remove_network(config_.docker_network_name)) {
    ok = false;
  }
  return ok;
}

bool LifecycleController::start_service(const ServiceDescriptor &desc) {
  if (desc.is_systemd()) {
    return start_systemd(desc);
  }

  ResolvedCommand cmd;
  try {
    cmd = CommandSynthesizer(config_).synthesize(desc);
  } catch (const std::exception &e) {
    LOG_ERROR(desc.name + ": " + e.what());
    return false;
  }

  clear_existing(desc.name);
  warn_port_conflict(desc);

  bool own_network =
      desc.has("network_mode") || desc.has("network") || desc.has("net");
  if (!own_network && !runtime_.ensure_network(config_.docker_network_name,
                                               config_.docker_network_subnet)) {
    return false;
  }

  LOG_INFO("Starting " + desc.name + " (" + cmd.image + ")");
  LOG_DEBUG(cmd.to_string());
  if (!runtime_.run(cmd.args)) {
    return false;
  }

  run_post_start_hook(desc);
  return true;
}

bool LifecycleController::start_systemd(const ServiceDescriptor &desc) {
  CommandRunner &runner = runtime_.runner();
  LOG_INFO("Starting systemd unit " + desc.name);

  CommandResult r = runner.mutate({"systemctl", "enable", desc.name});
  if (!r.ok()) {
    LOG_WARN("systemctl enable " + desc.name + " failed: " + trim(r.output));
  }
  r = runner.mutate({"systemctl", "start", desc.name});
  if (!r.ok()) {
    LOG_ERROR("systemctl start " + desc.name + " failed: " + trim(r.output));
    return false;
  }
  if (runner.dry_run()) {
    return true;
  }
  r = runner.run({"systemctl", "is-active", desc.name});
  if (!r.ok()) {
    LOG_ERROR(desc.name + " is not active after start: " + trim(r.output));
    return false;
  }
  run_post_start_hook(desc);
  return true;
}

void LifecycleController::clear_existing(const std::string &name) {
  if (!runtime_.exists(name)) {
    return;
  }
  if (runtime_.is_running(name)) {
    LOG_INFO("Stopping existing " + name);
    runtime_.stop(name);
  }
  runtime_.remove(name);
}

std::string LifecycleController::conflict_port(const ServiceDescriptor &desc,
                                               const Config &config,
                                               std::string &protocol) {
  protocol = "tcp";
  std::string declared = trim(desc.get("conflict_port"));
  if (!declared.empty()) {
    PortSpec spec;
    if (parse_port_spec(declared, spec)) {
      protocol = spec.protocol;
      return spec.host_port;
    }
    return "";
  }

  for (const auto &item : service_port_items(desc, config)) {
    PortSpec spec;
    if (parse_port_spec(item, spec)) {
      protocol = spec.protocol;
      return spec.host_port;
    }
  }
  return "";
}

void LifecycleController::warn_port_conflict(const ServiceDescriptor &desc) {
  std::string protocol;
  std::string port = conflict_port(desc, config_, protocol);
  if (port.empty()) {
    return;
  }

  CommandRunner &runner = runtime_.runner();
  if (!runner.program_exists("ss")) {
    LOG_DEBUG("ss not available, skipping port check for " + desc.name);
    return;
  }

  CommandResult r =
      runner.run({"ss", protocol == "udp" ? "-lun" : "-ltn"});
  if (!r.ok()) {
    return;
  }

  for (const auto &line : split(r.output, '\n')) {
    auto cols = split_whitespace(line);
    if (cols.size() < 4)
      continue;
    const std::string &local = cols[3];
    std::string suffix = ":" + port;
    if (local.size() > suffix.size() &&
        local.compare(local.size() - suffix.size(), suffix.size(), suffix) ==
            0) {
      LOG_WARN("Port " + port + "/" + protocol + " is in use (" + local +
               "). " + desc.name + " may fail to start.");
      return;
    }
  }
}

void LifecycleController::run_post_start_hook(const ServiceDescriptor &desc) {
  std::string hook = trim(desc.value("post_start_hook", config_.variables()));
  if (hook.empty()) {
    return;
  }

  LOG_INFO("Executing post-start hook for " + desc.name + ": " + hook);
  CommandResult r = runtime_.runner().mutate({"sh", "-c", hook});
  if (!r.ok()) {
    LOG_WARN("Post-start hook for " + desc.name + " failed (" +
             std::to_string(r.exit_code) + "), service is running: " +
             trim(r.output));
  }
}

bool LifecycleController::stop_service(const std::string &name) {
  if (!runtime_.exists(name)) {
    LOG_WARN(name + " does not exist");
    return true;
  }
  if (!runtime_.is_running(name)) {
    LOG_INFO(name + " is already stopped");
    return true;
  }
  return runtime_.stop(name);
}

bool LifecycleController::restart_service(const std::string &name) {
  if (!runtime_.exists(name)) {
    LOG_WARN(name + " does not exist, nothing to restart");
    return true;
  }
  return runtime_.restart(name);
}

bool LifecycleController::remove_service(const std::string &name) {
  if (!runtime_.exists(name)) {
    LOG_DEBUG(name + " already absent");
    return true;
  }
  if (runtime_.is_running(name) && !runtime_.stop(name)) {
    LOG_WARN("Could not stop " + name + ", forcing removal");
  }
  return runtime_.remove(name);
}

ServiceStatus LifecycleController::status(const std::string &name) {
  ServiceStatus st;
  st.name = name;
  st.health = runtime_.health(name);
  st.exists = st.health != HEALTH_MISSING;
  st.running = st.exists && runtime_.is_running(name);
  return st;
}

std::map<std::string, std::string> LifecycleController::container_ips(
    const std::vector<ServiceDescriptor> &services) {
  std::map<std::string, std::string> ips;
  for (const auto &desc : services) {
    if (desc.is_systemd())
      continue;
    std::string ip =
        runtime_.container_ip(desc.name, config_.docker_network_name);
    if (!ip.empty()) {
      ips[desc.name] = ip;
    }
  }
  return ips;
}

} // namespace clinic

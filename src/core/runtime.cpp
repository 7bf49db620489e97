// core/runtime.cpp - docker CLI operations
#include "runtime.hpp"
#include "../defs.hpp"

namespace clinic {

void ContainerRuntime::check_available() {
  if (!runner_.program_exists("docker")) {
    throw ExitError(EXIT_RUNTIME_MISSING,
                    "docker is not installed. Install Docker Engine and "
                    "re-run.");
  }
  CommandResult info = runner_.run({"docker", "info", "--format",
                                    "{{.ServerVersion}}"});
  if (!info.ok()) {
    throw ExitError(EXIT_DAEMON_DOWN,
                    "Docker daemon is not reachable. Start it with "
                    "'systemctl start docker' and check group membership: " +
                        trim(info.output));
  }
  LOG_DEBUG("Docker server " + trim(info.output));
}

CommandResult ContainerRuntime::inspect(const std::string &name,
                                        const std::string &format) {
  return runner_.run({"docker", "inspect", "-f", format, name});
}

bool ContainerRuntime::exists(const std::string &name) {
  return inspect(name, "{{.Name}}").ok();
}

bool ContainerRuntime::is_running(const std::string &name) {
  CommandResult r = inspect(name, "{{.State.Running}}");
  return r.ok() && trim(r.output) == "true";
}

std::string ContainerRuntime::health(const std::string &name) {
  CommandResult r = inspect(
      name, "{{if .State.Health}}{{.State.Health.Status}}{{else}}"
            "{{.State.Status}}{{end}}");
  if (!r.ok()) {
    return HEALTH_MISSING;
  }
  std::string value = trim(r.output);
  return value.empty() ? HEALTH_MISSING : value;
}

std::string ContainerRuntime::status(const std::string &name) {
  CommandResult r = inspect(name, "{{.State.Status}}");
  return r.ok() ? trim(r.output) : HEALTH_MISSING;
}

std::string ContainerRuntime::container_ip(const std::string &name,
                                           const std::string &network) {
  CommandResult r = inspect(name, "{{with index .NetworkSettings.Networks \"" +
                                      network + "\"}}{{.IPAddress}}{{end}}");
  return r.ok() ? trim(r.output) : "";
}

std::vector<std::string> ContainerRuntime::list_running() {
  CommandResult r = runner_.run({"docker", "ps", "--format", "{{.Names}}"});
  if (!r.ok()) {
    LOG_WARN("docker ps failed: " + trim(r.output));
    return {};
  }
  return split(r.output, '\n');
}

bool ContainerRuntime::run(const std::vector<std::string> &args) {
  std::vector<std::string> argv = {"docker"};
  argv.insert(argv.end(), args.begin(), args.end());
  CommandResult r = runner_.mutate(argv);
  if (!r.ok()) {
    LOG_ERROR("docker run failed (" + std::to_string(r.exit_code) +
              "): " + trim(r.output));
    return false;
  }
  return true;
}

bool ContainerRuntime::stop(const std::string &name) {
  CommandResult r = runner_.mutate({"docker", "stop", name});
  if (!r.ok()) {
    LOG_WARN("docker stop " + name + " failed: " + trim(r.output));
  }
  return r.ok();
}

bool ContainerRuntime::remove(const std::string &name) {
  CommandResult r = runner_.mutate({"docker", "rm", "-f", name});
  if (!r.ok()) {
    LOG_WARN("docker rm " + name + " failed: " + trim(r.output));
  }
  return r.ok();
}

bool ContainerRuntime::restart(const std::string &name) {
  CommandResult r = runner_.mutate({"docker", "restart", name});
  if (!r.ok()) {
    LOG_WARN("docker restart " + name + " failed: " + trim(r.output));
  }
  return r.ok();
}

bool ContainerRuntime::start(const std::string &name) {
  CommandResult r = runner_.mutate({"docker", "start", name});
  if (!r.ok()) {
    LOG_WARN("docker start " + name + " failed: " + trim(r.output));
  }
  return r.ok();
}

bool ContainerRuntime::ensure_network(const std::string &name,
                                      const std::string &subnet) {
  if (runner_.run({"docker", "network", "inspect", name}).ok()) {
    return true;
  }

  LOG_INFO("Creating docker network " + name + " (" + subnet + ")");
  CommandResult r =
      runner_.mutate({"docker", "network", "create", "--subnet", subnet, name});
  if (!r.ok()) {
    LOG_ERROR("Failed to create network " + name + ": " + trim(r.output));
    return false;
  }
  return true;
}

bool ContainerRuntime::remove_network(const std::string &name) {
  if (!runner_.run({"docker", "network", "inspect", name}).ok()) {
    LOG_DEBUG("Network " + name + " already absent");
    return true;
  }
  CommandResult r = runner_.mutate({"docker", "network", "rm", name});
  if (!r.ok()) {
    LOG_WARN("Failed to remove network " + name + ": " + trim(r.output));
  }
  return r.ok();
}

} // namespace clinic

// core/runtime.hpp - Container runtime facade over the docker CLI
#pragma once

#include "../utils.hpp"
#include <string>
#include <vector>

namespace clinic {

// Health as reported by the runtime: healthy, unhealthy, starting, or the
// plain state (running, exited, ...) for containers without a health check.
// "missing" when no container of that name exists.
constexpr const char *HEALTH_MISSING = "missing";

class ContainerRuntime {
public:
  explicit ContainerRuntime(CommandRunner &runner) : runner_(runner) {}

  // Throws ExitError when the binary is absent or the daemon is down.
  void check_available();

  bool exists(const std::string &name);
  bool is_running(const std::string &name);
  std::string health(const std::string &name);
  std::string status(const std::string &name);
  std::string container_ip(const std::string &name,
                           const std::string &network);
  std::vector<std::string> list_running();

  bool run(const std::vector<std::string> &args);
  bool stop(const std::string &name);
  bool remove(const std::string &name);
  bool restart(const std::string &name);
  bool start(const std::string &name);

  bool ensure_network(const std::string &name, const std::string &subnet);
  bool remove_network(const std::string &name);

  CommandRunner &runner() { return runner_; }

private:
  CommandResult inspect(const std::string &name, const std::string &format);

  CommandRunner &runner_;
};

} // namespace clinic

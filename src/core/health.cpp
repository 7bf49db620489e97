// core/health.cpp - Diagnostics and auto-repair implementation
#include "health.hpp"
#include "../utils.hpp"
#include <algorithm>
#include <chrono>
#include <set>
#include <thread>

namespace clinic {

json::Value DiagnosticsReport::to_json() const {
  json::Value root = json::Value::object();
  root["source"] = json::Value(source);
  root["timestamp"] = json::Value(timestamp);
  root["status"] = json::Value(passed() ? "PASS" : "FAIL");
  json::Value list = json::Value::array();
  for (const auto &f : failures) {
    list.push_back(json::Value(f));
  }
  root["failures"] = list;
  return root;
}

Diagnostics::Diagnostics(const Config &config, ContainerRuntime &runtime)
    : config_(config), runtime_(runtime) {}

DiagnosticsReport
Diagnostics::run(const std::vector<ServiceDescriptor> &services) {
  DiagnosticsReport report;
  report.timestamp = iso_timestamp();

  check_services(services, report);
  check_dns(report);

  bool vpn_selected =
      std::any_of(services.begin(), services.end(),
                  [this](const ServiceDescriptor &d) {
                    return d.name == config_.vpn_service;
                  });
  if (vpn_selected) {
    check_vpn_port(report);
  }

  if (report.passed()) {
    LOG_INFO("Diagnostics passed for " + std::to_string(services.size()) +
             " service(s)");
  } else {
    for (const auto &f : report.failures) {
      LOG_WARN("Diagnostics: " + f);
    }
  }
  return report;
}

void Diagnostics::check_services(
    const std::vector<ServiceDescriptor> &services, DiagnosticsReport &report) {
  CommandRunner &runner = runtime_.runner();
  for (const auto &desc : services) {
    bool running;
    if (desc.is_systemd()) {
      running = runner.run({"systemctl", "is-active", desc.name}).ok();
    } else {
      running = runtime_.is_running(desc.name);
    }
    if (!running) {
      report.failures.push_back(desc.name + " service is not running");
    }
  }
}

void Diagnostics::check_dns(DiagnosticsReport &report) {
  CommandRunner &runner = runtime_.runner();
  if (!runner.program_exists("dig")) {
    LOG_DEBUG("dig not installed, DNS check skipped");
    return;
  }
  CommandResult r = runner.run({"dig", "+short", "+time=2", "+tries=1",
                                "@" + config_.wg_client_dns, "example.com"});
  if (!r.ok() || trim(r.output).empty()) {
    report.failures.push_back("DNS resolution failed via " +
                              config_.wg_client_dns);
  }
}

void Diagnostics::check_vpn_port(DiagnosticsReport &report) {
  CommandRunner &runner = runtime_.runner();
  if (!runner.program_exists("ss")) {
    LOG_DEBUG("ss not installed, WireGuard port check skipped");
    return;
  }
  CommandResult r = runner.run({"ss", "-lun"});
  std::string suffix = ":" + std::to_string(config_.wg_port);
  bool listening = false;
  for (const auto &line : split(r.output, '\n')) {
    auto cols = split_whitespace(line);
    if (cols.size() >= 4) {
      const std::string &local = cols[3];
      if (local.size() > suffix.size() &&
          local.compare(local.size() - suffix.size(), suffix.size(),
                        suffix) == 0) {
        listening = true;
        break;
      }
    }
  }
  if (!listening) {
    report.failures.push_back("WireGuard port " +
                              std::to_string(config_.wg_port) +
                              " not listening");
  }
}

bool Diagnostics::write_report(const DiagnosticsReport &report,
                               const fs::path &path) {
  if (!write_file_atomic(path, json::dump(report.to_json(), 2) + "\n")) {
    LOG_ERROR("Cannot write diagnostics report " + path.string());
    return false;
  }
  LOG_DEBUG("Diagnostics report written to " + path.string());
  return true;
}

LoadedReport load_report(const fs::path &path) {
  LoadedReport loaded;
  if (!fs::exists(path)) {
    loaded.status = ReportStatus::Missing;
    loaded.error = "Diagnostics report not found: " + path.string();
    return loaded;
  }

  std::string text = read_file(path);
  if (trim(text).empty()) {
    LOG_INFO("Diagnostics report is empty, nothing to repair");
    return loaded;
  }

  json::Value root;
  try {
    root = json::parse(text);
  } catch (const json::ParseError &e) {
    loaded.status = ReportStatus::Invalid;
    loaded.error = path.string() + ": " + e.what();
    return loaded;
  }

  const json::Value *failures = root.find("failures");
  if (failures == nullptr || !failures->is_array()) {
    LOG_WARN("Diagnostics report has no failures array, nothing to repair");
    return loaded;
  }
  for (const auto &item : failures->items()) {
    if (item.is_string()) {
      loaded.failures.push_back(item.as_string());
    } else {
      LOG_WARN("Ignoring non-string entry in diagnostics failures");
    }
  }
  return loaded;
}

SubstringClassifier::SubstringClassifier(std::vector<std::string> services)
    : services_(std::move(services)) {}

std::string SubstringClassifier::classify(const std::string &failure) const {
  std::string text = to_lower(failure);
  std::string best;
  size_t best_pos = std::string::npos;

  for (const auto &service : services_) {
    if (service.empty())
      continue;
    size_t pos = text.find(to_lower(service));
    if (pos == std::string::npos)
      continue;

    bool better = best.empty() || service.size() > best.size() ||
                  (service.size() == best.size() &&
                   (pos < best_pos || (pos == best_pos && service < best)));
    if (better) {
      best = service;
      best_pos = pos;
    }
  }
  return best;
}

static void sleep_seconds(int seconds) {
  std::this_thread::sleep_for(std::chrono::seconds(seconds));
}

AutoRepair::AutoRepair(const Config &config, ContainerRuntime &runtime,
                       const FailureClassifier &classifier)
    : AutoRepair(config, runtime, classifier, sleep_seconds) {}

AutoRepair::AutoRepair(const Config &config, ContainerRuntime &runtime,
                       const FailureClassifier &classifier, Sleeper sleeper)
    : config_(config), runtime_(runtime), classifier_(classifier),
      sleeper_(std::move(sleeper)) {}

RepairSummary AutoRepair::repair(const std::vector<std::string> &failures) {
  RepairSummary summary;
  std::vector<std::string> targets;
  std::set<std::string> seen;

  for (const auto &failure : failures) {
    std::string service = classifier_.classify(failure);
    if (service.empty()) {
      LOG_DEBUG("No service matches failure: " + failure);
      summary.unclassified.push_back(failure);
      continue;
    }
    if (seen.insert(service).second) {
      targets.push_back(service);
    }
  }

  for (const auto &service : targets) {
    std::string health = runtime_.health(service);
    if (health == "healthy" || health == "starting" || health == "running") {
      LOG_INFO(service + " is " + health + ", no restart needed");
      summary.skipped.push_back(service);
      continue;
    }
    if (health == HEALTH_MISSING) {
      LOG_WARN(service + " container is missing; not creating it");
      summary.skipped.push_back(service);
      continue;
    }

    LOG_WARN(service + " is " + health + ", attempting restart");
    if (restart_with_retry(service)) {
      summary.restarted.push_back(service);
    } else {
      summary.failed.push_back(service);
    }
  }
  return summary;
}

bool AutoRepair::restart_with_retry(const std::string &service) {
  int max_attempts = std::max(1, config_.repair_max_attempts);
  for (int attempt = 1; attempt <= max_attempts; ++attempt) {
    if (runtime_.restart(service)) {
      LOG_INFO("Restarted " + service + " (attempt " +
               std::to_string(attempt) + ")");
      return true;
    }
    if (attempt < max_attempts) {
      int delay = config_.repair_retry_delay * attempt;
      LOG_DEBUG("Retrying " + service + " in " + std::to_string(delay) + "s");
      sleeper_(delay);
    }
  }
  LOG_WARN("Failed to restart " + service + " after " +
           std::to_string(max_attempts) + " attempt(s)");
  return false;
}

} // namespace clinic

// core/health.hpp - Diagnostics and auto-repair
#pragma once

#include "../conf/config.hpp"
#include "../conf/descriptor.hpp"
#include "json.hpp"
#include "runtime.hpp"
#include <functional>
#include <string>
#include <vector>

namespace clinic {

struct DiagnosticsReport {
  std::string source = "clinicd";
  std::string timestamp;
  std::vector<std::string> failures;

  bool passed() const { return failures.empty(); }
  json::Value to_json() const;
};

// Runs the health checks and produces the failure list.
class Diagnostics {
public:
  Diagnostics(const Config &config, ContainerRuntime &runtime);

  DiagnosticsReport run(const std::vector<ServiceDescriptor> &services);
  bool write_report(const DiagnosticsReport &report, const fs::path &path);

private:
  void check_services(const std::vector<ServiceDescriptor> &services,
                      DiagnosticsReport &report);
  void check_dns(DiagnosticsReport &report);
  void check_vpn_port(DiagnosticsReport &report);

  const Config &config_;
  ContainerRuntime &runtime_;
};

enum class ReportStatus { Ok, Missing, Invalid };

struct LoadedReport {
  ReportStatus status = ReportStatus::Ok;
  std::vector<std::string> failures;
  std::string error;
};

// Empty files and reports without a usable failures array load as Ok
// with no failures.
LoadedReport load_report(const fs::path &path);

// Maps a free-text failure to the service it is about.
class FailureClassifier {
public:
  virtual ~FailureClassifier() = default;
  // Empty when the failure names no known service.
  virtual std::string classify(const std::string &failure) const = 0;
};

// Case-insensitive substring match against known service names. When
// several names occur, the longest wins, then the earliest occurrence,
// then the lexicographically smallest name.
class SubstringClassifier : public FailureClassifier {
public:
  explicit SubstringClassifier(std::vector<std::string> services);
  std::string classify(const std::string &failure) const override;

private:
  std::vector<std::string> services_;
};

struct RepairSummary {
  std::vector<std::string> restarted;
  std::vector<std::string> failed;
  std::vector<std::string> skipped;
  std::vector<std::string> unclassified;
};

class AutoRepair {
public:
  using Sleeper = std::function<void(int seconds)>;

  AutoRepair(const Config &config, ContainerRuntime &runtime,
             const FailureClassifier &classifier);
  AutoRepair(const Config &config, ContainerRuntime &runtime,
             const FailureClassifier &classifier, Sleeper sleeper);

  // One restart sequence per classified service needing repair.
  RepairSummary repair(const std::vector<std::string> &failures);

  // Up to repair_max_attempts restarts, waiting delay * attempt between
  // them. Exhaustion is logged as a warning.
  bool restart_with_retry(const std::string &service);

private:
  const Config &config_;
  ContainerRuntime &runtime_;
  const FailureClassifier &classifier_;
  Sleeper sleeper_;
};

} // namespace clinic

// conf/descriptor.hpp - Per-service descriptor loading and validation
#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace clinic {

struct Config;

using VarMap = std::map<std::string, std::string>;

struct ServiceDescriptor {
  std::string name;
  fs::path path;
  // Declaration order. A repeated key keeps its first position and takes
  // the last value.
  std::vector<std::pair<std::string, std::string>> options;

  bool has(const std::string &key) const;
  std::string get(const std::string &key,
                  const std::string &fallback = "") const;
  void set(const std::string &key, const std::string &value);

  // Value with ${VAR} references expanded, except volume-shaped values.
  std::string value(const std::string &key, const VarMap &vars) const;

  bool is_systemd() const;

  static ServiceDescriptor parse(const std::string &name,
                                 const std::string &text);
};

// Expands $VAR and ${VAR} from vars, then the process environment.
// Unset variables expand to the empty string.
std::string expand_vars(const std::string &value, const VarMap &vars);

// Throws std::runtime_error when the file is unreadable or lacks image.
ServiceDescriptor load_descriptor(const fs::path &path);
bool validate_descriptor(const ServiceDescriptor &desc, std::string &error);

// services_dir/<svc>.conf and services_dir/<svc>/<svc>.conf, sorted by name.
std::vector<fs::path> discover_descriptors(const fs::path &services_dir);

// Loads every selected descriptor. Invalid ones are logged and skipped.
std::vector<ServiceDescriptor> load_selected_descriptors(const Config &config);

} // namespace clinic

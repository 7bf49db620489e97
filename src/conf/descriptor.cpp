// conf/descriptor.cpp - Descriptor implementation
#include "descriptor.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include "config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>

namespace clinic {

bool ServiceDescriptor::has(const std::string &key) const {
  for (const auto &opt : options) {
    if (opt.first == key)
      return true;
  }
  return false;
}

std::string ServiceDescriptor::get(const std::string &key,
                                   const std::string &fallback) const {
  for (const auto &opt : options) {
    if (opt.first == key)
      return opt.second;
  }
  return fallback;
}

void ServiceDescriptor::set(const std::string &key, const std::string &value) {
  for (auto &opt : options) {
    if (opt.first == key) {
      opt.second = value;
      return;
    }
  }
  options.emplace_back(key, value);
}

std::string ServiceDescriptor::value(const std::string &key,
                                     const VarMap &vars) const {
  std::string v = get(key);
  if (!contains(v, "$"))
    return v;
  // Host:container mount specs are left for the volume handler
  if (key == "volumes" && contains(v, ":") && contains(v, "/"))
    return v;
  return expand_vars(v, vars);
}

bool ServiceDescriptor::is_systemd() const {
  return to_lower(get("service_type")) == "systemd";
}

ServiceDescriptor ServiceDescriptor::parse(const std::string &name,
                                           const std::string &text) {
  ServiceDescriptor desc;
  desc.name = name;

  std::istringstream in(text);
  std::string line;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    std::string t = trim(line);
    if (t.empty() || t[0] == '#')
      continue;

    auto eq_pos = t.find('=');
    if (eq_pos == std::string::npos) {
      LOG_WARN(name + ": line " + std::to_string(line_no) +
               " has no '=', skipped");
      continue;
    }

    std::string key = trim(t.substr(0, eq_pos));
    std::string value = trim(t.substr(eq_pos + 1));
    if (key.empty()) {
      LOG_WARN(name + ": line " + std::to_string(line_no) +
               " has an empty key, skipped");
      continue;
    }
    if (desc.has(key)) {
      LOG_DEBUG(name + ": " + key + " declared twice, last value wins");
    }
    desc.set(key, value);
  }
  return desc;
}

static bool is_var_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

static std::string lookup_var(const std::string &name, const VarMap &vars) {
  auto it = vars.find(name);
  if (it != vars.end())
    return it->second;
  const char *env = std::getenv(name.c_str());
  return env ? env : "";
}

std::string expand_vars(const std::string &value, const VarMap &vars) {
  std::string out;
  size_t i = 0;
  while (i < value.size()) {
    char c = value[i];
    if (c != '$' || i + 1 >= value.size()) {
      out += c;
      ++i;
      continue;
    }

    if (value[i + 1] == '{') {
      auto close = value.find('}', i + 2);
      if (close == std::string::npos) {
        out += value.substr(i);
        break;
      }
      std::string inner = value.substr(i + 2, close - i - 2);
      // ${VAR:-default}
      auto dflt = inner.find(":-");
      std::string var = dflt == std::string::npos ? inner : inner.substr(0, dflt);
      std::string resolved = lookup_var(var, vars);
      if (resolved.empty() && dflt != std::string::npos)
        resolved = inner.substr(dflt + 2);
      out += resolved;
      i = close + 1;
    } else if (is_var_char(value[i + 1]) &&
               !std::isdigit(static_cast<unsigned char>(value[i + 1]))) {
      size_t j = i + 1;
      while (j < value.size() && is_var_char(value[j]))
        ++j;
      out += lookup_var(value.substr(i + 1, j - i - 1), vars);
      i = j;
    } else {
      out += c;
      ++i;
    }
  }
  return out;
}

bool validate_descriptor(const ServiceDescriptor &desc, std::string &error) {
  if (desc.name.empty()) {
    error = "descriptor has no service name";
    return false;
  }
  if (is_reserved_service_key(service_env_key(desc.name))) {
    error = "Service name '" + desc.name + "' collides with configuration key " +
            service_env_key(desc.name) + "_PORT; rename the descriptor";
    return false;
  }
  // Supervisor-managed units are not containers
  if (desc.is_systemd())
    return true;
  if (trim(desc.get("image")).empty()) {
    error = "Required field 'image' not found in " +
            (desc.path.empty() ? desc.name : desc.path.string());
    return false;
  }
  return true;
}

ServiceDescriptor load_descriptor(const fs::path &path) {
  if (!fs::is_regular_file(path)) {
    throw std::runtime_error("Descriptor not found: " + path.string());
  }

  ServiceDescriptor desc =
      ServiceDescriptor::parse(path.stem().string(), read_file(path));
  desc.path = path;

  std::string error;
  if (!validate_descriptor(desc, error)) {
    throw std::runtime_error(error);
  }
  return desc;
}

std::vector<fs::path> discover_descriptors(const fs::path &services_dir) {
  std::vector<fs::path> found;
  std::set<std::string> names;

  if (!fs::is_directory(services_dir)) {
    LOG_WARN("Services directory not found: " + services_dir.string());
    return found;
  }

  std::vector<fs::directory_entry> entries;
  try {
    for (const auto &entry : fs::directory_iterator(services_dir)) {
      entries.push_back(entry);
    }
  } catch (const fs::filesystem_error &e) {
    LOG_ERROR("Cannot scan " + services_dir.string() + ": " + e.what());
    return found;
  }
  std::sort(entries.begin(), entries.end(),
            [](const fs::directory_entry &a, const fs::directory_entry &b) {
              return a.path().filename() < b.path().filename();
            });

  // Flat descriptors take precedence over nested ones
  for (const auto &entry : entries) {
    if (entry.is_regular_file() &&
        entry.path().extension() == DESCRIPTOR_SUFFIX) {
      names.insert(entry.path().stem().string());
      found.push_back(entry.path());
    }
  }
  for (const auto &entry : entries) {
    if (!entry.is_directory())
      continue;
    std::string name = entry.path().filename().string();
    fs::path nested = entry.path() / (name + DESCRIPTOR_SUFFIX);
    if (!fs::is_regular_file(nested))
      continue;
    if (names.count(name)) {
      LOG_WARN("Both " + name + DESCRIPTOR_SUFFIX + " and " + nested.string() +
               " exist, using the flat file");
      continue;
    }
    names.insert(name);
    found.push_back(nested);
  }

  std::sort(found.begin(), found.end(),
            [](const fs::path &a, const fs::path &b) {
              return a.stem() < b.stem();
            });
  return found;
}

std::vector<ServiceDescriptor> load_selected_descriptors(const Config &config) {
  std::vector<ServiceDescriptor> result;
  std::set<std::string> seen;
  std::map<std::string, std::string> key_owner;

  for (const auto &path : discover_descriptors(config.services_dir())) {
    std::string name = path.stem().string();
    if (!config.is_selected(name))
      continue;
    // Snapshot keys must map back to exactly one service
    auto [owner, fresh] = key_owner.emplace(service_env_key(name), name);
    if (!fresh) {
      LOG_ERROR("Skipping " + name + ": snapshot key " + owner->first +
                " already belongs to " + owner->second);
      seen.insert(name);
      continue;
    }
    try {
      result.push_back(load_descriptor(path));
      seen.insert(name);
    } catch (const std::exception &e) {
      LOG_ERROR("Skipping " + name + ": " + e.what());
      seen.insert(name);
    }
  }

  for (const auto &name : config.selected_containers) {
    if (!seen.count(name)) {
      LOG_WARN("Selected service " + name + " has no descriptor in " +
               config.services_dir().string());
    }
  }
  return result;
}

} // namespace clinic

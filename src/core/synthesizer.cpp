// core/synthesizer.cpp - Command synthesis implementation
#include "synthesizer.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include "arg_map.hpp"
#include <algorithm>
#include <cctype>
#include <set>
#include <stdexcept>

namespace clinic {

std::vector<std::string> ResolvedCommand::argv() const {
  std::vector<std::string> out;
  out.reserve(args.size() + 1);
  out.push_back("docker");
  out.insert(out.end(), args.begin(), args.end());
  return out;
}

std::string ResolvedCommand::to_string() const {
  std::vector<std::string> quoted;
  for (const auto &arg : argv()) {
    quoted.push_back(shell_quote(arg));
  }
  return join(quoted, " ");
}

static bool is_port_number(const std::string &s) {
  if (!is_all_digits(s) || s.size() > 5)
    return false;
  int n = std::stoi(s);
  return n > 0 && n <= 65535;
}

static bool is_port_or_range(const std::string &s) {
  auto dash = s.find('-');
  if (dash == std::string::npos)
    return is_port_number(s);
  return is_port_number(s.substr(0, dash)) &&
         is_port_number(s.substr(dash + 1));
}

static std::vector<std::string> split_keep_empty(const std::string &s,
                                                 char delim) {
  std::vector<std::string> parts;
  size_t start = 0;
  while (true) {
    auto pos = s.find(delim, start);
    parts.push_back(s.substr(start, pos - start));
    if (pos == std::string::npos)
      break;
    start = pos + 1;
  }
  return parts;
}

bool parse_port_spec(const std::string &item, PortSpec &spec) {
  std::string base = trim(item);
  spec = PortSpec{};

  auto slash = base.rfind('/');
  if (slash != std::string::npos) {
    spec.protocol = to_lower(base.substr(slash + 1));
    base = base.substr(0, slash);
    if (spec.protocol != "tcp" && spec.protocol != "udp" &&
        spec.protocol != "sctp")
      return false;
  }

  auto parts = split_keep_empty(base, ':');
  if (parts.size() == 1) {
    spec.host_port = parts[0];
    spec.container_port = parts[0];
  } else if (parts.size() == 2) {
    spec.host_port = parts[0];
    spec.container_port = parts[1];
  } else if (parts.size() == 3 && !parts[0].empty()) {
    spec.host_ip = parts[0];
    spec.host_port = parts[1];
    spec.container_port = parts[2];
  } else {
    return false;
  }

  return is_port_or_range(spec.host_port) &&
         is_port_or_range(spec.container_port);
}

std::vector<std::string> service_port_items(const ServiceDescriptor &desc,
                                            const Config &config) {
  std::string raw = config.port_override(desc.name);
  if (raw.empty()) {
    raw = desc.has("port") ? desc.get("port") : desc.get("ports");
  }
  return split(raw, ',');
}

CommandSynthesizer::CommandSynthesizer(const Config &config)
    : config_(config) {}

ResolvedCommand CommandSynthesizer::synthesize(
    const ServiceDescriptor &desc) const {
  std::string error;
  if (!validate_descriptor(desc, error)) {
    throw std::runtime_error(error);
  }
  if (desc.is_systemd()) {
    throw std::runtime_error(desc.name +
                             " is a systemd unit, not a container");
  }

  Context ctx{desc, config_.variables()};
  ctx.domain_routing = trim(desc.get("domain_routing")) == "true";

  ctx.args = {"run", "-d", "--name", desc.name};
  bool own_network =
      desc.has("network_mode") || desc.has("network") || desc.has("net");
  if (!own_network) {
    ctx.args.push_back("--network");
    ctx.args.push_back(config_.docker_network_name);
  }
  if (!desc.has("restart") && !desc.has("restart_policy")) {
    ctx.args.push_back("--restart");
    ctx.args.push_back(DEFAULT_RESTART_POLICY);
  }
  std::string assigned_ip = config_.container_ip(desc.name);
  if (!assigned_ip.empty() && !own_network && !desc.has("static_ip") &&
      !desc.has("ip")) {
    ctx.args.push_back("--ip");
    ctx.args.push_back(assigned_ip);
  }

  for (const auto &[key, value] : desc.options) {
    handle_option(ctx, key, value);
  }

  // A snapshot port override applies even when the descriptor has no port
  if (!ctx.ports_done && !config_.port_override(desc.name).empty()) {
    add_ports(ctx, service_port_items(desc, config_));
  }
  if (ctx.discovery) {
    add_discovery(ctx);
  }

  ResolvedCommand cmd;
  cmd.service = desc.name;
  cmd.image = ctx.image;
  cmd.args = std::move(ctx.args);
  cmd.args.push_back(ctx.image);
  cmd.args.insert(cmd.args.end(), ctx.trailing.begin(), ctx.trailing.end());
  return cmd;
}

void CommandSynthesizer::handle_option(Context &ctx, const std::string &key,
                                       const std::string &raw) const {
  const ArgMapping mapping = lookup_mapping(key);
  const std::string flag = mapping.flag;
  const std::string &svc = ctx.desc.name;

  switch (mapping.kind) {
  case HandlerKind::Direct:
    ctx.image = ctx.desc.value(key, ctx.vars);
    break;

  case HandlerKind::Flag: {
    std::string value = ctx.desc.value(key, ctx.vars);
    if (value.empty()) {
      LOG_WARN(svc + ": empty value for " + key + ", skipped");
      break;
    }
    if (flag_keeps_commas(flag)) {
      ctx.args.push_back(flag);
      ctx.args.push_back(value);
      break;
    }
    for (const auto &item : split(value, ',')) {
      ctx.args.push_back(flag);
      ctx.args.push_back(item);
    }
    break;
  }

  case HandlerKind::BooleanFlag:
    if (trim(raw) == "true")
      ctx.args.push_back(flag);
    break;

  case HandlerKind::Port:
    if (!ctx.ports_done) {
      add_ports(ctx, service_port_items(ctx.desc, config_));
      ctx.ports_done = true;
    }
    break;

  case HandlerKind::Volume: {
    std::string value = contains(raw, "$") ? expand_vars(raw, ctx.vars) : raw;
    for (const auto &item : split(value, ',')) {
      ctx.args.push_back(flag);
      ctx.args.push_back(item);
    }
    break;
  }

  case HandlerKind::Env:
    add_env(ctx, raw);
    break;

  case HandlerKind::Label:
    add_labels(ctx, ctx.desc.value(key, ctx.vars));
    break;

  case HandlerKind::Vpn: {
    std::string mode = to_lower(trim(raw));
    if (mode.empty() || mode == "false" || mode == "no" || mode == "0")
      break;
    if (mode == "privileged") {
      ctx.args.insert(ctx.args.end(),
                      {"--privileged", "--device", "/dev/net/tun"});
    } else {
      // true/yes/1 and custom values share the tunnel capability set
      ctx.args.insert(ctx.args.end(),
                      {"--cap-add", "NET_ADMIN", "--device", "/dev/net/tun"});
    }
    break;
  }

  case HandlerKind::Privileged:
    if (trim(raw) == "true")
      ctx.args.push_back(flag);
    break;

  case HandlerKind::DependsOn:
    for (const auto &dep : split(raw, ',')) {
      ctx.args.push_back(flag);
      ctx.args.push_back(dep + ":" + dep);
    }
    break;

  case HandlerKind::Healthcheck: {
    std::string value = trim(raw);
    if (value.empty())
      break;
    ctx.args.push_back(flag);
    ctx.args.push_back(value);
    ctx.args.push_back(std::string("--health-interval=") +
                       DEFAULT_HEALTH_INTERVAL);
    ctx.args.push_back(std::string("--health-timeout=") +
                       DEFAULT_HEALTH_TIMEOUT);
    ctx.args.push_back(std::string("--health-retries=") +
                       DEFAULT_HEALTH_RETRIES);
    break;
  }

  case HandlerKind::ExtraArgs:
    for (const auto &token :
         split_whitespace(ctx.desc.value(key, ctx.vars))) {
      ctx.args.push_back(token);
    }
    break;

  case HandlerKind::Command:
    ctx.trailing = split_whitespace(ctx.desc.value(key, ctx.vars));
    break;

  case HandlerKind::DomainRouting:
    if (ctx.domain_routing)
      add_domain_routing(ctx);
    break;

  case HandlerKind::Discovery:
    ctx.discovery = trim(raw) == "true";
    break;

  case HandlerKind::Ignore:
    break;

  case HandlerKind::Unknown:
    LOG_WARN(svc + ": unknown option '" + key + "' ignored");
    break;
  }
}

void CommandSynthesizer::add_ports(Context &ctx,
                                   const std::vector<std::string> &items) const {
  for (const auto &item : items) {
    PortSpec spec;
    if (!parse_port_spec(item, spec)) {
      LOG_WARN(ctx.desc.name + ": invalid port '" + item + "', skipped");
      continue;
    }
    if (ctx.domain_routing &&
        (spec.host_port == "80" || spec.host_port == "443")) {
      LOG_INFO(ctx.desc.name + ": host port " + spec.host_port +
               " left to the reverse proxy");
      continue;
    }

    std::string mapped = trim(item);
    if (mapped.find(':') == std::string::npos) {
      mapped = spec.host_port + ":" + spec.container_port;
      if (contains(item, "/"))
        mapped += "/" + spec.protocol;
    }
    ctx.args.push_back("-p");
    ctx.args.push_back(mapped);
  }
}

static bool is_env_name(const std::string &s) {
  if (s.empty() || std::isdigit(static_cast<unsigned char>(s[0])))
    return false;
  return std::all_of(s.begin(), s.end(), [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
  });
}

bool is_volume_shaped(const std::string &value) {
  bool rooted = starts_with(value, "/") ||
                (starts_with(value, "$") && contains(value, "/"));
  if (!rooted)
    return false;
  for (size_t pos = value.find(":/"); pos != std::string::npos;
       pos = value.find(":/", pos + 1)) {
    if (value.compare(pos, 3, "://") != 0)
      return true;
  }
  return false;
}

void CommandSynthesizer::add_env(Context &ctx, const std::string &value) const {
  char delim = contains(value, ";") ? ';' : ',';
  for (const auto &item : split(value, delim)) {
    auto eq = item.find('=');
    if (eq == std::string::npos) {
      // Bare name: docker forwards the host's value
      if (!is_env_name(item)) {
        LOG_WARN(ctx.desc.name + ": environment entry '" + item +
                 "' is not a variable name, skipped");
        continue;
      }
      ctx.args.push_back("-e");
      ctx.args.push_back(item);
      continue;
    }
    std::string name = item.substr(0, eq);
    std::string val = item.substr(eq + 1);
    if (contains(val, "$") && !is_volume_shaped(val)) {
      val = expand_vars(val, ctx.vars);
    }
    ctx.args.push_back("-e");
    ctx.args.push_back(name + "=" + val);
  }
}

void CommandSynthesizer::add_labels(Context &ctx,
                                    const std::string &value) const {
  if (value.empty())
    return;
  // Source-range lists carry their own commas
  if (contains(value, "ipwhitelist.sourcerange=")) {
    ctx.args.push_back("--label");
    ctx.args.push_back(value);
    return;
  }
  for (const auto &item : split(value, ',')) {
    ctx.args.push_back("--label");
    ctx.args.push_back(item);
  }
}

void CommandSynthesizer::add_domain_routing(Context &ctx) const {
  const std::string &svc = ctx.desc.name;
  if (std::find(DOMAIN_ROUTING_MODES.begin(), DOMAIN_ROUTING_MODES.end(),
                config_.traefik_domain_mode) == DOMAIN_ROUTING_MODES.end() ||
      config_.traefik_domain_name.empty()) {
    LOG_DEBUG(svc + ": domain routing requested but TRAEFIK_DOMAIN_MODE=" +
              config_.traefik_domain_mode + ", no labels");
    return;
  }

  std::string router = "traefik.http.routers." + svc;
  std::vector<std::string> labels = {
      "traefik.enable=true",
      router + ".rule=Host(`" + svc + "." + config_.traefik_domain_name +
          "`)",
      router + ".entrypoints=web"};

  auto ports = service_port_items(ctx.desc, config_);
  PortSpec spec;
  if (!ports.empty() && parse_port_spec(ports.front(), spec)) {
    labels.push_back("traefik.http.services." + svc +
                     ".loadbalancer.server.port=" + spec.container_port);
  } else {
    LOG_WARN(svc + ": domain routing without a usable port, no "
                   "load-balancer label");
  }
  labels.push_back(router + ".middlewares=lan-vpn-only");

  for (const auto &label : labels) {
    ctx.args.push_back("--label");
    ctx.args.push_back(label);
  }
}

void CommandSynthesizer::add_discovery(Context &ctx) const {
  std::string declared = ctx.desc.get("discovery_ports");
  if (declared.empty()) {
    std::string image = to_lower(ctx.image);
    if (contains(image, "ollama"))
      declared = "11434/tcp";
    else if (contains(image, "agentcare") || contains(image, "mcp"))
      declared = "3000/tcp";
    else if (contains(image, "homeassistant") || contains(image, "hass"))
      declared = "5353/udp,21063/tcp";
    else
      declared = "1900/udp,5353/udp";
  }

  std::set<std::string> mapped;
  for (size_t i = 0; i + 1 < ctx.args.size(); ++i) {
    PortSpec spec;
    if (ctx.args[i] == "-p" && parse_port_spec(ctx.args[i + 1], spec)) {
      mapped.insert(spec.host_port + "/" + spec.protocol);
    }
  }

  for (const auto &item : split(declared, ',')) {
    PortSpec spec;
    if (!parse_port_spec(item, spec)) {
      LOG_WARN(ctx.desc.name + ": invalid discovery port '" + item + "'");
      continue;
    }
    if (mapped.count(spec.host_port + "/" + spec.protocol))
      continue;
    std::string value = spec.host_port + ":" + spec.container_port;
    if (spec.protocol != "tcp")
      value += "/" + spec.protocol;
    ctx.args.push_back("-p");
    ctx.args.push_back(value);
  }

  ctx.args.push_back("--add-host");
  ctx.args.push_back("host.docker.internal:host-gateway");
  if (trim(ctx.desc.get("multicast_relay")) == "true") {
    ctx.args.insert(ctx.args.end(),
                    {"--cap-add", "NET_ADMIN", "--cap-add", "NET_RAW"});
  }
}

} // namespace clinic

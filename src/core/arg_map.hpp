// core/arg_map.hpp - Descriptor option to container-launch argument table
#pragma once

#include <map>
#include <string>

namespace clinic {

enum class HandlerKind {
  Direct,        // image reference
  Flag,          // --flag value, comma lists repeat the pair
  BooleanFlag,   // --flag, only for the literal value "true"
  Port,          // -p with shorthand normalisation
  Volume,        // -v with variable expansion
  Env,           // -e, ';' or ',' separated
  Label,         // --label
  Vpn,           // tunnel capabilities
  Privileged,    // --privileged plus the tun device
  DependsOn,     // --link dep:dep
  Healthcheck,   // --health-cmd plus default timings
  ExtraArgs,     // raw tokens, whitespace separated
  Command,       // tokens placed after the image
  DomainRouting, // reverse-proxy labels
  Discovery,     // LAN discovery ports and host gateway
  Ignore,        // metadata, never emitted
  Unknown
};

struct ArgMapping {
  HandlerKind kind = HandlerKind::Unknown;
  const char *flag = "";
};

const std::map<std::string, ArgMapping> &argument_table();

// Unmapped keys resolve to HandlerKind::Unknown.
ArgMapping lookup_mapping(const std::string &key);

// Flags whose own value syntax uses commas are never split.
bool flag_keeps_commas(const std::string &flag);

std::string handler_kind_name(HandlerKind kind);

} // namespace clinic

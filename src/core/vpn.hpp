// core/vpn.hpp - WireGuard client pool and server configuration
#pragma once

#include "../conf/config.hpp"
#include "../utils.hpp"
#include <set>
#include <string>
#include <vector>

namespace clinic {

struct VpnClientRecord {
  std::string name;
  std::string address;
  fs::path dir;
  std::string public_key;
  std::string created;
};

struct ServerKeys {
  std::string private_key;
  std::string public_key;
  std::string preshared_key;

  bool complete() const {
    return !private_key.empty() && !public_key.empty() &&
           !preshared_key.empty();
  }
};

struct PeerEntry {
  std::string name;
  std::string public_key;
  std::string address;
};

// Lowest host offset in [2, 254] not in used, or -1 when the pool is full.
int lowest_free_offset(const std::set<int> &used);

// Host offset of address inside base ("10.8.0"), or -1 when it is outside.
int address_offset(const std::string &address, const std::string &base);

bool is_valid_client_name(const std::string &name);

ServerKeys parse_server_keys(const std::string &text);
std::string render_server_keys(const ServerKeys &keys);

std::string render_client_config(const std::string &private_key,
                                 const std::string &address,
                                 const ServerKeys &server,
                                 const Config &config);
std::string render_server_config(const ServerKeys &server,
                                 const std::vector<PeerEntry> &peers,
                                 const Config &config);

class VpnManager {
public:
  VpnManager(const Config &config, CommandRunner &runner);

  std::vector<VpnClientRecord> list_clients() const;
  bool client_exists(const std::string &name) const;
  std::string suggest_client_name(const std::string &base) const;

  // Throws ExitError(EXIT_IP_POOL_EXHAUSTED) when no offset is free.
  std::string allocate_address() const;

  // Throws ExitError on invalid names, duplicates, missing tools, missing
  // server keys or an exhausted pool.
  VpnClientRecord add_client(const std::string &name);
  bool delete_client(const std::string &name);

  // New server key pair and preshared key, propagated to every client.
  bool reset_keys();
  bool regenerate_server_config();
  bool backup();

  // tar can list the archive and every entry sits under WG_DIR's name.
  bool verify_backup(const fs::path &archive) const;
  // Verifies, extracts over WG_DIR, checks the restored files and restarts
  // the selected containers. Throws ExitError(EXIT_USAGE) when the archive
  // does not exist.
  bool restore_backup(const fs::path &archive);
  // WG_DIR and WG_KEYS_ENV are present; each missing one is warned.
  bool backup_integrity_ok() const;

  // Throws ExitError(EXIT_WG_KEYS_MISSING / EXIT_WG_KEYS_INCOMPLETE).
  ServerKeys load_server_keys() const;
  ServerKeys ensure_server_keys();

private:
  void require_wg() const;
  std::string generate_private_key() const;
  std::string derive_public_key(const std::string &private_key) const;
  std::string generate_preshared_key() const;
  ServerKeys generate_server_keys() const;
  bool write_client_config(const VpnClientRecord &record,
                           const ServerKeys &server);
  void render_qr(const VpnClientRecord &record, const std::string &conf);
  void restart_vpn_service();
  void prune_backups();

  const Config &config_;
  CommandRunner &runner_;
};

} // namespace clinic

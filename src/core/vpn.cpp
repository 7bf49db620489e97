// core/vpn.cpp - WireGuard client pool implementation
#include "vpn.hpp"
#include "../defs.hpp"
#include "runtime.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <sstream>

namespace clinic {

int lowest_free_offset(const std::set<int> &used) {
  for (int offset = VPN_FIRST_CLIENT_OFFSET; offset <= VPN_LAST_CLIENT_OFFSET;
       ++offset) {
    if (!used.count(offset)) {
      return offset;
    }
  }
  return -1;
}

int address_offset(const std::string &address, const std::string &base) {
  std::string addr = trim(address);
  auto slash = addr.find('/');
  if (slash != std::string::npos) {
    addr = addr.substr(0, slash);
  }
  std::string prefix = base + ".";
  if (!starts_with(addr, prefix)) {
    return -1;
  }
  std::string host = addr.substr(prefix.size());
  if (!is_all_digits(host) || host.size() > 3) {
    return -1;
  }
  int offset = std::stoi(host);
  return offset <= 255 ? offset : -1;
}

bool is_valid_client_name(const std::string &name) {
  if (name.empty() || name[0] == '.' || name[0] == '-' || name.size() > 64)
    return false;
  for (char c : name) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' &&
        c != '_' && c != '.')
      return false;
  }
  return true;
}

ServerKeys parse_server_keys(const std::string &text) {
  ServerKeys keys;
  std::vector<Assignment> assignments;
  std::string error;
  if (!parse_assignments(text, assignments, error)) {
    LOG_WARN("Server keys file: " + error);
    return keys;
  }
  for (const auto &a : assignments) {
    if (a.key == "WG_SERVER_PRIVATE_KEY")
      keys.private_key = a.value;
    else if (a.key == "WG_SERVER_PUBLIC_KEY")
      keys.public_key = a.value;
    else if (a.key == "WG_PRESHARED_KEY")
      keys.preshared_key = a.value;
  }
  return keys;
}

std::string render_server_keys(const ServerKeys &keys) {
  std::ostringstream out;
  out << "WG_SERVER_PRIVATE_KEY=\"" << keys.private_key << "\"\n";
  out << "WG_SERVER_PUBLIC_KEY=\"" << keys.public_key << "\"\n";
  out << "WG_PRESHARED_KEY=\"" << keys.preshared_key << "\"\n";
  return out.str();
}

std::string render_client_config(const std::string &private_key,
                                 const std::string &address,
                                 const ServerKeys &server,
                                 const Config &config) {
  std::ostringstream out;
  out << "[Interface]\n";
  out << "PrivateKey = " << private_key << "\n";
  out << "Address = " << address << "/32\n";
  out << "DNS = " << config.wg_client_dns << "\n";
  out << "\n";
  out << "[Peer]\n";
  out << "PublicKey = " << server.public_key << "\n";
  out << "PresharedKey = " << server.preshared_key << "\n";
  out << "AllowedIPs = 0.0.0.0/0\n";
  if (!config.wg_endpoint.empty()) {
    std::string endpoint = config.wg_endpoint;
    if (endpoint.find(':') == std::string::npos) {
      endpoint += ":" + std::to_string(config.wg_port);
    }
    out << "Endpoint = " << endpoint << "\n";
  }
  return out.str();
}

std::string render_server_config(const ServerKeys &server,
                                 const std::vector<PeerEntry> &peers,
                                 const Config &config) {
  const std::string forward =
      "iptables -{op} FORWARD -i %i -j ACCEPT; "
      "iptables -{op} FORWARD -o %i -j ACCEPT; "
      "iptables -t nat -{op} POSTROUTING -o eth+ -j MASQUERADE";
  auto rule = [&forward](const std::string &op) {
    std::string s = forward;
    size_t pos;
    while ((pos = s.find("{op}")) != std::string::npos) {
      s.replace(pos, 4, op);
    }
    return s;
  };

  std::ostringstream out;
  out << "[Interface]\n";
  out << "PrivateKey = " << server.private_key << "\n";
  out << "Address = " << config.vpn_subnet_base << ".1/24\n";
  out << "ListenPort = " << config.wg_port << "\n";
  out << "PostUp = " << rule("A") << "\n";
  out << "PostDown = " << rule("D") << "\n";

  for (const auto &peer : peers) {
    out << "\n";
    out << "[Peer]\n";
    out << "# Client: " << peer.name << "\n";
    out << "PublicKey = " << peer.public_key << "\n";
    out << "PresharedKey = " << server.preshared_key << "\n";
    out << "AllowedIPs = " << peer.address << "/32\n";
  }
  return out.str();
}

VpnManager::VpnManager(const Config &config, CommandRunner &runner)
    : config_(config), runner_(runner) {}

static std::string format_mtime(const fs::path &path) {
  std::error_code ec;
  auto ftime = fs::last_write_time(path, ec);
  if (ec) {
    return "";
  }
  auto sctp = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
      ftime - fs::file_time_type::clock::now() +
      std::chrono::system_clock::now());
  std::time_t tt = std::chrono::system_clock::to_time_t(sctp);
  char buf[64];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", std::gmtime(&tt));
  return buf;
}

std::vector<VpnClientRecord> VpnManager::list_clients() const {
  std::vector<VpnClientRecord> clients;
  fs::path root = config_.wg_clients_dir();
  if (!fs::is_directory(root)) {
    return clients;
  }

  try {
    for (const auto &entry : fs::directory_iterator(root)) {
      if (!entry.is_directory())
        continue;
      VpnClientRecord rec;
      rec.name = entry.path().filename().string();
      rec.dir = entry.path();
      rec.address = trim(read_file(entry.path() / CLIENT_IP_FILE));
      rec.public_key = trim(read_file(entry.path() / CLIENT_PUBLIC_KEY_FILE));
      rec.created = trim(read_file(entry.path() / CLIENT_CREATED_FILE));
      if (rec.created.empty()) {
        rec.created = format_mtime(entry.path());
      }
      clients.push_back(rec);
    }
  } catch (const fs::filesystem_error &e) {
    LOG_ERROR("Cannot scan " + root.string() + ": " + e.what());
  }

  std::sort(clients.begin(), clients.end(),
            [](const VpnClientRecord &a, const VpnClientRecord &b) {
              return a.name < b.name;
            });
  return clients;
}

bool VpnManager::client_exists(const std::string &name) const {
  return fs::is_directory(config_.wg_clients_dir() / name);
}

std::string VpnManager::suggest_client_name(const std::string &base) const {
  int n = 2;
  while (client_exists(base + "-" + std::to_string(n))) {
    ++n;
  }
  return base + "-" + std::to_string(n);
}

std::string VpnManager::allocate_address() const {
  std::set<int> used;
  for (const auto &client : list_clients()) {
    int offset = address_offset(client.address, config_.vpn_subnet_base);
    if (offset >= 0) {
      used.insert(offset);
    } else if (!client.address.empty()) {
      LOG_WARN("Client " + client.name + " has address " + client.address +
               " outside " + config_.vpn_subnet);
    }
  }

  int offset = lowest_free_offset(used);
  if (offset < 0) {
    throw ExitError(EXIT_IP_POOL_EXHAUSTED,
                    "No free VPN address left in " + config_.vpn_subnet +
                        ". Delete unused clients before adding new ones.");
  }
  return config_.vpn_subnet_base + "." + std::to_string(offset);
}

void VpnManager::require_wg() const {
  if (!runner_.program_exists("wg")) {
    throw ExitError(EXIT_DEPENDENCY_MISSING,
                    "wg not found. Install wireguard-tools.");
  }
}

std::string VpnManager::generate_private_key() const {
  CommandResult r = runner_.run({"wg", "genkey"});
  if (!r.ok() || trim(r.output).empty()) {
    throw ExitError(EXIT_FAILURE_GENERAL,
                    "wg genkey failed: " + trim(r.output));
  }
  return trim(r.output);
}

std::string VpnManager::derive_public_key(const std::string &private_key) const {
  CommandResult r = runner_.run({"wg", "pubkey"}, private_key + "\n");
  if (!r.ok() || trim(r.output).empty()) {
    throw ExitError(EXIT_FAILURE_GENERAL,
                    "wg pubkey failed: " + trim(r.output));
  }
  return trim(r.output);
}

std::string VpnManager::generate_preshared_key() const {
  CommandResult r = runner_.run({"wg", "genpsk"});
  if (!r.ok() || trim(r.output).empty()) {
    throw ExitError(EXIT_FAILURE_GENERAL,
                    "wg genpsk failed: " + trim(r.output));
  }
  return trim(r.output);
}

ServerKeys VpnManager::generate_server_keys() const {
  require_wg();
  ServerKeys keys;
  keys.private_key = generate_private_key();
  keys.public_key = derive_public_key(keys.private_key);
  keys.preshared_key = generate_preshared_key();
  return keys;
}

ServerKeys VpnManager::load_server_keys() const {
  fs::path path = config_.wg_keys_env();
  if (!fs::exists(path)) {
    throw ExitError(EXIT_WG_KEYS_MISSING,
                    "WireGuard keys file not found: " + path.string() +
                        ". Run 'clinicd vpn reset-keys' to create it.");
  }
  ServerKeys keys = parse_server_keys(read_file(path));
  if (!keys.complete()) {
    throw ExitError(EXIT_WG_KEYS_INCOMPLETE,
                    "WireGuard keys in " + path.string() +
                        " are incomplete. Run 'clinicd vpn reset-keys'.");
  }
  return keys;
}

ServerKeys VpnManager::ensure_server_keys() {
  if (fs::exists(config_.wg_keys_env())) {
    return load_server_keys();
  }

  LOG_INFO("Generating WireGuard server keys in " +
           config_.wg_keys_env().string());
  ServerKeys keys = generate_server_keys();
  if (!runner_.dry_run() &&
      !write_file_atomic(config_.wg_keys_env(), render_server_keys(keys),
                         true)) {
    throw ExitError(EXIT_FAILURE_GENERAL, "Cannot write " +
                                              config_.wg_keys_env().string());
  }
  return keys;
}

bool VpnManager::write_client_config(const VpnClientRecord &record,
                                     const ServerKeys &server) {
  std::string private_key =
      trim(read_file(record.dir / CLIENT_PRIVATE_KEY_FILE));
  if (private_key.empty() || record.address.empty()) {
    LOG_WARN("Client " + record.name + " is missing its key or address");
    return false;
  }

  std::string conf =
      render_client_config(private_key, record.address, server, config_);
  if (!write_file(record.dir / (record.name + ".conf"), conf, true)) {
    return false;
  }
  render_qr(record, conf);
  return true;
}

VpnClientRecord VpnManager::add_client(const std::string &name) {
  if (!is_valid_client_name(name)) {
    throw ExitError(EXIT_USAGE, "Invalid client name: '" + name + "'");
  }
  if (client_exists(name)) {
    throw ExitError(EXIT_FAILURE_GENERAL,
                    "Client " + name + " already exists. Try '" +
                        suggest_client_name(name) + "'.");
  }

  require_wg();
  ServerKeys server = ensure_server_keys();

  VpnClientRecord record;
  record.name = name;
  record.dir = config_.wg_clients_dir() / name;
  record.address = allocate_address();
  record.created = iso_timestamp();

  if (runner_.dry_run()) {
    LOG_INFO("[dry-run] would add client " + name + " at " + record.address);
    return record;
  }

  std::string private_key = generate_private_key();
  record.public_key = derive_public_key(private_key);

  if (!ensure_dir_exists(record.dir)) {
    throw ExitError(EXIT_FAILURE_GENERAL,
                    "Cannot create " + record.dir.string());
  }
  std::error_code ec;
  fs::permissions(record.dir, fs::perms::owner_all, fs::perm_options::replace,
                  ec);

  bool ok = write_file(record.dir / CLIENT_IP_FILE, record.address + "\n",
                       true) &&
            write_file(record.dir / CLIENT_PRIVATE_KEY_FILE,
                       private_key + "\n", true) &&
            write_file(record.dir / CLIENT_PUBLIC_KEY_FILE,
                       record.public_key + "\n", true) &&
            write_file(record.dir / CLIENT_CREATED_FILE,
                       record.created + "\n", true) &&
            write_client_config(record, server);
  if (!ok) {
    fs::remove_all(record.dir, ec);
    throw ExitError(EXIT_FAILURE_GENERAL,
                    "Failed to write client files for " + name);
  }

  LOG_INFO("Added VPN client " + name + " at " + record.address);
  backup();
  regenerate_server_config();
  return record;
}

bool VpnManager::delete_client(const std::string &name) {
  if (!client_exists(name)) {
    LOG_WARN("Client " + name + " does not exist");
    return true;
  }
  if (runner_.dry_run()) {
    LOG_INFO("[dry-run] would delete client " + name);
    return true;
  }

  backup();

  std::error_code ec;
  fs::remove_all(config_.wg_clients_dir() / name, ec);
  if (ec) {
    LOG_ERROR("Failed to remove client " + name + ": " + ec.message());
    return false;
  }
  fs::remove(config_.qr_dir() / (name + ".png"), ec);

  LOG_INFO("Deleted VPN client " + name);
  return regenerate_server_config();
}

bool VpnManager::reset_keys() {
  if (runner_.dry_run()) {
    LOG_INFO("[dry-run] would regenerate server keys for " +
             std::to_string(list_clients().size()) + " client(s)");
    return true;
  }

  backup();

  ServerKeys keys = generate_server_keys();
  if (!write_file_atomic(config_.wg_keys_env(), render_server_keys(keys),
                         true)) {
    LOG_ERROR("Cannot write " + config_.wg_keys_env().string());
    return false;
  }

  int updated = 0;
  for (const auto &client : list_clients()) {
    if (write_client_config(client, keys)) {
      ++updated;
    }
  }
  LOG_INFO("Server keys regenerated, " + std::to_string(updated) +
           " client config(s) updated");
  return regenerate_server_config();
}

bool VpnManager::regenerate_server_config() {
  ServerKeys server = load_server_keys();

  std::vector<PeerEntry> peers;
  for (const auto &client : list_clients()) {
    if (client.public_key.empty() || client.address.empty()) {
      LOG_WARN("Client " + client.name +
               " is missing public.key or ip, skipped in server config");
      continue;
    }
    peers.push_back({client.name, client.public_key, client.address});
  }

  if (runner_.dry_run()) {
    LOG_INFO("[dry-run] would write " + config_.wg_server_conf().string() +
             " with " + std::to_string(peers.size()) + " peer(s)");
    return true;
  }

  if (!write_file_atomic(config_.wg_server_conf(),
                         render_server_config(server, peers, config_), true)) {
    return false;
  }
  LOG_INFO("Wrote " + config_.wg_server_conf().string() + " with " +
           std::to_string(peers.size()) + " peer(s)");

  restart_vpn_service();
  return true;
}

void VpnManager::restart_vpn_service() {
  if (!runner_.program_exists("docker")) {
    return;
  }
  ContainerRuntime runtime(runner_);
  if (runtime.is_running(config_.vpn_service)) {
    LOG_INFO("Restarting " + config_.vpn_service + " to load new peers");
    runtime.restart(config_.vpn_service);
  }
}

void VpnManager::render_qr(const VpnClientRecord &record,
                           const std::string &conf) {
  if (!runner_.program_exists("qrencode")) {
    LOG_WARN("qrencode not installed, no QR code for " + record.name);
    return;
  }

  fs::path png = record.dir / (record.name + ".png");
  CommandResult r = runner_.mutate({"qrencode", "-o", png.string()}, conf);
  if (!r.ok()) {
    LOG_WARN("qrencode failed for " + record.name + ": " + trim(r.output));
    return;
  }

  if (!ensure_dir_exists(config_.qr_dir())) {
    return;
  }
  std::error_code ec;
  fs::copy_file(png, config_.qr_dir() / png.filename(),
                fs::copy_options::overwrite_existing, ec);
  if (ec) {
    LOG_WARN("Cannot copy QR code to " + config_.qr_dir().string() + ": " +
             ec.message());
  }
}

bool VpnManager::backup() {
  if (!fs::exists(config_.wg_dir)) {
    LOG_DEBUG("Nothing to back up, " + config_.wg_dir.string() + " missing");
    return true;
  }
  if (!ensure_dir_exists(config_.backup_dir())) {
    return false;
  }

  fs::path archive =
      config_.backup_dir() / ("wg-backup-" + timestamp() + ".tar.gz");
  fs::path parent = config_.wg_dir.parent_path();
  if (parent.empty()) {
    parent = ".";
  }
  CommandResult r =
      runner_.mutate({"tar", "czf", archive.string(), "-C", parent.string(),
                      config_.wg_dir.filename().string()});
  if (!r.ok()) {
    LOG_WARN("Backup of " + config_.wg_dir.string() + " failed: " +
             trim(r.output));
    return false;
  }
  LOG_DEBUG("Backup written to " + archive.string());

  prune_backups();
  return true;
}

bool VpnManager::verify_backup(const fs::path &archive) const {
  CommandResult r = runner_.run({"tar", "tzf", archive.string()});
  if (!r.ok()) {
    LOG_ERROR("Backup " + archive.string() + " is invalid or corrupted: " +
              trim(r.output));
    return false;
  }

  std::string root = config_.wg_dir.filename().string();
  auto entries = split(r.output, '\n');
  bool rooted = !entries.empty() &&
                std::all_of(entries.begin(), entries.end(),
                            [&root](const std::string &entry) {
                              return entry == root ||
                                     starts_with(entry, root + "/");
                            });
  if (!rooted) {
    LOG_ERROR("Backup " + archive.string() + " does not hold " + root + "/");
    return false;
  }
  LOG_INFO("Backup " + archive.string() + " is valid (" +
           std::to_string(entries.size()) + " entries)");
  return true;
}

bool VpnManager::backup_integrity_ok() const {
  bool ok = true;
  if (!fs::is_directory(config_.wg_dir)) {
    LOG_WARN("Restored WireGuard directory missing: " +
             config_.wg_dir.string());
    ok = false;
  }
  if (!fs::exists(config_.wg_keys_env())) {
    LOG_WARN("Restored WireGuard keys missing: " +
             config_.wg_keys_env().string());
    ok = false;
  }
  return ok;
}

bool VpnManager::restore_backup(const fs::path &archive) {
  if (!fs::exists(archive)) {
    throw ExitError(EXIT_USAGE, "Backup file not found: " + archive.string());
  }
  if (!verify_backup(archive)) {
    return false;
  }

  fs::path parent = config_.wg_dir.parent_path();
  if (parent.empty()) {
    parent = ".";
  }
  CommandResult r =
      runner_.mutate({"tar", "xzf", archive.string(), "-C", parent.string()});
  if (!r.ok()) {
    LOG_ERROR("Restore from " + archive.string() + " failed: " +
              trim(r.output));
    return false;
  }
  LOG_INFO("Restored backup from " + archive.string());

  if (!runner_.dry_run()) {
    backup_integrity_ok();
  }

  if (!runner_.program_exists("docker")) {
    return true;
  }
  ContainerRuntime runtime(runner_);
  for (const auto &name : config_.selected_containers) {
    if (!runtime.restart(name)) {
      LOG_WARN("Could not restart " + name + " after restore");
    }
  }
  return true;
}

void VpnManager::prune_backups() {
  std::vector<fs::path> archives;
  std::error_code ec;
  for (const auto &entry : fs::directory_iterator(config_.backup_dir(), ec)) {
    std::string name = entry.path().filename().string();
    if (starts_with(name, "wg-backup-") &&
        entry.path().extension() == ".gz") {
      archives.push_back(entry.path());
    }
  }
  if (static_cast<int>(archives.size()) <= config_.backup_retention) {
    return;
  }

  // Names embed the timestamp, so lexical order is chronological
  std::sort(archives.begin(), archives.end());
  size_t excess = archives.size() - static_cast<size_t>(config_.backup_retention);
  for (size_t i = 0; i < excess; ++i) {
    fs::remove(archives[i], ec);
    if (ec) {
      LOG_WARN("Cannot prune " + archives[i].string() + ": " + ec.message());
    }
  }
}

} // namespace clinic

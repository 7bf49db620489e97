// Constants and definitions
#pragma once

#include <string>
#include <vector>

namespace clinic {

// Directories and files
constexpr const char *DEFAULT_CFG_ROOT = "/opt/intelluxe/clinic-stack";
constexpr const char *STATE_FILE_NAME = ".clinic-bootstrap.conf";
constexpr const char *SERVICES_SUBDIR = "services/user";
constexpr const char *BACKUP_SUBDIR = "backups";
constexpr const char *LOG_SUBDIR = "logs";
constexpr const char *QR_SUBDIR = "qrcodes";
constexpr const char *WG_CONFS_SUBDIR = "wg_confs";
constexpr const char *WG_SERVER_CONF_NAME = "wg0.conf";
constexpr const char *DIAGNOSTICS_FILE_NAME = "diagnostics.json";
constexpr const char *DAEMON_LOG_NAME = "clinicd.log";
constexpr const char *LOCK_FILE_NAME = "clinic-bootstrap.lock";
constexpr const char *DESCRIPTOR_SUFFIX = ".conf";

// WireGuard
constexpr const char *DEFAULT_WG_DIR = "/etc/wireguard";
constexpr const char *WG_KEYS_ENV_NAME = "wg-keys.env";
constexpr const char *WG_CLIENTS_SUBDIR = "clients";
constexpr int DEFAULT_WG_PORT = 51820;
constexpr int VPN_FIRST_CLIENT_OFFSET = 2;
constexpr int VPN_LAST_CLIENT_OFFSET = 254;

// Client record files
constexpr const char *CLIENT_IP_FILE = "ip";
constexpr const char *CLIENT_PRIVATE_KEY_FILE = "private.key";
constexpr const char *CLIENT_PUBLIC_KEY_FILE = "public.key";
constexpr const char *CLIENT_CREATED_FILE = "created";

// Networks
constexpr const char *DEFAULT_DOCKER_NETWORK = "intelluxe-net";
constexpr const char *DEFAULT_DOCKER_SUBNET = "172.20.0.0/16";
constexpr const char *DEFAULT_LAN_SUBNET = "192.168.0.0/16";
constexpr const char *DEFAULT_VPN_SUBNET = "10.8.0.0/24";
constexpr const char *DEFAULT_VPN_BASE = "10.8.0";
constexpr const char *DEFAULT_VPN_SERVICE = "wireguard";
constexpr const char *DEFAULT_CLIENT_DNS = "1.1.1.2";
constexpr const char *DEFAULT_DNS_FALLBACK = "1.0.0.2";

// Firewall persistence
constexpr const char *IPTABLES_RULES_FILE = "/etc/iptables/rules.v4";

// Snapshot
constexpr const char *LEGACY_STATE_MARKER = "CONTAINER_PORTS[";

// Container launch defaults
constexpr const char *DEFAULT_RESTART_POLICY = "unless-stopped";
constexpr const char *DEFAULT_HEALTH_INTERVAL = "30s";
constexpr const char *DEFAULT_HEALTH_TIMEOUT = "5s";
constexpr const char *DEFAULT_HEALTH_RETRIES = "3";

// Repair
constexpr int DEFAULT_REPAIR_ATTEMPTS = 3;
constexpr int DEFAULT_REPAIR_DELAY_SECONDS = 5;
constexpr int DEFAULT_BACKUP_RETENTION = 10;

// Reverse proxy modes that produce routing labels
const std::vector<std::string> DOMAIN_ROUTING_MODES = {"domain", "ddns",
                                                       "hostfile", "vpn-only"};

// Process exit codes
constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILURE_GENERAL = 1;
constexpr int EXIT_USAGE = 2;
constexpr int EXIT_DIAGNOSTICS_MISSING = 2;
constexpr int EXIT_DIAGNOSTICS_INVALID = 3;
constexpr int EXIT_DEPENDENCY_MISSING = 4;
constexpr int EXIT_WG_KEYS_MISSING = 23;
constexpr int EXIT_WG_KEYS_INCOMPLETE = 24;
constexpr int EXIT_IP_POOL_EXHAUSTED = 27;
constexpr int EXIT_CONFIG_INVALID = 64;
constexpr int EXIT_LOCK_HELD = 75;
constexpr int EXIT_ROOT_REQUIRED = 100;
constexpr int EXIT_DAEMON_DOWN = 110;
constexpr int EXIT_RUNTIME_MISSING = 127;

} // namespace clinic

#include "conf/config.hpp"
#include "core/state.hpp"
#include "defs.hpp"
#include "fake_runner.hpp"
#include "utils.hpp"

#include <sys/stat.h>

#include <cassert>
#include <string>

using namespace clinic;
using clinic_test::TempDir;

namespace {

size_t backups_of(const fs::path& path) {
    size_t n = 0;
    for (const auto& entry : fs::directory_iterator(path.parent_path())) {
        if (entry.path().filename().string().rfind(path.filename().string() + ".backup-", 0) == 0)
            ++n;
    }
    return n;
}

}  // namespace

int main() {
    // Saved state loads back into an equivalent configuration
    {
        TempDir tmp;
        Config config;
        config.cfg_root = tmp.path() / "stack";
        config.wg_dir = tmp.path() / "wg";
        config.selected_containers = {"grafana", "home-assistant", "wireguard"};
        config.lan_subnet = "192.168.50.0/24";
        config.wg_endpoint = "vpn.example:443";
        config.firewall_mode = FirewallMode::Custom;
        config.restricted_services = {"grafana"};
        config.traefik_domain_mode = "domain";
        config.traefik_domain_name = "clinic.example";
        config.traefik_acme_email = "ops \"on call\" $USER";
        config.port_overrides[service_env_key("home-assistant")] = "8124:8123";
        config.container_ips[service_env_key("grafana")] = "172.20.0.5";

        fs::path path = config.state_file();
        DesiredStateSnapshot snapshot = DesiredStateSnapshot::capture(config);
        assert(snapshot.save(path));

        struct stat st;
        assert(stat(path.c_str(), &st) == 0);
        assert((st.st_mode & 0777) == 0600);

        std::string text = read_file(path);
        assert(text.find("SELECTED_CONTAINERS=(grafana home-assistant wireguard)") !=
               std::string::npos);
        assert(text.find("HOME_ASSISTANT_PORT=\"8124:8123\"") != std::string::npos);
        assert(text.find("GRAFANA_CONTAINER_IP=\"172.20.0.5\"") != std::string::npos);
        assert(text.find("\\$USER") != std::string::npos);

        std::string error;
        assert(inspect_snapshot(path, &error) == SnapshotStatus::Valid);

        Config loaded = Config::from_file(path);
        assert(loaded.cfg_root == config.cfg_root);
        assert(loaded.wg_dir == config.wg_dir);
        assert(loaded.selected_containers == config.selected_containers);
        assert(loaded.lan_subnet == "192.168.50.0/24");
        assert(loaded.wg_endpoint == "vpn.example:443");
        assert(loaded.firewall_mode == FirewallMode::Custom);
        assert(loaded.restricted_services == config.restricted_services);
        assert(loaded.traefik_domain_name == "clinic.example");
        assert(loaded.traefik_acme_email == config.traefik_acme_email);
        assert(loaded.port_override("home-assistant") == "8124:8123");
        assert(loaded.container_ip("grafana") == "172.20.0.5");
        assert(loaded.container_ip("wireguard").empty());
    }

    {
        TempDir tmp;
        Config config;
        std::string rendered = DesiredStateSnapshot::capture(config).render();
        assert(rendered.find("WG_ENDPOINT") == std::string::npos);
        assert(rendered.find("FIREWALL_RESTRICT_MODE=\"open\"") != std::string::npos);
        assert(snapshot_status_to_string(SnapshotStatus::Legacy) == "legacy");
    }

    // Status classification
    {
        TempDir tmp;
        fs::path path = tmp.path() / STATE_FILE_NAME;
        std::string error;
        assert(inspect_snapshot(path, &error) == SnapshotStatus::Missing);

        write_file(path, "declare -A CONTAINER_PORTS\nCONTAINER_PORTS[grafana]=3000\n");
        assert(inspect_snapshot(path, &error) == SnapshotStatus::Legacy);

        write_file(path, "CFG_ROOT=\"/opt/stack\"\nthis is not an assignment\n");
        assert(inspect_snapshot(path, &error) == SnapshotStatus::Corrupt);
        assert(!error.empty());

        error.clear();
        write_file(path, "WG_PORT=abc\n");
        assert(inspect_snapshot(path, &error) == SnapshotStatus::Corrupt);
        assert(!error.empty());

        write_file(path, "# comment only\n\nWG_PORT=51821\n");
        assert(inspect_snapshot(path, nullptr) == SnapshotStatus::Valid);
    }

    // Unusable snapshots are moved aside for regeneration
    {
        TempDir tmp;
        fs::path path = tmp.path() / STATE_FILE_NAME;
        assert(!prepare_snapshot(path));

        write_file(path, "CONTAINER_PORTS[grafana]=3000\n");
        assert(!prepare_snapshot(path));
        assert(!fs::exists(path));
        assert(backups_of(path) == 1);

        write_file(path, "SELECTED_CONTAINERS=(grafana)\n");
        assert(prepare_snapshot(path));
        assert(fs::exists(path));
        assert(backups_of(path) == 1);
    }

    return 0;
}

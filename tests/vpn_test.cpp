#include "conf/config.hpp"
#include "core/vpn.hpp"
#include "defs.hpp"
#include "fake_runner.hpp"
#include "utils.hpp"

#include <sys/stat.h>

#include <cassert>
#include <functional>
#include <set>
#include <string>

using namespace clinic;
using clinic_test::FakeRunner;
using clinic_test::TempDir;

namespace {

Config make_config(const TempDir& tmp) {
    Config config;
    config.cfg_root = tmp.path() / "stack";
    config.wg_dir = tmp.path() / "wireguard";
    config.wg_endpoint = "vpn.clinic.example";
    return config;
}

void seed_client(const Config& config, const std::string& name, const std::string& address) {
    fs::path dir = config.wg_clients_dir() / name;
    write_file(dir / CLIENT_IP_FILE, address + "\n");
    write_file(dir / CLIENT_PRIVATE_KEY_FILE, "priv-" + name + "\n");
    write_file(dir / CLIENT_PUBLIC_KEY_FILE, "pub-" + name + "\n");
    write_file(dir / CLIENT_CREATED_FILE, "2024-01-01T00:00:00Z\n");
}

void seed_keys(const Config& config) {
    ServerKeys keys{"server-priv", "server-pub", "psk"};
    write_file(config.wg_keys_env(), render_server_keys(keys));
}

void script_wg(FakeRunner& runner) {
    runner.install("wg");
    runner.install("tar");
    runner.respond({"wg", "genkey"}, 0, "generated-private\n");
    runner.respond({"wg", "pubkey"}, 0, "derived-public\n");
    runner.respond({"wg", "genpsk"}, 0, "generated-psk\n");
}

int exit_code_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const ExitError& e) {
        return e.code();
    }
    return 0;
}

}  // namespace

int main() {
    {
        assert(lowest_free_offset({}) == 2);
        assert(lowest_free_offset({2, 3, 5}) == 4);
        std::set<int> full;
        for (int i = VPN_FIRST_CLIENT_OFFSET; i <= VPN_LAST_CLIENT_OFFSET; ++i)
            full.insert(i);
        assert(lowest_free_offset(full) == -1);

        assert(address_offset("10.8.0.7", "10.8.0") == 7);
        assert(address_offset("10.8.0.7/32", "10.8.0") == 7);
        assert(address_offset("10.8.01", "10.8.0") == -1);
        assert(address_offset("10.9.0.7", "10.8.0") == -1);

        assert(is_valid_client_name("laptop-2"));
        assert(!is_valid_client_name("../etc"));
        assert(!is_valid_client_name("has space"));
        assert(!is_valid_client_name(""));
    }

    {
        ServerKeys keys = parse_server_keys(render_server_keys({"a", "b", "c"}));
        assert(keys.complete());
        assert(keys.private_key == "a" && keys.public_key == "b" && keys.preshared_key == "c");
        assert(!parse_server_keys("WG_SERVER_PRIVATE_KEY=\"a\"\n").complete());
    }

    {
        Config config;
        ServerKeys server{"sp", "spub", "psk"};
        std::string conf = render_client_config("cp", "10.8.0.4", server, config);
        assert(conf.find("Address = 10.8.0.4/32") != std::string::npos);
        assert(conf.find("PublicKey = spub") != std::string::npos);
        assert(conf.find("Endpoint") == std::string::npos);

        config.wg_endpoint = "vpn.example";
        conf = render_client_config("cp", "10.8.0.4", server, config);
        assert(conf.find("Endpoint = vpn.example:51820") != std::string::npos);
        config.wg_endpoint = "vpn.example:443";
        conf = render_client_config("cp", "10.8.0.4", server, config);
        assert(conf.find("Endpoint = vpn.example:443\n") != std::string::npos);
    }

    // Next address is the lowest free offset
    {
        TempDir tmp;
        Config config = make_config(tmp);
        seed_client(config, "a", "10.8.0.2");
        seed_client(config, "b", "10.8.0.3");
        seed_client(config, "c", "10.8.0.5");
        FakeRunner runner;
        VpnManager vpn(config, runner);

        assert(vpn.list_clients().size() == 3);
        assert(vpn.allocate_address() == "10.8.0.4");
        assert(vpn.client_exists("b"));
        assert(vpn.suggest_client_name("b") == "b-2");
    }

    // Exhausted pool
    {
        TempDir tmp;
        Config config = make_config(tmp);
        for (int i = VPN_FIRST_CLIENT_OFFSET; i <= VPN_LAST_CLIENT_OFFSET; ++i) {
            seed_client(config, "c" + std::to_string(i), "10.8.0." + std::to_string(i));
        }
        FakeRunner runner;
        VpnManager vpn(config, runner);
        assert(exit_code_of([&] { vpn.allocate_address(); }) == EXIT_IP_POOL_EXHAUSTED);
    }

    // Server key failures have distinct codes
    {
        TempDir tmp;
        Config config = make_config(tmp);
        FakeRunner runner;
        VpnManager vpn(config, runner);
        assert(exit_code_of([&] { vpn.load_server_keys(); }) == EXIT_WG_KEYS_MISSING);
        write_file(config.wg_keys_env(), "WG_SERVER_PRIVATE_KEY=\"x\"\n");
        assert(exit_code_of([&] { vpn.load_server_keys(); }) == EXIT_WG_KEYS_INCOMPLETE);
        assert(exit_code_of([&] { vpn.add_client("phone"); }) == EXIT_DEPENDENCY_MISSING);
        assert(exit_code_of([&] { vpn.add_client("bad name"); }) == EXIT_USAGE);
    }

    // Add C, delete D: server config has C and not D
    {
        TempDir tmp;
        Config config = make_config(tmp);
        seed_keys(config);
        seed_client(config, "d", "10.8.0.2");
        FakeRunner runner;
        script_wg(runner);
        VpnManager vpn(config, runner);

        VpnClientRecord c = vpn.add_client("c");
        assert(c.address == "10.8.0.3");
        assert(fs::exists(c.dir / "c.conf"));
        assert(trim(read_file(c.dir / CLIENT_IP_FILE)) == "10.8.0.3");
        assert(runner.called({"tar", "czf"}));

        struct stat st;
        assert(stat((c.dir / CLIENT_PRIVATE_KEY_FILE).c_str(), &st) == 0);
        assert((st.st_mode & 0777) == 0600);

        assert(exit_code_of([&] { vpn.add_client("c"); }) == EXIT_FAILURE_GENERAL);

        assert(vpn.delete_client("d"));
        assert(!vpn.client_exists("d"));
        assert(vpn.delete_client("d"));

        std::string server = read_file(config.wg_server_conf());
        assert(server.find("# Client: c") != std::string::npos);
        assert(server.find("AllowedIPs = 10.8.0.3/32") != std::string::npos);
        assert(server.find("# Client: d") == std::string::npos);
        assert(server.find("ListenPort = 51820") != std::string::npos);
        assert(server.find("PrivateKey = server-priv") != std::string::npos);
    }

    // Incomplete client records are left out of the server config
    {
        TempDir tmp;
        Config config = make_config(tmp);
        seed_keys(config);
        seed_client(config, "good", "10.8.0.2");
        write_file(config.wg_clients_dir() / "half" / CLIENT_IP_FILE, "10.8.0.3\n");
        FakeRunner runner;
        VpnManager vpn(config, runner);

        assert(vpn.regenerate_server_config());
        std::string server = read_file(config.wg_server_conf());
        assert(server.find("# Client: good") != std::string::npos);
        assert(server.find("# Client: half") == std::string::npos);
    }

    // Key rotation re-issues every client config
    {
        TempDir tmp;
        Config config = make_config(tmp);
        seed_keys(config);
        seed_client(config, "a", "10.8.0.2");
        FakeRunner runner;
        script_wg(runner);
        VpnManager vpn(config, runner);

        assert(vpn.reset_keys());
        ServerKeys keys = vpn.load_server_keys();
        assert(keys.private_key == "generated-private");
        assert(keys.preshared_key == "generated-psk");
        std::string conf = read_file(config.wg_clients_dir() / "a" / "a.conf");
        assert(conf.find("PublicKey = derived-public") != std::string::npos);
        assert(conf.find("Endpoint = vpn.clinic.example:51820") != std::string::npos);
    }

    // Backups beyond the retention count are pruned
    {
        TempDir tmp;
        Config config = make_config(tmp);
        config.backup_retention = 2;
        ensure_dir_exists(config.wg_dir);
        for (const char* name : {"wg-backup-20240101-000000.tar.gz", "wg-backup-20240102-000000.tar.gz",
                                 "wg-backup-20240103-000000.tar.gz"}) {
            write_file(config.backup_dir() / name, "x");
        }
        FakeRunner runner;
        VpnManager vpn(config, runner);
        assert(vpn.backup());
        assert(runner.called({"tar", "czf"}));
        assert(!fs::exists(config.backup_dir() / "wg-backup-20240101-000000.tar.gz"));
        assert(fs::exists(config.backup_dir() / "wg-backup-20240102-000000.tar.gz"));
        assert(fs::exists(config.backup_dir() / "wg-backup-20240103-000000.tar.gz"));
    }

    // Restoring checks the archive, extracts it and restarts the stack
    {
        TempDir tmp;
        Config config = make_config(tmp);
        config.selected_containers = {"grafana", "wireguard"};
        seed_keys(config);
        fs::path archive = tmp.path() / "wg-backup-20240101-000000.tar.gz";
        write_file(archive, "x");
        FakeRunner runner;
        runner.install("tar");
        runner.install("docker");
        runner.respond({"tar", "tzf"}, 0, "wireguard/\nwireguard/wg-keys.env\nwireguard/clients/\n");
        VpnManager vpn(config, runner);

        assert(vpn.verify_backup(archive));
        assert(vpn.restore_backup(archive));
        assert(runner.called({"tar", "xzf", archive.string(), "-C", tmp.path().string()}));
        assert(runner.called({"docker", "restart", "grafana"}));
        assert(runner.called({"docker", "restart", "wireguard"}));
        assert(vpn.backup_integrity_ok());

        fs::remove(config.wg_keys_env());
        assert(!vpn.backup_integrity_ok());

        assert(exit_code_of([&] { vpn.restore_backup(tmp.path() / "absent.tar.gz"); }) ==
               EXIT_USAGE);
    }

    // Corrupt or foreign archives are refused before extraction
    {
        TempDir tmp;
        Config config = make_config(tmp);
        fs::path archive = tmp.path() / "wg-backup-20240101-000000.tar.gz";
        write_file(archive, "not gzip");
        FakeRunner runner;
        runner.install("tar");
        VpnManager vpn(config, runner);

        runner.respond({"tar", "tzf"}, 2, "gzip: stdin: not in gzip format");
        assert(!vpn.verify_backup(archive));
        assert(!vpn.restore_backup(archive));

        runner.respond({"tar", "tzf"}, 0, "etc/passwd\nwireguard/wg0.conf\n");
        assert(!vpn.verify_backup(archive));
        assert(!runner.called({"tar", "xzf"}));
    }

    return 0;
}

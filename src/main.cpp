// main.cpp - Main entry point
#include <getopt.h>
#include <unistd.h>
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <set>
#include "conf/config.hpp"
#include "conf/descriptor.hpp"
#include "core/deploy.hpp"
#include "core/firewall.hpp"
#include "core/health.hpp"
#include "core/json.hpp"
#include "core/lifecycle.hpp"
#include "core/runtime.hpp"
#include "core/state.hpp"
#include "core/synthesizer.hpp"
#include "core/vpn.hpp"
#include "defs.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;
using namespace clinic;

struct CliOptions {
    std::string config_file;
    std::string command;
    fs::path root;
    std::vector<std::string> services;
    std::string firewall_mode;
    std::vector<std::string> restricted;
    std::map<std::string, std::string> ports;
    bool dry_run = false;
    bool verbose = false;
    bool all = false;
    std::string output;
    std::vector<std::string> args;
};

static void print_help() {
    std::cout << "Usage: clinicd [OPTIONS] <command> [args...]\n\n";
    std::cout << "Stack Commands:\n";
    std::cout << "  up                 Start every selected service (default action)\n";
    std::cout << "  down [--all]       Stop selected services (--all also removes the network)\n";
    std::cout << "  render <name>      Print the launch command for a service\n\n";

    std::cout << "Service Commands (service <subcommand> <name>):\n";
    std::cout << "  service start      Replace and start one service\n";
    std::cout << "  service stop       Stop one service\n";
    std::cout << "  service restart    Restart one service\n";
    std::cout << "  service remove     Stop and remove one service\n";
    std::cout << "  service status     Show state and health\n\n";

    std::cout << "VPN Commands (vpn <subcommand>):\n";
    std::cout << "  vpn add <name>     Add a client and allocate its address\n";
    std::cout << "  vpn delete <name>  Delete a client\n";
    std::cout << "  vpn list           List clients\n";
    std::cout << "  vpn reset-keys     Rotate server keys and re-issue client configs\n";
    std::cout << "  vpn regen          Regenerate the server configuration\n";
    std::cout << "  vpn verify <file>  Check a WireGuard backup archive\n";
    std::cout << "  vpn restore <file> Restore a backup and restart selected services\n\n";

    std::cout << "Firewall Commands (firewall <subcommand>):\n";
    std::cout << "  firewall plan      Print the derived rules\n";
    std::cout << "  firewall apply     Install missing rules\n\n";

    std::cout << "Health Commands:\n";
    std::cout << "  diagnose           Run health checks and write the report\n";
    std::cout << "  repair [report]    Restart services flagged by the report\n\n";

    std::cout << "Configuration Commands:\n";
    std::cout << "  config gen         Write a default configuration file\n";
    std::cout << "  config show        Show the effective configuration (JSON)\n";
    std::cout << "  state show         Show the desired-state snapshot\n\n";

    std::cout << "Options:\n";
    std::cout << "  -c, --config FILE        Configuration / desired-state file\n";
    std::cout << "  -r, --root DIR           Stack root (CFG_ROOT)\n";
    std::cout << "  -s, --services A,B       Services to act on\n";
    std::cout << "  -m, --firewall-mode M    open, restrict or custom\n";
    std::cout << "  -R, --restrict A,B       Restrict only these services (custom mode)\n";
    std::cout << "  -p, --port SVC=PORT      Override a service port (repeatable)\n";
    std::cout << "  -n, --dry-run            Log mutating commands instead of running them\n";
    std::cout << "  -v, --verbose            Verbose logging\n";
    std::cout << "  -o, --output FILE        Output file (config gen, diagnose)\n";
    std::cout << "  -a, --all                With down: also remove the shared network\n";
    std::cout << "  -h, --help               Show this help\n";
    std::cout << "\nExamples:\n";
    std::cout << "  clinicd up                         # Bring the stack up\n";
    std::cout << "  clinicd -s grafana service restart grafana\n";
    std::cout << "  clinicd vpn add laptop             # New VPN client\n";
    std::cout << "  clinicd diagnose && clinicd repair # Health pass\n";
}

static CliOptions parse_args(int argc, char* argv[]) {
    CliOptions opts;

    static struct option long_options[] = {{"config", required_argument, 0, 'c'},
                                           {"root", required_argument, 0, 'r'},
                                           {"services", required_argument, 0, 's'},
                                           {"firewall-mode", required_argument, 0, 'm'},
                                           {"restrict", required_argument, 0, 'R'},
                                           {"port", required_argument, 0, 'p'},
                                           {"dry-run", no_argument, 0, 'n'},
                                           {"verbose", no_argument, 0, 'v'},
                                           {"output", required_argument, 0, 'o'},
                                           {"all", no_argument, 0, 'a'},
                                           {"help", no_argument, 0, 'h'},
                                           {0, 0, 0, 0}};

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, "c:r:s:m:R:p:nvo:ah", long_options,
                              &option_index)) != -1) {
        switch (opt) {
        case 'c':
            opts.config_file = optarg;
            break;
        case 'r':
            opts.root = optarg;
            break;
        case 's':
            for (const auto& s : split(optarg, ','))
                opts.services.push_back(s);
            break;
        case 'm':
            opts.firewall_mode = optarg;
            break;
        case 'R':
            for (const auto& s : split(optarg, ','))
                opts.restricted.push_back(s);
            break;
        case 'p': {
            std::string item = optarg;
            auto eq = item.find('=');
            if (eq == std::string::npos || eq == 0 || eq + 1 == item.size()) {
                std::cerr << "Invalid --port value '" << item << "', expected SVC=PORT\n";
                exit(EXIT_USAGE);
            }
            opts.ports[item.substr(0, eq)] = item.substr(eq + 1);
            break;
        }
        case 'n':
            opts.dry_run = true;
            break;
        case 'v':
            opts.verbose = true;
            break;
        case 'o':
            opts.output = optarg;
            break;
        case 'a':
            opts.all = true;
            break;
        case 'h':
            print_help();
            exit(EXIT_OK);
        default:
            print_help();
            exit(EXIT_USAGE);
        }
    }

    if (optind < argc) {
        opts.command = argv[optind];
        optind++;
        while (optind < argc) {
            opts.args.push_back(argv[optind]);
            optind++;
        }
    }

    return opts;
}

// Flag > environment > file > default. Legacy or corrupt snapshots are moved
// aside first so they are regenerated on the next save.
static Config load_config(const CliOptions& opts) {
    fs::path state_path;
    if (!opts.config_file.empty()) {
        state_path = opts.config_file;
    } else {
        fs::path root = opts.root;
        if (root.empty()) {
            const char* env_root = std::getenv("CFG_ROOT");
            root = (env_root && *env_root) ? fs::path(env_root) : fs::path(DEFAULT_CFG_ROOT);
        }
        state_path = root / STATE_FILE_NAME;
    }

    Config config;
    if (prepare_snapshot(state_path)) {
        try {
            config = Config::from_file(state_path);
        } catch (const std::runtime_error& e) {
            throw ExitError(EXIT_CONFIG_INVALID, e.what());
        }
        LOG_DEBUG("Loaded desired state from " + state_path.string());
    }

    try {
        config.apply_env();
        config.merge_with_cli(opts.root, opts.services, opts.firewall_mode, opts.restricted,
                              opts.ports, opts.dry_run, opts.verbose);
    } catch (const std::runtime_error& e) {
        throw ExitError(EXIT_CONFIG_INVALID, std::string("Invalid configuration: ") + e.what());
    }
    return config;
}

static void require_root(const Config& config) {
    if (config.dry_run || is_root()) {
        return;
    }
    throw ExitError(EXIT_ROOT_REQUIRED, "This command must be run as root (or with --dry-run)");
}

static std::unique_ptr<FileLock> acquire_lock(const Config& config) {
    auto lock = std::make_unique<FileLock>(config.lock_file());
    if (!lock->locked()) {
        throw ExitError(EXIT_LOCK_HELD,
                        "Another orchestration pass is running (lock " +
                            config.lock_file().string() + ")");
    }
    return lock;
}

static std::vector<std::string> known_service_names(const Config& config) {
    std::set<std::string> names(config.selected_containers.begin(),
                                config.selected_containers.end());
    for (const auto& path : discover_descriptors(config.services_dir())) {
        names.insert(path.stem().string());
    }
    names.insert(config.vpn_service);
    return std::vector<std::string>(names.begin(), names.end());
}

static ServiceDescriptor find_descriptor(const Config& config, const std::string& name) {
    for (const auto& path : discover_descriptors(config.services_dir())) {
        if (path.stem().string() != name)
            continue;
        try {
            return load_descriptor(path);
        } catch (const std::runtime_error& e) {
            throw ExitError(EXIT_CONFIG_INVALID, e.what());
        }
    }
    throw ExitError(EXIT_CONFIG_INVALID, "No descriptor for service '" + name + "' in " +
                                             config.services_dir().string());
}

static json::Value string_list(const std::vector<std::string>& items) {
    json::Value list = json::Value::array();
    for (const auto& item : items) {
        list.push_back(json::Value(item));
    }
    return list;
}

static json::Value config_to_json(const Config& config) {
    json::Value root = json::Value::object();
    root["cfg_root"] = json::Value(config.cfg_root.string());
    root["services_dir"] = json::Value(config.services_dir().string());
    root["state_file"] = json::Value(config.state_file().string());
    root["lock_file"] = json::Value(config.lock_file().string());
    root["diagnostics_file"] = json::Value(config.diagnostics_file().string());
    root["wg_dir"] = json::Value(config.wg_dir.string());
    root["wg_server_conf"] = json::Value(config.wg_server_conf().string());
    root["docker_network_name"] = json::Value(config.docker_network_name);
    root["docker_network_subnet"] = json::Value(config.docker_network_subnet);
    root["lan_subnet"] = json::Value(config.lan_subnet);
    root["vpn_subnet"] = json::Value(config.vpn_subnet);
    root["vpn_subnet_base"] = json::Value(config.vpn_subnet_base);
    root["vpn_service"] = json::Value(config.vpn_service);
    root["wg_port"] = json::Value(config.wg_port);
    root["wg_client_dns"] = json::Value(config.wg_client_dns);
    root["dns_fallback"] = json::Value(config.dns_fallback);
    root["wg_endpoint"] = json::Value(config.wg_endpoint);
    root["backup_retention"] = json::Value(config.backup_retention);
    root["selected_containers"] = string_list(config.selected_containers);
    root["firewall_mode"] = json::Value(firewall_mode_to_string(config.firewall_mode));
    root["restricted_services"] = string_list(config.restricted_services);
    root["traefik_domain_mode"] = json::Value(config.traefik_domain_mode);
    root["traefik_domain_name"] = json::Value(config.traefik_domain_name);
    root["repair_max_attempts"] = json::Value(config.repair_max_attempts);
    root["repair_retry_delay"] = json::Value(config.repair_retry_delay);
    root["dry_run"] = json::Value(config.dry_run);
    root["verbose"] = json::Value(config.verbose);

    json::Value ports = json::Value::object();
    for (const auto& [key, port] : config.port_overrides) {
        ports[key] = json::Value(port);
    }
    root["port_overrides"] = ports;
    json::Value ips = json::Value::object();
    for (const auto& [key, ip] : config.container_ips) {
        ips[key] = json::Value(ip);
    }
    root["container_ips"] = ips;
    return root;
}

static int cmd_up(Config& config, SystemRunner& runner) {
    require_root(config);
    auto lock = acquire_lock(config);

    ContainerRuntime runtime(runner);
    runtime.check_available();

    std::vector<ServiceDescriptor> services = load_selected_descriptors(config);
    if (services.empty()) {
        LOG_WARN("No services selected in " + config.services_dir().string());
        return EXIT_OK;
    }

    return deploy_stack(config, runtime, services) ? EXIT_OK : EXIT_FAILURE_GENERAL;
}

static int cmd_down(const Config& config, SystemRunner& runner, bool all) {
    require_root(config);
    auto lock = acquire_lock(config);

    ContainerRuntime runtime(runner);
    runtime.check_available();

    LifecycleController lifecycle(config, runtime);
    return lifecycle.down(load_selected_descriptors(config), all) ? EXIT_OK
                                                                  : EXIT_FAILURE_GENERAL;
}

static int cmd_service(Config& config, SystemRunner& runner, const CliOptions& cli) {
    if (cli.args.size() < 2) {
        std::cerr << "Usage: clinicd service <start|stop|restart|remove|status> <name>\n";
        return EXIT_USAGE;
    }
    const std::string& subcmd = cli.args[0];
    const std::string& name = cli.args[1];

    ContainerRuntime runtime(runner);
    runtime.check_available();
    LifecycleController lifecycle(config, runtime);

    if (subcmd == "status") {
        ServiceStatus st = lifecycle.status(name);
        std::cout << st.name << ": "
                  << (!st.exists ? "absent" : (st.running ? "running" : "stopped"));
        if (st.exists) {
            std::cout << " (" << st.health << ")";
        }
        std::cout << "\n";
        return st.running ? EXIT_OK : EXIT_FAILURE_GENERAL;
    }

    require_root(config);
    auto lock = acquire_lock(config);

    bool ok;
    if (subcmd == "start") {
        ServiceDescriptor desc = find_descriptor(config, name);
        ok = lifecycle.start_service(desc);
        if (ok) {
            for (const auto& [svc, ip] : lifecycle.container_ips({desc})) {
                config.container_ips[service_env_key(svc)] = ip;
            }
            ok = save_desired_state(config);
        }
    } else if (subcmd == "stop") {
        ok = lifecycle.stop_service(name);
    } else if (subcmd == "restart") {
        ok = lifecycle.restart_service(name);
    } else if (subcmd == "remove") {
        ok = lifecycle.remove_service(name);
    } else {
        std::cerr << "Unknown service subcommand: " << subcmd << "\n";
        std::cerr << "Available: start, stop, restart, remove, status\n";
        return EXIT_USAGE;
    }
    return ok ? EXIT_OK : EXIT_FAILURE_GENERAL;
}

static int cmd_vpn(const Config& config, SystemRunner& runner, const CliOptions& cli) {
    if (cli.args.empty()) {
        std::cerr << "Usage: clinicd vpn <add|delete|list|reset-keys|regen|verify|restore> [arg]\n";
        return EXIT_USAGE;
    }
    const std::string& subcmd = cli.args[0];
    VpnManager vpn(config, runner);

    if (subcmd == "list") {
        auto clients = vpn.list_clients();
        if (clients.empty()) {
            std::cout << "No VPN clients.\n";
            return EXIT_OK;
        }
        for (const auto& c : clients) {
            std::cout << c.name << "\t" << c.address << "\t" << c.created << "\n";
        }
        return EXIT_OK;
    }
    if (subcmd == "verify") {
        if (cli.args.size() < 2) {
            std::cerr << "Usage: clinicd vpn verify <archive>\n";
            return EXIT_USAGE;
        }
        return vpn.verify_backup(cli.args[1]) ? EXIT_OK : EXIT_FAILURE_GENERAL;
    }

    require_root(config);
    auto lock = acquire_lock(config);

    if (subcmd == "restore") {
        if (cli.args.size() < 2) {
            std::cerr << "Usage: clinicd vpn restore <archive>\n";
            return EXIT_USAGE;
        }
        return vpn.restore_backup(cli.args[1]) ? EXIT_OK : EXIT_FAILURE_GENERAL;
    }
    if (subcmd == "add" || subcmd == "delete") {
        if (cli.args.size() < 2) {
            std::cerr << "Usage: clinicd vpn " << subcmd << " <name>\n";
            return EXIT_USAGE;
        }
        const std::string& name = cli.args[1];
        if (subcmd == "add") {
            VpnClientRecord record = vpn.add_client(name);
            std::cout << "Added " << record.name << " at " << record.address << "\n";
            std::cout << "Config: " << (record.dir / (record.name + ".conf")).string() << "\n";
            return EXIT_OK;
        }
        return vpn.delete_client(name) ? EXIT_OK : EXIT_FAILURE_GENERAL;
    } else if (subcmd == "reset-keys") {
        return vpn.reset_keys() ? EXIT_OK : EXIT_FAILURE_GENERAL;
    } else if (subcmd == "regen") {
        return vpn.regenerate_server_config() ? EXIT_OK : EXIT_FAILURE_GENERAL;
    }

    std::cerr << "Unknown vpn subcommand: " << subcmd << "\n";
    std::cerr << "Available: add, delete, list, reset-keys, regen, verify, restore\n";
    return EXIT_USAGE;
}

static int cmd_firewall(const Config& config, SystemRunner& runner, const CliOptions& cli) {
    if (cli.args.empty()) {
        std::cerr << "Usage: clinicd firewall <plan|apply>\n";
        return EXIT_USAGE;
    }
    const std::string& subcmd = cli.args[0];
    std::vector<ServiceDescriptor> services = load_selected_descriptors(config);
    FirewallEngine engine(config, runner);

    if (subcmd == "plan") {
        auto rules = engine.plan(services);
        if (rules.empty()) {
            std::cout << "No firewall rules for the selected services.\n";
        }
        for (const auto& rule : rules) {
            std::cout << rule.describe() << "\n";
        }
        return EXIT_OK;
    } else if (subcmd == "apply") {
        require_root(config);
        auto lock = acquire_lock(config);
        FirewallReport report = engine.apply(services);
        if (report.backend.empty()) {
            std::cout << "No firewall backend available, nothing applied.\n";
            return EXIT_OK;
        }
        std::cout << report.backend << ": " << report.added << " added, " << report.present
                  << " already present, " << report.failed << " failed\n";
        return report.failed == 0 ? EXIT_OK : EXIT_FAILURE_GENERAL;
    }

    std::cerr << "Unknown firewall subcommand: " << subcmd << "\n";
    std::cerr << "Available: plan, apply\n";
    return EXIT_USAGE;
}

static int cmd_diagnose(const Config& config, SystemRunner& runner, const CliOptions& cli) {
    ContainerRuntime runtime(runner);
    runtime.check_available();

    Diagnostics diagnostics(config, runtime);
    DiagnosticsReport report = diagnostics.run(load_selected_descriptors(config));

    fs::path out = cli.output.empty() ? config.diagnostics_file() : fs::path(cli.output);
    if (!diagnostics.write_report(report, out)) {
        return EXIT_FAILURE_GENERAL;
    }
    std::cout << (report.passed() ? "PASS" : "FAIL") << " (" << report.failures.size()
              << " failure(s)) -> " << out.string() << "\n";
    return report.passed() ? EXIT_OK : EXIT_FAILURE_GENERAL;
}

static int cmd_repair(const Config& config, SystemRunner& runner, const CliOptions& cli) {
    auto lock = acquire_lock(config);

    fs::path path = cli.args.empty() ? config.diagnostics_file() : fs::path(cli.args[0]);
    LoadedReport loaded = load_report(path);
    if (loaded.status == ReportStatus::Missing) {
        throw ExitError(EXIT_DIAGNOSTICS_MISSING, loaded.error);
    }
    if (loaded.status == ReportStatus::Invalid) {
        throw ExitError(EXIT_DIAGNOSTICS_INVALID, "Invalid diagnostics report " + loaded.error);
    }

    RepairSummary summary;
    if (loaded.failures.empty()) {
        LOG_INFO("No failures reported, nothing to repair");
    } else {
        ContainerRuntime runtime(runner);
        runtime.check_available();

        SubstringClassifier classifier(known_service_names(config));
        AutoRepair repair(config, runtime, classifier);
        summary = repair.repair(loaded.failures);

        for (const auto& failure : summary.unclassified) {
            LOG_WARN("Unattributed failure: " + failure);
        }
        std::cout << summary.restarted.size() << " restarted, " << summary.skipped.size()
                  << " skipped, " << summary.failed.size() << " failed\n";
    }

    if (summary.failed.empty() && !config.dry_run) {
        std::error_code ec;
        fs::remove(path, ec);
        if (ec) {
            LOG_WARN("Cannot remove " + path.string() + ": " + ec.message());
        }
    }
    return EXIT_OK;
}

static int cmd_config(const CliOptions& cli) {
    if (cli.args.empty()) {
        std::cerr << "Usage: clinicd config <gen|show>\n";
        return EXIT_USAGE;
    }
    const std::string& subcmd = cli.args[0];

    if (subcmd == "gen") {
        Config defaults;
        defaults.merge_with_cli(cli.root, cli.services, cli.firewall_mode, cli.restricted,
                                cli.ports, false, false);
        fs::path output = cli.output.empty() ? defaults.state_file() : fs::path(cli.output);
        if (!DesiredStateSnapshot::capture(defaults).save(output)) {
            std::cerr << "Failed to write " << output.string() << "\n";
            return EXIT_FAILURE_GENERAL;
        }
        std::cout << "Generated config: " << output.string() << "\n";
        return EXIT_OK;
    } else if (subcmd == "show") {
        Config config = load_config(cli);
        std::cout << json::dump(config_to_json(config), 2) << "\n";
        return EXIT_OK;
    }

    std::cerr << "Unknown config subcommand: " << subcmd << "\n";
    std::cerr << "Available: gen, show\n";
    return EXIT_USAGE;
}

static int cmd_state(const Config& config, const CliOptions& cli) {
    if (cli.args.empty() || cli.args[0] != "show") {
        std::cerr << "Usage: clinicd state show\n";
        return EXIT_USAGE;
    }
    fs::path path = cli.config_file.empty() ? config.state_file() : fs::path(cli.config_file);
    std::string error;
    SnapshotStatus status = inspect_snapshot(path, &error);
    std::cout << "# " << path.string() << ": " << snapshot_status_to_string(status);
    if (!error.empty()) {
        std::cout << " (" << error << ")";
    }
    std::cout << "\n";
    if (status == SnapshotStatus::Missing) {
        std::cout << DesiredStateSnapshot::capture(config).render();
        return EXIT_OK;
    }
    std::cout << read_file(path);
    return status == SnapshotStatus::Valid ? EXIT_OK : EXIT_CONFIG_INVALID;
}

int main(int argc, char* argv[]) {
    try {
        CliOptions cli = parse_args(argc, argv);

        // Console only until the configuration names the log directory
        Logger::getInstance().init(cli.verbose, fs::path());

        std::string command = cli.command.empty() ? "up" : cli.command;

        enum class Command {
            UP,
            DOWN,
            SERVICE,
            RENDER,
            VPN,
            FIREWALL,
            DIAGNOSE,
            REPAIR,
            CONFIG,
            STATE,
            UNKNOWN
        };

        auto get_command = [](const std::string& cmd) -> Command {
            if (cmd == "up")
                return Command::UP;
            if (cmd == "down")
                return Command::DOWN;
            if (cmd == "service")
                return Command::SERVICE;
            if (cmd == "render")
                return Command::RENDER;
            if (cmd == "vpn")
                return Command::VPN;
            if (cmd == "firewall")
                return Command::FIREWALL;
            if (cmd == "diagnose")
                return Command::DIAGNOSE;
            if (cmd == "repair")
                return Command::REPAIR;
            if (cmd == "config")
                return Command::CONFIG;
            if (cmd == "state")
                return Command::STATE;
            return Command::UNKNOWN;
        };

        Command cmd = get_command(command);
        if (cmd == Command::UNKNOWN) {
            std::cerr << "Unknown command: " << command << "\n\n";
            print_help();
            return EXIT_USAGE;
        }
        if (cmd == Command::CONFIG) {
            return cmd_config(cli);
        }

        Config config = load_config(cli);
        Logger::getInstance().init(config.verbose, config.log_dir() / DAEMON_LOG_NAME);

        SystemRunner runner;
        runner.set_dry_run(config.dry_run);
        if (config.dry_run) {
            LOG_INFO("Dry-run: mutating commands are logged, not executed");
        }

        switch (cmd) {
        case Command::UP:
            return cmd_up(config, runner);
        case Command::DOWN:
            return cmd_down(config, runner, cli.all);
        case Command::SERVICE:
            return cmd_service(config, runner, cli);
        case Command::RENDER: {
            if (cli.args.empty()) {
                std::cerr << "Usage: clinicd render <name>\n";
                return EXIT_USAGE;
            }
            ServiceDescriptor desc = find_descriptor(config, cli.args[0]);
            try {
                std::cout << CommandSynthesizer(config).synthesize(desc).to_string() << "\n";
            } catch (const std::runtime_error& e) {
                throw ExitError(EXIT_CONFIG_INVALID, e.what());
            }
            return EXIT_OK;
        }
        case Command::VPN:
            return cmd_vpn(config, runner, cli);
        case Command::FIREWALL:
            return cmd_firewall(config, runner, cli);
        case Command::DIAGNOSE:
            return cmd_diagnose(config, runner, cli);
        case Command::REPAIR:
            return cmd_repair(config, runner, cli);
        case Command::STATE:
            return cmd_state(config, cli);
        case Command::CONFIG:
        case Command::UNKNOWN:
            break;
        }
        return EXIT_USAGE;
    } catch (const ExitError& e) {
        LOG_ERROR(e.what());
        return e.code();
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Fatal: ") + e.what());
        return EXIT_FAILURE_GENERAL;
    }
}

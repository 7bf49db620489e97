#include "conf/config.hpp"
#include "conf/descriptor.hpp"
#include "fake_runner.hpp"
#include "utils.hpp"

#include <cassert>
#include <cstdlib>
#include <stdexcept>
#include <string>

using namespace clinic;
using clinic_test::TempDir;

int main() {
    {
        ServiceDescriptor desc = ServiceDescriptor::parse(
            "grafana",
            "# Grafana dashboards\n"
            "image=grafana/grafana:10.2.0\n"
            "\n"
            "port=3000\n"
            "env=GF_SERVER_ROOT_URL=http://localhost:3000/?a=b\n"
            "no equals sign here\n"
            "port=3001\n");
        assert(desc.name == "grafana");
        assert(desc.get("image") == "grafana/grafana:10.2.0");
        assert(desc.get("env") == "GF_SERVER_ROOT_URL=http://localhost:3000/?a=b");
        // Last value wins, first position kept
        assert(desc.get("port") == "3001");
        assert(desc.options.size() == 3);
        assert(desc.options[1].first == "port");
        assert(!desc.has("volumes"));
        assert(desc.get("volumes", "none") == "none");
    }

    {
        VarMap vars = {{"CFG_ROOT", "/srv/stack"}};
        assert(expand_vars("${CFG_ROOT}/data", vars) == "/srv/stack/data");
        assert(expand_vars("$CFG_ROOT/data", vars) == "/srv/stack/data");
        assert(expand_vars("${UNSET_CLINIC_VAR:-fallback}", vars) == "fallback");
        assert(expand_vars("${UNSET_CLINIC_VAR}", vars) == "");
        assert(expand_vars("cost $5", vars) == "cost $5");

        setenv("CLINIC_TEST_VAR", "from-env", 1);
        assert(expand_vars("$CLINIC_TEST_VAR", vars) == "from-env");
        unsetenv("CLINIC_TEST_VAR");
    }

    // Mount specs are left to the volume handler
    {
        ServiceDescriptor desc;
        desc.name = "x";
        desc.set("volumes", "${CFG_ROOT}/x:/data");
        desc.set("hostname", "${CFG_ROOT}");
        VarMap vars = {{"CFG_ROOT", "/srv"}};
        assert(desc.value("volumes", vars) == "${CFG_ROOT}/x:/data");
        assert(desc.value("hostname", vars) == "/srv");
    }

    {
        ServiceDescriptor desc;
        desc.name = "noimage";
        std::string error;
        assert(!validate_descriptor(desc, error));
        assert(error.find("image") != std::string::npos);

        desc.set("service_type", "systemd");
        assert(desc.is_systemd());
        assert(validate_descriptor(desc, error));
    }

    // Discovery: flat files win over nested, results sorted
    {
        TempDir tmp;
        Config config;
        config.cfg_root = tmp.path();
        fs::path dir = config.services_dir();
        write_file(dir / "ollama.conf", "image=ollama/ollama\n");
        write_file(dir / "grafana" / "grafana.conf", "image=grafana/grafana\n");
        write_file(dir / "ollama" / "ollama.conf", "image=shadowed\n");
        write_file(dir / "broken.conf", "port=80\n");
        write_file(dir / "README.md", "not a descriptor\n");

        auto paths = discover_descriptors(dir);
        assert(paths.size() == 3);
        assert(paths[0].stem() == "broken");
        assert(paths[1].stem() == "grafana");
        assert(paths[2] == dir / "ollama.conf");

        auto loaded = load_selected_descriptors(config);
        assert(loaded.size() == 2);
        assert(loaded[0].name == "grafana");
        assert(loaded[1].get("image") == "ollama/ollama");

        config.selected_containers = {"ollama", "missing"};
        loaded = load_selected_descriptors(config);
        assert(loaded.size() == 1 && loaded[0].name == "ollama");

        bool threw = false;
        try {
            load_descriptor(dir / "broken.conf");
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);
    }

    // Names whose snapshot keys clash are refused
    {
        ServiceDescriptor wg = ServiceDescriptor::parse("wg", "image=linuxserver/wireguard\n");
        std::string error;
        assert(!validate_descriptor(wg, error));
        assert(error.find("WG_PORT") != std::string::npos);

        TempDir tmp;
        Config config;
        config.cfg_root = tmp.path();
        fs::path dir = config.services_dir();
        write_file(dir / "home-assistant.conf", "image=homeassistant/home-assistant\n");
        write_file(dir / "home_assistant.conf", "image=shadow\n");
        write_file(dir / "wg.conf", "image=linuxserver/wireguard\n");

        auto loaded = load_selected_descriptors(config);
        assert(loaded.size() == 1);
        assert(loaded[0].name == "home-assistant");
    }

    {
        auto none = discover_descriptors("/nonexistent/clinic/services");
        assert(none.empty());
    }

    return 0;
}

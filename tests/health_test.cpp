#include "conf/config.hpp"
#include "conf/descriptor.hpp"
#include "core/health.hpp"
#include "core/json.hpp"
#include "core/runtime.hpp"
#include "fake_runner.hpp"
#include "utils.hpp"

#include <cassert>
#include <map>
#include <string>
#include <vector>

using namespace clinic;
using clinic_test::FakeRunner;
using clinic_test::TempDir;

namespace {

// docker inspect answers from a name -> state table; absent names fail.
class InspectRunner : public FakeRunner {
public:
    InspectRunner() { install("docker"); }

    CommandResult execute(const std::vector<std::string>& argv,
                          const std::string& input) override {
        CommandResult scripted = FakeRunner::execute(argv, input);
        if (argv.size() == 5 && argv[0] == "docker" && argv[1] == "inspect") {
            auto it = state.find(argv[4]);
            if (it == state.end())
                return CommandResult{1, "Error: No such object: " + argv[4]};
            if (argv[3] == "{{.State.Running}}") {
                bool up = it->second != "exited";
                return CommandResult{0, up ? "true\n" : "false\n"};
            }
            return CommandResult{0, it->second + "\n"};
        }
        return scripted;
    }

    std::map<std::string, std::string> state;
};

ServiceDescriptor make(const std::string& name) {
    return ServiceDescriptor::parse(name, "image=example/" + name + "\n");
}

}  // namespace

int main() {
    {
        json::Value v = json::parse(
            "{\"source\": \"clinicd\", \"n\": 3, \"ok\": true, \"list\": [\"a\", 1, null],"
            " \"esc\": \"line\\nnext \\u0041\"}");
        assert(v.is_object());
        assert(v.find("source")->as_string() == "clinicd");
        assert(v.find("n")->as_number() == 3);
        assert(v.find("ok")->as_bool());
        assert(v.find("list")->size() == 3);
        assert(v.find("list")->items()[2].is_null());
        assert(v.find("esc")->as_string() == "line\nnext A");
        assert(v.find("missing") == nullptr);

        json::Value again = json::parse(json::dump(v, 2));
        assert(json::dump(again) == json::dump(v));
        assert(json::dump(json::Value::array()) == "[]");

        bool threw = false;
        try {
            json::parse("{\"failures\": [\"a\",]");
        } catch (const json::ParseError&) {
            threw = true;
        }
        assert(threw);
    }

    // Surrogate pairs decode to one code point; lone halves are rejected
    {
        json::Value v = json::parse("{\"emoji\": \"\\uD83D\\uDE00 ok\", \"e\": \"\\u00e9\"}");
        assert(v.find("emoji")->as_string() == "\xF0\x9F\x98\x80 ok");
        assert(v.find("e")->as_string() == "\xC3\xA9");

        for (const char* bad : {"{\"s\": \"\\uD83D\"}", "{\"s\": \"\\uD83Dx\"}",
                                "{\"s\": \"\\uD83D\\u0041\"}", "{\"s\": \"\\uDE00\"}"}) {
            bool rejected = false;
            try {
                json::parse(bad);
            } catch (const json::ParseError&) {
                rejected = true;
            }
            assert(rejected);
        }
    }

    // Longest name, then earliest occurrence, then lexicographic
    {
        SubstringClassifier classifier({"grafana", "grafana-agent", "ollama", "wireguard"});
        assert(classifier.classify("grafana-agent service is not running") == "grafana-agent");
        assert(classifier.classify("Grafana service is not running") == "grafana");
        assert(classifier.classify("DNS resolution failed via 1.1.1.2") == "");

        SubstringClassifier same_length({"alpha", "omega"});
        assert(same_length.classify("omega depends on alpha") == "omega");

        SubstringClassifier case_twins({"abc", "ABC"});
        assert(case_twins.classify("abc is down") == "ABC");
    }

    // Zero failures restart nothing
    {
        Config config;
        InspectRunner runner;
        ContainerRuntime runtime(runner);
        SubstringClassifier classifier({"grafana"});
        AutoRepair repair(config, runtime, classifier, [](int) {});

        RepairSummary summary = repair.repair({});
        assert(summary.restarted.empty() && summary.failed.empty());
        assert(runner.calls.empty());
    }

    // One restart sequence for the flagged service only
    {
        Config config;
        InspectRunner runner;
        runner.state = {{"grafana", "unhealthy"}, {"ollama", "unhealthy"}};
        ContainerRuntime runtime(runner);
        SubstringClassifier classifier({"grafana", "ollama"});
        AutoRepair repair(config, runtime, classifier, [](int) {});

        RepairSummary summary =
            repair.repair({"grafana service is not running", "grafana health check failed",
                           "something unrelated"});
        assert(summary.restarted.size() == 1 && summary.restarted[0] == "grafana");
        assert(summary.unclassified.size() == 1);
        assert(runner.count({"docker", "restart", "grafana"}) == 1);
        assert(!runner.called({"docker", "restart", "ollama"}));
    }

    // Healthy, starting and missing containers are left alone
    {
        Config config;
        InspectRunner runner;
        runner.state = {{"a", "healthy"}, {"b", "starting"}, {"c", "running"}};
        ContainerRuntime runtime(runner);
        SubstringClassifier classifier({"a", "b", "c", "d"});
        AutoRepair repair(config, runtime, classifier, [](int) {});

        RepairSummary summary = repair.repair({"a", "b", "c", "d"});
        assert(summary.skipped.size() == 4);
        assert(!runner.called({"docker", "restart"}));
        assert(!runner.called({"docker", "run"}));
    }

    // Bounded retries with linear backoff, exhaustion is not fatal
    {
        Config config;
        config.repair_max_attempts = 3;
        config.repair_retry_delay = 5;
        InspectRunner runner;
        runner.state = {{"ollama", "exited"}};
        runner.respond({"docker", "restart", "ollama"}, 1, "daemon error");
        ContainerRuntime runtime(runner);
        SubstringClassifier classifier({"ollama"});
        std::vector<int> delays;
        AutoRepair repair(config, runtime, classifier, [&delays](int s) { delays.push_back(s); });

        RepairSummary summary = repair.repair({"ollama service is not running"});
        assert(summary.failed.size() == 1 && summary.restarted.empty());
        assert(runner.count({"docker", "restart", "ollama"}) == 3);
        assert((delays == std::vector<int>{5, 10}));

        runner.respond({"docker", "restart", "ollama"}, 0, "");
        delays.clear();
        assert(repair.restart_with_retry("ollama"));
        assert(delays.empty());
    }

    // Report loading: missing, invalid, empty, shapeless
    {
        TempDir tmp;
        fs::path path = tmp.path() / "diagnostics.json";
        assert(load_report(path).status == ReportStatus::Missing);

        write_file(path, "{not json");
        assert(load_report(path).status == ReportStatus::Invalid);

        write_file(path, "   \n");
        LoadedReport empty = load_report(path);
        assert(empty.status == ReportStatus::Ok && empty.failures.empty());

        write_file(path, "{\"status\": \"FAIL\", \"failures\": \"grafana\"}");
        LoadedReport shapeless = load_report(path);
        assert(shapeless.status == ReportStatus::Ok && shapeless.failures.empty());

        write_file(path, "{\"failures\": [\"grafana down\", 42, \"ollama down\"]}");
        LoadedReport mixed = load_report(path);
        assert(mixed.status == ReportStatus::Ok);
        assert(mixed.failures.size() == 2 && mixed.failures[1] == "ollama down");
    }

    // Diagnostics feed the repair step through the report file
    {
        TempDir tmp;
        Config config;
        config.cfg_root = tmp.path();
        InspectRunner runner;
        runner.install("ss");
        runner.state = {{"grafana", "healthy"}, {"ollama", "exited"}, {"wireguard", "running"}};
        runner.respond({"ss", "-lun"}, 0,
                       "State Recv-Q Send-Q Local Address:Port Peer Address:Port\n"
                       "UNCONN 0 0 0.0.0.0:5353 0.0.0.0:*\n");
        ContainerRuntime runtime(runner);

        Diagnostics diagnostics(config, runtime);
        DiagnosticsReport report =
            diagnostics.run({make("grafana"), make("ollama"), make("wireguard")});
        assert(!report.passed());
        assert(report.failures.size() == 2);
        assert(report.failures[0] == "ollama service is not running");
        assert(report.failures[1] == "WireGuard port 51820 not listening");
        assert(!runner.called({"dig"}));

        json::Value doc = report.to_json();
        assert(doc.find("status")->as_string() == "FAIL");
        assert(doc.find("source")->as_string() == "clinicd");

        assert(diagnostics.write_report(report, config.diagnostics_file()));
        LoadedReport loaded = load_report(config.diagnostics_file());
        assert(loaded.status == ReportStatus::Ok);
        assert(loaded.failures == report.failures);

        runner.respond({"ss", "-lun"}, 0, "UNCONN 0 0 0.0.0.0:51820 0.0.0.0:*\n");
        runner.state["ollama"] = "running";
        runner.install("dig");
        runner.respond({"dig"}, 0, "93.184.216.34\n");
        report = diagnostics.run({make("grafana"), make("ollama"), make("wireguard")});
        assert(report.passed());
        assert(report.to_json().find("status")->as_string() == "PASS");

        runner.respond({"dig"}, 9, "");
        report = diagnostics.run({make("grafana")});
        assert(report.failures.size() == 1);
        assert(report.failures[0] == "DNS resolution failed via " + config.wg_client_dns);
    }

    return 0;
}

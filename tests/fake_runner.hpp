// tests/fake_runner.hpp - Scripted CommandRunner and scratch directories
#pragma once

#include "utils.hpp"

#include <cstdlib>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace clinic_test {

// Records every call. Responses are matched by argv prefix; the longest
// matching prefix wins, and among equal lengths the most recent one.
class FakeRunner : public clinic::CommandRunner {
public:
    struct Script {
        std::vector<std::string> prefix;
        clinic::CommandResult result;
    };

    void respond(const std::vector<std::string>& prefix, int exit_code,
                 const std::string& output = "") {
        scripts.push_back({prefix, clinic::CommandResult{exit_code, output}});
    }

    void install(const std::string& program) { programs.insert(program); }

    clinic::CommandResult execute(const std::vector<std::string>& argv,
                                  const std::string& input) override {
        calls.push_back(argv);
        inputs.push_back(input);
        const Script* best = nullptr;
        for (const auto& s : scripts) {
            if (matches(s.prefix, argv) && (!best || s.prefix.size() >= best->prefix.size())) {
                best = &s;
            }
        }
        return best ? best->result : default_result;
    }

    bool program_exists(const std::string& program) override {
        return programs.count(program) > 0;
    }

    size_t count(const std::vector<std::string>& prefix) const {
        size_t n = 0;
        for (const auto& call : calls) {
            if (matches(prefix, call))
                ++n;
        }
        return n;
    }

    bool called(const std::vector<std::string>& prefix) const { return count(prefix) > 0; }

    std::vector<std::vector<std::string>> calls;
    std::vector<std::string> inputs;
    std::vector<Script> scripts;
    std::set<std::string> programs;
    clinic::CommandResult default_result{0, ""};

private:
    static bool matches(const std::vector<std::string>& prefix,
                        const std::vector<std::string>& argv) {
        if (prefix.size() > argv.size())
            return false;
        for (size_t i = 0; i < prefix.size(); ++i) {
            if (prefix[i] != argv[i])
                return false;
        }
        return true;
    }
};

// mkdtemp directory removed on destruction.
class TempDir {
public:
    TempDir() {
        std::string tmpl = (fs::temp_directory_path() / "clinic-test-XXXXXX").string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        if (mkdtemp(buf.data()) == nullptr) {
            throw std::runtime_error("mkdtemp failed for " + tmpl);
        }
        path_ = buf.data();
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

}  // namespace clinic_test

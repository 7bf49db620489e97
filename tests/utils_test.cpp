#include "fake_runner.hpp"
#include "defs.hpp"
#include "utils.hpp"

#include <sys/stat.h>

#include <cassert>
#include <string>

using namespace clinic;
using clinic_test::FakeRunner;
using clinic_test::TempDir;

int main() {
    {
        assert(trim("  a b \n") == "a b");
        assert(trim(" \t ") == "");
        assert(to_lower("GraFana") == "grafana");
        assert(starts_with("10.8.0.4", "10.8.0."));
        assert(!starts_with("10.8", "10.8.0."));
    }

    {
        auto parts = split(" a, ,b ,c", ',');
        assert(parts.size() == 3);
        assert(parts[0] == "a" && parts[1] == "b" && parts[2] == "c");
        auto words = split_whitespace("  tcp   LISTEN 0  ");
        assert(words.size() == 3 && words[1] == "LISTEN");
        assert(join({"a", "b"}, ",") == "a,b");
    }

    {
        assert(shell_quote("plain") == "plain");
        assert(shell_quote("two words") == "'two words'");
        assert(shell_quote("it's") == "'it'\\''s'");
        assert(shell_quote("") == "''");
    }

    {
        assert(is_truthy("yes") && is_truthy("TRUE") && is_truthy("1"));
        assert(!is_truthy("no") && !is_truthy(""));
        assert(is_all_digits("51820"));
        assert(!is_all_digits("") && !is_all_digits("80a"));
    }

    // Atomic private write leaves no temp file and mode 0600
    {
        TempDir tmp;
        fs::path file = tmp.path() / "nested" / "keys.env";
        assert(write_file_atomic(file, "A=1\n", true));
        assert(read_file(file) == "A=1\n");
        fs::path leftover = file;
        leftover += ".tmp";
        assert(!fs::exists(leftover));

        struct stat st;
        assert(stat(file.c_str(), &st) == 0);
        assert((st.st_mode & 0777) == 0600);
    }

    // Second holder of the lock fails fast
    {
        TempDir tmp;
        fs::path lock_path = tmp.path() / "cache" / "clinic.lock";
        {
            FileLock first(lock_path);
            assert(first.locked());
            FileLock second(lock_path);
            assert(!second.locked());
        }
        FileLock again(lock_path);
        assert(again.locked());
    }

    // Dry-run suppresses mutations but not queries
    {
        FakeRunner runner;
        runner.set_dry_run(true);
        CommandResult r = runner.mutate({"docker", "rm", "-f", "x"});
        assert(r.ok());
        assert(runner.calls.empty());
        runner.run({"docker", "ps"});
        assert(runner.calls.size() == 1);
    }

    {
        SystemRunner runner;
        assert(runner.program_exists("sh"));
        assert(!runner.program_exists("clinic-no-such-program"));
        CommandResult r = runner.run({"sh", "-c", "cat; echo err >&2; exit 3"}, "in\n");
        assert(r.exit_code == 3);
        assert(r.output.find("in") != std::string::npos);
        assert(r.output.find("err") != std::string::npos);
    }

    {
        ExitError e(EXIT_LOCK_HELD, "busy");
        assert(e.code() == 75);
        assert(std::string(e.what()) == "busy");
    }

    return 0;
}

// utils.hpp - Utility functions
#pragma once

#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace clinic {

// Logging
class Logger {
public:
  static Logger &getInstance();
  void init(bool verbose, const fs::path &log_path);
  void log(const std::string &level, const std::string &message);

private:
  Logger() = default;
  bool verbose_ = false;
  std::unique_ptr<std::ofstream> log_file_;
};

#define LOG_INFO(msg) ::clinic::Logger::getInstance().log("INFO", msg)
#define LOG_WARN(msg) ::clinic::Logger::getInstance().log("WARN", msg)
#define LOG_ERROR(msg) ::clinic::Logger::getInstance().log("ERROR", msg)
#define LOG_DEBUG(msg) ::clinic::Logger::getInstance().log("DEBUG", msg)

// Fatal error carrying the process exit code main() should return.
class ExitError : public std::runtime_error {
public:
  ExitError(int code, const std::string &message)
      : std::runtime_error(message), code_(code) {}

  int code() const { return code_; }

private:
  int code_;
};

// File system utilities
bool ensure_dir_exists(const fs::path &path);
std::string read_file(const fs::path &path);
bool write_file(const fs::path &path, const std::string &content,
                bool private_mode = false);
bool write_file_atomic(const fs::path &path, const std::string &content,
                       bool private_mode = false);

// String utilities
std::string trim(const std::string &s);
std::string to_lower(std::string s);
bool starts_with(const std::string &s, const std::string &prefix);
bool contains(const std::string &s, const std::string &needle);
std::vector<std::string> split(const std::string &s, char delim);
std::vector<std::string> split_whitespace(const std::string &s);
std::string join(const std::vector<std::string> &parts,
                 const std::string &sep);
std::string shell_quote(const std::string &s);
bool is_truthy(const std::string &value);
bool is_all_digits(const std::string &s);

// Time
std::string timestamp(const char *format = "%Y%m%d-%H%M%S");
std::string iso_timestamp();

// Advisory lock held for the lifetime of the object.
// Acquisition never blocks: locked() is false when another process holds it.
class FileLock {
public:
  explicit FileLock(const fs::path &path);
  ~FileLock();

  FileLock(const FileLock &) = delete;
  FileLock &operator=(const FileLock &) = delete;

  bool locked() const { return fd_ >= 0; }
  const fs::path &path() const { return path_; }

private:
  fs::path path_;
  int fd_ = -1;
};

// Process utilities
struct CommandResult {
  int exit_code = -1;
  std::string output;

  bool ok() const { return exit_code == 0; }
};

// Every external tool (docker, wg, ufw, iptables, ...) is reached through
// this interface. run() always executes; mutate() is a no-op that reports
// success in dry-run mode.
class CommandRunner {
public:
  virtual ~CommandRunner() = default;

  virtual CommandResult execute(const std::vector<std::string> &argv,
                                const std::string &input) = 0;
  virtual bool program_exists(const std::string &program) = 0;

  CommandResult run(const std::vector<std::string> &argv,
                    const std::string &input = "");
  CommandResult mutate(const std::vector<std::string> &argv,
                       const std::string &input = "");

  void set_dry_run(bool dry_run) { dry_run_ = dry_run; }
  bool dry_run() const { return dry_run_; }

private:
  bool dry_run_ = false;
};

// fork/exec based runner, stderr is merged into the captured output.
class SystemRunner : public CommandRunner {
public:
  CommandResult execute(const std::vector<std::string> &argv,
                        const std::string &input) override;
  bool program_exists(const std::string &program) override;
};

bool is_root();

} // namespace clinic

// utils.cpp - Utility functions implementation
#include "utils.hpp"
#include "defs.hpp"
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <iostream>
#include <signal.h>
#include <sstream>
#include <sys/file.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace clinic {

// Logger implementation
Logger &Logger::getInstance() {
  static Logger instance;
  return instance;
}

void Logger::init(bool verbose, const fs::path &log_path) {
  verbose_ = verbose;

  if (!log_path.empty()) {
    std::error_code ec;
    if (log_path.has_parent_path()) {
      fs::create_directories(log_path.parent_path(), ec);
    }
    if (ec) {
      std::cerr << "Cannot create log directory " << log_path.parent_path()
                << ": " << ec.message() << "\n";
      return;
    }
    log_file_ = std::make_unique<std::ofstream>(log_path, std::ios::app);
  }
}

void Logger::log(const std::string &level, const std::string &message) {
  // Skip DEBUG messages if not in verbose mode
  if (level == "DEBUG" && !verbose_) {
    return;
  }

  auto now = std::time(nullptr);
  char time_buf[64];
  std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%d %H:%M:%S",
                std::localtime(&now));

  std::string log_line =
      std::string("[") + time_buf + "] [" + level + "] " + message + "\n";

  if (log_file_ && log_file_->is_open()) {
    *log_file_ << log_line;
    log_file_->flush();
  }

  std::cerr << log_line;
}

// File system utilities
bool ensure_dir_exists(const fs::path &path) {
  try {
    if (!fs::exists(path)) {
      fs::create_directories(path);
    }
    return true;
  } catch (const std::exception &e) {
    LOG_ERROR("Failed to create directory " + path.string() + ": " + e.what());
    return false;
  }
}

std::string read_file(const fs::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return "";
  }
  std::stringstream ss;
  ss << file.rdbuf();
  return ss.str();
}

bool write_file(const fs::path &path, const std::string &content,
                bool private_mode) {
  if (path.has_parent_path() && !ensure_dir_exists(path.parent_path())) {
    return false;
  }

  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file.is_open()) {
    LOG_ERROR("Cannot write " + path.string());
    return false;
  }
  file << content;
  file.close();
  if (!file) {
    LOG_ERROR("Short write on " + path.string());
    return false;
  }

  if (private_mode) {
    std::error_code ec;
    fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write,
                    fs::perm_options::replace, ec);
    if (ec) {
      LOG_WARN("chmod 600 failed for " + path.string() + ": " + ec.message());
    }
  }
  return true;
}

bool write_file_atomic(const fs::path &path, const std::string &content,
                       bool private_mode) {
  fs::path tmp = path;
  tmp += ".tmp";
  if (!write_file(tmp, content, private_mode)) {
    return false;
  }

  std::error_code ec;
  fs::rename(tmp, path, ec);
  if (ec) {
    LOG_ERROR("Failed to replace " + path.string() + ": " + ec.message());
    fs::remove(tmp, ec);
    return false;
  }
  return true;
}

// String utilities
std::string trim(const std::string &s) {
  auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return "";
  }
  auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

std::string to_lower(std::string s) {
  for (char &c : s) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return s;
}

bool starts_with(const std::string &s, const std::string &prefix) {
  return s.compare(0, prefix.size(), prefix) == 0;
}

bool contains(const std::string &s, const std::string &needle) {
  return s.find(needle) != std::string::npos;
}

std::vector<std::string> split(const std::string &s, char delim) {
  std::vector<std::string> parts;
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    item = trim(item);
    if (!item.empty()) {
      parts.push_back(item);
    }
  }
  return parts;
}

std::vector<std::string> split_whitespace(const std::string &s) {
  std::vector<std::string> parts;
  std::istringstream ss(s);
  std::string item;
  while (ss >> item) {
    parts.push_back(item);
  }
  return parts;
}

std::string join(const std::vector<std::string> &parts,
                 const std::string &sep) {
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0)
      out += sep;
    out += parts[i];
  }
  return out;
}

std::string shell_quote(const std::string &s) {
  if (!s.empty() && s.find_first_of(" \t\n'\"\\$`;&|<>(){}*?!#~") ==
                        std::string::npos) {
    return s;
  }
  std::string out = "'";
  for (char c : s) {
    if (c == '\'')
      out += "'\\''";
    else
      out += c;
  }
  out += "'";
  return out;
}

bool is_truthy(const std::string &value) {
  std::string v = to_lower(trim(value));
  return v == "true" || v == "yes" || v == "1";
}

bool is_all_digits(const std::string &s) {
  if (s.empty())
    return false;
  for (char c : s) {
    if (!std::isdigit(static_cast<unsigned char>(c)))
      return false;
  }
  return true;
}

// Time
std::string timestamp(const char *format) {
  auto now = std::time(nullptr);
  char buf[64];
  std::strftime(buf, sizeof(buf), format, std::localtime(&now));
  return buf;
}

std::string iso_timestamp() {
  auto now = std::time(nullptr);
  char buf[64];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", std::gmtime(&now));
  return buf;
}

// FileLock implementation
FileLock::FileLock(const fs::path &path) : path_(path) {
  if (path.has_parent_path() && !ensure_dir_exists(path.parent_path())) {
    return;
  }

  int fd = open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) {
    LOG_ERROR("Cannot open lock file " + path.string() + ": " +
              strerror(errno));
    return;
  }

  if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
    if (errno == EWOULDBLOCK) {
      LOG_ERROR("Another orchestration pass holds " + path.string());
    } else {
      LOG_ERROR("flock failed on " + path.string() + ": " + strerror(errno));
    }
    close(fd);
    return;
  }

  fd_ = fd;
  LOG_DEBUG("Acquired lock " + path.string());
}

FileLock::~FileLock() {
  if (fd_ >= 0) {
    flock(fd_, LOCK_UN);
    close(fd_);
  }
}

// CommandRunner implementation
CommandResult CommandRunner::run(const std::vector<std::string> &argv,
                                 const std::string &input) {
  LOG_DEBUG("exec: " + join(argv, " "));
  return execute(argv, input);
}

CommandResult CommandRunner::mutate(const std::vector<std::string> &argv,
                                    const std::string &input) {
  if (dry_run_) {
    std::vector<std::string> quoted;
    for (const auto &arg : argv) {
      quoted.push_back(shell_quote(arg));
    }
    LOG_INFO("[dry-run] " + join(quoted, " "));
    return CommandResult{0, ""};
  }
  return run(argv, input);
}

CommandResult SystemRunner::execute(const std::vector<std::string> &argv,
                                    const std::string &input) {
  CommandResult result;
  if (argv.empty()) {
    return result;
  }

  int in_pipe[2];
  int out_pipe[2];
  if (pipe2(in_pipe, O_CLOEXEC) != 0) {
    LOG_ERROR("pipe failed: " + std::string(strerror(errno)));
    return result;
  }
  if (pipe2(out_pipe, O_CLOEXEC) != 0) {
    LOG_ERROR("pipe failed: " + std::string(strerror(errno)));
    close(in_pipe[0]);
    close(in_pipe[1]);
    return result;
  }

  pid_t pid = fork();
  if (pid < 0) {
    LOG_ERROR("fork failed: " + std::string(strerror(errno)));
    close(in_pipe[0]);
    close(in_pipe[1]);
    close(out_pipe[0]);
    close(out_pipe[1]);
    return result;
  }

  if (pid == 0) {
    dup2(in_pipe[0], STDIN_FILENO);
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(out_pipe[1], STDERR_FILENO);

    std::vector<char *> args;
    for (const auto &arg : argv) {
      args.push_back(const_cast<char *>(arg.c_str()));
    }
    args.push_back(nullptr);
    execvp(args[0], args.data());
    _exit(127);
  }

  close(in_pipe[0]);
  close(out_pipe[1]);

  // Inputs are small (keys, rendered configs), well below the pipe buffer.
  if (!input.empty()) {
    signal(SIGPIPE, SIG_IGN);
    const char *data = input.data();
    size_t remaining = input.size();
    while (remaining > 0) {
      ssize_t n = write(in_pipe[1], data, remaining);
      if (n < 0) {
        if (errno == EINTR)
          continue;
        LOG_WARN("Short write to " + argv[0] + " stdin: " + strerror(errno));
        break;
      }
      data += n;
      remaining -= static_cast<size_t>(n);
    }
  }
  close(in_pipe[1]);

  char buf[4096];
  while (true) {
    ssize_t n = read(out_pipe[0], buf, sizeof(buf));
    if (n < 0 && errno == EINTR)
      continue;
    if (n <= 0)
      break;
    result.output.append(buf, static_cast<size_t>(n));
  }
  close(out_pipe[0]);

  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      LOG_ERROR("waitpid failed: " + std::string(strerror(errno)));
      return result;
    }
  }

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  return result;
}

bool SystemRunner::program_exists(const std::string &program) {
  if (program.find('/') != std::string::npos) {
    return access(program.c_str(), X_OK) == 0;
  }

  const char *path_env = std::getenv("PATH");
  std::string path_str = path_env ? path_env : "/usr/sbin:/usr/bin:/sbin:/bin";
  for (const auto &dir : split(path_str, ':')) {
    fs::path candidate = fs::path(dir) / program;
    if (access(candidate.c_str(), X_OK) == 0) {
      return true;
    }
  }
  return false;
}

bool is_root() { return geteuid() == 0; }

} // namespace clinic

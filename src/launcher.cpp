#include "launcher.hpp"
#include "posix_fd.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

std::vector<std::string> split_program(const std::string& program) {
  std::istringstream iss(program);
  std::vector<std::string> parts; std::string p;
  while (iss >> p) parts.push_back(p);
  return parts;
}

std::string resolve_editor(const std::string& override_program) {
  if (!override_program.empty()) return override_program;
  const char* env = std::getenv("EDITOR");
  return env ? std::string(env) : std::string();
}

static std::vector<char*> make_argv(std::vector<std::string>& parts) {
  std::vector<char*> argv;
  argv.reserve(parts.size() + 1);
  for (auto& s : parts) argv.push_back(s.data());
  argv.push_back(nullptr);
  return argv;
}

bool edit_file(const std::string& program,
               const std::filesystem::path& path,
               std::string& msg) {
  auto parts = split_program(program);
  if (parts.empty()) { msg = "no editor configured (set $EDITOR or :set editor)"; return false; }
  parts.push_back(path.string());
  auto argv = make_argv(parts);
  pid_t pid = ::fork();
  if (pid < 0) { msg = std::string("fork failed: ") + std::strerror(errno); return false; }
  if (pid == 0) {
    ::execvp(argv[0], argv.data());
    ::_exit(127);
  }
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) { msg = std::string("wait failed: ") + std::strerror(errno); return false; }
  }
  if (WIFEXITED(status) && WEXITSTATUS(status) == 127) { msg = "can not run: " + parts[0]; return false; }
  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) { msg = parts[0] + " exited abnormally"; return false; }
  msg = "edited " + path.string();
  return true;
}

bool open_file(const std::string& program,
               const std::filesystem::path& path,
               std::string& msg) {
  auto parts = split_program(program);
  if (parts.empty()) { msg = "no opener configured (:set opener)"; return false; }
  parts.push_back(path.string());
  auto argv = make_argv(parts);
  UniqueFd null_fd = UniqueFd::open_dev_null();
  if (!null_fd.valid()) { msg = "can not open /dev/null"; return false; }
  pid_t pid = ::fork();
  if (pid < 0) { msg = std::string("fork failed: ") + std::strerror(errno); return false; }
  if (pid == 0) {
    // grandchild keeps running after the intermediate child exits
    ::setsid();
    if (!null_fd.dup_onto(STDIN_FILENO) || !null_fd.dup_onto(STDOUT_FILENO) ||
        !null_fd.dup_onto(STDERR_FILENO)) ::_exit(126);
    // exec closes the pipe; a byte on it means execvp failed
    UniqueFd exec_rd, exec_wr;
    if (!UniqueFd::make_pipe(exec_rd, exec_wr)) ::_exit(126);
    pid_t grand = ::fork();
    if (grand < 0) ::_exit(126);
    if (grand == 0) {
      ::execvp(argv[0], argv.data());
      char fail = 1;
      ssize_t ignored = ::write(exec_wr.get(), &fail, 1);
      (void)ignored;
      ::_exit(127);
    }
    exec_wr.reset();
    char byte = 0;
    ssize_t n;
    while ((n = ::read(exec_rd.get(), &byte, 1)) < 0 && errno == EINTR) {}
    ::_exit(n > 0 ? 127 : 0);
  }
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) { msg = std::string("wait failed: ") + std::strerror(errno); return false; }
  }
  if (WIFEXITED(status) && WEXITSTATUS(status) == 127) { msg = "can not run: " + parts[0]; return false; }
  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) { msg = "can not start: " + parts[0]; return false; }
  msg = "opened " + path.string();
  return true;
}

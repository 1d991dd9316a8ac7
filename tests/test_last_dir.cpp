#include "last_dir.hpp"
#include "test_util.hpp"
#include <cassert>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>

static std::string slurp(const std::filesystem::path& p) {
  std::ifstream in(p);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

int main() {
  TempDir tmp;
  std::string msg;

  auto file = tmp.path() / "cache" / ".mdir";
  assert(write_last_dir_to(file, "/home/user/src", msg));
  assert(slurp(file) == "/home/user/src");
  assert(write_last_dir_to(file, "/", msg));
  assert(slurp(file) == "/");

  ::setenv("XDG_CACHE_HOME", (tmp.path() / "xdg").c_str(), 1);
  auto resolved = last_dir_file();
  assert(resolved && *resolved == tmp.path() / "xdg" / ".mdir");
  assert(write_last_dir("/var/tmp", msg));
  assert(slurp(tmp.path() / "xdg" / ".mdir") == "/var/tmp");

  ::unsetenv("XDG_CACHE_HOME");
  ::setenv("HOME", tmp.path().c_str(), 1);
  resolved = last_dir_file();
  assert(resolved && *resolved == tmp.path() / ".cache" / ".mdir");

  return 0;
}

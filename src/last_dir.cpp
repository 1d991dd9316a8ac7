#include "last_dir.hpp"
#include "config.hpp"
#include <cstdlib>
#include <fstream>
#include <system_error>

std::optional<std::filesystem::path> last_dir_file() {
  const char* xdg = std::getenv("XDG_CACHE_HOME");
  if (xdg && *xdg) return std::filesystem::path(xdg) / MDIR_LASTDIR_NAME;
  const char* home = std::getenv("HOME");
  if (home && *home) return std::filesystem::path(home) / ".cache" / MDIR_LASTDIR_NAME;
  return std::nullopt;
}

bool write_last_dir_to(const std::filesystem::path& file,
                       const std::filesystem::path& dir,
                       std::string& msg) {
  std::error_code ec;
  if (file.has_parent_path()) std::filesystem::create_directories(file.parent_path(), ec);
  if (ec) { msg = "can not create " + file.parent_path().string() + ": " + ec.message(); return false; }
  std::ofstream out(file, std::ios::trunc);
  if (!out.is_open()) { msg = "can not write " + file.string(); return false; }
  out << dir.string();
  if (!out) { msg = "write failed: " + file.string(); return false; }
  msg = "saved last directory to " + file.string();
  return true;
}

bool write_last_dir(const std::filesystem::path& dir, std::string& msg) {
  auto file = last_dir_file();
  if (!file) { msg = "no cache directory ($XDG_CACHE_HOME / $HOME unset)"; return false; }
  return write_last_dir_to(*file, dir, msg);
}

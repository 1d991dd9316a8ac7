#include "entry_lister.hpp"
#include <system_error>

bool list_directory(const std::filesystem::path& dir,
                    std::vector<Entry>& out,
                    std::string& msg) {
  out.clear();
  std::error_code ec;
  std::filesystem::directory_iterator it(dir, ec);
  if (ec) { msg = "can not read directory: " + dir.string() + " (" + ec.message() + ")"; return false; }
  std::vector<Entry> entries;
  for (std::filesystem::directory_iterator end; it != end; it.increment(ec)) {
    if (ec) break;
    Entry e;
    e.path = it->path();
    e.name = e.path.filename().string();
    // follows symlinks; resolution failures leave the entry classified as a file
    std::error_code cls_ec;
    e.is_dir = std::filesystem::is_directory(e.path, cls_ec);
    if (cls_ec) e.is_dir = false;
    entries.push_back(std::move(e));
  }
  if (ec) { msg = "error while reading directory: " + dir.string() + " (" + ec.message() + ")"; return false; }
  out = std::move(entries);
  return true;
}

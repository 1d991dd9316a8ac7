#include "dir_memory.hpp"
#include <system_error>

std::string normalize_dir_key(const std::filesystem::path& p) {
  std::error_code ec;
  auto abs = std::filesystem::absolute(p, ec);
  if (ec) abs = p;
  auto norm = abs.lexically_normal();
  // "/a/b/" and "/a/b" must share one entry
  if (norm.has_relative_path() && norm.filename().empty()) norm = norm.parent_path();
  return norm.string();
}

const DirState* DirMemory::find(const std::filesystem::path& dir) const {
  auto it = map_.find(normalize_dir_key(dir));
  if (it == map_.end()) return nullptr;
  return &it->second;
}

DirState& DirMemory::get_or_create(const std::filesystem::path& dir) {
  return map_[normalize_dir_key(dir)];
}

void DirMemory::save(const std::filesystem::path& dir, const DirState& st) {
  map_[normalize_dir_key(dir)] = st;
}

DirState DirMemory::lookup(const std::filesystem::path& dir) const {
  if (const DirState* st = find(dir)) return *st;
  return DirState{};
}

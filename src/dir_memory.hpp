#pragma once
/*
 * DirMemory
 *
 * Purpose: per-directory browsing memory (cursor/scroll/hidden flag/marks).
 * Design: map normalized absolute path → DirState; entries are created lazily and kept
 *         for the lifetime of the owning pane.
 */
#include <filesystem>
#include <set>
#include <string>
#include <unordered_map>

struct DirState {
  int cursor = 0;
  int scroll = 0;
  bool show_hidden = false;
  std::set<std::string> marks;
};

std::string normalize_dir_key(const std::filesystem::path& p);

class DirMemory {
public:
  // nullptr when the directory was never recorded
  const DirState* find(const std::filesystem::path& dir) const;
  DirState& get_or_create(const std::filesystem::path& dir);
  void save(const std::filesystem::path& dir, const DirState& st);
  // defaults when absent
  DirState lookup(const std::filesystem::path& dir) const;
  size_t size() const { return map_.size(); }
private:
  std::unordered_map<std::string, DirState> map_;
};

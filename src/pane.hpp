#pragma once
/*
 * Pane
 *
 * Purpose: one directory-browsing context: current dir, ordered listing snapshot,
 *          cursor within the visible window, scroll offset, viewport height, marks.
 * Invariants: the visible window is [scroll, scroll + viewport_height]; cursor is an
 *          index into that window. Navigation is all-or-nothing: a failed read leaves
 *          current_dir and the listing snapshot untouched.
 * Memory: browsing position per directory is kept in a DirMemory owned by the pane.
 */
#include <filesystem>
#include <set>
#include <string>
#include <vector>
#include "config.hpp"
#include "dir_memory.hpp"
#include "types.hpp"

class Pane {
public:
  static constexpr int kPageStep = MDIR_PAGE_STEP;
  static constexpr int kDefaultViewportHeight = 20;

  // first read of a pane; IoError leaves the pane unopened
  Status open(const std::filesystem::path& dir, std::string& msg);
  Status change_dir(const std::filesystem::path& dir, std::string& msg);
  Status enter_child(const std::string& name, std::string& msg);
  Status enter_target(std::string& msg);
  Status leave_to_parent(std::string& msg);
  Status toggle_hidden(std::string& msg);
  Status refresh(std::string& msg);

  void cursor_up(int amount);
  void cursor_down(int amount);
  void jump_to(int index);
  void clamp_cursor();
  void set_position(int cursor, int scroll);
  void set_viewport_height(int height);

  const Entry* target() const;
  std::string target_path() const;

  void toggle_mark(const std::filesystem::path& path);
  bool toggle_mark_target();
  void clear_marks() { marks_.clear(); }
  bool is_marked(const std::filesystem::path& path) const;
  const std::set<std::string>& marks() const { return marks_; }

  Listing listing() const;

  bool is_open() const { return opened_; }
  const std::filesystem::path& current_dir() const { return current_dir_; }
  const std::vector<Entry>& directory() const { return directory_; }
  int cursor() const { return cursor_; }
  int scroll() const { return scroll_; }
  int absolute() const { return scroll_ + cursor_; }
  int viewport_height() const { return viewport_height_; }
  bool show_hidden() const { return show_hidden_; }
  const DirMemory& memory() const { return memory_; }

private:
  DirState snapshot() const;
  void restore(const DirState& st);
  void clamp_absolute(int last);

  std::filesystem::path current_dir_;
  std::vector<Entry> directory_;
  int cursor_ = 0;
  int scroll_ = 0;
  int viewport_height_ = kDefaultViewportHeight;
  bool show_hidden_ = false;
  bool opened_ = false;
  std::set<std::string> marks_;
  DirMemory memory_;
};

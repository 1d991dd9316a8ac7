#pragma once
/*
 * PaneSet
 *
 * Purpose: fixed collection of independent panes plus the active index.
 * Note: every pane starts at the same directory; nothing is shared between panes.
 *       pane_at() fails closed (nullptr) on an out-of-range index.
 */
#include <filesystem>
#include <string>
#include <vector>
#include "config.hpp"
#include "pane.hpp"
#include "types.hpp"

class PaneSet {
public:
  static constexpr int kPaneCount = MDIR_PANE_COUNT;

  PaneSet();
  // reads the start directory once per pane; IoError is fatal for the caller
  Status open(const std::filesystem::path& start_dir, std::string& msg);

  Status switch_to(int index, std::string& msg);
  void next();
  void previous();

  Pane& active() { return panes_[active_index_]; }
  const Pane& active() const { return panes_[active_index_]; }
  Pane* pane_at(int index);
  const Pane* pane_at(int index) const;
  int active_index() const { return active_index_; }
  int size() const { return static_cast<int>(panes_.size()); }

  void set_viewport_height(int height);

private:
  std::vector<Pane> panes_;
  int active_index_ = 0;
};

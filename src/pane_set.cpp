#include "pane_set.hpp"

PaneSet::PaneSet() : panes_(kPaneCount) {}

Status PaneSet::open(const std::filesystem::path& start_dir, std::string& msg) {
  for (auto& p : panes_) {
    Status s = p.open(start_dir, msg);
    if (s != Status::Ok) return s;
  }
  active_index_ = 0;
  return Status::Ok;
}

Pane* PaneSet::pane_at(int index) {
  if (index < 0 || index >= size()) return nullptr;
  return &panes_[index];
}

const Pane* PaneSet::pane_at(int index) const {
  if (index < 0 || index >= size()) return nullptr;
  return &panes_[index];
}

Status PaneSet::switch_to(int index, std::string& msg) {
  Pane* p = pane_at(index);
  if (!p) {
    msg = "no such view: " + std::to_string(index + 1);
    return Status::OutOfRange;
  }
  active_index_ = index;
  // pick up changes made while the pane was inactive
  return p->refresh(msg);
}

void PaneSet::next() {
  active_index_ = (active_index_ + 1) % size();
}

void PaneSet::previous() {
  active_index_ = (active_index_ + size() - 1) % size();
}

void PaneSet::set_viewport_height(int height) {
  for (auto& p : panes_) p.set_viewport_height(height);
}

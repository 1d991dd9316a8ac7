#include "pane.hpp"
#include "entry_order.hpp"
#include <algorithm>

static std::string mark_key(const std::filesystem::path& p) {
  return p.lexically_normal().string();
}

DirState Pane::snapshot() const {
  DirState st;
  st.cursor = cursor_;
  st.scroll = scroll_;
  st.show_hidden = show_hidden_;
  st.marks = marks_;
  return st;
}

void Pane::restore(const DirState& st) {
  cursor_ = std::max(0, st.cursor);
  scroll_ = std::max(0, st.scroll);
  show_hidden_ = st.show_hidden;
  marks_ = st.marks;
  // remembered under a taller viewport: keep the absolute position
  if (cursor_ > viewport_height_) {
    scroll_ += cursor_ - viewport_height_;
    cursor_ = viewport_height_;
  }
}

Status Pane::open(const std::filesystem::path& dir, std::string& msg) {
  return change_dir(dir, msg);
}

Status Pane::change_dir(const std::filesystem::path& dir, std::string& msg) {
  std::filesystem::path next(normalize_dir_key(opened_ && dir.is_relative() ? current_dir_ / dir : dir));
  if (opened_) memory_.save(current_dir_, snapshot());
  DirState st = memory_.lookup(next);
  std::vector<Entry> fresh;
  if (!read_ordered(next, st.show_hidden, fresh, msg)) return Status::IoError;
  current_dir_ = std::move(next);
  directory_ = std::move(fresh);
  opened_ = true;
  restore(st);
  clamp_cursor();
  return Status::Ok;
}

Status Pane::enter_child(const std::string& name, std::string& msg) {
  auto it = std::find_if(directory_.begin(), directory_.end(),
                         [&](const Entry& e){ return e.name == name; });
  if (it == directory_.end() || !it->is_dir) {
    msg = "not a directory: " + name;
    return Status::NotADirectory;
  }
  return change_dir(current_dir_ / name, msg);
}

Status Pane::enter_target(std::string& msg) {
  const Entry* t = target();
  if (!t) return Status::NoTarget;
  return enter_child(t->name, msg);
}

Status Pane::leave_to_parent(std::string& msg) {
  // parent of the root is the root itself: re-read in place
  return change_dir(current_dir_.parent_path(), msg);
}

Status Pane::toggle_hidden(std::string& msg) {
  DirState st = snapshot();
  st.show_hidden = !show_hidden_;
  std::vector<Entry> fresh;
  if (!read_ordered(current_dir_, st.show_hidden, fresh, msg)) return Status::IoError;
  memory_.get_or_create(current_dir_) = st;
  directory_ = std::move(fresh);
  restore(st);
  clamp_cursor();
  return Status::Ok;
}

Status Pane::refresh(std::string& msg) {
  std::vector<Entry> fresh;
  if (!read_ordered(current_dir_, show_hidden_, fresh, msg)) return Status::IoError;
  directory_ = std::move(fresh);
  clamp_cursor();
  return Status::Ok;
}

void Pane::cursor_up(int amount) {
  if (amount <= 0) return;
  if (cursor_ < amount && scroll_ > 0) {
    int step = std::min({kPageStep, scroll_, viewport_height_ - cursor_});
    if (step > 0) {
      scroll_ -= step;
      cursor_ += step;
      return;
    }
  }
  cursor_ = std::max(0, cursor_ - amount);
}

void Pane::cursor_down(int amount) {
  if (amount <= 0) return;
  int last = static_cast<int>(directory_.size()) - 1;
  if (last < 0) { cursor_ = 0; scroll_ = 0; return; }
  if (scroll_ + cursor_ >= last) { clamp_absolute(last); return; }
  if (cursor_ + amount > viewport_height_) {
    int step = std::min(kPageStep, cursor_);
    if (step > 0) {
      cursor_ -= step;
      scroll_ += step;
    } else {
      scroll_ += amount;
    }
  } else {
    cursor_ += amount;
  }
  clamp_absolute(last);
}

void Pane::clamp_absolute(int last) {
  int abs = std::min(scroll_ + cursor_, last);
  if (scroll_ > abs) scroll_ = abs;
  cursor_ = abs - scroll_;
}

void Pane::jump_to(int index) {
  int n = static_cast<int>(directory_.size());
  if (n == 0) { cursor_ = 0; scroll_ = 0; return; }
  index = std::clamp(index, 0, n - 1);
  if (index <= viewport_height_) {
    scroll_ = 0;
    cursor_ = index;
  } else {
    scroll_ = index - viewport_height_;
    cursor_ = viewport_height_;
  }
}

void Pane::clamp_cursor() {
  if (target()) return;
  scroll_ = 0;
  int n = static_cast<int>(directory_.size());
  cursor_ = n == 0 ? 0 : std::min(viewport_height_, n - 1);
}

void Pane::set_position(int cursor, int scroll) {
  cursor_ = std::max(0, cursor);
  scroll_ = std::max(0, scroll);
}

void Pane::set_viewport_height(int height) {
  viewport_height_ = std::max(1, height);
  if (cursor_ > viewport_height_) {
    scroll_ += cursor_ - viewport_height_;
    cursor_ = viewport_height_;
  }
  clamp_cursor();
}

const Entry* Pane::target() const {
  if (cursor_ < 0 || cursor_ > viewport_height_ || scroll_ < 0) return nullptr;
  size_t abs = static_cast<size_t>(scroll_) + static_cast<size_t>(cursor_);
  if (abs >= directory_.size()) return nullptr;
  return &directory_[abs];
}

std::string Pane::target_path() const {
  const Entry* t = target();
  return t ? t->path.string() : std::string();
}

void Pane::toggle_mark(const std::filesystem::path& path) {
  std::string key = mark_key(path);
  auto it = marks_.find(key);
  if (it != marks_.end()) marks_.erase(it);
  else marks_.insert(key);
}

bool Pane::toggle_mark_target() {
  const Entry* t = target();
  if (!t) return false;
  toggle_mark(t->path);
  return true;
}

bool Pane::is_marked(const std::filesystem::path& path) const {
  return marks_.count(mark_key(path)) != 0;
}

Listing Pane::listing() const {
  Listing out;
  for (int i = 0; i <= viewport_height_; ++i) {
    size_t idx = static_cast<size_t>(scroll_) + static_cast<size_t>(i);
    if (idx >= directory_.size()) break;
    const Entry& e = directory_[idx];
    bool highlight = (i == cursor_);
    RowStyle style;
    if (highlight) style = e.is_dir ? RowStyle::DirectoryHighlighted : RowStyle::FileHighlighted;
    else style = e.is_dir ? RowStyle::Directory : RowStyle::File;
    Row row;
    // the mark is its own segment so it survives the highlight
    if (is_marked(e.path)) row.push_back({"*", RowStyle::Marked});
    row.push_back({e.name, style});
    if (e.is_dir) row.push_back({"/", RowStyle::Plain});
    out.push_back(std::move(row));
  }
  return out;
}

#include "pane_set.hpp"
#include "test_util.hpp"
#include <cassert>
#include <string>

int main() {
  TempDir tmp;
  make_dir(tmp.path() / "one");
  make_dir(tmp.path() / "two");
  touch(tmp.path() / "f.txt");

  PaneSet views; std::string msg;
  assert(views.size() == 4);
  assert(views.open(tmp.path(), msg) == Status::Ok);
  assert(views.active_index() == 0);
  for (int i = 0; i < views.size(); ++i) {
    assert(views.pane_at(i) != nullptr);
    assert(views.pane_at(i)->current_dir() == tmp.path());
  }
  assert(views.pane_at(-1) == nullptr);
  assert(views.pane_at(4) == nullptr);

  // panes are independent
  assert(views.active().enter_child("one", msg) == Status::Ok);
  views.active().toggle_mark(tmp.path() / "one" / "x");
  assert(views.switch_to(2, msg) == Status::Ok);
  assert(views.active_index() == 2);
  assert(views.active().current_dir() == tmp.path());
  assert(views.active().marks().empty());
  assert(views.pane_at(0)->current_dir() == tmp.path() / "one");

  // out of range leaves the active pane alone
  assert(views.switch_to(4, msg) == Status::OutOfRange);
  assert(views.switch_to(-1, msg) == Status::OutOfRange);
  assert(views.active_index() == 2);

  // switching re-reads: changes made meanwhile become visible
  size_t before = views.pane_at(1)->directory().size();
  touch(tmp.path() / "g.txt");
  assert(views.switch_to(1, msg) == Status::Ok);
  assert(views.active().directory().size() == before + 1);

  // cyclic next/previous
  views.next();
  assert(views.active_index() == 2);
  views.next();
  views.next();
  assert(views.active_index() == 0);
  views.previous();
  assert(views.active_index() == 3);
  views.previous();
  assert(views.active_index() == 2);

  views.set_viewport_height(7);
  for (int i = 0; i < views.size(); ++i) assert(views.pane_at(i)->viewport_height() == 7);

  PaneSet broken;
  assert(broken.open(tmp.path() / "missing", msg) == Status::IoError);
  return 0;
}

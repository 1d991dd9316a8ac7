#include "dir_memory.hpp"
#include <cassert>

int main() {
  DirMemory mem;
  assert(mem.find("/a/b") == nullptr);
  DirState def = mem.lookup("/a/b");
  assert(def.cursor == 0 && def.scroll == 0 && !def.show_hidden && def.marks.empty());
  assert(mem.size() == 0);

  DirState st;
  st.cursor = 3; st.scroll = 10; st.show_hidden = true; st.marks.insert("/a/b/x");
  mem.save("/a/b", st);
  // trailing separators and dot segments share the key
  assert(mem.find("/a/b/") != nullptr);
  assert(mem.find("/a/./c/../b") != nullptr);
  assert(mem.lookup("/a/b/").cursor == 3);
  assert(mem.lookup("/a/b").marks.count("/a/b/x") == 1);
  assert(mem.size() == 1);

  DirState& created = mem.get_or_create("/a");
  assert(created.cursor == 0 && !created.show_hidden);
  created.show_hidden = true;
  assert(mem.lookup("/a").show_hidden);
  assert(mem.size() == 2);

  assert(normalize_dir_key("/") == "/");
  assert(normalize_dir_key("/tmp/") == "/tmp");
  return 0;
}

#include "launcher.hpp"
#include "test_util.hpp"
#include <cassert>
#include <cstdlib>
#include <string>
#include <vector>

static void test_split_and_resolve() {
  assert((split_program("code  -w") == std::vector<std::string>{"code", "-w"}));
  assert(split_program("   ").empty());
  ::setenv("EDITOR", "vi", 1);
  assert(resolve_editor("") == "vi");
  assert(resolve_editor("nano") == "nano");
  ::unsetenv("EDITOR");
  assert(resolve_editor("").empty());
}

static void test_edit_file() {
  TempDir tmp;
  auto target = tmp.path() / "x";
  std::string msg;

  // nothing configured
  assert(!edit_file(resolve_editor(""), target, msg));
  assert(msg.find("no editor configured") != std::string::npos);

  assert(edit_file("true", target, msg));
  assert(msg == "edited " + target.string());

  assert(!edit_file("false", target, msg));
  assert(msg == "false exited abnormally");

  // exec failure surfaces as exit 127
  assert(!edit_file("mdir-no-such-program", target, msg));
  assert(msg == "can not run: mdir-no-such-program");

}

static void test_open_file() {
  TempDir tmp;
  auto target = tmp.path() / "x";
  std::string msg;

  assert(!open_file("", target, msg));
  assert(msg.find("no opener configured") != std::string::npos);

  assert(open_file("true", target, msg));
  assert(msg == "opened " + target.string());

  // the program's own exit status is not awaited
  assert(open_file("false", target, msg));

  assert(!open_file("mdir-no-such-program", target, msg));
  assert(msg == "can not run: mdir-no-such-program");
}

int main() {
  test_split_and_resolve();
  test_edit_file();
  test_open_file();
  return 0;
}

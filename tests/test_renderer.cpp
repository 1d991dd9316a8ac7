#include "renderer.hpp"
#include "headless_terminal.hpp"
#include "test_util.hpp"
#include <cassert>
#include <string>

int main() {
  TempDir tmp;
  make_dir(tmp.path() / "src");
  touch(tmp.path() / "README.md");
  touch(tmp.path() / "notes.txt");

  assert(Renderer::viewport_height_for(10) == 7);
  assert(Renderer::viewport_height_for(2) == 1);

  HeadlessTerminal term(10, 40);
  Pane pane; std::string msg;
  assert(pane.open(tmp.path(), msg) == Status::Ok);
  pane.set_viewport_height(Renderer::viewport_height_for(term.getSize().rows));
  pane.toggle_mark(tmp.path() / "notes.txt");

  ModeController mode;
  Renderer r;
  FrameInfo frame;
  frame.pane = &pane;
  frame.pane_index = 1;
  frame.pane_count = 4;
  frame.mode = &mode;
  frame.message = "hello";
  r.render(term, frame);

  assert(term.row_text(0).rfind("[2/4] ", 0) == 0);
  assert(term.row_text(1) == "src/");
  assert(term.row_text(2) == "README.md");
  assert(term.row_text(3) == "*notes.txt");
  assert(term.row_text(4).empty());
  assert(term.style_at(1, 0) == RowStyle::DirectoryHighlighted);
  assert(term.style_at(1, 3) == RowStyle::Plain);
  assert(term.style_at(2, 0) == RowStyle::File);
  assert(term.style_at(3, 0) == RowStyle::Marked);
  assert(term.style_at(3, 1) == RowStyle::File);
  std::string status = term.row_text(9);
  assert(status.rfind("NORMAL  1/3", 0) == 0);
  assert(status.find("marked:1") != std::string::npos);
  assert(status.find("| hello") != std::string::npos);
  assert(!term.cursor_visible);
  assert(term.refreshes == 1);

  // command line replaces the status line
  std::string cmd;
  mode.feed(':', cmd);
  mode.feed('c', cmd);
  mode.feed('d', cmd);
  r.render(term, frame);
  assert(term.row_text(9) == ":cd");
  assert(term.cursor_visible);
  assert(term.cursor_row == 9 && term.cursor_col == 3);

  // monochrome: reverse video for the target, '*' for marks
  frame.enable_color = false;
  pane.cursor_down(2);
  r.render(term, frame);
  assert(term.row_text(3) == "*notes.txt");
  assert(term.style_at(3, 0) == RowStyle::Plain);
  assert(term.style_at(3, 1) == RowStyle::FileHighlighted);
  pane.cursor_up(2);
  r.render(term, frame);
  assert(term.row_text(3) == "*notes.txt");
  assert(term.style_at(3, 1) == RowStyle::Plain);

  // narrow terminal truncates rows
  HeadlessTerminal narrow(6, 3);
  r.render(narrow, frame);
  assert(narrow.row_text(1) == "src");
  return 0;
}

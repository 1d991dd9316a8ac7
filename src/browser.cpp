#include <ncurses.h>
#include "browser.hpp"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include "command_line.hpp"
#include "config.hpp"
#include "launcher.hpp"
#include "logger.hpp"
#include "terminal.hpp"

static constexpr int CTRL_c = 'C'-64;
static constexpr int CTRL_d = 'D'-64;
static constexpr int CTRL_u = 'U'-64;

Browser::Browser() {
  register_commands();
}

Status Browser::open(const std::filesystem::path& start_dir, std::string& msg) {
  Status s = views.open(start_dir, msg);
  if (s != Status::Ok) {
    Logger::error("startup read failed: " + msg);
    return s;
  }
  Logger::info("session start at " + views.active().current_dir().string());
  update_viewport();
  load_rc();
  return Status::Ok;
}

void Browser::run() {
  while (!should_quit) {
    render();
    int ch = getch();
    if (ch == ERR) continue;
    handle_input(ch);
  }
  Logger::info("session end at " + last_directory().string());
}

void Browser::render() {
  FrameInfo frame;
  frame.pane = &views.active();
  frame.pane_index = views.active_index();
  frame.pane_count = views.size();
  frame.mode = &mode;
  frame.message = message;
  frame.enable_color = enable_color;
  renderer.render(term, frame);
}

void Browser::update_viewport() {
  TermSize sz = term.getSize();
  views.set_viewport_height(Renderer::viewport_height_for(sz.rows));
}

int Browser::half_page() const {
  return std::max(1, views.active().viewport_height() / 2);
}

// navigation refusals (entering a file, nothing targeted) are normal key presses
void Browser::report(Status s, const std::string& msg) {
  switch (s) {
    case Status::Ok: break;
    case Status::NotADirectory:
    case Status::NoTarget:
      Logger::debug(std::string("ignored: ") + status_name(s));
      break;
    case Status::IoError:
      message = msg;
      Logger::warn(msg);
      break;
    case Status::OutOfRange:
      message = msg;
      break;
  }
}

void Browser::handle_input(int ch) {
  if (ch == KEY_RESIZE) { update_viewport(); return; }
  std::string command;
  switch (mode.feed(ch, command)) {
    case ModeController::Outcome::Navigate: handle_normal_input(ch); break;
    case ModeController::Outcome::Execute: execute_command(command); break;
    case ModeController::Outcome::Consumed: input.reset(); break;
  }
}

void Browser::handle_normal_input(int ch) {
  if (input.consumeDigit(ch)) return;
  bool had_count = input.hasCount();
  if (input.consumeGg(ch)) {
    pane().jump_to(had_count ? input.takeCount() - 1 : 0);
    input.reset();
    return;
  }
  if (ch == 'g') return;
  int n = input.takeCount();
  message.clear();
  std::string m;
  switch (ch) {
    case 'q': case CTRL_c: should_quit = true; break;
    case 'j': case KEY_DOWN: pane().cursor_down(n); break;
    case 'k': case KEY_UP: pane().cursor_up(n); break;
    case CTRL_d: case KEY_NPAGE: pane().cursor_down(n * half_page()); break;
    case CTRL_u: case KEY_PPAGE: pane().cursor_up(n * half_page()); break;
    case 'G': pane().jump_to(had_count ? n - 1 : static_cast<int>(pane().directory().size()) - 1); break;
    case 'h': case KEY_LEFT: case KEY_BACKSPACE: case 127:
      report(pane().leave_to_parent(m), m); break;
    case 'l': case KEY_RIGHT: case '\n': case '\r': case KEY_ENTER:
      report(pane().enter_target(m), m); break;
    case '.': report(pane().toggle_hidden(m), m); break;
    case ' ': pane().toggle_mark_target(); break;
    case 'r': report(pane().refresh(m), m); break;
    case 'e': edit_target(); break;
    case 'o': open_target(); break;
    case '\t': cycle_view(true); break;
    case KEY_BTAB: cycle_view(false); break;
    default: break;
  }
  input.reset();
}

void Browser::cycle_view(bool forward) {
  if (forward) views.next(); else views.previous();
  std::string m;
  report(pane().refresh(m), m);
  Logger::debug("view " + std::to_string(views.active_index() + 1));
}

void Browser::switch_view(int index) {
  std::string m;
  Status s = views.switch_to(index, m);
  report(s, m);
  if (s == Status::Ok) Logger::debug("view " + std::to_string(index + 1));
}

void Browser::edit_target() {
  const Entry* t = pane().target();
  if (!t) return;
  std::filesystem::path target = t->path;
  std::string program = resolve_editor(editor_program);
  std::string m;
  Terminal::suspend();
  bool ok = edit_file(program, target, m);
  Terminal::resume();
  message = m;
  if (!ok) Logger::warn("edit failed: " + m);
  // the editor may have created or removed files
  std::string rm;
  report(pane().refresh(rm), rm);
}

void Browser::open_target() {
  const Entry* t = pane().target();
  if (!t) return;
  std::string m;
  if (!open_file(opener_program, t->path, m)) Logger::warn("open failed: " + m);
  message = m;
}

void Browser::change_directory(const std::string& arg) {
  std::string m;
  report(pane().change_dir(expand_home(arg, std::getenv("HOME")), m), m);
}

void Browser::execute_command(const std::string& line) {
  Logger::info("command: " + line);
  std::string m;
  if (!run_command_line(registry, line, m)) {
    message = m;
    Logger::warn(message);
  }
}

void Browser::load_rc() {
  const char* home = std::getenv("HOME");
  if (!home) return;
  auto p = std::filesystem::path(home) / MDIR_RC_NAME;
  std::error_code ec;
  if (!std::filesystem::exists(p, ec)) return;
  std::ifstream in(p);
  if (!in.is_open()) { message = "can not read " + p.string(); Logger::warn(message); return; }
  std::string line, command;
  while (std::getline(in, line)) {
    if (rc_line_command(line, command)) execute_command(command);
  }
  Logger::info("loaded " + p.string());
}

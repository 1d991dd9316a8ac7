#pragma once
#include <filesystem>
#include <string>
#include <vector>
#include "types.hpp"
#include "pane_set.hpp"
#include "mode_controller.hpp"
#include "input.hpp"
#include "renderer.hpp"
#include "ncurses_terminal.hpp"
#include "cmd_registry.hpp"

// interactive session: key loop, command mode, rc file, collaborators.
// construct after Terminal so ncurses is initialized.
class Browser {
public:
  Browser();
  // first read of every pane; anything but Ok is fatal for the session
  Status open(const std::filesystem::path& start_dir, std::string& msg);
  void run();

  // exit hook: active pane's directory
  std::filesystem::path last_directory() const { return views.active().current_dir(); }
  bool persist_last_dir() const { return save_last_dir; }

private:
  PaneSet views;
  ModeController mode;
  Input input;
  Renderer renderer;
  NcursesTerminal term;
  CommandRegistry registry;
  std::string message;
  bool should_quit = false;
  bool enable_color = true;
  bool save_last_dir = true;
  std::string editor_program;
  std::string opener_program = "xdg-open";

  Pane& pane() { return views.active(); }
  void render();
  void handle_input(int ch);
  void handle_normal_input(int ch);
  void execute_command(const std::string& line);
  void register_commands();
  void load_rc();
  void report(Status s, const std::string& msg);
  void update_viewport();
  int half_page() const;
  void switch_view(int index);
  void cycle_view(bool forward);
  void edit_target();
  void open_target();
  void change_directory(const std::string& arg);
};

#include "browser.hpp"
#include <ncurses.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <vector>
#include "logger.hpp"

static std::string join_args(const std::vector<std::string>& args) {
  std::string out;
  for (const auto& a : args) { if (!out.empty()) out += ' '; out += a; }
  return out;
}

// "on"/"off" style values; empty args toggle
static bool parse_switch(const std::vector<std::string>& args, bool current, bool& out) {
  if (args.empty()) { out = !current; return true; }
  const std::string& v = args[0];
  if (v == "on" || v == "1" || v == "true") { out = true; return true; }
  if (v == "off" || v == "0" || v == "false") { out = false; return true; }
  return false;
}

void Browser::register_commands() {
  registry.register_command("q", [this](const CommandLine&){ should_quit = true; });
  registry.alias("quit", "q");
  registry.register_command("cd", [this](const CommandLine& cl){
    change_directory(cl.raw);
  });
  registry.register_command("view", [this](const CommandLine& cl){
    if (cl.args.empty()) { message = "view <1-" + std::to_string(views.size()) + ">"; return; }
    int idx = 0;
    try {
      idx = std::stoi(cl.args[0]) - 1;
    } catch (const std::exception&) {
      message = "view <1-" + std::to_string(views.size()) + ">";
      return;
    }
    switch_view(idx);
  });
  registry.register_command("hidden", [this](const CommandLine&){
    std::string m;
    report(pane().toggle_hidden(m), m);
  });
  registry.register_command("refresh", [this](const CommandLine&){
    std::string m;
    report(pane().refresh(m), m);
  });
  registry.register_command("mark", [this](const CommandLine&){
    if (!pane().toggle_mark_target()) message = "nothing to mark";
  });
  registry.register_command("unmark", [this](const CommandLine&){
    pane().clear_marks();
    message = "marks cleared";
  });
  registry.register_command("edit", [this](const CommandLine&){ edit_target(); });
  registry.register_command("open", [this](const CommandLine&){ open_target(); });
  registry.register_command("help", [this](const CommandLine&){
    message = "commands: " + join_args(registry.names());
  });
  registry.register_command("set color", [this](const CommandLine& cl){
    if (!parse_switch(cl.args, enable_color, enable_color)) { message = "set color: use :set color on|off"; return; }
    message = enable_color ? "color on" : "color off";
  });
  registry.register_command("set lastdir", [this](const CommandLine& cl){
    if (!parse_switch(cl.args, save_last_dir, save_last_dir)) { message = "set lastdir: use :set lastdir on|off"; return; }
    message = save_last_dir ? "lastdir on" : "lastdir off";
  });
  registry.register_command("set background", [this](const CommandLine& cl){
    if (cl.args.empty()) { message = "set background: use :set background default|black|white|red|green|blue|yellow|magenta|cyan"; return; }
    std::string v = cl.args[0];
    for (auto& c : v) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    short col = -1;
    if (v == "default" || v == "normal") col = -1;
    else if (v == "black") col = COLOR_BLACK;
    else if (v == "white") col = COLOR_WHITE;
    else if (v == "red") col = COLOR_RED;
    else if (v == "green") col = COLOR_GREEN;
    else if (v == "blue") col = COLOR_BLUE;
    else if (v == "yellow") col = COLOR_YELLOW;
    else if (v == "magenta") col = COLOR_MAGENTA;
    else if (v == "cyan") col = COLOR_CYAN;
    else { message = "set background: unknown color"; return; }
    term.setBackground(col);
    message = "background=" + v;
  });
  registry.register_command("set loglevel", [this](const CommandLine& cl){
    Logger::Level level;
    if (cl.args.empty() || !parse_log_level(cl.args[0], level)) {
      message = "set loglevel: use :set loglevel debug|info|warn|error";
      return;
    }
    Logger::set_min_level(level);
    message = "loglevel=" + cl.args[0];
  });
  registry.register_command("set editor", [this](const CommandLine& cl){
    editor_program = cl.raw;
    message = editor_program.empty() ? "editor=$EDITOR" : "editor=" + editor_program;
  });
  registry.register_command("set opener", [this](const CommandLine& cl){
    if (cl.args.empty()) { message = "set opener: use :set opener <program>"; return; }
    opener_program = cl.raw;
    message = "opener=" + opener_program;
  });
}

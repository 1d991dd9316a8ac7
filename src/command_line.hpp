#pragma once
/*
 * Command line
 *
 * Purpose: turn a command-mode line (typed or read from the rc file) into a registry call.
 * Usage: parse_command_line(":set color=on" minus the colon) -> {"set color", {"on"}, "on"}.
 * Note: "set name=value" and "set name value" both dispatch as "set name".
 *       raw keeps the argument text as typed, so paths with repeated spaces survive.
 */
#include <string>
#include <vector>

class CommandRegistry;

struct CommandLine {
  std::string name;
  std::vector<std::string> args;
  std::string raw;
};

CommandLine parse_command_line(const std::string& line);

// "~" and "~/..." against home; empty means home ("/" without one)
std::string expand_home(const std::string& arg, const char* home);

// rc file line -> command; false for blanks and comments (#, ", //)
bool rc_line_command(const std::string& line, std::string& command);

// false with "unknown command: <name>" in msg when nothing is registered under the name
bool run_command_line(const CommandRegistry& registry, const std::string& line, std::string& msg);

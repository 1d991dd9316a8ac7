#include "command_line.hpp"
#include "cmd_registry.hpp"
#include <cctype>
#include <sstream>

static bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

static std::string trim(const std::string& s) {
  size_t i = 0; while (i < s.size() && is_space(s[i])) i++;
  size_t j = s.size(); while (j > i && is_space(s[j-1])) j--;
  return s.substr(i, j - i);
}

// first word of s; rest gets the trimmed remainder
static std::string first_word(const std::string& s, std::string& rest) {
  size_t end = 0; while (end < s.size() && !is_space(s[end])) end++;
  rest = trim(s.substr(end));
  return s.substr(0, end);
}

static std::vector<std::string> split_words(const std::string& s) {
  std::istringstream iss(s);
  std::vector<std::string> out; std::string w;
  while (iss >> w) out.push_back(w);
  return out;
}

CommandLine parse_command_line(const std::string& line) {
  CommandLine cl;
  std::string rest;
  cl.name = first_word(trim(line), rest);
  if (cl.name == "set" && !rest.empty()) {
    std::string value;
    std::string opt = first_word(rest, value);
    size_t eq = opt.find('=');
    if (eq != std::string::npos) {
      // everything after '=' is the value, spaces included
      value = trim(rest.substr(eq + 1));
      opt = opt.substr(0, eq);
    }
    cl.name += " " + opt;
    rest = value;
  }
  cl.raw = rest;
  cl.args = split_words(rest);
  return cl;
}

std::string expand_home(const std::string& arg, const char* home) {
  if (arg.empty()) return home ? home : "/";
  if (home && arg[0] == '~' && (arg.size() == 1 || arg[1] == '/')) return std::string(home) + arg.substr(1);
  return arg;
}

bool rc_line_command(const std::string& line, std::string& command) {
  std::string s = trim(line);
  if (s.empty()) return false;
  if (s[0] == '#' || s[0] == '"') return false;
  if (s.size() >= 2 && s[0] == '/' && s[1] == '/') return false;
  if (s[0] == ':') s = trim(s.substr(1));
  if (s.empty()) return false;
  command = s;
  return true;
}

bool run_command_line(const CommandRegistry& registry, const std::string& line, std::string& msg) {
  CommandLine cl = parse_command_line(line);
  if (cl.name.empty()) return true;
  if (!registry.execute(cl)) {
    msg = "unknown command: " + cl.name;
    return false;
  }
  return true;
}

#pragma once
/*
 * CommandRegistry
 *
 * Purpose: register and dispatch command-mode commands.
 * Design: map name → handler; parse_command_line builds the CommandLine that is routed here.
 */
#include <algorithm>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>
#include "command_line.hpp"

class CommandRegistry {
public:
  using Handler = std::function<void(const CommandLine&)>;
  void register_command(const std::string& name, Handler h) { map_[name] = std::move(h); }
  void alias(const std::string& name, const std::string& target) {
    auto it = map_.find(target);
    if (it != map_.end()) map_[name] = it->second;
  }
  bool execute(const CommandLine& cl) const {
    auto it = map_.find(cl.name);
    if (it == map_.end()) return false;
    it->second(cl);
    return true;
  }
  bool has(const std::string& name) const { return map_.count(name) != 0; }
  std::vector<std::string> names() const {
    std::vector<std::string> out;
    out.reserve(map_.size());
    for (const auto& kv : map_) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
  }
private:
  std::unordered_map<std::string, Handler> map_;
};

#pragma once
/*
 * Logger
 *
 * Purpose: append timestamped diagnostics to a log file (the terminal belongs to ncurses).
 * Usage: Logger::init(path) once in main; Logger::info("...") anywhere.
 * Note: if the file can not be opened, log calls are silently dropped.
 */
#include <string>

class Logger {
public:
  enum class Level { Debug, Info, Warn, Error };

  static void init(const std::string& path);
  // $MDIR_LOG or the default path
  static std::string default_path();
  static void set_min_level(Level level);
  static void log(Level level, const std::string& message);
  static void debug(const std::string& message);
  static void info(const std::string& message);
  static void warn(const std::string& message);
  static void error(const std::string& message);
};

// "debug", "info", "warn", "error"; false leaves level untouched
bool parse_log_level(const std::string& name, Logger::Level& level);

#include "logger.hpp"
#include "config.hpp"
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <mutex>

static std::mutex log_mutex;
static std::ofstream log_file;  // kept open between calls
static Logger::Level min_level = Logger::Level::Debug;

void Logger::init(const std::string& path) {
  std::lock_guard<std::mutex> lock(log_mutex);
  if (log_file.is_open()) log_file.close();
  log_file.open(path, std::ios::app);
}

std::string Logger::default_path() {
  const char* env = std::getenv("MDIR_LOG");
  if (env && *env) return env;
  return MDIR_DEFAULT_LOG;
}

void Logger::set_min_level(Level level) {
  std::lock_guard<std::mutex> lock(log_mutex);
  min_level = level;
}

void Logger::log(Level level, const std::string& message) {
  std::lock_guard<std::mutex> lock(log_mutex);
  if (!log_file.is_open() || level < min_level) return;

  std::time_t now = std::time(nullptr);
  std::tm tm{};
  localtime_r(&now, &tm);

  const char* level_str = "";
  switch (level) {
    case Level::Debug: level_str = "[DEBUG] "; break;
    case Level::Info:  level_str = "[INFO]  "; break;
    case Level::Warn:  level_str = "[WARN]  "; break;
    case Level::Error: level_str = "[ERROR] "; break;
  }
  log_file << std::put_time(&tm, "[%H:%M:%S] ") << level_str << message << '\n';
  log_file.flush();
}

void Logger::debug(const std::string& message) { log(Level::Debug, message); }
void Logger::info(const std::string& message) { log(Level::Info, message); }
void Logger::warn(const std::string& message) { log(Level::Warn, message); }
void Logger::error(const std::string& message) { log(Level::Error, message); }

bool parse_log_level(const std::string& name, Logger::Level& level) {
  if (name == "debug") level = Logger::Level::Debug;
  else if (name == "info") level = Logger::Level::Info;
  else if (name == "warn") level = Logger::Level::Warn;
  else if (name == "error") level = Logger::Level::Error;
  else return false;
  return true;
}

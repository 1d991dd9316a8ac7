#include "terminal.hpp"
#include "browser.hpp"
#include "last_dir.hpp"
#include "logger.hpp"
#include <filesystem>
#include <iostream>
#include <system_error>

int main(int argc, char** argv) {
  Logger::init(Logger::default_path());
  std::filesystem::path start;
  if (argc >= 2) {
    start = argv[1];
  } else {
    std::error_code ec;
    start = std::filesystem::current_path(ec);
    if (ec) { std::cerr << "mdir: can not get working directory: " << ec.message() << "\n"; return 1; }
  }

  std::string msg;
  bool failed = false;
  bool persist = false;
  std::filesystem::path last;
  {
    Terminal term;
    Browser br;
    if (br.open(start, msg) != Status::Ok) {
      failed = true;
    } else {
      br.run();
      persist = br.persist_last_dir();
      last = br.last_directory();
    }
  }
  if (failed) {
    std::cerr << "mdir: " << msg << "\n";
    return 1;
  }
  if (persist && !write_last_dir(last, msg)) Logger::warn(msg);
  return 0;
}

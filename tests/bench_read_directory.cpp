#include "entry_order.hpp"
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
  std::filesystem::path dir = argc >= 2 ? argv[1] : "/usr/bin";
  int iters = 200;
  std::vector<Entry> out; std::string msg;
  auto t0 = std::chrono::steady_clock::now();
  for (int i = 0; i < iters; ++i) {
    if (!read_ordered(dir, true, out, msg)) { std::cerr << msg << "\n"; return 1; }
  }
  auto t1 = std::chrono::steady_clock::now();
  std::chrono::duration<double> dt = t1 - t0;
  std::cout << "read_ordered " << dir.string() << " entries=" << out.size()
            << " iters=" << iters << " took " << dt.count() << "s ("
            << (dt.count() / iters * 1e3) << " ms/read)\n";
  return 0;
}

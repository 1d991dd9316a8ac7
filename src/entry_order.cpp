#include "entry_order.hpp"
#include "entry_lister.hpp"
#include <algorithm>
#include <tuple>

bool is_hidden_name(const std::string& name) {
  return !name.empty() && name[0] == '.';
}

bool entry_less(const Entry& a, const Entry& b) {
  // std::string compares via char_traits<char>, which is unsigned byte order
  const bool a_file = !a.is_dir, b_file = !b.is_dir;
  const bool a_hidden = is_hidden_name(a.name), b_hidden = is_hidden_name(b.name);
  return std::tie(a_file, a_hidden, a.name) < std::tie(b_file, b_hidden, b.name);
}

void order_entries(std::vector<Entry>& entries, bool show_hidden) {
  if (!show_hidden) {
    entries.erase(std::remove_if(entries.begin(), entries.end(),
                                 [](const Entry& e){ return is_hidden_name(e.name); }),
                  entries.end());
  }
  std::stable_sort(entries.begin(), entries.end(), entry_less);
}

bool read_ordered(const std::filesystem::path& dir, bool show_hidden,
                  std::vector<Entry>& out, std::string& msg) {
  std::vector<Entry> raw;
  if (!list_directory(dir, raw, msg)) return false;
  order_entries(raw, show_hidden);
  out = std::move(raw);
  return true;
}

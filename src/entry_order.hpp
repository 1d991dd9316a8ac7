#pragma once
/*
 * EntryOrder
 *
 * Purpose: deterministic ordering and hidden-entry filtering of a raw directory read.
 * Order: directories first, then non-hidden before hidden, then byte-wise name.
 * Filter: with show_hidden == false, names starting with '.' are dropped entirely.
 */
#include <filesystem>
#include <string>
#include <vector>
#include "types.hpp"

bool is_hidden_name(const std::string& name);
bool entry_less(const Entry& a, const Entry& b);
void order_entries(std::vector<Entry>& entries, bool show_hidden);

// list_directory + order_entries; false with msg when the read fails
bool read_ordered(const std::filesystem::path& dir, bool show_hidden,
                  std::vector<Entry>& out, std::string& msg);

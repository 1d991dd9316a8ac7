#pragma once
/*
 * EntryLister
 *
 * Purpose: read the immediate children of a directory and classify each as file/dir.
 * Usage: list_directory(dir, out, msg); returns false with msg on failure (no partial result).
 * Note: symlinks count as directories only when they resolve to one; a broken link is a file.
 */
#include <filesystem>
#include <string>
#include <vector>
#include "types.hpp"

bool list_directory(const std::filesystem::path& dir,
                    std::vector<Entry>& out,
                    std::string& msg);

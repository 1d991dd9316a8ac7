#pragma once
/*
 * LastDir
 *
 * Purpose: exit hook writing the active pane's directory so a shell wrapper can cd there.
 * Location: $XDG_CACHE_HOME/.mdir, else $HOME/.cache/.mdir.
 */
#include <filesystem>
#include <optional>
#include <string>

std::optional<std::filesystem::path> last_dir_file();
bool write_last_dir(const std::filesystem::path& dir, std::string& msg);
// same as write_last_dir but to an explicit file
bool write_last_dir_to(const std::filesystem::path& file,
                       const std::filesystem::path& dir,
                       std::string& msg);

#pragma once
/*
 * Launcher
 *
 * Purpose: hand a target path to an external program (editor / open handler).
 * Usage: edit_file blocks until the program exits (terminal editors);
 *        open_file returns once the program has started, its stdio on /dev/null.
 * Note: program may carry arguments ("code -w"); it is split on whitespace.
 */
#include <filesystem>
#include <string>
#include <vector>

std::vector<std::string> split_program(const std::string& program);
// $EDITOR when override is empty; empty result means "no editor configured"
std::string resolve_editor(const std::string& override_program);

bool edit_file(const std::string& program,
               const std::filesystem::path& path,
               std::string& msg);
// false when the program can not be started; its exit status is not awaited
bool open_file(const std::string& program,
               const std::filesystem::path& path,
               std::string& msg);

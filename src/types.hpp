#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Status/Entry/RowStyle/listing rows).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <filesystem>
#include <string>
#include <vector>

enum class Status { Ok, IoError, NotADirectory, NoTarget, OutOfRange };

inline const char* status_name(Status s) {
  switch (s) {
    case Status::Ok: return "ok";
    case Status::IoError: return "io-error";
    case Status::NotADirectory: return "not-a-directory";
    case Status::NoTarget: return "no-target";
    case Status::OutOfRange: return "out-of-range";
  }
  return "unknown";
}

// one immediate child of a directory; regenerated on every read
struct Entry {
  std::filesystem::path path;
  std::string name;
  bool is_dir = false;
};

enum class RowStyle { File, FileHighlighted, Directory, DirectoryHighlighted, Marked, Plain };

struct Segment {
  std::string text;
  RowStyle style = RowStyle::Plain;
};

using Row = std::vector<Segment>;
using Listing = std::vector<Row>;

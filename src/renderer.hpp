#pragma once
/*
 * Renderer
 *
 * Purpose: draw the active pane: title (view index + directory), the listing rows,
 *          and the status/command line.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless; receives a snapshot from Browser each frame.
 */
#include <string>
#include "iterminal.hpp"
#include "mode_controller.hpp"
#include "pane.hpp"

struct FrameInfo {
  const Pane* pane = nullptr;
  int pane_index = 0;
  int pane_count = 1;
  const ModeController* mode = nullptr;
  std::string message;
  bool enable_color = true;
};

class Renderer {
public:
  // title row + status row + the window's inclusive upper bound
  static constexpr int kChromeRows = 3;
  static int viewport_height_for(int term_rows);

  void render(ITerminal& term, const FrameInfo& frame);

private:
  void draw_row(ITerminal& term, int screen_row, const Row& row, int cols, bool enable_color);
};

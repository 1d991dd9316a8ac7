#include "renderer.hpp"
#include <algorithm>
#include <sstream>

int Renderer::viewport_height_for(int term_rows) {
  return std::max(1, term_rows - kChromeRows);
}

void Renderer::draw_row(ITerminal& term, int screen_row, const Row& row, int cols, bool enable_color) {
  int col = 0;
  for (const auto& seg : row) {
    if (col >= cols) break;
    std::string text = seg.text.substr(0, static_cast<size_t>(cols - col));
    if (enable_color) {
      term.draw_styled(screen_row, col, text, seg.style);
    } else if (seg.style == RowStyle::FileHighlighted || seg.style == RowStyle::DirectoryHighlighted) {
      term.draw_highlighted(screen_row, col, text);
    } else {
      term.draw_text(screen_row, col, text);
    }
    col += static_cast<int>(text.size());
  }
  term.clear_to_eol(screen_row, std::min(col, cols));
}

void Renderer::render(ITerminal& term, const FrameInfo& frame) {
  TermSize sz = term.getSize();
  int rows = sz.rows, cols = sz.cols;
  term.clear();
  if (!frame.pane || rows <= 0 || cols <= 0) { term.refresh(); return; }
  const Pane& pane = *frame.pane;

  std::ostringstream title;
  title << "[" << (frame.pane_index + 1) << "/" << frame.pane_count << "] "
        << pane.current_dir().string();
  if (pane.show_hidden()) title << " [hidden]";
  std::string title_str = title.str().substr(0, static_cast<size_t>(cols));
  term.draw_text(0, 0, title_str);
  term.clear_to_eol(0, static_cast<int>(title_str.size()));

  Listing listing = pane.listing();
  int max_rows = std::max(0, rows - 2);
  for (int i = 0; i < static_cast<int>(listing.size()) && i < max_rows; ++i) {
    draw_row(term, 1 + i, listing[i], cols, frame.enable_color);
  }

  std::string status;
  const std::string* cmd = frame.mode ? frame.mode->command_text() : nullptr;
  if (cmd) {
    status = ":" + *cmd;
  } else {
    std::ostringstream oss;
    oss << (frame.mode ? frame.mode->mode_name() : "NORMAL") << "  ";
    int total = static_cast<int>(pane.directory().size());
    oss << (total == 0 ? 0 : std::min(pane.absolute() + 1, total)) << "/" << total;
    if (!pane.marks().empty()) oss << "  marked:" << pane.marks().size();
    if (!frame.message.empty()) oss << "  | " << frame.message;
    status = oss.str();
  }
  term.draw_text(rows - 1, 0, status.substr(0, static_cast<size_t>(cols)));
  term.clear_to_eol(rows - 1, std::min(static_cast<int>(status.size()), cols));
  if (cmd) {
    term.set_cursor_visible(true);
    term.move_cursor(rows - 1, std::min(static_cast<int>(status.size()), cols - 1));
  } else {
    term.set_cursor_visible(false);
    term.move_cursor(rows - 1, 0);
  }
  term.refresh();
}

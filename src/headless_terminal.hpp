#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal recording draws into a character grid, for tests.
 * Usage: render into it, then inspect row_text(row) / style_at(row, col).
 */
#include <algorithm>
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols)
    : rows_(rows), cols_(cols),
      grid_(rows, std::string(cols, ' ')),
      styles_(rows, std::vector<RowStyle>(cols, RowStyle::Plain)) {}

  TermSize getSize() const override { return {rows_, cols_}; }
  void clear() override {
    for (auto& r : grid_) r.assign(cols_, ' ');
    for (auto& r : styles_) r.assign(cols_, RowStyle::Plain);
  }
  void draw_text(int row, int col, const std::string& text) override { put(row, col, text, RowStyle::Plain); }
  void draw_highlighted(int row, int col, const std::string& text) override {
    put(row, col, text, RowStyle::FileHighlighted);
  }
  void draw_styled(int row, int col, const std::string& text, RowStyle style) override { put(row, col, text, style); }
  void move_cursor(int row, int col) override { cursor_row = row; cursor_col = col; }
  void set_cursor_visible(bool visible) override { cursor_visible = visible; }
  void refresh() override { ++refreshes; }
  void clear_to_eol(int row, int col) override {
    if (row < 0 || row >= rows_) return;
    for (int c = std::max(0, col); c < cols_; ++c) { grid_[row][c] = ' '; styles_[row][c] = RowStyle::Plain; }
  }

  // row contents without trailing blanks
  std::string row_text(int row) const {
    if (row < 0 || row >= rows_) return std::string();
    std::string s = grid_[row];
    size_t end = s.find_last_not_of(' ');
    return end == std::string::npos ? std::string() : s.substr(0, end + 1);
  }
  RowStyle style_at(int row, int col) const { return styles_[row][col]; }

  int cursor_row = 0;
  int cursor_col = 0;
  bool cursor_visible = true;
  int refreshes = 0;

private:
  void put(int row, int col, const std::string& text, RowStyle style) {
    if (row < 0 || row >= rows_) return;
    for (size_t i = 0; i < text.size(); ++i) {
      int c = col + static_cast<int>(i);
      if (c < 0) continue;
      if (c >= cols_) break;
      grid_[row][c] = text[i];
      styles_[row][c] = style;
    }
  }
  int rows_;
  int cols_;
  std::vector<std::string> grid_;
  std::vector<std::vector<RowStyle>> styles_;
};

#include "ncurses_terminal.hpp"

// color pair ids, one per row style
static constexpr short PAIR_FILE = 1;
static constexpr short PAIR_FILE_HL = 2;
static constexpr short PAIR_DIR = 3;
static constexpr short PAIR_DIR_HL = 4;
static constexpr short PAIR_MARKED = 5;
static constexpr short PAIR_PLAIN = 6;

static void init_pairs(short bg) {
  init_pair(PAIR_FILE, COLOR_WHITE, bg);
  init_pair(PAIR_FILE_HL, COLOR_BLACK, COLOR_WHITE);
  init_pair(PAIR_DIR, COLOR_BLUE, bg);
  init_pair(PAIR_DIR_HL, COLOR_BLACK, COLOR_BLUE);
  init_pair(PAIR_MARKED, COLOR_YELLOW, bg);
  init_pair(PAIR_PLAIN, -1, bg);
}

NcursesTerminal::NcursesTerminal() {
  if (has_colors()) {
    start_color();
    // -1 needs use_default_colors(); fall back to black otherwise
    if (use_default_colors() != OK) bg_color_ = COLOR_BLACK;
    init_pairs(bg_color_);
    colors_ = true;
  }
}

TermSize NcursesTerminal::getSize() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  if (colors_) attron(COLOR_PAIR(PAIR_PLAIN));
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  if (colors_) attroff(COLOR_PAIR(PAIR_PLAIN));
}

void NcursesTerminal::draw_highlighted(int row, int col, const std::string& text) {
  attron(A_REVERSE);
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  attroff(A_REVERSE);
}

void NcursesTerminal::draw_styled(int row, int col, const std::string& text, RowStyle style) {
  if (!colors_) {
    if (style == RowStyle::FileHighlighted || style == RowStyle::DirectoryHighlighted) draw_highlighted(row, col, text);
    else draw_text(row, col, text);
    return;
  }
  short pair = PAIR_PLAIN;
  attr_t extra = A_NORMAL;
  switch (style) {
    case RowStyle::File: pair = PAIR_FILE; break;
    case RowStyle::FileHighlighted: pair = PAIR_FILE_HL; break;
    case RowStyle::Directory: pair = PAIR_DIR; extra = A_BOLD; break;
    case RowStyle::DirectoryHighlighted: pair = PAIR_DIR_HL; extra = A_BOLD; break;
    case RowStyle::Marked: pair = PAIR_MARKED; extra = A_BOLD; break;
    case RowStyle::Plain: pair = PAIR_PLAIN; break;
  }
  attron(COLOR_PAIR(pair) | extra);
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  attroff(COLOR_PAIR(pair) | extra);
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::set_cursor_visible(bool visible) { curs_set(visible ? 1 : 0); }

void NcursesTerminal::refresh() { ::refresh(); }

void NcursesTerminal::clear_to_eol(int row, int col) {
  move(row, col);
  clrtoeol();
}

void NcursesTerminal::setBackground(short color) {
  if (!colors_) return;
  bg_color_ = color;
  init_pairs(bg_color_);
  wbkgd(stdscr, COLOR_PAIR(PAIR_PLAIN));
  erase();
}

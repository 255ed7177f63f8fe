#include "ncurses_terminal.hpp"
#include <algorithm>
#include "utf8.hpp"

// color pair per style id; pair 0 is reserved by ncurses
static short pair_for_style(int style) {
  switch (style) {
    case kStyleBorder: return 2;
    case kStyleTitle: return 3;
    case kStyleScrollbar: return 4;
    default: return 1;
  }
}

static void init_pairs(short bg) {
  init_pair(1, -1, bg);           // text
  init_pair(2, COLOR_CYAN, bg);   // border
  init_pair(3, COLOR_YELLOW, bg); // title
  init_pair(4, COLOR_BLUE, bg);   // scrollbar
}

NcursesTerminal::NcursesTerminal() {
  if (has_colors()) {
    start_color();
    if (use_default_colors() == OK) {
      init_pairs(-1);
    } else {
      bg_color_ = COLOR_BLACK;
      init_pairs(COLOR_BLACK); // fallback
    }
  }
}
NcursesTerminal::~NcursesTerminal() {}

TermSize NcursesTerminal::getSize() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::draw_text(int row, int col, std::string_view text, int max_width, int style) {
  TermSize sz = getSize();
  if (row < 0 || row >= sz.rows || col < 0 || col >= sz.cols) return;
  int cols = std::min(max_width, sz.cols - col);
  if (cols <= 0) return;
  std::string shown = strip_control(text);
  int n = static_cast<int>(utf8_prefix_bytes(shown, cols));
  if (n == 0) return;
  short pair = pair_for_style(style);
  if (has_colors()) attron(COLOR_PAIR(pair));
  if (style == kStyleTitle) attron(A_BOLD);
  mvaddnstr(row, col, shown.data(), n);
  if (style == kStyleTitle) attroff(A_BOLD);
  if (has_colors()) attroff(COLOR_PAIR(pair));
}

void NcursesTerminal::refresh() { ::refresh(); }

void NcursesTerminal::setBackground(short color) {
  if (!has_colors()) return;
  bg_color_ = color;
  init_pairs(bg_color_);
  wbkgd(stdscr, COLOR_PAIR(1));
  erase();
}

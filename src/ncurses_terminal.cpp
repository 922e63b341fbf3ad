#include "ncurses_terminal.hpp"
#include <ncurses.h>

NcursesTerminal::NcursesTerminal() {
  if (has_colors()) {
    start_color();
    short bg = -1;
    if (use_default_colors() != OK) bg = COLOR_BLACK; // fallback
    init_pair(kPairFinger, COLOR_YELLOW, bg);
    init_pair(kPairDefault, bg == -1 ? -1 : COLOR_WHITE, bg);
    init_pair(kPairAccent, COLOR_CYAN, bg);
    init_pair(kPairError, COLOR_RED, bg);
    init_pair(kPairDim, COLOR_WHITE, bg);
  }
}
NcursesTerminal::~NcursesTerminal() {}

TermSize NcursesTerminal::getSize() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  mvaddnstr(row, col, text.c_str(), (int)text.size());
}

void NcursesTerminal::draw_colored(int row, int col, const std::string& text, int color_pair_id) {
  if (has_colors()) attron(COLOR_PAIR(color_pair_id));
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  if (has_colors()) attroff(COLOR_PAIR(color_pair_id));
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::show_cursor(bool visible) { curs_set(visible ? 1 : 0); }

void NcursesTerminal::refresh() { ::refresh(); }

#include "terminal.hpp"
#include <ncurses.h>
#include <locale.h>

Terminal::Terminal() {
  setlocale(LC_ALL, "");
  initscr();
  raw();
  noecho();
  keypad(stdscr, TRUE);
  ESCDELAY = 25;
}

Terminal::~Terminal() {
  curs_set(1);
  endwin();
}

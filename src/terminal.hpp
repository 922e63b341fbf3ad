#pragma once
/*
 * Terminal
 *
 * Purpose: RAII wrapper around ncurses init/teardown.
 * Usage: construct in main before the App; destructor restores terminal.
 * Note: manages terminal modes (raw/noecho/keypad), not rendering.
 */

class Terminal {
public:
  Terminal();
  ~Terminal();
};

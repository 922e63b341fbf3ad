#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal, records drawn characters for tests.
 * Note: colors/highlight are dropped; only text and cursor state are kept.
 */
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols);
  TermSize getSize() const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_colored(int row, int col, const std::string& text, int color_pair_id) override;
  void move_cursor(int row, int col) override;
  void show_cursor(bool visible) override;
  void refresh() override;

  const std::string& row(int r) const { return grid_[r]; }
  bool contains(const std::string& needle) const;
  int refresh_count() const { return refreshes_; }
  bool cursor_visible() const { return cursor_visible_; }
  int cursor_row() const { return cur_row_; }
  int cursor_col() const { return cur_col_; }
private:
  int rows_;
  int cols_;
  std::vector<std::string> grid_;
  int cur_row_ = 0;
  int cur_col_ = 0;
  bool cursor_visible_ = true;
  int refreshes_ = 0;
};

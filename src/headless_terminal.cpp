#include "headless_terminal.hpp"

HeadlessTerminal::HeadlessTerminal(int rows, int cols)
  : rows_(rows), cols_(cols), grid_(rows, std::string(cols, ' ')) {}

TermSize HeadlessTerminal::getSize() const { return {rows_, cols_}; }

void HeadlessTerminal::clear() {
  for (auto& r : grid_) r.assign(cols_, ' ');
}

void HeadlessTerminal::draw_text(int row, int col, const std::string& text) {
  if (row < 0 || row >= rows_) return;
  for (int i = 0; i < (int)text.size(); ++i) {
    int c = col + i;
    if (c < 0) continue;
    if (c >= cols_) break;
    grid_[row][c] = text[i];
  }
}

void HeadlessTerminal::draw_colored(int row, int col, const std::string& text, int) {
  draw_text(row, col, text);
}

void HeadlessTerminal::move_cursor(int row, int col) { cur_row_ = row; cur_col_ = col; }

void HeadlessTerminal::show_cursor(bool visible) { cursor_visible_ = visible; }

void HeadlessTerminal::refresh() { refreshes_++; }

bool HeadlessTerminal::contains(const std::string& needle) const {
  for (const auto& r : grid_) if (r.find(needle) != std::string::npos) return true;
  return false;
}

#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract draw surface (size, clear, draw, cursor, refresh).
 * Goal: keep diagram/screen code off ncurses, enable headless testing.
 */
#include <string>

struct TermSize { int rows; int cols; };

// color pair ids understood by every backend
enum ColorPair { kPairDefault = 2, kPairFinger = 1, kPairAccent = 3, kPairError = 4, kPairDim = 5 };

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize getSize() const = 0;
  virtual void clear() = 0;
  virtual void draw_text(int row, int col, const std::string& text) = 0;
  virtual void draw_colored(int row, int col, const std::string& text, int color_pair_id) = 0;
  virtual void move_cursor(int row, int col) = 0;
  virtual void show_cursor(bool visible) = 0;
  virtual void refresh() = 0;
};

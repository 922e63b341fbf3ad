#pragma once
#include <string>
/*
 * InputLine
 *
 * Purpose: the chord prompt buffer; append-only editing at the end of line.
 * Note: key decoding stays in App; this only owns the text.
 */

class InputLine {
public:
  bool insert(int ch);
  bool backspace();
  bool delete_token();
  bool clear();
  const std::string& text() const { return text_; }
  bool empty() const { return text_.empty(); }
  int size() const { return static_cast<int>(text_.size()); }
private:
  std::string text_;
};

#include "input.hpp"

bool InputLine::insert(int ch) {
  if (ch < 32 || ch > 126) return false;
  text_.push_back(static_cast<char>(ch));
  return true;
}

bool InputLine::backspace() {
  if (text_.empty()) return false;
  text_.pop_back();
  return true;
}

// drop trailing spaces, then back to the previous ',' (kept) or line start
bool InputLine::delete_token() {
  if (text_.empty()) return false;
  size_t end = text_.size();
  while (end > 0 && text_[end - 1] == ' ') end--;
  if (end > 0 && text_[end - 1] == ',') end--;
  size_t pos = text_.rfind(',', end == 0 ? 0 : end - 1);
  if (end == 0 || pos == std::string::npos) text_.clear();
  else text_.erase(pos + 1);
  return true;
}

bool InputLine::clear() {
  if (text_.empty()) return false;
  text_.clear();
  return true;
}

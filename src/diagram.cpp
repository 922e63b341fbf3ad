#include "diagram.hpp"
#include <algorithm>

static void pad_block(DiagramBlock& b) {
  size_t w = 0;
  for (const auto& l : b.lines) w = std::max(w, l.size());
  for (auto& l : b.lines) l.resize(w, ' ');
}

static std::string fret_header(const FretWindow& window) {
  std::string s(kStringPrefixWidth, ' ');
  for (int f = window.low; f <= window.high; ++f) {
    std::string cell = " " + std::to_string(f);
    cell.resize(kFretCellWidth, ' ');
    s += cell;
  }
  return s;
}

static std::string string_row(int idx, int fret, const FretWindow& window, const DiagramGlyphs& glyphs) {
  std::string name = string_name(idx);
  std::string s(2 - std::min<size_t>(2, name.size()), ' ');
  s += name;
  s += ' ';
  if (fret == kOpenFret) s += glyphs.open;
  else if (fret == kMutedFret) s += glyphs.muted;
  else s += ' ';
  s += ' ';
  s += window.low == 1 ? '#' : '|';
  for (int f = window.low; f <= window.high; ++f) {
    s += '-';
    s += (fret == f) ? glyphs.finger : '-';
    s += "-|";
  }
  return s;
}

DiagramBlock render_diagram(const Chord& chord, const FretWindow& window, const DiagramGlyphs& glyphs) {
  DiagramBlock b;
  b.lines.push_back(chord.name);
  b.lines.push_back(fret_header(window));
  for (int i = kStringCount - 1; i >= 0; --i) {
    b.lines.push_back(string_row(i, chord.frets[i], window, glyphs));
  }
  pad_block(b);
  return b;
}

DiagramBlock render_unknown_block(const std::string& token) {
  DiagramBlock b;
  b.lines.push_back(token);
  b.lines.push_back("  ?  not found");
  pad_block(b);
  return b;
}

#include "diagram.hpp"
#include <cassert>
#include <string>

static Chord chord(const std::string& name, int g, int c, int e, int a) {
  Chord ch;
  ch.name = name;
  ch.frets = {g, c, e, a};
  return ch;
}

int main() {
  Chord am = chord("Am", 2, 0, 0, 0);
  DiagramBlock b = render_diagram(am, FretWindow{2, 6});
  assert(b.height() == 6);
  assert(b.width() == kStringPrefixWidth + 5 * kFretCellWidth);
  for (const auto& l : b.lines) assert((int)l.size() == b.width());
  assert(b.lines[0].rfind("Am", 0) == 0);
  assert(b.lines[1] == "       2   3   4   5   6  ");
  assert(b.lines[2] == " A O |---|---|---|---|---|");
  assert(b.lines[3] == " E O |---|---|---|---|---|");
  assert(b.lines[4] == " C O |---|---|---|---|---|");
  assert(b.lines[5] == " G   |-*-|---|---|---|---|");

  // window at the nut, muted string
  Chord d = chord("D7x", kMutedFret, 2, 2, 3);
  b = render_diagram(d, FretWindow{1, 5});
  assert(b.lines[1] == "       1   2   3   4   5  ");
  assert(b.lines[2] == " A   #---|---|-*-|---|---|");
  assert(b.lines[5] == " G X #---|---|---|---|---|");

  // absolute fret numbers, two digits
  Chord high = chord("High", 10, 9, 8, 7);
  b = render_diagram(high, FretWindow{7, 11});
  assert(b.lines[1] == "       7   8   9   10  11 ");
  assert(b.lines[2] == " A   |-*-|---|---|---|---|");
  assert(b.lines[5] == " G   |---|---|---|-*-|---|");

  // deterministic
  DiagramBlock again = render_diagram(high, FretWindow{7, 11});
  assert(again.lines == b.lines);

  DiagramGlyphs glyphs;
  glyphs.finger = '@';
  b = render_diagram(am, FretWindow{2, 6}, glyphs);
  assert(b.lines[5] == " G   |-@-|---|---|---|---|");

  // long names widen the block, every line stays the same width
  Chord longname = chord("AVeryLongChordNameIndeedYesSir", 0, 0, 0, 0);
  b = render_diagram(longname, FretWindow{1, 5});
  assert(b.width() == (int)longname.name.size());
  for (const auto& l : b.lines) assert((int)l.size() == b.width());

  DiagramBlock u = render_unknown_block("Hx");
  assert(u.height() == 2);
  assert(u.lines[0].rfind("Hx", 0) == 0);
  assert(u.lines[1].find("not found") != std::string::npos);
  return 0;
}

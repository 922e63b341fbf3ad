#include "chord_view.hpp"
#include <cassert>
#include <string>

static ChordTable load() {
  std::string msg; bool ok = false;
  ChordTable t = ChordTable::from_entries(embedded_chords(), msg, ok);
  assert(ok);
  return t;
}

int main() {
  ChordTable t = load();

  ChordView v = build_chord_view(t, "C, Am, F, G", 200);
  assert(!v.empty_input);
  assert(v.block_count == 4);
  assert(v.unknown.empty());
  assert((v.resolved == std::vector<std::string>{"C", "Am", "F", "G"}));
  assert(v.frame.size() == 6);
  assert(v.frame[0].find("C") == 0);
  assert(v.frame[0].find("Am") == 28);
  assert(v.frame[0].find("F") == 56);
  assert(v.frame[0].find("G") == 84);

  // narrower display wraps two per row, order kept
  v = build_chord_view(t, "C, Am, F, G", 80);
  assert(v.frame.size() == 13);
  assert(v.frame[0].find("C") == 0 && v.frame[0].find("Am") == 28);
  assert(v.frame[7].find("F") == 0 && v.frame[7].find("G", 1) == 28);
  for (const auto& line : v.frame) assert(line.size() <= 80);

  // each chord gets its own window unless shared
  assert(v.frame[1].find(" 3 ") != std::string::npos); // C: frets 3..7
  ViewOptions shared;
  shared.shared_window = true;
  v = build_chord_view(t, "C, Am, F, G", 200, shared);
  assert(v.frame[1].rfind("       1   2   3   4   5", 0) == 0);

  // unknown tokens do not abort the batch
  v = build_chord_view(t, "C, Hm, G", 200);
  assert((v.resolved == std::vector<std::string>{"C", "G"}));
  assert((v.unknown == std::vector<std::string>{"Hm"}));
  assert(v.block_count == 3);
  assert(v.frame[0].find("Hm") == 28);
  assert(unknown_message(v.unknown) == "Chord not found: Hm");

  ViewOptions skip;
  skip.show_unknown = false;
  v = build_chord_view(t, "C, Hm, Xq, G", 200, skip);
  assert(v.block_count == 2);
  assert(v.frame[0].find("G") == 28);
  assert(unknown_message(v.unknown) == "Chords not found: Hm, Xq");

  v = build_chord_view(t, "  ,  ", 80);
  assert(v.empty_input);
  assert(v.frame.empty());
  assert(v.block_count == 0);

  // display narrower than a block degrades to one column
  v = build_chord_view(t, "C, G", 10);
  assert(v.frame.size() == 13);
  return 0;
}

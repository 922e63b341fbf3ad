#include "chord_table.hpp"
#include <array>
#include <cassert>
#include <initializer_list>
#include <string>
#include <vector>

static ChordTable load() {
  std::string msg; bool ok = false;
  ChordTable t = ChordTable::from_entries(embedded_chords(), msg, ok);
  assert(ok);
  return t;
}

static bool frets_are(const Chord& c, int g, int cc, int e, int a) {
  return c.frets == std::array<int, kStringCount>{g, cc, e, a};
}

static void test_every_known_name_has_four_strings(const ChordTable& t) {
  auto names = t.names();
  assert(names.size() == t.size());
  assert(t.size() == 312 + 5 * 26);
  for (const auto& n : names) {
    auto c = t.lookup(n);
    assert(c.has_value());
    assert(c->name == n);
    assert(c->frets.size() == 4);
    for (int f : c->frets) assert(f >= kMutedFret && f <= 12);
  }
}

static void test_common_shapes(const ChordTable& t) {
  assert(frets_are(*t.lookup("C"), 0, 0, 0, 3));
  assert(frets_are(*t.lookup("Am"), 2, 0, 0, 0));
  assert(frets_are(*t.lookup("F"), 2, 0, 1, 0));
  assert(frets_are(*t.lookup("G"), 0, 2, 3, 2));
  assert(frets_are(*t.lookup("Am7"), 0, 0, 0, 0));
  assert(frets_are(*t.lookup("Bb"), 3, 2, 1, 1));
}

static void test_extended_qualities(const ChordTable& t) {
  assert(frets_are(*t.lookup("Cmaj9"), 4, 2, 0, 3));
  assert(frets_are(*t.lookup("Am9"), 2, 0, 3, 2));
  assert(frets_are(*t.lookup("C6/9"), 2, 2, 0, 3));
  assert(frets_are(*t.lookup("C6/9:2"), 5, 4, 5, 5));
  assert(t.lookup("C6/9:2")->name == "C6/9:2");
  assert(!t.lookup("C6/9:3").has_value());
  assert(!t.lookup("C6/").has_value());
  for (const char* q : {"7sus2", "7+5", "7b5", "mM7", "madd9", "add11", "madd11"}) {
    assert(t.lookup(std::string("C") + q).has_value());
    assert(t.lookup(std::string("B") + q).has_value());
  }
  assert(t.lookup("Dbmaj9")->frets == t.lookup("C#maj9")->frets);
  assert(t.lookup("A#6/9")->frets == t.lookup("Bb6/9")->frets);
  assert(t.voicing_count("Cm9") == 1);
}

static void test_enharmonic_aliases(const ChordTable& t) {
  assert(t.lookup("Db")->frets == t.lookup("C#")->frets);
  assert(t.lookup("Dbm7")->frets == t.lookup("C#m7")->frets);
  assert(t.lookup("G#")->frets == t.lookup("Ab")->frets);
  assert(t.lookup("A#sus4")->frets == t.lookup("Bbsus4")->frets);
  assert(t.lookup("Gbdim")->name == "Gbdim");
}

static void test_unknown_names(const ChordTable& t) {
  assert(!t.lookup("c").has_value());
  assert(!t.lookup("am").has_value());
  assert(!t.lookup("H").has_value());
  assert(!t.lookup("").has_value());
  assert(!t.lookup("Cmaj13").has_value());
  assert(!t.lookup(" C").has_value());
  assert(!t.lookup("Fb").has_value());
}

static void test_variants(const ChordTable& t) {
  auto c2 = t.lookup("C:2");
  assert(c2.has_value());
  assert(c2->name == "C:2");
  assert(frets_are(*c2, 5, 4, 3, 3));
  assert(frets_are(*t.lookup("C:1"), 0, 0, 0, 3));
  assert(t.voicing_count("C") == 2);
  assert(t.voicing_count("Ddim") == 1);
  assert(t.voicing_count("Q") == 0);
  assert(!t.lookup("C:3").has_value());
  assert(!t.lookup("C:0").has_value());
  assert(!t.lookup("C:").has_value());
  assert(!t.lookup("C:x").has_value());
  assert(!t.lookup("Ddim:2").has_value());
}

static void test_malformed_data_is_rejected() {
  std::string msg; bool ok = true;
  ChordTable::from_entries({{"Bad", {"0 0 0"}}}, msg, ok);
  assert(!ok);
  assert(msg.find("Bad") != std::string::npos);

  ok = true;
  ChordTable::from_entries({{"Bad", {"0 0 a 3"}}}, msg, ok);
  assert(!ok);

  ok = true;
  ChordTable::from_entries({{"C", {"0 0 0 3"}}, {"C", {"5 4 3 3"}}}, msg, ok);
  assert(!ok);
  assert(msg.find("duplicate") != std::string::npos);

  ok = true;
  ChordTable::from_entries({{"C", {}}}, msg, ok);
  assert(!ok);

  ok = false;
  ChordTable small = ChordTable::from_entries({{"C", {"0 0 0 3"}}, {"X7", {"x 2 3 2"}}}, msg, ok);
  assert(ok);
  assert(small.size() == 2);
  assert(frets_are(*small.lookup("X7"), kMutedFret, 2, 3, 2));
}

static void test_parse_frets() {
  std::array<int, kStringCount> f{};
  std::string msg;
  assert(parse_frets("x 2 3 X", f, msg));
  assert(f[0] == kMutedFret && f[3] == kMutedFret);
  assert(format_frets(f) == "x 2 3 x");
  assert(!parse_frets("0 0 0 0 0", f, msg));
  assert(!parse_frets("", f, msg));
  assert(!parse_frets("0 0 0 -1", f, msg));
  assert(!parse_frets("0 0 0 123", f, msg));
}

int main() {
  ChordTable t = load();
  test_every_known_name_has_four_strings(t);
  test_common_shapes(t);
  test_extended_qualities(t);
  test_enharmonic_aliases(t);
  test_unknown_names(t);
  test_variants(t);
  test_malformed_data_is_rejected();
  test_parse_frets();
  return 0;
}

#include "print_mode.hpp"
#include "config.hpp"
#include <cassert>
#include <sstream>
#include <string>
#include <vector>

static ChordTable load() {
  std::string msg; bool ok = false;
  ChordTable t = ChordTable::from_entries(embedded_chords(), msg, ok);
  assert(ok);
  return t;
}

static std::vector<std::string> lines_of(const std::string& s) {
  std::vector<std::string> out;
  std::istringstream iss(s);
  std::string line;
  while (std::getline(iss, line)) out.push_back(line);
  return out;
}

static void test_nothing_resolved_exits_2(const ChordTable& t) {
  std::ostringstream out;
  assert(print_chords(t, "Zz", 80, out) == 2);
  assert(out.str() == "Chord not found: Zz\n");

  std::ostringstream empty;
  assert(print_chords(t, " , ", 80, empty) == 2);
  assert(empty.str().empty());
}

static void test_partial_batch_exits_0(const ChordTable& t) {
  std::ostringstream out;
  assert(print_chords(t, "C, Hm", 80, out) == 0);
  auto lines = lines_of(out.str());
  assert(lines.size() == 7);
  assert(lines[0] == "C");
  assert(lines[2] == " A   |-*-|---|---|---|---|");
  assert(lines[6] == "Chord not found: Hm");
  assert(out.str().find("?  not found") == std::string::npos);
}

static void test_width_wraps_blocks(const ChordTable& t) {
  std::ostringstream out;
  assert(print_chords(t, "C, G, Am, F", 30, out) == 0);
  auto lines = lines_of(out.str());
  assert(lines.size() == 4 * 6 + 3);
  for (const auto& l : lines) assert(l.size() <= 30);
  assert(lines[7] == "G");
}

static void test_list_prints_every_name(const ChordTable& t) {
  std::ostringstream out;
  list_chords(t, out);
  auto lines = lines_of(out.str());
  assert(lines.size() == t.size());
  assert(lines.size() == 442);
  assert(lines[0] == "C  0 0 0 3, 5 4 3 3");
  std::string s = "\n" + out.str();
  assert(s.find("\nDdim  7 5 4 5\n") != std::string::npos);
  assert(s.find("\nC6/9  2 2 0 3, 5 4 5 5\n") != std::string::npos);
  assert(s.find("\nDbmaj9  6 5 8 6\n") != std::string::npos);
}

static void test_print_width() {
  assert(print_width(nullptr) == UKE_PRINT_WIDTH);
  assert(print_width("120") == 120);
  assert(print_width("0") == UKE_PRINT_WIDTH);
  assert(print_width("wide") == UKE_PRINT_WIDTH);
}

int main() {
  ChordTable t = load();
  test_nothing_resolved_exits_2(t);
  test_partial_batch_exits_0(t);
  test_width_wraps_blocks(t);
  test_list_prints_every_name(t);
  test_print_width();
  return 0;
}

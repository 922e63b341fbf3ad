#include "chord_parser.hpp"
#include <cassert>
#include <string>
#include <vector>

int main() {
  using V = std::vector<std::string>;
  assert(parse_chord_list("C, Am7 , , G") == (V{"C", "Am7", "G"}));
  assert(parse_chord_list("").empty());
  assert(parse_chord_list("   ").empty());
  assert(parse_chord_list(",,,").empty());
  assert(parse_chord_list(" , \t, ").empty());
  assert(parse_chord_list("  C  ") == (V{"C"}));
  assert(parse_chord_list("C,Am7,G,") == (V{"C", "Am7", "G"}));
  assert(parse_chord_list(",F#dim") == (V{"F#dim"}));
  // names are not validated here
  assert(parse_chord_list("nope, C:2") == (V{"nope", "C:2"}));
  assert(trim("\t x y \n") == "x y");
  assert(trim("") == "");
  return 0;
}

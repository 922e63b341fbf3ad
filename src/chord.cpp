#include "chord.hpp"
#include <sstream>
#include <cctype>

static const char* kStringNames[kStringCount] = {"G", "C", "E", "A"};

const char* string_name(int idx) {
  if (idx < 0 || idx >= kStringCount) return "?";
  return kStringNames[idx];
}

bool is_fretted(int fret) { return fret >= 1; }

bool has_fretted(const Chord& c) {
  for (int f : c.frets) if (is_fretted(f)) return true;
  return false;
}

bool parse_frets(const std::string& pattern, std::array<int, kStringCount>& out, std::string& msg) {
  std::istringstream iss(pattern);
  std::string tok;
  int n = 0;
  while (iss >> tok) {
    if (n >= kStringCount) { msg = "too many fret values in \"" + pattern + "\""; return false; }
    if (tok == "x" || tok == "X") { out[n++] = kMutedFret; continue; }
    bool digits = !tok.empty() && tok.size() <= 2;
    for (unsigned char c : tok) if (std::isdigit(c) == 0) digits = false;
    if (!digits) { msg = "bad fret value \"" + tok + "\" in \"" + pattern + "\""; return false; }
    out[n++] = std::stoi(tok);
  }
  if (n != kStringCount) {
    msg = "expected " + std::to_string(kStringCount) + " fret values, got " + std::to_string(n) + " in \"" + pattern + "\"";
    return false;
  }
  return true;
}

std::string format_frets(const std::array<int, kStringCount>& frets) {
  std::string s;
  for (int i = 0; i < kStringCount; ++i) {
    if (i) s += ' ';
    s += frets[i] == kMutedFret ? std::string("x") : std::to_string(frets[i]);
  }
  return s;
}

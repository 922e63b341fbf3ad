#include "fret_window.hpp"
#include <algorithm>
#include <limits>

static bool fret_bounds(const Chord& c, int& lo, int& hi) {
  lo = std::numeric_limits<int>::max();
  hi = 0;
  for (int f : c.frets) {
    if (!is_fretted(f)) continue;
    lo = std::min(lo, f);
    hi = std::max(hi, f);
  }
  return hi > 0;
}

static FretWindow widen(int low, int high) {
  low = std::max(1, low);
  if (high - low + 1 < kMinWindow) high = low + kMinWindow - 1;
  return {low, high};
}

FretWindow compute_fret_window(const Chord& chord) {
  int lo = 0, hi = 0;
  if (!fret_bounds(chord, lo, hi)) return {1, kMinWindow};
  return widen(lo, hi);
}

FretWindow compute_shared_window(const std::vector<Chord>& chords) {
  int gmin = std::numeric_limits<int>::max();
  int gmax = 0;
  bool has_open = false;
  for (const auto& c : chords) {
    for (int f : c.frets) if (f == kOpenFret) has_open = true;
    int lo = 0, hi = 0;
    if (fret_bounds(c, lo, hi)) { gmin = std::min(gmin, lo); gmax = std::max(gmax, hi); }
  }
  if (gmax == 0) return {1, kMinWindow};
  int start = (has_open || gmin < 2) ? 1 : gmin;
  return widen(start, gmax);
}

#include "fret_window.hpp"
#include <cassert>

static Chord chord(int g, int c, int e, int a) {
  Chord ch;
  ch.name = "t";
  ch.frets = {g, c, e, a};
  return ch;
}

static void check_covers(const Chord& c, const FretWindow& w) {
  assert(w.low >= 1);
  assert(w.high - w.low + 1 >= kMinWindow);
  for (int f : c.frets) if (is_fretted(f)) assert(f >= w.low && f <= w.high);
}

int main() {
  FretWindow w = compute_fret_window(chord(0, 0, 0, 0));
  assert(w.low == 1 && w.high == kMinWindow);
  w = compute_fret_window(chord(kMutedFret, 0, 0, kMutedFret));
  assert(w.low == 1 && w.high == 5);

  Chord c = chord(2, 2, 3, 0);
  w = compute_fret_window(c);
  assert(w.low == 2 && w.high == 6);
  check_covers(c, w);

  c = chord(0, 0, 0, 3);
  w = compute_fret_window(c);
  assert(w.low == 3 && w.high == 7);

  // span already at the minimum: no extension
  c = chord(3, 5, 6, 7);
  w = compute_fret_window(c);
  assert(w.low == 3 && w.high == 7);

  c = chord(1, 0, 0, 10);
  w = compute_fret_window(c);
  assert(w.low == 1 && w.high == 10);
  check_covers(c, w);

  for (int lo = 1; lo <= 9; ++lo) {
    for (int span = 0; span <= 4; ++span) {
      Chord s = chord(lo, 0, lo + span, kMutedFret);
      check_covers(s, compute_fret_window(s));
    }
  }

  // shared window starts at the nut when anything rings open
  w = compute_shared_window({chord(0, 0, 0, 3), chord(3, 2, 1, 1)});
  assert(w.low == 1 && w.high == 5);
  w = compute_shared_window({chord(3, 5, 6, 5), chord(2, 2, 2, 5)});
  assert(w.low == 2 && w.high == 6);
  w = compute_shared_window({chord(7, 5, 4, 5)});
  assert(w.low == 4 && w.high == 8);
  w = compute_shared_window({chord(1, 3, 5, 8)});
  assert(w.low == 1 && w.high == 8);
  w = compute_shared_window({});
  assert(w.low == 1 && w.high == 5);
  return 0;
}

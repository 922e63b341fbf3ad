#pragma once
/*
 * FretWindow
 *
 * Purpose: pick the range of frets a diagram shows.
 * Rule: cover every fretted note, at least kMinWindow frets wide, never below fret 1.
 * Short spans grow upward from the lowest fretted note.
 */
#include <vector>
#include "chord.hpp"
#include "types.hpp"

inline constexpr int kMinWindow = 5;

FretWindow compute_fret_window(const Chord& chord);
// One window for a batch so diagrams line up; starts at the nut when any chord rings open.
FretWindow compute_shared_window(const std::vector<Chord>& chords);

#pragma once
/*
 * Chord
 *
 * Purpose: one ukulele fingering, four fret values in G C E A order.
 * Values: -1 muted, 0 open, n >= 1 fretted at n.
 */
#include <array>
#include <string>

inline constexpr int kStringCount = 4;
inline constexpr int kMutedFret = -1;
inline constexpr int kOpenFret = 0;

struct Chord {
  std::string name;
  std::array<int, kStringCount> frets{};
};

const char* string_name(int idx);
bool is_fretted(int fret);
bool has_fretted(const Chord& c);

// "0 0 0 3", "x 2 3 2"; false with msg unless exactly four values.
bool parse_frets(const std::string& pattern, std::array<int, kStringCount>& out, std::string& msg);
std::string format_frets(const std::array<int, kStringCount>& frets);

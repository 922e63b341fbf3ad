#pragma once
/*
 * DiagramRenderer
 *
 * Purpose: draw one chord as a fixed-size character block.
 * Layout: name line, absolute fret numbers, then one row per string (A on top).
 * Constraint: pure; same (chord, window, glyphs) gives the same block.
 */
#include <string>
#include <vector>
#include "chord.hpp"
#include "types.hpp"

struct DiagramBlock {
  std::vector<std::string> lines; // all padded to width()
  int width() const { return lines.empty() ? 0 : static_cast<int>(lines.front().size()); }
  int height() const { return static_cast<int>(lines.size()); }
};

inline constexpr int kFretCellWidth = 4;
inline constexpr int kStringPrefixWidth = 6;

DiagramBlock render_diagram(const Chord& chord, const FretWindow& window, const DiagramGlyphs& glyphs = {});
DiagramBlock render_unknown_block(const std::string& token);

#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Mode/FretWindow/ViewOptions).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include "config.hpp"

enum class Mode { Splash, Input, Diagrams, Help };

struct FretWindow { int low = 1; int high = 5; };

struct GridGaps { int col = UKE_DEFAULT_COL_GAP; int row = UKE_DEFAULT_ROW_GAP; };

struct DiagramGlyphs {
  char finger = UKE_FINGER_GLYPH;
  char open = UKE_OPEN_GLYPH;
  char muted = UKE_MUTED_GLYPH;
};

struct ViewOptions {
  bool shared_window = false;
  bool show_unknown = true;
  GridGaps gaps{};
  DiagramGlyphs glyphs{};
};

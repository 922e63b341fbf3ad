#pragma once
/*
 * Renderer
 *
 * Purpose: draw prompt box, diagram area (or splash logo), help overlay and status.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless; receives a snapshot from App to render.
 */
#include <string>
#include "grid_layout.hpp"
#include "iterminal.hpp"
#include "types.hpp"

struct ScreenState {
  Mode mode = Mode::Splash;
  Mode under_help = Mode::Input; // what Help is drawn over
  const std::string* input = nullptr;
  const Frame* frame = nullptr;
  int scroll = 0;
  int help_scroll = 0;
  std::string message;
  bool message_is_error = false;
  bool enable_color = true;
  char finger = UKE_FINGER_GLYPH;
};

class Renderer {
public:
  void render(ITerminal& term, const ScreenState& st);

  static Rect diagram_area(TermSize sz);
  static int max_scroll(TermSize sz, int frame_rows);
  static int max_help_scroll(TermSize sz);
};

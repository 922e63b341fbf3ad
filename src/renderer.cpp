#include "renderer.hpp"
#include <algorithm>
#include <vector>

static const char* kLogo[] = {
  "     .-\"\"\"-.",
  "    /  ___  \\_______________________________________  ___",
  "   |  /   \\  |---|---|---|---|---|---|---|---|---|---||  o|",
  "   |  \\___/  |---|---|---|---|---|---|---|---|---|---||  o|",
  "    \\       /\"\"\"\"\"\"\"\"\"\"\"\"\"\"\"\"\"\"\"\"\"\"\"\"\"\"\"\"\"\"\"\"\"\"\"\"\"\"\"  \"\"\"",
  "     '-...-'",
  "",
  "                        u k e t u i",
};

static const char* kHelp[] = {
  "Keybindings",
  "",
  "typing    : edit the chord list, diagrams follow live",
  "Enter     : look up chords (when live is off)",
  "Up / Down : scroll diagrams",
  "PgUp/PgDn : scroll a page",
  "Ctrl-W    : delete the last chord",
  "Ctrl-U    : clear the input",
  "?         : show/hide this help",
  "Esc / C-c : close help or exit",
  "",
  "Usage: [Note][Accidental][Type][:Variant], where",
  "Note = C, D, E, F, G, A, B",
  "Accidental = none, #, b",
  "Type = none (major), m, 7, m7, maj7, 6, m6, 9, maj9, m9, add9, madd9, 6/9, sus2, sus4, 7sus2, 7sus4, 7+5, 7b5, mM7, dim, dim7, m7b5, aug, add11, madd11",
  "Variant = 1 (default), 2 for a closed shape up the neck",
  "",
  "Example: C, Ebm, G#m7, F:2",
};

static constexpr int kPromptHeight = 3;
static constexpr int kFooterRows = 2;

static std::vector<std::string> wrap_lines(int width) {
  std::vector<std::string> out;
  if (width <= 0) return out;
  for (const char* raw : kHelp) {
    std::string s(raw);
    if (s.empty()) { out.emplace_back(); continue; }
    while ((int)s.size() > width) {
      size_t cut = s.rfind(' ', width);
      if (cut == std::string::npos || cut == 0) cut = width;
      out.push_back(s.substr(0, cut));
      size_t next = s.find_first_not_of(' ', cut);
      s = next == std::string::npos ? std::string() : s.substr(next);
    }
    if (!s.empty()) out.push_back(s);
  }
  return out;
}

static Rect help_area(TermSize sz) {
  int w = std::max(0, sz.cols - 10);
  int h = std::max(0, sz.rows - 6);
  return Rect{(sz.rows - h) / 2, (sz.cols - w) / 2, h, w};
}

static void draw_box(ITerminal& term, const Rect& r, const std::string& title, int pair, bool color) {
  if (r.width < 2 || r.height < 2) return;
  std::string top = "+" + std::string(r.width - 2, '-') + "+";
  if (!title.empty() && (int)title.size() + 4 <= r.width) top.replace(2, title.size(), title);
  std::string bottom = "+" + std::string(r.width - 2, '-') + "+";
  std::string middle = "|" + std::string(r.width - 2, ' ') + "|";
  auto put = [&](int row, const std::string& s) {
    if (color) term.draw_colored(row, r.col, s, pair); else term.draw_text(row, r.col, s);
  };
  put(r.row, top);
  for (int i = 1; i < r.height - 1; ++i) put(r.row + i, middle);
  put(r.row + r.height - 1, bottom);
}

Rect Renderer::diagram_area(TermSize sz) {
  int h = std::max(0, sz.rows - kPromptHeight - kFooterRows - 2);
  int w = std::max(0, sz.cols - 4);
  return Rect{kPromptHeight + 1, 2, h, w};
}

int Renderer::max_scroll(TermSize sz, int frame_rows) {
  return std::max(0, frame_rows - diagram_area(sz).height);
}


int Renderer::max_help_scroll(TermSize sz) {
  Rect a = help_area(sz);
  int lines = static_cast<int>(wrap_lines(a.width - 4).size());
  return std::max(0, lines - std::max(0, a.height - 2));
}

static void render_splash(ITerminal& term, const Rect& area, bool prompt_only) {
  int lines = static_cast<int>(sizeof(kLogo) / sizeof(kLogo[0]));
  int max_len = 0;
  for (const char* l : kLogo) max_len = std::max(max_len, (int)std::string(l).size());
  std::string hint = "Type chords separated by commas, ? for help";
  bool logo = !prompt_only && max_len <= area.width && lines + 2 <= area.height;
  int total = logo ? lines + 2 : 1;
  int row = area.row + std::max(0, (area.height - total) / 2);
  if (logo) {
    int col = area.col + (area.width - max_len) / 2;
    for (const char* l : kLogo) term.draw_text(row++, col, l);
    row++;
  }
  if ((int)hint.size() > area.width) hint.resize(std::max(0, area.width));
  term.draw_text(row, area.col + std::max(0, (area.width - (int)hint.size()) / 2), hint);
}

static void render_frame(ITerminal& term, const Rect& area, const Frame& frame, int scroll, bool color, char finger) {
  for (int i = 0; i < area.height; ++i) {
    int idx = scroll + i;
    if (idx < 0 || idx >= (int)frame.size()) break;
    std::string line = frame[idx];
    if ((int)line.size() > area.width) line.resize(area.width);
    term.draw_text(area.row + i, area.col, line);
    if (!color) continue;
    for (size_t c = 0; c < line.size(); ++c) {
      if (line[c] == finger && c > 0 && line[c - 1] == '-') {
        term.draw_colored(area.row + i, area.col + (int)c, std::string(1, finger), kPairFinger);
      }
    }
  }
}

static void render_help(ITerminal& term, TermSize sz, int scroll, bool color) {
  Rect a = help_area(sz);
  if (a.width < 6 || a.height < 3) return;
  draw_box(term, a, " Help ", kPairAccent, color);
  auto lines = wrap_lines(a.width - 4);
  int visible = a.height - 2;
  for (int i = 0; i < visible; ++i) {
    int idx = scroll + i;
    if (idx >= (int)lines.size()) break;
    term.draw_text(a.row + 1 + i, a.col + 2, lines[idx]);
  }
}

void Renderer::render(ITerminal& term, const ScreenState& st) {
  TermSize sz = term.getSize();
  int rows = sz.rows, cols = sz.cols;
  term.clear();
  Mode base = st.mode == Mode::Help ? st.under_help : st.mode;

  // prompt
  draw_box(term, Rect{0, 0, kPromptHeight, cols}, " Chord(s) ", kPairDefault, false);
  std::string text = st.input ? *st.input : std::string();
  int text_cols = std::max(0, cols - 4);
  if ((int)text.size() > text_cols) text = text.substr(text.size() - text_cols);
  if (base != Mode::Splash) term.draw_text(1, 2, text);

  // diagrams
  Rect area = diagram_area(sz);
  draw_box(term, Rect{area.row - 1, 0, area.height + 2, cols}, " Diagrams ", kPairDefault, false);
  bool have_frame = st.frame && !st.frame->empty();
  if (base == Mode::Diagrams || (base == Mode::Input && have_frame)) {
    render_frame(term, area, *st.frame, st.scroll, st.enable_color, st.finger);
  } else {
    render_splash(term, area, base == Mode::Input && st.input && !st.input->empty());
  }

  // status + footer
  if (rows >= 2 && !st.message.empty()) {
    if (st.message_is_error) term.draw_colored(rows - 2, 1, st.message, kPairError);
    else term.draw_text(rows - 2, 1, st.message);
  }
  std::string footer = "type:chords  Up/Down:scroll  ?:help  Esc/C-c:quit";
  if (rows >= 1) {
    int col = std::max(0, (cols - (int)footer.size()) / 2);
    if (st.enable_color) term.draw_colored(rows - 1, col, footer, kPairDim); else term.draw_text(rows - 1, col, footer);
  }

  if (st.mode == Mode::Help) {
    render_help(term, sz, st.help_scroll, st.enable_color);
    term.show_cursor(false);
  } else {
    term.show_cursor(true);
    term.move_cursor(1, std::min(2 + (int)text.size(), std::max(0, cols - 2)));
  }
  term.refresh();
}

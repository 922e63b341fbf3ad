#include "chord_view.hpp"
#include "chord_parser.hpp"
#include "diagram.hpp"
#include "fret_window.hpp"

ChordView build_chord_view(const ChordTable& table, const std::string& input, int width, const ViewOptions& opts) {
  ChordView view;
  std::vector<std::string> tokens = parse_chord_list(input);
  view.empty_input = tokens.empty();
  if (tokens.empty()) return view;

  // token order is kept across known and unknown entries
  struct Slot { bool known; Chord chord; std::string token; };
  std::vector<Slot> slots;
  std::vector<Chord> found;
  for (const auto& tok : tokens) {
    if (auto c = table.lookup(tok)) {
      found.push_back(*c);
      view.resolved.push_back(tok);
      slots.push_back({true, *c, tok});
    } else {
      view.unknown.push_back(tok);
      slots.push_back({false, Chord{}, tok});
    }
  }

  FretWindow shared = compute_shared_window(found);
  std::vector<DiagramBlock> blocks;
  for (const auto& s : slots) {
    if (s.known) {
      FretWindow w = opts.shared_window ? shared : compute_fret_window(s.chord);
      blocks.push_back(render_diagram(s.chord, w, opts.glyphs));
    } else if (opts.show_unknown) {
      blocks.push_back(render_unknown_block(s.token));
    }
  }
  view.block_count = static_cast<int>(blocks.size());
  view.frame = layout_blocks(blocks, width, opts.gaps);
  return view;
}

std::string unknown_message(const std::vector<std::string>& unknown) {
  if (unknown.empty()) return std::string();
  std::string m = unknown.size() == 1 ? "Chord not found: " : "Chords not found: ";
  for (size_t i = 0; i < unknown.size(); ++i) {
    if (i) m += ", ";
    m += unknown[i];
  }
  return m;
}

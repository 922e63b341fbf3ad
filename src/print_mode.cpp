#include "print_mode.hpp"
#include <cstdlib>
#include "chord_view.hpp"
#include "config.hpp"

int print_width(const char* columns) {
  if (!columns) return UKE_PRINT_WIDTH;
  int w = std::atoi(columns);
  return w > 0 ? w : UKE_PRINT_WIDTH;
}

int print_chords(const ChordTable& table, const std::string& query, int width, std::ostream& out) {
  ViewOptions opts;
  opts.show_unknown = false;
  ChordView view = build_chord_view(table, query, width, opts);
  for (const auto& line : view.frame) out << line << '\n';
  for (const auto& name : view.unknown) out << "Chord not found: " << name << '\n';
  return view.resolved.empty() ? 2 : 0;
}

void list_chords(const ChordTable& table, std::ostream& out) {
  for (const auto& name : table.names()) {
    out << name << "  ";
    int n = table.voicing_count(name);
    for (int i = 1; i <= n; ++i) {
      if (i > 1) out << ", ";
      out << format_frets(table.lookup(name + ":" + std::to_string(i))->frets);
    }
    out << '\n';
  }
}

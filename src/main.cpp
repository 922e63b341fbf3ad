#include "terminal.hpp"
#include "ncurses_terminal.hpp"
#include "app.hpp"
#include "print_mode.hpp"
#include <cstdlib>
#include <iostream>
#include <string>

int main(int argc, char** argv) {
  std::string msg; bool ok = false;
  ChordTable table = ChordTable::from_entries(embedded_chords(), msg, ok);
  if (!ok) { std::cerr << "uketui: " << msg << '\n'; return 1; }

  if (argc >= 2) {
    std::string first = argv[1];
    if (first == "-h" || first == "--help") {
      std::cout << "Usage: uketui [CHORD[,CHORD...]...]\n"
                   "       uketui --list\n"
                   "Without arguments starts the interactive viewer.\n";
      return 0;
    }
    if (first == "--list") {
      list_chords(table, std::cout);
      return 0;
    }
    std::string query;
    for (int i = 1; i < argc; ++i) { if (i > 1) query += ','; query += argv[i]; }
    return print_chords(table, query, print_width(std::getenv("COLUMNS")), std::cout);
  }

  Terminal term;
  NcursesTerminal screen;
  App app(table, screen);
  app.load_rc();
  app.run();
  return 0;
}

#pragma once
/*
 * App
 *
 * Purpose: splash/prompt/diagrams/help state machine around the chord view.
 * Flow: every prompt edit rebuilds the whole view (parse -> lookup -> render -> layout).
 * Note: owns no terminal; draws through the ITerminal it is given.
 */
#include <filesystem>
#include <string>
#include <vector>
#include "chord_table.hpp"
#include "chord_view.hpp"
#include "cmd_registry.hpp"
#include "input.hpp"
#include "iterminal.hpp"
#include "renderer.hpp"
#include "types.hpp"

class App {
public:
  App(const ChordTable& table, ITerminal& term);
  void run();
  void handle_key(int ch);
  void render();

  void load_rc();
  void load_rc_file(const std::filesystem::path& path);
  void execute_line(const std::string& line);

  Mode current_mode() const { return mode; }
  const std::string& input_text() const { return input.text(); }
  const ChordView& view() const { return chord_view; }
  const ViewOptions& options() const { return view_options; }
  const std::string& status() const { return message; }
  bool live() const { return live_update; }
  bool color() const { return enable_color; }
  int scroll_offset() const { return scroll; }
  bool quitting() const { return should_quit; }

private:
  const ChordTable& table;
  ITerminal& term;
  Renderer renderer;
  CommandRegistry registry;
  InputLine input;
  ChordView chord_view;
  ViewOptions view_options;
  std::string view_query;
  Mode mode = Mode::Splash;
  Mode help_return = Mode::Input;
  std::string message;
  bool message_is_error = false;
  bool live_update = true;
  bool enable_color = true;
  bool should_quit = false;
  int scroll = 0;
  int help_scroll = 0;

  void handle_splash_key(int ch);
  void handle_prompt_key(int ch);
  void handle_help_key(int ch);
  void open_help();
  void on_edit();
  void refresh_view(const std::string& query);
  void scroll_by(int delta);
  void register_commands();
  bool parse_on_off(const std::vector<std::string>& args, const std::string& opt, bool& out);
  bool parse_count(const std::vector<std::string>& args, const std::string& opt, int lo, int hi, int& out);
};

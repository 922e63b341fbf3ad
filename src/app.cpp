#include <ncurses.h>
#include "app.hpp"
#include <algorithm>
#include <cstdlib>
#include <sstream>
#include "chord_parser.hpp"
#include "config.hpp"
#include "file_reader.hpp"

static constexpr int CTRL_c = 'C'-64;
static constexpr int CTRL_u = 'U'-64;
static constexpr int CTRL_w = 'W'-64;
static constexpr int ESC = 27;
static constexpr int DEL = 127;

static bool is_backspace(int ch) { return ch == KEY_BACKSPACE || ch == DEL || ch == '\b'; }
static bool is_enter(int ch) { return ch == '\n' || ch == '\r' || ch == KEY_ENTER; }
static bool is_printable(int ch) { return ch >= 32 && ch <= 126; }

App::App(const ChordTable& table, ITerminal& term) : table(table), term(term) {
  register_commands();
}

void App::run() {
  while (!should_quit) {
    render();
    int ch = getch();
    handle_key(ch);
  }
}

void App::render() {
  ScreenState st;
  st.mode = mode;
  st.under_help = help_return;
  st.input = &input.text();
  st.frame = &chord_view.frame;
  st.scroll = scroll;
  st.help_scroll = help_scroll;
  st.message = message;
  st.message_is_error = message_is_error;
  st.enable_color = enable_color;
  st.finger = view_options.glyphs.finger;
  renderer.render(term, st);
}

void App::handle_key(int ch) {
  if (ch == ERR) return;
  if (ch == KEY_RESIZE) { refresh_view(view_query); return; }
  switch (mode) {
    case Mode::Splash: handle_splash_key(ch); break;
    case Mode::Help: handle_help_key(ch); break;
    case Mode::Input:
    case Mode::Diagrams: handle_prompt_key(ch); break;
  }
}

void App::handle_splash_key(int ch) {
  if (ch == ESC || ch == CTRL_c) { should_quit = true; return; }
  mode = Mode::Input;
  if (ch == '?') { open_help(); return; }
  if (is_printable(ch)) handle_prompt_key(ch);
}

void App::handle_prompt_key(int ch) {
  if (ch == '?') { open_help(); return; }
  if (ch == ESC || ch == CTRL_c) { should_quit = true; return; }
  TermSize sz = term.getSize();
  int page = std::max(1, Renderer::diagram_area(sz).height);
  switch (ch) {
    case KEY_UP: scroll_by(-1); return;
    case KEY_DOWN: scroll_by(1); return;
    case KEY_PPAGE: scroll_by(-page); return;
    case KEY_NPAGE: scroll_by(page); return;
    default: break;
  }
  if (is_enter(ch)) {
    if (live_update) return;
    refresh_view(input.text());
    input.clear();
    return;
  }
  bool changed = false;
  if (is_backspace(ch)) changed = input.backspace();
  else if (ch == CTRL_w) changed = input.delete_token();
  else if (ch == CTRL_u) changed = input.clear();
  else if (is_printable(ch)) changed = input.insert(ch);
  if (changed) on_edit();
}

void App::handle_help_key(int ch) {
  TermSize sz = term.getSize();
  int max_scroll = Renderer::max_help_scroll(sz);
  switch (ch) {
    case ESC: case CTRL_c: case '?': case 'q':
      mode = help_return;
      help_scroll = 0;
      return;
    case KEY_UP: help_scroll = std::max(0, help_scroll - 1); return;
    case KEY_DOWN: help_scroll = std::min(max_scroll, help_scroll + 1); return;
    default: return;
  }
}

void App::open_help() {
  help_return = mode == Mode::Help ? help_return : mode;
  mode = Mode::Help;
  help_scroll = 0;
}

void App::on_edit() {
  if (live_update) refresh_view(input.text());
}

void App::refresh_view(const std::string& query) {
  view_query = query;
  int width = Renderer::diagram_area(term.getSize()).width;
  std::vector<std::string> before = chord_view.resolved;
  chord_view = build_chord_view(table, query, width, view_options);
  if (chord_view.resolved != before) scroll = 0;
  scroll = std::clamp(scroll, 0, Renderer::max_scroll(term.getSize(), (int)chord_view.frame.size()));
  Mode next = chord_view.resolved.empty() ? Mode::Input : Mode::Diagrams;
  if (mode == Mode::Help) help_return = next;
  else if (mode != Mode::Splash) mode = next;
  message = unknown_message(chord_view.unknown);
  message_is_error = !message.empty();
}

void App::scroll_by(int delta) {
  int max_scroll = Renderer::max_scroll(term.getSize(), (int)chord_view.frame.size());
  scroll = std::clamp(scroll + delta, 0, max_scroll);
}

void App::load_rc() {
  const char* home = std::getenv("HOME");
  if (!home) return;
  std::error_code ec;
  auto p = std::filesystem::path(home) / UKE_RC_FILE;
  if (!std::filesystem::exists(p, ec)) return;
  load_rc_file(p);
}

void App::load_rc_file(const std::filesystem::path& path) {
  std::vector<std::string> lines; std::string msg;
  if (!mmap_readlines(path, lines, msg)) { message = msg; message_is_error = true; return; }
  std::string first_error;
  for (const std::string& raw : lines) {
    std::string s = trim(raw);
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == '"') continue;
    if (s.size() >= 2 && s[0] == '/' && s[1] == '/') continue;
    if (s[0] == ':') s.erase(s.begin());
    execute_line(s);
    if (message_is_error && first_error.empty()) first_error = message;
  }
  // keep the first problem visible, later lines may overwrite message
  if (!first_error.empty()) { message = path.filename().string() + ": " + first_error; message_is_error = true; }
}

void App::execute_line(const std::string& line) {
  std::istringstream iss(line);
  std::string cmd; iss >> cmd;
  std::vector<std::string> args; std::string a; while (iss >> a) args.push_back(a);
  message_is_error = false;
  if (cmd == "set" && !args.empty()) {
    std::string opt = args[0];
    std::string name = opt;
    std::string value;
    size_t eq = opt.find('=');
    if (eq != std::string::npos) {
      name = opt.substr(0, eq);
      value = opt.substr(eq + 1);
    }
    std::string composite = std::string("set ") + name;
    std::vector<std::string> subargs;
    if (!value.empty()) subargs.push_back(value);
    for (size_t i = 1; i < args.size(); ++i) subargs.push_back(args[i]);
    if (!registry.execute(composite, subargs)) { message = "unknown command: " + composite; message_is_error = true; }
    return;
  }
  if (!registry.execute(cmd, args)) { message = "unknown command: " + cmd; message_is_error = true; }
}

#include "app.hpp"
#include <algorithm>
#include <cctype>
#include <string>

bool App::parse_on_off(const std::vector<std::string>& args, const std::string& opt, bool& out) {
  if (args.empty()) { message = "set " + opt + ": use set " + opt + " on|off"; message_is_error = true; return false; }
  const std::string& v = args[0];
  if (v == "on" || v == "1" || v == "true") { out = true; return true; }
  if (v == "off" || v == "0" || v == "false") { out = false; return true; }
  message = "set " + opt + ": value must be on|off";
  message_is_error = true;
  return false;
}

bool App::parse_count(const std::vector<std::string>& args, const std::string& opt, int lo, int hi, int& out) {
  if (args.empty()) { message = "set " + opt + ": use set " + opt + " <number>"; message_is_error = true; return false; }
  const std::string& s = args[0];
  bool ok = !s.empty() && s.size() <= 4 && std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; });
  if (!ok) { message = "set " + opt + ": value must be a number"; message_is_error = true; return false; }
  int v = std::stoi(s);
  if (v < lo || v > hi) {
    message = "set " + opt + ": value must be in " + std::to_string(lo) + ".." + std::to_string(hi);
    message_is_error = true;
    return false;
  }
  out = v;
  return true;
}

void App::register_commands() {
  auto reapply = [this]{ if (!view_query.empty()) refresh_view(view_query); };

  registry.register_command("set window", [this, reapply](const std::vector<std::string>& args){
    if (args.empty()) { message = "set window: use set window shared|each"; message_is_error = true; return; }
    if (args[0] == "shared") view_options.shared_window = true;
    else if (args[0] == "each") view_options.shared_window = false;
    else { message = "set window: value must be shared|each"; message_is_error = true; return; }
    reapply();
    message = "window=" + args[0];
    message_is_error = false;
  });
  registry.register_command("set unknown", [this, reapply](const std::vector<std::string>& args){
    if (args.empty()) { message = "set unknown: use set unknown show|skip"; message_is_error = true; return; }
    if (args[0] == "show") view_options.show_unknown = true;
    else if (args[0] == "skip") view_options.show_unknown = false;
    else { message = "set unknown: value must be show|skip"; message_is_error = true; return; }
    reapply();
    message = "unknown=" + args[0];
    message_is_error = false;
  });
  registry.register_command("set live", [this](const std::vector<std::string>& args){
    bool v = live_update;
    if (!parse_on_off(args, "live", v)) return;
    live_update = v;
    message = live_update ? "live on" : "live off";
  });
  registry.register_command("set color", [this](const std::vector<std::string>& args){
    bool v = enable_color;
    if (!parse_on_off(args, "color", v)) return;
    enable_color = v;
    message = enable_color ? "color on" : "color off";
  });
  registry.register_command("set gap", [this, reapply](const std::vector<std::string>& args){
    int v = 0;
    if (!parse_count(args, "gap", 0, 16, v)) return;
    view_options.gaps.col = v;
    reapply();
    message = "gap=" + std::to_string(v);
    message_is_error = false;
  });
  registry.register_command("set rowgap", [this, reapply](const std::vector<std::string>& args){
    int v = 0;
    if (!parse_count(args, "rowgap", 0, 8, v)) return;
    view_options.gaps.row = v;
    reapply();
    message = "rowgap=" + std::to_string(v);
    message_is_error = false;
  });
  registry.register_command("set finger", [this, reapply](const std::vector<std::string>& args){
    if (args.empty() || args[0].size() != 1) { message = "set finger: use set finger <char>"; message_is_error = true; return; }
    char c = args[0][0];
    if (c == '-' || c == '|' || c == '#' || c == view_options.glyphs.open || c == view_options.glyphs.muted) {
      message = "set finger: glyph clashes with the fretboard";
      message_is_error = true;
      return;
    }
    view_options.glyphs.finger = c;
    reapply();
    message = std::string("finger=") + c;
    message_is_error = false;
  });
}

#include "chord_parser.hpp"
#include <cctype>

std::string trim(const std::string& s) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
  return (j > i) ? s.substr(i, j - i) : std::string();
}

std::vector<std::string> parse_chord_list(const std::string& input) {
  std::vector<std::string> out;
  size_t st = 0;
  while (st <= input.size()) {
    size_t pos = input.find(',', st);
    if (pos == std::string::npos) pos = input.size();
    std::string tok = trim(input.substr(st, pos - st));
    if (!tok.empty()) out.push_back(std::move(tok));
    st = pos + 1;
  }
  return out;
}

#include "chord_table.hpp"
#include <cctype>
#include <utility>

static const std::pair<const char*, const char*> kEnharmonics[] = {
  {"Db", "C#"}, {"D#", "Eb"}, {"Gb", "F#"}, {"G#", "Ab"}, {"A#", "Bb"},
};

ChordTable ChordTable::from_entries(const std::vector<ChordEntry>& entries, std::string& msg, bool& ok) {
  ChordTable t;
  ok = false;
  for (const auto& e : entries) {
    if (e.name.empty()) { msg = "chord data: entry without a name"; return ChordTable(); }
    if (e.voicings.empty()) { msg = "chord data: " + e.name + " has no voicings"; return ChordTable(); }
    Voicings v;
    for (const auto& pattern : e.voicings) {
      std::array<int, kStringCount> frets{};
      std::string m;
      if (!parse_frets(pattern, frets, m)) { msg = "chord data: " + e.name + ": " + m; return ChordTable(); }
      v.push_back(frets);
    }
    if (!t.add(e.name, std::move(v), msg)) return ChordTable();
  }
  t.add_enharmonic_aliases();
  ok = true;
  msg = "loaded " + std::to_string(t.size()) + " chords";
  return t;
}

bool ChordTable::add(const std::string& name, Voicings v, std::string& msg) {
  if (map_.count(name)) { msg = "chord data: duplicate chord " + name; return false; }
  map_.emplace(name, std::move(v));
  order_.push_back(name);
  return true;
}

void ChordTable::add_enharmonic_aliases() {
  std::vector<std::string> canonical = order_;
  for (const auto& [alias, root] : kEnharmonics) {
    std::string r(root);
    for (const auto& name : canonical) {
      if (name.compare(0, r.size(), r) != 0) continue;
      std::string aliased = std::string(alias) + name.substr(r.size());
      if (map_.count(aliased)) continue;
      Voicings v = map_.at(name);
      map_.emplace(aliased, std::move(v));
      order_.push_back(aliased);
    }
  }
}

static bool split_variant(const std::string& name, std::string& base, int& variant) {
  base = name;
  variant = 1;
  size_t pos = name.rfind(':');
  if (pos == std::string::npos) return true;
  std::string num = name.substr(pos + 1);
  if (num.empty() || num.size() > 2) return false;
  for (unsigned char c : num) if (std::isdigit(c) == 0) return false;
  base = name.substr(0, pos);
  variant = std::stoi(num);
  return variant >= 1;
}

std::optional<Chord> ChordTable::lookup(const std::string& name) const {
  std::string base;
  int variant = 1;
  if (!split_variant(name, base, variant)) return std::nullopt;
  auto it = map_.find(base);
  if (it == map_.end()) return std::nullopt;
  if (variant > static_cast<int>(it->second.size())) return std::nullopt;
  Chord c;
  c.name = name;
  c.frets = it->second[variant - 1];
  return c;
}


int ChordTable::voicing_count(const std::string& name) const {
  auto it = map_.find(name);
  return it == map_.end() ? 0 : static_cast<int>(it->second.size());
}

std::vector<std::string> ChordTable::names() const { return order_; }

#pragma once
/*
 * ChordTable
 *
 * Purpose: read-only map chord name -> voicings, built once at startup.
 * Lookup: case-sensitive exact name, optional ":<n>" picks voicing n (1-based).
 * Failure: unknown names are std::nullopt, never an error.
 */
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "chord.hpp"

struct ChordEntry {
  std::string name;
  std::vector<std::string> voicings; // fret patterns, first is the default
};

const std::vector<ChordEntry>& embedded_chords();

class ChordTable {
public:
  static ChordTable from_entries(const std::vector<ChordEntry>& entries, std::string& msg, bool& ok);

  std::optional<Chord> lookup(const std::string& name) const;
  int voicing_count(const std::string& name) const;
  size_t size() const { return map_.size(); }
  std::vector<std::string> names() const;

private:
  using Voicings = std::vector<std::array<int, kStringCount>>;
  bool add(const std::string& name, Voicings v, std::string& msg);
  void add_enharmonic_aliases();

  std::unordered_map<std::string, Voicings> map_;
  std::vector<std::string> order_;
};

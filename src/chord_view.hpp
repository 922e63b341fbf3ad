#pragma once
/*
 * ChordView
 *
 * Purpose: prompt text -> composed diagram frame (parse, lookup, window, render, layout).
 * Note: unknown tokens never abort the batch; they are reported and optionally drawn.
 */
#include <string>
#include <vector>
#include "chord_table.hpp"
#include "grid_layout.hpp"
#include "types.hpp"

struct ChordView {
  Frame frame;
  std::vector<std::string> resolved;
  std::vector<std::string> unknown;
  int block_count = 0;
  bool empty_input = true;
};

ChordView build_chord_view(const ChordTable& table, const std::string& input, int width, const ViewOptions& opts = {});
std::string unknown_message(const std::vector<std::string>& unknown);

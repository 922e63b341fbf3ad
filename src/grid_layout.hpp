#pragma once
/*
 * GridLayout
 *
 * Purpose: place diagram blocks left-to-right, wrapping rows at a width.
 * Note: knows block sizes only; a block wider than the width gets a row to itself.
 */
#include <string>
#include <vector>
#include "diagram.hpp"
#include "types.hpp"

struct Rect {
  int row = 0;
  int col = 0;
  int height = 0;
  int width = 0;
};

struct BlockRect {
  int block = 0;
  Rect rect;
};

using Frame = std::vector<std::string>;

void collect_grid(const std::vector<DiagramBlock>& blocks, int width, const GridGaps& gaps, std::vector<BlockRect>& out);
Frame compose_frame(const std::vector<DiagramBlock>& blocks, const std::vector<BlockRect>& rects);
Frame layout_blocks(const std::vector<DiagramBlock>& blocks, int width, const GridGaps& gaps = {});

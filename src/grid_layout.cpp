#include "grid_layout.hpp"
#include <algorithm>

void collect_grid(const std::vector<DiagramBlock>& blocks, int width, const GridGaps& gaps, std::vector<BlockRect>& out) {
  out.clear();
  int col_gap = std::max(0, gaps.col);
  int row_gap = std::max(0, gaps.row);
  int row = 0;
  int col = 0;
  int row_h = 0;
  bool row_empty = true;
  for (int i = 0; i < static_cast<int>(blocks.size()); ++i) {
    const auto& b = blocks[i];
    int needed = row_empty ? b.width() : col + col_gap + b.width();
    if (!row_empty && needed > width) {
      row += row_h + row_gap;
      col = 0;
      row_h = 0;
      row_empty = true;
    }
    int x = row_empty ? 0 : col + col_gap;
    out.push_back(BlockRect{i, Rect{row, x, b.height(), b.width()}});
    col = x + b.width();
    row_h = std::max(row_h, b.height());
    row_empty = false;
  }
}

Frame compose_frame(const std::vector<DiagramBlock>& blocks, const std::vector<BlockRect>& rects) {
  int rows = 0;
  for (const auto& r : rects) rows = std::max(rows, r.rect.row + r.rect.height);
  Frame frame(rows);
  for (const auto& r : rects) {
    const auto& b = blocks[r.block];
    for (int i = 0; i < b.height(); ++i) {
      std::string& line = frame[r.rect.row + i];
      if (static_cast<int>(line.size()) < r.rect.col) line.resize(r.rect.col, ' ');
      line.replace(r.rect.col, std::string::npos, b.lines[i]);
    }
  }
  for (auto& line : frame) {
    size_t end = line.find_last_not_of(' ');
    line.erase(end == std::string::npos ? 0 : end + 1);
  }
  return frame;
}

Frame layout_blocks(const std::vector<DiagramBlock>& blocks, int width, const GridGaps& gaps) {
  std::vector<BlockRect> rects;
  collect_grid(blocks, width, gaps, rects);
  return compose_frame(blocks, rects);
}

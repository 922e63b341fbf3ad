#include "grid_layout.hpp"
#include <cassert>
#include <string>
#include <vector>

static DiagramBlock block(char fill, int w, int h) {
  DiagramBlock b;
  for (int i = 0; i < h; ++i) b.lines.push_back(std::string(w, fill));
  return b;
}

static bool in_order(const std::vector<BlockRect>& rs) {
  for (size_t i = 1; i < rs.size(); ++i) {
    const Rect& a = rs[i - 1].rect;
    const Rect& b = rs[i].rect;
    if (rs[i].block != rs[i - 1].block + 1) return false;
    if (b.row < a.row) return false;
    if (b.row == a.row && b.col <= a.col) return false;
  }
  return true;
}

int main() {
  std::vector<BlockRect> rs;
  collect_grid({}, 80, GridGaps{}, rs);
  assert(rs.empty());
  assert(layout_blocks({}, 80).empty());

  std::vector<DiagramBlock> bs = {block('a', 26, 6), block('b', 26, 6), block('c', 26, 6), block('d', 26, 6)};
  collect_grid(bs, 80, GridGaps{2, 1}, rs);
  assert(rs.size() == 4);
  assert(rs[0].rect.row == 0 && rs[0].rect.col == 0);
  assert(rs[1].rect.row == 0 && rs[1].rect.col == 28);
  assert(rs[2].rect.row == 7 && rs[2].rect.col == 0);
  assert(rs[3].rect.row == 7 && rs[3].rect.col == 28);
  assert(in_order(rs));

  Frame f = layout_blocks(bs, 80, GridGaps{2, 1});
  assert(f.size() == 13);
  assert(f[0] == std::string(26, 'a') + "  " + std::string(26, 'b'));
  assert(f[6].empty());
  assert(f[7].rfind(std::string(26, 'c'), 0) == 0);

  // wide display keeps everything on one row
  f = layout_blocks(bs, 200, GridGaps{2, 1});
  assert(f.size() == 6);
  assert((int)f[0].size() == 4 * 26 + 3 * 2);

  // mixed widths never overflow and keep input order
  std::vector<DiagramBlock> mixed;
  for (int i = 0; i < 12; ++i) mixed.push_back(block(static_cast<char>('a' + i), 3 + (i * 5) % 8, 2 + i % 3));
  collect_grid(mixed, 25, GridGaps{2, 1}, rs);
  assert(rs.size() == mixed.size());
  assert(in_order(rs));
  for (const auto& r : rs) assert(r.rect.col + r.rect.width <= 25);
  for (const auto& line : layout_blocks(mixed, 25)) assert(line.size() <= 25);

  // a block wider than the display gets its own row
  std::vector<DiagramBlock> wide = {block('w', 15, 2), block('n', 5, 2), block('m', 5, 2)};
  collect_grid(wide, 10, GridGaps{2, 1}, rs);
  assert(rs[0].rect.row == 0);
  assert(rs[1].rect.row == 3 && rs[1].rect.col == 0);
  assert(rs[2].rect.row == 6 && rs[2].rect.col == 0);

  // taller block in a row pushes the next row down
  std::vector<DiagramBlock> tall = {block('t', 4, 5), block('s', 4, 2), block('u', 4, 1)};
  collect_grid(tall, 10, GridGaps{1, 2}, rs);
  assert(rs[1].rect.row == 0 && rs[1].rect.col == 5);
  assert(rs[2].rect.row == 7);
  f = compose_frame(tall, rs);
  assert(f[3] == "tttt");
  return 0;
}

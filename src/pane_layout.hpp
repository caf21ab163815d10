#pragma once
/*
 * PaneLayout
 *
 * Purpose: map a percentage size sequence onto terminal cells.
 * Note: offsets are always derived from the sizes; nothing here is cached.
 */
#include <vector>
#include "types.hpp"

struct Rect {
  int row = 0;
  int col = 0;
  int height = 0;
  int width = 0;
};

struct PaneRect {
  int pane = 0; // index into the size sequence
  Rect rect;
};

inline bool contains(const Rect& r, int row, int col) {
  return row >= r.row && row < r.row + r.height && col >= r.col && col < r.col + r.width;
}

// offset_i = sum of sizes before i
std::vector<double> derive_offsets(const std::vector<double>& sizes);

int axis_extent(const Rect& area, Orientation o);
int axis_coord(int row, int col, Orientation o);

void collect_layout(const std::vector<double>& sizes, Orientation o, const Rect& area, std::vector<PaneRect>& out);

// Divider k sits on the trailing cell of pane k, for k < n-1.
void divider_rects(const std::vector<PaneRect>& panes, Orientation o, std::vector<Rect>& out);
Rect content_rect(const PaneRect& pr, int pane_count, Orientation o);
int hit_divider(const std::vector<PaneRect>& panes, Orientation o, int row, int col);

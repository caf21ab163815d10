#include "pane_layout.hpp"
#include <algorithm>
#include <cmath>

std::vector<double> derive_offsets(const std::vector<double>& sizes) {
  std::vector<double> out;
  out.reserve(sizes.size());
  double acc = 0.0;
  for (double s : sizes) { out.push_back(acc); acc += s; }
  return out;
}

int axis_extent(const Rect& area, Orientation o) {
  return o == Orientation::Horizontal ? area.width : area.height;
}

int axis_coord(int row, int col, Orientation o) {
  return o == Orientation::Horizontal ? col : row;
}

static int edge_cell(double offset_pct, double total_pct, int extent) {
  if (total_pct <= 0.0) return 0;
  int e = static_cast<int>(std::lround(offset_pct / total_pct * extent));
  return std::clamp(e, 0, extent);
}

void collect_layout(const std::vector<double>& sizes, Orientation o, const Rect& area, std::vector<PaneRect>& out) {
  out.clear();
  if (area.height <= 0 || area.width <= 0 || sizes.empty()) return;
  int extent = axis_extent(area, o);
  int n = static_cast<int>(sizes.size());
  if (extent < n) {
    // one cell each for the leading panes; the rest are not laid out, so
    // every emitted pane is followed by its true neighbour
    for (int i = 0; i < extent; ++i) {
      Rect r = area;
      if (o == Orientation::Horizontal) { r.col = area.col + i; r.width = 1; }
      else { r.row = area.row + i; r.height = 1; }
      out.push_back(PaneRect{i, r});
    }
    return;
  }
  std::vector<double> offsets = derive_offsets(sizes);
  // normalize against the actual sum so a transiently unbalanced layout still tiles the area
  double total = offsets.back() + sizes.back();
  std::vector<int> edges(n + 1);
  for (int i = 0; i < n; ++i) edges[i] = edge_cell(offsets[i], total, extent);
  edges[n] = extent;
  // keep every pane at least one cell wide
  for (int i = 1; i < n; ++i) edges[i] = std::max(edges[i], edges[i - 1] + 1);
  for (int i = n - 1; i >= 1; --i) edges[i] = std::min(edges[i], edges[i + 1] - 1);
  for (int i = 0; i < n; ++i) {
    int start = edges[i];
    int len = edges[i + 1] - edges[i];
    if (len <= 0) continue;
    Rect r = area;
    if (o == Orientation::Horizontal) { r.col = area.col + start; r.width = len; }
    else { r.row = area.row + start; r.height = len; }
    out.push_back(PaneRect{i, r});
  }
}

void divider_rects(const std::vector<PaneRect>& panes, Orientation o, std::vector<Rect>& out) {
  out.clear();
  for (size_t i = 0; i + 1 < panes.size(); ++i) {
    Rect r = panes[i].rect;
    if (o == Orientation::Horizontal) { r.col = r.col + r.width - 1; r.width = 1; }
    else { r.row = r.row + r.height - 1; r.height = 1; }
    out.push_back(r);
  }
}

Rect content_rect(const PaneRect& pr, int pane_count, Orientation o) {
  Rect r = pr.rect;
  if (pr.pane + 1 < pane_count) {
    if (o == Orientation::Horizontal) r.width = std::max(0, r.width - 1);
    else r.height = std::max(0, r.height - 1);
  }
  return r;
}

int hit_divider(const std::vector<PaneRect>& panes, Orientation o, int row, int col) {
  std::vector<Rect> divs;
  divider_rects(panes, o, divs);
  for (size_t i = 0; i < divs.size(); ++i) {
    if (contains(divs[i], row, col)) return panes[i].pane;
  }
  return -1;
}

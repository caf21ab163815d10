#include "renderer.hpp"
#include <algorithm>
#include <sstream>

static const char* kPlaceholder = "No content";
static const char* kCloseButton = "[x]";

Rect panel_area(TermSize sz) {
  return Rect{1, 0, std::max(0, sz.rows - 2), std::max(0, sz.cols)};
}

std::vector<ToolbarItem> toolbar_items(const SplitView& view) {
  bool horiz = view.orientation() == Orientation::Horizontal;
  std::vector<ToolbarItem> items = {
    {ToolbarAction::Orientation, horiz ? "[o] split: horizontal" : "[o] split: vertical", 0},
    {ToolbarAction::Add, "[a] add", 0},
    {ToolbarAction::Sync, view.sync_scrolling() ? "[s] sync: on" : "[s] sync: off", 0},
    {ToolbarAction::Reset, "[=] reset sizes", 0},
    {ToolbarAction::CloseAll, "[O] close all", 0},
  };
  int col = 1;
  for (auto& it : items) {
    it.col = col;
    col += static_cast<int>(it.label.size()) + 2;
  }
  return items;
}

Rect header_rect(const Rect& content) {
  return Rect{content.row, content.col, std::min(1, content.height), content.width};
}

Rect body_rect(const Rect& content) {
  return Rect{content.row + 1, content.col, std::max(0, content.height - 1), content.width};
}

bool hit_close_button(const Rect& content, int pane_count, int row, int col) {
  if (pane_count <= 1 || content.height <= 0 || content.width < 4) return false;
  return row == content.row && col >= content.col + content.width - 3 && col < content.col + content.width;
}

static std::string fit(const std::string& s, int width) {
  if (width <= 0) return std::string();
  if (static_cast<int>(s.size()) <= width) return s + std::string(width - s.size(), ' ');
  return s.substr(0, width);
}

void Renderer::render_toolbar(ITerminal& term, const SplitView& view, int cols) {
  term.clear_to_eol(0, 0);
  auto items = toolbar_items(view);
  bool full = view.registry().full();
  for (const auto& it : items) {
    if (it.col >= cols) break;
    std::string label = it.label.substr(0, std::max(0, cols - it.col));
    if (it.action == ToolbarAction::Add && full) term.draw_colored(0, it.col, label, kPairMuted);
    else if (it.action == ToolbarAction::Sync && view.sync_scrolling()) term.draw_colored(0, it.col, label, kPairAccent);
    else term.draw_text(0, it.col, label);
  }
}

void Renderer::render_panel(ITerminal& term, const Rect& content, const std::string& title, int pane_count, const PanelRenderInfo& info) {
  if (content.height <= 0 || content.width <= 0) return;
  Rect head = header_rect(content);
  std::string label = " " + title;
  if (info.doc && info.doc->path) label += " - " + info.doc->name();
  int label_w = head.width;
  if (pane_count > 1 && head.width >= 4) label_w -= 3;
  std::string header = fit(label, label_w);
  if (info.is_active) term.draw_highlighted(head.row, head.col, header, 0, static_cast<int>(header.size()));
  else term.draw_colored(head.row, head.col, header, kPairAccent);
  if (pane_count > 1 && head.width >= 4) term.draw_colored(head.row, head.col + label_w, kCloseButton, kPairAccent);

  Rect body = body_rect(content);
  if (body.height <= 0) return;
  if (!info.doc) {
    std::string ph = std::string(kPlaceholder).substr(0, body.width);
    int r = body.row + body.height / 2;
    int c = body.col + std::max(0, (body.width - static_cast<int>(ph.size())) / 2);
    term.draw_colored(r, c, ph, kPairMuted);
    return;
  }
  const Document& d = *info.doc;
  for (int i = 0; i < body.height; ++i) {
    int line_idx = info.vp.top_line + i;
    if (line_idx < 0 || line_idx >= d.line_count()) break;
    const std::string& s = d.lines[line_idx];
    int start = std::min(std::max(0, info.vp.left_col), static_cast<int>(s.size()));
    std::string vis = s.substr(start, body.width);
    term.draw_text(body.row + i, body.col, vis);
  }
}

void Renderer::render_dividers(ITerminal& term, const std::vector<PaneRect>& rects, const SplitView& view) {
  Orientation o = view.orientation();
  std::vector<Rect> divs;
  divider_rects(rects, o, divs);
  auto dragged = view.resizing_boundary();
  for (size_t i = 0; i < divs.size(); ++i) {
    const Rect& r = divs[i];
    bool active = dragged && *dragged == rects[i].pane;
    if (o == Orientation::Horizontal) {
      for (int row = r.row; row < r.row + r.height; ++row) {
        if (active) term.draw_highlighted(row, r.col, "|", 0, 1);
        else term.draw_colored(row, r.col, "|", kPairDivider);
      }
    } else {
      std::string bar(r.width, '-');
      if (active) term.draw_highlighted(r.row, r.col, bar, 0, r.width);
      else term.draw_colored(r.row, r.col, bar, kPairDivider);
    }
  }
}

void Renderer::render_status(ITerminal& term, const RenderState& st, int row, int cols) {
  term.clear_to_eol(row, 0);
  if (st.command_mode) {
    term.draw_text(row, 0, (":" + st.cmdline).substr(0, cols));
    term.move_cursor(row, std::min(cols - 1, 1 + static_cast<int>(st.cmdline.size())));
    return;
  }
  const SplitView& v = *st.view;
  std::ostringstream oss;
  oss << v.registry().size() << "/" << v.registry().max_panels() << " panels  "
      << orientation_name(v.orientation());
  if (v.sync_scrolling()) oss << "  sync";
  if (v.resizing()) oss << "  resizing";
  if (!st.message.empty()) oss << "  | " << st.message;
  term.draw_text(row, 0, oss.str().substr(0, cols));
  term.move_cursor(row, 0);
}

void Renderer::render(ITerminal& term, const RenderState& st) {
  if (!st.view) return;
  TermSize sz = term.getSize();
  term.clear();
  if (sz.rows <= 0 || sz.cols <= 0) { term.refresh(); return; }
  render_toolbar(term, *st.view, sz.cols);
  const PanelRegistry& reg = st.view->registry();
  Rect area = panel_area(sz);
  std::vector<PaneRect> rects;
  collect_layout(reg.sizes(), st.view->orientation(), area, rects);
  for (const auto& pr : rects) {
    if (pr.pane < 0 || pr.pane >= static_cast<int>(st.panels.size())) continue;
    Rect content = content_rect(pr, reg.size(), st.view->orientation());
    render_panel(term, content, reg.display_title(pr.pane), reg.size(), st.panels[pr.pane]);
  }
  render_dividers(term, rects, *st.view);
  if (sz.rows >= 2) render_status(term, st, sz.rows - 1, sz.cols);
  term.refresh();
}

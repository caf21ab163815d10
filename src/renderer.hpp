#pragma once
/*
 * Renderer
 *
 * Purpose: draw toolbar, panel headers, panel content, dividers and status line.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless; receives snapshots from Workbench to render. The
 *             geometry helpers are shared with the mouse hit-testing code.
 */
#include <string>
#include <vector>
#include "document.hpp"
#include "iterminal.hpp"
#include "pane_layout.hpp"
#include "split_view.hpp"

enum class ToolbarAction { Orientation, Add, Sync, Reset, CloseAll };

struct ToolbarItem {
  ToolbarAction action;
  std::string label;
  int col = 0;
};

struct PanelRenderInfo {
  const Document* doc = nullptr; // nullptr renders the placeholder
  Viewport vp{};
  bool is_active = false;
};

struct RenderState {
  const SplitView* view = nullptr;
  std::vector<PanelRenderInfo> panels; // same order as the registry
  std::string message;
  std::string cmdline;
  bool command_mode = false;
};

// rows between the toolbar and the status line
Rect panel_area(TermSize sz);
std::vector<ToolbarItem> toolbar_items(const SplitView& view);
// header row of a pane; the close button is the last 3 cells
Rect header_rect(const Rect& content);
Rect body_rect(const Rect& content);
bool hit_close_button(const Rect& content, int pane_count, int row, int col);

class Renderer {
public:
  void render(ITerminal& term, const RenderState& st);

private:
  void render_toolbar(ITerminal& term, const SplitView& view, int cols);
  void render_panel(ITerminal& term, const Rect& content, const std::string& title, int pane_count, const PanelRenderInfo& info);
  void render_dividers(ITerminal& term, const std::vector<PaneRect>& rects, const SplitView& view);
  void render_status(ITerminal& term, const RenderState& st, int row, int cols);
};

#include "renderer.hpp"
#include "headless_terminal.hpp"
#include <cassert>
#include <string>

static RenderState state_for(const SplitView& v, const std::vector<const Document*>& docs, int active) {
  RenderState st;
  st.view = &v;
  for (int i = 0; i < v.registry().size(); ++i) {
    PanelRenderInfo info;
    info.doc = i < static_cast<int>(docs.size()) ? docs[i] : nullptr;
    info.is_active = i == active;
    st.panels.push_back(info);
  }
  return st;
}

static void test_single_panel() {
  HeadlessTerminal t(12, 60);
  SplitView v;
  Renderer r;
  r.render(t, state_for(v, {}, 0));
  assert(t.line(0).find("[o] split: horizontal") != std::string::npos);
  assert(t.line(0).find("[a] add") != std::string::npos);
  assert(t.line(1).find("Panel 1") != std::string::npos);
  assert(!t.contains_text("[x]"));
  assert(t.find_row("No content") > 1);
  assert(t.line(11).rfind("1/4 panels  horizontal", 0) == 0);
  assert(t.refresh_count() == 1);
}

static void test_two_panels_horizontal() {
  HeadlessTerminal t(12, 60);
  SplitView v;
  std::string msg;
  v.add_split(kNoContent, msg);
  Document doc = Document::from_text("alpha\nbeta\ngamma\ndelta\n");
  RenderState st = state_for(v, {nullptr, &doc}, 0);
  st.panels[1].vp.top_line = 2;
  Renderer r;
  r.render(t, st);
  for (int row = 1; row <= 10; ++row) assert(t.at(row, 29) == '|');
  assert(t.at(1, 26) == '[' && t.at(1, 27) == 'x' && t.at(1, 28) == ']');
  assert(t.highlighted(1, 0));
  assert(!t.highlighted(1, 30));
  assert(t.line(2).substr(30, 5) == "gamma");
  assert(t.line(3).substr(30, 5) == "delta");
  assert(t.line(6).find("No content") != std::string::npos);
  assert(t.line(6).find("No content") < 29);
  assert(t.color_at(6, t.line(6).find("No content")) == kPairMuted);
}

static void test_vertical_and_drag() {
  HeadlessTerminal t(12, 60);
  SplitView v;
  std::string msg;
  v.add_split(kNoContent, msg);
  v.toggle_orientation();
  Renderer r;
  r.render(t, state_for(v, {}, 1));
  assert(t.line(0).find("[o] split: vertical") != std::string::npos);
  assert(t.line(5) == std::string(60, '-'));
  assert(!t.highlighted(5, 10));

  assert(v.begin_resize(0, 5));
  r.render(t, state_for(v, {}, 1));
  assert(t.highlighted(5, 10));
  assert(t.line(11).find("resizing") != std::string::npos);
}

static void test_status_line() {
  HeadlessTerminal t(12, 60);
  SplitView v;
  std::string msg;
  for (int i = 0; i < 3; ++i) v.add_split(kNoContent, msg);
  v.add_split(kNoContent, msg);
  v.toggle_sync();
  RenderState st = state_for(v, {}, 0);
  st.message = msg;
  Renderer r;
  r.render(t, st);
  assert(t.line(11).find("4/4 panels") == 0);
  assert(t.line(11).find("sync") != std::string::npos);
  assert(t.line(11).find("| Maximum 4 splits supported") != std::string::npos);
  int add_col = t.line(0).find("[a] add");
  assert(t.color_at(0, add_col) == kPairMuted);

  st.command_mode = true;
  st.cmdline = "add";
  r.render(t, st);
  assert(t.line(11).rfind(":add", 0) == 0);
  assert(t.cursor_row() == 11 && t.cursor_col() == 4);
}

static void test_hit_helpers() {
  SplitView v;
  auto items = toolbar_items(v);
  assert(items.size() == 5);
  assert(items[0].col == 1);
  assert(items[1].col == items[0].col + static_cast<int>(items[0].label.size()) + 2);
  Rect content{1, 0, 10, 29};
  assert(hit_close_button(content, 2, 1, 28));
  assert(hit_close_button(content, 2, 1, 26));
  assert(!hit_close_button(content, 2, 1, 25));
  assert(!hit_close_button(content, 2, 2, 27));
  assert(!hit_close_button(content, 1, 1, 27));
  Rect area = panel_area(TermSize{12, 60});
  assert(area.row == 1 && area.height == 10 && area.width == 60);
}

int main() {
  test_single_panel();
  test_two_panels_horizontal();
  test_vertical_and_drag();
  test_status_line();
  test_hit_helpers();
  return 0;
}

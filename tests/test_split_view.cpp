#include "split_view.hpp"
#include "pane_layout.hpp"
#include <cassert>
#include <cmath>
#include <map>
#include <string>
#include <vector>

static bool near(double a, double b) { return std::fabs(a - b) < 1e-6; }

struct Recorder {
  int calls = 0;
  std::vector<PanelSnapshot> last;
  void attach(SplitView& v) {
    v.set_change_listener([this](const std::vector<PanelSnapshot>& p){ ++calls; last = p; });
  }
};

static void test_walkthrough() {
  SplitView v(3);
  Recorder rec; rec.attach(v);
  std::string msg;
  PanelId a = v.registry().at(0).id;
  assert(near(v.registry().at(0).size, 100.0));
  auto p2 = v.add_split(kNoContent, msg);
  auto p3 = v.add_split(kNoContent, msg);
  assert(p2 && p3);
  assert(rec.calls == 2);
  assert(rec.last.size() == 3);
  for (const auto& s : rec.last) assert(near(s.size, 100.0 / 3.0));

  assert(v.close_split(*p2, msg));
  assert(rec.calls == 3);
  assert(v.registry().size() == 2);
  assert(near(v.registry().at(0).size, 50.0) && near(v.registry().at(1).size, 50.0));

  assert(v.orientation() == Orientation::Horizontal);
  std::vector<PaneRect> rs;
  collect_layout(v.registry().sizes(), v.orientation(), Rect{0, 0, 20, 100}, rs);
  assert(rs[0].rect.width == 50 && rs[0].rect.height == 20);
  v.toggle_orientation();
  assert(v.orientation() == Orientation::Vertical);
  assert(near(v.registry().at(0).size, 50.0) && near(v.registry().at(1).size, 50.0));
  assert(rec.calls == 3);
  collect_layout(v.registry().sizes(), v.orientation(), Rect{0, 0, 20, 100}, rs);
  assert(rs[0].rect.width == 100 && rs[0].rect.height == 10);

  assert(v.toggle_sync());
  std::map<PanelId, Viewport> vps;
  int written = v.notify_scroll(a, Viewport{120, 40}, [&](PanelId id, const Viewport& off){ vps[id] = off; });
  assert(written == 1);
  assert(vps[*p3].left_col == 40 && vps[*p3].top_line == 120);
}

static void test_capacity_signal() {
  SplitView v;
  Recorder rec; rec.attach(v);
  std::string msg;
  for (int i = 0; i < 3; ++i) assert(v.add_split(kNoContent, msg));
  assert(msg.empty());
  assert(rec.calls == 3);
  auto before = v.registry().snapshot();
  assert(!v.add_split(kNoContent, msg));
  assert(msg == "Maximum 4 splits supported");
  assert(v.registry().size() == 4);
  assert(rec.calls == 3);
  for (size_t i = 0; i < before.size(); ++i) assert(v.registry().at(static_cast<int>(i)).id == before[i].id);
}

static void test_last_panel_and_close_all() {
  SplitView v(11);
  Recorder rec; rec.attach(v);
  std::string msg;
  PanelId only = v.registry().at(0).id;
  assert(!v.close_split(only, msg));
  assert(!msg.empty());
  assert(v.registry().size() == 1);
  assert(rec.calls == 0);

  v.add_split(4, msg);
  v.add_split(5, msg);
  v.rename_panel(only, "Main");
  PanelId fresh = v.close_all_splits();
  assert(v.registry().size() == 1);
  assert(v.registry().at(0).id == fresh);
  assert(v.registry().at(0).content == 11);
  assert(near(v.registry().at(0).size, 100.0));
  assert(v.registry().display_title(0) == "Panel 1");
  assert(rec.last.size() == 1);
}

static void test_drag() {
  SplitView v;
  Recorder rec; rec.attach(v);
  std::string msg;
  v.add_split(kNoContent, msg);
  int calls = rec.calls;
  assert(v.begin_resize(0, 100));
  assert(v.resizing());
  assert(v.resizing_boundary() && *v.resizing_boundary() == 0);
  assert(!v.begin_resize(0, 100));
  assert(v.update_resize(700, 1000));
  assert(near(v.registry().at(0).size, 90.0) && near(v.registry().at(1).size, 10.0));
  assert(rec.calls == calls); // nothing reported mid-drag
  assert(v.end_resize());
  assert(rec.calls == calls + 1);
  assert(near(rec.last[0].size, 90.0));
  assert(!v.resizing());
  assert(!v.update_resize(100, 1000));
  assert(near(v.registry().at(0).size, 90.0));
  assert(!v.end_resize());

  // structural changes end the session
  assert(v.begin_resize(0, 0));
  v.add_split(kNoContent, msg);
  assert(!v.resizing());
  assert(near(v.registry().total(), 100.0));

  v.reset_sizes();
  std::vector<double> once = v.registry().sizes();
  v.reset_sizes();
  assert(v.registry().sizes() == once);
}

static void test_options() {
  SplitView v;
  Recorder rec; rec.attach(v);
  std::string msg;
  v.add_split(kNoContent, msg);
  v.add_split(kNoContent, msg);
  LayoutOptions o = v.options();
  o.max_panels = 2;
  assert(!v.set_options(o, msg));
  o.max_panels = 4; o.min_size = 30.0;
  assert(!v.set_options(o, msg));
  assert(v.options().min_size == 10.0);

  std::string m2;
  v.close_split(v.registry().at(2).id, m2);
  v.begin_resize(0, 0);
  v.update_resize(400, 1000);
  v.end_resize();
  assert(near(v.registry().at(1).size, 10.0));
  int calls = rec.calls;
  o.max_panels = 3; o.min_size = 20.0;
  assert(v.set_options(o, msg));
  assert(rec.calls == calls + 1);
  assert(near(v.registry().at(0).size, 50.0));
  assert(v.registry().max_panels() == 3);
  assert(v.add_split(kNoContent, msg));
  assert(!v.add_split(kNoContent, msg));
  assert(msg == "Maximum 3 splits supported");
}

static void test_restore() {
  SplitView v(2);
  Recorder rec; rec.attach(v);
  std::vector<PanelSnapshot> saved(3);
  saved[0].size = 20.0; saved[0].title = "Request";
  saved[1].size = 30.0;
  saved[2].size = 50.0; saved[2].title = "Response";
  v.restore(saved, Orientation::Vertical, true);
  assert(rec.calls == 1);
  assert(v.registry().size() == 3);
  assert(v.registry().at(0).content == 2);
  assert(v.registry().display_title(0) == "Request");
  assert(v.registry().display_title(1) == "Panel 2");
  assert(near(v.registry().at(2).size, 50.0));
  assert(v.orientation() == Orientation::Vertical);
  assert(v.sync_scrolling());
}

static void test_orientation_ends_drag() {
  SplitView v;
  std::string msg;
  v.add_split(kNoContent, msg);
  assert(v.begin_resize(0, 100));
  v.toggle_orientation();
  assert(!v.resizing());
  // a row coordinate must not be measured against the old column start
  assert(!v.update_resize(21, 40));
  assert(near(v.registry().at(0).size, 50.0) && near(v.registry().at(1).size, 50.0));

  assert(v.begin_resize(0, 20));
  v.set_orientation(Orientation::Horizontal);
  assert(!v.resizing());
  assert(v.orientation() == Orientation::Horizontal);

  assert(v.begin_resize(0, 20));
  v.set_orientation(Orientation::Horizontal);
  assert(v.resizing());
  v.cancel_resize();
  assert(!v.resizing());
}

static void test_legacy_drag_settles() {
  LayoutOptions o;
  o.clamp = ClampPolicy::Legacy;
  SplitView v(kNoContent, o);
  Recorder rec; rec.attach(v);
  std::string msg;
  v.add_split(kNoContent, msg);
  v.add_split(kNoContent, msg);
  double third = 100.0 / 3.0;

  assert(v.begin_resize(0, 0));
  v.update_resize(900, 1000);
  assert(near(v.registry().at(0).size, 90.0) && near(v.registry().at(1).size, 10.0));
  assert(near(v.registry().total(), 100.0 + third));
  assert(v.end_resize());
  assert(near(v.registry().total(), 100.0));
  assert(near(v.registry().at(0).size, 2.0 * third - 10.0));
  assert(near(v.registry().at(1).size, 10.0));
  assert(near(v.registry().at(2).size, third));
  double sum = 0;
  for (const auto& p : rec.last) sum += p.size;
  assert(near(sum, 100.0));

  v.reset_sizes();
  assert(v.begin_resize(1, 0));
  v.update_resize(-900, 1000);
  v.cancel_resize();
  assert(near(v.registry().total(), 100.0));
  assert(near(v.registry().at(0).size, third));
  assert(near(v.registry().at(1).size, 10.0));
}

int main() {
  test_walkthrough();
  test_capacity_signal();
  test_last_panel_and_close_all();
  test_drag();
  test_options();
  test_restore();
  test_orientation_ends_drag();
  test_legacy_drag_settles();
  return 0;
}

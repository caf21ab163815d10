#include "layout_store.hpp"
#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

static bool near(double a, double b) { return std::fabs(a - b) < 1e-6; }

static fs::path scratch(const std::string& name) {
  return fs::temp_directory_path() / ("splitview_test_" + std::to_string(::getpid()) + "_" + name);
}

static void write_file(const fs::path& p, const std::string& text) {
  std::ofstream out(p, std::ios::binary | std::ios::trunc);
  out << text;
}

static void test_format_parse() {
  SplitView v;
  std::string msg;
  v.add_split(kNoContent, msg);
  v.add_split(kNoContent, msg);
  v.rename_panel(v.registry().at(1).id, "Request headers");
  v.toggle_orientation();
  v.toggle_sync();
  std::string text = format_layout(v);
  assert(text.find("orientation vertical") != std::string::npos);
  assert(text.find("sync on") != std::string::npos);

  SavedLayout saved;
  assert(parse_layout(text, v.options(), saved, msg));
  assert(saved.orientation == Orientation::Vertical);
  assert(saved.sync);
  assert(saved.panels.size() == 3);
  assert(!saved.panels[0].title);
  assert(saved.panels[1].title && *saved.panels[1].title == "Request headers");
  for (const auto& p : saved.panels) assert(near(p.size, 100.0 / 3.0));
}

static void test_parse_rejects() {
  LayoutOptions opts;
  SavedLayout out;
  out.sync = true;
  std::string msg;
  assert(!parse_layout("", opts, out, msg));
  assert(msg == "layout has no panels");
  assert(!parse_layout("panel 50\npanel 50\nwidth 3\n", opts, out, msg));
  assert(msg.find("line 3") != std::string::npos);
  assert(!parse_layout("orientation diagonal\npanel 100\n", opts, out, msg));
  assert(!parse_layout("sync yes\npanel 100\n", opts, out, msg));
  assert(!parse_layout("panel fifty\npanel 50\n", opts, out, msg));
  assert(!parse_layout("panel 50x\npanel 50\n", opts, out, msg));
  assert(!parse_layout("panel 95\npanel 5\n", opts, out, msg));
  assert(msg == "panel size below minimum");
  assert(!parse_layout("panel 40\npanel 40\n", opts, out, msg));
  assert(msg == "panel sizes must sum to 100");
  assert(!parse_layout("panel 20\npanel 20\npanel 20\npanel 20\npanel 20\n", opts, out, msg));
  // failures leave the output untouched
  assert(out.sync && out.panels.empty());

  assert(parse_layout("# comment\n\n  panel 60 Left side  \npanel 40\n", opts, out, msg));
  assert(out.panels.size() == 2);
  assert(*out.panels[0].title == "Left side");
  assert(out.orientation == Orientation::Horizontal && !out.sync);
}

static void test_save_load() {
  fs::path p = scratch("layout");
  SplitView a;
  std::string msg;
  a.add_split(kNoContent, msg);
  a.begin_resize(0, 0);
  a.update_resize(25, 100);
  a.end_resize();
  a.rename_panel(a.registry().at(0).id, "Main view");
  assert(save_layout(p, a, msg));
  assert(fs::exists(p));
  fs::path tmp = p; tmp += ".tmp";
  assert(!fs::exists(tmp));

  SplitView b(7);
  int calls = 0;
  b.set_change_listener([&](const std::vector<PanelSnapshot>&){ ++calls; });
  assert(load_layout(p, b, msg));
  assert(calls == 1);
  assert(b.registry().size() == 2);
  assert(near(b.registry().at(0).size, 75.0) && near(b.registry().at(1).size, 25.0));
  assert(b.registry().display_title(0) == "Main view");
  assert(b.registry().at(0).content == 7);
  fs::remove(p);
}

static void test_load_failure_keeps_view() {
  fs::path p = scratch("bad");
  write_file(p, "orientation vertical\npanel 70\npanel 20\n");
  SplitView v;
  std::string msg;
  v.add_split(kNoContent, msg);
  auto before = v.registry().sizes();
  assert(!load_layout(p, v, msg));
  assert(msg.find("sum to 100") != std::string::npos);
  assert(v.registry().sizes() == before);
  assert(v.orientation() == Orientation::Horizontal);
  fs::remove(p);

  assert(!load_layout(scratch("missing"), v, msg));
  assert(v.registry().size() == 2);
}

static void test_legacy_drag_round_trip() {
  fs::path p = scratch("legacy");
  LayoutOptions opts;
  opts.clamp = ClampPolicy::Legacy;
  SplitView a(kNoContent, opts);
  std::string msg;
  a.add_split(kNoContent, msg);
  a.add_split(kNoContent, msg);
  a.begin_resize(0, 0);
  a.update_resize(900, 1000);
  // mid-drag the legacy clamp overshoots; nothing unloadable reaches disk
  assert(!save_layout(p, a, msg));
  assert(!fs::exists(p));
  a.end_resize();
  assert(save_layout(p, a, msg));

  SplitView b(kNoContent, opts);
  assert(load_layout(p, b, msg));
  assert(b.registry().size() == 3);
  assert(near(b.registry().total(), 100.0));
  assert(near(b.registry().at(0).size, a.registry().at(0).size));
  assert(near(b.registry().at(1).size, 10.0));
  fs::remove(p);
}

int main() {
  test_format_parse();
  test_parse_rejects();
  test_save_load();
  test_load_failure_keeps_view();
  test_legacy_drag_round_trip();
  return 0;
}

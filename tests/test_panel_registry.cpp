#include "panel_registry.hpp"
#include <cassert>
#include <cmath>
#include <set>
#include <string>
#include <vector>

static bool near(double a, double b) { return std::fabs(a - b) < 1e-6; }

static void test_add_rebalances() {
  PanelRegistry r(4);
  assert(r.size() == 1);
  assert(near(r.at(0).size, 100.0));
  assert(r.display_title(0) == "Panel 1");
  auto a = r.add_panel();
  auto b = r.add_panel(7);
  assert(a && b);
  assert(r.size() == 3);
  for (const auto& p : r.panels()) assert(near(p.size, 100.0 / 3.0));
  assert(near(r.total(), 100.0));
  assert(r.at(1).id == *a);
  assert(r.at(2).id == *b);
  assert(r.find(*b)->content == 7);
  assert(r.find(*a)->content == kNoContent);
  assert(r.display_title(2) == "Panel 3");
}

static void test_capacity() {
  PanelRegistry r(4);
  for (int i = 0; i < 3; ++i) assert(r.add_panel());
  assert(r.full());
  std::vector<double> before = r.sizes();
  PanelId first = r.at(0).id;
  assert(!r.add_panel());
  assert(r.size() == 4);
  assert(r.sizes() == before);
  assert(r.at(0).id == first);

  PanelRegistry small(2);
  assert(small.add_panel());
  assert(!small.add_panel());
  assert(small.size() == 2);
}

static void test_remove() {
  PanelRegistry r(4);
  PanelId p1 = r.at(0).id;
  PanelId p2 = *r.add_panel();
  PanelId p3 = *r.add_panel();
  PanelId p4 = *r.add_panel();
  assert(r.remove_panel(p2));
  assert(r.size() == 3);
  for (const auto& p : r.panels()) assert(near(p.size, 100.0 / 3.0));
  assert(r.at(0).id == p1 && r.at(1).id == p3 && r.at(2).id == p4);
  assert(!r.remove_panel(p2)); // unknown id
  assert(r.size() == 3);
  assert(r.remove_panel(p1));
  assert(r.remove_panel(p4));
  assert(r.size() == 1);
  assert(near(r.at(0).size, 100.0));
  assert(!r.remove_panel(p3)); // the last panel stays
  assert(r.size() == 1);
  assert(r.at(0).id == p3);
}

static void test_unique_ids() {
  PanelRegistry r(4);
  std::set<PanelId> seen{r.at(0).id};
  for (int round = 0; round < 5; ++round) {
    auto id = r.add_panel();
    assert(id);
    assert(seen.insert(*id).second);
    assert(r.remove_panel(*id));
  }
  PanelId single = r.collapse_to_single();
  assert(seen.insert(single).second);
  assert(PanelRegistry::key_for(3) == "panel-3");
}

static void test_reset_idempotent() {
  PanelRegistry r(4);
  r.add_panel();
  r.add_panel();
  r.assign_sizes({20.0, 30.0, 50.0});
  r.reset_sizes();
  std::vector<double> once = r.sizes();
  r.reset_sizes();
  assert(r.sizes() == once);
  for (double s : once) assert(near(s, 100.0 / 3.0));
}

static void test_collapse_and_rename() {
  PanelRegistry r(4, 9);
  PanelId old = r.at(0).id;
  r.add_panel(1);
  r.add_panel(2);
  assert(r.rename(old, "Left"));
  assert(r.display_title(0) == "Left");
  assert(r.rename(old, ""));
  assert(r.display_title(0).empty());
  assert(!r.rename(12345, "x"));
  PanelId fresh = r.collapse_to_single(5);
  assert(r.size() == 1);
  assert(fresh != old);
  assert(r.at(0).content == 5);
  assert(!r.at(0).title);
  assert(near(r.at(0).size, 100.0));
  assert(r.set_content(fresh, 6));
  assert(r.at(0).content == 6);
  assert(r.index_of(old) == -1);
  assert(r.index_of(fresh) == 0);
}

static void test_net_count() {
  // n follows the add/remove calls, floored at 1 and capped at 4
  PanelRegistry r(4);
  int expected = 1;
  const char* script = "aaaaaarrrrrraarar";
  for (const char* c = script; *c; ++c) {
    if (*c == 'a') { if (r.add_panel()) ++expected; else assert(expected == 4); }
    else { if (r.remove_panel(r.at(r.size() - 1).id)) --expected; else assert(expected == 1); }
    assert(r.size() == expected);
    assert(near(r.total(), 100.0));
  }
}

int main() {
  test_add_rebalances();
  test_capacity();
  test_remove();
  test_unique_ids();
  test_reset_idempotent();
  test_collapse_and_rename();
  test_net_count();
  return 0;
}

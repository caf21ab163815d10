#pragma once
/*
 * PanelRegistry
 *
 * Purpose: ordered panel list with the only mutation primitives that may
 *          create, destroy or rebalance panels.
 * Invariant: 1 <= size() <= max_panels; sizes sum to 100 after every call.
 * Note: content handles are stored, never inspected.
 */
#include <optional>
#include <string>
#include <vector>
#include "types.hpp"

struct Panel {
  PanelId id = 0;
  ContentHandle content = kNoContent;
  std::optional<std::string> title;
  double size = 100.0;
};

class PanelRegistry {
public:
  explicit PanelRegistry(int max_panels = 4, ContentHandle initial = kNoContent);

  std::optional<PanelId> add_panel(ContentHandle content = kNoContent);
  bool remove_panel(PanelId id);
  void reset_sizes();
  PanelId collapse_to_single(ContentHandle content = kNoContent);
  bool rename(PanelId id, const std::string& title);
  bool set_content(PanelId id, ContentHandle content);

  int size() const { return static_cast<int>(panels_.size()); }
  int max_panels() const { return max_panels_; }
  void set_max_panels(int n) { max_panels_ = n; }
  bool full() const { return size() >= max_panels_; }

  const std::vector<Panel>& panels() const { return panels_; }
  const Panel& at(int index) const { return panels_[index]; }
  const Panel* find(PanelId id) const;
  int index_of(PanelId id) const;
  std::vector<double> sizes() const;
  double total() const;
  std::string display_title(int index) const;
  std::vector<PanelSnapshot> snapshot() const;

  // Used by the resize controller and by layout restore; callers keep I1.
  void assign_sizes(const std::vector<double>& sizes);

  static std::string key_for(PanelId id);

private:
  PanelId next_id();
  void distribute_equally();

  std::vector<Panel> panels_;
  int max_panels_;
  PanelId last_id_ = 0;
};

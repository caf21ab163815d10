#pragma once
/*
 * SplitView
 *
 * Purpose: the split-view engine: panel registry + orientation + resize
 *          session + scroll sync, with one change listener.
 * Failure: nothing throws; capacity/floor/cardinality violations become
 *          no-ops or clamps, explained through the msg out-parameter.
 */
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "config.hpp"
#include "panel_registry.hpp"
#include "resize_controller.hpp"
#include "scroll_sync.hpp"

class SplitView {
public:
  using ChangeListener = std::function<void(const std::vector<PanelSnapshot>&)>;

  explicit SplitView(ContentHandle initial = kNoContent, const LayoutOptions& opts = LayoutOptions{});

  void set_change_listener(ChangeListener l) { listener_ = std::move(l); }

  /* toolbar actions */
  std::optional<PanelId> add_split(ContentHandle content, std::string& msg);
  bool close_split(PanelId id, std::string& msg);
  void reset_sizes();
  PanelId close_all_splits();
  bool rename_panel(PanelId id, const std::string& title);
  bool set_panel_content(PanelId id, ContentHandle content);
  void toggle_orientation();
  void set_orientation(Orientation o);
  bool toggle_sync() { return sync_.toggle(); }
  void set_sync(bool on) { sync_.set_enabled(on); }

  /* drag resize */
  bool begin_resize(int boundary, int pos);
  bool update_resize(int pos, int extent);
  bool end_resize();
  void cancel_resize();
  bool resizing() const { return resize_.active(); }
  std::optional<int> resizing_boundary() const;

  /* scroll sync */
  int notify_scroll(PanelId source, const Viewport& offset, const ScrollSynchronizer::Writer& write);

  /* restore: rebuild panels from a saved layout; all-or-nothing is the caller's job */
  void restore(const std::vector<PanelSnapshot>& panels, Orientation o, bool sync);

  bool set_options(const LayoutOptions& opts, std::string& msg);
  const LayoutOptions& options() const { return opts_; }

  const PanelRegistry& registry() const { return registry_; }
  Orientation orientation() const { return orientation_; }
  bool sync_scrolling() const { return sync_.enabled(); }
  ContentHandle initial_content() const { return initial_; }

private:
  void notify();
  void settle_drag();

  LayoutOptions opts_;
  ContentHandle initial_;
  PanelRegistry registry_;
  ResizeController resize_;
  ScrollSynchronizer sync_;
  Orientation orientation_ = Orientation::Horizontal;
  ChangeListener listener_;
};

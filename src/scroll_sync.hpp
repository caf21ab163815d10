#pragma once
/*
 * ScrollSynchronizer
 *
 * Purpose: mirror one panel's scroll offsets onto every other panel.
 * Note: plain fan-out, last writer wins; writes made while broadcasting do
 *       not start another broadcast.
 */
#include <functional>
#include "types.hpp"
#include "panel_registry.hpp"

class ScrollSynchronizer {
public:
  using Writer = std::function<void(PanelId, const Viewport&)>;

  bool enabled() const { return enabled_; }
  void set_enabled(bool on) { enabled_ = on; }
  bool toggle() { enabled_ = !enabled_; return enabled_; }

  int on_scroll(PanelId source, const Viewport& offset, const PanelRegistry& reg, const Writer& write);

private:
  bool enabled_ = false;
  bool broadcasting_ = false;
};

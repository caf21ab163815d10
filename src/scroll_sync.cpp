#include "scroll_sync.hpp"

int ScrollSynchronizer::on_scroll(PanelId source, const Viewport& offset, const PanelRegistry& reg, const Writer& write) {
  if (!enabled_ || broadcasting_ || !write) return 0;
  broadcasting_ = true;
  int written = 0;
  // copy ids first: a writer may touch the registry's owner
  std::vector<PanelId> targets;
  for (const auto& p : reg.panels()) if (p.id != source) targets.push_back(p.id);
  for (PanelId id : targets) { write(id, offset); ++written; }
  broadcasting_ = false;
  return written;
}

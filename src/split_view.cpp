#include "split_view.hpp"
#include <algorithm>
#include "logger.hpp"

SplitView::SplitView(ContentHandle initial, const LayoutOptions& opts)
    : opts_(opts), initial_(initial), registry_(opts.max_panels, initial), resize_(opts.min_size, opts.clamp) {}

void SplitView::notify() {
  if (listener_) listener_(registry_.snapshot());
}

std::optional<PanelId> SplitView::add_split(ContentHandle content, std::string& msg) {
  cancel_resize();
  auto id = registry_.add_panel(content);
  if (!id) {
    msg = "Maximum " + std::to_string(registry_.max_panels()) + " splits supported";
    LOG_WARN("add split refused: {} panels open", registry_.size());
    return std::nullopt;
  }
  LOG_DEBUG("added {} ({} panels)", PanelRegistry::key_for(*id), registry_.size());
  notify();
  return id;
}

bool SplitView::close_split(PanelId id, std::string& msg) {
  cancel_resize();
  if (registry_.size() <= 1) { msg = "cannot close the last panel"; return false; }
  if (!registry_.remove_panel(id)) { msg = "no such panel"; return false; }
  LOG_DEBUG("closed {} ({} panels)", PanelRegistry::key_for(id), registry_.size());
  notify();
  return true;
}

void SplitView::reset_sizes() {
  cancel_resize();
  registry_.reset_sizes();
  notify();
}

PanelId SplitView::close_all_splits() {
  cancel_resize();
  PanelId id = registry_.collapse_to_single(initial_);
  LOG_DEBUG("collapsed to single panel {}", PanelRegistry::key_for(id));
  notify();
  return id;
}

bool SplitView::rename_panel(PanelId id, const std::string& title) {
  if (!registry_.rename(id, title)) return false;
  notify();
  return true;
}

bool SplitView::set_panel_content(PanelId id, ContentHandle content) {
  return registry_.set_content(id, content);
}

void SplitView::toggle_orientation() {
  // the session's start position was measured on the old axis
  cancel_resize();
  orientation_ = orientation_ == Orientation::Horizontal ? Orientation::Vertical : Orientation::Horizontal;
  LOG_DEBUG("orientation {}", orientation_name(orientation_));
}

bool SplitView::begin_resize(int boundary, int pos) {
  bool ok = resize_.begin(boundary, pos, registry_.sizes());
  if (ok) LOG_TRACE("drag start on boundary {} at {}", boundary, pos);
  return ok;
}

bool SplitView::update_resize(int pos, int extent) {
  std::vector<double> sizes = registry_.sizes();
  if (!resize_.move(pos, extent, sizes)) return false;
  registry_.assign_sizes(sizes);
  return true;
}

void SplitView::set_orientation(Orientation o) {
  if (o == orientation_) return;
  toggle_orientation();
}

void SplitView::settle_drag() {
  std::vector<double> sizes = registry_.sizes();
  resize_.settle(sizes);
  registry_.assign_sizes(sizes);
}

bool SplitView::end_resize() {
  if (!resize_.active()) return false;
  settle_drag();
  resize_.end();
  LOG_DEBUG("drag end, total {:.4f}", registry_.total());
  notify();
  return true;
}

void SplitView::cancel_resize() {
  if (!resize_.active()) return;
  LOG_TRACE("drag cancelled");
  settle_drag();
  resize_.cancel();
}

std::optional<int> SplitView::resizing_boundary() const {
  if (!resize_.session()) return std::nullopt;
  return resize_.session()->boundary;
}

int SplitView::notify_scroll(PanelId source, const Viewport& offset, const ScrollSynchronizer::Writer& write) {
  return sync_.on_scroll(source, offset, registry_, write);
}

void SplitView::restore(const std::vector<PanelSnapshot>& panels, Orientation o, bool sync) {
  cancel_resize();
  registry_.collapse_to_single(initial_);
  for (size_t i = 1; i < panels.size(); ++i) {
    if (!registry_.add_panel(kNoContent)) break;
  }
  std::vector<double> sizes;
  for (size_t i = 0; i < panels.size() && i < registry_.panels().size(); ++i) {
    const auto& src = panels[i];
    if (src.title) registry_.rename(registry_.at(static_cast<int>(i)).id, *src.title);
    sizes.push_back(src.size);
  }
  if (sizes.size() == static_cast<size_t>(registry_.size())) registry_.assign_sizes(sizes);
  orientation_ = o;
  sync_.set_enabled(sync);
  notify();
}

bool SplitView::set_options(const LayoutOptions& opts, std::string& msg) {
  if (opts.max_panels < 1) { msg = "maxpanels must be >= 1"; return false; }
  if (opts.min_size < 0.0 || opts.min_size >= 100.0) { msg = "minsize must be in [0, 100)"; return false; }
  if (opts.max_panels * opts.min_size > 100.0 + SV_SIZE_EPSILON) {
    msg = "maxpanels * minsize must not exceed 100";
    return false;
  }
  if (opts.max_panels < registry_.size()) {
    msg = "close panels first: " + std::to_string(registry_.size()) + " open";
    return false;
  }
  cancel_resize();
  opts_ = opts;
  registry_.set_max_panels(opts.max_panels);
  resize_.set_min_size(opts.min_size);
  resize_.set_policy(opts.clamp);
  bool below = std::any_of(registry_.panels().begin(), registry_.panels().end(),
                           [&](const Panel& p){ return p.size + SV_SIZE_EPSILON < opts.min_size; });
  if (below) {
    registry_.reset_sizes();
    notify();
  }
  return true;
}

#include "panel_registry.hpp"
#include <algorithm>
#include <numeric>

PanelRegistry::PanelRegistry(int max_panels, ContentHandle initial)
    : max_panels_(std::max(1, max_panels)) {
  panels_.push_back(Panel{next_id(), initial, std::nullopt, 100.0});
}

PanelId PanelRegistry::next_id() { return ++last_id_; }

void PanelRegistry::distribute_equally() {
  if (panels_.empty()) return;
  double share = 100.0 / static_cast<double>(panels_.size());
  for (auto& p : panels_) p.size = share;
}

std::optional<PanelId> PanelRegistry::add_panel(ContentHandle content) {
  if (full()) return std::nullopt;
  PanelId id = next_id();
  panels_.push_back(Panel{id, content, std::nullopt, 0.0});
  distribute_equally();
  return id;
}

bool PanelRegistry::remove_panel(PanelId id) {
  if (panels_.size() <= 1) return false; // the last panel never closes
  auto it = std::find_if(panels_.begin(), panels_.end(), [id](const Panel& p){ return p.id == id; });
  if (it == panels_.end()) return false;
  panels_.erase(it);
  distribute_equally();
  return true;
}

void PanelRegistry::reset_sizes() { distribute_equally(); }

PanelId PanelRegistry::collapse_to_single(ContentHandle content) {
  panels_.clear();
  PanelId id = next_id();
  panels_.push_back(Panel{id, content, std::nullopt, 100.0});
  return id;
}

bool PanelRegistry::rename(PanelId id, const std::string& title) {
  for (auto& p : panels_) {
    if (p.id == id) { p.title = title; return true; }
  }
  return false;
}

bool PanelRegistry::set_content(PanelId id, ContentHandle content) {
  for (auto& p : panels_) {
    if (p.id == id) { p.content = content; return true; }
  }
  return false;
}

const Panel* PanelRegistry::find(PanelId id) const {
  for (const auto& p : panels_) if (p.id == id) return &p;
  return nullptr;
}

int PanelRegistry::index_of(PanelId id) const {
  for (size_t i = 0; i < panels_.size(); ++i) if (panels_[i].id == id) return static_cast<int>(i);
  return -1;
}

std::vector<double> PanelRegistry::sizes() const {
  std::vector<double> out;
  out.reserve(panels_.size());
  for (const auto& p : panels_) out.push_back(p.size);
  return out;
}

double PanelRegistry::total() const {
  return std::accumulate(panels_.begin(), panels_.end(), 0.0,
                         [](double acc, const Panel& p){ return acc + p.size; });
}

std::string PanelRegistry::display_title(int index) const {
  if (index < 0 || index >= size()) return std::string();
  const auto& t = panels_[index].title;
  if (t) return *t;
  return "Panel " + std::to_string(index + 1);
}

std::vector<PanelSnapshot> PanelRegistry::snapshot() const {
  std::vector<PanelSnapshot> out;
  out.reserve(panels_.size());
  for (const auto& p : panels_) out.push_back(PanelSnapshot{p.id, p.title, p.size});
  return out;
}

void PanelRegistry::assign_sizes(const std::vector<double>& sizes) {
  size_t n = std::min(sizes.size(), panels_.size());
  for (size_t i = 0; i < n; ++i) panels_[i].size = sizes[i];
}

std::string PanelRegistry::key_for(PanelId id) {
  return "panel-" + std::to_string(id);
}

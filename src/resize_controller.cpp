#include "resize_controller.hpp"
#include <algorithm>
#include <cmath>
#include "config.hpp"

bool ResizeController::begin(int boundary, int pos, const std::vector<double>& sizes) {
  if (session_) return false; // one boundary at a time
  if (boundary < 0 || boundary + 1 >= static_cast<int>(sizes.size())) return false;
  session_ = DragSession{boundary, pos, sizes[boundary], sizes[boundary] + sizes[boundary + 1]};
  return true;
}

bool ResizeController::move(int pos, int extent, std::vector<double>& sizes) const {
  if (!session_ || extent <= 0) return false;
  const DragSession& s = *session_;
  int k = s.boundary;
  if (k + 1 >= static_cast<int>(sizes.size())) return false;
  double delta_pct = static_cast<double>(pos - s.start_pos) / static_cast<double>(extent) * 100.0;
  if (policy_ == ClampPolicy::Strict) {
    double hi = std::max(min_size_, s.pair_total - min_size_);
    double proposed = std::clamp(s.start_size + delta_pct, min_size_, hi);
    sizes[k] = proposed;
    sizes[k + 1] = s.pair_total - proposed;
  } else {
    double proposed = std::clamp(s.start_size + delta_pct, min_size_, 100.0 - min_size_);
    double diff = proposed - sizes[k];
    sizes[k] = proposed;
    sizes[k + 1] = std::max(min_size_, sizes[k + 1] - diff);
  }
  return true;
}

void ResizeController::settle(std::vector<double>& sizes) const {
  if (!session_) return;
  const DragSession& s = *session_;
  int k = s.boundary;
  if (k + 1 >= static_cast<int>(sizes.size())) return;
  if (std::fabs(sizes[k] + sizes[k + 1] - s.pair_total) <= SV_SIZE_EPSILON) return;
  double hi = std::max(min_size_, s.pair_total - min_size_);
  sizes[k] = std::clamp(sizes[k], min_size_, hi);
  sizes[k + 1] = s.pair_total - sizes[k];
}

bool ResizeController::end() {
  if (!session_) return false;
  session_.reset();
  return true;
}

#pragma once
/*
 * ResizeController
 *
 * Purpose: turn a pointer drag on the boundary after panel k into a size
 *          transfer between panels k and k+1 only.
 * Session: begin() creates the single drag session, end()/cancel() always
 *          destroy it; move() without a session is ignored.
 * Legacy: the legacy clamp may leave the pair off its starting total while
 *         the drag runs; settle() restores it before the session ends.
 */
#include <optional>
#include <vector>
#include "types.hpp"

struct DragSession {
  int boundary = 0;      // index of the left/upper panel
  int start_pos = 0;     // pointer coordinate along the active axis
  double start_size = 0; // size(boundary) at drag start
  double pair_total = 0; // size(boundary) + size(boundary + 1) at drag start
};

class ResizeController {
public:
  ResizeController(double min_size, ClampPolicy policy) : min_size_(min_size), policy_(policy) {}

  bool begin(int boundary, int pos, const std::vector<double>& sizes);
  bool move(int pos, int extent, std::vector<double>& sizes) const;
  void settle(std::vector<double>& sizes) const;
  bool end();
  void cancel() { session_.reset(); }

  bool active() const { return session_.has_value(); }
  const std::optional<DragSession>& session() const { return session_; }

  double min_size() const { return min_size_; }
  void set_min_size(double v) { min_size_ = v; }
  ClampPolicy policy() const { return policy_; }
  void set_policy(ClampPolicy p) { policy_ = p; }

private:
  std::optional<DragSession> session_;
  double min_size_;
  ClampPolicy policy_;
};

#include "input.hpp"

static constexpr int CTRL_w = 'W' - 64;
static constexpr size_t kMaxCount = 100000;

bool Input::consume_ctrl_w(int ch) {
  if (ch != CTRL_w) return false;
  pending_ctrl_w_ = true;
  return true;
}

bool Input::take_window_prefix() {
  bool p = pending_ctrl_w_;
  pending_ctrl_w_ = false;
  return p;
}

bool Input::consume_digit(int ch) {
  if (ch >= '1' && ch <= '9') {
    pending_count_ = pending_count_ * 10 + static_cast<size_t>(ch - '0');
    if (pending_count_ > kMaxCount) pending_count_ = kMaxCount;
    return true;
  }
  if (ch == '0' && pending_count_ > 0) {
    pending_count_ = pending_count_ * 10;
    if (pending_count_ > kMaxCount) pending_count_ = kMaxCount;
    return true;
  }
  return false;
}

size_t Input::take_count(size_t fallback) {
  size_t c = pending_count_ > 0 ? pending_count_ : fallback;
  pending_count_ = 0;
  return c;
}

void Input::reset() {
  pending_ctrl_w_ = false;
  pending_count_ = 0;
}

#pragma once
#include <cstddef>
/*
 * Input
 *
 * Purpose: key prefix state for normal mode: count prefixes ("5j") and the
 *          Ctrl-W window prefix.
 * Extend: decoupled from concrete actions; Workbench decides what a key does.
 */

class Input {
public:
  bool consume_ctrl_w(int ch);
  bool consume_digit(int ch);
  size_t take_count(size_t fallback = 1);
  bool take_window_prefix();
  void reset();
private:
  bool pending_ctrl_w_ = false;
  size_t pending_count_ = 0;
};

#include "headless_terminal.hpp"
#include <algorithm>

HeadlessTerminal::HeadlessTerminal(int rows, int cols) : rows_(0), cols_(0) { resize(rows, cols); }

void HeadlessTerminal::resize(int rows, int cols) {
  rows_ = std::max(0, rows);
  cols_ = std::max(0, cols);
  grid_.assign(rows_, std::string(cols_, ' '));
  reverse_.assign(rows_, std::vector<char>(cols_, 0));
  color_.assign(rows_, std::vector<int>(cols_, kPairDefault));
}

void HeadlessTerminal::clear() { resize(rows_, cols_); }

void HeadlessTerminal::put(int row, int col, const std::string& text, bool reverse, int pair) {
  if (row < 0 || row >= rows_) return;
  for (size_t i = 0; i < text.size(); ++i) {
    int c = col + static_cast<int>(i);
    if (c < 0) continue;
    if (c >= cols_) break; // clipped like a real terminal
    grid_[row][c] = text[i];
    reverse_[row][c] = reverse ? 1 : 0;
    color_[row][c] = pair;
  }
}

void HeadlessTerminal::draw_text(int row, int col, const std::string& text) {
  put(row, col, text, false, kPairDefault);
}

void HeadlessTerminal::draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) {
  int len = static_cast<int>(text.size());
  hl_start = std::clamp(hl_start, 0, len);
  int hl_end = std::clamp(hl_start + std::max(0, hl_len), hl_start, len);
  put(row, col, text.substr(0, hl_start), false, kPairDefault);
  put(row, col + hl_start, text.substr(hl_start, hl_end - hl_start), true, kPairDefault);
  put(row, col + hl_end, text.substr(hl_end), false, kPairDefault);
}

void HeadlessTerminal::draw_colored(int row, int col, const std::string& text, int color_pair_id) {
  put(row, col, text, false, color_pair_id);
}

void HeadlessTerminal::clear_to_eol(int row, int col) {
  if (row < 0 || row >= rows_ || col >= cols_) return;
  put(row, std::max(0, col), std::string(cols_ - std::max(0, col), ' '), false, kPairDefault);
}

bool HeadlessTerminal::contains_text(const std::string& needle) const {
  return find_row(needle) >= 0;
}

int HeadlessTerminal::find_row(const std::string& needle) const {
  for (int r = 0; r < rows_; ++r) if (grid_[r].find(needle) != std::string::npos) return r;
  return -1;
}

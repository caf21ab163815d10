#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal for tests; keeps a character grid plus a
 *          reverse-video and a color-pair grid that assertions can read.
 */
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols);

  TermSize getSize() const override { return {rows_, cols_}; }
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) override;
  void draw_colored(int row, int col, const std::string& text, int color_pair_id) override;
  void move_cursor(int row, int col) override { cursor_row_ = row; cursor_col_ = col; }
  void refresh() override { ++refresh_count_; }
  void clear_to_eol(int row, int col) override;

  void resize(int rows, int cols);
  const std::string& line(int row) const { return grid_[row]; }
  char at(int row, int col) const { return grid_[row][col]; }
  bool highlighted(int row, int col) const { return reverse_[row][col] != 0; }
  int color_at(int row, int col) const { return color_[row][col]; }
  bool contains_text(const std::string& needle) const;
  int find_row(const std::string& needle) const;
  int refresh_count() const { return refresh_count_; }
  int cursor_row() const { return cursor_row_; }
  int cursor_col() const { return cursor_col_; }

private:
  void put(int row, int col, const std::string& text, bool reverse, int pair);

  int rows_;
  int cols_;
  std::vector<std::string> grid_;
  std::vector<std::vector<char>> reverse_;
  std::vector<std::vector<int>> color_;
  int cursor_row_ = 0;
  int cursor_col_ = 0;
  int refresh_count_ = 0;
};

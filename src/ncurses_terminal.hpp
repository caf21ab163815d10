#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal implementation on stdscr, plus the key and mouse
 *          reads the workbench loop needs.
 * Note: initialization/teardown is managed by Terminal RAII wrapper; the
 *       four ColorPair ids are registered here.
 */
#include "iterminal.hpp"
#include <ncurses.h>

class NcursesTerminal : public ITerminal {
public:
  NcursesTerminal();
  TermSize getSize() const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) override;
  void draw_colored(int row, int col, const std::string& text, int color_pair_id) override;
  void move_cursor(int row, int col) override;
  void refresh() override;
  void clear_to_eol(int row, int col) override;

  int read_key() const { return getch(); }
  // false when ncurses has no pending mouse event
  bool read_mouse(MEVENT& out) const { return getmouse(&out) == OK; }
  void show_cursor(bool on);

private:
  bool cursor_visible_ = true;
};

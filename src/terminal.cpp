#include "terminal.hpp"
#include <cstdio>
#include <locale.h>

Terminal::Terminal() {
  setlocale(LC_ALL, "");
  initscr();
  raw();
  noecho();
  keypad(stdscr, TRUE);
  ESCDELAY = 25;
  mouseinterval(0); // separate press/release, no click synthesis
}

Terminal::~Terminal() {
  set_mouse(false);
  endwin();
}

void Terminal::set_mouse(bool on) {
  if (on) {
    mousemask(ALL_MOUSE_EVENTS | REPORT_MOUSE_POSITION, nullptr);
    // button-event tracking: motion is reported while a button is down
    std::printf("\033[?1002h");
  } else {
    mousemask(0, nullptr);
    std::printf("\033[?1002l");
  }
  std::fflush(stdout);
}

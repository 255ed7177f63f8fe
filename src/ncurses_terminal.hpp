#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal implementation drawing with ncurses; styles map to color pairs.
 * Note: initialization/teardown is managed by Terminal RAII wrapper.
 */
#include "iterminal.hpp"
#include <ncurses.h>

class NcursesTerminal : public ITerminal {
public:
  NcursesTerminal();
  ~NcursesTerminal();
  TermSize getSize() const override;
  void clear() override;
  void draw_text(int row, int col, std::string_view text, int max_width, int style) override;
  void refresh() override;
  void setBackground(short color);
private:
  short bg_color_ = -1; // -1: default background
};

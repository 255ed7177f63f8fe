#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract host surface the widgets paint into (size, clear, draw, refresh).
 * Goal: decouple from concrete impls (ncurses/headless/etc), enable testing.
 */
#include <string_view>
#include "types.hpp"

// opaque style ids, passed through to the backend untouched
constexpr int kStyleDefault = 0;
constexpr int kStyleBorder = 1;
constexpr int kStyleTitle = 2;
constexpr int kStyleScrollbar = 3;

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize getSize() const = 0;
  virtual void clear() = 0;
  // writes at most max_width columns of text starting at (row, col)
  virtual void draw_text(int row, int col, std::string_view text, int max_width, int style) = 0;
  virtual void refresh() = 0;
};

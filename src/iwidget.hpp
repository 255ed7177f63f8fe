#pragma once
/*
 * IWidget
 *
 * Purpose: capability set a panel child provides (natural height, paint into a rect).
 * Goal: new child kinds plug into Panel without touching the compositor.
 */
#include <string>
#include "types.hpp"
#include "iterminal.hpp"

class IWidget {
public:
  virtual ~IWidget() = default;
  // rows needed at the given width; false + msg if the widget cannot lay itself out
  virtual bool height(int width, int& out_rows, std::string& msg) const = 0;
  virtual bool render(ITerminal& term, const Rect& area, std::string& msg) const = 0;
};

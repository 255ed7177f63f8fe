#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight geometry structs (Rect/TermSize).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <algorithm>

struct TermSize { int rows; int cols; };

// cells; row/col is the top-left corner
struct Rect {
  int row = 0;
  int col = 0;
  int height = 0;
  int width = 0;

  int right() const { return col + width; }
  int bottom() const { return row + height; }
  bool empty() const { return width <= 0 || height <= 0; }
  bool operator==(const Rect&) const = default;
};

inline int saturating_sub(int a, int b) { return std::max(0, a - b); }

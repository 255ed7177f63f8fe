#include "decoration.hpp"
#include <algorithm>

static std::string repeat_glyph(std::string_view glyph, int n) {
  std::string s;
  s.reserve(glyph.size() * static_cast<size_t>(std::max(0, n)));
  for (int i = 0; i < n; ++i) s.append(glyph);
  return s;
}

TermSize decoration_min_size(const Decoration& dec) {
  int rows = dec.padding.top + dec.padding.bottom;
  int cols = dec.padding.left + dec.padding.right;
  if (has_border(dec.borders, Borders::Top)) rows++;
  if (has_border(dec.borders, Borders::Bottom)) rows++;
  if (has_border(dec.borders, Borders::Left)) cols++;
  if (has_border(dec.borders, Borders::Right)) cols++;
  if (dec.title && !has_border(dec.borders, Borders::Top)) rows++;
  return {rows, cols};
}

bool decoration_fits(const Decoration& dec, const Rect& outer) {
  TermSize min = decoration_min_size(dec);
  return outer.height >= min.rows && outer.width >= min.cols;
}

Rect decoration_inner(const Decoration& dec, const Rect& outer) {
  Rect r = outer;
  r.width = std::max(0, r.width);
  r.height = std::max(0, r.height);
  auto shrink_left = [&](int n) { int d = std::min(n, r.width); r.col += d; r.width -= d; };
  auto shrink_top = [&](int n) { int d = std::min(n, r.height); r.row += d; r.height -= d; };
  auto shrink_right = [&](int n) { r.width = saturating_sub(r.width, n); };
  auto shrink_bottom = [&](int n) { r.height = saturating_sub(r.height, n); };

  if (has_border(dec.borders, Borders::Left)) shrink_left(1);
  if (has_border(dec.borders, Borders::Top)) shrink_top(1);
  if (has_border(dec.borders, Borders::Right)) shrink_right(1);
  if (has_border(dec.borders, Borders::Bottom)) shrink_bottom(1);
  if (dec.title && !has_border(dec.borders, Borders::Top)) shrink_top(1);
  shrink_left(dec.padding.left);
  shrink_right(dec.padding.right);
  shrink_top(dec.padding.top);
  shrink_bottom(dec.padding.bottom);
  return r;
}

Rect render_decoration(ITerminal& term, const Decoration& dec, const Rect& outer) {
  if (outer.empty()) return decoration_inner(dec, outer);
  const int top = outer.row;
  const int bottom = outer.bottom() - 1;
  const int left = outer.col;
  const int right = outer.right() - 1;
  const bool bt = has_border(dec.borders, Borders::Top);
  const bool bb = has_border(dec.borders, Borders::Bottom);
  const bool bl = has_border(dec.borders, Borders::Left);
  const bool br = has_border(dec.borders, Borders::Right);

  std::string hline = repeat_glyph("─", outer.width);
  if (bt) term.draw_text(top, left, hline, outer.width, kStyleBorder);
  if (bb) term.draw_text(bottom, left, hline, outer.width, kStyleBorder);
  for (int r = top; r <= bottom; ++r) {
    if (bl) term.draw_text(r, left, "│", 1, kStyleBorder);
    if (br) term.draw_text(r, right, "│", 1, kStyleBorder);
  }
  if (bt && bl) term.draw_text(top, left, "┌", 1, kStyleBorder);
  if (bt && br) term.draw_text(top, right, "┐", 1, kStyleBorder);
  if (bb && bl) term.draw_text(bottom, left, "└", 1, kStyleBorder);
  if (bb && br) term.draw_text(bottom, right, "┘", 1, kStyleBorder);

  if (dec.title && !dec.title->empty()) {
    int col = left + (bl ? 1 : 0);
    int room = outer.width - (bl ? 1 : 0) - (br ? 1 : 0);
    if (room > 0) term.draw_text(top, col, *dec.title, room, kStyleTitle);
  }
  return decoration_inner(dec, outer);
}

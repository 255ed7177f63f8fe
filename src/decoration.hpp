#pragma once
/*
 * Decoration
 *
 * Purpose: border/title/padding box around a panel and its inner rect.
 * Constraint: geometry saturates at zero; an outer rect below the minimum
 * size is reported by decoration_fits() and never painted.
 */
#include <optional>
#include <string>
#include "types.hpp"
#include "iterminal.hpp"

enum class Borders : unsigned {
  None = 0,
  Top = 1u << 0,
  Right = 1u << 1,
  Bottom = 1u << 2,
  Left = 1u << 3,
  All = 0xFu,
};

inline Borders operator|(Borders a, Borders b) {
  return static_cast<Borders>(static_cast<unsigned>(a) | static_cast<unsigned>(b));
}
inline bool has_border(Borders set, Borders side) {
  return (static_cast<unsigned>(set) & static_cast<unsigned>(side)) != 0;
}

struct Padding {
  int left = 0;
  int right = 0;
  int top = 0;
  int bottom = 0;

  static Padding uniform(int n) { return {n, n, n, n}; }
  static Padding symmetric(int horizontal, int vertical) { return {horizontal, horizontal, vertical, vertical}; }
  bool operator==(const Padding&) const = default;
};

struct Decoration {
  std::optional<std::string> title;
  Borders borders = Borders::All;
  Padding padding{};
};

TermSize decoration_min_size(const Decoration& dec);
bool decoration_fits(const Decoration& dec, const Rect& outer);
Rect decoration_inner(const Decoration& dec, const Rect& outer);
// paints borders and title; returns the inner rect
Rect render_decoration(ITerminal& term, const Decoration& dec, const Rect& outer);

#include "text_block.hpp"
#include <utility>
#include "log.hpp"
#include "utf8.hpp"

static constexpr std::string_view kEllipsis = "...";

TextBlock::TextBlock(std::string text, WrapPolicy wrap) : text_(std::move(text)), wrap_(wrap) {}

bool TextBlock::lines(int width, std::vector<Line>& out, std::string& msg) const {
  return compute_lines(text_, width, wrap_, out, msg);
}

bool TextBlock::height(int width, int& out_rows, std::string& msg) const {
  return compute_height(text_, width, wrap_, out_rows, msg);
}

bool TextBlock::render(ITerminal& term, const Rect& area, std::string& msg) const {
  std::vector<Line> ls;
  if (!lines(area.width, ls, msg)) return false;
  if (area.empty()) return true;
  PK_LOG_TRACE("text render at ({}, {}) {}x{}: {} lines", area.row, area.col, area.width, area.height, ls.size());

  if (wrap_ == WrapPolicy::TruncateEllipsis && !ls.empty() &&
      ls[0].size() == static_cast<size_t>(area.width)) {
    size_t cut = floor_char_boundary(ls[0], saturating_sub(area.width, static_cast<int>(kEllipsis.size())));
    Line kept = ls[0].substr(0, cut);
    int keep = utf8_columns(kept);
    term.draw_text(area.row, area.col, kept, keep, kStyleDefault);
    term.draw_text(area.row, area.col + keep, kEllipsis, area.width - keep, kStyleDefault);
    return true;
  }

  for (size_t i = 0; i < ls.size(); ++i) {
    int row = area.row + static_cast<int>(i);
    if (row >= area.bottom()) break;
    term.draw_text(row, area.col, ls[i], area.width, kStyleDefault);
  }
  return true;
}

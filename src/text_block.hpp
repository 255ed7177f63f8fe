#pragma once
/*
 * TextBlock
 *
 * Purpose: immutable text widget; truncates or wraps to the width it is given.
 * Note: layout is recomputed on every height/render query, nothing is cached.
 * Ellipsis: TruncateEllipsis paints "..." over the last 3 columns only when the
 * truncated line fills the area width exactly.
 */
#include <string>
#include <vector>
#include "iwidget.hpp"
#include "text_layout.hpp"

class TextBlock : public IWidget {
public:
  explicit TextBlock(std::string text, WrapPolicy wrap = WrapPolicy::WrapWords);

  const std::string& text() const { return text_; }
  WrapPolicy wrap() const { return wrap_; }

  bool lines(int width, std::vector<Line>& out, std::string& msg) const;
  bool height(int width, int& out_rows, std::string& msg) const override;
  bool render(ITerminal& term, const Rect& area, std::string& msg) const override;

private:
  std::string text_;
  WrapPolicy wrap_;
};

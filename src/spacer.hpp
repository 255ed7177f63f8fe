#pragma once
/*
 * Spacer
 *
 * Purpose: fixed-height blank child; paints nothing, only occupies rows.
 */
#include "iwidget.hpp"

class Spacer : public IWidget {
public:
  explicit Spacer(int rows) : rows_(rows < 0 ? 0 : rows) {}

  int rows() const { return rows_; }
  bool height(int, int& out_rows, std::string&) const override { out_rows = rows_; return true; }
  bool render(ITerminal&, const Rect&, std::string&) const override { return true; }

private:
  int rows_;
};

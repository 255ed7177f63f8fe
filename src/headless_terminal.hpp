#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal (cell grid) for automated tests and render checks.
 * Model: one UTF-8 code point per column; writes outside the grid are dropped.
 */
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols);

  TermSize getSize() const override;
  void clear() override;
  void draw_text(int row, int col, std::string_view text, int max_width, int style) override;
  void refresh() override;

  const std::string& cell(int row, int col) const;
  int style_at(int row, int col) const;
  // row contents with trailing blanks kept
  std::string row_text(int row) const;
  std::vector<std::string> lines() const;
  int draw_calls() const { return draw_calls_; }
  int refresh_count() const { return refresh_count_; }

private:
  int index(int row, int col) const { return row * cols_ + col; }

  int rows_;
  int cols_;
  std::vector<std::string> cells_;
  std::vector<int> styles_;
  int draw_calls_ = 0;
  int refresh_count_ = 0;
};

#include "headless_terminal.hpp"
#include <algorithm>
#include "utf8.hpp"

static const std::string kBlank = " ";

HeadlessTerminal::HeadlessTerminal(int rows, int cols)
    : rows_(std::max(0, rows)), cols_(std::max(0, cols)),
      cells_(static_cast<size_t>(rows_) * cols_, kBlank),
      styles_(static_cast<size_t>(rows_) * cols_, kStyleDefault) {}

TermSize HeadlessTerminal::getSize() const { return {rows_, cols_}; }

void HeadlessTerminal::clear() {
  std::fill(cells_.begin(), cells_.end(), kBlank);
  std::fill(styles_.begin(), styles_.end(), kStyleDefault);
}

void HeadlessTerminal::draw_text(int row, int col, std::string_view text, int max_width, int style) {
  draw_calls_++;
  if (row < 0 || row >= rows_) return;
  size_t i = 0;
  int written = 0;
  while (i < text.size() && written < max_width) {
    if (is_control_byte(static_cast<unsigned char>(text[i]))) { i++; continue; }
    size_t n = std::min(utf8_seq_len(static_cast<unsigned char>(text[i])), text.size() - i);
    int c = col + written;
    if (c >= cols_) break;
    if (c >= 0) {
      cells_[index(row, c)] = std::string(text.substr(i, n));
      styles_[index(row, c)] = style;
    }
    i += n;
    written++;
  }
}

void HeadlessTerminal::refresh() { refresh_count_++; }

const std::string& HeadlessTerminal::cell(int row, int col) const {
  if (row < 0 || row >= rows_ || col < 0 || col >= cols_) return kBlank;
  return cells_[index(row, col)];
}

int HeadlessTerminal::style_at(int row, int col) const {
  if (row < 0 || row >= rows_ || col < 0 || col >= cols_) return kStyleDefault;
  return styles_[index(row, col)];
}

std::string HeadlessTerminal::row_text(int row) const {
  std::string s;
  if (row < 0 || row >= rows_) return s;
  for (int c = 0; c < cols_; ++c) s += cells_[index(row, c)];
  return s;
}

std::vector<std::string> HeadlessTerminal::lines() const {
  std::vector<std::string> out;
  out.reserve(rows_);
  for (int r = 0; r < rows_; ++r) out.push_back(row_text(r));
  return out;
}

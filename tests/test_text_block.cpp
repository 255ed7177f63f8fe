#include "text_block.hpp"
#include "headless_terminal.hpp"
#include <cassert>
#include <string>

static std::string pad(const std::string& s, int width) {
  return s + std::string(static_cast<size_t>(width) - s.size(), ' ');
}

static void test_fits_exactly() {
  HeadlessTerminal term(1, 13);
  TextBlock text("Hello, world!");
  std::string msg;
  assert(text.wrap() == WrapPolicy::WrapWords);
  assert(text.render(term, Rect{0, 0, 1, 13}, msg));
  assert(term.row_text(0) == "Hello, world!");
}

static void test_truncate_render() {
  HeadlessTerminal term(3, 40);
  TextBlock text("Let's not wrap this text even though it's plenty long enough to do so.", WrapPolicy::Truncate);
  std::string msg;
  assert(text.render(term, Rect{0, 0, 3, 40}, msg));
  assert(term.row_text(0) == "Let's not wrap this text even though it'");
  assert(term.row_text(1) == std::string(40, ' '));
  assert(term.row_text(2) == std::string(40, ' '));
}

static void test_ellipsis_render() {
  HeadlessTerminal term(3, 40);
  TextBlock text("Let's not wrap this text even though it's plenty long enough to do so.", WrapPolicy::TruncateEllipsis);
  std::string msg;
  assert(text.render(term, Rect{0, 0, 3, 40}, msg));
  assert(term.row_text(0) == "Let's not wrap this text even though ...");
  assert(term.row_text(1) == std::string(40, ' '));
}

static void test_ellipsis_only_when_full() {
  std::string msg;
  {
    HeadlessTerminal term(1, 10);
    TextBlock text("short", WrapPolicy::TruncateEllipsis);
    assert(text.render(term, Rect{0, 0, 1, 10}, msg));
    assert(term.row_text(0) == pad("short", 10));
  }
  {
    // fits exactly, so it is indistinguishable from a cut line
    HeadlessTerminal term(1, 6);
    TextBlock text("abcdef", WrapPolicy::TruncateEllipsis);
    assert(text.render(term, Rect{0, 0, 1, 6}, msg));
    assert(term.row_text(0) == "abc...");
  }
  {
    HeadlessTerminal term(1, 4);
    TextBlock text("abcdef", WrapPolicy::TruncateEllipsis);
    assert(text.render(term, Rect{0, 0, 1, 2}, msg));
    assert(term.row_text(0) == "..  ");
  }
}

static void test_control_bytes_not_painted() {
  std::string msg;
  {
    HeadlessTerminal term(1, 8);
    TextBlock text("ab\ncd", WrapPolicy::Truncate);
    assert(text.render(term, Rect{0, 0, 1, 8}, msg));
    assert(term.row_text(0) == "abcd    ");
  }
  {
    HeadlessTerminal term(1, 5);
    TextBlock text("ab\ncdef", WrapPolicy::TruncateEllipsis);
    assert(text.render(term, Rect{0, 0, 1, 5}, msg));
    assert(term.row_text(0) == "ab...");
  }
}

static void test_ellipsis_keeps_characters_whole() {
  std::string msg;
  {
    // the cut at byte 2 would land inside the two-byte e-acute
    HeadlessTerminal term(1, 5);
    TextBlock text("a\xC3\xA9" "bcd", WrapPolicy::TruncateEllipsis);
    assert(text.render(term, Rect{0, 0, 1, 5}, msg));
    assert(term.cell(0, 0) == "a");
    assert(term.cell(0, 1) == ".");
    assert(term.row_text(0) == "a... ");
  }
  {
    HeadlessTerminal term(1, 7);
    TextBlock text("\xC3\xA9\xC3\xA9" "xyzw", WrapPolicy::TruncateEllipsis);
    assert(text.render(term, Rect{0, 0, 1, 7}, msg));
    assert(term.cell(0, 1) == "\xC3\xA9");
    assert(term.row_text(0) == "\xC3\xA9\xC3\xA9...  ");
  }
}

static void test_wrap_clipped_to_area() {
  HeadlessTerminal term(4, 20);
  TextBlock text("String that is longer than the 40 characters of the rectangle.");
  std::string msg;
  int h = 0;
  assert(text.height(20, h, msg));
  assert(h == 4);
  assert(text.render(term, Rect{1, 2, 2, 18}, msg));
  assert(term.row_text(0) == std::string(20, ' '));
  assert(term.row_text(1) == pad("  String that is", 20));
  assert(term.row_text(2) == pad("  longer than the 40", 20));
  assert(term.row_text(3) == std::string(20, ' '));
}

static void test_wrap_exact_newline_render() {
  HeadlessTerminal term(3, 40);
  TextBlock text("Let's wrap this text that is long enough to do so.\nAnd it has a newline.", WrapPolicy::WrapExact);
  std::string msg;
  assert(text.render(term, Rect{0, 0, 3, 40}, msg));
  assert(term.row_text(0) == "Let's wrap this text that is long enough");
  assert(term.row_text(1) == pad(" to do so.", 40));
  assert(term.row_text(2) == pad("And it has a newline.", 40));
}

static void test_empty_area() {
  HeadlessTerminal term(2, 10);
  TextBlock text("anything", WrapPolicy::TruncateEllipsis);
  std::string msg;
  assert(text.render(term, Rect{0, 0, 0, 10}, msg));
  assert(text.render(term, Rect{0, 0, 2, 0}, msg));
  assert(term.draw_calls() == 0);
}

static void test_reserved_policy_render() {
  HeadlessTerminal term(2, 10);
  TextBlock text("centered?", WrapPolicy::WrapCentered);
  std::string msg;
  int h = 0;
  assert(!text.height(10, h, msg));
  msg.clear();
  assert(!text.render(term, Rect{0, 0, 2, 10}, msg));
  assert(msg.find("centered") != std::string::npos);
  assert(term.draw_calls() == 0);
}

int main() {
  test_fits_exactly();
  test_truncate_render();
  test_ellipsis_render();
  test_ellipsis_only_when_full();
  test_control_bytes_not_painted();
  test_ellipsis_keeps_characters_whole();
  test_wrap_clipped_to_area();
  test_wrap_exact_newline_render();
  test_empty_area();
  test_reserved_policy_render();
  return 0;
}

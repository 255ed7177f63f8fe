#include "panel_script.hpp"
#include "headless_terminal.hpp"
#include "text_block.hpp"
#include "spacer.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

static void test_apply_full_script() {
  std::vector<std::string> lines = {
    "# demo panel",
    "title Panel Test",
    "padding 0",
    "",
    "   text words Hello 1!",
    "text exact two\\nlines",
    "spacer 2",
    "text ellipsis   keeps  inner  spacing",
    "scrollbar off",
  };
  PanelBuilder b;
  std::string msg;
  assert(apply_panel_script(lines, b, "demo", msg));
  Panel p = b.build();
  assert(p.decoration() && p.decoration()->title == std::string("Panel Test"));
  assert(p.decoration()->padding == Padding::uniform(0));
  assert(!p.show_scrollbar());
  assert(p.child_count() == 4);

  auto* t0 = dynamic_cast<const TextBlock*>(&p.child(0));
  assert(t0 && t0->text() == "Hello 1!" && t0->wrap() == WrapPolicy::WrapWords);
  auto* t1 = dynamic_cast<const TextBlock*>(&p.child(1));
  assert(t1 && t1->text() == "two\nlines" && t1->wrap() == WrapPolicy::WrapExact);
  auto* sp = dynamic_cast<const Spacer*>(&p.child(2));
  assert(sp && sp->rows() == 2);
  auto* t3 = dynamic_cast<const TextBlock*>(&p.child(3));
  assert(t3 && t3->text() == "keeps  inner  spacing" && t3->wrap() == WrapPolicy::TruncateEllipsis);

  HeadlessTerminal term(8, 20);
  assert(p.render(term, Rect{0, 0, 8, 20}, msg));
  assert(term.row_text(1) == "│Hello 1!          │");
  assert(term.row_text(2) == "│two               │");
  assert(term.row_text(3) == "│lines             │");
  assert(term.row_text(6) == "│keeps  inner  s...│");
}

static void test_borders_and_padding_forms() {
  PanelBuilder b;
  std::string msg;
  assert(apply_panel_script({"borders top left", "padding 1 2 3 4"}, b, "x", msg));
  Panel p = b.build();
  assert(p.decoration());
  assert(!p.decoration()->title);
  assert(p.decoration()->borders == (Borders::Top | Borders::Left));
  assert((p.decoration()->padding == Padding{1, 2, 3, 4}));

  PanelBuilder b2;
  assert(apply_panel_script({"borders none", "padding 3 1"}, b2, "x", msg));
  Panel p2 = b2.build();
  assert(p2.decoration()->borders == Borders::None);
  assert(p2.decoration()->padding == Padding::symmetric(3, 1));
}

static void test_errors_name_the_line() {
  struct Case { std::vector<std::string> lines; std::string expect; };
  const std::vector<Case> cases = {
    {{"title ok", "bogus thing"}, "cfg:2: unknown command 'bogus'"},
    {{"text sideways hi"}, "cfg:1: unknown wrap policy 'sideways'"},
    {{"# c", "", "padding 1 2 3"}, "cfg:3: padding takes 1, 2 or 4 values"},
    {{"padding -1"}, "cfg:1: bad padding '-1'"},
    {{"scrollbar maybe"}, "cfg:1: scrollbar takes on|off"},
    {{"spacer x"}, "cfg:1: spacer takes a row count"},
    {{"borders diagonal"}, "cfg:1: bad border 'diagonal'"},
    {{"title"}, "cfg:1: title needs text"},
    {{"text"}, "cfg:1: text needs a wrap policy"},
  };
  for (const auto& c : cases) {
    PanelBuilder b;
    std::string msg;
    assert(!apply_panel_script(c.lines, b, "cfg", msg));
    assert(msg == c.expect);
  }
}

static void test_reserved_policy_loads_but_fails_render() {
  PanelBuilder b;
  std::string msg;
  assert(apply_panel_script({"text right aligned?"}, b, "cfg", msg));
  Panel p = b.build();
  HeadlessTerminal term(4, 10);
  assert(!p.render(term, Rect{0, 0, 4, 10}, msg));
  assert(msg.find("not implemented") != std::string::npos);
}

static void test_load_from_file() {
  auto dir = std::filesystem::temp_directory_path();
  auto path = dir / "panelkit_script_test.rc";
  {
    std::ofstream out(path, std::ios::binary);
    out << "title From File\r\n" << "text words hello\r\n" << "spacer 1";
  }
  PanelBuilder b;
  std::string msg;
  assert(load_panel_script(path, b, msg));
  Panel p = b.build();
  assert(p.decoration()->title == std::string("From File"));
  assert(p.child_count() == 2);
  auto* t = dynamic_cast<const TextBlock*>(&p.child(0));
  assert(t && t->text() == "hello");
  std::filesystem::remove(path);

  PanelBuilder missing;
  msg.clear();
  assert(!load_panel_script(dir / "panelkit_no_such_script.rc", missing, msg));
  assert(msg.find("can not open file") != std::string::npos);
}

int main() {
  test_apply_full_script();
  test_borders_and_padding_forms();
  test_errors_name_the_line();
  test_reserved_policy_loads_but_fails_render();
  test_load_from_file();
  return 0;
}

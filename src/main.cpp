#include "terminal.hpp"
#include "ncurses_terminal.hpp"
#include "panel.hpp"
#include "panel_script.hpp"
#include "config.hpp"
#include "log.hpp"
#include <cstdlib>
#include <optional>
#include <filesystem>
#include <string>

static void sample_panel(PanelBuilder& b) {
  b.title("panelkit " PK_VERSION)
   .add_text("Press q to quit. Resize the terminal to see the layout reflow.")
   .add_spacer(1)
   .add_text("Truncated: this line never wraps, however narrow the panel becomes.", WrapPolicy::Truncate)
   .add_text("Ellipsis: this line never wraps either, and ends in dots when it is cut.", WrapPolicy::TruncateEllipsis)
   .add_text("Exact: fixed width slices ignore word boundaries entirely.\nA newline ends the slice early.", WrapPolicy::WrapExact)
   .add_text("Words: greedy word wrapping packs as many whole words on each row as will fit, "
             "and hard breaks words longer than the row.");
}

static void setup_logging() {
  if (const char* lvl = std::getenv(PK_LOG_LEVEL_ENV)) {
    LogLevel l;
    if (parse_log_level(lvl, l)) set_log_level(l);
  }
  const char* file = std::getenv(PK_LOG_ENV);
  std::string msg;
  // the screen belongs to ncurses, stderr output would corrupt it
  if (!file || !log_to_file(file, msg)) set_log_level(LogLevel::Off);
}

static std::optional<std::filesystem::path> script_path(int argc, char** argv) {
  if (argc >= 2) return std::filesystem::path(argv[1]);
  const char* home = std::getenv("HOME");
  if (!home) return std::nullopt;
  std::error_code ec;
  auto p = std::filesystem::path(home) / PK_RC_NAME;
  if (!std::filesystem::exists(p, ec)) return std::nullopt;
  return p;
}

int main(int argc, char** argv) {
  setup_logging();
  PanelBuilder builder;
  std::string message;
  auto path = script_path(argc, argv);
  if (path) {
    if (!load_panel_script(*path, builder, message)) builder = PanelBuilder();
  }
  if (!path || !message.empty()) sample_panel(builder);
  Panel panel = builder.build();

  Terminal guard;
  NcursesTerminal term;
  for (;;) {
    TermSize sz = term.getSize();
    term.clear();
    int panel_rows = message.empty() ? sz.rows : sz.rows - 1;
    std::string err;
    if (!panel.render(term, Rect{0, 0, panel_rows, sz.cols}, err)) message = err;
    if (!message.empty()) term.draw_text(sz.rows - 1, 0, message, sz.cols, kStyleDefault);
    term.refresh();
    int ch = getch();
    if (ch == 'q' || ch == 'Q') break;
  }
  return 0;
}

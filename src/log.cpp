#include "log.hpp"
#include <cstdio>

static LogLevel g_level = LogLevel::Warn;
static std::FILE* g_sink = nullptr; // nullptr: stderr

static const char* level_tag(LogLevel level) {
  switch (level) {
    case LogLevel::Trace: return "trace";
    case LogLevel::Debug: return "debug";
    case LogLevel::Info: return "info";
    case LogLevel::Warn: return "warn";
    case LogLevel::Error: return "error";
    case LogLevel::Off: break;
  }
  return "off";
}

void set_log_level(LogLevel level) { g_level = level; }
LogLevel log_level() { return g_level; }

bool log_enabled(LogLevel level) {
  return level != LogLevel::Off && static_cast<int>(level) >= static_cast<int>(g_level);
}

bool parse_log_level(std::string_view name, LogLevel& out) {
  for (LogLevel l : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Warn, LogLevel::Error, LogLevel::Off}) {
    if (name == level_tag(l)) { out = l; return true; }
  }
  return false;
}

bool log_to_file(const std::filesystem::path& path, std::string& msg) {
  std::FILE* f = std::fopen(path.string().c_str(), "a");
  if (!f) { msg = std::string("can not open log file: ") + path.string(); return false; }
  if (g_sink) std::fclose(g_sink);
  g_sink = f;
  return true;
}

void log_to_stderr() {
  if (g_sink) std::fclose(g_sink);
  g_sink = nullptr;
}

void log_write(LogLevel level, std::string_view text) {
  std::FILE* out = g_sink ? g_sink : stderr;
  fmt::print(out, "[panelkit {}] {}\n", level_tag(level), text);
  std::fflush(out);
}

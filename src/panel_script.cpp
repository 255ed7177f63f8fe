#include "panel_script.hpp"
#include <cctype>
#include <charconv>
#include "cmd_registry.hpp"
#include "file_reader.hpp"
#include "log.hpp"

static inline bool is_space(unsigned char c) { return std::isspace(c) != 0; }

static std::string trim(const std::string& s) {
  size_t i = 0; while (i < s.size() && is_space((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && is_space((unsigned char)s[j-1])) j--;
  return s.substr(i, j - i);
}

static std::vector<std::string> split_words(const std::string& s) {
  std::vector<std::string> out;
  size_t i = 0;
  while (i < s.size()) {
    while (i < s.size() && is_space((unsigned char)s[i])) i++;
    size_t st = i;
    while (i < s.size() && !is_space((unsigned char)s[i])) i++;
    if (i > st) out.emplace_back(s.substr(st, i - st));
  }
  return out;
}

// text after the first n words, leading blanks dropped
static std::string rest_after_words(const std::string& s, int n) {
  size_t i = 0;
  for (int w = 0; w < n; ++w) {
    while (i < s.size() && is_space((unsigned char)s[i])) i++;
    while (i < s.size() && !is_space((unsigned char)s[i])) i++;
  }
  while (i < s.size() && is_space((unsigned char)s[i])) i++;
  return s.substr(i);
}

static std::string unescape(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '\\' && i + 1 < s.size()) {
      if (s[i+1] == 'n') { out.push_back('\n'); i++; continue; }
      if (s[i+1] == '\\') { out.push_back('\\'); i++; continue; }
    }
    out.push_back(s[i]);
  }
  return out;
}

static bool parse_count(const std::string& s, int& out) {
  auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc() && p == s.data() + s.size() && out >= 0;
}

static bool parse_border(const std::string& s, Borders& out) {
  if (s == "all") { out = Borders::All; return true; }
  if (s == "none") { out = Borders::None; return true; }
  if (s == "top") { out = Borders::Top; return true; }
  if (s == "bottom") { out = Borders::Bottom; return true; }
  if (s == "left") { out = Borders::Left; return true; }
  if (s == "right") { out = Borders::Right; return true; }
  return false;
}

static void register_script_commands(CommandRegistry& reg, PanelBuilder& b, const std::string& line) {
  reg.register_command("title", [&](const std::vector<std::string>& args, std::string& msg) {
    if (args.empty()) { msg = "title needs text"; return false; }
    b.title(unescape(rest_after_words(line, 1)));
    return true;
  });
  reg.register_command("borders", [&](const std::vector<std::string>& args, std::string& msg) {
    if (args.empty()) { msg = "borders needs at least one side"; return false; }
    Borders set = Borders::None;
    for (const auto& a : args) {
      Borders side;
      if (!parse_border(a, side)) { msg = "bad border '" + a + "'"; return false; }
      set = set | side;
    }
    b.borders(set);
    return true;
  });
  reg.register_command("padding", [&](const std::vector<std::string>& args, std::string& msg) {
    std::vector<int> v;
    for (const auto& a : args) {
      int n = 0;
      if (!parse_count(a, n)) { msg = "bad padding '" + a + "'"; return false; }
      v.push_back(n);
    }
    if (v.size() == 1) b.padding(Padding::uniform(v[0]));
    else if (v.size() == 2) b.padding(Padding::symmetric(v[0], v[1]));
    else if (v.size() == 4) b.padding(Padding{v[0], v[1], v[2], v[3]});
    else { msg = "padding takes 1, 2 or 4 values"; return false; }
    return true;
  });
  reg.register_command("scrollbar", [&](const std::vector<std::string>& args, std::string& msg) {
    if (args.size() != 1 || (args[0] != "on" && args[0] != "off")) { msg = "scrollbar takes on|off"; return false; }
    b.scrollbar(args[0] == "on");
    return true;
  });
  reg.register_command("spacer", [&](const std::vector<std::string>& args, std::string& msg) {
    int n = 0;
    if (args.size() != 1 || !parse_count(args[0], n)) { msg = "spacer takes a row count"; return false; }
    b.add_spacer(n);
    return true;
  });
  reg.register_command("text", [&](const std::vector<std::string>& args, std::string& msg) {
    if (args.empty()) { msg = "text needs a wrap policy"; return false; }
    WrapPolicy wrap;
    if (!parse_policy(args[0], wrap)) { msg = "unknown wrap policy '" + args[0] + "'"; return false; }
    b.add_text(unescape(rest_after_words(line, 2)), wrap);
    return true;
  });
}

bool apply_panel_script(const std::vector<std::string>& lines, PanelBuilder& builder,
                        const std::string& origin, std::string& msg) {
  std::string current;
  CommandRegistry reg;
  register_script_commands(reg, builder, current);
  for (size_t i = 0; i < lines.size(); ++i) {
    std::string s = trim(lines[i]);
    if (s.empty() || s[0] == '#') continue;
    current = s;
    std::vector<std::string> words = split_words(s);
    std::string name = words.front();
    words.erase(words.begin());
    std::string err;
    if (!reg.execute(name, words, err)) {
      msg = origin + ":" + std::to_string(i + 1) + ": " + err;
      PK_LOG_WARN("{}", msg);
      return false;
    }
  }
  return true;
}

bool load_panel_script(const std::filesystem::path& path, PanelBuilder& builder, std::string& msg) {
  std::vector<std::string> lines;
  if (!mmap_readlines(path, lines, msg)) return false;
  PK_LOG_INFO("loading panel script {} ({} lines)", path.string(), lines.size());
  return apply_panel_script(lines, builder, path.string(), msg);
}

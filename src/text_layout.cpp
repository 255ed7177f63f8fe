#include "text_layout.hpp"
#include <algorithm>
#include "utf8.hpp"
#include "log.hpp"

struct PolicyEntry {
  WrapPolicy policy;
  const char* name;
  bool implemented;
};

static constexpr PolicyEntry kPolicies[] = {
  {WrapPolicy::Truncate, "truncate", true},
  {WrapPolicy::TruncateEllipsis, "ellipsis", true},
  {WrapPolicy::WrapExact, "exact", true},
  {WrapPolicy::WrapWords, "words", true},
  {WrapPolicy::WrapJustified, "justified", false},
  {WrapPolicy::WrapCentered, "centered", false},
  {WrapPolicy::WrapRightAligned, "right", false},
};

const char* policy_name(WrapPolicy policy) {
  for (const auto& e : kPolicies) if (e.policy == policy) return e.name;
  return "unknown";
}

bool parse_policy(std::string_view name, WrapPolicy& out) {
  for (const auto& e : kPolicies) {
    if (name == e.name) { out = e.policy; return true; }
  }
  return false;
}

bool is_policy_implemented(WrapPolicy policy) {
  for (const auto& e : kPolicies) if (e.policy == policy) return e.implemented;
  return false;
}

// end of the window of up to width bytes at pos, snapped to a char boundary;
// always > pos while pos < text.size()
static size_t window_end(std::string_view text, size_t pos, size_t width) {
  size_t end = floor_char_boundary(text, std::min(text.size(), pos + width));
  if (end <= pos) end = ceil_char_boundary(text, pos + 1);
  return end;
}

static void lines_truncate(std::string_view text, size_t width, std::vector<Line>& out) {
  size_t end = floor_char_boundary(text, std::min(text.size(), width));
  out.push_back(text.substr(0, end));
}

static void lines_wrap_exact(std::string_view text, size_t width, std::vector<Line>& out) {
  size_t pos = 0;
  while (pos < text.size()) {
    size_t end = window_end(text, pos, width);
    std::string_view window = text.substr(pos, end - pos);
    size_t nl = window.find('\n');
    if (nl != std::string_view::npos) {
      out.push_back(window.substr(0, nl));
      pos += nl + 1;
      continue;
    }
    out.push_back(window);
    pos = end;
  }
}

static void lines_wrap_words(std::string_view text, size_t width, std::vector<Line>& out) {
  const size_t n = text.size();
  size_t pos = 0;
  while (pos < n) {
    size_t end = window_end(text, pos, width);
    std::string_view window = text.substr(pos, end - pos);
    size_t nl = window.find('\n');
    if (nl != std::string_view::npos) {
      out.push_back(window.substr(0, nl));
      pos += nl + 1;
      continue;
    }
    size_t to = end;
    if (end != n && text[end] != ' ') {
      size_t sp = window.rfind(' ');
      if (sp != std::string_view::npos) to = pos + sp;
    }
    out.push_back(text.substr(pos, to - pos));
    pos = to;
    while (pos < n && text[pos] == ' ') pos++;
  }
}

bool compute_lines(std::string_view text, int width, WrapPolicy policy,
                   std::vector<Line>& out, std::string& msg) {
  out.clear();
  if (!is_policy_implemented(policy)) {
    msg = std::string("wrap policy '") + policy_name(policy) + "' is not implemented";
    PK_LOG_ERROR("{}", msg);
    return false;
  }
  bool truncating = policy == WrapPolicy::Truncate || policy == WrapPolicy::TruncateEllipsis;
  if (width <= 0) {
    if (truncating) out.push_back(text.substr(0, 0));
    PK_LOG_DEBUG("degenerate width {} for policy {}", width, policy_name(policy));
    return true;
  }
  size_t w = static_cast<size_t>(width);
  switch (policy) {
    case WrapPolicy::Truncate:
    case WrapPolicy::TruncateEllipsis:
      lines_truncate(text, w, out);
      break;
    case WrapPolicy::WrapExact:
      lines_wrap_exact(text, w, out);
      break;
    case WrapPolicy::WrapWords:
      lines_wrap_words(text, w, out);
      break;
    default:
      break;
  }
  PK_LOG_TRACE("layout {} bytes at width {} ({}): {} lines", text.size(), width, policy_name(policy), out.size());
  return true;
}

bool compute_height(std::string_view text, int width, WrapPolicy policy,
                    int& out_height, std::string& msg) {
  std::vector<Line> lines;
  if (!compute_lines(text, width, policy, lines, msg)) return false;
  out_height = static_cast<int>(lines.size());
  return true;
}

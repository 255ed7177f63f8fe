#pragma once
/*
 * TextLayout
 *
 * Purpose: split a string into display lines for a given width under a wrap policy.
 * Design: lines are string_views into the caller's text; no copies, no cached state.
 * Errors: reserved policies return false with msg; nothing falls back silently.
 */
#include <string>
#include <string_view>
#include <vector>

enum class WrapPolicy {
  Truncate,
  TruncateEllipsis,
  WrapExact,
  WrapWords,
  WrapJustified,
  WrapCentered,
  WrapRightAligned,
};

// one display row; views the source text, so it must not outlive it
using Line = std::string_view;

const char* policy_name(WrapPolicy policy);
bool parse_policy(std::string_view name, WrapPolicy& out);
bool is_policy_implemented(WrapPolicy policy);

// width counts bytes. width <= 0: truncation yields one empty line, wrapping yields none.
bool compute_lines(std::string_view text, int width, WrapPolicy policy,
                   std::vector<Line>& out, std::string& msg);
bool compute_height(std::string_view text, int width, WrapPolicy policy,
                    int& out_height, std::string& msg);

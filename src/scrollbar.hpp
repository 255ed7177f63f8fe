#pragma once
/*
 * Scrollbar
 *
 * Purpose: derived scroll metrics and a vertical scroll indicator.
 * Note: scroll_offset is always 0 for panels; there is no live scrolling.
 */
#include <string>
#include "types.hpp"
#include "iterminal.hpp"

struct ScrollState {
  int content_height = 0;
  int viewport_height = 0;
  int scroll_offset = 0;

  int thumb_size() const { return saturating_sub(content_height, viewport_height); }
};

struct ScrollbarGlyphs {
  std::string begin = "↑";
  std::string end = "↓";
  std::string track = "║";
  std::string thumb = "█";
};

// cells between the begin/end glyphs; 0 means nothing is drawn
int scrollbar_track_length(const Rect& area);
// draws in the rightmost column of area
void render_scrollbar(ITerminal& term, const Rect& area, const ScrollState& state, const ScrollbarGlyphs& glyphs);

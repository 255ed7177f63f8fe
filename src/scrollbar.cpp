#include "scrollbar.hpp"
#include <algorithm>
#include "log.hpp"

int scrollbar_track_length(const Rect& area) {
  if (area.width <= 0) return 0;
  return saturating_sub(area.height, 2);
}

void render_scrollbar(ITerminal& term, const Rect& area, const ScrollState& state, const ScrollbarGlyphs& glyphs) {
  int track = scrollbar_track_length(area);
  if (track == 0) return;
  const int col = area.right() - 1;
  const int first = area.row + 1;
  term.draw_text(area.row, col, glyphs.begin, 1, kStyleScrollbar);
  for (int i = 0; i < track; ++i) term.draw_text(first + i, col, glyphs.track, 1, kStyleScrollbar);
  term.draw_text(area.bottom() - 1, col, glyphs.end, 1, kStyleScrollbar);

  int start = std::clamp(state.scroll_offset, 0, track);
  int thumb = std::min(state.thumb_size(), track - start);
  for (int i = 0; i < thumb; ++i) term.draw_text(first + start + i, col, glyphs.thumb, 1, kStyleScrollbar);
  PK_LOG_TRACE("scrollbar col {} track {} content {} viewport {} thumb {}",
               col, track, state.content_height, state.viewport_height, thumb);
}

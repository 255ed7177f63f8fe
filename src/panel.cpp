#include "panel.hpp"
#include <algorithm>
#include <utility>
#include "config.hpp"
#include "log.hpp"
#include "spacer.hpp"
#include "text_block.hpp"

PanelBuilder& PanelBuilder::title(std::string t) { title_ = std::move(t); return *this; }
PanelBuilder& PanelBuilder::borders(Borders b) { borders_ = b; return *this; }
PanelBuilder& PanelBuilder::padding(Padding p) { padding_ = p; return *this; }
PanelBuilder& PanelBuilder::scrollbar(bool on) { scrollbar_ = on; return *this; }
PanelBuilder& PanelBuilder::glyphs(ScrollbarGlyphs g) { glyphs_ = std::move(g); return *this; }

PanelBuilder& PanelBuilder::add_child(std::unique_ptr<IWidget> w) {
  if (w) children_.push_back(std::move(w));
  return *this;
}

PanelBuilder& PanelBuilder::add_text(std::string text, WrapPolicy wrap) {
  return add_child(std::make_unique<TextBlock>(std::move(text), wrap));
}

PanelBuilder& PanelBuilder::add_spacer(int rows) {
  return add_child(std::make_unique<Spacer>(rows));
}

Panel PanelBuilder::build() {
  Panel p;
  if (title_ || borders_) {
    Decoration d;
    d.title = std::move(title_);
    d.borders = borders_.value_or(Borders::All);
    d.padding = padding_.value_or(Padding::symmetric(PK_DEFAULT_PADDING_H, PK_DEFAULT_PADDING_V));
    p.decoration_ = std::move(d);
  }
  p.scrollbar_ = scrollbar_;
  p.glyphs_ = std::move(glyphs_);
  p.children_ = std::move(children_);
  children_.clear();
  title_.reset();
  borders_.reset();
  padding_.reset();
  return p;
}

bool Panel::fits(const Rect& outer) const {
  if (outer.width < 0 || outer.height < 0) return false;
  return !decoration_ || decoration_fits(*decoration_, outer);
}

Rect Panel::inner_rect(const Rect& outer) const {
  if (decoration_) return decoration_inner(*decoration_, outer);
  return Rect{outer.row, outer.col, std::max(0, outer.height), std::max(0, outer.width)};
}

Rect Panel::scrollbar_area(const Rect& outer) const {
  return Rect{outer.row + 1, outer.col, saturating_sub(outer.height, 2), std::max(0, outer.width)};
}

bool Panel::stack_children(const Rect& inner, std::vector<ChildRect>& out, ScrollState& scroll, std::string& msg) const {
  int y = inner.row;
  int content = 0;
  for (size_t i = 0; i < children_.size(); ++i) {
    int natural = 0;
    if (!children_[i]->height(inner.width, natural, msg)) {
      msg = "child " + std::to_string(i) + ": " + msg;
      return false;
    }
    natural = std::max(0, natural);
    int clamped = std::min(natural, inner.bottom() - y);
    out.push_back(ChildRect{static_cast<int>(i), Rect{y, inner.col, clamped, inner.width}, natural});
    y += clamped;
    content += natural;
  }
  scroll.content_height = content;
  scroll.viewport_height = inner.height;
  scroll.scroll_offset = 0;
  return true;
}

bool Panel::layout(const Rect& outer, std::vector<ChildRect>& out, ScrollState& scroll, std::string& msg) const {
  out.clear();
  scroll = ScrollState{};
  if (!fits(outer)) return true;
  return stack_children(inner_rect(outer), out, scroll, msg);
}

bool Panel::render(ITerminal& term, const Rect& outer, std::string& msg) const {
  ScrollState scroll;
  return render(term, outer, scroll, msg);
}

bool Panel::render(ITerminal& term, const Rect& outer, ScrollState& scroll, std::string& msg) const {
  scroll = ScrollState{};
  if (!fits(outer)) {
    PK_LOG_DEBUG("panel rect {}x{} below minimum size, skipped", outer.width, outer.height);
    return true;
  }
  Rect inner = decoration_ ? render_decoration(term, *decoration_, outer) : inner_rect(outer);
  PK_LOG_TRACE("panel inner ({}, {}) {}x{}", inner.row, inner.col, inner.width, inner.height);

  std::vector<ChildRect> rects;
  rects.reserve(children_.size());
  if (!stack_children(inner, rects, scroll, msg)) return false;
  for (const auto& cr : rects) {
    if (cr.rect.empty()) continue;
    PK_LOG_TRACE("child {} at ({}, {}) {}x{} (natural {})",
                 cr.child, cr.rect.row, cr.rect.col, cr.rect.width, cr.rect.height, cr.natural_height);
    if (!children_[cr.child]->render(term, cr.rect, msg)) {
      msg = "child " + std::to_string(cr.child) + ": " + msg;
      return false;
    }
  }

  if (scrollbar_) render_scrollbar(term, scrollbar_area(outer), scroll, glyphs_);
  return true;
}

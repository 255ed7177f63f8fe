#pragma once
/*
 * Panel
 *
 * Purpose: stack child widgets top-to-bottom inside an optional decoration,
 * clip them at the viewport and draw a scroll indicator.
 * Usage: PanelBuilder().title("Logs").add_text("...").build().render(term, rect, msg);
 * Constraint: children keep insertion order; render never mutates the panel.
 */
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "types.hpp"
#include "iterminal.hpp"
#include "iwidget.hpp"
#include "decoration.hpp"
#include "scrollbar.hpp"
#include "text_layout.hpp"

struct ChildRect {
  int child = 0;
  Rect rect;              // clamped to the viewport, height may be 0
  int natural_height = 0; // rows the child asked for
};

class Panel {
public:
  Panel() = default;
  Panel(Panel&&) = default;
  Panel& operator=(Panel&&) = default;

  const std::optional<Decoration>& decoration() const { return decoration_; }
  bool show_scrollbar() const { return scrollbar_; }
  const ScrollbarGlyphs& glyphs() const { return glyphs_; }
  size_t child_count() const { return children_.size(); }
  const IWidget& child(size_t i) const { return *children_[i]; }

  // false when outer is below the decoration's minimum size
  bool fits(const Rect& outer) const;
  Rect inner_rect(const Rect& outer) const;
  Rect scrollbar_area(const Rect& outer) const;

  // geometry only, nothing is painted
  bool layout(const Rect& outer, std::vector<ChildRect>& out, ScrollState& scroll, std::string& msg) const;
  bool render(ITerminal& term, const Rect& outer, std::string& msg) const;
  bool render(ITerminal& term, const Rect& outer, ScrollState& scroll, std::string& msg) const;

private:
  friend class PanelBuilder;
  bool stack_children(const Rect& inner, std::vector<ChildRect>& out, ScrollState& scroll, std::string& msg) const;

  std::optional<Decoration> decoration_;
  bool scrollbar_ = true;
  ScrollbarGlyphs glyphs_;
  std::vector<std::unique_ptr<IWidget>> children_;
};

class PanelBuilder {
public:
  PanelBuilder& title(std::string t);
  PanelBuilder& borders(Borders b);
  PanelBuilder& padding(Padding p);
  PanelBuilder& scrollbar(bool on);
  PanelBuilder& glyphs(ScrollbarGlyphs g);
  PanelBuilder& add_child(std::unique_ptr<IWidget> w);
  PanelBuilder& add_text(std::string text, WrapPolicy wrap = WrapPolicy::WrapWords);
  PanelBuilder& add_spacer(int rows);
  // consumes the collected children
  Panel build();

private:
  std::optional<std::string> title_;
  std::optional<Borders> borders_;
  std::optional<Padding> padding_;
  bool scrollbar_ = true;
  ScrollbarGlyphs glyphs_;
  std::vector<std::unique_ptr<IWidget>> children_;
};

#include "mv/inset/EdgeInsets.hpp"

namespace mv {

Side resolveEdge(Edge edge, LayoutDirection direction) {
  bool rtl = direction == LayoutDirection::RightToLeft;
  switch (edge) {
    case Edge::Top: return Side::Top;
    case Edge::Bottom: return Side::Bottom;
    case Edge::Leading: return rtl ? Side::Right : Side::Left;
    case Edge::Trailing: return rtl ? Side::Left : Side::Right;
    default: return Side::Top;
  }
}

Insets toDirectional(const EdgeInsets& insets, LayoutDirection direction) {
  Insets out;
  out.top = insets.top;
  out.bottom = insets.bottom;
  if (resolveEdge(Edge::Leading, direction) == Side::Left) {
    out.left = insets.leading;
    out.right = insets.trailing;
  } else {
    out.left = insets.trailing;
    out.right = insets.leading;
  }
  return out;
}

EdgeInsets toAbstract(const Insets& insets, LayoutDirection direction) {
  EdgeInsets out;
  out.top = insets.top;
  out.bottom = insets.bottom;
  if (resolveEdge(Edge::Leading, direction) == Side::Left) {
    out.leading = insets.left;
    out.trailing = insets.right;
  } else {
    out.leading = insets.right;
    out.trailing = insets.left;
  }
  return out;
}

const EdgeInsetMapping& edgeInsetMapping() {
  static const EdgeInsetMapping mapping{{
    {Edge::Top, &EdgeInsets::top},
    {Edge::Leading, &EdgeInsets::leading},
    {Edge::Bottom, &EdgeInsets::bottom},
    {Edge::Trailing, &EdgeInsets::trailing},
  }};
  return mapping;
}

double edgeValue(const EdgeInsets& insets, Edge edge) {
  for (const auto& m : edgeInsetMapping()) {
    if (m.edge == edge) return insets.*(m.field);
  }
  return 0.0;
}

void setEdgeValue(EdgeInsets& insets, Edge edge, double value) {
  for (const auto& m : edgeInsetMapping()) {
    if (m.edge == edge) {
      insets.*(m.field) = value;
      return;
    }
  }
}

} // namespace mv

#pragma once
#include <array>
#include <cstdint>
#include <initializer_list>

namespace mv {

enum class LayoutDirection : std::uint8_t {
  LeftToRight,
  RightToLeft
};

// Direction-independent edge. Leading/Trailing resolve to Left/Right through LayoutDirection.
enum class Edge : std::uint8_t {
  Top,
  Leading,
  Bottom,
  Trailing
};

// Concrete screen side.
enum class Side : std::uint8_t {
  Top,
  Left,
  Bottom,
  Right
};

inline const char* toString(Edge e) {
  switch (e) {
    case Edge::Top: return "top";
    case Edge::Leading: return "leading";
    case Edge::Bottom: return "bottom";
    case Edge::Trailing: return "trailing";
    default: return "unknown";
  }
}

inline const char* toString(LayoutDirection d) {
  return d == LayoutDirection::RightToLeft ? "rightToLeft" : "leftToRight";
}

// Set of abstract edges.
class EdgeSet {
public:
  EdgeSet() = default;
  EdgeSet(std::initializer_list<Edge> edges) {
    for (Edge e : edges) insert(e);
  }

  static EdgeSet all() { return EdgeSet{Edge::Top, Edge::Leading, Edge::Bottom, Edge::Trailing}; }
  static EdgeSet horizontal() { return EdgeSet{Edge::Leading, Edge::Trailing}; }
  static EdgeSet vertical() { return EdgeSet{Edge::Top, Edge::Bottom}; }

  bool contains(Edge e) const { return (bits_ & bit(e)) != 0; }
  void insert(Edge e) { bits_ = static_cast<std::uint8_t>(bits_ | bit(e)); }
  void remove(Edge e) { bits_ = static_cast<std::uint8_t>(bits_ & ~bit(e)); }
  bool empty() const { return bits_ == 0; }
  std::uint8_t bits() const { return bits_; }

  friend bool operator==(const EdgeSet& a, const EdgeSet& b) { return a.bits_ == b.bits_; }
  friend bool operator!=(const EdgeSet& a, const EdgeSet& b) { return !(a == b); }

private:
  static std::uint8_t bit(Edge e) {
    return static_cast<std::uint8_t>(1u << static_cast<unsigned>(e));
  }

  std::uint8_t bits_{0};
};

// Abstract four-sided inset (user insets, overview geometry padding).
struct EdgeInsets {
  double top{0};
  double leading{0};
  double bottom{0};
  double trailing{0};

  EdgeInsets& operator+=(const EdgeInsets& o) {
    top += o.top;
    leading += o.leading;
    bottom += o.bottom;
    trailing += o.trailing;
    return *this;
  }
};

// Directional four-sided inset (safe area input, resolved padding).
struct Insets {
  double top{0};
  double left{0};
  double bottom{0};
  double right{0};

  Insets& operator+=(const Insets& o) {
    top += o.top;
    left += o.left;
    bottom += o.bottom;
    right += o.right;
    return *this;
  }
};

inline EdgeInsets operator+(EdgeInsets a, const EdgeInsets& b) { return a += b; }
inline Insets operator+(Insets a, const Insets& b) { return a += b; }

inline bool operator==(const EdgeInsets& a, const EdgeInsets& b) {
  return a.top == b.top && a.leading == b.leading &&
         a.bottom == b.bottom && a.trailing == b.trailing;
}
inline bool operator!=(const EdgeInsets& a, const EdgeInsets& b) { return !(a == b); }

inline bool operator==(const Insets& a, const Insets& b) {
  return a.top == b.top && a.left == b.left &&
         a.bottom == b.bottom && a.right == b.right;
}
inline bool operator!=(const Insets& a, const Insets& b) { return !(a == b); }

// ---- Edge resolution ----

Side resolveEdge(Edge edge, LayoutDirection direction);

// Abstract -> directional, e.g. leading lands on the left in LTR and on the right in RTL.
Insets toDirectional(const EdgeInsets& insets, LayoutDirection direction);

// Directional -> abstract (inverse of toDirectional for the same direction).
EdgeInsets toAbstract(const Insets& insets, LayoutDirection direction);

// Single edge -> field table. Every named-edge read/write goes through this table.
struct EdgeInsetField {
  Edge edge;
  double EdgeInsets::*field;
};

using EdgeInsetMapping = std::array<EdgeInsetField, 4>;

const EdgeInsetMapping& edgeInsetMapping();

double edgeValue(const EdgeInsets& insets, Edge edge);
void setEdgeValue(EdgeInsets& insets, Edge edge, double value);

} // namespace mv

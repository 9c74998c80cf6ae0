#pragma once
#include <cstdint>

namespace mv {

// Bearing source for the follow-puck viewport: a fixed heading, or the live heading of the puck.
class FollowPuckBearing {
public:
  enum class Kind : std::uint8_t {
    Constant,
    Heading
  };

  FollowPuckBearing() = default;

  static FollowPuckBearing constant(double degrees) { return FollowPuckBearing(Kind::Constant, degrees); }
  static FollowPuckBearing heading() { return FollowPuckBearing(Kind::Heading, 0.0); }

  Kind kind() const { return kind_; }
  bool isConstant() const { return kind_ == Kind::Constant; }
  bool isHeading() const { return kind_ == Kind::Heading; }

  // Meaningful only for Kind::Constant.
  double degrees() const { return degrees_; }

  friend bool operator==(const FollowPuckBearing& a, const FollowPuckBearing& b) {
    if (a.kind_ != b.kind_) return false;
    return a.kind_ != Kind::Constant || a.degrees_ == b.degrees_;
  }
  friend bool operator!=(const FollowPuckBearing& a, const FollowPuckBearing& b) { return !(a == b); }

private:
  FollowPuckBearing(Kind kind, double degrees) : kind_(kind), degrees_(degrees) {}

  Kind kind_{Kind::Constant};
  double degrees_{0};
};

} // namespace mv

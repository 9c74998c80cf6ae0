#pragma once
#include "mv/geometry/Geometry.hpp"
#include "mv/inset/EdgeInsets.hpp"
#include "mv/viewport/CameraOptions.hpp"
#include "mv/viewport/FollowPuckBearing.hpp"

#include <cstdint>
#include <optional>
#include <utility>
#include <variant>

namespace mv {

enum class ViewportMode : std::uint8_t {
  Idle,
  StyleDefault,
  Camera,
  Overview,
  FollowPuck
};

inline const char* toString(ViewportMode m) {
  switch (m) {
    case ViewportMode::Idle: return "idle";
    case ViewportMode::StyleDefault: return "styleDefault";
    case ViewportMode::Camera: return "camera";
    case ViewportMode::Overview: return "overview";
    case ViewportMode::FollowPuck: return "followPuck";
    default: return "unknown";
  }
}

struct OverviewOptions {
  Geometry geometry;
  double bearing{0};
  double pitch{0};
  EdgeInsets geometryPadding;         // frames the geometry; independent of the viewport insets
  std::optional<double> maxZoom;
  std::optional<ScreenPoint> offset;  // bounds center relative to the map center, in points
};

struct FollowPuckOptions {
  double zoom{0};
  FollowPuckBearing bearing;
  double pitch{0};
};

// Insets apply to every mode except idle.
struct InsetOptions {
  EdgeInsets insets;           // added on top of the surviving safe area
  EdgeSet ignoredSafeAreaEdges;
};

bool operator==(const OverviewOptions& a, const OverviewOptions& b);
bool operator==(const FollowPuckOptions& a, const FollowPuckOptions& b);
bool operator==(const InsetOptions& a, const InsetOptions& b);
inline bool operator!=(const OverviewOptions& a, const OverviewOptions& b) { return !(a == b); }
inline bool operator!=(const FollowPuckOptions& a, const FollowPuckOptions& b) { return !(a == b); }
inline bool operator!=(const InsetOptions& a, const InsetOptions& b) { return !(a == b); }

// Declarative description of how the camera should be positioned.
// Immutable value: inset() returns a modified copy.
class Viewport {
public:
  struct IdleMode {
    friend bool operator==(const IdleMode&, const IdleMode&) { return true; }
  };
  struct StyleDefaultMode {
    friend bool operator==(const StyleDefaultMode&, const StyleDefaultMode&) { return true; }
  };
  using Storage = std::variant<IdleMode, StyleDefaultMode, CameraOptions,
                               OverviewOptions, FollowPuckOptions>;

  // ---- Factories ----
  static Viewport idle();
  static Viewport styleDefault();
  static Viewport camera(std::optional<LatLng> center = std::nullopt,
                         std::optional<ScreenPoint> anchor = std::nullopt,
                         std::optional<double> zoom = std::nullopt,
                         std::optional<double> bearing = std::nullopt,
                         std::optional<double> pitch = std::nullopt);
  static Viewport overview(const Geometry& geometry,
                           double bearing = 0,
                           double pitch = 0,
                           const EdgeInsets& geometryPadding = EdgeInsets{},
                           std::optional<double> maxZoom = std::nullopt,
                           std::optional<ScreenPoint> offset = std::nullopt);
  static Viewport followPuck(double zoom,
                             FollowPuckBearing bearing = FollowPuckBearing::constant(0),
                             double pitch = 0);

  // ---- Insets ----

  // Replaces the whole inset configuration.
  Viewport inset(const EdgeInsets& insets, EdgeSet ignoringSafeArea = EdgeSet{}) const;

  // Sets `length` on each of `edges` and adds/removes them from the ignored set.
  // Other edges keep their values, so calls compose.
  Viewport inset(EdgeSet edges, double length, bool ignoringSafeArea = false) const;

  // ---- Accessors ----
  ViewportMode mode() const { return static_cast<ViewportMode>(storage_.index()); }
  bool isIdle() const { return std::holds_alternative<IdleMode>(storage_); }
  bool isStyleDefault() const { return std::holds_alternative<StyleDefaultMode>(storage_); }
  std::optional<CameraOptions> cameraOptions() const;
  std::optional<OverviewOptions> overviewOptions() const;
  std::optional<FollowPuckOptions> followPuckOptions() const;

  const InsetOptions& insetOptions() const { return insetOptions_; }
  const Storage& storage() const { return storage_; }

  friend bool operator==(const Viewport& a, const Viewport& b);
  friend bool operator!=(const Viewport& a, const Viewport& b) { return !(a == b); }

private:
  explicit Viewport(Storage storage) : storage_(std::move(storage)) {}

  Storage storage_;
  InsetOptions insetOptions_;
};

} // namespace mv

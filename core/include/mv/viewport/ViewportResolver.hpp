#pragma once
#include "mv/geometry/Geometry.hpp"
#include "mv/inset/EdgeInsets.hpp"
#include "mv/viewport/CameraOptions.hpp"
#include "mv/viewport/FollowPuckBearing.hpp"
#include "mv/viewport/Viewport.hpp"

#include <functional>
#include <optional>
#include <variant>

namespace mv {

class StyleCameraSource;

// Ambient safe area, queried lazily. An empty source means a zero safe area.
using SafeAreaSource = std::function<Insets()>;

// Host-supplied inputs read at resolution time.
struct ViewportEnvironment {
  LayoutDirection layoutDirection{LayoutDirection::LeftToRight};
  SafeAreaSource safeArea;
  const StyleCameraSource* style{nullptr};  // opaque, forwarded to StyleDefaultRequest
};

// ---- Resolved parameter bundles ----

// Idle: install nothing, the camera stays under direct user control.
struct NoState {};

struct CameraParameters {
  CameraOptions options;  // options.padding always holds the resolved padding
};

struct StyleDefaultRequest {
  Insets padding;
  const StyleCameraSource* style{nullptr};
};

struct OverviewParameters {
  Geometry geometry;
  Insets geometryPadding;
  double bearing{0};
  double pitch{0};
  Insets padding;
  std::optional<double> maxZoom;
  std::optional<ScreenPoint> offset;
  double animationDuration{0};
};

struct FollowPuckParameters {
  Insets padding;
  double zoom{0};
  FollowPuckBearing bearing;
  double pitch{0};
};

using ResolvedState = std::variant<NoState, CameraParameters, StyleDefaultRequest,
                                   OverviewParameters, FollowPuckParameters>;

inline bool operator==(const NoState&, const NoState&) { return true; }
inline bool operator!=(const NoState&, const NoState&) { return false; }
bool operator==(const CameraParameters& a, const CameraParameters& b);
bool operator==(const StyleDefaultRequest& a, const StyleDefaultRequest& b);
bool operator==(const OverviewParameters& a, const OverviewParameters& b);
bool operator==(const FollowPuckParameters& a, const FollowPuckParameters& b);
inline bool operator!=(const CameraParameters& a, const CameraParameters& b) { return !(a == b); }
inline bool operator!=(const StyleDefaultRequest& a, const StyleDefaultRequest& b) { return !(a == b); }
inline bool operator!=(const OverviewParameters& a, const OverviewParameters& b) { return !(a == b); }
inline bool operator!=(const FollowPuckParameters& a, const FollowPuckParameters& b) { return !(a == b); }

inline bool isNoState(const ResolvedState& s) { return std::holds_alternative<NoState>(s); }

// Maps a viewport to exactly one resolved bundle. Total and stateless.
// For idle the safe area source is never invoked.
ResolvedState resolveViewport(const Viewport& viewport, const ViewportEnvironment& env);

ResolvedState resolveViewport(const Viewport& viewport,
                              LayoutDirection direction,
                              const Insets& safeAreaInsets,
                              const StyleCameraSource* style = nullptr);

} // namespace mv

#pragma once
#include "mv/geometry/Geometry.hpp"
#include "mv/inset/EdgeInsets.hpp"

#include <optional>

namespace mv {

// Camera dimensions. An empty optional means "leave unspecified", never zero.
// center and anchor are mutually exclusive by contract; both are passed through untouched.
struct CameraOptions {
  std::optional<LatLng> center;
  std::optional<ScreenPoint> anchor;   // pivot for zoom/bearing, in screen space
  std::optional<double> zoom;
  std::optional<double> bearing;       // degrees clockwise from true north
  std::optional<double> pitch;         // degrees, 0 = top-down
  std::optional<Insets> padding;       // owned by the resolver
};

inline bool operator==(const CameraOptions& a, const CameraOptions& b) {
  return a.center == b.center && a.anchor == b.anchor && a.zoom == b.zoom &&
         a.bearing == b.bearing && a.pitch == b.pitch && a.padding == b.padding;
}
inline bool operator!=(const CameraOptions& a, const CameraOptions& b) { return !(a == b); }

} // namespace mv

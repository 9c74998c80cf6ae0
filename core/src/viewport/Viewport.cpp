#include "mv/viewport/Viewport.hpp"

namespace mv {

bool operator==(const OverviewOptions& a, const OverviewOptions& b) {
  return a.geometry == b.geometry && a.bearing == b.bearing && a.pitch == b.pitch &&
         a.geometryPadding == b.geometryPadding && a.maxZoom == b.maxZoom &&
         a.offset == b.offset;
}

bool operator==(const FollowPuckOptions& a, const FollowPuckOptions& b) {
  return a.zoom == b.zoom && a.bearing == b.bearing && a.pitch == b.pitch;
}

bool operator==(const InsetOptions& a, const InsetOptions& b) {
  return a.insets == b.insets && a.ignoredSafeAreaEdges == b.ignoredSafeAreaEdges;
}

bool operator==(const Viewport& a, const Viewport& b) {
  return a.storage_ == b.storage_ && a.insetOptions_ == b.insetOptions_;
}

// ---- Factories ----

Viewport Viewport::idle() {
  return Viewport(IdleMode{});
}

Viewport Viewport::styleDefault() {
  return Viewport(StyleDefaultMode{});
}

Viewport Viewport::camera(std::optional<LatLng> center,
                          std::optional<ScreenPoint> anchor,
                          std::optional<double> zoom,
                          std::optional<double> bearing,
                          std::optional<double> pitch) {
  CameraOptions opts;
  opts.center = center;
  opts.anchor = anchor;
  opts.zoom = zoom;
  opts.bearing = bearing;
  opts.pitch = pitch;
  return Viewport(opts);
}

Viewport Viewport::overview(const Geometry& geometry,
                            double bearing,
                            double pitch,
                            const EdgeInsets& geometryPadding,
                            std::optional<double> maxZoom,
                            std::optional<ScreenPoint> offset) {
  OverviewOptions opts;
  opts.geometry = geometry;
  opts.bearing = bearing;
  opts.pitch = pitch;
  opts.geometryPadding = geometryPadding;
  opts.maxZoom = maxZoom;
  opts.offset = offset;
  return Viewport(opts);
}

Viewport Viewport::followPuck(double zoom, FollowPuckBearing bearing, double pitch) {
  FollowPuckOptions opts;
  opts.zoom = zoom;
  opts.bearing = bearing;
  opts.pitch = pitch;
  return Viewport(opts);
}

// ---- Insets ----

Viewport Viewport::inset(const EdgeInsets& insets, EdgeSet ignoringSafeArea) const {
  Viewport copy = *this;
  copy.insetOptions_.insets = insets;
  copy.insetOptions_.ignoredSafeAreaEdges = ignoringSafeArea;
  return copy;
}

Viewport Viewport::inset(EdgeSet edges, double length, bool ignoringSafeArea) const {
  Viewport copy = *this;
  for (const auto& m : edgeInsetMapping()) {
    if (!edges.contains(m.edge)) continue;
    copy.insetOptions_.insets.*(m.field) = length;
    if (ignoringSafeArea) {
      copy.insetOptions_.ignoredSafeAreaEdges.insert(m.edge);
    } else {
      copy.insetOptions_.ignoredSafeAreaEdges.remove(m.edge);
    }
  }
  return copy;
}

// ---- Accessors ----

std::optional<CameraOptions> Viewport::cameraOptions() const {
  if (const auto* opts = std::get_if<CameraOptions>(&storage_)) return *opts;
  return std::nullopt;
}

std::optional<OverviewOptions> Viewport::overviewOptions() const {
  if (const auto* opts = std::get_if<OverviewOptions>(&storage_)) return *opts;
  return std::nullopt;
}

std::optional<FollowPuckOptions> Viewport::followPuckOptions() const {
  if (const auto* opts = std::get_if<FollowPuckOptions>(&storage_)) return *opts;
  return std::nullopt;
}

} // namespace mv

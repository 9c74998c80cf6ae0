#include "mv/viewport/ViewportResolver.hpp"
#include "mv/viewport/PaddingResolver.hpp"

#include <type_traits>

namespace mv {

bool operator==(const CameraParameters& a, const CameraParameters& b) {
  return a.options == b.options;
}

bool operator==(const StyleDefaultRequest& a, const StyleDefaultRequest& b) {
  return a.padding == b.padding && a.style == b.style;
}

bool operator==(const OverviewParameters& a, const OverviewParameters& b) {
  return a.geometry == b.geometry && a.geometryPadding == b.geometryPadding &&
         a.bearing == b.bearing && a.pitch == b.pitch && a.padding == b.padding &&
         a.maxZoom == b.maxZoom && a.offset == b.offset &&
         a.animationDuration == b.animationDuration;
}

bool operator==(const FollowPuckParameters& a, const FollowPuckParameters& b) {
  return a.padding == b.padding && a.zoom == b.zoom &&
         a.bearing == b.bearing && a.pitch == b.pitch;
}

ResolvedState resolveViewport(const Viewport& viewport, const ViewportEnvironment& env) {
  if (viewport.isIdle()) return NoState{};

  Insets safeArea = env.safeArea ? env.safeArea() : Insets{};
  Insets padding = resolvePadding(viewport.insetOptions(), env.layoutDirection, safeArea);

  return std::visit([&](const auto& mode) -> ResolvedState {
    using T = std::decay_t<decltype(mode)>;
    if constexpr (std::is_same_v<T, Viewport::IdleMode>) {
      return NoState{};
    } else if constexpr (std::is_same_v<T, Viewport::StyleDefaultMode>) {
      StyleDefaultRequest req;
      req.padding = padding;
      req.style = env.style;
      return req;
    } else if constexpr (std::is_same_v<T, CameraOptions>) {
      CameraParameters params;
      params.options = mode;
      params.options.padding = padding;
      return params;
    } else if constexpr (std::is_same_v<T, OverviewOptions>) {
      OverviewParameters params;
      params.geometry = mode.geometry;
      params.geometryPadding = toDirectional(mode.geometryPadding, env.layoutDirection);
      params.bearing = mode.bearing;
      params.pitch = mode.pitch;
      params.padding = padding;
      params.maxZoom = mode.maxZoom;
      params.offset = mode.offset;
      params.animationDuration = 0.0;
      return params;
    } else {
      FollowPuckParameters params;
      params.padding = padding;
      params.zoom = mode.zoom;
      params.bearing = mode.bearing;
      params.pitch = mode.pitch;
      return params;
    }
  }, viewport.storage());
}

ResolvedState resolveViewport(const Viewport& viewport,
                              LayoutDirection direction,
                              const Insets& safeAreaInsets,
                              const StyleCameraSource* style) {
  ViewportEnvironment env;
  env.layoutDirection = direction;
  env.safeArea = [safeAreaInsets]() { return safeAreaInsets; };
  env.style = style;
  return resolveViewport(viewport, env);
}

} // namespace mv

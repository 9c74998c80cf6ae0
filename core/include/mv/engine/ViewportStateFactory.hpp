#pragma once
#include "mv/viewport/ViewportResolver.hpp"

#include <memory>

namespace mv {

// Engine-owned runtime state that drives the camera once installed.
class ViewportState {
public:
  virtual ~ViewportState() = default;
};

// Active style's camera query surface. Never dereferenced by the resolver.
class StyleCameraSource {
public:
  virtual ~StyleCameraSource() = default;
};

// Construction contract of the camera-state engine.
class ViewportStateFactory {
public:
  virtual ~ViewportStateFactory() = default;

  virtual std::unique_ptr<ViewportState> makeCameraState(const CameraParameters& params) = 0;
  virtual std::unique_ptr<ViewportState> makeStyleDefaultState(const StyleDefaultRequest& request) = 0;
  virtual std::unique_ptr<ViewportState> makeOverviewState(const OverviewParameters& params) = 0;
  virtual std::unique_ptr<ViewportState> makeFollowPuckState(const FollowPuckParameters& params) = 0;
};

// Hands an already-resolved bundle to the factory. NoState yields nullptr.
std::unique_ptr<ViewportState> makeState(const ResolvedState& resolved,
                                         ViewportStateFactory& factory);

// Resolve + construct. Returns nullptr for idle without touching the factory.
std::unique_ptr<ViewportState> makeState(const Viewport& viewport,
                                         const ViewportEnvironment& env,
                                         ViewportStateFactory& factory);

} // namespace mv

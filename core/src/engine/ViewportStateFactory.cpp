#include "mv/engine/ViewportStateFactory.hpp"

#include <type_traits>

namespace mv {

std::unique_ptr<ViewportState> makeState(const ResolvedState& resolved,
                                         ViewportStateFactory& factory) {
  return std::visit([&](const auto& params) -> std::unique_ptr<ViewportState> {
    using T = std::decay_t<decltype(params)>;
    if constexpr (std::is_same_v<T, NoState>) {
      return nullptr;
    } else if constexpr (std::is_same_v<T, CameraParameters>) {
      return factory.makeCameraState(params);
    } else if constexpr (std::is_same_v<T, StyleDefaultRequest>) {
      return factory.makeStyleDefaultState(params);
    } else if constexpr (std::is_same_v<T, OverviewParameters>) {
      return factory.makeOverviewState(params);
    } else {
      return factory.makeFollowPuckState(params);
    }
  }, resolved);
}

std::unique_ptr<ViewportState> makeState(const Viewport& viewport,
                                         const ViewportEnvironment& env,
                                         ViewportStateFactory& factory) {
  return makeState(resolveViewport(viewport, env), factory);
}

} // namespace mv

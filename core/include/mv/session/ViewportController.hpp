#pragma once
#include "mv/engine/ViewportStateFactory.hpp"
#include "mv/inset/EdgeInsets.hpp"
#include "mv/viewport/Viewport.hpp"
#include "mv/viewport/ViewportResolver.hpp"

#include <cstdint>
#include <memory>

namespace mv {

struct ViewportControllerConfig {
  bool logTransitions{false};  // print every install to stderr
};

// Host-side driver: owns the current viewport value plus the layout/safe-area
// environment and re-installs engine state whenever the effective input changes.
class ViewportController {
public:
  explicit ViewportController(ViewportStateFactory& factory);

  void setConfig(const ViewportControllerConfig& cfg) { config_ = cfg; }

  // Each setter returns true if a resolution pass ran (state installed or dropped).
  // Structurally equal input is a no-op once the controller has been applied.
  bool setViewport(const Viewport& viewport);
  bool setLayoutDirection(LayoutDirection direction);
  bool setSafeAreaInsets(const Insets& insets);
  bool setStyleSource(const StyleCameraSource* style);

  // User started dragging: switch to idle and drop the active state.
  bool beginUserInteraction();

  // Force a resolution pass with the current inputs.
  void apply();

  const Viewport& viewport() const { return viewport_; }
  LayoutDirection layoutDirection() const { return direction_; }
  const Insets& safeAreaInsets() const { return safeArea_; }
  const ResolvedState& resolvedState() const { return resolved_; }

  // Non-owning; nullptr while idle or before the first apply.
  ViewportState* activeState() const { return active_.get(); }
  std::uint64_t transitionCount() const { return transitions_; }

private:
  ViewportEnvironment environment() const;
  void logInstall() const;

  ViewportStateFactory& factory_;
  ViewportControllerConfig config_;

  Viewport viewport_{Viewport::styleDefault()};
  LayoutDirection direction_{LayoutDirection::LeftToRight};
  Insets safeArea_;
  const StyleCameraSource* style_{nullptr};

  bool applied_{false};
  ResolvedState resolved_;
  std::unique_ptr<ViewportState> active_;
  std::uint64_t transitions_{0};
};

} // namespace mv

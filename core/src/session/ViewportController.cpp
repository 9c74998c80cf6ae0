#include "mv/session/ViewportController.hpp"

#include <cstdio>

namespace mv {

ViewportController::ViewportController(ViewportStateFactory& factory)
  : factory_(factory) {}

bool ViewportController::setViewport(const Viewport& viewport) {
  if (applied_ && viewport == viewport_) return false;
  // Idle installs nothing and ignores insets, so idle to idle only updates the stored value.
  bool idleToIdle = applied_ && viewport_.isIdle() && viewport.isIdle();
  viewport_ = viewport;
  if (idleToIdle) return false;
  apply();
  return true;
}

bool ViewportController::setLayoutDirection(LayoutDirection direction) {
  if (applied_ && direction == direction_) return false;
  direction_ = direction;
  // Idle has no padding consumer; keep the new direction for the next pass.
  if (applied_ && viewport_.isIdle()) return false;
  apply();
  return true;
}

bool ViewportController::setSafeAreaInsets(const Insets& insets) {
  if (applied_ && insets == safeArea_) return false;
  safeArea_ = insets;
  if (applied_ && viewport_.isIdle()) return false;
  apply();
  return true;
}

bool ViewportController::setStyleSource(const StyleCameraSource* style) {
  if (applied_ && style == style_) return false;
  style_ = style;
  if (applied_ && !viewport_.isStyleDefault()) return false;
  apply();
  return true;
}

bool ViewportController::beginUserInteraction() {
  return setViewport(Viewport::idle());
}

void ViewportController::apply() {
  resolved_ = resolveViewport(viewport_, environment());
  // Drop the previous state before the engine builds the next one.
  active_.reset();
  active_ = makeState(resolved_, factory_);
  applied_ = true;
  ++transitions_;

  if (config_.logTransitions) logInstall();
}

ViewportEnvironment ViewportController::environment() const {
  ViewportEnvironment env;
  env.layoutDirection = direction_;
  Insets safeArea = safeArea_;
  env.safeArea = [safeArea]() { return safeArea; };
  env.style = style_;
  return env;
}

void ViewportController::logInstall() const {
  const char* mode = toString(viewport_.mode());
  if (isNoState(resolved_)) {
    std::fprintf(stderr, "[ViewportController] #%llu %s: no state installed\n",
                 static_cast<unsigned long long>(transitions_), mode);
    return;
  }

  Insets padding;
  if (const auto* p = std::get_if<CameraParameters>(&resolved_)) {
    padding = p->options.padding.value_or(Insets{});
  } else if (const auto* p = std::get_if<StyleDefaultRequest>(&resolved_)) {
    padding = p->padding;
  } else if (const auto* p = std::get_if<OverviewParameters>(&resolved_)) {
    padding = p->padding;
  } else if (const auto* p = std::get_if<FollowPuckParameters>(&resolved_)) {
    padding = p->padding;
  }

  std::fprintf(stderr,
               "[ViewportController] #%llu %s (%s): padding t=%.1f l=%.1f b=%.1f r=%.1f\n",
               static_cast<unsigned long long>(transitions_), mode,
               toString(direction_),
               padding.top, padding.left, padding.bottom, padding.right);
}

} // namespace mv

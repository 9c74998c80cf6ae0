// D4.1 — ViewportController: change detection, idle handling, environment updates

#include "mv/session/ViewportController.hpp"
#include <cstdio>
#include <cstdlib>
#include <memory>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

namespace {

struct CountingState : mv::ViewportState {
  explicit CountingState(int* live) : live_(live) { ++*live_; }
  ~CountingState() override { --*live_; }
  int* live_;
};

class CountingFactory : public mv::ViewportStateFactory {
public:
  int built{0};
  int live{0};
  mv::Insets lastPadding;

  std::unique_ptr<mv::ViewportState> makeCameraState(const mv::CameraParameters& p) override {
    lastPadding = p.options.padding.value_or(mv::Insets{});
    return make();
  }
  std::unique_ptr<mv::ViewportState> makeStyleDefaultState(const mv::StyleDefaultRequest& r) override {
    lastPadding = r.padding;
    return make();
  }
  std::unique_ptr<mv::ViewportState> makeOverviewState(const mv::OverviewParameters& p) override {
    lastPadding = p.padding;
    return make();
  }
  std::unique_ptr<mv::ViewportState> makeFollowPuckState(const mv::FollowPuckParameters& p) override {
    lastPadding = p.padding;
    return make();
  }

private:
  std::unique_ptr<mv::ViewportState> make() {
    built++;
    return std::make_unique<CountingState>(&live);
  }
};

class DummyStyle : public mv::StyleCameraSource {};

} // namespace

int main() {
  using mv::Edge;

  // --- Initial apply installs style default ---
  {
    CountingFactory f;
    mv::ViewportController ctl(f);
    requireTrue(ctl.activeState() == nullptr, "nothing before apply");
    requireTrue(ctl.viewport().isStyleDefault(), "starts at styleDefault");

    ctl.apply();
    requireTrue(ctl.activeState() != nullptr, "styleDefault installed");
    requireTrue(f.built == 1 && f.live == 1, "one live state");
    requireTrue(ctl.transitionCount() == 1, "one transition");
    std::printf("  initial apply PASS\n");
  }

  // --- Equal viewport is a no-op ---
  {
    CountingFactory f;
    mv::ViewportController ctl(f);
    mv::Viewport vp = mv::Viewport::camera(mv::LatLng{1, 2}, std::nullopt, 10.0);

    requireTrue(ctl.setViewport(vp), "first set installs");
    requireTrue(!ctl.setViewport(mv::Viewport::camera(mv::LatLng{1, 2}, std::nullopt, 10.0)),
                "structurally equal set is a no-op");
    requireTrue(f.built == 1, "built once");

    requireTrue(ctl.setViewport(vp.inset({Edge::Top}, 5.0)), "inset change re-installs");
    requireTrue(f.built == 2 && f.live == 1, "previous state released");
    std::printf("  change detection PASS\n");
  }

  // --- User interaction drops to idle ---
  {
    CountingFactory f;
    mv::ViewportController ctl(f);
    ctl.setViewport(mv::Viewport::followPuck(16.0));
    requireTrue(f.live == 1, "followPuck live");

    requireTrue(ctl.beginUserInteraction(), "switch to idle");
    requireTrue(ctl.viewport().isIdle(), "viewport is idle");
    requireTrue(ctl.activeState() == nullptr, "no state while idle");
    requireTrue(mv::isNoState(ctl.resolvedState()), "resolved NoState");
    requireTrue(f.live == 0, "engine state dropped");
    requireTrue(!ctl.beginUserInteraction(), "already idle");

    auto transitions = ctl.transitionCount();
    requireTrue(!ctl.setViewport(mv::Viewport::idle().inset({Edge::Top}, 12.0)),
                "idle with insets installs nothing");
    requireTrue(ctl.transitionCount() == transitions, "no transition between idle values");
    requireTrue(ctl.viewport().insetOptions().insets.top == 12.0, "idle value still stored");
    requireTrue(ctl.activeState() == nullptr && f.built == 1, "nothing built");
    std::printf("  user interaction PASS\n");
  }

  // --- Safe area / layout changes re-install only when not idle ---
  {
    CountingFactory f;
    mv::ViewportController ctl(f);
    ctl.setViewport(mv::Viewport::styleDefault().inset({Edge::Leading}, 7.0));
    requireTrue(f.lastPadding == (mv::Insets{0, 7, 0, 0}), "LTR leading on left");

    requireTrue(ctl.setSafeAreaInsets(mv::Insets{20, 0, 34, 0}), "safe area change re-installs");
    requireTrue(f.lastPadding == (mv::Insets{20, 7, 34, 0}), "safe area applied");
    requireTrue(!ctl.setSafeAreaInsets(mv::Insets{20, 0, 34, 0}), "same safe area is a no-op");

    requireTrue(ctl.setLayoutDirection(mv::LayoutDirection::RightToLeft), "direction re-installs");
    requireTrue(f.lastPadding == (mv::Insets{20, 0, 34, 7}), "RTL leading on right");

    ctl.beginUserInteraction();
    int builtBefore = f.built;
    requireTrue(!ctl.setSafeAreaInsets(mv::Insets{44, 0, 0, 0}), "idle ignores safe area");
    requireTrue(!ctl.setLayoutDirection(mv::LayoutDirection::LeftToRight), "idle ignores direction");
    requireTrue(f.built == builtBefore, "nothing built while idle");
    requireTrue(ctl.safeAreaInsets() == (mv::Insets{44, 0, 0, 0}), "safe area still stored");

    ctl.setViewport(mv::Viewport::followPuck(15.0));
    requireTrue(f.lastPadding == (mv::Insets{44, 0, 0, 0}), "stored safe area used on leaving idle");
    std::printf("  environment PASS\n");
  }

  // --- Style source matters only for style default ---
  {
    CountingFactory f;
    DummyStyle style;
    mv::ViewportController ctl(f);
    ctl.setViewport(mv::Viewport::followPuck(15.0));
    requireTrue(!ctl.setStyleSource(&style), "style ignored outside styleDefault");

    ctl.setViewport(mv::Viewport::styleDefault());
    const auto* req = std::get_if<mv::StyleDefaultRequest>(&ctl.resolvedState());
    requireTrue(req != nullptr && req->style == &style, "stored style forwarded");

    DummyStyle other;
    requireTrue(ctl.setStyleSource(&other), "style change re-installs styleDefault");
    req = std::get_if<mv::StyleDefaultRequest>(&ctl.resolvedState());
    requireTrue(req != nullptr && req->style == &other, "new style forwarded");
    std::printf("  style source PASS\n");
  }

  // --- Logging config does not change behaviour ---
  {
    CountingFactory f;
    mv::ViewportController ctl(f);
    mv::ViewportControllerConfig cfg;
    cfg.logTransitions = true;
    ctl.setConfig(cfg);
    ctl.setViewport(mv::Viewport::overview(mv::Point{{1, 2}}));
    ctl.beginUserInteraction();
    requireTrue(ctl.transitionCount() == 2, "two transitions logged");
    std::printf("  logging PASS\n");
  }

  std::printf("D4.1 controller: ALL PASS\n");
  return 0;
}

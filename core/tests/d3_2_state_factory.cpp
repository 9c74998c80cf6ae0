// D3.2 — Engine construction contract: makeState dispatch

#include "mv/engine/ViewportStateFactory.hpp"
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <utility>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

namespace {

struct FakeState : mv::ViewportState {
  explicit FakeState(std::string k) : kind(std::move(k)) {}
  std::string kind;
};

// Records each construction call.
class RecordingFactory : public mv::ViewportStateFactory {
public:
  int cameraCalls{0}, styleCalls{0}, overviewCalls{0}, followCalls{0};
  mv::Insets lastPadding;

  std::unique_ptr<mv::ViewportState> makeCameraState(const mv::CameraParameters& p) override {
    cameraCalls++;
    lastPadding = p.options.padding.value_or(mv::Insets{});
    return std::make_unique<FakeState>("camera");
  }
  std::unique_ptr<mv::ViewportState> makeStyleDefaultState(const mv::StyleDefaultRequest& r) override {
    styleCalls++;
    lastPadding = r.padding;
    return std::make_unique<FakeState>("styleDefault");
  }
  std::unique_ptr<mv::ViewportState> makeOverviewState(const mv::OverviewParameters& p) override {
    overviewCalls++;
    lastPadding = p.padding;
    return std::make_unique<FakeState>("overview");
  }
  std::unique_ptr<mv::ViewportState> makeFollowPuckState(const mv::FollowPuckParameters& p) override {
    followCalls++;
    lastPadding = p.padding;
    return std::make_unique<FakeState>("followPuck");
  }

  int total() const { return cameraCalls + styleCalls + overviewCalls + followCalls; }
};

const char* kindOf(const std::unique_ptr<mv::ViewportState>& s) {
  auto* fake = dynamic_cast<FakeState*>(s.get());
  return fake ? fake->kind.c_str() : "";
}

} // namespace

int main() {
  mv::ViewportEnvironment env;
  env.layoutDirection = mv::LayoutDirection::LeftToRight;
  env.safeArea = []() { return mv::Insets{20, 0, 34, 0}; };

  // --- Idle never reaches the factory ---
  {
    RecordingFactory f;
    auto s = mv::makeState(mv::Viewport::idle(), env, f);
    requireTrue(s == nullptr, "idle -> nullptr");
    requireTrue(f.total() == 0, "factory untouched for idle");
    std::printf("  idle PASS\n");
  }

  // --- Each mode calls exactly its constructor once ---
  {
    RecordingFactory f;
    auto s = mv::makeState(mv::Viewport::camera(std::nullopt, std::nullopt, 4.0), env, f);
    requireTrue(std::string(kindOf(s)) == "camera", "camera state");
    requireTrue(f.cameraCalls == 1 && f.total() == 1, "camera called once");
    requireTrue(f.lastPadding == (mv::Insets{20, 0, 34, 0}), "camera got resolved padding");

    s = mv::makeState(mv::Viewport::styleDefault(), env, f);
    requireTrue(std::string(kindOf(s)) == "styleDefault", "styleDefault state");
    requireTrue(f.styleCalls == 1 && f.total() == 2, "styleDefault called once");

    s = mv::makeState(mv::Viewport::overview(mv::Point{{1.0, 2.0}}), env, f);
    requireTrue(std::string(kindOf(s)) == "overview", "overview state");
    requireTrue(f.overviewCalls == 1 && f.total() == 3, "overview called once");

    s = mv::makeState(mv::Viewport::followPuck(16.0).inset({mv::Edge::Top}, 5.0, true), env, f);
    requireTrue(std::string(kindOf(s)) == "followPuck", "followPuck state");
    requireTrue(f.followCalls == 1 && f.total() == 4, "followPuck called once");
    requireTrue(f.lastPadding == (mv::Insets{5, 0, 34, 0}), "followPuck padding");
    std::printf("  dispatch PASS\n");
  }

  // --- Pre-resolved bundle overload ---
  {
    RecordingFactory f;
    mv::ResolvedState none = mv::NoState{};
    requireTrue(mv::makeState(none, f) == nullptr, "NoState -> nullptr");

    mv::ResolvedState resolved = mv::resolveViewport(mv::Viewport::followPuck(12.0),
                                                     mv::LayoutDirection::RightToLeft,
                                                     mv::Insets{0, 1, 0, 2});
    auto s = mv::makeState(resolved, f);
    requireTrue(std::string(kindOf(s)) == "followPuck", "followPuck from bundle");
    requireTrue(f.lastPadding == (mv::Insets{0, 1, 0, 2}), "safe area kept as directional");
    std::printf("  bundle overload PASS\n");
  }

  std::printf("D3.2 state_factory: ALL PASS\n");
  return 0;
}

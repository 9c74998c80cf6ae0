// D1.2 — Padding resolution: safe area, ignored edges, additive user insets

#include "mv/viewport/PaddingResolver.hpp"
#include "mv/viewport/Viewport.hpp"
#include <cstdio>
#include <cstdlib>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

int main() {
  using mv::Edge;
  using mv::LayoutDirection;
  const auto LTR = LayoutDirection::LeftToRight;
  const auto RTL = LayoutDirection::RightToLeft;

  // --- No options: padding equals safe area ---
  {
    mv::InsetOptions opts;
    mv::Insets safe{20, 0, 34, 0};
    requireTrue(mv::resolvePadding(opts, LTR, safe) == safe, "LTR passthrough");
    requireTrue(mv::resolvePadding(opts, RTL, safe) == safe, "RTL passthrough");
    std::printf("  passthrough PASS\n");
  }

  // --- User insets are additive ---
  {
    mv::Viewport vp = mv::Viewport::styleDefault().inset(mv::EdgeInsets{5, 0, 6, 0});
    mv::Insets p = mv::resolvePadding(vp.insetOptions(), LTR, mv::Insets{20, 0, 34, 0});
    requireTrue(p.top == 25.0 && p.bottom == 40.0, "user insets added to safe area");
    std::printf("  additive PASS\n");
  }

  // --- Ignore runs before add ---
  {
    mv::Viewport vp = mv::Viewport::styleDefault().inset({Edge::Top}, 10.0, true);
    mv::Insets p = mv::resolvePadding(vp.insetOptions(), LTR, mv::Insets{20, 0, 0, 0});
    requireTrue(p.top == 10.0, "top = 20 zeroed then 10 added");

    mv::Viewport keep = mv::Viewport::styleDefault().inset({Edge::Top}, 10.0, false);
    p = mv::resolvePadding(keep.insetOptions(), LTR, mv::Insets{20, 0, 0, 0});
    requireTrue(p.top == 30.0, "not ignored: 20 + 10");
    std::printf("  ignore-before-add PASS\n");
  }

  // --- Ignored edge without user inset ---
  {
    mv::Viewport vp = mv::Viewport::styleDefault().inset(mv::EdgeInsets{},
                                                         mv::EdgeSet::all());
    mv::Insets p = mv::resolvePadding(vp.insetOptions(), LTR, mv::Insets{20, 11, 34, 12});
    requireTrue(p == mv::Insets{}, "all edges ignored -> zero");
    std::printf("  ignore all PASS\n");
  }

  // --- Layout direction flips leading ---
  {
    mv::Insets safe{0, 3, 0, 4};
    mv::Viewport vp = mv::Viewport::styleDefault().inset({Edge::Leading}, 7.0);

    mv::Insets ltr = mv::resolvePadding(vp.insetOptions(), LTR, safe);
    requireTrue(ltr.left == 10.0, "LTR leading on left (3 + 7)");
    requireTrue(ltr.right == 4.0, "LTR right keeps safe area");

    mv::Insets rtl = mv::resolvePadding(vp.insetOptions(), RTL, safe);
    requireTrue(rtl.right == 11.0, "RTL leading on right (4 + 7)");
    requireTrue(rtl.left == 3.0, "RTL left keeps safe area");

    mv::Insets zero;
    requireTrue(mv::resolvePadding(vp.insetOptions(), LTR, zero).left == 7.0, "LTR left=7");
    requireTrue(mv::resolvePadding(vp.insetOptions(), LTR, zero).right == 0.0, "LTR right=0");
    requireTrue(mv::resolvePadding(vp.insetOptions(), RTL, zero).right == 7.0, "RTL right=7");
    requireTrue(mv::resolvePadding(vp.insetOptions(), RTL, zero).left == 0.0, "RTL left=0");
    std::printf("  direction flip PASS\n");
  }

  // --- Ignoring trailing in RTL zeroes the physical left ---
  {
    mv::Viewport vp = mv::Viewport::styleDefault().inset(mv::EdgeInsets{},
                                                         {Edge::Trailing});
    mv::Insets p = mv::resolvePadding(vp.insetOptions(), RTL, mv::Insets{0, 8, 0, 9});
    requireTrue(p.left == 0.0 && p.right == 9.0, "RTL trailing is left");
    std::printf("  RTL ignore PASS\n");
  }

  std::printf("D1.2 padding_resolver: ALL PASS\n");
  return 0;
}

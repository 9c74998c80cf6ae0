// Resolve Demo
// Loads a viewport JSON description and prints the bundle the engine would receive.
//
//   resolve_demo viewport.json [--rtl] [--safe-area top,left,bottom,right]

#include "mv/session/ViewportConfig.hpp"
#include "mv/viewport/ViewportResolver.hpp"

#include <cstdio>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <variant>

static void printInsets(const char* label, const mv::Insets& i) {
  std::printf("  %-16s top=%.1f left=%.1f bottom=%.1f right=%.1f\n",
              label, i.top, i.left, i.bottom, i.right);
}

static void printOptional(const char* label, const std::optional<double>& v) {
  if (v) std::printf("  %-16s %.3f\n", label, *v);
  else std::printf("  %-16s (unspecified)\n", label);
}

static bool parseInsets(const char* text, mv::Insets& out) {
  return std::sscanf(text, "%lf,%lf,%lf,%lf",
                     &out.top, &out.left, &out.bottom, &out.right) == 4;
}

int main(int argc, char* argv[]) {
  std::string path;
  mv::LayoutDirection direction = mv::LayoutDirection::LeftToRight;
  mv::Insets safeArea;

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--rtl") {
      direction = mv::LayoutDirection::RightToLeft;
    } else if (arg == "--safe-area" && i + 1 < argc) {
      if (!parseInsets(argv[++i], safeArea)) {
        std::fprintf(stderr, "resolve_demo: --safe-area expects top,left,bottom,right\n");
        return 1;
      }
    } else {
      path = arg;
    }
  }

  if (path.empty()) {
    std::fprintf(stderr, "usage: resolve_demo viewport.json [--rtl] [--safe-area t,l,b,r]\n");
    return 1;
  }

  std::ifstream in(path);
  if (!in) {
    std::fprintf(stderr, "resolve_demo: cannot open %s\n", path.c_str());
    return 1;
  }
  std::stringstream ss;
  ss << in.rdbuf();

  mv::Viewport viewport = mv::Viewport::idle();
  std::string err;
  if (!mv::parseViewportConfig(ss.str(), viewport, &err)) {
    std::fprintf(stderr, "resolve_demo: %s: %s\n", path.c_str(), err.c_str());
    return 1;
  }

  std::printf("viewport: %s\n", mv::serializeViewportConfig(viewport).c_str());
  std::printf("layout:   %s\n", mv::toString(direction));

  mv::ResolvedState state = mv::resolveViewport(viewport, direction, safeArea);

  if (mv::isNoState(state)) {
    std::printf("resolved: nothing (camera under user control)\n");
  } else if (const auto* cam = std::get_if<mv::CameraParameters>(&state)) {
    std::printf("resolved: camera\n");
    if (cam->options.center)
      std::printf("  %-16s lat=%.6f lng=%.6f\n", "center",
                  cam->options.center->latitude, cam->options.center->longitude);
    if (cam->options.anchor)
      std::printf("  %-16s x=%.1f y=%.1f\n", "anchor",
                  cam->options.anchor->x, cam->options.anchor->y);
    printOptional("zoom", cam->options.zoom);
    printOptional("bearing", cam->options.bearing);
    printOptional("pitch", cam->options.pitch);
    printInsets("padding", cam->options.padding.value_or(mv::Insets{}));
  } else if (const auto* req = std::get_if<mv::StyleDefaultRequest>(&state)) {
    std::printf("resolved: style default\n");
    printInsets("padding", req->padding);
  } else if (const auto* ov = std::get_if<mv::OverviewParameters>(&state)) {
    std::printf("resolved: overview of %s\n", mv::toString(ov->geometry.type()));
    printInsets("padding", ov->padding);
    printInsets("geometryPadding", ov->geometryPadding);
    std::printf("  %-16s %.3f\n", "bearing", ov->bearing);
    std::printf("  %-16s %.3f\n", "pitch", ov->pitch);
    printOptional("maxZoom", ov->maxZoom);
    if (ov->offset) std::printf("  %-16s x=%.1f y=%.1f\n", "offset", ov->offset->x, ov->offset->y);
    std::printf("  %-16s %.3f\n", "duration", ov->animationDuration);
  } else if (const auto* fp = std::get_if<mv::FollowPuckParameters>(&state)) {
    std::printf("resolved: follow puck\n");
    printInsets("padding", fp->padding);
    std::printf("  %-16s %.3f\n", "zoom", fp->zoom);
    if (fp->bearing.isHeading()) std::printf("  %-16s heading\n", "bearing");
    else std::printf("  %-16s %.3f\n", "bearing", fp->bearing.degrees());
    std::printf("  %-16s %.3f\n", "pitch", fp->pitch);
  }

  return 0;
}

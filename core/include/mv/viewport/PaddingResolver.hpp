#pragma once
#include "mv/inset/EdgeInsets.hpp"
#include "mv/viewport/Viewport.hpp"

namespace mv {

// Final padding handed to the engine:
//   safe area (directional -> abstract), ignored edges zeroed, user insets added,
//   converted back to directional.
// Ignoring runs before the addition so an ignored edge keeps its user inset.
Insets resolvePadding(const InsetOptions& options,
                      LayoutDirection direction,
                      const Insets& safeAreaInsets);

} // namespace mv

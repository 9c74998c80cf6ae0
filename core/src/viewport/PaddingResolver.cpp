#include "mv/viewport/PaddingResolver.hpp"

namespace mv {

Insets resolvePadding(const InsetOptions& options,
                      LayoutDirection direction,
                      const Insets& safeAreaInsets) {
  EdgeInsets result = toAbstract(safeAreaInsets, direction);

  for (const auto& m : edgeInsetMapping()) {
    if (options.ignoredSafeAreaEdges.contains(m.edge)) result.*(m.field) = 0.0;
  }

  result += options.insets;

  return toDirectional(result, direction);
}

} // namespace mv

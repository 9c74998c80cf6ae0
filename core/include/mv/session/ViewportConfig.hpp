#pragma once
#include "mv/viewport/Viewport.hpp"

#include <string>

namespace mv {

// Declarative viewport configuration in JSON, e.g.
//   {"mode":"camera","center":[2.35,48.85],"zoom":12,
//    "insets":{"top":10},"ignoredSafeAreaEdges":["top"]}
// Coordinates use GeoJSON [lng, lat] order.

// Serialize a viewport value to a JSON string. Unset camera fields are omitted.
std::string serializeViewportConfig(const Viewport& viewport);

// Parse a JSON viewport description. Returns false on error and leaves `out` untouched.
// When `error` is null, the reason is logged to stderr instead.
bool parseViewportConfig(const std::string& json, Viewport& out, std::string* error = nullptr);

} // namespace mv

#pragma once
#include <cstdint>
#include <variant>
#include <vector>

namespace mv {

// World coordinate in degrees.
struct LatLng {
  double latitude{0};
  double longitude{0};
};

// Screen-space point in logical pixels, 0=left/top.
struct ScreenPoint {
  double x{0};
  double y{0};
};

inline bool operator==(const LatLng& a, const LatLng& b) {
  return a.latitude == b.latitude && a.longitude == b.longitude;
}
inline bool operator!=(const LatLng& a, const LatLng& b) { return !(a == b); }

inline bool operator==(const ScreenPoint& a, const ScreenPoint& b) {
  return a.x == b.x && a.y == b.y;
}
inline bool operator!=(const ScreenPoint& a, const ScreenPoint& b) { return !(a == b); }

// ---- Geometry kinds ----
// Kept as plain coordinate containers; bounding/projection math belongs to the engine.

struct Point {
  LatLng coordinate;
};

struct LineString {
  std::vector<LatLng> coordinates;
};

struct Polygon {
  std::vector<std::vector<LatLng>> rings;  // first ring is the outer ring
};

struct MultiPoint {
  std::vector<LatLng> coordinates;
};

struct MultiLineString {
  std::vector<std::vector<LatLng>> lines;
};

struct MultiPolygon {
  std::vector<std::vector<std::vector<LatLng>>> polygons;
};

inline bool operator==(const Point& a, const Point& b) { return a.coordinate == b.coordinate; }
inline bool operator==(const LineString& a, const LineString& b) { return a.coordinates == b.coordinates; }
inline bool operator==(const Polygon& a, const Polygon& b) { return a.rings == b.rings; }
inline bool operator==(const MultiPoint& a, const MultiPoint& b) { return a.coordinates == b.coordinates; }
inline bool operator==(const MultiLineString& a, const MultiLineString& b) { return a.lines == b.lines; }
inline bool operator==(const MultiPolygon& a, const MultiPolygon& b) { return a.polygons == b.polygons; }

enum class GeometryType : std::uint8_t {
  Point,
  LineString,
  Polygon,
  MultiPoint,
  MultiLineString,
  MultiPolygon
};

inline const char* toString(GeometryType t) {
  switch (t) {
    case GeometryType::Point: return "Point";
    case GeometryType::LineString: return "LineString";
    case GeometryType::Polygon: return "Polygon";
    case GeometryType::MultiPoint: return "MultiPoint";
    case GeometryType::MultiLineString: return "MultiLineString";
    case GeometryType::MultiPolygon: return "MultiPolygon";
    default: return "unknown";
  }
}

// Opaque geometry value consumed by the overview viewport.
// Implicitly constructible from every geometry kind (the GeometryConvertible contract).
class Geometry {
public:
  using Storage = std::variant<Point, LineString, Polygon,
                               MultiPoint, MultiLineString, MultiPolygon>;

  Geometry() = default;
  Geometry(const Point& g) : storage_(g) {}
  Geometry(const LineString& g) : storage_(g) {}
  Geometry(const Polygon& g) : storage_(g) {}
  Geometry(const MultiPoint& g) : storage_(g) {}
  Geometry(const MultiLineString& g) : storage_(g) {}
  Geometry(const MultiPolygon& g) : storage_(g) {}

  GeometryType type() const { return static_cast<GeometryType>(storage_.index()); }
  const Storage& storage() const { return storage_; }

  template <typename T>
  const T* as() const { return std::get_if<T>(&storage_); }

  friend bool operator==(const Geometry& a, const Geometry& b) { return a.storage_ == b.storage_; }
  friend bool operator!=(const Geometry& a, const Geometry& b) { return !(a == b); }

private:
  Storage storage_{Point{}};
};

// ---- GeometryConvertible ----

inline Geometry toGeometry(const Geometry& g) { return g; }
inline Geometry toGeometry(const LatLng& c) { return Point{c}; }
inline Geometry toGeometry(const Point& g) { return g; }
inline Geometry toGeometry(const LineString& g) { return g; }
inline Geometry toGeometry(const Polygon& g) { return g; }
inline Geometry toGeometry(const MultiPoint& g) { return g; }
inline Geometry toGeometry(const MultiLineString& g) { return g; }
inline Geometry toGeometry(const MultiPolygon& g) { return g; }

} // namespace mv

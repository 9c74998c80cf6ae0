#include "mv/session/ViewportConfig.hpp"

#include <cstdio>
#include <cstring>
#include <optional>
#include <utility>
#include <vector>

#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

namespace mv {

namespace {

using Alloc = rapidjson::Document::AllocatorType;

// ---- Writing ----

rapidjson::Value writePair(double a, double b, Alloc& alloc) {
  rapidjson::Value arr(rapidjson::kArrayType);
  arr.PushBack(a, alloc);
  arr.PushBack(b, alloc);
  return arr;
}

rapidjson::Value writePosition(const LatLng& c, Alloc& alloc) {
  return writePair(c.longitude, c.latitude, alloc);
}

rapidjson::Value writePositions(const std::vector<LatLng>& coords, Alloc& alloc) {
  rapidjson::Value arr(rapidjson::kArrayType);
  for (const auto& c : coords) arr.PushBack(writePosition(c, alloc), alloc);
  return arr;
}

rapidjson::Value writeRings(const std::vector<std::vector<LatLng>>& rings, Alloc& alloc) {
  rapidjson::Value arr(rapidjson::kArrayType);
  for (const auto& r : rings) arr.PushBack(writePositions(r, alloc), alloc);
  return arr;
}

rapidjson::Value writeGeometry(const Geometry& g, Alloc& alloc) {
  rapidjson::Value obj(rapidjson::kObjectType);
  obj.AddMember("type", rapidjson::StringRef(toString(g.type())), alloc);

  rapidjson::Value coords;
  switch (g.type()) {
    case GeometryType::Point:
      coords = writePosition(g.as<Point>()->coordinate, alloc);
      break;
    case GeometryType::LineString:
      coords = writePositions(g.as<LineString>()->coordinates, alloc);
      break;
    case GeometryType::Polygon:
      coords = writeRings(g.as<Polygon>()->rings, alloc);
      break;
    case GeometryType::MultiPoint:
      coords = writePositions(g.as<MultiPoint>()->coordinates, alloc);
      break;
    case GeometryType::MultiLineString:
      coords = writeRings(g.as<MultiLineString>()->lines, alloc);
      break;
    case GeometryType::MultiPolygon: {
      coords.SetArray();
      for (const auto& poly : g.as<MultiPolygon>()->polygons)
        coords.PushBack(writeRings(poly, alloc), alloc);
      break;
    }
  }
  obj.AddMember("coordinates", coords, alloc);
  return obj;
}

rapidjson::Value writeEdgeInsets(const EdgeInsets& e, Alloc& alloc) {
  rapidjson::Value obj(rapidjson::kObjectType);
  for (const auto& m : edgeInsetMapping()) {
    obj.AddMember(rapidjson::StringRef(toString(m.edge)), e.*(m.field), alloc);
  }
  return obj;
}

void addOptional(rapidjson::Value& obj, const char* key,
                 const std::optional<double>& v, Alloc& alloc) {
  if (v) obj.AddMember(rapidjson::StringRef(key), *v, alloc);
}

// ---- Reading ----

struct Reader {
  std::string error;

  bool fail(const std::string& msg) {
    if (error.empty()) error = msg;
    return false;
  }

  bool readNumber(const rapidjson::Value& obj, const char* key, double& out) {
    if (!obj.HasMember(key)) return true;
    const auto& v = obj[key];
    if (!v.IsNumber()) return fail(std::string("'") + key + "' must be a number");
    out = v.GetDouble();
    return true;
  }

  bool readOptional(const rapidjson::Value& obj, const char* key, std::optional<double>& out) {
    if (!obj.HasMember(key)) return true;
    double v = 0.0;
    if (!readNumber(obj, key, v)) return false;
    out = v;
    return true;
  }

  bool readPair(const rapidjson::Value& v, const char* what, double& a, double& b) {
    if (!v.IsArray() || v.Size() < 2 || !v[0].IsNumber() || !v[1].IsNumber())
      return fail(std::string("'") + what + "' must be an array of two numbers");
    a = v[0].GetDouble();
    b = v[1].GetDouble();
    return true;
  }

  bool readScreenPoint(const rapidjson::Value& v, const char* what, ScreenPoint& out) {
    if (v.IsArray() && v.Size() != 2)
      return fail(std::string("'") + what + "' must be an array of two numbers");
    return readPair(v, what, out.x, out.y);
  }

  bool readPosition(const rapidjson::Value& v, LatLng& out) {
    return readPair(v, "position", out.longitude, out.latitude);
  }

  bool readPositions(const rapidjson::Value& v, std::vector<LatLng>& out) {
    if (!v.IsArray()) return fail("'coordinates' must be an array of positions");
    for (const auto& p : v.GetArray()) {
      LatLng c;
      if (!readPosition(p, c)) return false;
      out.push_back(c);
    }
    return true;
  }

  bool readRings(const rapidjson::Value& v, std::vector<std::vector<LatLng>>& out) {
    if (!v.IsArray()) return fail("'coordinates' must be an array of position arrays");
    for (const auto& r : v.GetArray()) {
      std::vector<LatLng> ring;
      if (!readPositions(r, ring)) return false;
      out.push_back(std::move(ring));
    }
    return true;
  }

  bool readGeometry(const rapidjson::Value& v, Geometry& out) {
    if (!v.IsObject()) return fail("'geometry' must be an object");
    if (!v.HasMember("type") || !v["type"].IsString())
      return fail("'geometry.type' must be a string");
    if (!v.HasMember("coordinates")) return fail("'geometry.coordinates' is required");

    const char* type = v["type"].GetString();
    const auto& coords = v["coordinates"];

    if (std::strcmp(type, "Point") == 0) {
      Point g;
      if (!readPosition(coords, g.coordinate)) return false;
      out = g;
    } else if (std::strcmp(type, "LineString") == 0) {
      LineString g;
      if (!readPositions(coords, g.coordinates)) return false;
      out = g;
    } else if (std::strcmp(type, "Polygon") == 0) {
      Polygon g;
      if (!readRings(coords, g.rings)) return false;
      out = g;
    } else if (std::strcmp(type, "MultiPoint") == 0) {
      MultiPoint g;
      if (!readPositions(coords, g.coordinates)) return false;
      out = g;
    } else if (std::strcmp(type, "MultiLineString") == 0) {
      MultiLineString g;
      if (!readRings(coords, g.lines)) return false;
      out = g;
    } else if (std::strcmp(type, "MultiPolygon") == 0) {
      if (!coords.IsArray()) return fail("'coordinates' must be an array of polygons");
      MultiPolygon g;
      for (const auto& p : coords.GetArray()) {
        std::vector<std::vector<LatLng>> rings;
        if (!readRings(p, rings)) return false;
        g.polygons.push_back(std::move(rings));
      }
      out = g;
    } else {
      return fail(std::string("unknown geometry type '") + type + "'");
    }
    return true;
  }

  bool readEdgeInsets(const rapidjson::Value& obj, const char* key, EdgeInsets& out) {
    if (!obj.HasMember(key)) return true;
    const auto& v = obj[key];
    if (!v.IsObject()) return fail(std::string("'") + key + "' must be an object");
    for (const auto& m : edgeInsetMapping()) {
      if (!readNumber(v, toString(m.edge), out.*(m.field))) return false;
    }
    return true;
  }

  bool readEdge(const rapidjson::Value& v, Edge& out) {
    if (v.IsString()) {
      for (const auto& m : edgeInsetMapping()) {
        if (std::strcmp(v.GetString(), toString(m.edge)) == 0) {
          out = m.edge;
          return true;
        }
      }
      return fail(std::string("unknown edge '") + v.GetString() + "'");
    }
    return fail("edge names must be strings");
  }

  bool readEdgeSet(const rapidjson::Value& obj, const char* key, EdgeSet& out) {
    if (!obj.HasMember(key)) return true;
    const auto& v = obj[key];
    if (!v.IsArray()) return fail(std::string("'") + key + "' must be an array");
    for (const auto& e : v.GetArray()) {
      Edge edge = Edge::Top;
      if (!readEdge(e, edge)) return false;
      out.insert(edge);
    }
    return true;
  }

  bool readCamera(const rapidjson::Value& doc, Viewport& out) {
    std::optional<LatLng> center;
    std::optional<ScreenPoint> anchor;
    std::optional<double> zoom, bearing, pitch;

    if (doc.HasMember("center")) {
      LatLng c;
      if (!readPair(doc["center"], "center", c.longitude, c.latitude)) return false;
      center = c;
    }
    if (doc.HasMember("anchor")) {
      ScreenPoint p;
      if (!readScreenPoint(doc["anchor"], "anchor", p)) return false;
      anchor = p;
    }
    if (!readOptional(doc, "zoom", zoom)) return false;
    if (!readOptional(doc, "bearing", bearing)) return false;
    if (!readOptional(doc, "pitch", pitch)) return false;

    out = Viewport::camera(center, anchor, zoom, bearing, pitch);
    return true;
  }

  bool readOverview(const rapidjson::Value& doc, Viewport& out) {
    if (!doc.HasMember("geometry")) return fail("overview requires 'geometry'");
    Geometry geometry;
    if (!readGeometry(doc["geometry"], geometry)) return false;

    double bearing = 0.0, pitch = 0.0;
    EdgeInsets geometryPadding;
    std::optional<double> maxZoom;
    std::optional<ScreenPoint> offset;

    if (!readNumber(doc, "bearing", bearing)) return false;
    if (!readNumber(doc, "pitch", pitch)) return false;
    if (!readEdgeInsets(doc, "geometryPadding", geometryPadding)) return false;
    if (!readOptional(doc, "maxZoom", maxZoom)) return false;
    if (doc.HasMember("offset")) {
      ScreenPoint p;
      if (!readScreenPoint(doc["offset"], "offset", p)) return false;
      offset = p;
    }

    out = Viewport::overview(geometry, bearing, pitch, geometryPadding, maxZoom, offset);
    return true;
  }

  bool readFollowPuck(const rapidjson::Value& doc, Viewport& out) {
    if (!doc.HasMember("zoom")) return fail("followPuck requires 'zoom'");
    double zoom = 0.0, pitch = 0.0;
    if (!readNumber(doc, "zoom", zoom)) return false;
    if (!readNumber(doc, "pitch", pitch)) return false;

    FollowPuckBearing bearing = FollowPuckBearing::constant(0);
    if (doc.HasMember("bearing")) {
      const auto& b = doc["bearing"];
      if (b.IsNumber()) {
        bearing = FollowPuckBearing::constant(b.GetDouble());
      } else if (b.IsString() && std::strcmp(b.GetString(), "heading") == 0) {
        bearing = FollowPuckBearing::heading();
      } else {
        return fail("'bearing' must be a number or \"heading\"");
      }
    }

    out = Viewport::followPuck(zoom, bearing, pitch);
    return true;
  }
};

} // namespace

std::string serializeViewportConfig(const Viewport& viewport) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  doc.AddMember("mode", rapidjson::StringRef(toString(viewport.mode())), alloc);

  if (auto cam = viewport.cameraOptions()) {
    if (cam->center) doc.AddMember("center", writePosition(*cam->center, alloc), alloc);
    if (cam->anchor) doc.AddMember("anchor", writePair(cam->anchor->x, cam->anchor->y, alloc), alloc);
    addOptional(doc, "zoom", cam->zoom, alloc);
    addOptional(doc, "bearing", cam->bearing, alloc);
    addOptional(doc, "pitch", cam->pitch, alloc);
  } else if (auto ov = viewport.overviewOptions()) {
    doc.AddMember("geometry", writeGeometry(ov->geometry, alloc), alloc);
    doc.AddMember("bearing", ov->bearing, alloc);
    doc.AddMember("pitch", ov->pitch, alloc);
    doc.AddMember("geometryPadding", writeEdgeInsets(ov->geometryPadding, alloc), alloc);
    addOptional(doc, "maxZoom", ov->maxZoom, alloc);
    if (ov->offset) doc.AddMember("offset", writePair(ov->offset->x, ov->offset->y, alloc), alloc);
  } else if (auto fp = viewport.followPuckOptions()) {
    doc.AddMember("zoom", fp->zoom, alloc);
    if (fp->bearing.isHeading()) {
      doc.AddMember("bearing", "heading", alloc);
    } else {
      doc.AddMember("bearing", fp->bearing.degrees(), alloc);
    }
    doc.AddMember("pitch", fp->pitch, alloc);
  }

  const auto& insetOpts = viewport.insetOptions();
  doc.AddMember("insets", writeEdgeInsets(insetOpts.insets, alloc), alloc);

  rapidjson::Value ignored(rapidjson::kArrayType);
  for (const auto& m : edgeInsetMapping()) {
    if (insetOpts.ignoredSafeAreaEdges.contains(m.edge))
      ignored.PushBack(rapidjson::StringRef(toString(m.edge)), alloc);
  }
  doc.AddMember("ignoredSafeAreaEdges", ignored, alloc);

  // Numbers are not range-checked; non-finite values go out as Infinity/NaN tokens.
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer, rapidjson::UTF8<>, rapidjson::UTF8<>,
                    rapidjson::CrtAllocator, rapidjson::kWriteNanAndInfFlag> writer(sb);
  if (!doc.Accept(writer)) {
    std::fprintf(stderr, "[ViewportConfig] serialize failed\n");
    return std::string();
  }
  return sb.GetString();
}

bool parseViewportConfig(const std::string& json, Viewport& out, std::string* error) {
  Reader r;
  rapidjson::Document doc;
  doc.Parse<rapidjson::kParseNanAndInfFlag>(json.c_str());

  bool ok = false;
  Viewport result = Viewport::idle();

  if (doc.HasParseError() || !doc.IsObject()) {
    r.fail("malformed JSON");
  } else if (!doc.HasMember("mode") || !doc["mode"].IsString()) {
    r.fail("'mode' must be a string");
  } else {
    const char* mode = doc["mode"].GetString();
    if (std::strcmp(mode, "idle") == 0) {
      ok = true;
    } else if (std::strcmp(mode, "styleDefault") == 0) {
      result = Viewport::styleDefault();
      ok = true;
    } else if (std::strcmp(mode, "camera") == 0) {
      ok = r.readCamera(doc, result);
    } else if (std::strcmp(mode, "overview") == 0) {
      ok = r.readOverview(doc, result);
    } else if (std::strcmp(mode, "followPuck") == 0) {
      ok = r.readFollowPuck(doc, result);
    } else {
      r.fail(std::string("unknown mode '") + mode + "'");
    }
  }

  if (ok) {
    InsetOptions insetOpts;
    ok = r.readEdgeInsets(doc, "insets", insetOpts.insets) &&
         r.readEdgeSet(doc, "ignoredSafeAreaEdges", insetOpts.ignoredSafeAreaEdges);
    if (ok) result = result.inset(insetOpts.insets, insetOpts.ignoredSafeAreaEdges);
  }

  if (!ok) {
    if (error) {
      *error = r.error;
    } else {
      std::fprintf(stderr, "[ViewportConfig] rejected: %s\n", r.error.c_str());
    }
    return false;
  }

  out = result;
  return true;
}

} // namespace mv

#pragma once

#include <optional>
#include <variant>
#include <vector>

#include "internal/util/time.hpp"

namespace airspace::model {

struct LatLng {
  double lat_degrees = 0;
  double lng_degrees = 0;
};

// Vertex ring; the closing edge back to the first vertex is implicit.
struct Polygon {
  std::vector<LatLng> vertices;
};

struct Circle {
  LatLng center;
  double radius_meters = 0;
};

using Footprint = std::variant<Polygon, Circle>;

struct Volume3D {
  std::optional<Footprint> footprint;
  std::optional<double>    altitude_lower;
  std::optional<double>    altitude_upper;
};

struct Volume4D {
  Volume3D                       spatial_volume;
  std::optional<util::TimePoint> starts_at;
  std::optional<util::TimePoint> ends_at;
};

} // namespace airspace::model

#include "covering.hpp"

#include <s2/s1angle.h>
#include <s2/s2cap.h>
#include <s2/s2cell_union.h>
#include <s2/s2earth.h>
#include <s2/s2error.h>
#include <s2/s2latlng.h>
#include <s2/s2loop.h>
#include <s2/s2polygon.h>
#include <s2/s2region_coverer.h>

#include <cmath>
#include <memory>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace airspace::geo {

namespace {

S2Point ToPoint(const model::LatLng& ll) {
  if (!std::isfinite(ll.lat_degrees) || !std::isfinite(ll.lng_degrees)) {
    throw util::InvalidInput("footprint: non-finite coordinate");
  }
  const S2LatLng s2 = S2LatLng::FromDegrees(ll.lat_degrees, ll.lng_degrees);
  if (!s2.is_valid()) {
    throw util::InvalidInput("footprint: coordinate out of range (" + std::to_string(ll.lat_degrees) + ", " + std::to_string(ll.lng_degrees) + ")");
  }
  return s2.ToPoint();
}

void CheckArea(double steradians, const CoveringPolicy& policy) {
  const double km2 = S2Earth::SteradiansToSquareKm(steradians);
  if (km2 > policy.max_area_km2) {
    throw util::InvalidInput("footprint: area too large (" + std::to_string(km2) + " km2 > " + std::to_string(policy.max_area_km2) + " km2)");
  }
}

model::CellSet CoverRegion(const S2Region& region, const CoveringPolicy& policy) {
  S2RegionCoverer::Options options;
  options.set_min_level(policy.min_level);
  options.set_max_level(policy.max_level);
  options.set_level_mod(policy.level_mod);
  options.set_max_cells(policy.max_cells);

  S2RegionCoverer   coverer(options);
  const S2CellUnion covering = coverer.GetCovering(region);

  model::CellSet cells;
  cells.reserve(covering.cell_ids().size());
  for (const S2CellId& id : covering.cell_ids()) {
    cells.push_back(static_cast<model::CellId>(id.id()));
  }
  if (cells.empty()) throw util::InvalidInput("footprint: empty covering");
  return model::NormalizeCells(std::move(cells));
}

model::CellSet CoverPolygon(const model::Polygon& polygon, const CoveringPolicy& policy) {
  std::vector<S2Point> points;
  points.reserve(polygon.vertices.size());
  for (const auto& vertex : polygon.vertices) {
    S2Point p = ToPoint(vertex);
    if (!points.empty() && points.back() == p) continue;
    points.push_back(p);
  }
  // An explicitly closed ring repeats its first vertex.
  if (points.size() > 1 && points.front() == points.back()) points.pop_back();

  if (points.size() < 3) throw util::InvalidInput("footprint: polygon needs at least 3 distinct vertices");

  auto loop = std::make_unique<S2Loop>(points, S2Debug::DISABLE);
  S2Error error;
  if (loop->FindValidationError(&error)) {
    throw util::InvalidInput("footprint: invalid polygon: " + std::string(error.text()));
  }
  // Either winding order is accepted; the smaller of the two regions is meant.
  loop->Normalize();
  CheckArea(loop->GetArea(), policy);

  const S2Polygon region(std::move(loop), S2Debug::DISABLE);
  return CoverRegion(region, policy);
}

model::CellSet CoverCircle(const model::Circle& circle, const CoveringPolicy& policy) {
  if (!std::isfinite(circle.radius_meters) || circle.radius_meters <= 0) {
    throw util::InvalidInput("footprint: circle radius must be positive");
  }
  const S2Cap cap(ToPoint(circle.center), S2Earth::MetersToAngle(circle.radius_meters));
  CheckArea(cap.GetArea(), policy);
  return CoverRegion(cap, policy);
}

} // namespace

CoveringEngine::CoveringEngine(CoveringPolicy policy) : policy_(policy) {
}

model::CellSet CoveringEngine::Cover(const model::Footprint& footprint) const {
  if (const auto* polygon = std::get_if<model::Polygon>(&footprint)) return CoverPolygon(*polygon, policy_);
  return CoverCircle(std::get<model::Circle>(footprint), policy_);
}

model::CellSet CoveringEngine::Cover(const model::Volume3D& volume) const {
  if (!volume.footprint) throw util::InvalidInput("volume: missing footprint");
  if (volume.altitude_lower && volume.altitude_upper && *volume.altitude_lower > *volume.altitude_upper) {
    throw util::InvalidInput("volume: altitude_lower exceeds altitude_upper");
  }
  return Cover(*volume.footprint);
}

model::SearchFilter CoveringEngine::MakeSearchFilter(const model::Volume4D& volume) const {
  if (volume.starts_at && volume.ends_at && *volume.ends_at < *volume.starts_at) {
    throw util::InvalidInput("volume: ends_at precedes starts_at");
  }

  model::SearchFilter filter;
  filter.cells          = Cover(volume.spatial_volume);
  filter.altitude_lower = volume.spatial_volume.altitude_lower;
  filter.altitude_upper = volume.spatial_volume.altitude_upper;
  filter.starts_at      = volume.starts_at;
  filter.ends_at        = volume.ends_at;
  return filter;
}

} // namespace airspace::geo

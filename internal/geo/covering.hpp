#pragma once

#include "internal/model/cells.hpp"
#include "internal/model/search_filter.hpp"
#include "internal/model/volume.hpp"

namespace airspace::geo {

/*
  Covering resolution and size limits.

  The defaults index every footprint at S2 level 13 (roughly 1 km cells).
*/
struct CoveringPolicy {
  int    min_level    = 13;
  int    max_level    = 13;
  int    level_mod    = 1;
  int    max_cells    = 100000;
  double max_area_km2 = 2500;
};

/*
  Footprint -> sorted, deduplicated, non-empty set of S2 cell ids.

  Throws util::InvalidInput for degenerate footprints (fewer than 3 distinct
  vertices, self-intersecting rings, non-finite or out-of-range coordinates,
  non-positive radius), for footprints larger than max_area_km2, and when
  the covering comes out empty.
*/
class CoveringEngine {
 public:
  explicit CoveringEngine(CoveringPolicy policy = {});

  const CoveringPolicy& policy() const {
    return policy_;
  }

  model::CellSet Cover(const model::Footprint& footprint) const;

  // Altitude bounds do not change the covering; they are checked for order.
  model::CellSet Cover(const model::Volume3D& volume) const;

  // Covering of the footprint plus the volume's altitude and time bounds.
  model::SearchFilter MakeSearchFilter(const model::Volume4D& volume) const;

 private:
  CoveringPolicy policy_;
};

} // namespace airspace::geo

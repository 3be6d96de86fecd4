#pragma once

#include <cstdint>
#include <vector>

namespace airspace::model {

// S2 cell id stored in its signed 64-bit form (the backends have no unsigned type).
using CellId = int64_t;

/*
  Discrete footprint approximation.

  Kept sorted ascending and free of duplicates so equal coverings compare
  equal and storage is idempotent under retries.
*/
using CellSet = std::vector<CellId>;

CellSet NormalizeCells(CellSet cells);

bool CellsIntersect(const CellSet& a, const CellSet& b);

} // namespace airspace::model

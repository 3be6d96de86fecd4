#include "cells.hpp"

#include <algorithm>

namespace airspace::model {

CellSet NormalizeCells(CellSet cells) {
  std::sort(cells.begin(), cells.end());
  cells.erase(std::unique(cells.begin(), cells.end()), cells.end());
  return cells;
}

bool CellsIntersect(const CellSet& a, const CellSet& b) {
  auto ia = a.begin();
  auto ib = b.begin();
  while (ia != a.end() && ib != b.end()) {
    if (*ia == *ib) return true;
    if (*ia < *ib) {
      ++ia;
    } else {
      ++ib;
    }
  }
  return false;
}

} // namespace airspace::model

#pragma once

#include <algorithm>
#include <optional>

#include "grid_item.h"

namespace dashgrid {

// Rectangles are half-open: items that only touch along an edge do not
// overlap.

// Do the two items share any row band, regardless of columns.
inline bool vertically_overlaps(const GridItem &a, const GridItem &b) {
  return a.y < b.bottom() && b.y < a.bottom();
}

// Do the two items share any column band, regardless of rows.
inline bool horizontally_overlaps(const GridItem &a, const GridItem &b) {
  return a.x < b.right() && b.x < a.right();
}

inline bool overlaps(const GridItem &a, const GridItem &b) {
  return horizontally_overlaps(a, b) && vertically_overlaps(a, b);
}

// One past the lowest occupied row, 0 for an empty layout. `exclude_id`
// is left out, as if already lifted off the grid.
inline int max_occupied_row(const Layout &layout,
                            const std::optional<ComponentId> &exclude_id = {}) {
  int max_row = 0;
  for (const GridItem &item : layout) {
    if (exclude_id && item.component_id == *exclude_id)
      continue;
    max_row = std::max(max_row, item.bottom());
  }
  return max_row;
}

} // namespace dashgrid

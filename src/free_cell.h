#pragma once

#include <algorithm>
#include <optional>

#include "geometry.h"
#include "grid_config.h"
#include "grid_item.h"
#include "logging.h"

namespace dashgrid {

struct Cell {
  int x = 0;
  int y = 0;

  bool operator==(const Cell &) const = default;
};

// Is the rectangle (x, y, width, height) inside the grid and clear of every
// item except `exclude_id`.
inline bool can_place(const Layout &layout, int x, int y, int width,
                      int height, const GridConfig &config,
                      const std::optional<ComponentId> &exclude_id = {}) {
  if (x < 0 || y < 0 || width < 1 || height < 1)
    return false;
  if (x + width > config.columns || height > config.max_component_height)
    return false;

  GridItem probe{.x = x, .y = y, .width = width, .height = height};
  return std::none_of(layout.begin(), layout.end(), [&](const GridItem &i) {
    if (exclude_id && i.component_id == *exclude_id)
      return false;
    return overlaps(probe, i);
  });
}

// Column-locked search: keeps `target.x` and slides down from `target.y`
// to the first row where the rectangle fits, giving up past the lowest
// item other than `exclude_id` plus `height` and the slack rows. A drop
// never jumps sideways.
inline std::optional<Cell>
find_free_cell(const Layout &layout, Cell target, int width, int height,
               const GridConfig &config,
               const std::optional<ComponentId> &exclude_id = {}) {
  // x never changes, so a column range outside the grid can never fit
  if (target.x < 0 || target.x + width > config.columns)
    return std::nullopt;

  // A target below this window is refused rather than honoured.
  const int last_row = max_occupied_row(layout, exclude_id) + height +
                       config.search_slack_rows;

  for (int y = target.y; y <= last_row; y++) {
    if (can_place(layout, target.x, y, width, height, config, exclude_id)) {
      if (y != target.y) {
        log_trace("free cell for {}x{} at column {} slid from row {} to {}",
                  width, height, target.x, target.y, y);
      }
      return Cell{target.x, y};
    }
  }
  return std::nullopt;
}

} // namespace dashgrid

#pragma once

#include <algorithm>

#include "free_cell.h"
#include "grid_config.h"
#include "grid_item.h"
#include "layout_result.h"
#include "logging.h"

namespace dashgrid {

// Appends `item` at the first free row at or below (item.x, item.y).
inline LayoutResult add_item(const Layout &layout, const GridItem &item,
                             const GridConfig &config) {
  if (layout.contains(item.component_id)) {
    log_warn("add rejected: {} is already in the layout", item.component_id);
    return LayoutResult::rejected(layout);
  }

  auto cell = find_free_cell(layout, Cell{item.x, item.y}, item.width,
                             item.height, config);
  if (!cell) {
    log_info("add rejected: no room for {} ({}x{}) in column {}",
             item.component_id, item.width, item.height, item.x);
    return LayoutResult::rejected(layout);
  }

  Layout next = layout;
  GridItem placed = item;
  placed.x = cell->x;
  placed.y = cell->y;
  next.items.push_back(placed);
  return LayoutResult::ok(std::move(next));
}

// Nothing else moves, there is no gravity to re-apply.
inline LayoutResult remove_item(const Layout &layout, const ComponentId &id) {
  Layout next = layout;
  std::erase_if(next.items,
                [&](const GridItem &i) { return i.component_id == id; });
  return LayoutResult::ok(std::move(next));
}

inline LayoutResult reposition_item(const Layout &layout, const ComponentId &id,
                                    int new_x, int new_y,
                                    const GridConfig &config) {
  auto idx = layout.index_of(id);
  if (!idx) {
    log_warn("reposition: no component {}", id);
    return LayoutResult::not_found(layout);
  }

  const GridItem &moving = layout.items[*idx];
  auto cell = find_free_cell(layout, Cell{new_x, new_y}, moving.width,
                             moving.height, config, id);
  if (!cell) {
    log_info("reposition rejected: {} does not fit in column {}", id, new_x);
    return LayoutResult::rejected(layout);
  }

  Layout next = layout;
  next.items[*idx].x = cell->x;
  next.items[*idx].y = cell->y;
  return LayoutResult::ok(std::move(next));
}

} // namespace dashgrid

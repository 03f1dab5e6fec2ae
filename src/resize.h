#pragma once

#include <algorithm>
#include <vector>

#include "cascade.h"
#include "grid_config.h"
#include "grid_item.h"
#include "layout_result.h"
#include "logging.h"

namespace dashgrid {

// Right edge drag. The left edge stays put; anything in the way is pushed
// right, and the whole resize is refused if that pushes something (or the
// resized item itself) past the last column.
inline LayoutResult resize_width(const Layout &layout, const ComponentId &id,
                                 int new_width, const GridConfig &config) {
  auto idx = layout.index_of(id);
  if (!idx) {
    log_warn("resize_width: no component {}", id);
    return LayoutResult::not_found(layout);
  }

  Layout next = layout;
  GridItem &resized = next.items[*idx];
  resized.width = std::clamp(new_width, 1, config.columns);

  if (resized.x < 0 || resized.right() > config.columns) {
    log_info("resize_width rejected: {} would end at column {}", id,
             resized.right());
    return LayoutResult::rejected(layout);
  }
  if (!detail::collides(next.items, *idx))
    return LayoutResult::ok(std::move(next));

  const CascadeBounds bounds{.lower = 0, .upper = config.columns};
  const bool settled =
      cascade(next.items, *idx, std::vector<bool>(next.size(), false), Axis::x,
              PushDirection::forward, bounds);
  if (!settled ||
      std::any_of(next.begin(), next.end(), [&](const GridItem &i) {
        return i.right() > config.columns;
      })) {
    log_info("resize_width rejected: widening {} to {} pushes past column {}",
             id, resized.width, config.columns);
    return LayoutResult::rejected(layout);
  }
  return LayoutResult::ok(std::move(next));
}

// Left edge drag. The right edge is fixed, so the width follows `new_x`.
// Mirrors resize_width with the push going left and column 0 as the wall.
inline LayoutResult resize_left_edge(const Layout &layout,
                                     const ComponentId &id, int new_x,
                                     const GridConfig &config) {
  auto idx = layout.index_of(id);
  if (!idx) {
    log_warn("resize_left_edge: no component {}", id);
    return LayoutResult::not_found(layout);
  }

  Layout next = layout;
  GridItem &resized = next.items[*idx];
  const int right = resized.right();
  resized.x = std::clamp(new_x, 0, right - 1);
  resized.width = right - resized.x;

  if (!detail::collides(next.items, *idx))
    return LayoutResult::ok(std::move(next));

  const CascadeBounds bounds{.lower = 0, .upper = config.columns};
  const bool settled =
      cascade(next.items, *idx, std::vector<bool>(next.size(), false), Axis::x,
              PushDirection::backward, bounds);
  if (!settled || std::any_of(next.begin(), next.end(),
                              [](const GridItem &i) { return i.x < 0; })) {
    log_info("resize_left_edge rejected: moving {} to column {} pushes past "
             "column 0",
             id, resized.x);
    return LayoutResult::rejected(layout);
  }
  return LayoutResult::ok(std::move(next));
}

// Bottom edge drag. The grid has no floor, so this never rejects: growing
// into occupied rows pushes the occupants (and everything stacked under
// them) down.
inline LayoutResult resize_height(const Layout &layout, const ComponentId &id,
                                  int new_height, const GridConfig &config) {
  auto idx = layout.index_of(id);
  if (!idx) {
    log_warn("resize_height: no component {}", id);
    return LayoutResult::not_found(layout);
  }

  Layout next = layout;
  GridItem &resized = next.items[*idx];
  const int old_height = resized.height;
  const int old_bottom = resized.bottom();
  resized.height = std::clamp(new_height, 1, config.max_component_height);

  // shrinking only vacates rows
  if (resized.height <= old_height || !detail::collides(next.items, *idx))
    return LayoutResult::ok(std::move(next));

  std::vector<bool> pushed(next.size(), false);
  pushed[*idx] = true;
  push_down(next.items, *idx, old_bottom, pushed);

  // A chain of pushes with different deltas can still leave two displaced
  // items touching; settle those with a plain downward cascade.
  // Unbounded below and moves only go down, so this cannot fail.
  cascade(next.items, *idx, std::move(pushed), Axis::y, PushDirection::forward,
          CascadeBounds{});
  return LayoutResult::ok(std::move(next));
}

} // namespace dashgrid

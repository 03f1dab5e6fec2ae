#pragma once

#include <algorithm>
#include <cstddef>
#include <numeric>
#include <optional>
#include <vector>

#include "geometry.h"
#include "grid_item.h"
#include "logging.h"

namespace dashgrid {

enum struct Axis {
  x = 0,
  y = 1,
};

enum struct PushDirection {
  // toward larger coordinates (right on x, down on y)
  forward,
  // toward smaller coordinates (left on x)
  backward,
};

namespace detail {

inline int &position(GridItem &item, Axis axis) {
  return axis == Axis::x ? item.x : item.y;
}
inline int position(const GridItem &item, Axis axis) {
  return axis == Axis::x ? item.x : item.y;
}
inline int extent(const GridItem &item, Axis axis) {
  return axis == Axis::x ? item.width : item.height;
}
inline int far_edge(const GridItem &item, Axis axis) {
  return position(item, axis) + extent(item, axis);
}

// Does `item` collide with anything else in `items`.
inline bool collides(const std::vector<GridItem> &items, std::size_t index) {
  for (std::size_t i = 0; i < items.size(); i++) {
    if (i != index && overlaps(items[i], items[index]))
      return true;
  }
  return false;
}

// Of an overlapping pair, the one further along the push direction gives
// way. On a tie the item that has not moved yet gives way, so a pushed item
// keeps its new slot and shoves whatever it landed on.
inline bool gives_way(const GridItem &candidate, bool candidate_pushed,
                      const GridItem &other, bool other_pushed, Axis axis,
                      PushDirection dir) {
  const int a = dir == PushDirection::forward ? position(candidate, axis)
                                              : -far_edge(candidate, axis);
  const int b = dir == PushDirection::forward ? position(other, axis)
                                              : -far_edge(other, axis);
  if (a != b)
    return a > b;
  return !candidate_pushed || other_pushed;
}

} // namespace detail

struct CascadeBounds {
  int lower = 0;
  std::optional<int> upper;

  [[nodiscard]] bool contains(const GridItem &item, Axis axis) const {
    if (detail::position(item, axis) < lower)
      return false;
    return !upper || detail::far_edge(item, axis) <= *upper;
  }
};

// Domino push along one axis, iterated to a fixed point.
//
// `pushed` marks the items allowed to push (the resized item plus anything
// already displaced). Any overlap involving a pusher is resolved by moving
// the other item flush against it, which makes that item a pusher too.
// Overlap is the full rectangle test, so a pushed item that spans more rows
// (or columns) than the trigger carries the push into bands the trigger
// never touched. `source` never moves.
//
// Every move is strictly in `dir`, so the loop terminates. Returns false as
// soon as an item is pushed outside `bounds`; `items` is then a partial
// result the caller must discard.
inline bool cascade(std::vector<GridItem> &items, std::size_t source,
                    std::vector<bool> pushed, Axis axis, PushDirection dir,
                    const CascadeBounds &bounds) {
  using detail::position;

  pushed[source] = true;
  std::vector<std::size_t> order(items.size());
  std::iota(order.begin(), order.end(), 0);

  bool changed = true;
  while (changed) {
    changed = false;
    // ascending x for a forward push, descending right edge for a backward one
    std::stable_sort(order.begin(), order.end(),
                     [&](std::size_t a, std::size_t b) {
                       if (dir == PushDirection::forward)
                         return position(items[a], axis) <
                                position(items[b], axis);
                       return detail::far_edge(items[a], axis) >
                              detail::far_edge(items[b], axis);
                     });

    for (std::size_t pusher : order) {
      if (!pushed[pusher])
        continue;
      for (std::size_t other : order) {
        if (other == pusher || !overlaps(items[pusher], items[other]))
          continue;

        std::size_t mover = other;
        std::size_t anchor = pusher;
        if (other == source ||
            (pusher != source &&
             !detail::gives_way(items[other], pushed[other], items[pusher],
                                pushed[pusher], axis, dir))) {
          std::swap(mover, anchor);
        }

        GridItem &moved = items[mover];
        const GridItem &fixed = items[anchor];
        position(moved, axis) =
            dir == PushDirection::forward
                ? detail::far_edge(fixed, axis)
                : position(fixed, axis) - detail::extent(moved, axis);
        pushed[mover] = true;
        changed = true;

        log_trace("cascade: {} pushed by {} to ({}, {})", moved.component_id,
                  fixed.component_id, moved.x, moved.y);

        if (!bounds.contains(moved, axis))
          return false;
      }
    }
  }
  return true;
}

// Recursive downward push used when an item grows taller.
//
// `source` has just moved its bottom edge from `old_bottom` to its current
// bottom. Every unpushed item sharing a column with it is moved once:
// items whose top lies in the newly claimed band (or that straddle the old
// bottom) land flush on the new bottom, items fully below shift by the same
// delta. Each moved item then pushes in turn with its own columns, which is
// how the push fans out past the trigger's width.
inline void push_down(std::vector<GridItem> &items, std::size_t source,
                      int old_bottom, std::vector<bool> &pushed) {
  const GridItem src = items[source];
  const int new_bottom = src.bottom();
  const int delta = new_bottom - old_bottom;
  if (delta <= 0)
    return;

  std::vector<std::size_t> order(items.size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(),
                   [&](std::size_t a, std::size_t b) {
                     return items[a].y < items[b].y;
                   });

  for (std::size_t idx : order) {
    if (idx == source || pushed[idx])
      continue;
    GridItem &item = items[idx];
    if (!horizontally_overlaps(src, item))
      continue;

    const int top = item.y;
    const int bottom = item.bottom();
    int new_top = top;
    if (top >= old_bottom && top < new_bottom) {
      new_top = new_bottom;
    } else if (top >= old_bottom) {
      new_top = top + delta;
    } else if (top < new_bottom && bottom > old_bottom) {
      new_top = new_bottom;
    } else {
      continue;
    }

    item.y = new_top;
    pushed[idx] = true;
    log_trace("push_down: {} pushed by {} from row {} to {}",
              item.component_id, src.component_id, top, new_top);
    push_down(items, idx, bottom, pushed);
  }
}

} // namespace dashgrid

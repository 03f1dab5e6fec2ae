#pragma once

#include <cstddef>
#include <format>
#include <string>
#include <vector>

#include <magic_enum/magic_enum.hpp>

#include "geometry.h"
#include "grid_config.h"
#include "grid_item.h"

namespace dashgrid {

// Names double as the wire names of the violation kinds.
enum struct ViolationKind {
  overlap,
  out_of_bounds,
  invalid_dimensions,
};

struct Violation {
  ViolationKind kind = ViolationKind::overlap;
  std::string message;
  std::vector<ComponentId> affected_ids;

  bool operator==(const Violation &) const = default;
};

inline std::string to_string(ViolationKind kind) {
  return std::string(magic_enum::enum_name(kind));
}

namespace detail {
inline std::string describe(const GridItem &item) {
  return std::format("{} ({},{} {}x{})", item.component_id, item.x, item.y,
                     item.width, item.height);
}
} // namespace detail

// Independent re-check of the grid invariants. Does not know (or trust)
// which operation produced the layout; anything reported on an engine
// result is an engine defect.
inline std::vector<Violation> validate_layout(const Layout &layout,
                                              const GridConfig &config) {
  std::vector<Violation> violations;
  const auto &items = layout.items;

  for (std::size_t i = 0; i < items.size(); i++) {
    for (std::size_t j = i + 1; j < items.size(); j++) {
      const GridItem &a = items[i];
      const GridItem &b = items[j];
      if (!overlaps(a, b))
        continue;
      violations.push_back(Violation{
          .kind = ViolationKind::overlap,
          .message = std::format("Overlap: {} and {}", detail::describe(a),
                                 detail::describe(b)),
          .affected_ids = {a.component_id, b.component_id},
      });
    }
  }

  for (const GridItem &item : items) {
    if (item.right() > config.columns) {
      violations.push_back(Violation{
          .kind = ViolationKind::out_of_bounds,
          .message = std::format("Out of bounds: {} x:{} + w:{} = {} > {}",
                                 item.component_id, item.x, item.width,
                                 item.right(), config.columns),
          .affected_ids = {item.component_id},
      });
    }

    if (item.x < 0 || item.y < 0 || item.width < 1 || item.height < 1 ||
        item.height > config.max_component_height) {
      violations.push_back(Violation{
          .kind = ViolationKind::invalid_dimensions,
          .message = std::format("Invalid dimensions: {}",
                                 detail::describe(item)),
          .affected_ids = {item.component_id},
      });
    }
  }

  return violations;
}

} // namespace dashgrid

#pragma once

#include <cstddef>
#include <vector>

#include "../grid_config.h"
#include "../grid_item.h"
#include "../logging.h"

namespace dashgrid {

// Row based format used before items carried their own geometry.
struct LegacyItem {
  ComponentId component_id;
  ComponentType component_type;
};

struct LegacyRow {
  std::vector<LegacyItem> items;
};

// One shot conversion: each row's items split the grid width evenly (the
// leading items absorb the remainder), one row per legacy row, height 1.
// No placement logic runs, so the result is not validated here.
inline Layout migrate_legacy_rows(const std::vector<LegacyRow> &rows,
                                  const GridConfig &config) {
  Layout layout;
  for (std::size_t row = 0; row < rows.size(); row++) {
    const auto &items = rows[row].items;
    const int count = static_cast<int>(items.size());
    if (count == 0)
      continue;
    if (count > config.columns) {
      log_warn("legacy row {} has {} items for {} columns", row, count,
               config.columns);
    }

    const int base_width = config.columns / count;
    const int remainder = config.columns % count;
    int x = 0;
    for (int i = 0; i < count; i++) {
      const int width = base_width + (i < remainder ? 1 : 0);
      layout.items.push_back(GridItem{
          .component_id = items[i].component_id,
          .component_type = items[i].component_type,
          .x = x,
          .y = static_cast<int>(row),
          .width = width,
          .height = 1,
      });
      x += width;
    }
  }
  log_info("migrated {} legacy rows into {} items", rows.size(),
           layout.size());
  return layout;
}

} // namespace dashgrid

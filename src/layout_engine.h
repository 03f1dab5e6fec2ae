#pragma once

#include "grid_config.h"
#include "grid_item.h"
#include "layout_result.h"
#include "placement.h"
#include "resize.h"
#include "validator.h"

namespace dashgrid {

// Stateless front door to the layout operations. Every call takes the whole
// current layout and returns a new one; nothing is cached between calls, so
// one engine can serve any number of layouts that share a grid.
struct LayoutEngine {
  GridConfig config;

  LayoutEngine() = default;
  explicit LayoutEngine(GridConfig cfg) : config(cfg) {}

  [[nodiscard]] LayoutResult add(const Layout &layout,
                                 const GridItem &item) const {
    return add_item(layout, item, config);
  }

  [[nodiscard]] LayoutResult remove(const Layout &layout,
                                    const ComponentId &id) const {
    return remove_item(layout, id);
  }

  [[nodiscard]] LayoutResult reposition(const Layout &layout,
                                        const ComponentId &id, int x,
                                        int y) const {
    return reposition_item(layout, id, x, y, config);
  }

  [[nodiscard]] LayoutResult resize_width(const Layout &layout,
                                          const ComponentId &id,
                                          int width) const {
    return dashgrid::resize_width(layout, id, width, config);
  }

  [[nodiscard]] LayoutResult resize_left_edge(const Layout &layout,
                                              const ComponentId &id,
                                              int x) const {
    return dashgrid::resize_left_edge(layout, id, x, config);
  }

  [[nodiscard]] LayoutResult resize_height(const Layout &layout,
                                           const ComponentId &id,
                                           int height) const {
    return dashgrid::resize_height(layout, id, height, config);
  }

  [[nodiscard]] std::vector<Violation> validate(const Layout &layout) const {
    return validate_layout(layout, config);
  }
};

} // namespace dashgrid

#pragma once

#include <algorithm>
#include <cstddef>
#include <format>
#include <string>
#include <string_view>
#include <vector>

#include "../geometry.h"
#include "../grid_config.h"
#include "../grid_item.h"
#include "../validator.h"

namespace dashgrid {

namespace detail {
inline char item_label(std::size_t index) {
  constexpr std::string_view labels =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
  return labels[index % labels.size()];
}
} // namespace detail

// One character per cell, one line per row. Items are labelled by their
// position in the layout (A, B, ...), free cells are '.', and cells claimed
// by more than one item are '#'. Cells outside the grid are dropped.
inline std::string to_ascii(const Layout &layout, const GridConfig &config) {
  const int rows = max_occupied_row(layout);
  std::vector<std::string> grid(static_cast<std::size_t>(rows),
                                std::string(config.columns, '.'));

  for (std::size_t i = 0; i < layout.items.size(); i++) {
    const GridItem &item = layout.items[i];
    for (int y = std::max(item.y, 0); y < item.bottom(); y++) {
      for (int x = std::max(item.x, 0);
           x < std::min(item.right(), config.columns); x++) {
        char &cell = grid[y][x];
        cell = cell == '.' ? detail::item_label(i) : '#';
      }
    }
  }

  std::string out;
  for (const auto &line : grid) {
    out += line;
    out += '\n';
  }
  return out;
}

// Legend for to_ascii, one item per line.
inline std::string describe_layout(const Layout &layout) {
  std::string out;
  for (std::size_t i = 0; i < layout.items.size(); i++) {
    const GridItem &item = layout.items[i];
    out += std::format("{} {} [{}] ({},{} {}x{})\n", detail::item_label(i),
                       item.component_id, item.component_type, item.x, item.y,
                       item.width, item.height);
  }
  return out;
}

inline std::string describe_violations(const std::vector<Violation> &found) {
  std::string out;
  for (const Violation &v : found) {
    out += std::format("{}: {}\n", to_string(v.kind), v.message);
  }
  return out;
}

} // namespace dashgrid

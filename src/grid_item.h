#pragma once

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace dashgrid {

using ComponentId = std::string;
// Tag from a caller-extensible set (see ComponentCatalog). The engine only
// carries it through.
using ComponentType = std::string;

struct GridItem {
  ComponentId component_id;
  ComponentType component_type;
  int x = 0;
  int y = 0;
  int width = 1;
  int height = 1;

  [[nodiscard]] int right() const { return x + width; }
  [[nodiscard]] int bottom() const { return y + height; }

  bool operator==(const GridItem &) const = default;
};

inline std::ostream &operator<<(std::ostream &os, const GridItem &item) {
  os << item.component_id << " (" << item.x << "," << item.y << " "
     << item.width << "x" << item.height << ")";
  return os;
}

// An ordered set of grid items addressed by id. Operations never hand out
// indices; every lookup goes through the component id.
struct Layout {
  std::vector<GridItem> items;

  Layout() = default;
  Layout(std::initializer_list<GridItem> init) : items(init) {}
  explicit Layout(std::vector<GridItem> from) : items(std::move(from)) {}

  [[nodiscard]] std::optional<std::size_t>
  index_of(const ComponentId &id) const {
    auto it = std::find_if(items.begin(), items.end(), [&](const GridItem &i) {
      return i.component_id == id;
    });
    if (it == items.end())
      return std::nullopt;
    return static_cast<std::size_t>(std::distance(items.begin(), it));
  }

  [[nodiscard]] const GridItem *find(const ComponentId &id) const {
    auto idx = index_of(id);
    return idx ? &items[*idx] : nullptr;
  }

  [[nodiscard]] bool contains(const ComponentId &id) const {
    return index_of(id).has_value();
  }

  [[nodiscard]] std::size_t size() const { return items.size(); }
  [[nodiscard]] bool empty() const { return items.empty(); }

  auto begin() const { return items.begin(); }
  auto end() const { return items.end(); }

  bool operator==(const Layout &) const = default;
};

inline std::ostream &operator<<(std::ostream &os, const Layout &layout) {
  os << "[";
  for (std::size_t i = 0; i < layout.items.size(); i++) {
    if (i > 0)
      os << ", ";
    os << layout.items[i];
  }
  os << "]";
  return os;
}

} // namespace dashgrid

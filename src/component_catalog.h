#pragma once

#include <map>
#include <optional>
#include <vector>

#include "grid_item.h"

namespace dashgrid {

struct ComponentSize {
  int width = 1;
  int height = 1;

  bool operator==(const ComponentSize &) const = default;
};

// Known component types and the size a freshly added one gets.
struct ComponentCatalog {
  std::map<ComponentType, ComponentSize> default_sizes;

  static ComponentCatalog defaults() {
    ComponentCatalog catalog;
    catalog.register_type("Chart", {6, 2});
    catalog.register_type("Grid", {12, 3});
    catalog.register_type("KPI", {3, 1});
    catalog.register_type("StylizedKPIGraph", {4, 2});
    return catalog;
  }

  // Adds a type, or replaces the default size of an existing one.
  void register_type(const ComponentType &type, ComponentSize size) {
    default_sizes[type] = size;
  }

  [[nodiscard]] bool knows(const ComponentType &type) const {
    return default_sizes.contains(type);
  }

  [[nodiscard]] std::optional<ComponentSize>
  default_size(const ComponentType &type) const {
    auto it = default_sizes.find(type);
    if (it == default_sizes.end())
      return std::nullopt;
    return it->second;
  }

  [[nodiscard]] std::vector<ComponentType> types() const {
    std::vector<ComponentType> out;
    out.reserve(default_sizes.size());
    for (const auto &[type, _] : default_sizes)
      out.push_back(type);
    return out;
  }
};

} // namespace dashgrid

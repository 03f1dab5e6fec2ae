#pragma once

#include <ostream>
#include <utility>

#include "grid_item.h"

namespace dashgrid {

enum struct Outcome {
  applied,
  rejected,
  not_found,
};

inline std::ostream &operator<<(std::ostream &os, const Outcome &outcome) {
  switch (outcome) {
  case Outcome::applied:
    os << "applied";
    break;
  case Outcome::rejected:
    os << "rejected";
    break;
  case Outcome::not_found:
    os << "not_found";
    break;
  }
  return os;
}

// Result of one engine operation. Unless the outcome is `applied`, `layout`
// is the caller's input, untouched, so committing it is always safe.
struct LayoutResult {
  Outcome outcome = Outcome::applied;
  Layout layout;

  static LayoutResult ok(Layout next) {
    return LayoutResult{Outcome::applied, std::move(next)};
  }
  static LayoutResult rejected(Layout original) {
    return LayoutResult{Outcome::rejected, std::move(original)};
  }
  static LayoutResult not_found(Layout original) {
    return LayoutResult{Outcome::not_found, std::move(original)};
  }

  [[nodiscard]] bool was_applied() const {
    return outcome == Outcome::applied;
  }
  explicit operator bool() const { return was_applied(); }
};

} // namespace dashgrid

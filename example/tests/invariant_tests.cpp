#include <random>
#include <string>

#include <catch2/catch.hpp>
//
#include "../../dashgrid.h"
#include "../../src/plugins/layout_printer.h"
#include "test_helpers.h"

namespace dashgrid {
using test::get;
using test::item;

namespace {

struct RandomEditor {
  LayoutEngine engine;
  std::mt19937 rng;
  int next_id = 0;

  explicit RandomEditor(unsigned seed) : rng(seed) {}

  int roll(int lo, int hi) {
    return std::uniform_int_distribution<int>(lo, hi)(rng);
  }

  const ComponentId &pick(const Layout &layout) {
    return layout.items[static_cast<std::size_t>(
                            roll(0, static_cast<int>(layout.size()) - 1))]
        .component_id;
  }

  // One random edit. Checks the per-operation guarantees and returns the
  // layout to continue from.
  Layout step(const Layout &layout) {
    const int op = layout.size() < 3 ? 0 : roll(0, 5);
    switch (op) {
    case 0: {
      const int x = roll(0, engine.config.columns - 1);
      GridItem added = item("r" + std::to_string(next_id++), x, roll(0, 6),
                            roll(1, 6), roll(1, 4));
      auto result = engine.add(layout, added);
      if (x + added.width > engine.config.columns) {
        REQUIRE(result.outcome == Outcome::rejected);
      } else {
        REQUIRE(result);
        REQUIRE(get(result.layout, added.component_id).x == x);
        REQUIRE(get(result.layout, added.component_id).y >= added.y);
      }
      return settle(layout, result);
    }
    case 1: {
      if (layout.size() < 10)
        return layout;
      auto result = engine.remove(layout, pick(layout));
      REQUIRE(result);
      REQUIRE(result.layout.size() == layout.size() - 1);
      return settle(layout, result);
    }
    case 2: {
      const ComponentId id = pick(layout);
      const int x = roll(0, engine.config.columns - 1);
      auto result = engine.reposition(layout, id, x, roll(0, 8));
      if (result) {
        REQUIRE(get(result.layout, id).x == x);
        REQUIRE(get(result.layout, id).width == get(layout, id).width);
      }
      return settle(layout, result);
    }
    case 3: {
      const ComponentId id = pick(layout);
      auto result = engine.resize_width(layout, id, roll(1, 8));
      if (result)
        REQUIRE(get(result.layout, id).x == get(layout, id).x);
      return settle(layout, result);
    }
    case 4: {
      const ComponentId id = pick(layout);
      auto result = engine.resize_left_edge(layout, id, roll(-1, 11));
      REQUIRE(get(result.layout, id).right() == get(layout, id).right());
      return settle(layout, result);
    }
    default: {
      const ComponentId id = pick(layout);
      auto result = engine.resize_height(layout, id, roll(1, 6));
      REQUIRE(result.outcome == Outcome::applied);
      for (const GridItem &i : result.layout)
        REQUIRE(i.x == get(layout, i.component_id).x);
      return settle(layout, result);
    }
    }
  }

  Layout settle(const Layout &before, const LayoutResult &result) {
    if (!result.was_applied()) {
      REQUIRE(result.layout == before);
      return before;
    }
    auto violations = engine.validate(result.layout);
    INFO(describe_violations(violations));
    REQUIRE(violations.empty());
    return result.layout;
  }
};

} // namespace

TEST_CASE("RandomEditsNeverBreakTheLayout", "[Invariants]") {
  const unsigned seed = GENERATE(1u, 7u, 42u, 1337u);
  INFO("seed " << seed);
  RandomEditor editor(seed);

  Layout layout = test::sample_dashboard();
  for (int i = 0; i < 300; i++) {
    layout = editor.step(layout);
  }
  REQUIRE(editor.engine.validate(layout).empty());
}

} // namespace dashgrid

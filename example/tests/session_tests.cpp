#include <catch2/catch.hpp>
#include <trompeloeil.hpp>
//
#include "../../dashgrid.h"
#include "../../src/plugins/layout_history.h"
#include "../../src/plugins/layout_session.h"
#include "test_helpers.h"

namespace dashgrid {
using test::get;
using test::item;
using trompeloeil::_;

class LayoutListenerMock : public LayoutListener {
public:
  MAKE_MOCK2(on_applied, void(const LayoutChange &, const Layout &), override);
  MAKE_MOCK2(on_rejected, void(const LayoutChange &, Outcome), override);
  MAKE_MOCK1(on_violations, void(const std::vector<Violation> &), override);
};

static LayoutSession sample_session() {
  LayoutSession session;
  session.load(test::sample_dashboard());
  return session;
}

// ---------------- history ----------------

TEST_CASE("HistoryUndoRedoRestoresSnapshots", "[History]") {
  LayoutHistory history;
  Layout before{item("a", 0, 0, 2, 1)};
  Layout after{item("a", 0, 0, 4, 1)};
  Layout state = after;

  history.record(LayoutChange{ChangeKind::resize_width, "a"}, before, after);
  REQUIRE(history.next_undo_description() == "resize_width a");

  REQUIRE(history.undo(state));
  REQUIRE(state == before);
  REQUIRE(history.can_redo());

  REQUIRE(history.redo(state));
  REQUIRE(state == after);
  REQUIRE_FALSE(history.redo(state));
}

TEST_CASE("HistoryMergesOneGestureUntilSealed", "[History]") {
  LayoutHistory history;
  Layout l0{item("a", 0, 0, 2, 1)};
  Layout l1{item("a", 0, 0, 3, 1)};
  Layout l2{item("a", 0, 0, 4, 1)};
  Layout l3{item("a", 0, 0, 5, 1)};
  const LayoutChange drag{ChangeKind::resize_width, "a"};

  history.record(drag, l0, l1);
  history.record(drag, l1, l2);
  REQUIRE(history.undo_count() == 1);

  history.seal();
  history.record(drag, l2, l3);
  REQUIRE(history.undo_count() == 2);

  Layout state = l3;
  history.undo(state);
  REQUIRE(state == l2);
  history.undo(state);
  REQUIRE(state == l0);
}

TEST_CASE("HistoryDoesNotMergeAddsOrDifferentTargets", "[History]") {
  LayoutHistory history;
  Layout l0, l1{item("a", 0, 0, 1, 1)},
      l2{item("a", 0, 0, 1, 1), item("b", 1, 0, 1, 1)};

  history.record(LayoutChange{ChangeKind::add, "a"}, l0, l1);
  history.record(LayoutChange{ChangeKind::add, "b"}, l1, l2);
  history.record(LayoutChange{ChangeKind::resize_height, "a"}, l2, l2);
  history.record(LayoutChange{ChangeKind::resize_height, "b"}, l2, l2);
  REQUIRE(history.undo_count() == 4);
}

TEST_CASE("HistoryDropsTheOldestPastMaxDepth", "[History]") {
  LayoutHistory history(2);
  Layout l0, l1{item("a", 0, 0, 1, 1)};
  for (int i = 0; i < 5; i++) {
    history.record(LayoutChange{ChangeKind::remove, "a"}, l0, l1);
  }
  REQUIRE(history.undo_count() == 2);
}

// ---------------- session ----------------

TEST_CASE("SessionAddsCatalogComponentsWithGeneratedIds", "[Session]") {
  LayoutSession session;

  auto first = session.add_component("KPI", 0, 0);
  auto second = session.add_component("Chart", 0, 0);

  REQUIRE(first);
  REQUIRE(second);
  REQUIRE(get(session.layout(), "comp-101") == item("comp-101", 0, 0, 3, 1));
  REQUIRE(get(session.layout(), "comp-102") ==
          item("comp-102", 0, 1, 6, 2, "Chart"));
}

TEST_CASE("SessionSkipsGeneratedIdsAlreadyInUse", "[Session]") {
  LayoutSession session;
  session.load(Layout{item("comp-101", 0, 0, 3, 1)});

  REQUIRE(session.add_component("KPI", 3, 0));
  REQUIRE(session.layout().contains("comp-102"));
}

TEST_CASE("SessionCatalogIsExtensible", "[Session]") {
  LayoutSession session;
  REQUIRE_FALSE(session.add_component("Map", 0, 0));

  session.catalog().register_type("Map", {4, 4});
  REQUIRE(session.add_component("Map", 0, 0));
  REQUIRE(session.layout().items.back().width == 4);
  REQUIRE(session.layout().items.back().component_type == "Map");
}

TEST_CASE("SessionRejectionLeavesLayoutAndHistoryAlone", "[Session]") {
  LayoutSession session;
  session.load(Layout{item("a", 0, 0, 6, 2), item("b", 6, 0, 6, 1)});
  const Layout before = session.layout();

  auto result = session.resize_width("a", 8);

  REQUIRE(result.outcome == Outcome::rejected);
  REQUIRE(session.layout() == before);
  REQUIRE_FALSE(session.history().can_undo());
}

TEST_CASE("SessionUndoRewindsAWholeDrag", "[Session]") {
  LayoutSession session = sample_session();
  const Layout start = session.layout();

  session.resize_height("chart-a", 3);
  session.resize_height("chart-a", 4);
  session.resize_height("chart-a", 5);
  session.end_gesture();
  REQUIRE(get(session.layout(), "chart-a").height == 5);
  REQUIRE(get(session.layout(), "grid-d").y == 5);
  REQUIRE(session.history().undo_count() == 1);

  REQUIRE(session.undo());
  REQUIRE(session.layout() == start);
  REQUIRE(session.redo());
  REQUIRE(get(session.layout(), "chart-a").height == 5);
}

TEST_CASE("SessionNoOpsDoNotCreateUndoSteps", "[Session]") {
  LayoutSession session = sample_session();
  REQUIRE(session.remove("missing"));
  REQUIRE_FALSE(session.history().can_undo());
}

TEST_CASE("SessionReportsOutcomesToTheListener", "[Session]") {
  LayoutSession session = sample_session();
  LayoutListenerMock listener;
  session.set_listener(&listener);

  {
    REQUIRE_CALL(listener, on_applied(_, _))
        .WITH(_1.kind == ChangeKind::reposition &&
              _1.component_id == "chart-b")
        .WITH(_2.find("chart-b") != nullptr);
    REQUIRE(session.reposition("chart-b", 6, 0));
  }

  {
    REQUIRE_CALL(listener, on_rejected(_, Outcome::rejected))
        .WITH(_1.kind == ChangeKind::add);
    REQUIRE_FALSE(session.add(item("wide", 8, 0, 6, 1)));
  }

  {
    REQUIRE_CALL(listener, on_rejected(_, Outcome::not_found))
        .WITH(_1.component_id == "ghost");
    REQUIRE_FALSE(session.resize_height("ghost", 2));
  }
}

TEST_CASE("SessionWarnModeReportsViolationsOfLoadedLayouts", "[Session]") {
  LayoutSession session;
  LayoutListenerMock listener;
  session.set_listener(&listener);

  REQUIRE_CALL(listener, on_violations(_))
      .WITH(_1.size() == 1 && _1[0].kind == ViolationKind::overlap);
  session.load(Layout{item("a", 0, 0, 4, 2), item("b", 2, 1, 4, 2)});

  REQUIRE(session.violations().size() == 1);
}

TEST_CASE("SessionStrictModeThrowsOnDefects", "[Session]") {
  Settings settings;
  settings.validation.enable_strict_validation();
  LayoutSession session(settings);

  REQUIRE_THROWS_AS(session.load(Layout{item("a", 10, 0, 4, 1)}),
                    LayoutDefect);
  REQUIRE_NOTHROW(session.load(test::sample_dashboard()));
}

TEST_CASE("SessionSilentModeSkipsValidation", "[Session]") {
  Settings settings;
  settings.validation.disable_validation();
  LayoutSession session(settings);

  session.load(Layout{item("a", 10, 0, 4, 1)});
  REQUIRE(session.violations().empty());
}

TEST_CASE("SessionUsesTheConfiguredGrid", "[Session]") {
  Settings settings;
  settings.grid.columns = 24;
  LayoutSession session(settings);

  REQUIRE(session.add(item("a", 18, 0, 6, 1)));
  REQUIRE(session.resize_width("a", 20).outcome == Outcome::rejected);
  REQUIRE(session.resize_left_edge("a", 0));
  REQUIRE(get(session.layout(), "a") == item("a", 0, 0, 24, 1));
}

} // namespace dashgrid

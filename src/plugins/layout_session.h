#pragma once

#include <format>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../component_catalog.h"
#include "../grid_config.h"
#include "../grid_item.h"
#include "../layout_engine.h"
#include "../layout_result.h"
#include "../logging.h"
#include "../validator.h"
#include "layout_history.h"

namespace dashgrid {

// Thrown in strict validation mode when a committed layout breaks an
// invariant. The engine never produces one on its own; seeing this means
// either the engine has a defect or a broken layout was loaded.
struct LayoutDefect : std::logic_error {
  std::vector<Violation> violations;

  explicit LayoutDefect(std::vector<Violation> found)
      : std::logic_error(std::format("{} layout violation(s), first: {}",
                                     found.size(),
                                     found.empty() ? std::string()
                                                   : found.front().message)),
        violations(std::move(found)) {}
};

// Hooks for the presentation layer. Each outcome is reported exactly once.
struct LayoutListener {
  virtual ~LayoutListener() = default;

  virtual void on_applied(const LayoutChange &, const Layout &) {}
  virtual void on_rejected(const LayoutChange &, Outcome) {}
  virtual void on_violations(const std::vector<Violation> &) {}
};

// Caller side of the engine: owns the committed layout and feeds the engine
// one operation at a time, so results are always computed against the latest
// commit. Gestures are just repeated calls; end_gesture() closes the undo
// step they share.
class LayoutSession {
public:
  static constexpr int FIRST_GENERATED_ID = 101;

  explicit LayoutSession(Settings settings = {},
                         ComponentCatalog catalog = ComponentCatalog::defaults())
      : engine_(settings.grid), validation_(settings.validation),
        catalog_(std::move(catalog)) {}

  void set_listener(LayoutListener *listener) { listener_ = listener; }

  [[nodiscard]] const Layout &layout() const { return layout_; }
  [[nodiscard]] const GridConfig &grid() const { return engine_.config; }
  [[nodiscard]] const ComponentCatalog &catalog() const { return catalog_; }
  [[nodiscard]] ComponentCatalog &catalog() { return catalog_; }
  [[nodiscard]] const LayoutHistory &history() const { return history_; }
  [[nodiscard]] const std::vector<Violation> &violations() const {
    return violations_;
  }

  // Replaces the layout wholesale (file load, migration). Not undoable past
  // this point: history starts fresh.
  void load(Layout layout) {
    layout_ = std::move(layout);
    history_.clear();
    log_info("loaded layout with {} items", layout_.size());
    check_invariants();
  }

  // Palette drop: default size from the catalog and a generated id.
  LayoutResult add_component(const ComponentType &type, int x, int y) {
    auto size = catalog_.default_size(type);
    if (!size) {
      log_warn("add_component: unknown component type '{}'", type);
      return report(LayoutChange{ChangeKind::add, {}},
                    LayoutResult::rejected(layout_));
    }
    return add(GridItem{
        .component_id = next_component_id(),
        .component_type = type,
        .x = x,
        .y = y,
        .width = size->width,
        .height = size->height,
    });
  }

  LayoutResult add(const GridItem &item) {
    return commit(LayoutChange{ChangeKind::add, item.component_id},
                  engine_.add(layout_, item));
  }

  LayoutResult remove(const ComponentId &id) {
    return commit(LayoutChange{ChangeKind::remove, id},
                  engine_.remove(layout_, id));
  }

  LayoutResult reposition(const ComponentId &id, int x, int y) {
    return commit(LayoutChange{ChangeKind::reposition, id},
                  engine_.reposition(layout_, id, x, y));
  }

  LayoutResult resize_width(const ComponentId &id, int width) {
    return commit(LayoutChange{ChangeKind::resize_width, id},
                  engine_.resize_width(layout_, id, width));
  }

  LayoutResult resize_left_edge(const ComponentId &id, int x) {
    return commit(LayoutChange{ChangeKind::resize_left_edge, id},
                  engine_.resize_left_edge(layout_, id, x));
  }

  LayoutResult resize_height(const ComponentId &id, int height) {
    return commit(LayoutChange{ChangeKind::resize_height, id},
                  engine_.resize_height(layout_, id, height));
  }

  void end_gesture() { history_.seal(); }

  bool undo() {
    if (!history_.undo(layout_))
      return false;
    check_invariants();
    return true;
  }

  bool redo() {
    if (!history_.redo(layout_))
      return false;
    check_invariants();
    return true;
  }

  // comp-101, comp-102, ... skipping anything already in the layout
  [[nodiscard]] ComponentId next_component_id() {
    ComponentId id;
    do {
      id = std::format("comp-{}", id_counter_++);
    } while (layout_.contains(id));
    return id;
  }

private:
  LayoutEngine engine_;
  ValidationConfig validation_;
  ComponentCatalog catalog_;
  LayoutHistory history_;
  Layout layout_;
  std::vector<Violation> violations_;
  LayoutListener *listener_ = nullptr;
  int id_counter_ = FIRST_GENERATED_ID;

  LayoutResult commit(const LayoutChange &change, LayoutResult result) {
    if (!result.was_applied())
      return report(change, std::move(result));

    // a no-op (e.g. removing an absent id) still counts as applied but
    // leaves nothing to undo
    if (result.layout != layout_) {
      history_.record(change, layout_, result.layout);
      layout_ = result.layout;
    }
    log_trace("applied {}", change.describe());
    if (listener_)
      listener_->on_applied(change, layout_);
    check_invariants();
    return result;
  }

  LayoutResult report(const LayoutChange &change, LayoutResult result) {
    log_info("{} {}", change.describe(),
             result.outcome == Outcome::not_found ? "named an unknown component"
                                                  : "was rejected");
    if (listener_)
      listener_->on_rejected(change, result.outcome);
    return result;
  }

  void check_invariants() {
    if (!validation_.is_enabled()) {
      violations_.clear();
      return;
    }

    violations_ = engine_.validate(layout_);
    if (violations_.empty())
      return;

    for (const Violation &v : violations_) {
      if (validation_.is_strict())
        log_error("{}", v.message);
      else
        log_warn("{}", v.message);
    }
    if (listener_)
      listener_->on_violations(violations_);
    if (validation_.is_strict())
      throw LayoutDefect(violations_);
  }
};

} // namespace dashgrid

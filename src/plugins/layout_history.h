#pragma once

#include <cstddef>
#include <format>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <magic_enum/magic_enum.hpp>

#include "../grid_item.h"

namespace dashgrid {

enum struct ChangeKind {
  add,
  remove,
  reposition,
  resize_width,
  resize_left_edge,
  resize_height,
};

// Drags arrive as one call per pointer sample; these kinds collapse into a
// single undo step per gesture.
inline bool is_gesture_kind(ChangeKind kind) {
  return kind == ChangeKind::reposition || kind == ChangeKind::resize_width ||
         kind == ChangeKind::resize_left_edge ||
         kind == ChangeKind::resize_height;
}

struct LayoutChange {
  ChangeKind kind = ChangeKind::add;
  ComponentId component_id;

  [[nodiscard]] std::string describe() const {
    if (component_id.empty())
      return std::string(magic_enum::enum_name(kind));
    return std::format("{} {}", magic_enum::enum_name(kind), component_id);
  }

  bool operator==(const LayoutChange &) const = default;
};

/// A committed layout change, stored as the layouts on either side of it.
/// The engine is value based so snapshots are the whole story; there is no
/// inverse operation to compute.
struct LayoutCommand {
  LayoutChange change;
  Layout before;
  Layout after;
  // Set once the gesture that produced this command has ended.
  bool sealed = false;

  LayoutCommand(LayoutChange c, Layout b, Layout a)
      : change(std::move(c)), before(std::move(b)), after(std::move(a)) {}

  void execute(Layout &state) const { state = after; }
  void undo(Layout &state) const { state = before; }

  [[nodiscard]] std::string description() const { return change.describe(); }

  [[nodiscard]] bool can_merge_with(const LayoutCommand &next) const {
    return !sealed && is_gesture_kind(change.kind) && change == next.change;
  }

  // Keep the original `before` so one undo rewinds the whole gesture.
  void merge_with(const LayoutCommand &next) { after = next.after; }
};

/// Undo/redo stack over committed layouts.
struct LayoutHistory {
  using CommandPtr = std::unique_ptr<LayoutCommand>;

  std::vector<CommandPtr> undo_stack;
  std::vector<CommandPtr> redo_stack;
  std::size_t max_depth = 100;

  LayoutHistory() = default;
  explicit LayoutHistory(std::size_t depth) : max_depth(depth) {}

  /// Record a change that has already been committed.
  void push(CommandPtr cmd) {
    if (!undo_stack.empty() && undo_stack.back()->can_merge_with(*cmd)) {
      undo_stack.back()->merge_with(*cmd);
    } else {
      undo_stack.push_back(std::move(cmd));
      if (undo_stack.size() > max_depth) {
        undo_stack.erase(undo_stack.begin());
      }
    }
    redo_stack.clear();
  }

  void record(LayoutChange change, Layout before, Layout after) {
    push(std::make_unique<LayoutCommand>(std::move(change), std::move(before),
                                         std::move(after)));
  }

  /// Stop merging into the latest step (end of a drag).
  void seal() {
    if (!undo_stack.empty())
      undo_stack.back()->sealed = true;
  }

  bool undo(Layout &state) {
    if (undo_stack.empty())
      return false;

    auto cmd = std::move(undo_stack.back());
    undo_stack.pop_back();
    cmd->undo(state);
    cmd->sealed = true;
    redo_stack.push_back(std::move(cmd));
    return true;
  }

  bool redo(Layout &state) {
    if (redo_stack.empty())
      return false;

    auto cmd = std::move(redo_stack.back());
    redo_stack.pop_back();
    cmd->execute(state);
    undo_stack.push_back(std::move(cmd));
    return true;
  }

  [[nodiscard]] bool can_undo() const { return !undo_stack.empty(); }
  [[nodiscard]] bool can_redo() const { return !redo_stack.empty(); }
  [[nodiscard]] std::size_t undo_count() const { return undo_stack.size(); }
  [[nodiscard]] std::size_t redo_count() const { return redo_stack.size(); }

  /// e.g. "resize_width chart-a"
  [[nodiscard]] std::string next_undo_description() const {
    if (undo_stack.empty())
      return "";
    return undo_stack.back()->description();
  }

  [[nodiscard]] std::string next_redo_description() const {
    if (redo_stack.empty())
      return "";
    return redo_stack.back()->description();
  }

  void clear() {
    undo_stack.clear();
    redo_stack.clear();
  }
};

} // namespace dashgrid

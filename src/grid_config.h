#pragma once

namespace dashgrid {

// Grid dimensions shared by the engine and the validator. These are fixed
// for the lifetime of a layout; changing them under existing items is not
// supported.
struct GridConfig {
  static constexpr int DEFAULT_COLUMNS = 12;
  static constexpr int DEFAULT_MAX_COMPONENT_HEIGHT = 8;
  static constexpr int DEFAULT_SEARCH_SLACK_ROWS = 10;

  int columns = DEFAULT_COLUMNS;
  int max_component_height = DEFAULT_MAX_COMPONENT_HEIGHT;
  // Extra rows the free-cell search scans past the lowest occupied row.
  int search_slack_rows = DEFAULT_SEARCH_SLACK_ROWS;

  [[nodiscard]] bool is_sane() const {
    return columns >= 1 && max_component_height >= 1 &&
           search_slack_rows >= 0;
  }

  bool operator==(const GridConfig &) const = default;
};

// Severity mode for post-commit validation
enum struct ValidationMode {
  silent, // No checks
  warn,   // Log each violation (development default)
  strict  // Log and throw LayoutDefect (testing mode)
};

struct ValidationConfig {
  ValidationMode mode = ValidationMode::warn;

  [[nodiscard]] bool is_enabled() const {
    return mode != ValidationMode::silent;
  }
  [[nodiscard]] bool is_strict() const { return mode == ValidationMode::strict; }

  void enable_development_validation() { mode = ValidationMode::warn; }
  void enable_strict_validation() { mode = ValidationMode::strict; }
  void disable_validation() { mode = ValidationMode::silent; }
};

// Everything a session reads from its settings file.
struct Settings {
  GridConfig grid;
  ValidationConfig validation;
};

} // namespace dashgrid

#pragma once

#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <magic_enum/magic_enum.hpp>
#include <nlohmann/json.hpp>

#include "../grid_config.h"
#include "../grid_item.h"
#include "../logging.h"
#include "../validator.h"
#include "legacy_migration.h"

namespace dashgrid {

// --------- JSON adapters ----------
// Key names follow the interchange format, not the C++ member names.

inline void to_json(nlohmann::json &j, const GridItem &item) {
  j = nlohmann::json{
      {"componentId", item.component_id},
      {"componentType", item.component_type},
      {"x", item.x},
      {"y", item.y},
      {"width", item.width},
      {"height", item.height},
  };
}

inline void from_json(const nlohmann::json &j, GridItem &item) {
  j.at("componentId").get_to(item.component_id);
  j.at("componentType").get_to(item.component_type);
  j.at("x").get_to(item.x);
  j.at("y").get_to(item.y);
  j.at("width").get_to(item.width);
  j.at("height").get_to(item.height);
}

inline void to_json(nlohmann::json &j, const Layout &layout) {
  j = nlohmann::json(layout.items);
}

inline void from_json(const nlohmann::json &j, Layout &layout) {
  layout.items = j.get<std::vector<GridItem>>();
}

inline void from_json(const nlohmann::json &j, LegacyItem &item) {
  j.at("componentId").get_to(item.component_id);
  j.at("componentType").get_to(item.component_type);
}

inline void from_json(const nlohmann::json &j, LegacyRow &row) {
  j.at("items").get_to(row.items);
}

inline void to_json(nlohmann::json &j, const Violation &v) {
  j = nlohmann::json{
      {"type", std::string(magic_enum::enum_name(v.kind))},
      {"message", v.message},
      {"components", v.affected_ids},
  };
}

inline void to_json(nlohmann::json &j, const GridConfig &c) {
  j = nlohmann::json{
      {"columns", c.columns},
      {"maxComponentHeight", c.max_component_height},
      {"searchSlackRows", c.search_slack_rows},
  };
}

inline void from_json(const nlohmann::json &j, GridConfig &c) {
  // keep defaults for anything missing
  GridConfig tmp = c;
  if (j.contains("columns"))
    j.at("columns").get_to(tmp.columns);
  if (j.contains("maxComponentHeight"))
    j.at("maxComponentHeight").get_to(tmp.max_component_height);
  if (j.contains("searchSlackRows"))
    j.at("searchSlackRows").get_to(tmp.search_slack_rows);
  c = tmp;
}

// --------- Layouts ----------

// Accepts the current array-of-items shape, or the legacy
// {"rows": [{"items": [...]}]} shape which is migrated on the way in.
inline std::optional<Layout> parse_layout(std::string_view text,
                                          const GridConfig &config) {
  try {
    const auto j = nlohmann::json::parse(text);
    if (j.is_array())
      return j.get<Layout>();
    if (j.is_object() && j.contains("rows")) {
      log_info("reading legacy row layout");
      return migrate_legacy_rows(j.at("rows").get<std::vector<LegacyRow>>(),
                                 config);
    }
    log_error("layout json is neither an item array nor a legacy row list");
  } catch (const nlohmann::json::exception &e) {
    log_error("failed to read layout: {}", e.what());
  }
  return std::nullopt;
}

inline std::string dump_layout(const Layout &layout, int indent = 2) {
  return nlohmann::json(layout).dump(indent);
}

inline std::optional<Layout> load_layout_file(const std::filesystem::path &path,
                                              const GridConfig &config) {
  std::ifstream in(path);
  if (!in.is_open()) {
    log_error("cannot open layout file {}", path.string());
    return std::nullopt;
  }
  const std::string text((std::istreambuf_iterator<char>(in)),
                         std::istreambuf_iterator<char>());
  return parse_layout(text, config);
}

inline bool save_layout_file(const std::filesystem::path &path,
                             const Layout &layout) {
  std::ofstream out(path, std::ios::out | std::ios::trunc);
  if (!out.is_open()) {
    log_error("cannot write layout file {}", path.string());
    return false;
  }
  out << dump_layout(layout);
  return static_cast<bool>(out);
}

// --------- Settings ----------
// {"columns": 12, "maxComponentHeight": 8, "searchSlackRows": 10,
//  "validation": "warn"}

inline std::optional<Settings> parse_settings(std::string_view text) {
  Settings settings;
  try {
    const auto j = nlohmann::json::parse(text);
    j.get_to(settings.grid);
    if (j.contains("validation")) {
      const auto name = j.at("validation").get<std::string>();
      auto mode = magic_enum::enum_cast<ValidationMode>(name);
      if (!mode) {
        log_error("unknown validation mode '{}'", name);
        return std::nullopt;
      }
      settings.validation.mode = *mode;
    }
  } catch (const nlohmann::json::exception &e) {
    log_error("failed to read settings: {}", e.what());
    return std::nullopt;
  }

  if (!settings.grid.is_sane()) {
    log_error("settings rejected: columns={} maxComponentHeight={} "
              "searchSlackRows={}",
              settings.grid.columns, settings.grid.max_component_height,
              settings.grid.search_slack_rows);
    return std::nullopt;
  }
  return settings;
}

inline std::optional<Settings>
load_settings_file(const std::filesystem::path &path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    log_error("cannot open settings file {}", path.string());
    return std::nullopt;
  }
  const std::string text((std::istreambuf_iterator<char>(in)),
                         std::istreambuf_iterator<char>());
  return parse_settings(text);
}

inline std::string dump_settings(const Settings &settings, int indent = 2) {
  nlohmann::json j = settings.grid;
  j["validation"] = std::string(magic_enum::enum_name(settings.validation.mode));
  return j.dump(indent);
}

} // namespace dashgrid

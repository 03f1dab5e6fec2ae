#include <iostream>
#include <optional>
#include <string>

#include "../../dashgrid.h"
#include "../../src/plugins/layout_printer.h"
#include "../../src/plugins/layout_session.h"
#include "../../src/plugins/persistence.h"

using namespace dashgrid;

// Prints every outcome the session reports
struct PrintingListener : LayoutListener {
  const GridConfig *grid = nullptr;

  void on_applied(const LayoutChange &change, const Layout &layout) override {
    std::cout << "applied  " << change.describe() << std::endl;
    std::cout << to_ascii(layout, *grid) << std::endl;
  }

  void on_rejected(const LayoutChange &change, Outcome outcome) override {
    std::cout << outcome << " " << change.describe() << std::endl
              << std::endl;
  }

  void on_violations(const std::vector<Violation> &found) override {
    std::cout << describe_violations(found);
  }
};

static Layout default_dashboard() {
  return Layout{
      GridItem{"chart-a", "Chart", 0, 0, 6, 2},
      GridItem{"chart-b", "KPI", 6, 0, 6, 1},
      GridItem{"kpi-c", "StylizedKPIGraph", 6, 1, 6, 1},
      GridItem{"grid-d", "Grid", 0, 2, 12, 3},
  };
}

int main(int argc, char **argv) {
  Settings settings;
  if (argc > 2) {
    auto loaded = load_settings_file(argv[2]);
    if (!loaded) {
      std::cerr << "could not read settings from " << argv[2] << std::endl;
      return 1;
    }
    settings = *loaded;
  }

  Layout start = default_dashboard();
  if (argc > 1) {
    auto loaded = load_layout_file(argv[1], settings.grid);
    if (!loaded) {
      std::cerr << "could not read a layout from " << argv[1] << std::endl;
      return 1;
    }
    start = *loaded;
  }

  LayoutSession session(settings);
  PrintingListener listener;
  listener.grid = &session.grid();
  session.set_listener(&listener);

  std::cout << "=== Dashboard Grid Demo ===" << std::endl;
  try {
    session.load(start);
  } catch (const LayoutDefect &e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }
  std::cout << to_ascii(session.layout(), session.grid()) << std::endl
            << describe_layout(session.layout()) << std::endl;

  if (session.layout().empty()) {
    std::cout << "nothing to edit" << std::endl;
    return 0;
  }
  const ComponentId first = session.layout().items.front().component_id;

  std::cout << "1. Palette drop" << std::endl;
  session.add_component("KPI", 0, 0);

  std::cout << "2. Drag the bottom edge of " << first << std::endl;
  for (int h = 2; h <= 4; h++) {
    session.resize_height(first, h);
  }
  session.end_gesture();

  std::cout << "3. Drag the right edge of " << first << std::endl;
  session.resize_width(first, session.grid().columns);
  session.resize_width(first, 8);
  session.end_gesture();

  std::cout << "4. Drag the left edge of " << first << std::endl;
  session.resize_left_edge(first, 2);
  session.end_gesture();

  std::cout << "5. Move " << first << " to the top right" << std::endl;
  session.reposition(first, session.grid().columns - 1, 0);
  session.end_gesture();

  std::cout << "6. Undo the last " << session.history().undo_count()
            << " steps" << std::endl;
  while (session.undo()) {
  }
  std::cout << to_ascii(session.layout(), session.grid()) << std::endl;
  std::cout << (session.layout() == start ? "back to the loaded layout"
                                          : "undo did not restore the start")
            << std::endl;

  std::cout << std::endl << dump_layout(session.layout()) << std::endl;
  return 0;
}

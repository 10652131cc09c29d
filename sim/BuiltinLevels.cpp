#include "sim/Level.hpp"

#include "core/Log.hpp"

namespace {

template <int N>
void AddLevel(LevelCatalog &catalog, const LevelDefinitionInit &init,
              const char *const (&rows)[N]) {
  if (catalog.count >= kMaxCatalogLevels)
    return;
  if (!MakeLevelDefinition(catalog.levels[catalog.count], init, rows, N)) {
    LOG_ERROR("Built-in level '{}' does not fit, skipped", init.name);
    return;
  }
  ++catalog.count;
}

LevelCatalog BuildBuiltinCatalog() {
  LevelCatalog catalog{};

  // ===== 1: "Meet in the Middle" =====
  // Single corridor. Walk toward each other and step across.
  {
    const char *const rows[] = {
        "100002",
    };
    AddLevel(catalog, {"Meet in the Middle", Axis::X, Command::MoveRight, 3},
             rows);
  }

  // ===== 2: "Falling Together" =====
  // The only vertical level: left player starts on top, right player below.
  {
    const char *const rows[] = {
        "1",
        "0",
        "0",
        "2",
    };
    AddLevel(catalog, {"Falling Together", Axis::Y, Command::MoveDown, 2},
             rows);
  }

  // ===== 3: "Around the Edge" =====
  // Moving apart wraps both players straight to the seam.
  {
    const char *const rows[] = {
        "1000002.",
    };
    AddLevel(catalog, {"Around the Edge", Axis::X, Command::MoveRight, 2},
             rows);
  }

  // ===== 4: "Step Up" =====
  {
    const char *const rows[] = {
        "..0.",
        "0020",
        "1000",
    };
    AddLevel(catalog, {"Step Up", Axis::X, Command::MoveRight, 4}, rows);
  }

  // ===== 5: "Staircase" =====
  {
    const char *const rows[] = {
        "...002",
        ".00000",
        ".10000",
    };
    AddLevel(catalog, {"Staircase", Axis::X, Command::MoveRight, 3}, rows);
  }

  // ===== 6: "Crossroads" =====
  {
    const char *const rows[] = {
        "..00..",
        "001020",
        "..00..",
    };
    AddLevel(catalog, {"Crossroads", Axis::X, Command::MoveRight, 4}, rows);
  }

  return catalog;
}

} // namespace

const LevelCatalog &GetBuiltinCatalog() {
  static const LevelCatalog catalog = BuildBuiltinCatalog();
  return catalog;
}

int WrapLevelIndex(const LevelCatalog &catalog, const int index) {
  if (catalog.count <= 0)
    return 0;
  const int wrapped = index % catalog.count;
  return (wrapped < 0) ? wrapped + catalog.count : wrapped;
}

int ValidateCatalog(const LevelCatalog &catalog) {
  int failed = 0;
  LevelLayout layout{};
  for (int i = 0; i < catalog.count; ++i) {
    const LayoutError err = BuildLevelLayout(catalog.levels[i], layout);
    if (err != LayoutError::None) {
      LOG_ERROR("Level {} '{}' is invalid: {}", i, catalog.levels[i].name,
                GetLayoutErrorLabel(err));
      ++failed;
    }
  }
  return failed;
}

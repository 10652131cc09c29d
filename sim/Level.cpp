#include "sim/Level.hpp"

#include <cstdio>
#include <cstring>

#include "core/Log.hpp"

namespace {

int RowLength(const char *row) {
  // Rows are at most kMaxGridWidth chars plus the terminator; anything longer
  // means the buffer was filled without one.
  return static_cast<int>(strnlen(row, kMaxGridWidth + 1));
}

} // namespace

const char *GetCommandLabel(const Command c) {
  switch (c) {
  case Command::MoveLeft:
    return "MoveLeft";
  case Command::MoveRight:
    return "MoveRight";
  case Command::MoveUp:
    return "MoveUp";
  case Command::MoveDown:
    return "MoveDown";
  case Command::AdvanceLevelDebug:
    return "AdvanceLevelDebug";
  case Command::AcknowledgeWin:
    return "AcknowledgeWin";
  case Command::AnimationComplete:
    return "AnimationComplete";
  case Command::None:
    break;
  }
  return "None";
}

Command ParseCommandLabel(const char *label) {
  if (label == nullptr)
    return Command::None;
  const Command all[] = {Command::MoveLeft,          Command::MoveRight,
                         Command::MoveUp,            Command::MoveDown,
                         Command::AdvanceLevelDebug, Command::AcknowledgeWin,
                         Command::AnimationComplete};
  for (const Command c : all) {
    if (std::strcmp(label, GetCommandLabel(c)) == 0)
      return c;
  }
  return Command::None;
}

const char *GetLayoutErrorLabel(const LayoutError e) {
  switch (e) {
  case LayoutError::None:
    return "none";
  case LayoutError::EmptyLayout:
    return "layout has zero width or height";
  case LayoutError::TooLarge:
    return "layout exceeds the maximum grid size";
  case LayoutError::OddSplitDimension:
    return "split dimension must be even";
  case LayoutError::MissingStart:
    return "layout is missing a start cell";
  case LayoutError::DuplicateStart:
    return "layout has more than one start cell per player";
  case LayoutError::StartOutsideHalf:
    return "start cell lies outside its player's half";
  case LayoutError::InvalidWinCommand:
    return "win command is not a move command";
  }
  return "unknown";
}

bool MakeLevelDefinition(LevelDefinition &out, const LevelDefinitionInit &init,
                         const char *const *rows, const int rowCount) {
  if (rowCount < 0 || rowCount > kMaxGridHeight) {
    LOG_ERROR("Level '{}' has {} rows (max {})", init.name, rowCount,
              kMaxGridHeight);
    return false;
  }

  LevelDefinition def{};
  std::snprintf(def.name, sizeof(def.name), "%s", init.name ? init.name : "");
  for (int r = 0; r < rowCount; ++r) {
    const char *row = rows[r] ? rows[r] : "";
    if (std::strlen(row) > static_cast<size_t>(kMaxGridWidth)) {
      LOG_ERROR("Level '{}' row {} is wider than {} cells", init.name, r,
                kMaxGridWidth);
      return false;
    }
    std::snprintf(def.rows[r], sizeof(def.rows[r]), "%s", row);
  }
  def.rowCount = rowCount;
  def.splitAxis = init.splitAxis;
  def.winCommand = init.winCommand;
  def.par = init.par;

  out = def;
  return true;
}

int GetLevelWidth(const LevelDefinition &def) {
  int width = 0;
  const int rowCount = def.rowCount < kMaxGridHeight ? def.rowCount
                                                     : kMaxGridHeight;
  for (int r = 0; r < rowCount; ++r) {
    const int len = RowLength(def.rows[r]);
    if (len > width)
      width = len;
  }
  return width;
}

bool IsOccupied(const OccupancyGrid &grid, const GridPos pos) {
  if (pos.x < 0 || pos.y < 0 || pos.x >= grid.width || pos.y >= grid.height)
    return false;
  return grid.cells[pos.y][pos.x];
}

int CountOccupied(const OccupancyGrid &grid) {
  int count = 0;
  for (int y = 0; y < grid.height; ++y) {
    for (int x = 0; x < grid.width; ++x) {
      if (grid.cells[y][x])
        ++count;
    }
  }
  return count;
}

LayoutError BuildLevelLayout(const LevelDefinition &def, LevelLayout &out) {
  if (def.rowCount > kMaxGridHeight)
    return LayoutError::TooLarge;
  for (int r = 0; r < def.rowCount; ++r) {
    if (RowLength(def.rows[r]) > kMaxGridWidth)
      return LayoutError::TooLarge;
  }

  const int height = def.rowCount;
  const int width = GetLevelWidth(def);
  if (width <= 0 || height <= 0)
    return LayoutError::EmptyLayout;

  if (def.splitAxis == Axis::X && (width % 2) != 0)
    return LayoutError::OddSplitDimension;
  if (def.splitAxis == Axis::Y && (height % 2) != 0)
    return LayoutError::OddSplitDimension;

  if (!IsMoveCommand(def.winCommand))
    return LayoutError::InvalidWinCommand;

  // Built aside so a failing layout never touches `out`.
  LevelLayout layout{};
  layout.grid.width = width;
  layout.grid.height = height;
  layout.splitAxis = def.splitAxis;
  layout.winCommand = def.winCommand;

  int leftStarts = 0;
  int rightStarts = 0;

  // Flip y so the first row (top of the layout) becomes the highest y.
  for (int r = 0; r < height; ++r) {
    const char *row = def.rows[r];
    const int len = RowLength(row);
    for (int x = 0; x < len; ++x) {
      const char cell = row[x];
      if (cell == kCellEmpty)
        continue;

      const GridPos pos{x, height - 1 - r};
      layout.grid.cells[pos.y][pos.x] = true;

      if (cell == kCellLeftStart) {
        layout.leftStart = pos;
        ++leftStarts;
      } else if (cell == kCellRightStart) {
        layout.rightStart = pos;
        ++rightStarts;
      } else if (cell == kCellHazard) {
        layout.hazards[layout.hazardCount++] = pos;
      } else if (cell != kCellPlain) {
        LOG_WARN("Level '{}': unknown cell '{}' at ({}, {}) treated as plain",
                 def.name, cell, pos.x, pos.y);
      }
    }
  }

  if (leftStarts == 0 || rightStarts == 0)
    return LayoutError::MissingStart;
  if (leftStarts > 1 || rightStarts > 1)
    return LayoutError::DuplicateStart;

  ComputeSplitBounds(def.splitAxis, width, height, layout.leftBounds,
                     layout.rightBounds);
  if (!Contains(layout.leftBounds, layout.leftStart) ||
      !Contains(layout.rightBounds, layout.rightStart))
    return LayoutError::StartOutsideHalf;

  out = layout;
  return LayoutError::None;
}

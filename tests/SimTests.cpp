#include <cmath>
#include <cstring>
#include <filesystem>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include "core/Assets.hpp"
#include "core/Config.hpp"
#include "core/Log.hpp"
#include "sim/Level.hpp"
#include "sim/Players.hpp"
#include "sim/Session.hpp"
#include "sim/Solver.hpp"

namespace {
bool NearlyEqual(const float a, const float b, const float eps = 1e-4f) {
  return std::fabs(a - b) <= eps;
}

LevelDefinition MakeDef(std::initializer_list<const char *> rows,
                        const Axis split = Axis::X,
                        const Command win = Command::MoveRight) {
  const std::vector<const char *> r(rows);
  LevelDefinition def{};
  LevelDefinitionInit init{};
  init.name = "test";
  init.splitAxis = split;
  init.winCommand = win;
  MakeLevelDefinition(def, init, r.data(), static_cast<int>(r.size()));
  return def;
}

std::unique_ptr<LevelCatalog>
MakeCatalog(std::initializer_list<LevelDefinition> defs) {
  auto catalog = std::make_unique<LevelCatalog>();
  for (const LevelDefinition &d : defs)
    catalog->levels[catalog->count++] = d;
  return catalog;
}

OccupancyGrid MakeRowGrid(const char *row) {
  OccupancyGrid g{};
  g.width = static_cast<int>(std::strlen(row));
  g.height = 1;
  for (int x = 0; x < g.width; ++x)
    g.cells[0][x] = row[x] != '.';
  return g;
}

int CountEvents(const std::vector<SessionEvent> &events,
                const SessionEventType type) {
  int n = 0;
  for (const auto &ev : events) {
    if (ev.type == type)
      ++n;
  }
  return n;
}

// --- OccupancyGrid ---

bool TestGridMatchesSourceCells() {
  const LevelCatalog &catalog = GetBuiltinCatalog();
  for (int i = 0; i < catalog.count; ++i) {
    const LevelDefinition &def = catalog.levels[i];
    LevelLayout layout{};
    if (BuildLevelLayout(def, layout) != LayoutError::None)
      return false;
    const OccupancyGrid &g = layout.grid;
    for (int y = 0; y < g.height; ++y) {
      const char *row = def.rows[g.height - 1 - y];
      const int len = static_cast<int>(std::strlen(row));
      for (int x = 0; x < g.width; ++x) {
        const bool expected = x < len && row[x] != '.';
        if (IsOccupied(g, GridPos{x, y}) != expected)
          return false;
      }
    }
  }
  return true;
}

bool TestVerticalFlipStarts() {
  LevelLayout layout{};
  if (BuildLevelLayout(GetBuiltinCatalog().levels[1], layout) !=
      LayoutError::None)
    return false;
  return layout.grid.width == 1 && layout.grid.height == 4 &&
         layout.leftStart == GridPos{0, 3} &&
         layout.rightStart == GridPos{0, 0} && layout.splitAxis == Axis::Y &&
         layout.leftBounds.y.min == 2 && layout.leftBounds.y.max == 3 &&
         layout.rightBounds.y.min == 0 && layout.rightBounds.y.max == 1 &&
         layout.leftBounds.x.min == 0 && layout.leftBounds.x.max == 0;
}

bool TestHorizontalBoundsPartition() {
  LevelLayout layout{};
  if (BuildLevelLayout(GetBuiltinCatalog().levels[4], layout) !=
      LayoutError::None)
    return false;
  const PlayerBounds &l = layout.leftBounds;
  const PlayerBounds &r = layout.rightBounds;
  return l.x.min == 0 && l.x.max == 2 && r.x.min == 3 && r.x.max == 5 &&
         l.y.min == 0 && l.y.max == 2 && r.y.min == 0 && r.y.max == 2;
}

bool TestRaggedRowsPadded() {
  LevelLayout layout{};
  if (BuildLevelLayout(MakeDef({"1", "0002"}), layout) != LayoutError::None)
    return false;
  return layout.grid.width == 4 && layout.grid.height == 2 &&
         IsOccupied(layout.grid, GridPos{0, 1}) &&
         !IsOccupied(layout.grid, GridPos{1, 1}) &&
         !IsOccupied(layout.grid, GridPos{3, 1}) &&
         IsOccupied(layout.grid, GridPos{3, 0}) &&
         CountOccupied(layout.grid) == 5;
}

bool TestHazardCellsOccupiedAndReported() {
  LevelLayout layout{};
  if (BuildLevelLayout(MakeDef({".X00X.", "100002"}), layout) !=
      LayoutError::None)
    return false;
  return layout.hazardCount == 2 && layout.hazards[0] == GridPos{1, 1} &&
         layout.hazards[1] == GridPos{4, 1} &&
         IsOccupied(layout.grid, GridPos{1, 1}) &&
         IsOccupied(layout.grid, GridPos{4, 1});
}

bool TestUnknownCellTreatedAsPlain() {
  LevelLayout layout{};
  if (BuildLevelLayout(MakeDef({"1Z0002"}), layout) != LayoutError::None)
    return false;
  return IsOccupied(layout.grid, GridPos{1, 0}) && layout.hazardCount == 0;
}

bool TestEmptyLayoutRejected() {
  LevelLayout layout{};
  return BuildLevelLayout(MakeDef({}), layout) == LayoutError::EmptyLayout &&
         BuildLevelLayout(MakeDef({""}), layout) == LayoutError::EmptyLayout;
}

bool TestOddSplitDimensionRejected() {
  LevelLayout layout{};
  const bool oddWidth = BuildLevelLayout(MakeDef({"10002"}), layout) ==
                        LayoutError::OddSplitDimension;
  const bool oddHeight =
      BuildLevelLayout(MakeDef({"1", "0", "2"}, Axis::Y, Command::MoveDown),
                       layout) == LayoutError::OddSplitDimension;
  // Odd width is fine when the split is vertical.
  const bool vertOk =
      BuildLevelLayout(MakeDef({"100", "002"}, Axis::Y, Command::MoveDown),
                       layout) == LayoutError::None;
  return oddWidth && oddHeight && vertOk;
}

bool TestStartValidation() {
  LevelLayout layout{};
  return BuildLevelLayout(MakeDef({"100000"}), layout) ==
             LayoutError::MissingStart &&
         BuildLevelLayout(MakeDef({"110002"}), layout) ==
             LayoutError::DuplicateStart &&
         BuildLevelLayout(MakeDef({"000102"}), layout) ==
             LayoutError::StartOutsideHalf &&
         BuildLevelLayout(MakeDef({"100002"}, Axis::X,
                                  Command::AcknowledgeWin),
                          layout) == LayoutError::InvalidWinCommand;
}

bool TestFailedBuildLeavesOutputUntouched() {
  LevelLayout layout{};
  if (BuildLevelLayout(MakeDef({"100002"}), layout) != LayoutError::None)
    return false;
  if (BuildLevelLayout(MakeDef({"10002"}), layout) == LayoutError::None)
    return false;
  return layout.grid.width == 6 && layout.rightStart == GridPos{5, 0};
}

bool TestOversizedDefinitionRejected() {
  std::string wide(kMaxGridWidth + 2, '0');
  wide[0] = '1';
  wide[wide.size() - 1] = '2';
  const char *rows[] = {wide.c_str()};
  LevelDefinition def = MakeDef({"100002"});
  LevelDefinitionInit init{};
  init.name = "wide";
  if (MakeLevelDefinition(def, init, rows, 1))
    return false;
  // Untouched on failure.
  return def.rowCount == 1 && std::strcmp(def.rows[0], "100002") == 0;
}

// --- BoundedWrapSearch ---

bool TestWrapSearchStaysInBound() {
  const LevelCatalog &catalog = GetBuiltinCatalog();
  int checks = 0;
  for (int i = 0; i < catalog.count; ++i) {
    LevelLayout layout{};
    if (BuildLevelLayout(catalog.levels[i], layout) != LayoutError::None)
      return false;
    const PlayerBounds halves[] = {layout.leftBounds, layout.rightBounds};
    for (const PlayerBounds &b : halves) {
      for (int y = b.y.min; y <= b.y.max; ++y) {
        for (int x = b.x.min; x <= b.x.max; ++x) {
          const GridPos start{x, y};
          if (!IsOccupied(layout.grid, start))
            continue;
          for (const Axis axis : {Axis::X, Axis::Y}) {
            for (const int dir : {-1, 1}) {
              const AxisBound bound = BoundOnAxis(b, axis);
              const GridPos r =
                  FindNextValid(layout.grid, start, axis, dir, bound);
              const int moved = (axis == Axis::X) ? r.x : r.y;
              const int fixedBefore = (axis == Axis::X) ? start.y : start.x;
              const int fixedAfter = (axis == Axis::X) ? r.y : r.x;
              if (moved < bound.min || moved > bound.max)
                return false;
              if (fixedBefore != fixedAfter)
                return false;
              if (!IsOccupied(layout.grid, r) && r != start)
                return false;
              ++checks;
            }
          }
        }
      }
    }
  }
  return checks > 0;
}

bool TestWrapSearchCycleVisitsAllCells() {
  const OccupancyGrid g = MakeRowGrid("0000000000");
  const AxisBound bound{0, 4};
  GridPos p{0, 0};
  const int expected[] = {1, 2, 3, 4, 0, 1};
  for (const int x : expected) {
    p = FindNextValid(g, p, Axis::X, 1, bound);
    if (p.x != x || p.y != 0)
      return false;
  }
  return true;
}

bool TestWrapSearchSkipsGapsAndReportsWrap() {
  const OccupancyGrid g = MakeRowGrid("0.0.0.");
  const AxisBound bound{0, 4};
  bool wrapped = true;
  GridPos p = FindNextValid(g, GridPos{0, 0}, Axis::X, 1, bound, &wrapped);
  if (p.x != 2 || wrapped)
    return false;
  p = FindNextValid(g, p, Axis::X, 1, bound, &wrapped);
  if (p.x != 4 || wrapped)
    return false;
  p = FindNextValid(g, p, Axis::X, 1, bound, &wrapped);
  if (p.x != 0 || !wrapped)
    return false;
  p = FindNextValid(g, p, Axis::X, -1, bound, &wrapped);
  return p.x == 4 && wrapped;
}

bool TestWrapSearchEmptyHalfIsNoOp() {
  // Only the start cell is occupied: one full lap lands back on it.
  const OccupancyGrid lone = MakeRowGrid("..0...");
  bool wrapped = true;
  const GridPos a =
      FindNextValid(lone, GridPos{2, 0}, Axis::X, 1, AxisBound{0, 2}, &wrapped);
  if (!(a == GridPos{2, 0}) || wrapped)
    return false;
  // Nothing occupied at all: search gives up and returns start.
  const OccupancyGrid none = MakeRowGrid("......");
  const GridPos b =
      FindNextValid(none, GridPos{4, 0}, Axis::X, -1, AxisBound{3, 5}, &wrapped);
  return b == GridPos{4, 0} && !wrapped;
}

bool TestWrapSearchNeverCrossesHalf() {
  // The right half is fully occupied but the left bound must not see it.
  const OccupancyGrid g = MakeRowGrid("0..000");
  const GridPos r =
      FindNextValid(g, GridPos{0, 0}, Axis::X, 1, AxisBound{0, 2});
  return r == GridPos{0, 0};
}

// --- DualPlayerState ---

bool TestMirroredMoveDirections() {
  LevelLayout layout{};
  if (BuildLevelLayout(GetBuiltinCatalog().levels[4], layout) !=
      LayoutError::None)
    return false;
  DualPlayerState players{};
  InitPlayers(players, layout);
  // Left (1,0) goes up, right (5,2) goes down.
  MoveResult r = ApplyMove(players, layout.grid, Command::MoveUp);
  if (!(r.left == GridPos{1, 1}) || !(r.right == GridPos{5, 1}) ||
      r.crossedBoundary)
    return false;
  // Left moves right inside its half, right moves left inside its half.
  r = ApplyMove(players, layout.grid, Command::MoveRight);
  if (!(r.left == GridPos{2, 1}) || !(r.right == GridPos{4, 1}))
    return false;
  return players.left == r.left && players.right == r.right;
}

bool TestMoveReportsWrap() {
  LevelLayout layout{};
  if (BuildLevelLayout(MakeDef({"100002"}), layout) != LayoutError::None)
    return false;
  DualPlayerState players{};
  InitPlayers(players, layout);
  // Moving apart wraps both players onto the seam.
  const MoveResult r = ApplyMove(players, layout.grid, Command::MoveLeft);
  return r.crossedBoundary && r.left == GridPos{2, 0} &&
         r.right == GridPos{3, 0};
}

bool TestOppositeMovesRestorePositions() {
  const LevelCatalog &catalog = GetBuiltinCatalog();
  const Command pairs[][2] = {{Command::MoveLeft, Command::MoveRight},
                              {Command::MoveRight, Command::MoveLeft},
                              {Command::MoveUp, Command::MoveDown},
                              {Command::MoveDown, Command::MoveUp}};
  int checks = 0;
  for (int i = 0; i < catalog.count; ++i) {
    LevelLayout layout{};
    if (BuildLevelLayout(catalog.levels[i], layout) != LayoutError::None)
      return false;
    for (const auto &pair : pairs) {
      DualPlayerState players{};
      InitPlayers(players, layout);
      const DualPlayerState before = players;
      if (ApplyMove(players, layout.grid, pair[0]).crossedBoundary)
        continue;
      if (ApplyMove(players, layout.grid, pair[1]).crossedBoundary)
        continue;
      if (!(players.left == before.left) || !(players.right == before.right))
        return false;
      ++checks;
    }
  }
  return checks > 0;
}

bool TestNonMoveCommandLeavesPlayers() {
  LevelLayout layout{};
  if (BuildLevelLayout(MakeDef({"100002"}), layout) != LayoutError::None)
    return false;
  DualPlayerState players{};
  InitPlayers(players, layout);
  const MoveResult r = ApplyMove(players, layout.grid, Command::AcknowledgeWin);
  return r.left == GridPos{0, 0} && r.right == GridPos{5, 0} &&
         players.left == GridPos{0, 0} && !r.crossedBoundary;
}

// --- LevelSession ---

bool TestLevelLoadedEvent() {
  LevelSession session{};
  if (StartSession(session, GetBuiltinCatalog(), 0) != LayoutError::None)
    return false;
  const auto events = DrainEvents(session);
  if (events.size() != 1 || events[0].type != SessionEventType::LevelLoaded)
    return false;
  const SessionEvent &ev = events[0];
  return ev.levelIndex == 0 && ev.width == 6 && ev.height == 1 &&
         ev.occupiedCells.size() == 6 && ev.hazardCells.empty() &&
         ev.left == GridPos{0, 0} && ev.right == GridPos{5, 0} &&
         session.state == SessionState::Playing && session.moveCount == 0 &&
         session.events.empty();
}

bool TestWinFiresAtAdjacencyHorizontal() {
  LevelSession session{};
  StartSession(session, GetBuiltinCatalog(), 0);
  DrainEvents(session);

  for (int i = 0; i < 2; ++i) {
    if (!ApplyCommand(session, Command::MoveRight))
      return false;
    const auto events = DrainEvents(session);
    if (CountEvents(events, SessionEventType::WinTriggered) != 0)
      return false;
    if (CountEvents(events, SessionEventType::PositionsChanged) != 1)
      return false;
  }
  if (!(session.players.left == GridPos{2, 0}) ||
      !(session.players.right == GridPos{3, 0}) || session.moveCount != 2 ||
      session.state != SessionState::Playing)
    return false;

  if (!ApplyCommand(session, Command::MoveRight))
    return false;
  const auto events = DrainEvents(session);
  if (events.size() != 1 || events[0].type != SessionEventType::WinTriggered)
    return false;
  return events[0].moveCount == 3 && session.state == SessionState::Winning &&
         session.players.left == GridPos{2, 0} &&
         session.players.right == GridPos{3, 0};
}

bool TestOtherCommandsDoNotWin() {
  LevelSession session{};
  StartSession(session, GetBuiltinCatalog(), 0);
  ApplyCommand(session, Command::MoveRight);
  ApplyCommand(session, Command::MoveRight);
  DrainEvents(session);

  // Single-row level: up/down laps back onto the same cell.
  ApplyCommand(session, Command::MoveUp);
  if (session.state != SessionState::Playing ||
      !(session.players.left == GridPos{2, 0}))
    return false;

  ApplyCommand(session, Command::MoveLeft);
  const auto events = DrainEvents(session);
  return CountEvents(events, SessionEventType::WinTriggered) == 0 &&
         session.state == SessionState::Playing &&
         session.players.left == GridPos{1, 0} &&
         session.players.right == GridPos{4, 0} && session.moveCount == 4;
}

bool TestWinFiresAtAdjacencyVertical() {
  LevelSession session{};
  StartSession(session, GetBuiltinCatalog(), 1);
  DrainEvents(session);

  ApplyCommand(session, Command::MoveDown);
  if (!(session.players.left == GridPos{0, 2}) ||
      !(session.players.right == GridPos{0, 1}) ||
      session.state != SessionState::Playing)
    return false;

  // Adjacent, but only MoveDown closes a vertical seam.
  ApplyCommand(session, Command::MoveRight);
  if (session.state != SessionState::Playing || session.moveCount != 2)
    return false;

  ApplyCommand(session, Command::MoveDown);
  const auto events = DrainEvents(session);
  int winMoves = -1;
  for (const auto &ev : events) {
    if (ev.type == SessionEventType::WinTriggered)
      winMoves = ev.moveCount;
  }
  return winMoves == 3 && session.state == SessionState::Winning;
}

bool TestWinningIgnoresMoves() {
  LevelSession session{};
  StartSession(session, GetBuiltinCatalog(), 1);
  ApplyCommand(session, Command::MoveDown);
  ApplyCommand(session, Command::MoveDown);
  DrainEvents(session);
  if (session.state != SessionState::Winning)
    return false;

  const bool accepted = ApplyCommand(session, Command::MoveUp) ||
                        ApplyCommand(session, Command::MoveLeft) ||
                        ApplyCommand(session, Command::AnimationComplete);
  return !accepted && session.moveCount == 2 && session.events.empty() &&
         session.players.left == GridPos{0, 2};
}

bool TestAcknowledgeAdvancesAndResets() {
  LevelSession session{};
  StartSession(session, GetBuiltinCatalog(), 0);
  ApplyCommand(session, Command::MoveRight);
  ApplyCommand(session, Command::MoveRight);
  ApplyCommand(session, Command::MoveRight);
  DrainEvents(session);

  if (!ApplyCommand(session, Command::AcknowledgeWin))
    return false;
  const auto events = DrainEvents(session);
  if (events.size() != 2)
    return false;
  return events[0].type == SessionEventType::LevelAdvanced &&
         events[0].levelIndex == 1 &&
         events[1].type == SessionEventType::LevelLoaded &&
         events[1].levelIndex == 1 && session.levelIndex == 1 &&
         session.moveCount == 0 && session.state == SessionState::Playing &&
         session.levelsCompleted == 1 &&
         session.players.left == GridPos{0, 3};
}

bool TestAcknowledgeIgnoredWhilePlaying() {
  LevelSession session{};
  StartSession(session, GetBuiltinCatalog(), 2);
  DrainEvents(session);
  return !ApplyCommand(session, Command::AcknowledgeWin) &&
         session.levelIndex == 2 && session.events.empty();
}

bool TestDebugAdvance() {
  LevelSession session{};
  const LevelCatalog &catalog = GetBuiltinCatalog();
  StartSession(session, catalog, catalog.count - 1);
  ApplyCommand(session, Command::MoveRight);
  DrainEvents(session);

  // From Playing, wrapping past the end of the catalog.
  if (!ApplyCommand(session, Command::AdvanceLevelDebug))
    return false;
  if (session.levelIndex != 0 || session.moveCount != 0 ||
      session.levelsCompleted != 0)
    return false;

  // From Winning, bypassing the acknowledgement.
  ApplyCommand(session, Command::MoveRight);
  ApplyCommand(session, Command::MoveRight);
  ApplyCommand(session, Command::MoveRight);
  if (session.state != SessionState::Winning)
    return false;
  DrainEvents(session);
  if (!ApplyCommand(session, Command::AdvanceLevelDebug))
    return false;
  const auto events = DrainEvents(session);
  return session.levelIndex == 1 && session.state == SessionState::Playing &&
         CountEvents(events, SessionEventType::LevelAdvanced) == 1 &&
         CountEvents(events, SessionEventType::WinTriggered) == 0;
}

bool TestLevelIndexWraps() {
  const LevelCatalog &catalog = GetBuiltinCatalog();
  LevelSession session{};
  StartSession(session, catalog, catalog.count + 1);
  if (session.levelIndex != 1)
    return false;
  StartSession(session, catalog, -1);
  if (session.levelIndex != catalog.count - 1)
    return false;
  return WrapLevelIndex(catalog, 2 * catalog.count) == 0 &&
         WrapLevelIndex(catalog, -catalog.count - 2) == catalog.count - 2;
}

bool TestReloadIsDeterministic() {
  LevelSession a{};
  LevelSession b{};
  const LevelCatalog &catalog = GetBuiltinCatalog();
  for (int i = 0; i < catalog.count; ++i) {
    StartSession(a, catalog, i);
    ApplyCommand(a, Command::MoveUp);
    ApplyCommand(a, Command::MoveLeft);
    if (LoadLevel(a, i) != LayoutError::None)
      return false;
    StartSession(b, catalog, i);

    if (a.moveCount != 0 || a.state != SessionState::Playing)
      return false;
    if (!(a.players.left == b.players.left) ||
        !(a.players.right == b.players.right))
      return false;
    if (std::memcmp(&a.layout.grid, &b.layout.grid, sizeof(OccupancyGrid)) !=
        0)
      return false;
    if (std::memcmp(&a.layout.leftBounds, &b.layout.leftBounds,
                    sizeof(PlayerBounds)) != 0 ||
        std::memcmp(&a.layout.rightBounds, &b.layout.rightBounds,
                    sizeof(PlayerBounds)) != 0)
      return false;
  }
  return true;
}

bool TestFailedLoadKeepsSession() {
  auto catalog = MakeCatalog({MakeDef({"100002"}), MakeDef({"10002"})});
  LevelSession session{};
  if (StartSession(session, *catalog, 0) != LayoutError::None)
    return false;
  ApplyCommand(session, Command::MoveRight);
  DrainEvents(session);

  if (LoadLevel(session, 1) != LayoutError::OddSplitDimension)
    return false;
  if (session.levelIndex != 0 || session.moveCount != 1 ||
      !(session.players.left == GridPos{1, 0}) || !session.events.empty())
    return false;

  // Advancing into the broken level fails the same way.
  return !ApplyCommand(session, Command::AdvanceLevelDebug) &&
         session.levelIndex == 0 && session.state == SessionState::Playing;
}

bool TestNoOpMoveStillCounts() {
  LevelSession session{};
  StartSession(session, GetBuiltinCatalog(), 1);
  DrainEvents(session);
  // Width-1 level: horizontal moves cannot go anywhere.
  if (!ApplyCommand(session, Command::MoveLeft))
    return false;
  const auto events = DrainEvents(session);
  return session.moveCount == 1 &&
         CountEvents(events, SessionEventType::PositionsChanged) == 1 &&
         session.players.left == GridPos{0, 3} &&
         session.players.right == GridPos{0, 0};
}

bool TestAnimationLock() {
  SessionOptions options{};
  options.lockWhileAnimating = true;
  LevelSession session{};
  StartSession(session, GetBuiltinCatalog(), 0, options);

  if (!ApplyCommand(session, Command::MoveRight) ||
      session.state != SessionState::Animating)
    return false;
  if (ApplyCommand(session, Command::MoveRight) || session.moveCount != 1)
    return false;
  if (!ApplyCommand(session, Command::AnimationComplete) ||
      session.state != SessionState::Playing)
    return false;
  if (ApplyCommand(session, Command::AnimationComplete))
    return false;
  if (!ApplyCommand(session, Command::MoveRight) || session.moveCount != 2)
    return false;

  // Debug advance is not blocked by the lock.
  return ApplyCommand(session, Command::AdvanceLevelDebug) &&
         session.levelIndex == 1 && session.state == SessionState::Playing;
}

bool TestCommandsBeforeStartIgnored() {
  LevelSession session{};
  return !ApplyCommand(session, Command::MoveLeft) &&
         !ApplyCommand(session, Command::AdvanceLevelDebug) &&
         !ApplyCommand(session, Command::AcknowledgeWin) &&
         session.state == SessionState::Loading;
}

// --- Coordinate mapping ---

bool TestAnchoredPosition() {
  const AnchoredPos a = GetAnchoredPosition(GridPos{0, 0}, 6, 1, 150.0f);
  const AnchoredPos b = GetAnchoredPosition(GridPos{5, 0}, 6, 1, 150.0f);
  const AnchoredPos c = GetAnchoredPosition(GridPos{0, 3}, 1, 4, 150.0f);
  const AnchoredPos d =
      GetAnchoredPosition(GridPos{1, 1}, 3, 3, cfg::kCellSpacing);
  return NearlyEqual(a.x, -375.0f) && NearlyEqual(a.y, 0.0f) &&
         NearlyEqual(b.x, 375.0f) && NearlyEqual(c.x, 0.0f) &&
         NearlyEqual(c.y, 225.0f) && NearlyEqual(d.x, 0.0f) &&
         NearlyEqual(d.y, 0.0f);
}

// --- Solver ---

bool TestSolverShortestSolutions() {
  const LevelCatalog &catalog = GetBuiltinCatalog();
  const int expected[] = {2, 2, 2, 4, 3, 4};
  if (catalog.count != 6)
    return false;
  for (int i = 0; i < catalog.count; ++i) {
    LevelLayout layout{};
    if (BuildLevelLayout(catalog.levels[i], layout) != LayoutError::None)
      return false;
    std::vector<Command> solution;
    if (!SolveLevel(layout, solution))
      return false;
    if (static_cast<int>(solution.size()) != expected[i])
      return false;
    if (static_cast<int>(solution.size()) > catalog.levels[i].par)
      return false;
  }
  return true;
}

bool TestSolverSolutionsReplay() {
  const LevelCatalog &catalog = GetBuiltinCatalog();
  for (int i = 0; i < catalog.count; ++i) {
    LevelLayout layout{};
    BuildLevelLayout(catalog.levels[i], layout);
    std::vector<Command> solution;
    if (!SolveLevel(layout, solution))
      return false;

    LevelSession session{};
    StartSession(session, catalog, i);
    DrainEvents(session);
    for (size_t s = 0; s < solution.size(); ++s) {
      if (session.state != SessionState::Playing)
        return false;
      ApplyCommand(session, solution[s]);
    }
    const auto events = DrainEvents(session);
    if (events.empty() || events.back().type != SessionEventType::WinTriggered)
      return false;
    if (events.back().moveCount != static_cast<int>(solution.size()))
      return false;
  }
  return true;
}

bool TestSolverReportsUnsolvable() {
  LevelLayout layout{};
  if (BuildLevelLayout(MakeDef({"1..0.2"}), layout) != LayoutError::None)
    return false;
  std::vector<Command> solution{Command::MoveLeft};
  int visited = 0;
  return !SolveLevel(layout, solution, &visited) && solution.empty() &&
         visited > 0;
}

// --- Catalog loading ---

bool TestCatalogFromJson() {
  const char *text = R"({
    "levels": [
      {"name": "Tall", "split": "Y", "rows": ["1", "2"]},
      {"name": "Wide", "par": 2, "rows": ["1002"]},
      {"split": "horizontal", "winCommand": "MoveLeft", "rows": ["12"]}
    ]
  })";
  auto catalog = std::make_unique<LevelCatalog>();
  if (!LoadCatalogFromString(*catalog, text, "inline"))
    return false;
  if (catalog->count != 3)
    return false;
  const LevelDefinition &tall = catalog->levels[0];
  const LevelDefinition &wide = catalog->levels[1];
  const LevelDefinition &third = catalog->levels[2];
  return std::strcmp(tall.name, "Tall") == 0 && tall.splitAxis == Axis::Y &&
         tall.winCommand == Command::MoveDown && tall.rowCount == 2 &&
         tall.par == -1 && wide.splitAxis == Axis::X &&
         wide.winCommand == Command::MoveRight && wide.par == 2 &&
         std::strcmp(wide.rows[0], "1002") == 0 &&
         std::strcmp(third.name, "Level 3") == 0 &&
         third.winCommand == Command::MoveLeft && ValidateCatalog(*catalog) == 0;
}

bool TestCatalogJsonErrors() {
  auto catalog = std::make_unique<LevelCatalog>();
  *catalog = GetBuiltinCatalog();
  const char *bad[] = {
      "{ not json",
      R"({"levels": []})",
      R"({"levels": [{"name": "x"}]})",
      R"({"levels": [{"split": "diagonal", "rows": ["12"]}]})",
      R"({"levels": [{"winCommand": "Jump", "rows": ["12"]}]})",
      R"({"levels": [{"rows": ["12", 3]}]})",
      R"({"stages": []})",
      R"({"levels": [{"split": 1.5, "rows": ["1", "2"]}]})",
      R"({"levels": [{"split": 1e300, "rows": ["12"]}]})",
      R"({"levels": [{"par": 2.5, "rows": ["12"]}]})",
      R"({"levels": [{"par": 1e300, "rows": ["12"]}]})",
      R"({"levels": [{"par": 18446744073709551615, "rows": ["12"]}]})",
      R"({"levels": [{"rows": ["100002"]}, {"rows": ["10002"]}]})",
      R"({"levels": [{"rows": ["100002"]}, {"rows": ["100000"]}]})",
  };
  for (const char *text : bad) {
    if (LoadCatalogFromString(*catalog, text, "bad"))
      return false;
  }
  // Failed loads leave the previous catalog in place.
  return catalog->count == GetBuiltinCatalog().count &&
         std::strcmp(catalog->levels[0].name,
                     GetBuiltinCatalog().levels[0].name) == 0;
}

bool TestLoadedCatalogNeverStrandsSession() {
  // A file whose second level cannot build is refused as a whole, so the
  // session keeps the catalog it had and can still advance past level 0.
  auto catalog = MakeCatalog({MakeDef({"100002"}), MakeDef({"1002"})});
  const char *text =
      R"({"levels": [{"rows": ["100002"]}, {"rows": ["10002"]}]})";
  if (LoadCatalogFromString(*catalog, text, "broken"))
    return false;

  LevelSession session{};
  if (StartSession(session, *catalog, 0) != LayoutError::None)
    return false;
  ApplyCommand(session, Command::MoveRight);
  ApplyCommand(session, Command::MoveRight);
  ApplyCommand(session, Command::MoveRight);
  if (session.state != SessionState::Winning)
    return false;
  return ApplyCommand(session, Command::AcknowledgeWin) &&
         session.state == SessionState::Playing && session.levelIndex == 1;
}

bool TestCurrentLevelNeedsCatalog() {
  LevelSession session{};
  if (GetCurrentLevel(session) != nullptr)
    return false;
  StartSession(session, GetBuiltinCatalog(), 1);
  const LevelDefinition *def = GetCurrentLevel(session);
  return def != nullptr &&
         std::strcmp(def->name, GetBuiltinCatalog().levels[1].name) == 0;
}

bool TestCatalogSaveAndReload() {
  const std::string path =
      (std::filesystem::temp_directory_path() / "mirrorstep_catalog_test.json")
          .string();
  const LevelCatalog &builtin = GetBuiltinCatalog();
  if (!SaveCatalogToFile(builtin, path.c_str()))
    return false;

  auto loaded = std::make_unique<LevelCatalog>();
  const bool ok = LoadCatalogFromFile(*loaded, path.c_str());
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (!ok || loaded->count != builtin.count)
    return false;

  for (int i = 0; i < builtin.count; ++i) {
    const LevelDefinition &a = builtin.levels[i];
    const LevelDefinition &b = loaded->levels[i];
    if (std::strcmp(a.name, b.name) != 0 || a.rowCount != b.rowCount ||
        a.splitAxis != b.splitAxis || a.winCommand != b.winCommand ||
        a.par != b.par)
      return false;
    for (int r = 0; r < a.rowCount; ++r) {
      if (std::strcmp(a.rows[r], b.rows[r]) != 0)
        return false;
    }
  }
  return true;
}

bool TestShippedCatalogPlayable() {
  if (!assets::Exists(cfg::kDefaultCatalogPath))
    return false;
  auto catalog = std::make_unique<LevelCatalog>();
  if (!LoadCatalogFromFile(*catalog, assets::Path(cfg::kDefaultCatalogPath)))
    return false;
  if (catalog->count < GetBuiltinCatalog().count || ValidateCatalog(*catalog))
    return false;

  for (int i = 0; i < catalog->count; ++i) {
    LevelLayout layout{};
    BuildLevelLayout(catalog->levels[i], layout);
    std::vector<Command> solution;
    if (!SolveLevel(layout, solution))
      return false;
    if (catalog->levels[i].par > 0 &&
        static_cast<int>(solution.size()) > catalog->levels[i].par)
      return false;
  }
  return true;
}

bool TestCommandLabels() {
  const Command all[] = {Command::MoveLeft,          Command::MoveRight,
                         Command::MoveUp,            Command::MoveDown,
                         Command::AdvanceLevelDebug, Command::AcknowledgeWin,
                         Command::AnimationComplete};
  for (const Command c : all) {
    if (ParseCommandLabel(GetCommandLabel(c)) != c)
      return false;
  }
  return ParseCommandLabel("moveleft") == Command::None &&
         ParseCommandLabel(nullptr) == Command::None;
}

} // namespace

int main() {
  Log::Init("mirrorstep_tests.log");
  Log::SetConsoleLevel(spdlog::level::critical);
  int failed = 0;

  auto run = [&](const char *name, const bool ok) {
    if (!ok) {
      std::cerr << "[FAIL] " << name << '\n';
      ++failed;
    } else {
      std::cout << "[PASS] " << name << '\n';
    }
  };

  run("grid_matches_source_cells", TestGridMatchesSourceCells());
  run("vertical_flip_starts", TestVerticalFlipStarts());
  run("horizontal_bounds_partition", TestHorizontalBoundsPartition());
  run("ragged_rows_padded", TestRaggedRowsPadded());
  run("hazard_cells_occupied_and_reported",
      TestHazardCellsOccupiedAndReported());
  run("unknown_cell_treated_as_plain", TestUnknownCellTreatedAsPlain());
  run("empty_layout_rejected", TestEmptyLayoutRejected());
  run("odd_split_dimension_rejected", TestOddSplitDimensionRejected());
  run("start_validation", TestStartValidation());
  run("failed_build_leaves_output_untouched",
      TestFailedBuildLeavesOutputUntouched());
  run("oversized_definition_rejected", TestOversizedDefinitionRejected());
  run("wrap_search_stays_in_bound", TestWrapSearchStaysInBound());
  run("wrap_search_cycle_visits_all_cells",
      TestWrapSearchCycleVisitsAllCells());
  run("wrap_search_skips_gaps_and_reports_wrap",
      TestWrapSearchSkipsGapsAndReportsWrap());
  run("wrap_search_empty_half_is_no_op", TestWrapSearchEmptyHalfIsNoOp());
  run("wrap_search_never_crosses_half", TestWrapSearchNeverCrossesHalf());
  run("mirrored_move_directions", TestMirroredMoveDirections());
  run("move_reports_wrap", TestMoveReportsWrap());
  run("opposite_moves_restore_positions", TestOppositeMovesRestorePositions());
  run("non_move_command_leaves_players", TestNonMoveCommandLeavesPlayers());
  run("level_loaded_event", TestLevelLoadedEvent());
  run("win_fires_at_adjacency_horizontal",
      TestWinFiresAtAdjacencyHorizontal());
  run("other_commands_do_not_win", TestOtherCommandsDoNotWin());
  run("win_fires_at_adjacency_vertical", TestWinFiresAtAdjacencyVertical());
  run("winning_ignores_moves", TestWinningIgnoresMoves());
  run("acknowledge_advances_and_resets", TestAcknowledgeAdvancesAndResets());
  run("acknowledge_ignored_while_playing",
      TestAcknowledgeIgnoredWhilePlaying());
  run("debug_advance", TestDebugAdvance());
  run("level_index_wraps", TestLevelIndexWraps());
  run("reload_is_deterministic", TestReloadIsDeterministic());
  run("failed_load_keeps_session", TestFailedLoadKeepsSession());
  run("no_op_move_still_counts", TestNoOpMoveStillCounts());
  run("animation_lock", TestAnimationLock());
  run("commands_before_start_ignored", TestCommandsBeforeStartIgnored());
  run("anchored_position", TestAnchoredPosition());
  run("solver_shortest_solutions", TestSolverShortestSolutions());
  run("solver_solutions_replay", TestSolverSolutionsReplay());
  run("solver_reports_unsolvable", TestSolverReportsUnsolvable());
  run("catalog_from_json", TestCatalogFromJson());
  run("catalog_json_errors", TestCatalogJsonErrors());
  run("loaded_catalog_never_strands_session",
      TestLoadedCatalogNeverStrandsSession());
  run("current_level_needs_catalog", TestCurrentLevelNeedsCatalog());
  run("catalog_save_and_reload", TestCatalogSaveAndReload());
  run("shipped_catalog_playable", TestShippedCatalogPlayable());
  run("command_labels", TestCommandLabels());

  Log::Shutdown();
  return (failed == 0) ? 0 : 1;
}

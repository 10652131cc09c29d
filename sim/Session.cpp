#include "sim/Session.hpp"

#include <utility>

#include "core/Log.hpp"

namespace {

void PushLevelLoaded(LevelSession &session) {
  const OccupancyGrid &grid = session.layout.grid;

  SessionEvent ev{};
  ev.type = SessionEventType::LevelLoaded;
  ev.levelIndex = session.levelIndex;
  ev.width = grid.width;
  ev.height = grid.height;
  ev.left = session.layout.leftStart;
  ev.right = session.layout.rightStart;
  for (int y = 0; y < grid.height; ++y) {
    for (int x = 0; x < grid.width; ++x) {
      if (grid.cells[y][x])
        ev.occupiedCells.push_back(GridPos{x, y});
    }
  }
  for (int i = 0; i < session.layout.hazardCount; ++i)
    ev.hazardCells.push_back(session.layout.hazards[i]);
  session.events.push_back(std::move(ev));
}

LayoutError LoadLevelImpl(LevelSession &session, const int requestedIndex,
                          const bool advancing) {
  if (session.catalog == nullptr || session.catalog->count <= 0) {
    LOG_ERROR("Cannot load level {}: no catalog", requestedIndex);
    return LayoutError::EmptyLayout;
  }

  const int index = WrapLevelIndex(*session.catalog, requestedIndex);
  const LevelDefinition &def = session.catalog->levels[index];

  LevelLayout layout{};
  const LayoutError err = BuildLevelLayout(def, layout);
  if (err != LayoutError::None) {
    LOG_ERROR("Level {} '{}' failed to load: {}", index, def.name,
              GetLayoutErrorLabel(err));
    return err;
  }

  if (advancing) {
    SessionEvent ev{};
    ev.type = SessionEventType::LevelAdvanced;
    ev.levelIndex = index;
    session.events.push_back(ev);
  }

  session.state = SessionState::Loading;
  session.levelIndex = index;
  session.layout = layout;
  session.moveCount = 0;
  InitPlayers(session.players, session.layout);
  PushLevelLoaded(session);
  session.state = SessionState::Playing;

  LOG_INFO("Level {} '{}' loaded ({}x{}, split {})", index, def.name,
           layout.grid.width, layout.grid.height,
           layout.splitAxis == Axis::X ? "X" : "Y");
  return LayoutError::None;
}

bool AdvanceLevel(LevelSession &session, const bool solved) {
  const int from = session.levelIndex;
  if (LoadLevelImpl(session, from + 1, true) != LayoutError::None)
    return false;
  if (solved)
    ++session.levelsCompleted;
  return true;
}

bool ApplyMoveCommand(LevelSession &session, const Command c) {
  if (session.state != SessionState::Playing) {
    LOG_TRACE("{} ignored in state {}", GetCommandLabel(c),
              GetSessionStateLabel(session.state));
    return false;
  }

  ++session.moveCount;

  // The closing press is checked before moving: it ends the level instead.
  if (c == session.layout.winCommand &&
      AreAdjacentAcrossSplit(session.players, session.layout.splitAxis)) {
    session.state = SessionState::Winning;
    SessionEvent ev{};
    ev.type = SessionEventType::WinTriggered;
    ev.moveCount = session.moveCount;
    ev.levelIndex = session.levelIndex;
    session.events.push_back(ev);
    LOG_INFO("Level {} solved in {} move(s)", session.levelIndex,
             session.moveCount);
    return true;
  }

  const MoveResult r =
      ApplyMove(session.players, session.layout.grid, c);

  SessionEvent ev{};
  ev.type = SessionEventType::PositionsChanged;
  ev.left = r.left;
  ev.right = r.right;
  ev.command = c;
  ev.crossedBoundary = r.crossedBoundary;
  session.events.push_back(ev);

  LOG_DEBUG("{} -> left ({}, {}) right ({}, {}){}", GetCommandLabel(c),
            r.left.x, r.left.y, r.right.x, r.right.y,
            r.crossedBoundary ? " [wrapped]" : "");

  if (session.options.lockWhileAnimating)
    session.state = SessionState::Animating;
  return true;
}

} // namespace

const char *GetSessionStateLabel(const SessionState s) {
  switch (s) {
  case SessionState::Loading:
    return "Loading";
  case SessionState::Playing:
    return "Playing";
  case SessionState::Animating:
    return "Animating";
  case SessionState::Winning:
    return "Winning";
  }
  return "Unknown";
}

LayoutError StartSession(LevelSession &session, const LevelCatalog &catalog,
                         const int startIndex, const SessionOptions options) {
  session.catalog = &catalog;
  session.options = options;
  session.levelsCompleted = 0;
  session.events.clear();
  return LoadLevelImpl(session, startIndex, false);
}

LayoutError LoadLevel(LevelSession &session, const int index) {
  return LoadLevelImpl(session, index, false);
}

bool ApplyCommand(LevelSession &session, const Command c) {
  switch (c) {
  case Command::MoveLeft:
  case Command::MoveRight:
  case Command::MoveUp:
  case Command::MoveDown:
    return ApplyMoveCommand(session, c);

  case Command::AdvanceLevelDebug:
    if (session.state == SessionState::Loading)
      return false;
    LOG_INFO("Debug advance from level {}", session.levelIndex);
    return AdvanceLevel(session, false);

  case Command::AcknowledgeWin:
    if (session.state != SessionState::Winning)
      return false;
    return AdvanceLevel(session, true);

  case Command::AnimationComplete:
    if (session.state != SessionState::Animating)
      return false;
    session.state = SessionState::Playing;
    return true;

  case Command::None:
    break;
  }
  return false;
}

std::vector<SessionEvent> DrainEvents(LevelSession &session) {
  std::vector<SessionEvent> out;
  out.swap(session.events);
  return out;
}

const LevelDefinition *GetCurrentLevel(const LevelSession &session) {
  if (session.catalog == nullptr || session.catalog->count <= 0)
    return nullptr;
  return &session.catalog->levels[session.levelIndex];
}

#pragma once

#include <vector>

#include "sim/Level.hpp"
#include "sim/Players.hpp"

enum class SessionState {
  Loading,   // building the next level; transient
  Playing,   // accepting moves
  Animating, // move committed, waiting for AnimationComplete
  Winning,   // level solved, waiting for AcknowledgeWin
};

const char *GetSessionStateLabel(SessionState s);

enum class SessionEventType {
  PositionsChanged,
  LevelLoaded,
  WinTriggered,
  LevelAdvanced,
};

// Output for the presentation layer. Only the fields documented for the
// event's type are meaningful.
struct SessionEvent {
  SessionEventType type = SessionEventType::PositionsChanged;

  // PositionsChanged: new positions. LevelLoaded: start positions.
  GridPos left{};
  GridPos right{};
  Command command = Command::None; // PositionsChanged
  bool crossedBoundary = false;    // PositionsChanged

  // LevelLoaded / LevelAdvanced
  int levelIndex = 0;
  int width = 0;
  int height = 0;
  std::vector<GridPos> occupiedCells;
  std::vector<GridPos> hazardCells;

  int moveCount = 0; // WinTriggered
};

struct SessionOptions {
  // Enter Animating after every committed move and ignore further moves
  // until Command::AnimationComplete arrives.
  bool lockWhileAnimating = false;
};

struct LevelSession {
  const LevelCatalog *catalog = nullptr; // not owned; must outlive the session
  SessionOptions options{};
  SessionState state = SessionState::Loading;
  int levelIndex = 0;
  int moveCount = 0;
  int levelsCompleted = 0;
  LevelLayout layout{};
  DualPlayerState players{};
  std::vector<SessionEvent> events;
};

// Binds the session to `catalog` and loads `startIndex` (wrapped).
LayoutError StartSession(LevelSession &session, const LevelCatalog &catalog,
                         int startIndex, SessionOptions options = {});

// Loads `index` (wrapped) and resets the move counter. On error nothing in
// the session changes.
LayoutError LoadLevel(LevelSession &session, int index);

// Processes one command to completion. Returns false when the command was
// ignored in the current state.
bool ApplyCommand(LevelSession &session, Command c);

// Hands the queued events to the caller and clears the queue.
std::vector<SessionEvent> DrainEvents(LevelSession &session);

// Definition of the loaded level, or nullptr before StartSession has bound a
// catalog.
const LevelDefinition *GetCurrentLevel(const LevelSession &session);

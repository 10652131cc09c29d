#pragma once

#include <vector>

#include "sim/Level.hpp"
#include "sim/Session.hpp"
#include <raylib.h>

// Stepped slide of one sprite between two screen-space anchors.
struct PlayerTween {
  Vector2 from{};
  Vector2 to{};
  Vector2 current{};
  bool facingRight = true;
};

struct Game {
  LevelCatalog catalog{};
  LevelSession session{};

  // Snapshot of the loaded level for drawing.
  int gridWidth = 0;
  int gridHeight = 0;
  float cellSpacing = 0.0f;
  std::vector<GridPos> cells;
  std::vector<GridPos> hazards;

  PlayerTween leftSprite{};
  PlayerTween rightSprite{};
  bool tweenActive = false;
  float tweenElapsed = 0.0f;
  float hopTimer = 0.0f; // > 0 while the jump pose is shown

  bool winPending = false;
  float winTimer = 0.0f;
  int lastWinMoves = 0;

  Command pendingCommand = Command::None;
  bool wantsExit = false;
  bool screenshotRequested = false;
  float screenshotNotificationTimer = 0.0f;
  char screenshotPath[256] = {};
};

// Loads the catalog at `catalogPath` (falls back to the built-in one) and
// starts the session at `startLevel`. Returns false if no level could load.
bool InitGame(Game &game, const char *catalogPath, int startLevel);

// Polls the keyboard into game.pendingCommand and the meta flags.
void ReadInput(Game &game);

// Feeds the pending command to the session, reacts to its events and
// advances the move tween and win timer.
void UpdateGame(Game &game, float dt);

// Screen position of a cell center for the loaded level.
Vector2 CellToScreen(const Game &game, GridPos pos);

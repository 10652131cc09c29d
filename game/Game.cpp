#include "game/Game.hpp"

#include <algorithm>
#include <cmath>

#include "core/Config.hpp"
#include "core/Log.hpp"

namespace {

Vector2 LerpVec2(const Vector2 &a, const Vector2 &b, const float t) {
  return Vector2{a.x + (b.x - a.x) * t, a.y + (b.y - a.y) * t};
}

// Largest spacing (up to the configured one) that keeps the grid on screen
// with room for the HUD.
float FitCellSpacing(const int width, const int height) {
  const float maxW = static_cast<float>(cfg::kScreenWidth - 120);
  const float maxH = static_cast<float>(cfg::kScreenHeight - 180);
  float spacing = cfg::kCellSpacing;
  if (width > 0)
    spacing = std::min(spacing, maxW / static_cast<float>(width));
  if (height > 0)
    spacing = std::min(spacing, maxH / static_cast<float>(height));
  return spacing;
}

void OnLevelLoaded(Game &game, const SessionEvent &ev) {
  game.gridWidth = ev.width;
  game.gridHeight = ev.height;
  game.cellSpacing = FitCellSpacing(ev.width, ev.height);
  game.cells = ev.occupiedCells;
  game.hazards = ev.hazardCells;

  game.leftSprite.current = CellToScreen(game, ev.left);
  game.leftSprite.from = game.leftSprite.to = game.leftSprite.current;
  game.leftSprite.facingRight = true;
  game.rightSprite.current = CellToScreen(game, ev.right);
  game.rightSprite.from = game.rightSprite.to = game.rightSprite.current;
  game.rightSprite.facingRight = false;

  game.tweenActive = false;
  game.tweenElapsed = 0.0f;
  game.hopTimer = 0.0f;
  game.winPending = false;
  game.winTimer = 0.0f;
}

void OnPositionsChanged(Game &game, const SessionEvent &ev) {
  // Sprites face the way they were pushed; the right one is mirrored.
  if (ev.command == Command::MoveLeft || ev.command == Command::MoveRight) {
    const bool right = ev.command == Command::MoveRight;
    game.leftSprite.facingRight = right;
    game.rightSprite.facingRight = !right;
  }

  game.leftSprite.from = game.leftSprite.current;
  game.leftSprite.to = CellToScreen(game, ev.left);
  game.rightSprite.from = game.rightSprite.current;
  game.rightSprite.to = CellToScreen(game, ev.right);
  game.tweenActive = true;
  game.tweenElapsed = 0.0f;
  game.hopTimer = cfg::kMoveTweenDuration;
}

void HandleEvents(Game &game) {
  for (const SessionEvent &ev : DrainEvents(game.session)) {
    switch (ev.type) {
    case SessionEventType::LevelLoaded:
      OnLevelLoaded(game, ev);
      break;
    case SessionEventType::PositionsChanged:
      OnPositionsChanged(game, ev);
      break;
    case SessionEventType::WinTriggered:
      game.winPending = true;
      game.winTimer = cfg::kWinCelebrationTime;
      game.lastWinMoves = ev.moveCount;
      break;
    case SessionEventType::LevelAdvanced:
      LOG_INFO("Advancing to level {}", ev.levelIndex);
      break;
    }
  }
}

void UpdateTween(Game &game, const float dt) {
  if (!game.tweenActive)
    return;

  game.tweenElapsed += dt;
  const float stepDuration =
      cfg::kMoveTweenDuration / static_cast<float>(cfg::kMoveTweenSteps);
  // Discrete steps: the first one shows immediately.
  const int step = std::min(
      cfg::kMoveTweenSteps,
      static_cast<int>(std::floor(game.tweenElapsed / stepDuration)) + 1);
  const float t =
      static_cast<float>(step) / static_cast<float>(cfg::kMoveTweenSteps);
  game.leftSprite.current = LerpVec2(game.leftSprite.from, game.leftSprite.to, t);
  game.rightSprite.current =
      LerpVec2(game.rightSprite.from, game.rightSprite.to, t);

  if (game.tweenElapsed >= cfg::kMoveTweenDuration) {
    game.leftSprite.current = game.leftSprite.to;
    game.rightSprite.current = game.rightSprite.to;
    game.tweenActive = false;
    ApplyCommand(game.session, Command::AnimationComplete);
  }
}

} // namespace

bool InitGame(Game &game, const char *catalogPath, const int startLevel) {
  if (catalogPath == nullptr ||
      !LoadCatalogFromFile(game.catalog, catalogPath)) {
    LOG_WARN("Using built-in level catalog");
    game.catalog = GetBuiltinCatalog();
  }

  SessionOptions options{};
  options.lockWhileAnimating = true;
  if (StartSession(game.session, game.catalog, startLevel, options) !=
      LayoutError::None) {
    return false;
  }
  HandleEvents(game);
  return true;
}

void ReadInput(Game &game) {
  game.pendingCommand = Command::None;
  const auto &k = cfg::keys;

  if (IsKeyPressed(k.back))
    game.wantsExit = true;
  if (IsKeyPressed(k.screenshot))
    game.screenshotRequested = true;

  if (IsKeyPressed(k.advanceDebug)) {
    game.pendingCommand = Command::AdvanceLevelDebug;
    return;
  }

  if (IsKeyPressed(k.left) || IsKeyPressed(k.leftAlt))
    game.pendingCommand = Command::MoveLeft;
  else if (IsKeyPressed(k.right) || IsKeyPressed(k.rightAlt))
    game.pendingCommand = Command::MoveRight;
  else if (IsKeyPressed(k.up) || IsKeyPressed(k.upAlt))
    game.pendingCommand = Command::MoveUp;
  else if (IsKeyPressed(k.down) || IsKeyPressed(k.downAlt))
    game.pendingCommand = Command::MoveDown;
}

void UpdateGame(Game &game, const float dt) {
  if (game.pendingCommand != Command::None) {
    ApplyCommand(game.session, game.pendingCommand);
    game.pendingCommand = Command::None;
  }
  HandleEvents(game);

  UpdateTween(game, dt);
  if (game.hopTimer > 0.0f)
    game.hopTimer = std::max(0.0f, game.hopTimer - dt);

  if (game.winPending) {
    game.winTimer -= dt;
    if (game.winTimer <= 0.0f) {
      game.winPending = false;
      if (!ApplyCommand(game.session, Command::AcknowledgeWin)) {
        LOG_ERROR("Next level failed to load, staying on level {}",
                  game.session.levelIndex);
      }
    }
  }
  HandleEvents(game);

  if (game.screenshotNotificationTimer > 0.0f)
    game.screenshotNotificationTimer -= dt;
}

Vector2 CellToScreen(const Game &game, const GridPos pos) {
  const AnchoredPos a = GetAnchoredPosition(pos, game.gridWidth,
                                            game.gridHeight, game.cellSpacing);
  // Grid y grows upward, screen y grows downward.
  return Vector2{static_cast<float>(cfg::kScreenWidth) * 0.5f + a.x,
                 static_cast<float>(cfg::kScreenHeight) * 0.5f + 20.0f - a.y};
}

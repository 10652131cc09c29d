#include "sim/Players.hpp"

namespace {

// Axis and left-player direction of a move command. False for non-moves.
bool GetMoveVector(const Command c, Axis &axis, int &leftDirection) {
  switch (c) {
  case Command::MoveLeft:
    axis = Axis::X;
    leftDirection = -1;
    return true;
  case Command::MoveRight:
    axis = Axis::X;
    leftDirection = 1;
    return true;
  case Command::MoveUp:
    axis = Axis::Y;
    leftDirection = 1;
    return true;
  case Command::MoveDown:
    axis = Axis::Y;
    leftDirection = -1;
    return true;
  default:
    return false;
  }
}

} // namespace

void InitPlayers(DualPlayerState &players, const LevelLayout &layout) {
  players.left = layout.leftStart;
  players.right = layout.rightStart;
  players.leftBounds = layout.leftBounds;
  players.rightBounds = layout.rightBounds;
}

MoveResult ApplyMove(DualPlayerState &players, const OccupancyGrid &grid,
                     const Command c) {
  MoveResult result{};
  Axis axis = Axis::X;
  int leftDirection = 0;
  if (!GetMoveVector(c, axis, leftDirection)) {
    result.left = players.left;
    result.right = players.right;
    return result;
  }

  bool leftWrapped = false;
  bool rightWrapped = false;
  const GridPos nextLeft =
      FindNextValid(grid, players.left, axis, leftDirection,
                    BoundOnAxis(players.leftBounds, axis), &leftWrapped);
  // Mirrored: the right player always gets the opposite direction.
  const GridPos nextRight =
      FindNextValid(grid, players.right, axis, -leftDirection,
                    BoundOnAxis(players.rightBounds, axis), &rightWrapped);

  players.left = nextLeft;
  players.right = nextRight;

  result.left = nextLeft;
  result.right = nextRight;
  result.crossedBoundary = leftWrapped || rightWrapped;
  return result;
}

bool AreAdjacentAcrossSplit(const DualPlayerState &players,
                            const Axis splitAxis) {
  const GridPos &l = players.left;
  const GridPos &r = players.right;
  if (splitAxis == Axis::X)
    return l.x + 1 == r.x && l.y == r.y;
  return l.y == r.y + 1 && l.x == r.x;
}

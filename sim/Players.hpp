#pragma once

#include "sim/Level.hpp"

// Both characters' grid positions and the halves they are confined to.
struct DualPlayerState {
  GridPos left{};
  GridPos right{};
  PlayerBounds leftBounds{};
  PlayerBounds rightBounds{};
};

struct MoveResult {
  GridPos left{};
  GridPos right{};
  bool crossedBoundary = false; // either player wrapped past its half's edge
};

// Places both players on their start cells.
void InitPlayers(DualPlayerState &players, const LevelLayout &layout);

// Moves the left player along the command's direction and the right player
// the opposite way on the same axis, each inside its own bound. Non-move
// commands leave the state unchanged.
MoveResult ApplyMove(DualPlayerState &players, const OccupancyGrid &grid,
                     Command c);

// True when the players face each other across the seam: horizontally
// adjacent on an X split, vertically adjacent (left on top) on a Y split.
bool AreAdjacentAcrossSplit(const DualPlayerState &players, Axis splitAxis);

#include "sim/Level.hpp"

void ComputeSplitBounds(const Axis splitAxis, const int width,
                        const int height, PlayerBounds &left,
                        PlayerBounds &right) {
  if (splitAxis == Axis::X) {
    const int halfWidth = width / 2;
    left.x = AxisBound{0, halfWidth - 1};
    left.y = AxisBound{0, height - 1};
    right.x = AxisBound{halfWidth, width - 1};
    right.y = AxisBound{0, height - 1};
  } else {
    // Left player owns the top half; y grows upward.
    const int halfHeight = height / 2;
    left.x = AxisBound{0, width - 1};
    left.y = AxisBound{halfHeight, height - 1};
    right.x = AxisBound{0, width - 1};
    right.y = AxisBound{0, halfHeight - 1};
  }
}

GridPos FindNextValid(const OccupancyGrid &grid, const GridPos start,
                      const Axis axis, const int direction,
                      const AxisBound bound, bool *wrapped) {
  if (wrapped)
    *wrapped = false;
  if (direction == 0 || bound.max < bound.min)
    return start;

  const int step = (direction > 0) ? 1 : -1;
  GridPos candidate = start;
  int &coord = (axis == Axis::X) ? candidate.x : candidate.y;
  bool didWrap = false;

  // At most one lap of the bound, so an empty half cannot loop forever.
  const int span = bound.max - bound.min + 1;
  for (int i = 0; i < span; ++i) {
    coord += step;
    if (coord < bound.min) {
      coord = bound.max;
      didWrap = true;
    } else if (coord > bound.max) {
      coord = bound.min;
      didWrap = true;
    }
    if (IsOccupied(grid, candidate)) {
      if (wrapped)
        *wrapped = didWrap && candidate != start;
      return candidate;
    }
  }
  return start;
}

AnchoredPos GetAnchoredPosition(const GridPos pos, const int width,
                                const int height, const float cellSpacing) {
  const float offsetX = static_cast<float>(width - 1) * 0.5f;
  const float offsetY = static_cast<float>(height - 1) * 0.5f;
  return AnchoredPos{(static_cast<float>(pos.x) - offsetX) * cellSpacing,
                     (static_cast<float>(pos.y) - offsetY) * cellSpacing};
}

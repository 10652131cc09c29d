#include "sim/Solver.hpp"

#include <algorithm>
#include <cstdint>
#include <deque>

#include "sim/Players.hpp"

namespace {

constexpr Command kMoves[] = {Command::MoveLeft, Command::MoveRight,
                              Command::MoveUp, Command::MoveDown};

struct StateCodec {
  int width = 0;
  int height = 0;

  int Encode(const GridPos &l, const GridPos &r) const {
    const int cells = width * height;
    return (l.y * width + l.x) * cells + (r.y * width + r.x);
  }

  void Decode(const int code, GridPos &l, GridPos &r) const {
    const int cells = width * height;
    const int lc = code / cells;
    const int rc = code % cells;
    l = GridPos{lc % width, lc / width};
    r = GridPos{rc % width, rc / width};
  }
};

} // namespace

bool SolveLevel(const LevelLayout &layout, std::vector<Command> &solution,
                int *statesVisited) {
  solution.clear();
  if (statesVisited)
    *statesVisited = 0;

  const StateCodec codec{layout.grid.width, layout.grid.height};
  const int cells = codec.width * codec.height;
  if (cells <= 0)
    return false;

  // parent[state] == -1 marks unvisited; the start points at itself.
  std::vector<int32_t> parent(static_cast<size_t>(cells) * cells, -1);
  std::vector<int8_t> via(parent.size(), -1);

  DualPlayerState players{};
  InitPlayers(players, layout);

  const int start = codec.Encode(players.left, players.right);
  parent[start] = start;
  std::deque<int> open;
  open.push_back(start);

  int visited = 0;
  int goal = -1;
  while (!open.empty()) {
    const int current = open.front();
    open.pop_front();
    ++visited;

    codec.Decode(current, players.left, players.right);
    if (AreAdjacentAcrossSplit(players, layout.splitAxis)) {
      goal = current;
      break;
    }

    for (int m = 0; m < 4; ++m) {
      DualPlayerState next = players;
      ApplyMove(next, layout.grid, kMoves[m]);
      const int code = codec.Encode(next.left, next.right);
      if (parent[code] != -1)
        continue;
      parent[code] = current;
      via[code] = static_cast<int8_t>(m);
      open.push_back(code);
    }
  }

  if (statesVisited)
    *statesVisited = visited;
  if (goal < 0)
    return false;

  for (int s = goal; s != start; s = parent[s])
    solution.push_back(kMoves[via[s]]);
  std::reverse(solution.begin(), solution.end());
  solution.push_back(layout.winCommand);
  return true;
}

#pragma once

#include <vector>

#include "sim/Level.hpp"

// Breadth-first search over both players' positions. On success `solution`
// holds a shortest command sequence from the start cells, ending with the
// level's win command. Returns false when the level cannot be won.
// `statesVisited` (optional) receives the number of expanded states.
bool SolveLevel(const LevelLayout &layout, std::vector<Command> &solution,
                int *statesVisited = nullptr);

#pragma once

#include <raylib.h>

struct BoardPalette {
    Color background{};
    Color halfTint{};     // second half of the board
    Color cell{};
    Color cellEdge{};
    Color seam{};
    Color hazard{};
    Color leftPlayer{};
    Color rightPlayer{};
    Color playerEye{};
    Color uiPanel{};
    Color uiText{};
    Color uiAccent{};
};

// Palette 0 is used for X-split (side by side) boards, 1 for Y-split
// (stacked) boards.
const BoardPalette& GetPalette(int index);

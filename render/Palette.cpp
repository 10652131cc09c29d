#include "render/Palette.hpp"

namespace {

constexpr BoardPalette kPalettes[] = {
    // Side by side: warm left, cool right.
    BoardPalette{
        Color{24, 22, 38, 255},    // background
        Color{30, 34, 54, 255},    // halfTint
        Color{232, 214, 178, 255}, // cell
        Color{150, 128, 96, 255},  // cellEdge
        Color{255, 196, 84, 200},  // seam
        Color{220, 60, 70, 255},   // hazard
        Color{255, 138, 76, 255},  // leftPlayer
        Color{86, 170, 255, 255},  // rightPlayer
        Color{20, 20, 28, 255},    // playerEye
        Color{12, 12, 20, 200},    // uiPanel
        Color{236, 236, 240, 255}, // uiText
        Color{255, 196, 84, 255},  // uiAccent
    },
    // Stacked: sky on top, ground below.
    BoardPalette{
        Color{18, 30, 40, 255},
        Color{30, 26, 22, 255},
        Color{196, 230, 214, 255},
        Color{98, 150, 132, 255},
        Color{120, 255, 200, 200},
        Color{220, 60, 70, 255},
        Color{255, 138, 76, 255},
        Color{86, 170, 255, 255},
        Color{20, 20, 28, 255},
        Color{10, 16, 20, 200},
        Color{236, 240, 238, 255},
        Color{120, 255, 200, 255},
    },
};

constexpr int kPaletteCount =
    static_cast<int>(sizeof(kPalettes) / sizeof(kPalettes[0]));

} // namespace

const BoardPalette& GetPalette(const int index) {
    if (index < 0 || index >= kPaletteCount) {
        return kPalettes[0];
    }
    return kPalettes[index];
}

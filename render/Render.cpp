#include "render/Render.hpp"

#include <cmath>
#include <cstdio>

#include "core/Config.hpp"
#include "game/Game.hpp"
#include "render/Palette.hpp"
#include "sim/Level.hpp"

namespace {

// --- Board ---

Rectangle CellRect(const Vector2 center, const float size) {
    return Rectangle{center.x - size * 0.5f, center.y - size * 0.5f, size, size};
}

float CellScale(const Game& game) {
    return game.cellSpacing / cfg::kCellSpacing;
}

void DrawHalves(const Game& game, const BoardPalette& pal) {
    if (game.gridWidth <= 0 || game.gridHeight <= 0) return;

    // Tint the right/bottom player's half so the seam reads at a glance.
    const PlayerBounds& rb = game.session.layout.rightBounds;
    const Vector2 lo = CellToScreen(game, GridPos{rb.x.min, rb.y.max});
    const Vector2 hi = CellToScreen(game, GridPos{rb.x.max, rb.y.min});
    const float pad = game.cellSpacing * 0.5f;
    DrawRectangleRec(Rectangle{lo.x - pad, lo.y - pad, hi.x - lo.x + 2.0f * pad,
                               hi.y - lo.y + 2.0f * pad},
                     pal.halfTint);

    const GridPos a = (game.session.layout.splitAxis == Axis::X)
                          ? GridPos{rb.x.min, 0}
                          : GridPos{0, rb.y.max};
    const GridPos b = (game.session.layout.splitAxis == Axis::X)
                          ? GridPos{rb.x.min, game.gridHeight - 1}
                          : GridPos{game.gridWidth - 1, rb.y.max};
    Vector2 from = CellToScreen(game, a);
    Vector2 to = CellToScreen(game, b);
    if (game.session.layout.splitAxis == Axis::X) {
        from.x -= pad;
        to.x -= pad;
        from.y += pad;
        to.y -= pad;
    } else {
        from.y -= pad;
        to.y -= pad;
        from.x -= pad;
        to.x += pad;
    }
    DrawLineEx(from, to, 4.0f, pal.seam);
}

void DrawCells(const Game& game, const BoardPalette& pal) {
    const float size = cfg::kCellSize * CellScale(game);
    for (const GridPos& p : game.cells) {
        const Rectangle r = CellRect(CellToScreen(game, p), size);
        DrawRectangleRounded(r, 0.18f, 6, pal.cell);
        DrawRectangleLinesEx(r, 3.0f, pal.cellEdge);
    }

    const float inset = cfg::kHazardInset * CellScale(game);
    for (const GridPos& p : game.hazards) {
        const Rectangle r = CellRect(CellToScreen(game, p), size);
        DrawLineEx(Vector2{r.x + inset, r.y + inset},
                   Vector2{r.x + r.width - inset, r.y + r.height - inset}, 8.0f,
                   pal.hazard);
        DrawLineEx(Vector2{r.x + r.width - inset, r.y + inset},
                   Vector2{r.x + inset, r.y + r.height - inset}, 8.0f,
                   pal.hazard);
    }
}

void DrawPlayer(const Game& game, const PlayerTween& sprite, const Color body,
                const BoardPalette& pal) {
    const float scale = CellScale(game);
    const float size = cfg::kPlayerSize * scale;

    // Small hop while a move is playing.
    float lift = 0.0f;
    if (game.hopTimer > 0.0f) {
        const float t = 1.0f - game.hopTimer / cfg::kMoveTweenDuration;
        lift = std::sin(t * PI) * 18.0f * scale;
    }

    Vector2 c = sprite.current;
    c.y -= lift;
    DrawRectangleRounded(CellRect(c, size), 0.35f, 8, body);

    const float eyeX = c.x + (sprite.facingRight ? 1.0f : -1.0f) * size * 0.2f;
    DrawCircleV(Vector2{eyeX, c.y - size * 0.12f}, size * 0.09f, pal.playerEye);
}

// --- HUD ---

void DrawHud(const Game& game, const BoardPalette& pal) {
    const LevelSession& s = game.session;
    const LevelDefinition* current = GetCurrentLevel(s);
    if (!current) return;
    const LevelDefinition& def = *current;

    DrawRectangle(0, 0, cfg::kScreenWidth, 56, pal.uiPanel);

    char buf[160];
    std::snprintf(buf, sizeof(buf), "Level %d/%d  %s", s.levelIndex + 1,
                  s.catalog->count, def.name);
    DrawText(buf, 20, 16, cfg::kHudFontSize, pal.uiText);

    if (def.par > 0) {
        std::snprintf(buf, sizeof(buf), "Moves %d   Par %d", s.moveCount, def.par);
    } else {
        std::snprintf(buf, sizeof(buf), "Moves %d", s.moveCount);
    }
    const int w = MeasureText(buf, cfg::kHudFontSize);
    DrawText(buf, cfg::kScreenWidth - w - 20, 16, cfg::kHudFontSize, pal.uiAccent);

    const char* hint = "Arrows/WASD move both  |  L skip level  |  F12 screenshot";
    const int hw = MeasureText(hint, 18);
    DrawText(hint, (cfg::kScreenWidth - hw) / 2, cfg::kScreenHeight - 32, 18,
             Fade(pal.uiText, 0.6f));

    if (game.screenshotNotificationTimer > 0.0f) {
        std::snprintf(buf, sizeof(buf), "Saved %s", game.screenshotPath);
        DrawText(buf, 20, cfg::kScreenHeight - 60, 18, pal.uiAccent);
    }
}

void DrawWinBanner(const Game& game, const BoardPalette& pal) {
    if (game.session.state != SessionState::Winning) return;

    char buf[96];
    std::snprintf(buf, sizeof(buf), "Solved in %d moves", game.lastWinMoves);
    const int w = MeasureText(buf, cfg::kBannerFontSize);
    const int x = (cfg::kScreenWidth - w) / 2;
    const int y = cfg::kScreenHeight / 2 - cfg::kBannerFontSize / 2;
    DrawRectangle(x - 30, y - 20, w + 60, cfg::kBannerFontSize + 40, pal.uiPanel);
    DrawText(buf, x, y, cfg::kBannerFontSize, pal.uiAccent);
}

} // namespace

void RenderFrame(const Game& game) {
    const int paletteIndex =
        (game.session.layout.splitAxis == Axis::X) ? 0 : 1;
    const BoardPalette& pal = GetPalette(paletteIndex);

    BeginDrawing();
    ClearBackground(pal.background);

    DrawHalves(game, pal);
    DrawCells(game, pal);
    DrawPlayer(game, game.leftSprite, pal.leftPlayer, pal);
    DrawPlayer(game, game.rightSprite, pal.rightPlayer, pal);
    DrawHud(game, pal);
    DrawWinBanner(game, pal);

    EndDrawing();
}

#pragma once

namespace cfg {
constexpr int kScreenWidth = 1280;
constexpr int kScreenHeight = 720;
constexpr int kTargetFps = 60;

// Distance between neighbouring cell centers, in screen pixels.
constexpr float kCellSpacing = 150.0f;
constexpr float kCellSize = 110.0f;
constexpr float kPlayerSize = 80.0f;
constexpr float kHazardInset = 28.0f;

// Stepped move tween. The players snap through kMoveTweenSteps discrete
// positions over kMoveTweenDuration seconds.
constexpr float kMoveTweenDuration = 0.25f;
constexpr int kMoveTweenSteps = 6;

// How long the win banner stays up before the level advances.
constexpr float kWinCelebrationTime = 1.2f;

constexpr int kHudFontSize = 24;
constexpr int kBannerFontSize = 48;

// Default catalog, relative to the assets directory. The built-in catalog
// is used when the file is missing or invalid.
constexpr const char *kDefaultCatalogPath = "levels/catalog.json";

// --- Controls ---
struct KeyConfig {
  int left = 263;         // KEY_LEFT
  int leftAlt = 65;       // KEY_A
  int right = 262;        // KEY_RIGHT
  int rightAlt = 68;      // KEY_D
  int up = 265;           // KEY_UP
  int upAlt = 87;         // KEY_W
  int down = 264;         // KEY_DOWN
  int downAlt = 83;       // KEY_S
  int advanceDebug = 76;  // KEY_L
  int back = 256;         // KEY_ESCAPE
  int screenshot = 301;   // KEY_F12
};

extern KeyConfig keys;

} // namespace cfg

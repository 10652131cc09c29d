#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <string>

#include <raylib.h>

#include "core/Assets.hpp"
#include "core/Config.hpp"
#include "core/CrashHandler.hpp"
#include "core/Log.hpp"
#include "game/Game.hpp"
#include "render/Render.hpp"

namespace {

void PrintUsage() {
  std::printf("Usage: mirrorstep [options]\n"
              "  --catalog <path>   Level catalog JSON (default: assets/%s)\n"
              "  --builtin          Ignore catalog files, use built-in levels\n"
              "  --level <n>        Start level, 1-based (default: 1)\n"
              "  -h, --help         Print usage\n",
              cfg::kDefaultCatalogPath);
}

} // namespace

int main(int argc, char **argv) {
  std::string catalogPath;
  bool useBuiltin = false;
  int startLevel = 1;

  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--catalog") == 0 && i + 1 < argc) {
      catalogPath = argv[++i];
    } else if (std::strcmp(argv[i], "--builtin") == 0) {
      useBuiltin = true;
    } else if (std::strcmp(argv[i], "--level") == 0 && i + 1 < argc) {
      startLevel = std::atoi(argv[++i]);
    } else if (std::strcmp(argv[i], "-h") == 0 ||
               std::strcmp(argv[i], "--help") == 0) {
      PrintUsage();
      return 0;
    } else {
      std::fprintf(stderr, "Unknown argument: %s\n", argv[i]);
      PrintUsage();
      return 1;
    }
  }

  Log::Init();
  CrashHandler::Init();
  LOG_INFO("MirrorStep starting...");

  if (catalogPath.empty() && assets::Exists(cfg::kDefaultCatalogPath)) {
    catalogPath = assets::Path(cfg::kDefaultCatalogPath);
  }

  // The catalog alone is ~70 KB; keep the game off the stack.
  static Game game{};
  if (!InitGame(game, useBuiltin ? nullptr : catalogPath.c_str(),
                startLevel - 1)) {
    LOG_CRITICAL("No playable level, exiting");
    Log::Shutdown();
    return 1;
  }

  SetConfigFlags(FLAG_MSAA_4X_HINT);
  InitWindow(cfg::kScreenWidth, cfg::kScreenHeight, "MirrorStep");
  SetExitKey(0); // ESC is handled by ReadInput.
  SetTargetFPS(cfg::kTargetFps);

  while (!WindowShouldClose() && !game.wantsExit) {
    ReadInput(game);
    UpdateGame(game, GetFrameTime());
    RenderFrame(game);

    if (game.screenshotRequested) {
      std::time_t now = std::time(nullptr);
      std::tm *tm = std::localtime(&now);
      char filename[128];
      std::snprintf(filename, sizeof(filename),
                    "screenshot_%04d%02d%02d_%02d%02d%02d.png",
                    tm->tm_year + 1900, tm->tm_mon + 1, tm->tm_mday,
                    tm->tm_hour, tm->tm_min, tm->tm_sec);
      TakeScreenshot(filename);
      std::snprintf(game.screenshotPath, sizeof(game.screenshotPath), "%s",
                    filename);
      game.screenshotNotificationTimer = 3.0f;
      game.screenshotRequested = false;
    }
  }

  LOG_INFO("MirrorStep shutting down...");
  CloseWindow();
  Log::Shutdown();
  return 0;
}

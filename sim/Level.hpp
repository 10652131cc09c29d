#pragma once

#include <cstdint>

// Grid axis. A level's split axis is the one along which the grid is divided
// into the two characters' exclusive halves.
enum class Axis : int {
  X = 0, // left/right halves ("horizontal" level)
  Y = 1  // top/bottom halves ("vertical" level)
};

// Abstract player/host command. Polling keys into commands is the
// presentation layer's job.
enum class Command : int {
  None = -1,
  MoveLeft = 0,
  MoveRight = 1,
  MoveUp = 2,
  MoveDown = 3,
  AdvanceLevelDebug = 4, // skip to the next level from any live state
  AcknowledgeWin = 5,    // leave the Winning state and load the next level
  AnimationComplete = 6  // release the movement lock after a tween
};

inline bool IsMoveCommand(const Command c) {
  return c == Command::MoveLeft || c == Command::MoveRight ||
         c == Command::MoveUp || c == Command::MoveDown;
}

const char *GetCommandLabel(Command c);

// Parses the labels produced by GetCommandLabel. Returns Command::None for
// anything else.
Command ParseCommandLabel(const char *label);

struct GridPos {
  int x = 0;
  int y = 0;
};

inline bool operator==(const GridPos &a, const GridPos &b) {
  return a.x == b.x && a.y == b.y;
}
inline bool operator!=(const GridPos &a, const GridPos &b) { return !(a == b); }

// Inclusive integer range on one axis.
struct AxisBound {
  int min = 0;
  int max = 0;
};

struct PlayerBounds {
  AxisBound x{};
  AxisBound y{};
};

inline const AxisBound &BoundOnAxis(const PlayerBounds &b, const Axis axis) {
  return (axis == Axis::X) ? b.x : b.y;
}

inline bool Contains(const PlayerBounds &b, const GridPos &p) {
  return p.x >= b.x.min && p.x <= b.x.max && p.y >= b.y.min && p.y <= b.y.max;
}

// Fixed-capacity level data. No heap, trivially copyable.
constexpr int kMaxGridWidth = 32;
constexpr int kMaxGridHeight = 32;
constexpr int kMaxLevelNameLength = 48;
constexpr int kMaxHazards = kMaxGridWidth * kMaxGridHeight;

// Layout cell alphabet.
constexpr char kCellEmpty = '.';
constexpr char kCellPlain = '0';
constexpr char kCellLeftStart = '1';
constexpr char kCellRightStart = '2';
constexpr char kCellHazard = 'X';

// One puzzle layout as authored. Rows are stored top-to-bottom exactly as
// written; ragged rows are allowed and padded with empty cells on build.
struct LevelDefinition {
  char name[kMaxLevelNameLength] = "";
  char rows[kMaxGridHeight][kMaxGridWidth + 1]{};
  int rowCount = 0;
  Axis splitAxis = Axis::X;
  Command winCommand = Command::MoveRight;
  int par = -1; // designer's target press count incl. the winning press; -1 unknown
};

struct LevelDefinitionInit {
  const char *name = "";
  Axis splitAxis = Axis::X;
  Command winCommand = Command::MoveRight;
  int par = -1;
};

// Copies `rowCount` rows into `out`. Returns false, leaving `out` untouched,
// when the rows do not fit the fixed capacity.
bool MakeLevelDefinition(LevelDefinition &out, const LevelDefinitionInit &init,
                         const char *const *rows, int rowCount);

// Row width the definition was authored with, before padding.
int GetLevelWidth(const LevelDefinition &def);

// Cell (x, y) is true iff the cell is part of the level. y grows upward:
// source row 0 is y == height - 1.
struct OccupancyGrid {
  int width = 0;
  int height = 0;
  bool cells[kMaxGridHeight][kMaxGridWidth]{}; // [y][x]
};

// Out-of-range coordinates are never occupied.
bool IsOccupied(const OccupancyGrid &grid, GridPos pos);
int CountOccupied(const OccupancyGrid &grid);

enum class LayoutError : int {
  None = 0,
  EmptyLayout,       // zero width or height
  TooLarge,          // exceeds kMaxGridWidth x kMaxGridHeight
  OddSplitDimension, // split dimension cannot be halved
  MissingStart,      // no '1' or no '2'
  DuplicateStart,    // more than one '1' or '2'
  StartOutsideHalf,  // a start cell lies in the other character's half
  InvalidWinCommand  // win command is not a directional move
};

const char *GetLayoutErrorLabel(LayoutError e);

// Everything derived from a LevelDefinition when a level is loaded.
struct LevelLayout {
  OccupancyGrid grid{};
  GridPos leftStart{};
  GridPos rightStart{};
  PlayerBounds leftBounds{};
  PlayerBounds rightBounds{};
  GridPos hazards[kMaxHazards]{};
  int hazardCount = 0;
  Axis splitAxis = Axis::X;
  Command winCommand = Command::MoveRight;
};

// Scans the definition into `out`. On failure `out` is left untouched and the
// reason is returned.
LayoutError BuildLevelLayout(const LevelDefinition &def, LevelLayout &out);

// Splits a width x height grid into the two characters' bounds. The left
// character takes the low-X half of an X split and the top half of a Y split.
void ComputeSplitBounds(Axis splitAxis, int width, int height,
                        PlayerBounds &left, PlayerBounds &right);

// Steps `start` along `axis` by `direction` (+1/-1), wrapping inside `bound`,
// and returns the first occupied cell. Gives up after one full lap of the
// bound and returns `start`. `wrapped` (optional) is set when the returned
// cell was reached by wrapping past an edge of the bound.
GridPos FindNextValid(const OccupancyGrid &grid, GridPos start, Axis axis,
                      int direction, AxisBound bound, bool *wrapped = nullptr);

// Screen-space offset of a cell with the grid centered on the origin.
struct AnchoredPos {
  float x = 0.0f;
  float y = 0.0f;
};
AnchoredPos GetAnchoredPosition(GridPos pos, int width, int height,
                                float cellSpacing);

// Ordered level list. Indices wrap modulo `count`.
constexpr int kMaxCatalogLevels = 64;

struct LevelCatalog {
  LevelDefinition levels[kMaxCatalogLevels]{};
  int count = 0;
};

// Maps any integer onto [0, count). Returns 0 for an empty catalog.
int WrapLevelIndex(const LevelCatalog &catalog, int index);

// The six hand-made levels shipped with the game.
const LevelCatalog &GetBuiltinCatalog();

// Load a catalog from a JSON document. On failure `catalog` is left untouched.
bool LoadCatalogFromString(LevelCatalog &catalog, const char *text,
                           const char *sourceName);

// Load a catalog from a JSON file (absolute, or relative to the working
// directory; use assets::Path for asset-relative paths).
bool LoadCatalogFromFile(LevelCatalog &catalog, const char *path);

// Serialize a catalog back to the JSON format read by the loaders.
bool SaveCatalogToFile(const LevelCatalog &catalog, const char *path);

// Checks every level of the catalog builds. Logs each failure and returns
// the number of levels that failed.
int ValidateCatalog(const LevelCatalog &catalog);

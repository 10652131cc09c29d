#include "sim/Level.hpp"

#include "core/Log.hpp"
#include <cstdint>
#include <fstream>
#include <iterator>
#include <limits>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace {

// Accepts "X"/"Y" as well as the designer names "horizontal"/"vertical".
bool GetSplitAxis(const json &j, const char *key, Axis &out) {
  if (!j.contains(key)) {
    out = Axis::X;
    return true;
  }
  const auto &val = j[key];
  if (val.is_number_integer()) {
    const int64_t v = val.get<int64_t>();
    if (v != 0 && v != 1)
      return false;
    out = static_cast<Axis>(v);
    return true;
  }
  if (val.is_string()) {
    const std::string s = val.get<std::string>();
    if (s == "X" || s == "x" || s == "horizontal") {
      out = Axis::X;
      return true;
    }
    if (s == "Y" || s == "y" || s == "vertical") {
      out = Axis::Y;
      return true;
    }
  }
  return false;
}

// Missing win command defaults to the move that closes the seam.
bool GetWinCommand(const json &j, const char *key, const Axis splitAxis,
                   Command &out) {
  if (!j.contains(key)) {
    out = (splitAxis == Axis::X) ? Command::MoveRight : Command::MoveDown;
    return true;
  }
  const auto &val = j[key];
  if (!val.is_string())
    return false;
  out = ParseCommandLabel(val.get<std::string>().c_str());
  return out != Command::None;
}

// Optional integer field. Floats and out-of-range values are rejected.
bool GetOptionalInt(const json &j, const char *key, const int fallback,
                    int &out) {
  if (!j.contains(key)) {
    out = fallback;
    return true;
  }
  const auto &val = j[key];
  if (val.is_number_unsigned()) {
    const uint64_t v = val.get<uint64_t>();
    if (v > static_cast<uint64_t>(std::numeric_limits<int>::max()))
      return false;
    out = static_cast<int>(v);
    return true;
  }
  if (!val.is_number_integer())
    return false;
  const int64_t v = val.get<int64_t>();
  if (v < std::numeric_limits<int>::min() ||
      v > std::numeric_limits<int>::max())
    return false;
  out = static_cast<int>(v);
  return true;
}

bool ParseLevel(const json &l_json, const int index, LevelDefinition &out) {
  if (!l_json.is_object()) {
    LOG_ERROR("Level {} is not an object", index);
    return false;
  }
  if (!l_json.contains("rows") || !l_json["rows"].is_array()) {
    LOG_ERROR("Level {} has no 'rows' array", index);
    return false;
  }

  const std::string name =
      l_json.value("name", std::string("Level ") + std::to_string(index + 1));

  LevelDefinitionInit init{};
  init.name = name.c_str();
  if (!GetOptionalInt(l_json, "par", -1, init.par)) {
    LOG_ERROR("Level '{}' has a non-integer 'par' value", name);
    return false;
  }
  if (!GetSplitAxis(l_json, "split", init.splitAxis)) {
    LOG_ERROR("Level '{}' has an unknown 'split' value", name);
    return false;
  }
  if (!GetWinCommand(l_json, "winCommand", init.splitAxis, init.winCommand)) {
    LOG_ERROR("Level '{}' has an unknown 'winCommand' value", name);
    return false;
  }

  std::vector<std::string> rows;
  for (const auto &r_json : l_json["rows"]) {
    if (!r_json.is_string()) {
      LOG_ERROR("Level '{}' has a non-string row", name);
      return false;
    }
    rows.push_back(r_json.get<std::string>());
  }
  std::vector<const char *> rowPtrs;
  rowPtrs.reserve(rows.size());
  for (const auto &r : rows)
    rowPtrs.push_back(r.c_str());

  return MakeLevelDefinition(out, init, rowPtrs.data(),
                             static_cast<int>(rowPtrs.size()));
}

const char *GetSplitAxisLabel(const Axis axis) {
  return (axis == Axis::X) ? "X" : "Y";
}

} // namespace

bool LoadCatalogFromString(LevelCatalog &catalog, const char *text,
                           const char *sourceName) {
  // Catalogs are large; parse into a heap copy so `catalog` is only replaced
  // once every level has been read.
  auto parsed = std::make_unique<LevelCatalog>();

  try {
    json data = json::parse(text);

    if (!data.contains("levels") || !data["levels"].is_array()) {
      LOG_ERROR("Catalog {} has no 'levels' array", sourceName);
      return false;
    }

    for (const auto &l_json : data["levels"]) {
      if (parsed->count >= kMaxCatalogLevels) {
        LOG_WARN("Catalog {} has more than {} levels, rest ignored",
                 sourceName, kMaxCatalogLevels);
        break;
      }
      if (!ParseLevel(l_json, parsed->count, parsed->levels[parsed->count])) {
        LOG_ERROR("Catalog {}: level {} could not be read", sourceName,
                  parsed->count);
        return false;
      }
      ++parsed->count;
    }
  } catch (const json::exception &e) {
    LOG_ERROR("JSON error in {}: {}", sourceName, e.what());
    return false;
  }

  if (parsed->count == 0) {
    LOG_ERROR("Catalog {} contains no levels", sourceName);
    return false;
  }

  // All or nothing: one level that cannot build rejects the file.
  const int invalid = ValidateCatalog(*parsed);
  if (invalid > 0) {
    LOG_ERROR("Catalog {} has {} invalid level(s)", sourceName, invalid);
    return false;
  }

  catalog = *parsed;
  LOG_INFO("Loaded {} level(s) from {}", catalog.count, sourceName);
  return true;
}

bool LoadCatalogFromFile(LevelCatalog &catalog, const char *path) {
  std::ifstream f(path);
  if (!f.is_open()) {
    LOG_ERROR("Failed to open level catalog: {}", path);
    return false;
  }
  const std::string text((std::istreambuf_iterator<char>(f)),
                         std::istreambuf_iterator<char>());
  return LoadCatalogFromString(catalog, text.c_str(), path);
}

bool SaveCatalogToFile(const LevelCatalog &catalog, const char *path) {
  json data;
  data["levels"] = json::array();
  for (int i = 0; i < catalog.count; ++i) {
    const LevelDefinition &def = catalog.levels[i];
    json l_json;
    l_json["name"] = def.name;
    l_json["split"] = GetSplitAxisLabel(def.splitAxis);
    l_json["winCommand"] = GetCommandLabel(def.winCommand);
    if (def.par >= 0)
      l_json["par"] = def.par;
    l_json["rows"] = json::array();
    for (int r = 0; r < def.rowCount; ++r)
      l_json["rows"].push_back(std::string(def.rows[r]));
    data["levels"].push_back(l_json);
  }

  std::ofstream f(path);
  if (!f.is_open()) {
    LOG_ERROR("Failed to write level catalog: {}", path);
    return false;
  }
  f << data.dump(2) << '\n';
  return static_cast<bool>(f);
}

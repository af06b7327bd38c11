#include "level/Level.h"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <toml++/toml.h>

#include "actor/Behaviors.h"
#include "ecs/World.h"
#include "terrain/TerrainClass.h"
#include "util/Paths.h"
#include "util/TomlUtil.h"

// Test level layout (used by loadTestLevel fallback)
static constexpr int kTestW = 96;
static constexpr int kTestH = 48;
static constexpr int kTestFloorRow = 42;
static constexpr int kTestStepCol = 60;  // floor is 1px higher from here on
static constexpr int kTestWallCols = 2;

namespace {

struct PixelCanvas {
  int w = 0;
  int h = 0;
  std::vector<std::uint8_t> rgba;

  PixelCanvas(int width, int height, Rgb8 fill)
      : w(width), h(height), rgba(static_cast<std::size_t>(width * height) * 4) {
    rect(0, 0, width, height, fill);
  }

  void rect(int x0, int y0, int rw, int rh, Rgb8 c) {
    for (int y = std::max(0, y0); y < std::min(h, y0 + rh); ++y) {
      for (int x = std::max(0, x0); x < std::min(w, x0 + rw); ++x) {
        std::uint8_t* px = &rgba[(static_cast<std::size_t>(y) * w + x) * 4];
        px[0] = c.r;
        px[1] = c.g;
        px[2] = c.b;
        px[3] = 255;
      }
    }
  }
};

Rgb8 colorOf(TerrainKind kind) {
  for (const auto& e : Terrain::kPalette) {
    if (e.kind == kind)
      return e.color;
  }
  return Rgb8{};
}

ActorConfig::Kind parseKind(std::string_view value, const char* path, const std::string& scope) {
  if (value == "walker")
    return ActorConfig::Kind::Walker;
  if (value == "static")
    return ActorConfig::Kind::Static;
  TomlUtil::warnf(path, "{} kind should be 'walker' or 'static' (got '{}')", scope, std::string(value));
  return ActorConfig::Kind::Walker;
}

void readPoints(const toml::table& t,
                const char* path,
                std::string_view scope,
                std::unordered_map<std::string, Vec2>& out) {
  for (const auto& [key, node] : t) {
    const std::string name(key.str());
    const std::string field = std::string(scope) + "." + name;
    Vec2 p{};
    if (TomlUtil::readPoint(&node, path, field, p))
      out[name] = p;
  }
}

}  // namespace

void Level::loadTestLevel() {
  PixelCanvas canvas(kTestW, kTestH, colorOf(TerrainKind::Air));
  // floor with a 1px step up on the right half
  canvas.rect(0, kTestFloorRow, kTestW, kTestH - kTestFloorRow, colorOf(TerrainKind::Solid));
  canvas.rect(kTestStepCol, kTestFloorRow - 1, kTestW - kTestStepCol, 1,
              colorOf(TerrainKind::Solid));
  // walls
  canvas.rect(0, 0, kTestWallCols, kTestH, colorOf(TerrainKind::SolidNoFear));
  canvas.rect(kTestW - kTestWallCols, 0, kTestWallCols, kTestH, colorOf(TerrainKind::SolidNoFear));
  // a droppable ledge and a passable platform
  canvas.rect(10, 26, 30, 2, colorOf(TerrainKind::Droppable));
  canvas.rect(50, 30, 24, 1, colorOf(TerrainKind::PassableSolid));

  TerrainGrid grid;
  TerrainDecodeError err;
  if (!TerrainGrid::decodeRgba(canvas.w, canvas.h, canvas.rgba.data(), canvas.w * 4, grid,
                               err)) {
    // palette colors only, so this is a programming error in the layout above
    std::fprintf(stderr, "test level terrain: %s\n", err.message.c_str());
    return;
  }

  id_ = "test_level";
  displayName_ = "Test Level";
  terrainPath_.clear();
  backgroundPath_.clear();
  terrain_ = std::move(grid);
  terrainError_ = TerrainDecodeError{};
  entrances_.clear();
  exits_.clear();
  actors_.clear();

  entrances_.emplace("default", Vec2{8.0F, 20.0F});
  exits_.emplace("right", Vec2{static_cast<float>(kTestW - kTestWallCols - 1), 30.0F});

  ActorSpawn walker{};
  walker.name = "walker_a";
  walker.pos = Vec2{12.0F, 10.0F};
  walker.size = Vec2{4.0F, 6.0F};
  walker.cfg.drop.intervalTicks = 90;
  actors_.push_back(walker);

  walker.name = "walker_b";
  walker.pos = Vec2{24.0F, 10.0F};
  walker.facingX = -1;
  walker.weight = 2.0F;
  walker.cfg.drop.intervalTicks = 0;
  actors_.push_back(walker);

  ActorSpawn crate{};
  crate.name = "crate";
  crate.pos = Vec2{56.0F, 20.0F};
  crate.size = Vec2{5.0F, 5.0F};
  crate.weight = 4.0F;
  crate.cfg.kind = ActorConfig::Kind::Static;
  actors_.push_back(crate);
}

bool Level::loadFromToml(const char* levelTomlPath) {
  toml::table tbl;
  try {
    tbl = toml::parse_file(levelTomlPath);
  } catch (const toml::parse_error& err) {
    std::fprintf(stderr, "Level: parse error in %s: %s\n", levelTomlPath,
                 std::string(err.description()).c_str());
    return false;
  }

  TomlUtil::warnUnknownKeys(tbl, levelTomlPath, "root",
                            {"version", "level", "entrances", "exits", "actors"});

  std::string nextId;
  std::string nextDisplay;
  std::string nextTerrain;
  std::string nextBackground;
  std::unordered_map<std::string, Vec2> nextEntrances;
  std::unordered_map<std::string, Vec2> nextExits;
  std::vector<ActorSpawn> nextActors;

  nextId = std::filesystem::path(levelTomlPath).stem().string();

  if (auto lv = tbl["level"].as_table()) {
    TomlUtil::warnUnknownKeys(*lv, levelTomlPath, "level",
                              {"id", "display", "terrain", "background"});
    if (auto v = lv->get("id"))
      nextId = v->value_or(nextId);
    if (auto v = lv->get("display"))
      nextDisplay = v->value_or(nextDisplay);
    if (auto v = lv->get("terrain"))
      nextTerrain = v->value_or(nextTerrain);
    if (auto v = lv->get("background"))
      nextBackground = v->value_or(nextBackground);
  }
  if (nextDisplay.empty())
    nextDisplay = nextId;

  if (nextTerrain.empty()) {
    std::fprintf(stderr, "Level: %s has no level.terrain image\n", levelTomlPath);
    return false;
  }

  if (auto t = tbl["entrances"].as_table())
    readPoints(*t, levelTomlPath, "entrances", nextEntrances);
  if (auto t = tbl["exits"].as_table())
    readPoints(*t, levelTomlPath, "exits", nextExits);

  if (nextEntrances.find("default") == nextEntrances.end()) {
    TomlUtil::warnf(levelTomlPath, "entrances.default missing; using (0, 0)");
    nextEntrances.emplace("default", Vec2{});
  }

  if (auto actors = tbl["actors"].as_array()) {
    std::size_t idx = 0;
    for (const auto& node : *actors) {
      auto t = node.as_table();
      ++idx;
      if (!t)
        continue;

      const std::string scope = "actors[" + std::to_string(idx - 1) + "]";
      TomlUtil::warnUnknownKeys(
          *t, levelTomlPath, scope,
          {"name", "kind", "x", "y", "at", "w", "h", "weight", "facing", "collideable", "speed",
           "accel", "gravity", "max_fall_speed", "ground_friction", "turn_on_wall",
           "drop_interval", "drop_impulse"});

      ActorSpawn a{};
      a.name = scope;
      if (auto v = t->get("name"))
        a.name = v->value_or(a.name);
      if (auto v = t->get("kind")) {
        if (auto s = v->value<std::string_view>())
          a.cfg.kind = parseKind(*s, levelTomlPath, scope);
      }
      if (auto v = t->get("x"))
        a.pos.x = v->value_or(a.pos.x);
      if (auto v = t->get("y"))
        a.pos.y = v->value_or(a.pos.y);
      if (auto v = t->get("at"))
        a.entrance = v->value_or(a.entrance);
      if (auto v = t->get("w"))
        a.size.x = v->value_or(a.size.x);
      if (auto v = t->get("h"))
        a.size.y = v->value_or(a.size.y);
      if (auto v = t->get("weight"))
        a.weight = v->value_or(a.weight);
      if (auto v = t->get("facing"))
        a.facingX = v->value_or(a.facingX);
      if (auto v = t->get("collideable"))
        a.collideable = v->value_or(a.collideable);
      if (auto v = t->get("speed"))
        a.cfg.move.speed = v->value_or(a.cfg.move.speed);
      if (auto v = t->get("accel"))
        a.cfg.move.accel = v->value_or(a.cfg.move.accel);
      if (auto v = t->get("gravity"))
        a.cfg.move.gravity = v->value_or(a.cfg.move.gravity);
      if (auto v = t->get("max_fall_speed"))
        a.cfg.move.maxFallSpeed = v->value_or(a.cfg.move.maxFallSpeed);
      if (auto v = t->get("ground_friction"))
        a.cfg.move.groundFriction = v->value_or(a.cfg.move.groundFriction);
      if (auto v = t->get("turn_on_wall"))
        a.cfg.move.turnOnWall = v->value_or(a.cfg.move.turnOnWall);
      if (auto v = t->get("drop_interval"))
        a.cfg.drop.intervalTicks = v->value_or(a.cfg.drop.intervalTicks);
      if (auto v = t->get("drop_impulse"))
        a.cfg.drop.impulse = v->value_or(a.cfg.drop.impulse);

      if (a.size.x <= 0.0F || a.size.y <= 0.0F) {
        TomlUtil::warnf(levelTomlPath, "{} has invalid size (w={:.3F} h={:.3F}); skipping",
                        scope, a.size.x, a.size.y);
        continue;
      }
      if (a.weight <= 0.0F) {
        TomlUtil::warnf(levelTomlPath, "{} weight must be positive; using 1", scope);
        a.weight = 1.0F;
      }
      if (!a.entrance.empty()) {
        auto it = nextEntrances.find(a.entrance);
        if (it != nextEntrances.end()) {
          a.pos = it->second;
        } else {
          TomlUtil::warnf(levelTomlPath, "{} refers to unknown entrance '{}'", scope, a.entrance);
        }
      }
      a.facingX = (a.facingX < 0) ? -1 : 1;
      a.cfg.drop.intervalTicks = std::max(0, a.cfg.drop.intervalTicks);
      nextActors.push_back(std::move(a));
    }
  }

  // the terrain decode is the one step that can abort the load
  const std::string terrainFile = Paths::resolveNextTo(levelTomlPath, nextTerrain);
  TerrainGrid nextGrid;
  TerrainDecodeError err;
  if (!TerrainGrid::loadFromFile(terrainFile.c_str(), nextGrid, err)) {
    std::fprintf(stderr, "Level: %s: terrain %s: %s\n", levelTomlPath, terrainFile.c_str(),
                 err.message.c_str());
    terrainError_ = std::move(err);
    return false;
  }

  id_ = std::move(nextId);
  displayName_ = std::move(nextDisplay);
  terrainPath_ = terrainFile;
  backgroundPath_ = std::move(nextBackground);
  terrain_ = std::move(nextGrid);
  terrainError_ = TerrainDecodeError{};
  entrances_ = std::move(nextEntrances);
  exits_ = std::move(nextExits);
  actors_ = std::move(nextActors);
  return true;
}

bool Level::getEntrance(const char* name, Vec2& out) const {
  const char* key = (name != nullptr) ? name : "";
  auto it = entrances_.find(key);
  if (it == entrances_.end()) {
    return false;
  }
  out = it->second;
  return true;
}

bool Level::getExit(const char* name, Vec2& out) const {
  const char* key = (name != nullptr) ? name : "";
  auto it = exits_.find(key);
  if (it == exits_.end()) {
    return false;
  }
  out = it->second;
  return true;
}

std::vector<std::string> Level::entranceNames() const {
  std::vector<std::string> out;
  out.reserve(entrances_.size());
  for (const auto& [name, p] : entrances_) {
    (void)p;
    out.push_back(name);
  }
  std::sort(out.begin(), out.end());
  return out;
}

void Level::spawnActors(World& w) const {
  for (const auto& spawn : actors_) {
    Body body{};
    body.pos = spawn.pos;
    body.size = spawn.size;
    body.weight = spawn.weight;
    body.collideable = spawn.collideable;
    w.spawn(body, makeBehavior(spawn.cfg, spawn.facingX), spawn.name);
  }
}

#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "actor/ActorConfig.h"
#include "terrain/TerrainGrid.h"
#include "util/Vec2.h"

class World;

struct ActorSpawn {
  std::string name;
  // when set, pos is taken from this entrance
  std::string entrance;
  Vec2 pos{};
  Vec2 size{16.0F, 24.0F};
  float weight = 1.0F;
  int facingX = 1;
  bool collideable = true;
  ActorConfig cfg{};
};

// A level: its terrain grid plus the placement data the driver starts from.
// Loading is all-or-nothing; a failed load keeps the previous level.
class Level {
 public:
  void loadTestLevel();
  bool loadFromToml(const char* levelTomlPath);

  const std::string& id() const { return id_; }
  const std::string& displayName() const { return displayName_; }
  const std::string& terrainPath() const { return terrainPath_; }
  // carried for the renderer, never loaded here
  const std::string& backgroundPath() const { return backgroundPath_; }

  const TerrainGrid& terrain() const { return terrain_; }
  // set when the last loadFromToml failed while decoding the terrain image
  const TerrainDecodeError& terrainError() const { return terrainError_; }

  bool getEntrance(const char* name, Vec2& out) const;
  bool getExit(const char* name, Vec2& out) const;
  std::vector<std::string> entranceNames() const;
  const std::vector<ActorSpawn>& actorSpawns() const { return actors_; }

  // Spawns every actor in file order; ids follow that order.
  void spawnActors(World& w) const;

 private:
  std::string id_;
  std::string displayName_;
  std::string terrainPath_;
  std::string backgroundPath_;
  TerrainGrid terrain_;
  TerrainDecodeError terrainError_{};
  std::unordered_map<std::string, Vec2> entrances_;
  std::unordered_map<std::string, Vec2> exits_;
  std::vector<ActorSpawn> actors_;
};

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "core/Time.h"
#include "ecs/World.h"
#include "level/Level.h"

struct AppConfig {
  const char* levelTomlPath = nullptr;
  const char* physicsTomlPath = nullptr;
  // used to find relative config paths next to the executable
  const char* argv0 = nullptr;
  int maxTicks = 600;
  int reportEvery = 0;  // ticks between body reports, 0 = final report only
  float tickRate = 60.0F;
};

// Headless fixed-step driver: one level, its actors, N ticks.
class App {
 public:
  struct BodySnapshot {
    BodyId id = kInvalidBodyId;
    std::string name;
    float x = 0.0F;
    float y = 0.0F;
    float vx = 0.0F;
    float vy = 0.0F;
    bool grounded = false;
    bool hitWall = false;
    bool landed = false;
    int repelContacts = 0;
  };

  bool init(const AppConfig& cfg);
  void run();
  void shutdown();

  std::vector<BodySnapshot> snapshot() const;
  std::uint64_t tickCount() const { return tick_; }
  const World& world() const { return world_; }
  const Level& level() const { return level_; }

 private:
  void tick(TimeStep ts);
  void printTerrainSummary() const;
  void printReport() const;

  AppConfig cfg_{};
  Level level_;
  World world_;
  std::uint64_t tick_ = 0;
};

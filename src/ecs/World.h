#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <entt/entt.hpp>

#include "core/Time.h"       // IWYU pragma: keep
#include "ecs/Components.h"  // IWYU pragma: keep
#include "ecs/Entity.h"
#include "physics/MotionResolver.h"

class TerrainGrid;

class World {
 public:
  World() = default;
  explicit World(const PhysicsConfig& cfg) : motion_(cfg) {}

  // Takes body geometry and velocity from `body`; the id comes from `ids`.
  EntityId spawn(const Body& body, std::unique_ptr<Behavior> behavior, std::string name = {});
  // no-op for kInvalidEntity and already destroyed entities
  void destroy(EntityId id);
  void clear();

  void update(const TerrainGrid& grid, TimeStep ts);

  // entities ordered by body id, i.e. creation order
  std::vector<EntityId> bodiesInOrder() const;

  const MotionResolver& motion() const { return motion_; }
  void setPhysics(const PhysicsConfig& cfg) { motion_.setConfig(cfg); }

  entt::registry registry;
  BodyIdAllocator ids;

  // debug/test-friendly counters
  std::uint64_t ticks = 0;
  int landings = 0;
  int wallHits = 0;
  int repelContacts = 0;

 private:
  MotionResolver motion_;
};

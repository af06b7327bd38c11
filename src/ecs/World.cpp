#include "ecs/World.h"

#include <algorithm>
#include <utility>

#include "ecs/Systems.h"

EntityId World::spawn(const Body& body, std::unique_ptr<Behavior> behavior, std::string name) {
  EntityId e = registry.create();

  Body& b = registry.emplace<Body>(e, body);
  b.id = ids.next();
  registry.emplace<BehaviorSlot>(e, std::move(behavior));
  registry.emplace<Contact>(e);
  registry.emplace<DebugName>(e, std::move(name));
  return e;
}

void World::destroy(EntityId id) {
  if (id == kInvalidEntity || !registry.valid(id))
    return;
  registry.destroy(id);
}

void World::clear() {
  registry.clear();
  ids.reset();
  ticks = 0;
  landings = 0;
  wallHits = 0;
  repelContacts = 0;
}

std::vector<EntityId> World::bodiesInOrder() const {
  std::vector<EntityId> out;
  auto view = registry.view<const Body>();
  for (auto entity : view) {
    out.push_back(entity);
  }
  std::sort(out.begin(), out.end(), [this](EntityId a, EntityId b) {
    return registry.get<Body>(a).id < registry.get<Body>(b).id;
  });
  return out;
}

void World::update(const TerrainGrid& grid, TimeStep ts) {
  Systems::impulses(*this, grid, ts);
  Systems::integrate(*this, grid, ts);
  Systems::repel(*this, ts);
  Systems::collisions(*this, ts);
  ++ticks;
}

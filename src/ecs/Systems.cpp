#include "ecs/Systems.h"

#include <cstddef>
#include <vector>

#include "core/Time.h"
#include "ecs/Components.h"
#include "ecs/World.h"
#include "terrain/TerrainGrid.h"

namespace Systems {

void impulses(World& w, const TerrainGrid& grid, TimeStep ts) {
  (void)ts;
  auto view = w.registry.view<Body, BehaviorSlot>();
  for (auto entity : view) {
    auto& body = view.get<Body>(entity);
    auto& slot = view.get<BehaviorSlot>(entity);
    if (slot.behavior)
      slot.behavior->updateImpulse(body, grid, w.motion());
  }
}

void integrate(World& w, const TerrainGrid& grid, TimeStep ts) {
  (void)ts;
  auto view = w.registry.view<Body, Contact>();
  for (auto entity : view) {
    auto& body = view.get<Body>(entity);
    auto& contact = view.get<Contact>(entity);

    contact.last = w.motion().move(body, grid);
    contact.grounded = w.motion().isGrounded(body, grid);
    contact.repelContacts = 0;

    if (contact.last.vertical)
      ++w.landings;
    if (contact.last.horizontal)
      ++w.wallHits;
  }
}

void repel(World& w, TimeStep ts) {
  (void)ts;
  // fixed pair order keeps runs reproducible
  const std::vector<EntityId> order = w.bodiesInOrder();
  for (std::size_t i = 0; i < order.size(); ++i) {
    auto& a = w.registry.get<Body>(order[i]);
    for (std::size_t j = i + 1; j < order.size(); ++j) {
      auto& b = w.registry.get<Body>(order[j]);
      if (!w.motion().repel(a, b))
        continue;
      ++w.repelContacts;
      ++w.registry.get<Contact>(order[i]).repelContacts;
      ++w.registry.get<Contact>(order[j]).repelContacts;
    }
  }
}

void collisions(World& w, TimeStep ts) {
  (void)ts;
  auto view = w.registry.view<Body, BehaviorSlot, Contact>();
  for (auto entity : view) {
    auto& body = view.get<Body>(entity);
    auto& slot = view.get<BehaviorSlot>(entity);
    const auto& contact = view.get<Contact>(entity);
    if (!slot.behavior)
      continue;
    slot.behavior->handleCollisions(body, contact.last);
    slot.behavior->frameUpdate(body);
  }
}

}  // namespace Systems

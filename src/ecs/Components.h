#pragma once

#include <memory>
#include <string>

#include "actor/Behavior.h"
#include "body/Body.h"  // IWYU pragma: keep
#include "body/CollisionFlags.h"

struct BehaviorSlot {
  std::unique_ptr<Behavior> behavior;
};

// Result of the last tick, readable by whoever triggers side effects
// (landing sounds, state changes).
struct Contact {
  CollisionFlags last{};
  bool grounded = false;
  int repelContacts = 0;
};

struct DebugName {
  std::string name;
};

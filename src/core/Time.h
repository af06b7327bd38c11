#pragma once

#include <cstdint>

// Velocities are px/tick, so dt only matters to behaviors that count time.
struct TimeStep {
  float dt = 1.0F / 60.0F;  // seconds
  uint64_t tick = 0;
};

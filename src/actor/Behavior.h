#pragma once

#include "body/Body.h"
#include "body/CollisionFlags.h"

class MotionResolver;
class TerrainGrid;

// Per-actor policy driven once per tick by the World. MotionResolver never
// sees this interface; it only reads and writes Body state.
class Behavior {
 public:
  virtual ~Behavior() = default;

  // runs before move(): gravity, walking, jumps, drop-through
  virtual void updateImpulse(Body& body, const TerrainGrid& grid, const MotionResolver& motion) = 0;
  // runs after move() and repel() with the flags move() reported
  virtual void handleCollisions(Body& body, CollisionFlags flags) = 0;
  virtual void frameUpdate(Body& body) = 0;

  virtual const char* kindName() const = 0;
};

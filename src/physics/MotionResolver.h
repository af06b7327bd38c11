#pragma once

#include "body/Body.h"
#include "body/CollisionFlags.h"
#include "physics/PhysicsConfig.h"

class TerrainGrid;

// Moves bodies through a TerrainGrid and pushes overlapping bodies apart.
// Bodies are only borrowed for the duration of a call.
class MotionResolver {
 public:
  MotionResolver() = default;
  explicit MotionResolver(const PhysicsConfig& cfg) : cfg_(cfg) {}

  const PhysicsConfig& config() const { return cfg_; }
  void setConfig(const PhysicsConfig& cfg) { cfg_ = cfg; }

  // Integrates one tick of body.vel in ceil(|vel|) sub-steps so no cell is
  // skipped, stopping each axis on contact. Upward motion never collides.
  // A non-finite velocity leaves the body where it is.
  CollisionFlags move(Body& body, const TerrainGrid& grid) const;

  bool isGrounded(const Body& body, const TerrainGrid& grid) const;
  bool isOnWalkableGround(const Body& body,
                          const TerrainGrid& grid,
                          float verticalOffset = 0.0F) const;
  bool isOnSolidGround(const Body& body, const TerrainGrid& grid, float verticalOffset = 0.0F) const;
  // True while the body's feet are inside a platform it can fall through, or
  // shortly after it dropped through one.
  bool isInPassable(const Body& body, const TerrainGrid& grid) const;

  // Soft horizontal separation of two bodies standing in the same band.
  // Returns whether the pair was within interaction range.
  bool repel(Body& a, Body& b) const { return repel(a, b, cfg_.repel.damper); }
  bool repel(Body& a, Body& b, float damper) const;

 private:
  bool wallAhead(const Body& body, const TerrainGrid& grid, bool movingLeft) const;

  PhysicsConfig cfg_{};
};

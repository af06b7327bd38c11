#pragma once

#include <memory>

#include "actor/ActorConfig.h"
#include "actor/Behavior.h"

// Walks at a fixed speed, turns around at walls and can periodically drop
// through droppable platforms.
class WalkerBehavior : public Behavior {
 public:
  WalkerBehavior(const ActorConfig& cfg, int facingX);

  void updateImpulse(Body& body, const TerrainGrid& grid, const MotionResolver& motion) override;
  void handleCollisions(Body& body, CollisionFlags flags) override;
  void frameUpdate(Body& body) override;
  const char* kindName() const override { return "walker"; }

  int facingX() const { return facingX_; }
  bool grounded() const { return grounded_; }
  int landings() const { return landings_; }
  int drops() const { return drops_; }

 private:
  ActorConfig cfg_;
  int facingX_ = 1;
  bool grounded_ = false;
  int landings_ = 0;
  int drops_ = 0;
  int dropTimer_ = 0;
};

// Falls under gravity and slides to a stop; crates, props.
class StaticBehavior : public Behavior {
 public:
  explicit StaticBehavior(const ActorConfig& cfg) : cfg_(cfg) {}

  void updateImpulse(Body& body, const TerrainGrid& grid, const MotionResolver& motion) override;
  void handleCollisions(Body& body, CollisionFlags flags) override;
  void frameUpdate(Body& body) override;
  const char* kindName() const override { return "static"; }

  bool grounded() const { return grounded_; }

 private:
  ActorConfig cfg_;
  bool grounded_ = false;
};

std::unique_ptr<Behavior> makeBehavior(const ActorConfig& cfg, int facingX);

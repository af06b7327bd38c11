#include "actor/Behaviors.h"

#include <algorithm>
#include <cmath>

#include "physics/MotionResolver.h"
#include "terrain/TerrainClass.h"
#include "terrain/TerrainGrid.h"

namespace {

constexpr float kRestSpeed = 0.01F;

void applyGravity(Body& body, const ActorConfig::Move& move) {
  body.applyImpulse(0.0F, move.gravity);
  body.vel.y = std::min(body.vel.y, move.maxFallSpeed);
}

}  // namespace

const char* actorKindName(ActorConfig::Kind kind) {
  switch (kind) {
    case ActorConfig::Kind::Walker:
      return "walker";
    case ActorConfig::Kind::Static:
      return "static";
  }
  return "walker";
}

WalkerBehavior::WalkerBehavior(const ActorConfig& cfg, int facingX)
    : cfg_(cfg), facingX_((facingX < 0) ? -1 : 1), dropTimer_(cfg.drop.intervalTicks) {}

void WalkerBehavior::updateImpulse(Body& body,
                                   const TerrainGrid& grid,
                                   const MotionResolver& motion) {
  grounded_ = motion.isGrounded(body, grid);

  const float target = static_cast<float>(facingX_) * cfg_.move.speed;
  body.applyImpulse((target - body.vel.x) * cfg_.move.accel, 0.0F);
  applyGravity(body, cfg_.move);

  if (cfg_.drop.intervalTicks <= 0 || !grounded_ || dropTimer_ > 0)
    return;

  const TerrainClass under = grid.classificationAt(body.horizontalCenter(), body.bottom());
  if (Terrain::isDroppable(under) && Terrain::isPassable(under)) {
    body.fallthroughY = body.pos.y;
    body.applyImpulse(0.0F, cfg_.drop.impulse);
    ++drops_;
    dropTimer_ = cfg_.drop.intervalTicks;
  }
}

void WalkerBehavior::handleCollisions(Body& body, CollisionFlags flags) {
  if (flags.vertical) {
    body.vel.y = 0.0F;
    body.fallthroughY.reset();
    ++landings_;
  }
  if (flags.horizontal) {
    body.vel.x = 0.0F;
    if (cfg_.move.turnOnWall)
      facingX_ = -facingX_;
  }
}

void WalkerBehavior::frameUpdate(Body& body) {
  (void)body;
  if (dropTimer_ > 0)
    --dropTimer_;
}

void StaticBehavior::updateImpulse(Body& body,
                                   const TerrainGrid& grid,
                                   const MotionResolver& motion) {
  grounded_ = motion.isGrounded(body, grid);
  applyGravity(body, cfg_.move);
  if (grounded_)
    body.vel.x *= cfg_.move.groundFriction;
}

void StaticBehavior::handleCollisions(Body& body, CollisionFlags flags) {
  if (flags.vertical) {
    body.vel.y = 0.0F;
    body.fallthroughY.reset();
  }
  if (flags.horizontal)
    body.vel.x = 0.0F;
}

void StaticBehavior::frameUpdate(Body& body) {
  if (std::fabs(body.vel.x) < kRestSpeed)
    body.vel.x = 0.0F;
}

std::unique_ptr<Behavior> makeBehavior(const ActorConfig& cfg, int facingX) {
  switch (cfg.kind) {
    case ActorConfig::Kind::Static:
      return std::make_unique<StaticBehavior>(cfg);
    case ActorConfig::Kind::Walker:
      break;
  }
  return std::make_unique<WalkerBehavior>(cfg, facingX);
}

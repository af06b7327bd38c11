#pragma once

#include <cstdint>
#include <optional>

#include "util/Vec2.h"

using BodyId = std::uint32_t;
inline constexpr BodyId kInvalidBodyId = 0;

// Axis-aligned movable rectangle. pos is the top-left corner.
struct Body {
  BodyId id = kInvalidBodyId;
  Vec2 pos{};
  Vec2 size{};
  Vec2 vel{};
  float weight = 1.0F;
  // y at which the body deliberately dropped through passable terrain
  std::optional<float> fallthroughY;
  bool collideable = true;

  float top() const { return pos.y; }
  float bottom() const { return pos.y + size.y; }
  float left() const { return pos.x; }
  float right() const { return pos.x + size.x; }
  float horizontalCenter() const { return pos.x + size.x / 2.0F; }
  float verticalCenter() const { return pos.y + size.y / 2.0F; }

  // no clamping; gravity, jumps and knockback are the caller's policy
  void applyImpulse(float dx, float dy) {
    vel.x += dx;
    vel.y += dy;
  }
};

// Hands out body ids. Ids start at 1 and only grow until reset().
class BodyIdAllocator {
 public:
  BodyId next() { return next_++; }
  BodyId peek() const { return next_; }
  void reset() { next_ = 1; }

 private:
  BodyId next_ = 1;
};

#pragma once

// Outcome of one MotionResolver::move call.
struct CollisionFlags {
  bool horizontal = false;
  bool vertical = false;

  bool any() const { return horizontal || vertical; }
};

#pragma once

// Snap and probe margin used for every boundary test against the grid.
inline constexpr float kEpsilon = 0.01F;

struct PhysicsConfig {
  int version = 0;

  struct Repel {
    float damper = 8.5F;
    float proximity = 0.85F;  // fraction of combined half widths
    float band = 15.0F;       // max bottom difference for a push
    float strength = 1.0F;    // px/tick at zero distance
  } repel;

  struct Passable {
    float fallthroughWindow = 5.0F;  // px of grace after a drop-through
    float probeDepth = 2.0F;         // px above bottom
  } passable;

  struct Ground {
    int spanSteps = 2;
  } ground;

  bool loadFromToml(const char* path);
};

// Separation speed for two bodies whose centers are `distance` apart.
// strength / (1 + |distance| / damper): positive, falls off with distance.
float repulsionForce(float distance, float damper, float strength = 1.0F);

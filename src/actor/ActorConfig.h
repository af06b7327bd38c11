#pragma once

#include <cstdint>

struct ActorConfig {
  enum class Kind : std::uint8_t {
    Walker,
    Static,
  };

  Kind kind = Kind::Walker;

  struct Move {
    float speed = 1.0F;         // px/tick
    float accel = 0.2F;         // fraction of the speed gap closed per tick
    float gravity = 0.25F;      // px/tick^2
    float maxFallSpeed = 6.0F;  // px/tick
    float groundFriction = 0.8F;
    bool turnOnWall = true;
  } move;

  struct Drop {
    int intervalTicks = 0;  // 0 = never drops through platforms
    float impulse = 1.0F;   // px/tick downward
  } drop;
};

const char* actorKindName(ActorConfig::Kind kind);

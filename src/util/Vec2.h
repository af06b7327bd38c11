#pragma once

struct Vec2 {
  float x = 0.0F;
  float y = 0.0F;
};

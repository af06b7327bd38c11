#include "physics/MotionResolver.h"

#include <cmath>

#include "terrain/TerrainClass.h"
#include "terrain/TerrainGrid.h"

namespace {

// beyond this many px/tick sub-steps get longer than one cell
constexpr int kMaxSubSteps = 1 << 16;

}  // namespace

bool MotionResolver::isOnWalkableGround(const Body& body,
                                        const TerrainGrid& grid,
                                        float verticalOffset) const {
  const float y = body.bottom() + verticalOffset;
  const bool span = TerrainGrid::testLine(
      Vec2{body.left(), y}, Vec2{body.right() - kEpsilon, y},
      [&](float x, float py) { return Terrain::isWalkable(grid.classificationAt(x, py)); },
      cfg_.ground.spanSteps);
  return span || Terrain::isPointWalkable(grid.classificationAt(body.horizontalCenter(), y));
}

bool MotionResolver::isOnSolidGround(const Body& body,
                                     const TerrainGrid& grid,
                                     float verticalOffset) const {
  const float y = body.bottom() + verticalOffset;
  return TerrainGrid::testLine(
      Vec2{body.left(), y}, Vec2{body.right() - kEpsilon, y},
      [&](float x, float py) { return Terrain::isSolid(grid.classificationAt(x, py)); },
      cfg_.ground.spanSteps);
}

bool MotionResolver::isInPassable(const Body& body, const TerrainGrid& grid) const {
  if (body.fallthroughY &&
      std::fabs(body.pos.y - *body.fallthroughY) < cfg_.passable.fallthroughWindow) {
    return true;
  }

  const float y = body.bottom() - cfg_.passable.probeDepth;
  if (Terrain::isPointWalkable(grid.classificationAt(body.horizontalCenter(), y)))
    return true;

  // one sample per pixel of width
  const int steps = static_cast<int>(std::ceil(body.size.x));
  return TerrainGrid::testLine(
      Vec2{body.left(), y}, Vec2{body.right() - kEpsilon, y},
      [&](float x, float py) { return Terrain::isPassable(grid.classificationAt(x, py)); }, steps);
}

bool MotionResolver::isGrounded(const Body& body, const TerrainGrid& grid) const {
  if (body.vel.y < 0.0F)
    return false;
  if (!isOnWalkableGround(body, grid))
    return false;
  if (isOnSolidGround(body, grid))
    return true;
  // still inside a platform we are falling through
  if (isInPassable(body, grid))
    return false;
  return true;
}

bool MotionResolver::wallAhead(const Body& body, const TerrainGrid& grid, bool movingLeft) const {
  // never probe the bottom row so the floor under the feet can't read as a wall
  const float x = movingLeft ? body.left() : body.right() - kEpsilon;
  return TerrainGrid::testLine(
      Vec2{x, body.top()}, Vec2{x, body.bottom() - 1.0F - kEpsilon},
      [&](float px, float py) { return Terrain::isWalled(grid.classificationAt(px, py)); });
}

// NOLINTNEXTLINE
CollisionFlags MotionResolver::move(Body& body, const TerrainGrid& grid) const {
  CollisionFlags flags{};

  const float vx = body.vel.x;
  const float vy = body.vel.y;
  const float magnitude = std::ceil(std::sqrt(vx * vx + vy * vy));
  if (!(magnitude > 0.0F) || !std::isfinite(magnitude))
    return flags;

  const int steps =
      (magnitude > static_cast<float>(kMaxSubSteps)) ? kMaxSubSteps : static_cast<int>(magnitude);
  const float stepX = vx / static_cast<float>(steps);
  const float stepY = vy / static_cast<float>(steps);
  bool movingX = vx != 0.0F;
  bool movingY = vy != 0.0F;

  for (int i = 0; i < steps && (movingX || movingY); ++i) {
    if (movingY) {
      body.pos.y += stepY;
      // no ceiling: only downward motion can land
      if (vy >= 0.0F) {
        const bool landed = isOnSolidGround(body, grid, -kEpsilon) ||
                            (isOnWalkableGround(body, grid, -kEpsilon) && !isInPassable(body, grid));
        if (landed) {
          movingY = false;
          flags.vertical = true;
          body.pos.y = std::floor(body.pos.y - kEpsilon);
        }
      }
    }

    if (movingX) {
      body.pos.x += stepX;
      const bool movingLeft = vx < 0.0F;
      if (wallAhead(body, grid, movingLeft)) {
        movingX = false;
        flags.horizontal = true;
        // leading edge back onto the cell boundary next to the wall
        body.pos.x = movingLeft ? std::floor(body.pos.x) + 1.0F : std::floor(body.pos.x - kEpsilon);
      }

      // walking along the ground: follow 1px steps up and down
      if (!movingY) {
        if (isOnWalkableGround(body, grid, -1.0F)) {
          body.pos.y -= 1.0F;
        } else if (!isOnWalkableGround(body, grid) && isOnWalkableGround(body, grid, 1.0F)) {
          body.pos.y += 1.0F;
        }
      }
    }
  }

  return flags;
}

bool MotionResolver::repel(Body& a, Body& b, float damper) const {
  if (!a.collideable)
    return false;

  const float dist = a.horizontalCenter() - b.horizontalCenter();
  const float reach = (a.size.x / 2.0F + b.size.x / 2.0F) * cfg_.repel.proximity;
  if (std::fabs(dist) >= reach)
    return false;

  if (!b.collideable)
    return true;
  // different vertical bands, e.g. one body on a platform above the other
  if (std::fabs(a.bottom() - b.bottom()) >= cfg_.repel.band)
    return true;

  const float force = repulsionForce(dist, damper, cfg_.repel.strength);
  const float weightRatio = a.weight / b.weight;
  // a body already heading into the other gets pushed twice as hard
  if (dist < 0.0F) {
    a.vel.x -= force / weightRatio * (a.vel.x > 0.0F ? 2.0F : 1.0F);
    b.vel.x += force * weightRatio * (b.vel.x < 0.0F ? 2.0F : 1.0F);
  } else {
    a.vel.x += force / weightRatio * (a.vel.x < 0.0F ? 2.0F : 1.0F);
    b.vel.x -= force * weightRatio * (b.vel.x > 0.0F ? 2.0F : 1.0F);
  }
  return true;
}

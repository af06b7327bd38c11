#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

// Traversal properties of one terrain cell, as independent bits.
enum class TerrainFlag : std::uint8_t {
  Solid = 0x01,
  Walkable = 0x02,
  PointWalkable = 0x04,  // stood on via a single center probe only
  Fearless = 0x08,       // ground that never triggers fall-fear
  Walled = 0x10,
  Passable = 0x20,  // can be fallen through on purpose
  Droppable = 0x40,
};

struct TerrainClass {
  std::uint8_t bits = 0;

  constexpr bool has(TerrainFlag f) const { return (bits & static_cast<std::uint8_t>(f)) != 0; }

  friend constexpr bool operator==(TerrainClass a, TerrainClass b) { return a.bits == b.bits; }
  friend constexpr bool operator!=(TerrainClass a, TerrainClass b) { return a.bits != b.bits; }
};

constexpr TerrainClass operator|(TerrainFlag a, TerrainFlag b) {
  return TerrainClass{static_cast<std::uint8_t>(static_cast<std::uint8_t>(a) |
                                                static_cast<std::uint8_t>(b))};
}

constexpr TerrainClass operator|(TerrainClass a, TerrainFlag b) {
  return TerrainClass{static_cast<std::uint8_t>(a.bits | static_cast<std::uint8_t>(b))};
}

// Named terrain classes recognized in terrain images. PassableSolid and
// PassableRamp share flags and only differ in their source color.
enum class TerrainKind : std::uint8_t {
  Air,
  Solid,
  PassableSolid,
  PassableRamp,
  Droppable,
  PointPassable,
  SolidNoFear,
  DroppableNoFear,
};

inline constexpr std::size_t kTerrainKindCount = 8;

struct Rgb8 {
  std::uint8_t r = 0;
  std::uint8_t g = 0;
  std::uint8_t b = 0;

  friend constexpr bool operator==(Rgb8 a, Rgb8 b) {
    return a.r == b.r && a.g == b.g && a.b == b.b;
  }
};

namespace Terrain {

inline constexpr TerrainClass kAir{static_cast<std::uint8_t>(TerrainFlag::Droppable)};
inline constexpr TerrainClass kSolid = TerrainFlag::Solid | TerrainFlag::Walled |
                                       TerrainFlag::Walkable;
inline constexpr TerrainClass kPassableSolid = TerrainFlag::Walkable | TerrainFlag::Passable;
inline constexpr TerrainClass kPassableRamp = TerrainFlag::Walkable | TerrainFlag::Passable;
inline constexpr TerrainClass kDroppable = TerrainFlag::Walkable | TerrainFlag::Passable |
                                           TerrainFlag::Droppable;
inline constexpr TerrainClass kPointPassable = TerrainFlag::PointWalkable |
                                               TerrainFlag::Droppable;
inline constexpr TerrainClass kSolidNoFear = TerrainFlag::Solid | TerrainFlag::Fearless |
                                             TerrainFlag::Walkable | TerrainFlag::Walled;
inline constexpr TerrainClass kDroppableNoFear = TerrainFlag::Walkable | TerrainFlag::Fearless |
                                                 TerrainFlag::Passable | TerrainFlag::Droppable;

struct PaletteEntry {
  Rgb8 color{};
  TerrainKind kind = TerrainKind::Air;
  TerrainClass cls{};
  const char* name = "";
};

// The only colors a terrain image may contain.
inline constexpr std::array<PaletteEntry, kTerrainKindCount> kPalette = {{
    {{0x00, 0x00, 0x00}, TerrainKind::Solid, kSolid, "solid"},
    {{0xFF, 0xFF, 0xFF}, TerrainKind::Air, kAir, "air"},
    {{0xFF, 0x00, 0x00}, TerrainKind::PassableSolid, kPassableSolid, "passable_solid"},
    {{0x00, 0xFF, 0x00}, TerrainKind::PassableRamp, kPassableRamp, "passable_ramp"},
    {{0xFF, 0x00, 0xDC}, TerrainKind::Droppable, kDroppable, "droppable"},
    {{0xFF, 0xFF, 0x00}, TerrainKind::PointPassable, kPointPassable, "point_passable"},
    {{0xAA, 0xAA, 0xAA}, TerrainKind::SolidNoFear, kSolidNoFear, "solid_no_fear"},
    {{0xFF, 0x88, 0x99}, TerrainKind::DroppableNoFear, kDroppableNoFear, "droppable_no_fear"},
}};

constexpr const PaletteEntry* findColor(Rgb8 c) {
  for (const auto& e : kPalette) {
    if (e.color == c)
      return &e;
  }
  return nullptr;
}

constexpr TerrainClass classOf(TerrainKind kind) {
  for (const auto& e : kPalette) {
    if (e.kind == kind)
      return e.cls;
  }
  return kSolid;
}

constexpr bool isSolid(TerrainClass c) {
  return c.has(TerrainFlag::Solid);
}

constexpr bool isWalkable(TerrainClass c) {
  return c.has(TerrainFlag::Walkable);
}

constexpr bool isPointWalkable(TerrainClass c) {
  return c.has(TerrainFlag::PointWalkable);
}

constexpr bool isFearless(TerrainClass c) {
  return c.has(TerrainFlag::Fearless);
}

constexpr bool isWalled(TerrainClass c) {
  return c.has(TerrainFlag::Walled);
}

constexpr bool isPassable(TerrainClass c) {
  return c.has(TerrainFlag::Passable);
}

constexpr bool isDroppable(TerrainClass c) {
  return c.has(TerrainFlag::Droppable);
}

static_assert(kSolid.bits == 0x13);
static_assert(kDroppableNoFear.bits == 0x6A);

}  // namespace Terrain

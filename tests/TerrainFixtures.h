#pragma once

#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "body/Body.h"
#include "terrain/TerrainClass.h"
#include "terrain/TerrainGrid.h"

// Builds terrain from rows of characters:
//   '.' air   '#' solid   'r' passable solid   'g' passable ramp
//   'd' droppable   'y' point passable   'n' solid no fear   'p' droppable no fear
inline Rgb8 fixtureColor(char c) {
  TerrainKind kind = TerrainKind::Air;
  switch (c) {
    case '.':
      kind = TerrainKind::Air;
      break;
    case '#':
      kind = TerrainKind::Solid;
      break;
    case 'r':
      kind = TerrainKind::PassableSolid;
      break;
    case 'g':
      kind = TerrainKind::PassableRamp;
      break;
    case 'd':
      kind = TerrainKind::Droppable;
      break;
    case 'y':
      kind = TerrainKind::PointPassable;
      break;
    case 'n':
      kind = TerrainKind::SolidNoFear;
      break;
    case 'p':
      kind = TerrainKind::DroppableNoFear;
      break;
    default:
      throw std::invalid_argument(std::string("unknown fixture cell '") + c + "'");
  }
  for (const auto& e : Terrain::kPalette) {
    if (e.kind == kind)
      return e.color;
  }
  return Rgb8{};
}

inline std::vector<std::uint8_t> fixturePixels(std::initializer_list<std::string_view> rows) {
  std::vector<std::uint8_t> rgba;
  for (std::string_view row : rows) {
    for (char c : row) {
      const Rgb8 color = fixtureColor(c);
      rgba.push_back(color.r);
      rgba.push_back(color.g);
      rgba.push_back(color.b);
      rgba.push_back(255);
    }
  }
  return rgba;
}

inline TerrainGrid makeGrid(std::initializer_list<std::string_view> rows) {
  const int height = static_cast<int>(rows.size());
  const int width = height > 0 ? static_cast<int>(rows.begin()->size()) : 0;
  const std::vector<std::uint8_t> rgba = fixturePixels(rows);

  TerrainGrid grid;
  TerrainDecodeError err;
  if (!TerrainGrid::decodeRgba(width, height, rgba.data(), width * 4, grid, err))
    throw std::runtime_error(err.message);
  return grid;
}

inline Body makeBody(float x, float y, float w, float h, float vx = 0.0F, float vy = 0.0F) {
  Body b{};
  b.pos = Vec2{x, y};
  b.size = Vec2{w, h};
  b.vel = Vec2{vx, vy};
  return b;
}

// Scratch directory removed again when the fixture goes out of scope.
struct TempDir {
  std::filesystem::path path;

  explicit TempDir(std::string_view name)
      : path(std::filesystem::temp_directory_path() / std::string(name)) {
    std::filesystem::remove_all(path);
    std::filesystem::create_directories(path);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
};

#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "terrain/TerrainClass.h"
#include "util/Vec2.h"

struct SDL_Surface;

struct TerrainDecodeError {
  enum class Kind : std::uint8_t {
    None,
    Unreadable,
    Rasterize,
    BadDimensions,
    UnknownColor,
  };

  Kind kind = Kind::None;
  // offending pixel, only set for UnknownColor
  int x = -1;
  int y = -1;
  Rgb8 color{};
  std::string message;
};

// Dense row-major grid of terrain classes decoded from a palette image.
// Grids are read-only once built; the decoders only write `out` on success, so a
// failed decode leaves it untouched. Queries outside the grid report solid
// terrain so nothing can leave the world.
class TerrainGrid {
 public:
  // rgba: 4 bytes per pixel (R, G, B, A), rows `pitch` bytes apart. Alpha is ignored.
  static bool decodeRgba(int width,
                         int height,
                         const std::uint8_t* rgba,
                         int pitch,
                         TerrainGrid& out,
                         TerrainDecodeError& err);
  static bool decodeSurface(SDL_Surface& surface, TerrainGrid& out, TerrainDecodeError& err);
  // PNG through stb_image, anything else through SDL_LoadBMP.
  static bool loadFromFile(const char* path, TerrainGrid& out, TerrainDecodeError& err);

  int width() const { return width_; }
  int height() const { return height_; }
  bool empty() const { return cells_.empty(); }
  std::size_t cellCount() const { return cells_.size(); }
  std::size_t countOf(TerrainClass cls) const;

  TerrainClass classificationAt(float x, float y) const;

  // Samples steps+1 evenly spaced points from start to end (both inclusive) and
  // returns true on the first one where test(x, y) holds. steps <= 0 samples
  // only start.
  template <typename Pred>
  static bool testLine(Vec2 start, Vec2 end, Pred&& test, int steps = 1) {
    if (steps <= 0)
      return test(start.x, start.y);
    const float n = static_cast<float>(steps);
    for (int i = 0; i <= steps; ++i) {
      const float t = static_cast<float>(i) / n;
      if (test(std::lerp(start.x, end.x, t), std::lerp(start.y, end.y, t)))
        return true;
    }
    return false;
  }

 private:
  std::vector<std::uint8_t> cells_;
  int width_ = 0;
  int height_ = 0;
};

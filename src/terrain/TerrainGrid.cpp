#include "terrain/TerrainGrid.h"

#include <SDL3/SDL_error.h>
#include <SDL3/SDL_pixels.h>
#include <SDL3/SDL_surface.h>

#include <algorithm>
#include <cmath>
#include <format>
#include <string>
#include <utility>

#define STB_IMAGE_IMPLEMENTATION
#include "stb_image.h"  // NOLINT(build/include_subdir)

namespace {

bool endsWith(const std::string& str, const std::string& suffix) {
  if (suffix.size() > str.size())
    return false;
  return str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool isPngFile(const std::string& path) {
  return endsWith(path, ".png") || endsWith(path, ".PNG");
}

bool fail(TerrainDecodeError& err, TerrainDecodeError::Kind kind, std::string message) {
  err = TerrainDecodeError{};
  err.kind = kind;
  err.message = std::move(message);
  return false;
}

}  // namespace

bool TerrainGrid::decodeRgba(int width,
                             int height,
                             const std::uint8_t* rgba,
                             int pitch,
                             TerrainGrid& out,
                             TerrainDecodeError& err) {
  if (width <= 0 || height <= 0 || !rgba ||
      static_cast<std::int64_t>(pitch) < static_cast<std::int64_t>(width) * 4) {
    return fail(err, TerrainDecodeError::Kind::BadDimensions,
                std::format("bad terrain image dimensions {}x{} (pitch {})", width, height, pitch));
  }

  std::vector<std::uint8_t> next(static_cast<std::size_t>(width) *
                                 static_cast<std::size_t>(height));
  for (int y = 0; y < height; ++y) {
    const std::uint8_t* row = rgba + static_cast<std::ptrdiff_t>(y) * pitch;
    for (int x = 0; x < width; ++x) {
      const std::uint8_t* px = row + static_cast<std::ptrdiff_t>(x) * 4;
      const Rgb8 c{px[0], px[1], px[2]};
      const Terrain::PaletteEntry* entry = Terrain::findColor(c);
      if (!entry) {
        err = TerrainDecodeError{};
        err.kind = TerrainDecodeError::Kind::UnknownColor;
        err.x = x;
        err.y = y;
        err.color = c;
        err.message = std::format("invalid terrain color at {}, {}: {} {} {}", x, y, c.r, c.g, c.b);
        return false;
      }
      next[static_cast<std::size_t>(y) * static_cast<std::size_t>(width) +
           static_cast<std::size_t>(x)] = entry->cls.bits;
    }
  }

  out.cells_ = std::move(next);
  out.width_ = width;
  out.height_ = height;
  err = TerrainDecodeError{};
  return true;
}

bool TerrainGrid::decodeSurface(SDL_Surface& surface, TerrainGrid& out, TerrainDecodeError& err) {
  SDL_Surface* rgba = SDL_ConvertSurface(&surface, SDL_PIXELFORMAT_RGBA32);
  if (!rgba) {
    return fail(err, TerrainDecodeError::Kind::Rasterize,
                std::format("SDL_ConvertSurface failed: {}", SDL_GetError()));
  }
  if (!SDL_LockSurface(rgba)) {
    std::string message = std::format("SDL_LockSurface failed: {}", SDL_GetError());
    SDL_DestroySurface(rgba);
    return fail(err, TerrainDecodeError::Kind::Rasterize, std::move(message));
  }

  const bool ok = decodeRgba(rgba->w, rgba->h, static_cast<const std::uint8_t*>(rgba->pixels),
                             rgba->pitch, out, err);

  SDL_UnlockSurface(rgba);
  SDL_DestroySurface(rgba);
  return ok;
}

bool TerrainGrid::loadFromFile(const char* path, TerrainGrid& out, TerrainDecodeError& err) {
  if (!path || !*path)
    return fail(err, TerrainDecodeError::Kind::Unreadable, "empty terrain image path");

  const std::string p(path);
  if (isPngFile(p)) {
    int w = 0;
    int h = 0;
    int channels = 0;
    // Request RGBA (4 channels)
    unsigned char* data = stbi_load(path, &w, &h, &channels, 4);
    if (!data) {
      return fail(err, TerrainDecodeError::Kind::Unreadable,
                  std::format("stbi_load failed: {} ({})", p, stbi_failure_reason()));
    }
    // stb_image caps dimensions well below the int pitch limit
    const bool ok = decodeRgba(w, h, data, w * 4, out, err);
    stbi_image_free(data);
    return ok;
  }

  SDL_Surface* surface = SDL_LoadBMP(path);
  if (!surface) {
    return fail(err, TerrainDecodeError::Kind::Unreadable,
                std::format("SDL_LoadBMP failed: {} ({})", p, SDL_GetError()));
  }
  const bool ok = decodeSurface(*surface, out, err);
  SDL_DestroySurface(surface);
  return ok;
}

std::size_t TerrainGrid::countOf(TerrainClass cls) const {
  return static_cast<std::size_t>(std::ranges::count(cells_, cls.bits));
}

TerrainClass TerrainGrid::classificationAt(float x, float y) const {
  const float fx = std::floor(x);
  const float fy = std::floor(y);
  if (!(fx >= 0.0F && fy >= 0.0F && fx < static_cast<float>(width_) &&
        fy < static_cast<float>(height_))) {
    return Terrain::kSolid;
  }
  const auto col = static_cast<std::size_t>(fx);
  const auto row = static_cast<std::size_t>(fy);
  return TerrainClass{cells_[row * static_cast<std::size_t>(width_) + col]};
}

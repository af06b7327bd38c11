#define BOOST_TEST_MODULE TerrainGridTests
#include <boost/test/unit_test.hpp>

#include <SDL3/SDL_pixels.h>
#include <SDL3/SDL_rect.h>
#include <SDL3/SDL_surface.h>

#include <array>
#include <cstdint>
#include <limits>
#include <utility>
#include <vector>

#include "TerrainFixtures.h"
#include "terrain/TerrainClass.h"
#include "terrain/TerrainGrid.h"

BOOST_AUTO_TEST_SUITE(TerrainClassTests)

BOOST_AUTO_TEST_CASE(TestNamedClassFlags) {
  BOOST_CHECK_EQUAL(Terrain::kAir.bits, 0x40);
  BOOST_CHECK_EQUAL(Terrain::kSolid.bits, 0x13);
  BOOST_CHECK_EQUAL(Terrain::kPassableSolid.bits, 0x22);
  BOOST_CHECK_EQUAL(Terrain::kPassableRamp.bits, 0x22);
  BOOST_CHECK_EQUAL(Terrain::kDroppable.bits, 0x62);
  BOOST_CHECK_EQUAL(Terrain::kPointPassable.bits, 0x44);
  BOOST_CHECK_EQUAL(Terrain::kSolidNoFear.bits, 0x1B);
  BOOST_CHECK_EQUAL(Terrain::kDroppableNoFear.bits, 0x6A);
}

BOOST_AUTO_TEST_CASE(TestFlagPredicates) {
  BOOST_CHECK(Terrain::isSolid(Terrain::kSolid));
  BOOST_CHECK(Terrain::isWalled(Terrain::kSolid));
  BOOST_CHECK(Terrain::isWalkable(Terrain::kSolid));
  BOOST_CHECK(!Terrain::isPassable(Terrain::kSolid));
  BOOST_CHECK(!Terrain::isFearless(Terrain::kSolid));

  BOOST_CHECK(Terrain::isDroppable(Terrain::kAir));
  BOOST_CHECK(!Terrain::isWalkable(Terrain::kAir));
  BOOST_CHECK(!Terrain::isSolid(Terrain::kAir));

  BOOST_CHECK(Terrain::isPointWalkable(Terrain::kPointPassable));
  BOOST_CHECK(!Terrain::isWalkable(Terrain::kPointPassable));

  BOOST_CHECK(Terrain::isFearless(Terrain::kSolidNoFear));
  BOOST_CHECK(Terrain::isFearless(Terrain::kDroppableNoFear));
  BOOST_CHECK(Terrain::isPassable(Terrain::kDroppableNoFear));
  BOOST_CHECK(!Terrain::isWalled(Terrain::kDroppableNoFear));
}

BOOST_AUTO_TEST_CASE(TestPassableKindsShareFlags) {
  BOOST_CHECK(Terrain::classOf(TerrainKind::PassableSolid) ==
        Terrain::classOf(TerrainKind::PassableRamp));
  BOOST_CHECK(Terrain::classOf(TerrainKind::Solid) == Terrain::kSolid);
  BOOST_CHECK(Terrain::findColor(Rgb8{0x12, 0x34, 0x56}) == nullptr);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(TerrainDecodeTests)

BOOST_AUTO_TEST_CASE(TestPaletteRoundTrip) {
  for (const auto& entry : Terrain::kPalette) {
    const std::array<std::uint8_t, 4> px = {entry.color.r, entry.color.g, entry.color.b, 255};
    TerrainGrid grid;
    TerrainDecodeError err;
    BOOST_REQUIRE_MESSAGE(TerrainGrid::decodeRgba(1, 1, px.data(), 4, grid, err), entry.name);
    BOOST_CHECK_EQUAL(grid.width(), 1);
    BOOST_CHECK_EQUAL(grid.height(), 1);
    BOOST_CHECK_MESSAGE(grid.classificationAt(0.0F, 0.0F) == entry.cls, entry.name);
  }
}

BOOST_AUTO_TEST_CASE(TestAlphaIgnored) {
  const std::array<std::uint8_t, 8> px = {0x00, 0x00, 0x00, 0x00, 0xFF, 0xFF, 0xFF, 0x10};
  TerrainGrid grid;
  TerrainDecodeError err;
  BOOST_REQUIRE(TerrainGrid::decodeRgba(2, 1, px.data(), 8, grid, err));
  BOOST_CHECK(grid.classificationAt(0.5F, 0.5F) == Terrain::kSolid);
  BOOST_CHECK(grid.classificationAt(1.5F, 0.5F) == Terrain::kAir);
}

BOOST_AUTO_TEST_CASE(TestRowMajorWithPitch) {
  // 2x2 image, rows padded to 12 bytes
  std::vector<std::uint8_t> px(24, 0xEE);
  auto put = [&](int x, int y, Rgb8 c) {
    std::uint8_t* p = &px[static_cast<std::size_t>(y * 12 + x * 4)];
    p[0] = c.r;
    p[1] = c.g;
    p[2] = c.b;
    p[3] = 255;
  };
  put(0, 0, Rgb8{0xFF, 0xFF, 0xFF});
  put(1, 0, Rgb8{0xFF, 0x00, 0xDC});
  put(0, 1, Rgb8{0xFF, 0xFF, 0x00});
  put(1, 1, Rgb8{0xAA, 0xAA, 0xAA});

  TerrainGrid grid;
  TerrainDecodeError err;
  BOOST_REQUIRE(TerrainGrid::decodeRgba(2, 2, px.data(), 12, grid, err));
  BOOST_CHECK(grid.classificationAt(0.0F, 0.0F) == Terrain::kAir);
  BOOST_CHECK(grid.classificationAt(1.0F, 0.0F) == Terrain::kDroppable);
  BOOST_CHECK(grid.classificationAt(0.0F, 1.0F) == Terrain::kPointPassable);
  BOOST_CHECK(grid.classificationAt(1.0F, 1.0F) == Terrain::kSolidNoFear);
}

BOOST_AUTO_TEST_CASE(TestUnknownColorReportsPixel) {
  TerrainGrid grid = makeGrid({"#"});

  std::vector<std::uint8_t> px = fixturePixels({"...", "..."});
  // pixel (2, 1)
  px[(1 * 3 + 2) * 4 + 0] = 0x12;
  px[(1 * 3 + 2) * 4 + 1] = 0x34;
  px[(1 * 3 + 2) * 4 + 2] = 0x56;

  TerrainDecodeError err;
  BOOST_CHECK(!TerrainGrid::decodeRgba(3, 2, px.data(), 12, grid, err));
  BOOST_CHECK(err.kind == TerrainDecodeError::Kind::UnknownColor);
  BOOST_CHECK_EQUAL(err.x, 2);
  BOOST_CHECK_EQUAL(err.y, 1);
  BOOST_CHECK_EQUAL(err.color.r, 0x12);
  BOOST_CHECK_EQUAL(err.color.g, 0x34);
  BOOST_CHECK_EQUAL(err.color.b, 0x56);
  BOOST_CHECK(!err.message.empty());

  // no partial grid: the output keeps what it held before
  BOOST_CHECK_EQUAL(grid.width(), 1);
  BOOST_CHECK_EQUAL(grid.height(), 1);
  BOOST_CHECK(grid.classificationAt(0.0F, 0.0F) == Terrain::kSolid);
}

BOOST_AUTO_TEST_CASE(TestBadDimensions) {
  const std::array<std::uint8_t, 4> px = {0, 0, 0, 255};
  TerrainGrid grid;
  TerrainDecodeError err;
  BOOST_CHECK(!TerrainGrid::decodeRgba(0, 1, px.data(), 4, grid, err));
  BOOST_CHECK(err.kind == TerrainDecodeError::Kind::BadDimensions);
  BOOST_CHECK(!TerrainGrid::decodeRgba(1, 1, nullptr, 4, grid, err));
  BOOST_CHECK(!TerrainGrid::decodeRgba(2, 1, px.data(), 4, grid, err));
  BOOST_CHECK(grid.empty());
}

BOOST_AUTO_TEST_CASE(TestHugeWidthRejectedWithoutOverflow) {
  const std::array<std::uint8_t, 4> px = {0, 0, 0, 255};
  TerrainGrid grid;
  TerrainDecodeError err;
  // width * 4 does not fit in an int
  const int width = std::numeric_limits<int>::max() / 2;
  BOOST_CHECK(!TerrainGrid::decodeRgba(width, 1, px.data(), 4, grid, err));
  BOOST_CHECK(err.kind == TerrainDecodeError::Kind::BadDimensions);
  BOOST_CHECK(!TerrainGrid::decodeRgba(width, 1, px.data(), std::numeric_limits<int>::max(), grid,
                                       err));
  BOOST_CHECK(err.kind == TerrainDecodeError::Kind::BadDimensions);
  BOOST_CHECK(grid.empty());
}

BOOST_AUTO_TEST_CASE(TestDecodeSurface) {
  SDL_Surface* surface = SDL_CreateSurface(3, 1, SDL_PIXELFORMAT_XRGB8888);
  BOOST_REQUIRE(surface != nullptr);

  const SDL_Rect left{0, 0, 1, 1};
  const SDL_Rect mid{1, 0, 1, 1};
  const SDL_Rect right{2, 0, 1, 1};
  BOOST_REQUIRE(SDL_FillSurfaceRect(surface, &left, SDL_MapSurfaceRGB(surface, 0, 0, 0)));
  BOOST_REQUIRE(SDL_FillSurfaceRect(surface, &mid, SDL_MapSurfaceRGB(surface, 0xFF, 0x88, 0x99)));
  BOOST_REQUIRE(SDL_FillSurfaceRect(surface, &right, SDL_MapSurfaceRGB(surface, 0, 0xFF, 0)));

  TerrainGrid grid;
  TerrainDecodeError err;
  const bool ok = TerrainGrid::decodeSurface(*surface, grid, err);
  SDL_DestroySurface(surface);

  BOOST_REQUIRE_MESSAGE(ok, err.message);
  BOOST_CHECK_EQUAL(grid.width(), 3);
  BOOST_CHECK_EQUAL(grid.height(), 1);
  BOOST_CHECK(grid.classificationAt(0.0F, 0.0F) == Terrain::kSolid);
  BOOST_CHECK(grid.classificationAt(1.0F, 0.0F) == Terrain::kDroppableNoFear);
  BOOST_CHECK(grid.classificationAt(2.0F, 0.0F) == Terrain::kPassableRamp);
}

BOOST_AUTO_TEST_CASE(TestLoadMissingFile) {
  TerrainGrid grid;
  TerrainDecodeError err;
  BOOST_CHECK(!TerrainGrid::loadFromFile("does/not/exist.png", grid, err));
  BOOST_CHECK(err.kind == TerrainDecodeError::Kind::Unreadable);
  BOOST_CHECK(!TerrainGrid::loadFromFile("does/not/exist.bmp", grid, err));
  BOOST_CHECK(err.kind == TerrainDecodeError::Kind::Unreadable);
  BOOST_CHECK(!TerrainGrid::loadFromFile("", grid, err));
  BOOST_CHECK(grid.empty());
}

BOOST_AUTO_TEST_CASE(TestCountOf) {
  const TerrainGrid grid = makeGrid({
    "..d.",
    "rgy#",
  });
  BOOST_CHECK_EQUAL(grid.cellCount(), 8U);
  BOOST_CHECK_EQUAL(grid.countOf(Terrain::kAir), 3U);
  BOOST_CHECK_EQUAL(grid.countOf(Terrain::kPassableSolid), 2U);
  BOOST_CHECK_EQUAL(grid.countOf(Terrain::kSolid), 1U);
  BOOST_CHECK_EQUAL(grid.countOf(Terrain::kSolidNoFear), 0U);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(TerrainQueryTests)

BOOST_AUTO_TEST_CASE(TestOutOfBoundsIsSolid) {
  const TerrainGrid grid = makeGrid({
    "....",
    "....",
    "....",
  });

  BOOST_CHECK(grid.classificationAt(-0.5F, 0.0F) == Terrain::kSolid);
  BOOST_CHECK(grid.classificationAt(-0.001F, 1.0F) == Terrain::kSolid);
  BOOST_CHECK(grid.classificationAt(0.0F, -1.0F) == Terrain::kSolid);
  BOOST_CHECK(grid.classificationAt(4.0F, 0.0F) == Terrain::kSolid);
  BOOST_CHECK(grid.classificationAt(0.0F, 3.0F) == Terrain::kSolid);
  BOOST_CHECK(grid.classificationAt(1.0e9F, 1.0F) == Terrain::kSolid);
  BOOST_CHECK(grid.classificationAt(1.0F, -1.0e9F) == Terrain::kSolid);

  BOOST_CHECK(grid.classificationAt(0.0F, 0.0F) == Terrain::kAir);
  BOOST_CHECK(grid.classificationAt(3.999F, 2.999F) == Terrain::kAir);
}

BOOST_AUTO_TEST_CASE(TestEmptyGridIsAllSolid) {
  const TerrainGrid grid;
  BOOST_CHECK(grid.classificationAt(0.0F, 0.0F) == Terrain::kSolid);
}

BOOST_AUTO_TEST_CASE(TestQueriesFloorCoordinates) {
  const TerrainGrid grid = makeGrid({
    ".#",
    "d.",
  });
  BOOST_CHECK(grid.classificationAt(1.0F, 0.0F) == Terrain::kSolid);
  BOOST_CHECK(grid.classificationAt(1.99F, 0.99F) == Terrain::kSolid);
  BOOST_CHECK(grid.classificationAt(0.99F, 0.99F) == Terrain::kAir);
  BOOST_CHECK(grid.classificationAt(0.5F, 1.5F) == Terrain::kDroppable);
}

BOOST_AUTO_TEST_CASE(TestLineZeroStepsSamplesStartOnly) {
  std::vector<Vec2> seen;
  const bool hit = TerrainGrid::testLine(
    Vec2{1.0F, 2.0F}, Vec2{9.0F, 9.0F},
    [&](float x, float y) {
      seen.push_back(Vec2{x, y});
      return false;
    },
    0);
  BOOST_CHECK(!hit);
  BOOST_REQUIRE_EQUAL(seen.size(), 1U);
  BOOST_CHECK_EQUAL(seen[0].x, 1.0F);
  BOOST_CHECK_EQUAL(seen[0].y, 2.0F);

  seen.clear();
  TerrainGrid::testLine(Vec2{1.0F, 2.0F}, Vec2{9.0F, 9.0F},
              [&](float x, float y) {
                seen.push_back(Vec2{x, y});
                return false;
              },
              -3);
  BOOST_CHECK_EQUAL(seen.size(), 1U);
}

BOOST_AUTO_TEST_CASE(TestLineSamplesBothEndpointsInOrder) {
  std::vector<Vec2> seen;
  const bool hit = TerrainGrid::testLine(
    Vec2{0.0F, 0.0F}, Vec2{8.0F, 4.0F},
    [&](float x, float y) {
      seen.push_back(Vec2{x, y});
      return false;
    },
    4);
  BOOST_CHECK(!hit);
  BOOST_REQUIRE_EQUAL(seen.size(), 5U);
  for (std::size_t i = 0; i < seen.size(); ++i) {
    BOOST_CHECK_EQUAL(seen[i].x, 2.0F * static_cast<float>(i));
    BOOST_CHECK_EQUAL(seen[i].y, 1.0F * static_cast<float>(i));
  }
}

BOOST_AUTO_TEST_CASE(TestLineEndpointIsExact) {
  float lastX = 0.0F;
  float lastY = 0.0F;
  TerrainGrid::testLine(Vec2{3.0F, 0.1F}, Vec2{3.99F, 7.3F},
              [&](float x, float y) {
                lastX = x;
                lastY = y;
                return false;
              },
              3);
  BOOST_CHECK_EQUAL(lastX, 3.99F);
  BOOST_CHECK_EQUAL(lastY, 7.3F);
}

BOOST_AUTO_TEST_CASE(TestLineShortCircuits) {
  int calls = 0;
  const bool hit = TerrainGrid::testLine(
    Vec2{0.0F, 0.0F}, Vec2{8.0F, 0.0F},
    [&](float x, float y) {
      (void)y;
      ++calls;
      return x >= 4.0F;
    },
    4);
  BOOST_CHECK(hit);
  BOOST_CHECK_EQUAL(calls, 3);
}

BOOST_AUTO_TEST_CASE(TestLineAgainstGrid) {
  const TerrainGrid grid = makeGrid({
    "....#...",
  });
  auto walled = [&](float x, float y) { return Terrain::isWalled(grid.classificationAt(x, y)); };

  // one step only looks at the ends and misses the wall in the middle
  BOOST_CHECK(!TerrainGrid::testLine(Vec2{0.5F, 0.5F}, Vec2{7.5F, 0.5F}, walled, 1));
  BOOST_CHECK(TerrainGrid::testLine(Vec2{0.5F, 0.5F}, Vec2{7.5F, 0.5F}, walled, 7));
}

BOOST_AUTO_TEST_SUITE_END()

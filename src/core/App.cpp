#include "core/App.h"

#include <cinttypes>
#include <cstdio>
#include <string>
#include <utility>

#include "physics/PhysicsConfig.h"
#include "terrain/TerrainClass.h"
#include "util/Paths.h"
#include "util/TomlUtil.h"

bool App::init(const AppConfig& cfg) {
  cfg_ = cfg;
  TomlUtil::resetWarningCount();

  PhysicsConfig physics{};
  if (cfg_.physicsTomlPath) {
    const std::string path = Paths::resolveAssetPath(cfg_.physicsTomlPath, cfg_.argv0);
    if (!physics.loadFromToml(path.c_str())) {
      std::fprintf(stderr, "Physics config load failed: %s\n", path.c_str());
      return false;
    }
  }
  world_.setPhysics(physics);

  if (cfg_.levelTomlPath) {
    const std::string path = Paths::resolveAssetPath(cfg_.levelTomlPath, cfg_.argv0);
    if (!level_.loadFromToml(path.c_str())) {
      std::fprintf(stderr, "Level load failed: %s\n", path.c_str());
      return false;
    }
  } else {
    level_.loadTestLevel();
  }
  if (TomlUtil::warningCount() > 0)
    std::printf("%d config warning(s)\n", TomlUtil::warningCount());
  if (level_.terrain().empty()) {
    std::fprintf(stderr, "Level %s has no terrain\n", level_.id().c_str());
    return false;
  }

  printTerrainSummary();
  world_.clear();
  level_.spawnActors(world_);
  tick_ = 0;
  return true;
}

void App::run() {
  const float dt = (cfg_.tickRate > 0.0F) ? 1.0F / cfg_.tickRate : 0.0F;

  for (int i = 0; i < cfg_.maxTicks; ++i) {
    tick(TimeStep{dt, tick_});
    if (cfg_.reportEvery > 0 && tick_ % static_cast<std::uint64_t>(cfg_.reportEvery) == 0) {
      printReport();
    }
  }
  if (cfg_.reportEvery <= 0 || tick_ % static_cast<std::uint64_t>(cfg_.reportEvery) != 0) {
    printReport();
  }
}

void App::shutdown() {
  world_.clear();
}

void App::tick(TimeStep ts) {
  world_.update(level_.terrain(), ts);
  ++tick_;
}

std::vector<App::BodySnapshot> App::snapshot() const {
  std::vector<BodySnapshot> out;
  for (auto entity : world_.bodiesInOrder()) {
    const auto& body = world_.registry.get<Body>(entity);
    const auto& contact = world_.registry.get<Contact>(entity);
    const auto& name = world_.registry.get<DebugName>(entity);

    BodySnapshot s{};
    s.id = body.id;
    s.name = name.name;
    s.x = body.pos.x;
    s.y = body.pos.y;
    s.vx = body.vel.x;
    s.vy = body.vel.y;
    s.grounded = contact.grounded;
    s.hitWall = contact.last.horizontal;
    s.landed = contact.last.vertical;
    s.repelContacts = contact.repelContacts;
    out.push_back(std::move(s));
  }
  return out;
}

void App::printTerrainSummary() const {
  const TerrainGrid& grid = level_.terrain();
  std::printf("level %s (%s): terrain %dx%d\n", level_.id().c_str(),
              level_.displayName().c_str(), grid.width(), grid.height());
  for (const auto& e : Terrain::kPalette) {
    // passable_solid and passable_ramp share flags and are reported together
    if (e.kind == TerrainKind::PassableRamp)
      continue;
    const std::size_t n = grid.countOf(e.cls);
    if (n > 0)
      std::printf("  %-18s %zu\n", e.name, n);
  }
}

void App::printReport() const {
  std::printf("tick %" PRIu64 ": landings=%d wall_hits=%d repel_contacts=%d\n", tick_,
              world_.landings, world_.wallHits, world_.repelContacts);
  for (const auto& s : snapshot()) {
    std::printf("  #%u %-10s pos=(%.2f, %.2f) vel=(%.2f, %.2f) repel=%d%s%s%s\n", s.id,
                s.name.c_str(), s.x, s.y, s.vx, s.vy, s.repelContacts,
                s.grounded ? " grounded" : "", s.landed ? " landed" : "", s.hitWall ? " wall" : "");
  }
}

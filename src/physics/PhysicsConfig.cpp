#include "physics/PhysicsConfig.h"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

#include <toml++/toml.h>

#include "util/TomlUtil.h"

namespace {

float clampNonNegative(float v) {
  return std::max(0.0F, v);
}

}  // namespace

float repulsionForce(float distance, float damper, float strength) {
  if (damper <= 0.0F)
    return strength;
  return strength / (1.0F + std::fabs(distance) / damper);
}

bool PhysicsConfig::loadFromToml(const char* path) {
  toml::table tbl;
  try {
    tbl = toml::parse_file(path);
  } catch (const toml::parse_error& err) {
    TomlUtil::warnf(path, "parse error: {}", std::string(err.description()));
    return false;
  }

  TomlUtil::warnUnknownKeys(tbl, path, "root", {"version", "repel", "passable", "ground"});

  PhysicsConfig next{};

  if (auto v = tbl["version"].value<int>())
    next.version = *v;

  if (auto r = tbl["repel"].as_table()) {
    TomlUtil::warnUnknownKeys(*r, path, "repel", {"damper", "proximity", "band", "strength"});
    if (auto v = r->get("damper"))
      next.repel.damper = v->value_or(next.repel.damper);
    if (auto v = r->get("proximity"))
      next.repel.proximity = v->value_or(next.repel.proximity);
    if (auto v = r->get("band"))
      next.repel.band = v->value_or(next.repel.band);
    if (auto v = r->get("strength"))
      next.repel.strength = v->value_or(next.repel.strength);
  }

  if (auto p = tbl["passable"].as_table()) {
    TomlUtil::warnUnknownKeys(*p, path, "passable", {"fallthrough_window", "probe_depth"});
    if (auto v = p->get("fallthrough_window"))
      next.passable.fallthroughWindow = v->value_or(next.passable.fallthroughWindow);
    if (auto v = p->get("probe_depth"))
      next.passable.probeDepth = v->value_or(next.passable.probeDepth);
  }

  if (auto g = tbl["ground"].as_table()) {
    TomlUtil::warnUnknownKeys(*g, path, "ground", {"span_steps"});
    if (auto v = g->get("span_steps"))
      next.ground.spanSteps = v->value_or(next.ground.spanSteps);
  }

  next.repel.damper = clampNonNegative(next.repel.damper);
  next.repel.proximity = clampNonNegative(next.repel.proximity);
  next.repel.band = clampNonNegative(next.repel.band);
  next.repel.strength = clampNonNegative(next.repel.strength);
  next.passable.fallthroughWindow = clampNonNegative(next.passable.fallthroughWindow);
  next.passable.probeDepth = clampNonNegative(next.passable.probeDepth);
  next.ground.spanSteps = std::max(0, next.ground.spanSteps);

  *this = std::move(next);
  return true;
}

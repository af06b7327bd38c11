#pragma once

class TerrainGrid;
class World;
struct TimeStep;

// One tick is impulses -> integrate -> repel -> collisions, in that order.
namespace Systems {
void impulses(World& w, const TerrainGrid& grid, TimeStep ts);
void integrate(World& w, const TerrainGrid& grid, TimeStep ts);
void repel(World& w, TimeStep ts);
void collisions(World& w, TimeStep ts);
}  // namespace Systems

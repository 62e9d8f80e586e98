#ifndef CANNONBALL_ROUND_CONTROLLER_H
#define CANNONBALL_ROUND_CONTROLLER_H

#include "cannonball_components.h"
#include <flecs.h>

namespace cannonball {

// ═════════════════════════════════════════════════════════════
// ROUND / MATCH POST-PASS
//
// Plain functions on the world, called by Match between ticks
// (never from inside a system). Structural changes happen here:
// projectile sweeps, round resets, match start.
// ═════════════════════════════════════════════════════════════

// Runs once after every world.progress():
//   sweep spent projectiles -> goal -> else stalemate -> clock -> win check
void resolve_round(flecs::world &ecs);

// Fresh match: scores, counters, timer, ball at spawn 0 (no jitter),
// full ammo, no projectiles. Phase becomes MATCH_PLAYING.
void begin_match(flecs::world &ecs);

// Next spawn point (+ jitter), full ammo, cannons Ready, no projectiles.
void reset_round(flecs::world &ecs);

// Ball at rest, nothing in flight, nobody charging, all ammo spent.
bool is_stalemate(flecs::world &ecs);

// Player whose cannon is FARTHER from the ball horizontally.
// Exact tie goes to player 1 (index 0).
int stalemate_winner(float ball_x, const GameConfig &cfg);

// Higher score; then fewer bullets fired; otherwise NO_PLAYER (draw).
int decide_winner(const MatchState &match);

// Destroys projectiles flagged inactive. Returns how many remain.
int sweep_spent_projectiles(flecs::world &ecs);

void clear_projectiles(flecs::world &ecs);

} // namespace cannonball

#endif // CANNONBALL_ROUND_CONTROLLER_H

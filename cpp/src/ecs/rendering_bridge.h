#ifndef CANNONBALL_RENDERING_BRIDGE_H
#define CANNONBALL_RENDERING_BRIDGE_H

#include "match.h"
#include <godot_cpp/variant/packed_float32_array.hpp>

namespace cannonball {

// ═══════════════════════════════════════════════════════════════
// RENDER BUFFERS (flat float arrays read by GDScript)
//
// The presentation layer only ever sees these. Layouts:
//   Ball        [x, y, vx, vy, radius]
//   Cannon      [x, y, angle, power, power_bullets, precision_bullets]
//   Projectiles [x, y, type, owner] per live projectile
// Screen coordinates, y down. type: 0 = power, 1 = precision.
// ═══════════════════════════════════════════════════════════════
constexpr int FLOATS_PER_BALL = 5;
constexpr int FLOATS_PER_CANNON = 6;
constexpr int FLOATS_PER_PROJECTILE = 4;

void sync_ball(const Match &match, godot::PackedFloat32Array &buffer_out);

void sync_cannon(const Match &match, int player,
                 godot::PackedFloat32Array &buffer_out);

// Packs active projectiles. Spent ones (already swept) never appear.
void sync_projectiles(Match &match, godot::PackedFloat32Array &buffer_out,
                      int &count_out);

} // namespace cannonball

#endif // CANNONBALL_RENDERING_BRIDGE_H

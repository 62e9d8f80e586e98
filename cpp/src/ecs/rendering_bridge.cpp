#include "rendering_bridge.h"
#include "cannonball_components.h"

namespace cannonball {

// ── Fixed-size buffers: resize once, then overwrite in place ──
static float *ensure_size(godot::PackedFloat32Array &buffer, int size) {
  if (buffer.size() != size) {
    buffer.resize(size);
  }
  return buffer.ptrw();
}

void sync_ball(const Match &match, godot::PackedFloat32Array &buffer_out) {
  Position p = match.ball_position();
  Velocity v = match.ball_velocity();

  float *dest = ensure_size(buffer_out, FLOATS_PER_BALL);
  dest[0] = p.x;
  dest[1] = p.y;
  dest[2] = v.vx;
  dest[3] = v.vy;
  dest[4] = match.config().ball_radius;
}

void sync_cannon(const Match &match, int player,
                 godot::PackedFloat32Array &buffer_out) {
  if (player < 0 || player >= NUM_PLAYERS) {
    buffer_out.resize(0);
    return;
  }

  const SpawnPoint &pos = match.config().cannon_pos[player];
  Cannon c = match.cannon(player);

  float *dest = ensure_size(buffer_out, FLOATS_PER_CANNON);
  dest[0] = pos.x;
  dest[1] = pos.y;
  dest[2] = c.angle;
  dest[3] = c.power;
  dest[4] = (float)c.power_bullets;
  dest[5] = (float)c.precision_bullets;
}

// ═══════════════════════════════════════════════════════════════
// PROJECTILE BUFFER
// ═══════════════════════════════════════════════════════════════
void sync_projectiles(Match &match, godot::PackedFloat32Array &buffer_out,
                      int &count_out) {
  auto q =
      match.world().query_builder<const Position, const Projectile>().build();

  int active_count = 0;
  q.each([&](const Position &p, const Projectile &shot) {
    if (shot.active)
      active_count++;
  });

  count_out = active_count;

  if (active_count == 0) {
    if (buffer_out.size() != 0) {
      buffer_out.resize(0);
    }
    return;
  }

  float *dest = ensure_size(buffer_out, active_count * FLOATS_PER_PROJECTILE);
  int idx = 0;

  q.each([&](const Position &p, const Projectile &shot) {
    if (!shot.active)
      return;

    int offset = idx * FLOATS_PER_PROJECTILE;
    dest[offset + 0] = p.x;
    dest[offset + 1] = p.y;
    dest[offset + 2] = (float)shot.type;
    dest[offset + 3] = (float)shot.owner;
    idx++;
  });
}

} // namespace cannonball

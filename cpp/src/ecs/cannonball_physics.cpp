#include "cannonball_physics.h"
#include <algorithm>
#include <cmath>

namespace cannonball {

// ═════════════════════════════════════════════════════════════
// BALL INTEGRATION
//
// Order is fixed: move, then friction, then stop snap, then walls.
// Speed can only shrink here (friction < 1, reflection keeps |v|),
// so any growth comes from apply_impulse alone.
// ═════════════════════════════════════════════════════════════
GoalSide integrate_ball(Position &pos, Velocity &vel, float radius,
                        const GameConfig &cfg) {
  pos.x += vel.vx;
  pos.y += vel.vy;

  vel.vx *= cfg.friction;
  vel.vy *= cfg.friction;

  // Snap to exact zero so the ball always reaches a terminal rest state
  if (std::fabs(vel.vx) < cfg.stop_velocity)
    vel.vx = 0.0f;
  if (std::fabs(vel.vy) < cfg.stop_velocity)
    vel.vy = 0.0f;

  // Top/bottom walls reflect. Reflection points away from the wall
  // that was touched, so a ball still in contact next tick is not
  // flipped back into it.
  if (pos.y - radius <= 0.0f) {
    vel.vy = std::fabs(vel.vy);
    pos.y = radius;
  } else if (pos.y + radius >= cfg.screen_height) {
    vel.vy = -std::fabs(vel.vy);
    pos.y = cfg.screen_height - radius;
  }

  // Left/right are goal lines, not walls
  if (pos.x - radius <= 0.0f)
    return GOAL_LEFT;
  if (pos.x + radius >= cfg.screen_width)
    return GOAL_RIGHT;
  return GOAL_NONE;
}

bool is_moving(const Velocity &vel) { return vel.vx != 0.0f || vel.vy != 0.0f; }

// ═════════════════════════════════════════════════════════════
// PROJECTILES
// ═════════════════════════════════════════════════════════════
void integrate_projectile(Position &pos, const Velocity &vel) {
  pos.x += vel.vx;
  pos.y += vel.vy;
}

bool is_out_of_bounds(const Position &pos, const GameConfig &cfg) {
  return pos.x < 0.0f || pos.x > cfg.screen_width || pos.y < 0.0f ||
         pos.y > cfg.screen_height;
}

bool check_collision(const Position &shot_pos, float shot_radius,
                     const Position &ball_pos, float ball_radius) {
  float dx = ball_pos.x - shot_pos.x;
  float dy = ball_pos.y - shot_pos.y;
  float reach = shot_radius + ball_radius;
  return (dx * dx + dy * dy) <= reach * reach;
}

void apply_impulse(const Position &shot_pos, const Velocity &shot_vel,
                   const Projectile &shot, const Position &ball_pos,
                   Velocity &ball_vel, const GameConfig &cfg) {
  float dx = ball_pos.x - shot_pos.x;
  float dy = ball_pos.y - shot_pos.y;
  float dist = std::sqrt(dx * dx + dy * dy);

  float dir_x = 1.0f;
  float dir_y = 0.0f;
  if (dist > 1e-6f) {
    dir_x = dx / dist;
    dir_y = dy / dist;
  } else {
    // Dead-center overlap: push along the flight direction
    float speed = std::sqrt(shot_vel.vx * shot_vel.vx + shot_vel.vy * shot_vel.vy);
    if (speed > 1e-6f) {
      dir_x = shot_vel.vx / speed;
      dir_y = shot_vel.vy / speed;
    }
  }

  float multiplier = (shot.type == BULLET_POWER) ? cfg.power_multiplier : 1.0f;
  float magnitude = shot.power * cfg.power_increment * multiplier;

  ball_vel.vx += dir_x * magnitude;
  ball_vel.vy += dir_y * magnitude;
}

Velocity launch_velocity(float angle_deg, float speed) {
  constexpr float DEG_TO_RAD = 3.14159265358979323846f / 180.0f;
  float rad = angle_deg * DEG_TO_RAD;
  return {std::cos(rad) * speed, -std::sin(rad) * speed};
}

float normalize_angle(float angle_deg) {
  float a = std::fmod(angle_deg, 360.0f);
  if (a < 0.0f)
    a += 360.0f;
  if (a >= 360.0f) // -tiny + 360 rounds up to 360 in float
    a = 0.0f;
  return a;
}

uint64_t cooldown_ticks(const GameConfig &cfg) {
  double ticks = (double)cfg.turn_delay * (double)cfg.tick_rate;
  if (ticks <= 0.0)
    return 0;
  return (uint64_t)std::llround(ticks);
}

} // namespace cannonball

#include "player_scripts.h"
#include "cannonball_physics.h"
#include <algorithm>
#include <cmath>

namespace cannonball {

std::optional<ShotCommand> validate_shot(const ShotDecision &decision,
                                         const GameConfig &cfg) {
  if (decision.kind != SHOT_FIRE)
    return std::nullopt;
  if (!std::isfinite(decision.angle) || !std::isfinite(decision.power))
    return std::nullopt;

  // Clamp only. The charge ramps in whole levels while below the
  // target, so a fractional request fires at the next level up.
  float max_power = std::max(1.0f, cfg.max_power);
  float level = std::max(1.0f, std::min(max_power, decision.power));

  ShotCommand cmd;
  cmd.angle = normalize_angle(decision.angle);
  cmd.power = level;
  cmd.bullet =
      (decision.bullet == BULLET_POWER) ? BULLET_POWER : BULLET_PRECISION;
  return cmd;
}

float aim_angle(float from_x, float from_y, float to_x, float to_y) {
  constexpr float RAD_TO_DEG = 180.0f / 3.14159265358979323846f;
  // Screen y grows down, so "up" is -dy
  return std::atan2(from_y - to_y, to_x - from_x) * RAD_TO_DEG;
}

Position predict_ball_position(const Position &ball, const Velocity &vel,
                               const GameConfig &cfg, int ticks) {
  Position p = ball;
  Velocity v = vel;
  for (int i = 0; i < ticks; i++) {
    if (!is_moving(v))
      break;
    if (integrate_ball(p, v, cfg.ball_radius, cfg) != GOAL_NONE)
      break;
  }
  return p;
}

// ═════════════════════════════════════════════════════════════
// TEAM REGISTRY
// ═════════════════════════════════════════════════════════════
bool TeamRegistry::add(const std::string &name, PlayerScript script) {
  if (name.empty() || script == nullptr)
    return false;
  return scripts.emplace(name, script).second;
}

PlayerScript TeamRegistry::find(const std::string &name) const {
  auto it = scripts.find(name);
  return it == scripts.end() ? nullptr : it->second;
}

bool TeamRegistry::contains(const std::string &name) const {
  return scripts.count(name) != 0;
}

std::vector<std::string> TeamRegistry::names() const {
  std::vector<std::string> out;
  out.reserve(scripts.size());
  for (const auto &kv : scripts)
    out.push_back(kv.first);
  return out;
}

// ═════════════════════════════════════════════════════════════
// REFERENCE TEAMS
//
// Every team aims THROUGH the ball: the impulse pushes the ball
// away from the shooter, i.e. toward the opponent's goal line.
// ═════════════════════════════════════════════════════════════

// ── Marksman: precision first, power scales with distance ──
ShotDecision marksman_script(const PlayerView &view, const GameConfig &cfg) {
  float dx = view.ball_x - view.cannon_x;
  float dy = view.ball_y - view.cannon_y;
  float dist = std::sqrt(dx * dx + dy * dy);

  float power = std::max(1.0f, std::min(cfg.max_power, dist / 20.0f));
  float angle = aim_angle(view.cannon_x, view.cannon_y, view.ball_x, view.ball_y);

  if (view.precision_bullets > 0)
    return fire_shot(angle, power, BULLET_PRECISION);
  if (view.power_bullets > 0)
    return fire_shot(angle, power, BULLET_POWER);
  return no_shot();
}

// ── Bombardier: everything at full power ──
ShotDecision bombardier_script(const PlayerView &view, const GameConfig &cfg) {
  float angle = aim_angle(view.cannon_x, view.cannon_y, view.ball_x, view.ball_y);

  if (view.power_bullets > 0)
    return fire_shot(angle, cfg.max_power, BULLET_POWER);
  if (view.precision_bullets > 0)
    return fire_shot(angle, cfg.max_power, BULLET_PRECISION);
  return no_shot();
}

// ── Interceptor: leads a moving ball ──
ShotDecision interceptor_script(const PlayerView &view, const GameConfig &cfg) {
  float dx = view.ball_x - view.cannon_x;
  float dy = view.ball_y - view.cannon_y;
  float dist = std::sqrt(dx * dx + dy * dy);

  // Flight time ignores the charge ticks; close enough for a lead.
  int flight_ticks = 0;
  if (cfg.bullet_speed > 0.0f)
    flight_ticks = (int)(dist / cfg.bullet_speed);

  Position lead = predict_ball_position({view.ball_x, view.ball_y},
                                        {view.ball_vx, view.ball_vy}, cfg,
                                        flight_ticks);
  float angle = aim_angle(view.cannon_x, view.cannon_y, lead.x, lead.y);
  float power = std::max(5.0f, std::min(cfg.max_power, dist / 10.0f));

  // Own half = the half containing this cannon
  float mid = cfg.screen_width * 0.5f;
  bool own_half = (view.cannon_x < mid) == (view.ball_x < mid);

  if (own_half && view.power_bullets > 0)
    return fire_shot(angle, power, BULLET_POWER);
  if (view.precision_bullets > 0)
    return fire_shot(angle, power, BULLET_PRECISION);
  if (view.power_bullets > 0)
    return fire_shot(angle, power, BULLET_POWER);
  return no_shot();
}

void register_builtin_teams(TeamRegistry &registry) {
  registry.add("marksman", &marksman_script);
  registry.add("bombardier", &bombardier_script);
  registry.add("interceptor", &interceptor_script);
}

} // namespace cannonball

#include "cannonball_systems.h"
#include "cannonball_components.h"
#include "cannonball_physics.h"
#include "cannonball_random.h"
#include "player_scripts.h"
#include <algorithm>
#include <chrono>
#include <exception>

// NOTE: Systems never destroy entities. Spent projectiles are flagged
// inactive and swept by the round post-pass (round_controller.cpp),
// which runs outside the pipeline where structural changes are safe.

namespace cannonball {

static bool match_running(flecs::world &w) {
  return w.get<MatchState>().phase == MATCH_PLAYING;
}

// ─── Decision request (cannon is Ready) ───────────────────────
// On acceptance the cannon leaves this tick Charging.
static void request_decision(flecs::world &w, const Position &pos,
                             Cannon &cannon, TurnState &turn,
                             const PlayerBrain &brain, uint8_t player,
                             const GameConfig &cfg) {
  if (brain.script == nullptr)
    return;

  const MatchRoster &roster = w.get<MatchRoster>();
  flecs::entity ball = w.entity(roster.ball);
  const Position &bp = ball.get<Position>();
  const Velocity &bv = ball.get<Velocity>();

  PlayerView view = {pos.x,
                     pos.y,
                     bp.x,
                     bp.y,
                     cannon.power_bullets,
                     cannon.precision_bullets,
                     bv.vx,
                     bv.vy};

  // A throwing script costs its owner the tick, never the match.
  ShotDecision raw = no_shot();
  auto start = std::chrono::steady_clock::now();
  try {
    raw = brain.script(view, cfg);
  } catch (const std::exception &ex) {
    flecs::log::warn("player %d: decision function threw: %s", player + 1,
                     ex.what());
    return;
  } catch (...) {
    flecs::log::warn("player %d: decision function threw a non-exception",
                     player + 1);
    return;
  }
  auto end = std::chrono::steady_clock::now();

  double ms = std::chrono::duration<double, std::milli>(end - start).count();
  if (ms > (double)cfg.script_budget_ms) {
    flecs::log::warn("player %d: decision took %.2fms (budget %.2fms)",
                     player + 1, ms, (double)cfg.script_budget_ms);
  }

  std::optional<ShotCommand> cmd = validate_shot(raw, cfg);
  if (!cmd) {
    if (raw.kind != SHOT_NONE)
      flecs::log::warn("player %d: malformed decision ignored", player + 1);
    return;
  }

  // No fallback to the other bullet type. Ask again next tick.
  int32_t &ammo = (cmd->bullet == BULLET_POWER) ? cannon.power_bullets
                                                : cannon.precision_bullets;
  if (ammo <= 0) {
    flecs::log::dbg("player %d: no %s bullets left, request dropped",
                    player + 1,
                    cmd->bullet == BULLET_POWER ? "power" : "precision");
    return;
  }

  ammo -= 1;
  w.ensure<MatchState>().bullets_fired[player] += 1;

  // Barrel swings immediately; power ramps from the next tick
  cannon.angle = cmd->angle;
  cannon.power = 0.0f;
  turn.phase = TURN_CHARGING;
  turn.pending_bullet = cmd->bullet;
  turn.pending_angle = cmd->angle;
  turn.pending_power = cmd->power;

  flecs::log::trace("player %d: %s shot accepted, angle %.1f power %.0f",
                    player + 1,
                    cmd->bullet == BULLET_POWER ? "power" : "precision",
                    (double)cmd->angle, (double)cmd->power);
}

// ─── Fire (charge complete) ───────────────────────────────────
static void fire_projectile(flecs::world &w, const Position &pos,
                            Cannon &cannon, TurnState &turn, uint8_t player,
                            const GameConfig &cfg) {
  float angle = turn.pending_angle;
  if (turn.pending_bullet == BULLET_POWER && cfg.power_angle_error > 0.0f) {
    MatchRng &rng = w.ensure<MatchRng>();
    angle += rng_uniform(rng, -cfg.power_angle_error, cfg.power_angle_error);
  }

  w.entity()
      .set<Position>({pos.x, pos.y})
      .set<Velocity>(launch_velocity(angle, cfg.bullet_speed))
      .set<Projectile>({player,
                        turn.pending_bullet,
                        true,         // active
                        0,            // pad
                        cannon.power, // power level reached
                        cfg.bullet_radius});

  cannon.power = 0.0f;
  turn.phase = TURN_COOLDOWN;
  turn.pending_power = 0.0f;
  turn.last_fire_tick = w.get<MatchState>().tick;
}

// ═════════════════════════════════════════════════════════════
// TURN CONTROLLER
// ═════════════════════════════════════════════════════════════
void register_turn_systems(flecs::world &ecs) {

  // ── System 1: Turn Controller (PreUpdate) ──────────────────
  // One state machine per cannon:
  //   Cooldown -> Ready    when cooldown_ticks have elapsed
  //   Ready    -> Charging when the script returns a valid, affordable shot
  //   Charging -> Cooldown when power reaches the target (or max)
  // A Charging cannon never consults its script, so at most one shot
  // is ever pending per cannon.
  ecs.system<const Position, Cannon, TurnState, const PlayerBrain,
             const PlayerId>("TurnController")
      .kind(flecs::PreUpdate)
      // Spawned projectiles are merged before OnUpdate, so a shot
      // moves on the tick it is fired.
      .write<Position>()
      .write<Velocity>()
      .write<Projectile>()
      .each([](flecs::entity e, const Position &pos, Cannon &cannon,
               TurnState &turn, const PlayerBrain &brain,
               const PlayerId &id) {
        flecs::world w = e.world();
        if (!match_running(w))
          return;

        const GameConfig &cfg = w.get<GameConfig>();
        uint64_t now = w.get<MatchState>().tick;

        if (turn.phase == TURN_COOLDOWN) {
          if (now - turn.last_fire_tick < cooldown_ticks(cfg))
            return;
          turn.phase = TURN_READY; // Eligible this same tick
        }

        if (turn.phase == TURN_READY) {
          request_decision(w, pos, cannon, turn, brain, id.player, cfg);
          return;
        }

        // TURN_CHARGING: +1 level per tick until target or max
        if (cannon.power < turn.pending_power && cannon.power < cfg.max_power) {
          cannon.power = std::min(cannon.power + 1.0f, cfg.max_power);
          return;
        }
        fire_projectile(w, pos, cannon, turn, id.player, cfg);
      });
}

// ═════════════════════════════════════════════════════════════
// PHYSICS
// ═════════════════════════════════════════════════════════════
void register_physics_systems(flecs::world &ecs) {

  // ── System 2: Ball Integration ──────────────────────────────
  // Move, friction, stop snap, wall reflection, goal-line check.
  ecs.system<Position, Velocity, const BallBody>("BallIntegration")
      .kind(flecs::OnUpdate)
      .each([](flecs::entity e, Position &p, Velocity &v,
               const BallBody &body) {
        flecs::world w = e.world();
        if (!match_running(w))
          return;

        GoalSide goal = integrate_ball(p, v, body.radius, w.get<GameConfig>());
        if (goal != GOAL_NONE) {
          PhysicsReport &report = w.ensure<PhysicsReport>();
          if (report.goal == GOAL_NONE)
            report.goal = goal;
        }
      });

  // ── System 3: Projectile Kinematics ─────────────────────────
  // Straight line at constant speed. Leaving the field spends the
  // shot; it is not a collision.
  ecs.system<Position, const Velocity, Projectile>("ProjectileKinematics")
      .kind(flecs::OnUpdate)
      .each([](flecs::entity e, Position &p, const Velocity &v,
               Projectile &shot) {
        if (!shot.active)
          return;
        flecs::world w = e.world();
        if (!match_running(w))
          return;

        integrate_projectile(p, v);
        if (is_out_of_bounds(p, w.get<GameConfig>())) {
          shot.active = false;
          w.ensure<PhysicsReport>().expired += 1;
        }
      });

  // ── System 4: Projectile-Ball Collision ─────────────────────
  // Runs once per ball and scans every live projectile. Each hit
  // adds its own impulse (impulses commute) and spends the shot,
  // so a projectile resolves at most one collision.
  ecs.system<const Position, Velocity, const BallBody>(
         "ProjectileBallCollision")
      .kind(flecs::OnUpdate)
      .each([](flecs::entity e, const Position &ball_pos, Velocity &ball_vel,
               const BallBody &body) {
        flecs::world w = e.world();
        if (!match_running(w))
          return;

        const GameConfig &cfg = w.get<GameConfig>();
        int hits = 0;

        w.each([&](const Position &sp, const Velocity &sv, Projectile &shot) {
          if (!shot.active)
            return;
          if (!check_collision(sp, shot.radius, ball_pos, body.radius))
            return;
          apply_impulse(sp, sv, shot, ball_pos, ball_vel, cfg);
          shot.active = false;
          hits++;
        });

        if (hits > 0)
          w.ensure<PhysicsReport>().hits += hits;
      });
}

} // namespace cannonball

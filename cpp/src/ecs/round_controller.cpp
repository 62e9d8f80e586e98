#include "round_controller.h"
#include "cannonball_physics.h"
#include "cannonball_random.h"
#include <cmath>

namespace cannonball {

static const char *player_name(int player) {
  return player == 0 ? "player 1" : "player 2";
}

// ── Helpers: ball placement + cannon refill ──────────────────
static void place_ball(flecs::world &ecs, float x, float y) {
  flecs::entity ball = ecs.entity(ecs.get<MatchRoster>().ball);
  ball.set<Position>({x, y});
  ball.set<Velocity>({0.0f, 0.0f});
}

static void refill_cannons(flecs::world &ecs) {
  const GameConfig &cfg = ecs.get<GameConfig>();
  uint64_t now = ecs.get<MatchState>().tick;

  ecs.each([&](Cannon &cannon, TurnState &turn) {
    cannon.power = 0.0f;
    cannon.power_bullets = cfg.power_bullets;
    cannon.precision_bullets = cfg.precision_bullets;
    turn.phase = TURN_READY;
    turn.pending_angle = 0.0f;
    turn.pending_power = 0.0f;
    turn.last_fire_tick = now;
  });
}

int sweep_spent_projectiles(flecs::world &ecs) {
  int remaining = 0;
  ecs.defer_begin();
  ecs.each([&](flecs::entity e, const Projectile &shot) {
    if (shot.active)
      remaining++;
    else
      e.destruct();
  });
  ecs.defer_end();
  return remaining;
}

void clear_projectiles(flecs::world &ecs) { ecs.delete_with<Projectile>(); }

// ═════════════════════════════════════════════════════════════
// STALEMATE
// ═════════════════════════════════════════════════════════════
bool is_stalemate(flecs::world &ecs) {
  const MatchRoster &roster = ecs.get<MatchRoster>();
  if (is_moving(ecs.entity(roster.ball).get<Velocity>()))
    return false;

  int live = 0;
  ecs.each([&](const Projectile &shot) {
    if (shot.active)
      live++;
  });
  if (live > 0)
    return false;

  // A Charging cannon has paid for a shot that has not spawned yet
  for (int p = 0; p < NUM_PLAYERS; p++) {
    flecs::entity cannon_e = ecs.entity(roster.cannon[p]);
    const Cannon &cannon = cannon_e.get<Cannon>();
    if (cannon.power_bullets > 0 || cannon.precision_bullets > 0)
      return false;
    if (cannon_e.get<TurnState>().phase == TURN_CHARGING)
      return false;
  }
  return true;
}

int stalemate_winner(float ball_x, const GameConfig &cfg) {
  float d1 = std::fabs(ball_x - cfg.cannon_pos[0].x);
  float d2 = std::fabs(ball_x - cfg.cannon_pos[1].x);
  return d1 >= d2 ? 0 : 1;
}

int decide_winner(const MatchState &match) {
  if (match.score[0] != match.score[1])
    return match.score[0] > match.score[1] ? 0 : 1;
  if (match.bullets_fired[0] != match.bullets_fired[1])
    return match.bullets_fired[0] < match.bullets_fired[1] ? 0 : 1;
  return NO_PLAYER;
}

// ═════════════════════════════════════════════════════════════
// ROUND LIFECYCLE
// ═════════════════════════════════════════════════════════════
void reset_round(flecs::world &ecs) {
  const GameConfig &cfg = ecs.get<GameConfig>();

  MatchState &match = ecs.ensure<MatchState>();
  match.round += 1;

  int count = cfg.spawn_count > 0 ? cfg.spawn_count : 1;
  const SpawnPoint &spawn = cfg.spawns[match.round % count];

  MatchRng &rng = ecs.ensure<MatchRng>();
  int jx = rng_int(rng, -cfg.spawn_jitter, cfg.spawn_jitter);
  int jy = rng_int(rng, -cfg.spawn_jitter, cfg.spawn_jitter);

  place_ball(ecs, spawn.x + (float)jx, spawn.y + (float)jy);
  clear_projectiles(ecs);
  refill_cannons(ecs);
}

void begin_match(flecs::world &ecs) {
  const GameConfig &cfg = ecs.get<GameConfig>();

  MatchState fresh = {};
  fresh.time_remaining = cfg.match_duration;
  fresh.phase = MATCH_PLAYING;
  fresh.last_round_end = ROUND_NONE;
  fresh.last_scorer = NO_PLAYER;
  fresh.winner = NO_PLAYER;
  ecs.set<MatchState>(fresh);
  ecs.set<PhysicsReport>({GOAL_NONE, 0, 0});

  place_ball(ecs, cfg.spawns[0].x, cfg.spawns[0].y);
  clear_projectiles(ecs);
  refill_cannons(ecs);
}

static void award_round(flecs::world &ecs, int scorer, RoundEnd how) {
  MatchState &match = ecs.ensure<MatchState>();
  match.score[scorer] += 1;
  match.last_scorer = (int8_t)scorer;
  match.last_round_end = how;

  flecs::log::trace("round %d: %s by %s, score %d-%d", match.round,
                    how == ROUND_GOAL ? "goal" : "stalemate",
                    player_name(scorer), match.score[0], match.score[1]);

  reset_round(ecs);
}

static void end_match(flecs::world &ecs) {
  MatchState &match = ecs.ensure<MatchState>();
  match.phase = MATCH_OVER;
  match.winner = (int8_t)decide_winner(match);

  if (match.winner == NO_PLAYER) {
    flecs::log::trace("match over: draw %d-%d", match.score[0],
                      match.score[1]);
  } else {
    flecs::log::trace("match over: %s wins %d-%d", player_name(match.winner),
                      match.score[0], match.score[1]);
  }
}

void resolve_round(flecs::world &ecs) {
  if (ecs.get<MatchState>().phase != MATCH_PLAYING)
    return;

  const GameConfig &cfg = ecs.get<GameConfig>();
  PhysicsReport report = ecs.get<PhysicsReport>();

  // 1. Spent shots leave the world before anything counts them
  sweep_spent_projectiles(ecs);

  // 2. Goal, else stalemate. Never both in one tick.
  if (report.goal == GOAL_LEFT) {
    award_round(ecs, 1, ROUND_GOAL);
  } else if (report.goal == GOAL_RIGHT) {
    award_round(ecs, 0, ROUND_GOAL);
  } else if (is_stalemate(ecs)) {
    float ball_x =
        ecs.entity(ecs.get<MatchRoster>().ball).get<Position>().x;
    award_round(ecs, stalemate_winner(ball_x, cfg), ROUND_STALEMATE);
  }

  // 3. Clock. Cooldowns and the countdown read the same counter.
  MatchState &match = ecs.ensure<MatchState>();
  match.tick += 1;
  if (cfg.tick_rate > 0 && match.tick % (uint64_t)cfg.tick_rate == 0 &&
      match.time_remaining > 0) {
    match.time_remaining -= 1;
  }

  // 4. Win conditions
  if (match.score[0] >= cfg.winning_score ||
      match.score[1] >= cfg.winning_score || match.time_remaining <= 0) {
    end_match(ecs);
  }
}

} // namespace cannonball

#include "match.h"
#include "cannonball_systems.h"
#include "round_controller.h"
#include <cmath>

namespace cannonball {

static bool valid_player(int player, const char *caller) {
  if (player < 0 || player >= NUM_PLAYERS) {
    flecs::log::warn("%s: no player %d", caller, player);
    return false;
  }
  return true;
}

Match::Match(const GameConfig &config, uint64_t seed) {
  flecs::log::set_level(config.log_level);

  // Register components
  ecs.component<Position>("Position");
  ecs.component<Velocity>("Velocity");
  ecs.component<BallBody>("BallBody");
  ecs.component<PlayerId>("PlayerId");
  ecs.component<Cannon>("Cannon");
  ecs.component<TurnState>("TurnState");
  ecs.component<PlayerBrain>("PlayerBrain");
  ecs.component<Projectile>("Projectile");

  // Singletons (must exist before the systems first run)
  ecs.component<GameConfig>("GameConfig");
  ecs.component<MatchState>("MatchState");
  ecs.component<PhysicsReport>("PhysicsReport");
  ecs.component<MatchRng>("MatchRng");
  ecs.component<MatchRoster>("MatchRoster");

  ecs.set<GameConfig>(config);
  ecs.set<MatchState>({});
  ecs.set<PhysicsReport>({GOAL_NONE, 0, 0});
  ecs.set<MatchRng>({seed});

  // Pipeline order: turns (PreUpdate) before physics (OnUpdate)
  register_turn_systems(ecs);
  register_physics_systems(ecs);

  // Ball + cannons live for the whole match; rounds reposition them
  ball = ecs.entity("Ball")
             .set<Position>({config.spawns[0].x, config.spawns[0].y})
             .set<Velocity>({0.0f, 0.0f})
             .set<BallBody>({config.ball_radius});

  const char *names[NUM_PLAYERS] = {"Cannon1", "Cannon2"};
  for (int p = 0; p < NUM_PLAYERS; p++) {
    cannons[p] =
        ecs.entity(names[p])
            .set<Position>({config.cannon_pos[p].x, config.cannon_pos[p].y})
            .set<Cannon>({0.0f, 0.0f, config.power_bullets,
                          config.precision_bullets})
            .set<TurnState>({TURN_READY, BULLET_PRECISION, {}, 0.0f, 0.0f, 0})
            .set<PlayerBrain>({nullptr})
            .set<PlayerId>({(uint8_t)p});
  }

  ecs.set<MatchRoster>({ball.id(), {cannons[0].id(), cannons[1].id()}});

  start(seed);
}

bool Match::set_player_script(int player, PlayerScript script) {
  if (!valid_player(player, "set_player_script"))
    return false;
  cannons[player].set<PlayerBrain>({script});
  return true;
}

void Match::start(uint64_t seed) {
  ecs.set<MatchRng>({seed});
  begin_match(ecs);
  accumulator = 0.0;
}

void Match::step() {
  if (ecs.get<MatchState>().phase != MATCH_PLAYING)
    return;

  // Transient per-tick report, filled by the physics systems
  ecs.set<PhysicsReport>({GOAL_NONE, 0, 0});

  float dt = 1.0f / (float)ecs.get<GameConfig>().tick_rate;
  ecs.progress(dt);

  resolve_round(ecs);
}

int Match::advance(double seconds) {
  if (!std::isfinite(seconds) || seconds <= 0.0)
    return 0;
  if (ecs.get<MatchState>().phase != MATCH_PLAYING) {
    accumulator = 0.0;
    return 0;
  }

  const GameConfig &cfg = ecs.get<GameConfig>();
  double tick_len = 1.0 / (double)cfg.tick_rate;

  accumulator += seconds;
  int ran = 0;
  while (accumulator >= tick_len && ran < cfg.max_catchup_ticks) {
    step();
    accumulator -= tick_len;
    ran++;
    if (ecs.get<MatchState>().phase != MATCH_PLAYING) {
      accumulator = 0.0;
      return ran;
    }
  }

  // Hitch: drop whole ticks we could not afford, keep the fraction
  if (accumulator >= tick_len)
    accumulator = std::fmod(accumulator, tick_len);
  return ran;
}

// ─── Snapshots ────────────────────────────────────────────────
// entity_view::world() hands back a mutable handle, so const
// accessors go through the ball entity.
const MatchState &Match::state() const {
  return ball.world().get<MatchState>();
}

const GameConfig &Match::config() const {
  return ball.world().get<GameConfig>();
}

Position Match::ball_position() const { return ball.get<Position>(); }

Velocity Match::ball_velocity() const { return ball.get<Velocity>(); }

Cannon Match::cannon(int player) const {
  if (!valid_player(player, "cannon"))
    return Cannon{};
  return cannons[player].get<Cannon>();
}

TurnState Match::turn(int player) const {
  if (!valid_player(player, "turn"))
    return TurnState{};
  return cannons[player].get<TurnState>();
}

flecs::entity Match::cannon_entity(int player) const {
  if (!valid_player(player, "cannon_entity"))
    return flecs::entity();
  return cannons[player];
}

int Match::projectile_count() const {
  return ball.world().count<Projectile>();
}

} // namespace cannonball

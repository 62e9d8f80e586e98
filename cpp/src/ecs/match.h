#ifndef CANNONBALL_MATCH_H
#define CANNONBALL_MATCH_H

#include "cannonball_components.h"
#include <flecs.h>

namespace cannonball {

// ═════════════════════════════════════════════════════════════
// MATCH
//
// Owns one flecs world: components, systems, singletons, the ball
// and both cannons. One step() = one tick:
//   TurnController (PreUpdate) -> physics (OnUpdate) -> resolve_round
//
// Godot-free. The host node and the test harness both drive this.
// ═════════════════════════════════════════════════════════════
class Match {
public:
  explicit Match(const GameConfig &config = GameConfig(), uint64_t seed = 1);

  Match(const Match &) = delete;
  Match &operator=(const Match &) = delete;

  // player = 0 (left) or 1 (right). nullptr = never shoots.
  bool set_player_script(int player, PlayerScript script);

  // Fresh match with a new seed. Scripts stay bound.
  void start(uint64_t seed);

  // Exactly one tick. No-op unless the match is playing.
  void step();

  // Fixed-timestep accumulator: runs whole ticks for `seconds` of
  // wall time, at most max_catchup_ticks per call. Returns ticks run.
  int advance(double seconds);

  // ── Snapshots ──
  const MatchState &state() const;
  const GameConfig &config() const;
  Position ball_position() const;
  Velocity ball_velocity() const;
  // Zeroed snapshot (and a warning) for a bad player index
  Cannon cannon(int player) const;
  TurnState turn(int player) const;
  int projectile_count() const;
  bool is_over() const { return state().phase == MATCH_OVER; }

  flecs::world &world() { return ecs; }
  flecs::entity ball_entity() const { return ball; }
  // Null entity for a player index outside 0..1
  flecs::entity cannon_entity(int player) const;

private:
  flecs::world ecs;
  flecs::entity ball;
  flecs::entity cannons[NUM_PLAYERS];
  double accumulator = 0.0;
};

} // namespace cannonball

#endif // CANNONBALL_MATCH_H

#ifndef CANNONBALL_COMPONENTS_H
#define CANNONBALL_COMPONENTS_H

#include <cstdint>

/**
 * Cannonball Engine: ECS Component Definitions
 *
 * POD structs only. No std::vector, no virtual functions, no heap.
 * The only pointer is PlayerBrain::script (a plain function pointer).
 * Systems that iterate these live in cannonball_systems.cpp; the
 * round post-pass lives in round_controller.cpp.
 */

namespace cannonball {

// ─── Spatial ───────────────────────────────────────────────
// Screen space: x grows right, y grows DOWN. Units are pixels,
// velocities are pixels per tick.
struct Position {
  float x, y;
}; // 8 bytes
struct Velocity {
  float vx, vy;
}; // 8 bytes

// ─── Ball ─────────────────────────────────────────────────
struct BallBody {
  float radius;
}; // 4 bytes

enum GoalSide : uint8_t {
  GOAL_NONE = 0,
  GOAL_LEFT = 1, // Crossed the left line -> point for player 2
  GOAL_RIGHT = 2 // Crossed the right line -> point for player 1
};

// ─── Cannon ───────────────────────────────────────────────
enum BulletType : uint8_t { BULLET_POWER = 0, BULLET_PRECISION = 1 };

constexpr int NUM_PLAYERS = 2;

struct PlayerId {
  uint8_t player;
}; // 1 byte: 0=left cannon, 1=right cannon

struct Cannon {
  float angle;               // Degrees, [0, 360)
  float power;               // 0 unless charging
  int32_t power_bullets;     // Never negative
  int32_t precision_bullets; // Never negative
}; // 16 bytes

// ─── Turn State Machine ───────────────────────────────────
enum TurnPhase : uint8_t {
  TURN_COOLDOWN = 0, // Fired within the last turn_delay
  TURN_READY = 1,    // Asks its script for a decision every tick
  TURN_CHARGING = 2  // One accepted shot pending, power ramping
};

struct TurnState {
  TurnPhase phase;
  BulletType pending_bullet;
  uint8_t pad[2];
  float pending_angle;
  float pending_power;
  uint64_t last_fire_tick;
}; // 24 bytes

// ─── Projectile ───────────────────────────────────────────
struct Projectile {
  uint8_t owner; // PlayerId of the firing cannon
  BulletType type;
  bool active;  // false = spent (hit or left the field), swept post-tick
  uint8_t pad;
  float power;  // Power level reached at fire time
  float radius;
}; // 12 bytes

// ─── Player Decision Contract ─────────────────────────────
struct GameConfig;

// Everything a script sees. Positions/velocities in screen space.
struct PlayerView {
  float cannon_x, cannon_y;
  float ball_x, ball_y;
  int32_t power_bullets;
  int32_t precision_bullets;
  float ball_vx, ball_vy;
};

enum ShotKind : uint8_t { SHOT_NONE = 0, SHOT_FIRE = 1 };

// Raw script output. Unvalidated: angle and power may be anything,
// bullet may hold any tag value. validate_shot() is the only reader.
struct ShotDecision {
  ShotKind kind;
  uint8_t bullet;
  uint8_t pad[2];
  float angle;
  float power;
};

// Validated command: angle in [0,360), power integral in [1, max_power].
struct ShotCommand {
  float angle;
  float power;
  BulletType bullet;
};

using PlayerScript = ShotDecision (*)(const PlayerView &view,
                                      const GameConfig &config);

struct PlayerBrain {
  PlayerScript script; // nullptr = never shoots
};

// ─── Singletons ───────────────────────────────────────────
constexpr int MAX_SPAWN_POINTS = 8;

struct SpawnPoint {
  float x, y;
};

struct GameConfig {
  // Field
  float screen_width = 800.0f;
  float screen_height = 600.0f;
  int32_t tick_rate = 60; // Ticks per second

  // Ball
  float ball_radius = 20.0f;
  float friction = 0.995f;
  float stop_velocity = 0.1f;
  SpawnPoint spawns[MAX_SPAWN_POINTS] = {{400.0f, 300.0f},
                                         {400.0f, 350.0f},
                                         {400.0f, 250.0f},
                                         {400.0f, 400.0f},
                                         {350.0f, 200.0f}};
  int32_t spawn_count = 5;
  int32_t spawn_jitter = 5; // +/- units, integer, per axis

  // Cannons
  SpawnPoint cannon_pos[NUM_PLAYERS] = {{50.0f, 300.0f}, {750.0f, 300.0f}};
  float cannon_radius = 30.0f;
  float max_power = 30.0f;
  float turn_delay = 0.6f; // Seconds
  int32_t power_bullets = 5;
  int32_t precision_bullets = 10;

  // Projectiles
  float bullet_radius = 5.0f;
  float bullet_speed = 15.0f;
  float power_increment = 0.13f;  // Impulse per power level
  float power_angle_error = 5.0f; // Degrees, power bullets only
  float power_multiplier = 1.5f;

  // Match
  int32_t winning_score = 1;
  int32_t match_duration = 60; // Whole seconds

  // Host / diagnostics
  int32_t max_catchup_ticks = 5;
  float script_budget_ms = 2.0f;
  int32_t log_level = -1; // flecs log level (-1 = warnings and errors)
};

enum MatchPhase : uint8_t { MATCH_IDLE = 0, MATCH_PLAYING, MATCH_OVER };
enum RoundEnd : uint8_t { ROUND_NONE = 0, ROUND_GOAL, ROUND_STALEMATE };

constexpr int8_t NO_PLAYER = -1;

struct MatchState {
  int32_t score[NUM_PLAYERS];
  int32_t bullets_fired[NUM_PLAYERS];
  int32_t round;
  int32_t time_remaining; // Whole seconds, counts down
  uint64_t tick;          // THE clock. Cooldowns and countdown both read it.
  MatchPhase phase;
  RoundEnd last_round_end;
  int8_t last_scorer; // NO_PLAYER until the first round ends
  int8_t winner;      // NO_PLAYER while playing, or on a draw
};

// Transient: zeroed before every tick, filled by the physics systems,
// read by the round post-pass.
struct PhysicsReport {
  GoalSide goal;
  int32_t hits;    // Projectile-ball collisions this tick
  int32_t expired; // Projectiles that left the field this tick
};

struct MatchRng {
  uint64_t state;
};

struct MatchRoster {
  uint64_t ball;                // flecs::entity_t
  uint64_t cannon[NUM_PLAYERS]; // Indexed by PlayerId
};

} // namespace cannonball

#endif // CANNONBALL_COMPONENTS_H

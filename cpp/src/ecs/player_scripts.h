#ifndef CANNONBALL_PLAYER_SCRIPTS_H
#define CANNONBALL_PLAYER_SCRIPTS_H

#include "cannonball_components.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cannonball {

// ═════════════════════════════════════════════════════════════
// PLAYER DECISION CONTRACT
//
// A team is one PlayerScript: called at most once per tick while its
// cannon is Ready, with the cannon/ball state and the live GameConfig
// (the same constants the simulation uses, so predictions match).
// Returns no_shot() or fire_shot(angle, power, bullet).
//
//   angle:  degrees, 0 = right, 90 = up. Any finite value.
//   power:  1..max_power, clamped. Charging stops at the first whole
//           level >= power (or at max_power).
//   bullet: BULLET_POWER or BULLET_PRECISION. Anything else = precision.
//
// Scripts may throw. The turn controller catches, logs and skips.
// ═════════════════════════════════════════════════════════════

inline ShotDecision no_shot() { return {SHOT_NONE, BULLET_PRECISION, {}, 0.0f, 0.0f}; }

inline ShotDecision fire_shot(float angle, float power, BulletType bullet) {
  return {SHOT_FIRE, (uint8_t)bullet, {}, angle, power};
}

// The one place raw script output is checked. Empty = no shot.
std::optional<ShotCommand> validate_shot(const ShotDecision &decision,
                                         const GameConfig &cfg);

// ── Aiming helpers for scripts ───────────────────────────────
// Degrees from one point to another, screen y flipped (up = 90).
float aim_angle(float from_x, float from_y, float to_x, float to_y);

// Runs the simulation's own ball integration on a copy for `ticks`
// steps. Stops early if the ball reaches a goal line.
Position predict_ball_position(const Position &ball, const Velocity &vel,
                               const GameConfig &cfg, int ticks);

// ═════════════════════════════════════════════════════════════
// TEAM REGISTRY
//
// Name -> script table, filled once at startup and handed to whoever
// builds matches. Not a global: the host owns one instance.
// ═════════════════════════════════════════════════════════════
class TeamRegistry {
public:
  // false on empty name, null script, or duplicate name
  bool add(const std::string &name, PlayerScript script);

  // nullptr if unknown
  PlayerScript find(const std::string &name) const;

  bool contains(const std::string &name) const;

  // Sorted, for the team-selection menu
  std::vector<std::string> names() const;

  size_t size() const { return scripts.size(); }

private:
  std::map<std::string, PlayerScript> scripts;
};

// Reference teams: "marksman", "bombardier", "interceptor"
void register_builtin_teams(TeamRegistry &registry);

ShotDecision marksman_script(const PlayerView &view, const GameConfig &cfg);
ShotDecision bombardier_script(const PlayerView &view, const GameConfig &cfg);
ShotDecision interceptor_script(const PlayerView &view, const GameConfig &cfg);

} // namespace cannonball

#endif // CANNONBALL_PLAYER_SCRIPTS_H

#ifndef CANNONBALL_PHYSICS_H
#define CANNONBALL_PHYSICS_H

#include "cannonball_components.h"

namespace cannonball {

// Ball: position += velocity, friction, stop snap, top/bottom reflection.
// Returns which goal line (if any) the ball touched this step.
GoalSide integrate_ball(Position &pos, Velocity &vel, float radius,
                        const GameConfig &cfg);

// Discrete zero-check. integrate_ball snaps sub-threshold components to
// exactly 0, so a resting ball always reports false.
bool is_moving(const Velocity &vel);

// Projectile: straight line, fixed velocity, no friction.
void integrate_projectile(Position &pos, const Velocity &vel);

// Center outside [0, width] x [0, height]
bool is_out_of_bounds(const Position &pos, const GameConfig &cfg);

// Distance between centers <= sum of radii
bool check_collision(const Position &shot_pos, float shot_radius,
                     const Position &ball_pos, float ball_radius);

// Pushes the ball away from the projectile center by
// power * power_increment * type multiplier.
void apply_impulse(const Position &shot_pos, const Velocity &shot_vel,
                   const Projectile &shot, const Position &ball_pos,
                   Velocity &ball_vel, const GameConfig &cfg);

// Degrees -> velocity. 0 = right, 90 = up (screen y is flipped).
Velocity launch_velocity(float angle_deg, float speed);

// Any finite angle -> [0, 360)
float normalize_angle(float angle_deg);

// Ticks a cannon must wait after firing before it is Ready again.
uint64_t cooldown_ticks(const GameConfig &cfg);

} // namespace cannonball

#endif // CANNONBALL_PHYSICS_H

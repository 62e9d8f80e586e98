#ifndef CANNONBALL_SYSTEMS_H
#define CANNONBALL_SYSTEMS_H

#include <flecs.h>

namespace cannonball {

// PreUpdate: cooldown -> decision request -> charge -> fire
void register_turn_systems(flecs::world &ecs);

// OnUpdate: ball integration, projectile kinematics, projectile-ball hits
void register_physics_systems(flecs::world &ecs);

} // namespace cannonball

#endif // CANNONBALL_SYSTEMS_H

// ═════════════════════════════════════════════════════════════════════════════
// CANNONBALL ENGINE: UNITY BUILD (CORE)
// ═════════════════════════════════════════════════════════════════════════════
// Compile ONLY this file for the core library. All ECS translation units
// merge into one, so flecs::type_id<T>::id statics are instantiated once
// and w.each<T>() resolves the same component ids everywhere (MSVC DLL rule).
//
// Godot-free. cannonball_host_master.cpp includes it together with the
// Godot-side sources; the test binary includes it too.
//
// ORDER MATTERS: pure math first, then systems, then the owners.
// ═════════════════════════════════════════════════════════════════════════════

// 1. Physics primitives (integration, collision, impulse)
#include "cannonball_physics.cpp"

// 2. Player contract (validation, registry, reference teams)
#include "player_scripts.cpp"

// 3. Data (JSON game config)
#include "cannonball_config.cpp"

// 4. Systems (turn controller + physics pipeline)
#include "cannonball_systems.cpp"

// 5. Round post-pass (scoring, stalemate, reset, clock)
#include "round_controller.cpp"

// 6. Match (world owner)
#include "match.cpp"

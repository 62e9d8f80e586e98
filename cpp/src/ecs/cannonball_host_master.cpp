// ═════════════════════════════════════════════════════════════════════════════
// CANNONBALL ENGINE: UNITY BUILD (GDEXTENSION)
// ═════════════════════════════════════════════════════════════════════════════
// Compile ONLY this file for the Godot library. The core, the rendering
// bridge and the host node share one translation unit, so every
// flecs::type_id<T>::id the bridge queries is the one the core registered.
//
// ORDER MATTERS: core first, then the Godot-facing layers.
// ═════════════════════════════════════════════════════════════════════════════

// 1. Core (physics, players, config, systems, rounds, match)
#include "cannonball_master.cpp"

// 2. Rendering Bridge (ball / cannon / projectile float buffers)
#include "rendering_bridge.cpp"

// 3. Host node (CannonballServer)
#include "cannonball_server.cpp"

// 4. GDExtension entry point
#include "../register_types.cpp"

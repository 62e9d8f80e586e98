#include "cannonball_server.h"
#include "cannonball_config.h"
#include "rendering_bridge.h"
#include <godot_cpp/classes/engine.hpp>
#include <godot_cpp/classes/file_access.hpp>
#include <godot_cpp/core/class_db.hpp>
#include <godot_cpp/variant/utility_functions.hpp>
#include <string>

namespace godot {

CannonballServer::CannonballServer() {}

CannonballServer::~CannonballServer() {}

void CannonballServer::_bind_methods() {
  // Setup
  ClassDB::bind_method(D_METHOD("set_config_path", "path"),
                       &CannonballServer::set_config_path);
  ClassDB::bind_method(D_METHOD("get_config_path"),
                       &CannonballServer::get_config_path);
  ADD_PROPERTY(PropertyInfo(Variant::STRING, "config_path"), "set_config_path",
               "get_config_path");

  ClassDB::bind_method(D_METHOD("get_team_names"),
                       &CannonballServer::get_team_names);
  ClassDB::bind_method(D_METHOD("start_match", "team_1", "team_2", "seed"),
                       &CannonballServer::start_match);
  ClassDB::bind_method(D_METHOD("restart_match", "seed"),
                       &CannonballServer::restart_match);

  // State
  ClassDB::bind_method(D_METHOD("is_match_running"),
                       &CannonballServer::is_match_running);
  ClassDB::bind_method(D_METHOD("is_match_over"),
                       &CannonballServer::is_match_over);
  ClassDB::bind_method(D_METHOD("get_winner"), &CannonballServer::get_winner);
  ClassDB::bind_method(D_METHOD("get_score", "player"),
                       &CannonballServer::get_score);
  ClassDB::bind_method(D_METHOD("get_bullets_fired", "player"),
                       &CannonballServer::get_bullets_fired);
  ClassDB::bind_method(D_METHOD("get_round"), &CannonballServer::get_round);
  ClassDB::bind_method(D_METHOD("get_time_remaining"),
                       &CannonballServer::get_time_remaining);
  ClassDB::bind_method(D_METHOD("get_last_round_end"),
                       &CannonballServer::get_last_round_end);
  ClassDB::bind_method(D_METHOD("get_last_scorer"),
                       &CannonballServer::get_last_scorer);

  // Rendering
  ClassDB::bind_method(D_METHOD("get_ball_buffer"),
                       &CannonballServer::get_ball_buffer);
  ClassDB::bind_method(D_METHOD("get_cannon_buffer", "player"),
                       &CannonballServer::get_cannon_buffer);
  ClassDB::bind_method(D_METHOD("get_projectile_buffer"),
                       &CannonballServer::get_projectile_buffer);
  ClassDB::bind_method(D_METHOD("get_projectile_count"),
                       &CannonballServer::get_projectile_count);
}

void CannonballServer::_ready() {
  if (Engine::get_singleton()->is_editor_hint()) {
    return;
  }
  init_match();
}

void CannonballServer::load_config() {
  config = cannonball::GameConfig();

  if (!FileAccess::file_exists(config_path)) {
    UtilityFunctions::printerr("[Cannonball] Failed to find ", config_path,
                               ", using defaults");
    return;
  }

  String content = FileAccess::get_file_as_string(config_path);
  if (!cannonball::parse_game_config(content.utf8().get_data(), config)) {
    UtilityFunctions::printerr("[Cannonball] Bad config in ", config_path,
                               ", using defaults");
    return;
  }
  UtilityFunctions::print("[Cannonball] Loaded ", config_path);
}

void CannonballServer::init_match() {
  UtilityFunctions::print("[Cannonball] Initializing ECS...");

  load_config();

  if (teams.size() == 0) {
    cannonball::register_builtin_teams(teams);
  }

  match = std::make_unique<cannonball::Match>(config, 1);
  running = false;
  sync_buffers();

  UtilityFunctions::print("[Cannonball] ECS ready, ", (int)teams.size(),
                          " teams registered.");
}

void CannonballServer::_process(double delta) {
  if (Engine::get_singleton()->is_editor_hint()) {
    return;
  }
  if (!match || !running) {
    return;
  }

  match->advance(delta);
  sync_buffers();

  if (match->is_over()) {
    running = false;
    UtilityFunctions::print("[Cannonball] Match over. Score ",
                            match->state().score[0], "-",
                            match->state().score[1], ", winner ",
                            get_winner() + 1);
  }
}

void CannonballServer::sync_buffers() {
  if (!match) {
    return;
  }
  cannonball::sync_ball(*match, ball_buffer);
  for (int p = 0; p < cannonball::NUM_PLAYERS; p++) {
    cannonball::sync_cannon(*match, p, cannon_buffers[p]);
  }
  cannonball::sync_projectiles(*match, projectile_buffer, projectile_count);
}

// ═══════════════════════════════════════════════════════════════
// Setup API
// ═══════════════════════════════════════════════════════════════

void CannonballServer::set_config_path(const String &path) {
  config_path = path;
}

String CannonballServer::get_config_path() const { return config_path; }

PackedStringArray CannonballServer::get_team_names() const {
  PackedStringArray out;
  for (const std::string &name : teams.names()) {
    out.push_back(String(name.c_str()));
  }
  return out;
}

bool CannonballServer::start_match(const String &team_1, const String &team_2,
                                   int seed) {
  if (!match) {
    init_match();
  }

  const String requested[cannonball::NUM_PLAYERS] = {team_1, team_2};
  bool all_found = true;

  for (int p = 0; p < cannonball::NUM_PLAYERS; p++) {
    std::string name = requested[p].utf8().get_data();
    cannonball::PlayerScript script = teams.find(name);
    if (script == nullptr) {
      // Unknown team: that cannon simply never shoots
      UtilityFunctions::printerr("[Cannonball] Unknown team '", requested[p],
                                 "' for player ", p + 1);
      all_found = false;
    }
    match->set_player_script(p, script);
  }

  UtilityFunctions::print("[Cannonball] Match: ", team_1, " vs ", team_2,
                          " (seed ", seed, ")");
  restart_match(seed);
  return all_found;
}

void CannonballServer::restart_match(int seed) {
  if (!match) {
    return;
  }
  match->start((uint64_t)(uint32_t)seed);
  running = true;
  sync_buffers();
}

// ═══════════════════════════════════════════════════════════════
// State API
// ═══════════════════════════════════════════════════════════════

bool CannonballServer::is_match_running() const {
  return match && running && !match->is_over();
}

bool CannonballServer::is_match_over() const {
  return match && match->is_over();
}

int CannonballServer::get_winner() const {
  if (!match || !match->is_over()) {
    return cannonball::NO_PLAYER;
  }
  return match->state().winner;
}

int CannonballServer::get_score(int player) const {
  if (!match || player < 0 || player >= cannonball::NUM_PLAYERS) {
    return 0;
  }
  return match->state().score[player];
}

int CannonballServer::get_bullets_fired(int player) const {
  if (!match || player < 0 || player >= cannonball::NUM_PLAYERS) {
    return 0;
  }
  return match->state().bullets_fired[player];
}

int CannonballServer::get_round() const {
  return match ? match->state().round : 0;
}

int CannonballServer::get_time_remaining() const {
  return match ? match->state().time_remaining : 0;
}

int CannonballServer::get_last_round_end() const {
  return match ? (int)match->state().last_round_end : 0;
}

int CannonballServer::get_last_scorer() const {
  return match ? (int)match->state().last_scorer : cannonball::NO_PLAYER;
}

// ═══════════════════════════════════════════════════════════════
// Rendering API
// ═══════════════════════════════════════════════════════════════

PackedFloat32Array CannonballServer::get_ball_buffer() const {
  return ball_buffer;
}

PackedFloat32Array CannonballServer::get_cannon_buffer(int player) const {
  if (player < 0 || player >= cannonball::NUM_PLAYERS) {
    return PackedFloat32Array();
  }
  return cannon_buffers[player];
}

PackedFloat32Array CannonballServer::get_projectile_buffer() const {
  return projectile_buffer;
}

int CannonballServer::get_projectile_count() const { return projectile_count; }

} // namespace godot

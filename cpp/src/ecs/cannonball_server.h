#ifndef CANNONBALL_SERVER_H
#define CANNONBALL_SERVER_H

#include "match.h"
#include "player_scripts.h"
#include <godot_cpp/classes/node.hpp>
#include <godot_cpp/variant/packed_float32_array.hpp>
#include <godot_cpp/variant/packed_string_array.hpp>
#include <godot_cpp/variant/string.hpp>
#include <memory>

namespace godot {

class CannonballServer : public Node {
  GDCLASS(CannonballServer, Node)

private:
  std::unique_ptr<cannonball::Match> match;
  cannonball::TeamRegistry teams;
  cannonball::GameConfig config;

  String config_path = "res://res/data/game_config.json";
  bool running = false; // false until start_match()

  // Render buffers (rewritten after every _process)
  PackedFloat32Array ball_buffer;
  PackedFloat32Array cannon_buffers[cannonball::NUM_PLAYERS];
  PackedFloat32Array projectile_buffer;
  int projectile_count = 0;

  void load_config();
  void sync_buffers();

protected:
  static void _bind_methods();

public:
  CannonballServer();
  ~CannonballServer();

  void _ready() override;
  void _process(double delta) override;

  void init_match();

  // --- GDScript API: setup ---
  void set_config_path(const String &path);
  String get_config_path() const;
  PackedStringArray get_team_names() const;
  bool start_match(const String &team_1, const String &team_2, int seed);
  void restart_match(int seed);

  // --- GDScript API: state ---
  bool is_match_running() const;
  bool is_match_over() const;
  int get_winner() const; // 0/1, or -1 for a draw / no match
  int get_score(int player) const;
  int get_bullets_fired(int player) const;
  int get_round() const;
  int get_time_remaining() const;
  int get_last_round_end() const;
  int get_last_scorer() const;

  // --- GDScript API: rendering ---
  PackedFloat32Array get_ball_buffer() const;
  PackedFloat32Array get_cannon_buffer(int player) const;
  PackedFloat32Array get_projectile_buffer() const;
  int get_projectile_count() const;
};

} // namespace godot

#endif // CANNONBALL_SERVER_H

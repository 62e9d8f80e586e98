#include "cannonball_config.h"
#include <cmath>
#include <cstdint>
#include <limits>
#include <type_traits>
#include <flecs.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace cannonball {

// ── Knob readers ─────────────────────────────────────────────
// get<T>() throws type_error on a wrongly-typed value; that
// aborts the whole document in parse_game_config().

// Integer knobs take only exact integers that fit the field.
template <typename T>
static bool exact_integer(const json &raw, T &out) {
  if (raw.is_number_unsigned()) {
    uint64_t u = raw.get<uint64_t>();
    if (u > (uint64_t)std::numeric_limits<T>::max())
      return false;
    out = (T)u;
    return true;
  }
  if (raw.is_number_integer()) {
    int64_t i = raw.get<int64_t>();
    if (i < (int64_t)std::numeric_limits<T>::min() ||
        i > (int64_t)std::numeric_limits<T>::max())
      return false;
    out = (T)i;
    return true;
  }
  if (raw.is_number_float()) {
    double d = raw.get<double>();
    if (!std::isfinite(d) || d != std::floor(d) ||
        d < (double)std::numeric_limits<T>::min() ||
        d > (double)std::numeric_limits<T>::max())
      return false;
    out = (T)d;
    return true;
  }
  out = raw.get<T>(); // Not a number: throws
  return true;
}

template <typename T, typename Valid>
static void read_knob(const json &section, const char *section_name,
                      const char *key, T &field, Valid valid) {
  if (!section.contains(key))
    return;
  const json &raw = section[key];

  T v = field;
  if constexpr (std::is_integral<T>::value) {
    if (!exact_integer(raw, v)) {
      flecs::log::warn("game_config: %s.%s is not a whole number in range, "
                       "keeping %g",
                       section_name, key, (double)field);
      return;
    }
  } else {
    v = raw.get<T>();
  }

  if (!valid(v)) {
    flecs::log::warn("game_config: %s.%s out of range, keeping %g",
                     section_name, key, (double)field);
    return;
  }
  field = v;
}

static bool positive(float v) { return std::isfinite(v) && v > 0.0f; }
static bool non_negative(float v) { return std::isfinite(v) && v >= 0.0f; }

// [[x, y], ...] -> up to `max` points. Malformed entries are skipped.
static int read_points(const json &arr, const char *name, SpawnPoint *dst,
                       int max) {
  int count = 0;
  for (const auto &p : arr) {
    if (!p.is_array() || p.size() != 2 || !p[0].is_number() ||
        !p[1].is_number()) {
      flecs::log::warn("game_config: %s entry is not an [x, y] pair", name);
      continue;
    }
    float x = p[0].get<float>();
    float y = p[1].get<float>();
    if (!std::isfinite(x) || !std::isfinite(y)) {
      flecs::log::warn("game_config: %s entry is not finite", name);
      continue;
    }
    if (count == max) {
      flecs::log::warn("game_config: %s holds more than %d points, "
                       "ignoring the rest",
                       name, max);
      break;
    }
    dst[count++] = {x, y};
  }
  return count;
}

static const json *find_section(const json &doc, const char *name,
                                bool &ok) {
  if (!doc.contains(name))
    return nullptr;
  const json &s = doc[name];
  if (!s.is_object()) {
    flecs::log::err("game_config: section '%s' is not an object", name);
    ok = false;
    return nullptr;
  }
  return &s;
}

bool parse_game_config(const std::string &text, GameConfig &out) {
  GameConfig cfg = out;
  bool ok = true;

  try {
    json j = json::parse(text);
    if (!j.is_object()) {
      flecs::log::err("game_config: document root is not an object");
      return false;
    }

    // 1. Field
    if (const json *s = find_section(j, "field", ok)) {
      read_knob(*s, "field", "screen_width", cfg.screen_width, positive);
      read_knob(*s, "field", "screen_height", cfg.screen_height, positive);
      read_knob(*s, "field", "tick_rate", cfg.tick_rate,
                [](int32_t v) { return v > 0 && v <= 1000; });
    }

    // 2. Ball
    if (const json *s = find_section(j, "ball", ok)) {
      read_knob(*s, "ball", "radius", cfg.ball_radius, positive);
      read_knob(*s, "ball", "friction", cfg.friction,
                [](float v) { return std::isfinite(v) && v > 0.0f && v < 1.0f; });
      read_knob(*s, "ball", "stop_velocity", cfg.stop_velocity, positive);
      read_knob(*s, "ball", "spawn_jitter", cfg.spawn_jitter,
                [](int32_t v) { return v >= 0; });

      if (s->contains("spawns")) {
        const json &arr = (*s)["spawns"];
        if (!arr.is_array()) {
          flecs::log::err("game_config: ball.spawns is not an array");
          return false;
        }
        SpawnPoint pts[MAX_SPAWN_POINTS];
        int n = read_points(arr, "ball.spawns", pts, MAX_SPAWN_POINTS);
        if (n == 0) {
          flecs::log::warn("game_config: ball.spawns is empty, keeping "
                           "%d default points",
                           cfg.spawn_count);
        } else {
          for (int i = 0; i < n; i++)
            cfg.spawns[i] = pts[i];
          cfg.spawn_count = n;
        }
      }
    }

    // 3. Cannons
    if (const json *s = find_section(j, "cannons", ok)) {
      read_knob(*s, "cannons", "radius", cfg.cannon_radius, positive);
      read_knob(*s, "cannons", "max_power", cfg.max_power,
                [](float v) { return std::isfinite(v) && v >= 1.0f; });
      read_knob(*s, "cannons", "turn_delay", cfg.turn_delay, non_negative);
      read_knob(*s, "cannons", "power_bullets", cfg.power_bullets,
                [](int32_t v) { return v >= 0; });
      read_knob(*s, "cannons", "precision_bullets", cfg.precision_bullets,
                [](int32_t v) { return v >= 0; });

      if (s->contains("positions")) {
        const json &arr = (*s)["positions"];
        if (!arr.is_array()) {
          flecs::log::err("game_config: cannons.positions is not an array");
          return false;
        }
        SpawnPoint pts[NUM_PLAYERS];
        int n = read_points(arr, "cannons.positions", pts, NUM_PLAYERS);
        if (n != NUM_PLAYERS) {
          flecs::log::warn("game_config: cannons.positions needs exactly %d "
                           "points, keeping defaults",
                           NUM_PLAYERS);
        } else {
          cfg.cannon_pos[0] = pts[0];
          cfg.cannon_pos[1] = pts[1];
        }
      }
    }

    // 4. Projectiles
    if (const json *s = find_section(j, "projectiles", ok)) {
      read_knob(*s, "projectiles", "radius", cfg.bullet_radius, positive);
      read_knob(*s, "projectiles", "speed", cfg.bullet_speed, positive);
      read_knob(*s, "projectiles", "power_increment", cfg.power_increment,
                non_negative);
      read_knob(*s, "projectiles", "power_angle_error", cfg.power_angle_error,
                non_negative);
      read_knob(*s, "projectiles", "power_multiplier", cfg.power_multiplier,
                positive);
    }

    // 5. Match
    if (const json *s = find_section(j, "match", ok)) {
      read_knob(*s, "match", "winning_score", cfg.winning_score,
                [](int32_t v) { return v >= 1; });
      read_knob(*s, "match", "duration", cfg.match_duration,
                [](int32_t v) { return v >= 1; });
    }

    // 6. Host / diagnostics
    if (const json *s = find_section(j, "host", ok)) {
      read_knob(*s, "host", "max_catchup_ticks", cfg.max_catchup_ticks,
                [](int32_t v) { return v >= 1; });
      read_knob(*s, "host", "script_budget_ms", cfg.script_budget_ms,
                positive);
      read_knob(*s, "host", "log_level", cfg.log_level,
                [](int32_t v) { return v >= -4 && v <= 4; });
    }
  } catch (json::parse_error &e) {
    flecs::log::err("game_config: parse error: %s", e.what());
    return false;
  } catch (json::exception &e) {
    flecs::log::err("game_config: bad value: %s", e.what());
    return false;
  }

  if (!ok)
    return false;

  out = cfg;
  return true;
}

} // namespace cannonball

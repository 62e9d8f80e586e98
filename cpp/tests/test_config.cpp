// ═════════════════════════════════════════════════════════════
// Category 4: CONFIG: game_config.json
// ═════════════════════════════════════════════════════════════
#include <fstream>
#include <sstream>

TEST_CASE("Cat4: Defaults match the reference game") {
  GameConfig cfg;
  CHECK(cfg.screen_width == 800.0f);
  CHECK(cfg.screen_height == 600.0f);
  CHECK(cfg.tick_rate == 60);
  CHECK(cfg.ball_radius == 20.0f);
  CHECK(cfg.friction == doctest::Approx(0.995f));
  CHECK(cfg.bullet_radius == 5.0f);
  CHECK(cfg.bullet_speed == 15.0f);
  CHECK(cfg.max_power == 30.0f);
  CHECK(cfg.power_increment == doctest::Approx(0.13f));
  CHECK(cfg.power_bullets == 5);
  CHECK(cfg.precision_bullets == 10);
  CHECK(cfg.turn_delay == doctest::Approx(0.6f));
  CHECK(cfg.winning_score == 1);
  CHECK(cfg.match_duration == 60);
  CHECK(cfg.power_angle_error == 5.0f);
  CHECK(cfg.power_multiplier == doctest::Approx(1.5f));
  CHECK(cfg.spawn_count == 5);
  CHECK(cfg.cannon_pos[0].x == 50.0f);
  CHECK(cfg.cannon_pos[1].x == 750.0f);
}

TEST_CASE("Cat4: Overrides apply, missing keys keep their value") {
  GameConfig cfg;
  bool ok = parse_game_config(R"({
    "field": { "screen_width": 1024, "tick_rate": 120 },
    "ball": { "friction": 0.99, "spawns": [[100, 100], [200, 200]] },
    "cannons": { "power_bullets": 2, "positions": [[10, 20], [30, 40]] },
    "projectiles": { "speed": 20.5 },
    "match": { "winning_score": 3, "duration": 90 },
    "host": { "log_level": 0 }
  })",
                              cfg);

  REQUIRE(ok);
  CHECK(cfg.screen_width == 1024.0f);
  CHECK(cfg.screen_height == 600.0f); // Untouched
  CHECK(cfg.tick_rate == 120);
  CHECK(cfg.friction == doctest::Approx(0.99f));
  CHECK(cfg.spawn_count == 2);
  CHECK(cfg.spawns[1].x == 200.0f);
  CHECK(cfg.power_bullets == 2);
  CHECK(cfg.precision_bullets == 10);
  CHECK(cfg.cannon_pos[1].y == 40.0f);
  CHECK(cfg.bullet_speed == doctest::Approx(20.5f));
  CHECK(cfg.winning_score == 3);
  CHECK(cfg.match_duration == 90);
  CHECK(cfg.log_level == 0);
}

TEST_CASE("Cat4: Broken documents leave the config untouched") {
  GameConfig cfg;
  cfg.max_power = 12.0f;

  SUBCASE("Syntax error") {
    CHECK_FALSE(parse_game_config("{ \"ball\": { \"radius\": 3 ", cfg));
  }
  SUBCASE("Wrong type") {
    CHECK_FALSE(parse_game_config(
        R"({ "ball": { "radius": 3 }, "cannons": { "max_power": "lots" } })",
        cfg));
  }
  SUBCASE("Section is not an object") {
    CHECK_FALSE(parse_game_config(R"({ "ball": { "radius": 3 }, "match": 5 })",
                                  cfg));
  }
  SUBCASE("Root is not an object") {
    CHECK_FALSE(parse_game_config("[1, 2, 3]", cfg));
  }

  CHECK(cfg.ball_radius == 20.0f);
  CHECK(cfg.max_power == 12.0f);
}

TEST_CASE("Cat4: Out-of-range values are rejected one by one") {
  GameConfig cfg;
  bool ok = parse_game_config(R"({
    "field": { "tick_rate": 0, "screen_height": 480 },
    "ball": { "friction": 1.5, "radius": -4 },
    "cannons": { "precision_bullets": -1, "power_bullets": 0 },
    "match": { "winning_score": 0 }
  })",
                              cfg);

  CHECK(ok);
  CHECK(cfg.tick_rate == 60);
  CHECK(cfg.screen_height == 480.0f); // Valid sibling still applied
  CHECK(cfg.friction == doctest::Approx(0.995f));
  CHECK(cfg.ball_radius == 20.0f);
  CHECK(cfg.precision_bullets == 10);
  CHECK(cfg.power_bullets == 0); // Zero ammo is legal
  CHECK(cfg.winning_score == 1);
}

TEST_CASE("Cat4: Integer knobs take whole numbers only") {
  GameConfig cfg;
  bool ok = parse_game_config(R"({
    "field": { "tick_rate": 60.9 },
    "cannons": { "power_bullets": 4294967296, "precision_bullets": 7.0 },
    "match": { "duration": -3000000000, "winning_score": 2 }
  })",
                              cfg);

  CHECK(ok);
  CHECK(cfg.tick_rate == 60);           // Fractional: rejected, not truncated
  CHECK(cfg.power_bullets == 5);        // Does not fit in 32 bits
  CHECK(cfg.precision_bullets == 7);    // Integral float is fine
  CHECK(cfg.match_duration == 60);      // Below int32 range
  CHECK(cfg.winning_score == 2);
}

TEST_CASE("Cat4: Spawn list limits") {
  SUBCASE("More than eight points") {
    GameConfig cfg;
    CHECK(parse_game_config(R"({ "ball": { "spawns": [
      [1,1],[2,2],[3,3],[4,4],[5,5],[6,6],[7,7],[8,8],[9,9],[10,10]
    ] } })",
                            cfg));
    CHECK(cfg.spawn_count == MAX_SPAWN_POINTS);
    CHECK(cfg.spawns[7].x == 8.0f);
  }
  SUBCASE("Empty list keeps the defaults") {
    GameConfig cfg;
    CHECK(parse_game_config(R"({ "ball": { "spawns": [] } })", cfg));
    CHECK(cfg.spawn_count == 5);
    CHECK(cfg.spawns[0].x == 400.0f);
  }
  SUBCASE("Malformed entries are skipped") {
    GameConfig cfg;
    CHECK(parse_game_config(
        R"({ "ball": { "spawns": [[1, 2, 3], ["a", 5], [300, 310]] } })",
        cfg));
    CHECK(cfg.spawn_count == 1);
    CHECK(cfg.spawns[0].y == 310.0f);
  }
  SUBCASE("Cannon list needs exactly two") {
    GameConfig cfg;
    CHECK(parse_game_config(R"({ "cannons": { "positions": [[1, 1]] } })",
                            cfg));
    CHECK(cfg.cannon_pos[0].x == 50.0f);
  }
}

TEST_CASE("Cat4: Shipped game_config.json parses to the defaults") {
  std::ifstream in(CANNONBALL_DATA_DIR "/game_config.json");
  REQUIRE(in.good());
  std::stringstream ss;
  ss << in.rdbuf();

  GameConfig cfg;
  cfg.bullet_speed = 1.0f; // Must be overwritten by the file
  REQUIRE(parse_game_config(ss.str(), cfg));

  GameConfig defaults;
  CHECK(cfg.bullet_speed == defaults.bullet_speed);
  CHECK(cfg.spawn_count == defaults.spawn_count);
  CHECK(cfg.spawns[4].x == defaults.spawns[4].x);
  CHECK(cfg.turn_delay == doctest::Approx(defaults.turn_delay));
  CHECK(cfg.cannon_pos[1].x == defaults.cannon_pos[1].x);
  CHECK(cfg.match_duration == defaults.match_duration);
}

TEST_CASE_FIXTURE(MatchTestHarness,
                  "Cat4: A parsed config drives the simulation") {
  GameConfig cfg = quiet_config();
  REQUIRE(parse_game_config(
      R"({ "cannons": { "power_bullets": 1, "precision_bullets": 0 } })", cfg));
  rebuild(cfg);

  CHECK(match->cannon(0).power_bullets == 1);
  CHECK(match->cannon(1).precision_bullets == 0);
  CHECK(match->config().power_bullets == 1);
}

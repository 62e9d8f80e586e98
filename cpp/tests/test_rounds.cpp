// ═════════════════════════════════════════════════════════════
// Category 3: ROUNDS: Scoring, Stalemate, Reset, Clock, Win
// ═════════════════════════════════════════════════════════════

static GameConfig long_match_config(int winning_score = 3) {
  GameConfig cfg = MatchTestHarness::quiet_config();
  cfg.winning_score = winning_score;
  return cfg;
}

TEST_CASE_FIXTURE(MatchTestHarness,
                  "Cat3: Left goal scores for player 2 and resets the round") {
  rebuild(long_match_config());
  spawn_projectile(100.0f, 100.0f, 15.0f, 0.0f); // Cleared by the reset
  set_ammo(0, 1, 2);
  set_ball(25.0f, 300.0f, -10.0f, 0.0f);

  step();

  CHECK(state().score[0] == 0);
  CHECK(state().score[1] == 1);
  CHECK(state().last_round_end == ROUND_GOAL);
  CHECK(state().last_scorer == 1);
  CHECK(state().round == 1);
  CHECK(state().phase == MATCH_PLAYING);

  // Ball at spawn 1 = (400, 350) +/- 5, at rest
  Position p = match->ball_position();
  CHECK(p.x >= 395.0f);
  CHECK(p.x <= 405.0f);
  CHECK(p.y >= 345.0f);
  CHECK(p.y <= 355.0f);
  CHECK(p.x == std::floor(p.x)); // Integer jitter
  CHECK_FALSE(is_moving(match->ball_velocity()));

  CHECK(match->projectile_count() == 0);
  CHECK(match->cannon(0).power_bullets == 5);
  CHECK(match->cannon(0).precision_bullets == 10);
}

TEST_CASE_FIXTURE(MatchTestHarness, "Cat3: Right goal scores for player 1") {
  set_ball(775.0f, 300.0f, 10.0f, 0.0f);
  step();
  CHECK(state().score[0] == 1);
  CHECK(state().score[1] == 0);

  // Default winning score is 1
  CHECK(state().phase == MATCH_OVER);
  CHECK(state().winner == 0);
}

TEST_CASE_FIXTURE(MatchTestHarness,
                  "Cat3: Rolling ball with no ammo ends in a stalemate for "
                  "the farther player") {
  rebuild(long_match_config());
  empty_all_ammo();
  set_ball(500.0f, 300.0f, -2.0f, 0.0f);

  // Still rolling: no stalemate yet
  step(10);
  CHECK(state().round == 0);
  CHECK(state().score[0] + state().score[1] == 0);

  int ticks = run_until([&] { return state().round == 1; }, 2000);
  REQUIRE(ticks > 0);

  CHECK(state().last_round_end == ROUND_STALEMATE);
  // Ball came to rest near the left cannon: player 2 is farther
  CHECK(state().score[1] == 1);
  CHECK(state().score[0] == 0);
}

TEST_CASE_FIXTURE(MatchTestHarness,
                  "Cat3: Stalemate at equal distance goes to player 1") {
  GameConfig cfg;
  CHECK(stalemate_winner(400.0f, cfg) == 0);
  CHECK(stalemate_winner(100.0f, cfg) == 1);
  CHECK(stalemate_winner(700.0f, cfg) == 0);

  // Ball rests dead center at spawn 0
  empty_all_ammo();
  step();
  CHECK(state().last_round_end == ROUND_STALEMATE);
  CHECK(state().score[0] == 1);
}

TEST_CASE_FIXTURE(MatchTestHarness,
                  "Cat3: No stalemate while anything can still happen") {
  empty_all_ammo();

  SUBCASE("Ammo left") {
    set_ammo(1, 0, 1);
    CHECK_FALSE(is_stalemate(world()));
  }
  SUBCASE("Projectile in flight") {
    spawn_projectile(100.0f, 100.0f, 15.0f, 0.0f);
    CHECK_FALSE(is_stalemate(world()));
  }
  SUBCASE("Ball moving") {
    set_ball(400.0f, 300.0f, 0.5f, 0.0f);
    CHECK_FALSE(is_stalemate(world()));
  }
  SUBCASE("Cannon charging a paid-for shot") {
    TurnState &t = match->cannon_entity(0).ensure<TurnState>();
    t.phase = TURN_CHARGING;
    t.pending_power = 3.0f;
    CHECK_FALSE(is_stalemate(world()));
  }
  SUBCASE("Nothing left") { CHECK(is_stalemate(world())); }
}

TEST_CASE_FIXTURE(MatchTestHarness, "Cat3: Round reset refills ammo exactly") {
  set_ammo(0, 2, 7);
  set_ammo(1, 0, 0);
  match->cannon_entity(1).ensure<TurnState>().phase = TURN_CHARGING;
  match->cannon_entity(1).ensure<Cannon>().power = 12.0f;

  reset_round(world());
  for (int p = 0; p < NUM_PLAYERS; p++) {
    CHECK(match->cannon(p).power_bullets == 5);
    CHECK(match->cannon(p).precision_bullets == 10);
    CHECK(match->cannon(p).power == 0.0f);
    CHECK(match->turn(p).phase == TURN_READY);
  }

  reset_round(world());
  for (int p = 0; p < NUM_PLAYERS; p++) {
    CHECK(match->cannon(p).power_bullets == 5);
    CHECK(match->cannon(p).precision_bullets == 10);
  }
  CHECK(state().round == 2);
}

TEST_CASE_FIXTURE(MatchTestHarness, "Cat3: Spawn points cycle with the round") {
  rebuild(long_match_config());
  const GameConfig &cfg = match->config();

  for (int r = 1; r <= 6; r++) {
    reset_round(world());
    const SpawnPoint &sp = cfg.spawns[r % cfg.spawn_count];
    Position p = match->ball_position();
    CHECK(std::fabs(p.x - sp.x) <= 5.0f);
    CHECK(std::fabs(p.y - sp.y) <= 5.0f);
  }
}

TEST_CASE_FIXTURE(MatchTestHarness, "Cat3: A tick never scores for both") {
  GameConfig cfg = long_match_config(1000);
  cfg.match_duration = 30;
  rebuild(cfg);
  match->set_player_script(0, &bombardier_script);
  match->set_player_script(1, &marksman_script);

  int prev_total = 0;
  while (!match->is_over()) {
    step();
    int total = state().score[0] + state().score[1];
    CHECK(total - prev_total <= 1);
    prev_total = total;
  }
}

TEST_CASE_FIXTURE(MatchTestHarness, "Cat3: Countdown ticks once per second") {
  GameConfig cfg = quiet_config();
  cfg.match_duration = 2;
  rebuild(cfg);

  step(59);
  CHECK(state().time_remaining == 2);
  step();
  CHECK(state().time_remaining == 1);
  CHECK(state().phase == MATCH_PLAYING);
  step(59);
  CHECK(state().phase == MATCH_PLAYING);
  step();
  CHECK(state().time_remaining == 0);
  CHECK(state().phase == MATCH_OVER);
  CHECK(state().tick == 120);

  // Over means frozen
  step(10);
  CHECK(state().tick == 120);
}

TEST_CASE_FIXTURE(MatchTestHarness, "Cat3: Timer expiry decides the winner") {
  GameConfig cfg = long_match_config();
  cfg.match_duration = 1;
  rebuild(cfg);

  SUBCASE("Equal score, equal bullets: draw") {
    step(60);
    CHECK(state().phase == MATCH_OVER);
    CHECK(state().winner == NO_PLAYER);
  }
  SUBCASE("Equal score: fewer bullets fired wins") {
    MatchState &m = world().ensure<MatchState>();
    m.bullets_fired[0] = 5;
    m.bullets_fired[1] = 3;
    step(60);
    CHECK(state().winner == 1);
  }
  SUBCASE("Higher score wins regardless of bullets") {
    MatchState &m = world().ensure<MatchState>();
    m.score[0] = 2;
    m.bullets_fired[0] = 15;
    step(60);
    CHECK(state().winner == 0);
  }
}

TEST_CASE("Cat3: decide_winner tie-breaks") {
  MatchState m = {};
  CHECK(decide_winner(m) == NO_PLAYER);
  m.score[1] = 1;
  CHECK(decide_winner(m) == 1);
  m.score[0] = 1;
  m.bullets_fired[0] = 2;
  m.bullets_fired[1] = 4;
  CHECK(decide_winner(m) == 0);
}

TEST_CASE_FIXTURE(MatchTestHarness, "Cat3: Restart resets the whole match") {
  rebuild(long_match_config());
  order(0, 0.0f, 10.0f, BULLET_POWER);
  set_ball(25.0f, 300.0f, -10.0f, 0.0f);
  step(15);
  REQUIRE(state().score[1] == 1);

  match->start(99);

  CHECK(state().score[0] == 0);
  CHECK(state().score[1] == 0);
  CHECK(state().bullets_fired[0] == 0);
  CHECK(state().round == 0);
  CHECK(state().tick == 0);
  CHECK(state().time_remaining == 60);
  CHECK(state().phase == MATCH_PLAYING);
  CHECK(state().winner == NO_PLAYER);
  CHECK(match->projectile_count() == 0);
  CHECK(match->ball_position().x == doctest::Approx(400.0f));
  CHECK(match->ball_position().y == doctest::Approx(300.0f));
  CHECK(match->cannon(0).power_bullets == 5);
}

TEST_CASE("Cat3: Same seed, same match") {
  GameConfig cfg = MatchTestHarness::quiet_config();
  cfg.winning_score = 5;

  Match a(cfg, 7);
  Match b(cfg, 7);
  for (Match *m : {&a, &b}) {
    m->set_player_script(0, &bombardier_script);
    m->set_player_script(1, &interceptor_script);
  }

  for (int i = 0; i < 1500; i++) {
    a.step();
    b.step();
  }

  CHECK(a.state().score[0] == b.state().score[0]);
  CHECK(a.state().score[1] == b.state().score[1]);
  CHECK(a.state().round == b.state().round);
  CHECK(a.state().bullets_fired[0] == b.state().bullets_fired[0]);
  CHECK(a.ball_position().x == b.ball_position().x);
  CHECK(a.ball_position().y == b.ball_position().y);
  CHECK(a.projectile_count() == b.projectile_count());
}

TEST_CASE_FIXTURE(MatchTestHarness,
                  "Cat3: advance() runs whole ticks, capped per call") {
  double tick = 1.0 / 60.0;

  CHECK(match->advance(tick * 0.5) == 0);
  CHECK(match->advance(tick * 0.6) == 1); // Accumulated past one tick
  CHECK(match->advance(tick * 3.0) == 3);
  CHECK(match->advance(1.0) == 5); // max_catchup_ticks
  CHECK(match->advance(-1.0) == 0);
  CHECK(state().tick == 9);
}

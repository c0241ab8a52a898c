#include <catch2/catch.hpp>
#include <atomic>
#include <set>
#include <thread>
#include <vector>
#include <paddock/provisional.hpp>

using namespace paddock;

static SessionConfig race_config(RankingMode mode = RankingMode::time_derived) {
  SessionConfig c;
  c.ranking_mode = mode;
  c.ranking_key = RankingKey::laps_then_best;
  return c;
}

TEST_CASE("LiveSession starts empty and idle") {
  LiveSession s(1, "Heat 1", race_config());
  auto c = s.current();
  REQUIRE(c);
  REQUIRE(c->rows.empty());
  REQUIRE(c->state == SessionState::idle);
  REQUIRE(s.kind() == SessionKind::heat);
}

TEST_CASE("LiveSession recomputes on every lap") {
  LiveSession s(1, "Heat 1", race_config());
  const auto a = s.register_competitor("11", "Alice");
  const auto b = s.register_competitor("22", "Bob");
  REQUIRE(a == 1);
  REQUIRE(b == 2);

  for (int lap = 1; lap <= 3; ++lap) {
    s.record_lap("11", lap, lap == 2 ? 45100 : 46000, lap * 46000);
    s.record_lap("22", lap, lap == 3 ? 44900 : 46500, lap * 46500);
  }
  auto c = s.current();
  REQUIRE(c->rows.size() == 2);
  REQUIRE(c->rows[0].number == "22");
  REQUIRE(c->rows[0].best_lap == 44900);
  REQUIRE(c->rows[1].name == "Alice");
  REQUIRE(c->rows[1].total_laps == 3);
  REQUIRE(c->revision > 1);
  REQUIRE(s.lap_count() == 6);
}

TEST_CASE("LiveSession lap numbering") {
  LiveSession s(1, "Heat 1", race_config());

  SECTION("lap 0 means next") {
    REQUIRE(s.record_lap("7", 0, 46000) == LapOutcome::recorded);
    REQUIRE(s.record_lap("7", 0, 46000) == LapOutcome::recorded);
    REQUIRE(s.has_lap(1, 1));
    REQUIRE(s.has_lap(1, 2));
  }

  SECTION("duplicates are dropped") {
    REQUIRE(s.record_lap("7", 1, 46000) == LapOutcome::recorded);
    REQUIRE(s.record_lap("7", 1, 45000) == LapOutcome::duplicate);
    REQUIRE(s.lap_count() == 1);
    REQUIRE(s.duplicate_laps() == 1);
    REQUIRE(s.current()->rows[0].best_lap == 46000);
  }

  SECTION("short laps are kept but not counted") {
    REQUIRE(s.record_lap("7", 1, 12000) == LapOutcome::recorded_invalid);
    REQUIRE(s.lap_count() == 1);
    REQUIRE(s.current()->rows[0].total_laps == 0);
  }
}

TEST_CASE("LiveSession auto-registers and fills names once") {
  LiveSession s(1, "Practice", race_config());
  s.record_lap("9", 1, 50000);
  REQUIRE(s.find_competitor(1)->name.empty());
  s.register_competitor("9", "Grace Hopper");
  REQUIRE(s.find_competitor(1)->name == "Grace Hopper");
  s.register_competitor("9", "Someone Else");
  REQUIRE(s.find_competitor(1)->name == "Grace Hopper");
  REQUIRE(s.find_number("9") == 1u);
  REQUIRE_FALSE(s.find_number("10").has_value());
  REQUIRE(s.current()->rows[0].name == "Grace Hopper");
}

TEST_CASE("LiveSession state change does not recompute") {
  LiveSession s(1, "Heat 1", race_config());
  s.record_lap("7", 1, 46000);
  const auto before = s.current();
  s.change_state(SessionState::live);
  const auto after = s.current();
  REQUIRE(s.state() == SessionState::live);
  REQUIRE(after->state == SessionState::live);
  REQUIRE(after->revision == before->revision);
  REQUIRE(after->rows == before->rows);
  REQUIRE(before->state == SessionState::idle);  // published values are immutable
}

TEST_CASE("LiveSession feed-reported mode follows $G positions") {
  LiveSession s(1, "Final", race_config(RankingMode::feed_reported));
  s.record_lap("1", 1, 44000);
  s.record_lap("2", 1, 46000);
  s.record_lap("3", 1, 45000);
  s.report_position("2", 1);
  s.report_position("3", 2);
  auto c = s.current();
  REQUIRE(c->rows[0].number == "2");
  REQUIRE(c->rows[1].number == "3");
  REQUIRE(c->rows[2].number == "1");

  auto in = s.capture();
  REQUIRE(in.reports == std::vector<PositionReport>{{2, 1}, {3, 2}});

  SECTION("repeating a position adds nothing to the report log") {
    s.report_position("2", 1);
    REQUIRE(s.capture().reports.size() == 2);
  }
}

TEST_CASE("LiveSession time-derived mode ignores reported positions for order") {
  LiveSession s(1, "Heat 1", race_config());
  s.record_lap("1", 1, 44000);
  s.record_lap("2", 1, 46000);
  s.report_position("2", 1);
  REQUIRE(s.current()->rows[0].number == "1");
}

TEST_CASE("LiveSession readers see complete classifications while a writer runs") {
  LiveSession s(1, "Heat 1", race_config());
  std::atomic<bool> done{false};
  std::atomic<int> torn{0};

  std::thread reader([&] {
    std::uint64_t cursor = 0;
    std::shared_ptr<const Classification> c;
    while (!done.load()) {
      if (!s.try_consume_latest(cursor, c)) continue;
      std::set<int> positions;
      for (const auto& r : c->rows) positions.insert(r.position);
      if (positions.size() != c->rows.size()) ++torn;
      for (std::size_t i = 1; i < c->rows.size(); ++i)
        if (c->rows[i - 1].total_laps < c->rows[i].total_laps) ++torn;
    }
  });

  for (int lap = 1; lap <= 50; ++lap)
    for (int k = 1; k <= 8; ++k)
      s.record_lap(std::to_string(k), lap, 40000 + k * 100 + lap, lap * 41000);
  done.store(true);
  reader.join();

  REQUIRE(torn.load() == 0);
  REQUIRE(s.current()->rows.size() == 8);
  REQUIRE(s.current()->rows[0].total_laps == 50);
}

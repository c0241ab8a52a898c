#include <catch2/catch.hpp>
#include <algorithm>
#include <atomic>
#include <future>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <fmt/format.h>
#include <paddock/engine.hpp>
#include <paddock/feed_client.hpp>

using namespace paddock;

namespace {

SessionConfig heat_config() {
  SessionConfig c;
  c.ranking_key = RankingKey::laps_then_best;
  c.points_scale = make_points_scale("pair", {25, 18});
  return c;
}

// $G followed by $J for each lap, so lap numbers come from the feed.
std::string laps_packets(const std::string& number, const std::vector<std::string>& times) {
  std::string out;
  int lap = 0;
  for (const auto& t : times) {
    ++lap;
    out += fmt::format("$G,1,\"{}\",{},\"\"\n", number, lap);
    out += fmt::format("$J,\"{}\",\"{}\",\"\"\n", number, t);
  }
  return out;
}

std::string scenario_feed() {
  std::string f = "$B,1,\"Heat 1\"\n";
  f += "$A,\"11\",\"11\",1001,\"Alice\",\"A\"\n";
  f += "$A,\"22\",\"22\",1002,\"Bruno\",\"B\"\n";
  f += laps_packets("11", {"00:46.000", "00:45.100", "00:46.200"});
  f += laps_packets("22", {"00:46.000", "00:44.900", "00:46.200"});
  return f;
}

std::size_t feed(ResultsEngine& engine, const std::string& bytes, std::size_t chunk = 7) {
  std::istringstream in(bytes);
  FeedParser parser;
  return replay_feed(in, parser, [&](const FeedEvent& ev){ engine.on_event(ev); }, chunk);
}

std::vector<std::string> numbers(const std::vector<ResultEntry>& entries) {
  std::vector<std::string> out;
  for (const auto& e : entries) out.push_back(e.number);
  return out;
}

std::vector<std::string> numbers(const Classification& c) {
  std::vector<std::string> out;
  for (const auto& r : c.rows) out.push_back(r.number);
  return out;
}

SessionId scenario_session(ResultsEngine& engine) {
  const auto id = engine.create_session("Heat 1", heat_config());
  REQUIRE(id);
  feed(engine, scenario_feed());
  return id.value();
}

void laps_for(LiveSession& s, const std::string& number, int count, Millis base) {
  for (int lap = 1; lap <= count; ++lap) s.record_lap(number, lap, base + lap, lap * base);
}

struct RecordingSink : PublicationSink {
  std::mutex mutex;
  std::vector<PublishedUnit> units;
  void on_published(const PublishedUnit& unit) override {
    std::lock_guard lock(mutex);
    units.push_back(unit);
  }
};

} // namespace

TEST_CASE("time penalty reorders the official result and its points") {
  ResultsEngine engine;
  const auto id = scenario_session(engine);

  auto prov = engine.get_provisional(id);
  REQUIRE(prov);
  REQUIRE(numbers(*prov.value()) == std::vector<std::string>{"22", "11"});
  REQUIRE(prov.value()->rows[1].name == "Alice A");

  const auto b = engine.live(id)->find_number("22");
  REQUIRE(b);
  auto pid = engine.submit_penalty(id, *b, TimeAdjust{1000}, "steward");
  REQUIRE(pid);
  REQUIRE(pid.value() == 1);

  // Staged only: provisional is unchanged.
  REQUIRE(numbers(*engine.get_provisional(id).value()) == std::vector<std::string>{"22", "11"});

  auto preview = engine.preview_official(id);
  REQUIRE(preview);
  REQUIRE(numbers(preview.value()) == std::vector<std::string>{"11", "22"});

  auto snap = engine.publish_official(id);
  REQUIRE(snap);
  REQUIRE(snap.value()->version == 1);
  REQUIRE(snap.value()->basis == Basis::official);
  REQUIRE(numbers(snap.value()->entries) == std::vector<std::string>{"11", "22"});

  auto points = engine.get_points(id);
  REQUIRE(points);
  REQUIRE(points.value().size() == 2);
  REQUIRE(points.value()[0].number == "11");
  REQUIRE(points.value()[0].points == 25);
  REQUIRE(points.value()[1].number == "22");
  REQUIRE(points.value()[1].points == 18);
  for (const auto& p : points.value()) REQUIRE(p.version == snap.value()->version);
}

TEST_CASE("a disqualified leader is placed last with no points") {
  ResultsEngine engine;
  const auto id = engine.create_session("Heat 3", heat_config()).value();
  auto& live = *engine.live(id);
  laps_for(live, "1", 3, 45000);
  laps_for(live, "2", 3, 46000);
  laps_for(live, "3", 3, 44000);  // C leads
  REQUIRE(engine.get_provisional(id).value()->rows[0].number == "3");

  const auto c = *live.find_number("3");
  REQUIRE(engine.submit_penalty(id, c, Disqualify{}, "steward"));
  auto snap = engine.publish_official(id);
  REQUIRE(snap);
  REQUIRE(numbers(snap.value()->entries) == std::vector<std::string>{"1", "2", "3"});
  REQUIRE(snap.value()->entries[2].status == ResultStatus::disqualified);

  const auto pts = engine.get_points(id, 1).value();
  REQUIRE(pts[2].number == "3");
  REQUIRE(pts[2].points == 0);
}

TEST_CASE("position adjustments accumulate through the engine") {
  ResultsEngine engine;
  const auto id = engine.create_session("Heat 4", heat_config()).value();
  auto& live = *engine.live(id);
  laps_for(live, "1", 2, 44000);
  laps_for(live, "2", 2, 45000);
  laps_for(live, "3", 2, 46000);
  laps_for(live, "4", 2, 47000);

  const auto c = *live.find_number("3");
  REQUIRE(engine.submit_penalty(id, c, PositionAdjust{+1}, "a"));
  REQUIRE(engine.submit_penalty(id, c, PositionAdjust{-2}, "b"));
  REQUIRE(numbers(engine.preview_official(id).value()) == std::vector<std::string>{"1", "3", "2", "4"});

  const auto ledger = engine.ledger(id).value();
  REQUIRE(ledger.size() == 2);
  REQUIRE(ledger[0].author == "a");
  REQUIRE(std::get<PositionAdjust>(ledger[1].params).offset == -2);
}

TEST_CASE("submit_penalty rejects bad requests without touching the ledger") {
  ResultsEngine engine;
  const auto id = scenario_session(engine);

  REQUIRE(engine.submit_penalty(99, 1, Disqualify{}, "s").error() == errc::unknown_session);
  REQUIRE(engine.submit_penalty(id, 42, Disqualify{}, "s").error() == errc::unknown_competitor);
  REQUIRE(engine.submit_penalty(id, 1, TimeAdjust{0}, "s").error() == errc::invalid_penalty_params);
  REQUIRE(engine.submit_penalty(id, 1, Disqualify{}, "").error() == errc::invalid_penalty_params);
  REQUIRE(engine.submit_penalty(id, 1, InvalidateLap{9}, "s").error() == errc::invalid_penalty_params);
  REQUIRE(engine.ledger(id).value().empty());

  REQUIRE(engine.submit_penalty(id, 1, InvalidateLap{2}, "s"));
  REQUIRE(engine.ledger(id).value().size() == 1);
}

TEST_CASE("preview is idempotent and creates no version") {
  ResultsEngine engine;
  const auto id = scenario_session(engine);
  REQUIRE(engine.submit_penalty(id, 1, TimeAdjust{-500}, "s"));

  const auto first = engine.preview_official(id).value();
  const auto second = engine.preview_official(id).value();
  REQUIRE(first == second);
  REQUIRE(engine.get_official(id).error() == errc::no_official_result);
  REQUIRE(engine.get_points(id).error() == errc::no_official_result);
}

TEST_CASE("publish_official failure conditions") {
  ResultsEngine engine;
  REQUIRE(engine.publish_official(5).error() == errc::unknown_session);

  const auto id = engine.create_session("Heat 9", heat_config()).value();
  engine.live(id)->register_competitor("5", "Nobody");
  REQUIRE(engine.publish_official(id).error() == errc::no_provisional_data);
  REQUIRE(engine.get_official(id).error() == errc::no_official_result);

  REQUIRE(engine.create_session("Heat 9", heat_config()).error() == errc::session_exists);
}

TEST_CASE("versions are gapless and immutable") {
  ResultsEngine engine;
  const auto id = scenario_session(engine);

  auto v1 = engine.publish_official(id).value();
  REQUIRE(engine.submit_penalty(id, 2, TimeAdjust{1000}, "s"));
  auto v2 = engine.publish_official(id).value();
  REQUIRE(v1->version == 1);
  REQUIRE(v2->version == 2);
  REQUIRE(numbers(v1->entries) == std::vector<std::string>{"22", "11"});
  REQUIRE(numbers(v2->entries) == std::vector<std::string>{"11", "22"});

  REQUIRE(engine.get_official(id).value()->version == 2);
  REQUIRE(engine.get_official(id, 1).value() == v1);
  REQUIRE(engine.get_official(id, 3).error() == errc::unknown_version);
  REQUIRE(engine.get_official(id, 0).error() == errc::unknown_version);
  REQUIRE(engine.get_points(id, 1).value()[0].points == 25);
  REQUIRE(engine.get_points(id, 1).value()[0].number == "22");
}

TEST_CASE("concurrent publishers never duplicate or skip a version") {
  ResultsEngine engine;
  const auto id = scenario_session(engine);

  std::mutex m;
  std::vector<std::uint32_t> versions;
  std::atomic<int> conflicts{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 6; ++t)
    threads.emplace_back([&] {
      int done = 0;
      while (done < 20) {
        auto r = engine.publish_official(id);
        if (!r) {
          if (r.error() == errc::concurrent_publish) ++conflicts;
          continue;
        }
        std::lock_guard lock(m);
        versions.push_back(r.value()->version);
        ++done;
      }
    });
  for (auto& t : threads) t.join();

  std::sort(versions.begin(), versions.end());
  REQUIRE(versions.size() == 120);
  for (std::size_t i = 0; i < versions.size(); ++i) REQUIRE(versions[i] == i + 1);
  REQUIRE(engine.get_official(id).value()->version == 120);
}

TEST_CASE("a publish in flight rejects a second publish for the same session") {
  struct BlockingSink : PublicationSink {
    std::promise<void> entered;
    std::shared_future<void> release;
    std::atomic<bool> first{true};
    void on_published(const PublishedUnit&) override {
      if (first.exchange(false)) {
        entered.set_value();
        release.wait();
      }
    }
  };

  ResultsEngine engine;
  const auto id = scenario_session(engine);
  const auto other = engine.create_session("Heat 2", heat_config()).value();
  laps_for(*engine.live(other), "5", 1, 45000);

  std::promise<void> release;
  auto sink = std::make_shared<BlockingSink>();
  sink->release = release.get_future().share();
  engine.subscribe(sink);
  auto entered = sink->entered.get_future();

  std::optional<Result<std::shared_ptr<const ResultSnapshot>>> first;
  std::thread publisher([&] { first.emplace(engine.publish_official(id)); });
  entered.wait();

  REQUIRE(engine.publish_official(id).error() == errc::concurrent_publish);
  // Other sessions are independent.
  REQUIRE(engine.publish_official(other).value()->version == 1);

  release.set_value();
  publisher.join();
  REQUIRE(first.has_value());
  REQUIRE(first->value()->version == 1);
  REQUIRE(engine.publish_official(id).value()->version == 2);
}

TEST_CASE("sinks receive one unit per publish, tagged with the snapshot version") {
  ResultsEngine engine;
  auto sink = std::make_shared<RecordingSink>();
  engine.subscribe(sink);

  struct ThrowingSink : PublicationSink {
    void on_published(const PublishedUnit&) override { throw std::runtime_error("offline"); }
  };
  engine.subscribe(std::make_shared<ThrowingSink>());

  const auto id = scenario_session(engine);
  REQUIRE(engine.publish_official(id));
  REQUIRE(engine.publish_official(id));

  REQUIRE(sink->units.size() == 2);
  for (std::size_t i = 0; i < sink->units.size(); ++i) {
    const auto& u = sink->units[i];
    REQUIRE(u.version == i + 1);
    REQUIRE(u.session == id);
    REQUIRE(u.session_name == "Heat 1");
    REQUIRE(u.snapshot->version == u.version);
    for (const auto& p : u.points) REQUIRE(p.version == u.version);
  }
  REQUIRE(engine.stats().publications == 2);
}

TEST_CASE("replaying laps and ledger reproduces the official snapshot") {
  ResultsEngine engine;
  const auto id = scenario_session(engine);
  REQUIRE(engine.submit_penalty(id, 2, TimeAdjust{1000}, "s"));
  REQUIRE(engine.submit_penalty(id, 1, InvalidateLap{3}, "s"));
  const auto snap = engine.publish_official(id).value();

  // Activity after publication does not change the checkpoint.
  laps_for(*engine.live(id), "33", 4, 43000);
  REQUIRE(engine.submit_penalty(id, 1, Disqualify{}, "s"));
  REQUIRE(numbers(engine.preview_official(id).value()) != numbers(snap->entries));

  const auto replayed = engine.replay_official(id).value();
  REQUIRE(replayed.entries == snap->entries);
  REQUIRE(same_classification(replayed, *snap));

  SECTION("an independent engine fed the same data agrees") {
    ResultsEngine twin;
    const auto tid = scenario_session(twin);
    REQUIRE(twin.submit_penalty(tid, 2, TimeAdjust{1000}, "s"));
    REQUIRE(twin.submit_penalty(tid, 1, InvalidateLap{3}, "s"));
    const auto twin_snap = twin.publish_official(tid).value();
    REQUIRE(same_classification(*twin_snap, *snap));
  }
}

TEST_CASE("a competitor registered after publication is not part of the replay") {
  ResultsEngine engine;
  const auto id = scenario_session(engine);
  const auto alice = engine.live(id)->find_number("11");
  REQUIRE(alice);
  REQUIRE(engine.submit_penalty(id, *alice, PositionAdjust{+5}, "s"));
  const auto snap = engine.publish_official(id).value();
  REQUIRE(numbers(snap->entries) == std::vector<std::string>{"22", "11"});

  engine.live(id)->register_competitor("33", "Cara");
  REQUIRE(numbers(engine.preview_official(id).value()) == std::vector<std::string>{"22", "33", "11"});

  const auto replayed = engine.replay_official(id, snap->version).value();
  REQUIRE(replayed.entries == snap->entries);
  REQUIRE(replayed.competitor_watermark == 2);
}

TEST_CASE("feed-reported replay uses the running order seen at publication") {
  ResultsEngine engine;
  SessionConfig cfg = heat_config();
  cfg.ranking_mode = RankingMode::feed_reported;
  const auto id = engine.create_session("Final", cfg).value();
  auto& live = *engine.live(id);
  live.register_competitor("11", "Alice");
  live.register_competitor("22", "Bruno");
  laps_for(live, "11", 2, 45000);
  laps_for(live, "22", 2, 45000);
  live.report_position("22", 1);
  live.report_position("11", 2);
  const auto v1 = engine.publish_official(id).value();
  REQUIRE(numbers(v1->entries) == std::vector<std::string>{"22", "11"});

  live.report_position("11", 1);
  live.report_position("22", 2);
  const auto v2 = engine.publish_official(id).value();
  REQUIRE(numbers(v2->entries) == std::vector<std::string>{"11", "22"});

  live.report_position("22", 1);
  live.report_position("11", 2);

  REQUIRE(engine.replay_official(id, 1).value().entries == v1->entries);
  REQUIRE(engine.replay_official(id, 2).value().entries == v2->entries);
  REQUIRE(engine.replay_official(id, 2).value().report_watermark == 4);
  REQUIRE(engine.replay_official(id, 3).error() == errc::unknown_version);
}

TEST_CASE("malformed bytes in the feed do not disturb valid packets") {
  ResultsEngine clean_engine;
  const auto clean = scenario_session(clean_engine);

  ResultsEngine noisy_engine;
  const auto noisy = noisy_engine.create_session("Heat 1", heat_config()).value();
  std::string bytes;
  std::istringstream lines(scenario_feed());
  std::string line;
  while (std::getline(lines, line)) {
    bytes += line + "\n";
    bytes += "$J,\"11\",\"garbage\n\x7f\x01\x02\n$XX,,\n";
  }
  feed(noisy_engine, bytes, 3);

  REQUIRE(noisy_engine.get_provisional(noisy).value()->rows == clean_engine.get_provisional(clean).value()->rows);
}

TEST_CASE("feed-created sessions use the defaults for their kind") {
  ResultsEngine engine;
  feed(engine, "$B,1,\"Senior Qualifying\"\n$J,\"8\",\"00:50.000\",\"\"\n$B,2,\"Heat 1\"\n$F,0,\"\",\"\",\"\",\"Green\"\n");
  const auto q = engine.find_session("Senior Qualifying");
  const auto h = engine.find_session("Heat 1");
  REQUIRE(q);
  REQUIRE(h);
  REQUIRE(engine.live(*q)->config().ranking_key == RankingKey::best_lap);
  REQUIRE(engine.live(*h)->state() == SessionState::live);
  REQUIRE(engine.live(*q)->state() == SessionState::idle);

  const auto all = engine.sessions();
  REQUIRE(all.size() == 2);
  REQUIRE(all[0].kind == SessionKind::qualifying);
  REQUIRE(all[0].laps == 1);
  REQUIRE(engine.stats().events == 4);
  REQUIRE(engine.find_competitor(*q, 1).value().number == "8");
  REQUIRE(engine.find_competitor(*q, 2).error() == errc::unknown_competitor);
}

TEST_CASE("build_grid uses each session's latest official result") {
  ResultsEngine engine;
  const auto scale = make_points_scale("heat", {10, 6, 3});
  const auto h1 = engine.create_session("Heat 1", heat_config()).value();
  const auto h2 = engine.create_session("Heat 2", heat_config()).value();
  const auto q = engine.create_session("Qualifying", heat_config()).value();

  laps_for(*engine.live(h1), "7", 2, 45000);
  laps_for(*engine.live(h1), "3", 2, 46000);
  laps_for(*engine.live(h2), "3", 2, 45000);
  laps_for(*engine.live(h2), "7", 2, 46000);
  laps_for(*engine.live(q), "3", 1, 44000);
  laps_for(*engine.live(q), "7", 1, 45000);

  REQUIRE(engine.build_grid({h1, h2}, q, scale).error() == errc::no_official_result);

  REQUIRE(engine.publish_official(h1));
  REQUIRE(engine.publish_official(h2));
  REQUIRE(engine.publish_official(q));

  auto grid = engine.build_grid({h1, h2}, q, scale);
  REQUIRE(grid);
  REQUIRE(grid.value().size() == 2);
  REQUIRE(grid.value()[0].number == "3");  // tie on 16, better qualifying
  REQUIRE(grid.value()[0].total_points == 16);
  REQUIRE(grid.value()[0].qualifying_position == 1);

  REQUIRE(engine.build_grid({h1, 77}, std::nullopt, scale).error() == errc::unknown_session);
}

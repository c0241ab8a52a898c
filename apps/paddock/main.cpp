#include <paddock/config.hpp>
#include <paddock/engine.hpp>
#include <paddock/feed_client.hpp>
#include <paddock/log.hpp>
#include <paddock/publish.hpp>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include <fmt/format.h>

using namespace paddock;

static void usage() {
  fmt::print(stderr,
             "usage: paddock_cli [--config <file>] listen\n"
             "       paddock_cli [--config <file>] replay <feed file> [--publish <session>]\n");
}

static void print_classification(const std::string& name, const Classification& c) {
  fmt::print("{} [{} rev {}, {}]\n", name, to_string(c.state), c.revision, to_string(c.key));
  fmt::print("{:>3}  {:<6} {:<24} {:>4} {:>10} {:>10}\n", "Pos", "No", "Name", "Laps", "Best", "Gap");
  for (const auto& r : c.rows) {
    std::string gap;
    if (r.laps_behind > 0) gap = fmt::format("+{}L", r.laps_behind);
    else if (r.gap_ms && r.position > 1) gap = fmt::format("+{:.3f}", static_cast<double>(*r.gap_ms) / 1000.0);
    fmt::print("{:>3}  {:<6} {:<24} {:>4} {:>10} {:>10}\n", r.position, r.number, r.name, r.total_laps,
               r.best_lap ? format_lap_time(*r.best_lap) : "-", gap);
  }
}

static void print_official(const std::string& name, const ResultSnapshot& s, const PointsTable& points) {
  fmt::print("{} official v{} (laps {}, penalties {})\n", name, s.version, s.lap_watermark, s.penalty_watermark);
  fmt::print("{:>3}  {:<6} {:<24} {:<10} {:>4} {:>6}\n", "Pos", "No", "Name", "Status", "Laps", "Pts");
  for (const auto& e : s.entries) {
    int pts = 0;
    for (const auto& p : points)
      if (p.competitor == e.competitor) pts = p.points;
    fmt::print("{:>3}  {:<6} {:<24} {:<10} {:>4} {:>6}\n", e.position, e.number, e.name,
               to_string(e.status), e.total_laps, pts);
  }
}

// CSV export of every official version to publish.dir, off the engine's thread.
static std::shared_ptr<AsyncPublisher> subscribe_file_writer(ResultsEngine& engine, const AppConfig& cfg) {
  if (cfg.publish_dir.empty()) return nullptr;
  auto writer = std::make_shared<AsyncPublisher>([dir = cfg.publish_dir](const PublishedUnit& unit) {
    const auto path = write_snapshot_file(dir, unit);
    log_info("wrote {}", path);
  });
  writer->start();
  engine.subscribe(writer);
  return writer;
}

static int publish_named(ResultsEngine& engine, const std::string& name) {
  const auto id = engine.find_session(name);
  if (!id) {
    log_error("no session named '{}'", name);
    return 1;
  }
  auto snap = engine.publish_official(*id);
  if (!snap) {
    log_error("publish '{}' failed: {}", name, snap.error().message());
    return 1;
  }
  auto points = engine.get_points(*id, snap.value()->version);
  print_official(name, *snap.value(), points ? points.value() : PointsTable{});
  return 0;
}

static int run_replay(const AppConfig& cfg, const std::string& file, const std::string& publish) {
  std::ifstream in(file, std::ios::binary);
  if (!in) {
    log_error("cannot open {}", file);
    return 1;
  }
  ResultsEngine engine(cfg.sessions);
  auto writer = subscribe_file_writer(engine, cfg);

  FeedParser parser(cfg.max_packet_bytes);
  const auto n = replay_feed(in, parser, [&](const FeedEvent& ev){ engine.on_event(ev); });
  const auto& c = parser.counters();
  log_info("replayed {} event(s): decoded {} ignored {} malformed {} orphaned {}",
           n, c.decoded, c.ignored, c.malformed, c.orphaned);

  for (const auto& s : engine.sessions()) {
    if (auto cls = engine.get_provisional(s.id)) print_classification(s.name, *cls.value());
    fmt::print("\n");
  }

  int rc = 0;
  if (!publish.empty()) rc = publish_named(engine, publish);
  if (writer) writer->stop();
  return rc;
}

static int run_listen(const AppConfig& cfg) {
  ResultsEngine engine(cfg.sessions);
  auto writer = subscribe_file_writer(engine, cfg);

  FeedClient::Options opt;
  opt.host = cfg.feed_host;
  opt.port = cfg.feed_port;
  opt.max_backoff = std::chrono::seconds(cfg.max_backoff_s);
  opt.max_packet_bytes = cfg.max_packet_bytes;

  FeedClient client(opt, [&](const FeedEvent& ev){ engine.on_event(ev); });
  client.on_reconnect_needed([](std::uint64_t n) {
    log_warning("feed reconnect #{}; packets sent while disconnected are not recovered", n);
  });
  client.start();

  fmt::print(stderr, "commands: status | show <session> | publish <session> | quit\n");
  std::string line;
  while (std::getline(std::cin, line)) {
    std::istringstream words(line);
    std::string cmd;
    words >> cmd;
    std::string arg;
    std::getline(words >> std::ws, arg);

    if (cmd == "quit" || cmd == "exit") break;
    if (cmd == "status") {
      const auto c = client.counters();
      fmt::print("feed {} reconnects {} decoded {} malformed {}\n",
                 client.connected() ? "up" : "down", client.reconnects(), c.decoded, c.malformed);
      for (const auto& s : engine.sessions())
        fmt::print("  {} '{}' {} laps {} penalties {} v{}\n", s.id, s.name, to_string(s.state),
                   s.laps, s.penalties, s.latest_version);
    } else if (cmd == "show") {
      const auto id = engine.find_session(arg);
      auto cls = id ? engine.get_provisional(*id) : Result<std::shared_ptr<const Classification>>(errc::unknown_session);
      if (cls) print_classification(arg, *cls.value());
      else log_error("show '{}': {}", arg, cls.error().message());
    } else if (cmd == "publish") {
      publish_named(engine, arg);
    } else if (!cmd.empty()) {
      log_warning("unknown command '{}'", cmd);
    }
  }

  client.stop();
  if (writer) writer->stop();
  return 0;
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  std::string config_path;
  std::string command;
  std::vector<std::string> rest;
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--config" && i + 1 < args.size()) config_path = args[++i];
    else if (command.empty()) command = args[i];
    else rest.push_back(args[i]);
  }

  AppConfig cfg;
  if (!config_path.empty()) {
    auto loaded = load_app_config(config_path);
    if (!loaded) {
      log_critical("cannot read config {}", config_path);
      return 2;
    }
    cfg = std::move(*loaded);
  }
  apply_env_overrides(cfg, [](const char* name) { return std::getenv(name); });
  set_log_level(cfg.log_level);

  if (command == "listen") return run_listen(cfg);
  if (command == "replay" && !rest.empty()) {
    std::string publish;
    for (std::size_t i = 1; i < rest.size(); ++i)
      if (rest[i] == "--publish" && i + 1 < rest.size()) publish = rest[++i];
    return run_replay(cfg, rest[0], publish);
  }
  usage();
  return 2;
}

#pragma once
#include <cstdint>
#include <functional>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <paddock/log.hpp>
#include <paddock/points.hpp>
#include <paddock/types.hpp>

namespace paddock {

// Laps faster than this are recorded but marked invalid (cut track, transponder glitch).
inline constexpr Millis kMinValidLapMs = 30000;

// Fixed at session creation.
struct SessionConfig {
  RankingMode ranking_mode = RankingMode::time_derived;
  RankingKey ranking_key = RankingKey::laps_then_best;
  PointsScale points_scale;
  Millis min_lap_ms = kMinValidLapMs;
};

// Defaults applied to sessions the feed creates, chosen by session kind.
struct SessionDefaults {
  RankingMode ranking_mode = RankingMode::time_derived;
  std::map<SessionKind, RankingKey> keys;
  std::map<SessionKind, PointsScale> scales;
  Millis min_lap_ms = kMinValidLapMs;

  SessionConfig config_for(SessionKind kind) const;
  SessionConfig config_for_name(std::string_view session_name) const;
};

// Built-in defaults: best lap for practice and qualifying, laps then best lap
// for races; a 10-deep 25-18-15 scale for heats, prefinals and finals.
SessionDefaults default_session_defaults();

struct AppConfig {
  std::string feed_host = "127.0.0.1";
  std::uint16_t feed_port = 50000;
  int max_backoff_s = 10;
  std::size_t max_packet_bytes = 1024;
  std::string publish_dir;  // empty: no CSV export
  LogLevel log_level = LogLevel::info;
  SessionDefaults sessions = default_session_defaults();
};

// "key = value" lines, '#' comments. Unknown keys and bad values are logged
// and leave the default in place. Relative points paths resolve against
// `base_dir`.
AppConfig app_config_from_stream(std::istream& in, const std::string& base_dir = {});

// nullopt if the file cannot be opened.
std::optional<AppConfig> load_app_config(const std::string& path);

using EnvLookup = std::function<const char*(const char*)>;

// PADDOCK_FEED_HOST, PADDOCK_FEED_PORT, PADDOCK_LOG_LEVEL.
void apply_env_overrides(AppConfig& cfg, const EnvLookup& getenv_fn);

} // namespace paddock

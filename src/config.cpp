#include <paddock/config.hpp>
#include <filesystem>
#include <fstream>
#include <limits>
#include "text_util.hpp"

namespace paddock {

using detail::trim;

SessionConfig SessionDefaults::config_for(SessionKind kind) const {
  SessionConfig c;
  c.ranking_mode = ranking_mode;
  if (const auto it = keys.find(kind); it != keys.end()) c.ranking_key = it->second;
  if (const auto it = scales.find(kind); it != scales.end()) c.points_scale = it->second;
  c.min_lap_ms = min_lap_ms;
  return c;
}

SessionConfig SessionDefaults::config_for_name(std::string_view session_name) const {
  return config_for(session_kind_from_name(session_name));
}

SessionDefaults default_session_defaults() {
  SessionDefaults d;
  d.keys = {
    {SessionKind::practice,   RankingKey::best_lap},
    {SessionKind::qualifying, RankingKey::best_lap},
    {SessionKind::heat,       RankingKey::laps_then_best},
    {SessionKind::prefinal,   RankingKey::laps_then_best},
    {SessionKind::final,      RankingKey::laps_then_best},
  };
  const auto race = make_points_scale("default", {25, 18, 15, 12, 10, 8, 6, 4, 2, 1});
  d.scales[SessionKind::heat] = race;
  d.scales[SessionKind::prefinal] = race;
  d.scales[SessionKind::final] = race;
  return d;
}

// "25,18,15" inline, anything else is a CSV path.
static std::optional<PointsScale> parse_points_value(std::string_view value, SessionKind kind,
                                                     const std::string& base_dir) {
  if (!value.empty() && (std::isdigit(static_cast<unsigned char>(value[0])) || value[0] == '-')) {
    std::vector<int> values;
    for (const auto& col : detail::split_csv_line(value)) {
      const auto v = detail::parse_int<int>(col);
      if (!v) return std::nullopt;
      values.push_back(*v);
    }
    return make_points_scale(to_string(kind), values);
  }
  std::filesystem::path p{std::string(value)};
  if (p.is_relative() && !base_dir.empty()) p = std::filesystem::path(base_dir) / p;
  auto scale = load_points_scale_csv(p.string());
  if (scale && scale->scheme.empty()) scale->scheme = to_string(kind);
  return scale;
}

static bool apply_key(AppConfig& cfg, const std::string& key, std::string_view value,
                      const std::string& base_dir) {
  if (key == "feed.host") {
    if (value.empty()) return false;
    cfg.feed_host = std::string(value);
    return true;
  }
  if (key == "feed.port") {
    const auto v = detail::parse_int<int>(value);
    if (!v || *v <= 0 || *v > std::numeric_limits<std::uint16_t>::max()) return false;
    cfg.feed_port = static_cast<std::uint16_t>(*v);
    return true;
  }
  if (key == "feed.max_backoff_s") {
    const auto v = detail::parse_int<int>(value);
    if (!v || *v < 1) return false;
    cfg.max_backoff_s = *v;
    return true;
  }
  if (key == "feed.max_packet_bytes") {
    const auto v = detail::parse_int<std::size_t>(value);
    if (!v || *v < 16) return false;
    cfg.max_packet_bytes = *v;
    return true;
  }
  if (key == "ranking.mode") {
    const auto m = parse_ranking_mode(value);
    if (!m) return false;
    cfg.sessions.ranking_mode = *m;
    return true;
  }
  if (key == "ranking.min_lap_ms") {
    const auto v = detail::parse_int<Millis>(value);
    if (!v || *v < 0) return false;
    cfg.sessions.min_lap_ms = *v;
    return true;
  }
  if (key.rfind("ranking.key.", 0) == 0) {
    const auto kind = parse_session_kind(std::string_view(key).substr(12));
    const auto k = parse_ranking_key(value);
    if (!kind || !k) return false;
    cfg.sessions.keys[*kind] = *k;
    return true;
  }
  if (key.rfind("points.", 0) == 0) {
    const auto kind = parse_session_kind(std::string_view(key).substr(7));
    if (!kind) return false;
    auto scale = parse_points_value(value, *kind, base_dir);
    if (!scale) return false;
    cfg.sessions.scales[*kind] = std::move(*scale);
    return true;
  }
  if (key == "publish.dir") {
    cfg.publish_dir = std::string(value);
    return true;
  }
  if (key == "log.level") {
    const auto l = parse_log_level(value);
    if (!l) return false;
    cfg.log_level = *l;
    return true;
  }
  return false;
}

AppConfig app_config_from_stream(std::istream& in, const std::string& base_dir) {
  AppConfig cfg;
  std::string line;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    std::string_view raw = trim(line);
    if (raw.empty() || raw[0] == '#') continue;
    const auto eq = raw.find('=');
    if (eq == std::string_view::npos) {
      log_warning("config line {}: expected key = value", line_no);
      continue;
    }
    const auto key = detail::lower(trim(raw.substr(0, eq)));
    const auto value = trim(raw.substr(eq + 1));
    if (!apply_key(cfg, key, value, base_dir))
      log_warning("config line {}: ignoring {} = '{}'", line_no, key, value);
  }
  return cfg;
}

std::optional<AppConfig> load_app_config(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return app_config_from_stream(f, std::filesystem::path(path).parent_path().string());
}

void apply_env_overrides(AppConfig& cfg, const EnvLookup& getenv_fn) {
  auto override_key = [&](const char* var, const char* key) {
    const char* v = getenv_fn(var);
    if (!v) return;
    if (!apply_key(cfg, key, trim(v), {}))
      log_warning("ignoring {}='{}'", var, v);
  };
  override_key("PADDOCK_FEED_HOST", "feed.host");
  override_key("PADDOCK_FEED_PORT", "feed.port");
  override_key("PADDOCK_LOG_LEVEL", "log.level");
}

} // namespace paddock

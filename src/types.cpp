#include <paddock/types.hpp>
#include <string>
#include "text_util.hpp"

namespace paddock {

using detail::lower;

const char* to_string(SessionState s) {
  switch (s) {
    case SessionState::idle:  return "idle";
    case SessionState::live:  return "live";
    case SessionState::ended: return "ended";
  }
  return "unknown";
}

const char* to_string(RankingMode m) {
  switch (m) {
    case RankingMode::time_derived:  return "time_derived";
    case RankingMode::feed_reported: return "feed_reported";
  }
  return "unknown";
}

const char* to_string(RankingKey k) {
  switch (k) {
    case RankingKey::laps_then_best:  return "laps_then_best";
    case RankingKey::laps_then_total: return "laps_then_total";
    case RankingKey::best_lap:        return "best_lap";
  }
  return "unknown";
}

const char* to_string(SessionKind k) {
  switch (k) {
    case SessionKind::practice:   return "practice";
    case SessionKind::qualifying: return "qualifying";
    case SessionKind::heat:       return "heat";
    case SessionKind::prefinal:   return "prefinal";
    case SessionKind::final:      return "final";
  }
  return "unknown";
}

std::optional<RankingMode> parse_ranking_mode(std::string_view s) {
  const auto v = lower(s);
  if (v == "time_derived" || v == "time") return RankingMode::time_derived;
  if (v == "feed_reported" || v == "feed") return RankingMode::feed_reported;
  return std::nullopt;
}

std::optional<RankingKey> parse_ranking_key(std::string_view s) {
  const auto v = lower(s);
  if (v == "laps_then_best")  return RankingKey::laps_then_best;
  if (v == "laps_then_total") return RankingKey::laps_then_total;
  if (v == "best_lap")        return RankingKey::best_lap;
  return std::nullopt;
}

std::optional<SessionKind> parse_session_kind(std::string_view s) {
  const auto v = lower(s);
  if (v == "practice")   return SessionKind::practice;
  if (v == "qualifying") return SessionKind::qualifying;
  if (v == "heat")       return SessionKind::heat;
  if (v == "prefinal")   return SessionKind::prefinal;
  if (v == "final")      return SessionKind::final;
  return std::nullopt;
}

SessionKind session_kind_from_name(std::string_view name) {
  const auto n = lower(name);
  auto has = [&](const char* token) { return n.find(token) != std::string::npos; };
  // "prefinal" contains "final": test it first.
  if (has("qual")) return SessionKind::qualifying;
  if (has("heat")) return SessionKind::heat;
  if (has("prefinal") || has("pre-final") || has("pre final")) return SessionKind::prefinal;
  if (has("final")) return SessionKind::final;
  return SessionKind::practice;
}

} // namespace paddock

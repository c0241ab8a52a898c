#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace paddock {

// Identifiers are assigned by the engine, starting at 1. Competitor ids are
// scoped to their session.
using SessionId    = std::uint32_t;
using CompetitorId = std::uint32_t;
using PenaltyId    = std::uint64_t;

// All times are integer milliseconds (lap times, race time, deltas).
using Millis = std::int64_t;

enum class SessionState : std::uint8_t { idle, live, ended };

// Which signal orders the live classification.
enum class RankingMode : std::uint8_t { time_derived, feed_reported };

// Comparator used by the time-derived ranking.
enum class RankingKey : std::uint8_t {
  laps_then_best,   // laps desc, best lap asc
  laps_then_total,  // laps desc, total elapsed asc
  best_lap          // best lap asc (practice / qualifying)
};

enum class SessionKind : std::uint8_t { practice, qualifying, heat, prefinal, final };

struct Competitor {
  CompetitorId id = 0;
  std::string number;       // kart / transponder number as shown by the feed
  std::string name;         // display name, may be empty
  std::string transponder;
};

// Append-only record of one completed lap.
struct LapRecord {
  CompetitorId competitor = 0;
  int lap = 0;
  Millis lap_time = 0;
  Millis timestamp = 0;        // session race time when the lap was completed
  std::uint64_t sequence = 0;  // arrival order within the session
  bool valid = true;

  bool operator==(const LapRecord&) const = default;
};

const char* to_string(SessionState s);
const char* to_string(RankingMode m);
const char* to_string(RankingKey k);
const char* to_string(SessionKind k);

// Case-insensitive parsers for configuration values.
std::optional<RankingMode> parse_ranking_mode(std::string_view s);
std::optional<RankingKey>  parse_ranking_key(std::string_view s);
std::optional<SessionKind> parse_session_kind(std::string_view s);

// Derive the session kind from a feed session name ("Heat 2 - Group A" -> heat).
// Defaults to practice.
SessionKind session_kind_from_name(std::string_view name);

} // namespace paddock

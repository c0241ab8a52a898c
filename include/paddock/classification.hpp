#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include <paddock/types.hpp>

namespace paddock {

// Per-competitor running totals the ranking works from.
struct Standing {
  CompetitorId competitor = 0;
  int laps = 0;                      // counted (valid) laps
  std::optional<Millis> best_lap;
  Millis best_lap_at = 0;            // timestamp of the lap that set best_lap
  Millis total_time = 0;             // sum of counted lap times
  Millis reached_at = 0;             // timestamp of reaching `laps`
  std::uint64_t reached_seq = 0;     // arrival sequence of that lap
  std::optional<int> reported_position; // latest feed-reported position

  bool operator==(const Standing&) const = default;
};

// Changes applied while tallying laps (penalty replay).
struct StandingAdjustments {
  std::set<std::pair<CompetitorId, int>> invalid_laps; // (competitor, lap number)
  std::map<CompetitorId, Millis> time_delta;           // added to best and total

  bool empty() const { return invalid_laps.empty() && time_delta.empty(); }
};

// Fold one lap into a standing. Invalid laps are ignored.
void add_lap(Standing& s, const LapRecord& lap);

// Build standings from scratch for every competitor in `competitors`
// (ids 1..N, in id order) from the first `lap_count` records of `laps`.
std::vector<Standing> tally_standings(const std::vector<Competitor>& competitors,
                                      const std::vector<LapRecord>& laps,
                                      std::size_t lap_count,
                                      const StandingAdjustments& adj = {});

// Strict weak ordering: true when `a` ranks ahead of `b`.
bool ranks_ahead(const Standing& a, const Standing& b, RankingKey key);

// Feed order first (reported position asc, unreported last), then `key`.
bool ranks_ahead_reported(const Standing& a, const Standing& b, RankingKey key);

std::vector<Standing> rank_standings(std::vector<Standing> standings, RankingMode mode, RankingKey key);

struct ClassificationRow {
  CompetitorId competitor = 0;
  std::string number;
  std::string name;
  int position = 0;
  std::optional<Millis> best_lap;
  int total_laps = 0;
  Millis total_time = 0;
  int laps_behind = 0;          // leader laps minus own laps
  std::optional<Millis> gap_ms; // to the leader, when comparable under the key

  bool operator==(const ClassificationRow&) const = default;
};

// The current, always provisional, ranked view of one session.
struct Classification {
  SessionId session = 0;
  std::uint64_t revision = 0;  // bumps on every recompute
  SessionState state = SessionState::idle;
  RankingMode mode = RankingMode::time_derived;
  RankingKey key = RankingKey::laps_then_best;
  std::vector<ClassificationRow> rows;

  const ClassificationRow* find(CompetitorId id) const;
  const ClassificationRow* find_number(const std::string& number) const;
};

// Rows for an already ordered standings list; positions 1..N.
std::vector<ClassificationRow> make_rows(const std::vector<Standing>& ordered,
                                         const std::vector<Competitor>& competitors,
                                         RankingKey key);

} // namespace paddock

#include <paddock/classification.hpp>
#include <algorithm>
#include <limits>
#include <tuple>

namespace paddock {

void add_lap(Standing& s, const LapRecord& lap) {
  if (!lap.valid) return;
  ++s.laps;
  s.total_time += lap.lap_time;
  if (!s.best_lap || lap.lap_time < *s.best_lap) {
    s.best_lap = lap.lap_time;
    s.best_lap_at = lap.timestamp;
  }
  s.reached_at = lap.timestamp;
  s.reached_seq = lap.sequence;
}

std::vector<Standing> tally_standings(const std::vector<Competitor>& competitors,
                                      const std::vector<LapRecord>& laps,
                                      std::size_t lap_count,
                                      const StandingAdjustments& adj) {
  std::vector<Standing> out(competitors.size());
  for (std::size_t i = 0; i < competitors.size(); ++i) out[i].competitor = competitors[i].id;

  const std::size_t n = std::min(lap_count, laps.size());
  for (std::size_t i = 0; i < n; ++i) {
    const auto& lap = laps[i];
    if (lap.competitor == 0 || lap.competitor > out.size()) continue;
    if (adj.invalid_laps.count({lap.competitor, lap.lap})) continue;
    add_lap(out[lap.competitor - 1], lap);
  }

  for (const auto& [id, delta] : adj.time_delta) {
    if (id == 0 || id > out.size()) continue;
    auto& s = out[id - 1];
    if (s.best_lap) *s.best_lap += delta;
    if (s.laps > 0) s.total_time += delta;
  }
  return out;
}

// Missing best laps sort last.
static inline Millis best_or_max(const Standing& s) {
  return s.best_lap ? *s.best_lap : std::numeric_limits<Millis>::max();
}

bool ranks_ahead(const Standing& a, const Standing& b, RankingKey key) {
  switch (key) {
    case RankingKey::laps_then_best:
      return std::make_tuple(-a.laps, best_or_max(a), a.reached_at, a.reached_seq, a.competitor) <
             std::make_tuple(-b.laps, best_or_max(b), b.reached_at, b.reached_seq, b.competitor);
    case RankingKey::laps_then_total:
      return std::make_tuple(-a.laps, a.total_time, a.reached_at, a.reached_seq, a.competitor) <
             std::make_tuple(-b.laps, b.total_time, b.reached_at, b.reached_seq, b.competitor);
    case RankingKey::best_lap:
      return std::make_tuple(best_or_max(a), a.best_lap_at, a.reached_seq, a.competitor) <
             std::make_tuple(best_or_max(b), b.best_lap_at, b.reached_seq, b.competitor);
  }
  return a.competitor < b.competitor;
}

bool ranks_ahead_reported(const Standing& a, const Standing& b, RankingKey key) {
  const int pa = a.reported_position.value_or(std::numeric_limits<int>::max());
  const int pb = b.reported_position.value_or(std::numeric_limits<int>::max());
  if (pa != pb) return pa < pb;
  return ranks_ahead(a, b, key);
}

std::vector<Standing> rank_standings(std::vector<Standing> standings, RankingMode mode, RankingKey key) {
  if (mode == RankingMode::feed_reported) {
    std::sort(standings.begin(), standings.end(),
              [key](const Standing& a, const Standing& b){ return ranks_ahead_reported(a, b, key); });
  } else {
    std::sort(standings.begin(), standings.end(),
              [key](const Standing& a, const Standing& b){ return ranks_ahead(a, b, key); });
  }
  return standings;
}

std::vector<ClassificationRow> make_rows(const std::vector<Standing>& ordered,
                                         const std::vector<Competitor>& competitors,
                                         RankingKey key) {
  std::vector<ClassificationRow> rows;
  rows.reserve(ordered.size());
  const Standing* leader = ordered.empty() ? nullptr : &ordered.front();

  for (std::size_t i = 0; i < ordered.size(); ++i) {
    const auto& s = ordered[i];
    ClassificationRow r;
    r.competitor = s.competitor;
    if (s.competitor >= 1 && s.competitor <= competitors.size()) {
      r.number = competitors[s.competitor - 1].number;
      r.name = competitors[s.competitor - 1].name;
    }
    r.position = static_cast<int>(i) + 1;
    r.best_lap = s.best_lap;
    r.total_laps = s.laps;
    r.total_time = s.total_time;
    r.laps_behind = leader->laps - s.laps;

    switch (key) {
      case RankingKey::laps_then_best:
        if (r.laps_behind == 0 && s.best_lap && leader->best_lap) r.gap_ms = *s.best_lap - *leader->best_lap;
        break;
      case RankingKey::laps_then_total:
        if (r.laps_behind == 0 && s.laps > 0) r.gap_ms = s.total_time - leader->total_time;
        break;
      case RankingKey::best_lap:
        if (s.best_lap && leader->best_lap) r.gap_ms = *s.best_lap - *leader->best_lap;
        break;
    }
    rows.push_back(std::move(r));
  }
  return rows;
}

const ClassificationRow* Classification::find(CompetitorId id) const {
  const auto it = std::find_if(rows.begin(), rows.end(), [&](const ClassificationRow& r){ return r.competitor == id; });
  return it == rows.end() ? nullptr : &*it;
}

const ClassificationRow* Classification::find_number(const std::string& number) const {
  const auto it = std::find_if(rows.begin(), rows.end(), [&](const ClassificationRow& r){ return r.number == number; });
  return it == rows.end() ? nullptr : &*it;
}

} // namespace paddock

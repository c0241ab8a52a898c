#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <paddock/classification.hpp>
#include <paddock/penalty.hpp>
#include <paddock/types.hpp>

namespace paddock {

enum class Basis : std::uint8_t { provisional, official };
enum class ResultStatus : std::uint8_t { classified, disqualified };

const char* to_string(Basis b);
const char* to_string(ResultStatus s);

struct ResultEntry {
  CompetitorId competitor = 0;
  std::string number;
  std::string name;
  int position = 0;
  bool points_eligible = false;
  ResultStatus status = ResultStatus::classified;
  std::optional<Millis> best_lap;  // effective, after penalties
  int total_laps = 0;
  Millis total_time = 0;

  bool operator==(const ResultEntry&) const = default;
};

// Immutable unit of publication.
struct ResultSnapshot {
  SessionId session = 0;
  Basis basis = Basis::official;
  std::uint32_t version = 0;  // 1.. per session
  std::vector<ResultEntry> entries;
  std::chrono::system_clock::time_point created_at{};
  std::size_t competitor_watermark = 0;  // competitors registered at capture
  std::size_t lap_watermark = 0;         // lap records the snapshot was built from
  std::size_t report_watermark = 0;      // feed position reports seen
  std::size_t penalty_watermark = 0;     // ledger entries applied

  const ResultEntry* find(CompetitorId id) const;
  const ResultEntry* find_number(const std::string& number) const;
};

// One `$G` running-order report, kept in arrival order.
struct PositionReport {
  CompetitorId competitor = 0;
  int position = 0;

  bool operator==(const PositionReport&) const = default;
};

// Everything a replay needs, captured at one instant.
struct OfficialInputs {
  SessionId session = 0;
  RankingMode mode = RankingMode::time_derived;
  RankingKey key = RankingKey::laps_then_best;
  std::vector<Competitor> competitors;         // ids 1..N in order
  std::vector<LapRecord> laps;                 // arrival order
  std::vector<PositionReport> reports;         // arrival order, latest per competitor wins
  std::vector<PenaltyRecord> penalties;        // ledger order
};

// Replay the ledger against the raw laps and produce the candidate order.
// Pure: the same inputs always give the same entries.
std::vector<ResultEntry> apply_penalties(const OfficialInputs& in);

// Candidate order tagged as an official snapshot of `version`.
ResultSnapshot make_official_snapshot(const OfficialInputs& in, std::uint32_t version);

// The prefix of `in` that `snap` was built from. Later competitors, laps,
// reports and ledger entries are dropped.
OfficialInputs inputs_at(OfficialInputs in, const ResultSnapshot& snap);

// Classification content equality (ignores creation time).
bool same_classification(const ResultSnapshot& a, const ResultSnapshot& b);

} // namespace paddock

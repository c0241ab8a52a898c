#include <paddock/official.hpp>
#include <algorithm>
#include <map>
#include <variant>
#include "text_util.hpp"

namespace paddock {


const char* to_string(Basis b) {
  return b == Basis::official ? "official" : "provisional";
}

const char* to_string(ResultStatus s) {
  return s == ResultStatus::disqualified ? "DQ" : "classified";
}

const ResultEntry* ResultSnapshot::find(CompetitorId id) const {
  const auto it = std::find_if(entries.begin(), entries.end(), [&](const ResultEntry& e){ return e.competitor == id; });
  return it == entries.end() ? nullptr : &*it;
}

const ResultEntry* ResultSnapshot::find_number(const std::string& number) const {
  const auto it = std::find_if(entries.begin(), entries.end(), [&](const ResultEntry& e){ return e.number == number; });
  return it == entries.end() ? nullptr : &*it;
}

namespace {

struct LedgerSummary {
  StandingAdjustments adj;
  std::vector<CompetitorId> disqualified;              // first DQ submission order
  std::vector<std::pair<CompetitorId, int>> offsets;   // first adjust order, summed offset
  bool time_basis_changed = false;
};

LedgerSummary summarize(const std::vector<PenaltyRecord>& penalties) {
  LedgerSummary s;
  for (const auto& p : penalties) {
    const auto id = p.competitor;
    std::visit(detail::overloaded{
      [&](const Disqualify&) {
        if (std::find(s.disqualified.begin(), s.disqualified.end(), id) == s.disqualified.end())
          s.disqualified.push_back(id);
      },
      [&](const PositionAdjust& a) {
        auto it = std::find_if(s.offsets.begin(), s.offsets.end(), [&](const auto& o){ return o.first == id; });
        if (it == s.offsets.end()) s.offsets.emplace_back(id, a.offset);
        else it->second += a.offset;
      },
      [&](const TimeAdjust& a) {
        s.adj.time_delta[id] += a.delta;
        s.time_basis_changed = true;
      },
      [&](const InvalidateLap& a) {
        s.adj.invalid_laps.insert({id, a.lap});
        s.time_basis_changed = true;
      },
    }, p.params);
  }
  return s;
}

} // namespace

std::vector<ResultEntry> apply_penalties(const OfficialInputs& in) {
  const auto summary = summarize(in.penalties);

  auto standings = tally_standings(in.competitors, in.laps, in.laps.size(), summary.adj);
  for (const auto& r : in.reports) {
    if (r.competitor >= 1 && r.competitor <= standings.size()) standings[r.competitor - 1].reported_position = r.position;
  }

  // Feed-reported sessions keep the feed order unless the time basis changed.
  const auto mode = (in.mode == RankingMode::feed_reported && !summary.time_basis_changed)
                      ? RankingMode::feed_reported : RankingMode::time_derived;
  auto ordered = rank_standings(std::move(standings), mode, in.key);

  auto is_dq = [&](CompetitorId id) {
    return std::find(summary.disqualified.begin(), summary.disqualified.end(), id) != summary.disqualified.end();
  };

  std::vector<const Standing*> classified;
  std::map<CompetitorId, const Standing*> by_id;
  for (const auto& st : ordered) {
    by_id[st.competitor] = &st;
    if (!is_dq(st.competitor)) classified.push_back(&st);
  }

  // Position adjustments come last, after DQ removal; clamped to the field.
  for (const auto& adjust : summary.offsets) {
    const auto id = adjust.first;
    const auto offset = adjust.second;
    if (offset == 0 || is_dq(id)) continue;
    auto it = std::find_if(classified.begin(), classified.end(), [&](const Standing* s){ return s->competitor == id; });
    if (it == classified.end()) continue;
    const auto idx = static_cast<long>(it - classified.begin());
    const Standing* moved = *it;
    classified.erase(it);
    const long target = std::clamp(idx + offset, 0L, static_cast<long>(classified.size()));
    classified.insert(classified.begin() + target, moved);
  }

  auto make_entry = [&](const Standing& st, int position, ResultStatus status) {
    ResultEntry e;
    e.competitor = st.competitor;
    if (st.competitor >= 1 && st.competitor <= in.competitors.size()) {
      e.number = in.competitors[st.competitor - 1].number;
      e.name = in.competitors[st.competitor - 1].name;
    }
    e.position = position;
    e.status = status;
    e.points_eligible = status == ResultStatus::classified && st.laps > 0;
    e.best_lap = st.best_lap;
    e.total_laps = st.laps;
    e.total_time = st.total_time;
    return e;
  };

  std::vector<ResultEntry> out;
  out.reserve(ordered.size());
  int position = 0;
  for (const auto* st : classified) out.push_back(make_entry(*st, ++position, ResultStatus::classified));
  for (const auto id : summary.disqualified) {
    const auto it = by_id.find(id);
    if (it == by_id.end()) continue;
    out.push_back(make_entry(*it->second, ++position, ResultStatus::disqualified));
  }
  return out;
}

ResultSnapshot make_official_snapshot(const OfficialInputs& in, std::uint32_t version) {
  ResultSnapshot snap;
  snap.session = in.session;
  snap.basis = Basis::official;
  snap.version = version;
  snap.entries = apply_penalties(in);
  snap.created_at = std::chrono::system_clock::now();
  snap.competitor_watermark = in.competitors.size();
  snap.lap_watermark = in.laps.size();
  snap.report_watermark = in.reports.size();
  snap.penalty_watermark = in.penalties.size();
  return snap;
}

OfficialInputs inputs_at(OfficialInputs in, const ResultSnapshot& snap) {
  if (in.competitors.size() > snap.competitor_watermark) in.competitors.resize(snap.competitor_watermark);
  if (in.laps.size() > snap.lap_watermark) in.laps.resize(snap.lap_watermark);
  if (in.reports.size() > snap.report_watermark) in.reports.resize(snap.report_watermark);
  if (in.penalties.size() > snap.penalty_watermark) in.penalties.resize(snap.penalty_watermark);
  return in;
}

bool same_classification(const ResultSnapshot& a, const ResultSnapshot& b) {
  return a.session == b.session && a.basis == b.basis && a.version == b.version && a.entries == b.entries;
}

} // namespace paddock

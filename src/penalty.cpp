#include <paddock/penalty.hpp>
#include <algorithm>
#include <fmt/format.h>
#include <paddock/feed.hpp> // format_lap_time
#include "text_util.hpp"

namespace paddock {

const char* to_string(PenaltyKind k) {
  switch (k) {
    case PenaltyKind::disqualify:      return "disqualify";
    case PenaltyKind::position_adjust: return "position_adjust";
    case PenaltyKind::time_adjust:     return "time_adjust";
    case PenaltyKind::invalidate_lap:  return "invalidate_lap";
  }
  return "unknown";
}

Result<void> validate_penalty(const PenaltyParams& params, std::string_view author) {
  if (detail::trim(author).empty()) return errc::invalid_penalty_params;
  const bool ok = std::visit(detail::overloaded{
    [](const Disqualify&)        { return true; },
    [](const PositionAdjust& p)  { return p.offset != 0; },
    [](const TimeAdjust& p)      { return p.delta != 0; },
    [](const InvalidateLap& p)   { return p.lap >= 1; },
  }, params);
  if (!ok) return errc::invalid_penalty_params;
  return outcome::success();
}

std::string describe(const PenaltyParams& params) {
  return std::visit(detail::overloaded{
    [](const Disqualify&)       { return std::string("disqualify"); },
    [](const PositionAdjust& p) { return fmt::format("position_adjust {:+d}", p.offset); },
    [](const TimeAdjust& p)     { return fmt::format("time_adjust {}{}s", p.delta < 0 ? "" : "+", format_lap_time(p.delta)); },
    [](const InvalidateLap& p)  { return fmt::format("invalidate_lap {}", p.lap); },
  }, params);
}

PenaltyId PenaltyLedger::append(SessionId session, CompetitorId competitor, PenaltyParams params, std::string author) {
  std::lock_guard lock(mutex_);
  PenaltyRecord r;
  r.id = entries_.size() + 1;
  r.session = session;
  r.competitor = competitor;
  r.params = std::move(params);
  r.submitted_at = std::chrono::system_clock::now();
  r.author = std::move(author);
  entries_.push_back(std::move(r));
  return entries_.back().id;
}

std::vector<PenaltyRecord> PenaltyLedger::entries() const {
  std::lock_guard lock(mutex_);
  return entries_;
}

std::vector<PenaltyRecord> PenaltyLedger::prefix(std::size_t n) const {
  std::lock_guard lock(mutex_);
  n = std::min(n, entries_.size());
  return {entries_.begin(), entries_.begin() + static_cast<std::ptrdiff_t>(n)};
}

std::size_t PenaltyLedger::size() const {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

} // namespace paddock

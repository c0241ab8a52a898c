#include <paddock/provisional.hpp>
#include <paddock/log.hpp>
#include <mutex>

namespace paddock {

LiveSession::LiveSession(SessionId id, std::string name, SessionConfig config)
  : id_(id), name_(std::move(name)), config_(std::move(config)) {
  std::unique_lock lock(mutex_);
  recompute_();
}

CompetitorId LiveSession::ensure_competitor_(const std::string& number) {
  if (const auto it = by_number_.find(number); it != by_number_.end()) return it->second;
  const auto id = static_cast<CompetitorId>(competitors_.size() + 1);
  competitors_.push_back(Competitor{.id = id, .number = number, .name = {}, .transponder = {}});
  by_number_.emplace(number, id);
  lap_numbers_.emplace_back();
  standings_.push_back(Standing{.competitor = id});
  reported_.emplace_back();
  last_timestamp_.push_back(0);
  return id;
}

CompetitorId LiveSession::register_competitor(const std::string& number, const std::string& name,
                                              const std::string& transponder) {
  std::unique_lock lock(mutex_);
  const auto before = competitors_.size();
  const auto id = ensure_competitor_(number);
  auto& c = competitors_[id - 1];
  bool changed = competitors_.size() != before;
  if (c.name.empty() && !name.empty()) {
    c.name = name;
    changed = true;
  }
  if (c.transponder.empty() && !transponder.empty()) c.transponder = transponder;
  if (changed) recompute_();
  return id;
}

LapOutcome LiveSession::record_lap(const std::string& number, int lap, Millis lap_time,
                                   std::optional<Millis> race_time) {
  std::unique_lock lock(mutex_);
  const auto id = ensure_competitor_(number);
  auto& seen = lap_numbers_[id - 1];
  if (lap <= 0) lap = seen.empty() ? 1 : *seen.rbegin() + 1;
  if (seen.count(lap)) {
    ++duplicates_;
    log_debug("session {}: duplicate lap {} for #{}", name_, lap, number);
    return LapOutcome::duplicate;
  }

  LapRecord rec;
  rec.competitor = id;
  rec.lap = lap;
  rec.lap_time = lap_time;
  rec.timestamp = race_time.value_or(last_timestamp_[id - 1]);
  rec.sequence = ++next_sequence_;
  rec.valid = lap_time > 0 && lap_time >= config_.min_lap_ms;

  seen.insert(lap);
  last_timestamp_[id - 1] = rec.timestamp;
  laps_.push_back(rec);
  add_lap(standings_[id - 1], rec);
  recompute_();
  return rec.valid ? LapOutcome::recorded : LapOutcome::recorded_invalid;
}

void LiveSession::report_position(const std::string& number, int position) {
  std::unique_lock lock(mutex_);
  const auto before = competitors_.size();
  const auto id = ensure_competitor_(number);
  auto& slot = reported_[id - 1];
  const bool moved = slot != position;
  slot = position;
  if (moved) reports_.push_back(PositionReport{id, position});
  standings_[id - 1].reported_position = position;
  // Time-derived sessions only keep the report for the record.
  if ((moved && config_.ranking_mode == RankingMode::feed_reported) || competitors_.size() != before)
    recompute_();
}

void LiveSession::change_state(SessionState state) {
  std::unique_lock lock(mutex_);
  if (state_.exchange(state, std::memory_order_acq_rel) == state) return;
  log_info("session {}: {}", name_, to_string(state));
  auto prev = cell_.load();
  auto next = std::make_shared<Classification>(*prev);
  next->state = state;
  cell_.publish(std::move(next));
}

void LiveSession::recompute_() {
  auto ordered = rank_standings(standings_, config_.ranking_mode, config_.ranking_key);
  auto c = std::make_shared<Classification>();
  c->session = id_;
  c->revision = ++revision_;
  c->state = state_.load(std::memory_order_acquire);
  c->mode = config_.ranking_mode;
  c->key = config_.ranking_key;
  c->rows = make_rows(ordered, competitors_, config_.ranking_key);
  cell_.publish(std::move(c));
}

OfficialInputs LiveSession::capture() const {
  std::shared_lock lock(mutex_);
  OfficialInputs in;
  in.session = id_;
  in.mode = config_.ranking_mode;
  in.key = config_.ranking_key;
  in.competitors = competitors_;
  in.laps = laps_;
  in.reports = reports_;
  return in;
}

std::optional<Competitor> LiveSession::find_competitor(CompetitorId id) const {
  std::shared_lock lock(mutex_);
  if (id == 0 || id > competitors_.size()) return std::nullopt;
  return competitors_[id - 1];
}

std::optional<CompetitorId> LiveSession::find_number(const std::string& number) const {
  std::shared_lock lock(mutex_);
  const auto it = by_number_.find(number);
  if (it == by_number_.end()) return std::nullopt;
  return it->second;
}

bool LiveSession::has_lap(CompetitorId id, int lap) const {
  std::shared_lock lock(mutex_);
  if (id == 0 || id > lap_numbers_.size()) return false;
  return lap_numbers_[id - 1].count(lap) > 0;
}

std::size_t LiveSession::lap_count() const {
  std::shared_lock lock(mutex_);
  return laps_.size();
}

std::vector<LapRecord> LiveSession::laps() const {
  std::shared_lock lock(mutex_);
  return laps_;
}

std::uint64_t LiveSession::duplicate_laps() const {
  std::shared_lock lock(mutex_);
  return duplicates_;
}

} // namespace paddock

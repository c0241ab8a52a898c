#include <paddock/engine.hpp>
#include <paddock/log.hpp>
#include <variant>
#include "text_util.hpp"

namespace paddock {

ResultsEngine::ResultsEngine(SessionDefaults defaults) : defaults_(std::move(defaults)) {}

ResultsEngine::SessionSlot* ResultsEngine::slot_(SessionId session) const {
  std::shared_lock lock(registry_mutex_);
  const auto it = slots_.find(session);
  return it == slots_.end() ? nullptr : it->second.get();
}

Result<ResultsEngine::SessionSlot*> ResultsEngine::insert_slot_(const std::string& name, SessionConfig config) {
  std::unique_lock lock(registry_mutex_);
  if (by_name_.count(name)) return errc::session_exists;
  const auto id = static_cast<SessionId>(slots_.size() + 1);
  auto slot = std::make_unique<SessionSlot>(id, name, std::move(config));
  auto* raw = slot.get();
  slots_.emplace(id, std::move(slot));
  by_name_.emplace(name, id);
  log_info("session {} '{}' created ({}, {})", id, name,
           to_string(raw->live.config().ranking_mode), to_string(raw->live.config().ranking_key));
  return raw;
}

ResultsEngine::SessionSlot& ResultsEngine::ensure_slot_(const std::string& name) {
  {
    std::shared_lock lock(registry_mutex_);
    if (const auto it = by_name_.find(name); it != by_name_.end()) return *slots_.at(it->second);
  }
  if (auto r = insert_slot_(name, defaults_.config_for_name(name))) return *r.value();
  // Lost a creation race to another writer.
  std::shared_lock lock(registry_mutex_);
  return *slots_.at(by_name_.at(name));
}

Result<SessionId> ResultsEngine::create_session(const std::string& name, SessionConfig config) {
  auto r = insert_slot_(name, std::move(config));
  if (!r) return r.error();
  return r.value()->live.id();
}

std::optional<SessionId> ResultsEngine::find_session(const std::string& name) const {
  std::shared_lock lock(registry_mutex_);
  const auto it = by_name_.find(name);
  if (it == by_name_.end()) return std::nullopt;
  return it->second;
}

std::vector<SessionInfo> ResultsEngine::sessions() const {
  std::shared_lock lock(registry_mutex_);
  std::vector<SessionInfo> out;
  out.reserve(slots_.size());
  for (const auto& [id, slot] : slots_) {
    SessionInfo info;
    info.id = id;
    info.name = slot->live.name();
    info.kind = slot->live.kind();
    info.state = slot->live.state();
    info.laps = slot->live.lap_count();
    info.penalties = slot->ledger.size();
    {
      std::shared_lock h(slot->history_mutex);
      info.latest_version = static_cast<std::uint32_t>(slot->history.size());
    }
    out.push_back(std::move(info));
  }
  return out;
}


void ResultsEngine::on_event(const FeedEvent& ev) {
  ++events_;
  auto& live = ensure_slot_(ev.session).live;
  std::visit(detail::overloaded{
    [&](const SessionAnnounced&) {},
    [&](const CompetitorRegistered& e) { live.register_competitor(e.number, e.name, e.transponder); },
    [&](const LapCompleted& e) {
      if (live.record_lap(e.number, e.lap, e.lap_time, e.race_time) == LapOutcome::recorded_invalid)
        log_debug("session {}: #{} lap {} ({}) below minimum, not counted",
                  live.name(), e.number, e.lap, format_lap_time(e.lap_time));
    },
    [&](const PositionChanged& e) { live.report_position(e.number, e.position); },
    [&](const SessionStateChanged& e) { live.change_state(e.state); },
  }, ev.payload);
}

LiveSession* ResultsEngine::live(SessionId session) {
  auto* slot = slot_(session);
  return slot ? &slot->live : nullptr;
}

const LiveSession* ResultsEngine::live(SessionId session) const {
  auto* slot = slot_(session);
  return slot ? &slot->live : nullptr;
}

Result<std::shared_ptr<const Classification>> ResultsEngine::get_provisional(SessionId session) const {
  auto* slot = slot_(session);
  if (!slot) return errc::unknown_session;
  return slot->live.current();
}

Result<std::vector<ResultEntry>> ResultsEngine::preview_official(SessionId session) const {
  auto* slot = slot_(session);
  if (!slot) return errc::unknown_session;
  auto in = slot->live.capture();
  in.penalties = slot->ledger.entries();
  return apply_penalties(in);
}

std::optional<ResultsEngine::Publication> ResultsEngine::publication_(const SessionSlot& slot,
                                                                      std::optional<std::uint32_t> version) const {
  std::shared_lock lock(slot.history_mutex);
  if (slot.history.empty()) return std::nullopt;
  if (!version) return slot.history.back();
  if (*version == 0 || *version > slot.history.size()) return std::nullopt;
  return slot.history[*version - 1];
}

Result<std::shared_ptr<const ResultSnapshot>> ResultsEngine::get_official(SessionId session,
                                                                          std::optional<std::uint32_t> version) const {
  auto* slot = slot_(session);
  if (!slot) return errc::unknown_session;
  auto pub = publication_(*slot, version);
  if (!pub) return version ? errc::unknown_version : errc::no_official_result;
  return pub->snapshot;
}

Result<ResultSnapshot> ResultsEngine::replay_official(SessionId session,
                                                      std::optional<std::uint32_t> version) const {
  auto* slot = slot_(session);
  if (!slot) return errc::unknown_session;
  auto pub = publication_(*slot, version);
  if (!pub) return version ? errc::unknown_version : errc::no_official_result;
  auto in = slot->live.capture();
  in.penalties = slot->ledger.entries();
  return make_official_snapshot(inputs_at(std::move(in), *pub->snapshot), pub->snapshot->version);
}

Result<PointsTable> ResultsEngine::get_points(SessionId session, std::optional<std::uint32_t> version) const {
  auto* slot = slot_(session);
  if (!slot) return errc::unknown_session;
  auto pub = publication_(*slot, version);
  if (!pub) return version ? errc::unknown_version : errc::no_official_result;
  return pub->points;
}

Result<std::vector<PenaltyRecord>> ResultsEngine::ledger(SessionId session) const {
  auto* slot = slot_(session);
  if (!slot) return errc::unknown_session;
  return slot->ledger.entries();
}

Result<Competitor> ResultsEngine::find_competitor(SessionId session, CompetitorId competitor) const {
  auto* slot = slot_(session);
  if (!slot) return errc::unknown_session;
  auto c = slot->live.find_competitor(competitor);
  if (!c) return errc::unknown_competitor;
  return *c;
}

Result<PenaltyId> ResultsEngine::submit_penalty(SessionId session, CompetitorId competitor,
                                                PenaltyParams params, std::string author) {
  auto* slot = slot_(session);
  if (!slot) return errc::unknown_session;
  if (!slot->live.find_competitor(competitor)) return errc::unknown_competitor;
  if (auto ok = validate_penalty(params, author); !ok) return ok.error();
  if (const auto* inv = std::get_if<InvalidateLap>(&params); inv && !slot->live.has_lap(competitor, inv->lap))
    return errc::invalid_penalty_params;

  const auto text = describe(params);
  const auto id = slot->ledger.append(session, competitor, std::move(params), author);
  ++penalties_;
  log_info("session {}: penalty {} on competitor {}: {} by {}", slot->live.name(), id, competitor, text, author);
  return id;
}

Result<std::shared_ptr<const ResultSnapshot>> ResultsEngine::publish_official(SessionId session) {
  auto* slot = slot_(session);
  if (!slot) return errc::unknown_session;

  std::unique_lock publishing(slot->publish_mutex, std::try_to_lock);
  if (!publishing.owns_lock()) return errc::concurrent_publish;

  auto in = slot->live.capture();
  if (in.laps.empty()) return errc::no_provisional_data;
  in.penalties = slot->ledger.entries();

  std::uint32_t version = 0;
  {
    std::shared_lock lock(slot->history_mutex);
    version = static_cast<std::uint32_t>(slot->history.size()) + 1;
  }

  auto snapshot = std::make_shared<const ResultSnapshot>(make_official_snapshot(in, version));
  auto points = compute_points(*snapshot, slot->live.config().points_scale);
  {
    std::unique_lock lock(slot->history_mutex);
    slot->history.push_back(Publication{snapshot, points});
  }
  ++publications_;
  log_info("session {} '{}': official v{} ({} entries, {} penalties)", session, slot->live.name(),
           version, snapshot->entries.size(), snapshot->penalty_watermark);

  deliver_(PublishedUnit{session, slot->live.name(), version, snapshot, std::move(points)});
  return snapshot;
}

void ResultsEngine::deliver_(const PublishedUnit& unit) {
  std::vector<std::shared_ptr<PublicationSink>> sinks;
  {
    std::lock_guard lock(sinks_mutex_);
    sinks = sinks_;
  }
  for (const auto& sink : sinks) {
    try {
      sink->on_published(unit);
    } catch (const std::exception& e) {
      log_error("sink failed for {} v{}: {}", unit.session_name, unit.version, e.what());
    }
  }
}

Result<std::vector<GridEntry>> ResultsEngine::build_grid(const std::vector<SessionId>& heats,
                                                         std::optional<SessionId> qualifying,
                                                         const PointsScale& scale) const {
  std::vector<ResultSnapshot> heat_snaps;
  heat_snaps.reserve(heats.size());
  for (const auto id : heats) {
    auto snap = get_official(id);
    if (!snap) return snap.error() == errc::unknown_session ? snap.error() : make_error_code(errc::no_official_result);
    heat_snaps.push_back(*snap.value());
  }
  std::shared_ptr<const ResultSnapshot> qual;
  if (qualifying) {
    auto snap = get_official(*qualifying);
    if (!snap) return snap.error() == errc::unknown_session ? snap.error() : make_error_code(errc::no_official_result);
    qual = snap.value();
  }
  return build_prefinal_grid(heat_snaps, qual.get(), scale);
}

void ResultsEngine::subscribe(std::shared_ptr<PublicationSink> sink) {
  std::lock_guard lock(sinks_mutex_);
  sinks_.push_back(std::move(sink));
}

EngineStats ResultsEngine::stats() const {
  EngineStats s;
  s.events = events_.load();
  {
    std::shared_lock lock(registry_mutex_);
    s.sessions = slots_.size();
  }
  s.penalties = penalties_.load();
  s.publications = publications_.load();
  return s;
}

} // namespace paddock

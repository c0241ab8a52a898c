#pragma once
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include <paddock/config.hpp>
#include <paddock/error.hpp>
#include <paddock/feed.hpp>
#include <paddock/official.hpp>
#include <paddock/penalty.hpp>
#include <paddock/points.hpp>
#include <paddock/provisional.hpp>
#include <paddock/publish.hpp>

namespace paddock {

struct SessionInfo {
  SessionId id = 0;
  std::string name;
  SessionKind kind = SessionKind::practice;
  SessionState state = SessionState::idle;
  std::size_t laps = 0;
  std::size_t penalties = 0;
  std::uint32_t latest_version = 0;  // 0: nothing published yet
};

struct EngineStats {
  std::uint64_t events = 0;
  std::uint64_t sessions = 0;
  std::uint64_t penalties = 0;
  std::uint64_t publications = 0;
};

// Session registry plus the query and mutation boundary. Sessions are never
// removed, so references handed out by live() stay valid for the engine's
// lifetime.
class ResultsEngine {
public:
  explicit ResultsEngine(SessionDefaults defaults = default_session_defaults());
  ResultsEngine(const ResultsEngine&) = delete;
  ResultsEngine& operator=(const ResultsEngine&) = delete;

  // errc::session_exists if the name is taken.
  Result<SessionId> create_session(const std::string& name, SessionConfig config);
  std::optional<SessionId> find_session(const std::string& name) const;
  std::vector<SessionInfo> sessions() const;

  // Ingest boundary. Sessions named by the feed are created on first sight
  // with the defaults for their kind.
  void on_event(const FeedEvent& ev);

  LiveSession* live(SessionId session);
  const LiveSession* live(SessionId session) const;

  // Queries
  Result<std::shared_ptr<const Classification>> get_provisional(SessionId session) const;
  Result<std::vector<ResultEntry>> preview_official(SessionId session) const;
  Result<std::shared_ptr<const ResultSnapshot>> get_official(SessionId session,
                                                             std::optional<std::uint32_t> version = std::nullopt) const;
  // Rebuilds a published version from the raw history up to its watermarks.
  Result<ResultSnapshot> replay_official(SessionId session,
                                         std::optional<std::uint32_t> version = std::nullopt) const;
  Result<PointsTable> get_points(SessionId session, std::optional<std::uint32_t> version = std::nullopt) const;
  Result<std::vector<PenaltyRecord>> ledger(SessionId session) const;
  Result<Competitor> find_competitor(SessionId session, CompetitorId competitor) const;

  // Mutations
  Result<PenaltyId> submit_penalty(SessionId session, CompetitorId competitor,
                                   PenaltyParams params, std::string author);
  Result<std::shared_ptr<const ResultSnapshot>> publish_official(SessionId session);

  // Grid from the latest official snapshot of each heat (and qualifying).
  Result<std::vector<GridEntry>> build_grid(const std::vector<SessionId>& heats,
                                            std::optional<SessionId> qualifying,
                                            const PointsScale& scale) const;

  void subscribe(std::shared_ptr<PublicationSink> sink);

  EngineStats stats() const;

private:
  struct Publication {
    std::shared_ptr<const ResultSnapshot> snapshot;
    PointsTable points;
  };

  struct SessionSlot {
    SessionSlot(SessionId id, std::string name, SessionConfig config)
      : live(id, std::move(name), std::move(config)) {}

    LiveSession live;
    PenaltyLedger ledger;
    std::mutex publish_mutex;  // one publish_official in flight per session
    mutable std::shared_mutex history_mutex;
    std::vector<Publication> history;  // index = version - 1
  };

  SessionSlot* slot_(SessionId session) const;
  SessionSlot& ensure_slot_(const std::string& name);
  Result<SessionSlot*> insert_slot_(const std::string& name, SessionConfig config);
  std::optional<Publication> publication_(const SessionSlot& slot, std::optional<std::uint32_t> version) const;
  void deliver_(const PublishedUnit& unit);

  SessionDefaults defaults_;

  mutable std::shared_mutex registry_mutex_;
  std::map<SessionId, std::unique_ptr<SessionSlot>> slots_;
  std::map<std::string, SessionId> by_name_;

  std::mutex sinks_mutex_;
  std::vector<std::shared_ptr<PublicationSink>> sinks_;

  std::atomic<std::uint64_t> events_{0};
  std::atomic<std::uint64_t> penalties_{0};
  std::atomic<std::uint64_t> publications_{0};
};

} // namespace paddock

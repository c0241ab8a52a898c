#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <paddock/classification.hpp>
#include <paddock/config.hpp>
#include <paddock/official.hpp>
#include <paddock/snapshot_cell.hpp>
#include <paddock/types.hpp>

namespace paddock {

enum class LapOutcome : std::uint8_t {
  recorded,
  recorded_invalid,  // kept in the history, not counted (below min_lap_ms)
  duplicate          // lap number already recorded, dropped
};

// The live state of one session: raw competitors and laps plus the current
// provisional classification. Writers (the feed path) take an exclusive lock
// and publish a freshly built Classification into the cell; readers never see
// a classification that is still being assembled.
class LiveSession {
public:
  LiveSession(SessionId id, std::string name, SessionConfig config);

  SessionId id() const { return id_; }
  const std::string& name() const { return name_; }
  const SessionConfig& config() const { return config_; }
  SessionKind kind() const { return session_kind_from_name(name_); }

  // Returns the competitor id; an existing empty name is filled once.
  CompetitorId register_competitor(const std::string& number, const std::string& name,
                                   const std::string& transponder = {});

  // lap == 0 means the competitor's next lap. Unknown numbers are auto-registered.
  LapOutcome record_lap(const std::string& number, int lap, Millis lap_time,
                        std::optional<Millis> race_time = std::nullopt);

  void report_position(const std::string& number, int position);

  // No recompute; the current rows are republished with the new state.
  void change_state(SessionState state);
  SessionState state() const { return state_.load(std::memory_order_acquire); }

  std::shared_ptr<const Classification> current() const { return cell_.load(); }
  bool try_consume_latest(std::uint64_t& cursor, std::shared_ptr<const Classification>& out) const {
    return cell_.try_consume_latest(cursor, out);
  }

  // Consistent copy of everything an official replay needs.
  OfficialInputs capture() const;

  std::optional<Competitor> find_competitor(CompetitorId id) const;
  std::optional<CompetitorId> find_number(const std::string& number) const;
  bool has_lap(CompetitorId id, int lap) const;
  std::size_t lap_count() const;
  std::vector<LapRecord> laps() const;
  std::uint64_t duplicate_laps() const;

private:
  CompetitorId ensure_competitor_(const std::string& number);
  void recompute_();

  const SessionId id_;
  const std::string name_;
  const SessionConfig config_;

  mutable std::shared_mutex mutex_;
  std::vector<Competitor> competitors_;  // index = id - 1
  std::unordered_map<std::string, CompetitorId> by_number_;
  std::vector<LapRecord> laps_;
  std::vector<std::set<int>> lap_numbers_;  // recorded lap numbers per competitor
  std::vector<Standing> standings_;         // per competitor, updated incrementally
  std::vector<std::optional<int>> reported_;  // latest report per competitor
  std::vector<PositionReport> reports_;       // every change, arrival order
  std::vector<Millis> last_timestamp_;
  std::uint64_t next_sequence_ = 0;
  std::uint64_t revision_ = 0;
  std::uint64_t duplicates_ = 0;

  std::atomic<SessionState> state_{SessionState::idle};
  SnapshotCell<Classification> cell_;
};

} // namespace paddock

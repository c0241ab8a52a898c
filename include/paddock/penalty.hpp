#pragma once
#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <paddock/error.hpp>
#include <paddock/types.hpp>

namespace paddock {

// Removes the competitor from scored positions.
struct Disqualify {
  bool operator==(const Disqualify&) const = default;
};

// Shift of the final position; positive moves the competitor back.
struct PositionAdjust {
  int offset = 0;
  bool operator==(const PositionAdjust&) const = default;
};

// Added to the competitor's best-lap and total-time basis.
struct TimeAdjust {
  Millis delta = 0;
  bool operator==(const TimeAdjust&) const = default;
};

// Excludes one lap from best-lap and lap-count computation.
struct InvalidateLap {
  int lap = 0;
  bool operator==(const InvalidateLap&) const = default;
};

using PenaltyParams = std::variant<Disqualify, PositionAdjust, TimeAdjust, InvalidateLap>;

enum class PenaltyKind : std::uint8_t { disqualify, position_adjust, time_adjust, invalidate_lap };

inline PenaltyKind kind_of(const PenaltyParams& p) { return static_cast<PenaltyKind>(p.index()); }
const char* to_string(PenaltyKind k);

struct PenaltyRecord {
  PenaltyId id = 0;  // 1-based position in the session ledger
  SessionId session = 0;
  CompetitorId competitor = 0;
  PenaltyParams params;
  std::chrono::system_clock::time_point submitted_at{};
  std::string author;
};

// Shape checks that do not need session data.
Result<void> validate_penalty(const PenaltyParams& params, std::string_view author);

// Human readable form, e.g. "time_adjust +1.000s".
std::string describe(const PenaltyParams& params);

// Append-only, per-session ledger. Entries are never edited; a correction is a
// new entry. Append order is the replay order.
class PenaltyLedger {
public:
  PenaltyId append(SessionId session, CompetitorId competitor, PenaltyParams params, std::string author);

  std::vector<PenaltyRecord> entries() const;
  std::vector<PenaltyRecord> prefix(std::size_t n) const;
  std::size_t size() const;

private:
  mutable std::mutex mutex_;
  std::vector<PenaltyRecord> entries_;
};

} // namespace paddock

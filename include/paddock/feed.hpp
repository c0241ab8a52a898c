#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>
#include <paddock/types.hpp>

namespace paddock {

// ---- Decoded timing events -------------------------------------------------

// `$B`: the feed switched to a (possibly new) session.
struct SessionAnnounced {
  std::string feed_id;  // upstream run id, may be empty
};

// `$A` / `$COMP`: a competitor entry.
struct CompetitorRegistered {
  std::string number;
  std::string name;
  std::string transponder;
};

// `$J`: a lap crossing with its lap time.
struct LapCompleted {
  std::string number;
  int lap = 0;                     // 0 when the lap count is not known yet
  Millis lap_time = 0;
  std::optional<Millis> race_time; // session elapsed time at the crossing
};

// `$G`: feed-reported running order.
struct PositionChanged {
  std::string number;
  int position = 0;
  int laps = 0;
  std::optional<Millis> race_time;
};

// `$F`: flag / session state heartbeat.
struct SessionStateChanged {
  SessionState state = SessionState::idle;
  std::string flag;
};

using FeedPayload = std::variant<SessionAnnounced, CompetitorRegistered, LapCompleted,
                                 PositionChanged, SessionStateChanged>;

enum class FeedEventKind : std::uint8_t {
  session_announced,
  competitor_registered,
  lap_completed,
  position_changed,
  session_state_changed
};

struct FeedEvent {
  std::string session;  // session name from the latest `$B`
  FeedPayload payload;

  FeedEventKind kind() const { return static_cast<FeedEventKind>(payload.index()); }
};

const char* to_string(FeedEventKind k);

// ---- Parser -----------------------------------------------------------------

struct FeedCounters {
  std::uint64_t decoded = 0;    // packets that produced an event
  std::uint64_t ignored = 0;    // recognised packets that carry nothing we use
  std::uint64_t malformed = 0;  // unknown tags, bad fields, oversized lines
  std::uint64_t orphaned = 0;   // packets before any `$B`
  std::uint64_t resets = 0;     // reconnect resets
};

// Incremental decoder for the line-framed timing protocol. Bytes are pushed in
// arbitrary chunks; complete packets are decoded lazily, in arrival order, by
// next(). A trailing partial packet stays buffered until its delimiter arrives.
// The parser keeps framing context only (current session, last `$G` lap count
// per number); it holds no results state.
class FeedParser {
public:
  static constexpr std::size_t kDefaultMaxPacketBytes = 1024;

  explicit FeedParser(std::size_t max_packet_bytes = kDefaultMaxPacketBytes);

  void push(std::string_view chunk);

  // Decode the next complete packet that yields an event; nullopt when the
  // buffer holds no further complete packet.
  std::optional<FeedEvent> next();

  // Decode everything currently buffered.
  template <class F>
  std::size_t drain(F&& on_event) {
    std::size_t n = 0;
    while (auto ev = next()) {
      on_event(*ev);
      ++n;
    }
    return n;
  }

  // Connection was lost: drop the partial packet and lap correlation.
  // The session context survives; missed packets are not recovered.
  void reset();

  const FeedCounters& counters() const { return counters_; }
  const std::string& current_session() const { return session_; }
  std::size_t buffered_bytes() const { return buffer_.size() - read_pos_; }

private:
  std::optional<FeedEvent> decode_(std::string_view line);
  std::optional<FeedEvent> malformed_(std::string_view line, const char* why);
  void compact_();

  std::size_t max_packet_bytes_;
  std::string buffer_;
  std::size_t read_pos_ = 0;
  bool discarding_ = false;  // inside an oversized line, skip to next delimiter

  std::string session_;
  std::unordered_map<std::string, int> laps_by_number_;
  FeedCounters counters_{};
};

// Split one packet into fields. Double quotes group text (commas inside are
// kept) and are removed; unquoted fields are trimmed. nullopt on an
// unterminated quote.
std::optional<std::vector<std::string>> split_packet(std::string_view line);

// "[[hh:]mm:]ss[.fff]" -> milliseconds. nullopt on anything else.
std::optional<Millis> parse_race_time(std::string_view s);

// Flag text -> session state ("Green" -> live, "Finish" -> ended, "" -> idle).
std::optional<SessionState> session_state_from_flag(std::string_view flag);

// "m:ss.fff" rendering used by logs and exports.
std::string format_lap_time(Millis ms);

} // namespace paddock

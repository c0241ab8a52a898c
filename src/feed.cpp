#include <paddock/feed.hpp>
#include <paddock/log.hpp>
#include <fmt/format.h>
#include "text_util.hpp"

namespace paddock {

using detail::lower;
using detail::parse_int;
using detail::trim;

const char* to_string(FeedEventKind k) {
  switch (k) {
    case FeedEventKind::session_announced:     return "session_announced";
    case FeedEventKind::competitor_registered: return "competitor_registered";
    case FeedEventKind::lap_completed:         return "lap_completed";
    case FeedEventKind::position_changed:      return "position_changed";
    case FeedEventKind::session_state_changed: return "session_state_changed";
  }
  return "unknown";
}

std::optional<std::vector<std::string>> split_packet(std::string_view line) {
  std::vector<std::string> fields;
  std::string cur;
  bool quoted = false;     // inside quotes
  bool had_quote = false;  // current field used quotes: keep inner spaces
  for (char c : line) {
    if (c == '"') {
      quoted = !quoted;
      had_quote = true;
    } else if (c == ',' && !quoted) {
      fields.push_back(had_quote ? cur : std::string(trim(cur)));
      cur.clear();
      had_quote = false;
    } else {
      cur.push_back(c);
    }
  }
  if (quoted) return std::nullopt;
  fields.push_back(had_quote ? cur : std::string(trim(cur)));
  return fields;
}

std::optional<Millis> parse_race_time(std::string_view s) {
  s = trim(s);
  if (s.empty()) return std::nullopt;

  std::string_view frac;
  if (const auto dot = s.find('.'); dot != std::string_view::npos) {
    frac = s.substr(dot + 1);
    s = s.substr(0, dot);
    if (frac.empty()) return std::nullopt;
  }

  // Up to three ':'-separated integer parts, most significant first.
  long long parts[3] = {0, 0, 0};
  int count = 0;
  while (true) {
    const auto colon = s.find(':');
    const auto piece = s.substr(0, colon);
    // Nine digits per part keeps the millisecond total well inside Millis.
    if (piece.empty() || piece.size() > 9 || count == 3) return std::nullopt;
    for (char c : piece) if (c < '0' || c > '9') return std::nullopt;
    const auto v = parse_int<long long>(piece);
    if (!v) return std::nullopt;
    parts[count++] = *v;
    if (colon == std::string_view::npos) break;
    s.remove_prefix(colon + 1);
  }

  long long h = 0, m = 0, sec = 0;
  if (count == 3) { h = parts[0]; m = parts[1]; sec = parts[2]; }
  else if (count == 2) { m = parts[0]; sec = parts[1]; }
  else { sec = parts[0]; }
  if (count > 1 && sec >= 60) return std::nullopt;
  if (count == 3 && m >= 60) return std::nullopt;

  long long ms = 0;
  if (!frac.empty()) {
    // Millisecond resolution; extra digits are truncated.
    int digits = 0;
    for (char c : frac) {
      if (c < '0' || c > '9') return std::nullopt;
      if (digits < 3) { ms = ms * 10 + (c - '0'); ++digits; }
    }
    while (digits < 3) { ms *= 10; ++digits; }
  }
  return ((h * 60 + m) * 60 + sec) * 1000 + ms;
}

std::optional<SessionState> session_state_from_flag(std::string_view flag) {
  const auto f = lower(trim(flag));
  if (f.empty() || f == "none") return SessionState::idle;
  if (f == "green" || f == "yellow" || f == "red") return SessionState::live;
  if (f == "finish" || f == "finished" || f == "checkered" || f == "chequered") return SessionState::ended;
  return std::nullopt;
}

std::string format_lap_time(Millis ms) {
  if (ms < 0) return fmt::format("-{}", format_lap_time(-ms));
  const auto minutes = ms / 60000;
  const auto rest = ms % 60000;
  if (minutes == 0) return fmt::format("{}.{:03}", rest / 1000, rest % 1000);
  return fmt::format("{}:{:02}.{:03}", minutes, rest / 1000, rest % 1000);
}

// ---- FeedParser -------------------------------------------------------------

FeedParser::FeedParser(std::size_t max_packet_bytes)
  : max_packet_bytes_(max_packet_bytes == 0 ? kDefaultMaxPacketBytes : max_packet_bytes) {}

void FeedParser::push(std::string_view chunk) {
  if (discarding_) {
    const auto nl = chunk.find('\n');
    if (nl == std::string_view::npos) return;
    chunk.remove_prefix(nl + 1);
    discarding_ = false;
  }
  compact_();
  buffer_.append(chunk);

  // Guard the trailing partial packet only; complete lines are checked in next().
  const std::string_view pending(buffer_.data() + read_pos_, buffer_.size() - read_pos_);
  const auto last_nl = pending.rfind('\n');
  const auto partial = last_nl == std::string_view::npos ? pending.size() : pending.size() - last_nl - 1;
  if (partial > max_packet_bytes_) {
    buffer_.resize(buffer_.size() - partial);
    discarding_ = true;
    ++counters_.malformed;
    log_debug("feed: dropped oversized packet ({} bytes buffered without delimiter)", partial);
  }
}

std::optional<FeedEvent> FeedParser::next() {
  while (true) {
    const auto nl = buffer_.find('\n', read_pos_);
    if (nl == std::string::npos) return std::nullopt;
    std::string_view line(buffer_.data() + read_pos_, nl - read_pos_);
    read_pos_ = nl + 1;
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    if (trim(line).empty()) continue;
    if (line.size() > max_packet_bytes_) {
      ++counters_.malformed;
      log_debug("feed: dropped oversized packet ({} bytes)", line.size());
      continue;
    }
    if (auto ev = decode_(line)) {
      ++counters_.decoded;
      return ev;
    }
  }
}

void FeedParser::reset() {
  buffer_.clear();
  read_pos_ = 0;
  discarding_ = false;
  laps_by_number_.clear();
  ++counters_.resets;
}

void FeedParser::compact_() {
  if (read_pos_ == 0) return;
  buffer_.erase(0, read_pos_);
  read_pos_ = 0;
}

std::optional<FeedEvent> FeedParser::malformed_(std::string_view line, const char* why) {
  ++counters_.malformed;
  log_debug("feed: skipped malformed packet ({}): {}", why, line);
  return std::nullopt;
}

std::optional<FeedEvent> FeedParser::decode_(std::string_view line) {
  const auto fields_opt = split_packet(line);
  if (!fields_opt) return malformed_(line, "unterminated quote");
  const auto& f = *fields_opt;
  const std::string& tag = f[0];
  if (tag.size() < 2 || tag[0] != '$') return malformed_(line, "no tag");

  auto field = [&](std::size_t i) -> std::string_view {
    return i < f.size() ? std::string_view(f[i]) : std::string_view{};
  };

  if (tag == "$B") {
    // $B,<id>,"<name>"
    std::string name(trim(f.size() > 2 ? field(2) : field(1)));
    if (name.empty()) return malformed_(line, "session without name");
    if (name != session_) laps_by_number_.clear();
    session_ = name;
    return FeedEvent{session_, SessionAnnounced{std::string(trim(field(1)))}};
  }

  if (tag == "$C" || tag == "$E" || tag == "$H" || tag == "$I" || tag == "$SP" || tag == "$SR") {
    ++counters_.ignored;
    return std::nullopt;
  }

  const bool known = tag == "$A" || tag == "$COMP" || tag == "$F" || tag == "$G" || tag == "$J";
  if (!known) return malformed_(line, "unknown tag");
  if (session_.empty()) {
    ++counters_.orphaned;
    log_debug("feed: packet before any session announcement: {}", line);
    return std::nullopt;
  }

  if (tag == "$A" || tag == "$COMP") {
    // $A,"<num>","<num>",<transponder>,"<first>","<last>",...
    // $COMP,"<num>","<num>",<class>,"<first>","<last>",...
    std::string number(trim(field(1)));
    if (number.empty()) number = std::string(trim(field(2)));
    if (number.empty()) return malformed_(line, "competitor without number");
    const auto first = trim(field(4));
    const auto last = trim(field(5));
    std::string name(first);
    if (!first.empty() && !last.empty()) name.push_back(' ');
    name.append(last);
    std::string transponder = tag == "$A" ? std::string(trim(field(3))) : std::string{};
    return FeedEvent{session_, CompetitorRegistered{std::move(number), std::move(name), std::move(transponder)}};
  }

  if (tag == "$F") {
    // $F,<laps_to_go>,"<time_to_go>","<time_of_day>","<race_time>","<flag>"
    if (f.size() < 6) return malformed_(line, "short flag record");
    const auto state = session_state_from_flag(field(5));
    if (!state) return malformed_(line, "unknown flag");
    return FeedEvent{session_, SessionStateChanged{*state, std::string(trim(field(5)))}};
  }

  if (tag == "$G") {
    // $G,<pos>,"<num>",<laps>,"<race_time>"
    if (f.size() < 4) return malformed_(line, "short position record");
    const auto pos = parse_int<int>(field(1));
    std::string number(trim(field(2)));
    if (!pos || *pos < 1 || number.empty()) return malformed_(line, "bad position");
    int laps = 0;
    if (!trim(field(3)).empty()) {
      const auto l = parse_int<int>(field(3));
      if (!l || *l < 0) return malformed_(line, "bad lap count");
      laps = *l;
    }
    std::optional<Millis> race_time;
    if (!trim(field(4)).empty()) {
      race_time = parse_race_time(field(4));
      if (!race_time) return malformed_(line, "bad race time");
    }
    laps_by_number_[number] = laps;
    return FeedEvent{session_, PositionChanged{std::move(number), *pos, laps, race_time}};
  }

  // $J,"<num>","<lap_time>","<race_time>"
  if (f.size() < 3) return malformed_(line, "short passing record");
  std::string number(trim(field(1)));
  const auto lap_time = parse_race_time(field(2));
  if (number.empty() || !lap_time || *lap_time <= 0) return malformed_(line, "bad lap time");
  std::optional<Millis> race_time;
  if (!trim(field(3)).empty()) {
    race_time = parse_race_time(field(3));
    if (!race_time) return malformed_(line, "bad race time");
  }
  int lap = 0;
  if (const auto it = laps_by_number_.find(number); it != laps_by_number_.end()) lap = it->second;
  return FeedEvent{session_, LapCompleted{std::move(number), lap, *lap_time, race_time}};
}

} // namespace paddock

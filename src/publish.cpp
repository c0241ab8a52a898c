#include <paddock/publish.hpp>
#include <paddock/feed.hpp>
#include <paddock/log.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <fmt/ostream.h>

namespace paddock {

AsyncPublisher::AsyncPublisher(Handler handler) : handler_(std::move(handler)) {}

void AsyncPublisher::start() {
  if (running_.load()) return;
  running_.store(true);
  th_ = std::thread(&AsyncPublisher::thread_main_, this);
}

void AsyncPublisher::stop() {
  if (running_.load()) {
    {
      std::lock_guard lock(mutex_);
      running_.store(false);
    }
    wake_.notify_all();
    if (th_.joinable()) th_.join();
  }
  // Anything still queued was never handed to the worker.
  std::lock_guard lock(mutex_);
  if (queue_.empty()) return;
  failed_ += queue_.size();
  log_warning("publisher stopped with {} undelivered unit(s), first {} v{}",
              queue_.size(), queue_.front().session_name, queue_.front().version);
  queue_.clear();
}

void AsyncPublisher::on_published(const PublishedUnit& unit) {
  {
    std::lock_guard lock(mutex_);
    queue_.push_back(unit);
  }
  wake_.notify_one();
}

void AsyncPublisher::flush() {
  std::unique_lock lock(mutex_);
  idle_.wait(lock, [&]{ return (queue_.empty() && !busy_) || !running_.load(); });
}

void AsyncPublisher::thread_main_() {
  std::unique_lock lock(mutex_);
  for (;;) {
    wake_.wait(lock, [&]{ return !queue_.empty() || !running_.load(); });
    if (queue_.empty()) break;  // stopped and drained

    PublishedUnit unit = std::move(queue_.front());
    queue_.pop_front();
    busy_ = true;
    lock.unlock();

    try {
      handler_(unit);
      ++delivered_;
    } catch (const std::exception& e) {
      ++failed_;
      log_error("publish {} v{} failed: {}", unit.session_name, unit.version, e.what());
    }

    lock.lock();
    busy_ = false;
    if (queue_.empty()) idle_.notify_all();
  }
  idle_.notify_all();
}

std::string snapshot_file_name(const PublishedUnit& unit) {
  std::string name = unit.session_name.empty() ? fmt::format("session{}", unit.session) : unit.session_name;
  std::replace_if(name.begin(), name.end(), [](unsigned char c) {
    return !(std::isalnum(c) || c == '-' || c == '_');
  }, '_');
  return fmt::format("{}_v{}.csv", name, unit.version);
}

static std::string csv_quote(const std::string& s) {
  if (s.find_first_of(",\"\n") == std::string::npos) return s;
  std::string out = "\"";
  for (char c : s) {
    if (c == '"') out += '"';
    out += c;
  }
  out += '"';
  return out;
}

void write_snapshot_csv(std::ostream& out, const PublishedUnit& unit) {
  fmt::print(out, "session,version,position,number,name,status,laps,best_lap,points\n");
  if (!unit.snapshot) return;
  for (const auto& e : unit.snapshot->entries) {
    const auto pts = std::find_if(unit.points.begin(), unit.points.end(),
                                  [&](const PointsEntry& p){ return p.competitor == e.competitor; });
    fmt::print(out, "{},{},{},{},{},{},{},{},{}\n",
               csv_quote(unit.session_name), unit.version, e.position, csv_quote(e.number),
               csv_quote(e.name), to_string(e.status), e.total_laps,
               e.best_lap ? format_lap_time(*e.best_lap) : std::string(),
               pts == unit.points.end() ? 0 : pts->points);
  }
}

std::string write_snapshot_file(const std::string& dir, const PublishedUnit& unit) {
  std::filesystem::create_directories(dir);
  const auto path = (std::filesystem::path(dir) / snapshot_file_name(unit)).string();
  std::ofstream f(path, std::ios::trunc);
  if (!f) throw std::runtime_error("cannot open " + path);
  write_snapshot_csv(f, unit);
  if (!f) throw std::runtime_error("write failed: " + path);
  return path;
}

} // namespace paddock

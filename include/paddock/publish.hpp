#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <thread>
#include <paddock/official.hpp>
#include <paddock/points.hpp>

namespace paddock {

// Emitted once per successful publish_official; consumers upsert by (session, version).
struct PublishedUnit {
  SessionId session = 0;
  std::string session_name;
  std::uint32_t version = 0;
  std::shared_ptr<const ResultSnapshot> snapshot;
  PointsTable points;
};

// Receives published units. Called under the session's publish lock, in
// version order; implementations must return promptly.
class PublicationSink {
public:
  virtual ~PublicationSink() = default;
  virtual void on_published(const PublishedUnit& unit) = 0;
};

// Hands units to a handler on its own worker thread. Handler exceptions are
// logged and counted; the engine never sees them.
class AsyncPublisher : public PublicationSink {
public:
  using Handler = std::function<void(const PublishedUnit&)>;

  explicit AsyncPublisher(Handler handler);
  ~AsyncPublisher() override { stop(); }
  AsyncPublisher(const AsyncPublisher&) = delete;
  AsyncPublisher& operator=(const AsyncPublisher&) = delete;

  void start();
  void stop();  // drains the queue first

  void on_published(const PublishedUnit& unit) override;

  // Block until every queued unit has been handled.
  void flush();

  std::uint64_t delivered() const { return delivered_.load(); }
  std::uint64_t failed() const { return failed_.load(); }

private:
  void thread_main_();

  Handler handler_;
  std::thread th_;
  std::atomic<bool> running_{false};

  std::mutex mutex_;
  std::condition_variable wake_;
  std::condition_variable idle_;
  std::deque<PublishedUnit> queue_;
  bool busy_ = false;

  std::atomic<std::uint64_t> delivered_{0};
  std::atomic<std::uint64_t> failed_{0};
};

// "<session>_v<version>.csv" with characters unsafe in file names replaced.
std::string snapshot_file_name(const PublishedUnit& unit);

// One row per entry: position, number, name, status, laps, best lap, points.
void write_snapshot_csv(std::ostream& out, const PublishedUnit& unit);

// Write (or overwrite) the unit's CSV under `dir`. Throws std::runtime_error
// when the file cannot be written.
std::string write_snapshot_file(const std::string& dir, const PublishedUnit& unit);

} // namespace paddock

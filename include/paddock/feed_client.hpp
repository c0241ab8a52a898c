#pragma once
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <istream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <paddock/feed.hpp>

namespace paddock {

using FeedHandler = std::function<void(const FeedEvent&)>;

// TCP client for the timing feed. Runs its own io_context on a dedicated
// thread, decodes with a FeedParser and hands each event to the handler and
// observers on that thread. On EOF or error the parser is reset, the
// reconnect-needed signal fires, and the client reconnects with exponential
// backoff. Packets sent while disconnected are lost.
class FeedClient {
public:
  struct Options {
    std::string host = "127.0.0.1";
    std::uint16_t port = 50000;
    std::chrono::seconds initial_backoff{1};
    std::chrono::seconds max_backoff{10};
    std::size_t max_packet_bytes = FeedParser::kDefaultMaxPacketBytes;
  };

  using ReconnectHandler = std::function<void(std::uint64_t reconnects)>;

  FeedClient(Options options, FeedHandler handler);
  ~FeedClient() { stop(); }
  FeedClient(const FeedClient&) = delete;
  FeedClient& operator=(const FeedClient&) = delete;

  // Call before start().
  void add_observer(FeedHandler observer);
  void on_reconnect_needed(ReconnectHandler handler);

  void start();
  void stop();

  bool connected() const { return connected_.load(); }
  std::uint64_t reconnects() const { return reconnects_.load(); }
  FeedCounters counters() const;

  // Delay before the next attempt after `failures` consecutive failures.
  static std::chrono::seconds backoff_delay(unsigned failures, std::chrono::seconds initial,
                                            std::chrono::seconds max);

private:
  void thread_main_();
  void resolve_();
  void read_();
  void connection_lost_(const boost::system::error_code& ec);
  void schedule_retry_();
  void dispatch_(const FeedEvent& ev);
  void sync_counters_();

  Options options_;
  FeedHandler handler_;
  std::vector<FeedHandler> observers_;
  ReconnectHandler on_reconnect_;

  boost::asio::io_context io_;
  boost::asio::ip::tcp::resolver resolver_;
  boost::asio::ip::tcp::socket socket_;
  boost::asio::steady_timer retry_timer_;
  std::array<char, 4096> read_buf_{};

  FeedParser parser_;  // io thread only
  unsigned failures_ = 0;

  std::thread th_;
  std::atomic<bool> running_{false};
  std::atomic<bool> connected_{false};
  std::atomic<std::uint64_t> reconnects_{0};

  mutable std::mutex counters_mutex_;
  FeedCounters counters_{};
};

// Drive a parser from a recorded feed in fixed-size chunks. A final packet
// without a trailing newline is terminated at end of input. Returns the
// number of events delivered.
std::size_t replay_feed(std::istream& in, FeedParser& parser, const FeedHandler& handler,
                        std::size_t chunk_size = 4096);

} // namespace paddock

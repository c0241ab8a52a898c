#include <paddock/feed_client.hpp>
#include <paddock/log.hpp>
#include <algorithm>
#include <boost/asio/connect.hpp>
#include <boost/asio/post.hpp>

namespace paddock {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

FeedClient::FeedClient(Options options, FeedHandler handler)
  : options_(std::move(options)),
    handler_(std::move(handler)),
    resolver_(io_),
    socket_(io_),
    retry_timer_(io_),
    parser_(options_.max_packet_bytes) {}

void FeedClient::add_observer(FeedHandler observer) { observers_.push_back(std::move(observer)); }

void FeedClient::on_reconnect_needed(ReconnectHandler handler) { on_reconnect_ = std::move(handler); }

std::chrono::seconds FeedClient::backoff_delay(unsigned failures, std::chrono::seconds initial,
                                               std::chrono::seconds max) {
  auto d = initial;
  for (unsigned i = 1; i < failures && d < max; ++i) d *= 2;
  return std::min(d, max);
}

void FeedClient::start() {
  if (running_.load()) return;
  running_.store(true);
  asio::post(io_, [this]{ resolve_(); });
  th_ = std::thread(&FeedClient::thread_main_, this);
}

void FeedClient::stop() {
  if (!running_.load()) return;
  running_.store(false);
  asio::post(io_, [this] {
    boost::system::error_code ignored;
    retry_timer_.cancel();
    resolver_.cancel();
    socket_.close(ignored);
  });
  if (th_.joinable()) th_.join();
  connected_.store(false);
}

FeedCounters FeedClient::counters() const {
  std::lock_guard lock(counters_mutex_);
  return counters_;
}

void FeedClient::thread_main_() {
  io_.run();
  log_debug("feed client stopped");
}

void FeedClient::resolve_() {
  if (!running_.load()) return;
  log_info("feed: connecting to {}:{}", options_.host, options_.port);
  resolver_.async_resolve(options_.host, std::to_string(options_.port),
    [this](const boost::system::error_code& ec, const tcp::resolver::results_type& endpoints) {
      if (ec) {
        log_warning("feed: resolve {} failed: {}", options_.host, ec.message());
        schedule_retry_();
        return;
      }
      asio::async_connect(socket_, endpoints,
        [this](const boost::system::error_code& ec, const tcp::endpoint& ep) {
          if (ec) {
            log_warning("feed: connect failed: {}", ec.message());
            schedule_retry_();
            return;
          }
          failures_ = 0;
          connected_.store(true);
          log_info("feed: connected to {}:{}", ep.address().to_string(), ep.port());
          read_();
        });
    });
}

void FeedClient::read_() {
  socket_.async_read_some(asio::buffer(read_buf_),
    [this](const boost::system::error_code& ec, std::size_t n) {
      if (n > 0) {
        parser_.push(std::string_view(read_buf_.data(), n));
        parser_.drain([this](const FeedEvent& ev){ dispatch_(ev); });
        sync_counters_();
      }
      if (ec) {
        connection_lost_(ec);
        return;
      }
      read_();
    });
}

void FeedClient::connection_lost_(const boost::system::error_code& ec) {
  connected_.store(false);
  boost::system::error_code ignored;
  socket_.close(ignored);
  if (!running_.load()) return;

  const auto partial = parser_.buffered_bytes();
  parser_.reset();
  sync_counters_();
  const auto n = ++reconnects_;
  log_warning("feed: connection lost ({}), {} byte(s) of partial packet dropped; reconnecting",
              ec == asio::error::eof ? "eof" : ec.message(), partial);
  if (on_reconnect_) on_reconnect_(n);
  schedule_retry_();
}

void FeedClient::schedule_retry_() {
  if (!running_.load()) return;
  ++failures_;
  const auto delay = backoff_delay(failures_, options_.initial_backoff, options_.max_backoff);
  log_info("feed: retry in {}s", delay.count());
  retry_timer_.expires_after(delay);
  retry_timer_.async_wait([this](const boost::system::error_code& ec) {
    if (ec) return;  // cancelled by stop()
    resolve_();
  });
}

void FeedClient::dispatch_(const FeedEvent& ev) {
  if (handler_) handler_(ev);
  for (const auto& obs : observers_) obs(ev);
}

void FeedClient::sync_counters_() {
  std::lock_guard lock(counters_mutex_);
  counters_ = parser_.counters();
}

std::size_t replay_feed(std::istream& in, FeedParser& parser, const FeedHandler& handler,
                        std::size_t chunk_size) {
  std::vector<char> buf(std::max<std::size_t>(chunk_size, 1));
  std::size_t events = 0;
  auto emit = [&](const FeedEvent& ev) {
    if (handler) handler(ev);
  };
  while (in) {
    in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    const auto n = static_cast<std::size_t>(in.gcount());
    if (n == 0) break;
    parser.push(std::string_view(buf.data(), n));
    events += parser.drain(emit);
  }
  if (parser.buffered_bytes() > 0) {
    parser.push("\n");
    events += parser.drain(emit);
  }
  return events;
}

} // namespace paddock

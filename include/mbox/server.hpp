#ifndef MBOX_SERVER_HPP_
#define MBOX_SERVER_HPP_

#include "config.hpp"
#include "connection.hpp"
#include "dispatcher.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <chrono>
#include <memory>
#include <poll.h>
#include <string>
#include <vector>

namespace mbox {

// ============================================================================
// ServerStats - Atomic performance counters
// ============================================================================

struct ServerStats {
  // Throughput counters
  std::atomic<uint64_t> requests_dispatched{0};
  std::atomic<uint64_t> total_bytes_in{0};
  std::atomic<uint64_t> total_bytes_out{0};

  // Connection counters
  std::atomic<uint64_t> total_connections{0};
  std::atomic<uint64_t> active_connections{0};
  std::atomic<uint64_t> rejected_connections{0};
  std::atomic<uint64_t> idle_timeouts{0};

  // Error counters
  std::atomic<uint64_t> protocol_errors{0};
  std::atomic<uint64_t> socket_errors{0};

  // Latency tracking (microseconds)
  std::atomic<uint64_t> last_poll_latency_us{0};
  std::atomic<uint64_t> max_poll_latency_us{0};

  void reset() {
    requests_dispatched = 0;
    total_bytes_in = 0;
    total_bytes_out = 0;
    total_connections = 0;
    active_connections = 0;
    rejected_connections = 0;
    idle_timeouts = 0;
    protocol_errors = 0;
    socket_errors = 0;
    last_poll_latency_us = 0;
    max_poll_latency_us = 0;
  }
};

// ============================================================================
// Server (single-threaded poll reactor)
// ============================================================================

class Server {
 public:
  using ConnPtr = std::shared_ptr<Connection>;

  // Binds and listens immediately. Throws std::runtime_error if the config is
  // invalid or the socket cannot be set up.
  Server(const ServerConfig& config, Dispatcher& dispatcher);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  // Run ticks until shutdown completes (blocking).
  void run();

  // One reactor tick. Returns false once shutdown has completed.
  bool poll_once();

  // Request shutdown. Safe from any thread and from a signal handler.
  void stop();

  bool is_running() const { return !finished_.load(std::memory_order_acquire); }

  // Actual listening port (resolves port 0).
  uint16_t port() const { return port_; }

  // Poll thread only; other threads should read stats().active_connections.
  size_t get_connection_count() const { return connections_.size(); }

  // Performance monitoring
  const ServerStats& stats() const { return stats_; }
  void reset_stats() { stats_.reset(); }

  const ServerConfig& config() const { return config_; }

 private:
  using SteadyClock = std::chrono::steady_clock;

  const ServerConfig config_;
  Dispatcher& dispatcher_;
  int server_sock_ = -1;
  int wake_fd_ = -1;
  uint16_t port_ = 0;

  std::vector<ConnPtr> connections_;
  std::vector<pollfd> poll_fds_;

  std::atomic<bool> stop_requested_{false};
  std::atomic<bool> finished_{false};
  bool draining_ = false;
  SteadyClock::time_point drain_deadline_{};

  // Performance monitoring
  ServerStats stats_;

  // Internal methods
  expected<void, ErrorCode> accept_connection();
  void handle_connection_io(ConnPtr& conn, const pollfd& pfd);
  Response handle_frame(const RequestHeader& header, const uint8_t* payload, size_t len);
  void enforce_timeouts();
  void remove_closed_connections();
  void begin_shutdown();
  void finish_shutdown();
  int next_poll_timeout() const;
  void apply_tcp_tuning(int fd);
  void close_fds();
};

}  // namespace mbox

#endif  // MBOX_SERVER_HPP_

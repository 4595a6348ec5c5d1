#include "mbox/server.hpp"

#include "mbox/log.hpp"

#include <cerrno>
#include <cstring>

#include <algorithm>
#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <stdexcept>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <unistd.h>
#include <utility>

namespace mbox {

namespace {

constexpr int kListenBacklog = 128;
constexpr int kAcceptBatch = 64;

}  // namespace

Server::Server(const ServerConfig& config, Dispatcher& dispatcher) : config_(config), dispatcher_(dispatcher) {
  if (!validate(config_).has_value()) {
    MBOX_THROW(std::runtime_error("Invalid server configuration"));
  }

  struct sockaddr_in addr;
  memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(config_.port);
  if (config_.bind_addr.empty()) {
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
  } else if (inet_pton(AF_INET, config_.bind_addr.c_str(), &addr.sin_addr) != 1) {
    MBOX_THROW(std::runtime_error("Invalid bind address: " + config_.bind_addr));
  }

  // Create socket
  server_sock_ = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (server_sock_ < 0) {
    MBOX_THROW(std::runtime_error("Failed to create socket: " + std::string(strerror(errno))));
  }

  int reuse = 1;
  setsockopt(server_sock_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

  if (bind(server_sock_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
    int err = errno;
    close_fds();
    MBOX_THROW(std::runtime_error("Failed to bind port " + std::to_string(config_.port) + ": " + strerror(err)));
  }

  if (listen(server_sock_, kListenBacklog) < 0) {
    int err = errno;
    close_fds();
    MBOX_THROW(std::runtime_error("Failed to listen: " + std::string(strerror(err))));
  }

  if (fcntl(server_sock_, F_SETFL, O_NONBLOCK) < 0) {
    int err = errno;
    close_fds();
    MBOX_THROW(std::runtime_error("Failed to set listener non-blocking: " + std::string(strerror(err))));
  }

  struct sockaddr_in bound;
  socklen_t bound_len = sizeof(bound);
  if (getsockname(server_sock_, reinterpret_cast<struct sockaddr*>(&bound), &bound_len) < 0) {
    int err = errno;
    close_fds();
    MBOX_THROW(std::runtime_error("getsockname failed: " + std::string(strerror(err))));
  }
  port_ = ntohs(bound.sin_port);

  wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
  if (wake_fd_ < 0) {
    int err = errno;
    close_fds();
    MBOX_THROW(std::runtime_error("Failed to create eventfd: " + std::string(strerror(err))));
  }

  connections_.reserve(config_.max_connections);
  poll_fds_.reserve(config_.max_connections + 2);

  MBOX_LOG_INFO("Server listening on " + (config_.bind_addr.empty() ? std::string("0.0.0.0") : config_.bind_addr) +
                ":" + std::to_string(port_));
}

Server::~Server() {
  connections_.clear();
  close_fds();
}

void Server::close_fds() {
  if (server_sock_ >= 0) {
    ::close(server_sock_);
    server_sock_ = -1;
  }
  if (wake_fd_ >= 0) {
    ::close(wake_fd_);
    wake_fd_ = -1;
  }
}

void Server::stop() {
  stop_requested_.store(true, std::memory_order_release);
  if (wake_fd_ >= 0) {
    uint64_t one = 1;
    // On failure the flag is still seen at the next poll timeout.
    ssize_t n = ::write(wake_fd_, &one, sizeof(one));
    (void)n;
  }
}

void Server::run() {
  MBOX_LOG_INFO("Server starting...");
  while (poll_once()) {
  }
  MBOX_LOG_INFO("Server stopped");
}

int Server::next_poll_timeout() const {
  int timeout = config_.poll_timeout_ms;
  if (draining_) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(drain_deadline_ - SteadyClock::now());
    timeout = std::max(0, std::min(timeout, static_cast<int>(remaining.count()) + 1));
  }
  return timeout;
}

bool Server::poll_once() {
  if (finished_.load(std::memory_order_acquire)) {
    return false;
  }
  if (stop_requested_.load(std::memory_order_acquire) && !draining_) {
    begin_shutdown();
  }

  // Prepare poll FDs: wakeup, listener (until shutdown), then connections
  poll_fds_.clear();
  poll_fds_.push_back({wake_fd_, POLLIN, 0});
  poll_fds_.push_back({server_sock_, static_cast<short>(server_sock_ >= 0 ? POLLIN : 0), 0});
  size_t polled = connections_.size();
  for (size_t i = 0; i < polled; ++i) {
    poll_fds_.push_back({connections_[i]->get_fd(), connections_[i]->poll_events(), 0});
  }

  // Poll with latency tracking
  auto poll_start = SteadyClock::now();
  int ret = ::poll(poll_fds_.data(), static_cast<nfds_t>(poll_fds_.size()), next_poll_timeout());
  auto poll_end = SteadyClock::now();

  uint64_t poll_us =
      static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(poll_end - poll_start).count());
  stats_.last_poll_latency_us.store(poll_us, std::memory_order_relaxed);
  uint64_t prev_max = stats_.max_poll_latency_us.load(std::memory_order_relaxed);
  if (poll_us > prev_max) {
    stats_.max_poll_latency_us.store(poll_us, std::memory_order_relaxed);
  }

  if (ret < 0) {
    int err = errno;
    if (err == EINTR) {
      return true;
    }
    MBOX_LOG_ERROR("Poll error: " + std::string(strerror(err)));
    finish_shutdown();
    return false;
  }

  if (ret > 0) {
    if (poll_fds_[0].revents & POLLIN) {
      uint64_t value = 0;
      while (::read(wake_fd_, &value, sizeof(value)) > 0) {
      }
    }

    // Handle new connections
    if (server_sock_ >= 0 && (poll_fds_[1].revents & POLLIN)) {
      auto accepted = accept_connection();
      if (!accepted.has_value()) {
        MBOX_LOG_WARN(std::string("Accept failed: ") + error_code_name(accepted.get_error()));
      }
    }

    // Handle client I/O
    for (size_t i = 0; i < polled; ++i) {
      handle_connection_io(connections_[i], poll_fds_[i + 2]);
    }
  }

  enforce_timeouts();
  remove_closed_connections();

  if (stop_requested_.load(std::memory_order_acquire) && !draining_) {
    begin_shutdown();
  }
  if (draining_ && (connections_.empty() || SteadyClock::now() >= drain_deadline_)) {
    finish_shutdown();
    return false;
  }
  return true;
}

expected<void, ErrorCode> Server::accept_connection() {
  for (int n = 0; n < kAcceptBatch; ++n) {
    int client_sock = ::accept4(server_sock_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (client_sock < 0) {
      int err = errno;
      if (err == EAGAIN || err == EWOULDBLOCK) {
        return expected<void, ErrorCode>::success();
      }
      if (err == EINTR || err == ECONNABORTED) {
        continue;
      }
      MBOX_LOG_ERROR("Accept error: " + std::string(strerror(err)));
      stats_.socket_errors.fetch_add(1, std::memory_order_relaxed);
      return expected<void, ErrorCode>::error(ErrorCode::kSocketError);
    }

    // Overload protection: accept and immediately close to drain the queue
    if (connections_.size() >= config_.max_connections) {
      ::close(client_sock);
      stats_.rejected_connections.fetch_add(1, std::memory_order_relaxed);
      MBOX_LOG_WARN("Max connections reached, rejecting");
      continue;
    }

    apply_tcp_tuning(client_sock);

    auto conn = std::make_shared<Connection>(client_sock, config_);
    conn->on_frame = [this](const RequestHeader& header, const uint8_t* payload, size_t len) {
      return handle_frame(header, payload, len);
    };
    connections_.push_back(conn);

    stats_.total_connections.fetch_add(1, std::memory_order_relaxed);
    stats_.active_connections.fetch_add(1, std::memory_order_relaxed);
    MBOX_LOG_DEBUG(Logger::with_conn(conn->get_id(), "accepted"));
  }
  return expected<void, ErrorCode>::success();
}

Response Server::handle_frame(const RequestHeader& header, const uint8_t* payload, size_t len) {
  stats_.requests_dispatched.fetch_add(1, std::memory_order_relaxed);
  Response response = dispatcher_.dispatch(header, payload, len);
  if (response.code == ResponseCode::kMalformedRequest) {
    stats_.protocol_errors.fetch_add(1, std::memory_order_relaxed);
  }
  return response;
}

void Server::handle_connection_io(ConnPtr& conn, const pollfd& pfd) {
  uint64_t in_before = conn->bytes_received();
  uint64_t out_before = conn->bytes_sent();

  if (pfd.revents & POLLIN) {
    auto read_result = conn->handle_read();
    if (!read_result.has_value()) {
      if (read_result.get_error() == ErrorCode::kSocketError) {
        stats_.socket_errors.fetch_add(1, std::memory_order_relaxed);
      }
      conn->close();
    } else if (conn->get_last_error() == ErrorCode::kMalformedHeader) {
      stats_.protocol_errors.fetch_add(1, std::memory_order_relaxed);
    }
  }

  if ((pfd.revents & POLLOUT) && !conn->is_closed()) {
    auto write_result = conn->handle_write();
    if (!write_result.has_value()) {
      if (write_result.get_error() == ErrorCode::kSocketError) {
        stats_.socket_errors.fetch_add(1, std::memory_order_relaxed);
      }
      conn->close();
    }
  }

  if ((pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) && !conn->is_closed()) {
    conn->close();
  }

  stats_.total_bytes_in.fetch_add(conn->bytes_received() - in_before, std::memory_order_relaxed);
  stats_.total_bytes_out.fetch_add(conn->bytes_sent() - out_before, std::memory_order_relaxed);
}

void Server::enforce_timeouts() {
  for (auto& conn : connections_) {
    if (!conn->is_closed() && conn->is_idle_timed_out()) {
      MBOX_LOG_DEBUG(Logger::with_conn(conn->get_id(), "idle timeout in state " +
                                                           std::string(connection_state_name(conn->get_state()))));
      stats_.idle_timeouts.fetch_add(1, std::memory_order_relaxed);
      conn->close();
    }
  }
}

void Server::remove_closed_connections() {
  // Swap-and-pop removal
  uint32_t removed = 0;
  size_t i = 0;
  while (i < connections_.size()) {
    if (connections_[i]->is_closed()) {
      if (i < connections_.size() - 1) {
        connections_[i] = std::move(connections_.back());
      }
      connections_.pop_back();
      ++removed;
    } else {
      ++i;
    }
  }
  if (removed > 0) {
    stats_.active_connections.fetch_sub(removed, std::memory_order_relaxed);
  }
}

void Server::begin_shutdown() {
  draining_ = true;
  drain_deadline_ = SteadyClock::now() + std::chrono::milliseconds(config_.shutdown_grace_ms);

  if (server_sock_ >= 0) {
    ::close(server_sock_);
    server_sock_ = -1;
  }

  // Only connections with a response in flight get the grace period.
  size_t pending = 0;
  for (auto& conn : connections_) {
    if (conn->get_state() == ConnectionState::kAwaitingWrite) {
      ++pending;
    } else {
      conn->close();
    }
  }
  remove_closed_connections();
  MBOX_LOG_INFO("Shutting down, " + std::to_string(pending) + " response(s) pending");
}

void Server::finish_shutdown() {
  for (auto& conn : connections_) {
    conn->close();
  }
  remove_closed_connections();
  if (server_sock_ >= 0) {
    ::close(server_sock_);
    server_sock_ = -1;
  }
  finished_.store(true, std::memory_order_release);
}

void Server::apply_tcp_tuning(int fd) {
  const TcpTuning& tuning = config_.tcp_tuning;
  int opt = 1;

  if (tuning.tcp_nodelay) {
    setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt));
  }

#ifdef TCP_QUICKACK
  if (tuning.tcp_quickack) {
    setsockopt(fd, IPPROTO_TCP, TCP_QUICKACK, &opt, sizeof(opt));
  }
#endif

  if (tuning.so_keepalive) {
    setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));

#ifdef TCP_KEEPIDLE
    setsockopt(fd, IPPROTO_TCP, TCP_KEEPIDLE, &tuning.keepalive_idle_s, sizeof(tuning.keepalive_idle_s));
#endif
#ifdef TCP_KEEPINTVL
    setsockopt(fd, IPPROTO_TCP, TCP_KEEPINTVL, &tuning.keepalive_interval_s, sizeof(tuning.keepalive_interval_s));
#endif
#ifdef TCP_KEEPCNT
    setsockopt(fd, IPPROTO_TCP, TCP_KEEPCNT, &tuning.keepalive_count, sizeof(tuning.keepalive_count));
#endif
  }
}

}  // namespace mbox

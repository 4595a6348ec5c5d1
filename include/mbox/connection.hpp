#ifndef MBOX_CONNECTION_HPP_
#define MBOX_CONNECTION_HPP_

#include "buffer.hpp"
#include "config.hpp"
#include "protocol.hpp"
#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <chrono>
#include <functional>
#include <memory>
#include <sockpp/tcp_socket.h>
#include <string>

namespace mbox {

// ============================================================================
// Connection state machine
// ============================================================================
//
// One request and one response per connection:
//
//   kAwaitingHeader -> kAwaitingPayload -> kReadyToDispatch -> kAwaitingWrite
//          |                                                        ^    |
//          +---------------------(bad header)----------------------+    v
//                                                                     kClosed
//
// Any state may jump to kClosed on peer close, socket error or idle timeout.

enum class ConnectionState : uint8_t {
  kAwaitingHeader,
  kAwaitingPayload,
  kReadyToDispatch,
  kAwaitingWrite,
  kClosed,
};

const char* connection_state_name(ConnectionState state);

class Connection;

namespace detail {
bool header_on_data(Connection& conn);
bool payload_on_data(Connection& conn);
bool dispatch_on_data(Connection& conn);
bool idle_on_data(Connection& conn);
}  // namespace detail

// Advance on buffered input. Returns true if the state changed and the next
// handler should run.
using StateDataHandler = bool (*)(Connection& conn);

struct StateOps {
  ConnectionState state;
  StateDataHandler on_data;
  short poll_events;  // POLLIN / POLLOUT interest while in this state
};

class Connection {
 public:
  using ConnPtr = std::shared_ptr<Connection>;

  // Completed frame -> response. Called synchronously on the poll thread.
  using FrameHandler = std::function<Response(const RequestHeader&, const uint8_t*, size_t)>;

  Connection(sockpp::tcp_socket&& sock, const ServerConfig& config);
  Connection(int fd, const ServerConfig& config);  // Native socket fd constructor
  ~Connection();

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  // --- Reactor I/O API ---

  // Readable event. One recv of at most min(read_chunk_size, bytes the frame
  // still needs), then advance the state machine as far as possible.
  // Returns error(kConnectionClosed) on peer close (the connection is then
  // closed), error(kSocketError) on socket failure.
  expected<void, ErrorCode> handle_read();

  // Writable event. One send of the pending response. After the last byte
  // the write side is shut down and the connection closes.
  expected<void, ErrorCode> handle_write();

  void close();

  bool is_closed() const { return ops_->state == ConnectionState::kClosed; }

  bool has_data_to_send() const { return !tx_buffer_.empty(); }

  // Events to poll for in the current state (0 once closed).
  short poll_events() const;

  // --- Timeouts ---

  void touch_activity() { last_activity_ = SteadyClock::now(); }

  uint64_t idle_ms() const {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - last_activity_).count());
  }

  // idle_timeout_ms == 0 disables the check.
  bool is_idle_timed_out() const {
    return config_.idle_timeout_ms > 0 && idle_ms() >= config_.idle_timeout_ms;
  }

  // --- Getters ---

  int get_fd() const { return socket_.handle(); }
  uint64_t get_id() const { return id_; }
  ConnectionState get_state() const { return ops_->state; }
  const RequestHeader& header() const { return header_; }

  // Cached from the most recent operation.
  ErrorCode get_last_error() const { return last_error_code_; }

  uint64_t bytes_received() const { return bytes_received_; }
  uint64_t bytes_sent() const { return bytes_sent_; }

  FrameHandler on_frame;

 private:
  friend bool detail::header_on_data(Connection& conn);
  friend bool detail::payload_on_data(Connection& conn);
  friend bool detail::dispatch_on_data(Connection& conn);

  using SteadyClock = std::chrono::steady_clock;
  using TimePoint = SteadyClock::time_point;

  void transition_to_state(ConnectionState state);
  void queue_response(const Response& response);
  void finish();
  void discard_input();
  size_t bytes_wanted() const;

  const ServerConfig& config_;
  uint64_t id_;
  sockpp::tcp_socket socket_;
  ByteBuffer rx_buffer_;
  ByteBuffer tx_buffer_;
  const StateOps* ops_;

  RequestHeader header_;
  bool peer_eof_ = false;
  ErrorCode last_error_code_ = ErrorCode::kOk;

  uint64_t bytes_received_ = 0;
  uint64_t bytes_sent_ = 0;
  TimePoint last_activity_ = SteadyClock::now();

  void log_debug(const std::string& msg) const;
  void log_error(const std::string& msg) const;
};

}  // namespace mbox

#endif  // MBOX_CONNECTION_HPP_

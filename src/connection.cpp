#include "mbox/connection.hpp"

#include "mbox/log.hpp"
#include "mbox/response_builder.hpp"

#include <cerrno>
#include <cstring>

#include <algorithm>
#include <atomic>
#include <limits>
#include <poll.h>
#include <sys/socket.h>

namespace mbox {

namespace {

constexpr size_t kDiscardChunk = 4096;
constexpr int kMaxDiscardReads = 16;

std::atomic<uint64_t> g_next_conn_id{1};

bool would_block(int err) { return err == EAGAIN || err == EWOULDBLOCK || err == EINTR; }

}  // namespace

// ============================================================================
// State handlers
// ============================================================================

namespace detail {

bool header_on_data(Connection& conn) {
  if (conn.rx_buffer_.size() < kRequestHeaderSize) {
    return false;
  }

  auto header = wire::decode_header(conn.rx_buffer_.read_ptr(), kRequestHeaderSize, conn.config_.max_payload_size);
  if (!header.has_value()) {
    conn.last_error_code_ = header.get_error();
    conn.log_debug("Malformed request header");
    conn.rx_buffer_.clear();
    conn.queue_response(ResponseBuilder::error(header.get_error()));
    if (!conn.is_closed()) {
      conn.transition_to_state(ConnectionState::kAwaitingWrite);
    }
    return false;
  }

  conn.header_ = header.value();
  conn.rx_buffer_.advance(kRequestHeaderSize);
  conn.transition_to_state(ConnectionState::kAwaitingPayload);
  return true;
}

bool payload_on_data(Connection& conn) {
  if (conn.rx_buffer_.size() < conn.header_.payload_size) {
    return false;
  }
  conn.transition_to_state(ConnectionState::kReadyToDispatch);
  return true;
}

bool dispatch_on_data(Connection& conn) {
  Response response;
  if (conn.on_frame) {
    response = conn.on_frame(conn.header_, conn.rx_buffer_.read_ptr(), conn.header_.payload_size);
  } else {
    conn.log_error("No frame handler installed");
    response = ResponseBuilder::error(ErrorCode::kInternalError);
  }
  conn.rx_buffer_.clear();
  conn.queue_response(response);
  if (!conn.is_closed()) {
    conn.transition_to_state(ConnectionState::kAwaitingWrite);
  }
  return false;
}

bool idle_on_data(Connection&) { return false; }

}  // namespace detail

// State operation tables (const, zero allocation)
static const StateOps kHeaderOps = {ConnectionState::kAwaitingHeader, detail::header_on_data, POLLIN};
static const StateOps kPayloadOps = {ConnectionState::kAwaitingPayload, detail::payload_on_data, POLLIN};
static const StateOps kDispatchOps = {ConnectionState::kReadyToDispatch, detail::dispatch_on_data, 0};
// Input is still read (and discarded) so the close is not turned into a reset.
static const StateOps kWriteOps = {ConnectionState::kAwaitingWrite, detail::idle_on_data, POLLIN | POLLOUT};
static const StateOps kClosedOps = {ConnectionState::kClosed, detail::idle_on_data, 0};

const char* connection_state_name(ConnectionState state) {
  switch (state) {
    case ConnectionState::kAwaitingHeader:
      return "AwaitingHeader";
    case ConnectionState::kAwaitingPayload:
      return "AwaitingPayload";
    case ConnectionState::kReadyToDispatch:
      return "ReadyToDispatch";
    case ConnectionState::kAwaitingWrite:
      return "AwaitingWrite";
    case ConnectionState::kClosed:
      return "Closed";
  }
  return "Unknown";
}

// ============================================================================
// Connection
// ============================================================================

Connection::Connection(sockpp::tcp_socket&& sock, const ServerConfig& config)
    : config_(config),
      id_(g_next_conn_id.fetch_add(1, std::memory_order_relaxed)),
      socket_(std::move(sock)),
      rx_buffer_(kRequestHeaderSize + static_cast<size_t>(config.max_payload_size)),
      tx_buffer_(std::numeric_limits<size_t>::max()),
      ops_(&kHeaderOps) {
  socket_.set_non_blocking(true);
}

Connection::Connection(int fd, const ServerConfig& config)
    : config_(config),
      id_(g_next_conn_id.fetch_add(1, std::memory_order_relaxed)),
      socket_(fd),
      rx_buffer_(kRequestHeaderSize + static_cast<size_t>(config.max_payload_size)),
      tx_buffer_(std::numeric_limits<size_t>::max()),
      ops_(&kHeaderOps) {
  socket_.set_non_blocking(true);
}

Connection::~Connection() {
  if (socket_.is_open()) {
    socket_.close();
  }
}

short Connection::poll_events() const {
  if (ops_->state == ConnectionState::kAwaitingWrite && peer_eof_) {
    return POLLOUT;
  }
  return ops_->poll_events;
}

size_t Connection::bytes_wanted() const {
  switch (ops_->state) {
    case ConnectionState::kAwaitingHeader:
      return kRequestHeaderSize - rx_buffer_.size();
    case ConnectionState::kAwaitingPayload:
      return static_cast<size_t>(header_.payload_size) - rx_buffer_.size();
    default:
      return 0;
  }
}

expected<void, ErrorCode> Connection::handle_read() {
  if (is_closed()) {
    last_error_code_ = ErrorCode::kConnectionClosed;
    return expected<void, ErrorCode>::error(ErrorCode::kConnectionClosed);
  }
  last_error_code_ = ErrorCode::kOk;

  if (ops_->state == ConnectionState::kAwaitingWrite) {
    discard_input();
    return expected<void, ErrorCode>::success();
  }

  // Never read past the current frame: one request per connection.
  size_t len = std::min(config_.read_chunk_size, bytes_wanted());
  if (len == 0) {
    return expected<void, ErrorCode>::success();
  }
  uint8_t* dst = rx_buffer_.prepare(&len);
  if (len == 0) {
    rx_buffer_.commit_write(0);
    last_error_code_ = ErrorCode::kBufferFull;
    log_error("RX buffer full");
    close();
    return expected<void, ErrorCode>::error(ErrorCode::kBufferFull);
  }

  ssize_t n = ::recv(socket_.handle(), dst, len, 0);

  if (n > 0) {
    rx_buffer_.commit_write(static_cast<size_t>(n));
    bytes_received_ += static_cast<uint64_t>(n);
    touch_activity();
    while (ops_->on_data(*this)) {
    }
    return expected<void, ErrorCode>::success();
  }

  rx_buffer_.commit_write(0);
  if (n == 0) {
    log_debug("Peer closed in state " + std::string(connection_state_name(ops_->state)));
    last_error_code_ = ErrorCode::kConnectionClosed;
    close();
    return expected<void, ErrorCode>::error(ErrorCode::kConnectionClosed);
  }

  int err = errno;
  if (would_block(err)) {
    return expected<void, ErrorCode>::success();
  }
  last_error_code_ = ErrorCode::kSocketError;
  log_error("Read error: " + std::string(strerror(err)));
  close();
  return expected<void, ErrorCode>::error(ErrorCode::kSocketError);
}

expected<void, ErrorCode> Connection::handle_write() {
  if (is_closed()) {
    last_error_code_ = ErrorCode::kConnectionClosed;
    return expected<void, ErrorCode>::error(ErrorCode::kConnectionClosed);
  }
  last_error_code_ = ErrorCode::kOk;
  if (tx_buffer_.empty()) {
    return expected<void, ErrorCode>::success();
  }

  ssize_t n = ::send(socket_.handle(), tx_buffer_.read_ptr(), tx_buffer_.size(), MSG_NOSIGNAL);
  if (n > 0) {
    tx_buffer_.advance(static_cast<size_t>(n));
    bytes_sent_ += static_cast<uint64_t>(n);
    touch_activity();
    if (tx_buffer_.empty()) {
      finish();
    }
    return expected<void, ErrorCode>::success();
  }

  if (n < 0) {
    int err = errno;
    if (!would_block(err)) {
      last_error_code_ = ErrorCode::kSocketError;
      log_error("Write error: " + std::string(strerror(err)));
      close();
      return expected<void, ErrorCode>::error(ErrorCode::kSocketError);
    }
  }
  return expected<void, ErrorCode>::success();
}

void Connection::close() {
  if (is_closed()) {
    return;
  }
  transition_to_state(ConnectionState::kClosed);
  socket_.close();
}

void Connection::transition_to_state(ConnectionState state) {
  switch (state) {
    case ConnectionState::kAwaitingHeader:
      ops_ = &kHeaderOps;
      break;
    case ConnectionState::kAwaitingPayload:
      ops_ = &kPayloadOps;
      break;
    case ConnectionState::kReadyToDispatch:
      ops_ = &kDispatchOps;
      break;
    case ConnectionState::kAwaitingWrite:
      ops_ = &kWriteOps;
      break;
    case ConnectionState::kClosed:
      ops_ = &kClosedOps;
      break;
  }
}

void Connection::queue_response(const Response& response) {
  if (!tx_buffer_.push(wire::encode_response(response))) {
    last_error_code_ = ErrorCode::kBufferFull;
    log_error("TX buffer overflow");
    close();
  }
}

void Connection::finish() {
  ::shutdown(socket_.handle(), SHUT_WR);
  discard_input();
  log_debug("Response sent (" + std::to_string(bytes_sent_) + " bytes)");
  close();
}

void Connection::discard_input() {
  uint8_t scratch[kDiscardChunk];
  for (int i = 0; i < kMaxDiscardReads; ++i) {
    ssize_t n = ::recv(socket_.handle(), scratch, sizeof(scratch), 0);
    if (n > 0) {
      continue;
    }
    if (n == 0) {
      peer_eof_ = true;
    }
    break;
  }
}

void Connection::log_debug(const std::string& msg) const { MBOX_LOG_DEBUG(Logger::with_conn(id_, msg)); }

void Connection::log_error(const std::string& msg) const { MBOX_LOG_ERROR(Logger::with_conn(id_, msg)); }

}  // namespace mbox

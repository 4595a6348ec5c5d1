#ifndef MBOX_CONFIG_HPP_
#define MBOX_CONFIG_HPP_

#include "protocol.hpp"
#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <string>

namespace mbox {

// ============================================================================
// TCP Tuning Configuration
// ============================================================================

struct TcpTuning {
  bool tcp_nodelay = true;      // Disable Nagle algorithm
  bool tcp_quickack = false;    // Reduce ACK delay (Linux-specific)
  bool so_keepalive = false;    // Enable TCP keepalive

  // Keepalive parameters (Linux-specific, effective when so_keepalive=true)
  int keepalive_idle_s = 60;      // Seconds before first keepalive probe
  int keepalive_interval_s = 10;  // Seconds between probes
  int keepalive_count = 5;        // Max probes before dropping connection
};

// ============================================================================
// ServerConfig
// ============================================================================

struct ServerConfig {
  static constexpr uint16_t kDefaultPort = 1357;
  // A SEND_MESSAGE content is stored as one blob, bounded by SQLite's
  // default SQLITE_MAX_LENGTH of 1e9 bytes.
  static constexpr uint32_t kMaxPayloadLimit = 1000000000u - static_cast<uint32_t>(kSendHeaderSize);

  uint16_t port = kDefaultPort;
  std::string bind_addr;  // empty = any
  std::string db_path = "mbox.db";
  std::string port_file = "myport.info";

  size_t max_connections = 512;
  uint32_t max_payload_size = 4 * 1024 * 1024;
  size_t read_chunk_size = 4096;
  int poll_timeout_ms = 1000;
  uint32_t idle_timeout_ms = 30000;
  uint32_t shutdown_grace_ms = 2000;

  TcpTuning tcp_tuning;
};

// Port number from the first token of a text file. Missing file, empty file
// or a value outside 1..65535 is kInvalidConfig.
expected<uint16_t, ErrorCode> read_port_file(const std::string& path);

// Apply command line options on top of `config`. `--help` stops parsing and
// sets `help_requested`; `--log-level` is applied to Logger directly.
// Unknown options, missing values and values that do not parse are
// kInvalidConfig.
expected<void, ErrorCode> parse_args(int argc, const char* const* argv, ServerConfig& config,
                                     bool* help_requested = nullptr);

// Rejects zero sizes and counts, and a max_payload_size above
// ServerConfig::kMaxPayloadLimit.
expected<void, ErrorCode> validate(const ServerConfig& config);

std::string usage(const char* program);

}  // namespace mbox

#endif  // MBOX_CONFIG_HPP_

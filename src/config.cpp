#include "mbox/config.hpp"

#include "mbox/log.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <fstream>
#include <limits>
#include <sstream>
#include <string>

namespace mbox {

namespace {

expected<void, ErrorCode> invalid(const std::string& msg) {
  MBOX_LOG_ERROR(msg);
  return expected<void, ErrorCode>::error(ErrorCode::kInvalidConfig);
}

// Whole-string unsigned parse within [min, max].
bool parse_unsigned(const char* text, uint64_t min, uint64_t max, uint64_t& out) {
  if (text == nullptr || *text == '\0' || *text == '-' || *text == '+') {
    return false;
  }
  errno = 0;
  char* end = nullptr;
  unsigned long long value = std::strtoull(text, &end, 10);
  if (errno != 0 || end == text || *end != '\0') {
    return false;
  }
  if (value < min || value > max) {
    return false;
  }
  out = static_cast<uint64_t>(value);
  return true;
}

}  // namespace

expected<uint16_t, ErrorCode> read_port_file(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    return expected<uint16_t, ErrorCode>::error(ErrorCode::kInvalidConfig);
  }
  std::string token;
  if (!(in >> token)) {
    return expected<uint16_t, ErrorCode>::error(ErrorCode::kInvalidConfig);
  }
  uint64_t port = 0;
  if (!parse_unsigned(token.c_str(), 1, std::numeric_limits<uint16_t>::max(), port)) {
    return expected<uint16_t, ErrorCode>::error(ErrorCode::kInvalidConfig);
  }
  return expected<uint16_t, ErrorCode>::success(static_cast<uint16_t>(port));
}

expected<void, ErrorCode> parse_args(int argc, const char* const* argv, ServerConfig& config, bool* help_requested) {
  if (help_requested != nullptr) {
    *help_requested = false;
  }

  for (int i = 1; i < argc; ++i) {
    const std::string opt = argv[i];

    if (opt == "--help" || opt == "-h") {
      if (help_requested != nullptr) {
        *help_requested = true;
      }
      return expected<void, ErrorCode>::success();
    }

    if (i + 1 >= argc) {
      return invalid("Missing value for option " + opt);
    }
    const char* value = argv[++i];
    uint64_t n = 0;

    if (opt == "--port") {
      // 0 asks the kernel for an ephemeral port.
      if (!parse_unsigned(value, 0, std::numeric_limits<uint16_t>::max(), n)) {
        return invalid(std::string("Invalid port: ") + value);
      }
      config.port = static_cast<uint16_t>(n);
    } else if (opt == "--bind") {
      config.bind_addr = value;
    } else if (opt == "--db") {
      config.db_path = value;
    } else if (opt == "--port-file") {
      config.port_file = value;
    } else if (opt == "--max-connections") {
      if (!parse_unsigned(value, 1, 1u << 20, n)) {
        return invalid(std::string("Invalid max connections: ") + value);
      }
      config.max_connections = static_cast<size_t>(n);
    } else if (opt == "--max-payload") {
      if (!parse_unsigned(value, 1, ServerConfig::kMaxPayloadLimit, n)) {
        return invalid(std::string("Invalid max payload: ") + value);
      }
      config.max_payload_size = static_cast<uint32_t>(n);
    } else if (opt == "--idle-timeout") {
      if (!parse_unsigned(value, 0, std::numeric_limits<uint32_t>::max(), n)) {
        return invalid(std::string("Invalid idle timeout: ") + value);
      }
      config.idle_timeout_ms = static_cast<uint32_t>(n);
    } else if (opt == "--grace") {
      if (!parse_unsigned(value, 0, std::numeric_limits<uint32_t>::max(), n)) {
        return invalid(std::string("Invalid shutdown grace: ") + value);
      }
      config.shutdown_grace_ms = static_cast<uint32_t>(n);
    } else if (opt == "--log-level") {
      Logger::Level level;
      if (!Logger::parse_level(value, level)) {
        return invalid(std::string("Invalid log level: ") + value);
      }
      Logger::set_level(level);
    } else {
      return invalid("Unknown option " + opt);
    }
  }
  return expected<void, ErrorCode>::success();
}

expected<void, ErrorCode> validate(const ServerConfig& config) {
  if (config.read_chunk_size == 0) {
    return invalid("read_chunk_size must be positive");
  }
  if (config.max_connections == 0) {
    return invalid("max_connections must be positive");
  }
  if (config.max_payload_size == 0) {
    return invalid("max_payload_size must be positive");
  }
  if (config.max_payload_size > ServerConfig::kMaxPayloadLimit) {
    return invalid("max_payload_size exceeds " + std::to_string(ServerConfig::kMaxPayloadLimit));
  }
  if (config.poll_timeout_ms <= 0) {
    return invalid("poll_timeout_ms must be positive");
  }
  return expected<void, ErrorCode>::success();
}

std::string usage(const char* program) {
  std::ostringstream oss;
  oss << "Usage: " << (program ? program : "mbox_server") << " [options]\n"
      << "  --port <n>             listen port (default: from port file, else "
      << ServerConfig::kDefaultPort << ")\n"
      << "  --bind <addr>          bind address (default: any)\n"
      << "  --db <path>            database file (default: mbox.db)\n"
      << "  --port-file <path>     port file (default: myport.info)\n"
      << "  --max-connections <n>  concurrent connection limit\n"
      << "  --max-payload <bytes>  largest accepted request payload\n"
      << "  --idle-timeout <ms>    close connections idle this long\n"
      << "  --grace <ms>           time to flush responses on shutdown\n"
      << "  --log-level <level>    DEBUG, INFO, WARN or ERROR\n"
      << "  --help                 show this message\n";
  return oss.str();
}

}  // namespace mbox

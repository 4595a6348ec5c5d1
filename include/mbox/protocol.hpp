#ifndef MBOX_PROTOCOL_HPP_
#define MBOX_PROTOCOL_HPP_

#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <array>
#include <string>
#include <vector>

namespace mbox {

// ============================================================================
// Wire constants
// ============================================================================

static constexpr size_t kClientIdSize = 16;
static constexpr size_t kNameSize = 255;
static constexpr size_t kPublicKeySize = 160;

// client_id[16] | version u8 | code u16 | payload_size u32
static constexpr size_t kRequestHeaderSize = kClientIdSize + 1 + 2 + 4;
// version u8 | code u16 | payload_size u32
static constexpr size_t kResponseHeaderSize = 1 + 2 + 4;

// SEND_MESSAGE fixed part: recipient_id[16] | type u8 | content_size u32
static constexpr size_t kSendHeaderSize = kClientIdSize + 1 + 4;
// PENDING_MESSAGES record prefix: sender_id[16] | id u32 | type u8 | size u32
static constexpr size_t kPendingRecordHeaderSize = kClientIdSize + 4 + 1 + 4;
// Largest response payload that keeps the whole frame within a u32 length.
static constexpr size_t kMaxResponsePayload = UINT32_MAX - kResponseHeaderSize;

static constexpr uint8_t kProtocolVersion = 2;
static constexpr uint8_t kMinClientVersion = 1;

using ClientId = std::array<uint8_t, kClientIdSize>;
using PublicKey = std::array<uint8_t, kPublicKeySize>;

enum class RequestCode : uint16_t {
  kRegister = 600,
  kClientList = 601,
  kPublicKey = 602,
  kSendMessage = 603,
  kPendingMessages = 604,
};

enum class ResponseCode : uint16_t {
  kRegistered = 2100,
  kClientList = 2101,
  kPublicKey = 2102,
  kMessageSent = 2103,
  kPendingMessages = 2104,
  kError = 9000,
  kNameTaken = 9001,
  kUnknownClient = 9002,
  kMalformedRequest = 9003,
};

// Message types are carried through untouched; the server only rejects 0.
enum class MessageType : uint8_t {
  kKeyRequest = 1,
  kKeySend = 2,
  kText = 3,
  kFile = 4,
};

// ============================================================================
// Frame structures
// ============================================================================

struct RequestHeader {
  ClientId client_id{};
  uint8_t version = 0;
  RequestCode code = RequestCode::kRegister;
  uint32_t payload_size = 0;
};

// Decoded request. Only the fields belonging to `header.code` are set.
struct Request {
  RequestHeader header;

  // REGISTER
  std::string name;
  PublicKey public_key{};

  // PUBLIC_KEY (target) and SEND_MESSAGE (recipient)
  ClientId target_id{};

  // SEND_MESSAGE
  uint8_t message_type = 0;
  std::vector<uint8_t> content;
};

struct ResponseHeader {
  uint8_t version = kProtocolVersion;
  ResponseCode code = ResponseCode::kError;
  uint32_t payload_size = 0;
};

struct Response {
  uint8_t version = kProtocolVersion;
  ResponseCode code = ResponseCode::kError;
  std::vector<uint8_t> payload;
};

// ============================================================================
// Little-endian helpers
// ============================================================================

namespace wire {

inline void put_u16(uint8_t* out, uint16_t v) {
  out[0] = static_cast<uint8_t>(v & 0xFF);
  out[1] = static_cast<uint8_t>((v >> 8) & 0xFF);
}

inline void put_u32(uint8_t* out, uint32_t v) {
  out[0] = static_cast<uint8_t>(v & 0xFF);
  out[1] = static_cast<uint8_t>((v >> 8) & 0xFF);
  out[2] = static_cast<uint8_t>((v >> 16) & 0xFF);
  out[3] = static_cast<uint8_t>((v >> 24) & 0xFF);
}

inline uint16_t get_u16(const uint8_t* in) {
  return static_cast<uint16_t>(in[0] | (static_cast<uint16_t>(in[1]) << 8));
}

inline uint32_t get_u32(const uint8_t* in) {
  return static_cast<uint32_t>(in[0]) | (static_cast<uint32_t>(in[1]) << 8) |
         (static_cast<uint32_t>(in[2]) << 16) | (static_cast<uint32_t>(in[3]) << 24);
}

inline void append_u8(std::vector<uint8_t>& out, uint8_t v) { out.push_back(v); }

inline void append_u16(std::vector<uint8_t>& out, uint16_t v) {
  uint8_t b[2];
  put_u16(b, v);
  out.insert(out.end(), b, b + 2);
}

inline void append_u32(std::vector<uint8_t>& out, uint32_t v) {
  uint8_t b[4];
  put_u32(b, v);
  out.insert(out.end(), b, b + 4);
}

inline void append_bytes(std::vector<uint8_t>& out, const uint8_t* data, size_t len) {
  out.insert(out.end(), data, data + len);
}

// Writes `name` into a fixed NUL-padded field of `field_size` bytes. Names
// that do not fit are truncated so the field always ends with a NUL.
void append_padded_name(std::vector<uint8_t>& out, const std::string& name, size_t field_size = kNameSize);

bool is_known_request_code(uint16_t code);

// ============================================================================
// Codec
// ============================================================================

// Parse the fixed request header. Fails with kMalformedHeader on short input,
// unsupported version, unknown request code, or a payload size above
// `max_payload_size`.
expected<RequestHeader, ErrorCode> decode_header(const uint8_t* data, size_t len, uint32_t max_payload_size);

// Parse the payload for `header.code`. `len` must equal header.payload_size.
// Fails with kMalformedPayload when the shape does not match the code.
expected<Request, ErrorCode> decode_request(const RequestHeader& header, const uint8_t* payload, size_t len);

// header + payload, total size kResponseHeaderSize + payload.size(). A
// payload above kMaxResponsePayload is never truncated: the frame becomes a
// bare kError response instead.
std::vector<uint8_t> encode_response(const Response& response);

expected<ResponseHeader, ErrorCode> decode_response_header(const uint8_t* data, size_t len);

// Client side: header (payload_size is taken from `payload`) + payload.
std::vector<uint8_t> encode_request(const ClientId& client_id, RequestCode code, const std::vector<uint8_t>& payload,
                                    uint8_t version = kProtocolVersion);

// Client side payload builders.
std::vector<uint8_t> encode_register_payload(const std::string& name, const PublicKey& key);
std::vector<uint8_t> encode_send_payload(const ClientId& recipient, uint8_t type, const std::vector<uint8_t>& content);

std::string client_id_hex(const ClientId& id);

}  // namespace wire

}  // namespace mbox

#endif  // MBOX_PROTOCOL_HPP_

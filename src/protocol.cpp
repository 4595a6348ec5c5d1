#include "mbox/protocol.hpp"

#include <algorithm>
#include <cstring>

namespace mbox {
namespace wire {

void append_padded_name(std::vector<uint8_t>& out, const std::string& name, size_t field_size) {
  size_t len = std::min(name.size(), field_size - 1);
  out.insert(out.end(), name.begin(), name.begin() + static_cast<std::ptrdiff_t>(len));
  out.insert(out.end(), field_size - len, static_cast<uint8_t>(0));
}

bool is_known_request_code(uint16_t code) {
  switch (static_cast<RequestCode>(code)) {
    case RequestCode::kRegister:
    case RequestCode::kClientList:
    case RequestCode::kPublicKey:
    case RequestCode::kSendMessage:
    case RequestCode::kPendingMessages:
      return true;
  }
  return false;
}

expected<RequestHeader, ErrorCode> decode_header(const uint8_t* data, size_t len, uint32_t max_payload_size) {
  if (data == nullptr || len < kRequestHeaderSize) {
    return expected<RequestHeader, ErrorCode>::error(ErrorCode::kMalformedHeader);
  }

  RequestHeader header;
  std::memcpy(header.client_id.data(), data, kClientIdSize);
  size_t pos = kClientIdSize;
  header.version = data[pos];
  pos += 1;
  uint16_t code = get_u16(data + pos);
  pos += 2;
  header.payload_size = get_u32(data + pos);

  if (header.version < kMinClientVersion || header.version > kProtocolVersion) {
    return expected<RequestHeader, ErrorCode>::error(ErrorCode::kMalformedHeader);
  }
  if (!is_known_request_code(code)) {
    return expected<RequestHeader, ErrorCode>::error(ErrorCode::kMalformedHeader);
  }
  if (header.payload_size > max_payload_size) {
    return expected<RequestHeader, ErrorCode>::error(ErrorCode::kMalformedHeader);
  }

  header.code = static_cast<RequestCode>(code);
  return expected<RequestHeader, ErrorCode>::success(header);
}

namespace {

// Name field: printable ASCII, at least one character, NUL terminated within
// the field. Padding after the terminator is ignored.
bool decode_name(const uint8_t* field, std::string& out) {
  const void* nul = std::memchr(field, 0, kNameSize);
  if (nul == nullptr) {
    return false;
  }
  size_t len = static_cast<size_t>(static_cast<const uint8_t*>(nul) - field);
  if (len == 0) {
    return false;
  }
  for (size_t i = 0; i < len; ++i) {
    if (field[i] < 0x20 || field[i] > 0x7E) {
      return false;
    }
  }
  out.assign(reinterpret_cast<const char*>(field), len);
  return true;
}

}  // namespace

expected<Request, ErrorCode> decode_request(const RequestHeader& header, const uint8_t* payload, size_t len) {
  auto malformed = []() { return expected<Request, ErrorCode>::error(ErrorCode::kMalformedPayload); };

  if (len != header.payload_size || (len > 0 && payload == nullptr)) {
    return malformed();
  }

  Request request;
  request.header = header;

  switch (header.code) {
    case RequestCode::kRegister:
      if (len != kNameSize + kPublicKeySize) {
        return malformed();
      }
      if (!decode_name(payload, request.name)) {
        return malformed();
      }
      std::memcpy(request.public_key.data(), payload + kNameSize, kPublicKeySize);
      break;

    case RequestCode::kClientList:
    case RequestCode::kPendingMessages:
      if (len != 0) {
        return malformed();
      }
      break;

    case RequestCode::kPublicKey:
      if (len != kClientIdSize) {
        return malformed();
      }
      std::memcpy(request.target_id.data(), payload, kClientIdSize);
      break;

    case RequestCode::kSendMessage: {
      if (len < kSendHeaderSize) {
        return malformed();
      }
      std::memcpy(request.target_id.data(), payload, kClientIdSize);
      request.message_type = payload[kClientIdSize];
      uint32_t content_size = get_u32(payload + kClientIdSize + 1);
      if (request.message_type == 0) {
        return malformed();
      }
      if (static_cast<uint64_t>(content_size) != static_cast<uint64_t>(len - kSendHeaderSize)) {
        return malformed();
      }
      request.content.assign(payload + kSendHeaderSize, payload + len);
      break;
    }

    default:
      return malformed();
  }

  return expected<Request, ErrorCode>::success(std::move(request));
}

std::vector<uint8_t> encode_response(const Response& response) {
  if (response.payload.size() > kMaxResponsePayload) {
    Response overflow;
    overflow.version = response.version;
    overflow.code = ResponseCode::kError;
    return encode_response(overflow);
  }

  std::vector<uint8_t> out;
  out.reserve(kResponseHeaderSize + response.payload.size());
  append_u8(out, response.version);
  append_u16(out, static_cast<uint16_t>(response.code));
  append_u32(out, static_cast<uint32_t>(response.payload.size()));
  out.insert(out.end(), response.payload.begin(), response.payload.end());
  return out;
}

expected<ResponseHeader, ErrorCode> decode_response_header(const uint8_t* data, size_t len) {
  if (data == nullptr || len < kResponseHeaderSize) {
    return expected<ResponseHeader, ErrorCode>::error(ErrorCode::kMalformedHeader);
  }
  ResponseHeader header;
  header.version = data[0];
  header.code = static_cast<ResponseCode>(get_u16(data + 1));
  header.payload_size = get_u32(data + 3);
  return expected<ResponseHeader, ErrorCode>::success(header);
}

std::vector<uint8_t> encode_request(const ClientId& client_id, RequestCode code, const std::vector<uint8_t>& payload,
                                    uint8_t version) {
  std::vector<uint8_t> out;
  out.reserve(kRequestHeaderSize + payload.size());
  append_bytes(out, client_id.data(), client_id.size());
  append_u8(out, version);
  append_u16(out, static_cast<uint16_t>(code));
  append_u32(out, static_cast<uint32_t>(payload.size()));
  out.insert(out.end(), payload.begin(), payload.end());
  return out;
}

std::vector<uint8_t> encode_register_payload(const std::string& name, const PublicKey& key) {
  std::vector<uint8_t> out;
  out.reserve(kNameSize + kPublicKeySize);
  append_padded_name(out, name);
  append_bytes(out, key.data(), key.size());
  return out;
}

std::vector<uint8_t> encode_send_payload(const ClientId& recipient, uint8_t type, const std::vector<uint8_t>& content) {
  std::vector<uint8_t> out;
  out.reserve(kSendHeaderSize + content.size());
  append_bytes(out, recipient.data(), recipient.size());
  append_u8(out, type);
  append_u32(out, static_cast<uint32_t>(content.size()));
  out.insert(out.end(), content.begin(), content.end());
  return out;
}

std::string client_id_hex(const ClientId& id) {
  static constexpr const char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(id.size() * 2);
  for (uint8_t b : id) {
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0x0F]);
  }
  return out;
}

}  // namespace wire
}  // namespace mbox

#include "mbox/response_builder.hpp"

#include "mbox/log.hpp"

#include <exception>
#include <string>

namespace mbox {

namespace {

// False when the encoded payload would not fit a response frame.
bool encode_outcome(const Outcome& outcome, Response& response) {
  std::vector<uint8_t>& out = response.payload;

  switch (outcome.request) {
    case RequestCode::kRegister:
      response.code = ResponseCode::kRegistered;
      wire::append_bytes(out, outcome.client_id.data(), outcome.client_id.size());
      break;

    case RequestCode::kClientList:
      response.code = ResponseCode::kClientList;
      out.reserve(outcome.clients.size() * (kClientIdSize + kNameSize));
      for (const auto& client : outcome.clients) {
        wire::append_bytes(out, client.id.data(), client.id.size());
        wire::append_padded_name(out, client.name);
      }
      break;

    case RequestCode::kPublicKey:
      response.code = ResponseCode::kPublicKey;
      wire::append_bytes(out, outcome.client_id.data(), outcome.client_id.size());
      wire::append_bytes(out, outcome.public_key.data(), outcome.public_key.size());
      break;

    case RequestCode::kSendMessage:
      response.code = ResponseCode::kMessageSent;
      wire::append_bytes(out, outcome.client_id.data(), outcome.client_id.size());
      wire::append_u32(out, outcome.message_id);
      break;

    case RequestCode::kPendingMessages: {
      response.code = ResponseCode::kPendingMessages;
      size_t total = 0;
      for (const auto& msg : outcome.messages) {
        total += kPendingRecordHeaderSize + msg.payload.size();
      }
      if (total > kMaxResponsePayload) {
        return false;
      }
      out.reserve(total);
      for (const auto& msg : outcome.messages) {
        wire::append_bytes(out, msg.sender_id.data(), msg.sender_id.size());
        wire::append_u32(out, msg.id);
        wire::append_u8(out, msg.type);
        wire::append_u32(out, static_cast<uint32_t>(msg.payload.size()));
        wire::append_bytes(out, msg.payload.data(), msg.payload.size());
      }
      break;
    }
  }
  return true;
}

}  // namespace

ResponseCode ResponseBuilder::error_response_code(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::kNameTaken:
      return ResponseCode::kNameTaken;
    case ErrorCode::kUnknownClient:
      return ResponseCode::kUnknownClient;
    case ErrorCode::kMalformedPayload:
      return ResponseCode::kMalformedRequest;
    default:
      return ResponseCode::kError;
  }
}

Response ResponseBuilder::error(ErrorCode code) noexcept {
  Response response;
  response.code = error_response_code(code);
  return response;
}

Response ResponseBuilder::build(const HandlerResult& result) noexcept {
  if (!result.has_value()) {
    return error(result.get_error());
  }

  Response response;
  try {
    if (!encode_outcome(result.value(), response)) {
      MBOX_LOG_ERROR("Response payload exceeds the frame size limit");
      return error(ErrorCode::kInternalError);
    }
  } catch (const std::exception& e) {
    // Allocation failure while encoding a large mailbox.
    MBOX_LOG_ERROR(std::string("Response encoding failed: ") + e.what());
    return error(ErrorCode::kInternalError);
  }
  return response;
}

}  // namespace mbox

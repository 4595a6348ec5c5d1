#ifndef MBOX_RESPONSE_BUILDER_HPP_
#define MBOX_RESPONSE_BUILDER_HPP_

#include "protocol.hpp"
#include "store.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <vector>

namespace mbox {

// Result of one handler. `request` selects which of the other fields are
// meaningful:
//   kRegister         client_id
//   kClientList       clients
//   kPublicKey        client_id, public_key
//   kSendMessage      client_id (recipient), message_id
//   kPendingMessages  messages
struct Outcome {
  RequestCode request = RequestCode::kRegister;
  ClientId client_id{};
  PublicKey public_key{};
  uint32_t message_id = 0;
  std::vector<ClientRecord> clients;
  std::vector<MessageRecord> messages;
};

using HandlerResult = expected<Outcome, ErrorCode>;

class ResponseBuilder {
 public:
  // Success outcome -> 21xx response, error -> 900x. Never throws.
  static Response build(const HandlerResult& result) noexcept;

  // kNameTaken -> 9001, kUnknownClient -> 9002, kMalformedPayload -> 9003,
  // anything else -> 9000. Payload is always empty.
  static Response error(ErrorCode code) noexcept;

  static ResponseCode error_response_code(ErrorCode code) noexcept;
};

}  // namespace mbox

#endif  // MBOX_RESPONSE_BUILDER_HPP_

#include "mbox/dispatcher.hpp"

#include "mbox/log.hpp"

#include <exception>
#include <string>
#include <utility>

namespace mbox {

namespace {

HandlerResult fail(ErrorCode code) { return HandlerResult::error(code); }

const char* request_name(RequestCode code) {
  switch (code) {
    case RequestCode::kRegister:
      return "REGISTER";
    case RequestCode::kClientList:
      return "CLIENT_LIST";
    case RequestCode::kPublicKey:
      return "PUBLIC_KEY";
    case RequestCode::kSendMessage:
      return "SEND_MESSAGE";
    case RequestCode::kPendingMessages:
      return "PENDING_MESSAGES";
  }
  return "UNKNOWN";
}

}  // namespace

const Dispatcher::HandlerEntry Dispatcher::kHandlers[] = {
    {RequestCode::kRegister, &Dispatcher::on_register, false},
    {RequestCode::kClientList, &Dispatcher::on_client_list, true},
    {RequestCode::kPublicKey, &Dispatcher::on_public_key, true},
    {RequestCode::kSendMessage, &Dispatcher::on_send_message, true},
    {RequestCode::kPendingMessages, &Dispatcher::on_pending_messages, true},
};

const Dispatcher::HandlerEntry* Dispatcher::find_handler(RequestCode code) {
  for (const auto& entry : kHandlers) {
    if (entry.code == code) {
      return &entry;
    }
  }
  return nullptr;
}

Response Dispatcher::dispatch(const RequestHeader& header, const uint8_t* payload, size_t len) noexcept {
  try {
    auto request = wire::decode_request(header, payload, len);
    if (!request.has_value()) {
      MBOX_LOG_WARN(std::string("Malformed ") + request_name(header.code) + " payload (" + std::to_string(len) +
                    " bytes)");
      return ResponseBuilder::error(request.get_error());
    }
    return ResponseBuilder::build(handle(request.value()));
  } catch (const std::exception& e) {
    MBOX_LOG_ERROR(std::string("Dispatch failed: ") + e.what());
    return ResponseBuilder::error(ErrorCode::kInternalError);
  }
}

HandlerResult Dispatcher::handle(const Request& request) {
  const HandlerEntry* entry = find_handler(request.header.code);
  if (entry == nullptr) {
    return fail(ErrorCode::kMalformedHeader);
  }

  const ClientId& caller = request.header.client_id;
  if (entry->requires_identity) {
    auto client = store_.get_client(caller);
    if (!client.has_value()) {
      if (client.get_error() == ErrorCode::kUnknownClient) {
        MBOX_LOG_WARN(std::string(request_name(entry->code)) + " from unregistered client " +
                      wire::client_id_hex(caller));
      }
      return fail(client.get_error());
    }
  }

  HandlerResult result = entry->handler(store_, request);
  if (!result.has_value()) {
    if (result.get_error() == ErrorCode::kStoreFailure) {
      MBOX_LOG_ERROR(std::string(request_name(entry->code)) + " failed: store failure");
    } else {
      MBOX_LOG_DEBUG(std::string(request_name(entry->code)) + " rejected: " + error_code_name(result.get_error()));
    }
    return result;
  }

  // REGISTER: the caller is the client just created.
  const ClientId& seen = (entry->code == RequestCode::kRegister) ? result.value().client_id : caller;
  auto touched = store_.touch(seen);
  if (!touched.has_value()) {
    MBOX_LOG_WARN("Failed to update last_seen for " + wire::client_id_hex(seen) + ": " +
                  error_code_name(touched.get_error()));
  }
  return result;
}

// ============================================================================
// Handlers
// ============================================================================

HandlerResult Dispatcher::on_register(Store& store, const Request& request) {
  auto id = store.create_client(request.name, request.public_key);
  if (!id.has_value()) {
    return fail(id.get_error());
  }
  MBOX_LOG_INFO("Registered '" + request.name + "' as " + wire::client_id_hex(id.value()));

  Outcome outcome;
  outcome.request = RequestCode::kRegister;
  outcome.client_id = id.value();
  return HandlerResult::success(std::move(outcome));
}

HandlerResult Dispatcher::on_client_list(Store& store, const Request& request) {
  auto clients = store.list_clients(request.header.client_id);
  if (!clients.has_value()) {
    return fail(clients.get_error());
  }

  Outcome outcome;
  outcome.request = RequestCode::kClientList;
  outcome.clients = std::move(clients.value());
  return HandlerResult::success(std::move(outcome));
}

HandlerResult Dispatcher::on_public_key(Store& store, const Request& request) {
  auto client = store.get_client(request.target_id);
  if (!client.has_value()) {
    return fail(client.get_error());
  }

  Outcome outcome;
  outcome.request = RequestCode::kPublicKey;
  outcome.client_id = client.value().id;
  outcome.public_key = client.value().public_key;
  return HandlerResult::success(std::move(outcome));
}

HandlerResult Dispatcher::on_send_message(Store& store, const Request& request) {
  auto id = store.enqueue_message(request.target_id, request.header.client_id, request.message_type, request.content);
  if (!id.has_value()) {
    return fail(id.get_error());
  }
  MBOX_LOG_DEBUG("Message " + std::to_string(id.value()) + " queued for " + wire::client_id_hex(request.target_id));

  Outcome outcome;
  outcome.request = RequestCode::kSendMessage;
  outcome.client_id = request.target_id;
  outcome.message_id = id.value();
  return HandlerResult::success(std::move(outcome));
}

HandlerResult Dispatcher::on_pending_messages(Store& store, const Request& request) {
  auto messages = store.drain_messages(request.header.client_id);
  if (!messages.has_value()) {
    return fail(messages.get_error());
  }

  Outcome outcome;
  outcome.request = RequestCode::kPendingMessages;
  outcome.messages = std::move(messages.value());
  return HandlerResult::success(std::move(outcome));
}

}  // namespace mbox

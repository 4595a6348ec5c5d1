#ifndef MBOX_STORE_HPP_
#define MBOX_STORE_HPP_

#include "protocol.hpp"
#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <string>
#include <vector>

namespace mbox {

struct ClientRecord {
  ClientId id{};
  std::string name;
  PublicKey public_key{};
  int64_t last_seen = 0;  // unix seconds
};

struct MessageRecord {
  uint32_t id = 0;
  ClientId recipient_id{};
  ClientId sender_id{};
  uint8_t type = 0;
  std::vector<uint8_t> payload;
  int64_t created_at = 0;  // unix seconds
};

// ============================================================================
// Store - durable clients and per-recipient mailboxes
// ============================================================================
//
// Every operation is atomic and safe to call from several threads at once.
// Writes either commit completely or leave no trace. Errors:
//   kNameTaken      create_client with an existing name
//   kUnknownClient  get_client / enqueue_message on an absent id
//   kStoreFailure   any storage-level failure

class Store {
 public:
  virtual ~Store() = default;

  virtual expected<ClientId, ErrorCode> create_client(const std::string& name, const PublicKey& public_key) = 0;

  virtual expected<ClientRecord, ErrorCode> get_client(const ClientId& id) = 0;

  // All clients except `excluding`, in registration order, read as one
  // snapshot.
  virtual expected<std::vector<ClientRecord>, ErrorCode> list_clients(const ClientId& excluding) = 0;

  // Update last_seen to now. Touching an absent id is kUnknownClient.
  virtual expected<void, ErrorCode> touch(const ClientId& id) = 0;

  // Append to the recipient's mailbox and return the new message id.
  virtual expected<uint32_t, ErrorCode> enqueue_message(const ClientId& recipient_id, const ClientId& sender_id,
                                                        uint8_t type, const std::vector<uint8_t>& payload) = 0;

  // Remove and return the oldest messages addressed to `recipient_id`, in id
  // order, stopping before their encoded PENDING_MESSAGES records
  // (kPendingRecordHeaderSize + payload each) would exceed `byte_budget`. The
  // oldest message is always returned so the mailbox makes progress; the rest
  // stay queued for the next drain. The returned set is exactly the removed
  // set.
  virtual expected<std::vector<MessageRecord>, ErrorCode> drain_messages(const ClientId& recipient_id,
                                                                         size_t byte_budget) = 0;

  // Drain as much as fits in one response frame.
  expected<std::vector<MessageRecord>, ErrorCode> drain_messages(const ClientId& recipient_id) {
    return drain_messages(recipient_id, kMaxResponsePayload);
  }

  virtual expected<size_t, ErrorCode> client_count() = 0;
  virtual expected<size_t, ErrorCode> pending_count(const ClientId& recipient_id) = 0;
};

}  // namespace mbox

#endif  // MBOX_STORE_HPP_

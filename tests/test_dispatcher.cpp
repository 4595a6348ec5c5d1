#include "mbox/dispatcher.hpp"
#include "mbox/sqlite_store.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

using namespace mbox;

namespace {

PublicKey make_key(uint8_t seed) {
  PublicKey key{};
  key.fill(seed);
  return key;
}

Response call(Dispatcher& dispatcher, const ClientId& caller, RequestCode code,
              const std::vector<uint8_t>& payload = {}) {
  RequestHeader header;
  header.client_id = caller;
  header.version = kProtocolVersion;
  header.code = code;
  header.payload_size = static_cast<uint32_t>(payload.size());
  return dispatcher.dispatch(header, payload.data(), payload.size());
}

ClientId register_as(Dispatcher& dispatcher, const std::string& name, uint8_t key_seed = 0x42) {
  ClientId anonymous{};
  Response response = call(dispatcher, anonymous, RequestCode::kRegister,
                           wire::encode_register_payload(name, make_key(key_seed)));
  REQUIRE(response.code == ResponseCode::kRegistered);
  REQUIRE(response.payload.size() == kClientIdSize);
  ClientId id{};
  std::memcpy(id.data(), response.payload.data(), kClientIdSize);
  return id;
}

std::vector<uint8_t> text(const std::string& s) { return std::vector<uint8_t>(s.begin(), s.end()); }

// Delegates to a real store but fails selected operations.
class FaultyStore : public Store {
 public:
  bool fail_create = false;
  bool fail_list = false;
  bool fail_touch = false;
  bool fail_enqueue = false;
  bool fail_drain = false;
  int touch_calls = 0;
  size_t drain_budget = SIZE_MAX;

  expected<ClientId, ErrorCode> create_client(const std::string& name, const PublicKey& public_key) override {
    if (fail_create) {
      return expected<ClientId, ErrorCode>::error(ErrorCode::kStoreFailure);
    }
    return inner_.create_client(name, public_key);
  }

  expected<ClientRecord, ErrorCode> get_client(const ClientId& id) override { return inner_.get_client(id); }

  expected<std::vector<ClientRecord>, ErrorCode> list_clients(const ClientId& excluding) override {
    if (fail_list) {
      return expected<std::vector<ClientRecord>, ErrorCode>::error(ErrorCode::kStoreFailure);
    }
    return inner_.list_clients(excluding);
  }

  expected<void, ErrorCode> touch(const ClientId& id) override {
    ++touch_calls;
    if (fail_touch) {
      return expected<void, ErrorCode>::error(ErrorCode::kStoreFailure);
    }
    return inner_.touch(id);
  }

  expected<uint32_t, ErrorCode> enqueue_message(const ClientId& recipient_id, const ClientId& sender_id, uint8_t type,
                                                const std::vector<uint8_t>& payload) override {
    if (fail_enqueue) {
      return expected<uint32_t, ErrorCode>::error(ErrorCode::kStoreFailure);
    }
    return inner_.enqueue_message(recipient_id, sender_id, type, payload);
  }

  using Store::drain_messages;
  expected<std::vector<MessageRecord>, ErrorCode> drain_messages(const ClientId& recipient_id,
                                                                 size_t byte_budget) override {
    if (fail_drain) {
      return expected<std::vector<MessageRecord>, ErrorCode>::error(ErrorCode::kStoreFailure);
    }
    return inner_.drain_messages(recipient_id, std::min(byte_budget, drain_budget));
  }

  expected<size_t, ErrorCode> client_count() override { return inner_.client_count(); }

  expected<size_t, ErrorCode> pending_count(const ClientId& recipient_id) override {
    return inner_.pending_count(recipient_id);
  }

 private:
  SqliteStore inner_{":memory:"};
};

}  // namespace

// ============================================================================
// REGISTER
// ============================================================================

TEST_CASE("Dispatcher - register returns fresh id", "[dispatcher]") {
  SqliteStore store(":memory:");
  Dispatcher dispatcher(store);

  ClientId alice = register_as(dispatcher, "alice", 0x11);
  auto record = store.get_client(alice);
  REQUIRE(record.has_value());
  REQUIRE(record.value().name == "alice");
  REQUIRE(record.value().public_key == make_key(0x11));
}

TEST_CASE("Dispatcher - register ignores header client id", "[dispatcher]") {
  SqliteStore store(":memory:");
  Dispatcher dispatcher(store);

  ClientId claimed{};
  claimed.fill(0x77);
  Response response = call(dispatcher, claimed, RequestCode::kRegister,
                           wire::encode_register_payload("alice", make_key(1)));
  REQUIRE(response.code == ResponseCode::kRegistered);
  REQUIRE(std::memcmp(response.payload.data(), claimed.data(), kClientIdSize) != 0);
}

TEST_CASE("Dispatcher - duplicate name is 9001", "[dispatcher]") {
  SqliteStore store(":memory:");
  Dispatcher dispatcher(store);
  register_as(dispatcher, "alice");

  Response response = call(dispatcher, ClientId{}, RequestCode::kRegister,
                           wire::encode_register_payload("alice", make_key(2)));
  REQUIRE(response.code == ResponseCode::kNameTaken);
  REQUIRE(response.payload.empty());
  REQUIRE(store.client_count().value() == 1);
}

TEST_CASE("Dispatcher - malformed register payload is 9003", "[dispatcher]") {
  SqliteStore store(":memory:");
  Dispatcher dispatcher(store);

  SECTION("short payload") {
    Response response = call(dispatcher, ClientId{}, RequestCode::kRegister, std::vector<uint8_t>(100, 'a'));
    REQUIRE(response.code == ResponseCode::kMalformedRequest);
  }

  SECTION("empty name") {
    Response response = call(dispatcher, ClientId{}, RequestCode::kRegister,
                             wire::encode_register_payload("", make_key(1)));
    REQUIRE(response.code == ResponseCode::kMalformedRequest);
  }

  SECTION("name without terminator") {
    std::vector<uint8_t> payload(kNameSize, 'x');
    PublicKey key = make_key(1);
    payload.insert(payload.end(), key.begin(), key.end());
    Response response = call(dispatcher, ClientId{}, RequestCode::kRegister, payload);
    REQUIRE(response.code == ResponseCode::kMalformedRequest);
  }

  REQUIRE(store.client_count().value() == 0);
}

// ============================================================================
// Identity
// ============================================================================

TEST_CASE("Dispatcher - unregistered caller is 9002", "[dispatcher]") {
  SqliteStore store(":memory:");
  Dispatcher dispatcher(store);
  ClientId bob = register_as(dispatcher, "bob");

  ClientId stranger{};
  stranger.fill(0xAB);

  REQUIRE(call(dispatcher, stranger, RequestCode::kClientList).code == ResponseCode::kUnknownClient);
  REQUIRE(call(dispatcher, stranger, RequestCode::kPendingMessages).code == ResponseCode::kUnknownClient);
  REQUIRE(call(dispatcher, stranger, RequestCode::kPublicKey, std::vector<uint8_t>(bob.begin(), bob.end())).code ==
          ResponseCode::kUnknownClient);
  REQUIRE(call(dispatcher, stranger, RequestCode::kSendMessage, wire::encode_send_payload(bob, 3, text("hi"))).code ==
          ResponseCode::kUnknownClient);
  REQUIRE(store.pending_count(bob).value() == 0);
}

// ============================================================================
// CLIENT_LIST / PUBLIC_KEY
// ============================================================================

TEST_CASE("Dispatcher - client list excludes caller", "[dispatcher]") {
  SqliteStore store(":memory:");
  Dispatcher dispatcher(store);
  ClientId alice = register_as(dispatcher, "alice");
  ClientId bob = register_as(dispatcher, "bob");

  Response response = call(dispatcher, alice, RequestCode::kClientList);
  REQUIRE(response.code == ResponseCode::kClientList);
  REQUIRE(response.payload.size() == kClientIdSize + kNameSize);
  REQUIRE(std::memcmp(response.payload.data(), bob.data(), kClientIdSize) == 0);
  REQUIRE(std::string(reinterpret_cast<const char*>(response.payload.data() + kClientIdSize)) == "bob");
}

TEST_CASE("Dispatcher - client list for sole client is empty", "[dispatcher]") {
  SqliteStore store(":memory:");
  Dispatcher dispatcher(store);
  ClientId alice = register_as(dispatcher, "alice");

  Response response = call(dispatcher, alice, RequestCode::kClientList);
  REQUIRE(response.code == ResponseCode::kClientList);
  REQUIRE(response.payload.empty());
}

TEST_CASE("Dispatcher - client list with payload is 9003", "[dispatcher]") {
  SqliteStore store(":memory:");
  Dispatcher dispatcher(store);
  ClientId alice = register_as(dispatcher, "alice");

  REQUIRE(call(dispatcher, alice, RequestCode::kClientList, {1}).code == ResponseCode::kMalformedRequest);
}

TEST_CASE("Dispatcher - public key lookup", "[dispatcher]") {
  SqliteStore store(":memory:");
  Dispatcher dispatcher(store);
  ClientId alice = register_as(dispatcher, "alice", 0x01);
  ClientId bob = register_as(dispatcher, "bob", 0x02);

  Response response = call(dispatcher, alice, RequestCode::kPublicKey, std::vector<uint8_t>(bob.begin(), bob.end()));
  REQUIRE(response.code == ResponseCode::kPublicKey);
  REQUIRE(response.payload.size() == kClientIdSize + kPublicKeySize);
  REQUIRE(std::memcmp(response.payload.data(), bob.data(), kClientIdSize) == 0);
  PublicKey expected_key = make_key(0x02);
  REQUIRE(std::memcmp(response.payload.data() + kClientIdSize, expected_key.data(), kPublicKeySize) == 0);
}

TEST_CASE("Dispatcher - public key of unknown target is 9002", "[dispatcher]") {
  SqliteStore store(":memory:");
  Dispatcher dispatcher(store);
  ClientId alice = register_as(dispatcher, "alice");

  std::vector<uint8_t> ghost(kClientIdSize, 0xCD);
  REQUIRE(call(dispatcher, alice, RequestCode::kPublicKey, ghost).code == ResponseCode::kUnknownClient);
}

TEST_CASE("Dispatcher - public key with short payload is 9003", "[dispatcher]") {
  SqliteStore store(":memory:");
  Dispatcher dispatcher(store);
  ClientId alice = register_as(dispatcher, "alice");

  REQUIRE(call(dispatcher, alice, RequestCode::kPublicKey, std::vector<uint8_t>(8, 0)).code ==
          ResponseCode::kMalformedRequest);
}

// ============================================================================
// SEND_MESSAGE / PENDING_MESSAGES
// ============================================================================

TEST_CASE("Dispatcher - send then drain", "[dispatcher]") {
  SqliteStore store(":memory:");
  Dispatcher dispatcher(store);
  ClientId alice = register_as(dispatcher, "alice");
  ClientId bob = register_as(dispatcher, "bob");

  Response sent = call(dispatcher, alice, RequestCode::kSendMessage, wire::encode_send_payload(bob, 3, text("hello")));
  REQUIRE(sent.code == ResponseCode::kMessageSent);
  REQUIRE(sent.payload.size() == kClientIdSize + 4);
  REQUIRE(std::memcmp(sent.payload.data(), bob.data(), kClientIdSize) == 0);
  uint32_t message_id = wire::get_u32(sent.payload.data() + kClientIdSize);

  Response pending = call(dispatcher, bob, RequestCode::kPendingMessages);
  REQUIRE(pending.code == ResponseCode::kPendingMessages);
  REQUIRE(pending.payload.size() == kPendingRecordHeaderSize + 5);
  const uint8_t* p = pending.payload.data();
  REQUIRE(std::memcmp(p, alice.data(), kClientIdSize) == 0);
  REQUIRE(wire::get_u32(p + kClientIdSize) == message_id);
  REQUIRE(p[kClientIdSize + 4] == 3);
  REQUIRE(wire::get_u32(p + kClientIdSize + 5) == 5);
  REQUIRE(std::memcmp(p + kPendingRecordHeaderSize, "hello", 5) == 0);

  Response again = call(dispatcher, bob, RequestCode::kPendingMessages);
  REQUIRE(again.code == ResponseCode::kPendingMessages);
  REQUIRE(again.payload.empty());
}

TEST_CASE("Dispatcher - messages drain in send order", "[dispatcher]") {
  SqliteStore store(":memory:");
  Dispatcher dispatcher(store);
  ClientId alice = register_as(dispatcher, "alice");
  ClientId bob = register_as(dispatcher, "bob");

  call(dispatcher, alice, RequestCode::kSendMessage, wire::encode_send_payload(bob, 1, {}));
  call(dispatcher, alice, RequestCode::kSendMessage, wire::encode_send_payload(bob, 2, text("key")));
  call(dispatcher, alice, RequestCode::kSendMessage, wire::encode_send_payload(bob, 3, text("msg")));

  Response pending = call(dispatcher, bob, RequestCode::kPendingMessages);
  REQUIRE(pending.code == ResponseCode::kPendingMessages);
  REQUIRE(pending.payload.size() == 3 * kPendingRecordHeaderSize + 6);

  const uint8_t* p = pending.payload.data();
  uint32_t prev_id = 0;
  for (uint8_t expected_type = 1; expected_type <= 3; ++expected_type) {
    uint32_t id = wire::get_u32(p + kClientIdSize);
    REQUIRE(id > prev_id);
    prev_id = id;
    REQUIRE(p[kClientIdSize + 4] == expected_type);
    p += kPendingRecordHeaderSize + wire::get_u32(p + kClientIdSize + 5);
  }
  REQUIRE(p == pending.payload.data() + pending.payload.size());
}

TEST_CASE("Dispatcher - mailbox larger than one response drains over several requests", "[dispatcher]") {
  FaultyStore store;
  Dispatcher dispatcher(store);
  ClientId alice = register_as(dispatcher, "alice");
  ClientId bob = register_as(dispatcher, "bob");

  // Room for two 10-byte messages per response.
  store.drain_budget = 2 * (kPendingRecordHeaderSize + 10);
  for (uint8_t i = 1; i <= 5; ++i) {
    REQUIRE(call(dispatcher, alice, RequestCode::kSendMessage,
                 wire::encode_send_payload(bob, i, std::vector<uint8_t>(10, i)))
                .code == ResponseCode::kMessageSent);
  }

  std::vector<uint8_t> types;
  for (size_t expected_size : {2u, 2u, 1u, 0u}) {
    Response pending = call(dispatcher, bob, RequestCode::kPendingMessages);
    REQUIRE(pending.code == ResponseCode::kPendingMessages);
    REQUIRE(pending.payload.size() == expected_size * (kPendingRecordHeaderSize + 10));
    for (size_t off = 0; off < pending.payload.size(); off += kPendingRecordHeaderSize + 10) {
      types.push_back(pending.payload[off + kClientIdSize + 4]);
    }
  }
  REQUIRE(types == std::vector<uint8_t>({1, 2, 3, 4, 5}));
}

TEST_CASE("Dispatcher - send to unknown recipient is 9002", "[dispatcher]") {
  SqliteStore store(":memory:");
  Dispatcher dispatcher(store);
  ClientId alice = register_as(dispatcher, "alice");

  ClientId ghost{};
  ghost.fill(0x99);
  Response response =
      call(dispatcher, alice, RequestCode::kSendMessage, wire::encode_send_payload(ghost, 3, text("hi")));
  REQUIRE(response.code == ResponseCode::kUnknownClient);
  REQUIRE(store.pending_count(ghost).value() == 0);
}

TEST_CASE("Dispatcher - malformed send payload is 9003", "[dispatcher]") {
  SqliteStore store(":memory:");
  Dispatcher dispatcher(store);
  ClientId alice = register_as(dispatcher, "alice");
  ClientId bob = register_as(dispatcher, "bob");

  SECTION("content size disagrees with payload") {
    std::vector<uint8_t> payload = wire::encode_send_payload(bob, 3, text("hello"));
    payload.pop_back();
    REQUIRE(call(dispatcher, alice, RequestCode::kSendMessage, payload).code == ResponseCode::kMalformedRequest);
  }

  SECTION("type zero") {
    REQUIRE(call(dispatcher, alice, RequestCode::kSendMessage, wire::encode_send_payload(bob, 0, text("x"))).code ==
            ResponseCode::kMalformedRequest);
  }

  SECTION("truncated send header") {
    REQUIRE(call(dispatcher, alice, RequestCode::kSendMessage, std::vector<uint8_t>(10, 0)).code ==
            ResponseCode::kMalformedRequest);
  }

  REQUIRE(store.pending_count(bob).value() == 0);
}

TEST_CASE("Dispatcher - payload length disagreeing with header is 9003", "[dispatcher]") {
  SqliteStore store(":memory:");
  Dispatcher dispatcher(store);
  ClientId alice = register_as(dispatcher, "alice");

  RequestHeader header;
  header.client_id = alice;
  header.version = kProtocolVersion;
  header.code = RequestCode::kClientList;
  header.payload_size = 4;
  Response response = dispatcher.dispatch(header, nullptr, 0);
  REQUIRE(response.code == ResponseCode::kMalformedRequest);
}

TEST_CASE("Dispatcher - empty mailbox", "[dispatcher]") {
  SqliteStore store(":memory:");
  Dispatcher dispatcher(store);
  ClientId alice = register_as(dispatcher, "alice");

  Response response = call(dispatcher, alice, RequestCode::kPendingMessages);
  REQUIRE(response.code == ResponseCode::kPendingMessages);
  REQUIRE(response.payload.empty());
}

TEST_CASE("Dispatcher - version 1 clients are served", "[dispatcher]") {
  SqliteStore store(":memory:");
  Dispatcher dispatcher(store);
  ClientId alice = register_as(dispatcher, "alice");

  RequestHeader header;
  header.client_id = alice;
  header.version = kMinClientVersion;
  header.code = RequestCode::kPendingMessages;
  Response response = dispatcher.dispatch(header, nullptr, 0);
  REQUIRE(response.code == ResponseCode::kPendingMessages);
  REQUIRE(response.version == kProtocolVersion);
}

// ============================================================================
// last_seen and store failures
// ============================================================================

TEST_CASE("Dispatcher - successful requests touch the caller", "[dispatcher]") {
  FaultyStore store;
  Dispatcher dispatcher(store);
  ClientId alice = register_as(dispatcher, "alice");
  REQUIRE(store.touch_calls == 1);

  call(dispatcher, alice, RequestCode::kClientList);
  REQUIRE(store.touch_calls == 2);

  // Rejected requests leave last_seen alone.
  call(dispatcher, alice, RequestCode::kClientList, {1});
  REQUIRE(store.touch_calls == 2);
}

TEST_CASE("Dispatcher - touch failure does not fail the request", "[dispatcher]") {
  FaultyStore store;
  Dispatcher dispatcher(store);
  ClientId alice = register_as(dispatcher, "alice");

  store.fail_touch = true;
  REQUIRE(call(dispatcher, alice, RequestCode::kPendingMessages).code == ResponseCode::kPendingMessages);
}

TEST_CASE("Dispatcher - store failures are 9000", "[dispatcher]") {
  FaultyStore store;
  Dispatcher dispatcher(store);
  ClientId alice = register_as(dispatcher, "alice");
  ClientId bob = register_as(dispatcher, "bob");

  store.fail_create = true;
  REQUIRE(call(dispatcher, ClientId{}, RequestCode::kRegister, wire::encode_register_payload("carol", make_key(3)))
              .code == ResponseCode::kError);

  store.fail_list = true;
  REQUIRE(call(dispatcher, alice, RequestCode::kClientList).code == ResponseCode::kError);

  store.fail_enqueue = true;
  REQUIRE(call(dispatcher, alice, RequestCode::kSendMessage, wire::encode_send_payload(bob, 3, text("x"))).code ==
          ResponseCode::kError);

  store.fail_drain = true;
  Response response = call(dispatcher, bob, RequestCode::kPendingMessages);
  REQUIRE(response.code == ResponseCode::kError);
  REQUIRE(response.payload.empty());
}

TEST_CASE("Dispatcher - failed drain keeps messages", "[dispatcher]") {
  FaultyStore store;
  Dispatcher dispatcher(store);
  ClientId alice = register_as(dispatcher, "alice");
  ClientId bob = register_as(dispatcher, "bob");

  call(dispatcher, alice, RequestCode::kSendMessage, wire::encode_send_payload(bob, 3, text("kept")));
  store.fail_drain = true;
  REQUIRE(call(dispatcher, bob, RequestCode::kPendingMessages).code == ResponseCode::kError);
  REQUIRE(store.pending_count(bob).value() == 1);

  store.fail_drain = false;
  Response response = call(dispatcher, bob, RequestCode::kPendingMessages);
  REQUIRE(response.code == ResponseCode::kPendingMessages);
  REQUIRE(response.payload.size() == kPendingRecordHeaderSize + 4);
}

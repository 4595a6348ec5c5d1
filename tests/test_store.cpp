#include "mbox/sqlite_store.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace mbox;

namespace {

PublicKey make_key(uint8_t seed) {
  PublicKey key{};
  key.fill(seed);
  return key;
}

ClientId register_client(Store& store, const std::string& name) {
  auto id = store.create_client(name, make_key(static_cast<uint8_t>(name.size())));
  REQUIRE(id.has_value());
  return id.value();
}

std::string temp_db_path(const char* tag) {
  return std::string("/tmp/mbox_store_") + tag + "_" + std::to_string(::getpid()) + ".db";
}

void remove_db(const std::string& path) {
  std::remove(path.c_str());
  std::remove((path + "-wal").c_str());
  std::remove((path + "-shm").c_str());
}

}  // namespace

// ============================================================================
// Clients
// ============================================================================

TEST_CASE("Store - create and get client", "[store]") {
  SqliteStore store(":memory:");
  auto id = store.create_client("alice", make_key(0x5A));
  REQUIRE(id.has_value());

  auto client = store.get_client(id.value());
  REQUIRE(client.has_value());
  REQUIRE(client.value().id == id.value());
  REQUIRE(client.value().name == "alice");
  REQUIRE(client.value().public_key == make_key(0x5A));
  REQUIRE(client.value().last_seen > 0);
}

TEST_CASE("Store - client ids are random UUIDv4", "[store]") {
  SqliteStore store(":memory:");
  std::set<ClientId> ids;
  for (int i = 0; i < 50; ++i) {
    ClientId id = register_client(store, "client" + std::to_string(i));
    REQUIRE((id[6] & 0xF0) == 0x40);
    REQUIRE((id[8] & 0xC0) == 0x80);
    ids.insert(id);
  }
  REQUIRE(ids.size() == 50);
}

TEST_CASE("Store - duplicate name rejected", "[store]") {
  SqliteStore store(":memory:");
  register_client(store, "alice");

  auto again = store.create_client("alice", make_key(1));
  REQUIRE(!again.has_value());
  REQUIRE(again.get_error() == ErrorCode::kNameTaken);
  REQUIRE(store.client_count().value() == 1);
}

TEST_CASE("Store - names are case-sensitive", "[store]") {
  SqliteStore store(":memory:");
  register_client(store, "alice");
  REQUIRE(store.create_client("Alice", make_key(1)).has_value());
  REQUIRE(store.client_count().value() == 2);
}

TEST_CASE("Store - unknown client", "[store]") {
  SqliteStore store(":memory:");
  ClientId ghost{};
  ghost.fill(0xEE);

  auto client = store.get_client(ghost);
  REQUIRE(!client.has_value());
  REQUIRE(client.get_error() == ErrorCode::kUnknownClient);

  auto touched = store.touch(ghost);
  REQUIRE(!touched.has_value());
  REQUIRE(touched.get_error() == ErrorCode::kUnknownClient);
}

TEST_CASE("Store - list excludes caller in registration order", "[store]") {
  SqliteStore store(":memory:");
  ClientId alice = register_client(store, "alice");
  ClientId bob = register_client(store, "bob");
  ClientId carol = register_client(store, "carol");

  auto list = store.list_clients(alice);
  REQUIRE(list.has_value());
  REQUIRE(list.value().size() == 2);
  REQUIRE(list.value()[0].id == bob);
  REQUIRE(list.value()[0].name == "bob");
  REQUIRE(list.value()[1].id == carol);

  ClientId nobody{};
  REQUIRE(store.list_clients(nobody).value().size() == 3);
}

TEST_CASE("Store - touch known client", "[store]") {
  SqliteStore store(":memory:");
  ClientId alice = register_client(store, "alice");
  REQUIRE(store.touch(alice).has_value());
  REQUIRE(store.get_client(alice).value().last_seen > 0);
}

// ============================================================================
// Mailboxes
// ============================================================================

TEST_CASE("Store - enqueue to unknown recipient leaves nothing behind", "[store]") {
  SqliteStore store(":memory:");
  ClientId alice = register_client(store, "alice");
  ClientId ghost{};
  ghost.fill(0x01);

  auto sent = store.enqueue_message(ghost, alice, 3, {1, 2, 3});
  REQUIRE(!sent.has_value());
  REQUIRE(sent.get_error() == ErrorCode::kUnknownClient);
  REQUIRE(store.pending_count(ghost).value() == 0);

  // The next successful insert is unaffected by the rolled back attempt.
  ClientId bob = register_client(store, "bob");
  REQUIRE(store.enqueue_message(bob, alice, 3, {1}).has_value());
  REQUIRE(store.pending_count(bob).value() == 1);
}

TEST_CASE("Store - drain returns messages oldest first and empties mailbox", "[store]") {
  SqliteStore store(":memory:");
  ClientId alice = register_client(store, "alice");
  ClientId bob = register_client(store, "bob");

  uint32_t last = 0;
  for (uint8_t i = 1; i <= 5; ++i) {
    auto id = store.enqueue_message(bob, alice, 3, std::vector<uint8_t>(i, i));
    REQUIRE(id.has_value());
    REQUIRE(id.value() > last);
    last = id.value();
  }
  REQUIRE(store.pending_count(bob).value() == 5);

  auto drained = store.drain_messages(bob);
  REQUIRE(drained.has_value());
  REQUIRE(drained.value().size() == 5);
  for (size_t i = 0; i < 5; ++i) {
    const MessageRecord& msg = drained.value()[i];
    REQUIRE(msg.sender_id == alice);
    REQUIRE(msg.recipient_id == bob);
    REQUIRE(msg.type == 3);
    REQUIRE(msg.payload.size() == i + 1);
    if (i > 0) {
      REQUIRE(msg.id > drained.value()[i - 1].id);
    }
  }

  auto again = store.drain_messages(bob);
  REQUIRE(again.has_value());
  REQUIRE(again.value().empty());
}

TEST_CASE("Store - empty payload round trip", "[store]") {
  SqliteStore store(":memory:");
  ClientId alice = register_client(store, "alice");
  ClientId bob = register_client(store, "bob");

  REQUIRE(store.enqueue_message(bob, alice, 1, {}).has_value());
  auto drained = store.drain_messages(bob);
  REQUIRE(drained.value().size() == 1);
  REQUIRE(drained.value()[0].payload.empty());
  REQUIRE(drained.value()[0].type == 1);
}

TEST_CASE("Store - drain only touches the recipient's mailbox", "[store]") {
  SqliteStore store(":memory:");
  ClientId alice = register_client(store, "alice");
  ClientId bob = register_client(store, "bob");

  store.enqueue_message(bob, alice, 3, {1});
  store.enqueue_message(alice, bob, 3, {2});

  REQUIRE(store.drain_messages(bob).value().size() == 1);
  REQUIRE(store.pending_count(alice).value() == 1);
}

TEST_CASE("Store - message ids are never reused", "[store]") {
  SqliteStore store(":memory:");
  ClientId alice = register_client(store, "alice");
  ClientId bob = register_client(store, "bob");

  uint32_t first = store.enqueue_message(bob, alice, 3, {1}).value();
  store.drain_messages(bob);
  uint32_t second = store.enqueue_message(bob, alice, 3, {1}).value();
  REQUIRE(second > first);
}

TEST_CASE("Store - drain stops at the byte budget and keeps the rest queued", "[store]") {
  SqliteStore store(":memory:");
  ClientId alice = register_client(store, "alice");
  ClientId bob = register_client(store, "bob");

  constexpr size_t kRecord = kPendingRecordHeaderSize + 100;
  for (uint8_t i = 1; i <= 5; ++i) {
    REQUIRE(store.enqueue_message(bob, alice, i, std::vector<uint8_t>(100, i)).has_value());
  }

  // Two full records fit, a third would overflow by one byte.
  auto first = store.drain_messages(bob, 3 * kRecord - 1);
  REQUIRE(first.has_value());
  REQUIRE(first.value().size() == 2);
  REQUIRE(first.value()[0].type == 1);
  REQUIRE(first.value()[1].type == 2);
  REQUIRE(store.pending_count(bob).value() == 3);

  auto second = store.drain_messages(bob, 3 * kRecord);
  REQUIRE(second.value().size() == 3);
  REQUIRE(second.value()[0].type == 3);
  REQUIRE(second.value()[2].type == 5);
  REQUIRE(second.value()[0].id > first.value()[1].id);
  REQUIRE(store.pending_count(bob).value() == 0);
}

TEST_CASE("Store - oldest message is returned even above the budget", "[store]") {
  SqliteStore store(":memory:");
  ClientId alice = register_client(store, "alice");
  ClientId bob = register_client(store, "bob");
  store.enqueue_message(bob, alice, 1, std::vector<uint8_t>(64, 1));
  store.enqueue_message(bob, alice, 2, {2});

  auto drained = store.drain_messages(bob, 10);
  REQUIRE(drained.has_value());
  REQUIRE(drained.value().size() == 1);
  REQUIRE(drained.value()[0].payload.size() == 64);
  REQUIRE(store.pending_count(bob).value() == 1);
}

TEST_CASE("Store - self-addressed message", "[store]") {
  SqliteStore store(":memory:");
  ClientId alice = register_client(store, "alice");
  REQUIRE(store.enqueue_message(alice, alice, 3, {9}).has_value());
  auto drained = store.drain_messages(alice);
  REQUIRE(drained.value().size() == 1);
  REQUIRE(drained.value()[0].sender_id == alice);
}

// ============================================================================
// Durability and concurrency
// ============================================================================

TEST_CASE("Store - data survives reopen", "[store]") {
  std::string path = temp_db_path("reopen");
  remove_db(path);

  ClientId alice{};
  ClientId bob{};
  {
    SqliteStore store(path);
    alice = register_client(store, "alice");
    bob = register_client(store, "bob");
    REQUIRE(store.enqueue_message(bob, alice, 3, {'h', 'i'}).has_value());
  }
  {
    SqliteStore store(path);
    REQUIRE(store.client_count().value() == 2);
    REQUIRE(store.get_client(alice).value().name == "alice");
    REQUIRE(store.create_client("alice", make_key(1)).get_error() == ErrorCode::kNameTaken);

    auto drained = store.drain_messages(bob);
    REQUIRE(drained.value().size() == 1);
    REQUIRE(drained.value()[0].payload == std::vector<uint8_t>({'h', 'i'}));
  }
  remove_db(path);
}

TEST_CASE("Store - open failure throws", "[store]") {
  REQUIRE_THROWS_AS(SqliteStore("/nonexistent-dir/sub/mbox.db"), std::runtime_error);
}

TEST_CASE("Store - concurrent send and drain deliver exactly once", "[store]") {
  SqliteStore store(":memory:");
  ClientId bob = register_client(store, "bob");

  constexpr int kSenders = 4;
  constexpr int kPerSender = 100;
  std::vector<ClientId> senders;
  for (int s = 0; s < kSenders; ++s) {
    senders.push_back(register_client(store, "sender" + std::to_string(s)));
  }

  std::vector<std::thread> threads;
  for (int s = 0; s < kSenders; ++s) {
    threads.emplace_back([&store, &senders, bob, s]() {
      for (int i = 0; i < kPerSender; ++i) {
        std::vector<uint8_t> payload = {static_cast<uint8_t>(s), static_cast<uint8_t>(i)};
        auto id = store.enqueue_message(bob, senders[s], 3, payload);
        if (!id.has_value()) {
          return;
        }
      }
    });
  }

  std::vector<MessageRecord> received;
  std::thread drainer([&store, &received, bob]() {
    for (int round = 0; round < 200; ++round) {
      auto batch = store.drain_messages(bob);
      if (batch.has_value()) {
        for (auto& msg : batch.value()) {
          received.push_back(msg);
        }
      }
      std::this_thread::yield();
    }
  });

  for (auto& t : threads) {
    t.join();
  }
  drainer.join();

  auto rest = store.drain_messages(bob);
  REQUIRE(rest.has_value());
  for (auto& msg : rest.value()) {
    received.push_back(msg);
  }

  REQUIRE(received.size() == static_cast<size_t>(kSenders * kPerSender));

  std::set<uint32_t> ids;
  std::vector<int> next(kSenders, 0);
  uint32_t prev_id = 0;
  for (const auto& msg : received) {
    REQUIRE(msg.id > prev_id);
    prev_id = msg.id;
    ids.insert(msg.id);
    int s = msg.payload[0];
    REQUIRE(msg.payload[1] == next[s]);
    ++next[s];
  }
  REQUIRE(ids.size() == received.size());
  REQUIRE(store.pending_count(bob).value() == 0);
}

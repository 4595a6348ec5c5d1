#ifndef MBOX_SQLITE_STORE_HPP_
#define MBOX_SQLITE_STORE_HPP_

// SQLite-backed Store.
//
// Schema:
//   clients(id BLOB PK, name TEXT UNIQUE, public_key BLOB, last_seen INTEGER)
//   messages(id INTEGER PK AUTOINCREMENT, recipient_id, sender_id, type,
//            payload BLOB, created_at INTEGER)
//
// Concurrency:
// - One connection handle guarded by a mutex; every public method holds it
//   for its whole duration, so enqueue/drain on a recipient never interleave.
// - Writes run inside BEGIN IMMEDIATE ... COMMIT and roll back on any early
//   return.

#include "store.hpp"

#include <mutex>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace mbox {

class SqliteStore final : public Store {
 public:
  // Open or create the database at `path` (":memory:" for a private
  // in-memory database) and ensure the schema exists. Throws
  // std::runtime_error if the file cannot be opened or initialised.
  explicit SqliteStore(const std::string& path);
  ~SqliteStore() override;

  SqliteStore(const SqliteStore&) = delete;
  SqliteStore& operator=(const SqliteStore&) = delete;

  expected<ClientId, ErrorCode> create_client(const std::string& name, const PublicKey& public_key) override;
  expected<ClientRecord, ErrorCode> get_client(const ClientId& id) override;
  expected<std::vector<ClientRecord>, ErrorCode> list_clients(const ClientId& excluding) override;
  expected<void, ErrorCode> touch(const ClientId& id) override;
  expected<uint32_t, ErrorCode> enqueue_message(const ClientId& recipient_id, const ClientId& sender_id, uint8_t type,
                                                const std::vector<uint8_t>& payload) override;
  using Store::drain_messages;
  expected<std::vector<MessageRecord>, ErrorCode> drain_messages(const ClientId& recipient_id,
                                                                 size_t byte_budget) override;
  expected<size_t, ErrorCode> client_count() override;
  expected<size_t, ErrorCode> pending_count(const ClientId& recipient_id) override;

  const std::string& path() const { return db_path_; }

 private:
  class Statement;

  bool exec(const char* sql);
  bool begin();
  bool commit();
  void rollback();
  void init_tables();
  bool client_exists(const ClientId& id, bool& exists);

  sqlite3* db_ = nullptr;
  std::string db_path_;
  std::mutex mutex_;
};

}  // namespace mbox

#endif  // MBOX_SQLITE_STORE_HPP_

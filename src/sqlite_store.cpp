#include "mbox/sqlite_store.hpp"

#include "mbox/log.hpp"

#include <sqlite3.h>

#include <cstring>
#include <ctime>

#include <limits>
#include <stdexcept>

namespace mbox {

namespace {

constexpr int kBusyTimeoutMs = 5000;
constexpr int kMaxIdAttempts = 8;

int64_t unix_now() { return static_cast<int64_t>(std::time(nullptr)); }

// Random id with the UUIDv4 version and variant bits set.
ClientId random_client_id() {
  ClientId id{};
  sqlite3_randomness(static_cast<int>(id.size()), id.data());
  id[6] = static_cast<uint8_t>((id[6] & 0x0F) | 0x40);
  id[8] = static_cast<uint8_t>((id[8] & 0x3F) | 0x80);
  return id;
}

template <typename T>
expected<T, ErrorCode> store_failure() {
  return expected<T, ErrorCode>::error(ErrorCode::kStoreFailure);
}

}  // namespace

// ============================================================================
// Statement - owns one prepared statement
// ============================================================================

class SqliteStore::Statement {
 public:
  Statement(sqlite3* db, const char* sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
      MBOX_LOG_ERROR(std::string("SQL prepare error: ") + sqlite3_errmsg(db));
      stmt_ = nullptr;
    }
  }

  ~Statement() {
    if (stmt_ != nullptr) {
      sqlite3_finalize(stmt_);
    }
  }

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  bool ok() const { return stmt_ != nullptr; }

  bool bind_blob(int index, const uint8_t* data, size_t len) {
    if (len > static_cast<size_t>(std::numeric_limits<int>::max())) {
      MBOX_LOG_ERROR("SQL bind error: blob of " + std::to_string(len) + " bytes is too big");
      return false;
    }
    int rc = (len == 0) ? sqlite3_bind_zeroblob(stmt_, index, 0)
                        : sqlite3_bind_blob(stmt_, index, data, static_cast<int>(len), SQLITE_TRANSIENT);
    return check_bind(rc);
  }

  template <size_t N>
  bool bind_blob(int index, const std::array<uint8_t, N>& data) {
    return bind_blob(index, data.data(), data.size());
  }

  bool bind_text(int index, const std::string& text) {
    return check_bind(sqlite3_bind_text(stmt_, index, text.c_str(), static_cast<int>(text.size()), SQLITE_TRANSIENT));
  }

  bool bind_int64(int index, int64_t value) { return check_bind(sqlite3_bind_int64(stmt_, index, value)); }

  // SQLITE_ROW, SQLITE_DONE or an error code.
  int step() { return sqlite3_step(stmt_); }

  int64_t column_int64(int col) const { return sqlite3_column_int64(stmt_, col); }

  std::string column_text(int col) const {
    const unsigned char* text = sqlite3_column_text(stmt_, col);
    int len = sqlite3_column_bytes(stmt_, col);
    if (text == nullptr || len <= 0) {
      return std::string();
    }
    return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(len));
  }

  std::vector<uint8_t> column_blob(int col) const {
    const void* blob = sqlite3_column_blob(stmt_, col);
    int len = sqlite3_column_bytes(stmt_, col);
    if (blob == nullptr || len <= 0) {
      return {};
    }
    const uint8_t* p = static_cast<const uint8_t*>(blob);
    return std::vector<uint8_t>(p, p + len);
  }

  // Copies a fixed-size blob column; a size mismatch is a corrupt row.
  template <size_t N>
  bool column_array(int col, std::array<uint8_t, N>& out) const {
    const void* blob = sqlite3_column_blob(stmt_, col);
    int len = sqlite3_column_bytes(stmt_, col);
    if (blob == nullptr || static_cast<size_t>(len) != N) {
      return false;
    }
    std::memcpy(out.data(), blob, N);
    return true;
  }

  void log_step_error(const char* what) const {
    MBOX_LOG_ERROR(std::string(what) + " failed: " + sqlite3_errmsg(db_));
  }

 private:
  bool check_bind(int rc) {
    if (rc != SQLITE_OK) {
      MBOX_LOG_ERROR(std::string("SQL bind error: ") + sqlite3_errmsg(db_));
      return false;
    }
    return true;
  }

  sqlite3* db_;
  sqlite3_stmt* stmt_ = nullptr;
};

// ============================================================================
// Lifecycle
// ============================================================================

SqliteStore::SqliteStore(const std::string& path) : db_path_(path) {
  int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
  if (sqlite3_open_v2(path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    std::string msg = "Error opening database '" + path + "': " + (db_ ? sqlite3_errmsg(db_) : "out of memory");
    if (db_ != nullptr) {
      sqlite3_close(db_);
      db_ = nullptr;
    }
    MBOX_THROW(std::runtime_error(msg));
  }
  sqlite3_busy_timeout(db_, kBusyTimeoutMs);
  init_tables();
  MBOX_LOG_INFO("Store opened: " + path);
}

SqliteStore::~SqliteStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

bool SqliteStore::exec(const char* sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    MBOX_LOG_ERROR(std::string("SQL exec error: ") + (err ? err : sqlite3_errmsg(db_)));
    sqlite3_free(err);
    return false;
  }
  return true;
}

bool SqliteStore::begin() { return exec("BEGIN IMMEDIATE;"); }

bool SqliteStore::commit() { return exec("COMMIT;"); }

void SqliteStore::rollback() {
  if (sqlite3_get_autocommit(db_) == 0) {
    exec("ROLLBACK;");
  }
}

void SqliteStore::init_tables() {
  bool in_memory = db_path_.empty() || db_path_ == ":memory:";
  bool ok = exec("PRAGMA foreign_keys = ON;") && exec("PRAGMA synchronous = FULL;");
  if (ok && !in_memory) {
    ok = exec("PRAGMA journal_mode = WAL;");
  }
  ok = ok && exec(
                 "CREATE TABLE IF NOT EXISTS clients("
                 "id BLOB PRIMARY KEY,"
                 "name TEXT NOT NULL UNIQUE,"
                 "public_key BLOB NOT NULL,"
                 "last_seen INTEGER NOT NULL);");
  ok = ok && exec(
                 "CREATE TABLE IF NOT EXISTS messages("
                 "id INTEGER PRIMARY KEY AUTOINCREMENT,"
                 "recipient_id BLOB NOT NULL REFERENCES clients(id),"
                 "sender_id BLOB NOT NULL REFERENCES clients(id),"
                 "type INTEGER NOT NULL,"
                 "payload BLOB NOT NULL,"
                 "created_at INTEGER NOT NULL);");
  ok = ok && exec("CREATE INDEX IF NOT EXISTS messages_by_recipient ON messages(recipient_id, id);");
  if (!ok) {
    sqlite3_close(db_);
    db_ = nullptr;
    MBOX_THROW(std::runtime_error("Failed to initialise database schema: " + db_path_));
  }
}

bool SqliteStore::client_exists(const ClientId& id, bool& exists) {
  Statement stmt(db_, "SELECT 1 FROM clients WHERE id = ?");
  if (!stmt.ok() || !stmt.bind_blob(1, id)) {
    return false;
  }
  int rc = stmt.step();
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    stmt.log_step_error("Client lookup");
    return false;
  }
  exists = (rc == SQLITE_ROW);
  return true;
}

// ============================================================================
// Clients
// ============================================================================

expected<ClientId, ErrorCode> SqliteStore::create_client(const std::string& name, const PublicKey& public_key) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!begin()) {
    return store_failure<ClientId>();
  }
  ScopeGuard guard(FixedFunction<void()>([this]() { rollback(); }));

  {
    Statement lookup(db_, "SELECT 1 FROM clients WHERE name = ?");
    if (!lookup.ok() || !lookup.bind_text(1, name)) {
      return store_failure<ClientId>();
    }
    int rc = lookup.step();
    if (rc == SQLITE_ROW) {
      return expected<ClientId, ErrorCode>::error(ErrorCode::kNameTaken);
    }
    if (rc != SQLITE_DONE) {
      lookup.log_step_error("Name lookup");
      return store_failure<ClientId>();
    }
  }

  for (int attempt = 0; attempt < kMaxIdAttempts; ++attempt) {
    ClientId id = random_client_id();
    Statement insert(db_, "INSERT INTO clients(id, name, public_key, last_seen) VALUES (?, ?, ?, ?)");
    if (!insert.ok() || !insert.bind_blob(1, id) || !insert.bind_text(2, name) ||
        !insert.bind_blob(3, public_key) || !insert.bind_int64(4, unix_now())) {
      return store_failure<ClientId>();
    }
    int rc = insert.step();
    if (rc == SQLITE_DONE) {
      if (!commit()) {
        return store_failure<ClientId>();
      }
      guard.release();
      return expected<ClientId, ErrorCode>::success(id);
    }
    if (sqlite3_extended_errcode(db_) != SQLITE_CONSTRAINT_PRIMARYKEY) {
      insert.log_step_error("Client insert");
      return store_failure<ClientId>();
    }
    MBOX_LOG_WARN("Client id collision, retrying");
  }
  MBOX_LOG_ERROR("Could not allocate a unique client id");
  return store_failure<ClientId>();
}

expected<ClientRecord, ErrorCode> SqliteStore::get_client(const ClientId& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(db_, "SELECT name, public_key, last_seen FROM clients WHERE id = ?");
  if (!stmt.ok() || !stmt.bind_blob(1, id)) {
    return store_failure<ClientRecord>();
  }
  int rc = stmt.step();
  if (rc == SQLITE_DONE) {
    return expected<ClientRecord, ErrorCode>::error(ErrorCode::kUnknownClient);
  }
  if (rc != SQLITE_ROW) {
    stmt.log_step_error("Client select");
    return store_failure<ClientRecord>();
  }

  ClientRecord record;
  record.id = id;
  record.name = stmt.column_text(0);
  if (!stmt.column_array(1, record.public_key)) {
    MBOX_LOG_ERROR("Corrupt public key for client " + wire::client_id_hex(id));
    return store_failure<ClientRecord>();
  }
  record.last_seen = stmt.column_int64(2);
  return expected<ClientRecord, ErrorCode>::success(std::move(record));
}

expected<std::vector<ClientRecord>, ErrorCode> SqliteStore::list_clients(const ClientId& excluding) {
  std::lock_guard<std::mutex> lock(mutex_);
  // A single SELECT reads one consistent snapshot.
  Statement stmt(db_, "SELECT id, name, public_key, last_seen FROM clients WHERE id <> ? ORDER BY rowid");
  if (!stmt.ok() || !stmt.bind_blob(1, excluding)) {
    return store_failure<std::vector<ClientRecord>>();
  }

  std::vector<ClientRecord> out;
  int rc;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    ClientRecord record;
    if (!stmt.column_array(0, record.id) || !stmt.column_array(2, record.public_key)) {
      MBOX_LOG_ERROR("Corrupt client row");
      return store_failure<std::vector<ClientRecord>>();
    }
    record.name = stmt.column_text(1);
    record.last_seen = stmt.column_int64(3);
    out.push_back(std::move(record));
  }
  if (rc != SQLITE_DONE) {
    stmt.log_step_error("Client list");
    return store_failure<std::vector<ClientRecord>>();
  }
  return expected<std::vector<ClientRecord>, ErrorCode>::success(std::move(out));
}

expected<void, ErrorCode> SqliteStore::touch(const ClientId& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(db_, "UPDATE clients SET last_seen = ? WHERE id = ?");
  if (!stmt.ok() || !stmt.bind_int64(1, unix_now()) || !stmt.bind_blob(2, id)) {
    return expected<void, ErrorCode>::error(ErrorCode::kStoreFailure);
  }
  if (stmt.step() != SQLITE_DONE) {
    stmt.log_step_error("Touch");
    return expected<void, ErrorCode>::error(ErrorCode::kStoreFailure);
  }
  if (sqlite3_changes(db_) == 0) {
    return expected<void, ErrorCode>::error(ErrorCode::kUnknownClient);
  }
  return expected<void, ErrorCode>::success();
}

expected<size_t, ErrorCode> SqliteStore::client_count() {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(db_, "SELECT COUNT(*) FROM clients");
  if (!stmt.ok() || stmt.step() != SQLITE_ROW) {
    return store_failure<size_t>();
  }
  return expected<size_t, ErrorCode>::success(static_cast<size_t>(stmt.column_int64(0)));
}

// ============================================================================
// Mailboxes
// ============================================================================

expected<uint32_t, ErrorCode> SqliteStore::enqueue_message(const ClientId& recipient_id, const ClientId& sender_id,
                                                           uint8_t type, const std::vector<uint8_t>& payload) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!begin()) {
    return store_failure<uint32_t>();
  }
  ScopeGuard guard(FixedFunction<void()>([this]() { rollback(); }));

  bool recipient_found = false;
  bool sender_found = false;
  if (!client_exists(recipient_id, recipient_found) || !client_exists(sender_id, sender_found)) {
    return store_failure<uint32_t>();
  }
  if (!recipient_found || !sender_found) {
    return expected<uint32_t, ErrorCode>::error(ErrorCode::kUnknownClient);
  }

  Statement insert(db_,
                   "INSERT INTO messages(recipient_id, sender_id, type, payload, created_at) "
                   "VALUES (?, ?, ?, ?, ?)");
  if (!insert.ok() || !insert.bind_blob(1, recipient_id) || !insert.bind_blob(2, sender_id) ||
      !insert.bind_int64(3, type) || !insert.bind_blob(4, payload.data(), payload.size()) ||
      !insert.bind_int64(5, unix_now())) {
    return store_failure<uint32_t>();
  }
  if (insert.step() != SQLITE_DONE) {
    insert.log_step_error("Message insert");
    return store_failure<uint32_t>();
  }

  int64_t rowid = sqlite3_last_insert_rowid(db_);
  if (rowid <= 0 || rowid > static_cast<int64_t>(std::numeric_limits<uint32_t>::max())) {
    MBOX_LOG_ERROR("Message id space exhausted");
    return store_failure<uint32_t>();
  }
  if (!commit()) {
    return store_failure<uint32_t>();
  }
  guard.release();
  return expected<uint32_t, ErrorCode>::success(static_cast<uint32_t>(rowid));
}

expected<std::vector<MessageRecord>, ErrorCode> SqliteStore::drain_messages(const ClientId& recipient_id,
                                                                            size_t byte_budget) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!begin()) {
    return store_failure<std::vector<MessageRecord>>();
  }
  ScopeGuard guard(FixedFunction<void()>([this]() { rollback(); }));

  std::vector<MessageRecord> out;
  {
    Statement select(db_,
                     "SELECT id, sender_id, type, length(payload), payload, created_at FROM messages "
                     "WHERE recipient_id = ? ORDER BY id");
    if (!select.ok() || !select.bind_blob(1, recipient_id)) {
      return store_failure<std::vector<MessageRecord>>();
    }
    size_t used = 0;
    int rc;
    while ((rc = select.step()) == SQLITE_ROW) {
      size_t record_size = kPendingRecordHeaderSize + static_cast<size_t>(select.column_int64(3));
      if (!out.empty() && used + record_size > byte_budget) {
        rc = SQLITE_DONE;
        break;
      }
      used += record_size;

      MessageRecord record;
      record.id = static_cast<uint32_t>(select.column_int64(0));
      record.recipient_id = recipient_id;
      if (!select.column_array(1, record.sender_id)) {
        MBOX_LOG_ERROR("Corrupt message row");
        return store_failure<std::vector<MessageRecord>>();
      }
      record.type = static_cast<uint8_t>(select.column_int64(2));
      record.payload = select.column_blob(4);
      record.created_at = select.column_int64(5);
      out.push_back(std::move(record));
    }
    if (rc != SQLITE_DONE) {
      select.log_step_error("Message select");
      return store_failure<std::vector<MessageRecord>>();
    }
  }

  if (!out.empty()) {
    // Bounded by the last selected id so the deleted set equals the returned set.
    Statement remove(db_, "DELETE FROM messages WHERE recipient_id = ? AND id <= ?");
    if (!remove.ok() || !remove.bind_blob(1, recipient_id) ||
        !remove.bind_int64(2, static_cast<int64_t>(out.back().id))) {
      return store_failure<std::vector<MessageRecord>>();
    }
    if (remove.step() != SQLITE_DONE) {
      remove.log_step_error("Message delete");
      return store_failure<std::vector<MessageRecord>>();
    }
  }

  if (!commit()) {
    return store_failure<std::vector<MessageRecord>>();
  }
  guard.release();
  return expected<std::vector<MessageRecord>, ErrorCode>::success(std::move(out));
}

expected<size_t, ErrorCode> SqliteStore::pending_count(const ClientId& recipient_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(db_, "SELECT COUNT(*) FROM messages WHERE recipient_id = ?");
  if (!stmt.ok() || !stmt.bind_blob(1, recipient_id) || stmt.step() != SQLITE_ROW) {
    return store_failure<size_t>();
  }
  return expected<size_t, ErrorCode>::success(static_cast<size_t>(stmt.column_int64(0)));
}

}  // namespace mbox

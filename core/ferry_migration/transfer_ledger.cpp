// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "transfer_ledger.hpp"

#include <sqlite3.h>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <stdexcept>

#define FERRY_LOG_COMPONENT "transfer_ledger"
#include "ferry_log_macros.hpp"

namespace ferry {
namespace migration {

namespace {

// Current ISO 8601 timestamp (UTC)
std::string currentTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&time, &tm);

  std::ostringstream ss;
  ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return ss.str();
}

std::string columnText(sqlite3_stmt* stmt, int column) {
  const unsigned char* text = sqlite3_column_text(stmt, column);
  return text ? reinterpret_cast<const char*>(text) : "";
}

/**
 * Prepared statement finalized on scope exit
 */
class Statement {
public:
  Statement(sqlite3* db, const char* sql) {
    if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
      FERRY_LOG_ERROR("Failed to prepare statement: " << sqlite3_errmsg(db));
      stmt_ = nullptr;
    }
  }

  ~Statement() {
    if (stmt_) {
      sqlite3_finalize(stmt_);
    }
  }

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  bool ok() const {
    return stmt_ != nullptr;
  }

  sqlite3_stmt* get() const {
    return stmt_;
  }

  void bind(int index, const std::string& value) {
    sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
  }

  void bind(int index, int64_t value) {
    sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value));
  }

  int step() {
    return sqlite3_step(stmt_);
  }

private:
  sqlite3_stmt* stmt_ = nullptr;
};

constexpr const char* kRecordColumns =
  "bucket, object_key, size_bytes, strategy, status, attempts, last_error, created_at, "
  "updated_at, completed_at";

}  // namespace

class TransferLedger::Impl {
public:
  sqlite3* db = nullptr;
  std::string db_path;
  mutable std::mutex mutex;

  ~Impl() {
    if (db) {
      sqlite3_close(db);
    }
  }

  void exec(const char* sql, const char* what) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
      std::string error = err_msg ? err_msg : "Unknown error";
      sqlite3_free(err_msg);
      throw std::runtime_error(std::string(what) + ": " + error);
    }
  }

  void initDatabase() {
    int rc = sqlite3_open(db_path.c_str(), &db);
    if (rc != SQLITE_OK) {
      throw std::runtime_error("Cannot open SQLite database: " + db_path);
    }

    exec("PRAGMA journal_mode=WAL;", "Failed to enable WAL mode");
    exec("PRAGMA synchronous=NORMAL;", "Failed to set synchronous mode");
    exec("PRAGMA busy_timeout=5000;", "Failed to set busy timeout");

    exec(R"(
      CREATE TABLE IF NOT EXISTS transfer_state (
        bucket TEXT NOT NULL,
        object_key TEXT NOT NULL,
        size_bytes INTEGER DEFAULT 0,
        strategy TEXT,
        status TEXT NOT NULL
          CHECK(status IN ('pending', 'transferring', 'completed', 'failed')),
        attempts INTEGER DEFAULT 0,
        last_error TEXT,
        created_at TEXT NOT NULL,
        updated_at TEXT NOT NULL,
        completed_at TEXT,
        PRIMARY KEY (bucket, object_key)
      );
      CREATE INDEX IF NOT EXISTS idx_transfer_status ON transfer_state(status);
      CREATE TABLE IF NOT EXISTS open_sessions (
        upload_id TEXT PRIMARY KEY,
        bucket TEXT NOT NULL,
        object_key TEXT NOT NULL,
        opened_at TEXT NOT NULL
      );
    )",
         "Failed to create tables");
  }

  static TransferRecord parseRecord(sqlite3_stmt* stmt) {
    TransferRecord record;
    record.bucket = columnText(stmt, 0);
    record.object_key = columnText(stmt, 1);
    record.size_bytes = static_cast<uint64_t>(sqlite3_column_int64(stmt, 2));
    record.strategy = columnText(stmt, 3);
    record.status = transferStatusFromString(columnText(stmt, 4));
    record.attempts = sqlite3_column_int(stmt, 5);
    record.last_error = columnText(stmt, 6);
    record.created_at = columnText(stmt, 7);
    record.updated_at = columnText(stmt, 8);
    record.completed_at = columnText(stmt, 9);
    return record;
  }

  bool changedRow(Statement& stmt) {
    return stmt.step() == SQLITE_DONE && sqlite3_changes(db) > 0;
  }
};

TransferLedger::TransferLedger(const std::string& db_path)
    : impl_(std::make_unique<Impl>()) {
  impl_->db_path = db_path;
  impl_->initDatabase();
  FERRY_LOG_DEBUG("Transfer ledger opened" << ::ferry::logging::kv("path", db_path));
}

TransferLedger::~TransferLedger() = default;

bool TransferLedger::recordAttempt(
  const std::string& bucket, const std::string& object_key, uint64_t size_bytes,
  const std::string& strategy
) {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  Statement stmt(impl_->db, R"(
    INSERT INTO transfer_state
      (bucket, object_key, size_bytes, strategy, status, attempts, created_at, updated_at)
    VALUES (?, ?, ?, ?, 'transferring', 1, ?, ?)
    ON CONFLICT(bucket, object_key) DO UPDATE SET
      size_bytes = excluded.size_bytes,
      strategy = excluded.strategy,
      status = 'transferring',
      attempts = attempts + 1,
      updated_at = excluded.updated_at
  )");
  if (!stmt.ok()) {
    return false;
  }

  std::string now = currentTimestamp();
  stmt.bind(1, bucket);
  stmt.bind(2, object_key);
  stmt.bind(3, static_cast<int64_t>(size_bytes));
  stmt.bind(4, strategy);
  stmt.bind(5, now);
  stmt.bind(6, now);
  return impl_->changedRow(stmt);
}

bool TransferLedger::markCompleted(const std::string& bucket, const std::string& object_key) {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  Statement stmt(impl_->db, R"(
    UPDATE transfer_state
    SET status = 'completed', last_error = NULL, completed_at = ?, updated_at = ?
    WHERE bucket = ? AND object_key = ?
  )");
  if (!stmt.ok()) {
    return false;
  }

  std::string now = currentTimestamp();
  stmt.bind(1, now);
  stmt.bind(2, now);
  stmt.bind(3, bucket);
  stmt.bind(4, object_key);
  return impl_->changedRow(stmt);
}

bool TransferLedger::markFailed(
  const std::string& bucket, const std::string& object_key, const std::string& error
) {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  Statement stmt(impl_->db, R"(
    UPDATE transfer_state
    SET status = 'failed', last_error = ?, updated_at = ?
    WHERE bucket = ? AND object_key = ?
  )");
  if (!stmt.ok()) {
    return false;
  }

  stmt.bind(1, error);
  stmt.bind(2, currentTimestamp());
  stmt.bind(3, bucket);
  stmt.bind(4, object_key);
  return impl_->changedRow(stmt);
}

std::optional<TransferRecord> TransferLedger::get(
  const std::string& bucket, const std::string& object_key
) {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  std::string sql = std::string("SELECT ") + kRecordColumns +
                    " FROM transfer_state WHERE bucket = ? AND object_key = ?";
  Statement stmt(impl_->db, sql.c_str());
  if (!stmt.ok()) {
    return std::nullopt;
  }

  stmt.bind(1, bucket);
  stmt.bind(2, object_key);
  if (stmt.step() == SQLITE_ROW) {
    return Impl::parseRecord(stmt.get());
  }
  return std::nullopt;
}

std::vector<TransferRecord> TransferLedger::getFailed() {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  std::string sql = std::string("SELECT ") + kRecordColumns +
                    " FROM transfer_state WHERE status = 'failed' ORDER BY bucket, object_key";
  Statement stmt(impl_->db, sql.c_str());
  if (!stmt.ok()) {
    return {};
  }

  std::vector<TransferRecord> records;
  while (stmt.step() == SQLITE_ROW) {
    records.push_back(Impl::parseRecord(stmt.get()));
  }
  return records;
}

size_t TransferLedger::countByStatus(TransferStatus status) {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  Statement stmt(impl_->db, "SELECT COUNT(*) FROM transfer_state WHERE status = ?");
  if (!stmt.ok()) {
    return 0;
  }

  stmt.bind(1, transferStatusToString(status));
  if (stmt.step() == SQLITE_ROW) {
    return static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0));
  }
  return 0;
}

void TransferLedger::onSessionOpened(
  const std::string& bucket, const std::string& object_key, const std::string& upload_id
) {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  Statement stmt(impl_->db, R"(
    INSERT OR REPLACE INTO open_sessions (upload_id, bucket, object_key, opened_at)
    VALUES (?, ?, ?, ?)
  )");
  if (!stmt.ok()) {
    return;
  }

  stmt.bind(1, upload_id);
  stmt.bind(2, bucket);
  stmt.bind(3, object_key);
  stmt.bind(4, currentTimestamp());
  if (stmt.step() != SQLITE_DONE) {
    FERRY_LOG_WARN(
      "Failed to record open session: " << sqlite3_errmsg(impl_->db)
                                        << ::ferry::logging::kv("upload_id", upload_id)
    );
  }
}

void TransferLedger::onSessionClosed(const std::string& upload_id) {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  Statement stmt(impl_->db, "DELETE FROM open_sessions WHERE upload_id = ?");
  if (!stmt.ok()) {
    return;
  }

  stmt.bind(1, upload_id);
  if (stmt.step() != SQLITE_DONE) {
    FERRY_LOG_WARN(
      "Failed to release session record: " << sqlite3_errmsg(impl_->db)
                                            << ::ferry::logging::kv("upload_id", upload_id)
    );
  }
}

std::vector<OpenSession> TransferLedger::getOpenSessions() {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  Statement stmt(
    impl_->db,
    "SELECT upload_id, bucket, object_key, opened_at FROM open_sessions ORDER BY opened_at"
  );
  if (!stmt.ok()) {
    return {};
  }

  std::vector<OpenSession> sessions;
  while (stmt.step() == SQLITE_ROW) {
    OpenSession session;
    session.upload_id = columnText(stmt.get(), 0);
    session.bucket = columnText(stmt.get(), 1);
    session.object_key = columnText(stmt.get(), 2);
    session.opened_at = columnText(stmt.get(), 3);
    sessions.push_back(std::move(session));
  }
  return sessions;
}

const std::string& TransferLedger::path() const {
  return impl_->db_path;
}

}  // namespace migration
}  // namespace ferry

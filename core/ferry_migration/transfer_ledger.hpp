// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_TRANSFER_LEDGER_HPP
#define FERRY_TRANSFER_LEDGER_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "session_tracker.hpp"

namespace ferry {
namespace migration {

enum class TransferStatus {
  PENDING,       // Known, not attempted yet
  TRANSFERRING,  // Attempt in progress
  COMPLETED,     // Present at the destination
  FAILED         // Last attempt failed
};

inline std::string transferStatusToString(TransferStatus status) {
  switch (status) {
    case TransferStatus::PENDING:
      return "pending";
    case TransferStatus::TRANSFERRING:
      return "transferring";
    case TransferStatus::COMPLETED:
      return "completed";
    case TransferStatus::FAILED:
      return "failed";
    default:
      return "unknown";
  }
}

inline TransferStatus transferStatusFromString(const std::string& str) {
  if (str == "transferring") return TransferStatus::TRANSFERRING;
  if (str == "completed") return TransferStatus::COMPLETED;
  if (str == "failed") return TransferStatus::FAILED;
  return TransferStatus::PENDING;
}

/**
 * One object as recorded in the ledger
 */
struct TransferRecord {
  std::string bucket;      // Source bucket
  std::string object_key;
  uint64_t size_bytes = 0;
  std::string strategy;    // "single_part" or "chunked"
  TransferStatus status = TransferStatus::PENDING;
  int attempts = 0;
  std::string last_error;
  std::string created_at;    // ISO 8601
  std::string updated_at;    // ISO 8601
  std::string completed_at;  // Empty until completed
};

/**
 * Multipart session opened at the destination and not yet released
 */
struct OpenSession {
  std::string upload_id;
  std::string bucket;  // Destination bucket
  std::string object_key;
  std::string opened_at;
};

/**
 * SQLite-backed record of per-object transfer attempts and open sessions
 *
 * The destination listing stays the source of truth for what is migrated.
 * The ledger adds an audit trail and lets a later run abort multipart
 * sessions an abruptly terminated run left behind.
 *
 * Thread-safety: all methods are thread-safe (protected by mutex).
 */
class TransferLedger : public storage::ISessionTracker {
public:
  /**
   * @param db_path Path to SQLite database file, created if missing
   * @throws std::runtime_error if the database cannot be opened or initialised
   */
  explicit TransferLedger(const std::string& db_path);
  ~TransferLedger() override;

  // Non-copyable, non-movable
  TransferLedger(const TransferLedger&) = delete;
  TransferLedger& operator=(const TransferLedger&) = delete;
  TransferLedger(TransferLedger&&) = delete;
  TransferLedger& operator=(TransferLedger&&) = delete;

  /**
   * Mark an object as transferring and count the attempt
   *
   * Inserts the record on first sight.
   */
  bool recordAttempt(
    const std::string& bucket, const std::string& object_key, uint64_t size_bytes,
    const std::string& strategy
  );

  bool markCompleted(const std::string& bucket, const std::string& object_key);

  bool markFailed(
    const std::string& bucket, const std::string& object_key, const std::string& error
  );

  std::optional<TransferRecord> get(const std::string& bucket, const std::string& object_key);

  std::vector<TransferRecord> getFailed();

  size_t countByStatus(TransferStatus status);

  // ISessionTracker
  void onSessionOpened(
    const std::string& bucket, const std::string& object_key, const std::string& upload_id
  ) override;
  void onSessionClosed(const std::string& upload_id) override;

  std::vector<OpenSession> getOpenSessions();

  const std::string& path() const;

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace migration
}  // namespace ferry

#endif  // FERRY_TRANSFER_LEDGER_HPP

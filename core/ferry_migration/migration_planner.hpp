// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_MIGRATION_PLANNER_HPP
#define FERRY_MIGRATION_PLANNER_HPP

#include <atomic>
#include <cstdint>
#include <string>
#include <unordered_set>
#include <vector>

#include "chunked_transfer_engine.hpp"
#include "migration_errors.hpp"
#include "object_transfer.hpp"
#include "storage_client.hpp"

namespace ferry {
namespace migration {

class TransferLedger;

struct MigrationOptions {
  // Appended to a source bucket name that is taken at the destination.
  // Empty means no fallback name.
  std::string bucket_suffix;

  // Keep going with the bucket's remaining objects after one fails
  bool continue_on_object_failure = true;

  // Bucket naming/creation errors end the run instead of skipping the bucket
  bool halt_on_bucket_conflict = true;

  // Source listing cap per bucket
  uint64_t max_source_keys = storage::kMaxKeys;

  // Listing page size, 0 for the provider default
  int page_size = 0;

  // Restrict the run to these source buckets, empty for all
  std::vector<std::string> only_buckets;
};

/**
 * Run counters, updated while the run is in progress
 */
struct MigrationStats {
  std::atomic<uint64_t> buckets_processed{0};
  std::atomic<uint64_t> buckets_failed{0};
  std::atomic<uint64_t> objects_listed{0};
  std::atomic<uint64_t> objects_skipped{0};
  std::atomic<uint64_t> objects_transferred{0};
  std::atomic<uint64_t> objects_failed{0};
  std::atomic<uint64_t> bytes_transferred{0};
  std::atomic<uint64_t> single_part_transfers{0};
  std::atomic<uint64_t> chunked_transfers{0};
  std::atomic<uint64_t> sessions_recovered{0};
};

enum class BucketStatus {
  COMPLETED,                // Every pending object transferred
  COMPLETED_WITH_FAILURES,  // Some objects failed
  FAILED,                   // Bucket could not be migrated at all
  STOPPED                   // Stop requested before the queue drained
};

const char* bucketStatusToString(BucketStatus status);

struct BucketReport {
  std::string source_bucket;
  std::string destination_bucket;  // Empty if name resolution failed
  uint64_t source_objects = 0;
  uint64_t already_migrated = 0;
  uint64_t pending = 0;
  uint64_t transferred = 0;
  uint64_t bytes_transferred = 0;
  bool listing_truncated = false;  // Source listing hit max_source_keys
  std::vector<std::string> failed_keys;
  BucketStatus status = BucketStatus::COMPLETED;
  std::string error;
};

struct MigrationSummary {
  std::vector<BucketReport> buckets;
  uint64_t sessions_recovered = 0;
  bool stopped = false;

  bool hasFailures() const;
};

/**
 * Bucket-by-bucket migration from a source to a destination endpoint
 *
 * Per bucket:
 *   1. resolve the destination name (create, reuse, or create with suffix)
 *   2. list source objects (capped) and destination objects (exhaustive)
 *   3. pending = source keys not present at the destination
 *   4. transfer each pending object in source listing order
 *
 * Re-running converges: objects already at the destination are skipped.
 * Buckets and objects are processed sequentially; parallelism is confined
 * to the parts of one chunked transfer.
 */
class MigrationPlanner {
public:
  /**
   * @param ledger Optional; records attempts and open multipart sessions
   */
  MigrationPlanner(
    storage::IStorageClient& source, storage::IStorageClient& destination,
    const MigrationOptions& options, const storage::ChunkedTransferConfig& transfer_config = {},
    TransferLedger* ledger = nullptr
  );

  /**
   * Migrate every source bucket
   *
   * @throws MigrationError if the source bucket listing fails, or on a
   *         bucket naming error while halt_on_bucket_conflict is set
   */
  MigrationSummary run();

  /**
   * Migrate one bucket
   *
   * @throws MigrationError on naming or listing failures
   */
  BucketReport migrateBucket(const std::string& source_bucket);

  /**
   * Create or reuse the destination bucket for a source bucket
   *
   * A conflicting name is retried once with the configured suffix.
   *
   * @throws MigrationError NO_SUFFIX_CONFIGURED, BUCKET_NAME_EXHAUSTED or
   *         BUCKET_CREATE_FAILED
   */
  std::string resolveDestinationBucket(const std::string& source_bucket);

  /**
   * @param truncated Set when the listing stopped at max_source_keys
   * @throws MigrationError LISTING
   */
  std::vector<storage::ObjectSummary> listSourceObjects(
    const std::string& bucket, bool* truncated = nullptr
  );

  /**
   * Keys present at the destination, paginated to exhaustion
   *
   * @throws MigrationError LISTING
   */
  std::unordered_set<std::string> listMigratedKeys(const std::string& bucket);

  /**
   * Source objects whose key is absent from migrated, in source order
   */
  static std::vector<storage::ObjectSummary> computePending(
    const std::vector<storage::ObjectSummary>& source_objects,
    const std::unordered_set<std::string>& migrated
  );

  /**
   * Abort multipart sessions a previous run left open
   *
   * @return Number of sessions released
   */
  uint64_t recoverOrphanedSessions();

  /**
   * Stop after the object currently in flight
   */
  void requestStop() {
    stop_requested_.store(true);
  }

  bool stopRequested() const {
    return stop_requested_.load();
  }

  const MigrationStats& stats() const {
    return stats_;
  }

private:
  bool transferObject(
    const std::string& source_bucket, const std::string& destination_bucket,
    const storage::ObjectSummary& object, BucketReport& report
  );

  storage::IStorageClient& source_;
  storage::IStorageClient& destination_;
  MigrationOptions options_;
  TransferLedger* ledger_;
  storage::ObjectTransfer transfer_;
  std::atomic<bool> stop_requested_{false};
  MigrationStats stats_;
};

}  // namespace migration
}  // namespace ferry

#endif  // FERRY_MIGRATION_PLANNER_HPP

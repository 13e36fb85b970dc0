// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_BUCKET_SWEEPER_HPP
#define FERRY_BUCKET_SWEEPER_HPP

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

#include "migration_errors.hpp"
#include "storage_client.hpp"

namespace ferry {
namespace migration {

struct SweepOptions {
  bool dry_run = false;  // List and report, delete nothing
  int page_size = 0;     // 0 for the provider default
  std::vector<std::string> only_buckets;  // Empty for all
};

struct BucketSweepReport {
  std::string bucket;
  uint64_t pages_listed = 0;
  uint64_t objects_listed = 0;
  uint64_t objects_deleted = 0;
  uint64_t delete_failures = 0;
  bool bucket_deleted = false;
  std::string error;  // Why the bucket was kept, empty otherwise
};

struct SweepSummary {
  std::vector<BucketSweepReport> buckets;
  bool stopped = false;

  bool hasFailures() const;
};

/**
 * Deletes every object and then every bucket at one endpoint
 *
 * Listing is paginated without a cap. A bucket is only deleted once all its
 * objects were deleted; a failure in one bucket never stops the others.
 */
class BucketSweeper {
public:
  BucketSweeper(storage::IStorageClient& target, const SweepOptions& options = {});

  /**
   * @throws MigrationError LISTING if the bucket list cannot be fetched
   */
  SweepSummary run();

  BucketSweepReport sweepBucket(const std::string& bucket);

  void requestStop() {
    stop_requested_.store(true);
  }

  bool stopRequested() const {
    return stop_requested_.load();
  }

private:
  storage::IStorageClient& target_;
  SweepOptions options_;
  std::atomic<bool> stop_requested_{false};
};

}  // namespace migration
}  // namespace ferry

#endif  // FERRY_BUCKET_SWEEPER_HPP

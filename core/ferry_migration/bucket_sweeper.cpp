// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "bucket_sweeper.hpp"

#include <algorithm>

#define FERRY_LOG_COMPONENT "bucket_sweeper"
#include "ferry_log_macros.hpp"

namespace ferry {
namespace migration {

using ::ferry::logging::kv;

bool SweepSummary::hasFailures() const {
  return std::any_of(buckets.begin(), buckets.end(), [](const BucketSweepReport& report) {
    return !report.error.empty();
  });
}

BucketSweeper::BucketSweeper(storage::IStorageClient& target, const SweepOptions& options)
    : target_(target)
    , options_(options) {}

SweepSummary BucketSweeper::run() {
  auto listed = target_.listBuckets();
  if (!listed.success) {
    throw MigrationError(
      MigrationErrorKind::LISTING, "", "Cannot list buckets: " + listed.error.message
    );
  }

  std::vector<std::string> buckets = listed.value;
  if (!options_.only_buckets.empty()) {
    buckets.erase(
      std::remove_if(
        buckets.begin(), buckets.end(),
        [this](const std::string& name) {
          return std::find(options_.only_buckets.begin(), options_.only_buckets.end(), name) ==
                 options_.only_buckets.end();
        }
      ),
      buckets.end()
    );
  }

  FERRY_LOG_INFO(
    "Starting sweep" << kv("buckets", buckets.size()) << kv("dry_run", options_.dry_run)
  );

  SweepSummary summary;
  for (const auto& bucket : buckets) {
    if (stopRequested()) {
      summary.stopped = true;
      FERRY_LOG_WARN("Stop requested, remaining buckets kept");
      break;
    }
    summary.buckets.push_back(sweepBucket(bucket));
  }
  if (stopRequested()) {
    summary.stopped = true;
  }
  return summary;
}

BucketSweepReport BucketSweeper::sweepBucket(const std::string& bucket) {
  BucketSweepReport report;
  report.bucket = bucket;

  // Collect every key first so deletions do not shift the listing under us
  std::vector<std::string> keys;
  std::string continuation;
  for (;;) {
    auto page = target_.listObjects(bucket, continuation, options_.page_size);
    if (!page.success) {
      report.error = "listing failed: " + page.error.message;
      FERRY_LOG_ERROR("Cannot list bucket, kept: " << page.error.message << kv("bucket", bucket));
      return report;
    }
    ++report.pages_listed;
    for (const auto& object : page.value.objects) {
      keys.push_back(object.key);
    }
    if (!page.value.next_continuation) {
      break;
    }
    continuation = *page.value.next_continuation;
  }
  report.objects_listed = keys.size();

  FERRY_LOG_INFO(
    "Bucket listed" << kv("bucket", bucket) << kv("objects", report.objects_listed)
                    << kv("pages", report.pages_listed)
  );

  if (options_.dry_run) {
    return report;
  }

  for (const auto& key : keys) {
    if (stopRequested()) {
      report.error = "stopped before all objects were deleted";
      return report;
    }
    auto deleted = target_.deleteObject(bucket, key);
    if (deleted.success) {
      ++report.objects_deleted;
      FERRY_LOG_INFO_EVERY_N(
        1000, "Deleting objects" << kv("bucket", bucket) << kv("deleted", report.objects_deleted)
      );
    } else {
      ++report.delete_failures;
      FERRY_LOG_ERROR(
        "Cannot delete object: " << deleted.error.message << kv("bucket", bucket) << kv("key", key)
      );
    }
  }

  if (report.delete_failures > 0) {
    report.error = std::to_string(report.delete_failures) + " objects could not be deleted";
    FERRY_LOG_ERROR(
      "Bucket not empty, kept" << kv("bucket", bucket) << kv("failures", report.delete_failures)
    );
    return report;
  }

  auto removed = target_.deleteBucket(bucket);
  if (!removed.success) {
    report.error = "bucket delete failed: " + removed.error.message;
    FERRY_LOG_ERROR(
      "Cannot delete bucket: " << removed.error.message << kv("bucket", bucket)
                               << kv("code", removed.error.code)
    );
    return report;
  }

  report.bucket_deleted = true;
  FERRY_LOG_INFO("Bucket deleted" << kv("bucket", bucket) << kv("objects", report.objects_deleted));
  return report;
}

}  // namespace migration
}  // namespace ferry

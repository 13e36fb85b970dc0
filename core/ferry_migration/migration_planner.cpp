// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "migration_planner.hpp"

#include <algorithm>
#include <exception>

#include "transfer_ledger.hpp"
#include "transfer_strategy.hpp"

#define FERRY_LOG_COMPONENT "migration_planner"
#include "ferry_log_macros.hpp"

namespace ferry {
namespace migration {

using ::ferry::logging::kv;
using storage::CreateBucketOutcome;
using storage::ObjectSummary;

const char* bucketStatusToString(BucketStatus status) {
  switch (status) {
    case BucketStatus::COMPLETED:
      return "completed";
    case BucketStatus::COMPLETED_WITH_FAILURES:
      return "completed_with_failures";
    case BucketStatus::FAILED:
      return "failed";
    case BucketStatus::STOPPED:
      return "stopped";
    default:
      return "unknown";
  }
}

bool MigrationSummary::hasFailures() const {
  return std::any_of(buckets.begin(), buckets.end(), [](const BucketReport& report) {
    return report.status == BucketStatus::FAILED ||
           report.status == BucketStatus::COMPLETED_WITH_FAILURES;
  });
}

MigrationPlanner::MigrationPlanner(
  storage::IStorageClient& source, storage::IStorageClient& destination,
  const MigrationOptions& options, const storage::ChunkedTransferConfig& transfer_config,
  TransferLedger* ledger
)
    : source_(source)
    , destination_(destination)
    , options_(options)
    , ledger_(ledger)
    , transfer_(source, destination, transfer_config, ledger) {}

MigrationSummary MigrationPlanner::run() {
  MigrationSummary summary;

  if (ledger_) {
    summary.sessions_recovered = recoverOrphanedSessions();
  }

  auto listed = source_.listBuckets();
  if (!listed.success) {
    throw MigrationError(
      MigrationErrorKind::LISTING, "", "Cannot list source buckets: " + listed.error.message
    );
  }

  std::vector<std::string> buckets = listed.value;
  if (!options_.only_buckets.empty()) {
    std::vector<std::string> selected;
    for (const auto& name : options_.only_buckets) {
      if (std::find(buckets.begin(), buckets.end(), name) != buckets.end()) {
        selected.push_back(name);
      } else {
        FERRY_LOG_WARN("Requested bucket not found at source" << kv("bucket", name));
      }
    }
    buckets.swap(selected);
  }

  FERRY_LOG_INFO("Starting migration" << kv("buckets", buckets.size()));

  for (const auto& bucket : buckets) {
    if (stopRequested()) {
      summary.stopped = true;
      FERRY_LOG_WARN("Stop requested, remaining buckets skipped");
      break;
    }

    try {
      summary.buckets.push_back(migrateBucket(bucket));
      if (summary.buckets.back().status == BucketStatus::STOPPED) {
        summary.stopped = true;
      }
    } catch (const MigrationError& e) {
      ++stats_.buckets_failed;
      const bool naming_error = e.kind() != MigrationErrorKind::LISTING;
      if (naming_error && options_.halt_on_bucket_conflict) {
        FERRY_LOG_FATAL(
          "Bucket naming failed, halting run: " << e.what()
                                                << kv("kind", migrationErrorKindToString(e.kind()))
        );
        throw;
      }

      FERRY_LOG_ERROR(
        "Bucket skipped: " << e.what() << kv("bucket", bucket)
                           << kv("kind", migrationErrorKindToString(e.kind()))
      );
      BucketReport report;
      report.source_bucket = bucket;
      report.status = BucketStatus::FAILED;
      report.error = e.what();
      summary.buckets.push_back(std::move(report));
    }
  }

  FERRY_LOG_INFO(
    "Migration finished" << kv("buckets", stats_.buckets_processed.load())
                         << kv("buckets_failed", stats_.buckets_failed.load())
                         << kv("transferred", stats_.objects_transferred.load())
                         << kv("skipped", stats_.objects_skipped.load())
                         << kv("failed", stats_.objects_failed.load())
                         << kv("bytes", stats_.bytes_transferred.load())
  );
  return summary;
}

BucketReport MigrationPlanner::migrateBucket(const std::string& source_bucket) {
  BucketReport report;
  report.source_bucket = source_bucket;

  FERRY_LOG_INFO("Migrating bucket" << kv("bucket", source_bucket));

  report.destination_bucket = resolveDestinationBucket(source_bucket);

  auto source_objects = listSourceObjects(source_bucket, &report.listing_truncated);
  auto migrated = listMigratedKeys(report.destination_bucket);
  auto pending = computePending(source_objects, migrated);

  report.source_objects = source_objects.size();
  report.pending = pending.size();
  report.already_migrated = report.source_objects - report.pending;
  stats_.objects_listed += report.source_objects;
  stats_.objects_skipped += report.already_migrated;

  FERRY_LOG_INFO(
    "Bucket planned" << kv("bucket", source_bucket)
                     << kv("destination", report.destination_bucket)
                     << kv("source_objects", report.source_objects)
                     << kv("already_migrated", report.already_migrated)
                     << kv("pending", report.pending)
  );

  for (const auto& object : pending) {
    if (stopRequested()) {
      report.status = BucketStatus::STOPPED;
      break;
    }
    if (!transferObject(source_bucket, report.destination_bucket, object, report) &&
        !options_.continue_on_object_failure) {
      FERRY_LOG_WARN(
        "Object failed, remaining objects of the bucket skipped" << kv("bucket", source_bucket)
      );
      break;
    }
  }

  if (report.status != BucketStatus::STOPPED) {
    report.status =
      report.failed_keys.empty() ? BucketStatus::COMPLETED : BucketStatus::COMPLETED_WITH_FAILURES;
  }
  ++stats_.buckets_processed;

  FERRY_LOG_INFO(
    "Bucket done" << kv("bucket", source_bucket) << kv("status", bucketStatusToString(report.status))
                  << kv("transferred", report.transferred)
                  << kv("failed", report.failed_keys.size())
  );
  return report;
}

std::string MigrationPlanner::resolveDestinationBucket(const std::string& source_bucket) {
  auto created = destination_.createBucket(source_bucket);
  if (!created.success) {
    throw MigrationError(
      MigrationErrorKind::BUCKET_CREATE_FAILED, source_bucket,
      "CreateBucket failed for " + source_bucket + ": " + created.error.message
    );
  }
  if (created.value != CreateBucketOutcome::ALREADY_EXISTS) {
    FERRY_LOG_DEBUG(
      "Destination bucket ready" << kv("bucket", source_bucket)
                                 << kv("outcome", storage::createBucketOutcomeToString(created.value))
    );
    return source_bucket;
  }

  if (options_.bucket_suffix.empty()) {
    throw MigrationError(
      MigrationErrorKind::NO_SUFFIX_CONFIGURED, source_bucket,
      "Bucket name " + source_bucket + " is taken at the destination and no suffix is configured"
    );
  }

  const std::string candidate = source_bucket + options_.bucket_suffix;
  FERRY_LOG_WARN(
    "Bucket name taken at destination, retrying with suffix" << kv("bucket", source_bucket)
                                                             << kv("candidate", candidate)
  );

  auto retried = destination_.createBucket(candidate);
  if (!retried.success) {
    throw MigrationError(
      MigrationErrorKind::BUCKET_CREATE_FAILED, source_bucket,
      "CreateBucket failed for " + candidate + ": " + retried.error.message
    );
  }
  if (retried.value == CreateBucketOutcome::ALREADY_EXISTS) {
    throw MigrationError(
      MigrationErrorKind::BUCKET_NAME_EXHAUSTED, source_bucket,
      "Bucket names " + source_bucket + " and " + candidate + " are both taken at the destination"
    );
  }
  return candidate;
}

std::vector<ObjectSummary> MigrationPlanner::listSourceObjects(
  const std::string& bucket, bool* truncated
) {
  std::vector<ObjectSummary> objects;
  std::string continuation;
  bool more = true;

  while (more && objects.size() < options_.max_source_keys) {
    auto page = source_.listObjects(bucket, continuation, options_.page_size);
    if (!page.success) {
      throw MigrationError(
        MigrationErrorKind::LISTING, bucket,
        "Cannot list source bucket " + bucket + ": " + page.error.message
      );
    }
    for (auto& object : page.value.objects) {
      objects.push_back(std::move(object));
    }
    more = page.value.next_continuation.has_value();
    if (more) {
      continuation = *page.value.next_continuation;
    }
  }

  const bool capped = objects.size() > options_.max_source_keys ||
                      (more && objects.size() >= options_.max_source_keys);
  if (objects.size() > options_.max_source_keys) {
    objects.resize(static_cast<size_t>(options_.max_source_keys));
  }
  if (capped) {
    FERRY_LOG_WARN(
      "Source listing capped, remaining objects are not migrated in this run"
      << kv("bucket", bucket) << kv("limit", options_.max_source_keys)
    );
  }
  if (truncated) {
    *truncated = capped;
  }
  return objects;
}

std::unordered_set<std::string> MigrationPlanner::listMigratedKeys(const std::string& bucket) {
  std::unordered_set<std::string> keys;
  std::string continuation;

  for (;;) {
    auto page = destination_.listObjects(bucket, continuation, options_.page_size);
    if (!page.success) {
      throw MigrationError(
        MigrationErrorKind::LISTING, bucket,
        "Cannot list destination bucket " + bucket + ": " + page.error.message
      );
    }
    for (const auto& object : page.value.objects) {
      keys.insert(object.key);
    }
    if (!page.value.next_continuation) {
      break;
    }
    continuation = *page.value.next_continuation;
  }
  return keys;
}

std::vector<ObjectSummary> MigrationPlanner::computePending(
  const std::vector<ObjectSummary>& source_objects,
  const std::unordered_set<std::string>& migrated
) {
  std::vector<ObjectSummary> pending;
  for (const auto& object : source_objects) {
    if (migrated.count(object.key) == 0) {
      pending.push_back(object);
    }
  }
  return pending;
}

uint64_t MigrationPlanner::recoverOrphanedSessions() {
  if (!ledger_) {
    return 0;
  }

  uint64_t released = 0;
  for (const auto& session : ledger_->getOpenSessions()) {
    auto aborted =
      destination_.abortMultipartUpload(session.bucket, session.object_key, session.upload_id);
    if (aborted.success || aborted.error.code == storage::kErrorNoSuchUpload) {
      ledger_->onSessionClosed(session.upload_id);
      ++released;
      FERRY_LOG_INFO(
        "Released orphaned multipart session" << kv("bucket", session.bucket)
                                              << kv("key", session.object_key)
                                              << kv("upload_id", session.upload_id)
      );
    } else {
      FERRY_LOG_WARN(
        "Cannot abort orphaned multipart session: " << aborted.error.message
                                                    << kv("upload_id", session.upload_id)
      );
    }
  }
  stats_.sessions_recovered += released;
  return released;
}

bool MigrationPlanner::transferObject(
  const std::string& source_bucket, const std::string& destination_bucket,
  const ObjectSummary& object, BucketReport& report
) {
  FERRY_LOG_SCOPED_CONTEXT(source_bucket, object.key);

  if (ledger_ && !ledger_->recordAttempt(
                   source_bucket, object.key, object.size_bytes,
                   storage::transferStrategyToString(storage::selectTransferStrategy(object.size_bytes))
                 )) {
    FERRY_LOG_WARN("Ledger did not record the attempt");
  }

  storage::TransferStrategy strategy = storage::TransferStrategy::SINGLE_PART;
  uint64_t bytes = 0;
  storage::TransferResult result;
  bool threw = false;
  try {
    result = transfer_.copy(source_bucket, destination_bucket, object.key, &strategy, &bytes);
  } catch (const std::exception& e) {
    // One object's exception (bad_alloc on a huge body, SDK errors) must not end the run
    threw = true;
    result = storage::TransferResult::Failure(
      storage::TransferError::NONE, std::string("transfer threw: ") + e.what()
    );
  }

  if (!result.success) {
    ++stats_.objects_failed;
    report.failed_keys.push_back(object.key);
    if (ledger_ && !ledger_->markFailed(source_bucket, object.key, result.message)) {
      FERRY_LOG_WARN("Ledger did not record the failure");
    }
    if (threw) {
      FERRY_LOG_ERROR("Object transfer failed: " << result.message);
    } else {
      FERRY_LOG_ERROR(
        "Object transfer failed: " << result.message
                                   << kv("error", storage::transferErrorToString(result.error))
      );
    }
    return false;
  }

  ++stats_.objects_transferred;
  stats_.bytes_transferred += bytes;
  if (strategy == storage::TransferStrategy::CHUNKED) {
    ++stats_.chunked_transfers;
  } else {
    ++stats_.single_part_transfers;
  }
  ++report.transferred;
  report.bytes_transferred += bytes;
  if (ledger_ && !ledger_->markCompleted(source_bucket, object.key)) {
    FERRY_LOG_WARN("Ledger did not record the completion");
  }

  FERRY_LOG_INFO(
    "Object transferred" << kv("strategy", storage::transferStrategyToString(strategy))
                         << kv("bytes", bytes) << kv("parts", result.parts.size())
  );
  return true;
}

}  // namespace migration
}  // namespace ferry

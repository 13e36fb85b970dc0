// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_STORAGE_TYPES_HPP
#define FERRY_STORAGE_TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ferry {
namespace storage {

// Transfer threshold and chunk size are the same value
constexpr uint64_t kChunkSize = 5ULL * 1024 * 1024;

// Source listing cap for the migration path (the sweep paginates without it)
constexpr uint64_t kMaxKeys = 1000000;

// Page size most providers use when none is requested
constexpr int kDefaultPageSize = 1000;

// Error codes the migration logic branches on
constexpr const char* kErrorNoSuchUpload = "NoSuchUpload";
constexpr const char* kErrorNoSuchBucket = "NoSuchBucket";
constexpr const char* kErrorBucketNotEmpty = "BucketNotEmpty";

using ObjectPayload = std::vector<uint8_t>;

/**
 * Error reported by a storage operation after the transport gave up retrying
 */
struct StorageError {
  std::string code;     // Provider error code, e.g. "NoSuchKey"
  std::string message;  // Human readable message
  bool is_retryable = false;
};

/**
 * Result of a storage operation without a value
 */
struct StorageStatus {
  bool success = false;
  StorageError error;

  static StorageStatus Ok() {
    StorageStatus status;
    status.success = true;
    return status;
  }

  static StorageStatus Failure(
    const std::string& message, const std::string& code = "", bool retryable = false
  ) {
    StorageStatus status;
    status.error = {code, message, retryable};
    return status;
  }

  static StorageStatus Failure(const StorageError& error) {
    StorageStatus status;
    status.error = error;
    return status;
  }
};

/**
 * Result of a storage operation that yields a value on success
 */
template <typename T>
struct StorageResult {
  bool success = false;
  T value{};
  StorageError error;

  static StorageResult Success(T value) {
    StorageResult result;
    result.success = true;
    result.value = std::move(value);
    return result;
  }

  static StorageResult Failure(
    const std::string& message, const std::string& code = "", bool retryable = false
  ) {
    StorageResult result;
    result.error = {code, message, retryable};
    return result;
  }

  static StorageResult Failure(const StorageError& error) {
    StorageResult result;
    result.error = error;
    return result;
  }
};

/**
 * CreateBucket answers that are not errors for the caller
 */
enum class CreateBucketOutcome {
  CREATED,                 // New bucket created
  ALREADY_OWNED_BY_YOU,    // Bucket exists and belongs to the caller
  ALREADY_EXISTS           // Name taken by another owner
};

inline const char* createBucketOutcomeToString(CreateBucketOutcome outcome) {
  switch (outcome) {
    case CreateBucketOutcome::CREATED:
      return "created";
    case CreateBucketOutcome::ALREADY_OWNED_BY_YOU:
      return "already_owned_by_you";
    case CreateBucketOutcome::ALREADY_EXISTS:
      return "already_exists";
    default:
      return "unknown";
  }
}

/**
 * Listing entry
 */
struct ObjectSummary {
  std::string key;
  uint64_t size_bytes = 0;
};

/**
 * One page of an object listing
 */
struct ObjectPage {
  std::vector<ObjectSummary> objects;
  std::optional<std::string> next_continuation;  // Absent on the last page
};

/**
 * Part of a multipart session as acknowledged by the destination
 */
struct CompletedPart {
  int part_number = 0;
  std::string etag;  // Part tag
};

}  // namespace storage
}  // namespace ferry

#endif  // FERRY_STORAGE_TYPES_HPP

// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_TRANSFER_RESULT_HPP
#define FERRY_TRANSFER_RESULT_HPP

#include <string>
#include <utility>
#include <vector>

#include "storage_types.hpp"

namespace ferry {
namespace storage {

/**
 * Per-object transfer failure
 */
enum class TransferError {
  NONE,
  SOURCE_READ_FAILED,   // GetObject at the source failed
  SESSION_OPEN_FAILED,  // CreateMultipartUpload or session tracking failed
  PART_UPLOAD_FAILED,   // At least one part failed; session aborted
  COMPLETION_FAILED,    // CompleteMultipartUpload rejected; session aborted
  PUT_FAILED            // Single-part PutObject failed
};

inline const char* transferErrorToString(TransferError error) {
  switch (error) {
    case TransferError::NONE:
      return "none";
    case TransferError::SOURCE_READ_FAILED:
      return "source_read_failed";
    case TransferError::SESSION_OPEN_FAILED:
      return "session_open_failed";
    case TransferError::PART_UPLOAD_FAILED:
      return "part_upload_failed";
    case TransferError::COMPLETION_FAILED:
      return "completion_failed";
    case TransferError::PUT_FAILED:
      return "put_failed";
    default:
      return "unknown";
  }
}

struct TransferResult {
  bool success = false;
  TransferError error = TransferError::NONE;
  std::string message;
  std::vector<CompletedPart> parts;  // Chunked only, sorted by part number

  static TransferResult Success(std::vector<CompletedPart> parts = {}) {
    TransferResult result;
    result.success = true;
    result.parts = std::move(parts);
    return result;
  }

  static TransferResult Failure(TransferError error, const std::string& message) {
    TransferResult result;
    result.error = error;
    result.message = message;
    return result;
  }
};

}  // namespace storage
}  // namespace ferry

#endif  // FERRY_TRANSFER_RESULT_HPP

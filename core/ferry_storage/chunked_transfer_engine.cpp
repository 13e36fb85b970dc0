// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "chunked_transfer_engine.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <stdexcept>
#include <thread>
#include <vector>

#include "transfer_strategy.hpp"

#define FERRY_LOG_COMPONENT "chunked_transfer"
#include "ferry_log_macros.hpp"

namespace ferry {
namespace storage {

using ::ferry::logging::kv;

namespace {

struct PartOutcome {
  bool success = false;
  std::string etag;
  std::string error;
};

}  // namespace

ChunkedTransferEngine::ChunkedTransferEngine(
  IStorageClient& destination, const ChunkedTransferConfig& config, ISessionTracker* tracker
)
    : destination_(destination)
    , config_(config)
    , tracker_(tracker) {
  if (config_.chunk_size == 0) {
    throw std::invalid_argument("chunk_size must be positive");
  }
  if (config_.max_concurrent_parts < 1) {
    config_.max_concurrent_parts = 1;
  }
}

TransferResult ChunkedTransferEngine::transfer(
  const std::string& bucket, const std::string& key, const ObjectPayload& payload
) {
  // 1. Open
  auto opened = destination_.createMultipartUpload(bucket, key);
  if (!opened.success) {
    FERRY_LOG_ERROR("Failed to open multipart session: " << opened.error.message << kv("code", opened.error.code));
    return TransferResult::Failure(
      TransferError::SESSION_OPEN_FAILED, "CreateMultipartUpload failed: " + opened.error.message
    );
  }
  const std::string upload_id = opened.value;
  if (tracker_) {
    try {
      tracker_->onSessionOpened(bucket, key, upload_id);
    } catch (const std::exception& e) {
      FERRY_LOG_ERROR(
        "Session tracker failed, aborting session: " << e.what() << kv("upload_id", upload_id)
      );
      abortSession(bucket, key, upload_id);
      return TransferResult::Failure(
        TransferError::SESSION_OPEN_FAILED, std::string("session tracking failed: ") + e.what()
      );
    }
  }

  // 2. Partition
  const auto chunks = partitionPayload(payload.size(), config_.chunk_size);
  std::vector<PartOutcome> outcomes(chunks.size());

  // 3. Parallel upload on a bounded worker set
  const size_t worker_count =
    std::min(static_cast<size_t>(config_.max_concurrent_parts), chunks.size());
  std::atomic<size_t> next_chunk{0};

  FERRY_LOG_DEBUG(
    "Multipart session opened" << kv("upload_id", upload_id) << kv("parts", chunks.size())
                               << kv("workers", worker_count)
  );

  auto worker = [&]() {
    for (;;) {
      const size_t index = next_chunk.fetch_add(1);
      if (index >= chunks.size()) {
        return;
      }
      const auto& chunk = chunks[index];
      auto& outcome = outcomes[index];
      try {
        auto uploaded = destination_.uploadPart(
          bucket, key, upload_id, chunk.part_number, payload.data() + chunk.offset,
          static_cast<size_t>(chunk.length)
        );
        outcome.success = uploaded.success;
        if (uploaded.success) {
          outcome.etag = uploaded.value;
        } else {
          outcome.error = uploaded.error.message;
        }
      } catch (const std::exception& e) {
        outcome.success = false;
        outcome.error = e.what();
      }
    }
  };

  std::vector<std::thread> workers;
  std::string spawn_error;
  try {
    workers.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
      workers.emplace_back(worker);
    }
  } catch (const std::exception& e) {
    spawn_error = e.what();
    // Started workers take no further chunks
    next_chunk.store(chunks.size());
  }
  // Barrier: every part settles before the decision
  for (auto& t : workers) {
    t.join();
  }
  if (!spawn_error.empty()) {
    FERRY_LOG_ERROR(
      "Failed to start part workers, aborting session: " << spawn_error
                                                         << kv("upload_id", upload_id)
                                                         << kv("started", workers.size())
    );
    abortSession(bucket, key, upload_id);
    return TransferResult::Failure(
      TransferError::PART_UPLOAD_FAILED, "failed to start part workers: " + spawn_error
    );
  }

  // 4. Completion decision
  std::vector<CompletedPart> parts;
  parts.reserve(chunks.size());
  size_t failed_parts = 0;
  std::string first_error;
  for (size_t i = 0; i < chunks.size(); ++i) {
    if (outcomes[i].success) {
      parts.push_back({chunks[i].part_number, outcomes[i].etag});
    } else {
      if (failed_parts == 0) {
        first_error = "part " + std::to_string(chunks[i].part_number) + ": " + outcomes[i].error;
      }
      ++failed_parts;
    }
  }

  if (failed_parts > 0) {
    FERRY_LOG_ERROR(
      "Part uploads failed, aborting session" << kv("upload_id", upload_id)
                                              << kv("failed_parts", failed_parts)
                                              << kv("total_parts", chunks.size())
    );
    abortSession(bucket, key, upload_id);
    return TransferResult::Failure(
      TransferError::PART_UPLOAD_FAILED,
      std::to_string(failed_parts) + " of " + std::to_string(chunks.size()) +
        " parts failed, first " + first_error
    );
  }

  std::sort(parts.begin(), parts.end(), [](const CompletedPart& a, const CompletedPart& b) {
    return a.part_number < b.part_number;
  });

  StorageStatus completed;
  try {
    completed = destination_.completeMultipartUpload(bucket, key, upload_id, parts);
  } catch (const std::exception& e) {
    FERRY_LOG_ERROR(
      "CompleteMultipartUpload threw, aborting session: " << e.what() << kv("upload_id", upload_id)
    );
    abortSession(bucket, key, upload_id);
    return TransferResult::Failure(
      TransferError::COMPLETION_FAILED, std::string("CompleteMultipartUpload failed: ") + e.what()
    );
  }
  if (!completed.success) {
    FERRY_LOG_ERROR(
      "CompleteMultipartUpload rejected, aborting session: " << completed.error.message
                                                             << kv("upload_id", upload_id)
    );
    abortSession(bucket, key, upload_id);
    return TransferResult::Failure(
      TransferError::COMPLETION_FAILED,
      "CompleteMultipartUpload failed: " + completed.error.message
    );
  }

  if (tracker_) {
    tracker_->onSessionClosed(upload_id);
  }
  return TransferResult::Success(std::move(parts));
}

void ChunkedTransferEngine::abortSession(
  const std::string& bucket, const std::string& key, const std::string& upload_id
) {
  StorageStatus aborted;
  try {
    aborted = destination_.abortMultipartUpload(bucket, key, upload_id);
  } catch (const std::exception& e) {
    aborted = StorageStatus::Failure(e.what());
  }
  if (!aborted.success && aborted.error.code != kErrorNoSuchUpload) {
    FERRY_LOG_ERROR(
      "AbortMultipartUpload failed, session left open: " << aborted.error.message
                                                         << kv("upload_id", upload_id)
    );
    return;
  }
  if (tracker_) {
    tracker_->onSessionClosed(upload_id);
  }
}

}  // namespace storage
}  // namespace ferry

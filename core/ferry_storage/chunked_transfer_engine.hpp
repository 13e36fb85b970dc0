// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_CHUNKED_TRANSFER_ENGINE_HPP
#define FERRY_CHUNKED_TRANSFER_ENGINE_HPP

#include <cstdint>
#include <string>

#include "session_tracker.hpp"
#include "storage_client.hpp"
#include "transfer_result.hpp"

namespace ferry {
namespace storage {

struct ChunkedTransferConfig {
  uint64_t chunk_size = kChunkSize;
  int max_concurrent_parts = 8;  // Upper bound on part upload workers
};

/**
 * Multipart session driver
 *
 * State machine per transfer() call:
 *   open -> partition -> parallel part upload -> barrier -> complete | abort
 *
 * Part uploads run on min(max_concurrent_parts, chunk count) worker threads.
 * All workers are joined before the complete/abort decision, so a failing
 * part never cuts the others short. Exactly one of complete or abort is
 * issued for every opened session. If completion is rejected the session
 * is aborted as well.
 *
 * The destination client must allow concurrent uploadPart() calls.
 */
class ChunkedTransferEngine {
public:
  ChunkedTransferEngine(
    IStorageClient& destination, const ChunkedTransferConfig& config = {},
    ISessionTracker* tracker = nullptr
  );

  TransferResult transfer(
    const std::string& bucket, const std::string& key, const ObjectPayload& payload
  );

  const ChunkedTransferConfig& config() const {
    return config_;
  }

private:
  // A failed abort is logged and the session stays tracked as open
  void abortSession(const std::string& bucket, const std::string& key, const std::string& upload_id);

  IStorageClient& destination_;
  ChunkedTransferConfig config_;
  ISessionTracker* tracker_;
};

}  // namespace storage
}  // namespace ferry

#endif  // FERRY_CHUNKED_TRANSFER_ENGINE_HPP
